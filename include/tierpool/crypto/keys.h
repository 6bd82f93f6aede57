// TIERPOOL - Key Types
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// secp256k1 key objects used for operator signatures. Public keys are kept
// in compressed form; an identity is the Hash160 of the compressed key.

#ifndef TIERPOOL_CRYPTO_KEYS_H
#define TIERPOOL_CRYPTO_KEYS_H

#include "tierpool/core/types.h"
#include "tierpool/crypto/secp256k1.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tierpool {

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A compressed secp256k1 public key (33 bytes).
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from compressed bytes
    explicit PublicKey(const std::array<uint8_t, SIZE>& data) : data_(data) {}

    /// Check for a 0x02/0x03 prefix
    bool IsValid() const { return data_[0] == 0x02 || data_[0] == 0x03; }

    const uint8_t* data() const { return data_.data(); }
    static constexpr size_t size() { return SIZE; }

    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_.begin(), data_.end());
    }

    /// Identity derived from this key
    Address GetAddress() const;

    /**
     * Recover the signer from a 65-byte r || s || v signature.
     * V must already be in {27, 28}; s must be in the lower half order.
     */
    static std::optional<PublicKey> RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature);

    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 *
 * Always exactly 32 bytes. Must be in the valid range [1, n-1] where n
 * is the order of the secp256k1 curve.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }

    /// Construct from raw 32 bytes
    explicit PrivateKey(const std::array<uint8_t, SIZE>& data);

    /// Destructor - securely clear memory
    ~PrivateKey();

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(PrivateKey&& other) noexcept;
    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);

    /// Generate a new random private key
    static PrivateKey Generate();

    /// Deterministic key from SHA256(seed); for simulations and tests
    static PrivateKey FromSeed(const std::string& seed);

    bool IsValid() const { return valid_; }

    /// Derive public key
    PublicKey GetPublicKey() const;

    /// Shortcut for GetPublicKey().GetAddress()
    Address GetAddress() const { return GetPublicKey().GetAddress(); }

    /**
     * Sign a 32-byte hash.
     * Returns a 65-byte r || s || v signature, or empty on failure.
     */
    std::vector<uint8_t> SignRecoverable(const Hash256& hash) const;

    /// Clear and invalidate the key
    void Clear();

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

} // namespace tierpool

#endif // TIERPOOL_CRYPTO_KEYS_H
