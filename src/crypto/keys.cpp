// TIERPOOL - Key Types Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/crypto/keys.h"
#include "tierpool/core/hex.h"
#include "tierpool/crypto/hash.h"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstring>

namespace tierpool {

// ============================================================================
// PublicKey Implementation
// ============================================================================

Address PublicKey::GetAddress() const {
    return ComputeHash160(data_.data(), data_.size());
}

std::optional<PublicKey> PublicKey::RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature) {
    if (signature.size() != secp256k1::RECOVERABLE_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    const uint8_t* r = signature.data();
    const uint8_t* s = signature.data() + 32;
    uint8_t v = signature[64];

    if (v != secp256k1::RECOVERY_ID_OFFSET && v != secp256k1::RECOVERY_ID_OFFSET + 1) {
        return std::nullopt;
    }
    if (!secp256k1::IsLowS(s)) {
        return std::nullopt;
    }

    std::array<uint8_t, SIZE> pub;
    if (!secp256k1::ECDSARecover(hash.data(), r, s, v - secp256k1::RECOVERY_ID_OFFSET,
                                 pub.data())) {
        return std::nullopt;
    }
    return PublicKey(pub);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_);
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const std::array<uint8_t, SIZE>& data) : data_(data) {
    valid_ = secp256k1::IsValidPrivateKey(data_.data());
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : data_(other.data_), valid_(other.valid_) {
    other.Clear();
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        Clear();
        data_ = other.data_;
        valid_ = other.valid_;
        other.Clear();
    }
    return *this;
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {
}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    PrivateKey key;

    // Generate random bytes until we get a valid key
    for (int attempts = 0; attempts < 100; ++attempts) {
        if (RAND_bytes(key.data_.data(), static_cast<int>(SIZE)) != 1) {
            break;
        }
        if (secp256k1::IsValidPrivateKey(key.data_.data())) {
            key.valid_ = true;
            return key;
        }
    }

    return PrivateKey();
}

PrivateKey PrivateKey::FromSeed(const std::string& seed) {
    Hash256 digest = SHA256Hash(seed);
    std::array<uint8_t, SIZE> bytes;
    std::memcpy(bytes.data(), digest.data(), SIZE);
    PrivateKey key(bytes);
    OPENSSL_cleanse(bytes.data(), SIZE);
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    std::array<uint8_t, PublicKey::SIZE> pub;
    if (!valid_ || !secp256k1::DerivePublicKey(data_.data(), pub.data())) {
        return PublicKey();
    }
    return PublicKey(pub);
}

std::vector<uint8_t> PrivateKey::SignRecoverable(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    std::vector<uint8_t> sig(secp256k1::RECOVERABLE_SIGNATURE_SIZE);
    if (!secp256k1::ECDSASignRecoverable(hash.data(), data_.data(), sig.data())) {
        return {};
    }
    return sig;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

} // namespace tierpool
