// TIERPOOL - secp256k1 Recoverable Signatures
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Low-level secp256k1 operations on raw byte buffers, implemented on top of
// OpenSSL's EC and BN primitives. For key objects, see keys.h instead.
//
// Recoverable signatures use the 65-byte layout r(32) || s(32) || v(1),
// with v in the canonical {27, 28} domain.

#ifndef TIERPOOL_CRYPTO_SECP256K1_H
#define TIERPOOL_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace tierpool {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key size (32 bytes)
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Compressed public key size (33 bytes: 0x02/0x03 + 32 bytes X)
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

/// Recoverable signature size (32 R + 32 S + 1 V)
constexpr size_t RECOVERABLE_SIGNATURE_SIZE = 65;

/// Offset added to the raw recovery id in the V byte
constexpr uint8_t RECOVERY_ID_OFFSET = 27;

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// floor(n / 2); canonical signatures have s <= this value
extern const std::array<uint8_t, 32> HALF_CURVE_ORDER;

// ============================================================================
// Operations
// ============================================================================

/// Check that a 32-byte big-endian scalar is in [1, n-1]
bool IsValidPrivateKey(const uint8_t* key);

/// Check that a 32-byte big-endian s value is in [1, n/2]
bool IsLowS(const uint8_t* s);

/**
 * Derive the compressed public key for a private key.
 *
 * @param privateKey 32-byte private key
 * @param publicKey Output: 33-byte compressed public key
 * @return true if the key is valid
 */
bool DerivePublicKey(const uint8_t* privateKey, uint8_t publicKey[COMPRESSED_PUBKEY_SIZE]);

/**
 * Sign a 32-byte hash, producing a low-s recoverable signature.
 *
 * @param hash 32-byte message hash
 * @param privateKey 32-byte private key
 * @param signature Output: r || s || v, v in {27, 28}
 * @return true if successful
 */
bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t signature[RECOVERABLE_SIGNATURE_SIZE]);

/**
 * Recover the signer's public key from (r, s, recid).
 *
 * @param hash 32-byte message hash
 * @param r 32-byte big-endian r
 * @param s 32-byte big-endian s
 * @param recid Raw recovery id (0..3)
 * @param publicKey Output: 33-byte compressed public key
 * @return true if a valid, non-infinity key was recovered
 */
bool ECDSARecover(const uint8_t* hash, const uint8_t* r, const uint8_t* s,
                  int recid, uint8_t publicKey[COMPRESSED_PUBKEY_SIZE]);

} // namespace secp256k1
} // namespace tierpool

#endif // TIERPOOL_CRYPTO_SECP256K1_H
