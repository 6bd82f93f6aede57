// TIERPOOL - secp256k1 Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/crypto/secp256k1.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <memory>

namespace tierpool {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 32> HALF_CURVE_ORDER = {{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
}};

namespace {

struct BnDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct KeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using KeyPtr = std::unique_ptr<EC_KEY, KeyDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

inline void SecureClear(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

// Compare two 32-byte big-endian numbers
// Returns: -1 if a < b, 0 if a == b, 1 if a > b
int Compare32(const uint8_t* a, const uint8_t* b) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    return 0;
}

bool IsZero32(const uint8_t* a) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

/// Write a BIGNUM as a fixed 32-byte big-endian value
bool BnTo32(const BIGNUM* bn, uint8_t out[32]) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

bool IsValidPrivateKey(const uint8_t* key) {
    if (IsZero32(key)) return false;
    return Compare32(key, CURVE_ORDER.data()) < 0;
}

bool IsLowS(const uint8_t* s) {
    if (IsZero32(s)) return false;
    return Compare32(s, HALF_CURVE_ORDER.data()) <= 0;
}

// ============================================================================
// Key Derivation
// ============================================================================

bool DerivePublicKey(const uint8_t* privateKey, uint8_t publicKey[COMPRESSED_PUBKEY_SIZE]) {
    if (!IsValidPrivateKey(privateKey)) return false;

    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr priv(BN_bin2bn(privateKey, PRIVATE_KEY_SIZE, nullptr));
    if (!group || !ctx || !priv) return false;

    PointPtr pub(EC_POINT_new(group.get()));
    if (!pub) return false;

    if (EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get()) != 1) {
        return false;
    }

    size_t written = EC_POINT_point2oct(group.get(), pub.get(), POINT_CONVERSION_COMPRESSED,
                                        publicKey, COMPRESSED_PUBKEY_SIZE, ctx.get());
    return written == COMPRESSED_PUBKEY_SIZE;
}

// ============================================================================
// Recovery
// ============================================================================

bool ECDSARecover(const uint8_t* hash, const uint8_t* r, const uint8_t* s,
                  int recid, uint8_t publicKey[COMPRESSED_PUBKEY_SIZE]) {
    if (recid < 0 || recid > 3) return false;

    // r and s must both lie in [1, n-1]
    if (!IsValidPrivateKey(r) || !IsValidPrivateKey(s)) return false;

    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnCtxPtr ctx(BN_CTX_new());
    if (!group || !ctx) return false;

    const BIGNUM* n = EC_GROUP_get0_order(group.get());
    BnPtr bnR(BN_bin2bn(r, 32, nullptr));
    BnPtr bnS(BN_bin2bn(s, 32, nullptr));
    BnPtr e(BN_bin2bn(hash, 32, nullptr));
    BnPtr x(BN_dup(bnR.get()));
    if (!n || !bnR || !bnS || !e || !x) return false;

    // x = r + (recid / 2) * n
    if (recid >= 2 && BN_add(x.get(), x.get(), n) != 1) {
        return false;
    }

    // R = (x, y) with y parity from recid; fails when x is not on the curve
    PointPtr R(EC_POINT_new(group.get()));
    if (!R || EC_POINT_set_compressed_coordinates(group.get(), R.get(), x.get(),
                                                  recid & 1, ctx.get()) != 1) {
        return false;
    }

    // Q = r^-1 * (s*R - e*G)
    BnPtr rInv(BN_mod_inverse(nullptr, bnR.get(), n, ctx.get()));
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    if (!rInv || !u1 || !u2) return false;

    if (BN_mod_mul(u2.get(), bnS.get(), rInv.get(), n, ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), e.get(), rInv.get(), n, ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), n, u1.get(), n, ctx.get()) != 1) {
        return false;
    }

    PointPtr Q(EC_POINT_new(group.get()));
    if (!Q || EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()) != 1) {
        return false;
    }

    if (EC_POINT_is_at_infinity(group.get(), Q.get())) {
        return false;
    }

    size_t written = EC_POINT_point2oct(group.get(), Q.get(), POINT_CONVERSION_COMPRESSED,
                                        publicKey, COMPRESSED_PUBKEY_SIZE, ctx.get());
    return written == COMPRESSED_PUBKEY_SIZE;
}

// ============================================================================
// Signing
// ============================================================================

bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t signature[RECOVERABLE_SIGNATURE_SIZE]) {
    uint8_t ownPub[COMPRESSED_PUBKEY_SIZE];
    if (!DerivePublicKey(privateKey, ownPub)) return false;

    KeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    BnPtr priv(BN_bin2bn(privateKey, PRIVATE_KEY_SIZE, nullptr));
    if (!key || !priv) return false;

    if (EC_KEY_set_private_key(key.get(), priv.get()) != 1) {
        return false;
    }

    const BIGNUM* n = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    BnPtr halfN(BN_bin2bn(HALF_CURVE_ORDER.data(), 32, nullptr));
    if (!n || !halfN) return false;

    // k is random; a retry covers the rare case where recid would be 2 or 3
    for (int attempt = 0; attempt < 4; ++attempt) {
        SigPtr sig(ECDSA_do_sign(hash, 32, key.get()));
        if (!sig) return false;

        const BIGNUM* r = nullptr;
        const BIGNUM* s = nullptr;
        ECDSA_SIG_get0(sig.get(), &r, &s);

        BnPtr lowS(BN_dup(s));
        if (!lowS) return false;

        // Ensure low S
        if (BN_cmp(lowS.get(), halfN.get()) > 0 &&
            BN_sub(lowS.get(), n, lowS.get()) != 1) {
            return false;
        }

        uint8_t rBytes[32];
        uint8_t sBytes[32];
        if (!BnTo32(r, rBytes) || !BnTo32(lowS.get(), sBytes)) {
            return false;
        }

        for (int recid = 0; recid < 2; ++recid) {
            uint8_t recovered[COMPRESSED_PUBKEY_SIZE];
            if (ECDSARecover(hash, rBytes, sBytes, recid, recovered) &&
                std::memcmp(recovered, ownPub, COMPRESSED_PUBKEY_SIZE) == 0) {
                std::memcpy(signature, rBytes, 32);
                std::memcpy(signature + 32, sBytes, 32);
                signature[64] = static_cast<uint8_t>(RECOVERY_ID_OFFSET + recid);
                return true;
            }
        }
    }

    SecureClear(signature, RECOVERABLE_SIGNATURE_SIZE);
    return false;
}

} // namespace secp256k1
} // namespace tierpool
