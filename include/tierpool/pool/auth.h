// TIERPOOL - Signature Authenticator
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Decides whether a 65-byte recoverable signature over a 32-byte hash was
// produced by the pool operator.

#ifndef TIERPOOL_POOL_AUTH_H
#define TIERPOOL_POOL_AUTH_H

#include "tierpool/core/types.h"

#include <cstdint>
#include <vector>

namespace tierpool {
namespace pool {

/// Marker returned for a valid operator signature
constexpr uint32_t MAGIC_VALUE = 0x1626ba7e;

/// Marker returned for anything else
constexpr uint32_t INVALID_SIGNATURE = 0xffffffff;

enum class AuthStatus {
    Valid,
    InvalidSignatureLength,
    InvalidRecoveryId,
    MalleableSignature,
    RecoveryFailed,
    NotOperator
};

const char* AuthStatusToString(AuthStatus status);

class SignatureAuthenticator {
public:
    /**
     * Check signature = r(32) || s(32) || v(1) over hash against op.
     *
     * v in {0, 1} is accepted as {27, 28}. s must be in the lower half of
     * the curve order and r, s in [1, n-1]. The length is checked before
     * any recovery is attempted.
     */
    static AuthStatus Verify(const Hash256& hash, const std::vector<Byte>& signature,
                             const Address& op);

    /// MAGIC_VALUE if Verify() is Valid, otherwise INVALID_SIGNATURE
    static uint32_t IsValidSignature(const Hash256& hash, const std::vector<Byte>& signature,
                                     const Address& op) noexcept;
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_AUTH_H
