// TIERPOOL - Signature Authenticator Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/auth.h"
#include "tierpool/crypto/keys.h"
#include "tierpool/crypto/secp256k1.h"
#include "tierpool/util/logging.h"

#include <exception>

namespace tierpool {
namespace pool {

const char* AuthStatusToString(AuthStatus status) {
    switch (status) {
        case AuthStatus::Valid:                  return "Valid";
        case AuthStatus::InvalidSignatureLength: return "InvalidSignatureLength";
        case AuthStatus::InvalidRecoveryId:      return "InvalidRecoveryId";
        case AuthStatus::MalleableSignature:     return "MalleableSignature";
        case AuthStatus::RecoveryFailed:         return "RecoveryFailed";
        case AuthStatus::NotOperator:            return "NotOperator";
    }
    return "Unknown";
}

AuthStatus SignatureAuthenticator::Verify(const Hash256& hash,
                                          const std::vector<Byte>& signature,
                                          const Address& op) {
    if (signature.size() != secp256k1::RECOVERABLE_SIGNATURE_SIZE) {
        LOG_WARN(util::LogCategory::AUTH) << "Rejected signature of " << signature.size()
                                          << " bytes";
        return AuthStatus::InvalidSignatureLength;
    }

    std::vector<Byte> normalized(signature);
    Byte& v = normalized[64];
    if (v < secp256k1::RECOVERY_ID_OFFSET) {
        v = static_cast<Byte>(v + secp256k1::RECOVERY_ID_OFFSET);
    }
    if (v != secp256k1::RECOVERY_ID_OFFSET && v != secp256k1::RECOVERY_ID_OFFSET + 1) {
        LOG_WARN(util::LogCategory::AUTH) << "Rejected recovery id " << static_cast<int>(signature[64]);
        return AuthStatus::InvalidRecoveryId;
    }

    if (!secp256k1::IsLowS(normalized.data() + 32)) {
        LOG_WARN(util::LogCategory::AUTH) << "Rejected high-s or zero-s signature";
        return AuthStatus::MalleableSignature;
    }

    auto signer = PublicKey::RecoverCompact(hash, normalized);
    if (!signer) {
        LOG_WARN(util::LogCategory::AUTH) << "Signer recovery failed";
        return AuthStatus::RecoveryFailed;
    }

    Address recovered = signer->GetAddress();
    if (recovered.IsNull() || op.IsNull() || recovered != op) {
        LOG_WARN(util::LogCategory::AUTH) << "Signer " << recovered.ToHex()
                                          << " is not the operator";
        return AuthStatus::NotOperator;
    }

    LOG_DEBUG(util::LogCategory::AUTH) << "Operator signature accepted";
    return AuthStatus::Valid;
}

uint32_t SignatureAuthenticator::IsValidSignature(const Hash256& hash,
                                                  const std::vector<Byte>& signature,
                                                  const Address& op) noexcept {
    try {
        return Verify(hash, signature, op) == AuthStatus::Valid ? MAGIC_VALUE
                                                                 : INVALID_SIGNATURE;
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::AUTH) << "Signature check aborted: " << e.what();
        return INVALID_SIGNATURE;
    }
}

} // namespace pool
} // namespace tierpool
