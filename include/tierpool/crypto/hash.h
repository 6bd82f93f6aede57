// TIERPOOL - Hash Functions
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// SHA-256 and RIPEMD-160 digests backed by OpenSSL's EVP interface.

#ifndef TIERPOOL_CRYPTO_HASH_H
#define TIERPOOL_CRYPTO_HASH_H

#include "tierpool/core/types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tierpool {

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

/// RIPEMD160(SHA256(data)); used to derive addresses from public keys
Hash160 ComputeHash160(const Byte* data, size_t len);

inline Hash160 ComputeHash160(const std::vector<Byte>& data) {
    return ComputeHash160(data.data(), data.size());
}

inline Hash160 ComputeHash160(const std::string& data) {
    return ComputeHash160(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace tierpool

#endif // TIERPOOL_CRYPTO_HASH_H
