// TIERPOOL - Hash Functions Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/crypto/hash.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace tierpool {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

/// One-shot digest; a failure here means libcrypto is unusable
template<size_t N>
std::array<Byte, N> Digest(const EVP_MD* md, const Byte* data, size_t len) {
    if (!md) {
        throw std::runtime_error("digest algorithm unavailable");
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    std::array<Byte, N> out{};
    unsigned int outLen = 0;

    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &outLen) != 1 ||
        outLen != N) {
        throw std::runtime_error("digest computation failed");
    }
    return out;
}

} // anonymous namespace

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return Hash256(Digest<Hash256::SIZE>(EVP_sha256(), data, len));
}

Hash160 ComputeHash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    return Hash160(Digest<Hash160::SIZE>(EVP_ripemd160(), sha.data(), sha.size()));
}

} // namespace tierpool
