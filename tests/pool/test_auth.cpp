// TIERPOOL - Signature Authenticator Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/crypto/hash.h"
#include "tierpool/crypto/keys.h"
#include "tierpool/crypto/secp256k1.h"
#include "tierpool/pool/auth.h"

#include <openssl/bn.h>

#include <memory>

namespace tierpool {
namespace pool {
namespace test {

class SignatureAuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        operatorKey_ = PrivateKey::FromSeed("tierpool operator key");
        otherKey_ = PrivateKey::FromSeed("someone else");
        ASSERT_TRUE(operatorKey_.IsValid());
        ASSERT_TRUE(otherKey_.IsValid());
        hash_ = SHA256Hash(std::string("authorize payload"));
    }

    /// Replace s with n - s and flip the recovery id: same signer, high s
    std::vector<Byte> Malleate(std::vector<Byte> sig) {
        std::unique_ptr<BIGNUM, decltype(&BN_free)> n(
            BN_bin2bn(secp256k1::CURVE_ORDER.data(), 32, nullptr), &BN_free);
        std::unique_ptr<BIGNUM, decltype(&BN_free)> s(
            BN_bin2bn(sig.data() + 32, 32, nullptr), &BN_free);
        std::unique_ptr<BIGNUM, decltype(&BN_free)> high(BN_new(), &BN_free);
        EXPECT_EQ(BN_sub(high.get(), n.get(), s.get()), 1);
        EXPECT_EQ(BN_bn2binpad(high.get(), sig.data() + 32, 32), 32);
        sig[64] = sig[64] == 27 ? 28 : 27;
        return sig;
    }

    PrivateKey operatorKey_;
    PrivateKey otherKey_;
    Hash256 hash_;
};

TEST_F(SignatureAuthenticatorTest, OperatorSignatureIsValid) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    ASSERT_EQ(sig.size(), 65u);

    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
              AuthStatus::Valid);
    EXPECT_EQ(SignatureAuthenticator::IsValidSignature(hash_, sig, operatorKey_.GetAddress()),
              MAGIC_VALUE);
}

TEST_F(SignatureAuthenticatorTest, OtherSignerIsRejected) {
    auto sig = otherKey_.SignRecoverable(hash_);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
              AuthStatus::NotOperator);
    EXPECT_EQ(SignatureAuthenticator::IsValidSignature(hash_, sig, operatorKey_.GetAddress()),
              INVALID_SIGNATURE);
}

TEST_F(SignatureAuthenticatorTest, WrongHashIsRejected) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    Hash256 other = SHA256Hash(std::string("different payload"));
    EXPECT_EQ(SignatureAuthenticator::IsValidSignature(other, sig, operatorKey_.GetAddress()),
              INVALID_SIGNATURE);
}

TEST_F(SignatureAuthenticatorTest, RawRecoveryIdIsNormalized) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    sig[64] = static_cast<Byte>(sig[64] - 27);
    ASSERT_TRUE(sig[64] == 0 || sig[64] == 1);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
              AuthStatus::Valid);
}

TEST_F(SignatureAuthenticatorTest, OutOfDomainRecoveryIdIsRejected) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    for (Byte v : {Byte(2), Byte(26), Byte(29), Byte(35), Byte(255)}) {
        sig[64] = v;
        EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
                  AuthStatus::InvalidRecoveryId) << "v=" << static_cast<int>(v);
    }
}

TEST_F(SignatureAuthenticatorTest, WrongLengthIsRejectedBeforeRecovery) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    std::vector<Byte> short64(sig.begin(), sig.begin() + 64);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, short64, operatorKey_.GetAddress()),
              AuthStatus::InvalidSignatureLength);

    std::vector<Byte> long66(sig);
    long66.push_back(0);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, long66, operatorKey_.GetAddress()),
              AuthStatus::InvalidSignatureLength);

    EXPECT_EQ(SignatureAuthenticator::IsValidSignature(hash_, {}, operatorKey_.GetAddress()),
              INVALID_SIGNATURE);
}

TEST_F(SignatureAuthenticatorTest, HighSIsRejected) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    auto malleated = Malleate(sig);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, malleated, operatorKey_.GetAddress()),
              AuthStatus::MalleableSignature);
    EXPECT_EQ(SignatureAuthenticator::IsValidSignature(hash_, malleated,
                                                       operatorKey_.GetAddress()),
              INVALID_SIGNATURE);
}

TEST_F(SignatureAuthenticatorTest, ZeroRIsRejected) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    std::fill(sig.begin(), sig.begin() + 32, 0);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
              AuthStatus::RecoveryFailed);
}

TEST_F(SignatureAuthenticatorTest, RAtCurveOrderIsRejected) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    std::copy(secp256k1::CURVE_ORDER.begin(), secp256k1::CURVE_ORDER.end(), sig.begin());
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, operatorKey_.GetAddress()),
              AuthStatus::RecoveryFailed);
}

TEST_F(SignatureAuthenticatorTest, NullOperatorNeverMatches) {
    auto sig = operatorKey_.SignRecoverable(hash_);
    EXPECT_EQ(SignatureAuthenticator::Verify(hash_, sig, Address()), AuthStatus::NotOperator);
}

TEST(AuthStatusTest, Names) {
    EXPECT_STREQ(AuthStatusToString(AuthStatus::Valid), "Valid");
    EXPECT_STREQ(AuthStatusToString(AuthStatus::MalleableSignature), "MalleableSignature");
}

} // namespace test
} // namespace pool
} // namespace tierpool
