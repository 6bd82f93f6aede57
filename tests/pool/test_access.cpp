// TIERPOOL - Access Control Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/crypto/hash.h"
#include "tierpool/pool/access.h"
#include "tierpool/pool/params.h"

#include <stdexcept>

namespace tierpool {
namespace pool {
namespace test {

class AccessControlTest : public ::testing::Test {
protected:
    AccessControlTest()
        : operator_(ComputeHash160(std::string("operator")))
        , successor_(ComputeHash160(std::string("successor")))
        , stranger_(ComputeHash160(std::string("stranger")))
        , access_(operator_, 500) {}

    Address operator_;
    Address successor_;
    Address stranger_;
    AccessControl access_;
};

TEST_F(AccessControlTest, ConstructorValidates) {
    EXPECT_THROW(AccessControl(Address(), 500), std::invalid_argument);
    EXPECT_THROW(AccessControl(operator_, MAX_FEE_BPS + 1), std::invalid_argument);
    EXPECT_THROW(AccessControl(operator_, -1), std::invalid_argument);
    EXPECT_NO_THROW(AccessControl(operator_, MAX_FEE_BPS));
}

TEST_F(AccessControlTest, InitialState) {
    EXPECT_EQ(access_.GetOperator(), operator_);
    EXPECT_TRUE(access_.GetPendingOperator().IsNull());
    EXPECT_EQ(access_.GetFeeBps(), 500);
    EXPECT_FALSE(access_.IsPaused());
    EXPECT_EQ(access_.RequireOperator(operator_), PoolError::None);
    EXPECT_EQ(access_.RequireOperator(stranger_), PoolError::NotOperator);
}

TEST_F(AccessControlTest, SetFee) {
    EXPECT_EQ(access_.SetFee(stranger_, 100), PoolError::NotOperator);
    EXPECT_EQ(access_.SetFee(operator_, MAX_FEE_BPS + 1), PoolError::FeeTooHigh);
    EXPECT_EQ(access_.GetFeeBps(), 500);
    EXPECT_EQ(access_.SetFee(operator_, MAX_FEE_BPS), PoolError::None);
    EXPECT_EQ(access_.GetFeeBps(), MAX_FEE_BPS);
    EXPECT_EQ(access_.SetFee(operator_, 0), PoolError::None);
    EXPECT_EQ(access_.GetFeeBps(), 0);
}

TEST_F(AccessControlTest, TwoStepHandover) {
    EXPECT_EQ(access_.ProposeOperator(stranger_, successor_), PoolError::NotOperator);
    EXPECT_EQ(access_.ProposeOperator(operator_, Address()), PoolError::InvalidOperator);
    EXPECT_EQ(access_.AcceptOperator(successor_), PoolError::NotPendingOperator);

    ASSERT_EQ(access_.ProposeOperator(operator_, successor_), PoolError::None);
    EXPECT_EQ(access_.GetPendingOperator(), successor_);
    EXPECT_EQ(access_.GetOperator(), operator_);

    EXPECT_EQ(access_.AcceptOperator(stranger_), PoolError::NotPendingOperator);
    ASSERT_EQ(access_.AcceptOperator(successor_), PoolError::None);
    EXPECT_EQ(access_.GetOperator(), successor_);
    EXPECT_TRUE(access_.GetPendingOperator().IsNull());

    EXPECT_EQ(access_.SetFee(operator_, 100), PoolError::NotOperator);
    EXPECT_EQ(access_.SetFee(successor_, 100), PoolError::None);
}

TEST_F(AccessControlTest, ProposalCanBeReplaced) {
    ASSERT_EQ(access_.ProposeOperator(operator_, stranger_), PoolError::None);
    ASSERT_EQ(access_.ProposeOperator(operator_, successor_), PoolError::None);
    EXPECT_EQ(access_.AcceptOperator(stranger_), PoolError::NotPendingOperator);
    EXPECT_EQ(access_.AcceptOperator(successor_), PoolError::None);
}

TEST_F(AccessControlTest, PauseGate) {
    EXPECT_EQ(access_.Pause(stranger_), PoolError::NotOperator);
    EXPECT_EQ(access_.RequireNotPaused(), PoolError::None);

    ASSERT_EQ(access_.Pause(operator_), PoolError::None);
    EXPECT_TRUE(access_.IsPaused());
    EXPECT_EQ(access_.RequireNotPaused(), PoolError::Paused);

    // Idempotent
    EXPECT_EQ(access_.Pause(operator_), PoolError::None);
    EXPECT_TRUE(access_.IsPaused());

    EXPECT_EQ(access_.Unpause(stranger_), PoolError::NotOperator);
    ASSERT_EQ(access_.Unpause(operator_), PoolError::None);
    EXPECT_FALSE(access_.IsPaused());
    EXPECT_EQ(access_.Unpause(operator_), PoolError::None);
}

} // namespace test
} // namespace pool
} // namespace tierpool
