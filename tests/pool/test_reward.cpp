// TIERPOOL - Reward Distributor Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/pool/ledger.h"
#include "tierpool/pool/reward.h"

#include <cstdlib>

namespace tierpool {
namespace pool {
namespace test {

// ============================================================================
// Fee Split
// ============================================================================

TEST(SplitRewardTest, FiveHundredBps) {
    RewardSplit split = SplitReward(1000, 500);
    EXPECT_EQ(split.totalReward, 1000);
    EXPECT_EQ(split.operatorFee, 50);
    EXPECT_EQ(split.depositorReward, 950);
}

TEST(SplitRewardTest, FeeFloors) {
    RewardSplit split = SplitReward(999, 500);
    EXPECT_EQ(split.operatorFee, 49);
    EXPECT_EQ(split.depositorReward, 950);
}

TEST(SplitRewardTest, ZeroFeeAndZeroReward) {
    EXPECT_EQ(SplitReward(1000, 0).operatorFee, 0);
    EXPECT_EQ(SplitReward(1000, 0).depositorReward, 1000);
    EXPECT_EQ(SplitReward(0, 500).operatorFee, 0);
    EXPECT_EQ(SplitReward(0, 500).depositorReward, 0);
}

TEST(SplitRewardTest, LargeRewardDoesNotOverflow) {
    RewardSplit split = SplitReward(MAX_AMOUNT, 2000);
    EXPECT_EQ(split.operatorFee + split.depositorReward, MAX_AMOUNT);
    EXPECT_EQ(split.operatorFee, MAX_AMOUNT / 5);
}

// ============================================================================
// Distribution
// ============================================================================

class RewardDistributorTest : public ::testing::Test {
protected:
    Address MakeAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[10] = id;
        return Address(data);
    }

    /// Deposit at epoch 0 and promote at epoch 1
    void Lock(const Address& who, Amount amount) {
        ASSERT_EQ(ledger_.AddPending(who, amount, 0), PoolError::None);
        ledger_.PromoteMatured(1);
    }

    DepositLedger ledger_;
    RewardDistributor distributor_;
};

TEST_F(RewardDistributorTest, ProRataOverLockedStake) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    Lock(a, 200);
    Lock(b, 100);

    DistributionResult r = distributor_.Distribute(900, ledger_);
    EXPECT_EQ(r.distributed, 900);
    EXPECT_EQ(r.dust, 0);
    EXPECT_EQ(r.recipients, 2u);
    EXPECT_EQ(ledger_.Find(a)->unclaimedReward, 600);
    EXPECT_EQ(ledger_.Find(b)->unclaimedReward, 300);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 900);
}

TEST_F(RewardDistributorTest, TwoToOneWithinRounding) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    Lock(a, 2 * COIN);
    Lock(b, 1 * COIN);

    distributor_.Distribute(1001, ledger_);
    Amount ra = ledger_.Find(a)->unclaimedReward;
    Amount rb = ledger_.Find(b)->unclaimedReward;
    EXPECT_LE(std::llabs(ra - 2 * rb), 2);
    EXPECT_LE(1001 - (ra + rb), 1);
}

TEST_F(RewardDistributorTest, PendingStakeEarnsNothing) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    Lock(a, 100);
    ASSERT_EQ(ledger_.AddPending(b, 1000, 1), PoolError::None);

    DistributionResult r = distributor_.Distribute(500, ledger_);
    EXPECT_EQ(r.recipients, 1u);
    EXPECT_EQ(ledger_.Find(a)->unclaimedReward, 500);
    EXPECT_EQ(ledger_.Find(b)->unclaimedReward, 0);
}

TEST_F(RewardDistributorTest, DustIsBelowRecipientCount) {
    Lock(MakeAddress(1), 1);
    Lock(MakeAddress(2), 1);
    Lock(MakeAddress(3), 1);

    DistributionResult r = distributor_.Distribute(100, ledger_);
    EXPECT_EQ(r.distributed, 99);
    EXPECT_EQ(r.dust, 1);
    EXPECT_LT(r.dust, static_cast<Amount>(r.recipients));
}

TEST_F(RewardDistributorTest, NothingLockedCarries) {
    ASSERT_EQ(ledger_.AddPending(MakeAddress(1), 100, 5), PoolError::None);

    DistributionResult r = distributor_.Distribute(700, ledger_);
    EXPECT_EQ(r.distributed, 0);
    EXPECT_EQ(r.carried, 700);
    EXPECT_EQ(distributor_.GetCarriedReward(), 700);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 0);

    ledger_.PromoteMatured(6);
    r = distributor_.Distribute(300, ledger_);
    EXPECT_EQ(r.distributed, 1000);
    EXPECT_EQ(r.carried, 0);
    EXPECT_EQ(distributor_.GetCarriedReward(), 0);
    EXPECT_EQ(ledger_.Find(MakeAddress(1))->unclaimedReward, 1000);
}

TEST_F(RewardDistributorTest, ZeroRewardIsNoOp) {
    Lock(MakeAddress(1), 100);
    DistributionResult r = distributor_.Distribute(0, ledger_);
    EXPECT_EQ(r.distributed, 0);
    EXPECT_EQ(r.recipients, 0u);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 0);
}

TEST_F(RewardDistributorTest, RecordClaimAccumulates) {
    RewardSplit split = SplitReward(1000, 500);
    DistributionResult dist;
    dist.distributed = 948;
    distributor_.RecordClaim(split, dist);
    distributor_.RecordClaim(SplitReward(0, 500), DistributionResult());

    const PoolStats& stats = distributor_.GetStats();
    EXPECT_EQ(stats.totalRewardReceived, 1000);
    EXPECT_EQ(stats.totalOperatorFees, 50);
    EXPECT_EQ(stats.totalDistributed, 948);
    EXPECT_EQ(stats.claimCount, 2u);
}

} // namespace test
} // namespace pool
} // namespace tierpool
