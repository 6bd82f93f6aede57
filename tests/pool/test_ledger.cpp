// TIERPOOL - Deposit Ledger Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/pool/ledger.h"

#include <algorithm>

namespace tierpool {
namespace pool {
namespace test {

class DepositLedgerTest : public ::testing::Test {
protected:
    Address MakeAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Address(data);
    }

    void ExpectConsistent() {
        std::string error;
        EXPECT_TRUE(ledger_.CheckInvariants(&error)) << error;
    }

    DepositLedger ledger_;
};

TEST_F(DepositLedgerTest, EmptyLedger) {
    EXPECT_EQ(ledger_.GetTotalLocked(), 0);
    EXPECT_EQ(ledger_.GetTotalPending(), 0);
    EXPECT_EQ(ledger_.GetDepositorCount(), 0u);
    EXPECT_EQ(ledger_.Find(MakeAddress(1)), nullptr);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, AddPendingLocksNextEpoch) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 5), PoolError::None);

    const Participant* p = ledger_.Find(a);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->pendingAmount, 100);
    EXPECT_EQ(p->lockedAmount, 0);
    EXPECT_EQ(p->lockEpoch, 6u);
    EXPECT_TRUE(p->active);
    EXPECT_EQ(ledger_.GetTotalPending(), 100);
    EXPECT_EQ(ledger_.GetDepositorCount(), 1u);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, AddPendingMergesBatch) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 5), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(a, 50, 5), PoolError::None);

    const Participant* p = ledger_.Find(a);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->pendingAmount, 150);
    EXPECT_EQ(p->lockEpoch, 6u);
    EXPECT_EQ(ledger_.GetDepositorCount(), 1u);
}

TEST_F(DepositLedgerTest, LaterDepositPushesLockEpoch) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 5), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(a, 10, 8), PoolError::None);
    EXPECT_EQ(ledger_.Find(a)->lockEpoch, 9u);
}

TEST_F(DepositLedgerTest, AddPendingRejectsBadAmounts) {
    Address a = MakeAddress(1);
    EXPECT_EQ(ledger_.AddPending(a, 0, 1), PoolError::InvalidAmount);
    EXPECT_EQ(ledger_.AddPending(a, -5, 1), PoolError::InvalidAmount);
    EXPECT_EQ(ledger_.Find(a), nullptr);

    ASSERT_EQ(ledger_.AddPending(a, MAX_AMOUNT - 10, 1), PoolError::None);
    EXPECT_EQ(ledger_.AddPending(MakeAddress(2), 11, 1), PoolError::InvalidAmount);
    EXPECT_EQ(ledger_.Find(MakeAddress(2)), nullptr);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, PromoteMatured) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    ASSERT_EQ(ledger_.AddPending(a, 100, 5), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(b, 200, 6), PoolError::None);

    EXPECT_EQ(ledger_.PromoteMatured(5), 0u);
    EXPECT_EQ(ledger_.PromoteMatured(6), 1u);
    EXPECT_EQ(ledger_.Find(a)->lockedAmount, 100);
    EXPECT_EQ(ledger_.Find(a)->pendingAmount, 0);
    EXPECT_EQ(ledger_.Find(b)->pendingAmount, 200);
    EXPECT_EQ(ledger_.GetTotalLocked(), 100);
    EXPECT_EQ(ledger_.GetTotalPending(), 200);

    EXPECT_EQ(ledger_.PromoteMatured(10), 1u);
    EXPECT_EQ(ledger_.GetTotalLocked(), 300);
    EXPECT_EQ(ledger_.GetTotalPending(), 0);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, RemoveStakeTakesPendingFirst) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);
    ledger_.PromoteMatured(1);
    ASSERT_EQ(ledger_.AddPending(a, 30, 1), PoolError::None);

    Amount fromLocked = -1;
    ASSERT_EQ(ledger_.RemoveStake(a, 50, &fromLocked), PoolError::None);
    EXPECT_EQ(fromLocked, 20);
    EXPECT_EQ(ledger_.Find(a)->pendingAmount, 0);
    EXPECT_EQ(ledger_.Find(a)->lockedAmount, 80);
    EXPECT_EQ(ledger_.GetTotalLocked(), 80);
    EXPECT_EQ(ledger_.GetTotalPending(), 0);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, RemoveStakeRejections) {
    Address a = MakeAddress(1);
    EXPECT_EQ(ledger_.RemoveStake(a, 10), PoolError::InsufficientBalance);

    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);
    EXPECT_EQ(ledger_.RemoveStake(a, 0), PoolError::InvalidAmount);
    EXPECT_EQ(ledger_.RemoveStake(a, 101), PoolError::InsufficientBalance);
    EXPECT_EQ(ledger_.Find(a)->pendingAmount, 100);
}

TEST_F(DepositLedgerTest, FullRemovalLeavesRosterAndErases) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);
    ASSERT_EQ(ledger_.RemoveStake(a, 100), PoolError::None);
    EXPECT_EQ(ledger_.GetDepositorCount(), 0u);
    EXPECT_EQ(ledger_.Find(a), nullptr);
    EXPECT_EQ(ledger_.GetRecordCount(), 0u);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, SwapAndPopKeepsIndices) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    Address c = MakeAddress(3);
    ASSERT_EQ(ledger_.AddPending(a, 10, 0), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(b, 20, 0), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(c, 30, 0), PoolError::None);

    ASSERT_EQ(ledger_.RemoveStake(a, 10), PoolError::None);

    const auto& roster = ledger_.GetRoster();
    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0], c);
    EXPECT_EQ(roster[1], b);
    EXPECT_EQ(ledger_.Find(c)->rosterIndex, 0u);
    EXPECT_EQ(ledger_.Find(b)->rosterIndex, 1u);
    ExpectConsistent();

    ASSERT_EQ(ledger_.RemoveStake(b, 20), PoolError::None);
    ASSERT_EQ(ledger_.GetRoster().size(), 1u);
    EXPECT_EQ(ledger_.GetRoster()[0], c);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, InactiveRecordKeptWhileRewardOwed) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);
    ledger_.PromoteMatured(1);
    ledger_.CreditReward(a, 7);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 7);

    ASSERT_EQ(ledger_.RemoveStake(a, 100), PoolError::None);
    const Participant* p = ledger_.Find(a);
    ASSERT_NE(p, nullptr);
    EXPECT_FALSE(p->active);
    EXPECT_EQ(p->unclaimedReward, 7);
    EXPECT_EQ(ledger_.GetDepositorCount(), 0u);
    ExpectConsistent();

    EXPECT_EQ(ledger_.TakeReward(a), 7);
    EXPECT_EQ(ledger_.Find(a), nullptr);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 0);
    ExpectConsistent();
}

TEST_F(DepositLedgerTest, TakeRewardOnUnknown) {
    EXPECT_EQ(ledger_.TakeReward(MakeAddress(9)), 0);
}

TEST_F(DepositLedgerTest, SweepAll) {
    Address a = MakeAddress(1);
    Address b = MakeAddress(2);
    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);
    ASSERT_EQ(ledger_.AddPending(b, 50, 0), PoolError::None);
    ledger_.PromoteMatured(1);
    ASSERT_EQ(ledger_.AddPending(a, 40, 1), PoolError::None);
    ledger_.CreditReward(a, 5);

    EXPECT_EQ(ledger_.SweepAll(a), 145);
    EXPECT_EQ(ledger_.Find(a), nullptr);
    EXPECT_EQ(ledger_.GetTotalLocked(), 50);
    EXPECT_EQ(ledger_.GetTotalPending(), 0);
    EXPECT_EQ(ledger_.GetTotalUnclaimedReward(), 0);
    EXPECT_EQ(ledger_.GetDepositorCount(), 1u);
    ExpectConsistent();

    EXPECT_EQ(ledger_.SweepAll(a), 0);
}

TEST_F(DepositLedgerTest, CopyIsIndependent) {
    Address a = MakeAddress(1);
    ASSERT_EQ(ledger_.AddPending(a, 100, 0), PoolError::None);

    DepositLedger saved = ledger_;
    ASSERT_EQ(ledger_.RemoveStake(a, 100), PoolError::None);
    EXPECT_EQ(saved.GetTotalPending(), 100);
    ASSERT_NE(saved.Find(a), nullptr);

    ledger_ = saved;
    EXPECT_EQ(ledger_.GetTotalPending(), 100);
    EXPECT_EQ(ledger_.GetDepositorCount(), 1u);
    ExpectConsistent();
}

} // namespace test
} // namespace pool
} // namespace tierpool
