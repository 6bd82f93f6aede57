// TIERPOOL - Withdrawal Queue Tests
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include <gtest/gtest.h>

#include "tierpool/pool/withdrawal.h"

namespace tierpool {
namespace pool {
namespace test {

class WithdrawalQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::array<Byte, 20> a{};
        a[0] = 0xaa;
        alice_ = Address(a);
        std::array<Byte, 20> b{};
        b[0] = 0xbb;
        bob_ = Address(b);
    }

    WithdrawalQueue queue_;
    Address alice_;
    Address bob_;
};

TEST_F(WithdrawalQueueTest, EnqueueSetsAvailableEpoch) {
    PendingWithdrawal w = queue_.Enqueue(alice_, 100, 7);
    EXPECT_EQ(w.owner, alice_);
    EXPECT_EQ(w.amount, 100);
    EXPECT_EQ(w.requestEpoch, 7u);
    EXPECT_EQ(w.availableEpoch, 8u);
    EXPECT_FALSE(w.IsMature(7));
    EXPECT_TRUE(w.IsMature(8));
    EXPECT_EQ(queue_.GetTotalQueued(), 100);
    EXPECT_EQ(queue_.GetQueued(alice_), 100);
    EXPECT_EQ(queue_.Size(), 1u);
}

TEST_F(WithdrawalQueueTest, NothingToRelease) {
    AmountResult r = queue_.ReleaseMature(alice_, 100);
    EXPECT_EQ(r.error, PoolError::NothingToRelease);
}

TEST_F(WithdrawalQueueTest, NotReadyBeforeAvailableEpoch) {
    queue_.Enqueue(alice_, 100, 7);
    AmountResult r = queue_.ReleaseMature(alice_, 7);
    EXPECT_EQ(r.error, PoolError::WithdrawalNotReady);
    EXPECT_NE(r.message.find("8"), std::string::npos);
    EXPECT_EQ(queue_.GetTotalQueued(), 100);
}

TEST_F(WithdrawalQueueTest, ReleasesOnlyMatureRecords) {
    queue_.Enqueue(alice_, 100, 5);
    queue_.Enqueue(alice_, 40, 9);
    queue_.Enqueue(alice_, 60, 6);
    queue_.Enqueue(bob_, 70, 5);

    AmountResult r = queue_.ReleaseMature(alice_, 7);
    ASSERT_TRUE(r.IsOk());
    EXPECT_EQ(r.amount, 160);

    auto remaining = queue_.GetRequests(alice_);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].amount, 40);
    EXPECT_EQ(remaining[0].availableEpoch, 10u);

    EXPECT_EQ(queue_.GetTotalQueued(), 110);
    EXPECT_EQ(queue_.GetQueued(bob_), 70);
    EXPECT_EQ(queue_.Size(), 2u);
}

TEST_F(WithdrawalQueueTest, SecondReleaseFindsNothing) {
    queue_.Enqueue(alice_, 100, 1);
    ASSERT_TRUE(queue_.ReleaseMature(alice_, 2).IsOk());
    EXPECT_EQ(queue_.ReleaseMature(alice_, 2).error, PoolError::NothingToRelease);
    EXPECT_TRUE(queue_.GetRequests(alice_).empty());
    EXPECT_EQ(queue_.GetTotalQueued(), 0);
}

TEST_F(WithdrawalQueueTest, RemoveAllIgnoresMaturity) {
    queue_.Enqueue(alice_, 100, 1);
    queue_.Enqueue(alice_, 50, 20);
    EXPECT_EQ(queue_.RemoveAll(alice_), 150);
    EXPECT_EQ(queue_.GetTotalQueued(), 0);
    EXPECT_EQ(queue_.Size(), 0u);
    EXPECT_EQ(queue_.RemoveAll(alice_), 0);
}

} // namespace test
} // namespace pool
} // namespace tierpool
