// TIERPOOL - Reward Distributor
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Splits each settlement reward into the operator fee and the depositor
// share, then credits the depositor share pro-rata over locked stake.
// Pending stake earns nothing. Floor rounding leaves a bounded remainder
// (fewer units than there are recipients) in custody, untracked.

#ifndef TIERPOOL_POOL_REWARD_H
#define TIERPOOL_POOL_REWARD_H

#include "tierpool/core/types.h"

#include <cstdint>

namespace tierpool {
namespace pool {

class DepositLedger;

/// Fee split of a single reward
struct RewardSplit {
    Amount totalReward{0};
    Amount operatorFee{0};
    Amount depositorReward{0};
};

/// floor(total * feeBps / 10000) to the operator, the rest to depositors
RewardSplit SplitReward(Amount totalReward, int feeBps);

/// Outcome of one pro-rata distribution
struct DistributionResult {
    /// Sum credited to participants
    Amount distributed{0};

    /// Rounding remainder left in custody
    Amount dust{0};

    /// Held back for the next distribution because nothing was locked
    Amount carried{0};

    /// Participants credited
    size_t recipients{0};
};

/// Lifetime counters
struct PoolStats {
    Amount totalRewardReceived{0};
    Amount totalOperatorFees{0};
    Amount totalDistributed{0};
    uint64_t claimCount{0};
};

class RewardDistributor {
public:
    RewardDistributor() = default;

    /**
     * Credit depositorReward plus any carried amount to locked holders.
     * With no locked stake the whole amount is carried instead.
     */
    DistributionResult Distribute(Amount depositorReward, DepositLedger& ledger);

    /// Count a claim event in the lifetime stats
    void RecordClaim(const RewardSplit& split, const DistributionResult& dist);

    Amount GetCarriedReward() const { return carried_; }
    const PoolStats& GetStats() const { return stats_; }

private:
    Amount carried_{0};
    PoolStats stats_;
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_REWARD_H
