// TIERPOOL - Reward Distributor Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/reward.h"
#include "tierpool/pool/ledger.h"
#include "tierpool/pool/params.h"
#include "tierpool/util/logging.h"

namespace tierpool {
namespace pool {

RewardSplit SplitReward(Amount totalReward, int feeBps) {
    RewardSplit split;
    split.totalReward = totalReward;
    if (totalReward <= 0) {
        return split;
    }
    split.operatorFee = MulDiv(totalReward, feeBps, BPS_DENOMINATOR);
    split.depositorReward = totalReward - split.operatorFee;
    return split;
}

DistributionResult RewardDistributor::Distribute(Amount depositorReward, DepositLedger& ledger) {
    DistributionResult result;

    Amount pool = depositorReward + carried_;
    if (pool <= 0) {
        return result;
    }

    Amount totalLocked = ledger.GetTotalLocked();
    if (totalLocked == 0) {
        carried_ = pool;
        result.carried = pool;
        LOG_INFO(util::LogCategory::REWARD) << "No locked stake; carrying " << pool
                                            << " to the next distribution";
        return result;
    }
    carried_ = 0;

    for (const Address& who : ledger.GetRoster()) {
        const Participant* p = ledger.Find(who);
        if (!p || p->lockedAmount == 0) {
            continue;
        }
        Amount share = MulDiv(pool, p->lockedAmount, totalLocked);
        if (share > 0) {
            ledger.CreditReward(who, share);
            result.distributed += share;
            ++result.recipients;
        }
    }

    result.dust = pool - result.distributed;
    LOG_DEBUG(util::LogCategory::REWARD) << "Distributed " << result.distributed << " to "
                                         << result.recipients << " holder(s), dust "
                                         << result.dust;
    return result;
}

void RewardDistributor::RecordClaim(const RewardSplit& split, const DistributionResult& dist) {
    stats_.totalRewardReceived += split.totalReward;
    stats_.totalOperatorFees += split.operatorFee;
    stats_.totalDistributed += dist.distributed;
    ++stats_.claimCount;
}

} // namespace pool
} // namespace tierpool
