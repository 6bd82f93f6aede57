// TIERPOOL - Pool Events
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#ifndef TIERPOOL_POOL_EVENTS_H
#define TIERPOOL_POOL_EVENTS_H

#include "tierpool/core/types.h"

#include <functional>
#include <string>

namespace tierpool {
namespace pool {

enum class PoolEventType {
    Deposited,
    WithdrawalRequested,
    WithdrawalCompleted,
    EmergencyWithdrawn,
    RewardsClaimed,
    UserRewardsClaimed,
    EpochProcessed,
    WorkSubmitted,
    FeeUpdated,
    OperatorTransferStarted,
    OperatorTransferred,
    Paused,
    Unpaused
};

const char* PoolEventTypeToString(PoolEventType type);

/**
 * A committed state change. Fields not meaningful for a given type are zero.
 *
 * - Deposited: account, amount, epoch = lock epoch
 * - WithdrawalRequested: account, amount, epoch = available epoch
 * - WithdrawalCompleted / EmergencyWithdrawn / UserRewardsClaimed: account, amount
 * - RewardsClaimed: account = caller, amount = total reward, fee, distributed, dust
 * - EpochProcessed: epoch, amount = participants promoted
 * - FeeUpdated: amount = old bps, fee = new bps
 * - OperatorTransferStarted / OperatorTransferred: account = old, counterparty = new
 * - Paused / Unpaused / WorkSubmitted: account = operator
 */
struct PoolEvent {
    PoolEventType type{PoolEventType::Deposited};
    Address account;
    Address counterparty;
    Amount amount{0};
    Amount fee{0};
    Amount distributed{0};
    Amount dust{0};
    Epoch epoch{0};

    std::string ToString() const;
};

/// Receives events once the enclosing operation commits
using PoolEventCallback = std::function<void(const PoolEvent&)>;

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_EVENTS_H
