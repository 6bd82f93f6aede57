// TIERPOOL - Pool Events Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/events.h"

#include <sstream>

namespace tierpool {
namespace pool {

const char* PoolEventTypeToString(PoolEventType type) {
    switch (type) {
        case PoolEventType::Deposited:               return "Deposited";
        case PoolEventType::WithdrawalRequested:     return "WithdrawalRequested";
        case PoolEventType::WithdrawalCompleted:     return "WithdrawalCompleted";
        case PoolEventType::EmergencyWithdrawn:      return "EmergencyWithdrawn";
        case PoolEventType::RewardsClaimed:          return "RewardsClaimed";
        case PoolEventType::UserRewardsClaimed:      return "UserRewardsClaimed";
        case PoolEventType::EpochProcessed:          return "EpochProcessed";
        case PoolEventType::WorkSubmitted:           return "WorkSubmitted";
        case PoolEventType::FeeUpdated:              return "FeeUpdated";
        case PoolEventType::OperatorTransferStarted: return "OperatorTransferStarted";
        case PoolEventType::OperatorTransferred:     return "OperatorTransferred";
        case PoolEventType::Paused:                  return "Paused";
        case PoolEventType::Unpaused:                return "Unpaused";
    }
    return "Unknown";
}

std::string PoolEvent::ToString() const {
    std::ostringstream oss;
    oss << PoolEventTypeToString(type);

    switch (type) {
        case PoolEventType::Deposited:
        case PoolEventType::WithdrawalRequested:
            oss << " account=" << account.ToHex() << " amount=" << amount
                << " epoch=" << epoch;
            break;
        case PoolEventType::WithdrawalCompleted:
        case PoolEventType::EmergencyWithdrawn:
        case PoolEventType::UserRewardsClaimed:
            oss << " account=" << account.ToHex() << " amount=" << amount;
            break;
        case PoolEventType::RewardsClaimed:
            oss << " reward=" << amount << " fee=" << fee
                << " distributed=" << distributed << " dust=" << dust;
            break;
        case PoolEventType::EpochProcessed:
            oss << " epoch=" << epoch << " promoted=" << amount;
            break;
        case PoolEventType::FeeUpdated:
            oss << " from=" << amount << "bps to=" << fee << "bps";
            break;
        case PoolEventType::OperatorTransferStarted:
        case PoolEventType::OperatorTransferred:
            oss << " from=" << account.ToHex() << " to=" << counterparty.ToHex();
            break;
        case PoolEventType::WorkSubmitted:
        case PoolEventType::Paused:
        case PoolEventType::Unpaused:
            oss << " by=" << account.ToHex();
            break;
    }
    return oss.str();
}

} // namespace pool
} // namespace tierpool
