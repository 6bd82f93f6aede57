// TIERPOOL - Pool Result Types Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/errors.h"

#include <sstream>

namespace tierpool {
namespace pool {

const char* PoolErrorToString(PoolError error) {
    switch (error) {
        case PoolError::None:               return "None";
        case PoolError::InvalidAmount:      return "InvalidAmount";
        case PoolError::FeeTooHigh:         return "FeeTooHigh";
        case PoolError::InvalidOperator:    return "InvalidOperator";
        case PoolError::NotOperator:        return "NotOperator";
        case PoolError::NotPendingOperator: return "NotPendingOperator";
        case PoolError::Paused:             return "Paused";
        case PoolError::InsufficientBalance: return "InsufficientBalance";
        case PoolError::NothingToRelease:   return "NothingToRelease";
        case PoolError::WithdrawalNotReady: return "WithdrawalNotReady";
        case PoolError::NothingToWithdraw:  return "NothingToWithdraw";
        case PoolError::NoRewards:          return "NoRewards";
        case PoolError::TransferFailed:     return "TransferFailed";
        case PoolError::ClaimFailed:        return "ClaimFailed";
        case PoolError::SubmissionFailed:   return "SubmissionFailed";
        case PoolError::EpochUnavailable:   return "EpochUnavailable";
        case PoolError::Reentrant:          return "Reentrant";
    }
    return "Unknown";
}

std::string PoolResult::ToString() const {
    if (IsOk()) {
        return "ok";
    }
    return std::string(PoolErrorToString(error)) + ": " + message;
}

std::string AmountResult::ToString() const {
    if (IsOk()) {
        return "ok amount=" + std::to_string(amount);
    }
    return std::string(PoolErrorToString(error)) + ": " + message;
}

std::string ClaimResult::ToString() const {
    if (!IsOk()) {
        return std::string(PoolErrorToString(error)) + ": " + message;
    }
    std::ostringstream oss;
    oss << "ok reward=" << totalReward
        << " fee=" << operatorFee
        << " distributed=" << distributed
        << " dust=" << dust;
    if (carried > 0) {
        oss << " carried=" << carried;
    }
    return oss.str();
}

} // namespace pool
} // namespace tierpool
