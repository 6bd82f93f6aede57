// TIERPOOL - Pool Result Types
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Typed rejections returned by every pool operation. A failed operation
// has left no state change behind.

#ifndef TIERPOOL_POOL_ERRORS_H
#define TIERPOOL_POOL_ERRORS_H

#include "tierpool/core/types.h"

#include <string>

namespace tierpool {
namespace pool {

// ============================================================================
// Error Codes
// ============================================================================

enum class PoolError {
    None,

    // Validation
    InvalidAmount,
    FeeTooHigh,
    InvalidOperator,

    // Authorization
    NotOperator,
    NotPendingOperator,
    Paused,

    // Balances and queue state
    InsufficientBalance,
    NothingToRelease,
    WithdrawalNotReady,
    NothingToWithdraw,
    NoRewards,

    // External collaborators
    TransferFailed,
    ClaimFailed,
    SubmissionFailed,
    EpochUnavailable,

    // Called from inside another engine operation
    Reentrant
};

/// Stable name for an error code
const char* PoolErrorToString(PoolError error);

// ============================================================================
// Results
// ============================================================================

/// Outcome of an operation with no payload
struct PoolResult {
    PoolError error{PoolError::None};
    std::string message;

    bool IsOk() const { return error == PoolError::None; }
    explicit operator bool() const { return IsOk(); }

    static PoolResult Success() { return PoolResult(); }

    static PoolResult Failure(PoolError e, const std::string& msg = "") {
        PoolResult r;
        r.error = e;
        r.message = msg.empty() ? PoolErrorToString(e) : msg;
        return r;
    }

    std::string ToString() const;
};

/// Outcome of an operation that moves an amount
struct AmountResult {
    PoolError error{PoolError::None};
    std::string message;
    Amount amount{0};

    bool IsOk() const { return error == PoolError::None; }
    explicit operator bool() const { return IsOk(); }

    static AmountResult Success(Amount a) {
        AmountResult r;
        r.amount = a;
        return r;
    }

    static AmountResult Failure(PoolError e, const std::string& msg = "") {
        AmountResult r;
        r.error = e;
        r.message = msg.empty() ? PoolErrorToString(e) : msg;
        return r;
    }

    std::string ToString() const;
};

/// Outcome of an epoch synchronization
struct EpochResult {
    PoolError error{PoolError::None};
    std::string message;
    Epoch epoch{0};
    size_t promoted{0};
    bool advanced{false};

    bool IsOk() const { return error == PoolError::None; }
    explicit operator bool() const { return IsOk(); }

    static EpochResult Success(Epoch e, size_t promotedCount, bool didAdvance) {
        EpochResult r;
        r.epoch = e;
        r.promoted = promotedCount;
        r.advanced = didAdvance;
        return r;
    }

    static EpochResult Failure(PoolError e, const std::string& msg = "") {
        EpochResult r;
        r.error = e;
        r.message = msg.empty() ? PoolErrorToString(e) : msg;
        return r;
    }
};

/// Outcome of a settlement claim event
struct ClaimResult {
    PoolError error{PoolError::None};
    std::string message;

    /// Balance delta observed across the settlement call
    Amount totalReward{0};

    /// Fee paid to the operator
    Amount operatorFee{0};

    /// Sum credited to depositors
    Amount distributed{0};

    /// Rounding remainder left in custody
    Amount dust{0};

    /// Depositor share held for the next event (no locked stake)
    Amount carried{0};

    bool IsOk() const { return error == PoolError::None; }
    explicit operator bool() const { return IsOk(); }

    static ClaimResult Failure(PoolError e, const std::string& msg = "") {
        ClaimResult r;
        r.error = e;
        r.message = msg.empty() ? PoolErrorToString(e) : msg;
        return r;
    }

    std::string ToString() const;
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_ERRORS_H
