// TIERPOOL - Access Control and Pause Gate
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Operator identity with two-step handover, the bounded operator fee and
// the pause flag. Pausing blocks deposits and work submission only; no
// withdrawal path consults it.

#ifndef TIERPOOL_POOL_ACCESS_H
#define TIERPOOL_POOL_ACCESS_H

#include "tierpool/core/types.h"
#include "tierpool/pool/errors.h"

namespace tierpool {
namespace pool {

class AccessControl {
public:
    /// Throws std::invalid_argument on a null operator or out-of-range fee
    AccessControl(const Address& op, int feeBps);

    /// NotOperator unless caller is the current operator
    PoolError RequireOperator(const Address& caller) const;

    /// Paused while the gate is closed
    PoolError RequireNotPaused() const;

    PoolError SetFee(const Address& caller, int feeBps);

    /// Start a handover; a second proposal replaces the first
    PoolError ProposeOperator(const Address& caller, const Address& successor);

    /// Complete a handover; only the proposed successor may call
    PoolError AcceptOperator(const Address& caller);

    PoolError Pause(const Address& caller);
    PoolError Unpause(const Address& caller);

    const Address& GetOperator() const { return operator_; }
    const Address& GetPendingOperator() const { return pendingOperator_; }
    int GetFeeBps() const { return feeBps_; }
    bool IsPaused() const { return paused_; }

private:
    Address operator_;
    Address pendingOperator_;
    int feeBps_;
    bool paused_{false};
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_ACCESS_H
