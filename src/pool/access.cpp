// TIERPOOL - Access Control Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/access.h"
#include "tierpool/pool/params.h"

#include <stdexcept>

namespace tierpool {
namespace pool {

AccessControl::AccessControl(const Address& op, int feeBps)
    : operator_(op), feeBps_(feeBps) {
    if (op.IsNull()) {
        throw std::invalid_argument("operator must not be null");
    }
    if (feeBps < 0 || feeBps > MAX_FEE_BPS) {
        throw std::invalid_argument("operator fee out of range");
    }
}

PoolError AccessControl::RequireOperator(const Address& caller) const {
    return caller == operator_ ? PoolError::None : PoolError::NotOperator;
}

PoolError AccessControl::RequireNotPaused() const {
    return paused_ ? PoolError::Paused : PoolError::None;
}

PoolError AccessControl::SetFee(const Address& caller, int feeBps) {
    if (caller != operator_) {
        return PoolError::NotOperator;
    }
    if (feeBps < 0 || feeBps > MAX_FEE_BPS) {
        return PoolError::FeeTooHigh;
    }
    feeBps_ = feeBps;
    return PoolError::None;
}

PoolError AccessControl::ProposeOperator(const Address& caller, const Address& successor) {
    if (caller != operator_) {
        return PoolError::NotOperator;
    }
    if (successor.IsNull()) {
        return PoolError::InvalidOperator;
    }
    pendingOperator_ = successor;
    return PoolError::None;
}

PoolError AccessControl::AcceptOperator(const Address& caller) {
    if (pendingOperator_.IsNull() || caller != pendingOperator_) {
        return PoolError::NotPendingOperator;
    }
    operator_ = pendingOperator_;
    pendingOperator_.SetNull();
    return PoolError::None;
}

PoolError AccessControl::Pause(const Address& caller) {
    if (caller != operator_) {
        return PoolError::NotOperator;
    }
    paused_ = true;
    return PoolError::None;
}

PoolError AccessControl::Unpause(const Address& caller) {
    if (caller != operator_) {
        return PoolError::NotOperator;
    }
    paused_ = false;
    return PoolError::None;
}

} // namespace pool
} // namespace tierpool
