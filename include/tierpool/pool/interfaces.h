// TIERPOOL - External Collaborators
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Boundaries the pool engine talks to but does not implement: the asset
// ledger holding custody, the external work-settlement channel and the
// epoch counter. Reference in-memory versions live in simulation.h.

#ifndef TIERPOOL_POOL_INTERFACES_H
#define TIERPOOL_POOL_INTERFACES_H

#include "tierpool/core/types.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace tierpool {
namespace pool {

/**
 * Custodied asset. Transfers are all-or-nothing: on false, neither side
 * has changed. The ledger knows which holder is the pool's custody.
 */
class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    /// Move amount from a depositor into custody
    virtual bool TransferIn(const Address& from, Amount amount) = 0;

    /// Move amount from custody to a recipient
    virtual bool TransferOut(const Address& to, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder) const = 0;
};

/**
 * Opaque channel to the remote system the operator works for. Payment for
 * a claim arrives as an increase of the custody balance.
 */
class IWorkSettlement {
public:
    virtual ~IWorkSettlement() = default;

    virtual bool Submit(const std::vector<Byte>& payload) = 0;

    virtual bool Claim(const std::vector<uint64_t>& epochIds) = 0;
};

/// Authoritative, monotonically non-decreasing epoch counter
class IEpochOracle {
public:
    virtual ~IEpochOracle() = default;

    /// Empty when the counter cannot be read
    virtual std::optional<Epoch> CurrentEpoch() const = 0;
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_INTERFACES_H
