// TIERPOOL - Withdrawal Queue
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Withdrawal requests wait one epoch before their principal is released.
// An owner may hold any number of requests; mature ones are released
// together.

#ifndef TIERPOOL_POOL_WITHDRAWAL_H
#define TIERPOOL_POOL_WITHDRAWAL_H

#include "tierpool/core/types.h"
#include "tierpool/pool/errors.h"

#include <map>
#include <vector>

namespace tierpool {
namespace pool {

/// Epochs a request waits before release
constexpr Epoch WITHDRAWAL_DELAY_EPOCHS = 1;

struct PendingWithdrawal {
    Address owner;
    Amount amount{0};

    /// First epoch at which release is permitted
    Epoch availableEpoch{0};

    /// Epoch in which the request was made
    Epoch requestEpoch{0};

    bool IsMature(Epoch currentEpoch) const { return availableEpoch <= currentEpoch; }
};

class WithdrawalQueue {
public:
    WithdrawalQueue() = default;

    /// Append a request maturing at currentEpoch + WITHDRAWAL_DELAY_EPOCHS
    PendingWithdrawal Enqueue(const Address& owner, Amount amount, Epoch currentEpoch);

    /**
     * Remove every mature request of owner and return their sum.
     *
     * @return NothingToRelease if owner has no request,
     *         WithdrawalNotReady if none is mature yet
     */
    AmountResult ReleaseMature(const Address& owner, Epoch currentEpoch);

    /// Remove every request of owner regardless of maturity
    Amount RemoveAll(const Address& owner);

    std::vector<PendingWithdrawal> GetRequests(const Address& owner) const;

    /// Sum of owner's outstanding requests
    Amount GetQueued(const Address& owner) const;

    Amount GetTotalQueued() const { return totalQueued_; }

    /// Number of outstanding requests across all owners
    size_t Size() const;

private:
    std::map<Address, std::vector<PendingWithdrawal>> byOwner_;
    Amount totalQueued_{0};
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_WITHDRAWAL_H
