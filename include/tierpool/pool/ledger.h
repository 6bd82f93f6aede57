// TIERPOOL - Deposit Ledger
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Per-participant stake split into pending (not yet epoch-qualified) and
// locked (reward-earning) amounts, unclaimed rewards, pool-wide aggregates,
// and a roster of active participants supporting O(1) removal.

#ifndef TIERPOOL_POOL_LEDGER_H
#define TIERPOOL_POOL_LEDGER_H

#include "tierpool/core/types.h"
#include "tierpool/pool/errors.h"

#include <map>
#include <string>
#include <vector>

namespace tierpool {
namespace pool {

// ============================================================================
// Participant
// ============================================================================

struct Participant {
    /// Deposited, waiting for lockEpoch
    Amount pendingAmount{0};

    /// Epoch-qualified, earns rewards
    Amount lockedAmount{0};

    /// Epoch at which the pending batch becomes locked
    Epoch lockEpoch{0};

    /// Position in the roster while active
    size_t rosterIndex{0};

    /// pendingAmount > 0 || lockedAmount > 0
    bool active{false};

    /// Credited but not yet paid out
    Amount unclaimedReward{0};

    Amount GetStake() const { return pendingAmount + lockedAmount; }
};

// ============================================================================
// DepositLedger
// ============================================================================

class DepositLedger {
public:
    DepositLedger() = default;

    // === Queries ===

    /// nullptr when the identity has no record
    const Participant* Find(const Address& who) const;

    Amount GetTotalLocked() const { return totalLocked_; }
    Amount GetTotalPending() const { return totalPending_; }
    Amount GetTotalUnclaimedReward() const { return totalUnclaimedReward_; }

    /// Active participants in roster order
    const std::vector<Address>& GetRoster() const { return roster_; }
    size_t GetDepositorCount() const { return roster_.size(); }

    /// Number of records, including inactive ones still owed rewards
    size_t GetRecordCount() const { return participants_.size(); }

    // === Stake ===

    /**
     * Add amount to the pending batch, merging with any batch already
     * waiting. The merged batch locks at max(existing, currentEpoch + 1).
     *
     * @return InvalidAmount if amount <= 0 or an aggregate would overflow
     */
    PoolError AddPending(const Address& who, Amount amount, Epoch currentEpoch);

    /**
     * Remove stake for a withdrawal request, drawing on pending first and
     * then locked. Leaves the roster if nothing remains.
     *
     * @param fromLocked Output: the part taken from locked stake
     * @return InvalidAmount or InsufficientBalance on rejection
     */
    PoolError RemoveStake(const Address& who, Amount amount, Amount* fromLocked = nullptr);

    /**
     * Promote every pending batch with lockEpoch <= epoch.
     * @return Number of participants promoted
     */
    size_t PromoteMatured(Epoch epoch);

    // === Rewards ===

    /// Credit reward to an existing record
    void CreditReward(const Address& who, Amount amount);

    /// Zero and return unclaimed reward
    Amount TakeReward(const Address& who);

    // === Exit ===

    /// Zero pending, locked and unclaimed reward; return their sum
    Amount SweepAll(const Address& who);

    // === Consistency ===

    /**
     * Recompute every aggregate and roster link from the records.
     * @return true if consistent; otherwise a description in *error
     */
    bool CheckInvariants(std::string* error = nullptr) const;

private:
    void AddToRoster(const Address& who, Participant& p);
    void RemoveFromRoster(Participant& p);

    /// Drop the record once it holds nothing
    void EraseIfEmpty(const Address& who);

    std::map<Address, Participant> participants_;
    std::vector<Address> roster_;

    Amount totalLocked_{0};
    Amount totalPending_{0};
    Amount totalUnclaimedReward_{0};
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_LEDGER_H
