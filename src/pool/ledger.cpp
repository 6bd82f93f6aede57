// TIERPOOL - Deposit Ledger Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/ledger.h"

#include <algorithm>

namespace tierpool {
namespace pool {

const Participant* DepositLedger::Find(const Address& who) const {
    auto it = participants_.find(who);
    return it == participants_.end() ? nullptr : &it->second;
}

// ============================================================================
// Roster
// ============================================================================

void DepositLedger::AddToRoster(const Address& who, Participant& p) {
    p.rosterIndex = roster_.size();
    p.active = true;
    roster_.push_back(who);
}

void DepositLedger::RemoveFromRoster(Participant& p) {
    if (!p.active) {
        return;
    }

    // Swap with last, then pop
    size_t index = p.rosterIndex;
    size_t last = roster_.size() - 1;
    if (index != last) {
        const Address& moved = roster_[last];
        roster_[index] = moved;
        participants_[moved].rosterIndex = index;
    }
    roster_.pop_back();

    p.active = false;
    p.rosterIndex = 0;
}

void DepositLedger::EraseIfEmpty(const Address& who) {
    auto it = participants_.find(who);
    if (it != participants_.end() && !it->second.active &&
        it->second.unclaimedReward == 0) {
        participants_.erase(it);
    }
}

// ============================================================================
// Stake
// ============================================================================

PoolError DepositLedger::AddPending(const Address& who, Amount amount, Epoch currentEpoch) {
    if (amount <= 0 || AdditionOverflows(totalPending_, amount) ||
        AdditionOverflows(totalPending_ + amount, totalLocked_)) {
        return PoolError::InvalidAmount;
    }

    Participant& p = participants_[who];
    if (!p.active) {
        AddToRoster(who, p);
    }

    p.pendingAmount += amount;
    p.lockEpoch = std::max(p.lockEpoch, currentEpoch + 1);
    totalPending_ += amount;
    return PoolError::None;
}

PoolError DepositLedger::RemoveStake(const Address& who, Amount amount, Amount* fromLocked) {
    if (amount <= 0) {
        return PoolError::InvalidAmount;
    }

    auto it = participants_.find(who);
    if (it == participants_.end() || it->second.GetStake() < amount) {
        return PoolError::InsufficientBalance;
    }

    Participant& p = it->second;
    Amount takePending = std::min(p.pendingAmount, amount);
    Amount takeLocked = amount - takePending;

    p.pendingAmount -= takePending;
    p.lockedAmount -= takeLocked;
    totalPending_ -= takePending;
    totalLocked_ -= takeLocked;

    if (fromLocked) {
        *fromLocked = takeLocked;
    }

    if (p.pendingAmount == 0 && p.lockedAmount == 0) {
        RemoveFromRoster(p);
        EraseIfEmpty(who);
    }
    return PoolError::None;
}

size_t DepositLedger::PromoteMatured(Epoch epoch) {
    size_t promoted = 0;
    for (const Address& who : roster_) {
        Participant& p = participants_[who];
        if (p.pendingAmount > 0 && p.lockEpoch <= epoch) {
            p.lockedAmount += p.pendingAmount;
            totalLocked_ += p.pendingAmount;
            totalPending_ -= p.pendingAmount;
            p.pendingAmount = 0;
            ++promoted;
        }
    }
    return promoted;
}

// ============================================================================
// Rewards
// ============================================================================

void DepositLedger::CreditReward(const Address& who, Amount amount) {
    auto it = participants_.find(who);
    if (it == participants_.end() || amount <= 0) {
        return;
    }
    it->second.unclaimedReward += amount;
    totalUnclaimedReward_ += amount;
}

Amount DepositLedger::TakeReward(const Address& who) {
    auto it = participants_.find(who);
    if (it == participants_.end()) {
        return 0;
    }

    Amount reward = it->second.unclaimedReward;
    it->second.unclaimedReward = 0;
    totalUnclaimedReward_ -= reward;
    EraseIfEmpty(who);
    return reward;
}

// ============================================================================
// Exit
// ============================================================================

Amount DepositLedger::SweepAll(const Address& who) {
    auto it = participants_.find(who);
    if (it == participants_.end()) {
        return 0;
    }

    Participant& p = it->second;
    Amount total = p.pendingAmount + p.lockedAmount + p.unclaimedReward;

    totalPending_ -= p.pendingAmount;
    totalLocked_ -= p.lockedAmount;
    totalUnclaimedReward_ -= p.unclaimedReward;

    RemoveFromRoster(p);
    participants_.erase(it);
    return total;
}

// ============================================================================
// Consistency
// ============================================================================

bool DepositLedger::CheckInvariants(std::string* error) const {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    Amount sumLocked = 0;
    Amount sumPending = 0;
    Amount sumUnclaimed = 0;
    size_t activeCount = 0;

    for (const auto& [who, p] : participants_) {
        if (p.pendingAmount < 0 || p.lockedAmount < 0 || p.unclaimedReward < 0) {
            return fail("negative balance for " + who.ToHex());
        }
        bool shouldBeActive = p.pendingAmount > 0 || p.lockedAmount > 0;
        if (p.active != shouldBeActive) {
            return fail("active flag mismatch for " + who.ToHex());
        }
        if (p.active) {
            ++activeCount;
            if (p.rosterIndex >= roster_.size() || roster_[p.rosterIndex] != who) {
                return fail("roster index mismatch for " + who.ToHex());
            }
        } else if (p.unclaimedReward == 0) {
            return fail("idle record retained for " + who.ToHex());
        }
        sumLocked += p.lockedAmount;
        sumPending += p.pendingAmount;
        sumUnclaimed += p.unclaimedReward;
    }

    if (activeCount != roster_.size()) {
        return fail("roster size " + std::to_string(roster_.size()) +
                    " != active count " + std::to_string(activeCount));
    }
    if (sumLocked != totalLocked_) {
        return fail("totalLocked " + std::to_string(totalLocked_) +
                    " != sum " + std::to_string(sumLocked));
    }
    if (sumPending != totalPending_) {
        return fail("totalPending " + std::to_string(totalPending_) +
                    " != sum " + std::to_string(sumPending));
    }
    if (sumUnclaimed != totalUnclaimedReward_) {
        return fail("totalUnclaimedReward " + std::to_string(totalUnclaimedReward_) +
                    " != sum " + std::to_string(sumUnclaimed));
    }
    return true;
}

} // namespace pool
} // namespace tierpool
