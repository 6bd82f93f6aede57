// TIERPOOL - In-Memory Collaborators Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/simulation.h"

namespace tierpool {
namespace pool {

// ============================================================================
// InMemoryAssetLedger
// ============================================================================

InMemoryAssetLedger::InMemoryAssetLedger(const Address& custody) : custody_(custody) {}

Amount InMemoryAssetLedger::BalanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryAssetLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    if (amount <= 0) {
        return false;
    }
    if (from == to) {
        return BalanceOf(from) >= amount;
    }

    Amount fromBalance = BalanceOf(from);
    Amount toBalance = BalanceOf(to);
    if (fromBalance < amount || AdditionOverflows(toBalance, amount)) {
        return false;
    }

    balances_[from] = fromBalance - amount;
    balances_[to] = toBalance + amount;
    return true;
}

bool InMemoryAssetLedger::TransferIn(const Address& from, Amount amount) {
    if (failIn_) {
        return false;
    }
    return Transfer(from, custody_, amount);
}

bool InMemoryAssetLedger::TransferOut(const Address& to, Amount amount) {
    if (failOut_ || amount <= 0 || BalanceOf(custody_) < amount) {
        return false;
    }

    ++transferOutCount_;

    if (hook_ && !inHook_) {
        inHook_ = true;
        hook_(to, amount);
        inHook_ = false;
    }

    // The hook may have moved custody funds
    return Transfer(custody_, to, amount);
}

bool InMemoryAssetLedger::Mint(const Address& holder, Amount amount) {
    if (amount <= 0 || AdditionOverflows(totalSupply_, amount)) {
        return false;
    }
    balances_[holder] = BalanceOf(holder) + amount;
    totalSupply_ += amount;
    return true;
}

bool InMemoryAssetLedger::Burn(const Address& holder, Amount amount) {
    Amount balance = BalanceOf(holder);
    if (amount <= 0 || balance < amount) {
        return false;
    }
    balances_[holder] = balance - amount;
    totalSupply_ -= amount;
    return true;
}

// ============================================================================
// ManualEpochOracle
// ============================================================================

std::optional<Epoch> ManualEpochOracle::CurrentEpoch() const {
    if (!available_) {
        return std::nullopt;
    }
    return epoch_;
}

void ManualEpochOracle::Set(Epoch epoch) {
    if (epoch > epoch_) {
        epoch_ = epoch;
    }
}

// ============================================================================
// ScriptedSettlement
// ============================================================================

bool ScriptedSettlement::Submit(const std::vector<Byte>& payload) {
    if (failing_) {
        return false;
    }
    submissions_.push_back(payload);
    return true;
}

bool ScriptedSettlement::Claim(const std::vector<uint64_t>& epochIds) {
    if (failing_) {
        return false;
    }
    claims_.push_back(epochIds);

    if (rewards_.empty()) {
        return true;
    }

    Amount reward = rewards_.front();
    rewards_.pop_front();

    if (reward > 0) {
        return ledger_.Mint(ledger_.GetCustody(), reward);
    }
    if (reward < 0) {
        return ledger_.Burn(ledger_.GetCustody(), -reward);
    }
    return true;
}

} // namespace pool
} // namespace tierpool
