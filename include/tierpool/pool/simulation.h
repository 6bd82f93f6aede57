// TIERPOOL - In-Memory Collaborators
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Deterministic implementations of the collaborator interfaces, used by the
// scenario runner and the test suite. Each one can be told to fail so that
// rollback paths are reachable.

#ifndef TIERPOOL_POOL_SIMULATION_H
#define TIERPOOL_POOL_SIMULATION_H

#include "tierpool/pool/interfaces.h"

#include <deque>
#include <functional>
#include <map>
#include <vector>

namespace tierpool {
namespace pool {

// ============================================================================
// InMemoryAssetLedger
// ============================================================================

class InMemoryAssetLedger : public IAssetLedger {
public:
    /// Invoked with (recipient, amount) before an outbound transfer settles
    using TransferHook = std::function<void(const Address& to, Amount amount)>;

    explicit InMemoryAssetLedger(const Address& custody);

    bool TransferIn(const Address& from, Amount amount) override;
    bool TransferOut(const Address& to, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;

    /// Move between any two holders
    bool Transfer(const Address& from, const Address& to, Amount amount);

    /// Create funds; false on a non-positive amount or overflow
    bool Mint(const Address& holder, Amount amount);

    /// Destroy funds; false if the holder has less than amount
    bool Burn(const Address& holder, Amount amount);

    /// Make every inbound transfer fail
    void SetFailTransferIn(bool fail) { failIn_ = fail; }

    /// Make every outbound transfer fail
    void SetFailTransferOut(bool fail) { failOut_ = fail; }

    /**
     * Install a recipient callback. It runs once per outbound transfer, is
     * not re-entered by transfers it triggers itself, and may call back into
     * the pool.
     */
    void SetBeforeTransferOutHook(TransferHook hook) { hook_ = std::move(hook); }

    const Address& GetCustody() const { return custody_; }
    Amount GetTotalSupply() const { return totalSupply_; }
    size_t GetTransferOutCount() const { return transferOutCount_; }

private:
    Address custody_;
    std::map<Address, Amount> balances_;
    Amount totalSupply_{0};

    bool failIn_{false};
    bool failOut_{false};
    TransferHook hook_;
    bool inHook_{false};
    size_t transferOutCount_{0};
};

// ============================================================================
// ManualEpochOracle
// ============================================================================

class ManualEpochOracle : public IEpochOracle {
public:
    explicit ManualEpochOracle(Epoch start = 0) : epoch_(start) {}

    std::optional<Epoch> CurrentEpoch() const override;

    /// Move to epoch; values below the current one are ignored
    void Set(Epoch epoch);

    void Advance(Epoch count = 1) { epoch_ += count; }

    void SetAvailable(bool available) { available_ = available; }

    Epoch Peek() const { return epoch_; }

private:
    Epoch epoch_;
    bool available_{true};
};

// ============================================================================
// ScriptedSettlement
// ============================================================================

/**
 * Settlement channel that pays queued rewards into custody, one per claim.
 * A claim with nothing queued pays zero. A negative entry removes funds from
 * custody, modelling a misbehaving channel.
 */
class ScriptedSettlement : public IWorkSettlement {
public:
    explicit ScriptedSettlement(InMemoryAssetLedger& ledger) : ledger_(ledger) {}

    bool Submit(const std::vector<Byte>& payload) override;
    bool Claim(const std::vector<uint64_t>& epochIds) override;

    void QueueReward(Amount amount) { rewards_.push_back(amount); }

    void SetFailing(bool failing) { failing_ = failing; }

    const std::vector<std::vector<Byte>>& GetSubmissions() const { return submissions_; }
    const std::vector<std::vector<uint64_t>>& GetClaims() const { return claims_; }

private:
    InMemoryAssetLedger& ledger_;
    std::deque<Amount> rewards_;
    bool failing_{false};
    std::vector<std::vector<Byte>> submissions_;
    std::vector<std::vector<uint64_t>> claims_;
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_SIMULATION_H
