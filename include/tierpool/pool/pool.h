// TIERPOOL - Pool Engine
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// The pooled-custody engine. Depositors pool a fungible asset under one
// operator; stake becomes reward-earning at the next epoch, leaves through
// a one-epoch withdrawal queue, and shares settlement rewards pro-rata
// after the operator fee.
//
// The engine is single-threaded and not thread-safe. Every mutating
// operation runs under a state checkpoint: if it fails at any point, the
// full pool state and any events it emitted are restored.

#ifndef TIERPOOL_POOL_POOL_H
#define TIERPOOL_POOL_POOL_H

#include "tierpool/core/types.h"
#include "tierpool/pool/access.h"
#include "tierpool/pool/auth.h"
#include "tierpool/pool/epoch.h"
#include "tierpool/pool/errors.h"
#include "tierpool/pool/events.h"
#include "tierpool/pool/interfaces.h"
#include "tierpool/pool/ledger.h"
#include "tierpool/pool/params.h"
#include "tierpool/pool/reward.h"
#include "tierpool/pool/withdrawal.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tierpool {
namespace pool {

// ============================================================================
// Pool State
// ============================================================================

/// Every mutable value the engine owns; copied whole by a checkpoint
struct PoolState {
    DepositLedger ledger;
    WithdrawalQueue withdrawals;
    EpochProcessor epochs;
    AccessControl access;
    RewardDistributor rewards;

    PoolState(const Address& op, int feeBps) : access(op, feeBps) {}
};

// ============================================================================
// Snapshots
// ============================================================================

/// Point-in-time view of one participant
struct ParticipantInfo {
    Address account;
    Amount lockedAmount{0};
    Amount pendingAmount{0};
    Epoch lockEpoch{0};
    Amount unclaimedReward{0};
    Amount queuedWithdrawal{0};
    bool active{false};

    std::string ToString() const;
};

/// Point-in-time view of the pool
struct PoolInfo {
    Address poolAddress;
    Amount poolBalance{0};
    int tier{0};

    Amount totalLocked{0};
    Amount totalPending{0};
    Amount totalUnclaimedReward{0};
    Amount totalQueued{0};
    Amount carriedReward{0};
    size_t depositorCount{0};

    /// False when the oracle could not be read
    bool epochAvailable{false};
    Epoch currentEpoch{0};
    Epoch lastProcessedEpoch{0};

    int feeBps{0};
    Address operatorAddress;
    Address pendingOperator;
    bool paused{false};

    PoolStats stats;

    std::string ToString() const;
};

// ============================================================================
// PoolEngine
// ============================================================================

class PoolEngine {
public:
    /**
     * @throws std::invalid_argument if params fail validation
     */
    PoolEngine(const PoolParams& params, IAssetLedger& assets,
               IWorkSettlement& settlement, IEpochOracle& oracle);

    PoolEngine(const PoolEngine&) = delete;
    PoolEngine& operator=(const PoolEngine&) = delete;

    // === Depositor Operations ===

    /// Stake amount; it becomes locked at currentEpoch + 1
    PoolResult Deposit(const Address& caller, Amount amount);

    /// Queue amount for release after one epoch; pending stake goes first
    PoolResult RequestWithdrawal(const Address& caller, Amount amount);

    /// Pay out every matured request of caller
    AmountResult CompleteWithdrawal(const Address& caller);

    /**
     * Pay out everything caller holds in one transfer, ignoring the pause
     * gate, the epoch oracle and withdrawal maturity.
     */
    AmountResult EmergencyWithdraw(const Address& caller);

    /// Pay out caller's accrued reward
    AmountResult ClaimUserRewards(const Address& caller);

    // === Settlement ===

    /**
     * Claim from the settlement channel and distribute what arrived.
     * Anyone may call. The reward is the custody balance delta across the
     * channel call.
     */
    ClaimResult ClaimRewards(const Address& caller, const std::vector<uint64_t>& epochIds);

    /// Forward a work payload to the settlement channel (operator only)
    PoolResult SubmitWork(const Address& caller, const std::vector<Byte>& payload);

    /// Promote matured stake up to the oracle epoch; callable by anyone
    EpochResult ProcessEpoch();

    // === Administration ===

    PoolResult SetFee(const Address& caller, int feeBps);
    PoolResult ProposeOperator(const Address& caller, const Address& successor);
    PoolResult AcceptOperator(const Address& caller);
    PoolResult Pause(const Address& caller);
    PoolResult Unpause(const Address& caller);

    // === Authentication ===

    /// MAGIC_VALUE if the current operator signed hash; never throws
    uint32_t IsValidSignature(const Hash256& hash, const std::vector<Byte>& signature) const noexcept;

    /// Detailed verification status against the current operator
    AuthStatus VerifySignature(const Hash256& hash, const std::vector<Byte>& signature) const;

    // === Queries ===

    /// 0..3 from the custody balance
    int GetTier() const;

    size_t GetDepositorCount() const { return state_.ledger.GetDepositorCount(); }

    ParticipantInfo GetParticipant(const Address& who) const;

    std::vector<PendingWithdrawal> GetPendingWithdrawals(const Address& who) const {
        return state_.withdrawals.GetRequests(who);
    }

    PoolInfo GetPoolInfo() const;

    const PoolState& GetState() const { return state_; }
    const PoolParams& GetParams() const { return params_; }

    // === Events ===

    /**
     * Listener invoked for each event after its operation commits. It may
     * call back into the engine. An exception it throws is logged and
     * dropped.
     */
    void SetEventCallback(PoolEventCallback callback) { callback_ = std::move(callback); }

    /// Every committed event, plus those of operations still in progress
    const std::vector<PoolEvent>& GetEvents() const { return events_; }

    // === Consistency ===

    /**
     * Ledger aggregates and roster, plus custody covering every tracked
     * liability (stake, unclaimed reward, queued withdrawals, carried reward).
     */
    bool CheckInvariants(std::string* error = nullptr) const;

private:
    class Checkpoint;

    /// Read the oracle and promote matured stake
    EpochResult SyncEpoch();

    void Emit(PoolEvent event);

    /// Deliver committed events; listener exceptions are logged, not propagated
    void DispatchPending();

    PoolParams params_;
    IAssetLedger& assets_;
    IWorkSettlement& settlement_;
    IEpochOracle& oracle_;

    PoolState state_;

    std::vector<PoolEvent> events_;
    size_t dispatched_{0};
    PoolEventCallback callback_;

    /// Set while an operation runs; mutating calls made then fail with Reentrant
    bool inOperation_{false};
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_POOL_H
