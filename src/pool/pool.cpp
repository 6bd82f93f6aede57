// TIERPOOL - Pool Engine Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/pool.h"
#include "tierpool/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace tierpool {
namespace pool {

namespace {

const PoolParams& Validated(const PoolParams& params) {
    std::string error;
    if (!params.Validate(&error)) {
        throw std::invalid_argument("invalid pool parameters: " + error);
    }
    return params;
}

template<typename R>
R Reject(const char* operation, PoolError error, const std::string& message = "") {
    R result = R::Failure(error, message);
    LOG_WARN(util::LogCategory::POOL) << operation << " rejected: " << result.message;
    return result;
}

template<typename R>
R RejectReentrant(const char* operation) {
    return Reject<R>(operation, PoolError::Reentrant,
                     "called from inside another pool operation");
}

/// Re-tag a failure from a sub-step as a failure of operation
template<typename R, typename From>
R Forward(const char* operation, const From& from) {
    return Reject<R>(operation, from.error, from.message);
}

} // namespace

// ============================================================================
// Checkpoint
// ============================================================================

/**
 * Saves the pool state and event count on entry. Unless Commit() is called
 * the destructor restores both, which also covers early returns and
 * exceptions. Committed events are handed to the listener once the
 * operation is over, so the listener may call back into the engine.
 */
class PoolEngine::Checkpoint {
public:
    explicit Checkpoint(PoolEngine& engine)
        : engine_(engine), saved_(engine.state_), eventCount_(engine.events_.size()) {
        engine_.inOperation_ = true;
    }

    ~Checkpoint() {
        engine_.inOperation_ = false;
        if (!committed_) {
            engine_.state_ = saved_;
            engine_.events_.resize(eventCount_);
            return;
        }
        engine_.DispatchPending();
    }

    Checkpoint(const Checkpoint&) = delete;
    Checkpoint& operator=(const Checkpoint&) = delete;

    void Commit() { committed_ = true; }

private:
    PoolEngine& engine_;
    PoolState saved_;
    size_t eventCount_;
    bool committed_{false};
};

// ============================================================================
// Construction
// ============================================================================

PoolEngine::PoolEngine(const PoolParams& params, IAssetLedger& assets,
                       IWorkSettlement& settlement, IEpochOracle& oracle)
    : params_(Validated(params))
    , assets_(assets)
    , settlement_(settlement)
    , oracle_(oracle)
    , state_(params.operatorAddress, params.feeBps) {
    LOG_INFO(util::LogCategory::POOL) << "Pool " << params_.poolAddress.ToHex()
                                      << " created, operator "
                                      << params_.operatorAddress.ToHex()
                                      << ", fee " << params_.feeBps << " bps";
}

// ============================================================================
// Internals
// ============================================================================

EpochResult PoolEngine::SyncEpoch() {
    auto current = oracle_.CurrentEpoch();
    if (!current) {
        return EpochResult::Failure(PoolError::EpochUnavailable, "epoch oracle unavailable");
    }

    size_t promoted = 0;
    bool advanced = state_.epochs.Process(*current, state_.ledger, &promoted);
    if (advanced) {
        PoolEvent event;
        event.type = PoolEventType::EpochProcessed;
        event.epoch = *current;
        event.amount = static_cast<Amount>(promoted);
        Emit(event);
    }
    return EpochResult::Success(*current, promoted, advanced);
}

void PoolEngine::Emit(PoolEvent event) {
    events_.push_back(std::move(event));
}

void PoolEngine::DispatchPending() {
    // The listener may call back into the engine and append more events
    while (dispatched_ < events_.size()) {
        PoolEvent event = events_[dispatched_++];
        if (!callback_) {
            continue;
        }
        try {
            callback_(event);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::POOL) << "Event listener failed on "
                                               << PoolEventTypeToString(event.type)
                                               << ": " << e.what();
        }
    }
}

// ============================================================================
// Depositor Operations
// ============================================================================

PoolResult PoolEngine::Deposit(const Address& caller, Amount amount) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("deposit");
    }
    if (amount <= 0) {
        return Reject<PoolResult>("deposit", PoolError::InvalidAmount, "amount must be positive");
    }
    if (state_.access.IsPaused()) {
        return Reject<PoolResult>("deposit", PoolError::Paused, "deposits are paused");
    }

    Checkpoint cp(*this);

    EpochResult sync = SyncEpoch();
    if (!sync) {
        return Forward<PoolResult>("deposit", sync);
    }

    PoolError err = state_.ledger.AddPending(caller, amount, sync.epoch);
    if (err != PoolError::None) {
        return Reject<PoolResult>("deposit", err, "deposit would overflow pool totals");
    }

    const Participant* p = state_.ledger.Find(caller);
    PoolEvent event;
    event.type = PoolEventType::Deposited;
    event.account = caller;
    event.amount = amount;
    event.epoch = p ? p->lockEpoch : sync.epoch + 1;
    Emit(event);

    if (!assets_.TransferIn(caller, amount)) {
        return Reject<PoolResult>("deposit", PoolError::TransferFailed, "inbound transfer failed");
    }

    cp.Commit();
    LOG_DEBUG(util::LogCategory::POOL) << "Deposit " << amount << " from " << caller.ToHex()
                                       << ", locks at epoch " << event.epoch;
    return PoolResult::Success();
}

PoolResult PoolEngine::RequestWithdrawal(const Address& caller, Amount amount) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("withdrawal request");
    }
    if (amount <= 0) {
        return Reject<PoolResult>("withdrawal request", PoolError::InvalidAmount,
                                  "amount must be positive");
    }

    Checkpoint cp(*this);

    EpochResult sync = SyncEpoch();
    if (!sync) {
        return Forward<PoolResult>("withdrawal request", sync);
    }

    Amount fromLocked = 0;
    PoolError err = state_.ledger.RemoveStake(caller, amount, &fromLocked);
    if (err != PoolError::None) {
        return Reject<PoolResult>("withdrawal request", err,
                                  err == PoolError::InsufficientBalance
                                      ? "stake is smaller than the requested amount"
                                      : "");
    }

    PendingWithdrawal request = state_.withdrawals.Enqueue(caller, amount, sync.epoch);

    PoolEvent event;
    event.type = PoolEventType::WithdrawalRequested;
    event.account = caller;
    event.amount = amount;
    event.epoch = request.availableEpoch;
    Emit(event);

    cp.Commit();
    LOG_DEBUG(util::LogCategory::POOL) << "Withdrawal of " << amount << " queued for "
                                       << caller.ToHex() << " (" << fromLocked
                                       << " from locked), available at epoch "
                                       << request.availableEpoch;
    return PoolResult::Success();
}

AmountResult PoolEngine::CompleteWithdrawal(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<AmountResult>("withdrawal");
    }
    Checkpoint cp(*this);

    EpochResult sync = SyncEpoch();
    if (!sync) {
        return Forward<AmountResult>("withdrawal", sync);
    }

    AmountResult released = state_.withdrawals.ReleaseMature(caller, sync.epoch);
    if (!released) {
        return Forward<AmountResult>("withdrawal", released);
    }

    PoolEvent event;
    event.type = PoolEventType::WithdrawalCompleted;
    event.account = caller;
    event.amount = released.amount;
    Emit(event);

    if (!assets_.TransferOut(caller, released.amount)) {
        return Reject<AmountResult>("withdrawal", PoolError::TransferFailed,
                                    "outbound transfer failed");
    }

    cp.Commit();
    LOG_DEBUG(util::LogCategory::POOL) << "Released " << released.amount << " to "
                                       << caller.ToHex();
    return AmountResult::Success(released.amount);
}

AmountResult PoolEngine::EmergencyWithdraw(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<AmountResult>("emergency withdrawal");
    }
    Checkpoint cp(*this);

    Amount total = state_.ledger.SweepAll(caller);
    total += state_.withdrawals.RemoveAll(caller);
    if (total == 0) {
        return Reject<AmountResult>("emergency withdrawal", PoolError::NothingToWithdraw,
                                    "caller holds nothing in the pool");
    }

    PoolEvent event;
    event.type = PoolEventType::EmergencyWithdrawn;
    event.account = caller;
    event.amount = total;
    Emit(event);

    if (!assets_.TransferOut(caller, total)) {
        return Reject<AmountResult>("emergency withdrawal", PoolError::TransferFailed,
                                    "outbound transfer failed");
    }

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Emergency withdrawal of " << total << " by "
                                      << caller.ToHex();
    return AmountResult::Success(total);
}

AmountResult PoolEngine::ClaimUserRewards(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<AmountResult>("reward claim");
    }
    Checkpoint cp(*this);

    Amount reward = state_.ledger.TakeReward(caller);
    if (reward == 0) {
        return Reject<AmountResult>("reward claim", PoolError::NoRewards,
                                    "no unclaimed reward");
    }

    PoolEvent event;
    event.type = PoolEventType::UserRewardsClaimed;
    event.account = caller;
    event.amount = reward;
    Emit(event);

    if (!assets_.TransferOut(caller, reward)) {
        return Reject<AmountResult>("reward claim", PoolError::TransferFailed,
                                    "outbound transfer failed");
    }

    cp.Commit();
    LOG_DEBUG(util::LogCategory::REWARD) << "Paid reward " << reward << " to "
                                         << caller.ToHex();
    return AmountResult::Success(reward);
}

// ============================================================================
// Settlement
// ============================================================================

ClaimResult PoolEngine::ClaimRewards(const Address& caller, const std::vector<uint64_t>& epochIds) {
    if (inOperation_) {
        return RejectReentrant<ClaimResult>("settlement claim");
    }
    Checkpoint cp(*this);

    EpochResult sync = SyncEpoch();
    if (!sync) {
        return Forward<ClaimResult>("settlement claim", sync);
    }

    Amount before = assets_.BalanceOf(params_.poolAddress);
    if (!settlement_.Claim(epochIds)) {
        return Reject<ClaimResult>("settlement claim", PoolError::ClaimFailed,
                                   "settlement channel rejected the claim");
    }
    Amount after = assets_.BalanceOf(params_.poolAddress);
    if (after < before) {
        return Reject<ClaimResult>("settlement claim", PoolError::ClaimFailed,
                                   "custody balance decreased during the claim");
    }

    RewardSplit split = SplitReward(after - before, state_.access.GetFeeBps());
    DistributionResult dist;
    if (split.totalReward > 0) {
        dist = state_.rewards.Distribute(split.depositorReward, state_.ledger);
    }
    state_.rewards.RecordClaim(split, dist);

    PoolEvent event;
    event.type = PoolEventType::RewardsClaimed;
    event.account = caller;
    event.amount = split.totalReward;
    event.fee = split.operatorFee;
    event.distributed = dist.distributed;
    event.dust = dist.dust;
    event.epoch = sync.epoch;
    Emit(event);

    if (split.operatorFee > 0 &&
        !assets_.TransferOut(state_.access.GetOperator(), split.operatorFee)) {
        return Reject<ClaimResult>("settlement claim", PoolError::TransferFailed,
                                   "operator fee transfer failed");
    }

    cp.Commit();

    ClaimResult result;
    result.totalReward = split.totalReward;
    result.operatorFee = split.operatorFee;
    result.distributed = dist.distributed;
    result.dust = dist.dust;
    result.carried = dist.carried;

    LogDebugF(util::LogCategory::REWARD,
              "Claim: reward=%lld fee=%lld distributed=%lld dust=%lld carried=%lld",
              static_cast<long long>(result.totalReward),
              static_cast<long long>(result.operatorFee),
              static_cast<long long>(result.distributed),
              static_cast<long long>(result.dust),
              static_cast<long long>(result.carried));
    return result;
}

PoolResult PoolEngine::SubmitWork(const Address& caller, const std::vector<Byte>& payload) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("work submission");
    }
    PoolError err = state_.access.RequireOperator(caller);
    if (err == PoolError::None) {
        err = state_.access.RequireNotPaused();
    }
    if (err != PoolError::None) {
        return Reject<PoolResult>("work submission", err);
    }

    Checkpoint cp(*this);

    PoolEvent event;
    event.type = PoolEventType::WorkSubmitted;
    event.account = caller;
    event.amount = static_cast<Amount>(payload.size());
    Emit(event);

    if (!settlement_.Submit(payload)) {
        return Reject<PoolResult>("work submission", PoolError::SubmissionFailed,
                                  "settlement channel rejected the payload");
    }

    cp.Commit();
    LOG_DEBUG(util::LogCategory::POOL) << "Submitted " << payload.size() << " byte payload";
    return PoolResult::Success();
}

EpochResult PoolEngine::ProcessEpoch() {
    if (inOperation_) {
        return RejectReentrant<EpochResult>("epoch processing");
    }
    Checkpoint cp(*this);

    EpochResult sync = SyncEpoch();
    if (!sync) {
        return Forward<EpochResult>("epoch processing", sync);
    }

    cp.Commit();
    return sync;
}

// ============================================================================
// Administration
// ============================================================================

PoolResult PoolEngine::SetFee(const Address& caller, int feeBps) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("fee update");
    }
    Checkpoint cp(*this);

    int oldFee = state_.access.GetFeeBps();
    PoolError err = state_.access.SetFee(caller, feeBps);
    if (err != PoolError::None) {
        return Reject<PoolResult>("fee update", err);
    }

    PoolEvent event;
    event.type = PoolEventType::FeeUpdated;
    event.account = caller;
    event.amount = oldFee;
    event.fee = feeBps;
    Emit(event);

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Operator fee " << oldFee << " -> " << feeBps << " bps";
    return PoolResult::Success();
}

PoolResult PoolEngine::ProposeOperator(const Address& caller, const Address& successor) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("operator proposal");
    }
    Checkpoint cp(*this);

    PoolError err = state_.access.ProposeOperator(caller, successor);
    if (err != PoolError::None) {
        return Reject<PoolResult>("operator proposal", err);
    }

    PoolEvent event;
    event.type = PoolEventType::OperatorTransferStarted;
    event.account = caller;
    event.counterparty = successor;
    Emit(event);

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Operator handover to " << successor.ToHex()
                                      << " proposed";
    return PoolResult::Success();
}

PoolResult PoolEngine::AcceptOperator(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("operator acceptance");
    }
    Checkpoint cp(*this);

    Address previous = state_.access.GetOperator();
    PoolError err = state_.access.AcceptOperator(caller);
    if (err != PoolError::None) {
        return Reject<PoolResult>("operator acceptance", err);
    }

    PoolEvent event;
    event.type = PoolEventType::OperatorTransferred;
    event.account = previous;
    event.counterparty = caller;
    Emit(event);

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Operator is now " << caller.ToHex();
    return PoolResult::Success();
}

PoolResult PoolEngine::Pause(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("pause");
    }
    Checkpoint cp(*this);

    PoolError err = state_.access.Pause(caller);
    if (err != PoolError::None) {
        return Reject<PoolResult>("pause", err);
    }

    PoolEvent event;
    event.type = PoolEventType::Paused;
    event.account = caller;
    Emit(event);

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Pool paused";
    return PoolResult::Success();
}

PoolResult PoolEngine::Unpause(const Address& caller) {
    if (inOperation_) {
        return RejectReentrant<PoolResult>("unpause");
    }
    Checkpoint cp(*this);

    PoolError err = state_.access.Unpause(caller);
    if (err != PoolError::None) {
        return Reject<PoolResult>("unpause", err);
    }

    PoolEvent event;
    event.type = PoolEventType::Unpaused;
    event.account = caller;
    Emit(event);

    cp.Commit();
    LOG_INFO(util::LogCategory::POOL) << "Pool unpaused";
    return PoolResult::Success();
}

// ============================================================================
// Authentication
// ============================================================================

uint32_t PoolEngine::IsValidSignature(const Hash256& hash,
                                      const std::vector<Byte>& signature) const noexcept {
    return SignatureAuthenticator::IsValidSignature(hash, signature,
                                                    state_.access.GetOperator());
}

AuthStatus PoolEngine::VerifySignature(const Hash256& hash,
                                       const std::vector<Byte>& signature) const {
    return SignatureAuthenticator::Verify(hash, signature, state_.access.GetOperator());
}

// ============================================================================
// Queries
// ============================================================================

int PoolEngine::GetTier() const {
    return params_.TierFor(assets_.BalanceOf(params_.poolAddress));
}

ParticipantInfo PoolEngine::GetParticipant(const Address& who) const {
    ParticipantInfo info;
    info.account = who;
    if (const Participant* p = state_.ledger.Find(who)) {
        info.lockedAmount = p->lockedAmount;
        info.pendingAmount = p->pendingAmount;
        info.lockEpoch = p->lockEpoch;
        info.unclaimedReward = p->unclaimedReward;
        info.active = p->active;
    }
    info.queuedWithdrawal = state_.withdrawals.GetQueued(who);
    return info;
}

PoolInfo PoolEngine::GetPoolInfo() const {
    PoolInfo info;
    info.poolAddress = params_.poolAddress;
    info.poolBalance = assets_.BalanceOf(params_.poolAddress);
    info.tier = params_.TierFor(info.poolBalance);

    info.totalLocked = state_.ledger.GetTotalLocked();
    info.totalPending = state_.ledger.GetTotalPending();
    info.totalUnclaimedReward = state_.ledger.GetTotalUnclaimedReward();
    info.totalQueued = state_.withdrawals.GetTotalQueued();
    info.carriedReward = state_.rewards.GetCarriedReward();
    info.depositorCount = state_.ledger.GetDepositorCount();

    auto current = oracle_.CurrentEpoch();
    info.epochAvailable = current.has_value();
    info.currentEpoch = current.value_or(0);
    info.lastProcessedEpoch = state_.epochs.GetLastProcessedEpoch();

    info.feeBps = state_.access.GetFeeBps();
    info.operatorAddress = state_.access.GetOperator();
    info.pendingOperator = state_.access.GetPendingOperator();
    info.paused = state_.access.IsPaused();

    info.stats = state_.rewards.GetStats();
    return info;
}

// ============================================================================
// Consistency
// ============================================================================

bool PoolEngine::CheckInvariants(std::string* error) const {
    if (!state_.ledger.CheckInvariants(error)) {
        return false;
    }

    Amount queued = state_.withdrawals.GetTotalQueued();
    if (queued < 0 || (state_.withdrawals.Size() == 0 && queued != 0)) {
        if (error) *error = "withdrawal queue total out of step with its records";
        return false;
    }

    Amount liabilities = state_.ledger.GetTotalLocked() + state_.ledger.GetTotalPending() +
                         state_.ledger.GetTotalUnclaimedReward() + queued +
                         state_.rewards.GetCarriedReward();
    Amount balance = assets_.BalanceOf(params_.poolAddress);
    if (balance < liabilities) {
        if (error) {
            std::ostringstream oss;
            oss << "custody " << balance << " below liabilities " << liabilities;
            *error = oss.str();
        }
        return false;
    }
    return true;
}

// ============================================================================
// Snapshots
// ============================================================================

std::string ParticipantInfo::ToString() const {
    std::ostringstream oss;
    oss << "Participant(" << account.ToHex()
        << ", locked=" << lockedAmount
        << ", pending=" << pendingAmount
        << ", lockEpoch=" << lockEpoch
        << ", unclaimed=" << unclaimedReward
        << ", queued=" << queuedWithdrawal
        << ", active=" << (active ? "yes" : "no") << ")";
    return oss.str();
}

std::string PoolInfo::ToString() const {
    std::ostringstream oss;
    oss << "Pool(" << poolAddress.ToHex() << ")\n"
        << "  balance:    " << poolBalance << " (tier " << tier << ")\n"
        << "  locked:     " << totalLocked << "\n"
        << "  pending:    " << totalPending << "\n"
        << "  unclaimed:  " << totalUnclaimedReward << "\n"
        << "  queued:     " << totalQueued << "\n"
        << "  carried:    " << carriedReward << "\n"
        << "  depositors: " << depositorCount << "\n"
        << "  epoch:      ";
    if (epochAvailable) {
        oss << currentEpoch;
    } else {
        oss << "unavailable";
    }
    oss << " (processed " << lastProcessedEpoch << ")\n"
        << "  operator:   " << operatorAddress.ToHex();
    if (!pendingOperator.IsNull()) {
        oss << " (pending " << pendingOperator.ToHex() << ")";
    }
    oss << "\n"
        << "  fee:        " << feeBps << " bps\n"
        << "  paused:     " << (paused ? "yes" : "no") << "\n"
        << "  claims:     " << stats.claimCount
        << " (received " << stats.totalRewardReceived
        << ", fees " << stats.totalOperatorFees
        << ", distributed " << stats.totalDistributed << ")";
    return oss.str();
}

} // namespace pool
} // namespace tierpool
