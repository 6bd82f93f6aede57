// TIERPOOL - Withdrawal Queue Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/withdrawal.h"

#include <algorithm>

namespace tierpool {
namespace pool {

PendingWithdrawal WithdrawalQueue::Enqueue(const Address& owner, Amount amount,
                                           Epoch currentEpoch) {
    PendingWithdrawal request;
    request.owner = owner;
    request.amount = amount;
    request.requestEpoch = currentEpoch;
    request.availableEpoch = currentEpoch + WITHDRAWAL_DELAY_EPOCHS;

    byOwner_[owner].push_back(request);
    totalQueued_ += amount;
    return request;
}

AmountResult WithdrawalQueue::ReleaseMature(const Address& owner, Epoch currentEpoch) {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end() || it->second.empty()) {
        return AmountResult::Failure(PoolError::NothingToRelease,
                                     "no withdrawal requests");
    }

    auto& requests = it->second;
    auto firstMature = std::stable_partition(
        requests.begin(), requests.end(),
        [currentEpoch](const PendingWithdrawal& w) { return !w.IsMature(currentEpoch); });

    if (firstMature == requests.end()) {
        Epoch earliest = requests.front().availableEpoch;
        for (const auto& w : requests) {
            earliest = std::min(earliest, w.availableEpoch);
        }
        return AmountResult::Failure(PoolError::WithdrawalNotReady,
                                     "earliest release at epoch " + std::to_string(earliest));
    }

    Amount released = 0;
    for (auto w = firstMature; w != requests.end(); ++w) {
        released += w->amount;
    }
    requests.erase(firstMature, requests.end());
    if (requests.empty()) {
        byOwner_.erase(it);
    }

    totalQueued_ -= released;
    return AmountResult::Success(released);
}

Amount WithdrawalQueue::RemoveAll(const Address& owner) {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        return 0;
    }

    Amount total = 0;
    for (const auto& w : it->second) {
        total += w.amount;
    }
    byOwner_.erase(it);
    totalQueued_ -= total;
    return total;
}

std::vector<PendingWithdrawal> WithdrawalQueue::GetRequests(const Address& owner) const {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        return {};
    }
    return it->second;
}

Amount WithdrawalQueue::GetQueued(const Address& owner) const {
    Amount total = 0;
    auto it = byOwner_.find(owner);
    if (it != byOwner_.end()) {
        for (const auto& w : it->second) {
            total += w.amount;
        }
    }
    return total;
}

size_t WithdrawalQueue::Size() const {
    size_t count = 0;
    for (const auto& [owner, requests] : byOwner_) {
        count += requests.size();
    }
    return count;
}

} // namespace pool
} // namespace tierpool
