// TIERPOOL - Epoch Processor
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#ifndef TIERPOOL_POOL_EPOCH_H
#define TIERPOOL_POOL_EPOCH_H

#include "tierpool/core/types.h"

namespace tierpool {
namespace pool {

class DepositLedger;

/**
 * Promotes matured pending stake to locked as the external epoch advances.
 *
 * The cursor only moves forward. Processing an epoch at or below the
 * cursor is a no-op, so repeated or redundant calls converge.
 */
class EpochProcessor {
public:
    EpochProcessor() = default;

    /**
     * Synchronize the ledger with epoch.
     *
     * @param epoch Oracle value
     * @param ledger Ledger whose pending batches are promoted
     * @param promoted Output: participants promoted (0 on a no-op)
     * @return true if the cursor advanced
     */
    bool Process(Epoch epoch, DepositLedger& ledger, size_t* promoted = nullptr);

    Epoch GetLastProcessedEpoch() const { return lastProcessedEpoch_; }

private:
    Epoch lastProcessedEpoch_{0};
};

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_EPOCH_H
