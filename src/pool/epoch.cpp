// TIERPOOL - Epoch Processor Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/epoch.h"
#include "tierpool/pool/ledger.h"
#include "tierpool/util/logging.h"

namespace tierpool {
namespace pool {

bool EpochProcessor::Process(Epoch epoch, DepositLedger& ledger, size_t* promoted) {
    if (promoted) {
        *promoted = 0;
    }
    if (epoch <= lastProcessedEpoch_) {
        return false;
    }

    size_t count = ledger.PromoteMatured(epoch);
    LOG_DEBUG(util::LogCategory::EPOCH) << "Epoch " << lastProcessedEpoch_ << " -> " << epoch
                                        << ", promoted " << count << " participant(s)";
    lastProcessedEpoch_ = epoch;

    if (promoted) {
        *promoted = count;
    }
    return true;
}

} // namespace pool
} // namespace tierpool
