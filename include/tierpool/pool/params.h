// TIERPOOL - Pool Parameters
// Copyright (c) 2024 TIERPOOL Developers
// MIT License
//
// Construction-time parameters for a pool: operator, fee, tier thresholds
// and the pool's own custody identity. Loaded from the [pool] section of a
// configuration file.

#ifndef TIERPOOL_POOL_PARAMS_H
#define TIERPOOL_POOL_PARAMS_H

#include "tierpool/core/types.h"

#include <array>
#include <string>

namespace tierpool {

namespace util {
class ConfigManager;
}

namespace pool {

// ============================================================================
// Pool Constants
// ============================================================================

/// Basis-point denominator (100%)
constexpr int BPS_DENOMINATOR = 10000;

/// Operator fee upper bound (20%)
constexpr int MAX_FEE_BPS = 2000;

/// Operator fee when none is configured (5%)
constexpr int DEFAULT_FEE_BPS = 500;

/// Number of tier thresholds above tier 0
constexpr size_t TIER_COUNT = 3;

/// Default tier thresholds (25M / 50M / 100M tokens)
constexpr Amount DEFAULT_TIER1_THRESHOLD = 25000000LL * COIN;
constexpr Amount DEFAULT_TIER2_THRESHOLD = 50000000LL * COIN;
constexpr Amount DEFAULT_TIER3_THRESHOLD = 100000000LL * COIN;

/// Seed hashed into the default custody identity
constexpr const char* DEFAULT_POOL_ADDRESS_SEED = "tierpool.custody";

/// Config section holding pool keys
constexpr const char* POOL_CONFIG_SECTION = "pool";

// ============================================================================
// PoolParams
// ============================================================================

struct PoolParams {
    /// Initial operator; must not be null
    Address operatorAddress;

    /// Initial operator fee in basis points, [0, MAX_FEE_BPS]
    int feeBps{DEFAULT_FEE_BPS};

    /// Ascending pool-balance thresholds for tiers 1..3
    std::array<Amount, TIER_COUNT> tierThresholds{{
        DEFAULT_TIER1_THRESHOLD, DEFAULT_TIER2_THRESHOLD, DEFAULT_TIER3_THRESHOLD
    }};

    /// Identity under which the asset ledger holds pool custody
    Address poolAddress;

    /// Default parameters with the given operator
    static PoolParams WithOperator(const Address& op);

    /// Check parameters; on failure writes a reason to *error if non-null
    bool Validate(std::string* error = nullptr) const;

    /// Tier 0..3 for a pool balance
    int TierFor(Amount poolBalance) const;
};

// ============================================================================
// Loading
// ============================================================================

struct PoolParamsResult {
    bool success{false};
    PoolParams params;
    std::string error;

    static PoolParamsResult Success(const PoolParams& p) {
        PoolParamsResult r;
        r.success = true;
        r.params = p;
        return r;
    }

    static PoolParamsResult Error(const std::string& msg) {
        PoolParamsResult r;
        r.error = msg;
        return r;
    }
};

/**
 * Read [pool] keys: operator (hex address, required), feebps, tier1..tier3
 * (whole tokens) and address (hex custody identity, optional).
 */
PoolParamsResult LoadPoolParams(const util::ConfigManager& config);

} // namespace pool
} // namespace tierpool

#endif // TIERPOOL_POOL_PARAMS_H
