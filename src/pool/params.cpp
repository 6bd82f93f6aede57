// TIERPOOL - Pool Parameters Implementation
// Copyright (c) 2024 TIERPOOL Developers
// MIT License

#include "tierpool/pool/params.h"
#include "tierpool/crypto/hash.h"
#include "tierpool/util/config.h"
#include "tierpool/util/logging.h"

#include <optional>
#include <stdexcept>

namespace tierpool {
namespace pool {

PoolParams PoolParams::WithOperator(const Address& op) {
    PoolParams params;
    params.operatorAddress = op;
    params.poolAddress = ComputeHash160(std::string(DEFAULT_POOL_ADDRESS_SEED));
    return params;
}

bool PoolParams::Validate(std::string* error) const {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    if (operatorAddress.IsNull()) {
        return fail("operator must not be null");
    }
    if (poolAddress.IsNull()) {
        return fail("pool address must not be null");
    }
    if (poolAddress == operatorAddress) {
        return fail("pool address must differ from operator");
    }
    if (feeBps < 0 || feeBps > MAX_FEE_BPS) {
        return fail("fee " + std::to_string(feeBps) + " bps outside [0, " +
                    std::to_string(MAX_FEE_BPS) + "]");
    }
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        if (tierThresholds[i] <= 0) {
            return fail("tier" + std::to_string(i + 1) + " threshold must be positive");
        }
        if (i > 0 && tierThresholds[i] <= tierThresholds[i - 1]) {
            return fail("tier thresholds must be strictly ascending");
        }
    }
    return true;
}

int PoolParams::TierFor(Amount poolBalance) const {
    int tier = 0;
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        if (poolBalance >= tierThresholds[i]) {
            tier = static_cast<int>(i + 1);
        }
    }
    return tier;
}

namespace {

std::optional<Address> ParseAddress(const std::string& hex) {
    try {
        return Address::FromHex(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // anonymous namespace

PoolParamsResult LoadPoolParams(const util::ConfigManager& config) {
    const std::string section = POOL_CONFIG_SECTION;
    PoolParams params = PoolParams::WithOperator(Address());

    auto opHex = config.TryGetString("operator", section);
    if (!opHex) {
        return PoolParamsResult::Error("missing [pool] operator");
    }
    auto op = ParseAddress(*opHex);
    if (!op) {
        return PoolParamsResult::Error("invalid [pool] operator: " + *opHex);
    }
    params.operatorAddress = *op;

    if (config.HasKey("feebps", section)) {
        auto fee = config.TryGetInt("feebps", section);
        if (!fee || *fee < 0 || *fee > MAX_FEE_BPS) {
            return PoolParamsResult::Error("invalid [pool] feebps");
        }
        params.feeBps = static_cast<int>(*fee);
    }

    for (size_t i = 0; i < TIER_COUNT; ++i) {
        std::string key = "tier" + std::to_string(i + 1);
        if (!config.HasKey(key, section)) {
            continue;
        }
        auto tokens = config.TryGetInt(key, section);
        if (!tokens || *tokens <= 0 || *tokens > MAX_AMOUNT / COIN) {
            return PoolParamsResult::Error("invalid [pool] " + key);
        }
        params.tierThresholds[i] = *tokens * COIN;
    }

    if (auto addrHex = config.TryGetString("address", section)) {
        auto addr = ParseAddress(*addrHex);
        if (!addr) {
            return PoolParamsResult::Error("invalid [pool] address: " + *addrHex);
        }
        params.poolAddress = *addr;
    }

    std::string error;
    if (!params.Validate(&error)) {
        return PoolParamsResult::Error(error);
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded pool params: operator="
        << params.operatorAddress.ToHex() << " fee=" << params.feeBps << "bps";
    return PoolParamsResult::Success(params);
}

} // namespace pool
} // namespace tierpool
