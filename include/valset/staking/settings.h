// VALSET - Staking Settings
// Copyright (c) 2024 VALSET Developers
// MIT License

#ifndef VALSET_STAKING_SETTINGS_H
#define VALSET_STAKING_SETTINGS_H

#include <valset/core/types.h>
#include <valset/util/config.h>
#include <valset/validator/errors.h>

#include <cstdint>
#include <optional>
#include <string>

namespace valset {
namespace staking {

/// Delegation fees above 100% are meaningless
constexpr uint16_t MAXIMUM_DELEGATION_FEE_BIPS = 10000;

/// Cap on how far delegations may grow a validator's weight
constexpr uint8_t MAXIMUM_STAKE_MULTIPLIER_LIMIT = 10;

struct StakingSettings {
    /// Address the staking manager acts under towards the validator manager
    Address stakingManagerAddress;
    Amount minimumStakeAmount{0};
    Amount maximumStakeAmount{0};
    uint64_t minimumStakeDuration{0};
    uint16_t minimumDelegationFeeBips{0};
    uint8_t maximumStakeMultiplier{0};
    uint64_t weightToValueFactor{0};
    /// Chain whose validators sign uptime proofs
    Hash256 uptimeBlockchainID;
};

bool CheckStakingSettings(const StakingSettings& settings, validator::ManagerState& state);

/**
 * Read the [staking] section. `stakingManagerAddress` comes from the
 * `address` key of that section. On failure returns nullopt and sets
 * `error` to a message naming the offending key.
 */
std::optional<StakingSettings> LoadStakingSettings(const util::ConfigManager& config,
                                                   std::string& error);

/// `reward_basis_points` from the [staking] section, default 0
uint64_t LoadRewardBasisPoints(const util::ConfigManager& config);

} // namespace staking
} // namespace valset

#endif // VALSET_STAKING_SETTINGS_H
