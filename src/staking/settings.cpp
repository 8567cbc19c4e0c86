// VALSET - Staking Settings Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/staking/settings.h>
#include <valset/util/logging.h>
#include <valset/validator/settings.h>

#include <limits>

namespace valset {
namespace staking {

namespace LogCategory = util::LogCategory;
using validator::ErrorCode;
using validator::ManagerState;

bool CheckStakingSettings(const StakingSettings& settings, ManagerState& state) {
    if (settings.minimumDelegationFeeBips == 0 ||
        settings.minimumDelegationFeeBips > MAXIMUM_DELEGATION_FEE_BIPS) {
        return state.Invalid(ErrorCode::InvalidDelegationFee, settings.minimumDelegationFeeBips);
    }
    if (settings.minimumStakeAmount > settings.maximumStakeAmount) {
        return state.Invalid(ErrorCode::InvalidStakeAmount, settings.minimumStakeAmount,
                             "minimum above maximum");
    }
    if (settings.maximumStakeMultiplier == 0 ||
        settings.maximumStakeMultiplier > MAXIMUM_STAKE_MULTIPLIER_LIMIT) {
        return state.Invalid(ErrorCode::InvalidStakeMultiplier, settings.maximumStakeMultiplier);
    }
    if (settings.weightToValueFactor == 0) {
        return state.Invalid(ErrorCode::ZeroWeightToValueFactor);
    }
    if (settings.uptimeBlockchainID.IsNull()) {
        return state.Invalid(ErrorCode::InvalidUptimeBlockchainID);
    }
    if (settings.stakingManagerAddress.IsNull()) {
        return state.Invalid(ErrorCode::InvalidOwnerAddress, 0, "zero staking manager address");
    }
    return true;
}

namespace {

bool ReadUInt(const util::ConfigManager& config, const char* key, uint64_t max,
              uint64_t& out, std::string& error) {
    auto value = config.TryGetUInt(key, util::ConfigKeys::STAKING_SECTION);
    if (!value || *value > max) {
        error = std::string(util::ConfigKeys::STAKING_SECTION) + "." + key +
                ": missing or out of range";
        return false;
    }
    out = *value;
    return true;
}

} // namespace

std::optional<StakingSettings> LoadStakingSettings(const util::ConfigManager& config,
                                                   std::string& error) {
    namespace keys = util::ConfigKeys;
    const uint64_t u64max = std::numeric_limits<uint64_t>::max();
    StakingSettings settings;

    auto address = validator::ReadAddress(config, keys::ADDRESS, keys::STAKING_SECTION, error);
    if (!address) return std::nullopt;
    settings.stakingManagerAddress = *address;

    auto uptimeChain = validator::ReadHash256(config, keys::UPTIME_BLOCKCHAIN_ID,
                                              keys::STAKING_SECTION, error);
    if (!uptimeChain) return std::nullopt;
    settings.uptimeBlockchainID = *uptimeChain;

    uint64_t feeBips = 0;
    uint64_t multiplier = 0;
    if (!ReadUInt(config, keys::MINIMUM_STAKE_AMOUNT, u64max, settings.minimumStakeAmount, error) ||
        !ReadUInt(config, keys::MAXIMUM_STAKE_AMOUNT, u64max, settings.maximumStakeAmount, error) ||
        !ReadUInt(config, keys::MINIMUM_STAKE_DURATION, u64max, settings.minimumStakeDuration, error) ||
        !ReadUInt(config, keys::MINIMUM_DELEGATION_FEE_BIPS, std::numeric_limits<uint16_t>::max(),
                  feeBips, error) ||
        !ReadUInt(config, keys::MAXIMUM_STAKE_MULTIPLIER, std::numeric_limits<uint8_t>::max(),
                  multiplier, error) ||
        !ReadUInt(config, keys::WEIGHT_TO_VALUE_FACTOR, u64max, settings.weightToValueFactor, error)) {
        return std::nullopt;
    }
    settings.minimumDelegationFeeBips = static_cast<uint16_t>(feeBips);
    settings.maximumStakeMultiplier = static_cast<uint8_t>(multiplier);

    ManagerState state;
    if (!CheckStakingSettings(settings, state)) {
        error = std::string(keys::STAKING_SECTION) + ": " + state.ToString();
        return std::nullopt;
    }

    LOG_DEBUG(LogCategory::CONFIG) << "Staking settings: stake [" << settings.minimumStakeAmount
                                   << ", " << settings.maximumStakeAmount << "], factor "
                                   << settings.weightToValueFactor;
    return settings;
}

uint64_t LoadRewardBasisPoints(const util::ConfigManager& config) {
    return config.GetUInt(util::ConfigKeys::REWARD_BASIS_POINTS, 0,
                          util::ConfigKeys::STAKING_SECTION);
}

} // namespace staking
} // namespace valset
