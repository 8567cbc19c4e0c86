// VALSET - Reward Calculator
// Copyright (c) 2024 VALSET Developers
// MIT License

#ifndef VALSET_STAKING_REWARD_CALCULATOR_H
#define VALSET_STAKING_REWARD_CALCULATOR_H

#include <valset/core/types.h>

#include <cstdint>

namespace valset {
namespace staking {

/// Seconds in a 365-day year
constexpr uint64_t SECONDS_IN_YEAR = 31536000;

/// Basis points per unit
constexpr uint64_t BIPS_CONVERSION_FACTOR = 10000;

/// Uptime required for any reward, as a percentage of the validation period
constexpr uint64_t UPTIME_REWARDS_THRESHOLD_PERCENTAGE = 80;

/**
 * Reward policy for validators and delegators. Implementations must be pure:
 * the same inputs always give the same reward.
 */
class IRewardCalculator {
public:
    virtual ~IRewardCalculator() = default;

    /**
     * @param stakeAmount Value staked
     * @param validatorStartTime Start of the validation the stake backs
     * @param stakingStartTime Start of this stake (validator or delegator)
     * @param stakingEndTime End of this stake
     * @param uptimeSeconds Latest proven uptime of the validator
     */
    virtual Amount CalculateReward(Amount stakeAmount,
                                   Timestamp validatorStartTime,
                                   Timestamp stakingStartTime,
                                   Timestamp stakingEndTime,
                                   uint64_t uptimeSeconds) const = 0;
};

/**
 * Linear annual rate, paid only when uptime covers at least 80% of the
 * time since the validator started.
 */
class ExampleRewardCalculator : public IRewardCalculator {
public:
    explicit ExampleRewardCalculator(uint64_t rewardBasisPoints)
        : rewardBasisPoints_(rewardBasisPoints) {}

    Amount CalculateReward(Amount stakeAmount,
                           Timestamp validatorStartTime,
                           Timestamp stakingStartTime,
                           Timestamp stakingEndTime,
                           uint64_t uptimeSeconds) const override;

    uint64_t GetRewardBasisPoints() const { return rewardBasisPoints_; }

private:
    const uint64_t rewardBasisPoints_;
};

} // namespace staking
} // namespace valset

#endif // VALSET_STAKING_REWARD_CALCULATOR_H
