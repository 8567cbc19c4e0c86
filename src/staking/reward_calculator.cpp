// VALSET - Reward Calculator Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/staking/reward_calculator.h>

#include <limits>

namespace valset {
namespace staking {

Amount ExampleRewardCalculator::CalculateReward(Amount stakeAmount,
                                                Timestamp validatorStartTime,
                                                Timestamp stakingStartTime,
                                                Timestamp stakingEndTime,
                                                uint64_t uptimeSeconds) const {
    if (stakingEndTime <= stakingStartTime || stakingEndTime < validatorStartTime) {
        return 0;
    }

    // uptime / (end - validatorStart) < 80%, without the division
    using u128 = unsigned __int128;
    if (static_cast<u128>(uptimeSeconds) * 100 <
        static_cast<u128>(stakingEndTime - validatorStartTime) * UPTIME_REWARDS_THRESHOLD_PERCENTAGE) {
        return 0;
    }

    u128 reward = static_cast<u128>(stakeAmount) * rewardBasisPoints_ *
                  (stakingEndTime - stakingStartTime) / SECONDS_IN_YEAR / BIPS_CONVERSION_FACTOR;
    if (reward > std::numeric_limits<Amount>::max()) {
        return std::numeric_limits<Amount>::max();
    }
    return static_cast<Amount>(reward);
}

} // namespace staking
} // namespace valset
