// VALSET - Staking Manager
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Proof-of-stake policy layered over a ValidatorManager. Validators lock
// stake to obtain weight, delegators add weight to a validator, and rewards
// are paid on exit when the validator's proven uptime is high enough.
//
// The staking manager must own the validator manager (see
// ValidatorManager::MigrateToPermissionless); it calls the privileged
// operations under StakingSettings::stakingManagerAddress.
//
// Delegator lifecycle:
//   PendingAdded -> Active -> PendingRemoved -> Completed
//   PendingAdded -> Completed   (validator ended before the delegation started)
//   Active -> Completed         (validator already ended)

#ifndef VALSET_STAKING_STAKING_MANAGER_H
#define VALSET_STAKING_STAKING_MANAGER_H

#include <valset/core/types.h>
#include <valset/staking/asset.h>
#include <valset/staking/reward_calculator.h>
#include <valset/staking/settings.h>
#include <valset/validator/errors.h>
#include <valset/validator/events.h>
#include <valset/validator/validator_manager.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace valset {
namespace staking {

using validator::Event;
using validator::EventCallback;
using validator::ValidatorManager;
using validator::ValidatorRegistrationInput;

// ============================================================================
// Records
// ============================================================================

/// Staking data of a validator registered through this manager. Validators
/// without one (initial set, PoA) are "non-PoS".
struct PoSValidatorInfo {
    Address owner;                  ///< Staker; receives the stake back
    uint16_t delegationFeeBips{0};  ///< Share of delegation rewards kept as fee
    uint64_t minStakeDuration{0};   ///< Seconds before removal is allowed
    uint64_t uptimeSeconds{0};      ///< Highest proven uptime
    Address rewardRecipient;
};

enum class DelegatorStatus : uint8_t {
    Unknown = 0,
    PendingAdded = 1,
    Active = 2,
    PendingRemoved = 3,
    Completed = 4,
};

/// Status name for logs and error messages
const char* DelegatorStatusToString(DelegatorStatus status);

/// One delegation, keyed by delegationID
struct Delegator {
    DelegatorStatus status{DelegatorStatus::Unknown};
    Address owner;
    Hash256 validationID;
    Weight weight{0};
    Timestamp startTime{0};
    Timestamp endTime{0};
    uint64_t startingNonce{0};   ///< Validator nonce of the weight increase
    uint64_t endingNonce{0};     ///< Validator nonce of the weight decrease
    Address rewardRecipient;
};

/// Everything needed to rebuild a staking manager
struct StakingSnapshot {
    std::map<Hash256, PoSValidatorInfo> validators;
    std::map<Hash256, Delegator> delegators;
    std::map<Hash256, Amount> delegatorRewards;
    std::map<Hash256, Amount> redeemableValidatorRewards;
};

/// delegationID = sha256(validationID || u64 big-endian nonce)
Hash256 DelegationID(const Hash256& validationID, uint64_t nonce);

// ============================================================================
// Staking Manager
// ============================================================================

/**
 * Proof-of-stake front end of a ValidatorManager.
 *
 * Each operation holds an internal mutex while it checks and commits, and
 * locks stake through IStakingAsset before asking the validator manager to
 * act, unlocking it again when the validator manager refuses. Events from
 * both managers are delivered after the mutex is released, validator events
 * first, so callbacks may query either manager.
 */
class StakingManager {
public:
    /// Throws std::invalid_argument when the settings are rejected by
    /// CheckStakingSettings or a collaborator is null
    StakingManager(const StakingSettings& settings,
                   ValidatorManager& manager,
                   std::shared_ptr<IStakingAsset> asset,
                   std::shared_ptr<IRewardCalculator> rewardCalculator);

    StakingManager(const StakingManager&) = delete;
    StakingManager& operator=(const StakingManager&) = delete;

    // ========================================================================
    // Validators
    // ========================================================================

    /**
     * Lock `stakeAmount` from `caller` and register a validator with the
     * equivalent weight. The stake is released again if the registration is
     * rejected.
     */
    std::optional<Hash256> InitiateValidatorRegistration(const Address& caller,
                                                         const ValidatorRegistrationInput& input,
                                                         uint16_t delegationFeeBips,
                                                         uint64_t minStakeDuration,
                                                         Amount stakeAmount,
                                                         const Address& rewardRecipient,
                                                         ManagerState& state);

    /// Activate a registered validator; anyone may relay the acknowledgement
    std::optional<Hash256> CompleteValidatorRegistration(uint32_t messageIndex,
                                                         ManagerState& state);

    /**
     * Begin removing a validator. Non-PoS validators may be removed by anyone
     * and earn nothing. For PoS validators only the owner may call; the
     * minimum stake duration must have passed and the validator must have
     * earned a non-zero reward (ValidatorIneligibleForRewards otherwise).
     *
     * @param includeUptimeProof Read an uptime proof at `messageIndex` first
     */
    bool InitiateValidatorRemoval(const Address& caller, const Hash256& validationID,
                                  bool includeUptimeProof, uint32_t messageIndex,
                                  ManagerState& state);

    /// Like InitiateValidatorRemoval but forfeits rewards instead of failing
    /// for low uptime. The owner may force at any time; anyone else once the
    /// minimum stake duration has passed.
    bool ForceInitiateValidatorRemoval(const Address& caller, const Hash256& validationID,
                                       bool includeUptimeProof, uint32_t messageIndex,
                                       ManagerState& state);

    /// Finish a removal: pays the validator's rewards (when Completed) and
    /// returns its stake (Completed or Invalidated)
    std::optional<Hash256> CompleteValidatorRemoval(uint32_t messageIndex, ManagerState& state);

    /// Record a newer uptime for an active PoS validator
    bool SubmitUptimeProof(const Hash256& validationID, uint32_t messageIndex,
                           ManagerState& state);

    /// Pay out delegation fees accrued after the validator completed
    std::optional<Amount> ClaimDelegationFees(const Address& caller, const Hash256& validationID,
                                              ManagerState& state);

    /// Owner only; the recipient may not be zero
    bool ChangeValidatorRewardRecipient(const Address& caller, const Hash256& validationID,
                                        const Address& recipient, ManagerState& state);

    // ========================================================================
    // Delegators
    // ========================================================================

    /// Lock stake and raise the validator's weight. Returns the delegationID.
    std::optional<Hash256> InitiateDelegatorRegistration(const Address& caller,
                                                         const Hash256& validationID,
                                                         Amount stakeAmount,
                                                         const Address& rewardRecipient,
                                                         ManagerState& state);

    /// Activate a delegation once the P-Chain acknowledged a validator nonce
    /// at or beyond the delegation's starting nonce
    bool CompleteDelegatorRegistration(const Hash256& delegationID, uint32_t messageIndex,
                                       ManagerState& state);

    /**
     * Begin removing a delegation. The delegator may call once the minimum
     * stake duration has passed; the validator owner once the validator's
     * own minimum stake duration has passed. Fails with
     * DelegatorIneligibleForRewards when the reward would be zero.
     */
    bool InitiateDelegatorRemoval(const Address& caller, const Hash256& delegationID,
                                  bool includeUptimeProof, uint32_t messageIndex,
                                  ManagerState& state);

    /// Like InitiateDelegatorRemoval but forfeits rewards instead of failing.
    /// The delegator may force at any time; anyone else once the minimum
    /// stake durations have passed.
    bool ForceInitiateDelegatorRemoval(const Address& caller, const Hash256& delegationID,
                                       bool includeUptimeProof, uint32_t messageIndex,
                                       ManagerState& state);

    /// Pay the delegator's reward net of the validator's fee and return the stake
    bool CompleteDelegatorRemoval(const Hash256& delegationID, uint32_t messageIndex,
                                  ManagerState& state);

    /// Re-send the validator's latest weight message for a pending delegation
    std::optional<Bytes> ResendUpdateDelegator(const Hash256& delegationID, ManagerState& state);

    /// Delegator only; the recipient may not be zero
    bool ChangeDelegatorRewardRecipient(const Address& caller, const Hash256& delegationID,
                                        const Address& recipient, ManagerState& state);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Staking data; empty for non-PoS validators
    std::optional<PoSValidatorInfo> GetStakingValidator(const Hash256& validationID) const;

    /// Delegation record, including completed ones
    std::optional<Delegator> GetDelegator(const Hash256& delegationID) const;

    std::optional<Address> GetValidatorRewardRecipient(const Hash256& validationID) const;
    std::optional<Address> GetDelegatorRewardRecipient(const Hash256& delegationID) const;

    /// Validator reward recorded at removal and not yet paid
    Amount GetRedeemableValidatorRewards(const Hash256& validationID) const;

    /// Delegation reward recorded at removal and not yet paid
    Amount GetDelegatorRewards(const Hash256& delegationID) const;

    /// value / weightToValueFactor; fails InvalidStakeAmount on a zero result
    std::optional<Weight> ValueToWeight(Amount value, ManagerState& state) const;
    /// weight * weightToValueFactor
    Amount WeightToValue(Weight weight) const;

    const StakingSettings& GetSettings() const { return settings_; }
    ValidatorManager& GetValidatorManager() const { return manager_; }
    IStakingAsset& GetAsset() const { return *asset_; }

    // ========================================================================
    // Events and Persistence
    // ========================================================================

    /// Observer for staking transitions; validator transitions go to the
    /// validator manager's own callback
    void SetEventCallback(EventCallback callback);

    StakingSnapshot Snapshot() const;

    /// Replace all staking state; the validator manager is restored separately
    void Restore(const StakingSnapshot& snapshot);

private:
    // The *Locked helpers run with mutex_ held. Validator manager events go
    // to `managerEvents` and staking events to `events`; both are emitted
    // after the mutex is released.

    std::optional<Hash256> InitiateValidatorRegistrationLocked(
        const Address& caller, const ValidatorRegistrationInput& input,
        uint16_t delegationFeeBips, uint64_t minStakeDuration, Amount stakeAmount,
        const Address& rewardRecipient, std::vector<Event>& managerEvents,
        ManagerState& state);
    bool InitiateValidatorRemovalLocked(const Address& caller, const Hash256& validationID,
                                        bool includeUptimeProof, uint32_t messageIndex,
                                        bool force, std::vector<Event>& managerEvents,
                                        std::vector<Event>& events, ManagerState& state);
    std::optional<Hash256> CompleteValidatorRemovalLocked(uint32_t messageIndex,
                                                          std::vector<Event>& managerEvents,
                                                          ManagerState& state);
    bool InitiateDelegatorRemovalLocked(const Address& caller, const Hash256& delegationID,
                                        bool includeUptimeProof, uint32_t messageIndex,
                                        bool force, std::vector<Event>& managerEvents,
                                        std::vector<Event>& events, ManagerState& state);

    /// Read and check an uptime proof without recording it
    std::optional<uint64_t> ReadUptimeProof(const Hash256& validationID, uint32_t messageIndex,
                                            ManagerState& state) const;
    /// Record `uptime` if it is newer; returns the stored uptime
    uint64_t ApplyUptime(const Hash256& validationID, uint64_t uptime,
                         std::vector<Event>& events);

    /// Split a delegation reward into (delegator share, validator fee)
    std::pair<Amount, Amount> SplitDelegationReward(const Hash256& delegationID) const;
    void CompleteDelegatorRemovalLocked(const Hash256& delegationID, std::vector<Event>& events);

    bool IsPoSValidator(const Hash256& validationID) const;

    /// Deliver validator manager events, then staking events. Call without mutex_.
    void Emit(const std::vector<Event>& managerEvents, const std::vector<Event>& events);

    const StakingSettings settings_;
    ValidatorManager& manager_;
    std::shared_ptr<IStakingAsset> asset_;
    std::shared_ptr<IRewardCalculator> rewardCalculator_;

    std::map<Hash256, PoSValidatorInfo> validators_;
    std::map<Hash256, Delegator> delegators_;
    std::map<Hash256, Amount> delegatorRewards_;
    std::map<Hash256, Amount> redeemableValidatorRewards_;

    EventCallback eventCallback_;
    mutable std::mutex mutex_;
};

} // namespace staking
} // namespace valset

#endif // VALSET_STAKING_STAKING_MANAGER_H
