// VALSET - Staking Manager Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/staking/staking_manager.h>
#include <valset/core/serialize.h>
#include <valset/crypto/sha256.h>
#include <valset/util/logging.h>
#include <valset/util/time.h>
#include <valset/validator/messages.h>
#include <valset/validator/warp.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace valset {
namespace staking {

namespace LogCategory = util::LogCategory;
using validator::ErrorCode;
using validator::EventType;
using validator::ValidatorStatus;
using validator::ValidatorStatusToString;

namespace {

Timestamp Now() {
    return static_cast<Timestamp>(util::GetTime());
}

bool DurationPassed(Timestamp start, uint64_t duration, Timestamp now) {
    return now >= start && now - start >= duration;
}

void LogRejection(const char* operation, const ManagerState& state) {
    LOG_DEBUG(LogCategory::STAKING) << operation << " rejected: " << state.ToString();
}

bool InvalidStatus(ValidatorStatus status, ManagerState& state) {
    return state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                         ValidatorStatusToString(status));
}

bool InvalidStatus(DelegatorStatus status, ManagerState& state) {
    return state.Invalid(ErrorCode::InvalidDelegatorStatus, static_cast<uint64_t>(status),
                         DelegatorStatusToString(status));
}

} // namespace

const char* DelegatorStatusToString(DelegatorStatus status) {
    switch (status) {
        case DelegatorStatus::Unknown: return "Unknown";
        case DelegatorStatus::PendingAdded: return "PendingAdded";
        case DelegatorStatus::Active: return "Active";
        case DelegatorStatus::PendingRemoved: return "PendingRemoved";
        case DelegatorStatus::Completed: return "Completed";
    }
    return "Unknown";
}

Hash256 DelegationID(const Hash256& validationID, uint64_t nonce) {
    DataStream s;
    s << validationID;
    ser_writebe64(s, nonce);
    return crypto::SHA256Hash(s.Data());
}

// ============================================================================
// Construction
// ============================================================================

StakingManager::StakingManager(const StakingSettings& settings,
                               ValidatorManager& manager,
                               std::shared_ptr<IStakingAsset> asset,
                               std::shared_ptr<IRewardCalculator> rewardCalculator)
    : settings_(settings),
      manager_(manager),
      asset_(std::move(asset)),
      rewardCalculator_(std::move(rewardCalculator)) {
    ManagerState state;
    if (!CheckStakingSettings(settings, state)) {
        throw std::invalid_argument("StakingManager: " + state.ToString());
    }
    if (!asset_ || !rewardCalculator_) {
        throw std::invalid_argument("StakingManager: asset and reward calculator are required");
    }
    LOG_INFO(LogCategory::STAKING) << "Staking manager " << settings.stakingManagerAddress.ToShortHex()
                                   << " using " << asset_->GetName() << " asset";
}

// ============================================================================
// Conversions
// ============================================================================

std::optional<Weight> StakingManager::ValueToWeight(Amount value, ManagerState& state) const {
    Weight weight = value / settings_.weightToValueFactor;
    if (weight == 0) {
        state.Invalid(ErrorCode::InvalidStakeAmount, value, "stake below one unit of weight");
        return std::nullopt;
    }
    return weight;
}

Amount StakingManager::WeightToValue(Weight weight) const {
    unsigned __int128 value = static_cast<unsigned __int128>(weight) * settings_.weightToValueFactor;
    if (value > std::numeric_limits<Amount>::max()) {
        return std::numeric_limits<Amount>::max();
    }
    return static_cast<Amount>(value);
}

bool StakingManager::IsPoSValidator(const Hash256& validationID) const {
    auto it = validators_.find(validationID);
    return it != validators_.end() && !it->second.owner.IsNull();
}

// ============================================================================
// Validator Registration
// ============================================================================

std::optional<Hash256> StakingManager::InitiateValidatorRegistration(
    const Address& caller, const ValidatorRegistrationInput& input, uint16_t delegationFeeBips,
    uint64_t minStakeDuration, Amount stakeAmount, const Address& rewardRecipient,
    ManagerState& state) {
    std::vector<Event> managerEvents;
    std::optional<Hash256> validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        validationID = InitiateValidatorRegistrationLocked(caller, input, delegationFeeBips,
                                                           minStakeDuration, stakeAmount,
                                                           rewardRecipient, managerEvents, state);
    }
    Emit(managerEvents, {});
    return validationID;
}

std::optional<Hash256> StakingManager::InitiateValidatorRegistrationLocked(
    const Address& caller, const ValidatorRegistrationInput& input, uint16_t delegationFeeBips,
    uint64_t minStakeDuration, Amount stakeAmount, const Address& rewardRecipient,
    std::vector<Event>& managerEvents, ManagerState& state) {
    bool ok = true;
    if (delegationFeeBips < settings_.minimumDelegationFeeBips ||
        delegationFeeBips > MAXIMUM_DELEGATION_FEE_BIPS) {
        ok = state.Invalid(ErrorCode::InvalidDelegationFee, delegationFeeBips);
    } else if (minStakeDuration < settings_.minimumStakeDuration) {
        ok = state.Invalid(ErrorCode::InvalidMinStakeDuration, minStakeDuration);
    } else if (stakeAmount < settings_.minimumStakeAmount ||
               stakeAmount > settings_.maximumStakeAmount) {
        ok = state.Invalid(ErrorCode::InvalidStakeAmount, stakeAmount);
    } else if (rewardRecipient.IsNull()) {
        ok = state.Invalid(ErrorCode::InvalidRewardRecipient, 0, "zero reward recipient");
    }
    std::optional<Weight> weight;
    if (ok) {
        weight = ValueToWeight(stakeAmount, state);
    }
    if (!weight) {
        LogRejection("InitiateValidatorRegistration", state);
        return std::nullopt;
    }

    // Only whole units of weight are locked; the remainder stays with the owner
    Amount lockedValue = WeightToValue(*weight);
    if (!asset_->Lock(caller, lockedValue, state)) {
        LogRejection("InitiateValidatorRegistration", state);
        return std::nullopt;
    }

    auto validationID = manager_.InitiateValidatorRegistration(settings_.stakingManagerAddress,
                                                               input, *weight, managerEvents,
                                                               state);
    if (!validationID) {
        asset_->Unlock(caller, lockedValue);
        LogRejection("InitiateValidatorRegistration", state);
        return std::nullopt;
    }

    PoSValidatorInfo info;
    info.owner = caller;
    info.delegationFeeBips = delegationFeeBips;
    info.minStakeDuration = minStakeDuration;
    info.rewardRecipient = rewardRecipient;
    validators_[*validationID] = info;

    LOG_INFO(LogCategory::STAKING) << "Validator " << validationID->ToShortHex() << " staked "
                                   << lockedValue << " by " << caller.ToShortHex();
    return validationID;
}

std::optional<Hash256> StakingManager::CompleteValidatorRegistration(uint32_t messageIndex,
                                                                    ManagerState& state) {
    std::vector<Event> managerEvents;
    std::optional<Hash256> validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        validationID = manager_.CompleteValidatorRegistration(settings_.stakingManagerAddress,
                                                              messageIndex, managerEvents, state);
    }
    Emit(managerEvents, {});
    return validationID;
}

// ============================================================================
// Validator Removal
// ============================================================================

bool StakingManager::InitiateValidatorRemovalLocked(const Address& caller,
                                                    const Hash256& validationID,
                                                    bool includeUptimeProof,
                                                    uint32_t messageIndex, bool force,
                                                    std::vector<Event>& managerEvents,
                                                    std::vector<Event>& events,
                                                    ManagerState& state) {
    // Initial and PoA validators carry no stake and may be removed by anyone
    if (!IsPoSValidator(validationID)) {
        return manager_.InitiateValidatorRemoval(settings_.stakingManagerAddress, validationID,
                                                 managerEvents, state);
    }

    auto v = manager_.GetValidator(validationID);
    if (!v || v->status != ValidatorStatus::Active) {
        return InvalidStatus(v ? v->status : ValidatorStatus::Unknown, state);
    }
    PoSValidatorInfo& info = validators_[validationID];
    bool isOwner = caller == info.owner;
    if (!isOwner && !force) {
        return state.Invalid(ErrorCode::UnauthorizedOwner, 0, caller.ToHex());
    }

    Timestamp now = Now();
    if (!(force && isOwner) && !DurationPassed(v->startTime, info.minStakeDuration, now)) {
        return state.Invalid(ErrorCode::MinStakeDurationNotPassed, now);
    }

    std::optional<uint64_t> proof;
    uint64_t uptime = info.uptimeSeconds;
    if (includeUptimeProof) {
        proof = ReadUptimeProof(validationID, messageIndex, state);
        if (!proof) return false;
        uptime = std::max(uptime, *proof);
    }

    Amount reward = rewardCalculator_->CalculateReward(WeightToValue(v->startingWeight),
                                                       v->startTime, v->startTime, now, uptime);
    if (!force && reward == 0) {
        return state.Invalid(ErrorCode::ValidatorIneligibleForRewards, uptime,
                             validationID.ToHex());
    }

    if (!manager_.InitiateValidatorRemoval(settings_.stakingManagerAddress, validationID,
                                           managerEvents, state)) {
        return false;
    }

    if (proof) {
        ApplyUptime(validationID, *proof, events);
    }
    redeemableValidatorRewards_[validationID] += reward;

    LOG_INFO(LogCategory::STAKING) << (force ? "Forced removal of " : "Removal of ")
                                   << validationID.ToShortHex() << ", reward " << reward;
    return true;
}

bool StakingManager::InitiateValidatorRemoval(const Address& caller, const Hash256& validationID,
                                              bool includeUptimeProof, uint32_t messageIndex,
                                              ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = InitiateValidatorRemovalLocked(caller, validationID, includeUptimeProof,
                                            messageIndex, false, managerEvents, events, state);
    }
    if (!ok) {
        LogRejection("InitiateValidatorRemoval", state);
        return false;
    }
    Emit(managerEvents, events);
    return true;
}

bool StakingManager::ForceInitiateValidatorRemoval(const Address& caller,
                                                   const Hash256& validationID,
                                                   bool includeUptimeProof,
                                                   uint32_t messageIndex, ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = InitiateValidatorRemovalLocked(caller, validationID, includeUptimeProof,
                                            messageIndex, true, managerEvents, events, state);
    }
    if (!ok) {
        LogRejection("ForceInitiateValidatorRemoval", state);
        return false;
    }
    Emit(managerEvents, events);
    return true;
}

std::optional<Hash256> StakingManager::CompleteValidatorRemoval(uint32_t messageIndex,
                                                               ManagerState& state) {
    std::vector<Event> managerEvents;
    std::optional<Hash256> validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        validationID = CompleteValidatorRemovalLocked(messageIndex, managerEvents, state);
    }
    Emit(managerEvents, {});
    return validationID;
}

std::optional<Hash256> StakingManager::CompleteValidatorRemovalLocked(
    uint32_t messageIndex, std::vector<Event>& managerEvents, ManagerState& state) {
    auto ack = manager_.VerifyValidatorRemoval(messageIndex, state);
    if (!ack) {
        LogRejection("CompleteValidatorRemoval", state);
        return std::nullopt;
    }
    const Hash256& validationID = ack->validationID;
    if (!IsPoSValidator(validationID)) {
        return manager_.CompleteValidatorRemoval(settings_.stakingManagerAddress, messageIndex,
                                                 managerEvents, state);
    }

    const PoSValidatorInfo& info = validators_[validationID];
    auto v = manager_.GetValidator(validationID);
    Amount payout = 0;
    if (ack->newStatus == ValidatorStatus::Completed) {
        auto it = redeemableValidatorRewards_.find(validationID);
        payout = it == redeemableValidatorRewards_.end() ? 0 : it->second;
    }
    if (!asset_->CanReward(payout)) {
        state.Invalid(ErrorCode::InsufficientBalance, payout, "reward reserve too small");
        LogRejection("CompleteValidatorRemoval", state);
        return std::nullopt;
    }

    if (!manager_.CompleteValidatorRemoval(settings_.stakingManagerAddress, messageIndex,
                                           managerEvents, state)) {
        LogRejection("CompleteValidatorRemoval", state);
        return std::nullopt;
    }

    if (payout > 0) {
        asset_->Reward(info.rewardRecipient, payout);
    }
    redeemableValidatorRewards_.erase(validationID);
    // Stake comes back whether the validation completed or was invalidated
    asset_->Unlock(info.owner, WeightToValue(v->startingWeight));

    LOG_INFO(LogCategory::STAKING) << "Validator " << validationID.ToShortHex() << " exited, paid "
                                   << payout;
    return validationID;
}

// ============================================================================
// Uptime
// ============================================================================

std::optional<uint64_t> StakingManager::ReadUptimeProof(const Hash256& validationID,
                                                        uint32_t messageIndex,
                                                        ManagerState& state) const {
    auto message = validator::GetWarpMessageFrom(manager_.GetWarpMessenger(), messageIndex,
                                                 settings_.uptimeBlockchainID, state);
    if (!message) return std::nullopt;
    auto uptime = validator::UnpackValidationUptimeMessage(message->payload, state);
    if (!uptime) return std::nullopt;
    if (uptime->validationID != validationID) {
        state.Invalid(ErrorCode::UnexpectedValidationID, 0,
                      "proof for " + uptime->validationID.ToHex());
        return std::nullopt;
    }
    return uptime->uptime;
}

uint64_t StakingManager::ApplyUptime(const Hash256& validationID, uint64_t uptime,
                                     std::vector<Event>& events) {
    PoSValidatorInfo& info = validators_[validationID];
    if (uptime > info.uptimeSeconds) {
        info.uptimeSeconds = uptime;
        Event event(EventType::UptimeUpdated);
        event.validationID = validationID;
        event.uptime = uptime;
        events.push_back(event);
        LOG_DEBUG(LogCategory::STAKING) << "Uptime " << validationID.ToShortHex() << " = "
                                        << uptime << "s";
    }
    return info.uptimeSeconds;
}

bool StakingManager::SubmitUptimeProof(const Hash256& validationID, uint32_t messageIndex,
                                       ManagerState& state) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool ok = true;
        if (!IsPoSValidator(validationID)) {
            ok = state.Invalid(ErrorCode::ValidatorNotPoS, 0, validationID.ToHex());
        } else {
            auto v = manager_.GetValidator(validationID);
            if (!v || v->status != ValidatorStatus::Active) {
                ok = InvalidStatus(v ? v->status : ValidatorStatus::Unknown, state);
            }
        }
        std::optional<uint64_t> uptime;
        if (ok) {
            uptime = ReadUptimeProof(validationID, messageIndex, state);
        }
        if (!uptime) {
            LogRejection("SubmitUptimeProof", state);
            return false;
        }
        ApplyUptime(validationID, *uptime, events);
    }
    Emit({}, events);
    return true;
}

// ============================================================================
// Fees and Recipients
// ============================================================================

std::optional<Amount> StakingManager::ClaimDelegationFees(const Address& caller,
                                                          const Hash256& validationID,
                                                          ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = validators_.find(validationID);
    if (it == validators_.end() || it->second.owner != caller) {
        state.Invalid(ErrorCode::UnauthorizedOwner, 0, caller.ToHex());
        LogRejection("ClaimDelegationFees", state);
        return std::nullopt;
    }
    auto v = manager_.GetValidator(validationID);
    if (!v || v->status != ValidatorStatus::Completed) {
        InvalidStatus(v ? v->status : ValidatorStatus::Unknown, state);
        LogRejection("ClaimDelegationFees", state);
        return std::nullopt;
    }

    auto rewards = redeemableValidatorRewards_.find(validationID);
    Amount payout = rewards == redeemableValidatorRewards_.end() ? 0 : rewards->second;
    if (!asset_->CanReward(payout)) {
        state.Invalid(ErrorCode::InsufficientBalance, payout, "reward reserve too small");
        LogRejection("ClaimDelegationFees", state);
        return std::nullopt;
    }
    if (payout > 0) {
        asset_->Reward(it->second.rewardRecipient, payout);
    }
    redeemableValidatorRewards_.erase(validationID);
    LOG_INFO(LogCategory::STAKING) << "Claimed " << payout << " in delegation fees for "
                                   << validationID.ToShortHex();
    return payout;
}

bool StakingManager::ChangeValidatorRewardRecipient(const Address& caller,
                                                    const Hash256& validationID,
                                                    const Address& recipient,
                                                    ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recipient.IsNull()) {
        state.Invalid(ErrorCode::InvalidRewardRecipient, 0, "zero reward recipient");
        LogRejection("ChangeValidatorRewardRecipient", state);
        return false;
    }
    auto it = validators_.find(validationID);
    if (it == validators_.end() || it->second.owner != caller) {
        state.Invalid(ErrorCode::UnauthorizedOwner, 0, caller.ToHex());
        LogRejection("ChangeValidatorRewardRecipient", state);
        return false;
    }
    it->second.rewardRecipient = recipient;
    return true;
}

// ============================================================================
// Delegator Registration
// ============================================================================

std::optional<Hash256> StakingManager::InitiateDelegatorRegistration(
    const Address& caller, const Hash256& validationID, Amount stakeAmount,
    const Address& rewardRecipient, ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    Hash256 delegationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool ok = true;
        if (rewardRecipient.IsNull()) {
            ok = state.Invalid(ErrorCode::InvalidRewardRecipient, 0, "zero reward recipient");
        } else if (stakeAmount < settings_.minimumStakeAmount) {
            ok = state.Invalid(ErrorCode::InvalidStakeAmount, stakeAmount);
        }
        std::optional<Weight> weight;
        if (ok) {
            weight = ValueToWeight(stakeAmount, state);
        }
        std::optional<validator::Validator> v;
        if (weight) {
            if (!IsPoSValidator(validationID)) {
                state.Invalid(ErrorCode::ValidatorNotPoS, 0, validationID.ToHex());
                weight.reset();
            } else {
                v = manager_.GetValidator(validationID);
                if (!v || v->status != ValidatorStatus::Active) {
                    InvalidStatus(v ? v->status : ValidatorStatus::Unknown, state);
                    weight.reset();
                }
            }
        }
        if (!weight) {
            LogRejection("InitiateDelegatorRegistration", state);
            return std::nullopt;
        }

        if (*weight > std::numeric_limits<Weight>::max() - v->weight) {
            state.Invalid(ErrorCode::MaxWeightExceeded, std::numeric_limits<Weight>::max());
            LogRejection("InitiateDelegatorRegistration", state);
            return std::nullopt;
        }
        Weight newWeight = v->weight + *weight;
        if (static_cast<unsigned __int128>(newWeight) >
            static_cast<unsigned __int128>(v->startingWeight) * settings_.maximumStakeMultiplier) {
            state.Invalid(ErrorCode::MaxWeightExceeded, newWeight);
            LogRejection("InitiateDelegatorRegistration", state);
            return std::nullopt;
        }

        Amount lockedValue = WeightToValue(*weight);
        if (!asset_->Lock(caller, lockedValue, state)) {
            LogRejection("InitiateDelegatorRegistration", state);
            return std::nullopt;
        }
        auto update = manager_.InitiateValidatorWeightUpdate(settings_.stakingManagerAddress,
                                                             validationID, newWeight,
                                                             managerEvents, state);
        if (!update) {
            asset_->Unlock(caller, lockedValue);
            LogRejection("InitiateDelegatorRegistration", state);
            return std::nullopt;
        }

        delegationID = DelegationID(validationID, update->nonce);
        Delegator d;
        d.status = DelegatorStatus::PendingAdded;
        d.owner = caller;
        d.validationID = validationID;
        d.weight = *weight;
        d.startingNonce = update->nonce;
        d.rewardRecipient = rewardRecipient;
        delegators_[delegationID] = d;

        Event event(EventType::InitiatedDelegatorRegistration);
        event.delegationID = delegationID;
        event.validationID = validationID;
        event.account = caller;
        event.nonce = update->nonce;
        event.weight = newWeight;
        event.delegatorWeight = *weight;
        event.messageID = update->messageID;
        event.rewardRecipient = rewardRecipient;
        events.push_back(event);

        LOG_INFO(LogCategory::STAKING) << "Delegation " << delegationID.ToShortHex() << " of "
                                       << lockedValue << " to " << validationID.ToShortHex()
                                       << " (nonce " << update->nonce << ")";
    }
    Emit(managerEvents, events);
    return delegationID;
}

bool StakingManager::CompleteDelegatorRegistration(const Hash256& delegationID,
                                                   uint32_t messageIndex, ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = delegators_.find(delegationID);
        if (it == delegators_.end()) {
            state.Invalid(ErrorCode::InvalidDelegationID, 0, delegationID.ToHex());
            LogRejection("CompleteDelegatorRegistration", state);
            return false;
        }
        Delegator& d = it->second;
        if (d.status != DelegatorStatus::PendingAdded) {
            InvalidStatus(d.status, state);
            LogRejection("CompleteDelegatorRegistration", state);
            return false;
        }

        auto v = manager_.GetValidator(d.validationID);
        if (v && v->status == ValidatorStatus::Completed) {
            // Too late to stake; hand the stake back
            CompleteDelegatorRemovalLocked(delegationID, events);
        } else {
            auto ack = manager_.VerifyValidatorWeightUpdate(messageIndex, state);
            bool ok = ack.has_value();
            if (ok && ack->validationID != d.validationID) {
                ok = state.Invalid(ErrorCode::UnexpectedValidationID, 0,
                                   "ack for " + ack->validationID.ToHex());
            }
            // Any later nonce includes this delegation's weight change
            if (ok && ack->nonce < d.startingNonce) {
                ok = state.Invalid(ErrorCode::InvalidNonce, ack->nonce);
            }
            ok = ok && manager_.CompleteValidatorWeightUpdate(settings_.stakingManagerAddress,
                                                              messageIndex, managerEvents,
                                                              state).has_value();
            if (!ok) {
                LogRejection("CompleteDelegatorRegistration", state);
                return false;
            }

            d.status = DelegatorStatus::Active;
            d.startTime = Now();

            Event event(EventType::CompletedDelegatorRegistration);
            event.delegationID = delegationID;
            event.validationID = d.validationID;
            event.timestamp = d.startTime;
            events.push_back(event);

            LOG_INFO(LogCategory::STAKING) << "Delegation " << delegationID.ToShortHex()
                                           << " active";
        }
    }
    Emit(managerEvents, events);
    return true;
}

// ============================================================================
// Delegator Removal
// ============================================================================

std::pair<Amount, Amount> StakingManager::SplitDelegationReward(const Hash256& delegationID) const {
    auto rewardIt = delegatorRewards_.find(delegationID);
    Amount reward = rewardIt == delegatorRewards_.end() ? 0 : rewardIt->second;
    const Delegator& d = delegators_.at(delegationID);
    auto info = validators_.find(d.validationID);
    uint16_t feeBips = info == validators_.end() ? 0 : info->second.delegationFeeBips;
    Amount fee = static_cast<Amount>(static_cast<unsigned __int128>(reward) * feeBips /
                                     BIPS_CONVERSION_FACTOR);
    return {reward - fee, fee};
}

void StakingManager::CompleteDelegatorRemovalLocked(const Hash256& delegationID,
                                                    std::vector<Event>& events) {
    Delegator& d = delegators_.at(delegationID);
    auto [delegatorReward, fee] = SplitDelegationReward(delegationID);
    delegatorRewards_.erase(delegationID);

    if (fee > 0) {
        redeemableValidatorRewards_[d.validationID] += fee;
    }
    if (delegatorReward > 0) {
        asset_->Reward(d.rewardRecipient, delegatorReward);
    }
    asset_->Unlock(d.owner, WeightToValue(d.weight));
    d.status = DelegatorStatus::Completed;

    Event event(EventType::CompletedDelegatorRemoval);
    event.delegationID = delegationID;
    event.validationID = d.validationID;
    event.rewards = delegatorReward;
    event.fees = fee;
    events.push_back(event);

    LOG_INFO(LogCategory::STAKING) << "Delegation " << delegationID.ToShortHex()
                                   << " completed, reward " << delegatorReward << ", fee " << fee;
}

bool StakingManager::InitiateDelegatorRemovalLocked(const Address& caller,
                                                    const Hash256& delegationID,
                                                    bool includeUptimeProof,
                                                    uint32_t messageIndex, bool force,
                                                    std::vector<Event>& managerEvents,
                                                    std::vector<Event>& events,
                                                    ManagerState& state) {
    auto it = delegators_.find(delegationID);
    if (it == delegators_.end()) {
        return state.Invalid(ErrorCode::InvalidDelegationID, 0, delegationID.ToHex());
    }
    Delegator& d = it->second;
    if (d.status != DelegatorStatus::Active) {
        return InvalidStatus(d.status, state);
    }

    auto v = manager_.GetValidator(d.validationID);
    if (!v) {
        return InvalidStatus(ValidatorStatus::Unknown, state);
    }
    const PoSValidatorInfo& info = validators_[d.validationID];
    Timestamp now = Now();

    bool isOwner = caller == d.owner;
    if (!isOwner && !force && caller != info.owner) {
        return state.Invalid(ErrorCode::UnauthorizedOwner, 0, caller.ToHex());
    }
    if (!isOwner && !DurationPassed(v->startTime, info.minStakeDuration, now)) {
        return state.Invalid(ErrorCode::MinStakeDurationNotPassed, now);
    }

    if (v->status == ValidatorStatus::Active) {
        if (!(force && isOwner) &&
            !DurationPassed(d.startTime, settings_.minimumStakeDuration, now)) {
            return state.Invalid(ErrorCode::MinStakeDurationNotPassed, now);
        }

        std::optional<uint64_t> proof;
        uint64_t uptime = info.uptimeSeconds;
        if (includeUptimeProof) {
            proof = ReadUptimeProof(d.validationID, messageIndex, state);
            if (!proof) return false;
            uptime = std::max(uptime, *proof);
        }

        Amount reward = rewardCalculator_->CalculateReward(WeightToValue(d.weight), v->startTime,
                                                           d.startTime, now, uptime);
        if (!force && reward == 0) {
            return state.Invalid(ErrorCode::DelegatorIneligibleForRewards, uptime,
                                 delegationID.ToHex());
        }

        auto update = manager_.InitiateValidatorWeightUpdate(settings_.stakingManagerAddress,
                                                             d.validationID, v->weight - d.weight,
                                                             managerEvents, state);
        if (!update) return false;

        if (proof) {
            ApplyUptime(d.validationID, *proof, events);
        }
        d.status = DelegatorStatus::PendingRemoved;
        d.endTime = now;
        d.endingNonce = update->nonce;
        delegatorRewards_[delegationID] = reward;

        Event event(EventType::InitiatedDelegatorRemoval);
        event.delegationID = delegationID;
        event.validationID = d.validationID;
        event.nonce = update->nonce;
        events.push_back(event);

        LOG_INFO(LogCategory::STAKING) << "Removal of delegation " << delegationID.ToShortHex()
                                       << " (nonce " << update->nonce << "), reward " << reward;
        return true;
    }

    if (v->status == ValidatorStatus::Completed) {
        // No more uptime can arrive; settle immediately against the final record
        Amount reward = rewardCalculator_->CalculateReward(WeightToValue(d.weight), v->startTime,
                                                           d.startTime, v->endTime,
                                                           info.uptimeSeconds);
        Amount fee = static_cast<Amount>(static_cast<unsigned __int128>(reward) *
                                         info.delegationFeeBips / BIPS_CONVERSION_FACTOR);
        if (!asset_->CanReward(reward - fee)) {
            return state.Invalid(ErrorCode::InsufficientBalance, reward - fee,
                                 "reward reserve too small");
        }
        d.status = DelegatorStatus::PendingRemoved;
        d.endTime = v->endTime;
        delegatorRewards_[delegationID] = reward;

        Event event(EventType::InitiatedDelegatorRemoval);
        event.delegationID = delegationID;
        event.validationID = d.validationID;
        events.push_back(event);

        CompleteDelegatorRemovalLocked(delegationID, events);
        return true;
    }

    return InvalidStatus(v->status, state);
}

bool StakingManager::InitiateDelegatorRemoval(const Address& caller, const Hash256& delegationID,
                                              bool includeUptimeProof, uint32_t messageIndex,
                                              ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = InitiateDelegatorRemovalLocked(caller, delegationID, includeUptimeProof,
                                            messageIndex, false, managerEvents, events, state);
    }
    if (!ok) {
        LogRejection("InitiateDelegatorRemoval", state);
        return false;
    }
    Emit(managerEvents, events);
    return true;
}

bool StakingManager::ForceInitiateDelegatorRemoval(const Address& caller,
                                                   const Hash256& delegationID,
                                                   bool includeUptimeProof,
                                                   uint32_t messageIndex, ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = InitiateDelegatorRemovalLocked(caller, delegationID, includeUptimeProof,
                                            messageIndex, true, managerEvents, events, state);
    }
    if (!ok) {
        LogRejection("ForceInitiateDelegatorRemoval", state);
        return false;
    }
    Emit(managerEvents, events);
    return true;
}

bool StakingManager::CompleteDelegatorRemoval(const Hash256& delegationID, uint32_t messageIndex,
                                              ManagerState& state) {
    std::vector<Event> managerEvents;
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = delegators_.find(delegationID);
        if (it == delegators_.end()) {
            state.Invalid(ErrorCode::InvalidDelegationID, 0, delegationID.ToHex());
            LogRejection("CompleteDelegatorRemoval", state);
            return false;
        }
        const Delegator& d = it->second;
        if (d.status != DelegatorStatus::PendingRemoved) {
            InvalidStatus(d.status, state);
            LogRejection("CompleteDelegatorRemoval", state);
            return false;
        }

        auto v = manager_.GetValidator(d.validationID);
        // Once the validator has completed there is no weight change left to acknowledge
        bool needsAck = !v || v->status != ValidatorStatus::Completed;
        bool ok = true;
        if (needsAck) {
            auto ack = manager_.VerifyValidatorWeightUpdate(messageIndex, state);
            ok = ack.has_value();
            if (ok && ack->validationID != d.validationID) {
                ok = state.Invalid(ErrorCode::UnexpectedValidationID, 0,
                                   "ack for " + ack->validationID.ToHex());
            }
            if (ok && ack->nonce < d.endingNonce) {
                ok = state.Invalid(ErrorCode::InvalidNonce, ack->nonce);
            }
        }
        if (ok) {
            Amount delegatorReward = SplitDelegationReward(delegationID).first;
            if (!asset_->CanReward(delegatorReward)) {
                ok = state.Invalid(ErrorCode::InsufficientBalance, delegatorReward,
                                   "reward reserve too small");
            }
        }
        if (ok && needsAck) {
            ok = manager_.CompleteValidatorWeightUpdate(settings_.stakingManagerAddress,
                                                        messageIndex, managerEvents, state)
                     .has_value();
        }
        if (!ok) {
            LogRejection("CompleteDelegatorRemoval", state);
            return false;
        }

        CompleteDelegatorRemovalLocked(delegationID, events);
    }
    Emit(managerEvents, events);
    return true;
}

std::optional<Bytes> StakingManager::ResendUpdateDelegator(const Hash256& delegationID,
                                                           ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegators_.find(delegationID);
    if (it == delegators_.end()) {
        state.Invalid(ErrorCode::InvalidDelegationID, 0, delegationID.ToHex());
        LogRejection("ResendUpdateDelegator", state);
        return std::nullopt;
    }
    if (it->second.status != DelegatorStatus::PendingAdded &&
        it->second.status != DelegatorStatus::PendingRemoved) {
        InvalidStatus(it->second.status, state);
        LogRejection("ResendUpdateDelegator", state);
        return std::nullopt;
    }
    return manager_.ResendValidatorWeightMessage(it->second.validationID, state);
}

bool StakingManager::ChangeDelegatorRewardRecipient(const Address& caller,
                                                    const Hash256& delegationID,
                                                    const Address& recipient,
                                                    ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recipient.IsNull()) {
        state.Invalid(ErrorCode::InvalidRewardRecipient, 0, "zero reward recipient");
        LogRejection("ChangeDelegatorRewardRecipient", state);
        return false;
    }
    auto it = delegators_.find(delegationID);
    if (it == delegators_.end()) {
        state.Invalid(ErrorCode::InvalidDelegationID, 0, delegationID.ToHex());
        LogRejection("ChangeDelegatorRewardRecipient", state);
        return false;
    }
    if (it->second.owner != caller) {
        state.Invalid(ErrorCode::UnauthorizedOwner, 0, caller.ToHex());
        LogRejection("ChangeDelegatorRewardRecipient", state);
        return false;
    }
    it->second.rewardRecipient = recipient;
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<PoSValidatorInfo> StakingManager::GetStakingValidator(
    const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = validators_.find(validationID);
    if (it == validators_.end()) return std::nullopt;
    return it->second;
}

std::optional<Delegator> StakingManager::GetDelegator(const Hash256& delegationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegators_.find(delegationID);
    if (it == delegators_.end()) return std::nullopt;
    return it->second;
}

std::optional<Address> StakingManager::GetValidatorRewardRecipient(
    const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = validators_.find(validationID);
    if (it == validators_.end()) return std::nullopt;
    return it->second.rewardRecipient;
}

std::optional<Address> StakingManager::GetDelegatorRewardRecipient(
    const Hash256& delegationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegators_.find(delegationID);
    if (it == delegators_.end()) return std::nullopt;
    return it->second.rewardRecipient;
}

Amount StakingManager::GetRedeemableValidatorRewards(const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = redeemableValidatorRewards_.find(validationID);
    return it == redeemableValidatorRewards_.end() ? 0 : it->second;
}

Amount StakingManager::GetDelegatorRewards(const Hash256& delegationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegatorRewards_.find(delegationID);
    return it == delegatorRewards_.end() ? 0 : it->second;
}

void StakingManager::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

void StakingManager::Emit(const std::vector<Event>& managerEvents,
                          const std::vector<Event>& events) {
    // Validator transitions come first; staking events describe their consequences
    manager_.EmitEvents(managerEvents);
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = eventCallback_;
    }
    for (const auto& event : events) {
        LOG_TRACE(LogCategory::STAKING) << event.ToString();
        if (callback) {
            callback(event);
        }
    }
}

// ============================================================================
// Persistence
// ============================================================================

StakingSnapshot StakingManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StakingSnapshot snapshot;
    snapshot.validators = validators_;
    snapshot.delegators = delegators_;
    snapshot.delegatorRewards = delegatorRewards_;
    snapshot.redeemableValidatorRewards = redeemableValidatorRewards_;
    return snapshot;
}

void StakingManager::Restore(const StakingSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    validators_ = snapshot.validators;
    delegators_ = snapshot.delegators;
    delegatorRewards_ = snapshot.delegatorRewards;
    redeemableValidatorRewards_ = snapshot.redeemableValidatorRewards;
    LOG_INFO(LogCategory::STAKING) << "Restored " << validators_.size() << " staking validators, "
                                   << delegators_.size() << " delegators";
}

} // namespace staking
} // namespace valset
