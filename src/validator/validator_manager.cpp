// VALSET - Validator Manager Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/validator_manager.h>
#include <valset/util/logging.h>
#include <valset/util/time.h>

#include <limits>
#include <set>
#include <stdexcept>
#include <string>

namespace valset {
namespace validator {

namespace LogCategory = util::LogCategory;

namespace {

Timestamp Now() {
    return static_cast<Timestamp>(util::GetTime());
}

void LogRejection(const char* operation, const ManagerState& state) {
    LOG_DEBUG(LogCategory::VALIDATOR) << operation << " rejected: " << state.ToString();
}

bool CheckNodeID(const Bytes& nodeID, ManagerState& state) {
    if (nodeID.size() != NODE_ID_LENGTH) {
        return state.Invalid(ErrorCode::InvalidNodeID, nodeID.size(),
                             "node ID must be 20 bytes");
    }
    if (NodeID(nodeID.data(), nodeID.size()).IsNull()) {
        return state.Invalid(ErrorCode::InvalidNodeID, 0, "zero node ID");
    }
    return true;
}

bool IsLive(ValidatorStatus status) {
    return status == ValidatorStatus::PendingAdded || status == ValidatorStatus::Active ||
           status == ValidatorStatus::PendingRemoved;
}

} // namespace

const char* ValidatorStatusToString(ValidatorStatus status) {
    switch (status) {
        case ValidatorStatus::Unknown: return "Unknown";
        case ValidatorStatus::PendingAdded: return "PendingAdded";
        case ValidatorStatus::Active: return "Active";
        case ValidatorStatus::PendingRemoved: return "PendingRemoved";
        case ValidatorStatus::Completed: return "Completed";
        case ValidatorStatus::Invalidated: return "Invalidated";
    }
    return "Unknown";
}

// ============================================================================
// Construction
// ============================================================================

bool ValidatorManager::CheckSettings(const ValidatorManagerSettings& settings,
                                     ManagerState& state) {
    ChurnSettings churn{settings.churnPeriodSeconds, settings.maximumChurnPercentage};
    if (!CheckChurnSettings(churn, state)) {
        return false;
    }
    if (settings.admin.IsNull()) {
        return state.Invalid(ErrorCode::InvalidOwnerAddress, 0, "zero admin address");
    }
    return true;
}

ValidatorManager::ValidatorManager(const ValidatorManagerSettings& settings,
                                   IWarpMessenger& warp)
    : settings_(settings),
      warp_(warp),
      churn_(ChurnSettings{settings.churnPeriodSeconds, settings.maximumChurnPercentage}),
      owner_(settings.admin) {
    ManagerState state;
    if (!CheckSettings(settings, state)) {
        throw std::invalid_argument("ValidatorManager: " + state.ToString());
    }
    LOG_INFO(LogCategory::VALIDATOR) << "Validator manager for subnet "
                                     << settings.subnetID.ToShortHex()
                                     << " (churn " << static_cast<int>(settings.maximumChurnPercentage)
                                     << "% per " << settings.churnPeriodSeconds << "s)";
}

// ============================================================================
// Initial Validator Set
// ============================================================================

bool ValidatorManager::InitializeValidatorSet(const ConversionData& data,
                                              uint32_t messageIndex,
                                              ManagerState& state) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (initialized_) {
            state.Invalid(ErrorCode::InvalidInitializationStatus, 0, "already initialized");
            LogRejection("InitializeValidatorSet", state);
            return false;
        }
        if (data.validatorManagerBlockchainID != warp_.GetBlockchainID()) {
            state.Invalid(ErrorCode::InvalidValidatorManagerBlockchainID, 0,
                          data.validatorManagerBlockchainID.ToHex());
            LogRejection("InitializeValidatorSet", state);
            return false;
        }
        if (data.validatorManagerAddress != settings_.managerAddress) {
            state.Invalid(ErrorCode::InvalidValidatorManagerAddress, 0,
                          data.validatorManagerAddress.ToHex());
            LogRejection("InitializeValidatorSet", state);
            return false;
        }

        // Validate the whole set before touching any state
        std::set<NodeID> seen;
        Weight totalWeight = 0;
        for (const auto& initial : data.initialValidators) {
            if (!CheckNodeID(initial.nodeID, state)) {
                LogRejection("InitializeValidatorSet", state);
                return false;
            }
            NodeID nodeID(initial.nodeID.data(), initial.nodeID.size());
            if (!seen.insert(nodeID).second || nodeIndex_.count(nodeID)) {
                state.Invalid(ErrorCode::NodeAlreadyRegistered, 0, nodeID.ToHex());
                LogRejection("InitializeValidatorSet", state);
                return false;
            }
            if (initial.weight > std::numeric_limits<Weight>::max() - totalWeight) {
                state.Invalid(ErrorCode::InvalidTotalWeight, initial.weight,
                              "initial weight overflow");
                LogRejection("InitializeValidatorSet", state);
                return false;
            }
            totalWeight += initial.weight;
        }

        // A single unit of churn must fit within the percentage
        if (static_cast<unsigned __int128>(totalWeight) * settings_.maximumChurnPercentage < 100) {
            state.Invalid(ErrorCode::InvalidTotalWeight, totalWeight,
                          "total weight too low for churn percentage");
            LogRejection("InitializeValidatorSet", state);
            return false;
        }

        auto message = GetPChainWarpMessage(warp_, messageIndex, state);
        if (!message) {
            LogRejection("InitializeValidatorSet", state);
            return false;
        }
        auto conversionID = UnpackSubnetToL1ConversionMessage(message->payload, state);
        if (!conversionID) {
            LogRejection("InitializeValidatorSet", state);
            return false;
        }
        Hash256 expected = ConversionID(data);
        if (expected != *conversionID) {
            state.Invalid(ErrorCode::InvalidConversionID, 0,
                          "got " + conversionID->ToHex() + ", computed " + expected.ToHex());
            LogRejection("InitializeValidatorSet", state);
            return false;
        }

        // Commit
        Timestamp now = Now();
        for (uint32_t i = 0; i < data.initialValidators.size(); ++i) {
            const auto& initial = data.initialValidators[i];
            Hash256 validationID = InitialValidationID(data.subnetID, i);

            Validator v;
            v.status = ValidatorStatus::Active;
            v.nodeID = NodeID(initial.nodeID.data(), initial.nodeID.size());
            v.startingWeight = initial.weight;
            v.weight = initial.weight;
            v.startTime = now;
            validators_[validationID] = v;
            nodeIndex_[v.nodeID] = validationID;

            Event event(EventType::RegisteredInitialValidator);
            event.validationID = validationID;
            event.nodeID = v.nodeID;
            event.weight = initial.weight;
            events.push_back(event);
        }
        churn_.SetTotalWeight(totalWeight);
        initialized_ = true;

        LOG_INFO(LogCategory::VALIDATOR) << "Initialized validator set: "
                                         << data.initialValidators.size()
                                         << " validators, total weight " << totalWeight;
    }
    EmitEvents(events);
    return true;
}

// ============================================================================
// Registration
// ============================================================================

bool ValidatorManager::CheckPChainOwner(const PChainOwner& owner, ManagerState& state) {
    if (owner.threshold == 0 && !owner.addresses.empty()) {
        return state.Invalid(ErrorCode::InvalidPChainOwnerThreshold, owner.threshold,
                             "zero threshold with addresses");
    }
    if (owner.threshold > owner.addresses.size()) {
        return state.Invalid(ErrorCode::InvalidPChainOwnerThreshold, owner.threshold,
                             "threshold exceeds address count");
    }
    for (size_t i = 1; i < owner.addresses.size(); ++i) {
        if (!(owner.addresses[i - 1] < owner.addresses[i])) {
            return state.Invalid(ErrorCode::PChainOwnerAddressesNotSorted, i);
        }
    }
    return true;
}

std::optional<Hash256> ValidatorManager::InitiateValidatorRegistration(
    const Address& caller, const ValidatorRegistrationInput& input, Weight weight,
    ManagerState& state) {
    std::vector<Event> events;
    auto validationID = InitiateValidatorRegistration(caller, input, weight, events, state);
    EmitEvents(events);
    return validationID;
}

std::optional<Hash256> ValidatorManager::InitiateValidatorRegistration(
    const Address& caller, const ValidatorRegistrationInput& input, Weight weight,
    std::vector<Event>& events, ManagerState& state) {
    Hash256 validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = Now();

        bool ok = CheckOwner(caller, state);
        if (ok && !initialized_) {
            ok = state.Invalid(ErrorCode::InvalidInitializationStatus, 0, "not initialized");
        }
        if (ok && (input.registrationExpiry <= now ||
                   input.registrationExpiry >= now + MAXIMUM_REGISTRATION_EXPIRY_LENGTH)) {
            ok = state.Invalid(ErrorCode::InvalidRegistrationExpiry, input.registrationExpiry);
        }
        if (ok && weight > std::numeric_limits<Weight>::max() - churn_.GetTotalWeight()) {
            ok = state.Invalid(ErrorCode::InvalidTotalWeight, weight, "total weight overflow");
        }
        ok = ok && CheckPChainOwner(input.remainingBalanceOwner, state) &&
             CheckPChainOwner(input.disableOwner, state);
        if (ok && input.blsPublicKey.size() != BLS_PUBLIC_KEY_LENGTH) {
            ok = state.Invalid(ErrorCode::InvalidBLSKeyLength, input.blsPublicKey.size());
        }
        ok = ok && CheckNodeID(input.nodeID, state);

        NodeID nodeID;
        if (ok) {
            nodeID = NodeID(input.nodeID.data(), input.nodeID.size());
            if (nodeIndex_.count(nodeID)) {
                ok = state.Invalid(ErrorCode::NodeAlreadyRegistered, 0, nodeID.ToHex());
            }
        }

        Bytes payload;
        if (ok) {
            RegisterL1ValidatorMessage msg;
            msg.subnetID = settings_.subnetID;
            msg.nodeID = input.nodeID;
            msg.blsPublicKey = input.blsPublicKey;
            msg.registrationExpiry = input.registrationExpiry;
            msg.remainingBalanceOwner = input.remainingBalanceOwner;
            msg.disableOwner = input.disableOwner;
            msg.weight = weight;
            payload = PackRegisterL1ValidatorMessage(msg);
            validationID = WarpMessageID(payload);
            if (validators_.count(validationID)) {
                ok = state.Invalid(ErrorCode::InvalidValidationID, 0,
                                   "validation ID already used: " + validationID.ToHex());
            }
        }

        // Churn is committed last; nothing after it can fail
        ok = ok && churn_.CheckAndUpdate(weight, 0, now, state);
        if (!ok) {
            LogRejection("InitiateValidatorRegistration", state);
            return std::nullopt;
        }

        Hash256 messageID = warp_.SendWarpMessage(payload);
        pendingMessages_[validationID] = payload;
        nodeIndex_[nodeID] = validationID;

        Validator v;
        v.status = ValidatorStatus::PendingAdded;
        v.nodeID = nodeID;
        v.startingWeight = weight;
        v.weight = weight;
        validators_[validationID] = v;

        Event event(EventType::InitiatedValidatorRegistration);
        event.validationID = validationID;
        event.nodeID = nodeID;
        event.messageID = messageID;
        event.timestamp = input.registrationExpiry;
        event.weight = weight;
        events.push_back(event);

        LOG_INFO(LogCategory::VALIDATOR) << "Initiated registration " << validationID.ToShortHex()
                                         << " node " << nodeID.ToShortHex()
                                         << " weight " << weight;
    }
    return validationID;
}

std::optional<Hash256> ValidatorManager::CompleteValidatorRegistration(const Address& caller,
                                                                      uint32_t messageIndex,
                                                                      ManagerState& state) {
    std::vector<Event> events;
    auto validationID = CompleteValidatorRegistration(caller, messageIndex, events, state);
    EmitEvents(events);
    return validationID;
}

std::optional<Hash256> ValidatorManager::CompleteValidatorRegistration(
    const Address& caller, uint32_t messageIndex, std::vector<Event>& events,
    ManagerState& state) {
    Hash256 validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckOwner(caller, state)) {
            LogRejection("CompleteValidatorRegistration", state);
            return std::nullopt;
        }

        auto message = GetPChainWarpMessage(warp_, messageIndex, state);
        std::optional<L1ValidatorRegistrationMessage> ack;
        if (message) {
            ack = UnpackL1ValidatorRegistrationMessage(message->payload, state);
        }
        if (!ack) {
            LogRejection("CompleteValidatorRegistration", state);
            return std::nullopt;
        }
        validationID = ack->validationID;
        if (!ack->valid) {
            state.Invalid(ErrorCode::UnexpectedRegistrationStatus, 0, "registration not valid");
            LogRejection("CompleteValidatorRegistration", state);
            return std::nullopt;
        }
        auto pending = pendingMessages_.find(validationID);
        auto it = validators_.find(validationID);
        if (pending == pendingMessages_.end() || it == validators_.end()) {
            state.Invalid(ErrorCode::InvalidValidationID, 0, validationID.ToHex());
            LogRejection("CompleteValidatorRegistration", state);
            return std::nullopt;
        }
        Validator& v = it->second;
        if (v.status != ValidatorStatus::PendingAdded) {
            state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(v.status),
                          ValidatorStatusToString(v.status));
            LogRejection("CompleteValidatorRegistration", state);
            return std::nullopt;
        }

        pendingMessages_.erase(pending);
        v.status = ValidatorStatus::Active;
        v.startTime = Now();

        Event event(EventType::CompletedValidatorRegistration);
        event.validationID = validationID;
        event.weight = v.weight;
        events.push_back(event);

        LOG_INFO(LogCategory::VALIDATOR) << "Validator " << validationID.ToShortHex()
                                         << " active";
    }
    return validationID;
}

std::optional<Bytes> ValidatorManager::ResendRegisterValidatorMessage(
    const Hash256& validationID, ManagerState& state) {
    Bytes payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto pending = pendingMessages_.find(validationID);
        auto it = validators_.find(validationID);
        if (pending == pendingMessages_.end() || it == validators_.end()) {
            state.Invalid(ErrorCode::InvalidValidationID, 0, validationID.ToHex());
            LogRejection("ResendRegisterValidatorMessage", state);
            return std::nullopt;
        }
        if (it->second.status != ValidatorStatus::PendingAdded) {
            state.Invalid(ErrorCode::InvalidValidatorStatus,
                          static_cast<uint64_t>(it->second.status),
                          ValidatorStatusToString(it->second.status));
            LogRejection("ResendRegisterValidatorMessage", state);
            return std::nullopt;
        }
        payload = pending->second;
        warp_.SendWarpMessage(payload);
    }
    LOG_DEBUG(LogCategory::WARP) << "Resent registration for " << validationID.ToShortHex();
    return payload;
}

// ============================================================================
// Removal
// ============================================================================

bool ValidatorManager::InitiateValidatorRemoval(const Address& caller,
                                                const Hash256& validationID,
                                                ManagerState& state) {
    std::vector<Event> events;
    bool ok = InitiateValidatorRemoval(caller, validationID, events, state);
    EmitEvents(events);
    return ok;
}

bool ValidatorManager::InitiateValidatorRemoval(const Address& caller,
                                                const Hash256& validationID,
                                                std::vector<Event>& events,
                                                ManagerState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckOwner(caller, state)) {
            LogRejection("InitiateValidatorRemoval", state);
            return false;
        }
        auto it = validators_.find(validationID);
        if (it == validators_.end() || it->second.status != ValidatorStatus::Active) {
            ValidatorStatus status =
                it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
            state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                          ValidatorStatusToString(status));
            LogRejection("InitiateValidatorRemoval", state);
            return false;
        }
        Validator& v = it->second;
        Validator before = v;
        // Removal is a weight change to zero
        if (!InitiateWeightUpdateLocked(validationID, v, 0, events, state)) {
            LogRejection("InitiateValidatorRemoval", state);
            return false;
        }
        v.status = ValidatorStatus::PendingRemoved;
        v.endTime = Now();

        // Replace the weight-update event with a removal event
        Event event(EventType::InitiatedValidatorRemoval);
        event.validationID = validationID;
        event.messageID = events.back().messageID;
        event.weight = before.weight;
        event.timestamp = v.endTime;
        events.back() = event;

        LOG_INFO(LogCategory::VALIDATOR) << "Initiated removal of "
                                         << validationID.ToShortHex();
    }
    return true;
}

std::optional<RemovalAck> ValidatorManager::VerifyRemovalLocked(uint32_t messageIndex,
                                                                ManagerState& state) const {
    auto message = GetPChainWarpMessage(warp_, messageIndex, state);
    if (!message) return std::nullopt;
    auto ack = UnpackL1ValidatorRegistrationMessage(message->payload, state);
    if (!ack) return std::nullopt;
    if (ack->valid) {
        state.Invalid(ErrorCode::UnexpectedRegistrationStatus, 1,
                      "removal requires an invalid registration proof");
        return std::nullopt;
    }
    auto it = validators_.find(ack->validationID);
    ValidatorStatus status = it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
    RemovalAck result;
    result.validationID = ack->validationID;
    if (status == ValidatorStatus::PendingRemoved) {
        result.newStatus = ValidatorStatus::Completed;
    } else if (status == ValidatorStatus::PendingAdded) {
        result.newStatus = ValidatorStatus::Invalidated;
    } else {
        state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                      ValidatorStatusToString(status));
        return std::nullopt;
    }
    return result;
}

std::optional<RemovalAck> ValidatorManager::VerifyValidatorRemoval(uint32_t messageIndex,
                                                                   ManagerState& state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return VerifyRemovalLocked(messageIndex, state);
}

std::optional<Hash256> ValidatorManager::CompleteValidatorRemoval(const Address& caller,
                                                                 uint32_t messageIndex,
                                                                 ManagerState& state) {
    std::vector<Event> events;
    auto validationID = CompleteValidatorRemoval(caller, messageIndex, events, state);
    EmitEvents(events);
    return validationID;
}

std::optional<Hash256> ValidatorManager::CompleteValidatorRemoval(const Address& caller,
                                                                 uint32_t messageIndex,
                                                                 std::vector<Event>& events,
                                                                 ManagerState& state) {
    Hash256 validationID;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckOwner(caller, state)) {
            LogRejection("CompleteValidatorRemoval", state);
            return std::nullopt;
        }
        auto ack = VerifyRemovalLocked(messageIndex, state);
        if (!ack) {
            LogRejection("CompleteValidatorRemoval", state);
            return std::nullopt;
        }
        validationID = ack->validationID;
        Validator& v = validators_[validationID];

        if (ack->newStatus == ValidatorStatus::Invalidated) {
            // The P-Chain never added this weight
            churn_.RemoveWeight(v.weight);
            v.endTime = Now();
        }
        v.status = ack->newStatus;
        pendingMessages_.erase(validationID);
        nodeIndex_.erase(v.nodeID);

        Event event(EventType::CompletedValidatorRemoval);
        event.validationID = validationID;
        events.push_back(event);

        LOG_INFO(LogCategory::VALIDATOR) << "Validator " << validationID.ToShortHex() << " "
                                         << ValidatorStatusToString(v.status);
    }
    return validationID;
}

std::optional<Bytes> ValidatorManager::ResendValidatorRemovalMessage(
    const Hash256& validationID, ManagerState& state) {
    Bytes payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = validators_.find(validationID);
        ValidatorStatus status =
            it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
        if (status != ValidatorStatus::PendingRemoved) {
            state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                          ValidatorStatusToString(status));
            LogRejection("ResendValidatorRemovalMessage", state);
            return std::nullopt;
        }
        payload = PackL1ValidatorWeightMessage({validationID, it->second.sentNonce, 0});
        warp_.SendWarpMessage(payload);
    }
    LOG_DEBUG(LogCategory::WARP) << "Resent removal for " << validationID.ToShortHex();
    return payload;
}

// ============================================================================
// Weight Updates
// ============================================================================

std::optional<WeightUpdate> ValidatorManager::InitiateWeightUpdateLocked(
    const Hash256& validationID, Validator& validator, Weight newWeight,
    std::vector<Event>& events, ManagerState& state) {
    if (!churn_.CheckAndUpdate(newWeight, validator.weight, Now(), state)) {
        return std::nullopt;
    }

    validator.sentNonce += 1;
    validator.weight = newWeight;

    Bytes payload = PackL1ValidatorWeightMessage({validationID, validator.sentNonce, newWeight});
    WeightUpdate update;
    update.nonce = validator.sentNonce;
    update.messageID = warp_.SendWarpMessage(payload);
    pendingMessages_[validationID] = payload;

    Event event(EventType::InitiatedValidatorWeightUpdate);
    event.validationID = validationID;
    event.nonce = update.nonce;
    event.messageID = update.messageID;
    event.weight = newWeight;
    events.push_back(event);
    return update;
}

std::optional<WeightUpdate> ValidatorManager::InitiateValidatorWeightUpdate(
    const Address& caller, const Hash256& validationID, Weight newWeight,
    ManagerState& state) {
    std::vector<Event> events;
    auto update = InitiateValidatorWeightUpdate(caller, validationID, newWeight, events, state);
    EmitEvents(events);
    return update;
}

std::optional<WeightUpdate> ValidatorManager::InitiateValidatorWeightUpdate(
    const Address& caller, const Hash256& validationID, Weight newWeight,
    std::vector<Event>& events, ManagerState& state) {
    std::optional<WeightUpdate> update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckOwner(caller, state)) {
            LogRejection("InitiateValidatorWeightUpdate", state);
            return std::nullopt;
        }
        auto it = validators_.find(validationID);
        if (it == validators_.end() || it->second.status != ValidatorStatus::Active) {
            ValidatorStatus status =
                it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
            state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                          ValidatorStatusToString(status));
            LogRejection("InitiateValidatorWeightUpdate", state);
            return std::nullopt;
        }
        Weight oldWeight = it->second.weight;
        update = InitiateWeightUpdateLocked(validationID, it->second, newWeight, events, state);
        if (!update) {
            LogRejection("InitiateValidatorWeightUpdate", state);
            return std::nullopt;
        }
        LOG_INFO(LogCategory::VALIDATOR) << "Weight update " << validationID.ToShortHex()
                                         << " " << oldWeight << " -> " << newWeight
                                         << " (nonce " << update->nonce << ")";
    }
    return update;
}

std::optional<WeightAck> ValidatorManager::VerifyWeightUpdateLocked(uint32_t messageIndex,
                                                                    ManagerState& state) const {
    auto message = GetPChainWarpMessage(warp_, messageIndex, state);
    if (!message) return std::nullopt;
    auto ack = UnpackL1ValidatorWeightMessage(message->payload, state);
    if (!ack) return std::nullopt;

    auto it = validators_.find(ack->validationID);
    ValidatorStatus status = it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
    if (status != ValidatorStatus::Active && status != ValidatorStatus::PendingRemoved) {
        state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                      ValidatorStatusToString(status));
        return std::nullopt;
    }
    // A later nonce implies every earlier one, so any nonce up to the last
    // sent is acceptable
    if (ack->nonce > it->second.sentNonce) {
        state.Invalid(ErrorCode::InvalidNonce, ack->nonce, "nonce never sent");
        return std::nullopt;
    }
    return WeightAck{ack->validationID, ack->nonce, ack->weight};
}

std::optional<WeightAck> ValidatorManager::VerifyValidatorWeightUpdate(uint32_t messageIndex,
                                                                       ManagerState& state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return VerifyWeightUpdateLocked(messageIndex, state);
}

std::optional<WeightAck> ValidatorManager::CompleteValidatorWeightUpdate(const Address& caller,
                                                                        uint32_t messageIndex,
                                                                        ManagerState& state) {
    std::vector<Event> events;
    auto ack = CompleteValidatorWeightUpdate(caller, messageIndex, events, state);
    EmitEvents(events);
    return ack;
}

std::optional<WeightAck> ValidatorManager::CompleteValidatorWeightUpdate(
    const Address& caller, uint32_t messageIndex, std::vector<Event>& events,
    ManagerState& state) {
    std::optional<WeightAck> ack;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CheckOwner(caller, state)) {
            LogRejection("CompleteValidatorWeightUpdate", state);
            return std::nullopt;
        }
        ack = VerifyWeightUpdateLocked(messageIndex, state);
        if (!ack) {
            LogRejection("CompleteValidatorWeightUpdate", state);
            return std::nullopt;
        }
        Validator& v = validators_[ack->validationID];
        if (ack->nonce > v.receivedNonce) {
            v.receivedNonce = ack->nonce;
        }
        if (v.receivedNonce >= v.sentNonce) {
            pendingMessages_.erase(ack->validationID);
        }

        Event event(EventType::CompletedValidatorWeightUpdate);
        event.validationID = ack->validationID;
        event.nonce = ack->nonce;
        event.weight = ack->weight;
        events.push_back(event);

        LOG_DEBUG(LogCategory::VALIDATOR) << "Weight acknowledged " << ack->validationID.ToShortHex()
                                          << " nonce " << ack->nonce
                                          << " (received " << v.receivedNonce
                                          << "/" << v.sentNonce << ")";
    }
    return ack;
}

std::optional<Bytes> ValidatorManager::ResendValidatorWeightMessage(const Hash256& validationID,
                                                                    ManagerState& state) {
    Bytes payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = validators_.find(validationID);
        ValidatorStatus status =
            it == validators_.end() ? ValidatorStatus::Unknown : it->second.status;
        if (status != ValidatorStatus::Active && status != ValidatorStatus::PendingRemoved) {
            state.Invalid(ErrorCode::InvalidValidatorStatus, static_cast<uint64_t>(status),
                          ValidatorStatusToString(status));
            LogRejection("ResendValidatorWeightMessage", state);
            return std::nullopt;
        }
        if (it->second.sentNonce == 0) {
            state.Invalid(ErrorCode::InvalidNonce, 0, "no weight update sent");
            LogRejection("ResendValidatorWeightMessage", state);
            return std::nullopt;
        }
        auto pending = pendingMessages_.find(validationID);
        if (pending != pendingMessages_.end()) {
            payload = pending->second;
        } else {
            payload = PackL1ValidatorWeightMessage(
                {validationID, it->second.sentNonce, it->second.weight});
        }
        warp_.SendWarpMessage(payload);
    }
    LOG_DEBUG(LogCategory::WARP) << "Resent weight message for " << validationID.ToShortHex();
    return payload;
}

// ============================================================================
// Ownership
// ============================================================================

bool ValidatorManager::CheckOwner(const Address& caller, ManagerState& state) const {
    if (caller != owner_) {
        return state.Invalid(ErrorCode::UnauthorizedOwner, 0,
                             permissionless_ ? "caller is not the staking manager"
                                             : "caller is not the owner");
    }
    return true;
}

bool ValidatorManager::TransferOwnership(const Address& caller, const Address& newOwner,
                                         ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CheckOwner(caller, state)) {
        LogRejection("TransferOwnership", state);
        return false;
    }
    if (permissionless_) {
        state.Invalid(ErrorCode::UnauthorizedOwner, 0, "ownership fixed after migration");
        LogRejection("TransferOwnership", state);
        return false;
    }
    if (newOwner.IsNull()) {
        state.Invalid(ErrorCode::InvalidOwnerAddress, 0, "zero owner address");
        LogRejection("TransferOwnership", state);
        return false;
    }
    owner_ = newOwner;
    LOG_INFO(LogCategory::VALIDATOR) << "Ownership transferred to " << newOwner.ToShortHex();
    return true;
}

bool ValidatorManager::MigrateToPermissionless(const Address& caller,
                                               const Address& stakingManager,
                                               ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CheckOwner(caller, state)) {
        LogRejection("MigrateToPermissionless", state);
        return false;
    }
    if (permissionless_) {
        state.Invalid(ErrorCode::InvalidInitializationStatus, 0, "already migrated");
        LogRejection("MigrateToPermissionless", state);
        return false;
    }
    if (stakingManager.IsNull()) {
        state.Invalid(ErrorCode::InvalidOwnerAddress, 0, "zero staking manager address");
        LogRejection("MigrateToPermissionless", state);
        return false;
    }
    owner_ = stakingManager;
    permissionless_ = true;
    LOG_INFO(LogCategory::VALIDATOR) << "Migrated to staking manager "
                                     << stakingManager.ToShortHex();
    return true;
}

bool ValidatorManager::MigrateFromV1(const Address& caller, const Hash256& validationID,
                                     uint64_t receivedNonce, ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CheckOwner(caller, state)) {
        LogRejection("MigrateFromV1", state);
        return false;
    }
    auto legacy = legacyValidators_.find(validationID);
    if (legacy == legacyValidators_.end() ||
        legacy->second.status == ValidatorStatus::Unknown) {
        state.Invalid(ErrorCode::InvalidValidationID, 0, validationID.ToHex());
        LogRejection("MigrateFromV1", state);
        return false;
    }
    const LegacyValidator& old = legacy->second;
    if (receivedNonce > old.messageNonce) {
        state.Invalid(ErrorCode::InvalidNonce, receivedNonce,
                      "received nonce above sent nonce " + std::to_string(old.messageNonce));
        LogRejection("MigrateFromV1", state);
        return false;
    }
    if (validators_.count(validationID)) {
        state.Invalid(ErrorCode::InvalidValidationID, 0,
                      "validation ID already in use: " + validationID.ToHex());
        LogRejection("MigrateFromV1", state);
        return false;
    }

    Validator v;
    v.status = old.status;
    v.nodeID = old.nodeID;
    v.startingWeight = old.startingWeight;
    v.sentNonce = old.messageNonce;
    v.receivedNonce = receivedNonce;
    v.weight = old.weight;
    v.startTime = old.startedAt;
    v.endTime = old.endedAt;
    validators_[validationID] = v;
    legacyValidators_.erase(legacy);

    LOG_INFO(LogCategory::VALIDATOR) << "Migrated legacy validation " << validationID.ToShortHex()
                                     << " (" << ValidatorStatusToString(v.status)
                                     << ", nonce " << receivedNonce << "/" << v.sentNonce << ")";
    return true;
}

Address ValidatorManager::GetOwner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

bool ValidatorManager::IsPermissionless() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permissionless_;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Validator> ValidatorManager::GetValidator(const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = validators_.find(validationID);
    if (it == validators_.end()) return std::nullopt;
    return it->second;
}

std::optional<LegacyValidator> ValidatorManager::GetLegacyValidator(
    const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = legacyValidators_.find(validationID);
    if (it == legacyValidators_.end()) return std::nullopt;
    return it->second;
}

std::optional<Hash256> ValidatorManager::GetNodeValidationID(const NodeID& nodeID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodeIndex_.find(nodeID);
    if (it == nodeIndex_.end()) return std::nullopt;
    return it->second;
}

Weight ValidatorManager::L1TotalWeight() const {
    return churn_.GetTotalWeight();
}

ChurnPeriod ValidatorManager::GetChurnPeriod() const {
    return churn_.GetPeriod();
}

std::optional<Bytes> ValidatorManager::GetPendingMessage(const Hash256& validationID) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pendingMessages_.find(validationID);
    if (it == pendingMessages_.end()) return std::nullopt;
    return it->second;
}

bool ValidatorManager::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

size_t ValidatorManager::ValidatorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.size();
}

void ValidatorManager::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

void ValidatorManager::EmitEvents(const std::vector<Event>& events) {
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = eventCallback_;
    }
    for (const auto& event : events) {
        LOG_TRACE(LogCategory::VALIDATOR) << event.ToString();
        if (callback) {
            callback(event);
        }
    }
}

// ============================================================================
// Persistence
// ============================================================================

ValidatorManagerSnapshot ValidatorManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ValidatorManagerSnapshot snapshot;
    snapshot.initialized = initialized_;
    snapshot.owner = owner_;
    snapshot.permissionless = permissionless_;
    snapshot.churn = churn_.GetPeriod();
    snapshot.validators = validators_;
    snapshot.pendingMessages = pendingMessages_;
    snapshot.legacyValidators = legacyValidators_;
    return snapshot;
}

void ValidatorManager::Restore(const ValidatorManagerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = snapshot.initialized;
    owner_ = snapshot.owner;
    permissionless_ = snapshot.permissionless;
    churn_.Restore(snapshot.churn);
    validators_ = snapshot.validators;
    pendingMessages_ = snapshot.pendingMessages;
    legacyValidators_ = snapshot.legacyValidators;

    // Legacy records still hold their node IDs until migrated
    nodeIndex_.clear();
    for (const auto& [validationID, v] : legacyValidators_) {
        if (IsLive(v.status)) {
            nodeIndex_[v.nodeID] = validationID;
        }
    }
    for (const auto& [validationID, v] : validators_) {
        if (IsLive(v.status)) {
            nodeIndex_[v.nodeID] = validationID;
        }
    }
    LOG_INFO(LogCategory::VALIDATOR) << "Restored " << validators_.size() << " validators, "
                                     << legacyValidators_.size() << " legacy";
}

} // namespace validator
} // namespace valset
