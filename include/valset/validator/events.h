// VALSET - Validator Set Events
// Copyright (c) 2024 VALSET Developers
// MIT License

#ifndef VALSET_VALIDATOR_EVENTS_H
#define VALSET_VALIDATOR_EVENTS_H

#include <valset/core/types.h>

#include <functional>
#include <string>

namespace valset {
namespace validator {

enum class EventType {
    RegisteredInitialValidator,
    InitiatedValidatorRegistration,
    CompletedValidatorRegistration,
    InitiatedValidatorRemoval,
    CompletedValidatorRemoval,
    InitiatedValidatorWeightUpdate,
    CompletedValidatorWeightUpdate,
    InitiatedDelegatorRegistration,
    CompletedDelegatorRegistration,
    InitiatedDelegatorRemoval,
    CompletedDelegatorRemoval,
    UptimeUpdated,
};

const char* EventTypeToString(EventType type);

/// A state transition observed by relayers. Only the fields relevant to
/// `type` are set; the rest stay zero.
struct Event {
    EventType type;
    Hash256 validationID;
    Hash256 delegationID;
    Hash160 nodeID;
    Hash256 messageID;       ///< Outbound message, for Initiated* events
    uint64_t nonce{0};
    Weight weight{0};        ///< Validator weight after the change
    Weight delegatorWeight{0};
    Timestamp timestamp{0};  ///< Start, end or expiry time, per event
    uint64_t uptime{0};
    Amount rewards{0};
    Amount fees{0};
    Address account;         ///< Delegator owner
    Address rewardRecipient;

    explicit Event(EventType t) : type(t) {}

    std::string ToString() const;
};

using EventCallback = std::function<void(const Event&)>;

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_EVENTS_H
