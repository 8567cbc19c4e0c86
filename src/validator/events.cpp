// VALSET - Validator Set Events Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/events.h>

#include <sstream>

namespace valset {
namespace validator {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::RegisteredInitialValidator: return "RegisteredInitialValidator";
        case EventType::InitiatedValidatorRegistration: return "InitiatedValidatorRegistration";
        case EventType::CompletedValidatorRegistration: return "CompletedValidatorRegistration";
        case EventType::InitiatedValidatorRemoval: return "InitiatedValidatorRemoval";
        case EventType::CompletedValidatorRemoval: return "CompletedValidatorRemoval";
        case EventType::InitiatedValidatorWeightUpdate: return "InitiatedValidatorWeightUpdate";
        case EventType::CompletedValidatorWeightUpdate: return "CompletedValidatorWeightUpdate";
        case EventType::InitiatedDelegatorRegistration: return "InitiatedDelegatorRegistration";
        case EventType::CompletedDelegatorRegistration: return "CompletedDelegatorRegistration";
        case EventType::InitiatedDelegatorRemoval: return "InitiatedDelegatorRemoval";
        case EventType::CompletedDelegatorRemoval: return "CompletedDelegatorRemoval";
        case EventType::UptimeUpdated: return "UptimeUpdated";
        default: return "Unknown";
    }
}

std::string Event::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type) << "{validation=" << validationID.ToShortHex();
    if (!delegationID.IsNull()) {
        oss << " delegation=" << delegationID.ToShortHex();
    }
    if (nonce != 0) {
        oss << " nonce=" << nonce;
    }
    oss << " weight=" << weight << "}";
    return oss.str();
}

} // namespace validator
} // namespace valset
