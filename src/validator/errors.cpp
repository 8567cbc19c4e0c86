// VALSET - Validator Manager Errors Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/errors.h>

#include <sstream>

namespace valset {
namespace validator {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidBLSKeyLength: return "InvalidBLSKeyLength";
        case ErrorCode::InvalidNodeID: return "InvalidNodeID";
        case ErrorCode::InvalidRegistrationExpiry: return "InvalidRegistrationExpiry";
        case ErrorCode::InvalidPChainOwnerThreshold: return "InvalidPChainOwnerThreshold";
        case ErrorCode::PChainOwnerAddressesNotSorted: return "PChainOwnerAddressesNotSorted";
        case ErrorCode::InvalidMaximumChurnPercentage: return "InvalidMaximumChurnPercentage";
        case ErrorCode::InvalidDelegationFee: return "InvalidDelegationFee";
        case ErrorCode::InvalidStakeAmount: return "InvalidStakeAmount";
        case ErrorCode::InvalidStakeMultiplier: return "InvalidStakeMultiplier";
        case ErrorCode::InvalidMinStakeDuration: return "InvalidMinStakeDuration";
        case ErrorCode::ZeroWeightToValueFactor: return "ZeroWeightToValueFactor";
        case ErrorCode::InvalidUptimeBlockchainID: return "InvalidUptimeBlockchainID";
        case ErrorCode::InvalidRewardRecipient: return "InvalidRewardRecipient";
        case ErrorCode::InvalidOwnerAddress: return "InvalidOwnerAddress";
        case ErrorCode::InvalidInitializationStatus: return "InvalidInitializationStatus";
        case ErrorCode::NodeAlreadyRegistered: return "NodeAlreadyRegistered";
        case ErrorCode::InvalidValidationID: return "InvalidValidationID";
        case ErrorCode::InvalidDelegationID: return "InvalidDelegationID";
        case ErrorCode::InvalidValidatorStatus: return "InvalidValidatorStatus";
        case ErrorCode::InvalidDelegatorStatus: return "InvalidDelegatorStatus";
        case ErrorCode::InvalidNonce: return "InvalidNonce";
        case ErrorCode::UnexpectedRegistrationStatus: return "UnexpectedRegistrationStatus";
        case ErrorCode::UnexpectedValidationID: return "UnexpectedValidationID";
        case ErrorCode::ValidatorNotPoS: return "ValidatorNotPoS";
        case ErrorCode::MaxWeightExceeded: return "MaxWeightExceeded";
        case ErrorCode::MinStakeDurationNotPassed: return "MinStakeDurationNotPassed";
        case ErrorCode::ValidatorIneligibleForRewards: return "ValidatorIneligibleForRewards";
        case ErrorCode::DelegatorIneligibleForRewards: return "DelegatorIneligibleForRewards";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::MaxChurnRateExceeded: return "MaxChurnRateExceeded";
        case ErrorCode::InvalidTotalWeight: return "InvalidTotalWeight";
        case ErrorCode::UnauthorizedOwner: return "UnauthorizedOwner";
        case ErrorCode::InvalidWarpMessage: return "InvalidWarpMessage";
        case ErrorCode::InvalidWarpSourceChainID: return "InvalidWarpSourceChainID";
        case ErrorCode::InvalidWarpOriginSenderAddress: return "InvalidWarpOriginSenderAddress";
        case ErrorCode::InvalidValidatorManagerBlockchainID: return "InvalidValidatorManagerBlockchainID";
        case ErrorCode::InvalidValidatorManagerAddress: return "InvalidValidatorManagerAddress";
        case ErrorCode::InvalidConversionID: return "InvalidConversionID";
        case ErrorCode::InvalidCodecID: return "InvalidCodecID";
        case ErrorCode::InvalidMessageType: return "InvalidMessageType";
        case ErrorCode::InvalidMessageLength: return "InvalidMessageLength";
        default: return "Unknown";
    }
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InputValidation: return "input-validation";
        case ErrorKind::StateConflict: return "state-conflict";
        case ErrorKind::ChurnLimit: return "churn-limit";
        case ErrorKind::Authorization: return "authorization";
        case ErrorKind::ExternalMessage: return "external-message";
        default: return "unknown";
    }
}

ErrorKind ErrorKindOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorKind::None;
        case ErrorCode::InvalidBLSKeyLength:
        case ErrorCode::InvalidNodeID:
        case ErrorCode::InvalidRegistrationExpiry:
        case ErrorCode::InvalidPChainOwnerThreshold:
        case ErrorCode::PChainOwnerAddressesNotSorted:
        case ErrorCode::InvalidMaximumChurnPercentage:
        case ErrorCode::InvalidDelegationFee:
        case ErrorCode::InvalidStakeAmount:
        case ErrorCode::InvalidStakeMultiplier:
        case ErrorCode::InvalidMinStakeDuration:
        case ErrorCode::ZeroWeightToValueFactor:
        case ErrorCode::InvalidUptimeBlockchainID:
        case ErrorCode::InvalidRewardRecipient:
        case ErrorCode::InvalidOwnerAddress:
            return ErrorKind::InputValidation;
        case ErrorCode::InvalidInitializationStatus:
        case ErrorCode::NodeAlreadyRegistered:
        case ErrorCode::InvalidValidationID:
        case ErrorCode::InvalidDelegationID:
        case ErrorCode::InvalidValidatorStatus:
        case ErrorCode::InvalidDelegatorStatus:
        case ErrorCode::InvalidNonce:
        case ErrorCode::UnexpectedRegistrationStatus:
        case ErrorCode::UnexpectedValidationID:
        case ErrorCode::ValidatorNotPoS:
        case ErrorCode::MaxWeightExceeded:
        case ErrorCode::MinStakeDurationNotPassed:
        case ErrorCode::ValidatorIneligibleForRewards:
        case ErrorCode::DelegatorIneligibleForRewards:
        case ErrorCode::InsufficientBalance:
            return ErrorKind::StateConflict;
        case ErrorCode::MaxChurnRateExceeded:
        case ErrorCode::InvalidTotalWeight:
            return ErrorKind::ChurnLimit;
        case ErrorCode::UnauthorizedOwner:
            return ErrorKind::Authorization;
        case ErrorCode::InvalidWarpMessage:
        case ErrorCode::InvalidWarpSourceChainID:
        case ErrorCode::InvalidWarpOriginSenderAddress:
        case ErrorCode::InvalidValidatorManagerBlockchainID:
        case ErrorCode::InvalidValidatorManagerAddress:
        case ErrorCode::InvalidConversionID:
        case ErrorCode::InvalidCodecID:
        case ErrorCode::InvalidMessageType:
        case ErrorCode::InvalidMessageLength:
            return ErrorKind::ExternalMessage;
    }
    return ErrorKind::None;
}

std::string ManagerState::ToString() const {
    if (IsValid()) {
        return "valid";
    }
    std::ostringstream oss;
    oss << ErrorCodeToString(code_) << "(" << value_ << ")";
    if (!debugMessage_.empty()) {
        oss << ": " << debugMessage_;
    }
    return oss.str();
}

} // namespace validator
} // namespace valset
