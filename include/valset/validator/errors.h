// VALSET - Validator Manager Errors
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Rejection codes shared by the validator manager, the staking manager and
// the message codec. Every rejected operation leaves state untouched and
// reports one ErrorCode together with the value that violated the check.

#ifndef VALSET_VALIDATOR_ERRORS_H
#define VALSET_VALIDATOR_ERRORS_H

#include <cstdint>
#include <string>

namespace valset {
namespace validator {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    None = 0,

    // Input validation
    InvalidBLSKeyLength,
    InvalidNodeID,
    InvalidRegistrationExpiry,
    InvalidPChainOwnerThreshold,
    PChainOwnerAddressesNotSorted,
    InvalidMaximumChurnPercentage,
    InvalidDelegationFee,
    InvalidStakeAmount,
    InvalidStakeMultiplier,
    InvalidMinStakeDuration,
    ZeroWeightToValueFactor,
    InvalidUptimeBlockchainID,
    InvalidRewardRecipient,
    InvalidOwnerAddress,

    // State conflict
    InvalidInitializationStatus,
    NodeAlreadyRegistered,
    InvalidValidationID,
    InvalidDelegationID,
    InvalidValidatorStatus,
    InvalidDelegatorStatus,
    InvalidNonce,
    UnexpectedRegistrationStatus,
    UnexpectedValidationID,
    ValidatorNotPoS,
    MaxWeightExceeded,
    MinStakeDurationNotPassed,
    ValidatorIneligibleForRewards,
    DelegatorIneligibleForRewards,
    InsufficientBalance,

    // Churn limit
    MaxChurnRateExceeded,
    InvalidTotalWeight,

    // Authorization
    UnauthorizedOwner,

    // External message
    InvalidWarpMessage,
    InvalidWarpSourceChainID,
    InvalidWarpOriginSenderAddress,
    InvalidValidatorManagerBlockchainID,
    InvalidValidatorManagerAddress,
    InvalidConversionID,
    InvalidCodecID,
    InvalidMessageType,
    InvalidMessageLength,
};

/// Broad class of a rejection, telling the caller how to react
enum class ErrorKind {
    None,
    InputValidation,   ///< Caller-fixable argument problem
    StateConflict,     ///< Caller's view of state is stale; re-query
    ChurnLimit,        ///< Retry once the churn window has room
    Authorization,     ///< Wrong identity for this operation
    ExternalMessage,   ///< Proof is unusable; obtain a fresh one
};

const char* ErrorCodeToString(ErrorCode code);
const char* ErrorKindToString(ErrorKind kind);
ErrorKind ErrorKindOf(ErrorCode code);

// ============================================================================
// ManagerState
// ============================================================================

/// Outcome of a manager operation.
///
/// Operations take a ManagerState& and return false (or std::nullopt) after
/// calling Invalid(). The value carries the offending quantity: the current
/// status, nonce, weight, churn amount or length, depending on the code.
class ManagerState {
public:
    bool IsValid() const { return code_ == ErrorCode::None; }
    bool IsInvalid() const { return code_ != ErrorCode::None; }

    ErrorCode GetCode() const { return code_; }
    ErrorKind GetKind() const { return ErrorKindOf(code_); }
    uint64_t GetValue() const { return value_; }
    const std::string& GetDebugMessage() const { return debugMessage_; }

    /// Record a rejection; always returns false
    bool Invalid(ErrorCode code, uint64_t value = 0,
                 const std::string& debugMessage = "") {
        code_ = code;
        value_ = value;
        debugMessage_ = debugMessage;
        return false;
    }

    void Clear() {
        code_ = ErrorCode::None;
        value_ = 0;
        debugMessage_.clear();
    }

    /// "MaxChurnRateExceeded(150): churn window full"
    std::string ToString() const;

private:
    ErrorCode code_ = ErrorCode::None;
    uint64_t value_ = 0;
    std::string debugMessage_;
};

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_ERRORS_H
