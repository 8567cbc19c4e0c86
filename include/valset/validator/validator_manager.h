// VALSET - Validator Manager
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Lifecycle state machine for the validators of an L1. Changes are made in
// two phases: an Initiate* call updates local state and emits a message for
// the P-Chain, and a Complete* call later consumes the P-Chain's signed
// acknowledgement. Weight changes are rate-limited by a ChurnTracker.
//
//   PendingAdded -> Active -> PendingRemoved -> Completed
//   PendingAdded -> Invalidated

#ifndef VALSET_VALIDATOR_VALIDATOR_MANAGER_H
#define VALSET_VALIDATOR_VALIDATOR_MANAGER_H

#include <valset/core/types.h>
#include <valset/validator/churn.h>
#include <valset/validator/errors.h>
#include <valset/validator/events.h>
#include <valset/validator/messages.h>
#include <valset/validator/warp.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace valset {
namespace validator {

// ============================================================================
// Constants
// ============================================================================

/// Registration expiry must lie strictly inside (now, now + 2 days)
constexpr uint64_t MAXIMUM_REGISTRATION_EXPIRY_LENGTH = 2 * 24 * 60 * 60;

// ============================================================================
// Validator Record
// ============================================================================

enum class ValidatorStatus : uint8_t {
    Unknown = 0,
    PendingAdded = 1,      ///< Registration sent, not yet acknowledged
    Active = 2,            ///< Registered on the P-Chain
    PendingRemoved = 3,    ///< Weight 0 sent, waiting for the end of the validation
    Completed = 4,         ///< Validation ended
    Invalidated = 5,       ///< P-Chain refused the registration
};

/// Status name for logs and error messages
const char* ValidatorStatusToString(ValidatorStatus status);

/// True for Completed and Invalidated
inline bool IsTerminal(ValidatorStatus status) {
    return status == ValidatorStatus::Completed || status == ValidatorStatus::Invalidated;
}

/// One validator's tenure, keyed by validationID
struct Validator {
    ValidatorStatus status{ValidatorStatus::Unknown};
    NodeID nodeID;
    Weight startingWeight{0};    ///< Weight at registration
    uint64_t sentNonce{0};       ///< Highest weight-update nonce issued
    uint64_t receivedNonce{0};   ///< Highest nonce acknowledged by the P-Chain
    Weight weight{0};            ///< Current local weight
    Timestamp startTime{0};      ///< When the validator became Active
    Timestamp endTime{0};        ///< When removal began, or when it was invalidated
};

/**
 * A validation recorded by the previous manager version. It keeps a single
 * message nonce instead of separate sent/received nonces and is carried into
 * the current record layout by MigrateFromV1.
 */
struct LegacyValidator {
    ValidatorStatus status{ValidatorStatus::Unknown};
    NodeID nodeID;
    Weight startingWeight{0};
    uint64_t messageNonce{0};    ///< Last weight-update nonce sent
    Weight weight{0};
    Timestamp startedAt{0};
    Timestamp endedAt{0};
};

// ============================================================================
// Inputs and Results
// ============================================================================

struct ValidatorManagerSettings {
    /// Initial owner allowed to call privileged operations
    Address admin;
    /// Subnet converted into this L1
    Hash256 subnetID;
    /// Length of one churn window
    uint64_t churnPeriodSeconds{0};
    /// Share of the window's initial weight that may change per window, 1-20
    uint8_t maximumChurnPercentage{0};
    /// This manager's address as recorded in the conversion data
    Address managerAddress;
};

/// Everything the P-Chain needs to register a validator, except its weight
struct ValidatorRegistrationInput {
    Bytes nodeID;                       ///< 20 bytes, non-zero
    Bytes blsPublicKey;                 ///< 48 bytes
    uint64_t registrationExpiry{0};     ///< P-Chain drops the request after this time
    PChainOwner remainingBalanceOwner;  ///< Receives the leftover P-Chain balance
    PChainOwner disableOwner;           ///< May disable the validator on the P-Chain
};

/// Result of initiating a weight change
struct WeightUpdate {
    uint64_t nonce{0};
    Hash256 messageID;
};

/// A verified L1ValidatorWeight acknowledgement
struct WeightAck {
    Hash256 validationID;
    uint64_t nonce{0};
    Weight weight{0};
};

/// A verified removal acknowledgement and the status it leads to
struct RemovalAck {
    Hash256 validationID;
    ValidatorStatus newStatus{ValidatorStatus::Unknown};
};

/// Everything needed to rebuild a manager
struct ValidatorManagerSnapshot {
    bool initialized{false};
    Address owner;
    bool permissionless{false};
    ChurnPeriod churn;
    std::map<Hash256, Validator> validators;
    std::map<Hash256, Bytes> pendingMessages;
    /// Records of the previous version not yet migrated
    std::map<Hash256, LegacyValidator> legacyValidators;
};

// ============================================================================
// Validator Manager
// ============================================================================

/**
 * Owns the validator set of one L1.
 *
 * Every operation is serialized by an internal mutex. A rejected operation
 * returns false or std::nullopt, describes the failure in `state` and leaves
 * the manager untouched.
 *
 * Operations that change state come in two forms. The plain form emits its
 * events to the registered callback once the mutex is released. The form
 * taking an event vector appends the events instead, so a caller holding
 * its own lock can deliver them later through EmitEvents.
 */
class ValidatorManager {
public:
    /// Throws std::invalid_argument when the settings are rejected by CheckSettings
    ValidatorManager(const ValidatorManagerSettings& settings, IWarpMessenger& warp);

    ValidatorManager(const ValidatorManager&) = delete;
    ValidatorManager& operator=(const ValidatorManager&) = delete;

    /// Validate churn settings and the admin address
    static bool CheckSettings(const ValidatorManagerSettings& settings, ManagerState& state);

    // ========================================================================
    // Initial Validator Set
    // ========================================================================

    /// One-time bootstrap from the conversion data the P-Chain committed to.
    /// `messageIndex` must hold the P-Chain's SubnetToL1Conversion message
    /// whose conversionID equals sha256 of the packed data. All-or-nothing.
    bool InitializeValidatorSet(const ConversionData& data, uint32_t messageIndex,
                                ManagerState& state);

    // ========================================================================
    // Registration
    // ========================================================================

    /// Owner only. Returns the new validationID.
    std::optional<Hash256> InitiateValidatorRegistration(const Address& caller,
                                                         const ValidatorRegistrationInput& input,
                                                         Weight weight,
                                                         ManagerState& state);
    std::optional<Hash256> InitiateValidatorRegistration(const Address& caller,
                                                         const ValidatorRegistrationInput& input,
                                                         Weight weight,
                                                         std::vector<Event>& events,
                                                         ManagerState& state);

    /// Owner only. Consume an L1ValidatorRegistration(valid=true) acknowledgement.
    std::optional<Hash256> CompleteValidatorRegistration(const Address& caller,
                                                         uint32_t messageIndex,
                                                         ManagerState& state);
    std::optional<Hash256> CompleteValidatorRegistration(const Address& caller,
                                                         uint32_t messageIndex,
                                                         std::vector<Event>& events,
                                                         ManagerState& state);

    /// Re-send the cached RegisterL1Validator bytes of a pending registration
    std::optional<Bytes> ResendRegisterValidatorMessage(const Hash256& validationID,
                                                        ManagerState& state);

    // ========================================================================
    // Removal
    // ========================================================================

    /// Owner only. Marks the validator PendingRemoved and sends weight 0.
    bool InitiateValidatorRemoval(const Address& caller, const Hash256& validationID,
                                  ManagerState& state);
    bool InitiateValidatorRemoval(const Address& caller, const Hash256& validationID,
                                  std::vector<Event>& events, ManagerState& state);

    /// Owner only. Consume an L1ValidatorRegistration(valid=false)
    /// acknowledgement. Ends a PendingRemoved validator (Completed) or
    /// rejects a PendingAdded one (Invalidated), freeing the nodeID either way.
    std::optional<Hash256> CompleteValidatorRemoval(const Address& caller,
                                                    uint32_t messageIndex,
                                                    ManagerState& state);
    std::optional<Hash256> CompleteValidatorRemoval(const Address& caller,
                                                    uint32_t messageIndex,
                                                    std::vector<Event>& events,
                                                    ManagerState& state);

    /// Checks CompleteValidatorRemoval would succeed, without applying it
    std::optional<RemovalAck> VerifyValidatorRemoval(uint32_t messageIndex,
                                                     ManagerState& state) const;

    /// Re-send the weight-0 message of a PendingRemoved validator
    std::optional<Bytes> ResendValidatorRemovalMessage(const Hash256& validationID,
                                                       ManagerState& state);

    // ========================================================================
    // Weight Updates
    // ========================================================================

    /// Owner only; validator must be Active. The new weight takes effect
    /// locally before the P-Chain acknowledges it.
    std::optional<WeightUpdate> InitiateValidatorWeightUpdate(const Address& caller,
                                                              const Hash256& validationID,
                                                              Weight newWeight,
                                                              ManagerState& state);
    std::optional<WeightUpdate> InitiateValidatorWeightUpdate(const Address& caller,
                                                              const Hash256& validationID,
                                                              Weight newWeight,
                                                              std::vector<Event>& events,
                                                              ManagerState& state);

    /// Owner only. Consume an L1ValidatorWeight acknowledgement. Any nonce up
    /// to the last sent one is accepted; receivedNonce never decreases.
    std::optional<WeightAck> CompleteValidatorWeightUpdate(const Address& caller,
                                                           uint32_t messageIndex,
                                                           ManagerState& state);
    std::optional<WeightAck> CompleteValidatorWeightUpdate(const Address& caller,
                                                           uint32_t messageIndex,
                                                           std::vector<Event>& events,
                                                           ManagerState& state);

    /// Checks CompleteValidatorWeightUpdate would succeed, without applying it
    std::optional<WeightAck> VerifyValidatorWeightUpdate(uint32_t messageIndex,
                                                         ManagerState& state) const;

    /// Re-send the latest weight message (sentNonce, weight) of a validator
    std::optional<Bytes> ResendValidatorWeightMessage(const Hash256& validationID,
                                                      ManagerState& state);

    // ========================================================================
    // Ownership
    // ========================================================================

    /// Hand admin rights to another address (owner only, not after migration)
    bool TransferOwnership(const Address& caller, const Address& newOwner,
                           ManagerState& state);

    /// Irreversibly hand control to a staking manager
    bool MigrateToPermissionless(const Address& caller, const Address& stakingManager,
                                 ManagerState& state);

    /**
     * Owner only. Move a validation recorded by the previous manager version
     * into the current layout so it can be updated and removed here.
     *
     * The legacy message nonce becomes sentNonce. `receivedNonce` is the
     * latest nonce the P-Chain acknowledged and may not exceed it. Each
     * legacy record migrates once.
     */
    bool MigrateFromV1(const Address& caller, const Hash256& validationID,
                       uint64_t receivedNonce, ManagerState& state);

    /// Current owner: the admin, or the staking manager after migration
    Address GetOwner() const;

    /// True once MigrateToPermissionless succeeded
    bool IsPermissionless() const;

    // ========================================================================
    // Queries
    // ========================================================================

    /// Validator record, including ended and invalidated ones
    std::optional<Validator> GetValidator(const Hash256& validationID) const;

    /// Legacy record still awaiting MigrateFromV1
    std::optional<LegacyValidator> GetLegacyValidator(const Hash256& validationID) const;

    /// validationID currently holding `nodeID`, if any (registeredValidators)
    std::optional<Hash256> GetNodeValidationID(const NodeID& nodeID) const;

    /// Sum of the local weights of all live validators
    Weight L1TotalWeight() const;

    /// Current churn window
    ChurnPeriod GetChurnPeriod() const;

    /// Last message sent for a validator and not yet fully acknowledged
    std::optional<Bytes> GetPendingMessage(const Hash256& validationID) const;

    /// True once InitializeValidatorSet succeeded
    bool IsInitialized() const;

    /// Number of validator records, terminal ones included
    size_t ValidatorCount() const;

    const ValidatorManagerSettings& GetSettings() const { return settings_; }
    IWarpMessenger& GetWarpMessenger() const { return warp_; }

    // ========================================================================
    // Events
    // ========================================================================

    /// Observer for every committed state transition
    void SetEventCallback(EventCallback callback);

    /// Deliver events collected by the event-vector overloads. Must be
    /// called without holding any lock the callback may need.
    void EmitEvents(const std::vector<Event>& events);

    // ========================================================================
    // Persistence
    // ========================================================================

    ValidatorManagerSnapshot Snapshot() const;

    /// Replace all state; the nodeID index is rebuilt from live validators
    void Restore(const ValidatorManagerSnapshot& snapshot);

private:
    /// Caller must be the current owner
    bool CheckOwner(const Address& caller, ManagerState& state) const;

    /// Threshold within the address count and addresses strictly sorted
    static bool CheckPChainOwner(const PChainOwner& owner, ManagerState& state);

    /// Apply churn, bump sentNonce, send the weight message and record an event
    std::optional<WeightUpdate> InitiateWeightUpdateLocked(const Hash256& validationID,
                                                           Validator& validator,
                                                           Weight newWeight,
                                                           std::vector<Event>& events,
                                                           ManagerState& state);
    std::optional<WeightAck> VerifyWeightUpdateLocked(uint32_t messageIndex,
                                                      ManagerState& state) const;
    std::optional<RemovalAck> VerifyRemovalLocked(uint32_t messageIndex,
                                                  ManagerState& state) const;

    const ValidatorManagerSettings settings_;
    IWarpMessenger& warp_;
    ChurnTracker churn_;

    bool initialized_{false};
    Address owner_;
    bool permissionless_{false};

    std::map<Hash256, Validator> validators_;
    std::map<NodeID, Hash256> nodeIndex_;
    std::map<Hash256, Bytes> pendingMessages_;
    std::map<Hash256, LegacyValidator> legacyValidators_;

    EventCallback eventCallback_;
    mutable std::mutex mutex_;
};

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_VALIDATOR_MANAGER_H
