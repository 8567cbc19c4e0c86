// VALSET - Cross-Chain Message Codec
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Pack/unpack of the P-Chain validator messages. All integers are
// big-endian; every message starts with a uint16 codec ID (0) followed by
// a uint32 type ID.
//
//   type 0  SubnetToL1Conversion   conversionID[32]
//   type 0  ValidationUptime       validationID[32] uptime:u64
//   type 1  RegisterL1Validator    subnetID[32] nodeID(u32 len + bytes)
//                                  bls[48] expiry:u64 owner owner weight:u64
//   type 2  L1ValidatorRegistration validationID[32] valid:u8
//   type 3  L1ValidatorWeight      validationID[32] nonce:u64 weight:u64
//
// A P-Chain owner is threshold:u32 count:u32 followed by 20-byte addresses.

#ifndef VALSET_VALIDATOR_MESSAGES_H
#define VALSET_VALIDATOR_MESSAGES_H

#include <valset/core/types.h>
#include <valset/validator/errors.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace valset {
namespace validator {

/// Node identifier (20 bytes)
using NodeID = Hash160;

// ============================================================================
// Wire Constants
// ============================================================================

constexpr uint16_t CODEC_ID = 0;

constexpr size_t NODE_ID_LENGTH = 20;
constexpr size_t BLS_PUBLIC_KEY_LENGTH = 48;
constexpr size_t ADDRESS_LENGTH = 20;

namespace MessageTypeID {
    constexpr uint32_t SUBNET_TO_L1_CONVERSION = 0;
    constexpr uint32_t VALIDATION_UPTIME = 0;
    constexpr uint32_t REGISTER_L1_VALIDATOR = 1;
    constexpr uint32_t L1_VALIDATOR_REGISTRATION = 2;
    constexpr uint32_t L1_VALIDATOR_WEIGHT = 3;
}

// ============================================================================
// Message Types
// ============================================================================

/// Multisig owner on the P-Chain (remaining-balance or disable owner)
struct PChainOwner {
    uint32_t threshold{0};
    std::vector<Address> addresses;

    bool operator==(const PChainOwner& o) const {
        return threshold == o.threshold && addresses == o.addresses;
    }
};

struct InitialValidator {
    Bytes nodeID;
    Bytes blsPublicKey;
    Weight weight{0};
};

/// Validator set the P-Chain installed when the subnet was converted to an L1
struct ConversionData {
    Hash256 subnetID;
    Hash256 validatorManagerBlockchainID;
    Address validatorManagerAddress;
    std::vector<InitialValidator> initialValidators;
};

struct RegisterL1ValidatorMessage {
    Hash256 subnetID;
    Bytes nodeID;
    Bytes blsPublicKey;
    uint64_t registrationExpiry{0};
    PChainOwner remainingBalanceOwner;
    PChainOwner disableOwner;
    Weight weight{0};
};

struct L1ValidatorRegistrationMessage {
    Hash256 validationID;
    bool valid{false};
};

struct L1ValidatorWeightMessage {
    Hash256 validationID;
    uint64_t nonce{0};
    Weight weight{0};
};

struct ValidationUptimeMessage {
    Hash256 validationID;
    uint64_t uptime{0};
};

// ============================================================================
// Codec
// ============================================================================

/// Canonical packing of the conversion data; its SHA-256 is the conversionID
Bytes PackConversionData(const ConversionData& data);

/// sha256(PackConversionData(data))
Hash256 ConversionID(const ConversionData& data);

/// validationID of the initial validator at `index`: sha256(subnetID || u32 index)
Hash256 InitialValidationID(const Hash256& subnetID, uint32_t index);

Bytes PackSubnetToL1ConversionMessage(const Hash256& conversionID);
std::optional<Hash256> UnpackSubnetToL1ConversionMessage(const Bytes& input,
                                                          ManagerState& state);

Bytes PackRegisterL1ValidatorMessage(const RegisterL1ValidatorMessage& msg);
std::optional<RegisterL1ValidatorMessage> UnpackRegisterL1ValidatorMessage(
    const Bytes& input, ManagerState& state);

Bytes PackL1ValidatorRegistrationMessage(const L1ValidatorRegistrationMessage& msg);
std::optional<L1ValidatorRegistrationMessage> UnpackL1ValidatorRegistrationMessage(
    const Bytes& input, ManagerState& state);

Bytes PackL1ValidatorWeightMessage(const L1ValidatorWeightMessage& msg);
std::optional<L1ValidatorWeightMessage> UnpackL1ValidatorWeightMessage(
    const Bytes& input, ManagerState& state);

Bytes PackValidationUptimeMessage(const ValidationUptimeMessage& msg);
std::optional<ValidationUptimeMessage> UnpackValidationUptimeMessage(
    const Bytes& input, ManagerState& state);

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_MESSAGES_H
