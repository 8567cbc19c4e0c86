// VALSET - Cross-Chain Message Codec Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/messages.h>
#include <valset/core/serialize.h>
#include <valset/crypto/sha256.h>

namespace valset {
namespace validator {

namespace {

// Fixed message sizes (codec + type + body)
constexpr size_t HEADER_SIZE = 2 + 4;
constexpr size_t CONVERSION_MESSAGE_SIZE = HEADER_SIZE + 32;
constexpr size_t REGISTRATION_MESSAGE_SIZE = HEADER_SIZE + 32 + 1;
constexpr size_t WEIGHT_MESSAGE_SIZE = HEADER_SIZE + 32 + 8 + 8;
constexpr size_t UPTIME_MESSAGE_SIZE = HEADER_SIZE + 32 + 8;

void WriteHeader(DataStream& s, uint32_t typeID) {
    ser_writebe16(s, CODEC_ID);
    ser_writebe32(s, typeID);
}

/// Checks length, codec and type; leaves the stream positioned at the body
bool ReadHeader(DataStream& s, const Bytes& input, size_t expectedSize,
                uint32_t typeID, ManagerState& state) {
    if (expectedSize != 0 && input.size() != expectedSize) {
        return state.Invalid(ErrorCode::InvalidMessageLength, input.size());
    }
    if (input.size() < HEADER_SIZE) {
        return state.Invalid(ErrorCode::InvalidMessageLength, input.size());
    }
    uint16_t codec = ser_readbe16(s);
    if (codec != CODEC_ID) {
        return state.Invalid(ErrorCode::InvalidCodecID, codec);
    }
    uint32_t type = ser_readbe32(s);
    if (type != typeID) {
        return state.Invalid(ErrorCode::InvalidMessageType, type);
    }
    return true;
}

void WriteOwner(DataStream& s, const PChainOwner& owner) {
    ser_writebe32(s, owner.threshold);
    ser_writebe32(s, static_cast<uint32_t>(owner.addresses.size()));
    for (const auto& addr : owner.addresses) {
        s.Write(addr.data(), Address::SIZE);
    }
}

PChainOwner ReadOwner(DataStream& s) {
    PChainOwner owner;
    owner.threshold = ser_readbe32(s);
    uint32_t count = ser_readbe32(s);
    if (static_cast<uint64_t>(count) * ADDRESS_LENGTH > s.size()) {
        throw std::ios_base::failure("owner address count exceeds message");
    }
    owner.addresses.resize(count);
    for (auto& addr : owner.addresses) {
        s.Read(addr.data(), Address::SIZE);
    }
    return owner;
}

Bytes ReadLengthPrefixed(DataStream& s) {
    uint32_t len = ser_readbe32(s);
    if (len > s.size()) {
        throw std::ios_base::failure("length prefix exceeds message");
    }
    Bytes out(len);
    s.Read(out.data(), len);
    return out;
}

} // namespace

// ============================================================================
// Conversion
// ============================================================================

Bytes PackConversionData(const ConversionData& data) {
    DataStream s;
    ser_writebe16(s, CODEC_ID);
    s << data.subnetID;
    s << data.validatorManagerBlockchainID;
    ser_writebe32(s, static_cast<uint32_t>(ADDRESS_LENGTH));
    s << data.validatorManagerAddress;
    ser_writebe32(s, static_cast<uint32_t>(data.initialValidators.size()));
    for (const auto& v : data.initialValidators) {
        ser_writebe32(s, static_cast<uint32_t>(v.nodeID.size()));
        s.Write(v.nodeID.data(), v.nodeID.size());
        ser_writebe64(s, v.weight);
        s.Write(v.blsPublicKey.data(), v.blsPublicKey.size());
    }
    return s.Data();
}

Hash256 ConversionID(const ConversionData& data) {
    return crypto::SHA256Hash(PackConversionData(data));
}

Hash256 InitialValidationID(const Hash256& subnetID, uint32_t index) {
    DataStream s;
    s << subnetID;
    ser_writebe32(s, index);
    return crypto::SHA256Hash(s.Data());
}

Bytes PackSubnetToL1ConversionMessage(const Hash256& conversionID) {
    DataStream s;
    WriteHeader(s, MessageTypeID::SUBNET_TO_L1_CONVERSION);
    s << conversionID;
    return s.Data();
}

std::optional<Hash256> UnpackSubnetToL1ConversionMessage(const Bytes& input,
                                                          ManagerState& state) {
    DataStream s(input);
    if (!ReadHeader(s, input, CONVERSION_MESSAGE_SIZE,
                    MessageTypeID::SUBNET_TO_L1_CONVERSION, state)) {
        return std::nullopt;
    }
    Hash256 conversionID;
    s >> conversionID;
    return conversionID;
}

// ============================================================================
// RegisterL1Validator
// ============================================================================

Bytes PackRegisterL1ValidatorMessage(const RegisterL1ValidatorMessage& msg) {
    DataStream s;
    WriteHeader(s, MessageTypeID::REGISTER_L1_VALIDATOR);
    s << msg.subnetID;
    ser_writebe32(s, static_cast<uint32_t>(msg.nodeID.size()));
    s.Write(msg.nodeID.data(), msg.nodeID.size());
    s.Write(msg.blsPublicKey.data(), msg.blsPublicKey.size());
    ser_writebe64(s, msg.registrationExpiry);
    WriteOwner(s, msg.remainingBalanceOwner);
    WriteOwner(s, msg.disableOwner);
    ser_writebe64(s, msg.weight);
    return s.Data();
}

std::optional<RegisterL1ValidatorMessage> UnpackRegisterL1ValidatorMessage(
    const Bytes& input, ManagerState& state) {
    DataStream s(input);
    try {
        if (!ReadHeader(s, input, 0, MessageTypeID::REGISTER_L1_VALIDATOR, state)) {
            return std::nullopt;
        }
        RegisterL1ValidatorMessage msg;
        s >> msg.subnetID;
        msg.nodeID = ReadLengthPrefixed(s);
        msg.blsPublicKey.resize(BLS_PUBLIC_KEY_LENGTH);
        s.Read(msg.blsPublicKey.data(), BLS_PUBLIC_KEY_LENGTH);
        msg.registrationExpiry = ser_readbe64(s);
        msg.remainingBalanceOwner = ReadOwner(s);
        msg.disableOwner = ReadOwner(s);
        msg.weight = ser_readbe64(s);
        if (!s.empty()) {
            state.Invalid(ErrorCode::InvalidMessageLength, input.size(), "trailing bytes");
            return std::nullopt;
        }
        return msg;
    } catch (const std::ios_base::failure& e) {
        state.Invalid(ErrorCode::InvalidMessageLength, input.size(), e.what());
        return std::nullopt;
    }
}

// ============================================================================
// L1ValidatorRegistration
// ============================================================================

Bytes PackL1ValidatorRegistrationMessage(const L1ValidatorRegistrationMessage& msg) {
    DataStream s;
    WriteHeader(s, MessageTypeID::L1_VALIDATOR_REGISTRATION);
    s << msg.validationID;
    ser_writedata8(s, msg.valid ? 1 : 0);
    return s.Data();
}

std::optional<L1ValidatorRegistrationMessage> UnpackL1ValidatorRegistrationMessage(
    const Bytes& input, ManagerState& state) {
    DataStream s(input);
    if (!ReadHeader(s, input, REGISTRATION_MESSAGE_SIZE,
                    MessageTypeID::L1_VALIDATOR_REGISTRATION, state)) {
        return std::nullopt;
    }
    L1ValidatorRegistrationMessage msg;
    s >> msg.validationID;
    msg.valid = ser_readdata8(s) != 0;
    return msg;
}

// ============================================================================
// L1ValidatorWeight
// ============================================================================

Bytes PackL1ValidatorWeightMessage(const L1ValidatorWeightMessage& msg) {
    DataStream s;
    WriteHeader(s, MessageTypeID::L1_VALIDATOR_WEIGHT);
    s << msg.validationID;
    ser_writebe64(s, msg.nonce);
    ser_writebe64(s, msg.weight);
    return s.Data();
}

std::optional<L1ValidatorWeightMessage> UnpackL1ValidatorWeightMessage(
    const Bytes& input, ManagerState& state) {
    DataStream s(input);
    if (!ReadHeader(s, input, WEIGHT_MESSAGE_SIZE,
                    MessageTypeID::L1_VALIDATOR_WEIGHT, state)) {
        return std::nullopt;
    }
    L1ValidatorWeightMessage msg;
    s >> msg.validationID;
    msg.nonce = ser_readbe64(s);
    msg.weight = ser_readbe64(s);
    return msg;
}

// ============================================================================
// ValidationUptime
// ============================================================================

Bytes PackValidationUptimeMessage(const ValidationUptimeMessage& msg) {
    DataStream s;
    WriteHeader(s, MessageTypeID::VALIDATION_UPTIME);
    s << msg.validationID;
    ser_writebe64(s, msg.uptime);
    return s.Data();
}

std::optional<ValidationUptimeMessage> UnpackValidationUptimeMessage(
    const Bytes& input, ManagerState& state) {
    DataStream s(input);
    if (!ReadHeader(s, input, UPTIME_MESSAGE_SIZE,
                    MessageTypeID::VALIDATION_UPTIME, state)) {
        return std::nullopt;
    }
    ValidationUptimeMessage msg;
    s >> msg.validationID;
    msg.uptime = ser_readbe64(s);
    return msg;
}

} // namespace validator
} // namespace valset
