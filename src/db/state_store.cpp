// VALSET - Manager State Store
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/db/state_store.h>
#include <valset/core/serialize.h>
#include <valset/util/logging.h>

#include <ios>
#include <string>

namespace valset {
namespace db {

namespace LogCategory = util::LogCategory;

using validator::ChurnPeriod;
using validator::LegacyValidator;
using validator::Validator;
using validator::ValidatorManagerSnapshot;
using validator::ValidatorStatus;
using staking::Delegator;
using staking::DelegatorStatus;
using staking::PoSValidatorInfo;
using staking::StakingSnapshot;

namespace {

const char STATE_PREFIXES[] = {
    prefix::VERSION, prefix::MANAGER, prefix::CHURN, prefix::VALIDATOR,
    prefix::PENDING_MESSAGE, prefix::LEGACY_VALIDATOR, prefix::POS_VALIDATOR,
    prefix::DELEGATOR, prefix::DELEGATOR_REWARD, prefix::REDEEMABLE,
};

bool IsStateKey(const Slice& key) {
    if (key.empty()) return false;
    for (char p : STATE_PREFIXES) {
        if (key[0] == p) return true;
    }
    return false;
}

std::string ToValue(const DataStream& s) {
    const Bytes& data = s.Data();
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

DataStream FromValue(const Slice& value) {
    return DataStream(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

// ============================================================================
// Record Encoding
// ============================================================================

void EncodeChurn(DataStream& s, const ChurnPeriod& churn) {
    s << churn.startTime << churn.initialWeight << churn.totalWeight << churn.churnAmount;
}

void DecodeChurn(DataStream& s, ChurnPeriod& churn) {
    s >> churn.startTime >> churn.initialWeight >> churn.totalWeight >> churn.churnAmount;
}

void EncodeValidator(DataStream& s, const Validator& v) {
    s << static_cast<uint8_t>(v.status) << v.nodeID << v.startingWeight
      << v.sentNonce << v.receivedNonce << v.weight << v.startTime << v.endTime;
}

void DecodeValidator(DataStream& s, Validator& v) {
    uint8_t status = 0;
    s >> status;
    if (status > static_cast<uint8_t>(ValidatorStatus::Invalidated)) {
        throw std::ios_base::failure("unknown validator status " + std::to_string(status));
    }
    v.status = static_cast<ValidatorStatus>(status);
    s >> v.nodeID >> v.startingWeight >> v.sentNonce >> v.receivedNonce
      >> v.weight >> v.startTime >> v.endTime;
}

void EncodeLegacyValidator(DataStream& s, const LegacyValidator& v) {
    s << static_cast<uint8_t>(v.status) << v.nodeID << v.startingWeight
      << v.messageNonce << v.weight << v.startedAt << v.endedAt;
}

void DecodeLegacyValidator(DataStream& s, LegacyValidator& v) {
    uint8_t status = 0;
    s >> status;
    if (status > static_cast<uint8_t>(ValidatorStatus::Invalidated)) {
        throw std::ios_base::failure("unknown legacy validator status " + std::to_string(status));
    }
    v.status = static_cast<ValidatorStatus>(status);
    s >> v.nodeID >> v.startingWeight >> v.messageNonce >> v.weight >> v.startedAt >> v.endedAt;
}

void EncodePoSInfo(DataStream& s, const PoSValidatorInfo& info) {
    s << info.owner << info.delegationFeeBips << info.minStakeDuration
      << info.uptimeSeconds << info.rewardRecipient;
}

void DecodePoSInfo(DataStream& s, PoSValidatorInfo& info) {
    s >> info.owner >> info.delegationFeeBips >> info.minStakeDuration
      >> info.uptimeSeconds >> info.rewardRecipient;
}

void EncodeDelegator(DataStream& s, const Delegator& d) {
    s << static_cast<uint8_t>(d.status) << d.owner << d.validationID << d.weight
      << d.startTime << d.endTime << d.startingNonce << d.endingNonce << d.rewardRecipient;
}

void DecodeDelegator(DataStream& s, Delegator& d) {
    uint8_t status = 0;
    s >> status;
    if (status > static_cast<uint8_t>(DelegatorStatus::Completed)) {
        throw std::ios_base::failure("unknown delegator status " + std::to_string(status));
    }
    d.status = static_cast<DelegatorStatus>(status);
    s >> d.owner >> d.validationID >> d.weight >> d.startTime >> d.endTime
      >> d.startingNonce >> d.endingNonce >> d.rewardRecipient;
}

void StageManager(WriteBatch& batch, const ValidatorManagerSnapshot& snapshot) {
    DataStream meta;
    meta << snapshot.initialized << snapshot.owner << snapshot.permissionless;
    batch.Put(MakeKey(prefix::MANAGER), ToValue(meta));

    DataStream churn;
    EncodeChurn(churn, snapshot.churn);
    batch.Put(MakeKey(prefix::CHURN), ToValue(churn));

    for (const auto& [id, validator] : snapshot.validators) {
        DataStream s;
        EncodeValidator(s, validator);
        batch.Put(MakeKey(prefix::VALIDATOR, id), ToValue(s));
    }
    for (const auto& [id, message] : snapshot.pendingMessages) {
        batch.Put(MakeKey(prefix::PENDING_MESSAGE, id), Slice(message));
    }
    for (const auto& [id, legacy] : snapshot.legacyValidators) {
        DataStream s;
        EncodeLegacyValidator(s, legacy);
        batch.Put(MakeKey(prefix::LEGACY_VALIDATOR, id), ToValue(s));
    }
}

void StageAmounts(WriteBatch& batch, char p, const std::map<Hash256, Amount>& amounts) {
    for (const auto& [id, amount] : amounts) {
        DataStream s;
        s << amount;
        batch.Put(MakeKey(p, id), ToValue(s));
    }
}

void StageStaking(WriteBatch& batch, const StakingSnapshot& snapshot) {
    for (const auto& [id, info] : snapshot.validators) {
        DataStream s;
        EncodePoSInfo(s, info);
        batch.Put(MakeKey(prefix::POS_VALIDATOR, id), ToValue(s));
    }
    for (const auto& [id, delegator] : snapshot.delegators) {
        DataStream s;
        EncodeDelegator(s, delegator);
        batch.Put(MakeKey(prefix::DELEGATOR, id), ToValue(s));
    }
    StageAmounts(batch, prefix::DELEGATOR_REWARD, snapshot.delegatorRewards);
    StageAmounts(batch, prefix::REDEEMABLE, snapshot.redeemableValidatorRewards);
}

Hash256 IdFromKey(const Slice& key) {
    if (key.size() != 1 + Hash256::SIZE) {
        throw std::ios_base::failure("malformed key of " + std::to_string(key.size()) + " bytes");
    }
    return Hash256(reinterpret_cast<const Byte*>(key.data() + 1), Hash256::SIZE);
}

template<typename Decode>
void DecodeWhole(const Slice& value, Decode&& decode) {
    DataStream s = FromValue(value);
    decode(s);
    if (!s.empty()) {
        throw std::ios_base::failure("trailing bytes in record");
    }
}

} // namespace

// ============================================================================
// StateStore
// ============================================================================

Status StateStore::ClearInto(WriteBatch& batch) const {
    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (IsStateKey(it->key())) {
            batch.Delete(it->key());
        }
    }
    return it->status();
}

Status StateStore::Commit(WriteBatch& batch, bool sync) {
    WriteOptions options;
    options.sync = sync;
    Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        LOG_ERROR(LogCategory::DB) << "State write failed: " << status.ToString();
        return status;
    }
    LOG_DEBUG(LogCategory::DB) << "Committed state batch of " << batch.Count() << " operations";
    return status;
}

Status StateStore::Save(const ValidatorManagerSnapshot& manager,
                        const StakingSnapshot& staking,
                        bool sync) {
    WriteBatch batch;
    Status status = ClearInto(batch);
    if (!status.ok()) return status;

    DataStream version;
    version << STATE_SCHEMA_VERSION;
    batch.Put(MakeKey(prefix::VERSION), ToValue(version));

    StageManager(batch, manager);
    StageStaking(batch, staking);
    return Commit(batch, sync);
}

Status StateStore::Save(const ValidatorManagerSnapshot& manager, bool sync) {
    return Save(manager, StakingSnapshot{}, sync);
}

bool StateStore::HasState() const {
    return db_.Exists(MakeKey(prefix::VERSION));
}

Status StateStore::Load(ValidatorManagerSnapshot& manager, StakingSnapshot& staking) const {
    std::string versionValue;
    Status status = db_.Get(MakeKey(prefix::VERSION), &versionValue);
    if (!status.ok()) return status;

    ValidatorManagerSnapshot loadedManager;
    StakingSnapshot loadedStaking;

    try {
        uint32_t version = 0;
        DecodeWhole(Slice(versionValue), [&](DataStream& s) { s >> version; });
        if (version != STATE_SCHEMA_VERSION) {
            return Status::Corruption("unsupported schema version " + std::to_string(version));
        }

        auto it = db_.NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            Slice key = it->key();
            Slice value = it->value();
            if (key.empty()) continue;

            switch (key[0]) {
                case prefix::MANAGER:
                    DecodeWhole(value, [&](DataStream& s) {
                        s >> loadedManager.initialized >> loadedManager.owner
                          >> loadedManager.permissionless;
                    });
                    break;
                case prefix::CHURN:
                    DecodeWhole(value, [&](DataStream& s) { DecodeChurn(s, loadedManager.churn); });
                    break;
                case prefix::VALIDATOR: {
                    Validator v;
                    DecodeWhole(value, [&](DataStream& s) { DecodeValidator(s, v); });
                    loadedManager.validators[IdFromKey(key)] = v;
                    break;
                }
                case prefix::PENDING_MESSAGE:
                    loadedManager.pendingMessages[IdFromKey(key)] = value.ToVector();
                    break;
                case prefix::LEGACY_VALIDATOR: {
                    LegacyValidator v;
                    DecodeWhole(value, [&](DataStream& s) { DecodeLegacyValidator(s, v); });
                    loadedManager.legacyValidators[IdFromKey(key)] = v;
                    break;
                }
                case prefix::POS_VALIDATOR: {
                    PoSValidatorInfo info;
                    DecodeWhole(value, [&](DataStream& s) { DecodePoSInfo(s, info); });
                    loadedStaking.validators[IdFromKey(key)] = info;
                    break;
                }
                case prefix::DELEGATOR: {
                    Delegator d;
                    DecodeWhole(value, [&](DataStream& s) { DecodeDelegator(s, d); });
                    loadedStaking.delegators[IdFromKey(key)] = d;
                    break;
                }
                case prefix::DELEGATOR_REWARD:
                case prefix::REDEEMABLE: {
                    Amount amount = 0;
                    DecodeWhole(value, [&](DataStream& s) { s >> amount; });
                    auto& target = key[0] == prefix::REDEEMABLE
                        ? loadedStaking.redeemableValidatorRewards
                        : loadedStaking.delegatorRewards;
                    target[IdFromKey(key)] = amount;
                    break;
                }
                default:
                    break;
            }
        }
        status = it->status();
        if (!status.ok()) return status;
    } catch (const std::ios_base::failure& e) {
        LOG_ERROR(LogCategory::DB) << "Stored state is unreadable: " << e.what();
        return Status::Corruption(e.what());
    }

    // Pending messages only exist for known validators
    for (const auto& entry : loadedManager.pendingMessages) {
        if (loadedManager.validators.count(entry.first) == 0) {
            return Status::Corruption("pending message for unknown validation " +
                                      entry.first.ToShortHex());
        }
    }

    manager = std::move(loadedManager);
    staking = std::move(loadedStaking);
    LOG_INFO(LogCategory::DB) << "Loaded " << manager.validators.size() << " validators and "
                              << staking.delegators.size() << " delegators from state store";
    return Status::Ok();
}

} // namespace db
} // namespace valset
