// VALSET - State Store Tests
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <gtest/gtest.h>

#include <valset/core/serialize.h>
#include <valset/db/database.h>
#include <valset/db/leveldb.h>
#include <valset/db/state_store.h>

#include <algorithm>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace valset {
namespace db {
namespace test {

using staking::Delegator;
using staking::DelegatorStatus;
using staking::PoSValidatorInfo;
using staking::StakingSnapshot;
using validator::LegacyValidator;
using validator::Validator;
using validator::ValidatorManagerSnapshot;
using validator::ValidatorStatus;

namespace {

Hash256 FilledHash(Byte b) {
    Hash256 h;
    std::fill(h.begin(), h.end(), b);
    return h;
}

Address MakeAddress(Byte b) {
    Address a;
    std::fill(a.begin(), a.end(), b);
    return a;
}

std::string EncodeU32(uint32_t value) {
    DataStream s;
    s << value;
    return std::string(s.Data().begin(), s.Data().end());
}

} // namespace

// ============================================================================
// Memory Database
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db.Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db.Exists(Slice("key1")));

    ASSERT_TRUE(db.Delete(Slice("key1")).ok());
    EXPECT_TRUE(db.Get(Slice("key1"), &value).IsNotFound());
    EXPECT_EQ(db.Size(), 0u);
}

TEST(MemoryDatabaseTest, BatchAndIterationOrder) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put(Slice("b"), Slice("stale")).ok());

    WriteBatch batch;
    batch.Put(Slice("c"), Slice("3"));
    batch.Put(Slice("a"), Slice("1"));
    batch.Delete(Slice("b"));
    EXPECT_EQ(batch.Count(), 3u);
    ASSERT_TRUE(db.Write(&batch).ok());

    std::string keys;
    auto it = db.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys += it->key().ToString();
    }
    EXPECT_EQ(keys, "ac");
    EXPECT_TRUE(it->status().ok());

    it->Seek(Slice("b"));
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "c");
}

TEST(DatabaseKeyTest, PrefixedKeys) {
    Hash256 id = FilledHash(0x42);
    std::string key = MakeKey(prefix::VALIDATOR, id);
    ASSERT_EQ(key.size(), 1 + Hash256::SIZE);
    EXPECT_EQ(key[0], prefix::VALIDATOR);
    EXPECT_EQ(static_cast<uint8_t>(key[1]), 0x42);
    EXPECT_EQ(MakeKey(prefix::VERSION), "V");
}

#ifndef VALSET_USE_LEVELDB
TEST(DatabaseOpenTest, DiskDatabaseUnavailableWithoutLevelDB) {
    auto [status, db] = OpenDatabase(std::filesystem::temp_directory_path() / "valset_no_leveldb",
                                     Options());
    EXPECT_EQ(status.code(), Status::NOT_SUPPORTED);
    EXPECT_EQ(db, nullptr);
}
#endif

// ============================================================================
// State Store
// ============================================================================

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_.initialized = true;
        manager_.owner = MakeAddress(0x51);
        manager_.permissionless = true;
        manager_.churn.startTime = 1700000000;
        manager_.churn.initialWeight = 5000;
        manager_.churn.totalWeight = 5700;
        manager_.churn.churnAmount = 700;

        Validator active;
        active.status = ValidatorStatus::Active;
        active.nodeID = Hash160(std::vector<Byte>(20, 0xA0).data(), 20);
        active.startingWeight = 500;
        active.sentNonce = 2;
        active.receivedNonce = 1;
        active.weight = 700;
        active.startTime = 1700000000;
        manager_.validators[vid_] = active;

        Validator ended = active;
        ended.status = ValidatorStatus::Completed;
        ended.weight = 0;
        ended.endTime = 1700003600;
        manager_.validators[FilledHash(0x02)] = ended;

        manager_.pendingMessages[vid_] = Bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0xFF};

        PoSValidatorInfo info;
        info.owner = MakeAddress(0xA1);
        info.delegationFeeBips = 1000;
        info.minStakeDuration = 86400;
        info.uptimeSeconds = 3000;
        info.rewardRecipient = MakeAddress(0xC0);
        staking_.validators[vid_] = info;

        Delegator d;
        d.status = DelegatorStatus::PendingRemoved;
        d.owner = MakeAddress(0xB0);
        d.validationID = vid_;
        d.weight = 200;
        d.startTime = 1700003600;
        d.endTime = 1700090000;
        d.startingNonce = 1;
        d.endingNonce = 2;
        d.rewardRecipient = MakeAddress(0xB0);
        staking_.delegators[did_] = d;
        staking_.delegatorRewards[did_] = 200;
        staking_.redeemableValidatorRewards[vid_] = 20;
    }

    MemoryDatabase db_;
    Hash256 vid_ = FilledHash(0x01);
    Hash256 did_ = FilledHash(0xDD);
    ValidatorManagerSnapshot manager_;
    StakingSnapshot staking_;
};

TEST_F(StateStoreTest, EmptyStoreIsNotFound) {
    StateStore store(db_);
    EXPECT_FALSE(store.HasState());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    EXPECT_TRUE(store.Load(manager, staking).IsNotFound());
}

TEST_F(StateStoreTest, SaveAndLoad) {
    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());
    EXPECT_TRUE(store.HasState());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    Status status = store.Load(manager, staking);
    ASSERT_TRUE(status.ok()) << status.ToString();

    EXPECT_TRUE(manager.initialized);
    EXPECT_TRUE(manager.permissionless);
    EXPECT_EQ(manager.owner, manager_.owner);
    EXPECT_EQ(manager.churn, manager_.churn);
    ASSERT_EQ(manager.validators.size(), 2u);
    const Validator& v = manager.validators.at(vid_);
    EXPECT_EQ(v.status, ValidatorStatus::Active);
    EXPECT_EQ(v.nodeID, manager_.validators.at(vid_).nodeID);
    EXPECT_EQ(v.sentNonce, 2u);
    EXPECT_EQ(v.receivedNonce, 1u);
    EXPECT_EQ(v.weight, 700u);
    EXPECT_EQ(manager.validators.at(FilledHash(0x02)).endTime, 1700003600u);
    EXPECT_EQ(manager.pendingMessages.at(vid_), manager_.pendingMessages.at(vid_));

    const PoSValidatorInfo& info = staking.validators.at(vid_);
    EXPECT_EQ(info.delegationFeeBips, 1000);
    EXPECT_EQ(info.uptimeSeconds, 3000u);
    EXPECT_EQ(info.rewardRecipient, MakeAddress(0xC0));
    const Delegator& d = staking.delegators.at(did_);
    EXPECT_EQ(d.status, DelegatorStatus::PendingRemoved);
    EXPECT_EQ(d.validationID, vid_);
    EXPECT_EQ(d.endingNonce, 2u);
    EXPECT_EQ(staking.delegatorRewards.at(did_), 200u);
    EXPECT_EQ(staking.redeemableValidatorRewards.at(vid_), 20u);
}

TEST_F(StateStoreTest, SaveReplacesPreviousState) {
    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());

    manager_.validators.erase(FilledHash(0x02));
    manager_.pendingMessages.clear();
    ASSERT_TRUE(store.Save(manager_).ok());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    ASSERT_TRUE(store.Load(manager, staking).ok());
    EXPECT_EQ(manager.validators.size(), 1u);
    EXPECT_TRUE(manager.pendingMessages.empty());
    EXPECT_TRUE(staking.delegators.empty());
    EXPECT_TRUE(staking.redeemableValidatorRewards.empty());
}

TEST_F(StateStoreTest, LegacyRecordsPersistUntilMigrated) {
    LegacyValidator legacy;
    legacy.status = ValidatorStatus::PendingRemoved;
    legacy.nodeID = Hash160(std::vector<Byte>(20, 0x77).data(), 20);
    legacy.startingWeight = 300;
    legacy.messageNonce = 4;
    legacy.weight = 0;
    legacy.startedAt = 1690000000;
    legacy.endedAt = 1699990000;
    manager_.legacyValidators[FilledHash(0x1E)] = legacy;

    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    ASSERT_TRUE(store.Load(manager, staking).ok());
    ASSERT_EQ(manager.legacyValidators.size(), 1u);
    const LegacyValidator& loaded = manager.legacyValidators.at(FilledHash(0x1E));
    EXPECT_EQ(loaded.status, ValidatorStatus::PendingRemoved);
    EXPECT_EQ(loaded.nodeID, legacy.nodeID);
    EXPECT_EQ(loaded.startingWeight, 300u);
    EXPECT_EQ(loaded.messageNonce, 4u);
    EXPECT_EQ(loaded.endedAt, 1699990000u);
    EXPECT_EQ(manager.validators.size(), 2u);

    // A migrated record disappears from the store on the next save
    manager_.legacyValidators.clear();
    ASSERT_TRUE(store.Save(manager_).ok());
    ASSERT_TRUE(store.Load(manager, staking).ok());
    EXPECT_TRUE(manager.legacyValidators.empty());
}

TEST_F(StateStoreTest, UnrelatedKeysSurvive) {
    ASSERT_TRUE(db_.Put(Slice("zz-other"), Slice("kept")).ok());
    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());
    ASSERT_TRUE(store.Save(manager_).ok());

    std::string value;
    ASSERT_TRUE(db_.Get(Slice("zz-other"), &value).ok());
    EXPECT_EQ(value, "kept");
}

TEST_F(StateStoreTest, UnknownSchemaVersionIsCorruption) {
    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());
    ASSERT_TRUE(db_.Put(Slice(MakeKey(prefix::VERSION)), Slice(EncodeU32(STATE_SCHEMA_VERSION + 1)))
                    .ok());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    EXPECT_TRUE(store.Load(manager, staking).IsCorruption());
    EXPECT_FALSE(manager.initialized);
}

TEST_F(StateStoreTest, DamagedRecordsAreCorruption) {
    StateStore store(db_);
    ASSERT_TRUE(store.Save(manager_, staking_).ok());
    std::string key = MakeKey(prefix::VALIDATOR, vid_);
    std::string record;
    ASSERT_TRUE(db_.Get(Slice(key), &record).ok());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;

    // Truncated
    ASSERT_TRUE(db_.Put(Slice(key), Slice(record.substr(0, 10))).ok());
    EXPECT_TRUE(store.Load(manager, staking).IsCorruption());

    // Trailing bytes
    ASSERT_TRUE(db_.Put(Slice(key), Slice(record + "x")).ok());
    EXPECT_TRUE(store.Load(manager, staking).IsCorruption());

    // Status out of range
    std::string badStatus = record;
    badStatus[0] = 0x7F;
    ASSERT_TRUE(db_.Put(Slice(key), Slice(badStatus)).ok());
    EXPECT_TRUE(store.Load(manager, staking).IsCorruption());

    EXPECT_TRUE(manager.validators.empty());
}

TEST_F(StateStoreTest, OrphanPendingMessageIsCorruption) {
    StateStore store(db_);
    manager_.pendingMessages[FilledHash(0x77)] = Bytes{0x01};
    ASSERT_TRUE(store.Save(manager_, staking_).ok());

    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    EXPECT_TRUE(store.Load(manager, staking).IsCorruption());
}

#ifdef VALSET_USE_LEVELDB
// ============================================================================
// LevelDB
// ============================================================================

class LevelDBStateStoreTest : public StateStoreTest {
protected:
    void SetUp() override {
        StateStoreTest::SetUp();
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        dir_ = std::filesystem::temp_directory_path() /
               ("valset_state_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        DestroyDatabase(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(LevelDBStateStoreTest, StatePersistsAcrossReopen) {
    Options options;
    options.create_if_missing = true;
    {
        auto [status, db] = OpenDatabase(dir_, options);
        ASSERT_TRUE(status.ok()) << status.ToString();
        StateStore store(*db);
        ASSERT_TRUE(store.Save(manager_, staking_, true).ok());
    }

    auto [status, db] = OpenDatabase(dir_, options);
    ASSERT_TRUE(status.ok()) << status.ToString();
    StateStore store(*db);
    ValidatorManagerSnapshot manager;
    StakingSnapshot staking;
    ASSERT_TRUE(store.Load(manager, staking).ok());
    EXPECT_EQ(manager.validators.size(), 2u);
    EXPECT_EQ(staking.delegators.at(did_).weight, 200u);
}
#endif

} // namespace test
} // namespace db
} // namespace valset
