// VALSET - Manager State Store
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Persists validator and staking manager snapshots in a key-value database.
// Each save replaces the stored state in a single atomic batch.

#ifndef VALSET_DB_STATE_STORE_H
#define VALSET_DB_STATE_STORE_H

#include <valset/db/database.h>
#include <valset/staking/staking_manager.h>
#include <valset/validator/validator_manager.h>

#include <cstdint>

namespace valset {
namespace db {

/// Current on-disk record layout
constexpr uint32_t STATE_SCHEMA_VERSION = 1;

class StateStore {
public:
    explicit StateStore(Database& db) : db_(db) {}

    /// Replace the stored state with both snapshots atomically
    Status Save(const validator::ValidatorManagerSnapshot& manager,
                const staking::StakingSnapshot& staking,
                bool sync = false);

    /// Replace the stored state for a manager running without staking
    Status Save(const validator::ValidatorManagerSnapshot& manager, bool sync = false);

    /**
     * Read back the stored snapshots.
     *
     * Returns NotFound when nothing was ever saved, and Corruption when a
     * record cannot be decoded or the schema version is unknown. The output
     * snapshots are only assigned on success.
     */
    Status Load(validator::ValidatorManagerSnapshot& manager,
                staking::StakingSnapshot& staking) const;

    bool HasState() const;

private:
    Status ClearInto(WriteBatch& batch) const;
    Status Commit(WriteBatch& batch, bool sync);

    Database& db_;
};

} // namespace db
} // namespace valset

#endif // VALSET_DB_STATE_STORE_H
