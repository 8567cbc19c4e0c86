// VALSET - Database Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/db/database.h>
#include <valset/db/leveldb.h>
#include <valset/util/logging.h>

namespace valset {
namespace db {

namespace LogCategory = util::LogCategory;

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef VALSET_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);

    if (!s.ok()) {
        delete cache;
        delete filter;

        LOG_WARN(LogCategory::DB) << "Failed to open " << path.string() << ": " << s.ToString();
        if (s.IsCorruption()) {
            return {Status::Corruption(s.ToString()), nullptr};
        } else if (s.IsInvalidArgument()) {
            return {Status::InvalidArgument(s.ToString()), nullptr};
        }
        return {Status::IOError(s.ToString()), nullptr};
    }

    LOG_INFO(LogCategory::DB) << "Opened state database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
#else
    (void)options;
    LOG_WARN(LogCategory::DB) << "Cannot open " << path.string()
                              << ": built without LevelDB";
    return {Status::NotSupported("built without LevelDB"), nullptr};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef VALSET_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace valset
