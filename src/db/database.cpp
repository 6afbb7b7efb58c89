// BALLOT - Database Implementation
// Copyright (c) 2024 BALLOT Developers
// MIT License

#include "ballot/db/database.h"
#include "ballot/db/leveldb.h"
#include "ballot/util/logging.h"

#include <algorithm>
#include <system_error>

namespace ballot {
namespace db {

// ============================================================================
// Status / Slice
// ============================================================================

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

int Slice::compare(const Slice& b) const {
    size_t min_len = std::min(size_, b.size_);
    int r = std::memcmp(data_, b.data_, min_len);
    if (r == 0) {
        if (size_ < b.size_) r = -1;
        else if (size_ > b.size_) r = +1;
    }
    return r;
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key,
                           std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key,
                           const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return *fail_writes_;
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return *fail_writes_;
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) return *fail_writes_;
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
// LevelDB Status Conversion
// ============================================================================

#ifdef BALLOT_USE_LEVELDB

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

#endif // BALLOT_USE_LEVELDB

// ============================================================================
// Database Factory Functions
// ============================================================================

bool HaveLevelDB() {
#ifdef BALLOT_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef BALLOT_USE_LEVELDB
    if (!options.in_memory) {
        leveldb::Options lo;
        lo.create_if_missing = options.create_if_missing;
        lo.error_if_exists = options.error_if_exists;
        lo.paranoid_checks = options.paranoid_checks;
        lo.write_buffer_size = options.write_buffer_size;
        lo.max_open_files = options.max_open_files;

        leveldb::Cache* cache = nullptr;
        if (options.block_cache_size > 0) {
            cache = leveldb::NewLRUCache(options.block_cache_size);
            lo.block_cache = cache;
        }

        if (options.create_if_missing) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
        }

        leveldb::DB* db = nullptr;
        leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
        if (!s.ok()) {
            delete cache;
            LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                             << ": " << s.ToString();
            return {FromLevelDBStatus(s), nullptr};
        }

        LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB store at " << path.string();
        return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, path)};
    }
#endif

    if (!options.in_memory) {
        LOG_WARN(util::LogCategory::DB) << "LevelDB support not built in, using an "
                                        << "in-memory store instead of " << path.string();
    }
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef BALLOT_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return FromLevelDBStatus(s);
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
} // namespace ballot
