// BALLOT - Database Backends
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// LevelDB implementation of the database interface, plus the in-memory
// backend used by tests and as the fallback when LevelDB is not built in.

#ifndef BALLOT_DB_LEVELDB_H
#define BALLOT_DB_LEVELDB_H

#include "ballot/db/database.h"
#include <map>
#include <mutex>

#ifdef BALLOT_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#endif

namespace ballot {
namespace db {

#ifdef BALLOT_USE_LEVELDB

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::filesystem::path path_;

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), path_(path) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    ~LevelDBDatabase() override {
        // The DB references the cache, close it first
        db_.reset();
        cache_.reset();
    }

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        leveldb::Slice lkey(key.data(), key.size());
        return FromLevelDBStatus(db_->Get(MakeReadOptions(options), lkey, value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        leveldb::Slice lkey(key.data(), key.size());
        leveldb::Slice lval(value.data(), value.size());
        return FromLevelDBStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        leveldb::Slice lkey(key.data(), key.size());
        return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options), lkey));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }

    const char* Name() const override { return "leveldb"; }
};

#endif // BALLOT_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * In-memory database for tests, single-session CLI use, or builds
 * without LevelDB.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

    /// When set, every write fails with this status (test hook)
    std::optional<Status> fail_writes_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const char* Name() const override { return "memory"; }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

    /// Make subsequent writes fail (std::nullopt restores normal operation)
    void SetWriteFailure(std::optional<Status> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = std::move(status);
    }
};

/**
 * Iterator over a snapshot of a MemoryDatabase taken at creation.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace ballot

#endif // BALLOT_DB_LEVELDB_H
