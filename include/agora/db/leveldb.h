// AGORA - LevelDB Backend
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// LevelDB implementation of the database interface. Compiled only when the
// build finds LevelDB and defines AGORA_USE_LEVELDB.

#ifndef AGORA_DB_LEVELDB_H
#define AGORA_DB_LEVELDB_H

#include "agora/db/database.h"

#ifdef AGORA_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace agora {
namespace db {

inline Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : cache_(cache), filterPolicy_(filter), db_(db) {}

    ~LevelDBDatabase() override {
        // The DB must close before its cache and filter policy
        db_.reset();
    }

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        leveldb::ReadOptions lo;
        lo.verify_checksums = options.verify_checksums;
        return FromLevelDBStatus(db_->Get(lo, leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        leveldb::WriteOptions lo;
        lo.sync = options.sync;
        return FromLevelDBStatus(db_->Put(lo,
                                          leveldb::Slice(key.data(), key.size()),
                                          leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        leveldb::WriteOptions lo;
        lo.sync = options.sync;
        return FromLevelDBStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
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
        leveldb::WriteOptions lo;
        lo.sync = options.sync;
        return FromLevelDBStatus(db_->Write(lo, &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        leveldb::ReadOptions lo;
        lo.verify_checksums = options.verify_checksums;
        return std::make_unique<LevelDBIterator>(db_->NewIterator(lo));
    }

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

private:
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace agora

#endif // AGORA_USE_LEVELDB

#endif // AGORA_DB_LEVELDB_H
