// AGORA - In-Memory Database
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Ordered in-memory key-value store. Used by tests and whenever the build
// has no LevelDB.

#ifndef AGORA_DB_MEMORYDB_H
#define AGORA_DB_MEMORYDB_H

#include "agora/db/database.h"

#include <map>
#include <mutex>

namespace agora {
namespace db {

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace agora

#endif // AGORA_DB_MEMORYDB_H
