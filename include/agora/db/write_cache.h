// AGORA - Write Cache
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Buffers writes over a base database so a unit of work can be committed as
// one atomic batch or dropped entirely.

#ifndef AGORA_DB_WRITE_CACHE_H
#define AGORA_DB_WRITE_CACHE_H

#include "agora/db/database.h"

#include <map>
#include <optional>
#include <string>

namespace agora {
namespace db {

/**
 * Dirty-entry overlay on top of a Database.
 *
 * Reads consult the overlay first; an erased entry reads as NotFound even if
 * the base still holds it. Iteration is not overlaid: scans go to the base
 * and only see flushed data.
 */
class WriteCache {
public:
    explicit WriteCache(Database& base) : base_(base) {}

    WriteCache(const WriteCache&) = delete;
    WriteCache& operator=(const WriteCache&) = delete;

    Status Get(const std::string& key, std::string* value) const;
    void Put(const std::string& key, const std::string& value);
    void Delete(const std::string& key);

    /// True if the key resolves to a value; false on NotFound or error
    bool Exists(const std::string& key) const;

    /// Write every dirty entry in one batch. The overlay is cleared on success.
    Status Flush(const WriteOptions& options = WriteOptions());

    /// Drop all pending changes
    void Discard() { dirty_.clear(); }

    size_t DirtyCount() const { return dirty_.size(); }

    Database& Base() { return base_; }

private:
    Database& base_;

    /// nullopt marks a pending delete
    std::map<std::string, std::optional<std::string>> dirty_;
};

} // namespace db
} // namespace agora

#endif // AGORA_DB_WRITE_CACHE_H
