// AGORA - Database Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/db/database.h"
#include "agora/db/leveldb.h"
#include "agora/db/memorydb.h"
#include "agora/util/logging.h"

#include <system_error>

namespace agora {
namespace db {

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: name = "NotFound"; break;
        case CORRUPTION: name = "Corruption"; break;
        case NOT_SUPPORTED: name = "NotSupported"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR: name = "IOError"; break;
    }
    if (message_.empty()) {
        return name;
    }
    return std::string(name) + ": " + message_;
}

std::string PrefixUpperBound(const std::string& prefix) {
    std::string bound = prefix;
    while (!bound.empty()) {
        unsigned char last = static_cast<unsigned char>(bound.back());
        if (last != 0xFF) {
            bound.back() = static_cast<char>(last + 1);
            return bound;
        }
        bound.pop_back();
    }
    return bound;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef AGORA_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

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
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        Status status = FromLevelDBStatus(s);
        if (status.IsNotFound()) {
            status = Status::IOError(s.ToString());
        }
        return {status, nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB store at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
#else
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }
    LOG_DEBUG(util::LogCategory::DB) << "LevelDB unavailable, using in-memory store for "
                                     << path.string();
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef AGORA_USE_LEVELDB
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
} // namespace agora
