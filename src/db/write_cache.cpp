// AGORA - Write Cache Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/db/write_cache.h"
#include "agora/util/logging.h"

namespace agora {
namespace db {

Status WriteCache::Get(const std::string& key, std::string* value) const {
    auto it = dirty_.find(key);
    if (it != dirty_.end()) {
        if (!it->second) {
            return Status::NotFound();
        }
        *value = *it->second;
        return Status::Ok();
    }
    return base_.Get(key, value);
}

void WriteCache::Put(const std::string& key, const std::string& value) {
    dirty_[key] = value;
}

void WriteCache::Delete(const std::string& key) {
    dirty_[key] = std::nullopt;
}

bool WriteCache::Exists(const std::string& key) const {
    std::string value;
    return Get(key, &value).ok();
}

Status WriteCache::Flush(const WriteOptions& options) {
    if (dirty_.empty()) {
        return Status::Ok();
    }

    WriteBatch batch;
    for (const auto& [key, value] : dirty_) {
        if (value) {
            batch.Put(key, *value);
        } else {
            batch.Delete(key);
        }
    }

    Status s = base_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Batch write of " << batch.Count()
                                         << " entries failed: " << s.ToString();
        return s;
    }

    LOG_TRACE(util::LogCategory::DB) << "Flushed " << batch.Count() << " entries";
    dirty_.clear();
    return Status::Ok();
}

} // namespace db
} // namespace agora
