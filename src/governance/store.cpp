// AGORA - Governance Record Store Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/store.h"
#include "agora/util/logging.h"

namespace agora {
namespace governance {

// ============================================================================
// Keys
// ============================================================================

std::string GovStore::PollKey(PollId id) {
    std::string key = db::MakeKey(keys::POLL);
    db::AppendKeyU64(key, id);
    return key;
}

std::string GovStore::PollStatusKey(PollStatus status, PollId id) {
    std::string key = db::MakeKey(keys::POLL_STATUS);
    key.push_back(static_cast<char>(status));
    db::AppendKeyU64(key, id);
    return key;
}

std::string GovStore::VoterKey(PollId pollId, const Address& voter) {
    std::string key = db::MakeKey(keys::VOTER);
    db::AppendKeyU64(key, pollId);
    key.append(voter);
    return key;
}

std::string GovStore::StakerKey(const Address& staker) {
    return db::MakeKey(keys::STAKER, staker);
}

// ============================================================================
// Record Access
// ============================================================================

template<typename T>
db::Status GovStore::ReadRecord(const std::string& key, T& record, const char* what) const {
    std::string value;
    db::Status s = cache_.Get(key, &value);
    if (!s.ok()) {
        return s;
    }
    if (!db::DeserializeFromString(value, record)) {
        LOG_ERROR(util::LogCategory::DB) << "Undecodable " << what << " record";
        return db::Status::Corruption(std::string("undecodable ") + what + " record");
    }
    return db::Status::Ok();
}

db::Status GovStore::ReadConfig(GovConfig& config) const {
    return ReadRecord(db::MakeKey(keys::CONFIG), config, "config");
}

void GovStore::WriteConfig(const GovConfig& config) {
    WriteRecord(db::MakeKey(keys::CONFIG), config);
}

db::Status GovStore::ReadState(PoolState& state) const {
    return ReadRecord(db::MakeKey(keys::STATE), state, "state");
}

void GovStore::WriteState(const PoolState& state) {
    WriteRecord(db::MakeKey(keys::STATE), state);
}

db::Status GovStore::ReadPoll(PollId id, Poll& poll) const {
    return ReadRecord(PollKey(id), poll, "poll");
}

db::Status GovStore::WritePoll(const Poll& poll) {
    Poll previous;
    db::Status s = ReadPoll(poll.id, previous);
    if (s.ok()) {
        if (previous.status != poll.status) {
            cache_.Delete(PollStatusKey(previous.status, poll.id));
        }
    } else if (!s.IsNotFound()) {
        return s;
    }

    WriteRecord(PollKey(poll.id), poll);
    cache_.Put(PollStatusKey(poll.status, poll.id), std::string());
    return db::Status::Ok();
}

db::Status GovStore::ReadVoter(PollId pollId, const Address& voter, VoterInfo& info) const {
    return ReadRecord(VoterKey(pollId, voter), info, "voter");
}

void GovStore::WriteVoter(PollId pollId, const Address& voter, const VoterInfo& info) {
    WriteRecord(VoterKey(pollId, voter), info);
}

void GovStore::EraseVoter(PollId pollId, const Address& voter) {
    cache_.Delete(VoterKey(pollId, voter));
}

db::Status GovStore::ReadTokenManager(const Address& staker, TokenManager& manager) const {
    return ReadRecord(StakerKey(staker), manager, "staker");
}

void GovStore::WriteTokenManager(const Address& staker, const TokenManager& manager) {
    WriteRecord(StakerKey(staker), manager);
}

// ============================================================================
// Range Scans
// ============================================================================

db::Status GovStore::ScanPrefix(const std::string& prefix,
                                const std::optional<std::string>& startAfter,
                                size_t limit, OrderBy order,
                                const ScanVisitor& visit) const {
    auto it = db_.NewIterator();
    const db::Slice prefixSlice(prefix);

    if (order == OrderBy::Ascending) {
        if (startAfter) {
            std::string start = prefix + *startAfter;
            it->Seek(start);
            if (it->Valid() && it->key() == db::Slice(start)) {
                it->Next();
            }
        } else {
            it->Seek(prefix);
        }
    } else {
        std::string bound = startAfter ? prefix + *startAfter : db::PrefixUpperBound(prefix);
        if (bound.empty()) {
            it->SeekToLast();
        } else {
            it->Seek(bound);
            if (it->Valid()) {
                it->Prev();
            } else {
                it->SeekToLast();
            }
        }
    }

    size_t visited = 0;
    while (visited < limit && it->Valid() && it->key().starts_with(prefixSlice)) {
        db::Status s = visit(it->key(), it->value());
        if (!s.ok()) {
            return s;
        }
        ++visited;
        if (order == OrderBy::Ascending) {
            it->Next();
        } else {
            it->Prev();
        }
    }
    return it->status();
}

db::Status GovStore::ScanPolls(std::optional<PollStatus> filter,
                               std::optional<PollId> startAfter,
                               size_t limit, OrderBy order,
                               std::vector<Poll>& out) const {
    out.clear();

    std::optional<std::string> start;
    if (startAfter) {
        std::string body;
        db::AppendKeyU64(body, *startAfter);
        start = body;
    }

    if (!filter) {
        return ScanPrefix(db::MakeKey(keys::POLL), start, limit, order,
            [&out](const db::Slice&, const db::Slice& value) {
                Poll poll;
                if (!db::DeserializeFromString(value.ToString(), poll)) {
                    return db::Status::Corruption("undecodable poll record");
                }
                out.push_back(std::move(poll));
                return db::Status::Ok();
            });
    }

    std::string prefix = db::MakeKey(keys::POLL_STATUS);
    prefix.push_back(static_cast<char>(*filter));
    const size_t idOffset = prefix.size();

    return ScanPrefix(prefix, start, limit, order,
        [this, &out, idOffset](const db::Slice& key, const db::Slice&) {
            PollId id = 0;
            if (!db::ReadKeyU64(key, idOffset, id)) {
                return db::Status::Corruption("malformed poll status key");
            }
            Poll poll;
            std::string value;
            db::Status s = db_.Get(PollKey(id), &value);
            if (!s.ok()) {
                return s.IsNotFound() ? db::Status::Corruption("dangling poll status key") : s;
            }
            if (!db::DeserializeFromString(value, poll)) {
                return db::Status::Corruption("undecodable poll record");
            }
            out.push_back(std::move(poll));
            return db::Status::Ok();
        });
}

db::Status GovStore::ScanVoters(PollId pollId,
                                const std::optional<Address>& startAfter,
                                size_t limit, OrderBy order,
                                std::vector<std::pair<Address, VoterInfo>>& out) const {
    out.clear();

    std::string prefix = db::MakeKey(keys::VOTER);
    db::AppendKeyU64(prefix, pollId);
    const size_t voterOffset = prefix.size();

    return ScanPrefix(prefix, startAfter, limit, order,
        [&out, voterOffset](const db::Slice& key, const db::Slice& value) {
            VoterInfo info;
            if (!db::DeserializeFromString(value.ToString(), info)) {
                return db::Status::Corruption("undecodable voter record");
            }
            out.emplace_back(std::string(key.data() + voterOffset, key.size() - voterOffset),
                             info);
            return db::Status::Ok();
        });
}

// ============================================================================
// Transaction Control
// ============================================================================

db::Status GovStore::Commit() {
    db::WriteOptions options;
    options.sync = true;
    return cache_.Flush(options);
}

} // namespace governance
} // namespace agora
