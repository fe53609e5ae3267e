// AGORA - Governance Record Store
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Typed access to the governance records kept in a key-value database.
// Writes are buffered in a WriteCache and reach the database only on Commit.
//
// Key layout:
//   'c'                          -> GovConfig
//   's'                          -> PoolState
//   'p' + be64(poll id)          -> Poll
//   'i' + status + be64(poll id) -> (empty) status index
//   'v' + be64(poll id) + voter  -> VoterInfo
//   'b' + staker                 -> TokenManager

#ifndef AGORA_GOVERNANCE_STORE_H
#define AGORA_GOVERNANCE_STORE_H

#include "agora/db/database.h"
#include "agora/db/write_cache.h"
#include "agora/governance/state.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora {
namespace governance {

enum class OrderBy {
    Ascending,
    Descending
};

namespace keys {
constexpr char CONFIG = 'c';
constexpr char STATE = 's';
constexpr char POLL = 'p';
constexpr char POLL_STATUS = 'i';
constexpr char VOTER = 'v';
constexpr char STAKER = 'b';
}

class GovStore {
public:
    explicit GovStore(db::Database& db) : db_(db), cache_(db) {}

    GovStore(const GovStore&) = delete;
    GovStore& operator=(const GovStore&) = delete;

    // ========================================================================
    // Singletons
    // ========================================================================

    db::Status ReadConfig(GovConfig& config) const;
    void WriteConfig(const GovConfig& config);

    db::Status ReadState(PoolState& state) const;
    void WriteState(const PoolState& state);

    // ========================================================================
    // Polls
    // ========================================================================

    db::Status ReadPoll(PollId id, Poll& poll) const;

    /// Store a poll and move its status index entry if the status changed
    db::Status WritePoll(const Poll& poll);

    // ========================================================================
    // Voters and Stakers
    // ========================================================================

    db::Status ReadVoter(PollId pollId, const Address& voter, VoterInfo& info) const;
    void WriteVoter(PollId pollId, const Address& voter, const VoterInfo& info);
    void EraseVoter(PollId pollId, const Address& voter);

    db::Status ReadTokenManager(const Address& staker, TokenManager& manager) const;
    void WriteTokenManager(const Address& staker, const TokenManager& manager);

    // ========================================================================
    // Range Scans (committed data only)
    // ========================================================================

    /**
     * List polls by id.
     * @param filter Only polls with this status
     * @param startAfter Exclusive bound in iteration direction
     */
    db::Status ScanPolls(std::optional<PollStatus> filter,
                         std::optional<PollId> startAfter,
                         size_t limit, OrderBy order,
                         std::vector<Poll>& out) const;

    /// List the voters of a poll ordered by address
    db::Status ScanVoters(PollId pollId,
                          const std::optional<Address>& startAfter,
                          size_t limit, OrderBy order,
                          std::vector<std::pair<Address, VoterInfo>>& out) const;

    // ========================================================================
    // Transaction Control
    // ========================================================================

    /// Flush buffered writes as one atomic batch
    db::Status Commit();

    /// Drop buffered writes
    void Rollback() { cache_.Discard(); }

    bool HasPendingWrites() const { return cache_.DirtyCount() > 0; }

    static std::string PollKey(PollId id);
    static std::string PollStatusKey(PollStatus status, PollId id);
    static std::string VoterKey(PollId pollId, const Address& voter);
    static std::string StakerKey(const Address& staker);

private:
    using ScanVisitor = std::function<db::Status(const db::Slice& key,
                                                 const db::Slice& value)>;

    /// Visit up to limit entries under prefix, starting after prefix + startAfter
    db::Status ScanPrefix(const std::string& prefix,
                          const std::optional<std::string>& startAfter,
                          size_t limit, OrderBy order,
                          const ScanVisitor& visit) const;

    template<typename T>
    db::Status ReadRecord(const std::string& key, T& record, const char* what) const;

    template<typename T>
    void WriteRecord(const std::string& key, const T& record) {
        cache_.Put(key, db::SerializeToString(record));
    }

    db::Database& db_;
    db::WriteCache cache_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_STORE_H
