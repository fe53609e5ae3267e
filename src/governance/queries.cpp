// AGORA - Governance Engine Queries
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/engine.h"
#include "agora/util/logging.h"

#include <algorithm>

namespace agora {
namespace governance {

namespace {

GovError FromStatus(const db::Status& s, GovError notFound) {
    if (s.ok()) {
        return GovError::OK;
    }
    if (s.IsNotFound()) {
        return notFound;
    }
    LOG_ERROR(util::LogCategory::GOV) << "Query failed: " << s.ToString();
    return GovError::StorageError;
}

} // namespace

size_t EffectiveLimit(std::optional<uint32_t> limit) {
    return std::min(limit.value_or(DEFAULT_QUERY_LIMIT), MAX_QUERY_LIMIT);
}

GovError GovernanceEngine::QueryConfig(GovConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FromStatus(store_.ReadConfig(config), GovError::NotInitialized);
}

GovError GovernanceEngine::QueryState(StateResponse& response) const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolState state;
    GovError err = FromStatus(store_.ReadState(state), GovError::NotInitialized);
    if (err != GovError::OK) {
        return err;
    }
    response.pollCount = state.pollCount;
    response.totalShare = state.totalShare;
    response.totalDeposit = state.totalDeposit;
    return GovError::OK;
}

GovError GovernanceEngine::QueryPoll(PollId pollId, Poll& poll) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FromStatus(store_.ReadPoll(pollId, poll), GovError::PollNotFound);
}

GovError GovernanceEngine::QueryPolls(const PollsQuery& query, std::vector<Poll>& polls) const {
    std::lock_guard<std::mutex> lock(mutex_);
    db::Status s = store_.ScanPolls(query.filter, query.startAfter,
                                    EffectiveLimit(query.limit),
                                    query.orderBy.value_or(OrderBy::Descending), polls);
    return FromStatus(s, GovError::StorageError);
}

GovError GovernanceEngine::QueryStaker(const Address& staker, StakerResponse& response) const {
    std::lock_guard<std::mutex> lock(mutex_);

    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded.error;
    }

    TokenManager manager;
    db::Status s = store_.ReadTokenManager(staker, manager);
    if (!s.ok() && !s.IsNotFound()) {
        return FromStatus(s, GovError::StorageError);
    }

    GovError err = ledger_.QuotedBalance(config, state, manager, response.balance);
    if (err != GovError::OK) {
        return err;
    }
    response.share = manager.share;

    response.lockedBalance.clear();
    for (const auto& [pollId, info] : manager.lockedBalance) {
        Poll poll;
        s = store_.ReadPoll(pollId, poll);
        if (s.IsNotFound()) {
            continue;
        }
        if (!s.ok()) {
            return FromStatus(s, GovError::StorageError);
        }
        if (poll.status == PollStatus::InProgress) {
            response.lockedBalance.emplace_back(pollId, info);
        }
    }
    return GovError::OK;
}

GovError GovernanceEngine::QueryVoters(const VotersQuery& query,
                                       std::vector<VoterResponse>& voters) const {
    std::lock_guard<std::mutex> lock(mutex_);
    voters.clear();

    Poll poll;
    GovError err = FromStatus(store_.ReadPoll(query.pollId, poll), GovError::PollNotFound);
    if (err != GovError::OK) {
        return err;
    }
    if (poll.status != PollStatus::InProgress) {
        return GovError::OK;
    }

    std::vector<std::pair<Address, VoterInfo>> records;
    db::Status s = store_.ScanVoters(query.pollId, query.startAfter,
                                     EffectiveLimit(query.limit),
                                     query.orderBy.value_or(OrderBy::Descending), records);
    if (!s.ok()) {
        return FromStatus(s, GovError::StorageError);
    }

    voters.reserve(records.size());
    for (const auto& [voter, info] : records) {
        voters.push_back(VoterResponse{voter, info.vote, info.balance});
    }
    return GovError::OK;
}

} // namespace governance
} // namespace agora
