// AGORA - Governance Engine
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Token-weighted governance over a staked voting-token pool.
//
// Key features:
// - Share-based staking with proportional claims on the pool
// - Deposit-funded polls with an ordered batch of delegated calls
// - One vote per staker per poll, weighted by staked balance
// - Snapshot of the pool balance ahead of the poll end to fix the quorum base
// - Timelocked execution and expiry of passed polls
//
// Every operation runs against a consistent view and commits all of its
// writes as one batch, or none of them.

#ifndef AGORA_GOVERNANCE_ENGINE_H
#define AGORA_GOVERNANCE_ENGINE_H

#include "agora/core/types.h"
#include "agora/db/database.h"
#include "agora/governance/params.h"
#include "agora/governance/poll_store.h"
#include "agora/governance/result.h"
#include "agora/governance/state.h"
#include "agora/governance/store.h"
#include "agora/staking/ledger.h"
#include "agora/staking/token.h"

#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Invocation Context and Messages
// ============================================================================

/// Caller and block height of one invocation
struct CallContext {
    Address sender;
    BlockHeight height{0};
};

/// Hook: stake the received tokens
struct StakeVotingTokens {};

using ReceiveHook = std::variant<StakeVotingTokens, CreatePoll>;

/// Sent by the token contract after tokens were moved into the pool
struct DepositNotification {
    /// Original holder of the tokens
    Address sender;
    Amount amount{0};
    std::optional<ReceiveHook> hook;
};

// ============================================================================
// Query Types
// ============================================================================

struct StateResponse {
    uint64_t pollCount{0};
    Amount totalShare{0};
    Amount totalDeposit{0};
};

struct StakerResponse {
    Amount balance{0};
    Amount share{0};

    /// Locks on polls still in progress, by poll id
    std::vector<std::pair<PollId, VoterInfo>> lockedBalance;
};

struct PollsQuery {
    std::optional<PollStatus> filter;
    std::optional<PollId> startAfter;
    std::optional<uint32_t> limit;
    std::optional<OrderBy> orderBy;
};

struct VotersQuery {
    PollId pollId{0};
    std::optional<Address> startAfter;
    std::optional<uint32_t> limit;
    std::optional<OrderBy> orderBy;
};

struct VoterResponse {
    Address voter;
    VoteOption vote{VoteOption::Yes};
    Amount balance{0};
};

// ============================================================================
// Governance Engine
// ============================================================================

class GovernanceEngine {
public:
    GovernanceEngine(db::Database& db, const staking::TokenQuerier& token);

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // === Setup ===

    /// Store the initial config with ctx.sender as owner
    HandleResult Instantiate(const CallContext& ctx, const InitParams& params);

    /// Bind the governed token; owner only, once
    HandleResult RegisterToken(const CallContext& ctx, const Address& token);

    // === Operations ===

    /// Entry point for token deposits; ctx.sender must be the registered token
    HandleResult Receive(const CallContext& ctx, const DepositNotification& msg);

    HandleResult CastVote(const CallContext& ctx, PollId pollId,
                          VoteOption vote, Amount amount);

    /// Withdraw amount, or the whole staked balance if unset
    HandleResult WithdrawVotingTokens(const CallContext& ctx,
                                      std::optional<Amount> amount);

    /// Fix the quorum base to the current pool balance
    HandleResult SnapshotPoll(const CallContext& ctx, PollId pollId);

    HandleResult EndPoll(const CallContext& ctx, PollId pollId);
    HandleResult ExecutePoll(const CallContext& ctx, PollId pollId);
    HandleResult ExpirePoll(const CallContext& ctx, PollId pollId);

    HandleResult UpdateConfig(const CallContext& ctx, const ConfigUpdate& update);

    // === Queries ===

    GovError QueryConfig(GovConfig& config) const;
    GovError QueryState(StateResponse& response) const;
    GovError QueryPoll(PollId pollId, Poll& poll) const;
    GovError QueryPolls(const PollsQuery& query, std::vector<Poll>& polls) const;
    GovError QueryStaker(const Address& staker, StakerResponse& response) const;
    GovError QueryVoters(const VotersQuery& query,
                         std::vector<VoterResponse>& voters) const;

private:
    /// Load config and state; NotInitialized if never instantiated
    HandleResult LoadSingletons(GovConfig& config, PoolState& state) const;

    HandleResult ReceiveLocked(const CallContext& ctx, const DepositNotification& msg);
    HandleResult CastVoteLocked(const CallContext& ctx, PollId pollId,
                                VoteOption vote, Amount amount);
    HandleResult WithdrawLocked(const CallContext& ctx, std::optional<Amount> amount);
    HandleResult SnapshotPollLocked(const CallContext& ctx, PollId pollId);
    HandleResult EndPollLocked(const CallContext& ctx, PollId pollId);
    HandleResult ExecutePollLocked(const CallContext& ctx, PollId pollId);
    HandleResult ExpirePollLocked(const CallContext& ctx, PollId pollId);
    HandleResult UpdateConfigLocked(const CallContext& ctx, const ConfigUpdate& update);

    /// Commit on success, roll back on failure, and log the outcome
    HandleResult Finish(const char* operation, HandleResult result);

    mutable std::mutex mutex_;

    GovStore store_;
    PollStore polls_;
    staking::Ledger ledger_;
};

/// Requested page size capped at MAX_QUERY_LIMIT, DEFAULT_QUERY_LIMIT if unset
size_t EffectiveLimit(std::optional<uint32_t> limit);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_ENGINE_H
