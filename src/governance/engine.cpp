// AGORA - Governance Engine Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/engine.h"
#include "agora/util/logging.h"

#include <limits>

namespace agora {
namespace governance {

namespace {

const char* const REASON_NOT_IN_PROGRESS = "Poll is not in progress";
const char* const REASON_NOT_PASSED = "Poll is not in passed status";
const char* const REASON_QUORUM = "Quorum not reached";
const char* const REASON_THRESHOLD = "Threshold not reached";

/// Why a poll with these tallies fails, or empty if it passes
std::string ResolvePoll(const GovConfig& config, const Poll& poll, Amount denominator,
                        GovError& error) {
    error = GovError::OK;
    Uint128 tallied = poll.TalliedVotes();
    if (denominator == 0 || tallied == 0) {
        return REASON_QUORUM;
    }
    if (tallied > std::numeric_limits<Amount>::max()) {
        error = GovError::Overflow;
        return std::string();
    }
    Amount votes = static_cast<Amount>(tallied);

    auto participation = Decimal::FromRatio(votes, denominator);
    if (!participation || *participation < config.quorum) {
        return REASON_QUORUM;
    }

    auto approval = Decimal::FromRatio(poll.yesVotes, votes);
    if (!approval || *approval <= config.threshold) {
        return REASON_THRESHOLD;
    }
    return std::string();
}

} // namespace

GovernanceEngine::GovernanceEngine(db::Database& db, const staking::TokenQuerier& token)
    : store_(db), polls_(store_), ledger_(store_, token) {}

// ============================================================================
// Helpers
// ============================================================================

HandleResult GovernanceEngine::LoadSingletons(GovConfig& config, PoolState& state) const {
    db::Status s = store_.ReadConfig(config);
    if (s.ok()) {
        s = store_.ReadState(state);
    }
    if (s.IsNotFound()) {
        return HandleResult::Failure(GovError::NotInitialized, "Contract is not instantiated");
    }
    if (!s.ok()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }
    return HandleResult::Success();
}

HandleResult GovernanceEngine::Finish(const char* operation, HandleResult result) {
    if (!result.IsOk()) {
        store_.Rollback();
        if (result.error == GovError::StorageError) {
            LOG_ERROR(util::LogCategory::GOV) << operation << " failed: " << result.reason;
        } else {
            LOG_DEBUG(util::LogCategory::GOV) << operation << " rejected ("
                                              << GovErrorToString(result.error)
                                              << "): " << result.reason;
        }
        return result;
    }

    db::Status s = store_.Commit();
    if (!s.ok()) {
        store_.Rollback();
        LOG_ERROR(util::LogCategory::GOV) << operation << " commit failed: " << s.ToString();
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }

    LOG_INFO(util::LogCategory::GOV) << operation << ": " << FormatAttributes(result.attributes);
    return result;
}

// ============================================================================
// Setup
// ============================================================================

HandleResult GovernanceEngine::Instantiate(const CallContext& ctx, const InitParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    GovConfig existing;
    db::Status s = store_.ReadConfig(existing);
    if (s.ok()) {
        return Finish("instantiate",
                      HandleResult::Failure(GovError::Unauthorized, "Already instantiated"));
    }
    if (!s.IsNotFound()) {
        return Finish("instantiate", HandleResult::Failure(GovError::StorageError, s.ToString()));
    }

    GovConfig config;
    config.owner = ctx.sender;
    config.quorum = params.quorum;
    config.threshold = params.threshold;
    config.votingPeriod = params.votingPeriod;
    config.timelockPeriod = params.timelockPeriod;
    config.expirationPeriod = params.expirationPeriod;
    config.proposalDeposit = params.proposalDeposit;
    config.snapshotPeriod = params.snapshotPeriod;

    std::string reason;
    GovError err = ValidateConfig(config, reason);
    if (err != GovError::OK) {
        return Finish("instantiate", HandleResult::Failure(err, reason));
    }

    PoolState state;
    state.contractAddress = params.contractAddress;

    store_.WriteConfig(config);
    store_.WriteState(state);

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "instantiate").AddAttribute("owner", config.owner);
    return Finish("instantiate", std::move(result));
}

HandleResult GovernanceEngine::RegisterToken(const CallContext& ctx, const Address& token) {
    std::lock_guard<std::mutex> lock(mutex_);

    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return Finish("register_token", std::move(loaded));
    }
    if (config.HasToken() || ctx.sender != config.owner) {
        return Finish("register_token", HandleResult::Failure(GovError::Unauthorized));
    }

    config.token = token;
    store_.WriteConfig(config);

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "register_token").AddAttribute("token", token);
    return Finish("register_token", std::move(result));
}

// ============================================================================
// Deposits
// ============================================================================

HandleResult GovernanceEngine::Receive(const CallContext& ctx, const DepositNotification& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("receive", ReceiveLocked(ctx, msg));
}

HandleResult GovernanceEngine::ReceiveLocked(const CallContext& ctx,
                                             const DepositNotification& msg) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    if (!config.HasToken() || ctx.sender != config.token) {
        return HandleResult::Failure(GovError::Unauthorized);
    }
    if (!msg.hook) {
        return HandleResult::Failure(GovError::MissingHook, "Data should be given");
    }

    HandleResult result;
    if (std::holds_alternative<StakeVotingTokens>(*msg.hook)) {
        result = ledger_.Stake(config, state, msg.sender, msg.amount);
    } else {
        Poll poll;
        result = polls_.Create(config, state, ctx.height, msg.sender, msg.amount,
                               std::get<CreatePoll>(*msg.hook), poll);
    }

    if (result.IsOk()) {
        store_.WriteState(state);
    }
    return result;
}

// ============================================================================
// Voting
// ============================================================================

HandleResult GovernanceEngine::CastVote(const CallContext& ctx, PollId pollId,
                                        VoteOption vote, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("cast_vote", CastVoteLocked(ctx, pollId, vote, amount));
}

HandleResult GovernanceEngine::CastVoteLocked(const CallContext& ctx, PollId pollId,
                                              VoteOption vote, Amount amount) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    Poll poll;
    HandleResult found = polls_.Load(pollId, poll);
    if (!found.IsOk()) {
        return found;
    }
    if (poll.status != PollStatus::InProgress || ctx.height > poll.endHeight) {
        return HandleResult::Failure(GovError::PollNotInProgress, REASON_NOT_IN_PROGRESS);
    }

    HandleResult fresh = polls_.CheckNotVoted(pollId, ctx.sender);
    if (!fresh.IsOk()) {
        return fresh;
    }

    VoterInfo info;
    info.vote = vote;
    info.balance = amount;
    HandleResult locked = ledger_.LockForVote(config, state, ctx.sender, pollId, info);
    if (!locked.IsOk()) {
        return locked;
    }

    Amount& tally = (vote == VoteOption::Yes) ? poll.yesVotes : poll.noVotes;
    auto updated = CheckedAdd(tally, amount);
    if (!updated) {
        return HandleResult::Failure(GovError::Overflow);
    }
    tally = *updated;

    polls_.RecordVote(pollId, ctx.sender, info);
    HandleResult saved = polls_.Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "cast_vote")
          .AddAttribute("poll_id", std::to_string(pollId))
          .AddAttribute("amount", std::to_string(amount))
          .AddAttribute("voter", ctx.sender)
          .AddAttribute("vote_option", VoteOptionToString(vote));
    return result;
}

HandleResult GovernanceEngine::WithdrawVotingTokens(const CallContext& ctx,
                                                    std::optional<Amount> amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("withdraw_voting_tokens", WithdrawLocked(ctx, amount));
}

HandleResult GovernanceEngine::WithdrawLocked(const CallContext& ctx,
                                              std::optional<Amount> amount) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    HandleResult result = ledger_.Withdraw(config, state, ctx.sender, amount);
    if (result.IsOk()) {
        store_.WriteState(state);
    }
    return result;
}

// ============================================================================
// Poll Lifecycle
// ============================================================================

HandleResult GovernanceEngine::SnapshotPoll(const CallContext& ctx, PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("snapshot_poll", SnapshotPollLocked(ctx, pollId));
}

HandleResult GovernanceEngine::SnapshotPollLocked(const CallContext& ctx, PollId pollId) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    Poll poll;
    HandleResult found = polls_.Load(pollId, poll);
    if (!found.IsOk()) {
        return found;
    }
    if (poll.status != PollStatus::InProgress || ctx.height > poll.endHeight) {
        return HandleResult::Failure(GovError::PollNotInProgress, REASON_NOT_IN_PROGRESS);
    }

    BlockHeight windowStart = poll.endHeight > config.snapshotPeriod
                                  ? poll.endHeight - config.snapshotPeriod
                                  : 0;
    if (ctx.height < windowStart) {
        return HandleResult::Failure(GovError::SnapshotWindowNotOpen,
                                     "Cannot snapshot at this height");
    }
    if (poll.stakedAmount) {
        return HandleResult::Failure(GovError::SnapshotAlreadyTaken,
                                     "Snapshot has already occurred");
    }

    Amount underlying = 0;
    GovError err = ledger_.TotalUnderlying(config, state, underlying);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }
    poll.stakedAmount = underlying;

    HandleResult saved = polls_.Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "snapshot_poll")
          .AddAttribute("poll_id", std::to_string(pollId))
          .AddAttribute("staked_amount", std::to_string(underlying));
    return result;
}

HandleResult GovernanceEngine::EndPoll(const CallContext& ctx, PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("end_poll", EndPollLocked(ctx, pollId));
}

HandleResult GovernanceEngine::EndPollLocked(const CallContext& ctx, PollId pollId) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    Poll poll;
    HandleResult found = polls_.Load(pollId, poll);
    if (!found.IsOk()) {
        return found;
    }
    if (ctx.height <= poll.endHeight) {
        return HandleResult::Failure(GovError::VotingNotExpired,
                                     "Voting period has not expired");
    }
    if (poll.status != PollStatus::InProgress) {
        return HandleResult::Failure(GovError::PollNotInProgress, REASON_NOT_IN_PROGRESS);
    }

    Amount denominator = 0;
    if (poll.stakedAmount) {
        denominator = *poll.stakedAmount;
    } else {
        GovError err = ledger_.TotalUnderlying(config, state, denominator);
        if (err != GovError::OK) {
            return HandleResult::Failure(err);
        }
    }

    GovError err = GovError::OK;
    std::string rejectedReason = ResolvePoll(config, poll, denominator, err);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }
    const bool passed = rejectedReason.empty();

    HandleResult result = HandleResult::Success();
    if (passed) {
        auto remaining = CheckedSub(state.totalDeposit, poll.depositAmount);
        if (!remaining) {
            return HandleResult::Failure(GovError::Overflow,
                                         "Deposit exceeds recorded total deposit");
        }
        state.totalDeposit = *remaining;
        if (poll.depositAmount != 0) {
            result.AddEffect(TokenTransfer{config.token, poll.creator, poll.depositAmount});
        }
    }

    poll.status = passed ? PollStatus::Passed : PollStatus::Rejected;
    poll.totalBalanceAtEndPoll = denominator;

    HandleResult saved = polls_.Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }
    store_.WriteState(state);

    result.AddAttribute("action", "end_poll")
          .AddAttribute("poll_id", std::to_string(pollId))
          .AddAttribute("rejected_reason", rejectedReason)
          .AddAttribute("passed", passed ? "true" : "false");
    return result;
}

HandleResult GovernanceEngine::ExecutePoll(const CallContext& ctx, PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("execute_poll", ExecutePollLocked(ctx, pollId));
}

HandleResult GovernanceEngine::ExecutePollLocked(const CallContext& ctx, PollId pollId) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    Poll poll;
    HandleResult found = polls_.Load(pollId, poll);
    if (!found.IsOk()) {
        return found;
    }
    if (poll.status != PollStatus::Passed) {
        return HandleResult::Failure(GovError::PollNotPassed, REASON_NOT_PASSED);
    }
    auto unlockHeight = CheckedAdd(poll.endHeight, config.timelockPeriod);
    if (!unlockHeight || ctx.height < *unlockHeight) {
        return HandleResult::Failure(GovError::TimelockNotExpired,
                                     "Timelock period has not expired");
    }

    HandleResult result = HandleResult::Success();
    for (const auto& op : poll.executeData) {
        result.AddEffect(DelegatedCall{op.target, op.payload});
    }

    poll.status = PollStatus::Executed;
    HandleResult saved = polls_.Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }

    result.AddAttribute("action", "execute_poll")
          .AddAttribute("poll_id", std::to_string(pollId));
    return result;
}

HandleResult GovernanceEngine::ExpirePoll(const CallContext& ctx, PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("expire_poll", ExpirePollLocked(ctx, pollId));
}

HandleResult GovernanceEngine::ExpirePollLocked(const CallContext& ctx, PollId pollId) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }

    Poll poll;
    HandleResult found = polls_.Load(pollId, poll);
    if (!found.IsOk()) {
        return found;
    }
    if (poll.status != PollStatus::Passed) {
        return HandleResult::Failure(GovError::PollNotPassed, REASON_NOT_PASSED);
    }
    auto expireHeight = CheckedAdd(poll.endHeight, config.expirationPeriod);
    if (!expireHeight || ctx.height < *expireHeight) {
        return HandleResult::Failure(GovError::ExpirationNotReached,
                                     "Expire height has not been reached");
    }

    poll.status = PollStatus::Expired;
    HandleResult saved = polls_.Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "expire_poll")
          .AddAttribute("poll_id", std::to_string(pollId));
    return result;
}

// ============================================================================
// Configuration
// ============================================================================

HandleResult GovernanceEngine::UpdateConfig(const CallContext& ctx, const ConfigUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Finish("update_config", UpdateConfigLocked(ctx, update));
}

HandleResult GovernanceEngine::UpdateConfigLocked(const CallContext& ctx,
                                                  const ConfigUpdate& update) {
    GovConfig config;
    PoolState state;
    HandleResult loaded = LoadSingletons(config, state);
    if (!loaded.IsOk()) {
        return loaded;
    }
    if (ctx.sender != config.owner) {
        return HandleResult::Failure(GovError::Unauthorized);
    }

    if (update.owner) config.owner = *update.owner;
    if (update.quorum) config.quorum = *update.quorum;
    if (update.threshold) config.threshold = *update.threshold;
    if (update.votingPeriod) config.votingPeriod = *update.votingPeriod;
    if (update.timelockPeriod) config.timelockPeriod = *update.timelockPeriod;
    if (update.expirationPeriod) config.expirationPeriod = *update.expirationPeriod;
    if (update.proposalDeposit) config.proposalDeposit = *update.proposalDeposit;
    if (update.snapshotPeriod) config.snapshotPeriod = *update.snapshotPeriod;

    std::string reason;
    GovError err = ValidateConfig(config, reason);
    if (err != GovError::OK) {
        return HandleResult::Failure(err, reason);
    }

    store_.WriteConfig(config);

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "update_config");
    return result;
}

} // namespace governance
} // namespace agora
