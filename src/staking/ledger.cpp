// AGORA - Staking Ledger Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/staking/ledger.h"
#include "agora/util/logging.h"

#include <vector>

namespace agora {
namespace staking {

using governance::Poll;
using governance::PollStatus;
using governance::TokenTransfer;
using governance::VoterInfo;

// ============================================================================
// Balances
// ============================================================================

GovError Ledger::PoolBalance(const GovConfig& config, const PoolState& state,
                             Amount& balance) const {
    auto queried = token_.QueryBalance(config.token, state.contractAddress);
    if (!queried) {
        LOG_WARN(util::LogCategory::STAKING) << "Balance query for " << state.contractAddress
                                             << " on " << config.token << " failed";
        return GovError::TokenQueryFailed;
    }
    balance = *queried;
    return GovError::OK;
}

GovError Ledger::TotalUnderlying(const GovConfig& config, const PoolState& state,
                                 Amount& underlying) const {
    Amount balance = 0;
    GovError err = PoolBalance(config, state, balance);
    if (err != GovError::OK) {
        return err;
    }
    auto net = CheckedSub(balance, state.totalDeposit);
    if (!net) {
        return GovError::Overflow;
    }
    underlying = *net;
    return GovError::OK;
}

GovError Ledger::QuotedBalance(const GovConfig& config, const PoolState& state,
                               const TokenManager& manager, Amount& balance) const {
    if (state.totalShare == 0) {
        balance = 0;
        return GovError::OK;
    }
    Amount underlying = 0;
    GovError err = TotalUnderlying(config, state, underlying);
    if (err != GovError::OK) {
        return err;
    }
    auto quoted = MultiplyRatio(manager.share, underlying, state.totalShare);
    if (!quoted) {
        return GovError::Overflow;
    }
    balance = *quoted;
    return GovError::OK;
}

// ============================================================================
// Stake
// ============================================================================

HandleResult Ledger::Stake(const GovConfig& config, PoolState& state,
                           const Address& staker, Amount amount) {
    if (amount == 0) {
        return HandleResult::Failure(GovError::InsufficientFunds, "Insufficient funds sent");
    }

    TokenManager manager;
    db::Status s = store_.ReadTokenManager(staker, manager);
    if (!s.ok() && !s.IsNotFound()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }

    // The pool balance already includes the incoming amount
    Amount balance = 0;
    GovError err = PoolBalance(config, state, balance);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }
    auto held = CheckedAdd(state.totalDeposit, amount);
    std::optional<Amount> before;
    if (held) {
        before = CheckedSub(balance, *held);
    }
    if (!before) {
        return HandleResult::Failure(GovError::Overflow,
                                     "Pool balance is below deposits and stake");
    }

    Amount share = amount;
    if (*before != 0 && state.totalShare != 0) {
        auto minted = MultiplyRatio(amount, state.totalShare, *before);
        if (!minted) {
            return HandleResult::Failure(GovError::Overflow);
        }
        share = *minted;
    }

    auto newShare = CheckedAdd(manager.share, share);
    auto newTotal = CheckedAdd(state.totalShare, share);
    if (!newShare || !newTotal) {
        return HandleResult::Failure(GovError::Overflow);
    }
    manager.share = *newShare;
    state.totalShare = *newTotal;
    store_.WriteTokenManager(staker, manager);

    LOG_DEBUG(util::LogCategory::STAKING) << staker << " minted " << share
                                          << " shares for " << amount;

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "staking")
          .AddAttribute("sender", staker)
          .AddAttribute("share", std::to_string(share))
          .AddAttribute("amount", std::to_string(amount));
    return result;
}

// ============================================================================
// Vote Locks
// ============================================================================

HandleResult Ledger::LockForVote(const GovConfig& config, const PoolState& state,
                                 const Address& staker, PollId pollId,
                                 const VoterInfo& info) {
    TokenManager manager;
    db::Status s = store_.ReadTokenManager(staker, manager);
    if (!s.ok() && !s.IsNotFound()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }
    if (manager.lockedBalance.count(pollId) != 0) {
        return HandleResult::Failure(GovError::AlreadyVoted, "User has already voted.");
    }

    Amount staked = 0;
    GovError err = QuotedBalance(config, state, manager, staked);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }
    if (info.balance > staked) {
        return HandleResult::Failure(GovError::InsufficientStake,
                                     "User does not have enough staked tokens.");
    }

    manager.lockedBalance[pollId] = info;
    store_.WriteTokenManager(staker, manager);

    LOG_TRACE(util::LogCategory::STAKING) << staker << " locked " << info.balance
                                          << " on poll " << pollId;
    return HandleResult::Success();
}

// ============================================================================
// Withdraw
// ============================================================================

GovError Ledger::ReleaseSettledLocks(const Address& staker, TokenManager& manager) {
    std::vector<PollId> settled;
    for (const auto& [pollId, info] : manager.lockedBalance) {
        Poll poll;
        db::Status s = store_.ReadPoll(pollId, poll);
        if (s.ok() && poll.status == PollStatus::InProgress) {
            continue;
        }
        if (!s.ok() && !s.IsNotFound()) {
            LOG_ERROR(util::LogCategory::STAKING) << "Reading poll " << pollId
                                                  << " failed: " << s.ToString();
            return GovError::StorageError;
        }
        settled.push_back(pollId);
    }

    for (PollId pollId : settled) {
        manager.lockedBalance.erase(pollId);
        store_.EraseVoter(pollId, staker);
    }
    if (!settled.empty()) {
        LOG_TRACE(util::LogCategory::STAKING) << "Released " << settled.size()
                                              << " settled locks for " << staker;
    }
    return GovError::OK;
}

HandleResult Ledger::Withdraw(const GovConfig& config, PoolState& state,
                              const Address& staker, std::optional<Amount> amount) {
    TokenManager manager;
    db::Status s = store_.ReadTokenManager(staker, manager);
    if (s.IsNotFound()) {
        return HandleResult::Failure(GovError::NothingStaked, "Nothing staked");
    }
    if (!s.ok()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }

    GovError err = ReleaseSettledLocks(staker, manager);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }

    Amount underlying = 0;
    err = TotalUnderlying(config, state, underlying);
    if (err != GovError::OK) {
        return HandleResult::Failure(err);
    }

    Amount userBalance = 0;
    if (state.totalShare != 0) {
        auto quoted = MultiplyRatio(manager.share, underlying, state.totalShare);
        if (!quoted) {
            return HandleResult::Failure(GovError::Overflow);
        }
        userBalance = *quoted;
    }

    Amount withdrawAmount = amount.value_or(userBalance);
    if (withdrawAmount > userBalance) {
        return HandleResult::Failure(GovError::ExceedsBalance,
                                     "User is trying to withdraw too many tokens.");
    }

    // Round up so the rounding loss stays with the withdrawing staker
    Amount burned = 0;
    if (underlying != 0) {
        auto shares = MultiplyRatioCeil(withdrawAmount, state.totalShare, underlying);
        if (!shares) {
            return HandleResult::Failure(GovError::Overflow);
        }
        burned = *shares;
    }
    if (burned > manager.share) {
        burned = manager.share;
    }

    manager.share -= burned;
    state.totalShare -= burned;
    store_.WriteTokenManager(staker, manager);

    LOG_DEBUG(util::LogCategory::STAKING) << staker << " burned " << burned
                                          << " shares for " << withdrawAmount;

    HandleResult result = HandleResult::Success();
    result.AddEffect(TokenTransfer{config.token, staker, withdrawAmount});
    result.AddAttribute("action", "withdraw")
          .AddAttribute("recipient", staker)
          .AddAttribute("amount", std::to_string(withdrawAmount));
    return result;
}

} // namespace staking
} // namespace agora
