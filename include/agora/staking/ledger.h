// AGORA - Staking Ledger
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Share-based accounting for the voting-token pool. Stakers hold shares; a
// share's value is the pool's underlying balance divided by the total share
// count, so rewards and slashing sent to the pool accrue proportionally.
//
// Underlying balance = token balance of the pool - total_deposit

#ifndef AGORA_STAKING_LEDGER_H
#define AGORA_STAKING_LEDGER_H

#include "agora/core/types.h"
#include "agora/governance/result.h"
#include "agora/governance/state.h"
#include "agora/governance/store.h"
#include "agora/staking/token.h"

#include <optional>

namespace agora {
namespace staking {

using governance::GovConfig;
using governance::GovError;
using governance::HandleResult;
using governance::PoolState;
using governance::TokenManager;

class Ledger {
public:
    Ledger(governance::GovStore& store, const TokenQuerier& token)
        : store_(store), token_(token) {}

    /// Pool token balance
    GovError PoolBalance(const GovConfig& config, const PoolState& state,
                         Amount& balance) const;

    /// Pool token balance minus deposits held for polls
    GovError TotalUnderlying(const GovConfig& config, const PoolState& state,
                             Amount& underlying) const;

    /// floor(share * underlying / total_share); 0 when nothing is staked
    GovError QuotedBalance(const GovConfig& config, const PoolState& state,
                           const TokenManager& manager, Amount& balance) const;

    /**
     * Credit amount, already received by the pool, to staker as new shares.
     * Updates state in place; the caller persists it.
     */
    HandleResult Stake(const GovConfig& config, PoolState& state,
                       const Address& staker, Amount amount);

    /**
     * Burn ceil(amount * total_share / underlying) shares, capped at the
     * staker's share (amount defaults to the full balance), and emit a
     * transfer back to the staker. Locks on polls no longer in
     * progress are dropped first.
     */
    HandleResult Withdraw(const GovConfig& config, PoolState& state,
                          const Address& staker, std::optional<Amount> amount);

    /**
     * Record info as the staker's lock on pollId. Fails AlreadyVoted if a
     * lock exists and InsufficientStake if info.balance exceeds the quoted
     * balance.
     */
    HandleResult LockForVote(const GovConfig& config, const PoolState& state,
                             const Address& staker, PollId pollId,
                             const governance::VoterInfo& info);

private:
    /// Remove locks (and their voter records) for polls not in progress
    GovError ReleaseSettledLocks(const Address& staker, TokenManager& manager);

    governance::GovStore& store_;
    const TokenQuerier& token_;
};

} // namespace staking
} // namespace agora

#endif // AGORA_STAKING_LEDGER_H
