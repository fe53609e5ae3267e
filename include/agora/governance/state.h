// AGORA - Governance State Records
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Persistent records of the governance engine:
// - GovConfig: policy parameters, set at instantiation, owner-mutable
// - PoolState: poll counter and pool-wide share/deposit totals
// - Poll: a proposal with its tallies and ordered execution payload
// - VoterInfo / TokenManager: per-voter locks and per-staker shares

#ifndef AGORA_GOVERNANCE_STATE_H
#define AGORA_GOVERNANCE_STATE_H

#include "agora/core/decimal.h"
#include "agora/core/serialize.h"
#include "agora/core/types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Enumerations
// ============================================================================

/// Poll lifecycle status
enum class PollStatus : uint8_t {
    /// Accepting votes until end_height
    InProgress = 0,

    /// Quorum and threshold met, awaiting execution
    Passed = 1,

    /// Quorum or threshold not met; deposit forfeited
    Rejected = 2,

    /// Delegated calls dispatched
    Executed = 3,

    /// Passed but never executed before the expiration height
    Expired = 4
};

const char* PollStatusToString(PollStatus status);

/// Parse "in_progress", "passed", ... (as produced by PollStatusToString)
std::optional<PollStatus> ParsePollStatus(const std::string& str);

enum class VoteOption : uint8_t {
    Yes = 0,
    No = 1
};

/// "yes" or "no"
const char* VoteOptionToString(VoteOption option);

// ============================================================================
// Configuration
// ============================================================================

struct GovConfig {
    Address owner;

    /// Governed token; empty until RegisterToken
    Address token;

    /// Minimum participation ratio, in [0, 1]
    Decimal quorum;

    /// Minimum yes ratio of tallied votes, in [0, 1] (strictly exceeded)
    Decimal threshold;

    BlockHeight votingPeriod{0};
    BlockHeight timelockPeriod{0};
    BlockHeight expirationPeriod{0};
    Amount proposalDeposit{0};

    /// Lead time before end_height during which a snapshot may be taken
    BlockHeight snapshotPeriod{0};

    bool HasToken() const { return !token.empty(); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, owner);
        ::agora::Serialize(s, token);
        ::agora::Serialize(s, quorum);
        ::agora::Serialize(s, threshold);
        ::agora::Serialize(s, votingPeriod);
        ::agora::Serialize(s, timelockPeriod);
        ::agora::Serialize(s, expirationPeriod);
        ::agora::Serialize(s, proposalDeposit);
        ::agora::Serialize(s, snapshotPeriod);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::agora::Unserialize(s, owner);
        ::agora::Unserialize(s, token);
        ::agora::Unserialize(s, quorum);
        ::agora::Unserialize(s, threshold);
        ::agora::Unserialize(s, votingPeriod);
        ::agora::Unserialize(s, timelockPeriod);
        ::agora::Unserialize(s, expirationPeriod);
        ::agora::Unserialize(s, proposalDeposit);
        ::agora::Unserialize(s, snapshotPeriod);
    }

    bool operator==(const GovConfig& o) const {
        return owner == o.owner && token == o.token && quorum == o.quorum &&
               threshold == o.threshold && votingPeriod == o.votingPeriod &&
               timelockPeriod == o.timelockPeriod &&
               expirationPeriod == o.expirationPeriod &&
               proposalDeposit == o.proposalDeposit &&
               snapshotPeriod == o.snapshotPeriod;
    }
};

// ============================================================================
// Pool State
// ============================================================================

struct PoolState {
    /// Address holding the pooled tokens
    Address contractAddress;

    /// Number of polls ever created; the next id is pollCount + 1
    uint64_t pollCount{0};

    Amount totalShare{0};

    /// Deposits of unresolved and rejected polls held by the pool
    Amount totalDeposit{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, contractAddress);
        ::agora::Serialize(s, pollCount);
        ::agora::Serialize(s, totalShare);
        ::agora::Serialize(s, totalDeposit);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::agora::Unserialize(s, contractAddress);
        ::agora::Unserialize(s, pollCount);
        ::agora::Unserialize(s, totalShare);
        ::agora::Unserialize(s, totalDeposit);
    }
};

// ============================================================================
// Poll
// ============================================================================

/// One delegated operation of a poll
struct ExecuteData {
    /// Dispatch position; lower runs first
    uint64_t order{0};
    Address target;

    /// Relayed unchanged to the target
    Bytes payload;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, order);
        ::agora::Serialize(s, target);
        ::agora::Serialize(s, payload);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::agora::Unserialize(s, order);
        ::agora::Unserialize(s, target);
        ::agora::Unserialize(s, payload);
    }

    bool operator==(const ExecuteData& o) const {
        return order == o.order && target == o.target && payload == o.payload;
    }
};

struct Poll {
    PollId id{0};
    Address creator;
    PollStatus status{PollStatus::InProgress};
    Amount yesVotes{0};
    Amount noVotes{0};
    BlockHeight endHeight{0};
    std::string title;
    std::string description;
    std::optional<std::string> link;

    /// Sorted ascending by order at creation
    std::vector<ExecuteData> executeData;

    Amount depositAmount{0};

    /// Quorum denominator used when the poll was resolved
    std::optional<Amount> totalBalanceAtEndPoll;

    /// Pool balance captured by SnapshotPoll
    std::optional<Amount> stakedAmount;

    /// yes + no in 128 bits
    Uint128 TalliedVotes() const {
        return static_cast<Uint128>(yesVotes) + noVotes;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, id);
        ::agora::Serialize(s, creator);
        ::agora::Serialize(s, static_cast<uint8_t>(status));
        ::agora::Serialize(s, yesVotes);
        ::agora::Serialize(s, noVotes);
        ::agora::Serialize(s, endHeight);
        ::agora::Serialize(s, title);
        ::agora::Serialize(s, description);
        ::agora::Serialize(s, link);
        ::agora::Serialize(s, executeData);
        ::agora::Serialize(s, depositAmount);
        ::agora::Serialize(s, totalBalanceAtEndPoll);
        ::agora::Serialize(s, stakedAmount);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::agora::Unserialize(s, id);
        ::agora::Unserialize(s, creator);
        uint8_t rawStatus = 0;
        ::agora::Unserialize(s, rawStatus);
        if (rawStatus > static_cast<uint8_t>(PollStatus::Expired)) {
            throw std::ios_base::failure("Poll: unknown status");
        }
        status = static_cast<PollStatus>(rawStatus);
        ::agora::Unserialize(s, yesVotes);
        ::agora::Unserialize(s, noVotes);
        ::agora::Unserialize(s, endHeight);
        ::agora::Unserialize(s, title);
        ::agora::Unserialize(s, description);
        ::agora::Unserialize(s, link);
        ::agora::Unserialize(s, executeData);
        ::agora::Unserialize(s, depositAmount);
        ::agora::Unserialize(s, totalBalanceAtEndPoll);
        ::agora::Unserialize(s, stakedAmount);
    }
};

// ============================================================================
// Voter Records
// ============================================================================

struct VoterInfo {
    VoteOption vote{VoteOption::Yes};

    /// Weight cast, locked until the poll leaves InProgress
    Amount balance{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, static_cast<uint8_t>(vote));
        ::agora::Serialize(s, balance);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t rawVote = 0;
        ::agora::Unserialize(s, rawVote);
        if (rawVote > static_cast<uint8_t>(VoteOption::No)) {
            throw std::ios_base::failure("VoterInfo: unknown vote option");
        }
        vote = static_cast<VoteOption>(rawVote);
        ::agora::Unserialize(s, balance);
    }

    bool operator==(const VoterInfo& o) const {
        return vote == o.vote && balance == o.balance;
    }
};

/// A staker's pool shares and the votes it has outstanding
struct TokenManager {
    Amount share{0};
    std::map<PollId, VoterInfo> lockedBalance;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::agora::Serialize(s, share);
        ::agora::Serialize(s, lockedBalance);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::agora::Unserialize(s, share);
        ::agora::Unserialize(s, lockedBalance);
    }
};

// Free forwarding functions so the generic container serializers find records

template<typename Stream>
void Serialize(Stream& s, const GovConfig& config) {
    config.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, GovConfig& config) {
    config.Unserialize(s);
}

template<typename Stream>
void Serialize(Stream& s, const PoolState& state) {
    state.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, PoolState& state) {
    state.Unserialize(s);
}

template<typename Stream>
void Serialize(Stream& s, const ExecuteData& data) {
    data.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, ExecuteData& data) {
    data.Unserialize(s);
}

template<typename Stream>
void Serialize(Stream& s, const Poll& poll) {
    poll.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, Poll& poll) {
    poll.Unserialize(s);
}

template<typename Stream>
void Serialize(Stream& s, const VoterInfo& info) {
    info.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, VoterInfo& info) {
    info.Unserialize(s);
}

template<typename Stream>
void Serialize(Stream& s, const TokenManager& manager) {
    manager.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, TokenManager& manager) {
    manager.Unserialize(s);
}

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_STATE_H
