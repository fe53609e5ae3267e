// AGORA - Governance State Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/errors.h"
#include "agora/governance/state.h"

namespace agora {
namespace governance {

const char* GovErrorToString(GovError error) {
    switch (error) {
        case GovError::OK: return "ok";
        case GovError::InvalidField: return "invalid_field";
        case GovError::InvalidRatio: return "invalid_ratio";
        case GovError::MissingHook: return "missing_hook";
        case GovError::Unauthorized: return "unauthorized";
        case GovError::PollNotInProgress: return "poll_not_in_progress";
        case GovError::VotingNotExpired: return "voting_not_expired";
        case GovError::PollNotPassed: return "poll_not_passed";
        case GovError::TimelockNotExpired: return "timelock_not_expired";
        case GovError::ExpirationNotReached: return "expiration_not_reached";
        case GovError::AlreadyVoted: return "already_voted";
        case GovError::SnapshotWindowNotOpen: return "snapshot_window_not_open";
        case GovError::SnapshotAlreadyTaken: return "snapshot_already_taken";
        case GovError::InsufficientFunds: return "insufficient_funds";
        case GovError::InsufficientStake: return "insufficient_stake";
        case GovError::InsufficientDeposit: return "insufficient_deposit";
        case GovError::NothingStaked: return "nothing_staked";
        case GovError::ExceedsBalance: return "exceeds_balance";
        case GovError::PollNotFound: return "poll_not_found";
        case GovError::NotInitialized: return "not_initialized";
        case GovError::StorageError: return "storage_error";
        case GovError::TokenQueryFailed: return "token_query_failed";
        case GovError::Overflow: return "overflow";
    }
    return "unknown";
}

const char* PollStatusToString(PollStatus status) {
    switch (status) {
        case PollStatus::InProgress: return "in_progress";
        case PollStatus::Passed: return "passed";
        case PollStatus::Rejected: return "rejected";
        case PollStatus::Executed: return "executed";
        case PollStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<PollStatus> ParsePollStatus(const std::string& str) {
    for (PollStatus status : {PollStatus::InProgress, PollStatus::Passed,
                              PollStatus::Rejected, PollStatus::Executed,
                              PollStatus::Expired}) {
        if (str == PollStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* VoteOptionToString(VoteOption option) {
    switch (option) {
        case VoteOption::Yes: return "yes";
        case VoteOption::No: return "no";
    }
    return "unknown";
}

} // namespace governance
} // namespace agora
