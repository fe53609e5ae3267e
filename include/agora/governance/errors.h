// AGORA - Governance Error Codes
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_GOVERNANCE_ERRORS_H
#define AGORA_GOVERNANCE_ERRORS_H

namespace agora {
namespace governance {

/// Reason an engine operation or query was rejected
enum class GovError {
    OK = 0,

    // Validation
    InvalidField,
    InvalidRatio,
    MissingHook,

    // Authorization
    Unauthorized,

    // Guards
    PollNotInProgress,
    VotingNotExpired,
    PollNotPassed,
    TimelockNotExpired,
    ExpirationNotReached,
    AlreadyVoted,
    SnapshotWindowNotOpen,
    SnapshotAlreadyTaken,

    // Resources
    InsufficientFunds,
    InsufficientStake,
    InsufficientDeposit,
    NothingStaked,
    ExceedsBalance,

    // Missing records
    PollNotFound,
    NotInitialized,

    // Infrastructure
    StorageError,
    TokenQueryFailed,
    Overflow
};

/// Stable name of an error code
const char* GovErrorToString(GovError error);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_ERRORS_H
