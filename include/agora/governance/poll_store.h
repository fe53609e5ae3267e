// AGORA - Poll Store
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Creation and persistence of polls and of the per-poll voter records.

#ifndef AGORA_GOVERNANCE_POLL_STORE_H
#define AGORA_GOVERNANCE_POLL_STORE_H

#include "agora/governance/result.h"
#include "agora/governance/state.h"
#include "agora/governance/store.h"

#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace governance {

/// Poll-creation request carried by a deposit notification
struct CreatePoll {
    std::string title;
    std::string description;
    std::optional<std::string> link;

    /// Any order; sorted by ExecuteData::order on creation
    std::vector<ExecuteData> executeData;
};

/**
 * Check title, description and link lengths.
 * @param[out] reason "Title too short", "Link too long", ...
 */
GovError ValidatePollText(const CreatePoll& request, std::string& reason);

class PollStore {
public:
    explicit PollStore(GovStore& store) : store_(store) {}

    /**
     * Validate and store a new poll funded by deposit.
     *
     * On success the poll id is pollCount + 1, the poll ends at
     * height + votingPeriod, and state.pollCount and state.totalDeposit
     * are advanced. The caller persists state.
     *
     * @param[out] poll The stored poll
     */
    HandleResult Create(const GovConfig& config, PoolState& state, BlockHeight height,
                        const Address& creator, Amount deposit,
                        const CreatePoll& request, Poll& poll);

    /// Load a poll; PollNotFound with "Poll does not exist" if absent
    HandleResult Load(PollId id, Poll& poll) const;

    HandleResult Save(const Poll& poll);

    /// AlreadyVoted if voter has a vote recorded on the poll
    HandleResult CheckNotVoted(PollId pollId, const Address& voter) const;

    void RecordVote(PollId pollId, const Address& voter, const VoterInfo& info) {
        store_.WriteVoter(pollId, voter, info);
    }

private:
    GovStore& store_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_POLL_STORE_H
