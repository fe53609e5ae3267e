// AGORA - Poll Store Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/poll_store.h"
#include "agora/governance/params.h"
#include "agora/util/logging.h"

#include <algorithm>

namespace agora {
namespace governance {

namespace {

GovError CheckLength(const std::string& value, size_t minLen, size_t maxLen,
                     const char* field, std::string& reason) {
    if (value.size() < minLen) {
        reason = std::string(field) + " too short";
        return GovError::InvalidField;
    }
    if (value.size() > maxLen) {
        reason = std::string(field) + " too long";
        return GovError::InvalidField;
    }
    return GovError::OK;
}

} // namespace

GovError ValidatePollText(const CreatePoll& request, std::string& reason) {
    GovError err = CheckLength(request.title, MIN_TITLE_LENGTH, MAX_TITLE_LENGTH,
                               "Title", reason);
    if (err != GovError::OK) {
        return err;
    }
    err = CheckLength(request.description, MIN_DESC_LENGTH, MAX_DESC_LENGTH,
                      "Description", reason);
    if (err != GovError::OK) {
        return err;
    }
    if (request.link) {
        return CheckLength(*request.link, MIN_LINK_LENGTH, MAX_LINK_LENGTH, "Link", reason);
    }
    return GovError::OK;
}

HandleResult PollStore::Create(const GovConfig& config, PoolState& state,
                               BlockHeight height, const Address& creator,
                               Amount deposit, const CreatePoll& request, Poll& poll) {
    std::string reason;
    GovError err = ValidatePollText(request, reason);
    if (err != GovError::OK) {
        return HandleResult::Failure(err, reason);
    }

    if (deposit < config.proposalDeposit) {
        return HandleResult::Failure(
            GovError::InsufficientDeposit,
            "Must deposit more than " + std::to_string(config.proposalDeposit) + " token");
    }

    auto endHeight = CheckedAdd(height, config.votingPeriod);
    auto totalDeposit = CheckedAdd(state.totalDeposit, deposit);
    if (!endHeight || !totalDeposit) {
        return HandleResult::Failure(GovError::Overflow);
    }

    poll = Poll();
    poll.id = state.pollCount + 1;
    poll.creator = creator;
    poll.status = PollStatus::InProgress;
    poll.endHeight = *endHeight;
    poll.title = request.title;
    poll.description = request.description;
    poll.link = request.link;
    poll.executeData = request.executeData;
    poll.depositAmount = deposit;
    std::stable_sort(poll.executeData.begin(), poll.executeData.end(),
                     [](const ExecuteData& a, const ExecuteData& b) {
                         return a.order < b.order;
                     });

    HandleResult saved = Save(poll);
    if (!saved.IsOk()) {
        return saved;
    }

    state.pollCount = poll.id;
    state.totalDeposit = *totalDeposit;

    LOG_DEBUG(util::LogCategory::GOV) << "Poll " << poll.id << " by " << creator
                                      << " with " << poll.executeData.size()
                                      << " operations";

    HandleResult result = HandleResult::Success();
    result.AddAttribute("action", "create_poll")
          .AddAttribute("creator", creator)
          .AddAttribute("poll_id", std::to_string(poll.id))
          .AddAttribute("end_height", std::to_string(poll.endHeight));
    return result;
}

HandleResult PollStore::Load(PollId id, Poll& poll) const {
    db::Status s = store_.ReadPoll(id, poll);
    if (s.IsNotFound()) {
        return HandleResult::Failure(GovError::PollNotFound, "Poll does not exist");
    }
    if (!s.ok()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }
    return HandleResult::Success();
}

HandleResult PollStore::Save(const Poll& poll) {
    db::Status s = store_.WritePoll(poll);
    if (!s.ok()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }
    return HandleResult::Success();
}

HandleResult PollStore::CheckNotVoted(PollId pollId, const Address& voter) const {
    VoterInfo info;
    db::Status s = store_.ReadVoter(pollId, voter, info);
    if (s.ok()) {
        return HandleResult::Failure(GovError::AlreadyVoted, "User has already voted.");
    }
    if (!s.IsNotFound()) {
        return HandleResult::Failure(GovError::StorageError, s.ToString());
    }
    return HandleResult::Success();
}

} // namespace governance
} // namespace agora
