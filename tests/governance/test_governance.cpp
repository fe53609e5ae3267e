// AGORA - Governance Engine Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "common/gov_fixture.h"

#include <variant>

using namespace agora;
using namespace agora::governance;
using namespace agora::test;

namespace {

const Amount SMALL_DEPOSIT = 100;

InitParams SmallDepositParams() {
    InitParams params = GovernanceTestBase::DefaultParams();
    params.proposalDeposit = SMALL_DEPOSIT;
    return params;
}

} // namespace

// ============================================================================
// Setup
// ============================================================================

class GovernanceSetupTest : public GovernanceTestBase {};

TEST_F(GovernanceSetupTest, InstantiateStoresConfig) {
    HandleResult result = engine_.Instantiate({TEST_OWNER, 0}, DefaultParams());
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "instantiate"}, {"owner", TEST_OWNER}}));

    GovConfig config;
    ASSERT_EQ(engine_.QueryConfig(config), GovError::OK);
    EXPECT_EQ(config.owner, TEST_OWNER);
    EXPECT_FALSE(config.HasToken());
    EXPECT_EQ(config.quorum, Decimal::Percent(DEFAULT_QUORUM_PCT));
    EXPECT_EQ(config.threshold, Decimal::Percent(DEFAULT_THRESHOLD_PCT));
    EXPECT_EQ(config.votingPeriod, DEFAULT_VOTING_PERIOD);
    EXPECT_EQ(config.timelockPeriod, DEFAULT_TIMELOCK_PERIOD);
    EXPECT_EQ(config.expirationPeriod, DEFAULT_EXPIRATION_PERIOD);
    EXPECT_EQ(config.proposalDeposit, DEFAULT_PROPOSAL_DEPOSIT);
    EXPECT_EQ(config.snapshotPeriod, DEFAULT_SNAPSHOT_PERIOD);

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.pollCount, 0u);
    EXPECT_EQ(state.totalShare, 0u);
    EXPECT_EQ(state.totalDeposit, 0u);

    HandleResult again = engine_.Instantiate({TEST_OWNER, 0}, DefaultParams());
    EXPECT_EQ(again.error, GovError::Unauthorized);
    EXPECT_EQ(again.reason, "Already instantiated");
}

TEST_F(GovernanceSetupTest, InstantiateRejectsBadRatio) {
    InitParams params = DefaultParams();
    params.quorum = Decimal::Percent(101);

    HandleResult result = engine_.Instantiate({TEST_OWNER, 0}, params);
    EXPECT_EQ(result.error, GovError::InvalidRatio);
    EXPECT_EQ(result.reason, "quorum must be 0 to 1");

    GovConfig config;
    EXPECT_EQ(engine_.QueryConfig(config), GovError::NotInitialized);
}

TEST_F(GovernanceSetupTest, OperationsRequireInstantiation) {
    HandleResult result = Stake(TEST_VOTER, 100);
    EXPECT_EQ(result.error, GovError::NotInitialized);
    EXPECT_EQ(result.reason, "Contract is not instantiated");

    EXPECT_EQ(engine_.EndPoll({TEST_VOTER, 1}, 1).error, GovError::NotInitialized);

    StakerResponse staker;
    EXPECT_EQ(engine_.QueryStaker(TEST_VOTER, staker), GovError::NotInitialized);
}

TEST_F(GovernanceSetupTest, RegisterTokenOnceByOwner) {
    ASSERT_TRUE(engine_.Instantiate({TEST_OWNER, 0}, DefaultParams()).IsOk());

    EXPECT_EQ(engine_.RegisterToken({TEST_VOTER, 0}, VOTING_TOKEN).error,
              GovError::Unauthorized);

    HandleResult result = engine_.RegisterToken({TEST_OWNER, 0}, VOTING_TOKEN);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("token"), std::optional<std::string>(VOTING_TOKEN));

    EXPECT_EQ(engine_.RegisterToken({TEST_OWNER, 0}, "other_token").error,
              GovError::Unauthorized);

    GovConfig config;
    ASSERT_EQ(engine_.QueryConfig(config), GovError::OK);
    EXPECT_EQ(config.token, VOTING_TOKEN);
}

TEST_F(GovernanceSetupTest, UpdateConfigOwnerOnly) {
    Setup();

    ConfigUpdate update;
    update.quorum = Decimal::Percent(40);
    EXPECT_EQ(engine_.UpdateConfig({TEST_VOTER, 0}, update).error, GovError::Unauthorized);

    update.owner = std::string(TEST_VOTER);
    HandleResult result = engine_.UpdateConfig({TEST_OWNER, 0}, update);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("action"), std::optional<std::string>("update_config"));

    GovConfig config;
    ASSERT_EQ(engine_.QueryConfig(config), GovError::OK);
    EXPECT_EQ(config.owner, TEST_VOTER);
    EXPECT_EQ(config.quorum, Decimal::Percent(40));
    EXPECT_EQ(config.threshold, Decimal::Percent(DEFAULT_THRESHOLD_PCT));

    // Ownership moved with the same update
    EXPECT_EQ(engine_.UpdateConfig({TEST_OWNER, 0}, ConfigUpdate()).error,
              GovError::Unauthorized);

    ConfigUpdate bad;
    bad.threshold = Decimal::Percent(150);
    bad.votingPeriod = 5;
    HandleResult rejected = engine_.UpdateConfig({TEST_VOTER, 0}, bad);
    EXPECT_EQ(rejected.error, GovError::InvalidRatio);
    EXPECT_EQ(rejected.reason, "threshold must be 0 to 1");

    ASSERT_EQ(engine_.QueryConfig(config), GovError::OK);
    EXPECT_EQ(config.votingPeriod, DEFAULT_VOTING_PERIOD);
}

// ============================================================================
// Deposits
// ============================================================================

class GovernanceReceiveTest : public GovernanceTestBase {
protected:
    void SetUp() override { Setup(); }
};

TEST_F(GovernanceReceiveTest, OnlyRegisteredTokenMayNotify) {
    DepositNotification msg;
    msg.sender = TEST_VOTER;
    msg.amount = 100;
    msg.hook = ReceiveHook{StakeVotingTokens{}};

    HandleResult result = engine_.Receive({"fake_token", 0}, msg);
    EXPECT_EQ(result.error, GovError::Unauthorized);
    EXPECT_EQ(result.reason, "unauthorized");
}

TEST_F(GovernanceReceiveTest, HookRequired) {
    HandleResult result = Deposit(TEST_VOTER, 100, std::nullopt);
    EXPECT_EQ(result.error, GovError::MissingHook);
    EXPECT_EQ(result.reason, "Data should be given");
}

TEST_F(GovernanceReceiveTest, CreatePoll) {
    HandleResult result = OpenPoll(12345);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "create_poll"},
                                      {"creator", TEST_CREATOR},
                                      {"poll_id", "1"},
                                      {"end_height", "22345"}}));

    Poll poll = GetPoll(1);
    EXPECT_EQ(poll.creator, TEST_CREATOR);
    EXPECT_EQ(poll.status, PollStatus::InProgress);
    EXPECT_EQ(poll.endHeight, 22345u);
    EXPECT_EQ(poll.depositAmount, DEFAULT_PROPOSAL_DEPOSIT);

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.pollCount, 1u);
    EXPECT_EQ(state.totalDeposit, DEFAULT_PROPOSAL_DEPOSIT);
    EXPECT_EQ(state.totalShare, 0u);
}

TEST_F(GovernanceReceiveTest, FailedCreateLeavesStateUnchanged) {
    CreatePoll request = PollRequest();
    request.title = "a";
    HandleResult result = OpenPoll(0, request);
    EXPECT_EQ(result.error, GovError::InvalidField);
    EXPECT_EQ(result.reason, "Title too short");

    result = OpenPoll(0, PollRequest(), DEFAULT_PROPOSAL_DEPOSIT - 1);
    EXPECT_EQ(result.error, GovError::InsufficientDeposit);

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.pollCount, 0u);
    EXPECT_EQ(state.totalDeposit, 0u);

    Poll poll;
    EXPECT_EQ(engine_.QueryPoll(1, poll), GovError::PollNotFound);
}

TEST_F(GovernanceReceiveTest, TokenQueryFailureRejectsStake) {
    token_.SetUnavailable(true);
    HandleResult result = Stake(TEST_VOTER, 100);
    EXPECT_EQ(result.error, GovError::TokenQueryFailed);
    token_.SetUnavailable(false);

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.totalShare, 0u);
}

TEST_F(GovernanceReceiveTest, TotalShareMatchesStakerShares) {
    ASSERT_TRUE(Stake(TEST_VOTER, 100).IsOk());
    ASSERT_TRUE(Stake(TEST_VOTER_2, 300).IsOk());
    SetPool(pool_ + 200);  // rewards
    ASSERT_TRUE(Stake(TEST_VOTER_3, 60).IsOk());

    HandleResult withdrawn = engine_.WithdrawVotingTokens({TEST_VOTER_2, 0}, Amount{150});
    ASSERT_TRUE(withdrawn.IsOk()) << withdrawn.reason;
    Settle(withdrawn);

    Amount sum = 0;
    for (const char* staker : {TEST_VOTER, TEST_VOTER_2, TEST_VOTER_3}) {
        StakerResponse response;
        ASSERT_EQ(engine_.QueryStaker(staker, response), GovError::OK);
        sum += response.share;
    }

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.totalShare, sum);
}

// ============================================================================
// Voting
// ============================================================================

class GovernanceVoteTest : public GovernanceTestBase {
protected:
    void SetUp() override {
        Setup(SmallDepositParams());
        ASSERT_TRUE(OpenPoll(0, PollRequest(), SMALL_DEPOSIT).IsOk());
    }
};

TEST_F(GovernanceVoteTest, CastVote) {
    ASSERT_TRUE(Stake(TEST_VOTER, 11).IsOk());

    HandleResult result = engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 10);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "cast_vote"},
                                      {"poll_id", "1"},
                                      {"amount", "10"},
                                      {"voter", TEST_VOTER},
                                      {"vote_option", "yes"}}));

    Poll poll = GetPoll(1);
    EXPECT_EQ(poll.yesVotes, 10u);
    EXPECT_EQ(poll.noVotes, 0u);
    EXPECT_FALSE(poll.stakedAmount.has_value());

    StakerResponse staker;
    ASSERT_EQ(engine_.QueryStaker(TEST_VOTER, staker), GovError::OK);
    EXPECT_EQ(staker.balance, 11u);
    EXPECT_EQ(staker.share, 11u);
    ASSERT_EQ(staker.lockedBalance.size(), 1u);
    EXPECT_EQ(staker.lockedBalance[0].first, 1u);
    EXPECT_EQ(staker.lockedBalance[0].second, (VoterInfo{VoteOption::Yes, 10}));
}

TEST_F(GovernanceVoteTest, SecondVoteRejected) {
    ASSERT_TRUE(Stake(TEST_VOTER, 11).IsOk());
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 10).IsOk());

    HandleResult again = engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::No, 1);
    EXPECT_EQ(again.error, GovError::AlreadyVoted);
    EXPECT_EQ(again.reason, "User has already voted.");
    EXPECT_EQ(GetPoll(1).noVotes, 0u);
}

TEST_F(GovernanceVoteTest, VoteBeyondStakeRejected) {
    ASSERT_TRUE(Stake(TEST_VOTER, 10).IsOk());

    HandleResult result = engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 11);
    EXPECT_EQ(result.error, GovError::InsufficientStake);
    EXPECT_EQ(result.reason, "User does not have enough staked tokens.");

    StakerResponse staker;
    ASSERT_EQ(engine_.QueryStaker(TEST_VOTER, staker), GovError::OK);
    EXPECT_TRUE(staker.lockedBalance.empty());
}

TEST_F(GovernanceVoteTest, VoteWindow) {
    ASSERT_TRUE(Stake(TEST_VOTER, 10).IsOk());
    ASSERT_TRUE(Stake(TEST_VOTER_2, 10).IsOk());

    HandleResult late = engine_.CastVote({TEST_VOTER, DEFAULT_VOTING_PERIOD + 1}, 1,
                                         VoteOption::Yes, 10);
    EXPECT_EQ(late.error, GovError::PollNotInProgress);
    EXPECT_EQ(late.reason, "Poll is not in progress");

    EXPECT_TRUE(engine_.CastVote({TEST_VOTER_2, DEFAULT_VOTING_PERIOD}, 1,
                                 VoteOption::No, 10).IsOk());

    HandleResult missing = engine_.CastVote({TEST_VOTER, 0}, 2, VoteOption::Yes, 10);
    EXPECT_EQ(missing.error, GovError::PollNotFound);
    EXPECT_EQ(missing.reason, "Poll does not exist");
}

TEST_F(GovernanceVoteTest, LocksDoNotRestrictWithdraw) {
    ASSERT_TRUE(Stake(TEST_VOTER, 11).IsOk());
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 10).IsOk());

    HandleResult tooMuch = engine_.WithdrawVotingTokens({TEST_VOTER, 0}, Amount{12});
    EXPECT_EQ(tooMuch.error, GovError::ExceedsBalance);

    HandleResult result = engine_.WithdrawVotingTokens({TEST_VOTER, 0}, Amount{11});
    ASSERT_TRUE(result.IsOk()) << result.reason;
    ASSERT_EQ(result.effects.size(), 1u);
    EXPECT_EQ(std::get<TokenTransfer>(result.effects[0]),
              (TokenTransfer{VOTING_TOKEN, TEST_VOTER, 11}));
    Settle(result);

    StakerResponse staker;
    ASSERT_EQ(engine_.QueryStaker(TEST_VOTER, staker), GovError::OK);
    EXPECT_EQ(staker.balance, 0u);
    EXPECT_EQ(staker.share, 0u);
    EXPECT_EQ(staker.lockedBalance.size(), 1u);

    // Tally is untouched by the withdrawal
    EXPECT_EQ(GetPoll(1).yesVotes, 10u);
}

TEST_F(GovernanceVoteTest, WithdrawWithoutStake) {
    HandleResult result = engine_.WithdrawVotingTokens({TEST_VOTER, 0}, std::nullopt);
    EXPECT_EQ(result.error, GovError::NothingStaked);
}

// ============================================================================
// Resolution
// ============================================================================

class GovernanceEndPollTest : public GovernanceTestBase {
protected:
    const BlockHeight AFTER_END = DEFAULT_VOTING_PERIOD + 1;

    void SetUp() override {
        Setup(SmallDepositParams());
        ASSERT_TRUE(OpenPoll(0, PollRequest(), SMALL_DEPOSIT).IsOk());
        ASSERT_TRUE(Stake(TEST_VOTER, 1000).IsOk());
    }
};

TEST_F(GovernanceEndPollTest, PassedRefundsDeposit) {
    EXPECT_EQ(pool_, 1100u);
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 1000).IsOk());

    HandleResult result = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "end_poll"},
                                      {"poll_id", "1"},
                                      {"rejected_reason", ""},
                                      {"passed", "true"}}));
    ASSERT_EQ(result.effects.size(), 1u);
    EXPECT_EQ(std::get<TokenTransfer>(result.effects[0]),
              (TokenTransfer{VOTING_TOKEN, TEST_CREATOR, SMALL_DEPOSIT}));

    Poll poll = GetPoll(1);
    EXPECT_EQ(poll.status, PollStatus::Passed);
    EXPECT_EQ(poll.totalBalanceAtEndPoll, std::optional<Amount>(1000));

    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.totalDeposit, 0u);
}

TEST_F(GovernanceEndPollTest, QuorumNotReached) {
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 10).IsOk());

    HandleResult result = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("rejected_reason"),
              std::optional<std::string>("Quorum not reached"));
    EXPECT_EQ(result.GetAttribute("passed"), std::optional<std::string>("false"));
    EXPECT_TRUE(result.effects.empty());

    EXPECT_EQ(GetPoll(1).status, PollStatus::Rejected);

    // Forfeited deposit stays in the pool
    StateResponse state;
    ASSERT_EQ(engine_.QueryState(state), GovError::OK);
    EXPECT_EQ(state.totalDeposit, SMALL_DEPOSIT);
}

TEST_F(GovernanceEndPollTest, ThresholdMustBeExceeded) {
    ASSERT_TRUE(engine_.WithdrawVotingTokens({TEST_VOTER, 0}, Amount{500}).IsOk());
    SetPool(pool_ - 500);
    ASSERT_TRUE(Stake(TEST_VOTER_2, 500).IsOk());

    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 500).IsOk());
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER_2, 0}, 1, VoteOption::No, 500).IsOk());

    HandleResult result = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("rejected_reason"),
              std::optional<std::string>("Threshold not reached"));
    EXPECT_TRUE(result.effects.empty());
}

TEST_F(GovernanceEndPollTest, EndPollGuards) {
    HandleResult early = engine_.EndPoll({TEST_CREATOR, DEFAULT_VOTING_PERIOD}, 1);
    EXPECT_EQ(early.error, GovError::VotingNotExpired);
    EXPECT_EQ(early.reason, "Voting period has not expired");

    ASSERT_TRUE(engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1).IsOk());

    HandleResult again = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    EXPECT_EQ(again.error, GovError::PollNotInProgress);

    EXPECT_EQ(engine_.EndPoll({TEST_CREATOR, AFTER_END}, 9).error, GovError::PollNotFound);
}

TEST_F(GovernanceEndPollTest, SettledLocksLeaveStakerView) {
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 1000).IsOk());
    ASSERT_TRUE(engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1).IsOk());

    StakerResponse staker;
    ASSERT_EQ(engine_.QueryStaker(TEST_VOTER, staker), GovError::OK);
    EXPECT_TRUE(staker.lockedBalance.empty());

    std::vector<VoterResponse> voters;
    ASSERT_EQ(engine_.QueryVoters(VotersQuery{1, std::nullopt, std::nullopt, std::nullopt},
                                  voters), GovError::OK);
    EXPECT_TRUE(voters.empty());
}

// ============================================================================
// Snapshot
// ============================================================================

class GovernanceSnapshotTest : public GovernanceEndPollTest {
protected:
    const BlockHeight WINDOW_START = DEFAULT_VOTING_PERIOD - DEFAULT_SNAPSHOT_PERIOD;
};

TEST_F(GovernanceSnapshotTest, SnapshotWindow) {
    HandleResult early = engine_.SnapshotPoll({TEST_VOTER, WINDOW_START - 1}, 1);
    EXPECT_EQ(early.error, GovError::SnapshotWindowNotOpen);
    EXPECT_EQ(early.reason, "Cannot snapshot at this height");

    HandleResult result = engine_.SnapshotPoll({TEST_VOTER, WINDOW_START}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "snapshot_poll"},
                                      {"poll_id", "1"},
                                      {"staked_amount", "1000"}}));
    EXPECT_EQ(GetPoll(1).stakedAmount, std::optional<Amount>(1000));

    HandleResult again = engine_.SnapshotPoll({TEST_VOTER, WINDOW_START + 1}, 1);
    EXPECT_EQ(again.error, GovError::SnapshotAlreadyTaken);
    EXPECT_EQ(again.reason, "Snapshot has already occurred");

    HandleResult late = engine_.SnapshotPoll({TEST_VOTER, AFTER_END}, 1);
    EXPECT_EQ(late.error, GovError::PollNotInProgress);
}

TEST_F(GovernanceSnapshotTest, SnapshotFixesQuorumBase) {
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 1000).IsOk());
    ASSERT_TRUE(engine_.SnapshotPoll({TEST_VOTER, WINDOW_START}, 1).IsOk());

    // Late stake would push participation below quorum
    ASSERT_TRUE(Stake(TEST_VOTER_2, 5000).IsOk());

    HandleResult result = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("passed"), std::optional<std::string>("true"));
    EXPECT_EQ(GetPoll(1).totalBalanceAtEndPoll, std::optional<Amount>(1000));
}

TEST_F(GovernanceSnapshotTest, LiveBalanceWithoutSnapshot) {
    ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, 1, VoteOption::Yes, 1000).IsOk());
    ASSERT_TRUE(Stake(TEST_VOTER_2, 5000).IsOk());

    HandleResult result = engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("rejected_reason"),
              std::optional<std::string>("Quorum not reached"));
    EXPECT_EQ(GetPoll(1).totalBalanceAtEndPoll, std::optional<Amount>(6000));
}

// ============================================================================
// Execution and Expiry
// ============================================================================

class GovernanceExecuteTest : public GovernanceTestBase {
protected:
    const BlockHeight AFTER_END = DEFAULT_VOTING_PERIOD + 1;
    const BlockHeight UNLOCKED = DEFAULT_VOTING_PERIOD + DEFAULT_TIMELOCK_PERIOD;
    const BlockHeight EXPIRES = DEFAULT_VOTING_PERIOD + DEFAULT_EXPIRATION_PERIOD;

    void SetUp() override {
        Setup(SmallDepositParams());
        ASSERT_TRUE(Stake(TEST_VOTER, 1000).IsOk());
    }

    /// Create poll id with the given operations and carry it to Passed
    void PassPoll(PollId id, std::vector<ExecuteData> ops = {}) {
        CreatePoll request = PollRequest();
        request.executeData = std::move(ops);
        ASSERT_TRUE(OpenPoll(0, request, SMALL_DEPOSIT).IsOk());
        ASSERT_TRUE(engine_.CastVote({TEST_VOTER, 0}, id, VoteOption::Yes, 1000).IsOk());
        HandleResult ended = engine_.EndPoll({TEST_CREATOR, AFTER_END}, id);
        ASSERT_TRUE(ended.IsOk()) << ended.reason;
        ASSERT_EQ(ended.GetAttribute("passed"), std::optional<std::string>("true"));
        Settle(ended);
    }
};

TEST_F(GovernanceExecuteTest, ExecutesInOrder) {
    PassPoll(1, {ExecuteData{3, "target_3", Bytes{0x03}},
                 ExecuteData{1, "target_1", Bytes{0x01}},
                 ExecuteData{2, "target_2", Bytes{0x02}}});

    HandleResult locked = engine_.ExecutePoll({TEST_VOTER, UNLOCKED - 1}, 1);
    EXPECT_EQ(locked.error, GovError::TimelockNotExpired);
    EXPECT_EQ(locked.reason, "Timelock period has not expired");

    HandleResult result = engine_.ExecutePoll({TEST_VOTER, UNLOCKED}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.attributes,
              (std::vector<Attribute>{{"action", "execute_poll"}, {"poll_id", "1"}}));

    ASSERT_EQ(result.effects.size(), 3u);
    EXPECT_EQ(std::get<DelegatedCall>(result.effects[0]), (DelegatedCall{"target_1", Bytes{0x01}}));
    EXPECT_EQ(std::get<DelegatedCall>(result.effects[1]), (DelegatedCall{"target_2", Bytes{0x02}}));
    EXPECT_EQ(std::get<DelegatedCall>(result.effects[2]), (DelegatedCall{"target_3", Bytes{0x03}}));

    EXPECT_EQ(GetPoll(1).status, PollStatus::Executed);

    HandleResult again = engine_.ExecutePoll({TEST_VOTER, UNLOCKED}, 1);
    EXPECT_EQ(again.error, GovError::PollNotPassed);
    EXPECT_EQ(again.reason, "Poll is not in passed status");
    EXPECT_EQ(engine_.ExpirePoll({TEST_VOTER, EXPIRES}, 1).error, GovError::PollNotPassed);
}

TEST_F(GovernanceExecuteTest, ExecuteWithoutOperations) {
    PassPoll(1);
    HandleResult result = engine_.ExecutePoll({TEST_VOTER, UNLOCKED}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_TRUE(result.effects.empty());
}

TEST_F(GovernanceExecuteTest, RejectedPollCannotExecute) {
    ASSERT_TRUE(OpenPoll(0, PollRequest(), SMALL_DEPOSIT).IsOk());
    ASSERT_TRUE(engine_.EndPoll({TEST_CREATOR, AFTER_END}, 1).IsOk());
    EXPECT_EQ(GetPoll(1).status, PollStatus::Rejected);

    EXPECT_EQ(engine_.ExecutePoll({TEST_VOTER, UNLOCKED}, 1).error, GovError::PollNotPassed);
    EXPECT_EQ(engine_.ExpirePoll({TEST_VOTER, EXPIRES}, 1).error, GovError::PollNotPassed);
    EXPECT_EQ(engine_.ExecutePoll({TEST_VOTER, UNLOCKED}, 5).error, GovError::PollNotFound);
}

TEST_F(GovernanceExecuteTest, ExpirePassedPoll) {
    PassPoll(1, {ExecuteData{1, "target_1", Bytes{0x01}}});

    HandleResult early = engine_.ExpirePoll({TEST_VOTER, EXPIRES - 1}, 1);
    EXPECT_EQ(early.error, GovError::ExpirationNotReached);
    EXPECT_EQ(early.reason, "Expire height has not been reached");

    HandleResult result = engine_.ExpirePoll({TEST_VOTER, EXPIRES}, 1);
    ASSERT_TRUE(result.IsOk()) << result.reason;
    EXPECT_EQ(result.GetAttribute("action"), std::optional<std::string>("expire_poll"));
    EXPECT_EQ(GetPoll(1).status, PollStatus::Expired);

    EXPECT_EQ(engine_.ExecutePoll({TEST_VOTER, EXPIRES}, 1).error, GovError::PollNotPassed);
}
