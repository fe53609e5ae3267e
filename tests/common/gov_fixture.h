// AGORA - Governance Engine Test Fixture
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_TESTS_COMMON_GOV_FIXTURE_H
#define AGORA_TESTS_COMMON_GOV_FIXTURE_H

#include <gtest/gtest.h>

#include "agora/db/memorydb.h"
#include "agora/governance/engine.h"
#include "common/mock_token.h"

namespace agora {
namespace test {

/// Engine over an in-memory database with a scripted token balance
class GovernanceTestBase : public ::testing::Test {
public:
    static governance::InitParams DefaultParams() {
        governance::InitParams params;
        params.quorum = Decimal::Percent(DEFAULT_QUORUM_PCT);
        params.threshold = Decimal::Percent(DEFAULT_THRESHOLD_PCT);
        params.votingPeriod = DEFAULT_VOTING_PERIOD;
        params.timelockPeriod = DEFAULT_TIMELOCK_PERIOD;
        params.expirationPeriod = DEFAULT_EXPIRATION_PERIOD;
        params.proposalDeposit = DEFAULT_PROPOSAL_DEPOSIT;
        params.snapshotPeriod = DEFAULT_SNAPSHOT_PERIOD;
        params.contractAddress = CONTRACT_ADDR;
        return params;
    }

protected:
    db::MemoryDatabase db_;
    MockTokenQuerier token_;
    governance::GovernanceEngine engine_{db_, token_};

    /// Pool balance as reported by the token
    Amount pool_{0};

    /// Instantiate and register VOTING_TOKEN
    void Setup(const governance::InitParams& params = DefaultParams()) {
        governance::HandleResult init = engine_.Instantiate({TEST_OWNER, 0}, params);
        ASSERT_TRUE(init.IsOk()) << init.reason;
        governance::HandleResult reg = engine_.RegisterToken({TEST_OWNER, 0}, VOTING_TOKEN);
        ASSERT_TRUE(reg.IsOk()) << reg.reason;
    }

    void SetPool(Amount amount) {
        pool_ = amount;
        token_.SetBalance(VOTING_TOKEN, CONTRACT_ADDR, amount);
    }

    /// Move amount into the pool and notify the engine as the token would
    governance::HandleResult Deposit(const Address& sender, Amount amount,
                                     std::optional<governance::ReceiveHook> hook,
                                     BlockHeight height = 0) {
        SetPool(pool_ + amount);
        governance::DepositNotification msg;
        msg.sender = sender;
        msg.amount = amount;
        msg.hook = std::move(hook);
        governance::HandleResult result = engine_.Receive({VOTING_TOKEN, height}, msg);
        if (!result.IsOk()) {
            SetPool(pool_ - amount);
        }
        return result;
    }

    governance::HandleResult Stake(const Address& staker, Amount amount) {
        return Deposit(staker, amount, governance::ReceiveHook{governance::StakeVotingTokens{}});
    }

    static governance::CreatePoll PollRequest() {
        governance::CreatePoll request;
        request.title = "test";
        request.description = "test";
        request.link = std::string("http://google.com");
        return request;
    }

    governance::HandleResult OpenPoll(BlockHeight height,
                                      const governance::CreatePoll& request = PollRequest(),
                                      Amount deposit = DEFAULT_PROPOSAL_DEPOSIT) {
        return Deposit(TEST_CREATOR, deposit, governance::ReceiveHook{request}, height);
    }

    /// Pay out a TokenTransfer emitted by the engine
    void Settle(const governance::HandleResult& result) {
        for (const auto& effect : result.effects) {
            if (const auto* transfer = std::get_if<governance::TokenTransfer>(&effect)) {
                SetPool(pool_ - transfer->amount);
            }
        }
    }

    governance::Poll GetPoll(PollId id) {
        governance::Poll poll;
        EXPECT_EQ(engine_.QueryPoll(id, poll), governance::GovError::OK);
        return poll;
    }
};

} // namespace test
} // namespace agora

#endif // AGORA_TESTS_COMMON_GOV_FIXTURE_H
