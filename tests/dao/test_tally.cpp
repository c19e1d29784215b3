// PrivDAO - Tally and Timelock Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/dao/tally.h"
#include "privdao/dao/timelock.h"

#include <limits>

using namespace privdao;
using namespace privdao::dao;

class TallyTest : public ::testing::Test {
protected:
    void SetUp() override {
        authority_[0] = 0xAA;
        dao_.authority = authority_;
        dao_.quorumPercentage = 50;
        dao_.executionDelaySeconds = 3600;
        dao_.votingConfig = VotingConfig::TokenWeighted();

        proposal_.status = ProposalStatus::Voting;
        proposal_.votingEnd = 1000;
        proposal_.revealEnd = 1100;
    }

    void SetCounts(uint64_t commits, uint64_t reveals) {
        proposal_.commitCount = commits;
        proposal_.revealCount = reveals;
    }

    Identity authority_;
    DaoConfig dao_;
    Proposal proposal_;
};

// ============================================================================
// Quorum
// ============================================================================

TEST_F(TallyTest, QuorumBoundary) {
    EXPECT_FALSE(TallyEvaluator::QuorumMet(10, 4, 50));
    EXPECT_TRUE(TallyEvaluator::QuorumMet(10, 5, 50));
    EXPECT_TRUE(TallyEvaluator::QuorumMet(3, 3, 100));
    EXPECT_FALSE(TallyEvaluator::QuorumMet(3, 2, 100));
    EXPECT_TRUE(TallyEvaluator::QuorumMet(100, 1, 1));
}

TEST_F(TallyTest, NoCommitsNeverMeetsQuorum) {
    EXPECT_FALSE(TallyEvaluator::QuorumMet(0, 0, 1));
}

TEST_F(TallyTest, QuorumWithHugeCounts) {
    uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_TRUE(TallyEvaluator::QuorumMet(max, max / 2 + 1, 50));
    EXPECT_FALSE(TallyEvaluator::QuorumMet(max, max / 2 - 1, 50));
}

TEST_F(TallyTest, FailedQuorumFailsProposal) {
    SetCounts(10, 4);
    proposal_.yesCapital = 1000;
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Finalize(dao_, proposal_, 1100, outcome).ok());
    EXPECT_FALSE(outcome.quorumMet);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(proposal_.status, ProposalStatus::Failed);
}

// ============================================================================
// Voting Modes
// ============================================================================

TEST_F(TallyTest, TokenWeightedStrictMajority) {
    SetCounts(2, 2);
    proposal_.yesCapital = 500;
    proposal_.noCapital = 500;
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_TRUE(outcome.quorumMet);
    EXPECT_FALSE(outcome.passed);

    proposal_.yesCapital = 501;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_TRUE(outcome.passed);
}

TEST_F(TallyTest, QuadraticUsesCommunityChamber) {
    dao_.votingConfig = VotingConfig::Quadratic();
    SetCounts(3, 3);
    // One whale against two small holders
    proposal_.yesCapital = 10000;
    proposal_.yesCommunity = 100;
    proposal_.noCapital = 2 * 3600;
    proposal_.noCommunity = 2 * 60;
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_FALSE(outcome.passed);
}

TEST_F(TallyTest, ZeroWeightNeverPasses) {
    SetCounts(1, 1);
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_TRUE(outcome.quorumMet);
    EXPECT_FALSE(outcome.passed);
}

TEST_F(TallyTest, DualChamberNeedsBothThresholds) {
    dao_.votingConfig = VotingConfig::DualChamber(60, 40);
    SetCounts(10, 10);
    proposal_.yesCapital = 55;
    proposal_.noCapital = 45;
    proposal_.yesCommunity = 100;
    proposal_.noCommunity = 0;
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_FALSE(outcome.passed);

    proposal_.yesCapital = 60;
    proposal_.noCapital = 40;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_TRUE(outcome.passed);

    proposal_.yesCommunity = 39;
    proposal_.noCommunity = 61;
    ASSERT_TRUE(TallyEvaluator::Evaluate(dao_, proposal_, outcome).ok());
    EXPECT_FALSE(outcome.passed);
}

TEST_F(TallyTest, TallyOverflowIsArithmeticError) {
    SetCounts(2, 2);
    proposal_.yesCapital = std::numeric_limits<uint64_t>::max();
    proposal_.noCapital = 1;
    TallyOutcome outcome;
    Result r = TallyEvaluator::Finalize(dao_, proposal_, 1100, outcome);
    EXPECT_EQ(r.error(), DaoError::OVERFLOW);
    EXPECT_EQ(r.kind(), ErrorKind::Arithmetic);
    EXPECT_EQ(proposal_.status, ProposalStatus::Voting);
}

// ============================================================================
// Finalization
// ============================================================================

TEST_F(TallyTest, FinalizeWaitsForRevealEnd) {
    SetCounts(1, 1);
    proposal_.yesCapital = 10;
    TallyOutcome outcome;
    Result r = TallyEvaluator::Finalize(dao_, proposal_, proposal_.revealEnd - 1, outcome);
    EXPECT_EQ(r.error(), DaoError::REVEAL_STILL_OPEN);
    EXPECT_EQ(r.kind(), ErrorKind::Window);
    EXPECT_EQ(proposal_.status, ProposalStatus::Voting);
}

TEST_F(TallyTest, FinalizePassSchedulesTimelock) {
    SetCounts(1, 1);
    proposal_.yesCapital = 10;
    TallyOutcome outcome;
    ASSERT_TRUE(TallyEvaluator::Finalize(dao_, proposal_, 1200, outcome).ok());
    EXPECT_TRUE(outcome.passed);
    EXPECT_EQ(proposal_.status, ProposalStatus::Passed);
    EXPECT_EQ(proposal_.executionUnlocksAt, 1200 + 3600);

    Result r = TallyEvaluator::Finalize(dao_, proposal_, 1300, outcome);
    EXPECT_EQ(r.error(), DaoError::ALREADY_FINALIZED);
    EXPECT_EQ(r.kind(), ErrorKind::State);
    EXPECT_EQ(proposal_.executionUnlocksAt, 1200 + 3600);
}

TEST_F(TallyTest, FinalizeCancelledProposal) {
    proposal_.status = ProposalStatus::Cancelled;
    TallyOutcome outcome;
    EXPECT_EQ(TallyEvaluator::Finalize(dao_, proposal_, 1100, outcome).error(),
              DaoError::ALREADY_FINALIZED);
}

// ============================================================================
// Timelock
// ============================================================================

class TimelockTest : public TallyTest {
protected:
    void SetUp() override {
        TallyTest::SetUp();
        SetCounts(1, 1);
        proposal_.yesCapital = 10;
        TallyOutcome outcome;
        ASSERT_TRUE(TallyEvaluator::Finalize(dao_, proposal_, 1100, outcome).ok());
        unlocksAt_ = proposal_.executionUnlocksAt;
        recipient_[0] = 0x5E;
    }

    Timestamp unlocksAt_{0};
    Identity recipient_;
};

TEST_F(TimelockTest, VetoBeforeUnlock) {
    Proposal copy = proposal_;
    ASSERT_TRUE(TimelockController::Veto(dao_, copy, authority_, unlocksAt_ - 1).ok());
    EXPECT_EQ(copy.status, ProposalStatus::Vetoed);

    Result r = TimelockController::Veto(dao_, proposal_, authority_, unlocksAt_);
    EXPECT_EQ(r.error(), DaoError::VETO_WINDOW_EXPIRED);
    EXPECT_EQ(r.kind(), ErrorKind::Window);
    EXPECT_EQ(proposal_.status, ProposalStatus::Passed);
}

TEST_F(TimelockTest, VetoRequiresAuthority) {
    Result r = TimelockController::Veto(dao_, proposal_, recipient_, unlocksAt_ - 1);
    EXPECT_EQ(r.error(), DaoError::NOT_AUTHORITY);
}

TEST_F(TimelockTest, VetoAfterExecution) {
    TimelockController::MarkExecuted(proposal_);
    Result r = TimelockController::Veto(dao_, proposal_, authority_, unlocksAt_ - 1);
    EXPECT_EQ(r.error(), DaoError::VETO_AFTER_EXECUTION);
    EXPECT_EQ(r.kind(), ErrorKind::Window);
}

TEST_F(TimelockTest, ExecutionWaitsForUnlock) {
    Result r = TimelockController::AuthorizeExecution(proposal_, std::nullopt, unlocksAt_ - 1);
    EXPECT_EQ(r.error(), DaoError::EXECUTION_TIMELOCK_ACTIVE);
    EXPECT_EQ(r.kind(), ErrorKind::State);
    EXPECT_TRUE(TimelockController::AuthorizeExecution(proposal_, std::nullopt, unlocksAt_).ok());
}

TEST_F(TimelockTest, ExecutionChecksRecipient) {
    TreasuryAction action;
    action.type = TreasuryActionType::SendSol;
    action.amount = 100;
    action.recipient = recipient_;
    proposal_.treasuryAction = action;

    EXPECT_EQ(TimelockController::AuthorizeExecution(proposal_, std::nullopt, unlocksAt_).error(),
              DaoError::TREASURY_RECIPIENT_MISMATCH);
    EXPECT_EQ(TimelockController::AuthorizeExecution(proposal_, authority_, unlocksAt_).error(),
              DaoError::TREASURY_RECIPIENT_MISMATCH);
    EXPECT_TRUE(TimelockController::AuthorizeExecution(proposal_, recipient_, unlocksAt_).ok());
}

TEST_F(TimelockTest, ExecuteOnce) {
    TimelockController::MarkExecuted(proposal_);
    Result r = TimelockController::AuthorizeExecution(proposal_, std::nullopt, unlocksAt_);
    EXPECT_EQ(r.error(), DaoError::ALREADY_EXECUTED);
    EXPECT_EQ(r.kind(), ErrorKind::State);
}

TEST_F(TimelockTest, VetoedProposalCannotExecute) {
    ASSERT_TRUE(TimelockController::Veto(dao_, proposal_, authority_, unlocksAt_ - 1).ok());
    EXPECT_EQ(TimelockController::AuthorizeExecution(proposal_, std::nullopt, unlocksAt_).error(),
              DaoError::PROPOSAL_NOT_PASSED);
}
