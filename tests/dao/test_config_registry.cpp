// PrivDAO - Config Registry and Proposal Lifecycle Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/dao/config_registry.h"
#include "privdao/dao/proposal.h"

#include <limits>

using namespace privdao;
using namespace privdao::dao;

class ConfigRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        authority_[0] = 0xA1;
        token_[0] = 0x70;
        params_.name = "core";
        params_.quorumPercentage = 50;
        params_.requiredBalance = 100;
        params_.revealWindowSeconds = 60;
        params_.executionDelaySeconds = 120;
        params_.votingConfig = VotingConfig::TokenWeighted();
    }

    Identity authority_;
    Identity token_;
    DaoConfigParams params_;
};

TEST_F(ConfigRegistryTest, CreateCopiesParameters) {
    DaoConfig dao;
    ASSERT_TRUE(ConfigRegistry::Create(authority_, token_, params_, dao).ok());
    EXPECT_EQ(dao.authority, authority_);
    EXPECT_EQ(dao.governanceToken, token_);
    EXPECT_EQ(dao.quorumPercentage, 50);
    EXPECT_EQ(dao.requiredBalance, 100u);
    EXPECT_EQ(dao.proposalCount, 0u);
    EXPECT_FALSE(dao.migratedFrom.has_value());
}

TEST_F(ConfigRegistryTest, NameLengthBoundary) {
    DaoConfig dao;
    params_.name = std::string(MAX_NAME_LENGTH, 'n');
    EXPECT_TRUE(ConfigRegistry::Create(authority_, token_, params_, dao).ok());

    params_.name.push_back('n');
    Result r = ConfigRegistry::Create(authority_, token_, params_, dao);
    EXPECT_EQ(r.error(), DaoError::NAME_TOO_LONG);
    EXPECT_EQ(r.kind(), ErrorKind::Validation);
}

TEST_F(ConfigRegistryTest, QuorumRange) {
    params_.quorumPercentage = 0;
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::INVALID_QUORUM);
    params_.quorumPercentage = 101;
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::INVALID_QUORUM);
    params_.quorumPercentage = 1;
    EXPECT_TRUE(ConfigRegistry::Validate(params_).ok());
    params_.quorumPercentage = 100;
    EXPECT_TRUE(ConfigRegistry::Validate(params_).ok());
}

TEST_F(ConfigRegistryTest, RevealWindowAndDelay) {
    params_.revealWindowSeconds = MIN_REVEAL_WINDOW - 1;
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::REVEAL_WINDOW_TOO_SHORT);
    params_.revealWindowSeconds = MIN_REVEAL_WINDOW;
    EXPECT_TRUE(ConfigRegistry::Validate(params_).ok());

    params_.executionDelaySeconds = -1;
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::INVALID_EXECUTION_DELAY);
    params_.executionDelaySeconds = 0;
    EXPECT_TRUE(ConfigRegistry::Validate(params_).ok());
}

TEST_F(ConfigRegistryTest, DualChamberThresholds) {
    params_.votingConfig = VotingConfig::DualChamber(0, 50);
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::INVALID_THRESHOLD);
    params_.votingConfig = VotingConfig::DualChamber(60, 101);
    EXPECT_EQ(ConfigRegistry::Validate(params_).error(), DaoError::INVALID_THRESHOLD);
    params_.votingConfig = VotingConfig::DualChamber(60, 40);
    EXPECT_TRUE(ConfigRegistry::Validate(params_).ok());
}

TEST_F(ConfigRegistryTest, ThresholdsClearedOutsideDualChamber) {
    params_.votingConfig = VotingConfig{VotingMode::Quadratic, 70, 30};
    DaoConfig dao;
    ASSERT_TRUE(ConfigRegistry::Create(authority_, token_, params_, dao).ok());
    EXPECT_EQ(dao.votingConfig, VotingConfig::Quadratic());
}

TEST_F(ConfigRegistryTest, MigrateRecordsOriginAndDropsMinimumBalance) {
    Identity origin;
    origin[0] = 0x55;
    DaoConfig dao;
    ASSERT_TRUE(ConfigRegistry::Migrate(authority_, token_, origin, params_, dao).ok());
    EXPECT_EQ(dao.requiredBalance, 0u);
    ASSERT_TRUE(dao.migratedFrom.has_value());
    EXPECT_EQ(*dao.migratedFrom, origin);
}

TEST_F(ConfigRegistryTest, ProposalIdsAreSequential) {
    DaoConfig dao;
    ASSERT_TRUE(ConfigRegistry::Create(authority_, token_, params_, dao).ok());
    uint64_t id = 99;
    ASSERT_TRUE(ConfigRegistry::NextProposalId(dao, id).ok());
    EXPECT_EQ(id, 0u);
    ASSERT_TRUE(ConfigRegistry::NextProposalId(dao, id).ok());
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(dao.proposalCount, 2u);

    dao.proposalCount = std::numeric_limits<uint64_t>::max();
    Result r = ConfigRegistry::NextProposalId(dao, id);
    EXPECT_EQ(r.error(), DaoError::OVERFLOW);
    EXPECT_EQ(r.kind(), ErrorKind::Arithmetic);
}

// ============================================================================
// Proposal Lifecycle
// ============================================================================

class ProposalLifecycleTest : public ConfigRegistryTest {
protected:
    void SetUp() override {
        ConfigRegistryTest::SetUp();
        ASSERT_TRUE(ConfigRegistry::Create(authority_, token_, params_, dao_).ok());
        daoKey_[0] = 0xD0;
        proposer_[0] = 0xB2;
        proposal_.title = "Upgrade";
        proposal_.description = "Move to the new program";
        proposal_.votingDurationSeconds = 300;
    }

    DaoConfig dao_;
    Hash256 daoKey_;
    Identity proposer_;
    ProposalParams proposal_;
};

TEST_F(ProposalLifecycleTest, CreateSetsDeadlines) {
    Proposal p;
    ASSERT_TRUE(ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, 1000, p).ok());
    EXPECT_EQ(p.id, 0u);
    EXPECT_EQ(p.dao, daoKey_);
    EXPECT_EQ(p.status, ProposalStatus::Voting);
    EXPECT_EQ(p.votingEnd, 1300);
    EXPECT_EQ(p.revealEnd, 1360);
    EXPECT_EQ(p.commitCount, 0u);
    EXPECT_EQ(dao_.proposalCount, 1u);
}

TEST_F(ProposalLifecycleTest, RejectsOversizedText) {
    Proposal p;
    proposal_.title = std::string(MAX_TITLE_LENGTH + 1, 't');
    EXPECT_EQ(ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, 0, p).error(),
              DaoError::TITLE_TOO_LONG);

    proposal_.title = "ok";
    proposal_.description = std::string(MAX_DESCRIPTION_LENGTH + 1, 'd');
    EXPECT_EQ(ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, 0, p).error(),
              DaoError::DESCRIPTION_TOO_LONG);
    EXPECT_EQ(dao_.proposalCount, 0u);
}

TEST_F(ProposalLifecycleTest, RejectsShortVotingPeriod) {
    Proposal p;
    proposal_.votingDurationSeconds = MIN_VOTING_DURATION - 1;
    EXPECT_EQ(ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, 0, p).error(),
              DaoError::VOTING_DURATION_TOO_SHORT);
}

TEST_F(ProposalLifecycleTest, DeadlineOverflow) {
    Proposal p;
    Timestamp now = std::numeric_limits<Timestamp>::max() - 100;
    Result r = ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, now, p);
    EXPECT_EQ(r.kind(), ErrorKind::Arithmetic);
    EXPECT_EQ(dao_.proposalCount, 0u);
}

TEST_F(ProposalLifecycleTest, TreasuryActionShapes) {
    TreasuryAction action;
    action.type = TreasuryActionType::SendSol;
    action.amount = 10;
    EXPECT_EQ(ValidateTreasuryAction(action).error(), DaoError::INVALID_TREASURY_ACTION);

    action.recipient[0] = 0x01;
    EXPECT_TRUE(ValidateTreasuryAction(action).ok());

    action.amount = 0;
    EXPECT_EQ(ValidateTreasuryAction(action).error(), DaoError::INVALID_TREASURY_ACTION);

    action.type = TreasuryActionType::SendToken;
    action.amount = 10;
    EXPECT_EQ(ValidateTreasuryAction(action).error(), DaoError::TOKEN_MINT_REQUIRED);
    action.tokenMint = token_;
    EXPECT_TRUE(ValidateTreasuryAction(action).ok());

    action.type = TreasuryActionType::CustomCPI;
    EXPECT_EQ(ValidateTreasuryAction(action).error(), DaoError::INVALID_TREASURY_ACTION);
    action.tokenMint.reset();
    action.amount = 0;
    EXPECT_TRUE(ValidateTreasuryAction(action).ok());
}

TEST_F(ProposalLifecycleTest, CancelOnlyByAuthorityWhileVoting) {
    Proposal p;
    ASSERT_TRUE(ProposalLifecycle::Create(dao_, daoKey_, proposer_, proposal_, 0, p).ok());

    Result r = ProposalLifecycle::Cancel(dao_, p, proposer_);
    EXPECT_EQ(r.error(), DaoError::NOT_AUTHORITY);
    EXPECT_EQ(r.kind(), ErrorKind::Authorization);
    EXPECT_EQ(p.status, ProposalStatus::Voting);

    ASSERT_TRUE(ProposalLifecycle::Cancel(dao_, p, authority_).ok());
    EXPECT_EQ(p.status, ProposalStatus::Cancelled);
    EXPECT_TRUE(IsTerminal(p));

    r = ProposalLifecycle::Cancel(dao_, p, authority_);
    EXPECT_EQ(r.error(), DaoError::PROPOSAL_NOT_CANCELLABLE);
    EXPECT_EQ(r.kind(), ErrorKind::State);
}
