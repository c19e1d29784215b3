// PrivDAO - Engine Options and Voter Weight Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/dao/options.h"
#include "privdao/dao/voter_weight.h"
#include "privdao/util/config.h"

#include <limits>

using namespace privdao;
using namespace privdao::dao;

class EngineOptionsTest : public ::testing::Test {
protected:
    util::ConfigManager config_;
};

TEST_F(EngineOptionsTest, DefaultsWithoutSection) {
    EngineOptions options;
    options.revealRebate = 1;
    ASSERT_TRUE(LoadEngineOptions(config_, options).success);
    EXPECT_EQ(options.revealRebate, DEFAULT_REVEAL_REBATE);
    EXPECT_EQ(options.rebateReserve, DEFAULT_REBATE_RESERVE);
    EXPECT_EQ(options.proposalDeposit, 0u);
    EXPECT_EQ(options.voterWeightExpirySlots, DEFAULT_VOTER_WEIGHT_EXPIRY_SLOTS);
}

TEST_F(EngineOptionsTest, ReadsEngineSection) {
    ASSERT_TRUE(config_.ParseString(
        "# engine tuning\n"
        "reveal_rebate = 7\n"
        "[engine]\n"
        "reveal_rebate = 5000\n"
        "rebate_reserve = 10000\n"
        "proposal_deposit = 20000\n"
        "voter_weight_expiry_slots = 32\n").success);

    EngineOptions options;
    ASSERT_TRUE(LoadEngineOptions(config_, options).success);
    EXPECT_EQ(options.revealRebate, 5000u);
    EXPECT_EQ(options.rebateReserve, 10000u);
    EXPECT_EQ(options.proposalDeposit, 20000u);
    EXPECT_EQ(options.voterWeightExpirySlots, 32u);
}

TEST_F(EngineOptionsTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("[engine]\nreveal_rebate = 5000\n").success);
    const char* argv[] = {"privdao-cli", "--engine.reveal_rebate=0", "show-dao"};
    std::vector<std::string> positional;
    ASSERT_TRUE(config_.ParseCommandLine(3, argv, positional).success);
    ASSERT_EQ(positional.size(), 1u);
    EXPECT_EQ(positional[0], "show-dao");

    EngineOptions options;
    ASSERT_TRUE(LoadEngineOptions(config_, options).success);
    EXPECT_EQ(options.revealRebate, 0u);
}

TEST_F(EngineOptionsTest, RejectsInvalidValues) {
    ASSERT_TRUE(config_.ParseString("[engine]\nrebate_reserve = -5\n").success);
    EngineOptions options;
    options.rebateReserve = 42;
    util::ConfigParseResult result = LoadEngineOptions(config_, options);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("rebate_reserve"), std::string::npos);
    EXPECT_EQ(options.rebateReserve, 42u);

    config_.Clear();
    ASSERT_TRUE(config_.ParseString("[engine]\nvoter_weight_expiry_slots = soon\n").success);
    EXPECT_FALSE(LoadEngineOptions(config_, options).success);
}

// ============================================================================
// Voter Weight
// ============================================================================

class VoterWeightTest : public ::testing::Test {
protected:
    void SetUp() override {
        dao_.governanceToken[0] = 0x70;
        dao_.votingConfig = VotingConfig::Quadratic();
        realm_[0] = 0x3E;
        voter_[0] = 0x01;
    }

    DaoConfig dao_;
    Identity realm_;
    Identity voter_;
};

TEST_F(VoterWeightTest, PowerFollowsVotingMode) {
    EXPECT_EQ(VotingPowerFor(VotingConfig::TokenWeighted(), 10000), 10000u);
    EXPECT_EQ(VotingPowerFor(VotingConfig::Quadratic(), 10000), 100u);
    EXPECT_EQ(VotingPowerFor(VotingConfig::DualChamber(60, 40), 10000), 100u);
}

TEST_F(VoterWeightTest, BuildsExternalRecord) {
    VoterWeightRecord record;
    ASSERT_TRUE(BuildVoterWeightRecord(dao_, realm_, dao_.governanceToken, voter_, 2500, 1000,
                                       100, record).ok());
    EXPECT_EQ(record.realm, realm_);
    EXPECT_EQ(record.governingTokenMint, dao_.governanceToken);
    EXPECT_EQ(record.governingTokenOwner, voter_);
    EXPECT_EQ(record.voterWeight, 50u);
    ASSERT_TRUE(record.voterWeightExpiry.has_value());
    EXPECT_EQ(*record.voterWeightExpiry, 1100u);
    EXPECT_FALSE(record.weightAction.has_value());
    EXPECT_FALSE(record.weightActionTarget.has_value());
}

TEST_F(VoterWeightTest, RejectsForeignToken) {
    Identity other;
    other[0] = 0x71;
    VoterWeightRecord record;
    Result r = BuildVoterWeightRecord(dao_, realm_, other, voter_, 2500, 1000, 100, record);
    EXPECT_EQ(r.error(), DaoError::GOVERNING_MINT_MISMATCH);
    EXPECT_EQ(r.kind(), ErrorKind::Validation);
}

TEST_F(VoterWeightTest, ExpiryOverflow) {
    VoterWeightRecord record;
    Result r = BuildVoterWeightRecord(dao_, realm_, dao_.governanceToken, voter_, 1,
                                      std::numeric_limits<Slot>::max(), 1, record);
    EXPECT_EQ(r.kind(), ErrorKind::Arithmetic);
}
