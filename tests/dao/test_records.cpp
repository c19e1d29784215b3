// PrivDAO - Record Layout Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/dao/records.h"
#include "privdao/crypto/sha256.h"

#include <cstring>

using namespace privdao;
using namespace privdao::dao;

class RecordsTest : public ::testing::Test {
protected:
    static Identity MakeIdentity(uint8_t seed) {
        Identity id;
        for (size_t i = 0; i < id.size(); ++i) {
            id[i] = static_cast<Byte>(seed + i);
        }
        return id;
    }

    static DaoConfig MakeDao() {
        DaoConfig dao;
        dao.authority = MakeIdentity(1);
        dao.name = "treasury-council";
        dao.governanceToken = MakeIdentity(2);
        dao.quorumPercentage = 40;
        dao.requiredBalance = 500;
        dao.revealWindowSeconds = 3600;
        dao.executionDelaySeconds = 86400;
        dao.votingConfig = VotingConfig::DualChamber(60, 40);
        dao.proposalCount = 7;
        return dao;
    }

    static Proposal MakeProposal() {
        Proposal p;
        p.dao = MakeIdentity(3);
        p.proposer = MakeIdentity(4);
        p.id = 12;
        p.title = "Fund the audit";
        p.description = std::string(MAX_DESCRIPTION_LENGTH, 'd');
        p.status = ProposalStatus::Passed;
        p.votingEnd = 1700000100;
        p.revealEnd = 1700000200;
        p.yesCapital = 900;
        p.noCapital = 100;
        p.yesCommunity = 30;
        p.noCommunity = 10;
        p.commitCount = 4;
        p.revealCount = 3;
        TreasuryAction action;
        action.type = TreasuryActionType::SendToken;
        action.amount = 250;
        action.recipient = MakeIdentity(5);
        action.tokenMint = MakeIdentity(6);
        p.treasuryAction = action;
        p.executionUnlocksAt = 1700090000;
        p.isExecuted = true;
        return p;
    }

    static Discriminator Prefix(const std::vector<Byte>& bytes) {
        Discriminator d{};
        std::memcpy(d.data(), bytes.data(), d.size());
        return d;
    }
};

// ============================================================================
// Discriminators and Sizes
// ============================================================================

TEST_F(RecordsTest, DiscriminatorIsHashPrefix) {
    Hash256 hash = SHA256Hash(std::string("account:Proposal"));
    Discriminator d = RecordDiscriminator("Proposal");
    EXPECT_EQ(0, std::memcmp(d.data(), hash.data(), DISCRIMINATOR_SIZE));
    EXPECT_NE(RecordDiscriminator("Proposal"), RecordDiscriminator("VoterRecord"));
}

TEST_F(RecordsTest, EncodedSizesAreFixed) {
    EXPECT_EQ(DaoConfig().Serialize().size(), DAO_CONFIG_SIZE);
    EXPECT_EQ(MakeDao().Serialize().size(), DAO_CONFIG_SIZE);
    EXPECT_EQ(Proposal().Serialize().size(), PROPOSAL_SIZE);
    EXPECT_EQ(MakeProposal().Serialize().size(), PROPOSAL_SIZE);
    EXPECT_EQ(VoterRecord().Serialize().size(), VOTER_RECORD_SIZE);
    EXPECT_EQ(VoteDelegation().Serialize().size(), VOTE_DELEGATION_SIZE);
    EXPECT_EQ(VoterWeightRecord().Serialize().size(), VOTER_WEIGHT_RECORD_SIZE);

    EXPECT_EQ(DAO_CONFIG_SIZE, 210u);
    EXPECT_EQ(PROPOSAL_SIZE, 1390u);
    EXPECT_EQ(VOTER_RECORD_SIZE, 157u);
    EXPECT_EQ(VOTE_DELEGATION_SIZE, 122u);
    EXPECT_EQ(VOTER_WEIGHT_RECORD_SIZE, 164u);
}

TEST_F(RecordsTest, RecordsStartWithTheirDiscriminator) {
    EXPECT_EQ(Prefix(MakeDao().Serialize()), RecordDiscriminator("DaoConfig"));
    EXPECT_EQ(Prefix(MakeProposal().Serialize()), RecordDiscriminator("Proposal"));
    EXPECT_EQ(Prefix(VoterRecord().Serialize()), RecordDiscriminator("VoterRecord"));
    EXPECT_EQ(Prefix(VoteDelegation().Serialize()), RecordDiscriminator("VoteDelegation"));
    EXPECT_EQ(Prefix(VoterWeightRecord().Serialize()), RecordDiscriminator("VoterWeightRecord"));
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(RecordsTest, DaoConfigDecodesAllFields) {
    DaoConfig dao = MakeDao();
    dao.migratedFrom = MakeIdentity(9);
    std::vector<Byte> bytes = dao.Serialize();

    auto decoded = DaoConfig::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->authority, dao.authority);
    EXPECT_EQ(decoded->name, dao.name);
    EXPECT_EQ(decoded->quorumPercentage, 40);
    EXPECT_EQ(decoded->requiredBalance, 500u);
    EXPECT_EQ(decoded->executionDelaySeconds, 86400);
    EXPECT_EQ(decoded->votingConfig, VotingConfig::DualChamber(60, 40));
    EXPECT_EQ(decoded->proposalCount, 7u);
    ASSERT_TRUE(decoded->migratedFrom.has_value());
    EXPECT_EQ(*decoded->migratedFrom, MakeIdentity(9));
}

TEST_F(RecordsTest, ProposalWithMaximalStrings) {
    Proposal p = MakeProposal();
    p.title = std::string(MAX_TITLE_LENGTH, 't');
    std::vector<Byte> bytes = p.Serialize();
    ASSERT_EQ(bytes.size(), PROPOSAL_SIZE);

    auto decoded = Proposal::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->title, p.title);
    EXPECT_EQ(decoded->description, p.description);
    EXPECT_EQ(decoded->status, ProposalStatus::Passed);
    EXPECT_EQ(decoded->yesCommunity, 30u);
    ASSERT_TRUE(decoded->treasuryAction.has_value());
    EXPECT_EQ(*decoded->treasuryAction, *p.treasuryAction);
    EXPECT_EQ(decoded->executionUnlocksAt, 1700090000);
    EXPECT_TRUE(decoded->isExecuted);
}

TEST_F(RecordsTest, VoterRecordKeeperIsOptional) {
    VoterRecord r;
    r.voter = MakeIdentity(10);
    r.proposal = MakeIdentity(11);
    r.capitalWeight = 10000;
    r.communityWeight = 100;
    r.hasCommitted = true;

    std::vector<Byte> bytes = r.Serialize();
    auto decoded = VoterRecord::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->keeper.has_value());
    EXPECT_TRUE(decoded->hasCommitted);
    EXPECT_FALSE(decoded->hasRevealed);

    r.keeper = MakeIdentity(12);
    bytes = r.Serialize();
    decoded = VoterRecord::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->keeper.has_value());
    EXPECT_EQ(*decoded->keeper, MakeIdentity(12));
}

TEST_F(RecordsTest, RejectsWrongLength) {
    std::vector<Byte> bytes = MakeDao().Serialize();
    EXPECT_FALSE(DaoConfig::Deserialize(bytes.data(), bytes.size() - 1).has_value());
    bytes.push_back(0);
    EXPECT_FALSE(DaoConfig::Deserialize(bytes.data(), bytes.size()).has_value());
}

TEST_F(RecordsTest, RejectsForeignDiscriminator) {
    std::vector<Byte> bytes = VoteDelegation().Serialize();
    bytes[0] ^= 0x01;
    EXPECT_FALSE(VoteDelegation::Deserialize(bytes.data(), bytes.size()).has_value());
}

TEST_F(RecordsTest, RejectsUnknownLayoutVersion) {
    std::vector<Byte> bytes = VoterRecord().Serialize();
    bytes.back() = RECORD_LAYOUT_VERSION + 1;
    EXPECT_FALSE(VoterRecord::Deserialize(bytes.data(), bytes.size()).has_value());
}

TEST_F(RecordsTest, RejectsInvalidStatus) {
    std::vector<Byte> bytes = MakeProposal().Serialize();
    // discriminator, dao, proposer, id, title (4 + max), description (4 + max)
    size_t statusOffset = 8 + 32 + 32 + 8 + 4 + MAX_TITLE_LENGTH + 4 + MAX_DESCRIPTION_LENGTH;
    ASSERT_EQ(bytes[statusOffset], static_cast<Byte>(ProposalStatus::Passed));
    bytes[statusOffset] = 9;
    EXPECT_FALSE(Proposal::Deserialize(bytes.data(), bytes.size()).has_value());
}

// ============================================================================
// External Voter Weight Layout
// ============================================================================

TEST_F(RecordsTest, VoterWeightRecordFieldOffsets) {
    VoterWeightRecord r;
    r.realm = MakeIdentity(20);
    r.governingTokenMint = MakeIdentity(21);
    r.governingTokenOwner = MakeIdentity(22);
    r.voterWeight = 0x0102030405060708ULL;
    r.voterWeightExpiry = 150;

    std::vector<Byte> bytes = r.Serialize();
    ASSERT_EQ(bytes.size(), VOTER_WEIGHT_RECORD_SIZE);

    EXPECT_EQ(0, std::memcmp(bytes.data() + 8, r.realm.data(), 32));
    EXPECT_EQ(0, std::memcmp(bytes.data() + 40, r.governingTokenMint.data(), 32));
    EXPECT_EQ(0, std::memcmp(bytes.data() + 72, r.governingTokenOwner.data(), 32));

    // Little-endian weight
    EXPECT_EQ(bytes[104], 0x08);
    EXPECT_EQ(bytes[111], 0x01);

    // Expiry present, action and target absent
    EXPECT_EQ(bytes[112], 1);
    EXPECT_EQ(bytes[113], 150);
    EXPECT_EQ(bytes[121], 0);
    EXPECT_EQ(bytes[123], 0);

    for (size_t i = VOTER_WEIGHT_RECORD_SIZE - 8; i < VOTER_WEIGHT_RECORD_SIZE; ++i) {
        EXPECT_EQ(bytes[i], 0) << "reserved byte " << i;
    }

    auto decoded = VoterWeightRecord::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->voterWeight, r.voterWeight);
    ASSERT_TRUE(decoded->voterWeightExpiry.has_value());
    EXPECT_EQ(*decoded->voterWeightExpiry, 150u);
    EXPECT_FALSE(decoded->weightAction.has_value());
    EXPECT_FALSE(decoded->weightActionTarget.has_value());
}

// ============================================================================
// Enumerations
// ============================================================================

TEST_F(RecordsTest, VotingModeNames) {
    EXPECT_STREQ(VotingModeToString(VotingMode::Quadratic), "Quadratic");
    auto mode = VotingModeFromString("DualChamber");
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, VotingMode::DualChamber);
    EXPECT_FALSE(VotingModeFromString("Plurality").has_value());
}

TEST_F(RecordsTest, TreasuryActionTypeNames) {
    EXPECT_STREQ(TreasuryActionTypeToString(TreasuryActionType::SendToken), "SendToken");
    auto type = TreasuryActionTypeFromString("send-sol");
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(*type, TreasuryActionType::SendSol);
    EXPECT_FALSE(TreasuryActionTypeFromString("burn").has_value());
}
