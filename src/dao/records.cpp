// PrivDAO - Governance Records
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/records.h"
#include "privdao/core/serialize.h"
#include "privdao/crypto/sha256.h"

#include <ios>
#include <sstream>

namespace privdao {
namespace dao {

Discriminator RecordDiscriminator(const std::string& name) {
    Hash256 digest = SHA256Hash("account:" + name);
    Discriminator disc;
    std::copy(digest.begin(), digest.begin() + DISCRIMINATOR_SIZE, disc.begin());
    return disc;
}

namespace {

const char* DAO_CONFIG_NAME = "DaoConfig";
const char* PROPOSAL_NAME = "Proposal";
const char* VOTER_RECORD_NAME = "VoterRecord";
const char* VOTE_DELEGATION_NAME = "VoteDelegation";
const char* VOTER_WEIGHT_RECORD_NAME = "VoterWeightRecord";

/// Open a stream over an encoded record and check its size and type
bool OpenRecord(DataStream& ss, size_t expectedSize, const char* name) {
    if (ss.size() != expectedSize) {
        return false;
    }
    Discriminator disc;
    Unserialize(ss, disc);
    return disc == RecordDiscriminator(name);
}

void WriteVotingConfig(DataStream& ss, const VotingConfig& config) {
    ser_writedata8(ss, static_cast<uint8_t>(config.mode));
    ser_writedata8(ss, config.capitalThreshold);
    ser_writedata8(ss, config.communityThreshold);
}

bool ReadVotingConfig(DataStream& ss, VotingConfig& config) {
    uint8_t mode = ser_readdata8(ss);
    if (mode > static_cast<uint8_t>(VotingMode::DualChamber)) {
        return false;
    }
    config.mode = static_cast<VotingMode>(mode);
    config.capitalThreshold = ser_readdata8(ss);
    config.communityThreshold = ser_readdata8(ss);
    return true;
}

void WriteTreasuryAction(DataStream& ss, const std::optional<TreasuryAction>& action) {
    if (!action) {
        ser_writedata8(ss, 0);
        ss.Pad(TREASURY_ACTION_SIZE);
        return;
    }
    ser_writedata8(ss, 1);
    ser_writedata8(ss, static_cast<uint8_t>(action->type));
    ser_writedata64(ss, action->amount);
    Serialize(ss, action->recipient);
    WriteFixedOptional(ss, action->tokenMint, Identity::SIZE);
}

bool ReadTreasuryAction(DataStream& ss, std::optional<TreasuryAction>& action) {
    uint8_t present = ser_readdata8(ss);
    if (present > 1) {
        return false;
    }
    if (present == 0) {
        ss.Ignore(TREASURY_ACTION_SIZE);
        action.reset();
        return true;
    }
    TreasuryAction result;
    uint8_t type = ser_readdata8(ss);
    if (type > static_cast<uint8_t>(TreasuryActionType::CustomCPI)) {
        return false;
    }
    result.type = static_cast<TreasuryActionType>(type);
    result.amount = ser_readdata64(ss);
    Unserialize(ss, result.recipient);
    result.tokenMint = ReadFixedOptional<Identity>(ss, Identity::SIZE);
    action = result;
    return true;
}

void WriteFlag(DataStream& ss, bool flag) {
    ser_writedata8(ss, flag ? 1 : 0);
}

bool ReadFlag(DataStream& ss, bool& flag) {
    uint8_t b = ser_readdata8(ss);
    if (b > 1) {
        return false;
    }
    flag = (b == 1);
    return true;
}

} // namespace

// ============================================================================
// Enum Strings
// ============================================================================

const char* VotingModeToString(VotingMode mode) {
    switch (mode) {
        case VotingMode::TokenWeighted: return "TokenWeighted";
        case VotingMode::Quadratic:     return "Quadratic";
        case VotingMode::DualChamber:   return "DualChamber";
    }
    return "Unknown";
}

std::optional<VotingMode> VotingModeFromString(const std::string& str) {
    if (str == "TokenWeighted" || str == "token-weighted") return VotingMode::TokenWeighted;
    if (str == "Quadratic" || str == "quadratic") return VotingMode::Quadratic;
    if (str == "DualChamber" || str == "dual-chamber") return VotingMode::DualChamber;
    return std::nullopt;
}

const char* TreasuryActionTypeToString(TreasuryActionType type) {
    switch (type) {
        case TreasuryActionType::SendSol:   return "SendSol";
        case TreasuryActionType::SendToken: return "SendToken";
        case TreasuryActionType::CustomCPI: return "CustomCPI";
    }
    return "Unknown";
}

std::optional<TreasuryActionType> TreasuryActionTypeFromString(const std::string& str) {
    if (str == "SendSol" || str == "send-sol") return TreasuryActionType::SendSol;
    if (str == "SendToken" || str == "send-token") return TreasuryActionType::SendToken;
    if (str == "CustomCPI" || str == "custom-cpi") return TreasuryActionType::CustomCPI;
    return std::nullopt;
}

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Voting:    return "Voting";
        case ProposalStatus::Passed:    return "Passed";
        case ProposalStatus::Failed:    return "Failed";
        case ProposalStatus::Cancelled: return "Cancelled";
        case ProposalStatus::Vetoed:    return "Vetoed";
    }
    return "Unknown";
}

std::string VotingConfig::ToString() const {
    std::ostringstream ss;
    ss << VotingModeToString(mode);
    if (mode == VotingMode::DualChamber) {
        ss << "{capital: " << static_cast<int>(capitalThreshold)
           << "%, community: " << static_cast<int>(communityThreshold) << "%}";
    }
    return ss.str();
}

std::string TreasuryAction::ToString() const {
    std::ostringstream ss;
    ss << TreasuryActionTypeToString(type) << " { amount: " << amount
       << ", recipient: " << recipient.ToHex();
    if (tokenMint) {
        ss << ", token: " << tokenMint->ToHex();
    }
    ss << " }";
    return ss.str();
}

// ============================================================================
// DaoConfig
// ============================================================================

std::vector<Byte> DaoConfig::Serialize() const {
    DataStream ss;
    ss.reserve(DAO_CONFIG_SIZE);

    ss << RecordDiscriminator(DAO_CONFIG_NAME);
    ss << authority;
    WriteBoundedString(ss, name, MAX_NAME_LENGTH);
    ss << governanceToken;
    ser_writedata8(ss, quorumPercentage);
    ser_writedata64(ss, requiredBalance);
    ss << revealWindowSeconds << executionDelaySeconds;
    WriteVotingConfig(ss, votingConfig);
    ser_writedata64(ss, proposalCount);
    WriteFixedOptional(ss, migratedFrom, Identity::SIZE);
    ser_writedata8(ss, RECORD_LAYOUT_VERSION);

    return ss.Data();
}

std::optional<DaoConfig> DaoConfig::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        if (!OpenRecord(ss, DAO_CONFIG_SIZE, DAO_CONFIG_NAME)) return std::nullopt;

        DaoConfig config;
        ss >> config.authority;
        config.name = ReadBoundedString(ss, MAX_NAME_LENGTH);
        ss >> config.governanceToken;
        config.quorumPercentage = ser_readdata8(ss);
        config.requiredBalance = ser_readdata64(ss);
        ss >> config.revealWindowSeconds >> config.executionDelaySeconds;
        if (!ReadVotingConfig(ss, config.votingConfig)) return std::nullopt;
        config.proposalCount = ser_readdata64(ss);
        config.migratedFrom = ReadFixedOptional<Identity>(ss, Identity::SIZE);
        if (ser_readdata8(ss) != RECORD_LAYOUT_VERSION) return std::nullopt;

        return config;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string DaoConfig::ToString() const {
    std::ostringstream ss;
    ss << "DaoConfig {\n"
       << "  name: " << name << "\n"
       << "  authority: " << authority.ToHex() << "\n"
       << "  governance token: " << governanceToken.ToHex() << "\n"
       << "  quorum: " << static_cast<int>(quorumPercentage) << "%\n"
       << "  required balance: " << requiredBalance << "\n"
       << "  reveal window: " << revealWindowSeconds << "s\n"
       << "  execution delay: " << executionDelaySeconds << "s\n"
       << "  voting: " << votingConfig.ToString() << "\n"
       << "  proposals: " << proposalCount << "\n";
    if (migratedFrom) {
        ss << "  migrated from: " << migratedFrom->ToHex() << "\n";
    }
    ss << "}";
    return ss.str();
}

// ============================================================================
// Proposal
// ============================================================================

std::vector<Byte> Proposal::Serialize() const {
    DataStream ss;
    ss.reserve(PROPOSAL_SIZE);

    ss << RecordDiscriminator(PROPOSAL_NAME);
    ss << dao << proposer;
    ser_writedata64(ss, id);
    WriteBoundedString(ss, title, MAX_TITLE_LENGTH);
    WriteBoundedString(ss, description, MAX_DESCRIPTION_LENGTH);
    ser_writedata8(ss, static_cast<uint8_t>(status));
    ss << votingEnd << revealEnd;
    ser_writedata64(ss, yesCapital);
    ser_writedata64(ss, noCapital);
    ser_writedata64(ss, yesCommunity);
    ser_writedata64(ss, noCommunity);
    ser_writedata64(ss, commitCount);
    ser_writedata64(ss, revealCount);
    WriteTreasuryAction(ss, treasuryAction);
    ss << executionUnlocksAt;
    WriteFlag(ss, isExecuted);
    ser_writedata8(ss, RECORD_LAYOUT_VERSION);

    return ss.Data();
}

std::optional<Proposal> Proposal::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        if (!OpenRecord(ss, PROPOSAL_SIZE, PROPOSAL_NAME)) return std::nullopt;

        Proposal p;
        ss >> p.dao >> p.proposer;
        p.id = ser_readdata64(ss);
        p.title = ReadBoundedString(ss, MAX_TITLE_LENGTH);
        p.description = ReadBoundedString(ss, MAX_DESCRIPTION_LENGTH);
        uint8_t status = ser_readdata8(ss);
        if (status > static_cast<uint8_t>(ProposalStatus::Vetoed)) return std::nullopt;
        p.status = static_cast<ProposalStatus>(status);
        ss >> p.votingEnd >> p.revealEnd;
        p.yesCapital = ser_readdata64(ss);
        p.noCapital = ser_readdata64(ss);
        p.yesCommunity = ser_readdata64(ss);
        p.noCommunity = ser_readdata64(ss);
        p.commitCount = ser_readdata64(ss);
        p.revealCount = ser_readdata64(ss);
        if (!ReadTreasuryAction(ss, p.treasuryAction)) return std::nullopt;
        ss >> p.executionUnlocksAt;
        if (!ReadFlag(ss, p.isExecuted)) return std::nullopt;
        if (ser_readdata8(ss) != RECORD_LAYOUT_VERSION) return std::nullopt;

        return p;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Proposal::ToString() const {
    std::ostringstream ss;
    ss << "Proposal #" << id << " {\n"
       << "  title: " << title << "\n"
       << "  proposer: " << proposer.ToHex() << "\n"
       << "  status: " << ProposalStatusToString(status) << "\n"
       << "  voting ends: " << votingEnd << "\n"
       << "  reveal ends: " << revealEnd << "\n"
       << "  commits: " << commitCount << ", reveals: " << revealCount << "\n"
       << "  capital: " << yesCapital << " yes / " << noCapital << " no\n"
       << "  community: " << yesCommunity << " yes / " << noCommunity << " no\n";
    if (treasuryAction) {
        ss << "  action: " << treasuryAction->ToString() << "\n";
    }
    if (status == ProposalStatus::Passed) {
        ss << "  unlocks at: " << executionUnlocksAt << "\n"
           << "  executed: " << (isExecuted ? "yes" : "no") << "\n";
    }
    ss << "}";
    return ss.str();
}

// ============================================================================
// VoterRecord
// ============================================================================

std::vector<Byte> VoterRecord::Serialize() const {
    DataStream ss;
    ss.reserve(VOTER_RECORD_SIZE);

    ss << RecordDiscriminator(VOTER_RECORD_NAME);
    ss << voter << proposal << commitment;
    ser_writedata64(ss, capitalWeight);
    ser_writedata64(ss, communityWeight);
    WriteFlag(ss, hasCommitted);
    WriteFlag(ss, hasRevealed);
    WriteFlag(ss, votedYes);
    WriteFixedOptional(ss, keeper, Identity::SIZE);
    ser_writedata8(ss, RECORD_LAYOUT_VERSION);

    return ss.Data();
}

std::optional<VoterRecord> VoterRecord::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        if (!OpenRecord(ss, VOTER_RECORD_SIZE, VOTER_RECORD_NAME)) return std::nullopt;

        VoterRecord r;
        ss >> r.voter >> r.proposal >> r.commitment;
        r.capitalWeight = ser_readdata64(ss);
        r.communityWeight = ser_readdata64(ss);
        if (!ReadFlag(ss, r.hasCommitted) || !ReadFlag(ss, r.hasRevealed) ||
            !ReadFlag(ss, r.votedYes)) {
            return std::nullopt;
        }
        r.keeper = ReadFixedOptional<Identity>(ss, Identity::SIZE);
        if (ser_readdata8(ss) != RECORD_LAYOUT_VERSION) return std::nullopt;

        return r;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string VoterRecord::ToString() const {
    std::ostringstream ss;
    ss << "VoterRecord { voter: " << voter.ToHex()
       << ", capital: " << capitalWeight
       << ", community: " << communityWeight
       << ", revealed: " << (hasRevealed ? (votedYes ? "yes" : "no") : "pending")
       << " }";
    return ss.str();
}

// ============================================================================
// VoteDelegation
// ============================================================================

std::vector<Byte> VoteDelegation::Serialize() const {
    DataStream ss;
    ss.reserve(VOTE_DELEGATION_SIZE);

    ss << RecordDiscriminator(VOTE_DELEGATION_NAME);
    ss << delegator << delegatee << proposal;
    ser_writedata64(ss, delegatedCapital);
    ser_writedata64(ss, delegatedCommunity);
    WriteFlag(ss, isUsed);
    ser_writedata8(ss, RECORD_LAYOUT_VERSION);

    return ss.Data();
}

std::optional<VoteDelegation> VoteDelegation::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        if (!OpenRecord(ss, VOTE_DELEGATION_SIZE, VOTE_DELEGATION_NAME)) return std::nullopt;

        VoteDelegation d;
        ss >> d.delegator >> d.delegatee >> d.proposal;
        d.delegatedCapital = ser_readdata64(ss);
        d.delegatedCommunity = ser_readdata64(ss);
        if (!ReadFlag(ss, d.isUsed)) return std::nullopt;
        if (ser_readdata8(ss) != RECORD_LAYOUT_VERSION) return std::nullopt;

        return d;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string VoteDelegation::ToString() const {
    std::ostringstream ss;
    ss << "VoteDelegation { delegator: " << delegator.ToHex()
       << ", delegatee: " << delegatee.ToHex()
       << ", capital: " << delegatedCapital
       << ", community: " << delegatedCommunity
       << ", used: " << (isUsed ? "yes" : "no") << " }";
    return ss.str();
}

// ============================================================================
// VoterWeightRecord
// ============================================================================

std::vector<Byte> VoterWeightRecord::Serialize() const {
    DataStream ss;
    ss.reserve(VOTER_WEIGHT_RECORD_SIZE);

    ss << RecordDiscriminator(VOTER_WEIGHT_RECORD_NAME);
    ss << realm << governingTokenMint << governingTokenOwner;
    ser_writedata64(ss, voterWeight);
    WriteFixedOptional(ss, voterWeightExpiry, 8);
    WriteFixedOptional(ss, weightAction, 1);
    WriteFixedOptional(ss, weightActionTarget, Identity::SIZE);
    ss.Pad(8);

    return ss.Data();
}

std::optional<VoterWeightRecord> VoterWeightRecord::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        if (!OpenRecord(ss, VOTER_WEIGHT_RECORD_SIZE, VOTER_WEIGHT_RECORD_NAME)) {
            return std::nullopt;
        }

        VoterWeightRecord r;
        ss >> r.realm >> r.governingTokenMint >> r.governingTokenOwner;
        r.voterWeight = ser_readdata64(ss);
        r.voterWeightExpiry = ReadFixedOptional<uint64_t>(ss, 8);
        r.weightAction = ReadFixedOptional<uint8_t>(ss, 1);
        r.weightActionTarget = ReadFixedOptional<Identity>(ss, Identity::SIZE);
        ss.Ignore(8);

        return r;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string VoterWeightRecord::ToString() const {
    std::ostringstream ss;
    ss << "VoterWeightRecord { owner: " << governingTokenOwner.ToHex()
       << ", weight: " << voterWeight;
    if (voterWeightExpiry) {
        ss << ", expiry: " << *voterWeightExpiry;
    }
    ss << " }";
    return ss.str();
}

} // namespace dao
} // namespace privdao
