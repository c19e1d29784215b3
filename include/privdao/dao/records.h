// PrivDAO - Governance Records
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Persisted governance records and their fixed-size encodings.
//
// Every record starts with an 8-byte type discriminator (the first eight
// bytes of SHA-256("account:<Name>")), followed by its fields in a fixed
// order and zero padding. Strings and optional values always reserve
// their maximum width so a record never changes size.

#ifndef PRIVDAO_DAO_RECORDS_H
#define PRIVDAO_DAO_RECORDS_H

#include "privdao/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace privdao {
namespace dao {

// ============================================================================
// Constants
// ============================================================================

/// Maximum DAO name length
constexpr size_t MAX_NAME_LENGTH = 64;

/// Maximum proposal title length
constexpr size_t MAX_TITLE_LENGTH = 128;

/// Maximum proposal description length
constexpr size_t MAX_DESCRIPTION_LENGTH = 1024;

/// Minimum reveal window in seconds
constexpr int64_t MIN_REVEAL_WINDOW = 5;

/// Minimum voting duration in seconds
constexpr int64_t MIN_VOTING_DURATION = 5;

/// Current layout version written into every record
constexpr uint8_t RECORD_LAYOUT_VERSION = 1;

/// Encoded record sizes
constexpr size_t DAO_CONFIG_SIZE = 210;
constexpr size_t PROPOSAL_SIZE = 1390;
constexpr size_t TREASURY_ACTION_SIZE = 74;
constexpr size_t VOTER_RECORD_SIZE = 157;
constexpr size_t VOTE_DELEGATION_SIZE = 122;
constexpr size_t VOTER_WEIGHT_RECORD_SIZE = 164;

/// Size of the type discriminator at the head of every record
constexpr size_t DISCRIMINATOR_SIZE = 8;

using Discriminator = std::array<Byte, DISCRIMINATOR_SIZE>;

/// First eight bytes of SHA-256("account:" + name)
Discriminator RecordDiscriminator(const std::string& name);

// ============================================================================
// Voting Configuration
// ============================================================================

enum class VotingMode : uint8_t {
    TokenWeighted = 0,   ///< Linear (capital) weight decides
    Quadratic = 1,       ///< Square-root (community) weight decides
    DualChamber = 2,     ///< Both chambers must clear their own threshold
};

const char* VotingModeToString(VotingMode mode);
std::optional<VotingMode> VotingModeFromString(const std::string& str);

/**
 * Voting mode and, for DualChamber, the per-chamber yes thresholds in
 * percent. Thresholds are zero for the other modes.
 */
struct VotingConfig {
    VotingMode mode{VotingMode::TokenWeighted};
    uint8_t capitalThreshold{0};
    uint8_t communityThreshold{0};

    static VotingConfig TokenWeighted() { return {VotingMode::TokenWeighted, 0, 0}; }
    static VotingConfig Quadratic() { return {VotingMode::Quadratic, 0, 0}; }
    static VotingConfig DualChamber(uint8_t capital, uint8_t community) {
        return {VotingMode::DualChamber, capital, community};
    }

    bool operator==(const VotingConfig& o) const {
        return mode == o.mode && capitalThreshold == o.capitalThreshold &&
               communityThreshold == o.communityThreshold;
    }

    std::string ToString() const;
};

// ============================================================================
// DAO Configuration
// ============================================================================

/**
 * One DAO's configuration. Immutable after creation except for the
 * proposal counter.
 */
struct DaoConfig {
    Identity authority;
    std::string name;
    /// Token whose balance determines voting weight
    Identity governanceToken;
    uint8_t quorumPercentage{0};
    /// Minimum balance required to vote (0 = unrestricted)
    Amount requiredBalance{0};
    int64_t revealWindowSeconds{0};
    int64_t executionDelaySeconds{0};
    VotingConfig votingConfig;
    /// Next proposal id
    uint64_t proposalCount{0};
    /// External governance instance this DAO was migrated from
    std::optional<Identity> migratedFrom;

    std::vector<Byte> Serialize() const;
    static std::optional<DaoConfig> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Treasury Action
// ============================================================================

enum class TreasuryActionType : uint8_t {
    SendSol = 0,     ///< Native value transfer
    SendToken = 1,   ///< Token transfer
    CustomCPI = 2,   ///< Relay to an external program; no value moves
};

const char* TreasuryActionTypeToString(TreasuryActionType type);
std::optional<TreasuryActionType> TreasuryActionTypeFromString(const std::string& str);

/// Guarded action attached to a proposal at creation
struct TreasuryAction {
    TreasuryActionType type{TreasuryActionType::SendSol};
    Amount amount{0};
    Identity recipient;
    /// Token to send (SendToken only)
    std::optional<Identity> tokenMint;

    bool operator==(const TreasuryAction& o) const {
        return type == o.type && amount == o.amount &&
               recipient == o.recipient && tokenMint == o.tokenMint;
    }

    std::string ToString() const;
};

// ============================================================================
// Proposal
// ============================================================================

enum class ProposalStatus : uint8_t {
    Voting = 0,
    Passed = 1,
    Failed = 2,
    Cancelled = 3,
    Vetoed = 4,
};

const char* ProposalStatusToString(ProposalStatus status);

struct Proposal {
    /// Owning DAO key
    Hash256 dao;
    Identity proposer;
    uint64_t id{0};
    std::string title;
    std::string description;
    ProposalStatus status{ProposalStatus::Voting};
    Timestamp votingEnd{0};
    Timestamp revealEnd{0};

    uint64_t yesCapital{0};
    uint64_t noCapital{0};
    uint64_t yesCommunity{0};
    uint64_t noCommunity{0};

    uint64_t commitCount{0};
    uint64_t revealCount{0};

    std::optional<TreasuryAction> treasuryAction;
    /// Set when the proposal passes
    Timestamp executionUnlocksAt{0};
    bool isExecuted{false};

    std::vector<Byte> Serialize() const;
    static std::optional<Proposal> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Voter Record
// ============================================================================

/// One voter's commitment on one proposal
struct VoterRecord {
    Identity voter;
    /// Owning proposal key
    Hash256 proposal;
    Commitment commitment;
    uint64_t capitalWeight{0};
    uint64_t communityWeight{0};
    bool hasCommitted{false};
    bool hasRevealed{false};
    bool votedYes{false};
    /// Identity allowed to reveal on the voter's behalf
    std::optional<Identity> keeper;

    std::vector<Byte> Serialize() const;
    static std::optional<VoterRecord> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Vote Delegation
// ============================================================================

/// One-shot weight delegation for a single proposal
struct VoteDelegation {
    Identity delegator;
    Identity delegatee;
    /// Owning proposal key
    Hash256 proposal;
    uint64_t delegatedCapital{0};
    uint64_t delegatedCommunity{0};
    bool isUsed{false};

    std::vector<Byte> Serialize() const;
    static std::optional<VoteDelegation> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Voter Weight Record
// ============================================================================

/**
 * Voting power published for an external governance platform.
 * The layout is a fixed contract: discriminator, realm, governing token,
 * owner, weight, optional expiry, optional action tag, optional action
 * target, eight reserved bytes.
 */
struct VoterWeightRecord {
    Identity realm;
    Identity governingTokenMint;
    Identity governingTokenOwner;
    uint64_t voterWeight{0};
    std::optional<uint64_t> voterWeightExpiry;
    std::optional<uint8_t> weightAction;
    std::optional<Identity> weightActionTarget;

    std::vector<Byte> Serialize() const;
    static std::optional<VoterWeightRecord> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_RECORDS_H
