// PrivDAO - Governance Events
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Typed notifications emitted by successful operations. Events are written
// to the persisted event log in the same batch as the state change and are
// delivered to listeners only after that batch commits.

#ifndef PRIVDAO_DAO_EVENTS_H
#define PRIVDAO_DAO_EVENTS_H

#include "privdao/core/types.h"
#include "privdao/dao/records.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace privdao {
namespace dao {

// ============================================================================
// Event Payloads
// ============================================================================

struct DaoCreatedEvent {
    Hash256 dao;
    Identity authority;
    std::string name;
    VotingConfig votingConfig;
};

struct DaoMigratedEvent {
    Hash256 dao;
    Identity authority;
    std::string name;
    Identity migratedFrom;
};

struct ProposalCreatedEvent {
    Hash256 dao;
    Hash256 proposal;
    uint64_t id{0};
    Identity proposer;
    Timestamp votingEnd{0};
    Timestamp revealEnd{0};
    bool hasTreasuryAction{false};
};

struct ProposalCancelledEvent {
    Hash256 proposal;
    Identity authority;
};

struct ProposalVetoedEvent {
    Hash256 proposal;
    Identity authority;
};

struct VoteDelegatedEvent {
    Hash256 proposal;
    Identity delegator;
    Identity delegatee;
    uint64_t capitalWeight{0};
    uint64_t communityWeight{0};
};

struct VoteCommittedEvent {
    Hash256 proposal;
    Identity voter;
    Commitment commitment;
    uint64_t capitalWeight{0};
    uint64_t communityWeight{0};
    bool delegated{false};
};

struct VoteRevealedEvent {
    Hash256 proposal;
    Identity voter;
    Identity revealer;
    bool votedYes{false};
    uint64_t capitalWeight{0};
    uint64_t communityWeight{0};
    bool rebatePaid{false};
    Amount rebate{0};
};

/// Full tally snapshot, emitted whatever the outcome
struct ProposalFinalizedEvent {
    Hash256 proposal;
    ProposalStatus status{ProposalStatus::Voting};
    bool quorumMet{false};
    uint64_t yesCapital{0};
    uint64_t noCapital{0};
    uint64_t yesCommunity{0};
    uint64_t noCommunity{0};
    uint64_t commitCount{0};
    uint64_t revealCount{0};
    Timestamp executionUnlocksAt{0};
};

struct TreasuryDepositEvent {
    Hash256 dao;
    Identity depositor;
    std::optional<Identity> token;
    Amount amount{0};
};

struct TreasuryExecutedEvent {
    Hash256 proposal;
    Identity executor;
    std::optional<TreasuryAction> action;
};

struct TreasuryExecutionFailedEvent {
    Hash256 proposal;
    Identity executor;
    std::string reason;
};

struct VoterWeightSyncedEvent {
    Hash256 dao;
    Identity voter;
    uint64_t weight{0};
    uint64_t expiry{0};
};

enum class EventType : uint8_t {
    DaoCreated = 0,
    DaoMigrated,
    ProposalCreated,
    ProposalCancelled,
    ProposalVetoed,
    VoteDelegated,
    VoteCommitted,
    VoteRevealed,
    ProposalFinalized,
    TreasuryDeposit,
    TreasuryExecuted,
    TreasuryExecutionFailed,
    VoterWeightSynced,
};

const char* EventTypeToString(EventType type);

/// Alternatives are ordered as EventType
using EventPayload = std::variant<
    DaoCreatedEvent,
    DaoMigratedEvent,
    ProposalCreatedEvent,
    ProposalCancelledEvent,
    ProposalVetoedEvent,
    VoteDelegatedEvent,
    VoteCommittedEvent,
    VoteRevealedEvent,
    ProposalFinalizedEvent,
    TreasuryDepositEvent,
    TreasuryExecutedEvent,
    TreasuryExecutionFailedEvent,
    VoterWeightSyncedEvent
>;

// ============================================================================
// Event
// ============================================================================

struct Event {
    /// Position in the event log, assigned at commit
    uint64_t sequence{0};
    Timestamp timestamp{0};
    EventPayload payload;

    Event() = default;
    Event(Timestamp ts, EventPayload p) : timestamp(ts), payload(std::move(p)) {}

    EventType Type() const { return static_cast<EventType>(payload.index()); }

    std::vector<Byte> Serialize() const;
    static std::optional<Event> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Listeners
// ============================================================================

/**
 * Receives events after the state change that produced them has
 * been committed.
 */
class IEventListener {
public:
    virtual ~IEventListener() = default;

    virtual void OnEvent(const Event& event) = 0;
};

/// Writes every event to the log at Info
class LoggingEventListener : public IEventListener {
public:
    void OnEvent(const Event& event) override;
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_EVENTS_H
