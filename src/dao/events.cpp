// PrivDAO - Governance Events
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/events.h"
#include "privdao/core/serialize.h"
#include "privdao/util/logging.h"

#include <ios>
#include <sstream>

namespace privdao {
namespace dao {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::DaoCreated:              return "DaoCreated";
        case EventType::DaoMigrated:             return "DaoMigrated";
        case EventType::ProposalCreated:         return "ProposalCreated";
        case EventType::ProposalCancelled:       return "ProposalCancelled";
        case EventType::ProposalVetoed:          return "ProposalVetoed";
        case EventType::VoteDelegated:           return "VoteDelegated";
        case EventType::VoteCommitted:           return "VoteCommitted";
        case EventType::VoteRevealed:            return "VoteRevealed";
        case EventType::ProposalFinalized:       return "ProposalFinalized";
        case EventType::TreasuryDeposit:         return "TreasuryDeposit";
        case EventType::TreasuryExecuted:        return "TreasuryExecuted";
        case EventType::TreasuryExecutionFailed: return "TreasuryExecutionFailed";
        case EventType::VoterWeightSynced:       return "VoterWeightSynced";
    }
    return "Unknown";
}

namespace {

// ============================================================================
// Payload Encoding
// ============================================================================

void WriteAction(DataStream& ss, const std::optional<TreasuryAction>& action) {
    ser_writedata8(ss, action ? 1 : 0);
    if (action) {
        ser_writedata8(ss, static_cast<uint8_t>(action->type));
        ser_writedata64(ss, action->amount);
        ss << action->recipient;
        WriteFixedOptional(ss, action->tokenMint, Identity::SIZE);
    }
}

void ReadAction(DataStream& ss, std::optional<TreasuryAction>& action) {
    if (ser_readdata8(ss) == 0) {
        action.reset();
        return;
    }
    TreasuryAction a;
    uint8_t type = ser_readdata8(ss);
    if (type > static_cast<uint8_t>(TreasuryActionType::CustomCPI)) {
        throw std::ios_base::failure("bad treasury action type");
    }
    a.type = static_cast<TreasuryActionType>(type);
    a.amount = ser_readdata64(ss);
    ss >> a.recipient;
    a.tokenMint = ReadFixedOptional<Identity>(ss, Identity::SIZE);
    action = a;
}

void Write(DataStream& ss, const DaoCreatedEvent& e) {
    ss << e.dao << e.authority << e.name;
    ser_writedata8(ss, static_cast<uint8_t>(e.votingConfig.mode));
    ser_writedata8(ss, e.votingConfig.capitalThreshold);
    ser_writedata8(ss, e.votingConfig.communityThreshold);
}

void Read(DataStream& ss, DaoCreatedEvent& e) {
    ss >> e.dao >> e.authority >> e.name;
    uint8_t mode = ser_readdata8(ss);
    if (mode > static_cast<uint8_t>(VotingMode::DualChamber)) {
        throw std::ios_base::failure("bad voting mode");
    }
    e.votingConfig.mode = static_cast<VotingMode>(mode);
    e.votingConfig.capitalThreshold = ser_readdata8(ss);
    e.votingConfig.communityThreshold = ser_readdata8(ss);
}

void Write(DataStream& ss, const DaoMigratedEvent& e) {
    ss << e.dao << e.authority << e.name << e.migratedFrom;
}

void Read(DataStream& ss, DaoMigratedEvent& e) {
    ss >> e.dao >> e.authority >> e.name >> e.migratedFrom;
}

void Write(DataStream& ss, const ProposalCreatedEvent& e) {
    ss << e.dao << e.proposal << e.id << e.proposer << e.votingEnd << e.revealEnd
       << e.hasTreasuryAction;
}

void Read(DataStream& ss, ProposalCreatedEvent& e) {
    ss >> e.dao >> e.proposal >> e.id >> e.proposer >> e.votingEnd >> e.revealEnd
       >> e.hasTreasuryAction;
}

void Write(DataStream& ss, const ProposalCancelledEvent& e) {
    ss << e.proposal << e.authority;
}

void Read(DataStream& ss, ProposalCancelledEvent& e) {
    ss >> e.proposal >> e.authority;
}

void Write(DataStream& ss, const ProposalVetoedEvent& e) {
    ss << e.proposal << e.authority;
}

void Read(DataStream& ss, ProposalVetoedEvent& e) {
    ss >> e.proposal >> e.authority;
}

void Write(DataStream& ss, const VoteDelegatedEvent& e) {
    ss << e.proposal << e.delegator << e.delegatee << e.capitalWeight << e.communityWeight;
}

void Read(DataStream& ss, VoteDelegatedEvent& e) {
    ss >> e.proposal >> e.delegator >> e.delegatee >> e.capitalWeight >> e.communityWeight;
}

void Write(DataStream& ss, const VoteCommittedEvent& e) {
    ss << e.proposal << e.voter << e.commitment << e.capitalWeight << e.communityWeight
       << e.delegated;
}

void Read(DataStream& ss, VoteCommittedEvent& e) {
    ss >> e.proposal >> e.voter >> e.commitment >> e.capitalWeight >> e.communityWeight
       >> e.delegated;
}

void Write(DataStream& ss, const VoteRevealedEvent& e) {
    ss << e.proposal << e.voter << e.revealer << e.votedYes << e.capitalWeight
       << e.communityWeight << e.rebatePaid << e.rebate;
}

void Read(DataStream& ss, VoteRevealedEvent& e) {
    ss >> e.proposal >> e.voter >> e.revealer >> e.votedYes >> e.capitalWeight
       >> e.communityWeight >> e.rebatePaid >> e.rebate;
}

void Write(DataStream& ss, const ProposalFinalizedEvent& e) {
    ss << e.proposal;
    ser_writedata8(ss, static_cast<uint8_t>(e.status));
    ss << e.quorumMet << e.yesCapital << e.noCapital << e.yesCommunity << e.noCommunity
       << e.commitCount << e.revealCount << e.executionUnlocksAt;
}

void Read(DataStream& ss, ProposalFinalizedEvent& e) {
    ss >> e.proposal;
    uint8_t status = ser_readdata8(ss);
    if (status > static_cast<uint8_t>(ProposalStatus::Vetoed)) {
        throw std::ios_base::failure("bad proposal status");
    }
    e.status = static_cast<ProposalStatus>(status);
    ss >> e.quorumMet >> e.yesCapital >> e.noCapital >> e.yesCommunity >> e.noCommunity
       >> e.commitCount >> e.revealCount >> e.executionUnlocksAt;
}

void Write(DataStream& ss, const TreasuryDepositEvent& e) {
    ss << e.dao << e.depositor;
    WriteFixedOptional(ss, e.token, Identity::SIZE);
    ss << e.amount;
}

void Read(DataStream& ss, TreasuryDepositEvent& e) {
    ss >> e.dao >> e.depositor;
    e.token = ReadFixedOptional<Identity>(ss, Identity::SIZE);
    ss >> e.amount;
}

void Write(DataStream& ss, const TreasuryExecutedEvent& e) {
    ss << e.proposal << e.executor;
    WriteAction(ss, e.action);
}

void Read(DataStream& ss, TreasuryExecutedEvent& e) {
    ss >> e.proposal >> e.executor;
    ReadAction(ss, e.action);
}

void Write(DataStream& ss, const TreasuryExecutionFailedEvent& e) {
    ss << e.proposal << e.executor << e.reason;
}

void Read(DataStream& ss, TreasuryExecutionFailedEvent& e) {
    ss >> e.proposal >> e.executor >> e.reason;
}

void Write(DataStream& ss, const VoterWeightSyncedEvent& e) {
    ss << e.dao << e.voter << e.weight << e.expiry;
}

void Read(DataStream& ss, VoterWeightSyncedEvent& e) {
    ss >> e.dao >> e.voter >> e.weight >> e.expiry;
}

template<typename T>
void WritePayload(DataStream& ss, const EventPayload& payload) {
    Write(ss, std::get<T>(payload));
}

template<typename T>
EventPayload ReadPayload(DataStream& ss) {
    T e;
    Read(ss, e);
    return e;
}

std::string Short(const BaseHash<256>& hash) {
    return hash.ToHex().substr(0, 16);
}

const char* CategoryFor(EventType type) {
    switch (type) {
        case EventType::DaoCreated:
        case EventType::DaoMigrated:
        case EventType::VoterWeightSynced:
            return util::LogCategory::DAO;
        case EventType::ProposalCreated:
        case EventType::ProposalCancelled:
            return util::LogCategory::PROPOSAL;
        case EventType::ProposalVetoed:
            return util::LogCategory::TIMELOCK;
        case EventType::VoteDelegated:
            return util::LogCategory::DELEGATION;
        case EventType::VoteCommitted:
        case EventType::VoteRevealed:
            return util::LogCategory::VOTE;
        case EventType::ProposalFinalized:
            return util::LogCategory::TALLY;
        case EventType::TreasuryDeposit:
        case EventType::TreasuryExecuted:
        case EventType::TreasuryExecutionFailed:
            return util::LogCategory::TREASURY;
    }
    return util::LogCategory::DEFAULT;
}

} // namespace

// ============================================================================
// Event
// ============================================================================

std::vector<Byte> Event::Serialize() const {
    DataStream ss;
    ss << sequence << timestamp;
    ser_writedata8(ss, static_cast<uint8_t>(Type()));

    switch (Type()) {
        case EventType::DaoCreated:              WritePayload<DaoCreatedEvent>(ss, payload); break;
        case EventType::DaoMigrated:             WritePayload<DaoMigratedEvent>(ss, payload); break;
        case EventType::ProposalCreated:         WritePayload<ProposalCreatedEvent>(ss, payload); break;
        case EventType::ProposalCancelled:       WritePayload<ProposalCancelledEvent>(ss, payload); break;
        case EventType::ProposalVetoed:          WritePayload<ProposalVetoedEvent>(ss, payload); break;
        case EventType::VoteDelegated:           WritePayload<VoteDelegatedEvent>(ss, payload); break;
        case EventType::VoteCommitted:           WritePayload<VoteCommittedEvent>(ss, payload); break;
        case EventType::VoteRevealed:            WritePayload<VoteRevealedEvent>(ss, payload); break;
        case EventType::ProposalFinalized:       WritePayload<ProposalFinalizedEvent>(ss, payload); break;
        case EventType::TreasuryDeposit:         WritePayload<TreasuryDepositEvent>(ss, payload); break;
        case EventType::TreasuryExecuted:        WritePayload<TreasuryExecutedEvent>(ss, payload); break;
        case EventType::TreasuryExecutionFailed: WritePayload<TreasuryExecutionFailedEvent>(ss, payload); break;
        case EventType::VoterWeightSynced:       WritePayload<VoterWeightSyncedEvent>(ss, payload); break;
    }
    return ss.Data();
}

std::optional<Event> Event::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        Event event;
        ss >> event.sequence >> event.timestamp;

        uint8_t type = ser_readdata8(ss);
        switch (static_cast<EventType>(type)) {
            case EventType::DaoCreated:              event.payload = ReadPayload<DaoCreatedEvent>(ss); break;
            case EventType::DaoMigrated:             event.payload = ReadPayload<DaoMigratedEvent>(ss); break;
            case EventType::ProposalCreated:         event.payload = ReadPayload<ProposalCreatedEvent>(ss); break;
            case EventType::ProposalCancelled:       event.payload = ReadPayload<ProposalCancelledEvent>(ss); break;
            case EventType::ProposalVetoed:          event.payload = ReadPayload<ProposalVetoedEvent>(ss); break;
            case EventType::VoteDelegated:           event.payload = ReadPayload<VoteDelegatedEvent>(ss); break;
            case EventType::VoteCommitted:           event.payload = ReadPayload<VoteCommittedEvent>(ss); break;
            case EventType::VoteRevealed:            event.payload = ReadPayload<VoteRevealedEvent>(ss); break;
            case EventType::ProposalFinalized:       event.payload = ReadPayload<ProposalFinalizedEvent>(ss); break;
            case EventType::TreasuryDeposit:         event.payload = ReadPayload<TreasuryDepositEvent>(ss); break;
            case EventType::TreasuryExecuted:        event.payload = ReadPayload<TreasuryExecutedEvent>(ss); break;
            case EventType::TreasuryExecutionFailed: event.payload = ReadPayload<TreasuryExecutionFailedEvent>(ss); break;
            case EventType::VoterWeightSynced:       event.payload = ReadPayload<VoterWeightSyncedEvent>(ss); break;
            default:
                return std::nullopt;
        }
        if (!ss.empty()) {
            return std::nullopt;
        }
        return event;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string Event::ToString() const {
    std::ostringstream ss;
    ss << "#" << sequence << " " << EventTypeToString(Type()) << " ";

    switch (Type()) {
        case EventType::DaoCreated: {
            const auto& e = std::get<DaoCreatedEvent>(payload);
            ss << "dao=" << Short(e.dao) << " name=\"" << e.name << "\" voting="
               << e.votingConfig.ToString();
            break;
        }
        case EventType::DaoMigrated: {
            const auto& e = std::get<DaoMigratedEvent>(payload);
            ss << "dao=" << Short(e.dao) << " name=\"" << e.name << "\" from="
               << Short(e.migratedFrom);
            break;
        }
        case EventType::ProposalCreated: {
            const auto& e = std::get<ProposalCreatedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " id=" << e.id
               << " voting_end=" << e.votingEnd << " reveal_end=" << e.revealEnd
               << (e.hasTreasuryAction ? " with-action" : "");
            break;
        }
        case EventType::ProposalCancelled: {
            const auto& e = std::get<ProposalCancelledEvent>(payload);
            ss << "proposal=" << Short(e.proposal);
            break;
        }
        case EventType::ProposalVetoed: {
            const auto& e = std::get<ProposalVetoedEvent>(payload);
            ss << "proposal=" << Short(e.proposal);
            break;
        }
        case EventType::VoteDelegated: {
            const auto& e = std::get<VoteDelegatedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " from=" << Short(e.delegator)
               << " to=" << Short(e.delegatee) << " capital=" << e.capitalWeight
               << " community=" << e.communityWeight;
            break;
        }
        case EventType::VoteCommitted: {
            const auto& e = std::get<VoteCommittedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " voter=" << Short(e.voter)
               << " capital=" << e.capitalWeight << " community=" << e.communityWeight
               << (e.delegated ? " delegated" : "");
            break;
        }
        case EventType::VoteRevealed: {
            const auto& e = std::get<VoteRevealedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " voter=" << Short(e.voter)
               << " vote=" << (e.votedYes ? "yes" : "no")
               << " capital=" << e.capitalWeight << " community=" << e.communityWeight
               << " rebate=" << (e.rebatePaid ? std::to_string(e.rebate) : "skipped");
            break;
        }
        case EventType::ProposalFinalized: {
            const auto& e = std::get<ProposalFinalizedEvent>(payload);
            ss << "proposal=" << Short(e.proposal)
               << " status=" << ProposalStatusToString(e.status)
               << " quorum=" << (e.quorumMet ? "met" : "missed")
               << " reveals=" << e.revealCount << "/" << e.commitCount
               << " capital=" << e.yesCapital << "/" << e.noCapital
               << " community=" << e.yesCommunity << "/" << e.noCommunity;
            if (e.status == ProposalStatus::Passed) {
                ss << " unlocks_at=" << e.executionUnlocksAt;
            }
            break;
        }
        case EventType::TreasuryDeposit: {
            const auto& e = std::get<TreasuryDepositEvent>(payload);
            ss << "dao=" << Short(e.dao) << " from=" << Short(e.depositor)
               << " amount=" << e.amount;
            if (e.token) {
                ss << " token=" << Short(*e.token);
            }
            break;
        }
        case EventType::TreasuryExecuted: {
            const auto& e = std::get<TreasuryExecutedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " executor=" << Short(e.executor);
            if (e.action) {
                ss << " action=" << e.action->ToString();
            }
            break;
        }
        case EventType::TreasuryExecutionFailed: {
            const auto& e = std::get<TreasuryExecutionFailedEvent>(payload);
            ss << "proposal=" << Short(e.proposal) << " reason=\"" << e.reason << "\"";
            break;
        }
        case EventType::VoterWeightSynced: {
            const auto& e = std::get<VoterWeightSyncedEvent>(payload);
            ss << "dao=" << Short(e.dao) << " voter=" << Short(e.voter)
               << " weight=" << e.weight << " expiry=" << e.expiry;
            break;
        }
    }
    return ss.str();
}

// ============================================================================
// LoggingEventListener
// ============================================================================

void LoggingEventListener::OnEvent(const Event& event) {
    LOG_INFO(CategoryFor(event.Type())) << event.ToString();
}

} // namespace dao
} // namespace privdao
