// PrivDAO - Governance Engine
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/engine.h"
#include "privdao/dao/address.h"
#include "privdao/dao/arith.h"
#include "privdao/dao/delegation.h"
#include "privdao/dao/timelock.h"
#include "privdao/dao/voter_weight.h"
#include "privdao/util/logging.h"

#include <algorithm>

namespace privdao {
namespace dao {

namespace {

std::string Short(const BaseHash<256>& hash) {
    return hash.ToHex().substr(0, 16);
}

} // namespace

DaoEngine::DaoEngine(StateStore& store, IBalanceSource& balances, ITreasuryGateway& gateway,
                     const EngineOptions& options)
    : store_(store)
    , balances_(balances)
    , gateway_(gateway)
    , options_(options) {}

// ============================================================================
// Listeners
// ============================================================================

void DaoEngine::AddListener(IEventListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void DaoEngine::RemoveListener(IEventListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Internal Helpers
// ============================================================================

Result DaoEngine::Reject(const char* category, const char* op, const Result& result) const {
    if (result.kind() == ErrorKind::Storage) {
        LogErrorF(category, "%s failed: %s", op, result.ToString().c_str());
    } else {
        LogDebugF(category, "%s rejected: %s", op, result.ToString().c_str());
    }
    return result;
}

Result DaoEngine::LoadDao(const Transaction& tx, const Hash256& daoKey, DaoConfig& out) const {
    std::optional<DaoConfig> dao;
    Result r = tx.Load(db::prefix::DAO, daoKey, dao);
    if (!r.ok()) return r;
    if (!dao) {
        return Result::Error(DaoError::DAO_NOT_FOUND, "no DAO " + daoKey.ToHex());
    }
    out = std::move(*dao);
    return Result::Ok();
}

Result DaoEngine::LoadProposal(const Transaction& tx, const Hash256& proposalKey,
                               Proposal& out) const {
    std::optional<Proposal> proposal;
    Result r = tx.Load(db::prefix::PROPOSAL, proposalKey, proposal);
    if (!r.ok()) return r;
    if (!proposal) {
        return Result::Error(DaoError::PROPOSAL_NOT_FOUND, "no proposal " + proposalKey.ToHex());
    }
    out = std::move(*proposal);
    return Result::Ok();
}

Result DaoEngine::CommitAndNotify(std::unique_lock<std::mutex>& lock, Transaction& tx,
                                  const char* op) {
    Result r = tx.Commit();
    if (!r.ok()) {
        return Reject(util::LogCategory::DB, op, r);
    }
    if (tx.Events().empty() || listeners_.empty()) {
        return Result::Ok();
    }

    // Listeners may call back into the engine
    std::vector<Event> events = tx.Events();
    std::vector<IEventListener*> listeners = listeners_;
    lock.unlock();
    for (const Event& event : events) {
        for (IEventListener* listener : listeners) {
            listener->OnEvent(event);
        }
    }
    lock.lock();
    return Result::Ok();
}

// ============================================================================
// DAO Configuration
// ============================================================================

Result DaoEngine::CreateConfig(const RequestContext& ctx, const Identity& governanceToken,
                               const DaoConfigParams& params, Hash256& daoKey) {
    std::unique_lock<std::mutex> lock(mutex_);

    DaoConfig config;
    Result r = ConfigRegistry::Create(ctx.caller, governanceToken, params, config);
    if (!r.ok()) return Reject(util::LogCategory::DAO, "createConfig", r);

    return CreateDao(lock, config, ctx.now, daoKey, "createConfig");
}

Result DaoEngine::MigrateConfig(const RequestContext& ctx, const Identity& governanceToken,
                                const Identity& migratedFrom, const DaoConfigParams& params,
                                Hash256& daoKey) {
    std::unique_lock<std::mutex> lock(mutex_);

    DaoConfig config;
    Result r = ConfigRegistry::Migrate(ctx.caller, governanceToken, migratedFrom, params, config);
    if (!r.ok()) return Reject(util::LogCategory::DAO, "migrateConfig", r);

    return CreateDao(lock, config, ctx.now, daoKey, "migrateConfig");
}

Result DaoEngine::CreateDao(std::unique_lock<std::mutex>& lock, const DaoConfig& config,
                            Timestamp now, Hash256& daoKey, const char* op) {
    Hash256 key = DaoKey(config.authority, config.name);
    Transaction tx(store_);

    std::optional<DaoConfig> existing;
    Result r = tx.Load(db::prefix::DAO, key, existing);
    if (!r.ok()) return Reject(util::LogCategory::DAO, op, r);
    if (existing) {
        return Reject(util::LogCategory::DAO, op,
                      Result::Error(DaoError::DAO_ALREADY_EXISTS,
                                    "DAO \"" + config.name + "\" already exists"));
    }

    tx.Store(db::prefix::DAO, key, config);

    DaoCreatedEvent created;
    created.dao = key;
    created.authority = config.authority;
    created.name = config.name;
    created.votingConfig = config.votingConfig;
    tx.Emit(Event(now, created));

    if (config.migratedFrom) {
        DaoMigratedEvent migrated;
        migrated.dao = key;
        migrated.authority = config.authority;
        migrated.name = config.name;
        migrated.migratedFrom = *config.migratedFrom;
        tx.Emit(Event(now, migrated));
    }

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::DAO) << "created DAO \"" << config.name << "\" "
                                     << Short(key) << " (" << config.votingConfig.ToString()
                                     << ")";
    daoKey = key;
    return Result::Ok();
}

// ============================================================================
// Proposal Lifecycle
// ============================================================================

Result DaoEngine::CreateProposal(const RequestContext& ctx, const Hash256& daoKey,
                                 const ProposalParams& params, Hash256& proposalKey) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "createProposal";
    Transaction tx(store_);

    DaoConfig dao;
    Result r = LoadDao(tx, daoKey, dao);
    if (!r.ok()) return Reject(util::LogCategory::PROPOSAL, op, r);

    Proposal proposal;
    r = ProposalLifecycle::Create(dao, daoKey, ctx.caller, params, ctx.now, proposal);
    if (!r.ok()) return Reject(util::LogCategory::PROPOSAL, op, r);

    Hash256 key = ProposalKey(daoKey, proposal.id);
    if (options_.proposalDeposit > 0) {
        r = ValueLedger::Transfer(tx, ctx.caller, ProposalAccount(key), options_.proposalDeposit);
        if (!r.ok()) return Reject(util::LogCategory::PROPOSAL, op, r);
    }

    tx.Store(db::prefix::DAO, daoKey, dao);
    tx.Store(db::prefix::PROPOSAL, key, proposal);

    ProposalCreatedEvent event;
    event.dao = daoKey;
    event.proposal = key;
    event.id = proposal.id;
    event.proposer = ctx.caller;
    event.votingEnd = proposal.votingEnd;
    event.revealEnd = proposal.revealEnd;
    event.hasTreasuryAction = proposal.treasuryAction.has_value();
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::PROPOSAL) << "proposal #" << proposal.id << " \""
                                          << proposal.title << "\" created, voting until "
                                          << proposal.votingEnd;
    proposalKey = key;
    return Result::Ok();
}

Result DaoEngine::CancelProposal(const RequestContext& ctx, const Hash256& proposalKey) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "cancelProposal";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = ProposalLifecycle::Cancel(dao, proposal, ctx.caller);
    if (!r.ok()) return Reject(util::LogCategory::PROPOSAL, op, r);

    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);
    tx.Emit(Event(ctx.now, ProposalCancelledEvent{proposalKey, ctx.caller}));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::PROPOSAL) << "proposal #" << proposal.id << " cancelled";
    return Result::Ok();
}

Result DaoEngine::VetoProposal(const RequestContext& ctx, const Hash256& proposalKey) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "vetoProposal";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = TimelockController::Veto(dao, proposal, ctx.caller, ctx.now);
    if (!r.ok()) return Reject(util::LogCategory::TIMELOCK, op, r);

    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);
    tx.Emit(Event(ctx.now, ProposalVetoedEvent{proposalKey, ctx.caller}));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TIMELOCK) << "proposal #" << proposal.id << " vetoed";
    return Result::Ok();
}

// ============================================================================
// Voting
// ============================================================================

Result DaoEngine::CommitVote(const RequestContext& ctx, const Hash256& proposalKey,
                             const Commitment& commitment,
                             const std::optional<Identity>& keeper) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "commitVote";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    Amount balance = 0;
    std::optional<VoteDelegation> delegation;
    std::optional<VoterRecord> existing;
    Hash256 recordKey = VoterRecordKey(proposalKey, ctx.caller);

    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = balances_.GetTokenBalance(ctx.caller, dao.governanceToken, balance);
    if (r.ok()) r = tx.Load(db::prefix::DELEGATION, DelegationKey(proposalKey, ctx.caller),
                            delegation);
    if (r.ok()) r = tx.Load(db::prefix::VOTE, recordKey, existing);
    if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);

    CommitRequest request{ctx.caller, commitment, keeper};
    VoterRecord record;
    r = CommitRevealEngine::Commit(dao, proposal, proposalKey, request, balance,
                                   delegation.has_value(), existing, ctx.now, record);
    if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);

    tx.Store(db::prefix::VOTE, recordKey, record);
    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);

    VoteCommittedEvent event;
    event.proposal = proposalKey;
    event.voter = ctx.caller;
    event.commitment = commitment;
    event.capitalWeight = record.capitalWeight;
    event.communityWeight = record.communityWeight;
    event.delegated = false;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::VOTE) << "vote committed on #" << proposal.id << " by "
                                      << Short(ctx.caller) << " (capital "
                                      << record.capitalWeight << ", community "
                                      << record.communityWeight << ")";
    return Result::Ok();
}

Result DaoEngine::Delegate(const RequestContext& ctx, const Hash256& proposalKey,
                           const Identity& delegatee) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "delegate";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    Amount balance = 0;
    std::optional<VoteDelegation> existing;
    std::optional<VoterRecord> record;
    Hash256 delegationKey = DelegationKey(proposalKey, ctx.caller);

    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = balances_.GetTokenBalance(ctx.caller, dao.governanceToken, balance);
    if (r.ok()) r = tx.Load(db::prefix::DELEGATION, delegationKey, existing);
    if (r.ok()) r = tx.Load(db::prefix::VOTE, VoterRecordKey(proposalKey, ctx.caller), record);
    if (!r.ok()) return Reject(util::LogCategory::DELEGATION, op, r);

    VoteDelegation delegation;
    r = DelegationLedger::Delegate(proposal, proposalKey, ctx.caller, delegatee, balance,
                                   existing, record.has_value(), ctx.now, delegation);
    if (!r.ok()) return Reject(util::LogCategory::DELEGATION, op, r);

    tx.Store(db::prefix::DELEGATION, delegationKey, delegation);

    VoteDelegatedEvent event;
    event.proposal = proposalKey;
    event.delegator = ctx.caller;
    event.delegatee = delegatee;
    event.capitalWeight = delegation.delegatedCapital;
    event.communityWeight = delegation.delegatedCommunity;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::DELEGATION) << Short(ctx.caller) << " delegated "
                                            << delegation.delegatedCapital << " to "
                                            << Short(delegatee) << " on #" << proposal.id;
    return Result::Ok();
}

Result DaoEngine::CommitDelegatedVote(const RequestContext& ctx, const Hash256& proposalKey,
                                      const Hash256& delegationKey,
                                      const Commitment& commitment,
                                      const std::optional<Identity>& keeper) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "commitDelegatedVote";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    Amount balance = 0;
    std::optional<VoteDelegation> delegation;
    std::optional<VoteDelegation> ownDelegation;
    std::optional<VoterRecord> existing;
    Hash256 recordKey = VoterRecordKey(proposalKey, ctx.caller);

    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = tx.Load(db::prefix::DELEGATION, delegationKey, delegation);
    if (r.ok() && !delegation) {
        r = Result::Error(DaoError::DELEGATION_NOT_FOUND, "no delegation " + delegationKey.ToHex());
    }
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = balances_.GetTokenBalance(ctx.caller, dao.governanceToken, balance);
    if (r.ok()) r = tx.Load(db::prefix::VOTE, recordKey, existing);
    if (r.ok()) r = tx.Load(db::prefix::DELEGATION, DelegationKey(proposalKey, ctx.caller),
                            ownDelegation);
    if (!r.ok()) return Reject(util::LogCategory::DELEGATION, op, r);

    CommitRequest request{ctx.caller, commitment, keeper};
    VoterRecord record;
    r = DelegationLedger::CommitDelegated(proposal, proposalKey, *delegation, request, balance,
                                          existing, ownDelegation.has_value(), ctx.now, record);
    if (!r.ok()) return Reject(util::LogCategory::DELEGATION, op, r);

    tx.Store(db::prefix::VOTE, recordKey, record);
    tx.Store(db::prefix::DELEGATION, delegationKey, *delegation);
    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);

    VoteCommittedEvent event;
    event.proposal = proposalKey;
    event.voter = ctx.caller;
    event.commitment = commitment;
    event.capitalWeight = record.capitalWeight;
    event.communityWeight = record.communityWeight;
    event.delegated = true;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::DELEGATION) << "delegated vote committed on #" << proposal.id
                                            << " by " << Short(ctx.caller) << " (capital "
                                            << record.capitalWeight << ", community "
                                            << record.communityWeight << ")";
    return Result::Ok();
}

Result DaoEngine::RevealVote(const RequestContext& ctx, const Hash256& proposalKey,
                             const Identity& voter, bool voteYes, const Salt& salt) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "revealVote";
    Transaction tx(store_);

    Proposal proposal;
    std::optional<VoterRecord> record;
    Hash256 recordKey = VoterRecordKey(proposalKey, voter);

    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = tx.Load(db::prefix::VOTE, recordKey, record);
    if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);

    RevealRequest request;
    request.caller = ctx.caller;
    request.voter = voter;
    request.voteYes = voteYes;
    request.salt = salt;
    r = CommitRevealEngine::Reveal(proposal, record, request, ctx.now);
    if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);

    tx.Store(db::prefix::VOTE, recordKey, *record);
    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);

    // Best-effort rebate from the proposal's own account
    bool rebatePaid = false;
    if (options_.revealRebate > 0) {
        Identity account = ProposalAccount(proposalKey);
        Amount available = 0, callerBalance = 0, credited;
        r = ValueLedger::GetBalance(tx, account, available);
        if (r.ok()) r = ValueLedger::GetBalance(tx, ctx.caller, callerBalance);
        if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);

        if (CommitRevealEngine::CanPayRebate(available, options_.revealRebate,
                                             options_.rebateReserve) &&
            CheckedAdd(callerBalance, options_.revealRebate, credited)) {
            r = ValueLedger::Transfer(tx, account, ctx.caller, options_.revealRebate);
            if (!r.ok()) return Reject(util::LogCategory::VOTE, op, r);
            rebatePaid = true;
        } else {
            LOG_DEBUG(util::LogCategory::VOTE) << "reveal rebate skipped on #" << proposal.id
                                               << ": balance " << available;
        }
    }

    VoteRevealedEvent event;
    event.proposal = proposalKey;
    event.voter = voter;
    event.revealer = ctx.caller;
    event.votedYes = voteYes;
    event.capitalWeight = record->capitalWeight;
    event.communityWeight = record->communityWeight;
    event.rebatePaid = rebatePaid;
    event.rebate = rebatePaid ? options_.revealRebate : 0;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::VOTE) << "vote revealed on #" << proposal.id << " for "
                                      << Short(voter) << ": " << (voteYes ? "yes" : "no");
    return Result::Ok();
}

Result DaoEngine::Finalize(const RequestContext& ctx, const Hash256& proposalKey,
                           TallyOutcome* outcome) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "finalize";
    Transaction tx(store_);

    Proposal proposal;
    DaoConfig dao;
    TallyOutcome result;
    Result r = LoadProposal(tx, proposalKey, proposal);
    if (r.ok()) r = LoadDao(tx, proposal.dao, dao);
    if (r.ok()) r = TallyEvaluator::Finalize(dao, proposal, ctx.now, result);
    if (!r.ok()) return Reject(util::LogCategory::TALLY, op, r);

    tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);

    ProposalFinalizedEvent event;
    event.proposal = proposalKey;
    event.status = proposal.status;
    event.quorumMet = result.quorumMet;
    event.yesCapital = proposal.yesCapital;
    event.noCapital = proposal.noCapital;
    event.yesCommunity = proposal.yesCommunity;
    event.noCommunity = proposal.noCommunity;
    event.commitCount = proposal.commitCount;
    event.revealCount = proposal.revealCount;
    event.executionUnlocksAt = proposal.executionUnlocksAt;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TALLY) << "proposal #" << proposal.id << " "
                                       << ProposalStatusToString(proposal.status)
                                       << " (quorum " << (result.quorumMet ? "met" : "missed")
                                       << ", " << proposal.revealCount << "/"
                                       << proposal.commitCount << " revealed)";
    if (outcome) {
        *outcome = result;
    }
    return Result::Ok();
}

// ============================================================================
// Execution and Treasury
// ============================================================================

Result DaoEngine::Execute(const RequestContext& ctx, const Hash256& proposalKey,
                          const std::optional<Identity>& target) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "execute";

    Proposal proposal;
    {
        Transaction tx(store_);
        Result r = LoadProposal(tx, proposalKey, proposal);
        if (r.ok()) r = TimelockController::AuthorizeExecution(proposal, target, ctx.now);
        if (!r.ok()) return Reject(util::LogCategory::TIMELOCK, op, r);

        TimelockController::MarkExecuted(proposal);
        tx.Store(db::prefix::PROPOSAL, proposalKey, proposal);

        if (!proposal.treasuryAction) {
            tx.Emit(Event(ctx.now, TreasuryExecutedEvent{proposalKey, ctx.caller, std::nullopt}));
            r = CommitAndNotify(lock, tx, op);
            if (!r.ok()) return r;
            LOG_INFO(util::LogCategory::TIMELOCK) << "proposal #" << proposal.id
                                                  << " executed (no treasury action)";
            return Result::Ok();
        }

        r = CommitAndNotify(lock, tx, op);
        if (!r.ok()) return r;
    }

    TreasuryTransfer transfer;
    transfer.dao = proposal.dao;
    transfer.proposal = proposalKey;
    transfer.treasury = TreasuryAccount(proposal.dao);
    transfer.action = *proposal.treasuryAction;
    lock.unlock();
    Result transferResult = gateway_.Transfer(transfer);
    lock.lock();

    Transaction tx(store_);
    if (!transferResult.ok()) {
        LOG_WARN(util::LogCategory::TREASURY) << "treasury transfer for #" << proposal.id
                                              << " failed: " << transferResult.ToString();
        tx.Emit(Event(ctx.now, TreasuryExecutionFailedEvent{proposalKey, ctx.caller,
                                                            transferResult.ToString()}));
        Result r = CommitAndNotify(lock, tx, op);
        if (!r.ok()) {
            LOG_ERROR(util::LogCategory::TREASURY) << "failure event for #" << proposal.id
                                                   << " not recorded: " << r.ToString();
        }
        return Result::Error(DaoError::TREASURY_TRANSFER_FAILED, transferResult.ToString());
    }

    tx.Emit(Event(ctx.now, TreasuryExecutedEvent{proposalKey, ctx.caller,
                                                 proposal.treasuryAction}));
    Result r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TREASURY) << "proposal #" << proposal.id << " executed: "
                                          << proposal.treasuryAction->ToString();
    return Result::Ok();
}

Result DaoEngine::DepositTreasury(const RequestContext& ctx, const Hash256& daoKey,
                                  Amount amount) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "depositTreasury";
    Transaction tx(store_);

    if (amount == 0) {
        return Reject(util::LogCategory::TREASURY, op,
                      Result::Error(DaoError::INVALID_AMOUNT, "deposit must be positive"));
    }

    DaoConfig dao;
    Result r = LoadDao(tx, daoKey, dao);
    if (r.ok()) r = ValueLedger::Transfer(tx, ctx.caller, TreasuryAccount(daoKey), amount);
    if (!r.ok()) return Reject(util::LogCategory::TREASURY, op, r);

    tx.Emit(Event(ctx.now, TreasuryDepositEvent{daoKey, ctx.caller, std::nullopt, amount}));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TREASURY) << "deposited " << amount << " into \"" << dao.name
                                          << "\" treasury";
    return Result::Ok();
}

Result DaoEngine::DepositTreasuryToken(const RequestContext& ctx, const Hash256& daoKey,
                                       const Identity& token, Amount amount) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "depositTreasuryToken";
    Transaction tx(store_);

    if (amount == 0) {
        return Reject(util::LogCategory::TREASURY, op,
                      Result::Error(DaoError::INVALID_AMOUNT, "deposit must be positive"));
    }

    DaoConfig dao;
    Result r = LoadDao(tx, daoKey, dao);
    if (r.ok()) {
        r = ValueLedger::TransferToken(tx, ctx.caller, TreasuryAccount(daoKey), token, amount);
    }
    if (!r.ok()) return Reject(util::LogCategory::TREASURY, op, r);

    tx.Emit(Event(ctx.now, TreasuryDepositEvent{daoKey, ctx.caller, token, amount}));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::TREASURY) << "deposited " << amount << " of token "
                                          << Short(token) << " into \"" << dao.name
                                          << "\" treasury";
    return Result::Ok();
}

// ============================================================================
// External Voting Weight
// ============================================================================

Result DaoEngine::SyncExternalVotingWeight(const RequestContext& ctx, const Hash256& daoKey,
                                           const Identity& realm,
                                           const Identity& governingToken,
                                           VoterWeightRecord* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    const char* op = "syncExternalVotingWeight";
    Transaction tx(store_);

    DaoConfig dao;
    Amount balance = 0;
    VoterWeightRecord record;
    Result r = LoadDao(tx, daoKey, dao);
    if (r.ok() && governingToken != dao.governanceToken) {
        r = Result::Error(DaoError::GOVERNING_MINT_MISMATCH,
                          "token is not the DAO's governance token");
    }
    if (r.ok()) r = balances_.GetTokenBalance(ctx.caller, dao.governanceToken, balance);
    if (r.ok()) {
        r = BuildVoterWeightRecord(dao, realm, governingToken, ctx.caller, balance, ctx.slot,
                                   options_.voterWeightExpirySlots, record);
    }
    if (!r.ok()) return Reject(util::LogCategory::DAO, op, r);

    tx.Store(db::prefix::VOTER_WEIGHT, VoterWeightKey(realm, governingToken, ctx.caller), record);

    VoterWeightSyncedEvent event;
    event.dao = daoKey;
    event.voter = ctx.caller;
    event.weight = record.voterWeight;
    event.expiry = *record.voterWeightExpiry;
    tx.Emit(Event(ctx.now, event));

    r = CommitAndNotify(lock, tx, op);
    if (!r.ok()) return r;

    LOG_INFO(util::LogCategory::DAO) << "voter weight " << record.voterWeight << " published for "
                                     << Short(ctx.caller) << " until slot "
                                     << *record.voterWeightExpiry;
    if (out) {
        *out = record;
    }
    return Result::Ok();
}

Result DaoEngine::ReadCommittedWeight(const Hash256& proposalKey, const Identity& voter,
                                      uint64_t& weight) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);

    std::optional<VoterRecord> record;
    Result r = tx.Load(db::prefix::VOTE, VoterRecordKey(proposalKey, voter), record);
    if (!r.ok()) return Reject(util::LogCategory::VOTE, "readCommittedWeight", r);

    weight = record ? record->communityWeight : 0;
    return Result::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Result DaoEngine::GetDao(const Hash256& daoKey, std::optional<DaoConfig>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return tx.Load(db::prefix::DAO, daoKey, out);
}

Result DaoEngine::GetProposal(const Hash256& proposalKey, std::optional<Proposal>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return tx.Load(db::prefix::PROPOSAL, proposalKey, out);
}

Result DaoEngine::ListProposals(const Hash256& daoKey,
                                std::vector<std::pair<Hash256, Proposal>>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    out.clear();

    DaoConfig dao;
    Result r = LoadDao(tx, daoKey, dao);
    if (!r.ok()) return r;

    for (uint64_t id = 0; id < dao.proposalCount; ++id) {
        Hash256 key = ProposalKey(daoKey, id);
        std::optional<Proposal> proposal;
        r = tx.Load(db::prefix::PROPOSAL, key, proposal);
        if (!r.ok()) return r;
        if (!proposal) {
            return Result::Error(DaoError::CORRUPT_RECORD,
                                 "missing proposal #" + std::to_string(id));
        }
        out.emplace_back(key, std::move(*proposal));
    }
    return Result::Ok();
}

Result DaoEngine::GetVoterRecord(const Hash256& proposalKey, const Identity& voter,
                                 std::optional<VoterRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return tx.Load(db::prefix::VOTE, VoterRecordKey(proposalKey, voter), out);
}

Result DaoEngine::GetDelegation(const Hash256& delegationKey,
                                std::optional<VoteDelegation>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return tx.Load(db::prefix::DELEGATION, delegationKey, out);
}

Result DaoEngine::GetVoterWeightRecord(const Identity& realm, const Identity& governingToken,
                                       const Identity& voter,
                                       std::optional<VoterWeightRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return tx.Load(db::prefix::VOTER_WEIGHT, VoterWeightKey(realm, governingToken, voter), out);
}

Result DaoEngine::GetTreasuryBalance(const Hash256& daoKey, Amount& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return ValueLedger::GetBalance(tx, TreasuryAccount(daoKey), out);
}

Result DaoEngine::GetTreasuryTokenBalance(const Hash256& daoKey, const Identity& token,
                                          Amount& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return ValueLedger::GetTokenBalance(tx, TreasuryAccount(daoKey), token, out);
}

Result DaoEngine::GetBalance(const Identity& account, Amount& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(store_);
    return ValueLedger::GetBalance(tx, account, out);
}

Result DaoEngine::ReadEvents(uint64_t fromSequence, size_t maxCount, std::vector<Event>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.ReadEvents(fromSequence, maxCount, out);
}

} // namespace dao
} // namespace privdao
