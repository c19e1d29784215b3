// PrivDAO - Governance Engine
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// The request surface of a private-ballot DAO. Every operation loads the
// records it needs into a Transaction, applies one component's rules and
// commits all of its effects, events included, or none of them. Requests
// are serialized: the engine handles one at a time.

#ifndef PRIVDAO_DAO_ENGINE_H
#define PRIVDAO_DAO_ENGINE_H

#include "privdao/core/types.h"
#include "privdao/dao/commit_reveal.h"
#include "privdao/dao/config_registry.h"
#include "privdao/dao/errors.h"
#include "privdao/dao/events.h"
#include "privdao/dao/ledger.h"
#include "privdao/dao/options.h"
#include "privdao/dao/proposal.h"
#include "privdao/dao/records.h"
#include "privdao/dao/state_store.h"
#include "privdao/dao/tally.h"

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace privdao {
namespace dao {

/// Who is asking, and the host clock read once for this request
struct RequestContext {
    Identity caller;
    Timestamp now{0};
    Slot slot{0};
};

class DaoEngine {
public:
    DaoEngine(StateStore& store, IBalanceSource& balances, ITreasuryGateway& gateway,
              const EngineOptions& options = EngineOptions());

    DaoEngine(const DaoEngine&) = delete;
    DaoEngine& operator=(const DaoEngine&) = delete;

    // ========================================================================
    // Listeners
    // ========================================================================

    /// Listeners run after the write commits, outside the engine lock, and may
    /// call back into the engine.
    void AddListener(IEventListener* listener);
    void RemoveListener(IEventListener* listener);

    const EngineOptions& GetOptions() const { return options_; }

    // ========================================================================
    // DAO Configuration
    // ========================================================================

    /// Create a DAO with the caller as authority
    Result CreateConfig(const RequestContext& ctx, const Identity& governanceToken,
                        const DaoConfigParams& params, Hash256& daoKey);

    /// Create a DAO migrated from an external governance instance
    Result MigrateConfig(const RequestContext& ctx, const Identity& governanceToken,
                         const Identity& migratedFrom, const DaoConfigParams& params,
                         Hash256& daoKey);

    // ========================================================================
    // Proposal Lifecycle
    // ========================================================================

    Result CreateProposal(const RequestContext& ctx, const Hash256& daoKey,
                          const ProposalParams& params, Hash256& proposalKey);

    Result CancelProposal(const RequestContext& ctx, const Hash256& proposalKey);

    Result VetoProposal(const RequestContext& ctx, const Hash256& proposalKey);

    // ========================================================================
    // Voting
    // ========================================================================

    Result CommitVote(const RequestContext& ctx, const Hash256& proposalKey,
                      const Commitment& commitment,
                      const std::optional<Identity>& keeper = std::nullopt);

    /// Delegate the caller's current weight to delegatee for one proposal
    Result Delegate(const RequestContext& ctx, const Hash256& proposalKey,
                    const Identity& delegatee);

    /// Commit as delegatee using the delegation stored at delegationKey
    Result CommitDelegatedVote(const RequestContext& ctx, const Hash256& proposalKey,
                               const Hash256& delegationKey, const Commitment& commitment,
                               const std::optional<Identity>& keeper = std::nullopt);

    /// Reveal voter's ballot; the caller is the voter or its keeper
    Result RevealVote(const RequestContext& ctx, const Hash256& proposalKey,
                      const Identity& voter, bool voteYes, const Salt& salt);

    Result Finalize(const RequestContext& ctx, const Hash256& proposalKey,
                    TallyOutcome* outcome = nullptr);

    // ========================================================================
    // Execution and Treasury
    // ========================================================================

    /**
     * Execute a passed proposal once its timelock has expired. The executed
     * flag is committed before the treasury transfer is attempted, so the
     * transfer runs at most once. A failed transfer returns
     * TREASURY_TRANSFER_FAILED and the proposal stays executed, even when
     * the failure event cannot be recorded. The gateway runs without the
     * engine lock held.
     */
    Result Execute(const RequestContext& ctx, const Hash256& proposalKey,
                   const std::optional<Identity>& target);

    Result DepositTreasury(const RequestContext& ctx, const Hash256& daoKey, Amount amount);

    Result DepositTreasuryToken(const RequestContext& ctx, const Hash256& daoKey,
                                const Identity& token, Amount amount);

    // ========================================================================
    // External Voting Weight
    // ========================================================================

    /// Publish the caller's voting power for an external governance platform
    Result SyncExternalVotingWeight(const RequestContext& ctx, const Hash256& daoKey,
                                    const Identity& realm, const Identity& governingToken,
                                    VoterWeightRecord* out = nullptr);

    /// Committed quadratic weight of voter on a proposal, 0 without a record
    Result ReadCommittedWeight(const Hash256& proposalKey, const Identity& voter,
                               uint64_t& weight);

    // ========================================================================
    // Queries
    // ========================================================================

    Result GetDao(const Hash256& daoKey, std::optional<DaoConfig>& out);

    Result GetProposal(const Hash256& proposalKey, std::optional<Proposal>& out);

    /// All proposals of a DAO in id order, with their keys
    Result ListProposals(const Hash256& daoKey,
                         std::vector<std::pair<Hash256, Proposal>>& out);

    Result GetVoterRecord(const Hash256& proposalKey, const Identity& voter,
                          std::optional<VoterRecord>& out);

    Result GetDelegation(const Hash256& delegationKey, std::optional<VoteDelegation>& out);

    Result GetVoterWeightRecord(const Identity& realm, const Identity& governingToken,
                                const Identity& voter, std::optional<VoterWeightRecord>& out);

    Result GetTreasuryBalance(const Hash256& daoKey, Amount& out);

    Result GetTreasuryTokenBalance(const Hash256& daoKey, const Identity& token, Amount& out);

    /// Native balance of any ledger account
    Result GetBalance(const Identity& account, Amount& out);

    Result ReadEvents(uint64_t fromSequence, size_t maxCount, std::vector<Event>& out);

private:
    Result CreateDao(std::unique_lock<std::mutex>& lock, const DaoConfig& config, Timestamp now,
                     Hash256& daoKey, const char* op);

    Result LoadDao(const Transaction& tx, const Hash256& daoKey, DaoConfig& out) const;

    Result LoadProposal(const Transaction& tx, const Hash256& proposalKey,
                        Proposal& out) const;

    /// Commit the transaction, then deliver its events with the lock released.
    /// The lock is held again on return.
    Result CommitAndNotify(std::unique_lock<std::mutex>& lock, Transaction& tx, const char* op);

    /// Log a rejected request and pass its result through
    Result Reject(const char* category, const char* op, const Result& result) const;

    std::mutex mutex_;
    StateStore& store_;
    IBalanceSource& balances_;
    ITreasuryGateway& gateway_;
    EngineOptions options_;
    std::vector<IEventListener*> listeners_;
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_ENGINE_H
