// PrivDAO - Proposal Lifecycle
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Proposal creation and cancellation, and the shape rules for attached
// treasury actions.
//
//   Voting --finalize--> Passed | Failed
//   Voting --cancel----> Cancelled
//   Passed --veto------> Vetoed
//   Passed --execute---> Passed (executed)

#ifndef PRIVDAO_DAO_PROPOSAL_H
#define PRIVDAO_DAO_PROPOSAL_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

/// Caller-supplied settings for a new proposal
struct ProposalParams {
    std::string title;
    std::string description;
    int64_t votingDurationSeconds{0};
    std::optional<TreasuryAction> treasuryAction;
};

/**
 * Check the shape of a treasury action:
 * SendSol needs amount > 0 and no token; SendToken needs amount > 0 and a
 * token; CustomCPI needs amount == 0 and no token. All need a recipient.
 */
Result ValidateTreasuryAction(const TreasuryAction& action);

/// True once no further transition can apply
bool IsTerminal(const Proposal& proposal);

class ProposalLifecycle {
public:
    /**
     * Create proposal number dao.proposalCount and advance the counter.
     * voting_end = now + duration; reveal_end = voting_end + reveal window.
     */
    static Result Create(DaoConfig& dao, const Hash256& daoKey, const Identity& proposer,
                         const ProposalParams& params, Timestamp now, Proposal& out);

    /// Authority cancels a proposal that is still Voting
    static Result Cancel(const DaoConfig& dao, Proposal& proposal, const Identity& caller);
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_PROPOSAL_H
