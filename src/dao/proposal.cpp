// PrivDAO - Proposal Lifecycle
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/proposal.h"
#include "privdao/dao/arith.h"
#include "privdao/dao/config_registry.h"

namespace privdao {
namespace dao {

Result ValidateTreasuryAction(const TreasuryAction& action) {
    if (action.recipient.IsNull()) {
        return Result::Error(DaoError::INVALID_TREASURY_ACTION, "recipient is required");
    }

    switch (action.type) {
        case TreasuryActionType::SendSol:
            if (action.amount == 0) {
                return Result::Error(DaoError::INVALID_TREASURY_ACTION,
                                     "SendSol amount must be positive");
            }
            if (action.tokenMint) {
                return Result::Error(DaoError::INVALID_TREASURY_ACTION,
                                     "SendSol takes no token");
            }
            break;

        case TreasuryActionType::SendToken:
            if (action.amount == 0) {
                return Result::Error(DaoError::INVALID_TREASURY_ACTION,
                                     "SendToken amount must be positive");
            }
            if (!action.tokenMint || action.tokenMint->IsNull()) {
                return Result::Error(DaoError::TOKEN_MINT_REQUIRED,
                                     "SendToken requires a token");
            }
            break;

        case TreasuryActionType::CustomCPI:
            if (action.amount != 0) {
                return Result::Error(DaoError::INVALID_TREASURY_ACTION,
                                     "CustomCPI moves no value");
            }
            if (action.tokenMint) {
                return Result::Error(DaoError::INVALID_TREASURY_ACTION,
                                     "CustomCPI takes no token");
            }
            break;
    }
    return Result::Ok();
}

bool IsTerminal(const Proposal& proposal) {
    switch (proposal.status) {
        case ProposalStatus::Voting:    return false;
        case ProposalStatus::Passed:    return proposal.isExecuted;
        case ProposalStatus::Failed:
        case ProposalStatus::Cancelled:
        case ProposalStatus::Vetoed:    return true;
    }
    return true;
}

Result ProposalLifecycle::Create(DaoConfig& dao, const Hash256& daoKey,
                                 const Identity& proposer, const ProposalParams& params,
                                 Timestamp now, Proposal& out) {
    if (params.title.size() > MAX_TITLE_LENGTH) {
        return Result::Error(DaoError::TITLE_TOO_LONG,
                             "title exceeds " + std::to_string(MAX_TITLE_LENGTH) + " bytes");
    }
    if (params.description.size() > MAX_DESCRIPTION_LENGTH) {
        return Result::Error(DaoError::DESCRIPTION_TOO_LONG,
                             "description exceeds " +
                             std::to_string(MAX_DESCRIPTION_LENGTH) + " bytes");
    }
    if (params.votingDurationSeconds < MIN_VOTING_DURATION) {
        return Result::Error(DaoError::VOTING_DURATION_TOO_SHORT,
                             "voting duration must be at least " +
                             std::to_string(MIN_VOTING_DURATION) + " seconds");
    }
    if (params.treasuryAction) {
        Result r = ValidateTreasuryAction(*params.treasuryAction);
        if (!r.ok()) return r;
    }

    Timestamp votingEnd, revealEnd;
    if (!CheckedAdd(now, params.votingDurationSeconds, votingEnd) ||
        !CheckedAdd(votingEnd, dao.revealWindowSeconds, revealEnd)) {
        return Result::Error(DaoError::OVERFLOW, "proposal deadline out of range");
    }

    uint64_t id;
    Result r = ConfigRegistry::NextProposalId(dao, id);
    if (!r.ok()) return r;

    Proposal p;
    p.dao = daoKey;
    p.proposer = proposer;
    p.id = id;
    p.title = params.title;
    p.description = params.description;
    p.status = ProposalStatus::Voting;
    p.votingEnd = votingEnd;
    p.revealEnd = revealEnd;
    p.treasuryAction = params.treasuryAction;

    out = p;
    return Result::Ok();
}

Result ProposalLifecycle::Cancel(const DaoConfig& dao, Proposal& proposal,
                                 const Identity& caller) {
    if (caller != dao.authority) {
        return Result::Error(DaoError::NOT_AUTHORITY, "only the DAO authority may cancel");
    }
    if (proposal.status != ProposalStatus::Voting) {
        return Result::Error(DaoError::PROPOSAL_NOT_CANCELLABLE,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }
    proposal.status = ProposalStatus::Cancelled;
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
