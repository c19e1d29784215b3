// PrivDAO - Timelock Controller
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/timelock.h"
#include "privdao/dao/arith.h"
#include "privdao/dao/proposal.h"

namespace privdao {
namespace dao {

Result TimelockController::Schedule(const DaoConfig& dao, Proposal& proposal, Timestamp now) {
    Timestamp unlocksAt;
    if (!CheckedAdd(now, dao.executionDelaySeconds, unlocksAt)) {
        return Result::Error(DaoError::OVERFLOW, "unlock time out of range");
    }
    proposal.executionUnlocksAt = unlocksAt;
    return Result::Ok();
}

Result TimelockController::Veto(const DaoConfig& dao, Proposal& proposal,
                                const Identity& caller, Timestamp now) {
    if (caller != dao.authority) {
        return Result::Error(DaoError::NOT_AUTHORITY, "only the DAO authority may veto");
    }
    if (proposal.status != ProposalStatus::Passed) {
        return Result::Error(DaoError::PROPOSAL_NOT_PASSED,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }
    if (proposal.isExecuted) {
        return Result::Error(DaoError::VETO_AFTER_EXECUTION, "proposal already executed");
    }
    if (now >= proposal.executionUnlocksAt) {
        return Result::Error(DaoError::VETO_WINDOW_EXPIRED, "timelock has expired");
    }
    proposal.status = ProposalStatus::Vetoed;
    return Result::Ok();
}

Result TimelockController::AuthorizeExecution(const Proposal& proposal,
                                              const std::optional<Identity>& target,
                                              Timestamp now) {
    if (proposal.status != ProposalStatus::Passed) {
        return Result::Error(DaoError::PROPOSAL_NOT_PASSED,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }
    if (proposal.isExecuted) {
        return Result::Error(DaoError::ALREADY_EXECUTED, "proposal already executed");
    }
    if (now < proposal.executionUnlocksAt) {
        return Result::Error(DaoError::EXECUTION_TIMELOCK_ACTIVE,
                             "unlocks at " + std::to_string(proposal.executionUnlocksAt));
    }

    if (proposal.treasuryAction) {
        const TreasuryAction& action = *proposal.treasuryAction;
        Result r = ValidateTreasuryAction(action);
        if (!r.ok()) return r;
        if (!target || *target != action.recipient) {
            return Result::Error(DaoError::TREASURY_RECIPIENT_MISMATCH,
                                 "target does not match the designated recipient");
        }
    }
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
