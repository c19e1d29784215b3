// PrivDAO - Delegation Ledger
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/delegation.h"
#include "privdao/dao/arith.h"

namespace privdao {
namespace dao {

Result DelegationLedger::Delegate(const Proposal& proposal, const Hash256& proposalKey,
                                  const Identity& delegator, const Identity& delegatee,
                                  Amount rawBalance,
                                  const std::optional<VoteDelegation>& existing,
                                  bool hasCommitted, Timestamp now, VoteDelegation& out) {
    Result r = CommitRevealEngine::CheckCommitWindow(proposal, now);
    if (!r.ok()) return r;

    if (delegator == delegatee) {
        return Result::Error(DaoError::SELF_DELEGATION, "cannot delegate to self");
    }
    if (rawBalance == 0) {
        return Result::Error(DaoError::INSUFFICIENT_WEIGHT, "delegator has no weight");
    }
    if (existing) {
        return Result::Error(DaoError::ALREADY_DELEGATED,
                             "delegator already delegated on this proposal");
    }
    if (hasCommitted) {
        return Result::Error(DaoError::ALREADY_COMMITTED,
                             "delegator already committed on this proposal");
    }

    VoteDelegation delegation;
    delegation.delegator = delegator;
    delegation.delegatee = delegatee;
    delegation.proposal = proposalKey;
    delegation.delegatedCapital = rawBalance;
    delegation.delegatedCommunity = IntegerSqrt(rawBalance);
    delegation.isUsed = false;

    out = delegation;
    return Result::Ok();
}

Result DelegationLedger::CommitDelegated(Proposal& proposal, const Hash256& proposalKey,
                                         VoteDelegation& delegation,
                                         const CommitRequest& request,
                                         Amount delegateeRawBalance,
                                         const std::optional<VoterRecord>& delegateeExisting,
                                         bool delegateeDelegated, Timestamp now,
                                         VoterRecord& out) {
    if (request.voter != delegation.delegatee) {
        return Result::Error(DaoError::NOT_DELEGATEE, "caller is not the delegatee");
    }
    if (delegation.proposal != proposalKey) {
        return Result::Error(DaoError::WRONG_PROPOSAL,
                             "delegation belongs to another proposal");
    }

    Result r = CommitRevealEngine::CheckCommitWindow(proposal, now);
    if (!r.ok()) return r;

    if (delegation.isUsed) {
        return Result::Error(DaoError::DELEGATION_ALREADY_USED, "delegation already used");
    }
    if (delegateeExisting) {
        return Result::Error(DaoError::ALREADY_COMMITTED, "delegatee already committed");
    }
    if (delegateeDelegated) {
        return Result::Error(DaoError::ALREADY_DELEGATED,
                             "delegatee delegated its own weight on this proposal");
    }

    uint64_t capital, community;
    if (!CheckedAdd(delegateeRawBalance, delegation.delegatedCapital, capital) ||
        !CheckedAdd(IntegerSqrt(delegateeRawBalance), delegation.delegatedCommunity,
                    community)) {
        return Result::Error(DaoError::OVERFLOW, "combined weight overflow");
    }

    r = CommitRevealEngine::RecordCommit(proposal, proposalKey, request, capital,
                                         community, out);
    if (!r.ok()) return r;

    delegation.isUsed = true;
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
