// PrivDAO - Delegation Ledger
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// One-shot weight delegation for a single proposal. A delegation carries
// weight only, never a vote: the delegatee commits its own hidden ballot
// with the combined weight.

#ifndef PRIVDAO_DAO_DELEGATION_H
#define PRIVDAO_DAO_DELEGATION_H

#include "privdao/dao/commit_reveal.h"
#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

class DelegationLedger {
public:
    /**
     * Record a delegation of the delegator's current balance.
     *
     * @param existing        The delegator's existing delegation, if any
     * @param hasCommitted    The delegator already committed directly
     */
    static Result Delegate(const Proposal& proposal, const Hash256& proposalKey,
                           const Identity& delegator, const Identity& delegatee,
                           Amount rawBalance,
                           const std::optional<VoteDelegation>& existing,
                           bool hasCommitted, Timestamp now, VoteDelegation& out);

    /**
     * Commit the delegatee's ballot with its own weight plus the delegated
     * weight, and consume the delegation. Quadratic weights are summed
     * after the square root, never recomputed on the combined balance.
     *
     * @param delegateeExisting    The delegatee's existing voter record
     * @param delegateeDelegated   The delegatee delegated its own weight away
     */
    static Result CommitDelegated(Proposal& proposal, const Hash256& proposalKey,
                                  VoteDelegation& delegation, const CommitRequest& request,
                                  Amount delegateeRawBalance,
                                  const std::optional<VoterRecord>& delegateeExisting,
                                  bool delegateeDelegated, Timestamp now, VoterRecord& out);
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_DELEGATION_H
