// PrivDAO - Commit-Reveal Voting
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Two-phase private ballot. A voter first commits
//
//   commitment = SHA-256(vote_bit || salt[32] || voter[32])
//
// while voting is open, then reveals (vote_bit, salt) during the reveal
// window. Weights are snapshotted at commit time and added to the tallies
// only on a matching reveal.

#ifndef PRIVDAO_DAO_COMMIT_REVEAL_H
#define PRIVDAO_DAO_COMMIT_REVEAL_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

/// Commitment over a vote, salt and the voter's own identity
Commitment ComputeCommitment(bool voteYes, const Salt& salt, const Identity& voter);

/// A commit submitted by a voter (or by a delegatee for itself)
struct CommitRequest {
    Identity voter;
    Commitment commitment;
    std::optional<Identity> keeper;
};

/// A reveal submitted by the voter or its keeper
struct RevealRequest {
    Identity caller;
    Identity voter;
    bool voteYes{false};
    Salt salt{};
};

class CommitRevealEngine {
public:
    /// Commits are accepted only while Voting and before voting_end
    static Result CheckCommitWindow(const Proposal& proposal, Timestamp now);

    /**
     * Direct commit. Checks the window, the DAO's minimum balance and the
     * double-count guards, then snapshots capital = balance and
     * community = isqrt(balance).
     *
     * @param hasDelegated The voter delegated its weight on this proposal
     * @param existing     The voter's existing record, if any
     */
    static Result Commit(const DaoConfig& dao, Proposal& proposal,
                         const Hash256& proposalKey, const CommitRequest& request,
                         Amount rawBalance, bool hasDelegated,
                         const std::optional<VoterRecord>& existing,
                         Timestamp now, VoterRecord& out);

    /// Create the voter record with fixed weights and count the commit
    static Result RecordCommit(Proposal& proposal, const Hash256& proposalKey,
                               const CommitRequest& request, uint64_t capitalWeight,
                               uint64_t communityWeight, VoterRecord& out);

    /**
     * Reveal. Valid while now is in [voting_end, reveal_end). The hash is
     * always recomputed over the original voter's identity, whoever calls.
     * On a match the snapshotted weights are added to the chosen side.
     */
    static Result Reveal(Proposal& proposal, std::optional<VoterRecord>& record,
                         const RevealRequest& request, Timestamp now);

    /// A rebate is paid only if the proposal keeps more than the reserve
    static bool CanPayRebate(Amount proposalBalance, Amount rebate, Amount reserve);
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_COMMIT_REVEAL_H
