// PrivDAO - Commit-Reveal Voting
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/commit_reveal.h"
#include "privdao/dao/arith.h"
#include "privdao/crypto/sha256.h"

namespace privdao {
namespace dao {

Commitment ComputeCommitment(bool voteYes, const Salt& salt, const Identity& voter) {
    Byte vote = voteYes ? 1 : 0;
    SHA256 hasher;
    hasher.Write(&vote, 1).Write(salt.data(), salt.size()).Write(voter);
    return hasher.Finalize();
}

Result CommitRevealEngine::CheckCommitWindow(const Proposal& proposal, Timestamp now) {
    if (proposal.status != ProposalStatus::Voting) {
        return Result::Error(DaoError::VOTING_NOT_OPEN,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }
    if (now >= proposal.votingEnd) {
        return Result::Error(DaoError::VOTING_CLOSED, "voting period has ended");
    }
    return Result::Ok();
}

Result CommitRevealEngine::Commit(const DaoConfig& dao, Proposal& proposal,
                                  const Hash256& proposalKey, const CommitRequest& request,
                                  Amount rawBalance, bool hasDelegated,
                                  const std::optional<VoterRecord>& existing,
                                  Timestamp now, VoterRecord& out) {
    Result r = CheckCommitWindow(proposal, now);
    if (!r.ok()) return r;

    if (dao.requiredBalance > 0 && rawBalance < dao.requiredBalance) {
        return Result::Error(DaoError::INSUFFICIENT_WEIGHT,
                             "balance " + std::to_string(rawBalance) + " below required " +
                             std::to_string(dao.requiredBalance));
    }
    if (hasDelegated) {
        return Result::Error(DaoError::ALREADY_DELEGATED,
                             "voter delegated its weight on this proposal");
    }
    if (existing) {
        return Result::Error(DaoError::ALREADY_COMMITTED, "voter already committed");
    }

    return RecordCommit(proposal, proposalKey, request, rawBalance,
                        IntegerSqrt(rawBalance), out);
}

Result CommitRevealEngine::RecordCommit(Proposal& proposal, const Hash256& proposalKey,
                                        const CommitRequest& request,
                                        uint64_t capitalWeight, uint64_t communityWeight,
                                        VoterRecord& out) {
    uint64_t commitCount;
    if (!CheckedAdd(proposal.commitCount, uint64_t(1), commitCount)) {
        return Result::Error(DaoError::OVERFLOW, "commit count overflow");
    }

    VoterRecord record;
    record.voter = request.voter;
    record.proposal = proposalKey;
    record.commitment = request.commitment;
    record.capitalWeight = capitalWeight;
    record.communityWeight = communityWeight;
    record.hasCommitted = true;
    record.keeper = request.keeper;

    proposal.commitCount = commitCount;
    out = record;
    return Result::Ok();
}

Result CommitRevealEngine::Reveal(Proposal& proposal, std::optional<VoterRecord>& record,
                                  const RevealRequest& request, Timestamp now) {
    if (proposal.status != ProposalStatus::Voting) {
        return Result::Error(DaoError::VOTING_NOT_OPEN,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }
    if (now < proposal.votingEnd) {
        return Result::Error(DaoError::REVEAL_TOO_EARLY, "voting period still open");
    }
    if (now >= proposal.revealEnd) {
        return Result::Error(DaoError::REVEAL_CLOSED, "reveal period has ended");
    }
    if (!record || !record->hasCommitted) {
        return Result::Error(DaoError::NOT_COMMITTED, "no commitment for this voter");
    }
    if (record->hasRevealed) {
        return Result::Error(DaoError::ALREADY_REVEALED, "vote already revealed");
    }
    bool isVoter = request.caller == record->voter;
    bool isKeeper = record->keeper && request.caller == *record->keeper;
    if (!isVoter && !isKeeper) {
        return Result::Error(DaoError::NOT_AUTHORIZED_TO_REVEAL,
                             "caller is neither the voter nor its keeper");
    }
    if (ComputeCommitment(request.voteYes, request.salt, record->voter) != record->commitment) {
        return Result::Error(DaoError::COMMITMENT_MISMATCH,
                             "revealed vote does not match commitment");
    }

    uint64_t& capitalTally = request.voteYes ? proposal.yesCapital : proposal.noCapital;
    uint64_t& communityTally = request.voteYes ? proposal.yesCommunity : proposal.noCommunity;

    uint64_t capital, community, reveals;
    if (!CheckedAdd(capitalTally, record->capitalWeight, capital) ||
        !CheckedAdd(communityTally, record->communityWeight, community) ||
        !CheckedAdd(proposal.revealCount, uint64_t(1), reveals)) {
        return Result::Error(DaoError::OVERFLOW, "tally overflow");
    }

    capitalTally = capital;
    communityTally = community;
    proposal.revealCount = reveals;
    record->hasRevealed = true;
    record->votedYes = request.voteYes;
    return Result::Ok();
}

bool CommitRevealEngine::CanPayRebate(Amount proposalBalance, Amount rebate, Amount reserve) {
    uint64_t floor;
    if (!CheckedAdd(rebate, reserve, floor)) {
        return false;
    }
    return proposalBalance > floor;
}

} // namespace dao
} // namespace privdao
