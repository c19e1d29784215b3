// PrivDAO - Tally Evaluator
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/tally.h"
#include "privdao/dao/arith.h"
#include "privdao/dao/timelock.h"

namespace privdao {
namespace dao {

bool TallyEvaluator::QuorumMet(uint64_t commitCount, uint64_t revealCount,
                               uint8_t quorumPercentage) {
    if (commitCount == 0) {
        return false;
    }
    return ProductAtLeast(revealCount, 100, commitCount, quorumPercentage);
}

Result TallyEvaluator::MajorityPasses(uint64_t yes, uint64_t no, bool& passed) {
    uint64_t total;
    if (!CheckedAdd(yes, no, total)) {
        return Result::Error(DaoError::OVERFLOW, "tally total overflow");
    }
    passed = total > 0 && yes > no;
    return Result::Ok();
}

Result TallyEvaluator::ThresholdPasses(uint64_t yes, uint64_t no, uint8_t threshold,
                                       bool& passed) {
    uint64_t total;
    if (!CheckedAdd(yes, no, total)) {
        return Result::Error(DaoError::OVERFLOW, "tally total overflow");
    }
    passed = total > 0 && ProductAtLeast(yes, 100, total, threshold);
    return Result::Ok();
}

Result TallyEvaluator::Evaluate(const DaoConfig& dao, const Proposal& proposal,
                                TallyOutcome& out) {
    TallyOutcome outcome;
    outcome.quorumMet = QuorumMet(proposal.commitCount, proposal.revealCount,
                                  dao.quorumPercentage);
    if (!outcome.quorumMet) {
        out = outcome;
        return Result::Ok();
    }

    Result r;
    const VotingConfig& voting = dao.votingConfig;
    switch (voting.mode) {
        case VotingMode::TokenWeighted:
            r = MajorityPasses(proposal.yesCapital, proposal.noCapital, outcome.passed);
            break;

        case VotingMode::Quadratic:
            r = MajorityPasses(proposal.yesCommunity, proposal.noCommunity, outcome.passed);
            break;

        case VotingMode::DualChamber: {
            bool capitalPasses = false, communityPasses = false;
            r = ThresholdPasses(proposal.yesCapital, proposal.noCapital,
                                voting.capitalThreshold, capitalPasses);
            if (!r.ok()) return r;
            r = ThresholdPasses(proposal.yesCommunity, proposal.noCommunity,
                                voting.communityThreshold, communityPasses);
            outcome.passed = capitalPasses && communityPasses;
            break;
        }
    }
    if (!r.ok()) return r;

    out = outcome;
    return Result::Ok();
}

Result TallyEvaluator::Finalize(const DaoConfig& dao, Proposal& proposal, Timestamp now,
                                TallyOutcome& out) {
    if (now < proposal.revealEnd) {
        return Result::Error(DaoError::REVEAL_STILL_OPEN,
                             "reveal period ends at " + std::to_string(proposal.revealEnd));
    }
    if (proposal.status != ProposalStatus::Voting) {
        return Result::Error(DaoError::ALREADY_FINALIZED,
                             std::string("proposal is ") +
                             ProposalStatusToString(proposal.status));
    }

    TallyOutcome outcome;
    Result r = Evaluate(dao, proposal, outcome);
    if (!r.ok()) return r;

    if (outcome.passed) {
        r = TimelockController::Schedule(dao, proposal, now);
        if (!r.ok()) return r;
        proposal.status = ProposalStatus::Passed;
    } else {
        proposal.status = ProposalStatus::Failed;
    }

    out = outcome;
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
