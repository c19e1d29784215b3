// PrivDAO - Tally Evaluator
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Pass/fail evaluation of revealed tallies once the reveal window closes.

#ifndef PRIVDAO_DAO_TALLY_H
#define PRIVDAO_DAO_TALLY_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

struct TallyOutcome {
    bool quorumMet{false};
    bool passed{false};
};

class TallyEvaluator {
public:
    /// commit_count > 0 and reveal_count * 100 >= commit_count * quorum
    static bool QuorumMet(uint64_t commitCount, uint64_t revealCount, uint8_t quorumPercentage);

    /// Strict majority of a non-empty chamber
    static Result MajorityPasses(uint64_t yes, uint64_t no, bool& passed);

    /// yes * 100 >= (yes + no) * threshold, on a non-empty chamber
    static Result ThresholdPasses(uint64_t yes, uint64_t no, uint8_t threshold, bool& passed);

    /// Quorum and the voting-mode rule over the current tallies
    static Result Evaluate(const DaoConfig& dao, const Proposal& proposal, TallyOutcome& out);

    /**
     * Close voting: Passed (with the timelock started) or Failed. Valid once,
     * after reveal_end, while the proposal is still Voting.
     */
    static Result Finalize(const DaoConfig& dao, Proposal& proposal, Timestamp now,
                           TallyOutcome& out);
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_TALLY_H
