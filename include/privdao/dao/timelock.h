// PrivDAO - Timelock Controller
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Gates a passed proposal's treasury action behind the execution delay.
// During the delay the authority may veto; afterwards anyone may execute,
// exactly once.

#ifndef PRIVDAO_DAO_TIMELOCK_H
#define PRIVDAO_DAO_TIMELOCK_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

class TimelockController {
public:
    /// Start the delay: execution_unlocks_at = now + execution delay
    static Result Schedule(const DaoConfig& dao, Proposal& proposal, Timestamp now);

    /// Authority veto, only while Passed, unexecuted and now < unlocks_at
    static Result Veto(const DaoConfig& dao, Proposal& proposal, const Identity& caller,
                       Timestamp now);

    /**
     * Check that the proposal may execute now against the given target.
     * The attached action's shape is validated again and its recipient
     * must equal the target. Has no effect on the proposal.
     */
    static Result AuthorizeExecution(const Proposal& proposal,
                                     const std::optional<Identity>& target, Timestamp now);

    /// One-way executed flag, set before the transfer is attempted
    static void MarkExecuted(Proposal& proposal) { proposal.isExecuted = true; }
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_TIMELOCK_H
