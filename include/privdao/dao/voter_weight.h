// PrivDAO - External Voter Weight
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Publishes a member's voting power in the fixed-layout record read by an
// external governance platform.

#ifndef PRIVDAO_DAO_VOTER_WEIGHT_H
#define PRIVDAO_DAO_VOTER_WEIGHT_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

/// Linear balance under TokenWeighted, quadratic weight otherwise
uint64_t VotingPowerFor(const VotingConfig& config, Amount rawBalance);

/**
 * Build the voter-weight record for one member. The governing token must
 * be the DAO's governance token; the record expires expirySlots after slot.
 */
Result BuildVoterWeightRecord(const DaoConfig& dao, const Identity& realm,
                              const Identity& governingToken, const Identity& voter,
                              Amount rawBalance, Slot slot, uint64_t expirySlots,
                              VoterWeightRecord& out);

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_VOTER_WEIGHT_H
