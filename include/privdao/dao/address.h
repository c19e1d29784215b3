// PrivDAO - Record Addressing
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Deterministic record keys. Each key is SHA-256 over a domain tag and the
// semantic identity of the record, so the same inputs always address the
// same record.

#ifndef PRIVDAO_DAO_ADDRESS_H
#define PRIVDAO_DAO_ADDRESS_H

#include "privdao/core/types.h"

#include <string>

namespace privdao {
namespace dao {

/// Key of a DAO: ("dao", authority, name)
Hash256 DaoKey(const Identity& authority, const std::string& name);

/// Key of a proposal: ("proposal", dao key, id as 8-byte little endian)
Hash256 ProposalKey(const Hash256& daoKey, uint64_t proposalId);

/// Key of a voter record: ("vote", proposal key, voter)
Hash256 VoterRecordKey(const Hash256& proposalKey, const Identity& voter);

/// Key of a delegation: ("delegation", proposal key, delegator)
Hash256 DelegationKey(const Hash256& proposalKey, const Identity& delegator);

/// Key of a voter-weight record: ("voter-weight-record", realm, token, voter)
Hash256 VoterWeightKey(const Identity& realm, const Identity& governingToken,
                       const Identity& voter);

/// Treasury account of a DAO: ("treasury", dao key)
Identity TreasuryAccount(const Hash256& daoKey);

/// A proposal's own value account (funds reveal rebates)
inline Identity ProposalAccount(const Hash256& proposalKey) {
    return Identity(proposalKey);
}

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_ADDRESS_H
