// PrivDAO - Record Addressing
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/address.h"
#include "privdao/core/serialize.h"
#include "privdao/crypto/sha256.h"

namespace privdao {
namespace dao {

Hash256 DaoKey(const Identity& authority, const std::string& name) {
    SHA256 hasher;
    hasher.Write("dao").Write(authority).Write(name);
    return hasher.Finalize();
}

Hash256 ProposalKey(const Hash256& daoKey, uint64_t proposalId) {
    Byte id[8];
    uint64_t le = detail::HostToLE64(proposalId);
    std::memcpy(id, &le, sizeof(id));

    SHA256 hasher;
    hasher.Write("proposal").Write(daoKey).Write(id, sizeof(id));
    return hasher.Finalize();
}

Hash256 VoterRecordKey(const Hash256& proposalKey, const Identity& voter) {
    SHA256 hasher;
    hasher.Write("vote").Write(proposalKey).Write(voter);
    return hasher.Finalize();
}

Hash256 DelegationKey(const Hash256& proposalKey, const Identity& delegator) {
    SHA256 hasher;
    hasher.Write("delegation").Write(proposalKey).Write(delegator);
    return hasher.Finalize();
}

Hash256 VoterWeightKey(const Identity& realm, const Identity& governingToken,
                       const Identity& voter) {
    SHA256 hasher;
    hasher.Write("voter-weight-record").Write(realm).Write(governingToken).Write(voter);
    return hasher.Finalize();
}

Identity TreasuryAccount(const Hash256& daoKey) {
    SHA256 hasher;
    hasher.Write("treasury").Write(daoKey);
    return Identity(hasher.Finalize());
}

} // namespace dao
} // namespace privdao
