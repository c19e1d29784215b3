// PrivDAO - External Voter Weight
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/voter_weight.h"
#include "privdao/dao/arith.h"

namespace privdao {
namespace dao {

uint64_t VotingPowerFor(const VotingConfig& config, Amount rawBalance) {
    switch (config.mode) {
        case VotingMode::TokenWeighted:
            return rawBalance;
        case VotingMode::Quadratic:
        case VotingMode::DualChamber:
            return IntegerSqrt(rawBalance);
    }
    return IntegerSqrt(rawBalance);
}

Result BuildVoterWeightRecord(const DaoConfig& dao, const Identity& realm,
                              const Identity& governingToken, const Identity& voter,
                              Amount rawBalance, Slot slot, uint64_t expirySlots,
                              VoterWeightRecord& out) {
    if (governingToken != dao.governanceToken) {
        return Result::Error(DaoError::GOVERNING_MINT_MISMATCH,
                             "token is not the DAO's governance token");
    }

    uint64_t expiry;
    if (!CheckedAdd(slot, expirySlots, expiry)) {
        return Result::Error(DaoError::OVERFLOW, "expiry slot out of range");
    }

    VoterWeightRecord record;
    record.realm = realm;
    record.governingTokenMint = governingToken;
    record.governingTokenOwner = voter;
    record.voterWeight = VotingPowerFor(dao.votingConfig, rawBalance);
    record.voterWeightExpiry = expiry;

    out = record;
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
