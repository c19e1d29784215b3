// PrivDAO - Config Registry
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/config_registry.h"
#include "privdao/dao/arith.h"

namespace privdao {
namespace dao {

namespace {

bool IsPercentage(uint8_t value) {
    return value >= 1 && value <= 100;
}

} // namespace

Result ConfigRegistry::Validate(const DaoConfigParams& params) {
    if (params.name.size() > MAX_NAME_LENGTH) {
        return Result::Error(DaoError::NAME_TOO_LONG,
                             "name exceeds " + std::to_string(MAX_NAME_LENGTH) + " bytes");
    }
    if (!IsPercentage(params.quorumPercentage)) {
        return Result::Error(DaoError::INVALID_QUORUM, "quorum must be in [1, 100]");
    }
    if (params.revealWindowSeconds < MIN_REVEAL_WINDOW) {
        return Result::Error(DaoError::REVEAL_WINDOW_TOO_SHORT,
                             "reveal window must be at least " +
                             std::to_string(MIN_REVEAL_WINDOW) + " seconds");
    }
    if (params.executionDelaySeconds < 0) {
        return Result::Error(DaoError::INVALID_EXECUTION_DELAY,
                             "execution delay must not be negative");
    }

    const VotingConfig& voting = params.votingConfig;
    switch (voting.mode) {
        case VotingMode::TokenWeighted:
        case VotingMode::Quadratic:
            break;
        case VotingMode::DualChamber:
            if (!IsPercentage(voting.capitalThreshold) ||
                !IsPercentage(voting.communityThreshold)) {
                return Result::Error(DaoError::INVALID_THRESHOLD,
                                     "chamber thresholds must be in [1, 100]");
            }
            break;
    }
    return Result::Ok();
}

Result ConfigRegistry::Create(const Identity& authority, const Identity& governanceToken,
                              const DaoConfigParams& params, DaoConfig& out) {
    Result r = Validate(params);
    if (!r.ok()) return r;

    DaoConfig config;
    config.authority = authority;
    config.name = params.name;
    config.governanceToken = governanceToken;
    config.quorumPercentage = params.quorumPercentage;
    config.requiredBalance = params.requiredBalance;
    config.revealWindowSeconds = params.revealWindowSeconds;
    config.executionDelaySeconds = params.executionDelaySeconds;
    config.votingConfig = params.votingConfig;
    if (config.votingConfig.mode != VotingMode::DualChamber) {
        config.votingConfig.capitalThreshold = 0;
        config.votingConfig.communityThreshold = 0;
    }
    config.proposalCount = 0;

    out = config;
    return Result::Ok();
}

Result ConfigRegistry::Migrate(const Identity& authority, const Identity& governanceToken,
                               const Identity& migratedFrom, const DaoConfigParams& params,
                               DaoConfig& out) {
    DaoConfigParams migrated = params;
    migrated.requiredBalance = 0;

    DaoConfig config;
    Result r = Create(authority, governanceToken, migrated, config);
    if (!r.ok()) return r;

    config.migratedFrom = migratedFrom;
    out = config;
    return Result::Ok();
}

Result ConfigRegistry::NextProposalId(DaoConfig& config, uint64_t& id) {
    uint64_t next;
    if (!CheckedAdd(config.proposalCount, uint64_t(1), next)) {
        return Result::Error(DaoError::OVERFLOW, "proposal counter exhausted");
    }
    id = config.proposalCount;
    config.proposalCount = next;
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
