// PrivDAO - Config Registry
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Validation and construction of DAO configurations.

#ifndef PRIVDAO_DAO_CONFIG_REGISTRY_H
#define PRIVDAO_DAO_CONFIG_REGISTRY_H

#include "privdao/dao/errors.h"
#include "privdao/dao/records.h"

namespace privdao {
namespace dao {

/// Caller-supplied settings for a new DAO
struct DaoConfigParams {
    std::string name;
    uint8_t quorumPercentage{0};
    Amount requiredBalance{0};
    int64_t revealWindowSeconds{0};
    int64_t executionDelaySeconds{0};
    VotingConfig votingConfig;
};

/**
 * Creates DAO configurations. A configuration is immutable once created;
 * only its proposal counter advances.
 */
class ConfigRegistry {
public:
    /// Check name length, quorum, timing windows and chamber thresholds
    static Result Validate(const DaoConfigParams& params);

    /// Build a new configuration with proposal_count = 0
    static Result Create(const Identity& authority, const Identity& governanceToken,
                         const DaoConfigParams& params, DaoConfig& out);

    /**
     * Build a configuration for a DAO migrated from an external governance
     * instance. The minimum balance is forced to zero and the source is
     * recorded for provenance; validation is otherwise identical.
     */
    static Result Migrate(const Identity& authority, const Identity& governanceToken,
                          const Identity& migratedFrom, const DaoConfigParams& params,
                          DaoConfig& out);

    /// Take the next proposal id and advance the counter
    static Result NextProposalId(DaoConfig& config, uint64_t& id);
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_CONFIG_REGISTRY_H
