// PrivDAO - Engine Options
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#ifndef PRIVDAO_DAO_OPTIONS_H
#define PRIVDAO_DAO_OPTIONS_H

#include "privdao/core/types.h"
#include "privdao/util/config.h"

namespace privdao {
namespace dao {

/// Configuration section holding engine options
constexpr const char* ENGINE_CONFIG_SECTION = "engine";

/// Default reveal rebate in base units
constexpr Amount DEFAULT_REVEAL_REBATE = 1000000;

/// Default balance a proposal keeps back from rebates
constexpr Amount DEFAULT_REBATE_RESERVE = 1500000;

/// Default validity of a published voter weight, in slots
constexpr uint64_t DEFAULT_VOTER_WEIGHT_EXPIRY_SLOTS = 100;

struct EngineOptions {
    /// Paid to whoever submits a successful reveal
    Amount revealRebate{DEFAULT_REVEAL_REBATE};
    /// Rebates are skipped unless the proposal holds more than rebate + reserve
    Amount rebateReserve{DEFAULT_REBATE_RESERVE};
    /// Moved from the proposer into the proposal's account at creation
    Amount proposalDeposit{0};
    uint64_t voterWeightExpirySlots{DEFAULT_VOTER_WEIGHT_EXPIRY_SLOTS};
};

/**
 * Read [engine] reveal_rebate, rebate_reserve, proposal_deposit and
 * voter_weight_expiry_slots. Missing keys keep their defaults; a present
 * key that is not an unsigned integer is an error.
 */
util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineOptions& out);

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_OPTIONS_H
