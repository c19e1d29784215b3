// PrivDAO - Engine Options
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/options.h"

namespace privdao {
namespace dao {

namespace {

bool ReadUInt(const util::ConfigManager& config, const char* key, uint64_t& value,
              util::ConfigParseResult& error) {
    if (!config.HasKey(key, ENGINE_CONFIG_SECTION)) {
        return true;
    }
    auto parsed = config.TryGetUInt(key, ENGINE_CONFIG_SECTION);
    if (!parsed) {
        error = util::ConfigParseResult::Error(
            std::string("[") + ENGINE_CONFIG_SECTION + "] " + key +
            " must be an unsigned integer");
        return false;
    }
    value = *parsed;
    return true;
}

} // namespace

util::ConfigParseResult LoadEngineOptions(const util::ConfigManager& config,
                                          EngineOptions& out) {
    EngineOptions options;
    util::ConfigParseResult error;

    if (!ReadUInt(config, "reveal_rebate", options.revealRebate, error) ||
        !ReadUInt(config, "rebate_reserve", options.rebateReserve, error) ||
        !ReadUInt(config, "proposal_deposit", options.proposalDeposit, error) ||
        !ReadUInt(config, "voter_weight_expiry_slots", options.voterWeightExpirySlots, error)) {
        return error;
    }

    out = options;
    return util::ConfigParseResult::Success();
}

} // namespace dao
} // namespace privdao
