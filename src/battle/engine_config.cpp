/// @file engine_config.cpp
/// @brief EngineConfig loading and validation.

#include "gbe/battle/engine_config.hpp"

#include <string>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::BattleError;
using foundation::BattleResult;
using foundation::ErrorCode;

namespace {

/// Overwrite @p field with the value at @p key when the key is present.
template <typename T>
BattleResult<void> readOptional(const foundation::ConfigManager& config,
                                std::string_view key, T& field) {
    if (!config.hasKey(key)) {
        return BattleResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return BattleResult<void>::err(value.error());
    }
    field = value.value();
    return BattleResult<void>::ok();
}

} // namespace

BattleResult<void> ValidateEngineConfig(const EngineConfig& config) {
    if (config.gridWidth < 2 || config.gridHeight < 2) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::InvalidGridSize,
                        "grid must be at least 2x2, got " + std::to_string(config.gridWidth) +
                            "x" + std::to_string(config.gridHeight)));
    }
    if (config.cooldownDivisor <= 0.0) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::InvalidArgument, "cooldown divisor must be positive"));
    }
    if (config.maxTicks == 0) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::InvalidArgument, "tick ceiling must be positive"));
    }
    if (config.waveCompleteInterval <= 0) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::InvalidArgument, "wave complete interval must be positive"));
    }
    if (config.scrollDistance < 0 || config.spawnSearchRadius < 0) {
        return BattleResult<void>::err(
            BattleError(ErrorCode::InvalidArgument,
                        "scroll distance and spawn search radius must not be negative"));
    }
    return BattleResult<void>::ok();
}

BattleResult<EngineConfig> LoadEngineConfig(const foundation::ConfigManager& config) {
    EngineConfig result;

    for (auto status : {
             readOptional(config, "grid.width", result.gridWidth),
             readOptional(config, "grid.height", result.gridHeight),
             readOptional(config, "battle.max_ticks", result.maxTicks),
             readOptional(config, "battle.cooldown_divisor", result.cooldownDivisor),
             readOptional(config, "battle.consistency_check_interval",
                          result.consistencyCheckInterval),
             readOptional(config, "wave.scroll_distance", result.scrollDistance),
             readOptional(config, "wave.complete_interval", result.waveCompleteInterval),
             readOptional(config, "wave.spawn_search_radius", result.spawnSearchRadius),
             readOptional(config, "random.seed", result.seed),
         }) {
        if (status.hasError()) {
            GBE_LOG_ERROR(foundation::LogCategory::Config, std::string(status.error().message()));
            return BattleResult<EngineConfig>::err(status.error());
        }
    }

    auto valid = ValidateEngineConfig(result);
    if (valid.hasError()) {
        GBE_LOG_ERROR(foundation::LogCategory::Config, std::string(valid.error().message()));
        return BattleResult<EngineConfig>::err(valid.error());
    }
    return BattleResult<EngineConfig>::ok(result);
}

} // namespace gbe::battle
