#pragma once

/// @file engine_config.hpp
/// @brief Tunable engine parameters and their YAML loader.

#include <cstdint>

#include "gbe/battle/grid_types.hpp"
#include "gbe/battle/occupancy_grid.hpp"
#include "gbe/foundation/battle_result.hpp"
#include "gbe/foundation/config_manager.hpp"

namespace gbe::battle {

/// Every tunable of a battle, with defaults.
///
/// YAML keys (all optional):
/// @code
///   grid:
///     width: 8
///     height: 8
///   battle:
///     max_ticks: 10000
///     cooldown_divisor: 10
///     consistency_check_interval: 1
///   wave:
///     scroll_distance: 2
///     complete_interval: 3
///     spawn_search_radius: 5
///   random:
///     seed: 24301
/// @endcode
struct EngineConfig {
    int32_t gridWidth = kDefaultGridWidth;
    int32_t gridHeight = kDefaultGridHeight;
    uint32_t maxTicks = 10000;
    double cooldownDivisor = kDefaultCooldownDivisor;
    uint32_t consistencyCheckInterval = 1;  ///< 0 disables the occupancy check.
    int32_t scrollDistance = 2;
    int32_t waveCompleteInterval = 3;
    int32_t spawnSearchRadius = kDefaultFreeCellSearchRadius;
    uint64_t seed = 0x5eed;
};

/// Build an EngineConfig from @p config, keeping defaults for absent keys.
///
/// @return ConfigTypeMismatch if a present key has the wrong type,
///         InvalidGridSize for a grid smaller than 2x2, InvalidArgument for
///         a non-positive divisor, tick ceiling or wave interval.
foundation::BattleResult<EngineConfig> LoadEngineConfig(const foundation::ConfigManager& config);

/// Validate an EngineConfig built in code.
foundation::BattleResult<void> ValidateEngineConfig(const EngineConfig& config);

} // namespace gbe::battle
