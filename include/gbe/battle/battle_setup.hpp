#pragma once

/// @file battle_setup.hpp
/// @brief Battle input: hero roster, enemy waves, and roster validation.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gbe/battle/engine_config.hpp"
#include "gbe/battle/unit_components.hpp"
#include "gbe/foundation/battle_result.hpp"

namespace gbe::battle {

/// Definition of a unit supplied by the caller.
struct UnitDefinition {
    std::string id;
    std::string name;
    UnitStats stats;  ///< stats.hp is the starting hp.
    std::vector<Ability> abilities;
    std::optional<GridPosition> position;  ///< Overrides the formation slot.
    int32_t wave = 1;                      ///< Used when grouping a flat enemy list.
};

/// Everything the engine needs to run one battle.
struct BattleSetup {
    std::vector<UnitDefinition> heroes;
    std::vector<std::vector<UnitDefinition>> enemyWaves;

    /// Build a setup from a flat enemy list, grouped by UnitDefinition::wave.
    /// Wave numbers are compacted in ascending order; relative order within
    /// a wave is preserved.
    [[nodiscard]] static BattleSetup FromFlatEnemies(std::vector<UnitDefinition> heroes,
                                                     std::vector<UnitDefinition> enemies);
};

/// Reject malformed input before any battle state exists.
///
/// Returns the first problem found, naming the offending unit and ability.
foundation::BattleResult<void> ValidateSetup(const BattleSetup& setup,
                                             const EngineConfig& config);

/// Create a battle unit from its definition with full derived stats and
/// every ability ready.
[[nodiscard]] BattleUnit MakeBattleUnit(const UnitDefinition& def, bool isHero, int32_t wave,
                                        double cooldownDivisor);

} // namespace gbe::battle
