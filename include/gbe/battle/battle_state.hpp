#pragma once

/// @file battle_state.hpp
/// @brief Complete battle state: rosters, event log and outcome.

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "gbe/battle/combat_types.hpp"
#include "gbe/battle/event_log.hpp"
#include "gbe/battle/unit_components.hpp"

namespace gbe::battle {

/// Snapshot of a battle, and the engine's final output.
///
/// Dead units remain in their roster. Later-wave enemies are appended to
/// @c enemies when their wave spawns.
struct BattleState {
    uint32_t tick = 0;
    std::vector<BattleUnit> heroes;
    std::vector<BattleUnit> enemies;
    EventLog events;
    std::optional<Side> winner;
    int32_t currentWave = 1;
    int32_t totalWaves = 1;
    int32_t remainingEnemyWaves = 0;
    bool transitionInProgress = false;  ///< Set for the tick that ran a wave transition.
    bool finished = false;

    [[nodiscard]] std::vector<BattleUnit>& Roster(Side side) {
        return side == Side::Heroes ? heroes : enemies;
    }
    [[nodiscard]] const std::vector<BattleUnit>& Roster(Side side) const {
        return side == Side::Heroes ? heroes : enemies;
    }

    /// Living units of @p side, in roster order.
    [[nodiscard]] std::vector<BattleUnit*> Living(Side side);

    /// Living units on @p unit's side, including @p unit itself.
    [[nodiscard]] std::vector<BattleUnit*> Allies(const BattleUnit& unit);

    /// Living units on the opposing side.
    [[nodiscard]] std::vector<BattleUnit*> Opponents(const BattleUnit& unit);

    [[nodiscard]] bool HasLiving(Side side) const;

    /// Sum of current hp over living units of @p side.
    [[nodiscard]] double TotalHp(Side side) const;

    [[nodiscard]] BattleUnit* FindUnit(std::string_view id);
    [[nodiscard]] const BattleUnit* FindUnit(std::string_view id) const;
};

} // namespace gbe::battle
