#pragma once

/// @file battle_context.hpp
/// @brief Shared mutable state handed to the engine's components.

#include <optional>
#include <string>

#include "gbe/battle/battle_event.hpp"
#include "gbe/battle/battle_state.hpp"
#include "gbe/battle/engine_config.hpp"
#include "gbe/battle/occupancy_grid.hpp"
#include "gbe/battle/random_source.hpp"

namespace gbe::battle {

/// Non-owning view over everything a component may read or mutate during
/// a tick. The simulator owns the referenced objects.
struct BattleContext {
    BattleState& state;
    OccupancyGrid& grid;
    IRandomSource& random;
    const EngineConfig& config;

    /// Append @p payload to the log, stamped with the current tick.
    void Emit(EventPayload payload) {
        state.events.Append(state.tick, std::move(payload));
    }

    /// Mark @p unit dead: hp 0, status effects cleared, cell released,
    /// Death event emitted.
    void Kill(BattleUnit& unit, std::optional<std::string> killerId);
};

} // namespace gbe::battle
