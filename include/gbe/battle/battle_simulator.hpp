#pragma once

/// @file battle_simulator.hpp
/// @brief Tick scheduler driving a whole battle.

#include <memory>

#include "gbe/battle/ability_resolver.hpp"
#include "gbe/battle/battle_context.hpp"
#include "gbe/battle/battle_setup.hpp"
#include "gbe/battle/battle_state.hpp"
#include "gbe/battle/engine_config.hpp"
#include "gbe/battle/occupancy_grid.hpp"
#include "gbe/battle/random_source.hpp"
#include "gbe/battle/status_effect_processor.hpp"
#include "gbe/battle/targeting.hpp"
#include "gbe/battle/wave_controller.hpp"
#include "gbe/foundation/battle_result.hpp"

namespace gbe::battle {

/// Deterministic, single-threaded battle simulation.
///
/// Each tick:
///   1. status effects (damage over time, regeneration, expiry)
///   2. win/loss check (a hero wipe is a Defeat; an enemy wipe hands over
///      to the wave controller)
///   3. positions clamped to the board, occupancy cross-checked
///   4. cooldowns advance by cooldownRate, capped at 100; one Tick event
///   5. units at 100 act, most overdue first (ties in roster order, heroes
///      before enemies); controlled units skip their turn
///   6. win/loss re-checked after every action
/// A wave transition or the end of the battle ends the tick early. The
/// battle also ends at the tick ceiling, won by the side with more total hp.
///
/// Example:
/// @code
///   auto sim = BattleSimulator::Create(setup, config);
///   if (sim.hasValue()) {
///       const auto& state = sim.value()->Run();
///       for (const auto& event : state.events) { ... }
///   }
/// @endcode
class BattleSimulator {
public:
    /// Validate @p setup and place both rosters. Emits BattleStart.
    ///
    /// @param random Roll source; a SeededRandomSource over config.seed
    ///               when null.
    static foundation::BattleResult<std::unique_ptr<BattleSimulator>> Create(
        BattleSetup setup, EngineConfig config = {},
        std::unique_ptr<IRandomSource> random = nullptr);

    BattleSimulator(const BattleSimulator&) = delete;
    BattleSimulator& operator=(const BattleSimulator&) = delete;

    /// Advance one tick. Returns false (and does nothing) once finished.
    bool Step();

    /// Step until the battle is decided.
    const BattleState& Run();

    [[nodiscard]] bool IsFinished() const noexcept { return state_.finished; }
    [[nodiscard]] const BattleState& State() const noexcept { return state_; }
    [[nodiscard]] const OccupancyGrid& Grid() const noexcept { return grid_; }
    [[nodiscard]] const EngineConfig& Config() const noexcept { return config_; }

private:
    BattleSimulator(BattleSetup setup, EngineConfig config,
                    std::unique_ptr<IRandomSource> random);

    /// Returns true when the tick must stop (battle over or wave changed).
    bool checkOutcome();

    void enforceBounds();
    void verifyOccupancy();
    void advanceCooldowns();
    void actReadyUnits();
    void completeAction(BattleUnit& unit, const ActionOutcome& outcome);
    void finish(Side winner, EndReason reason);

    EngineConfig config_;
    BattleState state_;
    OccupancyGrid grid_;
    std::unique_ptr<IRandomSource> random_;
    BattleContext ctx_;
    StatusEffectProcessor statuses_;
    MovementResolver movement_;
    AbilityResolver abilities_;
    WaveController waves_;
};

/// Validate, run to completion and return the final state.
foundation::BattleResult<BattleState> SimulateBattle(
    BattleSetup setup, EngineConfig config = {},
    std::unique_ptr<IRandomSource> random = nullptr);

} // namespace gbe::battle
