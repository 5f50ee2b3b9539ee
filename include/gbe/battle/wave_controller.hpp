#pragma once

/// @file wave_controller.hpp
/// @brief Formation placement, wave clear detection and wave spawning.

#include <cstdint>
#include <vector>

#include "gbe/battle/battle_context.hpp"
#include "gbe/battle/battle_setup.hpp"

namespace gbe::battle {

/// What happened when the active enemy wave was cleared.
enum class WaveOutcome : uint8_t {
    NextWaveStarted,
    AllWavesCleared
};

/// Places rosters on the board and drives staged enemy waves.
///
/// On wave clear, surviving heroes scroll toward the left edge by
/// scrollDistance+1 cells, the next wave is created at its formation
/// slots and slides in from the off-board column. Emitted, in order:
/// an optional WaveComplete (every waveCompleteInterval-th wave and the
/// wave before the last), WaveTransition, WaveStart.
class WaveController {
public:
    WaveController(BattleContext& ctx, std::vector<std::vector<UnitDefinition>> enemyWaves);

    /// Create and place the hero roster and the first enemy wave.
    void DeployInitialRosters(const std::vector<UnitDefinition>& heroes);

    /// Handle an enemy-side wipe.
    WaveOutcome OnEnemiesCleared();

    [[nodiscard]] int32_t TotalWaves() const noexcept {
        return static_cast<int32_t>(enemyWaves_.size());
    }

    /// Whether clearing @p completedWave emits WaveComplete.
    [[nodiscard]] bool ShouldAnnounceWaveComplete(int32_t completedWave) const noexcept;

    /// Formation slot of the @p index-th hero: two columns on the left edge
    /// from row 2 down, wrapping from row 0 once those rows are full.
    [[nodiscard]] static GridPosition HeroSlot(int32_t index, int32_t width, int32_t height);

    /// Mirror of HeroSlot on the right edge.
    [[nodiscard]] static GridPosition EnemySlot(int32_t index, int32_t width, int32_t height);

    /// Post-scroll hero cells, in the order of @p heroes.
    ///
    /// Heroes are processed left to right; each takes the first unclaimed
    /// cell of its row from max(0, col - scroll - 1) up to its current column.
    [[nodiscard]] static std::vector<GridPosition> ComputeHeroShifts(
        const std::vector<const BattleUnit*>& heroes, int32_t scrollDistance);

private:
    /// Occupy @p preferred, or the nearest free cell. False if none.
    bool place(BattleUnit& unit, GridPosition preferred);

    void spawnWave(int32_t waveNumber);

    BattleContext& ctx_;
    std::vector<std::vector<UnitDefinition>> enemyWaves_;
};

} // namespace gbe::battle
