#pragma once

/// @file targeting.hpp
/// @brief Nearest-target selection and scored single-step pathing.

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

#include "gbe/battle/battle_context.hpp"
#include "gbe/battle/grid_types.hpp"
#include "gbe/battle/unit_components.hpp"

namespace gbe::battle {

/// Step offsets in candidate order: Right, Left, Down, Up, then the
/// diagonals Down-Right, Down-Left, Up-Right, Up-Left.
inline constexpr std::array<GridPosition, 8> kStepOffsets = {{
    {0, 1}, {0, -1}, {1, 0}, {-1, 0},
    {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
}};

/// Nearest living candidate by Chebyshev distance.
///
/// Ties keep the first candidate in iteration order. Candidates farther
/// than @p maxDistance (when given) are ignored.
[[nodiscard]] BattleUnit* FindNearestTarget(const BattleUnit& from,
                                            const std::vector<BattleUnit*>& candidates,
                                            std::optional<int32_t> maxDistance = std::nullopt);

/// Score of stepping from @p from to @p step while chasing @p target;
/// lower is better.
///
/// score = distance*100 - (50 if the step closes distance) - 10*alignment,
/// where alignment is the dot product of the target direction and the
/// step direction.
[[nodiscard]] int32_t ScoreStep(GridPosition from, GridPosition step,
                                GridPosition target) noexcept;

/// Moves units one cell per action toward their targets.
///
/// Tracks the cells claimed by moves in the current tick so two units
/// never walk into the same cell within one tick.
class MovementResolver {
public:
    explicit MovementResolver(BattleContext& ctx);

    /// Forget claims from the previous tick.
    void BeginTick();

    /// Take one step toward @p target.
    ///
    /// Candidates are tried in ascending score order (stable over
    /// kStepOffsets order); a step that would increase the distance by
    /// more than one is never taken. Emits Move on success.
    /// @return true if the unit moved.
    bool StepToward(BattleUnit& unit, const BattleUnit& target);

    [[nodiscard]] bool IsReserved(GridPosition pos) const { return reserved_.contains(pos); }

private:
    BattleContext& ctx_;
    std::unordered_set<GridPosition> reserved_;
};

} // namespace gbe::battle
