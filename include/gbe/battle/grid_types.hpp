#pragma once

/// @file grid_types.hpp
/// @brief Grid coordinates, distance metric and engine-wide constants.

#include <algorithm>
#include <compare>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>

namespace gbe::battle {

/// Cooldown gauge value at which a unit acts.
constexpr double kCooldownThreshold = 100.0;

/// Default divisor converting speed into cooldown gain per tick.
constexpr double kDefaultCooldownDivisor = 10.0;

/// Default battlefield dimensions.
constexpr int32_t kDefaultGridWidth = 8;
constexpr int32_t kDefaultGridHeight = 8;

/// Integer cell coordinate on the battlefield.
///
/// Valid in-bounds cells are [0, height-1] x [0, width-1]. The column
/// value equal to the grid width is reserved for units that have not yet
/// entered the battlefield (wave spawn-in).
struct GridPosition {
    int32_t row = 0;
    int32_t col = 0;

    constexpr auto operator<=>(const GridPosition&) const = default;
};

/// Chebyshev distance: diagonal neighbours are at distance 1.
[[nodiscard]] constexpr int32_t ChebyshevDistance(GridPosition a, GridPosition b) noexcept {
    return std::max(std::abs(a.row - b.row), std::abs(a.col - b.col));
}

/// Clamp a position into a width x height grid.
[[nodiscard]] constexpr GridPosition ClampToGrid(GridPosition pos, int32_t width,
                                                 int32_t height) noexcept {
    return {std::clamp(pos.row, 0, height - 1), std::clamp(pos.col, 0, width - 1)};
}

/// "row,col" rendering used in log context.
[[nodiscard]] inline std::string ToString(GridPosition pos) {
    return std::to_string(pos.row) + "," + std::to_string(pos.col);
}

} // namespace gbe::battle

/// Hash support for GridPosition.
template <>
struct std::hash<gbe::battle::GridPosition> {
    std::size_t operator()(const gbe::battle::GridPosition& p) const noexcept {
        auto h1 = std::hash<int32_t>{}(p.row);
        auto h2 = std::hash<int32_t>{}(p.col);
        return h1 ^ (h2 * 2654435761u);
    }
};
