#pragma once

/// @file occupancy_grid.hpp
/// @brief Exclusive cell -> unit occupancy store for the battlefield.
///
/// The grid is the single source of truth for which cell holds which unit.
/// Every claim on a cell goes through Occupy/Move; rejected claims return
/// false and leave the store untouched.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gbe/battle/grid_types.hpp"

namespace gbe::battle {

/// Default ring radius searched by FindNearestFree.
constexpr int32_t kDefaultFreeCellSearchRadius = 5;

/// Exclusive occupancy map for a width x height battlefield.
///
/// Thread safety: None. A battle runs on a single thread.
class OccupancyGrid {
public:
    OccupancyGrid(int32_t width = kDefaultGridWidth, int32_t height = kDefaultGridHeight);

    // -- Mutation -------------------------------------------------------

    /// Claim @p pos for @p unitId.
    ///
    /// Fails if @p pos is out of bounds, already occupied, or the unit
    /// already holds another cell (use Move for that).
    bool Occupy(GridPosition pos, std::string_view unitId);

    /// Release whatever unit holds @p pos. No-op on an empty cell.
    void Vacate(GridPosition pos);

    /// Release the cell held by @p unitId. No-op if it holds none.
    void Release(std::string_view unitId);

    /// Atomically move @p unitId from @p from to @p to.
    ///
    /// Fails without mutation unless @p to is in bounds and free and
    /// @p from is currently held by @p unitId.
    bool Move(std::string_view unitId, GridPosition from, GridPosition to);

    /// Make @p unitId the occupant of @p pos regardless of prior state,
    /// evicting any other occupant and releasing the unit's old cell.
    /// Used only to repair the store after a consistency check.
    /// @return false if @p pos is out of bounds.
    bool ForceOccupy(GridPosition pos, std::string_view unitId);

    // -- Queries --------------------------------------------------------

    /// Nearest free in-bounds cell to @p pos, searching @p pos itself and
    /// then square rings of growing radius up to @p maxRadius.
    [[nodiscard]] std::optional<GridPosition>
    FindNearestFree(GridPosition pos, int32_t maxRadius = kDefaultFreeCellSearchRadius) const;

    [[nodiscard]] bool IsInBounds(GridPosition pos) const noexcept {
        return pos.row >= 0 && pos.row < height_ && pos.col >= 0 && pos.col < width_;
    }

    [[nodiscard]] bool IsOccupied(GridPosition pos) const;

    /// Id of the unit at @p pos, if any.
    [[nodiscard]] std::optional<std::string> OccupantAt(GridPosition pos) const;

    /// Cell held by @p unitId, if any.
    [[nodiscard]] std::optional<GridPosition> PositionOf(std::string_view unitId) const;

    /// Number of occupied cells.
    [[nodiscard]] std::size_t Size() const noexcept { return occupants_.size(); }

    [[nodiscard]] int32_t Width() const noexcept { return width_; }
    [[nodiscard]] int32_t Height() const noexcept { return height_; }

    /// Column value marking units that have not entered the battlefield.
    [[nodiscard]] int32_t OffBoardColumn() const noexcept { return width_; }

private:
    int32_t width_;
    int32_t height_;

    /// cell -> occupying unit id.
    std::unordered_map<GridPosition, std::string> occupants_;

    /// unit id -> held cell (for Release and Move validation).
    std::unordered_map<std::string, GridPosition> unitCells_;
};

} // namespace gbe::battle
