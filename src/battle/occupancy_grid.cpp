/// @file occupancy_grid.cpp
/// @brief OccupancyGrid implementation.

#include "gbe/battle/occupancy_grid.hpp"

#include <cstdlib>

namespace gbe::battle {

OccupancyGrid::OccupancyGrid(int32_t width, int32_t height)
    : width_(width > 0 ? width : kDefaultGridWidth),
      height_(height > 0 ? height : kDefaultGridHeight) {}

bool OccupancyGrid::Occupy(GridPosition pos, std::string_view unitId) {
    if (!IsInBounds(pos) || occupants_.contains(pos)) {
        return false;
    }
    std::string id(unitId);
    if (unitCells_.contains(id)) {
        return false;
    }
    occupants_.emplace(pos, id);
    unitCells_.emplace(std::move(id), pos);
    return true;
}

void OccupancyGrid::Vacate(GridPosition pos) {
    auto it = occupants_.find(pos);
    if (it == occupants_.end()) {
        return;
    }
    unitCells_.erase(it->second);
    occupants_.erase(it);
}

void OccupancyGrid::Release(std::string_view unitId) {
    auto it = unitCells_.find(std::string(unitId));
    if (it == unitCells_.end()) {
        return;
    }
    occupants_.erase(it->second);
    unitCells_.erase(it);
}

bool OccupancyGrid::Move(std::string_view unitId, GridPosition from, GridPosition to) {
    if (!IsInBounds(to) || occupants_.contains(to)) {
        return false;
    }
    auto fromIt = occupants_.find(from);
    if (fromIt == occupants_.end() || fromIt->second != unitId) {
        return false;
    }

    std::string id = std::move(fromIt->second);
    occupants_.erase(fromIt);
    unitCells_[id] = to;
    occupants_.emplace(to, std::move(id));
    return true;
}

bool OccupancyGrid::ForceOccupy(GridPosition pos, std::string_view unitId) {
    if (!IsInBounds(pos)) {
        return false;
    }
    Release(unitId);
    Vacate(pos);
    std::string id(unitId);
    occupants_.emplace(pos, id);
    unitCells_.emplace(std::move(id), pos);
    return true;
}

std::optional<GridPosition> OccupancyGrid::FindNearestFree(GridPosition pos,
                                                           int32_t maxRadius) const {
    if (IsInBounds(pos) && !IsOccupied(pos)) {
        return pos;
    }

    for (int32_t radius = 1; radius <= maxRadius; ++radius) {
        for (int32_t dRow = -radius; dRow <= radius; ++dRow) {
            for (int32_t dCol = -radius; dCol <= radius; ++dCol) {
                // Ring perimeter only; the interior was covered by smaller radii.
                if (std::abs(dRow) != radius && std::abs(dCol) != radius) {
                    continue;
                }
                GridPosition candidate{pos.row + dRow, pos.col + dCol};
                if (IsInBounds(candidate) && !IsOccupied(candidate)) {
                    return candidate;
                }
            }
        }
    }
    return std::nullopt;
}

bool OccupancyGrid::IsOccupied(GridPosition pos) const {
    return occupants_.contains(pos);
}

std::optional<std::string> OccupancyGrid::OccupantAt(GridPosition pos) const {
    auto it = occupants_.find(pos);
    if (it == occupants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GridPosition> OccupancyGrid::PositionOf(std::string_view unitId) const {
    auto it = unitCells_.find(std::string(unitId));
    if (it == unitCells_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace gbe::battle
