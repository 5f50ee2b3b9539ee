/// @file targeting.cpp
/// @brief Target selection and movement resolution.

#include "gbe/battle/targeting.hpp"

#include <algorithm>
#include <limits>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

BattleUnit* FindNearestTarget(const BattleUnit& from,
                              const std::vector<BattleUnit*>& candidates,
                              std::optional<int32_t> maxDistance) {
    BattleUnit* nearest = nullptr;
    int32_t best = std::numeric_limits<int32_t>::max();
    for (auto* candidate : candidates) {
        if (candidate == nullptr || !candidate->isAlive) {
            continue;
        }
        int32_t dist = ChebyshevDistance(from.position, candidate->position);
        if (maxDistance && dist > *maxDistance) {
            continue;
        }
        if (dist < best) {
            best = dist;
            nearest = candidate;
        }
    }
    return nearest;
}

int32_t ScoreStep(GridPosition from, GridPosition step, GridPosition target) noexcept {
    const int32_t currentDist = ChebyshevDistance(from, target);
    const int32_t stepDist = ChebyshevDistance(step, target);
    const int32_t alignment = (step.row - from.row) * (target.row - from.row) +
                              (step.col - from.col) * (target.col - from.col);
    return stepDist * 100 - (stepDist < currentDist ? 50 : 0) - alignment * 10;
}

MovementResolver::MovementResolver(BattleContext& ctx) : ctx_(ctx) {}

void MovementResolver::BeginTick() {
    reserved_.clear();
}

bool MovementResolver::StepToward(BattleUnit& unit, const BattleUnit& target) {
    struct Candidate {
        GridPosition pos;
        int32_t score;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(kStepOffsets.size());
    for (const auto& offset : kStepOffsets) {
        GridPosition pos{unit.position.row + offset.row, unit.position.col + offset.col};
        if (!ctx_.grid.IsInBounds(pos) || ctx_.grid.IsOccupied(pos) || IsReserved(pos)) {
            continue;
        }
        candidates.push_back({pos, ScoreStep(unit.position, pos, target.position)});
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score < b.score; });

    const int32_t currentDist = ChebyshevDistance(unit.position, target.position);
    for (const auto& candidate : candidates) {
        if (ChebyshevDistance(candidate.pos, target.position) - currentDist > 1) {
            continue;
        }
        const GridPosition from = unit.position;
        if (!ctx_.grid.Move(unit.id, from, candidate.pos)) {
            continue;
        }
        unit.position = candidate.pos;
        reserved_.insert(candidate.pos);
        ctx_.Emit(MoveEvent{unit.id, from, candidate.pos, target.id});
        return true;
    }

    foundation::LogContext logCtx;
    logCtx.unitId = unit.id;
    logCtx.tick = ctx_.state.tick;
    logCtx.extra["target"] = target.id;
    GBE_LOG_CTX(foundation::LogLevel::Debug, foundation::LogCategory::Movement,
                "no legal step toward target", logCtx);
    return false;
}

} // namespace gbe::battle
