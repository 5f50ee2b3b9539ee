/// @file wave_controller.cpp
/// @brief WaveController implementation.

#include "gbe/battle/wave_controller.hpp"

#include <algorithm>
#include <numeric>
#include <set>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

/// Rows 0 and 1 are kept free for overflow; two columns per side.
int32_t formationCapacity(int32_t height) {
    return 2 * std::max(0, height - 2);
}

} // namespace

WaveController::WaveController(BattleContext& ctx,
                               std::vector<std::vector<UnitDefinition>> enemyWaves)
    : ctx_(ctx), enemyWaves_(std::move(enemyWaves)) {}

// ── Formation slots ─────────────────────────────────────────────────────

GridPosition WaveController::HeroSlot(int32_t index, int32_t /*width*/, int32_t height) {
    const int32_t capacity = formationCapacity(height);
    if (index >= capacity) {
        const int32_t overflow = index - capacity;
        return {(overflow / 2) % height, overflow % 2};
    }
    return {std::min(2 + index / 2, height - 1), index % 2};
}

GridPosition WaveController::EnemySlot(int32_t index, int32_t width, int32_t height) {
    const auto mirrored = HeroSlot(index, width, height);
    return {mirrored.row, width - 1 - mirrored.col};
}

bool WaveController::ShouldAnnounceWaveComplete(int32_t completedWave) const noexcept {
    return completedWave % ctx_.config.waveCompleteInterval == 0 ||
           completedWave == TotalWaves() - 1;
}

// ── Placement ───────────────────────────────────────────────────────────

bool WaveController::place(BattleUnit& unit, GridPosition preferred) {
    auto cell = ctx_.grid.FindNearestFree(preferred, ctx_.config.spawnSearchRadius);
    if (!cell) {
        // Fall back to a search wide enough to cover the whole board.
        cell = ctx_.grid.FindNearestFree(
            preferred, std::max(ctx_.grid.Width(), ctx_.grid.Height()));
    }
    if (!cell || !ctx_.grid.Occupy(*cell, unit.id)) {
        return false;
    }
    if (*cell != preferred) {
        LogContext logCtx;
        logCtx.unitId = unit.id;
        logCtx.extra["wanted"] = ToString(preferred);
        logCtx.extra["placed"] = ToString(*cell);
        GBE_LOG_CTX(LogLevel::Debug, LogCategory::Grid, "slot taken, placed nearby", logCtx);
    }
    unit.position = *cell;
    return true;
}

void WaveController::DeployInitialRosters(const std::vector<UnitDefinition>& heroes) {
    auto& state = ctx_.state;
    state.totalWaves = TotalWaves();
    state.currentWave = 1;
    state.remainingEnemyWaves = TotalWaves() - 1;

    const int32_t width = ctx_.grid.Width();
    const int32_t height = ctx_.grid.Height();

    for (std::size_t i = 0; i < heroes.size(); ++i) {
        state.heroes.push_back(
            MakeBattleUnit(heroes[i], true, 1, ctx_.config.cooldownDivisor));
    }
    for (const auto& def : enemyWaves_.front()) {
        state.enemies.push_back(MakeBattleUnit(def, false, 1, ctx_.config.cooldownDivisor));
    }

    // Explicit start positions claim their cells before formation slots.
    struct Pending {
        BattleUnit* unit;
        GridPosition cell;
    };
    std::vector<Pending> explicitCells;
    std::vector<Pending> slotCells;
    for (std::size_t i = 0; i < heroes.size(); ++i) {
        const auto slot = HeroSlot(static_cast<int32_t>(i), width, height);
        auto& bucket = heroes[i].position ? explicitCells : slotCells;
        bucket.push_back({&state.heroes[i], heroes[i].position.value_or(slot)});
    }
    const auto& firstWave = enemyWaves_.front();
    for (std::size_t i = 0; i < firstWave.size(); ++i) {
        const auto slot = EnemySlot(static_cast<int32_t>(i), width, height);
        auto& bucket = firstWave[i].position ? explicitCells : slotCells;
        bucket.push_back({&state.enemies[i], firstWave[i].position.value_or(slot)});
    }

    for (auto* pending : {&explicitCells, &slotCells}) {
        for (auto& [unit, cell] : *pending) {
            if (!place(*unit, cell)) {
                LogContext logCtx;
                logCtx.unitId = unit->id;
                GBE_LOG_CTX(LogLevel::Warning, LogCategory::Grid,
                            "no free cell for unit, it does not take part", logCtx);
                unit->isAlive = false;
                unit->position = {cell.row, ctx_.grid.OffBoardColumn()};
            }
        }
    }
}

// ── Wave transition ─────────────────────────────────────────────────────

std::vector<GridPosition> WaveController::ComputeHeroShifts(
    const std::vector<const BattleUnit*>& heroes, int32_t scrollDistance) {
    std::vector<std::size_t> order(heroes.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return heroes[a]->position.col < heroes[b]->position.col;
    });

    std::vector<GridPosition> result(heroes.size());
    std::set<GridPosition> claimed;
    for (auto idx : order) {
        const auto current = heroes[idx]->position;
        GridPosition target = current;
        for (int32_t col = std::max(0, current.col - scrollDistance - 1); col <= current.col;
             ++col) {
            if (!claimed.contains({current.row, col})) {
                target = {current.row, col};
                break;
            }
        }
        claimed.insert(target);
        result[idx] = target;
    }
    return result;
}

WaveOutcome WaveController::OnEnemiesCleared() {
    auto& state = ctx_.state;
    const int32_t completed = state.currentWave;
    if (completed >= TotalWaves()) {
        state.remainingEnemyWaves = 0;
        return WaveOutcome::AllWavesCleared;
    }
    const int32_t next = completed + 1;

    if (ShouldAnnounceWaveComplete(completed)) {
        ctx_.Emit(WaveCompleteEvent{completed, TotalWaves()});
    }

    // Remnants of the cleared wave give up any cell they still hold.
    for (const auto& enemy : state.enemies) {
        if (enemy.wave == completed) {
            ctx_.grid.Release(enemy.id);
        }
    }

    auto survivors = state.Living(Side::Heroes);
    std::vector<const BattleUnit*> view(survivors.begin(), survivors.end());
    const auto targets = ComputeHeroShifts(view, ctx_.config.scrollDistance);

    for (auto* hero : survivors) {
        ctx_.grid.Release(hero->id);
    }
    std::vector<UnitShift> shifts;
    shifts.reserve(survivors.size());
    for (std::size_t i = 0; i < survivors.size(); ++i) {
        auto* hero = survivors[i];
        const GridPosition from = hero->position;
        if (!place(*hero, targets[i])) {
            // Board full: keep the logical cell; the consistency check repairs it.
            LogContext logCtx;
            logCtx.unitId = hero->id;
            logCtx.wave = next;
            GBE_LOG_CTX(LogLevel::Warning, LogCategory::Wave, "hero could not be shifted",
                        logCtx);
        }
        shifts.push_back({hero->id, from, hero->position});
    }

    ctx_.Emit(WaveTransitionEvent{completed, next, ctx_.config.scrollDistance, shifts});
    spawnWave(next);

    state.currentWave = next;
    state.remainingEnemyWaves = TotalWaves() - next;
    state.transitionInProgress = true;

    LogContext logCtx;
    logCtx.tick = state.tick;
    logCtx.wave = next;
    logCtx.extra["total"] = std::to_string(TotalWaves());
    GBE_LOG_CTX(LogLevel::Info, LogCategory::Wave, "wave started", logCtx);
    return WaveOutcome::NextWaveStarted;
}

void WaveController::spawnWave(int32_t waveNumber) {
    auto& state = ctx_.state;
    const auto& defs = enemyWaves_[static_cast<std::size_t>(waveNumber - 1)];
    const int32_t width = ctx_.grid.Width();
    const int32_t height = ctx_.grid.Height();

    const std::size_t firstIndex = state.enemies.size();
    state.enemies.reserve(firstIndex + defs.size());
    for (const auto& def : defs) {
        state.enemies.push_back(
            MakeBattleUnit(def, false, waveNumber, ctx_.config.cooldownDivisor));
    }

    std::vector<SpawnPlacement> spawns;
    spawns.reserve(defs.size());
    auto spawnOne = [&](std::size_t i) {
        auto& unit = state.enemies[firstIndex + i];
        const auto slot =
            defs[i].position.value_or(EnemySlot(static_cast<int32_t>(i), width, height));
        if (!place(unit, slot)) {
            LogContext logCtx;
            logCtx.unitId = unit.id;
            logCtx.wave = waveNumber;
            GBE_LOG_CTX(LogLevel::Warning, LogCategory::Grid, "spawn rejected, board is full",
                        logCtx);
            unit.isAlive = false;
            unit.position = {slot.row, ctx_.grid.OffBoardColumn()};
            return;
        }
        spawns.push_back({unit.id, {unit.position.row, ctx_.grid.OffBoardColumn()},
                          unit.position});
    };

    // Explicit positions claim their cells first.
    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (defs[i].position) {
            spawnOne(i);
        }
    }
    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (!defs[i].position) {
            spawnOne(i);
        }
    }

    ctx_.Emit(WaveStartEvent{waveNumber, TotalWaves(), std::move(spawns)});
}

} // namespace gbe::battle
