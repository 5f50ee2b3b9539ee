/// @file battle_simulator.cpp
/// @brief BattleSimulator implementation.

#include "gbe/battle/battle_simulator.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::BattleResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Construction ────────────────────────────────────────────────────────

BattleSimulator::BattleSimulator(BattleSetup setup, EngineConfig config,
                                 std::unique_ptr<IRandomSource> random)
    : config_(config),
      grid_(config.gridWidth, config.gridHeight),
      random_(random ? std::move(random) : std::make_unique<SeededRandomSource>(config.seed)),
      ctx_{state_, grid_, *random_, config_},
      statuses_(ctx_),
      movement_(ctx_),
      abilities_(ctx_, statuses_, movement_),
      waves_(ctx_, std::move(setup.enemyWaves)) {
    waves_.DeployInitialRosters(setup.heroes);

    BattleStartEvent start;
    start.totalWaves = state_.totalWaves;
    for (const auto& hero : state_.heroes) {
        start.heroIds.push_back(hero.id);
    }
    for (const auto& enemy : state_.enemies) {
        start.enemyIds.push_back(enemy.id);
    }
    ctx_.Emit(std::move(start));
}

BattleResult<std::unique_ptr<BattleSimulator>> BattleSimulator::Create(
    BattleSetup setup, EngineConfig config, std::unique_ptr<IRandomSource> random) {
    auto valid = ValidateSetup(setup, config);
    if (valid.hasError()) {
        LogContext logCtx;
        if (valid.error().unitId()) {
            logCtx.unitId = *valid.error().unitId();
        }
        if (valid.error().abilityId()) {
            logCtx.extra["ability"] = *valid.error().abilityId();
        }
        GBE_LOG_CTX(LogLevel::Error, LogCategory::Core,
                    "rejected battle setup: " + std::string(valid.error().message()), logCtx);
        return BattleResult<std::unique_ptr<BattleSimulator>>::err(valid.error());
    }

    std::unique_ptr<BattleSimulator> sim(
        new BattleSimulator(std::move(setup), config, std::move(random)));

    LogContext logCtx;
    logCtx.extra["heroes"] = std::to_string(sim->state_.heroes.size());
    logCtx.extra["waves"] = std::to_string(sim->state_.totalWaves);
    GBE_LOG_CTX(LogLevel::Info, LogCategory::Core, "battle started", logCtx);
    return BattleResult<std::unique_ptr<BattleSimulator>>::ok(std::move(sim));
}

// ── Tick loop ───────────────────────────────────────────────────────────

bool BattleSimulator::Step() {
    if (state_.finished) {
        return false;
    }

    ++state_.tick;
    state_.transitionInProgress = false;
    movement_.BeginTick();

    statuses_.ProcessTick();
    if (!checkOutcome()) {
        enforceBounds();
        if (config_.consistencyCheckInterval > 0 &&
            state_.tick % config_.consistencyCheckInterval == 0) {
            verifyOccupancy();
        }
        advanceCooldowns();
        actReadyUnits();
    }

    if (!state_.finished && state_.tick >= config_.maxTicks) {
        const double heroHp = state_.TotalHp(Side::Heroes);
        const double enemyHp = state_.TotalHp(Side::Enemies);
        LogContext logCtx;
        logCtx.tick = state_.tick;
        logCtx.extra["hero_hp"] = std::to_string(heroHp);
        logCtx.extra["enemy_hp"] = std::to_string(enemyHp);
        GBE_LOG_CTX(LogLevel::Warning, LogCategory::Core,
                    "tick ceiling reached, deciding by remaining hp", logCtx);
        finish(heroHp > enemyHp ? Side::Heroes : Side::Enemies, EndReason::TickLimit);
    }
    return true;
}

const BattleState& BattleSimulator::Run() {
    while (Step()) {
    }
    return state_;
}

bool BattleSimulator::checkOutcome() {
    if (!state_.HasLiving(Side::Heroes)) {
        finish(Side::Enemies, EndReason::Elimination);
        return true;
    }
    if (!state_.HasLiving(Side::Enemies)) {
        if (waves_.OnEnemiesCleared() == WaveOutcome::AllWavesCleared) {
            finish(Side::Heroes, EndReason::Elimination);
        }
        return true;
    }
    return false;
}

void BattleSimulator::finish(Side winner, EndReason reason) {
    state_.finished = true;
    state_.winner = winner;

    BattleEndEvent summary{reason, state_.TotalHp(Side::Heroes), state_.TotalHp(Side::Enemies)};
    if (winner == Side::Heroes) {
        ctx_.Emit(VictoryEvent{summary});
    } else {
        ctx_.Emit(DefeatEvent{summary});
    }

    LogContext logCtx;
    logCtx.tick = state_.tick;
    logCtx.wave = state_.currentWave;
    logCtx.extra["winner"] = winner == Side::Heroes ? "heroes" : "enemies";
    GBE_LOG_CTX(LogLevel::Info, LogCategory::Core, "battle finished", logCtx);
}

// ── Per-tick stages ─────────────────────────────────────────────────────

void BattleSimulator::enforceBounds() {
    for (auto side : {Side::Heroes, Side::Enemies}) {
        for (auto* unit : state_.Living(side)) {
            const auto clamped = ClampToGrid(unit->position, grid_.Width(), grid_.Height());
            if (clamped == unit->position) {
                continue;
            }
            LogContext logCtx;
            logCtx.unitId = unit->id;
            logCtx.tick = state_.tick;
            logCtx.extra["from"] = ToString(unit->position);
            logCtx.extra["to"] = ToString(clamped);
            GBE_LOG_CTX(LogLevel::Warning, LogCategory::Grid, "position clamped to board",
                        logCtx);
            unit->position = clamped;
        }
    }
}

void BattleSimulator::verifyOccupancy() {
    for (auto side : {Side::Heroes, Side::Enemies}) {
        for (auto* unit : state_.Living(side)) {
            const auto held = grid_.PositionOf(unit->id);
            const auto occupant = grid_.OccupantAt(unit->position);
            if (held == unit->position && occupant == unit->id) {
                continue;
            }

            LogContext logCtx;
            logCtx.unitId = unit->id;
            logCtx.tick = state_.tick;
            logCtx.extra["logical"] = ToString(unit->position);
            logCtx.extra["stored"] = held ? ToString(*held) : "none";
            GBE_LOG_CTX(LogLevel::Warning, LogCategory::Grid, "occupancy mismatch repaired",
                        logCtx);

            // Another living unit legitimately stands here: move this one aside.
            if (occupant) {
                const auto* other = state_.FindUnit(*occupant);
                if (other != nullptr && other != unit && other->isAlive &&
                    other->position == unit->position) {
                    auto cell = grid_.FindNearestFree(
                        unit->position, std::max(grid_.Width(), grid_.Height()));
                    if (cell) {
                        grid_.Release(unit->id);
                        if (grid_.Occupy(*cell, unit->id)) {
                            unit->position = *cell;
                        }
                    }
                    continue;
                }
            }
            grid_.ForceOccupy(unit->position, unit->id);
        }
    }
}

void BattleSimulator::advanceCooldowns() {
    TickEvent tick;
    for (auto side : {Side::Heroes, Side::Enemies}) {
        for (auto* unit : state_.Living(side)) {
            unit->cooldown = std::min(kCooldownThreshold, unit->cooldown + unit->cooldownRate);
            tick.cooldowns.push_back({unit->id, unit->cooldown, unit->cooldownRate});
        }
    }
    ctx_.Emit(std::move(tick));
}

void BattleSimulator::actReadyUnits() {
    std::vector<BattleUnit*> ready;
    for (auto side : {Side::Heroes, Side::Enemies}) {
        for (auto* unit : state_.Living(side)) {
            if (unit->IsReady()) {
                ready.push_back(unit);
            }
        }
    }
    std::stable_sort(ready.begin(), ready.end(), [](const BattleUnit* a, const BattleUnit* b) {
        return a->cooldown > b->cooldown;
    });

    for (auto* unit : ready) {
        if (!unit->isAlive) {
            continue;
        }
        ActionOutcome outcome;
        if (unit->IsControlled()) {
            LogContext logCtx;
            logCtx.unitId = unit->id;
            logCtx.tick = state_.tick;
            GBE_LOG_CTX(LogLevel::Debug, LogCategory::Status, "turn skipped, unit controlled",
                        logCtx);
        } else {
            outcome = abilities_.ResolveAction(*unit);
        }
        completeAction(*unit, outcome);

        // Wave spawns may grow the enemy roster; stop touching `ready`.
        if (checkOutcome()) {
            return;
        }
    }
}

void BattleSimulator::completeAction(BattleUnit& unit, const ActionOutcome& outcome) {
    unit.cooldown = 0.0;
    for (auto& [abilityId, remaining] : unit.abilityCooldowns) {
        if (remaining > 0) {
            --remaining;
        }
    }
    if (!outcome.abilityId) {
        return;
    }
    for (const auto& ability : unit.abilities) {
        if (ability.id == *outcome.abilityId) {
            unit.abilityCooldowns[ability.id] = ability.cooldown;
            break;
        }
    }
}

// ── Convenience ─────────────────────────────────────────────────────────

BattleResult<BattleState> SimulateBattle(BattleSetup setup, EngineConfig config,
                                         std::unique_ptr<IRandomSource> random) {
    auto sim = BattleSimulator::Create(std::move(setup), config, std::move(random));
    if (sim.hasError()) {
        return BattleResult<BattleState>::err(sim.error());
    }
    return BattleResult<BattleState>::ok(sim.value()->Run());
}

} // namespace gbe::battle
