/// @file status_effect_processor.cpp
/// @brief StatusEffectProcessor implementation.

#include "gbe/battle/status_effect_processor.hpp"

#include <algorithm>
#include <vector>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

double& StatField(UnitStats& stats, StatKind kind) noexcept {
    switch (kind) {
        case StatKind::MaxHp:       return stats.maxHp;
        case StatKind::Damage:      return stats.damage;
        case StatKind::Speed:       return stats.speed;
        case StatKind::Defense:     return stats.defense;
        case StatKind::CritChance:  return stats.critChance;
        case StatKind::CritDamage:  return stats.critDamage;
        case StatKind::Evasion:     return stats.evasion;
        case StatKind::Accuracy:    return stats.accuracy;
        case StatKind::Penetration: return stats.penetration;
        case StatKind::Lifesteal:   return stats.lifesteal;
    }
    return stats.damage;
}

StatusEffectProcessor::StatusEffectProcessor(BattleContext& ctx) : ctx_(ctx) {}

// ── Stat recalculation ──────────────────────────────────────────────────

void StatusEffectProcessor::RecalculateStats(BattleUnit& unit, double cooldownDivisor) {
    const double hp = unit.stats.hp;
    unit.stats = unit.baseStats;
    unit.stats.hp = hp;

    // hp and maxHp are never modified; a broken shield awaiting removal no
    // longer counts.
    for (const auto& effect : unit.statusEffects) {
        if (!effect.modifier || effect.modifier->stat == StatKind::MaxHp ||
            effect.remainingDuration <= 0) {
            continue;
        }
        double& field = StatField(unit.stats, effect.modifier->stat);
        if (effect.modifier->isPercent) {
            field *= 1.0 + effect.modifier->value / 100.0;
        } else {
            field = std::max(0.0, field + effect.modifier->value);
        }
    }

    unit.cooldownRate = unit.stats.speed / cooldownDivisor;
}

// ── Application ─────────────────────────────────────────────────────────

StatusEffect StatusEffectProcessor::MakeStatus(const AbilityEffect& effect,
                                               const std::string& sourceId) {
    StatusEffect status;
    status.type = effect.statusType.value_or(StatusType::Weakened);
    status.category = ClassifyStatus(status.type);
    status.duration = effect.duration.value_or(kDefaultStatusDuration);
    status.remainingDuration = status.duration;

    // A damage-over-time status without an explicit rate uses the effect value.
    if (effect.damagePerTick) {
        status.damagePerTick = *effect.damagePerTick;
    } else if (status.category == StatusCategory::Dot) {
        status.damagePerTick = effect.value.value_or(0.0);
    }
    if (effect.healPerTick) {
        status.healPerTick = *effect.healPerTick;
    } else if (status.type == StatusType::Regeneration) {
        status.healPerTick = effect.value.value_or(0.0);
    }

    if (status.type == StatusType::Shield) {
        status.shieldAmount = effect.value.value_or(0.0);
    }

    status.modifier = effect.statModifier;
    status.sourceId = sourceId;
    return status;
}

std::string StatusEffectProcessor::Apply(BattleUnit& target, const AbilityEffect& effect,
                                         const std::string& sourceId) {
    return Apply(target, MakeStatus(effect, sourceId));
}

std::string StatusEffectProcessor::Apply(BattleUnit& target, StatusEffect status) {
    status.id = std::string(StatusTypeName(status.type)) + "_" + status.sourceId + "_" +
                std::to_string(nextStatusSerial_++);

    ctx_.Emit(StatusAppliedEvent{status.sourceId, target.id, status.id, status.type,
                                 status.category, status.duration});

    LogContext logCtx;
    logCtx.unitId = target.id;
    logCtx.tick = ctx_.state.tick;
    logCtx.extra["status"] = std::string(StatusTypeName(status.type));
    if (status.modifier) {
        logCtx.extra["stat"] = std::string(StatKindName(status.modifier->stat));
    }
    GBE_LOG_CTX(LogLevel::Debug, LogCategory::Status, "status applied", logCtx);

    std::string id = status.id;
    target.statusEffects.push_back(std::move(status));
    RecalculateStats(target, ctx_.config.cooldownDivisor);
    return id;
}

// ── Shields ─────────────────────────────────────────────────────────────

double StatusEffectProcessor::AbsorbDamage(BattleUnit& target, double amount) {
    bool broken = false;
    for (auto& status : target.statusEffects) {
        if (amount <= 0.0) {
            break;
        }
        if (status.type != StatusType::Shield || status.shieldAmount <= 0.0 ||
            status.remainingDuration <= 0) {
            continue;
        }
        const double absorbed = std::min(status.shieldAmount, amount);
        status.shieldAmount -= absorbed;
        amount -= absorbed;
        if (status.shieldAmount <= 0.0) {
            status.remainingDuration = 0;
            broken = true;
        }
    }

    if (broken) {
        LogContext logCtx;
        logCtx.unitId = target.id;
        logCtx.tick = ctx_.state.tick;
        GBE_LOG_CTX(LogLevel::Debug, LogCategory::Status, "shield broken", logCtx);
        RecalculateStats(target, ctx_.config.cooldownDivisor);
    }
    return amount;
}

// ── Per-tick processing ─────────────────────────────────────────────────

void StatusEffectProcessor::ProcessTick() {
    for (auto side : {Side::Heroes, Side::Enemies}) {
        for (auto* unit : ctx_.state.Living(side)) {
            processUnit(*unit);
        }
    }
}

void StatusEffectProcessor::processUnit(BattleUnit& unit) {
    // Damage over time.
    for (const auto& effect : unit.statusEffects) {
        if (effect.damagePerTick <= 0.0) {
            continue;
        }
        unit.stats.hp = std::max(0.0, unit.stats.hp - effect.damagePerTick);
        ctx_.Emit(DamageEvent{effect.sourceId, unit.id, effect.damagePerTick, unit.stats.hp,
                              DamageSource::DamageOverTime, false, std::nullopt});
        if (unit.stats.hp <= 0.0) {
            ctx_.Kill(unit, std::nullopt);
            return;
        }
    }

    // Regeneration.
    for (const auto& effect : unit.statusEffects) {
        if (effect.healPerTick <= 0.0) {
            continue;
        }
        double amount = std::min(effect.healPerTick, unit.stats.maxHp - unit.stats.hp);
        if (amount <= 0.0) {
            continue;
        }
        unit.stats.hp += amount;
        ctx_.Emit(HealEvent{effect.sourceId, unit.id, amount, unit.stats.hp,
                            HealSource::Regeneration});
    }

    // Duration and expiry.
    std::vector<StatusEffect> expired;
    for (auto& effect : unit.statusEffects) {
        --effect.remainingDuration;
        if (effect.remainingDuration <= 0) {
            expired.push_back(effect);
        }
    }
    if (expired.empty()) {
        return;
    }

    std::erase_if(unit.statusEffects,
                  [](const StatusEffect& e) { return e.remainingDuration <= 0; });
    for (const auto& effect : expired) {
        ctx_.Emit(StatusExpiredEvent{unit.id, effect.id, effect.type});
    }
    RecalculateStats(unit, ctx_.config.cooldownDivisor);
}

} // namespace gbe::battle
