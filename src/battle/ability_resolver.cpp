/// @file ability_resolver.cpp
/// @brief AbilityResolver implementation.
///
/// Action selection, area target patterns, ability effects and the
/// basic-attack pipeline (evasion -> crit -> mitigation -> shields ->
/// lifesteal).

#include "gbe/battle/ability_resolver.hpp"

#include <algorithm>
#include <array>

#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

AbilityResolver::AbilityResolver(BattleContext& ctx, StatusEffectProcessor& statuses,
                                 MovementResolver& movement)
    : ctx_(ctx), statuses_(statuses), movement_(movement) {}

// ── Static helpers ──────────────────────────────────────────────────────

int32_t AbilityResolver::EffectiveRange(const BattleUnit& unit) {
    int32_t range = 0;
    for (const auto& ability : unit.abilities) {
        if (ability.type == AbilityType::Offensive && unit.IsAbilityReady(ability)) {
            range = std::max(range, ability.range);
        }
    }
    return range > 0 ? range : 1;
}

double AbilityResolver::EffectiveEvasion(double targetEvasion, double attackerAccuracy) noexcept {
    return std::clamp(targetEvasion - (1.0 - attackerAccuracy), 0.0, kMaxEvasion);
}

double AbilityResolver::CalculateBasicAttackDamage(double damage, bool isCritical,
                                                   double critDamage, double defense,
                                                   double penetration) noexcept {
    const double base = damage * (isCritical ? critDamage : 1.0);
    return std::max(1.0, base - defense * (1.0 - penetration) * 0.5);
}

// ── Action selection ────────────────────────────────────────────────────

ActionOutcome AbilityResolver::ResolveAction(BattleUnit& unit) {
    auto opponents = ctx_.state.Opponents(unit);
    if (opponents.empty()) {
        return {ActionKind::Idle, std::nullopt};
    }

    auto allies = ctx_.state.Allies(unit);
    const bool allyHurt = std::any_of(allies.begin(), allies.end(), [](const BattleUnit* a) {
        return a->stats.hp < a->stats.maxHp * kHealTriggerRatio;
    });
    if (allyHurt) {
        for (const auto& ability : unit.abilities) {
            if (ability.type == AbilityType::Support && ability.HasEffect(EffectKind::Heal) &&
                unit.IsAbilityReady(ability) && TryUseAbility(unit, ability)) {
                return {ActionKind::Ability, ability.id};
            }
        }
    }

    auto* target = FindNearestTarget(unit, opponents);
    if (ChebyshevDistance(unit.position, target->position) > EffectiveRange(unit)) {
        return {movement_.StepToward(unit, *target) ? ActionKind::Move : ActionKind::Blocked,
                std::nullopt};
    }

    for (const auto& ability : unit.abilities) {
        if (ability.type == AbilityType::Offensive && unit.IsAbilityReady(ability) &&
            TryUseAbility(unit, ability)) {
            return {ActionKind::Ability, ability.id};
        }
    }

    for (const auto& ability : unit.abilities) {
        if (ability.type != AbilityType::Support || ability.HasEffect(EffectKind::Heal) ||
            !unit.IsAbilityReady(ability)) {
            continue;
        }
        if (ability.HasEffect(EffectKind::Buff) && buffAlreadyActive(unit)) {
            continue;
        }
        if (TryUseAbility(unit, ability)) {
            return {ActionKind::Ability, ability.id};
        }
    }

    // In ability range but no ability landed: close to melee.
    if (ChebyshevDistance(unit.position, target->position) > kBasicAttackRange) {
        return {movement_.StepToward(unit, *target) ? ActionKind::Move : ActionKind::Blocked,
                std::nullopt};
    }

    return {BasicAttack(unit, *target) ? ActionKind::Attack : ActionKind::Evaded, std::nullopt};
}

bool AbilityResolver::buffAlreadyActive(BattleUnit& caster) {
    for (const auto* ally : ctx_.state.Allies(caster)) {
        for (const auto& status : ally->statusEffects) {
            if (status.sourceId == caster.id && status.category == StatusCategory::Buff &&
                status.remainingDuration > 0) {
                return true;
            }
        }
    }
    return false;
}

// ── Target resolution ───────────────────────────────────────────────────

std::vector<BattleUnit*> AbilityResolver::ResolveTargets(BattleUnit& caster,
                                                         const Ability& ability,
                                                         const AbilityEffect& effect) {
    if (effect.target == TargetType::Self) {
        return {&caster};
    }

    auto opponents = ctx_.state.Opponents(caster);
    auto* primary = FindNearestTarget(caster, opponents, ability.range);
    if (primary == nullptr) {
        return {};
    }
    if (effect.target == TargetType::Enemy) {
        return {primary};
    }

    std::vector<BattleUnit*> targets;
    switch (ability.pattern) {
        case AreaPattern::Cleave: {
            if (ChebyshevDistance(caster.position, primary->position) != 1) {
                return {};
            }
            targets.push_back(primary);
            for (auto* other : opponents) {
                if (targets.size() >= 3) {
                    break;
                }
                if (other != primary &&
                    ChebyshevDistance(other->position, primary->position) == 1 &&
                    ChebyshevDistance(other->position, caster.position) == 1) {
                    targets.push_back(other);
                }
            }
            break;
        }
        case AreaPattern::Fireball: {
            const GridPosition anchor = primary->position;
            const std::array<GridPosition, 4> block = {{
                anchor,
                {anchor.row + 1, anchor.col},
                {anchor.row, anchor.col + 1},
                {anchor.row + 1, anchor.col + 1},
            }};
            for (auto* other : opponents) {
                if (std::find(block.begin(), block.end(), other->position) != block.end()) {
                    targets.push_back(other);
                }
            }
            break;
        }
        case AreaPattern::None: {
            const int32_t radius = effect.radius.value_or(1);
            for (auto* other : opponents) {
                if (ChebyshevDistance(other->position, primary->position) <= radius) {
                    targets.push_back(other);
                }
            }
            break;
        }
    }
    return targets;
}

bool AbilityResolver::wouldAffect(BattleUnit& caster, const Ability& ability,
                                  const AbilityEffect& effect) {
    switch (effect.kind) {
        case EffectKind::Damage:
        case EffectKind::Status:
            return !ResolveTargets(caster, ability, effect).empty();
        case EffectKind::Heal: {
            auto allies = ctx_.state.Allies(caster);
            return std::any_of(allies.begin(), allies.end(), [](const BattleUnit* a) {
                return a->stats.hp < a->stats.maxHp;
            });
        }
        case EffectKind::Buff:
            return true;
        case EffectKind::Lifesteal:
            return false;
    }
    return false;
}

// ── Ability use ─────────────────────────────────────────────────────────

bool AbilityResolver::TryUseAbility(BattleUnit& caster, const Ability& ability) {
    const bool usable = std::any_of(
        ability.effects.begin(), ability.effects.end(),
        [&](const AbilityEffect& effect) { return wouldAffect(caster, ability, effect); });
    if (!usable) {
        return false;
    }

    // Target sets are fixed before any effect lands.
    std::vector<std::vector<BattleUnit*>> targetSets(ability.effects.size());
    std::vector<std::string> targetIds;
    for (std::size_t i = 0; i < ability.effects.size(); ++i) {
        const auto& effect = ability.effects[i];
        switch (effect.kind) {
            case EffectKind::Damage:
            case EffectKind::Status:
                targetSets[i] = ResolveTargets(caster, ability, effect);
                break;
            case EffectKind::Heal:
            case EffectKind::Buff:
                targetSets[i] = ctx_.state.Allies(caster);
                break;
            case EffectKind::Lifesteal:
                break;
        }
        for (const auto* target : targetSets[i]) {
            if (std::find(targetIds.begin(), targetIds.end(), target->id) == targetIds.end()) {
                targetIds.push_back(target->id);
            }
        }
    }

    ctx_.Emit(AbilityUsedEvent{caster.id, ability.id, ability.name, targetIds});

    LogContext logCtx;
    logCtx.unitId = caster.id;
    logCtx.tick = ctx_.state.tick;
    logCtx.extra["ability"] = ability.id;
    logCtx.extra["targets"] = std::to_string(targetIds.size());
    GBE_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "ability used", logCtx);

    double totalDamage = 0.0;
    for (std::size_t i = 0; i < ability.effects.size(); ++i) {
        const auto& effect = ability.effects[i];
        switch (effect.kind) {
            case EffectKind::Damage: {
                const double amount = effect.value.value_or(0.0);
                for (auto* target : targetSets[i]) {
                    if (!target->isAlive) {
                        continue;
                    }
                    totalDamage += dealDamage(caster, *target, amount, DamageSource::Ability,
                                              false, ability.id);
                }
                break;
            }
            case EffectKind::Heal:
                for (auto* target : targetSets[i]) {
                    if (target->isAlive) {
                        heal(caster, *target, effect.value.value_or(0.0), HealSource::Ability);
                    }
                }
                break;
            case EffectKind::Buff:
                for (auto* target : targetSets[i]) {
                    if (!target->isAlive) {
                        continue;
                    }
                    auto shield = StatusEffectProcessor::MakeStatus(effect, caster.id);
                    shield.type = StatusType::Shield;
                    shield.category = ClassifyStatus(StatusType::Shield);
                    shield.shieldAmount = effect.value.value_or(0.0);
                    statuses_.Apply(*target, std::move(shield));
                }
                break;
            case EffectKind::Status:
                for (auto* target : targetSets[i]) {
                    if (target->isAlive) {
                        statuses_.Apply(*target, effect, caster.id);
                    }
                }
                break;
            case EffectKind::Lifesteal:
                // Applied after every damage effect of the cast has landed.
                break;
        }
    }

    for (const auto& effect : ability.effects) {
        if (effect.kind == EffectKind::Lifesteal && caster.isAlive && totalDamage > 0.0) {
            heal(caster, caster, totalDamage * effect.value.value_or(0.0), HealSource::Lifesteal);
        }
    }
    return true;
}

// ── Basic attack ────────────────────────────────────────────────────────

bool AbilityResolver::BasicAttack(BattleUnit& attacker, BattleUnit& target) {
    const double evasion = EffectiveEvasion(target.stats.evasion, attacker.stats.accuracy);
    if (ctx_.random.NextUnit() < evasion) {
        ctx_.Emit(EvadedEvent{attacker.id, target.id});
        return false;
    }

    const bool isCritical = ctx_.random.NextUnit() < attacker.stats.critChance;
    const double amount = CalculateBasicAttackDamage(attacker.stats.damage, isCritical,
                                                     attacker.stats.critDamage,
                                                     target.stats.defense,
                                                     attacker.stats.penetration);

    ctx_.Emit(AttackEvent{attacker.id, target.id, attacker.position, target.position});
    if (isCritical) {
        ctx_.Emit(CriticalHitEvent{attacker.id, target.id, attacker.stats.critDamage});
    }

    const double dealt = statuses_.AbsorbDamage(target, amount);
    target.stats.hp = std::max(0.0, target.stats.hp - dealt);
    ctx_.Emit(DamageEvent{attacker.id, target.id, dealt, target.stats.hp,
                          DamageSource::BasicAttack, isCritical, std::nullopt, amount - dealt});

    if (attacker.stats.lifesteal > 0.0 && dealt > 0.0) {
        heal(attacker, attacker, dealt * attacker.stats.lifesteal, HealSource::Lifesteal);
    }
    if (target.stats.hp <= 0.0) {
        ctx_.Kill(target, attacker.id);
    }
    return true;
}

// ── Damage / heal primitives ────────────────────────────────────────────

double AbilityResolver::dealDamage(BattleUnit& source, BattleUnit& target, double amount,
                                   DamageSource kind, bool isCritical,
                                   const std::optional<std::string>& abilityId) {
    const double dealt = statuses_.AbsorbDamage(target, amount);
    target.stats.hp = std::max(0.0, target.stats.hp - dealt);
    ctx_.Emit(DamageEvent{source.id, target.id, dealt, target.stats.hp, kind, isCritical,
                          abilityId, amount - dealt});
    if (target.stats.hp <= 0.0) {
        ctx_.Kill(target, source.id);
    }
    return dealt;
}

double AbilityResolver::heal(const BattleUnit& source, BattleUnit& target, double amount,
                             HealSource kind) {
    const double healed = std::min(amount, target.stats.maxHp - target.stats.hp);
    if (healed <= 0.0) {
        return 0.0;
    }
    target.stats.hp += healed;
    ctx_.Emit(HealEvent{source.id, target.id, healed, target.stats.hp, kind});
    return healed;
}

} // namespace gbe::battle
