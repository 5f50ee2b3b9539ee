#pragma once

/// @file unit_components.hpp
/// @brief Plain data shapes for combat units, abilities and status effects.

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "gbe/battle/combat_types.hpp"
#include "gbe/battle/grid_types.hpp"

namespace gbe::battle {

// ── Stats ───────────────────────────────────────────────────────────────

/// Combat statistics. Every field except hp is derived from base stats and
/// active status modifiers; hp is only changed by damage and healing.
struct UnitStats {
    double hp = 100.0;
    double maxHp = 100.0;
    double damage = 10.0;
    double speed = 10.0;
    double defense = 0.0;
    double critChance = 0.0;
    double critDamage = 1.5;
    double evasion = 0.0;
    double accuracy = 1.0;
    double penetration = 0.0;  ///< Fraction of defense ignored (0 = none).
    double lifesteal = 0.0;    ///< Fraction of basic-attack damage healed (0 = none).

    bool operator==(const UnitStats&) const = default;
};

/// Modification of a single derived stat.
struct StatModifier {
    StatKind stat = StatKind::Damage;
    double value = 0.0;
    bool isPercent = false;
};

// ── Abilities ───────────────────────────────────────────────────────────

/// One effect of an ability.
struct AbilityEffect {
    EffectKind kind = EffectKind::Damage;
    TargetType target = TargetType::Enemy;
    std::optional<double> value;
    std::optional<int32_t> radius;
    std::optional<StatusType> statusType;
    std::optional<int32_t> duration;
    std::optional<double> damagePerTick;
    std::optional<double> healPerTick;
    std::optional<StatModifier> statModifier;
};

/// Ability definition.
struct Ability {
    std::string id;
    std::string name;
    AbilityType type = AbilityType::Offensive;
    int32_t range = 1;
    int32_t cooldown = 0;  ///< Uses of other actions before reusable.
    AreaPattern pattern = AreaPattern::None;
    std::vector<AbilityEffect> effects;

    [[nodiscard]] bool HasEffect(EffectKind kind) const {
        return std::any_of(effects.begin(), effects.end(),
                           [kind](const AbilityEffect& e) { return e.kind == kind; });
    }
};

// ── Status effects ──────────────────────────────────────────────────────

/// Default duration (ticks) for a status effect that does not name one.
constexpr int32_t kDefaultStatusDuration = 3;

/// A timed modifier attached to a unit.
struct StatusEffect {
    std::string id;  ///< Unique per application.
    StatusType type = StatusType::Weakened;
    StatusCategory category = StatusCategory::Debuff;
    int32_t duration = kDefaultStatusDuration;
    int32_t remainingDuration = kDefaultStatusDuration;
    double damagePerTick = 0.0;
    double healPerTick = 0.0;
    double shieldAmount = 0.0;  ///< Damage still absorbed (Shield only).
    std::optional<StatModifier> modifier;
    std::string sourceId;
};

// ── Units ───────────────────────────────────────────────────────────────

/// A combatant for the duration of one battle.
///
/// Dead units stay in their roster for reference by the event log but no
/// longer hold a grid cell and are never valid targets.
struct BattleUnit {
    std::string id;
    std::string name;
    bool isHero = true;
    GridPosition position;
    UnitStats baseStats;
    UnitStats stats;
    std::vector<StatusEffect> statusEffects;
    std::vector<Ability> abilities;
    std::map<std::string, int32_t> abilityCooldowns;  ///< ability id -> uses until ready
    double cooldown = 0.0;
    double cooldownRate = 0.0;
    bool isAlive = true;
    int32_t wave = 1;

    [[nodiscard]] Side GetSide() const noexcept {
        return isHero ? Side::Heroes : Side::Enemies;
    }

    /// Remaining uses before @p abilityId is ready (0 = ready).
    [[nodiscard]] int32_t AbilityCooldown(const std::string& abilityId) const {
        auto it = abilityCooldowns.find(abilityId);
        return it == abilityCooldowns.end() ? 0 : it->second;
    }

    [[nodiscard]] bool IsAbilityReady(const Ability& ability) const {
        return AbilityCooldown(ability.id) == 0;
    }

    [[nodiscard]] bool HasStatusCategory(StatusCategory category) const {
        return std::any_of(statusEffects.begin(), statusEffects.end(),
                           [category](const StatusEffect& e) {
                               return e.category == category && e.remainingDuration > 0;
                           });
    }

    /// Control-category effects prevent the unit from acting.
    [[nodiscard]] bool IsControlled() const {
        return HasStatusCategory(StatusCategory::Control);
    }

    [[nodiscard]] bool IsReady() const noexcept {
        return isAlive && cooldown >= kCooldownThreshold;
    }
};

} // namespace gbe::battle
