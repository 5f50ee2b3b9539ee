#pragma once

/// @file ability_resolver.hpp
/// @brief Per-unit action selection and effect application.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gbe/battle/battle_context.hpp"
#include "gbe/battle/status_effect_processor.hpp"
#include "gbe/battle/targeting.hpp"
#include "gbe/battle/unit_components.hpp"

namespace gbe::battle {

/// Fraction of max hp below which an ally triggers a support heal.
constexpr double kHealTriggerRatio = 0.99;

/// Reach of a basic attack.
constexpr int32_t kBasicAttackRange = 1;

/// Cap on effective evasion after the accuracy adjustment.
constexpr double kMaxEvasion = 0.95;

/// What an acting unit ended up doing.
enum class ActionKind : uint8_t {
    Ability,
    Move,
    Blocked,      ///< Tried to move but had no legal step.
    Attack,
    Evaded,       ///< Basic attack was evaded.
    Idle          ///< No opponent left.
};

/// Result of one unit's action.
struct ActionOutcome {
    ActionKind kind = ActionKind::Idle;
    std::optional<std::string> abilityId;  ///< Set when kind == Ability.
};

/// Selects and applies one ability or basic attack per acting unit.
///
/// Selection order:
///   1. a ready support heal when any living ally is below 99% max hp
///   2. a step toward the nearest opponent when it is out of effective range
///   3. the first ready offensive ability that reaches a valid target
///   4. the first ready support buff not already active from this caster
///   5. a basic attack, or a step toward the target when it is beyond
///      basic attack reach
/// An ability that would affect no valid target is skipped and keeps its
/// cooldown.
class AbilityResolver {
public:
    AbilityResolver(BattleContext& ctx, StatusEffectProcessor& statuses,
                    MovementResolver& movement);

    /// Resolve the action of @p unit. Cooldown bookkeeping is left to the
    /// caller.
    ActionOutcome ResolveAction(BattleUnit& unit);

    /// Try to use @p ability. Returns false without side effects when no
    /// effect would reach a valid target.
    bool TryUseAbility(BattleUnit& caster, const Ability& ability);

    /// Basic attack against @p target: evasion roll, crit roll, mitigation,
    /// shield absorption, lifesteal, death check.
    /// @return false if the attack was evaded.
    bool BasicAttack(BattleUnit& attacker, BattleUnit& target);

    /// Max range over ready offensive abilities, or 1 when there are none.
    [[nodiscard]] static int32_t EffectiveRange(const BattleUnit& unit);

    /// Evasion chance after the attacker's accuracy adjustment, in [0, 0.95].
    [[nodiscard]] static double EffectiveEvasion(double targetEvasion,
                                                 double attackerAccuracy) noexcept;

    /// Basic attack damage after crit and defense mitigation (minimum 1).
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static double CalculateBasicAttackDamage(double damage, bool isCritical,
                                                           double critDamage, double defense,
                                                           double penetration) noexcept;

    /// Units hit by a damage/status effect of @p ability cast by @p caster.
    [[nodiscard]] std::vector<BattleUnit*> ResolveTargets(BattleUnit& caster,
                                                          const Ability& ability,
                                                          const AbilityEffect& effect);

private:
    /// Apply @p amount of damage from @p source to @p target after shields;
    /// handles death. Returns the hp damage dealt.
    double dealDamage(BattleUnit& source, BattleUnit& target, double amount,
                      DamageSource kind, bool isCritical,
                      const std::optional<std::string>& abilityId);

    /// Heal @p target up to its max hp. Returns the amount healed.
    double heal(const BattleUnit& source, BattleUnit& target, double amount, HealSource kind);

    [[nodiscard]] bool wouldAffect(BattleUnit& caster, const Ability& ability,
                                   const AbilityEffect& effect);

    [[nodiscard]] bool buffAlreadyActive(BattleUnit& caster);

    BattleContext& ctx_;
    StatusEffectProcessor& statuses_;
    MovementResolver& movement_;
};

} // namespace gbe::battle
