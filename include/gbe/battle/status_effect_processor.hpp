#pragma once

/// @file status_effect_processor.hpp
/// @brief Status effect application, per-tick processing and stat recalculation.

#include <cstdint>
#include <string>

#include "gbe/battle/battle_context.hpp"
#include "gbe/battle/unit_components.hpp"

namespace gbe::battle {

/// Drives every status effect in the battle.
///
/// Per tick, before any unit acts:
///   1. damage-over-time ticks (may kill the holder)
///   2. regeneration ticks
///   3. durations decrement; expired effects are removed and the holder's
///      stats are recalculated
class StatusEffectProcessor {
public:
    explicit StatusEffectProcessor(BattleContext& ctx);

    /// Run one tick of status processing over every living unit.
    void ProcessTick();

    /// Attach a status built from @p effect to @p target and recalculate
    /// its stats. Emits StatusApplied.
    /// @return The id of the new status effect.
    std::string Apply(BattleUnit& target, const AbilityEffect& effect,
                      const std::string& sourceId);

    /// Attach an already-built status effect (its id is assigned here).
    std::string Apply(BattleUnit& target, StatusEffect status);

    /// Let @p target's shields soak up @p amount, oldest first. A shield
    /// that is used up expires (it is removed on the next tick).
    /// @return The damage left for hp.
    double AbsorbDamage(BattleUnit& target, double amount);

    /// Rebuild derived stats from base stats plus active modifiers.
    ///
    /// Current hp is preserved and maxHp is never modified. Percent modifiers
    /// scale the stat by (1 + value/100); flat modifiers add and floor at 0.
    /// Effects with no remaining duration are ignored.
    static void RecalculateStats(BattleUnit& unit,
                                 double cooldownDivisor = kDefaultCooldownDivisor);

    /// Build (but do not attach) the status an ability effect describes.
    [[nodiscard]] static StatusEffect MakeStatus(const AbilityEffect& effect,
                                                 const std::string& sourceId);

private:
    void processUnit(BattleUnit& unit);

    BattleContext& ctx_;
    uint64_t nextStatusSerial_ = 1;
};

/// Mutable access to the stat a modifier targets.
[[nodiscard]] double& StatField(UnitStats& stats, StatKind kind) noexcept;

} // namespace gbe::battle
