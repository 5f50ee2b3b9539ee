#pragma once

/// @file combat_types.hpp
/// @brief Enumerations for abilities, effects and status effects.

#include <cstdint>
#include <string_view>

namespace gbe::battle {

/// Which side of the battle a unit fights for.
enum class Side : uint8_t {
    Heroes,
    Enemies
};

/// Ability role. Support abilities with a heal effect are used
/// preemptively; offensive abilities determine effective range.
enum class AbilityType : uint8_t {
    Offensive,
    Support
};

/// Closed set of ability effect kinds.
enum class EffectKind : uint8_t {
    Damage,     ///< Flat damage to the target set.
    Heal,       ///< Heal every living ally.
    Buff,       ///< Shield status carrying a stat modifier on every living ally.
    Status,     ///< Named status effect on the target set.
    Lifesteal   ///< Heal caster by a fraction of damage dealt this cast.
};

/// Who an effect is aimed at.
enum class TargetType : uint8_t {
    Enemy,  ///< Single nearest opponent.
    Aoe,    ///< Area around the nearest in-range opponent.
    Self    ///< The caster (or its allies for heal/buff).
};

/// Named area shape overriding the plain radius rule.
enum class AreaPattern : uint8_t {
    None,      ///< Generic radius around the primary target.
    Cleave,    ///< Adjacent primary plus up to two targets adjacent to both.
    Fireball   ///< 2x2 block anchored at the primary target.
};

/// Status effect category derived from the status type.
enum class StatusCategory : uint8_t {
    Buff,
    Debuff,
    Control,
    Dot,
    Special
};

/// Every named status effect.
enum class StatusType : uint8_t {
    // Control
    Taunt,
    Stun,
    Root,
    Silence,
    Disarm,
    Fear,
    Charm,
    Sleep,

    // Damage over time
    Poison,
    Burn,
    Bleed,

    // Debuffs
    Slow,
    ArmorBreak,
    Weakened,
    Vulnerable,
    Disease,
    Curse,
    Terror,
    Marked,

    // Buffs
    Shield,
    Regeneration,
    Enrage,
    Frenzy,
    Incorporeal,
    Fortify,
    Haste,
    Invisibility,

    // Special
    Thorns,
    BurningGround,
    ScorchedEarth,
    PlagueZone,
    Entangle
};

/// Number of distinct status types.
constexpr std::size_t kStatusTypeCount = 32;

/// Derived (non-hp) stats a modifier can change.
enum class StatKind : uint8_t {
    MaxHp,
    Damage,
    Speed,
    Defense,
    CritChance,
    CritDamage,
    Evasion,
    Accuracy,
    Penetration,
    Lifesteal
};

/// Fixed status -> category classification.
///
/// Taunt is tracked as a debuff: it does not prevent the holder from acting.
[[nodiscard]] constexpr StatusCategory ClassifyStatus(StatusType type) noexcept {
    switch (type) {
        case StatusType::Stun:
        case StatusType::Root:
        case StatusType::Silence:
        case StatusType::Disarm:
        case StatusType::Fear:
        case StatusType::Charm:
        case StatusType::Sleep:
            return StatusCategory::Control;

        case StatusType::Poison:
        case StatusType::Burn:
        case StatusType::Bleed:
            return StatusCategory::Dot;

        case StatusType::Shield:
        case StatusType::Regeneration:
        case StatusType::Enrage:
        case StatusType::Frenzy:
        case StatusType::Incorporeal:
        case StatusType::Fortify:
        case StatusType::Haste:
        case StatusType::Invisibility:
            return StatusCategory::Buff;

        case StatusType::Thorns:
        case StatusType::BurningGround:
        case StatusType::ScorchedEarth:
        case StatusType::PlagueZone:
        case StatusType::Entangle:
            return StatusCategory::Special;

        case StatusType::Taunt:
        case StatusType::Slow:
        case StatusType::ArmorBreak:
        case StatusType::Weakened:
        case StatusType::Vulnerable:
        case StatusType::Disease:
        case StatusType::Curse:
        case StatusType::Terror:
        case StatusType::Marked:
            return StatusCategory::Debuff;
    }
    return StatusCategory::Debuff;
}

[[nodiscard]] std::string_view StatusTypeName(StatusType type) noexcept;
[[nodiscard]] std::string_view StatusCategoryName(StatusCategory category) noexcept;
[[nodiscard]] std::string_view StatKindName(StatKind stat) noexcept;

} // namespace gbe::battle
