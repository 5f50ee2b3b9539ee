/// @file combat_types.cpp
/// @brief Display names for combat enumerations.

#include "gbe/battle/combat_types.hpp"

#include <array>

namespace gbe::battle {

std::string_view StatusTypeName(StatusType type) noexcept {
    static constexpr std::array<std::string_view, kStatusTypeCount> names = {
        "taunt", "stun", "root", "silence", "disarm", "fear", "charm", "sleep",
        "poison", "burn", "bleed",
        "slow", "armor_break", "weakened", "vulnerable", "disease", "curse",
        "terror", "marked",
        "shield", "regeneration", "enrage", "frenzy", "incorporeal", "fortify",
        "haste", "invisibility",
        "thorns", "burning_ground", "scorched_earth", "plague_zone", "entangle"
    };
    auto idx = static_cast<std::size_t>(type);
    return idx < names.size() ? names[idx] : "unknown";
}

std::string_view StatusCategoryName(StatusCategory category) noexcept {
    switch (category) {
        case StatusCategory::Buff:    return "buff";
        case StatusCategory::Debuff:  return "debuff";
        case StatusCategory::Control: return "control";
        case StatusCategory::Dot:     return "dot";
        case StatusCategory::Special: return "special";
    }
    return "unknown";
}

std::string_view StatKindName(StatKind stat) noexcept {
    switch (stat) {
        case StatKind::MaxHp:       return "maxHp";
        case StatKind::Damage:      return "damage";
        case StatKind::Speed:       return "speed";
        case StatKind::Defense:     return "defense";
        case StatKind::CritChance:  return "critChance";
        case StatKind::CritDamage:  return "critDamage";
        case StatKind::Evasion:     return "evasion";
        case StatKind::Accuracy:    return "accuracy";
        case StatKind::Penetration: return "penetration";
        case StatKind::Lifesteal:   return "lifesteal";
    }
    return "unknown";
}

} // namespace gbe::battle
