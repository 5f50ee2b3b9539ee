/// @file battle_setup.cpp
/// @brief Roster validation and unit construction.

#include "gbe/battle/battle_setup.hpp"

#include <map>
#include <set>
#include <unordered_set>

#include "gbe/battle/status_effect_processor.hpp"
#include "gbe/foundation/battle_logger.hpp"

namespace gbe::battle {

using foundation::BattleError;
using foundation::BattleResult;
using foundation::ErrorCode;

namespace {

using Check = BattleResult<void>;

Check fail(ErrorCode code, std::string message, const std::string& unitId,
           std::optional<std::string> abilityId = std::nullopt) {
    return Check::err(BattleError(code, std::move(message), unitId, std::move(abilityId)));
}

bool isFraction(double value) {
    return value >= 0.0 && value <= 1.0;
}

Check validateStats(const UnitDefinition& def) {
    const auto& s = def.stats;
    if (s.maxHp <= 0.0) {
        return fail(ErrorCode::InvalidUnitStats, "maxHp must be positive", def.id);
    }
    if (s.hp <= 0.0 || s.hp > s.maxHp) {
        return fail(ErrorCode::InvalidUnitStats, "hp must be in (0, maxHp]", def.id);
    }
    if (s.damage < 0.0 || s.speed < 0.0 || s.defense < 0.0 || s.critDamage < 0.0) {
        return fail(ErrorCode::InvalidUnitStats,
                    "damage, speed, defense and critDamage must not be negative", def.id);
    }
    if (!isFraction(s.critChance) || !isFraction(s.evasion) || !isFraction(s.accuracy) ||
        !isFraction(s.penetration) || !isFraction(s.lifesteal)) {
        return fail(ErrorCode::InvalidUnitStats,
                    "critChance, evasion, accuracy, penetration and lifesteal must be in [0, 1]",
                    def.id);
    }
    return Check::ok();
}

Check validateEffect(const UnitDefinition& def, const Ability& ability,
                     const AbilityEffect& effect) {
    auto bad = [&](std::string message) {
        return fail(ErrorCode::InvalidAbilityEffect, std::move(message), def.id, ability.id);
    };

    if (effect.value && *effect.value < 0.0) {
        return bad("effect value must not be negative");
    }
    if (effect.radius && *effect.radius < 0) {
        return bad("effect radius must not be negative");
    }
    if (effect.duration && *effect.duration <= 0) {
        return bad("effect duration must be positive");
    }
    if ((effect.damagePerTick && *effect.damagePerTick < 0.0) ||
        (effect.healPerTick && *effect.healPerTick < 0.0)) {
        return bad("per-tick amounts must not be negative");
    }
    if (effect.statModifier && effect.statModifier->stat == StatKind::MaxHp) {
        return bad("max hp cannot be modified by a status effect");
    }

    switch (effect.kind) {
        case EffectKind::Damage:
        case EffectKind::Heal:
        case EffectKind::Lifesteal:
            if (!effect.value) {
                return bad("effect requires a value");
            }
            break;
        case EffectKind::Buff:
            if (!effect.statModifier && !effect.value) {
                return bad("buff effect requires a stat modifier or a shield value");
            }
            break;
        case EffectKind::Status:
            if (!effect.statusType) {
                return fail(ErrorCode::UnknownStatusType,
                            "status effect does not name a status type", def.id, ability.id);
            }
            break;
    }
    return Check::ok();
}

Check validateAbilities(const UnitDefinition& def) {
    std::unordered_set<std::string> seen;
    for (const auto& ability : def.abilities) {
        if (ability.id.empty()) {
            return fail(ErrorCode::InvalidAbility, "ability id must not be empty", def.id);
        }
        if (!seen.insert(ability.id).second) {
            return fail(ErrorCode::InvalidAbility, "duplicate ability id", def.id, ability.id);
        }
        if (ability.range < 1) {
            return fail(ErrorCode::InvalidAbility, "ability range must be at least 1", def.id,
                        ability.id);
        }
        if (ability.cooldown < 0) {
            return fail(ErrorCode::InvalidAbility, "ability cooldown must not be negative",
                        def.id, ability.id);
        }
        if (ability.effects.empty()) {
            return fail(ErrorCode::InvalidAbility, "ability has no effects", def.id, ability.id);
        }
        for (const auto& effect : ability.effects) {
            auto status = validateEffect(def, ability, effect);
            if (status.hasError()) {
                return status;
            }
        }
    }
    return Check::ok();
}

/// Validate one group of units placed together (heroes, or one enemy wave).
Check validateGroup(const std::vector<UnitDefinition>& group, const EngineConfig& config,
                    std::unordered_set<std::string>& ids, std::set<GridPosition>& claimed) {
    for (const auto& def : group) {
        if (def.id.empty()) {
            return fail(ErrorCode::InvalidArgument, "unit id must not be empty", def.id);
        }
        if (!ids.insert(def.id).second) {
            return fail(ErrorCode::DuplicateUnitId, "duplicate unit id " + def.id, def.id);
        }
        for (auto status : {validateStats(def), validateAbilities(def)}) {
            if (status.hasError()) {
                return status;
            }
        }
        if (def.position) {
            const auto pos = *def.position;
            if (pos.row < 0 || pos.row >= config.gridHeight || pos.col < 0 ||
                pos.col >= config.gridWidth) {
                return fail(ErrorCode::PositionOutOfBounds,
                            "start position " + ToString(pos) + " is off the grid", def.id);
            }
            if (!claimed.insert(pos).second) {
                return fail(ErrorCode::PositionConflict,
                            "start position " + ToString(pos) + " is already taken", def.id);
            }
        }
    }
    return Check::ok();
}

} // namespace

BattleSetup BattleSetup::FromFlatEnemies(std::vector<UnitDefinition> heroes,
                                         std::vector<UnitDefinition> enemies) {
    std::map<int32_t, std::vector<UnitDefinition>> byWave;
    for (auto& enemy : enemies) {
        byWave[enemy.wave].push_back(std::move(enemy));
    }

    BattleSetup setup;
    setup.heroes = std::move(heroes);
    for (auto& [wave, group] : byWave) {
        setup.enemyWaves.push_back(std::move(group));
    }
    return setup;
}

BattleResult<void> ValidateSetup(const BattleSetup& setup, const EngineConfig& config) {
    auto configStatus = ValidateEngineConfig(config);
    if (configStatus.hasError()) {
        return configStatus;
    }
    if (setup.heroes.empty()) {
        return Check::err(BattleError(ErrorCode::EmptyRoster, "hero roster is empty"));
    }
    if (setup.enemyWaves.empty()) {
        return Check::err(BattleError(ErrorCode::EmptyRoster, "no enemy waves"));
    }

    const auto cells = static_cast<std::size_t>(config.gridWidth) *
                       static_cast<std::size_t>(config.gridHeight);
    for (const auto& wave : setup.enemyWaves) {
        if (setup.heroes.size() + wave.size() > cells) {
            return Check::err(BattleError(ErrorCode::InvalidArgument,
                                          "more units than grid cells in one wave"));
        }
    }

    std::unordered_set<std::string> ids;
    std::set<GridPosition> heroCells;
    auto status = validateGroup(setup.heroes, config, ids, heroCells);
    if (status.hasError()) {
        return status;
    }

    for (std::size_t i = 0; i < setup.enemyWaves.size(); ++i) {
        const auto& wave = setup.enemyWaves[i];
        if (wave.empty()) {
            return Check::err(BattleError(ErrorCode::EmptyRoster,
                                          "enemy wave " + std::to_string(i + 1) + " is empty"));
        }
        // Only the first wave shares the board with the heroes' start cells.
        std::set<GridPosition> waveCells = i == 0 ? heroCells : std::set<GridPosition>{};
        status = validateGroup(wave, config, ids, waveCells);
        if (status.hasError()) {
            return status;
        }
    }
    return Check::ok();
}

BattleUnit MakeBattleUnit(const UnitDefinition& def, bool isHero, int32_t wave,
                          double cooldownDivisor) {
    BattleUnit unit;
    unit.id = def.id;
    unit.name = def.name.empty() ? def.id : def.name;
    unit.isHero = isHero;
    unit.baseStats = def.stats;
    unit.stats = def.stats;
    unit.abilities = def.abilities;
    for (const auto& ability : unit.abilities) {
        unit.abilityCooldowns[ability.id] = 0;
    }
    unit.wave = wave;
    StatusEffectProcessor::RecalculateStats(unit, cooldownDivisor);
    return unit;
}

} // namespace gbe::battle
