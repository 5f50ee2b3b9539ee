#pragma once

/// @file battle_event.hpp
/// @brief Discrete battle events recorded in the event log.
///
/// Every event carries the tick it happened in and a payload specific to
/// its kind. Payloads hold both pre- and post-action positions where a
/// presentation layer needs to interpolate.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "gbe/battle/combat_types.hpp"
#include "gbe/battle/grid_types.hpp"

namespace gbe::battle {

/// Event kinds, in the same order as the BattleEvent payload variant.
enum class EventType : uint8_t {
    BattleStart,
    Tick,
    Move,
    Attack,
    AbilityUsed,
    Damage,
    Heal,
    Evaded,
    CriticalHit,
    StatusApplied,
    StatusExpired,
    Death,
    WaveStart,
    WaveComplete,
    WaveTransition,
    Victory,
    Defeat
};

/// Origin of a Damage event.
enum class DamageSource : uint8_t {
    BasicAttack,
    Ability,
    DamageOverTime
};

/// Origin of a Heal event.
enum class HealSource : uint8_t {
    Ability,
    Lifesteal,
    Regeneration
};

/// Why the battle ended.
enum class EndReason : uint8_t {
    Elimination,  ///< One side has no living units left.
    TickLimit     ///< Safety ceiling reached; decided by remaining hp.
};

// ── Payloads ────────────────────────────────────────────────────────────

struct BattleStartEvent {
    std::vector<std::string> heroIds;
    std::vector<std::string> enemyIds;
    int32_t totalWaves = 1;
};

/// Cooldown gauge of one living unit after the tick's advance.
struct CooldownSnapshot {
    std::string unitId;
    double cooldown = 0.0;
    double cooldownRate = 0.0;
};

struct TickEvent {
    std::vector<CooldownSnapshot> cooldowns;
};

struct MoveEvent {
    std::string unitId;
    GridPosition from;
    GridPosition to;
    std::string targetId;
};

struct AttackEvent {
    std::string attackerId;
    std::string targetId;
    GridPosition attackerPosition;
    GridPosition targetPosition;
};

struct AbilityUsedEvent {
    std::string casterId;
    std::string abilityId;
    std::string abilityName;
    std::vector<std::string> targetIds;
};

struct DamageEvent {
    std::string sourceId;  ///< Attacker, caster, or status source for DoT.
    std::string targetId;
    double amount = 0.0;
    double remainingHp = 0.0;
    DamageSource source = DamageSource::BasicAttack;
    bool isCritical = false;
    std::optional<std::string> abilityId;
    double absorbed = 0.0;  ///< Taken by shields before hp; not part of amount.
};

struct HealEvent {
    std::string sourceId;
    std::string targetId;
    double amount = 0.0;
    double newHp = 0.0;
    HealSource source = HealSource::Ability;
};

struct EvadedEvent {
    std::string attackerId;
    std::string targetId;
};

struct CriticalHitEvent {
    std::string attackerId;
    std::string targetId;
    double multiplier = 1.0;
};

struct StatusAppliedEvent {
    std::string sourceId;
    std::string targetId;
    std::string statusId;
    StatusType statusType = StatusType::Weakened;
    StatusCategory category = StatusCategory::Debuff;
    int32_t duration = 0;
};

struct StatusExpiredEvent {
    std::string unitId;
    std::string statusId;
    StatusType statusType = StatusType::Weakened;
};

struct DeathEvent {
    std::string unitId;
    std::optional<std::string> killerId;  ///< Absent for damage-over-time deaths.
    GridPosition position;
};

/// Where a spawned unit starts its slide-in and where it ends up.
struct SpawnPlacement {
    std::string unitId;
    GridPosition animationFrom;  ///< Off-board column, for interpolation only.
    GridPosition position;       ///< Logical position after spawn.
};

struct WaveStartEvent {
    int32_t waveNumber = 1;
    int32_t totalWaves = 1;
    std::vector<SpawnPlacement> spawns;
};

struct WaveCompleteEvent {
    int32_t waveNumber = 1;
    int32_t totalWaves = 1;
};

/// Repositioning of one surviving hero during a wave transition.
struct UnitShift {
    std::string unitId;
    GridPosition from;
    GridPosition to;
};

struct WaveTransitionEvent {
    int32_t fromWave = 1;
    int32_t toWave = 2;
    int32_t scrollDistance = 0;
    std::vector<UnitShift> heroShifts;
};

/// Payload shared by Victory and Defeat.
struct BattleEndEvent {
    EndReason reason = EndReason::Elimination;
    double heroHpTotal = 0.0;
    double enemyHpTotal = 0.0;
};

struct VictoryEvent : BattleEndEvent {};
struct DefeatEvent : BattleEndEvent {};

/// Tagged union over every payload. Alternative order matches EventType.
using EventPayload = std::variant<
    BattleStartEvent,
    TickEvent,
    MoveEvent,
    AttackEvent,
    AbilityUsedEvent,
    DamageEvent,
    HealEvent,
    EvadedEvent,
    CriticalHitEvent,
    StatusAppliedEvent,
    StatusExpiredEvent,
    DeathEvent,
    WaveStartEvent,
    WaveCompleteEvent,
    WaveTransitionEvent,
    VictoryEvent,
    DefeatEvent>;

/// One entry of the battle's event log.
struct BattleEvent {
    uint32_t tick = 0;
    EventPayload payload;

    [[nodiscard]] EventType Type() const noexcept {
        return static_cast<EventType>(payload.index());
    }

    /// Typed payload access; nullptr when the event is of another kind.
    template <typename T>
    [[nodiscard]] const T* As() const noexcept {
        return std::get_if<T>(&payload);
    }
};

[[nodiscard]] std::string_view EventTypeName(EventType type) noexcept;

} // namespace gbe::battle
