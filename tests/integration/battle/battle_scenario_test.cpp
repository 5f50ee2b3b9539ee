#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "gbe/gbe.hpp"
#include "support/battle_test_support.hpp"

using namespace gbe::battle;
using namespace gbe::battle::testing;
using gbe::foundation::ErrorCode;

namespace {

std::unique_ptr<BattleSimulator> MakeSimulator(BattleSetup setup, EngineConfig config = {},
                                               std::unique_ptr<IRandomSource> random = nullptr) {
    auto sim = BattleSimulator::Create(std::move(setup), config, std::move(random));
    EXPECT_TRUE(sim.hasValue());
    return sim.hasValue() ? std::move(sim).value() : nullptr;
}

/// Events of @p type whose payload names @p unitId as the actor.
std::size_t CountAttacksBy(const EventLog& log, const std::string& unitId, uint32_t upToTick) {
    std::size_t count = 0;
    for (const auto& event : log) {
        const auto* attack = event.As<AttackEvent>();
        if (attack != nullptr && attack->attackerId == unitId && event.tick <= upToTick) {
            ++count;
        }
    }
    return count;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Single exchanges
// ═══════════════════════════════════════════════════════════════════════════

TEST(BattleScenarioTest, FasterUnitKillsFirst) {
    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("hero", {0, 0}, 1.0, 10.0, 1000.0));
    setup.enemyWaves.push_back({MakePlacedDefinition("enemy", {0, 1}, 1.0, 10.0, 500.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    const auto& state = sim->Run();

    EXPECT_EQ(state.events.Types(),
              (std::vector<EventType>{EventType::BattleStart, EventType::Tick, EventType::Attack,
                                      EventType::Damage, EventType::Death, EventType::Victory}));
    EXPECT_EQ(state.tick, 1u);
    EXPECT_EQ(state.winner, Side::Heroes);
    EXPECT_TRUE(state.heroes[0].isAlive);
    EXPECT_FALSE(state.enemies[0].isAlive);

    const auto* victory = state.events.Last().As<VictoryEvent>();
    ASSERT_NE(victory, nullptr);
    EXPECT_EQ(victory->reason, EndReason::Elimination);
    EXPECT_DOUBLE_EQ(victory->heroHpTotal, 1.0);
    EXPECT_DOUBLE_EQ(victory->enemyHpTotal, 0.0);
}

TEST(BattleScenarioTest, BattleStartListsRosters) {
    BattleSetup setup;
    setup.heroes.push_back(MakeDefinition("knight"));
    setup.heroes.push_back(MakeDefinition("archer"));
    setup.enemyWaves.push_back({MakeDefinition("goblin")});
    setup.enemyWaves.push_back({MakeDefinition("orc")});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);

    const auto& log = sim->State().events;
    ASSERT_EQ(log.Size(), 1u);
    const auto* start = log.Last().As<BattleStartEvent>();
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(log.Last().tick, 0u);
    EXPECT_EQ(start->heroIds, (std::vector<std::string>{"knight", "archer"}));
    EXPECT_EQ(start->enemyIds, (std::vector<std::string>{"goblin"}));
    EXPECT_EQ(start->totalWaves, 2);
}

TEST(BattleScenarioTest, DoubleSpeedActsTwiceAsOften) {
    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("fast", {3, 3}, 1000.0, 1.0, 20.0));
    setup.enemyWaves.push_back({MakePlacedDefinition("slow", {3, 4}, 1000.0, 1.0, 10.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(sim->Step());
    }

    const auto& log = sim->State().events;
    EXPECT_EQ(CountAttacksBy(log, "fast", 49), 0u);
    EXPECT_EQ(CountAttacksBy(log, "fast", 100), 2u);
    EXPECT_EQ(CountAttacksBy(log, "slow", 100), 1u);
}

TEST(BattleScenarioTest, ScriptedEvasionLeavesTargetUntouched) {
    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("hero", {0, 0}, 100.0, 10.0, 1000.0));
    auto dodger = MakePlacedDefinition("dodger", {0, 1}, 50.0, 10.0, 1.0);
    dodger.stats.evasion = 0.5;
    setup.enemyWaves.push_back({dodger});

    auto random = std::make_unique<ScriptedRandomSource>();
    random->Push(0.0);
    auto sim = MakeSimulator(std::move(setup), {}, std::move(random));
    ASSERT_NE(sim, nullptr);
    ASSERT_TRUE(sim->Step());

    const auto& state = sim->State();
    EXPECT_EQ(state.events.Count(EventType::Evaded), 1u);
    EXPECT_EQ(state.events.Count(EventType::Damage), 0u);
    EXPECT_DOUBLE_EQ(state.enemies[0].stats.hp, 50.0);
}

TEST(BattleScenarioTest, AreaAbilityWithLifesteal) {
    Ability nova = MakeAbility("nova", AbilityType::Offensive, DamageEffect(10.0, TargetType::Aoe));
    nova.effects[0].radius = 1;
    AbilityEffect drain;
    drain.kind = EffectKind::Lifesteal;
    drain.target = TargetType::Self;
    drain.value = 0.5;
    nova.effects.push_back(drain);

    auto warlock = MakePlacedDefinition("warlock", {3, 3}, 100.0, 10.0, 1000.0);
    warlock.stats.hp = 50.0;
    warlock.abilities.push_back(nova);

    BattleSetup setup;
    setup.heroes.push_back(warlock);
    setup.enemyWaves.push_back({MakePlacedDefinition("a", {3, 4}, 100.0, 1.0, 1.0),
                                MakePlacedDefinition("b", {4, 5}, 100.0, 1.0, 1.0),
                                MakePlacedDefinition("c", {3, 6}, 100.0, 1.0, 1.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    ASSERT_TRUE(sim->Step());

    const auto& state = sim->State();
    EXPECT_DOUBLE_EQ(state.heroes[0].stats.hp, 60.0);
    EXPECT_DOUBLE_EQ(state.enemies[0].stats.hp, 90.0);
    EXPECT_DOUBLE_EQ(state.enemies[1].stats.hp, 90.0);
    EXPECT_DOUBLE_EQ(state.enemies[2].stats.hp, 100.0);

    auto heals = state.events.OfType(EventType::Heal);
    ASSERT_EQ(heals.size(), 1u);
    EXPECT_DOUBLE_EQ(heals[0].As<HealEvent>()->amount, 10.0);
    EXPECT_EQ(heals[0].As<HealEvent>()->source, HealSource::Lifesteal);
}

TEST(BattleScenarioTest, RangedCleaveUnitStillClosesToMelee) {
    Ability cleave = MakeAbility("cleave", AbilityType::Offensive,
                                 DamageEffect(5.0, TargetType::Aoe), 2);
    cleave.pattern = AreaPattern::Cleave;
    auto knight = MakePlacedDefinition("knight", {0, 0}, 100.0, 10.0, 10.0);
    knight.abilities.push_back(cleave);

    BattleSetup setup;
    setup.heroes.push_back(knight);
    setup.enemyWaves.push_back({MakePlacedDefinition("goblin", {0, 2}, 30.0, 1.0, 1.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    const auto& state = sim->Run();

    EXPECT_EQ(state.winner, Side::Heroes);
    for (const auto& event : state.events) {
        if (const auto* attack = event.As<AttackEvent>()) {
            EXPECT_LE(ChebyshevDistance(attack->attackerPosition, attack->targetPosition), 1)
                << "tick " << event.tick;
        }
    }
    EXPECT_GT(state.events.Count(EventType::Move), 0u);
    EXPECT_GT(state.events.Count(EventType::AbilityUsed), 0u);
}

TEST(BattleScenarioTest, ShieldSoaksHitsBeforeHp) {
    AbilityEffect barrier;
    barrier.kind = EffectKind::Buff;
    barrier.target = TargetType::Self;
    barrier.duration = 10;
    barrier.value = 25.0;
    auto guardian = MakePlacedDefinition("guardian", {0, 0}, 100.0, 1.0, 1000.0);
    guardian.abilities.push_back(MakeAbility("barrier", AbilityType::Support, barrier));

    BattleSetup setup;
    setup.heroes.push_back(guardian);
    setup.enemyWaves.push_back({MakePlacedDefinition("ogre", {0, 1}, 1000.0, 10.0, 500.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    ASSERT_TRUE(sim->Step());
    ASSERT_TRUE(sim->Step());

    const auto& state = sim->State();
    EXPECT_DOUBLE_EQ(state.heroes[0].stats.hp, 100.0);

    std::size_t hitsOnGuardian = 0;
    for (const auto& event : state.events.OfType(EventType::Damage)) {
        const auto* damage = event.As<DamageEvent>();
        if (damage->targetId != "guardian") {
            continue;
        }
        ++hitsOnGuardian;
        EXPECT_DOUBLE_EQ(damage->amount, 0.0);
        EXPECT_DOUBLE_EQ(damage->absorbed, 10.0);
    }
    EXPECT_EQ(hitsOnGuardian, 1u);
}

TEST(BattleScenarioTest, AbilityCooldownCountsOwnActions) {
    auto mage = MakePlacedDefinition("mage", {3, 3}, 1000.0, 1.0, 1000.0);
    mage.abilities.push_back(
        MakeAbility("bolt", AbilityType::Offensive, DamageEffect(5.0), 1, 2));

    BattleSetup setup;
    setup.heroes.push_back(mage);
    setup.enemyWaves.push_back({MakePlacedDefinition("dummy", {3, 4}, 1000.0, 1.0, 1.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(sim->Step());
    }

    std::vector<uint32_t> abilityTicks;
    for (const auto& event : sim->State().events) {
        if (event.Type() == EventType::AbilityUsed) {
            abilityTicks.push_back(event.tick);
        }
    }
    EXPECT_EQ(abilityTicks, (std::vector<uint32_t>{1, 4}));
    EXPECT_EQ(CountAttacksBy(sim->State().events, "mage", 4), 2u);
}

TEST(BattleScenarioTest, StunnedUnitSkipsTurns) {
    auto knight = MakePlacedDefinition("knight", {3, 3}, 1000.0, 1.0, 1000.0);
    knight.abilities.push_back(MakeAbility("bash", AbilityType::Offensive,
                                           StatusEffectOf(StatusType::Stun, 2), 1, 10));

    BattleSetup setup;
    setup.heroes.push_back(knight);
    setup.enemyWaves.push_back({MakePlacedDefinition("brute", {3, 4}, 1000.0, 1.0, 1000.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(sim->Step());
    }

    const auto& log = sim->State().events;
    EXPECT_EQ(CountAttacksBy(log, "brute", 2), 0u);
    EXPECT_EQ(CountAttacksBy(log, "brute", 3), 1u);
    EXPECT_EQ(log.Count(EventType::StatusExpired), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Waves
// ═══════════════════════════════════════════════════════════════════════════

TEST(BattleScenarioTest, FourWavesAnnounceOnlyThirdCompletion) {
    BattleSetup setup;
    setup.heroes.push_back(MakeDefinition("champion", 1000.0, 1000.0, 1000.0));
    for (int wave = 1; wave <= 4; ++wave) {
        setup.enemyWaves.push_back({MakeDefinition("grunt" + std::to_string(wave), 1.0, 1.0, 1.0)});
    }

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);
    const auto& state = sim->Run();

    EXPECT_EQ(state.winner, Side::Heroes);
    EXPECT_EQ(state.currentWave, 4);
    EXPECT_EQ(state.remainingEnemyWaves, 0);
    EXPECT_EQ(state.enemies.size(), 4u);

    auto completes = state.events.OfType(EventType::WaveComplete);
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0].As<WaveCompleteEvent>()->waveNumber, 3);
    EXPECT_EQ(state.events.Count(EventType::WaveTransition), 3u);
    EXPECT_EQ(state.events.Count(EventType::WaveStart), 3u);

    // Every transition is immediately followed by the matching wave start.
    const auto& events = state.events.Events();
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto* transition = events[i].As<WaveTransitionEvent>();
        if (transition == nullptr) {
            continue;
        }
        ASSERT_LT(i + 1, events.size());
        const auto* start = events[i + 1].As<WaveStartEvent>();
        ASSERT_NE(start, nullptr);
        EXPECT_EQ(start->waveNumber, transition->toWave);
        EXPECT_EQ(events[i + 1].tick, events[i].tick);
        if (transition->fromWave == 3) {
            EXPECT_NE(events[i - 1].As<WaveCompleteEvent>(), nullptr);
        }
    }
}

TEST(BattleScenarioTest, TransitionFlagLastsOneTick) {
    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("champion", {2, 5}, 1000.0, 1000.0, 1000.0));
    setup.enemyWaves.push_back({MakePlacedDefinition("first", {2, 6}, 1.0, 1.0, 1.0)});
    setup.enemyWaves.push_back({MakeDefinition("second", 1.0, 1.0, 1.0)});

    auto sim = MakeSimulator(std::move(setup));
    ASSERT_NE(sim, nullptr);

    ASSERT_TRUE(sim->Step());
    EXPECT_TRUE(sim->State().transitionInProgress);
    EXPECT_EQ(sim->State().currentWave, 2);
    EXPECT_EQ(sim->State().heroes[0].position, (GridPosition{2, 2}));

    ASSERT_TRUE(sim->Step());
    EXPECT_FALSE(sim->State().transitionInProgress);
}

// ═══════════════════════════════════════════════════════════════════════════
// Endings
// ═══════════════════════════════════════════════════════════════════════════

TEST(BattleScenarioTest, HeroWipeIsDefeat) {
    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("squire", {0, 0}, 5.0, 1.0, 1.0));
    setup.enemyWaves.push_back({MakePlacedDefinition("ogre", {0, 1}, 500.0, 50.0, 1000.0)});

    auto result = SimulateBattle(std::move(setup));
    ASSERT_TRUE(result.hasValue());
    const auto& state = result.value();
    EXPECT_EQ(state.winner, Side::Enemies);
    EXPECT_TRUE(state.finished);
    ASSERT_NE(state.events.Last().As<DefeatEvent>(), nullptr);
    EXPECT_EQ(state.events.Last().As<DefeatEvent>()->reason, EndReason::Elimination);
}

TEST(BattleScenarioTest, TickCeilingDecidesByHp) {
    EngineConfig config;
    config.maxTicks = 5;

    BattleSetup setup;
    setup.heroes.push_back(MakePlacedDefinition("tank", {0, 0}, 300.0, 1.0, 1.0));
    setup.enemyWaves.push_back({MakePlacedDefinition("wall", {7, 7}, 200.0, 1.0, 1.0)});

    auto sim = MakeSimulator(std::move(setup), config);
    ASSERT_NE(sim, nullptr);
    const auto& state = sim->Run();

    EXPECT_EQ(state.tick, 5u);
    EXPECT_EQ(state.winner, Side::Heroes);
    const auto* victory = state.events.Last().As<VictoryEvent>();
    ASSERT_NE(victory, nullptr);
    EXPECT_EQ(victory->reason, EndReason::TickLimit);
    EXPECT_DOUBLE_EQ(victory->heroHpTotal, 300.0);
    EXPECT_DOUBLE_EQ(victory->enemyHpTotal, 200.0);

    EXPECT_FALSE(sim->Step());
    EXPECT_EQ(sim->State().tick, 5u);
}

TEST(BattleScenarioTest, InvalidSetupIsRejected) {
    BattleSetup setup;
    setup.enemyWaves.push_back({MakeDefinition("goblin")});

    auto sim = BattleSimulator::Create(std::move(setup));
    ASSERT_TRUE(sim.hasError());
    EXPECT_EQ(sim.error().code(), ErrorCode::EmptyRoster);

    BattleSetup noWaves;
    noWaves.heroes.push_back(MakeDefinition("knight"));
    auto result = SimulateBattle(std::move(noWaves));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyRoster);
}

TEST(BattleScenarioTest, SameSeedReplaysIdentically) {
    auto makeSetup = [] {
        BattleSetup setup;
        auto rogue = MakeDefinition("rogue", 120.0, 14.0, 18.0);
        rogue.stats.critChance = 0.3;
        rogue.stats.evasion = 0.2;
        setup.heroes.push_back(rogue);
        setup.heroes.push_back(MakeDefinition("knight", 200.0, 9.0, 10.0));
        auto wolf = MakeDefinition("wolf", 90.0, 11.0, 15.0);
        wolf.stats.evasion = 0.25;
        wolf.stats.critChance = 0.2;
        setup.enemyWaves.push_back({wolf, MakeDefinition("boar", 150.0, 8.0, 8.0)});
        return setup;
    };

    EngineConfig config;
    config.seed = 1234;
    auto first = SimulateBattle(makeSetup(), config);
    auto second = SimulateBattle(makeSetup(), config);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    EXPECT_EQ(first.value().events.Types(), second.value().events.Types());
    EXPECT_EQ(first.value().tick, second.value().tick);
    EXPECT_EQ(first.value().winner, second.value().winner);
    for (std::size_t i = 0; i < first.value().heroes.size(); ++i) {
        EXPECT_DOUBLE_EQ(first.value().heroes[i].stats.hp, second.value().heroes[i].stats.hp);
    }
}
