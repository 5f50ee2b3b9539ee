#include <gtest/gtest.h>

#include <vector>

#include "gbe/battle/wave_controller.hpp"
#include "support/battle_test_support.hpp"

using namespace gbe::battle;
using namespace gbe::battle::testing;

// ═══════════════════════════════════════════════════════════════════════════
// Formation slots
// ═══════════════════════════════════════════════════════════════════════════

TEST(FormationSlotTest, HeroesFillTwoColumnsFromRowTwo) {
    EXPECT_EQ(WaveController::HeroSlot(0, 8, 8), (GridPosition{2, 0}));
    EXPECT_EQ(WaveController::HeroSlot(1, 8, 8), (GridPosition{2, 1}));
    EXPECT_EQ(WaveController::HeroSlot(2, 8, 8), (GridPosition{3, 0}));
    EXPECT_EQ(WaveController::HeroSlot(11, 8, 8), (GridPosition{7, 1}));
}

TEST(FormationSlotTest, OverflowWrapsToTopRows) {
    EXPECT_EQ(WaveController::HeroSlot(12, 8, 8), (GridPosition{0, 0}));
    EXPECT_EQ(WaveController::HeroSlot(13, 8, 8), (GridPosition{0, 1}));
    EXPECT_EQ(WaveController::HeroSlot(14, 8, 8), (GridPosition{1, 0}));
    EXPECT_EQ(WaveController::HeroSlot(4, 4, 4), (GridPosition{0, 0}));
}

TEST(FormationSlotTest, EnemiesMirrorOnRightEdge) {
    EXPECT_EQ(WaveController::EnemySlot(0, 8, 8), (GridPosition{2, 7}));
    EXPECT_EQ(WaveController::EnemySlot(1, 8, 8), (GridPosition{2, 6}));
    EXPECT_EQ(WaveController::EnemySlot(2, 6, 8), (GridPosition{3, 5}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Hero shifts
// ═══════════════════════════════════════════════════════════════════════════

TEST(HeroShiftTest, ScrollsTowardLeftEdgeWithoutCollisions) {
    BattleUnit a;
    a.position = {2, 3};
    BattleUnit b;
    b.position = {2, 4};
    BattleUnit c;
    c.position = {3, 1};

    auto shifted = WaveController::ComputeHeroShifts({&b, &a, &c}, 2);
    ASSERT_EQ(shifted.size(), 3u);
    EXPECT_EQ(shifted[0], (GridPosition{2, 1}));
    EXPECT_EQ(shifted[1], (GridPosition{2, 0}));
    EXPECT_EQ(shifted[2], (GridPosition{3, 0}));
}

TEST(HeroShiftTest, EdgeUnitsStayPut) {
    BattleUnit a;
    a.position = {4, 0};
    auto shifted = WaveController::ComputeHeroShifts({&a}, 2);
    EXPECT_EQ(shifted[0], (GridPosition{4, 0}));
}

TEST(HeroShiftTest, ScrollIsBoundedByDistance) {
    BattleUnit a;
    a.position = {1, 7};
    auto shifted = WaveController::ComputeHeroShifts({&a}, 2);
    EXPECT_EQ(shifted[0], (GridPosition{1, 4}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Deployment and transitions
// ═══════════════════════════════════════════════════════════════════════════

class WaveControllerTest : public ::testing::Test {
protected:
    static std::vector<UnitDefinition> Wave(const std::string& prefix, int count) {
        std::vector<UnitDefinition> wave;
        for (int i = 0; i < count; ++i) {
            wave.push_back(MakeDefinition(prefix + std::to_string(i)));
        }
        return wave;
    }

    void KillWave(int32_t wave) {
        for (auto& enemy : harness.state.enemies) {
            if (enemy.wave == wave && enemy.isAlive) {
                harness.ctx.Kill(enemy, std::nullopt);
            }
        }
    }

    BattleHarness harness;
};

TEST_F(WaveControllerTest, DeployPlacesFormation) {
    WaveController waves(harness.ctx, {Wave("w1_", 2), Wave("w2_", 1)});
    waves.DeployInitialRosters({MakeDefinition("knight"), MakeDefinition("archer")});

    const auto& state = harness.state;
    ASSERT_EQ(state.heroes.size(), 2u);
    ASSERT_EQ(state.enemies.size(), 2u);
    EXPECT_EQ(state.heroes[0].position, (GridPosition{2, 0}));
    EXPECT_EQ(state.heroes[1].position, (GridPosition{2, 1}));
    EXPECT_EQ(state.enemies[0].position, (GridPosition{2, 7}));
    EXPECT_EQ(state.enemies[1].position, (GridPosition{2, 6}));
    EXPECT_EQ(harness.grid.Size(), 4u);

    EXPECT_EQ(state.totalWaves, 2);
    EXPECT_EQ(state.currentWave, 1);
    EXPECT_EQ(state.remainingEnemyWaves, 1);
    EXPECT_TRUE(state.events.Empty());
}

TEST_F(WaveControllerTest, ExplicitPositionWinsOverSlot) {
    WaveController waves(harness.ctx, {Wave("e", 1)});
    auto pinned = MakePlacedDefinition("pinned", {2, 0});
    waves.DeployInitialRosters({MakeDefinition("slotted"), pinned});

    EXPECT_EQ(harness.state.heroes[1].position, (GridPosition{2, 0}));
    EXPECT_EQ(harness.state.heroes[0].position, (GridPosition{1, 0}));
    EXPECT_EQ(harness.grid.OccupantAt({2, 0}), "pinned");
}

TEST_F(WaveControllerTest, TransitionShiftsHeroesAndSpawnsNextWave) {
    WaveController waves(harness.ctx, {Wave("a", 1), Wave("b", 2), Wave("c", 1)});
    waves.DeployInitialRosters({MakeDefinition("knight")});

    auto& knight = harness.state.heroes[0];
    ASSERT_TRUE(harness.grid.Move("knight", knight.position, {3, 5}));
    knight.position = {3, 5};
    KillWave(1);
    const auto eventsBefore = harness.state.events.Size();

    EXPECT_EQ(waves.OnEnemiesCleared(), WaveOutcome::NextWaveStarted);

    const auto& log = harness.state.events.Events();
    ASSERT_EQ(log.size(), eventsBefore + 2);

    const auto* transition = log[eventsBefore].As<WaveTransitionEvent>();
    ASSERT_NE(transition, nullptr);
    EXPECT_EQ(transition->fromWave, 1);
    EXPECT_EQ(transition->toWave, 2);
    EXPECT_EQ(transition->scrollDistance, 2);
    ASSERT_EQ(transition->heroShifts.size(), 1u);
    EXPECT_EQ(transition->heroShifts[0].from, (GridPosition{3, 5}));
    EXPECT_EQ(transition->heroShifts[0].to, (GridPosition{3, 2}));
    EXPECT_EQ(knight.position, (GridPosition{3, 2}));
    EXPECT_EQ(harness.grid.OccupantAt({3, 2}), "knight");

    const auto* start = log[eventsBefore + 1].As<WaveStartEvent>();
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->waveNumber, 2);
    EXPECT_EQ(start->totalWaves, 3);
    ASSERT_EQ(start->spawns.size(), 2u);
    EXPECT_EQ(start->spawns[0].animationFrom, (GridPosition{2, 8}));
    EXPECT_EQ(start->spawns[0].position, (GridPosition{2, 7}));

    const auto& state = harness.state;
    EXPECT_EQ(state.currentWave, 2);
    EXPECT_EQ(state.remainingEnemyWaves, 1);
    EXPECT_TRUE(state.transitionInProgress);
    ASSERT_EQ(state.enemies.size(), 3u);
    EXPECT_EQ(state.enemies[1].wave, 2);
    EXPECT_TRUE(state.enemies[1].isAlive);
}

TEST_F(WaveControllerTest, WaveCompleteOnlyBeforeFinalWaveOfThree) {
    WaveController waves(harness.ctx, {Wave("a", 1), Wave("b", 1), Wave("c", 1)});
    waves.DeployInitialRosters({MakeDefinition("knight")});

    KillWave(1);
    waves.OnEnemiesCleared();
    EXPECT_EQ(harness.state.events.Count(EventType::WaveComplete), 0u);

    KillWave(2);
    waves.OnEnemiesCleared();
    auto completes = harness.state.events.OfType(EventType::WaveComplete);
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0].As<WaveCompleteEvent>()->waveNumber, 2);
    EXPECT_EQ(completes[0].As<WaveCompleteEvent>()->totalWaves, 3);

    KillWave(3);
    const auto eventsBefore = harness.state.events.Size();
    EXPECT_EQ(waves.OnEnemiesCleared(), WaveOutcome::AllWavesCleared);
    EXPECT_EQ(harness.state.events.Size(), eventsBefore);
    EXPECT_EQ(harness.state.remainingEnemyWaves, 0);
}

TEST_F(WaveControllerTest, AnnouncementPolicy) {
    WaveController four(harness.ctx, {Wave("a", 1), Wave("b", 1), Wave("c", 1), Wave("d", 1)});
    EXPECT_FALSE(four.ShouldAnnounceWaveComplete(1));
    EXPECT_FALSE(four.ShouldAnnounceWaveComplete(2));
    EXPECT_TRUE(four.ShouldAnnounceWaveComplete(3));

    std::vector<std::vector<UnitDefinition>> sevenWaves(7, Wave("x", 1));
    WaveController seven(harness.ctx, sevenWaves);
    EXPECT_TRUE(seven.ShouldAnnounceWaveComplete(3));
    EXPECT_FALSE(seven.ShouldAnnounceWaveComplete(4));
    EXPECT_TRUE(seven.ShouldAnnounceWaveComplete(6));
}

TEST_F(WaveControllerTest, SpawnAvoidsOccupiedSlot) {
    WaveController waves(harness.ctx, {Wave("a", 1), Wave("b", 1)});
    waves.DeployInitialRosters({MakeDefinition("knight")});
    KillWave(1);

    // Something else already holds the first enemy slot.
    ASSERT_TRUE(harness.grid.Occupy({2, 7}, "statue"));

    waves.OnEnemiesCleared();
    const auto& spawned = harness.state.enemies.back();
    EXPECT_TRUE(spawned.isAlive);
    EXPECT_NE(spawned.position, (GridPosition{2, 7}));
    EXPECT_EQ(harness.grid.OccupantAt(spawned.position), spawned.id);
}
