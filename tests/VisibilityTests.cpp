// tests/VisibilityTests.cpp
// Unit tests for team vision grids and snapshot filtering
//
// Covers:
// 1. Vision grid reveal, packing and change measurement.
// 2. Recompute from live units only.
// 3. Enemy units absent from a team's snapshot until a friendly unit gets in range.
// 4. Stealth concealment.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include "Config/MatchConfig.h"
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/UnitSystem.h"
#include "Game/VisibilityEngine.h"
#include "Protocol/ReplicationManager.h"

namespace {

bool Contains(const WorldSnapshot& snap, UnitId id) {
    return std::any_of(snap.units.begin(), snap.units.end(),
                       [id](const UnitSnapshot& u) { return u.id == id; });
}

}

/* ---------------------------------------------------------------- */
/* VisionGrid                                                         */
/* ---------------------------------------------------------------- */

TEST(VisionGridTests, RevealDisk_MarksCellsWithinRadius) {
    VisionGrid grid(10, 10, 1.0f);
    grid.RevealDisk(Vector3(5.5f, 5.5f, 0.0f), 1.0f);
    EXPECT_TRUE(grid.IsCellVisible(5, 5));
    EXPECT_TRUE(grid.IsCellVisible(6, 5));
    EXPECT_TRUE(grid.IsCellVisible(5, 4));
    EXPECT_FALSE(grid.IsCellVisible(7, 5));
    EXPECT_FALSE(grid.IsCellVisible(-1, 5)) << "outside the grid is never visible";
    EXPECT_TRUE(grid.IsVisible(Vector3(5.9f, 5.1f, 0.0f)));
    EXPECT_FALSE(grid.IsVisible(Vector3(100.0f, 5.0f, 0.0f)));
}

TEST(VisionGridTests, PackUnpack_PreservesCells) {
    VisionGrid grid(13, 7, 2.0f);
    grid.SetVisible(0, 0, true);
    grid.SetVisible(12, 6, true);
    grid.SetVisible(4, 3, true);

    auto bits = grid.Pack();
    EXPECT_EQ(bits.size(), (13u * 7u + 7u) / 8u);

    VisionGrid restored;
    ASSERT_TRUE(VisionGrid::Unpack(13, 7, 2.0f, bits, restored));
    EXPECT_EQ(restored, grid);
    EXPECT_EQ(restored.CountVisible(), 3u);

    bits.pop_back();
    EXPECT_FALSE(VisionGrid::Unpack(13, 7, 2.0f, bits, restored));
}

TEST(VisionGridTests, ChangedFraction) {
    VisionGrid a(10, 10, 1.0f);
    VisionGrid b(10, 10, 1.0f);
    EXPECT_FLOAT_EQ(a.ChangedFraction(b), 0.0f);
    b.SetVisible(1, 1, true);
    b.SetVisible(2, 2, true);
    EXPECT_FLOAT_EQ(a.ChangedFraction(b), 0.02f);
    EXPECT_FLOAT_EQ(a.ChangedFraction(VisionGrid(5, 5, 1.0f)), 1.0f);
}

/* ---------------------------------------------------------------- */
/* VisibilityEngine                                                   */
/* ---------------------------------------------------------------- */

class VisibilityTests : public ::testing::Test {
protected:
    void SetUp() override {
        settings.visionCellSize = 2.0f;
        visibility = std::make_unique<VisibilityEngine>(64.0f, 64.0f, settings.visionCellSize,
                                                        settings.stealthRevealRadius);
        units = std::make_unique<UnitSystem>(store, events, settings);
        units->SetVisibility(visibility.get());

        scout.name = "scout";
        scout.visionRange = 10.0f;
        scout.attackDamage = 0.0f;
        sentry = scout;
        sentry.name = "sentry";
        sentry.visionRange = 3.0f;
    }

    MatchSettings settings;
    EntityStore store;
    EventQueue events;
    std::unique_ptr<VisibilityEngine> visibility;
    std::unique_ptr<UnitSystem> units;
    UnitArchetype scout;
    UnitArchetype sentry;
};

TEST_F(VisibilityTests, Recompute_UsesLiveUnitsOnly) {
    UnitId a = store.SpawnUnit(TEAM_A, 1, scout, Vector3(10.0f, 10.0f, 0.0f));
    visibility->Recompute(store);
    EXPECT_TRUE(visibility->IsVisible(TEAM_A, Vector3(15.0f, 10.0f, 0.0f)));
    EXPECT_FALSE(visibility->IsVisible(TEAM_B, Vector3(10.0f, 10.0f, 0.0f)));

    store.FindUnit(a)->ApplyDamage(1000.0f);
    visibility->Recompute(store);
    EXPECT_EQ(visibility->GetGrid(TEAM_A).CountVisible(), 0u);
}

TEST_F(VisibilityTests, GridSizeFollowsMapAndCellSize) {
    const VisionGrid& grid = visibility->GetGrid(TEAM_A);
    EXPECT_EQ(grid.GetWidth(), 32);
    EXPECT_EQ(grid.GetHeight(), 32);
    EXPECT_FLOAT_EQ(grid.GetCellSize(), 2.0f);
    EXPECT_EQ(visibility->GetGrid(TEAM_NONE).CountVisible(), 0u);
}

TEST_F(VisibilityTests, EnemyOutOfRange_AbsentUntilFriendlyApproaches) {
    UnitId friendly = store.SpawnUnit(TEAM_A, 1, scout, Vector3(10.0f, 40.0f, 0.0f));
    UnitId enemy = store.SpawnUnit(TEAM_B, 2, sentry, Vector3(40.0f, 40.0f, 0.0f));
    visibility->Recompute(store);

    auto snap = ReplicationManager::BuildSnapshot(store, *visibility, TEAM_A, 0);
    EXPECT_TRUE(Contains(snap, friendly));
    EXPECT_FALSE(Contains(snap, enemy)) << "enemy outside every vision radius leaked";

    // The enemy's own team always sees it
    EXPECT_TRUE(Contains(ReplicationManager::BuildSnapshot(store, *visibility, TEAM_B, 0), enemy));

    ASSERT_EQ(units->OrderMove(friendly, Vector3(34.0f, 40.0f, 0.0f)), OrderResult::Accepted);

    bool appeared = false;
    for (uint32_t tick = 1; tick < 200 && !appeared; ++tick) {
        units->Update(0.1f, tick);
        visibility->Recompute(store);
        events.Drain();

        snap = ReplicationManager::BuildSnapshot(store, *visibility, TEAM_A, tick);
        const float dist = store.FindUnit(friendly)->GetPosition().Distance2D(
            store.FindUnit(enemy)->GetPosition());
        appeared = Contains(snap, enemy);
        if (dist <= scout.visionRange) {
            EXPECT_TRUE(appeared) << "enemy in range but missing at tick " << tick;
        } else if (dist > scout.visionRange + 2.0f * settings.visionCellSize) {
            EXPECT_FALSE(appeared) << "enemy far out of range visible at tick " << tick;
        }
    }
    EXPECT_TRUE(appeared);
}

TEST_F(VisibilityTests, StealthedEnemy_HiddenUntilRevealed) {
    store.SpawnUnit(TEAM_A, 1, scout, Vector3(10.0f, 10.0f, 0.0f));
    UnitId spy = store.SpawnUnit(TEAM_B, 2, sentry, Vector3(17.0f, 10.0f, 0.0f));
    store.FindUnit(spy)->SetStealth(5.0f);
    visibility->Recompute(store);

    const Unit& spyUnit = *store.FindUnit(spy);
    EXPECT_TRUE(visibility->IsVisible(TEAM_A, spyUnit.GetPosition()));
    EXPECT_FALSE(visibility->CanObserve(store, TEAM_A, spyUnit));
    EXPECT_TRUE(visibility->CanObserve(store, TEAM_B, spyUnit));

    store.SpawnUnit(TEAM_A, 1, sentry, Vector3(15.0f, 10.0f, 0.0f));
    visibility->Recompute(store);
    EXPECT_TRUE(visibility->CanObserve(store, TEAM_A, spyUnit));
}

TEST_F(VisibilityTests, DeadEnemyNotInSnapshot_OwnDeadUnitIs) {
    store.SpawnUnit(TEAM_A, 1, scout, Vector3(10.0f, 10.0f, 0.0f));
    UnitId enemy = store.SpawnUnit(TEAM_B, 2, sentry, Vector3(12.0f, 10.0f, 0.0f));
    visibility->Recompute(store);
    ASSERT_TRUE(Contains(ReplicationManager::BuildSnapshot(store, *visibility, TEAM_A, 0), enemy));

    store.FindUnit(enemy)->ApplyDamage(1000.0f);
    visibility->Recompute(store);
    EXPECT_FALSE(Contains(ReplicationManager::BuildSnapshot(store, *visibility, TEAM_A, 1), enemy));
    EXPECT_TRUE(Contains(ReplicationManager::BuildSnapshot(store, *visibility, TEAM_B, 1), enemy));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
