// tests/CommandTests.cpp
// Unit tests for command validation, rate limiting and application
//
// Covers:
// 1. Session gate and selection shape checks.
// 2. Token bucket rate limiting.
// 3. Ownership and liveness checks at apply time.
// 4. Formation slot layout.
// 5. Command and layout name parsing.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <vector>
#include "Config/MatchConfig.h"
#include "Game/Command.h"
#include "Game/CommandPipeline.h"
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/SessionManager.h"
#include "Game/UnitSystem.h"

namespace {

constexpr ConnectionId kHost = 1;
constexpr ConnectionId kGuest = 2;

Command MakeMove(std::vector<UnitId> units, float x, float y) {
    Command cmd;
    cmd.type = CommandType::Move;
    cmd.units = std::move(units);
    cmd.position = Vector3(x, y, 0.0f);
    return cmd;
}

Command MakeStop(UnitId unit) {
    Command cmd;
    cmd.type = CommandType::Stop;
    cmd.units = {unit};
    return cmd;
}

std::vector<GameEvent> Rejections(const std::vector<GameEvent>& events) {
    std::vector<GameEvent> out;
    std::copy_if(events.begin(), events.end(), std::back_inserter(out),
                 [](const GameEvent& e) { return e.type == GameEventType::CommandRejected; });
    return out;
}

}

class CommandTests : public ::testing::Test {
protected:
    void SetUp() override {
        settings.commandBurst = 20;
        settings.commandRateLimit = 10.0f;
        settings.maxUnitsPerCommand = 8;

        sessions = std::make_unique<SessionManager>(events);
        units = std::make_unique<UnitSystem>(store, events, settings);
        pipeline = std::make_unique<CommandPipeline>(store, *units, *sessions, events, settings);

        ASSERT_EQ(sessions->Host(kHost, "alpha", TEAM_A), SessionResult::Ok);
        ASSERT_EQ(sessions->Join(kGuest, "bravo", TEAM_B), SessionResult::Ok);
        sessions->SetReady(kHost, true);
        sessions->SetReady(kGuest, true);
        ASSERT_EQ(sessions->StartMatch(0, "digest"), SessionResult::Ok);

        trooper.name = "trooper";
        trooper.visionRange = 2.0f;
        for (int i = 0; i < 4; ++i) {
            mine.push_back(store.SpawnUnit(TEAM_A, kHost, trooper, Vector3(10.0f + i, 10.0f, 0.0f)));
        }
        theirs = store.SpawnUnit(TEAM_B, kGuest, trooper, Vector3(50.0f, 50.0f, 0.0f));
        events.Drain();
    }

    MatchSettings settings;
    EntityStore store;
    EventQueue events;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<UnitSystem> units;
    std::unique_ptr<CommandPipeline> pipeline;
    UnitArchetype trooper;
    std::vector<UnitId> mine;
    UnitId theirs = kInvalidUnit;
};

/* ---------------------------------------------------------------- */
/* Submission checks                                                  */
/* ---------------------------------------------------------------- */

TEST_F(CommandTests, AcceptedMove_AppliedOnNextApply) {
    ASSERT_TRUE(pipeline->Submit(kHost, MakeMove({mine[0]}, 20.0f, 10.0f)));
    EXPECT_EQ(store.FindUnit(mine[0])->GetState(), UnitState::Idle) << "applied before ApplyPending";
    EXPECT_EQ(pipeline->PendingCount(), 1u);

    EXPECT_EQ(pipeline->ApplyPending(1), 1u);
    EXPECT_EQ(store.FindUnit(mine[0])->GetState(), UnitState::Moving);
    EXPECT_TRUE(Rejections(events.Drain()).empty());
}

TEST_F(CommandTests, NotInMatch_Rejected) {
    EXPECT_FALSE(pipeline->Submit(77, MakeStop(mine[0])));
    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].recipient, 77u);
    EXPECT_EQ(rejected[0].detail, "not in match");
}

TEST_F(CommandTests, EmptyAndOversizedSelections_Rejected) {
    Command empty;
    empty.type = CommandType::Stop;
    EXPECT_FALSE(pipeline->Submit(kHost, empty));

    std::vector<UnitId> many(9, mine[0]);
    EXPECT_FALSE(pipeline->Submit(kHost, MakeMove(many, 1.0f, 1.0f)));

    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 2u);
    EXPECT_EQ(rejected[0].detail, "no units selected");
    EXPECT_EQ(rejected[1].detail, "too many units");
    EXPECT_EQ(pipeline->PendingCount(), 0u);
}

TEST_F(CommandTests, RateLimit_BurstThenRefill) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pipeline->Submit(kHost, MakeStop(mine[0]))) << "command " << i;
    }
    EXPECT_FALSE(pipeline->Submit(kHost, MakeStop(mine[0])));
    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].detail, "rate limited");

    // The other player has an independent bucket
    EXPECT_TRUE(pipeline->Submit(kGuest, MakeStop(theirs)));

    pipeline->AdvanceClock(0.5);
    EXPECT_NEAR(pipeline->GetAvailableTokens(kHost), 5.0, 1e-6);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(pipeline->Submit(kHost, MakeStop(mine[0])));
    }
    EXPECT_FALSE(pipeline->Submit(kHost, MakeStop(mine[0])));

    pipeline->AdvanceClock(100.0);
    EXPECT_NEAR(pipeline->GetAvailableTokens(kHost), 20.0, 1e-6) << "refill must cap at the burst size";
}

/* ---------------------------------------------------------------- */
/* Apply-time checks                                                  */
/* ---------------------------------------------------------------- */

TEST_F(CommandTests, ForeignUnit_RejectedAsNotOwned) {
    ASSERT_TRUE(pipeline->Submit(kGuest, MakeMove({mine[0]}, 30.0f, 30.0f)));
    EXPECT_EQ(pipeline->ApplyPending(1), 0u);
    EXPECT_EQ(store.FindUnit(mine[0])->GetState(), UnitState::Idle);

    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].recipient, kGuest);
    EXPECT_EQ(rejected[0].detail, "unit not owned");
}

TEST_F(CommandTests, MixedSelection_AppliesToOwnedUnitsOnly) {
    ASSERT_TRUE(pipeline->Submit(kHost, MakeMove({mine[0], theirs, 999}, 30.0f, 10.0f)));
    EXPECT_EQ(pipeline->ApplyPending(1), 1u);
    EXPECT_EQ(store.FindUnit(mine[0])->GetState(), UnitState::Moving);
    EXPECT_EQ(store.FindUnit(theirs)->GetState(), UnitState::Idle);
    EXPECT_TRUE(Rejections(events.Drain()).empty());
}

TEST_F(CommandTests, TargetInvalidBeforeApply_DroppedNotRetried) {
    store.FindUnit(theirs)->SetPosition(Vector3(11.0f, 11.0f, 0.0f));
    Command attack;
    attack.type = CommandType::Attack;
    attack.units = {mine[0]};
    attack.targetUnit = theirs;
    ASSERT_TRUE(pipeline->Submit(kHost, attack));

    store.FindUnit(theirs)->ApplyDamage(1000.0f);
    EXPECT_EQ(pipeline->ApplyPending(1), 0u);
    EXPECT_EQ(pipeline->PendingCount(), 0u);

    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].detail, "invalid target");
    EXPECT_EQ(pipeline->ApplyPending(2), 0u);
    EXPECT_TRUE(Rejections(events.Drain()).empty());
}

TEST_F(CommandTests, DeadUnit_RejectedAsNotAlive) {
    store.FindUnit(mine[1])->ApplyDamage(1000.0f);
    ASSERT_TRUE(pipeline->Submit(kHost, MakeMove({mine[1]}, 30.0f, 10.0f)));
    pipeline->ApplyPending(1);
    auto rejected = Rejections(events.Drain());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].detail, "unit not alive");
}

TEST_F(CommandTests, RemoveConnection_DropsQueuedCommands) {
    ASSERT_TRUE(pipeline->Submit(kHost, MakeMove({mine[0]}, 30.0f, 10.0f)));
    ASSERT_TRUE(pipeline->Submit(kGuest, MakeMove({theirs}, 30.0f, 40.0f)));
    pipeline->RemoveConnection(kHost);
    EXPECT_EQ(pipeline->PendingCount(), 1u);
    EXPECT_EQ(pipeline->ApplyPending(1), 1u);
    EXPECT_EQ(store.FindUnit(mine[0])->GetState(), UnitState::Idle);
}

/* ---------------------------------------------------------------- */
/* Formations                                                         */
/* ---------------------------------------------------------------- */

TEST_F(CommandTests, Formation_GivesEachUnitADistinctSlot) {
    Command formation;
    formation.type = CommandType::Formation;
    formation.units = mine;
    formation.layout = FormationLayout::Box;
    formation.position = Vector3(30.0f, 30.0f, 0.0f);
    formation.spacing = 3.0f;
    ASSERT_TRUE(pipeline->Submit(kHost, formation));
    EXPECT_EQ(pipeline->ApplyPending(1), 1u);

    std::set<std::pair<int, int>> goals;
    Vector3 centroid;
    for (UnitId id : mine) {
        const Unit* u = store.FindUnit(id);
        EXPECT_EQ(u->GetState(), UnitState::Moving);
        Vector3 g = u->GetMoveGoal();
        centroid += g;
        goals.insert({static_cast<int>(std::lround(g.x * 10)), static_cast<int>(std::lround(g.y * 10))});
    }
    EXPECT_EQ(goals.size(), mine.size());
    centroid = centroid / static_cast<float>(mine.size());
    EXPECT_NEAR(centroid.x, 30.0f, 1e-3f);
    EXPECT_NEAR(centroid.y, 30.0f, 1e-3f);
}

TEST(FormationSlotTests, LineIsCenteredAndEvenlySpaced) {
    auto slots = ComputeFormationSlots(FormationLayout::Line, Vector3(10.0f, 10.0f, 0.0f), 0.0f, 3, 2.0f);
    ASSERT_EQ(slots.size(), 3u);
    EXPECT_EQ(slots[1], Vector3(10.0f, 10.0f, 0.0f));
    EXPECT_NEAR(slots[0].Distance2D(slots[1]), 2.0f, 1e-4f);
    EXPECT_NEAR(slots[2].Distance2D(slots[1]), 2.0f, 1e-4f);
    // Facing +x, the line runs along y
    EXPECT_NEAR(slots[0].x, 10.0f, 1e-4f);
}

TEST(FormationSlotTests, WedgeLeaderAtTip) {
    auto slots = ComputeFormationSlots(FormationLayout::Wedge, Vector3(5.0f, 5.0f, 0.0f), 0.0f, 5, 1.0f);
    ASSERT_EQ(slots.size(), 5u);
    EXPECT_EQ(slots[0], Vector3(5.0f, 5.0f, 0.0f));
    for (size_t i = 1; i < slots.size(); ++i) {
        EXPECT_LT(slots[i].x, slots[0].x) << "slot " << i << " ahead of the leader";
    }
    EXPECT_TRUE(ComputeFormationSlots(FormationLayout::Column, Vector3(), 0.0f, 0, 1.0f).empty());
}

TEST(CommandNameTests, ParsesTypesAndLayouts) {
    EXPECT_EQ(ParseCommandType(" Move "), CommandType::Move);
    EXPECT_EQ(ParseCommandType("ability"), CommandType::UseAbility);
    EXPECT_EQ(ParseCommandType("useAbility"), CommandType::UseAbility);
    EXPECT_FALSE(ParseCommandType("dance").has_value());
    EXPECT_EQ(ParseFormationLayout("WEDGE"), FormationLayout::Wedge);
    EXPECT_FALSE(ParseFormationLayout("circle").has_value());
    EXPECT_STREQ(ToString(CommandType::Formation), "formation");
    EXPECT_STREQ(ToString(RejectReason::RateLimited), "rate limited");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
