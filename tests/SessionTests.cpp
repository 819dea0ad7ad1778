// tests/SessionTests.cpp
// Unit tests for session lifecycle, team assignment and match state
//
// Covers:
// 1. Host/join, duplicate connections and a single host.
// 2. Team assignment with a cap of two players per team.
// 3. Ready flags and match start preconditions.
// 4. Teammate links and disconnect notifications.
// 5. Match end returns everyone to Connected.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <vector>
#include "Game/GameEvents.h"
#include "Game/SessionManager.h"

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace {

std::vector<GameEvent> OfType(const std::vector<GameEvent>& events, GameEventType type) {
    std::vector<GameEvent> out;
    for (const auto& e : events) {
        if (e.type == type) out.push_back(e);
    }
    return out;
}

}

class SessionTests : public ::testing::Test {
protected:
    void SetUp() override {
        sessions = std::make_unique<SessionManager>(events);
    }

    void StartTwoPlayerMatch() {
        ASSERT_EQ(sessions->Host(1, "alpha"), SessionResult::Ok);
        ASSERT_EQ(sessions->Join(2, "bravo"), SessionResult::Ok);
        ASSERT_EQ(sessions->SetReady(1, true), SessionResult::Ok);
        ASSERT_EQ(sessions->SetReady(2, true), SessionResult::Ok);
        ASSERT_EQ(sessions->StartMatch(10, "abc"), SessionResult::Ok);
        events.Drain();
    }

    EventQueue events;
    std::unique_ptr<SessionManager> sessions;
};

/* ---------------------------------------------------------------- */
/* Lobby                                                              */
/* ---------------------------------------------------------------- */

TEST_F(SessionTests, HostThenJoin_BothConnected) {
    EXPECT_EQ(sessions->GetState(1), SessionState::Offline);
    ASSERT_EQ(sessions->Host(1, "alpha"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(2, "bravo"), SessionResult::Ok);

    const PlayerSession* host = sessions->Find(1);
    ASSERT_NE(host, nullptr);
    EXPECT_TRUE(host->isHost);
    EXPECT_EQ(host->state, SessionState::Connected);
    EXPECT_EQ(host->name, "alpha");
    EXPECT_EQ(host->token.size(), 32u) << "16 random bytes as hex";
    EXPECT_NE(host->token, sessions->Find(2)->token);
    EXPECT_FALSE(sessions->Find(2)->isHost);
    EXPECT_EQ(sessions->PlayerCount(), 2u);
}

TEST_F(SessionTests, SecondHostAndDuplicateConnection_Refused) {
    ASSERT_EQ(sessions->Host(1, "alpha"), SessionResult::Ok);
    EXPECT_EQ(sessions->Host(2, "bravo"), SessionResult::AlreadyHosted);
    EXPECT_EQ(sessions->Join(1, "again"), SessionResult::AlreadyConnected);
    EXPECT_EQ(sessions->Join(kInvalidConnection, "nobody"), SessionResult::UnknownConnection);
    EXPECT_EQ(sessions->PlayerCount(), 1u);
}

TEST_F(SessionTests, EmptyName_GetsPlaceholder) {
    ASSERT_EQ(sessions->Join(7, ""), SessionResult::Ok);
    EXPECT_EQ(sessions->Find(7)->name, "Player7");
}

TEST_F(SessionTests, TeamAssignment_BalancesAndCapsAtTwo) {
    ASSERT_EQ(sessions->Host(1, "a"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(2, "b"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(3, "c"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(4, "d"), SessionResult::Ok);
    EXPECT_EQ(sessions->GetTeam(1), TEAM_A);
    EXPECT_EQ(sessions->GetTeam(3), TEAM_A) << "even teams break ties toward A";
    EXPECT_EQ(sessions->GetTeam(2), TEAM_B);
    EXPECT_EQ(sessions->GetTeamMembers(TEAM_A).size(), 2u);
    EXPECT_EQ(sessions->GetTeamMembers(TEAM_B).size(), 2u);

    EXPECT_EQ(sessions->Join(5, "e"), SessionResult::LobbyFull);
    EXPECT_EQ(sessions->GetState(5), SessionState::Offline);
}

TEST_F(SessionTests, PreferredTeam_HonouredWhileOpen) {
    ASSERT_EQ(sessions->Join(1, "a", TEAM_B), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(2, "b", TEAM_B), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(3, "c", TEAM_B), SessionResult::Ok);
    EXPECT_EQ(sessions->GetTeam(1), TEAM_B);
    EXPECT_EQ(sessions->GetTeam(2), TEAM_B);
    EXPECT_EQ(sessions->GetTeam(3), TEAM_A) << "full team must overflow to the other";
}

TEST_F(SessionTests, Teammates_LinkedBothWays) {
    ASSERT_EQ(sessions->Join(1, "a", TEAM_A), SessionResult::Ok);
    EXPECT_EQ(sessions->Find(1)->teammate, kInvalidConnection);
    ASSERT_EQ(sessions->Join(3, "c", TEAM_A), SessionResult::Ok);
    EXPECT_EQ(sessions->Find(1)->teammate, 3u);
    EXPECT_EQ(sessions->Find(3)->teammate, 1u);
}

/* ---------------------------------------------------------------- */
/* Ready & start                                                      */
/* ---------------------------------------------------------------- */

TEST_F(SessionTests, StartRequiresBothTeamsReady) {
    ASSERT_EQ(sessions->Host(1, "a"), SessionResult::Ok);
    EXPECT_EQ(sessions->CanStartMatch(), SessionResult::TeamEmpty);

    ASSERT_EQ(sessions->Join(2, "b"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(3, "c"), SessionResult::Ok);
    EXPECT_EQ(sessions->CanStartMatch(), SessionResult::TeamsNotReady);

    sessions->SetReady(1, true);
    sessions->SetReady(2, true);
    EXPECT_TRUE(sessions->IsTeamReady(TEAM_B));
    EXPECT_FALSE(sessions->IsTeamReady(TEAM_A)) << "player 3 has not signalled ready";
    EXPECT_EQ(sessions->StartMatch(0, "x"), SessionResult::TeamsNotReady);
    EXPECT_FALSE(sessions->IsMatchRunning());

    sessions->SetReady(3, true);
    EXPECT_EQ(sessions->CanStartMatch(), SessionResult::Ok);
    EXPECT_EQ(sessions->SetReady(99, true), SessionResult::UnknownConnection);
}

TEST_F(SessionTests, StartMatch_MovesEveryoneInMatch) {
    ASSERT_EQ(sessions->Host(1, "alpha"), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(2, "bravo"), SessionResult::Ok);
    sessions->SetReady(1, true);
    sessions->SetReady(2, true);
    ASSERT_EQ(sessions->StartMatch(42, "digest"), SessionResult::Ok);

    EXPECT_TRUE(sessions->IsMatchRunning());
    EXPECT_TRUE(sessions->IsInMatch(1));
    EXPECT_TRUE(sessions->IsInMatch(2));
    EXPECT_THAT(sessions->GetMatchParticipants(), UnorderedElementsAre(1u, 2u));

    auto started = OfType(events.Drain(), GameEventType::MatchStarted);
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].tick, 42u);
    EXPECT_EQ(started[0].detail, "digest");

    EXPECT_EQ(sessions->StartMatch(43, "digest"), SessionResult::MatchInProgress);
    EXPECT_EQ(sessions->Join(3, "late"), SessionResult::MatchInProgress);
    EXPECT_EQ(sessions->SetReady(1, false), SessionResult::MatchInProgress);
}

TEST_F(SessionTests, EndMatch_ReturnsToConnectedAndClearsReady) {
    StartTwoPlayerMatch();
    ASSERT_EQ(sessions->EndMatch(TEAM_B, "Perimeter", 99), SessionResult::Ok);

    EXPECT_FALSE(sessions->IsMatchRunning());
    EXPECT_EQ(sessions->GetState(1), SessionState::Connected);
    EXPECT_FALSE(sessions->Find(1)->ready);
    EXPECT_TRUE(sessions->GetMatchParticipants().empty());

    auto ended = OfType(events.Drain(), GameEventType::MatchEnded);
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0].team, TEAM_B);
    EXPECT_EQ(ended[0].detail, "Perimeter");
    EXPECT_EQ(sessions->EndMatch(TEAM_A, "again", 100), SessionResult::NoMatchRunning);
}

/* ---------------------------------------------------------------- */
/* Disconnect                                                         */
/* ---------------------------------------------------------------- */

TEST_F(SessionTests, DisconnectMidMatch_OpponentWins) {
    StartTwoPlayerMatch();
    DisconnectOutcome out = sessions->Disconnect(2, 50);
    EXPECT_TRUE(out.known);
    EXPECT_TRUE(out.endedMatch);
    EXPECT_EQ(out.team, TEAM_B);
    EXPECT_EQ(out.winner, TEAM_A);

    auto ended = OfType(events.Drain(), GameEventType::MatchEnded);
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0].team, TEAM_A);
    EXPECT_EQ(sessions->GetState(1), SessionState::Connected);
    EXPECT_EQ(sessions->GetState(2), SessionState::Offline);
    EXPECT_EQ(sessions->PlayerCount(), 1u);
}

TEST_F(SessionTests, DisconnectInLobby_NotifiesTeammateOnly) {
    ASSERT_EQ(sessions->Join(1, "a", TEAM_A), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(2, "b", TEAM_A), SessionResult::Ok);
    ASSERT_EQ(sessions->Join(3, "c", TEAM_B), SessionResult::Ok);
    events.Drain();

    DisconnectOutcome out = sessions->Disconnect(2, 5);
    EXPECT_FALSE(out.endedMatch);
    EXPECT_EQ(out.formerTeammate, 1u);
    EXPECT_EQ(sessions->Find(1)->teammate, kInvalidConnection);

    auto drained = events.Drain();
    auto left = OfType(drained, GameEventType::TeammateLeft);
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].recipient, 1u);
    EXPECT_TRUE(OfType(drained, GameEventType::MatchEnded).empty());
    EXPECT_THAT(sessions->GetConnections(), ElementsAre(1u, 3u));
}

TEST_F(SessionTests, DisconnectUnknown_NoEffect) {
    DisconnectOutcome out = sessions->Disconnect(12, 0);
    EXPECT_FALSE(out.known);
    EXPECT_EQ(events.Pending(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
