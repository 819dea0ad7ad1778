// src/Game/SessionManager.h – Connection lifecycle, teams and match state

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Game/GameEvents.h"
#include "Game/GameTypes.h"

enum class SessionState {
    Offline,
    Hosting,
    Joining,
    Connected,
    InMatch
};

enum class SessionResult {
    Ok,
    AlreadyConnected,
    AlreadyHosted,
    LobbyFull,
    UnknownConnection,
    MatchInProgress,
    NoMatchRunning,
    TeamEmpty,
    TeamsNotReady
};

const char* ToString(SessionState state);
const char* ToString(SessionResult result);

struct PlayerSession {
    ConnectionId connection = kInvalidConnection;
    std::string  name;
    TeamId       team = TEAM_NONE;
    bool         ready = false;
    bool         isHost = false;
    ConnectionId teammate = kInvalidConnection;
    SessionState state = SessionState::Offline;
    std::string  token;
};

struct DisconnectOutcome {
    bool         known = false;
    bool         endedMatch = false;
    TeamId       team = TEAM_NONE;
    TeamId       winner = TEAM_NONE;
    ConnectionId formerTeammate = kInvalidConnection;
};

class SessionManager {
public:
    explicit SessionManager(EventQueue& events);
    ~SessionManager();

    // Lobby
    SessionResult Host(ConnectionId conn, const std::string& name,
                       TeamId preferredTeam = TEAM_NONE);
    SessionResult Join(ConnectionId conn, const std::string& name,
                       TeamId preferredTeam = TEAM_NONE);
    SessionResult SetReady(ConnectionId conn, bool ready);

    bool IsTeamReady(TeamId team) const;
    // Both teams populated and every member ready
    SessionResult CanStartMatch() const;

    // Match lifecycle
    SessionResult StartMatch(uint32_t tick, const std::string& mapDigest);
    SessionResult EndMatch(TeamId winner, const std::string& reason, uint32_t tick);
    bool IsMatchRunning() const { return m_matchRunning; }

    DisconnectOutcome Disconnect(ConnectionId conn, uint32_t tick);

    // Queries
    const PlayerSession* Find(ConnectionId conn) const;
    SessionState GetState(ConnectionId conn) const;
    bool   IsInMatch(ConnectionId conn) const;
    TeamId GetTeam(ConnectionId conn) const;
    std::vector<ConnectionId> GetTeamMembers(TeamId team) const;
    std::vector<ConnectionId> GetConnections() const;
    std::vector<ConnectionId> GetMatchParticipants() const;
    size_t PlayerCount() const { return m_players.size(); }

private:
    SessionResult Admit(ConnectionId conn, const std::string& name,
                        TeamId preferredTeam, bool asHost);
    std::optional<TeamId> PickTeam(TeamId preferred) const;
    void LinkTeammates(TeamId team);

    EventQueue& m_events;
    std::map<ConnectionId, PlayerSession> m_players;
    bool m_matchRunning;
};
