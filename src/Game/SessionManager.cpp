// src/Game/SessionManager.cpp

#include "Game/SessionManager.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logger.h"

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Offline:   return "Offline";
        case SessionState::Hosting:   return "Hosting";
        case SessionState::Joining:   return "Joining";
        case SessionState::Connected: return "Connected";
        case SessionState::InMatch:   return "InMatch";
    }
    return "Unknown";
}

const char* ToString(SessionResult result) {
    switch (result) {
        case SessionResult::Ok:                return "ok";
        case SessionResult::AlreadyConnected:  return "already connected";
        case SessionResult::AlreadyHosted:     return "already hosted";
        case SessionResult::LobbyFull:         return "lobby full";
        case SessionResult::UnknownConnection: return "unknown connection";
        case SessionResult::MatchInProgress:   return "match in progress";
        case SessionResult::NoMatchRunning:    return "no match running";
        case SessionResult::TeamEmpty:         return "team empty";
        case SessionResult::TeamsNotReady:     return "teams not ready";
    }
    return "unknown";
}

SessionManager::SessionManager(EventQueue& events)
    : m_events(events)
    , m_matchRunning(false)
{
}

SessionManager::~SessionManager() = default;

SessionResult SessionManager::Host(ConnectionId conn, const std::string& name, TeamId preferredTeam) {
    for (const auto& [id, p] : m_players) {
        if (p.isHost) return SessionResult::AlreadyHosted;
    }
    return Admit(conn, name, preferredTeam, true);
}

SessionResult SessionManager::Join(ConnectionId conn, const std::string& name, TeamId preferredTeam) {
    return Admit(conn, name, preferredTeam, false);
}

SessionResult SessionManager::Admit(ConnectionId conn, const std::string& name,
                                    TeamId preferredTeam, bool asHost) {
    if (conn == kInvalidConnection) return SessionResult::UnknownConnection;
    if (m_players.count(conn)) return SessionResult::AlreadyConnected;
    if (m_matchRunning) {
        Logger::Info("Connection %u refused: match in progress", conn);
        return SessionResult::MatchInProgress;
    }

    auto team = PickTeam(preferredTeam);
    if (!team) {
        Logger::Info("Connection %u (%s) refused: lobby full", conn, name.c_str());
        return SessionResult::LobbyFull;
    }

    PlayerSession session;
    session.connection = conn;
    session.name = name.empty() ? ("Player" + std::to_string(conn)) : name;
    session.team = *team;
    session.isHost = asHost;
    session.state = asHost ? SessionState::Hosting : SessionState::Joining;
    session.token = CryptoUtils::GenerateToken(16);
    if (session.token.empty()) {
        Logger::Warn("Session token generation failed for connection %u", conn);
    }

    Logger::Debug("Connection %u %s", conn, ToString(session.state));
    session.state = SessionState::Connected;
    m_players.emplace(conn, std::move(session));
    LinkTeammates(*team);

    const auto& p = m_players.at(conn);
    Logger::Info("Player '%s' (conn %u) %s team %u", p.name.c_str(), conn,
                 asHost ? "hosting on" : "joined", p.team);
    return SessionResult::Ok;
}

std::optional<TeamId> SessionManager::PickTeam(TeamId preferred) const {
    const size_t sizeA = GetTeamMembers(TEAM_A).size();
    const size_t sizeB = GetTeamMembers(TEAM_B).size();

    if (preferred == TEAM_A && sizeA < kMaxPlayersPerTeam) return TEAM_A;
    if (preferred == TEAM_B && sizeB < kMaxPlayersPerTeam) return TEAM_B;

    if (sizeA >= kMaxPlayersPerTeam && sizeB >= kMaxPlayersPerTeam) return std::nullopt;
    if (sizeA >= kMaxPlayersPerTeam) return TEAM_B;
    if (sizeB >= kMaxPlayersPerTeam) return TEAM_A;
    return sizeB < sizeA ? TEAM_B : TEAM_A;
}

void SessionManager::LinkTeammates(TeamId team) {
    auto members = GetTeamMembers(team);
    if (members.size() == 2) {
        m_players[members[0]].teammate = members[1];
        m_players[members[1]].teammate = members[0];
    } else {
        for (auto id : members) m_players[id].teammate = kInvalidConnection;
    }
}

SessionResult SessionManager::SetReady(ConnectionId conn, bool ready) {
    auto it = m_players.find(conn);
    if (it == m_players.end()) return SessionResult::UnknownConnection;
    if (m_matchRunning) return SessionResult::MatchInProgress;
    it->second.ready = ready;
    Logger::Info("Player '%s' %s", it->second.name.c_str(), ready ? "ready" : "not ready");
    return SessionResult::Ok;
}

bool SessionManager::IsTeamReady(TeamId team) const {
    auto members = GetTeamMembers(team);
    if (members.empty()) return false;
    for (auto id : members) {
        if (!m_players.at(id).ready) return false;
    }
    return true;
}

SessionResult SessionManager::CanStartMatch() const {
    if (m_matchRunning) return SessionResult::MatchInProgress;
    if (GetTeamMembers(TEAM_A).empty() || GetTeamMembers(TEAM_B).empty()) {
        return SessionResult::TeamEmpty;
    }
    if (!IsTeamReady(TEAM_A) || !IsTeamReady(TEAM_B)) {
        return SessionResult::TeamsNotReady;
    }
    return SessionResult::Ok;
}

SessionResult SessionManager::StartMatch(uint32_t tick, const std::string& mapDigest) {
    SessionResult check = CanStartMatch();
    if (check != SessionResult::Ok) {
        Logger::Debug("StartMatch refused: %s", ToString(check));
        return check;
    }

    m_matchRunning = true;
    for (auto& [id, p] : m_players) {
        p.state = SessionState::InMatch;
    }

    GameEvent ev;
    ev.type = GameEventType::MatchStarted;
    ev.tick = tick;
    ev.detail = mapDigest;
    m_events.Push(ev);
    Logger::Info("Match started with %zu players", m_players.size());
    return SessionResult::Ok;
}

SessionResult SessionManager::EndMatch(TeamId winner, const std::string& reason, uint32_t tick) {
    if (!m_matchRunning) return SessionResult::NoMatchRunning;

    m_matchRunning = false;
    for (auto& [id, p] : m_players) {
        p.state = SessionState::Connected;
        p.ready = false;
    }

    GameEvent ev;
    ev.type = GameEventType::MatchEnded;
    ev.tick = tick;
    ev.team = winner;
    ev.detail = reason;
    m_events.Push(ev);
    Logger::Info("Match ended, winner team %u (%s)", winner, reason.c_str());
    return SessionResult::Ok;
}

DisconnectOutcome SessionManager::Disconnect(ConnectionId conn, uint32_t tick) {
    DisconnectOutcome out;
    auto it = m_players.find(conn);
    if (it == m_players.end()) return out;

    out.known = true;
    out.team = it->second.team;
    out.formerTeammate = it->second.teammate;
    const bool wasInMatch = it->second.state == SessionState::InMatch;
    Logger::Info("Player '%s' (conn %u) disconnected", it->second.name.c_str(), conn);
    m_players.erase(it);

    if (out.formerTeammate != kInvalidConnection) {
        auto mate = m_players.find(out.formerTeammate);
        if (mate != m_players.end()) {
            mate->second.teammate = kInvalidConnection;
            GameEvent ev;
            ev.type = GameEventType::TeammateLeft;
            ev.tick = tick;
            ev.team = out.team;
            ev.recipient = out.formerTeammate;
            m_events.Push(ev);
        }
    }

    if (m_matchRunning && wasInMatch) {
        out.endedMatch = true;
        out.winner = OpposingTeam(out.team);
        EndMatch(out.winner, "opponent disconnected", tick);
    }
    return out;
}

const PlayerSession* SessionManager::Find(ConnectionId conn) const {
    auto it = m_players.find(conn);
    return it == m_players.end() ? nullptr : &it->second;
}

SessionState SessionManager::GetState(ConnectionId conn) const {
    const auto* p = Find(conn);
    return p ? p->state : SessionState::Offline;
}

bool SessionManager::IsInMatch(ConnectionId conn) const {
    return GetState(conn) == SessionState::InMatch;
}

TeamId SessionManager::GetTeam(ConnectionId conn) const {
    const auto* p = Find(conn);
    return p ? p->team : TEAM_NONE;
}

std::vector<ConnectionId> SessionManager::GetTeamMembers(TeamId team) const {
    std::vector<ConnectionId> out;
    for (const auto& [id, p] : m_players) {
        if (p.team == team) out.push_back(id);
    }
    return out;
}

std::vector<ConnectionId> SessionManager::GetConnections() const {
    std::vector<ConnectionId> out;
    for (const auto& [id, p] : m_players) out.push_back(id);
    return out;
}

std::vector<ConnectionId> SessionManager::GetMatchParticipants() const {
    std::vector<ConnectionId> out;
    for (const auto& [id, p] : m_players) {
        if (p.state == SessionState::InMatch) out.push_back(id);
    }
    return out;
}
