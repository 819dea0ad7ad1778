// src/Protocol/ReplicationManager.cpp
#include "Protocol/ReplicationManager.h"
#include "Utils/Logger.h"

#include <optional>

ReplicationManager::ReplicationManager(IObserverTransport& transport,
                                       CompressionAlgorithm fogCompression,
                                       float fogResendThreshold)
    : m_transport(transport)
    , m_fogCompression(fogCompression)
    , m_fogResendThreshold(fogResendThreshold)
{
    Logger::Info("ReplicationManager: fog %s, resend above %.1f%% change",
                 CompressionHandler::ToString(fogCompression), fogResendThreshold * 100.0f);
}

ReplicationManager::~ReplicationManager() = default;

WorldSnapshot ReplicationManager::BuildSnapshot(const EntityStore& store, const VisibilityEngine& visibility,
                                                TeamId team, uint32_t tick) {
    WorldSnapshot snap;
    snap.tick = tick;
    snap.team = team;

    for (const Unit* u : store.GetAllUnits()) {
        if (u->GetTeam() == team) {
            snap.units.push_back(UnitSnapshot::FromUnit(*u));
        } else if (u->IsAlive() && visibility.CanObserve(store, team, *u)) {
            snap.units.push_back(UnitSnapshot::FromUnit(*u));
        }
    }
    for (const ControlPoint* p : store.GetControlPoints()) {
        snap.points.push_back(ControlPointSnapshot::FromPoint(*p));
    }
    return snap;
}

size_t ReplicationManager::Broadcast(const EntityStore& store, const VisibilityEngine& visibility,
                                     const SessionManager& sessions, uint32_t tick) {
    // One encode per team; teammates share the same view
    std::map<TeamId, Packet> encoded;
    size_t sent = 0;

    for (ConnectionId conn : sessions.GetMatchParticipants()) {
        TeamId team = sessions.GetTeam(conn);
        auto it = encoded.find(team);
        if (it == encoded.end()) {
            it = encoded.emplace(team, SnapshotCodec::EncodeSnapshot(
                                           BuildSnapshot(store, visibility, team, tick))).first;
        }
        if (m_transport.SendUnreliable(conn, it->second)) {
            ++sent;
        }

        const VisionGrid& grid = visibility.GetGrid(team);
        if (NeedsFog(conn, grid)) {
            if (m_transport.SendReliable(conn, SnapshotCodec::EncodeFog(team, grid, m_fogCompression))) {
                m_lastFog[conn] = grid;
            }
        }
    }
    Logger::Trace("Tick %u: %zu snapshots sent", tick, sent);
    return sent;
}

size_t ReplicationManager::DispatchEvents(const std::vector<GameEvent>& events,
                                          const SessionManager& sessions,
                                          const VisibilityEngine* visibility) {
    size_t sent = 0;
    for (const auto& ev : events) {
        if (!IsNetworkEvent(ev.type)) continue;
        if (!ev.IsBroadcast()) {
            if (SendEventTo(ev.recipient, ev)) ++sent;
            continue;
        }

        std::optional<GameEvent> redacted;
        for (ConnectionId conn : sessions.GetConnections()) {
            const TeamId team = sessions.GetTeam(conn);
            const bool hidden = visibility && ev.type == GameEventType::UnitDied &&
                                team != ev.team && !visibility->IsVisible(team, ev.position);
            if (hidden && !redacted) {
                redacted = ev;
                redacted->position = Vector3();
            }
            if (SendEventTo(conn, hidden ? *redacted : ev)) ++sent;
        }
    }
    return sent;
}

bool ReplicationManager::SendEventTo(ConnectionId conn, const GameEvent& event) {
    return m_transport.SendReliable(conn, SnapshotCodec::EncodeEvent(event));
}

bool ReplicationManager::NeedsFog(ConnectionId conn, const VisionGrid& grid) const {
    auto it = m_lastFog.find(conn);
    if (it == m_lastFog.end()) return true;
    return it->second.ChangedFraction(grid) > m_fogResendThreshold;
}

void ReplicationManager::ForgetObserver(ConnectionId conn) {
    m_lastFog.erase(conn);
}

void ReplicationManager::Reset() {
    m_lastFog.clear();
}
