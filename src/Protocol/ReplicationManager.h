// src/Protocol/ReplicationManager.h
#pragma once

#include <map>
#include <vector>
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/SessionManager.h"
#include "Game/VisibilityEngine.h"
#include "Network/ObserverTransport.h"
#include "Protocol/CompressionHandler.h"
#include "Protocol/SnapshotCodec.h"

// Builds per-observer snapshots and routes outbound events. Holds the
// last fog grid sent to each observer so unchanged grids are not resent.
class ReplicationManager {
public:
    ReplicationManager(IObserverTransport& transport, CompressionAlgorithm fogCompression,
                       float fogResendThreshold);
    ~ReplicationManager();

    // Own units always; enemy units only while observable; every control point
    static WorldSnapshot BuildSnapshot(const EntityStore& store, const VisibilityEngine& visibility,
                                       TeamId team, uint32_t tick);

    // One snapshot (unreliable) per InMatch participant, plus the team fog
    // grid (reliable) when it changed enough. Returns snapshots sent.
    size_t Broadcast(const EntityStore& store, const VisibilityEngine& visibility,
                     const SessionManager& sessions, uint32_t tick);

    // Network events go reliable to their recipient, or to every known
    // connection when broadcast. With visibility, a unit_died outside an
    // enemy team's vision reaches that team without its position.
    // Returns packets sent.
    size_t DispatchEvents(const std::vector<GameEvent>& events, const SessionManager& sessions,
                          const VisibilityEngine* visibility = nullptr);

    // Also accepts connections that are not yet in a session
    bool SendEventTo(ConnectionId conn, const GameEvent& event);

    bool NeedsFog(ConnectionId conn, const VisionGrid& grid) const;
    void ForgetObserver(ConnectionId conn);
    // New match: every observer gets a fresh fog grid
    void Reset();

    void SetCompression(CompressionAlgorithm algo) { m_fogCompression = algo; }

private:
    IObserverTransport&              m_transport;
    CompressionAlgorithm             m_fogCompression;
    float                            m_fogResendThreshold;
    std::map<ConnectionId, VisionGrid> m_lastFog;
};
