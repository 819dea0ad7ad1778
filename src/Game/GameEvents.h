// src/Game/GameEvents.h – Domain events and the per-tick event queue

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "Game/GameTypes.h"
#include "Math/Vector3.h"

enum class GameEventType : uint8_t {
    UnitDied,
    UnitRespawned,
    UnitStateChanged,
    ControlPointCaptured,
    ControlPointNeutralized,
    Victory,
    MatchStarted,
    MatchEnded,
    CommandRejected,
    AIServiceError,
    TeammateLeft
};

struct GameEvent {
    GameEventType type = GameEventType::UnitStateChanged;
    uint32_t      tick = 0;
    UnitId        unitId = kInvalidUnit;
    PointId       pointId = 0;
    TeamId        team = TEAM_NONE;           // captured/winning/owning team
    TeamId        previousTeam = TEAM_NONE;   // neutralized from
    UnitState     fromState = UnitState::Idle;
    UnitState     toState = UnitState::Idle;
    Vector3       position;
    // kInvalidConnection broadcasts to every observer in the match
    ConnectionId  recipient = kInvalidConnection;
    std::string   detail;

    bool IsBroadcast() const { return recipient == kInvalidConnection; }
};

// Wire names: unit_died, control_point_captured, ...
const char* ToString(GameEventType type);

// True for events that leave the host; state changes stay internal
bool IsNetworkEvent(GameEventType type);

class IGameEventListener {
public:
    virtual ~IGameEventListener() = default;
    virtual void OnGameEvent(const GameEvent& event) = 0;
};

// Events are queued during a tick and fanned out in order once per tick.
// Listeners may queue follow-up events; those are delivered in the same drain.
class EventQueue {
public:
    EventQueue();
    ~EventQueue();

    void Push(GameEvent event);

    void AddListener(IGameEventListener* listener);
    void RemoveListener(IGameEventListener* listener);

    // Delivers everything pending to every listener, returns what was delivered
    std::vector<GameEvent> Drain();

    size_t Pending() const { return m_pending.size(); }
    void   Clear() { m_pending.clear(); }

private:
    std::vector<GameEvent>           m_pending;
    std::vector<IGameEventListener*> m_listeners;
};
