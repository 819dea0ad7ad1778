// src/Game/GameEvents.cpp

#include "Game/GameEvents.h"
#include "Utils/Logger.h"

#include <algorithm>

namespace {
// Listener cascades deeper than this are a logic error
constexpr int kMaxDrainPasses = 8;
}

const char* ToString(GameEventType type) {
    switch (type) {
        case GameEventType::UnitDied:                return "unit_died";
        case GameEventType::UnitRespawned:           return "unit_respawned";
        case GameEventType::UnitStateChanged:        return "unit_state_changed";
        case GameEventType::ControlPointCaptured:    return "control_point_captured";
        case GameEventType::ControlPointNeutralized: return "control_point_neutralized";
        case GameEventType::Victory:                 return "victory";
        case GameEventType::MatchStarted:            return "match_started";
        case GameEventType::MatchEnded:              return "match_ended";
        case GameEventType::CommandRejected:         return "command_rejected";
        case GameEventType::AIServiceError:          return "ai_service_error";
        case GameEventType::TeammateLeft:            return "teammate_left";
    }
    return "unknown";
}

bool IsNetworkEvent(GameEventType type) {
    return type != GameEventType::UnitStateChanged;
}

EventQueue::EventQueue() = default;

EventQueue::~EventQueue() = default;

void EventQueue::Push(GameEvent event) {
    Logger::Trace("Event queued: %s", ToString(event.type));
    m_pending.push_back(std::move(event));
}

void EventQueue::AddListener(IGameEventListener* listener) {
    if (!listener) return;
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
        m_listeners.push_back(listener);
    }
}

void EventQueue::RemoveListener(IGameEventListener* listener) {
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                      m_listeners.end());
}

std::vector<GameEvent> EventQueue::Drain() {
    std::vector<GameEvent> delivered;
    for (int pass = 0; pass < kMaxDrainPasses && !m_pending.empty(); ++pass) {
        std::vector<GameEvent> batch;
        batch.swap(m_pending);
        for (const auto& ev : batch) {
            for (auto* listener : m_listeners) {
                listener->OnGameEvent(ev);
            }
        }
        delivered.insert(delivered.end(), batch.begin(), batch.end());
    }
    if (!m_pending.empty()) {
        Logger::Error("EventQueue: listener cascade exceeded %d passes, %zu events deferred",
                      kMaxDrainPasses, m_pending.size());
    }
    return delivered;
}
