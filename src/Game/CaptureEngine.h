// src/Game/CaptureEngine.h

#pragma once

#include <cstdint>
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"

// Moves every control point's capture value by the balance of live units
// inside its radius and reports owner transitions.
class CaptureEngine {
public:
    CaptureEngine(EntityStore& store, EventQueue& events, float captureRatePerSecond);

    // Returns true when any point changed controlling team this tick
    bool Update(float deltaSeconds, uint32_t tick);

    void  SetCaptureRate(float rate) { m_captureRate = rate; }
    float GetCaptureRate() const { return m_captureRate; }

    // Controlled point count per team
    uint32_t CountControlled(TeamId team) const;

private:
    void RefreshOccupants(ControlPoint& point) const;
    void EmitTransition(const ControlPoint& point, TeamId before, TeamId after, uint32_t tick);

    EntityStore& m_store;
    EventQueue&  m_events;
    float        m_captureRate;
};
