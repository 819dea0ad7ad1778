// src/Game/CaptureEngine.cpp

#include "Game/CaptureEngine.h"
#include "Utils/Logger.h"

CaptureEngine::CaptureEngine(EntityStore& store, EventQueue& events, float captureRatePerSecond)
    : m_store(store)
    , m_events(events)
    , m_captureRate(captureRatePerSecond)
{
}

bool CaptureEngine::Update(float deltaSeconds, uint32_t tick) {
    bool ownershipChanged = false;

    for (ControlPoint* point : m_store.GetControlPoints()) {
        RefreshOccupants(*point);

        const int advantage = static_cast<int>(point->GetOccupants(TEAM_A).size()) -
                              static_cast<int>(point->GetOccupants(TEAM_B).size());

        const TeamId before = point->GetControllingTeam();
        point->ApplyAdvantage(advantage, m_captureRate, deltaSeconds);
        const TeamId after = point->GetControllingTeam();

        if (before != after) {
            EmitTransition(*point, before, after, tick);
            ownershipChanged = true;
        }
    }
    return ownershipChanged;
}

void CaptureEngine::RefreshOccupants(ControlPoint& point) const {
    std::vector<UnitId> teamA;
    std::vector<UnitId> teamB;
    const float r2 = point.GetRadius() * point.GetRadius();

    for (const Unit* u : m_store.GetAllUnits()) {
        if (!u->IsAlive()) continue;
        if (u->GetPosition().DistanceSquared2D(point.GetPosition()) > r2) continue;
        if (u->GetTeam() == TEAM_A) {
            teamA.push_back(u->GetId());
        } else if (u->GetTeam() == TEAM_B) {
            teamB.push_back(u->GetId());
        }
    }
    point.SetOccupants(TEAM_A, std::move(teamA));
    point.SetOccupants(TEAM_B, std::move(teamB));
}

void CaptureEngine::EmitTransition(const ControlPoint& point, TeamId before, TeamId after, uint32_t tick) {
    // A swing from one side straight to the other passes through neutral
    if (before != TEAM_NONE) {
        GameEvent ev;
        ev.type = GameEventType::ControlPointNeutralized;
        ev.tick = tick;
        ev.pointId = point.GetId();
        ev.previousTeam = before;
        ev.position = point.GetPosition();
        m_events.Push(ev);
        Logger::Info("Control point %u '%s' neutralized (was team %u)",
                     point.GetId(), point.GetName().c_str(), before);
    }
    if (after != TEAM_NONE) {
        GameEvent ev;
        ev.type = GameEventType::ControlPointCaptured;
        ev.tick = tick;
        ev.pointId = point.GetId();
        ev.team = after;
        ev.previousTeam = before;
        ev.position = point.GetPosition();
        m_events.Push(ev);
        Logger::Info("Control point %u '%s' captured by team %u",
                     point.GetId(), point.GetName().c_str(), after);
    }
}

uint32_t CaptureEngine::CountControlled(TeamId team) const {
    uint32_t count = 0;
    for (const ControlPoint* p : m_store.GetControlPoints()) {
        if (p->GetControllingTeam() == team) ++count;
    }
    return count;
}
