// src/Game/ControlPoint.h – Header for ControlPoint

#pragma once

#include <string>
#include <vector>
#include "Game/GameTypes.h"
#include "Math/Vector3.h"

enum class CaptureStatus {
    Neutral,     // value 0 and nobody inside
    Contested,   // strictly between -1 and +1
    Controlled   // exactly +1 or -1
};

struct ControlPointDefinition {
    PointId     id = 0;
    std::string name;
    Vector3     position;
    float       radius = 5.0f;
    float       strategicValue = 1.0f;
    bool        perimeter = false;
};

class ControlPoint {
public:
    explicit ControlPoint(const ControlPointDefinition& def);
    ~ControlPoint();

    PointId            GetId() const { return m_def.id; }
    const std::string& GetName() const { return m_def.name; }
    Vector3            GetPosition() const { return m_def.position; }
    float              GetRadius() const { return m_def.radius; }
    float              GetStrategicValue() const { return m_def.strategicValue; }
    bool               IsPerimeter() const { return m_def.perimeter; }
    const ControlPointDefinition& GetDefinition() const { return m_def; }

    // +1 leans fully to TEAM_A, -1 fully to TEAM_B
    float              GetCaptureValue() const { return m_captureValue; }
    float              GetProgress() const;

    // Derived from the capture value only
    TeamId             GetControllingTeam() const;
    CaptureStatus      GetStatus() const;

    // value += advantage * rate * dt, clamped to [-1, 1]
    void               ApplyAdvantage(int advantage, float ratePerSecond, float deltaSeconds);
    void               SetCaptureValue(float value);

    void               SetOccupants(TeamId team, std::vector<UnitId> units);
    const std::vector<UnitId>& GetOccupants(TeamId team) const;
    bool               HasOccupants() const;

    // Match reset only
    void               Reset();

private:
    ControlPointDefinition m_def;
    float              m_captureValue;
    std::vector<UnitId> m_occupantsA;
    std::vector<UnitId> m_occupantsB;
};

const char* ToString(CaptureStatus status);
