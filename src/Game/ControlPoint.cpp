// src/Game/ControlPoint.cpp – Implementation for ControlPoint

#include "Game/ControlPoint.h"
#include "Utils/Logger.h"
#include "Utils/MathUtils.h"

#include <cassert>
#include <cmath>

namespace {
const std::vector<UnitId> kNoOccupants;
}

ControlPoint::ControlPoint(const ControlPointDefinition& def)
    : m_def(def)
    , m_captureValue(0.0f)
{
    Logger::Info("Control point %u '%s' at (%.1f,%.1f) radius=%.1f value=%.1f%s",
                 m_def.id, m_def.name.c_str(), m_def.position.x, m_def.position.y,
                 m_def.radius, m_def.strategicValue, m_def.perimeter ? " perimeter" : "");
}

ControlPoint::~ControlPoint() = default;

float ControlPoint::GetProgress() const {
    return std::abs(m_captureValue);
}

TeamId ControlPoint::GetControllingTeam() const {
    if (m_captureValue >= 1.0f)  return TEAM_A;
    if (m_captureValue <= -1.0f) return TEAM_B;
    return TEAM_NONE;
}

CaptureStatus ControlPoint::GetStatus() const {
    if (GetControllingTeam() != TEAM_NONE) return CaptureStatus::Controlled;
    if (m_captureValue == 0.0f && !HasOccupants()) return CaptureStatus::Neutral;
    return CaptureStatus::Contested;
}

void ControlPoint::ApplyAdvantage(int advantage, float ratePerSecond, float deltaSeconds) {
    if (advantage == 0) return;
    SetCaptureValue(m_captureValue + static_cast<float>(advantage) * ratePerSecond * deltaSeconds);
}

void ControlPoint::SetCaptureValue(float value) {
    if (std::isnan(value)) {
        Logger::Error("Control point %u: capture value is NaN, holding %.3f",
                      m_def.id, m_captureValue);
        assert(false && "capture value is NaN");
        return;
    }
    float clamped = MathUtils::Clamp(value, -1.0f, 1.0f);
    assert(clamped >= -1.0f && clamped <= 1.0f);
    m_captureValue = clamped;
}

void ControlPoint::SetOccupants(TeamId team, std::vector<UnitId> units) {
    if (team == TEAM_A) {
        m_occupantsA = std::move(units);
    } else if (team == TEAM_B) {
        m_occupantsB = std::move(units);
    }
}

const std::vector<UnitId>& ControlPoint::GetOccupants(TeamId team) const {
    if (team == TEAM_A) return m_occupantsA;
    if (team == TEAM_B) return m_occupantsB;
    return kNoOccupants;
}

bool ControlPoint::HasOccupants() const {
    return !m_occupantsA.empty() || !m_occupantsB.empty();
}

void ControlPoint::Reset() {
    m_captureValue = 0.0f;
    m_occupantsA.clear();
    m_occupantsB.clear();
    Logger::Debug("Control point %u reset to neutral", m_def.id);
}

const char* ToString(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Neutral:    return "Neutral";
        case CaptureStatus::Contested:  return "Contested";
        case CaptureStatus::Controlled: return "Controlled";
    }
    return "Unknown";
}
