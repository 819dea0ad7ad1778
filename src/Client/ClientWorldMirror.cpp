// src/Client/ClientWorldMirror.cpp

#include "Client/ClientWorldMirror.h"
#include "Utils/Logger.h"
#include "Utils/MathUtils.h"

#include <vector>

namespace {
bool IsDown(UnitState state) {
    return state == UnitState::Dead || state == UnitState::Respawning;
}
}

ClientWorldMirror::ClientWorldMirror(IEntityPresenter* presenter, float blendSeconds)
    : m_presenter(presenter)
    , m_blendSeconds(blendSeconds > 0.0f ? blendSeconds : 0.1f)
{
}

bool ClientWorldMirror::ApplySnapshot(const WorldSnapshot& snapshot) {
    if (m_lastTick && snapshot.tick <= *m_lastTick) {
        Logger::Debug("ClientWorldMirror: snapshot %u ignored, %u already applied",
                      snapshot.tick, *m_lastTick);
        return false;
    }
    m_lastTick = snapshot.tick;

    std::set<UnitId> present;
    for (const auto& snap : snapshot.units) {
        // Units the host reported dead stay gone until they come back alive
        if (m_destroyed.count(snap.id)) {
            if (IsDown(snap.state)) continue;
            m_destroyed.erase(snap.id);
        }
        present.insert(snap.id);

        auto it = m_units.find(snap.id);
        if (it == m_units.end()) {
            CreateUnit(snap);
            continue;
        }
        MirroredUnit& unit = it->second;
        unit.fromPosition = unit.renderPosition;
        unit.fromYaw = unit.renderYaw;
        unit.blend = 0.0f;
        unit.authoritative = snap;
    }

    std::vector<UnitId> gone;
    for (const auto& [id, unit] : m_units) {
        if (!present.count(id)) gone.push_back(id);
    }
    for (UnitId id : gone) {
        HideUnit(id);
    }

    for (const auto& point : snapshot.points) {
        auto it = m_points.find(point.id);
        bool changed = it == m_points.end() ||
                       it->second.owner != point.owner ||
                       it->second.captureValue != point.captureValue;
        m_points[point.id] = point;
        if (changed && m_presenter) {
            m_presenter->OnControlPointChanged(point);
        }
    }
    return true;
}

void ClientWorldMirror::ApplyEvent(const GameEvent& event) {
    if (event.type == GameEventType::MatchStarted) {
        Clear();
        return;
    }
    if (event.type != GameEventType::UnitDied) return;

    const UnitId id = event.unitId;
    m_destroyed.insert(id);
    bool known = m_units.erase(id) > 0;
    known = m_hidden.erase(id) > 0 || known;
    if (known && m_presenter) {
        m_presenter->OnUnitDestroyed(id);
    }
}

void ClientWorldMirror::ApplyFog(const FogUpdate& fog) {
    m_fog = fog.grid;
}

void ClientWorldMirror::Update(float dt) {
    for (auto& [id, unit] : m_units) {
        if (unit.blend >= 1.0f) continue;
        unit.blend = MathUtils::Clamp(unit.blend + dt / m_blendSeconds, 0.0f, 1.0f);
        unit.renderPosition = unit.fromPosition.Lerp(unit.authoritative.position, unit.blend);
        unit.renderYaw = MathUtils::LerpAngle(unit.fromYaw, unit.authoritative.yaw, unit.blend);
    }
}

const MirroredUnit* ClientWorldMirror::FindUnit(UnitId id) const {
    auto it = m_units.find(id);
    return it == m_units.end() ? nullptr : &it->second;
}

std::optional<ControlPointSnapshot> ClientWorldMirror::FindControlPoint(PointId id) const {
    auto it = m_points.find(id);
    if (it == m_points.end()) return std::nullopt;
    return it->second;
}

bool ClientWorldMirror::SetAnnotation(UnitId id, const std::string& text) {
    auto it = m_units.find(id);
    if (it == m_units.end()) return false;
    it->second.annotation = text;
    return true;
}

void ClientWorldMirror::Clear() {
    m_units.clear();
    m_hidden.clear();
    m_destroyed.clear();
    m_points.clear();
    m_lastTick.reset();
}

void ClientWorldMirror::CreateUnit(const UnitSnapshot& snap) {
    MirroredUnit unit;
    unit.authoritative = snap;
    unit.renderPosition = snap.position;
    unit.fromPosition = snap.position;
    unit.renderYaw = snap.yaw;
    unit.fromYaw = snap.yaw;
    unit.blend = 1.0f;
    auto hidden = m_hidden.find(snap.id);
    if (hidden != m_hidden.end()) {
        unit.annotation = hidden->second;
        m_hidden.erase(hidden);
    }

    auto& stored = m_units[snap.id] = unit;
    if (m_presenter) {
        m_presenter->OnUnitCreated(stored);
    }
}

void ClientWorldMirror::HideUnit(UnitId id) {
    auto it = m_units.find(id);
    m_hidden[id] = it->second.annotation;
    m_units.erase(it);
    if (m_presenter) {
        m_presenter->OnUnitHidden(id);
    }
}
