// src/Game/EntityStore.cpp

#include "Game/EntityStore.h"
#include "Utils/Logger.h"

EntityStore::EntityStore()
    : m_nextUnitId(1)
{
}

EntityStore::~EntityStore() = default;

UnitId EntityStore::SpawnUnit(TeamId team, ConnectionId owner,
                              const UnitArchetype& archetype, const Vector3& position) {
    if (!IsPlayingTeam(team)) {
        Logger::Warn("SpawnUnit: refusing unit for team %u", team);
        return kInvalidUnit;
    }
    UnitId id = m_nextUnitId++;
    m_units.emplace(id, std::make_unique<Unit>(id, team, owner, archetype, position));
    return id;
}

bool EntityStore::RemoveUnit(UnitId id) {
    if (m_units.erase(id) == 0) {
        Logger::Debug("RemoveUnit: unit %u not present", id);
        return false;
    }
    Logger::Debug("Unit %u removed from store", id);
    return true;
}

Unit* EntityStore::FindUnit(UnitId id) {
    auto it = m_units.find(id);
    return it == m_units.end() ? nullptr : it->second.get();
}

const Unit* EntityStore::FindUnit(UnitId id) const {
    auto it = m_units.find(id);
    return it == m_units.end() ? nullptr : it->second.get();
}

Unit* EntityStore::FindLiveUnit(UnitId id) {
    Unit* u = FindUnit(id);
    return (u && u->IsAlive()) ? u : nullptr;
}

const Unit* EntityStore::FindLiveUnit(UnitId id) const {
    const Unit* u = FindUnit(id);
    return (u && u->IsAlive()) ? u : nullptr;
}

std::vector<Unit*> EntityStore::GetAllUnits() {
    std::vector<Unit*> out;
    out.reserve(m_units.size());
    for (auto& [id, u] : m_units) out.push_back(u.get());
    return out;
}

std::vector<const Unit*> EntityStore::GetAllUnits() const {
    std::vector<const Unit*> out;
    out.reserve(m_units.size());
    for (const auto& [id, u] : m_units) out.push_back(u.get());
    return out;
}

std::vector<Unit*> EntityStore::GetUnitsOfTeam(TeamId team) {
    std::vector<Unit*> out;
    for (auto& [id, u] : m_units) {
        if (u->GetTeam() == team) out.push_back(u.get());
    }
    return out;
}

std::vector<const Unit*> EntityStore::GetUnitsOfTeam(TeamId team) const {
    std::vector<const Unit*> out;
    for (const auto& [id, u] : m_units) {
        if (u->GetTeam() == team) out.push_back(u.get());
    }
    return out;
}

std::vector<UnitId> EntityStore::GetUnitIdsOwnedBy(ConnectionId owner) const {
    std::vector<UnitId> out;
    for (const auto& [id, u] : m_units) {
        if (u->GetOwner() == owner) out.push_back(id);
    }
    return out;
}

bool EntityStore::AddControlPoint(const ControlPointDefinition& def) {
    if (m_points.count(def.id)) {
        Logger::Error("Duplicate control point id %u", def.id);
        return false;
    }
    m_points.emplace(def.id, std::make_unique<ControlPoint>(def));
    return true;
}

ControlPoint* EntityStore::FindControlPoint(PointId id) {
    auto it = m_points.find(id);
    return it == m_points.end() ? nullptr : it->second.get();
}

const ControlPoint* EntityStore::FindControlPoint(PointId id) const {
    auto it = m_points.find(id);
    return it == m_points.end() ? nullptr : it->second.get();
}

std::vector<ControlPoint*> EntityStore::GetControlPoints() {
    std::vector<ControlPoint*> out;
    out.reserve(m_points.size());
    for (auto& [id, p] : m_points) out.push_back(p.get());
    return out;
}

std::vector<const ControlPoint*> EntityStore::GetControlPoints() const {
    std::vector<const ControlPoint*> out;
    out.reserve(m_points.size());
    for (const auto& [id, p] : m_points) out.push_back(p.get());
    return out;
}

void EntityStore::ResetControlPoints() {
    for (auto& [id, p] : m_points) p->Reset();
}

void EntityStore::SetSpawnPoint(TeamId team, const Vector3& pos) {
    m_spawnPoints[team] = pos;
}

Vector3 EntityStore::GetSpawnPoint(TeamId team) const {
    auto it = m_spawnPoints.find(team);
    if (it == m_spawnPoints.end()) {
        Logger::Warn("No spawn point for team %u, using origin", team);
        return Vector3::Zero();
    }
    return it->second;
}

void EntityStore::Clear() {
    Logger::Info("EntityStore cleared (%zu units, %zu control points)",
                 m_units.size(), m_points.size());
    m_units.clear();
    m_points.clear();
    m_spawnPoints.clear();
    m_nextUnitId = 1;
}
