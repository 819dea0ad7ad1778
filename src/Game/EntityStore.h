// src/Game/EntityStore.h

#pragma once

#include <map>
#include <memory>
#include <vector>
#include "Game/ControlPoint.h"
#include "Game/Unit.h"

// Sole owner of every Unit and ControlPoint in a match. Everything else
// holds ids and resolves them here. Iteration is in ascending id order.
class EntityStore {
public:
    EntityStore();
    ~EntityStore();

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // Units
    UnitId SpawnUnit(TeamId team, ConnectionId owner,
                     const UnitArchetype& archetype, const Vector3& position);
    bool   RemoveUnit(UnitId id);
    Unit*       FindUnit(UnitId id);
    const Unit* FindUnit(UnitId id) const;
    // Present and not Dead/Respawning
    Unit*       FindLiveUnit(UnitId id);
    const Unit* FindLiveUnit(UnitId id) const;

    std::vector<Unit*>       GetAllUnits();
    std::vector<const Unit*> GetAllUnits() const;
    std::vector<Unit*>       GetUnitsOfTeam(TeamId team);
    std::vector<const Unit*> GetUnitsOfTeam(TeamId team) const;
    std::vector<UnitId>      GetUnitIdsOwnedBy(ConnectionId owner) const;
    size_t UnitCount() const { return m_units.size(); }

    // Control points
    bool AddControlPoint(const ControlPointDefinition& def);
    ControlPoint*       FindControlPoint(PointId id);
    const ControlPoint* FindControlPoint(PointId id) const;
    std::vector<ControlPoint*>       GetControlPoints();
    std::vector<const ControlPoint*> GetControlPoints() const;
    size_t ControlPointCount() const { return m_points.size(); }
    void   ResetControlPoints();

    // Team spawn locations used on respawn
    void    SetSpawnPoint(TeamId team, const Vector3& pos);
    Vector3 GetSpawnPoint(TeamId team) const;

    // Drops every entity; ids restart from 1
    void Clear();

private:
    std::map<UnitId, std::unique_ptr<Unit>>          m_units;
    std::map<PointId, std::unique_ptr<ControlPoint>> m_points;
    std::map<TeamId, Vector3>                        m_spawnPoints;
    UnitId                                           m_nextUnitId;
};
