// src/Game/MapDefinition.h – Map generator output consumed at match setup

#pragma once

#include <map>
#include <string>
#include <vector>
#include "Game/ControlPoint.h"
#include "Game/GameTypes.h"
#include "Game/NavigationGrid.h"
#include "Math/Vector3.h"

class MapDefinition {
public:
    MapDefinition();

    // JSON layout:
    // { "name": "...", "width": 64, "height": 64, "navCellSize": 1.0,
    //   "blocked": [[x,y], ...],
    //   "spawns": { "1": [x,y], "2": [x,y] },
    //   "controlPoints": [ { "id":1, "name":"A", "position":[x,y],
    //                        "radius":5, "value":1, "perimeter":false } ] }
    bool LoadFromFile(const std::string& path);
    bool LoadFromJson(const std::string& text);

    const std::string& GetName() const { return m_name; }
    void  SetName(const std::string& name) { m_name = name; }

    // World extent
    float GetWidth() const { return m_grid.GetWorldWidth(); }
    float GetHeight() const { return m_grid.GetWorldHeight(); }

    NavigationGrid&       GetNavigation() { return m_grid; }
    const NavigationGrid& GetNavigation() const { return m_grid; }

    void AddControlPoint(const ControlPointDefinition& def);
    const std::vector<ControlPointDefinition>& GetControlPoints() const { return m_points; }

    void    SetSpawnPoint(TeamId team, const Vector3& pos) { m_spawns[team] = pos; }
    Vector3 GetSpawnPoint(TeamId team) const;
    bool    HasSpawnPoint(TeamId team) const { return m_spawns.count(team) != 0; }

    // Canonical JSON text, stable for hashing
    std::string ToJson() const;
    // SHA-256 of ToJson(), sent with match_started so clients can verify
    std::string Digest() const;

    // Open 64x64 field with three points and corner spawns
    static MapDefinition Default();

private:
    bool Validate() const;

    std::string m_name;
    NavigationGrid m_grid;
    std::vector<ControlPointDefinition> m_points;
    std::map<TeamId, Vector3> m_spawns;
};
