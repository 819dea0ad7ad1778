// src/Game/MapDefinition.cpp

#include "Game/MapDefinition.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logger.h"

#include <fstream>
#include <set>
#include <stdexcept>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

Vector3 ReadXY(const json& j) {
    if (!j.is_array() || j.size() < 2) {
        throw std::invalid_argument("position must be [x, y]");
    }
    return Vector3(j[0].get<float>(), j[1].get<float>(), 0.0f);
}

}

MapDefinition::MapDefinition()
    : m_name("unnamed")
{
}

bool MapDefinition::LoadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::Error("Cannot open map file: %s", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!LoadFromJson(buffer.str())) {
        Logger::Error("Map file %s rejected", path.c_str());
        return false;
    }
    Logger::Info("Map '%s' loaded from %s: %dx%d cells, %zu control points",
                 m_name.c_str(), path.c_str(), m_grid.GetWidth(), m_grid.GetHeight(),
                 m_points.size());
    return true;
}

bool MapDefinition::LoadFromJson(const std::string& text) {
    MapDefinition parsed;
    try {
        auto root = json::parse(text);
        parsed.m_name = root.value("name", std::string("unnamed"));
        parsed.m_grid.Resize(root.at("width").get<int>(),
                             root.at("height").get<int>(),
                             root.value("navCellSize", 1.0f));

        if (root.contains("blocked")) {
            for (const auto& cell : root.at("blocked")) {
                parsed.m_grid.SetBlocked(cell.at(0).get<int>(), cell.at(1).get<int>(), true);
            }
        }

        for (const auto& [key, pos] : root.at("spawns").items()) {
            TeamId team = static_cast<TeamId>(std::stoul(key));
            parsed.m_spawns[team] = ReadXY(pos);
        }

        for (const auto& cp : root.at("controlPoints")) {
            ControlPointDefinition def;
            def.id             = cp.at("id").get<PointId>();
            def.name           = cp.value("name", "CP" + std::to_string(def.id));
            def.position       = ReadXY(cp.at("position"));
            def.radius         = cp.value("radius", def.radius);
            def.strategicValue = cp.value("value", def.strategicValue);
            def.perimeter      = cp.value("perimeter", false);
            parsed.m_points.push_back(def);
        }
    } catch (const json::exception& e) {
        Logger::Error("Map JSON error: %s", e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::Error("Map definition error: %s", e.what());
        return false;
    }

    if (!parsed.Validate()) {
        return false;
    }
    *this = std::move(parsed);
    return true;
}

bool MapDefinition::Validate() const {
    if (m_grid.GetWidth() <= 0 || m_grid.GetHeight() <= 0) {
        Logger::Error("Map '%s' has an empty grid", m_name.c_str());
        return false;
    }
    if (!HasSpawnPoint(TEAM_A) || !HasSpawnPoint(TEAM_B)) {
        Logger::Error("Map '%s' needs spawn points for both teams", m_name.c_str());
        return false;
    }
    if (m_points.empty()) {
        Logger::Error("Map '%s' defines no control points", m_name.c_str());
        return false;
    }
    std::set<PointId> ids;
    for (const auto& p : m_points) {
        if (p.id == 0 || !ids.insert(p.id).second) {
            Logger::Error("Map '%s': invalid or duplicate control point id %u", m_name.c_str(), p.id);
            return false;
        }
        if (p.radius <= 0.0f) {
            Logger::Error("Map '%s': control point %u has no radius", m_name.c_str(), p.id);
            return false;
        }
    }
    return true;
}

void MapDefinition::AddControlPoint(const ControlPointDefinition& def) {
    m_points.push_back(def);
}

Vector3 MapDefinition::GetSpawnPoint(TeamId team) const {
    auto it = m_spawns.find(team);
    return it == m_spawns.end() ? Vector3::Zero() : it->second;
}

std::string MapDefinition::ToJson() const {
    json root;
    root["name"] = m_name;
    root["width"] = m_grid.GetWidth();
    root["height"] = m_grid.GetHeight();
    root["navCellSize"] = m_grid.GetCellSize();

    json blocked = json::array();
    for (int y = 0; y < m_grid.GetHeight(); ++y) {
        for (int x = 0; x < m_grid.GetWidth(); ++x) {
            if (m_grid.IsBlocked(x, y)) blocked.push_back({x, y});
        }
    }
    root["blocked"] = blocked;

    json spawns = json::object();
    for (const auto& [team, pos] : m_spawns) {
        spawns[std::to_string(team)] = {pos.x, pos.y};
    }
    root["spawns"] = spawns;

    json points = json::array();
    for (const auto& p : m_points) {
        points.push_back({
            {"id", p.id},
            {"name", p.name},
            {"position", {p.position.x, p.position.y}},
            {"radius", p.radius},
            {"value", p.strategicValue},
            {"perimeter", p.perimeter}
        });
    }
    root["controlPoints"] = points;
    return root.dump();
}

std::string MapDefinition::Digest() const {
    return CryptoUtils::SHA256Hex(ToJson());
}

MapDefinition MapDefinition::Default() {
    MapDefinition map;
    map.m_name = "crossroads";
    map.m_grid.Resize(64, 64, 1.0f);
    map.m_spawns[TEAM_A] = Vector3(6.0f, 6.0f, 0.0f);
    map.m_spawns[TEAM_B] = Vector3(58.0f, 58.0f, 0.0f);

    ControlPointDefinition west;
    west.id = 1;
    west.name = "West";
    west.position = Vector3(12.0f, 52.0f, 0.0f);
    west.perimeter = true;
    map.m_points.push_back(west);

    ControlPointDefinition center;
    center.id = 2;
    center.name = "Center";
    center.position = Vector3(32.0f, 32.0f, 0.0f);
    center.strategicValue = 3.0f;
    map.m_points.push_back(center);

    ControlPointDefinition east;
    east.id = 3;
    east.name = "East";
    east.position = Vector3(52.0f, 12.0f, 0.0f);
    east.perimeter = true;
    map.m_points.push_back(east);
    return map;
}
