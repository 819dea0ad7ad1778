// src/Config/ArchetypeCatalog.cpp

#include "Config/ArchetypeCatalog.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

AbilityType ParseAbility(const std::string& name) {
    auto lower = StringUtils::ToLower(name);
    if (lower == "heal")  return AbilityType::Heal;
    if (lower == "cloak") return AbilityType::Cloak;
    if (!lower.empty() && lower != "none") {
        Logger::Warn("Unknown ability '%s', archetype gets none", name.c_str());
    }
    return AbilityType::None;
}

UnitArchetype FromJson(const json& j) {
    UnitArchetype a;
    a.name           = j.at("name").get<std::string>();
    a.maxHealth      = j.value("maxHealth", a.maxHealth);
    a.speed          = j.value("speed", a.speed);
    a.attackRange    = j.value("attackRange", a.attackRange);
    a.attackDamage   = j.value("attackDamage", a.attackDamage);
    a.attackCooldown = j.value("attackCooldown", a.attackCooldown);
    a.visionRange    = j.value("visionRange", a.visionRange);
    a.respawnDelay   = j.value("respawnDelay", a.respawnDelay);

    if (j.contains("ability")) {
        const auto& ab = j.at("ability");
        a.abilityType       = ParseAbility(ab.value("type", std::string("none")));
        a.abilityRange      = ab.value("range", 0.0f);
        a.abilityMagnitude  = ab.value("magnitude", 0.0f);
        a.abilityChargeTime = ab.value("chargeTime", 0.0f);
        a.abilityCooldown   = ab.value("cooldown", 0.0f);
    }
    return a;
}

bool IsValid(const UnitArchetype& a) {
    if (a.name.empty()) {
        Logger::Error("Archetype without a name");
        return false;
    }
    if (a.maxHealth <= 0.0f || a.speed < 0.0f || a.attackRange < 0.0f ||
        a.attackDamage < 0.0f || a.attackCooldown < 0.0f || a.visionRange < 0.0f) {
        Logger::Error("Archetype '%s' has out of range stats", a.name.c_str());
        return false;
    }
    if (a.abilityType != AbilityType::None &&
        (a.abilityMagnitude < 0.0f || a.abilityChargeTime < 0.0f || a.abilityCooldown < 0.0f)) {
        Logger::Error("Archetype '%s' has invalid ability parameters", a.name.c_str());
        return false;
    }
    return true;
}

}

ArchetypeCatalog::ArchetypeCatalog() = default;

bool ArchetypeCatalog::LoadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::Error("Cannot open archetype file: %s", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (!LoadFromJson(buffer.str())) {
        Logger::Error("Archetype file %s rejected, keeping %zu existing archetypes",
                      path.c_str(), m_archetypes.size());
        return false;
    }
    Logger::Info("Loaded %zu archetypes from %s", m_archetypes.size(), path.c_str());
    return true;
}

bool ArchetypeCatalog::LoadFromJson(const std::string& text) {
    std::map<std::string, UnitArchetype> parsed;
    try {
        auto root = json::parse(text);
        for (const auto& entry : root.at("archetypes")) {
            auto a = FromJson(entry);
            if (!IsValid(a)) {
                return false;
            }
            parsed[a.name] = a;
        }
    } catch (const json::exception& e) {
        Logger::Error("Archetype JSON error: %s", e.what());
        return false;
    }

    if (parsed.empty()) {
        Logger::Error("Archetype JSON defines no archetypes");
        return false;
    }
    m_archetypes = std::move(parsed);
    return true;
}

void ArchetypeCatalog::Register(const UnitArchetype& archetype) {
    if (!IsValid(archetype)) return;
    m_archetypes[archetype.name] = archetype;
}

const UnitArchetype* ArchetypeCatalog::Find(const std::string& name) const {
    auto it = m_archetypes.find(name);
    return it == m_archetypes.end() ? nullptr : &it->second;
}

bool ArchetypeCatalog::Has(const std::string& name) const {
    return m_archetypes.count(name) != 0;
}

std::vector<std::string> ArchetypeCatalog::GetNames() const {
    std::vector<std::string> names;
    names.reserve(m_archetypes.size());
    for (const auto& [name, a] : m_archetypes) {
        names.push_back(name);
    }
    return names;
}

ArchetypeCatalog ArchetypeCatalog::BuiltIn() {
    ArchetypeCatalog catalog;

    UnitArchetype rifleman;
    rifleman.name = "rifleman";
    catalog.Register(rifleman);

    UnitArchetype scout;
    scout.name           = "scout";
    scout.maxHealth      = 70.0f;
    scout.speed          = 6.5f;
    scout.attackRange    = 5.0f;
    scout.attackDamage   = 15.0f;
    scout.attackCooldown = 0.8f;
    scout.visionRange    = 16.0f;
    catalog.Register(scout);

    UnitArchetype heavy;
    heavy.name           = "heavy";
    heavy.maxHealth      = 180.0f;
    heavy.speed          = 2.5f;
    heavy.attackRange    = 8.0f;
    heavy.attackDamage   = 40.0f;
    heavy.attackCooldown = 2.0f;
    heavy.visionRange    = 9.0f;
    catalog.Register(heavy);

    UnitArchetype medic;
    medic.name              = "medic";
    medic.maxHealth         = 80.0f;
    medic.attackDamage      = 10.0f;
    medic.abilityType       = AbilityType::Heal;
    medic.abilityRange      = 5.0f;
    medic.abilityMagnitude  = 40.0f;
    medic.abilityChargeTime = 1.5f;
    medic.abilityCooldown   = 8.0f;
    catalog.Register(medic);

    UnitArchetype infiltrator;
    infiltrator.name              = "infiltrator";
    infiltrator.maxHealth         = 75.0f;
    infiltrator.speed             = 5.0f;
    infiltrator.attackDamage      = 30.0f;
    infiltrator.attackRange       = 3.0f;
    infiltrator.abilityType       = AbilityType::Cloak;
    infiltrator.abilityMagnitude  = 10.0f;
    infiltrator.abilityChargeTime = 1.0f;
    infiltrator.abilityCooldown   = 20.0f;
    catalog.Register(infiltrator);

    return catalog;
}
