// src/Config/ArchetypeCatalog.h

#pragma once

#include <map>
#include <string>
#include <vector>
#include "Game/GameTypes.h"

// Base stats shared by every unit of one archetype.
struct UnitArchetype {
    std::string name;
    float       maxHealth        = 100.0f;
    float       speed            = 4.0f;    // world units per second
    float       attackRange      = 6.0f;
    float       attackDamage     = 25.0f;
    float       attackCooldown   = 1.0f;    // seconds between attacks
    float       visionRange      = 10.0f;
    float       respawnDelay     = -1.0f;   // < 0 uses the match default

    AbilityType abilityType      = AbilityType::None;
    float       abilityRange     = 0.0f;
    float       abilityMagnitude = 0.0f;    // heal amount or cloak duration
    float       abilityChargeTime = 0.0f;
    float       abilityCooldown  = 0.0f;
};

class ArchetypeCatalog {
public:
    ArchetypeCatalog();

    // Replace the built-in set with the contents of a JSON file:
    // { "archetypes": [ { "name": "rifleman", "maxHealth": 100, ... } ] }
    bool LoadFromFile(const std::string& path);
    bool LoadFromJson(const std::string& text);

    void Register(const UnitArchetype& archetype);

    const UnitArchetype* Find(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<std::string> GetNames() const;
    size_t Size() const { return m_archetypes.size(); }

    // rifleman, scout, heavy, medic, infiltrator
    static ArchetypeCatalog BuiltIn();

private:
    std::map<std::string, UnitArchetype> m_archetypes;
};
