// src/Game/UnitSystem.h – Unit state machine, movement and combat resolution

#pragma once

#include <cstdint>
#include <vector>
#include "Config/MatchConfig.h"
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/NavigationGrid.h"
#include "Game/VisibilityEngine.h"

enum class OrderResult {
    Accepted,
    UnknownUnit,
    UnitNotAlive,
    InvalidTarget,
    AbilityUnavailable,
    NoRoute
};

const char* ToString(OrderResult result);

class UnitSystem {
public:
    UnitSystem(EntityStore& store, EventQueue& events, const MatchSettings& settings);

    // Optional collaborators; straight-line movement and self-vision only when unset
    void SetNavigation(const NavigationGrid* nav) { m_nav = nav; }
    void SetVisibility(const VisibilityEngine* vis) { m_visibility = vis; }

    // Orders issued by the command pipeline
    OrderResult OrderMove(UnitId unitId, const Vector3& destination);
    OrderResult OrderAttack(UnitId unitId, UnitId targetId);
    OrderResult OrderStop(UnitId unitId);
    OrderResult OrderAbility(UnitId unitId, UnitId targetId, const Vector3& point);

    // Advance every unit by one tick
    void Update(float deltaSeconds, uint32_t tick);

    // Nearest visible enemy inside vision range, ties to the lowest id
    UnitId FindNearestEnemy(const Unit& unit) const;
    // Target is alive, hostile and observable by the attacker
    bool   IsValidTarget(const Unit& attacker, const Unit& target) const;

    float  GetRespawnDelay(const Unit& unit) const;

private:
    void UpdateUnit(Unit& unit, float dt);
    void UpdateIdle(Unit& unit, float dt);
    void UpdateMoving(Unit& unit, float dt);
    void UpdateEngagement(Unit& unit, float dt);
    void UpdateAbility(Unit& unit, float dt);
    void UpdateRespawn(Unit& unit, float dt);

    void ResolveAttack(Unit& attacker, Unit& target);
    void ApplyAbilityEffect(Unit& unit);

    bool PlanPath(Unit& unit, const Vector3& goal);
    // True when the final waypoint was reached
    bool StepAlongPath(Unit& unit, float dt);
    void HoldPosition(Unit& unit);

    void Transition(Unit& unit, UnitState state);
    bool WasKilledThisTick(UnitId id) const;

    EntityStore&             m_store;
    EventQueue&              m_events;
    MatchSettings            m_settings;
    const NavigationGrid*    m_nav;
    const VisibilityEngine*  m_visibility;
    uint32_t                 m_tick;
    std::vector<UnitId>      m_killedThisTick;
};
