// src/Game/Unit.h – Header for Unit

#pragma once

#include <cstdint>
#include <vector>
#include "Config/ArchetypeCatalog.h"
#include "Game/GameTypes.h"
#include "Math/Vector3.h"

enum class DamageOutcome {
    Discarded,   // target dead, respawning or invulnerable
    Wounded,
    Killed
};

class Unit {
public:
    Unit(UnitId id, TeamId team, ConnectionId owner,
         const UnitArchetype& archetype, const Vector3& position);
    ~Unit();

    UnitId        GetId() const { return m_id; }
    TeamId        GetTeam() const { return m_team; }
    ConnectionId  GetOwner() const { return m_owner; }
    void          SetOwner(ConnectionId owner) { m_owner = owner; }
    const UnitArchetype& GetArchetype() const { return m_archetype; }

    // State
    UnitState     GetState() const { return m_state; }
    // Returns true when the state actually changed
    bool          SetState(UnitState state);
    bool          IsAlive() const;

    // Position & movement
    Vector3       GetPosition() const { return m_position; }
    void          SetPosition(const Vector3& pos) { m_position = pos; }
    float         GetYaw() const { return m_yaw; }
    void          SetYaw(float yaw);
    Vector3       GetVelocity() const { return m_velocity; }
    void          SetVelocity(const Vector3& v) { m_velocity = v; }

    // Movement orders
    void          SetMoveGoal(const Vector3& goal) { m_moveGoal = goal; }
    Vector3       GetMoveGoal() const { return m_moveGoal; }
    void          SetPath(std::vector<Vector3> waypoints);
    void          ClearPath();
    bool          HasPath() const { return m_pathIndex < m_path.size(); }
    const Vector3& GetNextWaypoint() const { return m_path[m_pathIndex]; }
    void          AdvanceWaypoint() { ++m_pathIndex; }
    const std::vector<Vector3>& GetPath() const { return m_path; }

    // Health
    float         GetHealth() const { return m_health; }
    float         GetMaxHealth() const { return m_archetype.maxHealth; }

    // Damage, clamping and death bookkeeping in a single step
    DamageOutcome ApplyDamage(float amount);
    // Returns the amount actually restored
    float         Heal(float amount);

    // Target (weak, resolved through the EntityStore every tick)
    UnitId        GetTargetId() const { return m_targetId; }
    bool          HasExplicitTarget() const { return m_explicitTarget; }
    void          SetTarget(UnitId target, bool explicitOrder);
    void          ClearTarget();

    // Combat timing
    bool          CanAttack() const { return m_attackCooldown <= 0.0f; }
    void          ResetAttackCooldown() { m_attackCooldown = m_archetype.attackCooldown; }
    float         GetAttackCooldown() const { return m_attackCooldown; }

    // Abilities
    bool          HasAbility() const { return m_archetype.abilityType != AbilityType::None; }
    bool          IsAbilityReady() const { return HasAbility() && m_abilityCooldown <= 0.0f; }
    void          BeginAbility(UnitId target, const Vector3& point);
    void          CancelAbility();
    // Advances the charge; true once charging has completed
    bool          AdvanceAbilityCharge(float deltaSeconds);
    float         GetAbilityChargeFraction() const;
    UnitId        GetAbilityTarget() const { return m_abilityTargetId; }
    Vector3       GetAbilityPoint() const { return m_abilityPoint; }
    void          StartAbilityCooldown() { m_abilityCooldown = m_archetype.abilityCooldown; }
    float         GetAbilityCooldown() const { return m_abilityCooldown; }

    // Flags
    bool          IsInvulnerable() const { return m_invulnerableTimer > 0.0f; }
    void          GrantInvulnerability(float seconds) { m_invulnerableTimer = seconds; }
    bool          IsStealthed() const { return m_stealthTimer > 0.0f; }
    void          SetStealth(float seconds) { m_stealthTimer = seconds; }

    // Death & respawn
    void          BeginRespawn(float delaySeconds);
    // Counts down; true once the unit is ready to re-enter play
    bool          AdvanceRespawn(float deltaSeconds);
    float         GetRespawnRemaining() const { return m_respawnTimer; }
    void          CompleteRespawn(const Vector3& spawnPoint, float invulnerabilitySeconds);

    // Cooldowns, invulnerability and stealth countdowns
    void          TickTimers(float deltaSeconds);

private:
    void          Die();

    UnitId        m_id;
    TeamId        m_team;
    ConnectionId  m_owner;
    UnitArchetype m_archetype;

    UnitState     m_state;
    Vector3       m_position;
    float         m_yaw;
    Vector3       m_velocity;
    float         m_health;

    Vector3       m_moveGoal;
    std::vector<Vector3> m_path;
    size_t        m_pathIndex;

    UnitId        m_targetId;
    bool          m_explicitTarget;

    float         m_attackCooldown;
    float         m_respawnTimer;
    float         m_abilityCharge;
    float         m_abilityCooldown;
    UnitId        m_abilityTargetId;
    Vector3       m_abilityPoint;
    float         m_invulnerableTimer;
    float         m_stealthTimer;
};
