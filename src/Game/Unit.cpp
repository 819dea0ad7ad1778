// src/Game/Unit.cpp – Implementation for Unit

#include "Game/Unit.h"
#include "Utils/Logger.h"
#include "Utils/MathUtils.h"

#include <algorithm>
#include <cassert>

Unit::Unit(UnitId id, TeamId team, ConnectionId owner,
           const UnitArchetype& archetype, const Vector3& position)
    : m_id(id)
    , m_team(team)
    , m_owner(owner)
    , m_archetype(archetype)
    , m_state(UnitState::Idle)
    , m_position(position)
    , m_yaw(0.0f)
    , m_velocity()
    , m_health(archetype.maxHealth)
    , m_moveGoal(position)
    , m_pathIndex(0)
    , m_targetId(kInvalidUnit)
    , m_explicitTarget(false)
    , m_attackCooldown(0.0f)
    , m_respawnTimer(0.0f)
    , m_abilityCharge(0.0f)
    , m_abilityCooldown(0.0f)
    , m_abilityTargetId(kInvalidUnit)
    , m_invulnerableTimer(0.0f)
    , m_stealthTimer(0.0f)
{
    Logger::Debug("Unit %u (%s) spawned for team %u at (%.1f,%.1f)",
                  m_id, m_archetype.name.c_str(), m_team, position.x, position.y);
}

Unit::~Unit() = default;

bool Unit::SetState(UnitState state) {
    if (m_state == state) return false;
    Logger::Trace("Unit %u: %s -> %s", m_id, ToString(m_state), ToString(state));
    m_state = state;
    return true;
}

bool Unit::IsAlive() const {
    return m_state != UnitState::Dead && m_state != UnitState::Respawning;
}

void Unit::SetYaw(float yaw) {
    m_yaw = MathUtils::WrapRadians(yaw);
}

void Unit::SetPath(std::vector<Vector3> waypoints) {
    m_path = std::move(waypoints);
    m_pathIndex = 0;
}

void Unit::ClearPath() {
    m_path.clear();
    m_pathIndex = 0;
    m_velocity = Vector3::Zero();
}

DamageOutcome Unit::ApplyDamage(float amount) {
    if (!IsAlive() || IsInvulnerable() || amount <= 0.0f) {
        return DamageOutcome::Discarded;
    }

    float next = m_health - amount;
    assert(m_archetype.maxHealth > 0.0f);
    m_health = MathUtils::Clamp(next, 0.0f, m_archetype.maxHealth);

    if (m_health <= 0.0f) {
        m_health = 0.0f;
        Die();
        return DamageOutcome::Killed;
    }
    return DamageOutcome::Wounded;
}

float Unit::Heal(float amount) {
    if (!IsAlive() || amount <= 0.0f) return 0.0f;
    float before = m_health;
    m_health = std::min(m_health + amount, m_archetype.maxHealth);
    return m_health - before;
}

void Unit::SetTarget(UnitId target, bool explicitOrder) {
    m_targetId = target;
    m_explicitTarget = explicitOrder && target != kInvalidUnit;
}

void Unit::ClearTarget() {
    m_targetId = kInvalidUnit;
    m_explicitTarget = false;
}

void Unit::BeginAbility(UnitId target, const Vector3& point) {
    m_abilityTargetId = target;
    m_abilityPoint = point;
    m_abilityCharge = 0.0f;
}

void Unit::CancelAbility() {
    m_abilityTargetId = kInvalidUnit;
    m_abilityCharge = 0.0f;
}

bool Unit::AdvanceAbilityCharge(float deltaSeconds) {
    m_abilityCharge += deltaSeconds;
    return m_abilityCharge >= m_archetype.abilityChargeTime;
}

float Unit::GetAbilityChargeFraction() const {
    if (m_state != UnitState::ChargingAbility) return 0.0f;
    if (m_archetype.abilityChargeTime <= 0.0f) return 1.0f;
    return MathUtils::Clamp(m_abilityCharge / m_archetype.abilityChargeTime, 0.0f, 1.0f);
}

void Unit::Die() {
    m_state = UnitState::Dead;
    m_velocity = Vector3::Zero();
    m_path.clear();
    m_pathIndex = 0;
    ClearTarget();
    CancelAbility();
    m_attackCooldown = 0.0f;
    m_abilityCooldown = 0.0f;
    m_invulnerableTimer = 0.0f;
    m_stealthTimer = 0.0f;
    m_respawnTimer = 0.0f;
    Logger::Debug("Unit %u died", m_id);
}

void Unit::BeginRespawn(float delaySeconds) {
    m_state = UnitState::Respawning;
    m_respawnTimer = std::max(0.0f, delaySeconds);
}

bool Unit::AdvanceRespawn(float deltaSeconds) {
    if (m_state != UnitState::Respawning) return false;
    m_respawnTimer = std::max(0.0f, m_respawnTimer - deltaSeconds);
    return m_respawnTimer <= 0.0f;
}

void Unit::CompleteRespawn(const Vector3& spawnPoint, float invulnerabilitySeconds) {
    m_health = m_archetype.maxHealth;
    m_position = spawnPoint;
    m_moveGoal = spawnPoint;
    m_velocity = Vector3::Zero();
    m_state = UnitState::Idle;
    m_invulnerableTimer = invulnerabilitySeconds;
    Logger::Debug("Unit %u respawned at (%.1f,%.1f)", m_id, spawnPoint.x, spawnPoint.y);
}

void Unit::TickTimers(float deltaSeconds) {
    if (!IsAlive()) return;
    m_attackCooldown    = std::max(0.0f, m_attackCooldown - deltaSeconds);
    m_abilityCooldown   = std::max(0.0f, m_abilityCooldown - deltaSeconds);
    m_invulnerableTimer = std::max(0.0f, m_invulnerableTimer - deltaSeconds);
    m_stealthTimer      = std::max(0.0f, m_stealthTimer - deltaSeconds);
}
