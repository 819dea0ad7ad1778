// src/Game/UnitSystem.cpp

#include "Game/UnitSystem.h"
#include "Utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
// Slack for a heal target that drifted while the medic was charging
constexpr float kAbilityRangeSlack = 0.5f;
}

const char* ToString(OrderResult result) {
    switch (result) {
        case OrderResult::Accepted:           return "accepted";
        case OrderResult::UnknownUnit:        return "unknown unit";
        case OrderResult::UnitNotAlive:       return "unit not alive";
        case OrderResult::InvalidTarget:      return "invalid target";
        case OrderResult::AbilityUnavailable: return "ability unavailable";
        case OrderResult::NoRoute:            return "no route";
    }
    return "unknown";
}

UnitSystem::UnitSystem(EntityStore& store, EventQueue& events, const MatchSettings& settings)
    : m_store(store)
    , m_events(events)
    , m_settings(settings)
    , m_nav(nullptr)
    , m_visibility(nullptr)
    , m_tick(0)
{
}

// ---------------------------------------------------------------------------
// Orders
// ---------------------------------------------------------------------------

OrderResult UnitSystem::OrderMove(UnitId unitId, const Vector3& destination) {
    Unit* unit = m_store.FindUnit(unitId);
    if (!unit) return OrderResult::UnknownUnit;
    if (!unit->IsAlive()) return OrderResult::UnitNotAlive;

    unit->CancelAbility();
    unit->ClearTarget();
    if (!PlanPath(*unit, destination)) {
        Logger::Info("Unit %u has no route to (%.1f,%.1f), holding", unitId, destination.x, destination.y);
        HoldPosition(*unit);
        Transition(*unit, UnitState::Idle);
        return OrderResult::NoRoute;
    }
    unit->SetMoveGoal(destination);
    Transition(*unit, UnitState::Moving);
    return OrderResult::Accepted;
}

OrderResult UnitSystem::OrderAttack(UnitId unitId, UnitId targetId) {
    Unit* unit = m_store.FindUnit(unitId);
    if (!unit) return OrderResult::UnknownUnit;
    if (!unit->IsAlive()) return OrderResult::UnitNotAlive;

    const Unit* target = m_store.FindUnit(targetId);
    if (!target || !IsValidTarget(*unit, *target)) {
        return OrderResult::InvalidTarget;
    }

    unit->CancelAbility();
    unit->ClearPath();
    unit->SetTarget(targetId, true);
    Transition(*unit, UnitState::Attacking);
    return OrderResult::Accepted;
}

OrderResult UnitSystem::OrderStop(UnitId unitId) {
    Unit* unit = m_store.FindUnit(unitId);
    if (!unit) return OrderResult::UnknownUnit;
    if (!unit->IsAlive()) return OrderResult::UnitNotAlive;

    if (unit->GetState() == UnitState::Idle &&
        unit->GetTargetId() == kInvalidUnit && !unit->HasPath()) {
        return OrderResult::Accepted;
    }
    unit->CancelAbility();
    unit->ClearTarget();
    HoldPosition(*unit);
    Transition(*unit, UnitState::Idle);
    return OrderResult::Accepted;
}

OrderResult UnitSystem::OrderAbility(UnitId unitId, UnitId targetId, const Vector3& point) {
    Unit* unit = m_store.FindUnit(unitId);
    if (!unit) return OrderResult::UnknownUnit;
    if (!unit->IsAlive()) return OrderResult::UnitNotAlive;
    if (!unit->IsAbilityReady()) return OrderResult::AbilityUnavailable;

    const auto& arch = unit->GetArchetype();
    UnitId effectTarget = unitId;
    if (arch.abilityType == AbilityType::Heal) {
        if (targetId != kInvalidUnit) effectTarget = targetId;
        const Unit* target = m_store.FindLiveUnit(effectTarget);
        if (!target || target->GetTeam() != unit->GetTeam()) {
            return OrderResult::InvalidTarget;
        }
        if (target->GetPosition().Distance2D(unit->GetPosition()) > arch.abilityRange) {
            return OrderResult::InvalidTarget;
        }
    }

    unit->ClearTarget();
    HoldPosition(*unit);
    unit->BeginAbility(effectTarget, point);
    Transition(*unit, UnitState::ChargingAbility);
    Logger::Debug("Unit %u charging %s", unitId, ToString(arch.abilityType));
    return OrderResult::Accepted;
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

void UnitSystem::Update(float deltaSeconds, uint32_t tick) {
    m_tick = tick;
    m_killedThisTick.clear();

    std::vector<UnitId> ids;
    for (const Unit* u : m_store.GetAllUnits()) ids.push_back(u->GetId());

    std::vector<UnitId> removals;
    for (UnitId id : ids) {
        Unit* unit = m_store.FindUnit(id);
        if (!unit) continue;

        if (unit->GetState() == UnitState::Dead) {
            if (WasKilledThisTick(id)) continue;
            if (m_settings.respawnEnabled) {
                unit->BeginRespawn(GetRespawnDelay(*unit));
                GameEvent ev;
                ev.type = GameEventType::UnitStateChanged;
                ev.tick = m_tick;
                ev.unitId = id;
                ev.team = unit->GetTeam();
                ev.fromState = UnitState::Dead;
                ev.toState = UnitState::Respawning;
                m_events.Push(ev);
            } else {
                removals.push_back(id);
            }
            continue;
        }
        UpdateUnit(*unit, deltaSeconds);
    }

    for (UnitId id : removals) {
        m_store.RemoveUnit(id);
        Logger::Info("Unit %u removed, respawn disabled", id);
    }
}

void UnitSystem::UpdateUnit(Unit& unit, float dt) {
    if (unit.GetState() == UnitState::Respawning) {
        UpdateRespawn(unit, dt);
        return;
    }

    unit.TickTimers(dt);
    switch (unit.GetState()) {
        case UnitState::Idle:
            UpdateIdle(unit, dt);
            break;
        case UnitState::Moving:
            UpdateMoving(unit, dt);
            break;
        case UnitState::Attacking:
            UpdateEngagement(unit, dt);
            break;
        case UnitState::ChargingAbility:
            UpdateAbility(unit, dt);
            break;
        case UnitState::Dead:
        case UnitState::Respawning:
            break;
    }
}

void UnitSystem::UpdateIdle(Unit& unit, float dt) {
    UnitId enemy = FindNearestEnemy(unit);
    if (enemy == kInvalidUnit) return;
    unit.SetTarget(enemy, false);
    Transition(unit, UnitState::Attacking);
    UpdateEngagement(unit, dt);
}

void UnitSystem::UpdateMoving(Unit& unit, float dt) {
    // Still chasing an attack target
    if (unit.GetTargetId() != kInvalidUnit) {
        UpdateEngagement(unit, dt);
        return;
    }

    if (m_settings.acquireWhileMoving) {
        UnitId enemy = FindNearestEnemy(unit);
        if (enemy != kInvalidUnit) {
            unit.ClearPath();
            unit.SetTarget(enemy, false);
            Transition(unit, UnitState::Attacking);
            UpdateEngagement(unit, dt);
            return;
        }
    }

    if (StepAlongPath(unit, dt)) {
        HoldPosition(unit);
        Transition(unit, UnitState::Idle);
    }
}

void UnitSystem::UpdateEngagement(Unit& unit, float dt) {
    Unit* target = m_store.FindUnit(unit.GetTargetId());
    if (!target || !IsValidTarget(unit, *target)) {
        Logger::Debug("Unit %u lost target %u", unit.GetId(), unit.GetTargetId());
        unit.ClearTarget();
        HoldPosition(unit);
        Transition(unit, UnitState::Idle);
        return;
    }

    const Vector3 targetPos = target->GetPosition();
    const float distance = unit.GetPosition().Distance2D(targetPos);
    if (distance > unit.GetArchetype().attackRange) {
        if (!PlanPath(unit, targetPos)) {
            Logger::Debug("Unit %u cannot reach target %u", unit.GetId(), target->GetId());
            unit.ClearTarget();
            HoldPosition(unit);
            Transition(unit, UnitState::Idle);
            return;
        }
        Transition(unit, UnitState::Moving);
        StepAlongPath(unit, dt);
        return;
    }

    HoldPosition(unit);
    unit.SetYaw(unit.GetPosition().YawTo(targetPos));
    Transition(unit, UnitState::Attacking);
    if (unit.CanAttack()) {
        ResolveAttack(unit, *target);
    }
}

void UnitSystem::UpdateAbility(Unit& unit, float dt) {
    if (!unit.AdvanceAbilityCharge(dt)) return;
    ApplyAbilityEffect(unit);
    unit.StartAbilityCooldown();
    unit.CancelAbility();
    Transition(unit, UnitState::Idle);
}

void UnitSystem::UpdateRespawn(Unit& unit, float dt) {
    if (!unit.AdvanceRespawn(dt)) return;

    unit.CompleteRespawn(m_store.GetSpawnPoint(unit.GetTeam()), m_settings.invulnerabilitySeconds);

    GameEvent changed;
    changed.type = GameEventType::UnitStateChanged;
    changed.tick = m_tick;
    changed.unitId = unit.GetId();
    changed.team = unit.GetTeam();
    changed.fromState = UnitState::Respawning;
    changed.toState = UnitState::Idle;
    m_events.Push(changed);

    GameEvent respawned;
    respawned.type = GameEventType::UnitRespawned;
    respawned.tick = m_tick;
    respawned.unitId = unit.GetId();
    respawned.team = unit.GetTeam();
    respawned.position = unit.GetPosition();
    m_events.Push(respawned);
}

// ---------------------------------------------------------------------------
// Combat
// ---------------------------------------------------------------------------

void UnitSystem::ResolveAttack(Unit& attacker, Unit& target) {
    const UnitState before = target.GetState();
    const DamageOutcome outcome = target.ApplyDamage(attacker.GetArchetype().attackDamage);
    attacker.ResetAttackCooldown();

    switch (outcome) {
        case DamageOutcome::Discarded:
            Logger::Trace("Unit %u hit on %u discarded", attacker.GetId(), target.GetId());
            return;
        case DamageOutcome::Wounded:
            Logger::Trace("Unit %u hit %u, health %.1f", attacker.GetId(), target.GetId(), target.GetHealth());
            return;
        case DamageOutcome::Killed:
            break;
    }

    m_killedThisTick.push_back(target.GetId());
    Logger::Info("Unit %u (team %u) killed by unit %u", target.GetId(), target.GetTeam(), attacker.GetId());

    GameEvent changed;
    changed.type = GameEventType::UnitStateChanged;
    changed.tick = m_tick;
    changed.unitId = target.GetId();
    changed.team = target.GetTeam();
    changed.fromState = before;
    changed.toState = UnitState::Dead;
    m_events.Push(changed);

    GameEvent died;
    died.type = GameEventType::UnitDied;
    died.tick = m_tick;
    died.unitId = target.GetId();
    died.team = target.GetTeam();
    died.position = target.GetPosition();
    died.detail = std::to_string(attacker.GetId());
    m_events.Push(died);
}

void UnitSystem::ApplyAbilityEffect(Unit& unit) {
    const auto& arch = unit.GetArchetype();
    switch (arch.abilityType) {
        case AbilityType::Heal: {
            Unit* target = m_store.FindLiveUnit(unit.GetAbilityTarget());
            if (!target || target->GetTeam() != unit.GetTeam() ||
                target->GetPosition().Distance2D(unit.GetPosition()) > arch.abilityRange + kAbilityRangeSlack) {
                Logger::Debug("Unit %u heal fizzled", unit.GetId());
                return;
            }
            float restored = target->Heal(arch.abilityMagnitude);
            Logger::Debug("Unit %u healed unit %u for %.1f", unit.GetId(), target->GetId(), restored);
            break;
        }
        case AbilityType::Cloak:
            unit.SetStealth(arch.abilityMagnitude);
            Logger::Debug("Unit %u cloaked for %.1fs", unit.GetId(), arch.abilityMagnitude);
            break;
        case AbilityType::None:
            break;
    }
}

UnitId UnitSystem::FindNearestEnemy(const Unit& unit) const {
    const float vision = unit.GetArchetype().visionRange;
    const float vision2 = vision * vision;
    UnitId best = kInvalidUnit;
    float bestDist2 = 0.0f;

    for (const Unit* other : m_store.GetUnitsOfTeam(OpposingTeam(unit.GetTeam()))) {
        if (!other->IsAlive()) continue;
        float d2 = unit.GetPosition().DistanceSquared2D(other->GetPosition());
        if (d2 > vision2) continue;
        if (VisibilityEngine::IsConcealed(m_store, *other, unit.GetTeam(), m_settings.stealthRevealRadius)) {
            continue;
        }
        // Ascending id order, so strict less keeps the lowest id on ties
        if (best == kInvalidUnit || d2 < bestDist2) {
            best = other->GetId();
            bestDist2 = d2;
        }
    }
    return best;
}

bool UnitSystem::IsValidTarget(const Unit& attacker, const Unit& target) const {
    if (!target.IsAlive()) return false;
    if (target.GetId() == attacker.GetId() || target.GetTeam() == attacker.GetTeam()) return false;
    if (VisibilityEngine::IsConcealed(m_store, target, attacker.GetTeam(), m_settings.stealthRevealRadius)) {
        return false;
    }
    const float vision = attacker.GetArchetype().visionRange;
    if (attacker.GetPosition().DistanceSquared2D(target.GetPosition()) <= vision * vision) {
        return true;
    }
    return m_visibility && m_visibility->IsVisible(attacker.GetTeam(), target.GetPosition());
}

float UnitSystem::GetRespawnDelay(const Unit& unit) const {
    float archetypeDelay = unit.GetArchetype().respawnDelay;
    return archetypeDelay >= 0.0f ? archetypeDelay : m_settings.respawnDelaySeconds;
}

// ---------------------------------------------------------------------------
// Movement
// ---------------------------------------------------------------------------

bool UnitSystem::PlanPath(Unit& unit, const Vector3& goal) {
    if (!m_nav) {
        unit.SetPath({goal});
        return true;
    }
    auto path = m_nav->FindPath(unit.GetPosition(), goal);
    if (!path) {
        return false;
    }
    unit.SetPath(std::move(*path));
    return true;
}

bool UnitSystem::StepAlongPath(Unit& unit, float dt) {
    float step = unit.GetArchetype().speed * dt;
    Vector3 pos = unit.GetPosition();
    Vector3 dir;

    while (step > 0.0f && unit.HasPath()) {
        const Vector3& wp = unit.GetNextWaypoint();
        Vector3 delta(wp.x - pos.x, wp.y - pos.y, 0.0f);
        float dist = delta.Length();
        if (dist <= step) {
            pos.x = wp.x;
            pos.y = wp.y;
            step -= dist;
            if (dist > 1e-6f) dir = delta / dist;
            unit.AdvanceWaypoint();
        } else {
            dir = delta / dist;
            pos += dir * step;
            step = 0.0f;
        }
    }
    // Zero-length final hop
    while (unit.HasPath() && unit.GetNextWaypoint().DistanceSquared2D(pos) < 1e-10f) {
        unit.AdvanceWaypoint();
    }

    unit.SetPosition(pos);
    if (!dir.IsZero()) {
        unit.SetYaw(std::atan2(dir.y, dir.x));
        unit.SetVelocity(dir * unit.GetArchetype().speed);
    }
    if (!unit.HasPath()) {
        unit.SetVelocity(Vector3::Zero());
        return true;
    }
    return false;
}

void UnitSystem::HoldPosition(Unit& unit) {
    unit.ClearPath();
    unit.SetVelocity(Vector3::Zero());
    unit.SetMoveGoal(unit.GetPosition());
}

void UnitSystem::Transition(Unit& unit, UnitState state) {
    const UnitState from = unit.GetState();
    if (!unit.SetState(state)) return;

    GameEvent ev;
    ev.type = GameEventType::UnitStateChanged;
    ev.tick = m_tick;
    ev.unitId = unit.GetId();
    ev.team = unit.GetTeam();
    ev.fromState = from;
    ev.toState = state;
    m_events.Push(ev);
}

bool UnitSystem::WasKilledThisTick(UnitId id) const {
    return std::find(m_killedThisTick.begin(), m_killedThisTick.end(), id) != m_killedThisTick.end();
}
