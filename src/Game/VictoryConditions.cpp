// src/Game/VictoryConditions.cpp

#include "Game/VictoryConditions.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"

namespace {

const TeamId kTeamsInOrder[] = {TEAM_A, TEAM_B};

uint32_t CountControlled(const EntityStore& store, TeamId team) {
    uint32_t n = 0;
    for (const ControlPoint* p : store.GetControlPoints()) {
        if (p->GetControllingTeam() == team) ++n;
    }
    return n;
}

}

ControlQuotaCondition::ControlQuotaCondition(uint32_t quota)
    : m_quota(quota)
{
}

TeamId ControlQuotaCondition::Evaluate(const EntityStore& store) const {
    const size_t total = store.ControlPointCount();
    if (total == 0) return TEAM_NONE;
    const uint32_t needed = m_quota > 0 ? m_quota : static_cast<uint32_t>(total / 2 + 1);

    for (TeamId team : kTeamsInOrder) {
        if (CountControlled(store, team) >= needed) return team;
    }
    return TEAM_NONE;
}

KeyPointCondition::KeyPointCondition(PointId keyPointId, uint32_t extraQuota)
    : m_keyPointId(keyPointId)
    , m_extraQuota(extraQuota)
{
}

PointId KeyPointCondition::ResolveKeyPoint(const EntityStore& store, PointId configured) {
    if (configured != 0) {
        return store.FindControlPoint(configured) ? configured : 0;
    }
    PointId best = 0;
    float bestValue = 0.0f;
    for (const ControlPoint* p : store.GetControlPoints()) {
        if (best == 0 || p->GetStrategicValue() > bestValue) {
            best = p->GetId();
            bestValue = p->GetStrategicValue();
        }
    }
    return best;
}

TeamId KeyPointCondition::Evaluate(const EntityStore& store) const {
    const PointId keyId = ResolveKeyPoint(store, m_keyPointId);
    const ControlPoint* key = keyId ? store.FindControlPoint(keyId) : nullptr;
    if (!key) return TEAM_NONE;

    const TeamId holder = key->GetControllingTeam();
    if (holder == TEAM_NONE) return TEAM_NONE;

    uint32_t others = CountControlled(store, holder) - 1;
    return others >= m_extraQuota ? holder : TEAM_NONE;
}

TeamId PerimeterCondition::Evaluate(const EntityStore& store) const {
    for (TeamId team : kTeamsInOrder) {
        bool anyPerimeter = false;
        bool holdsAll = true;
        for (const ControlPoint* p : store.GetControlPoints()) {
            if (!p->IsPerimeter()) continue;
            anyPerimeter = true;
            if (p->GetControllingTeam() != team) {
                holdsAll = false;
                break;
            }
        }
        if (!anyPerimeter) return TEAM_NONE;
        if (holdsAll) return team;
    }
    return TEAM_NONE;
}

VictoryEvaluator::VictoryEvaluator() = default;

void VictoryEvaluator::AddCondition(std::unique_ptr<IVictoryCondition> condition) {
    if (condition) m_conditions.push_back(std::move(condition));
}

std::optional<VictoryResult> VictoryEvaluator::Evaluate(const EntityStore& store) const {
    for (const auto& cond : m_conditions) {
        TeamId winner = cond->Evaluate(store);
        if (winner != TEAM_NONE) {
            return VictoryResult{winner, cond->GetName()};
        }
    }
    return std::nullopt;
}

std::unique_ptr<IVictoryCondition> VictoryEvaluator::Create(const std::string& name,
                                                            const MatchSettings& settings) {
    if (StringUtils::EqualsIgnoreCase(name, "ControlQuota")) {
        return std::make_unique<ControlQuotaCondition>(settings.victoryPointQuota);
    }
    if (StringUtils::EqualsIgnoreCase(name, "KeyPoint")) {
        return std::make_unique<KeyPointCondition>(settings.keyPointId, settings.keyPointExtraQuota);
    }
    if (StringUtils::EqualsIgnoreCase(name, "Perimeter")) {
        return std::make_unique<PerimeterCondition>();
    }
    Logger::Warn("Unknown victory condition '%s' ignored", name.c_str());
    return nullptr;
}

VictoryEvaluator VictoryEvaluator::FromSettings(const MatchSettings& settings) {
    VictoryEvaluator evaluator;
    for (const auto& name : settings.victoryConditions) {
        evaluator.AddCondition(Create(name, settings));
    }
    if (evaluator.ConditionCount() == 0) {
        Logger::Warn("No victory conditions configured, falling back to ControlQuota");
        evaluator.AddCondition(std::make_unique<ControlQuotaCondition>(settings.victoryPointQuota));
    }
    return evaluator;
}
