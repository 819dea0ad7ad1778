// src/Game/VictoryConditions.h – Pluggable, priority-ordered victory rules

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Config/MatchConfig.h"
#include "Game/EntityStore.h"

class IVictoryCondition {
public:
    virtual ~IVictoryCondition() = default;
    virtual const char* GetName() const = 0;
    // Winning team, or TEAM_NONE while unsatisfied
    virtual TeamId Evaluate(const EntityStore& store) const = 0;
};

// Team controls at least quota points; quota 0 means a strict majority
class ControlQuotaCondition : public IVictoryCondition {
public:
    explicit ControlQuotaCondition(uint32_t quota);
    const char* GetName() const override { return "ControlQuota"; }
    TeamId Evaluate(const EntityStore& store) const override;

private:
    uint32_t m_quota;
};

// Team controls the key point plus extraQuota other points.
// keyPointId 0 picks the point with the highest strategic value.
class KeyPointCondition : public IVictoryCondition {
public:
    KeyPointCondition(PointId keyPointId, uint32_t extraQuota);
    const char* GetName() const override { return "KeyPoint"; }
    TeamId Evaluate(const EntityStore& store) const override;

    static PointId ResolveKeyPoint(const EntityStore& store, PointId configured);

private:
    PointId  m_keyPointId;
    uint32_t m_extraQuota;
};

// Team controls every point flagged as perimeter
class PerimeterCondition : public IVictoryCondition {
public:
    const char* GetName() const override { return "Perimeter"; }
    TeamId Evaluate(const EntityStore& store) const override;
};

struct VictoryResult {
    TeamId      team = TEAM_NONE;
    std::string condition;
};

class VictoryEvaluator {
public:
    VictoryEvaluator();

    void AddCondition(std::unique_ptr<IVictoryCondition> condition);
    size_t ConditionCount() const { return m_conditions.size(); }

    // First satisfied condition in priority order wins
    std::optional<VictoryResult> Evaluate(const EntityStore& store) const;

    // Builds conditions from settings.victoryConditions, skipping unknown names
    static VictoryEvaluator FromSettings(const MatchSettings& settings);
    static std::unique_ptr<IVictoryCondition> Create(const std::string& name,
                                                     const MatchSettings& settings);

private:
    std::vector<std::unique_ptr<IVictoryCondition>> m_conditions;
};
