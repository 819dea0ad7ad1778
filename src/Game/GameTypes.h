// src/Game/GameTypes.h – Shared identifiers and enums for the simulation

#pragma once

#include <cstdint>

using UnitId       = uint32_t;
using PointId      = uint32_t;
using TeamId       = uint32_t;
using ConnectionId = uint32_t;

constexpr UnitId       kInvalidUnit       = 0;
constexpr ConnectionId kInvalidConnection = 0;

// Exactly two playing teams. The sign of a control point's capture value
// leans toward TEAM_A when positive and TEAM_B when negative.
constexpr TeamId TEAM_NONE = 0;
constexpr TeamId TEAM_A    = 1;
constexpr TeamId TEAM_B    = 2;

constexpr uint32_t kMaxPlayersPerTeam = 2;

inline TeamId OpposingTeam(TeamId team) {
    if (team == TEAM_A) return TEAM_B;
    if (team == TEAM_B) return TEAM_A;
    return TEAM_NONE;
}

inline bool IsPlayingTeam(TeamId team) {
    return team == TEAM_A || team == TEAM_B;
}

enum class UnitState : uint8_t {
    Idle,
    Moving,
    Attacking,
    ChargingAbility,
    Dead,
    Respawning
};

enum class AbilityType : uint8_t {
    None,
    Heal,   // restore health to a friendly unit
    Cloak   // become stealthed for a duration
};

inline const char* ToString(UnitState state) {
    switch (state) {
        case UnitState::Idle:            return "Idle";
        case UnitState::Moving:          return "Moving";
        case UnitState::Attacking:       return "Attacking";
        case UnitState::ChargingAbility: return "ChargingAbility";
        case UnitState::Dead:            return "Dead";
        case UnitState::Respawning:      return "Respawning";
    }
    return "Unknown";
}

inline const char* ToString(AbilityType type) {
    switch (type) {
        case AbilityType::None:  return "None";
        case AbilityType::Heal:  return "Heal";
        case AbilityType::Cloak: return "Cloak";
    }
    return "Unknown";
}
