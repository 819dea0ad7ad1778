// src/Game/Command.h – Structured unit commands shared by manual and AI input

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Game/GameTypes.h"
#include "Math/Vector3.h"

enum class CommandType : uint8_t {
    Move,
    Attack,
    Stop,
    Formation,
    UseAbility
};

enum class FormationLayout : uint8_t {
    Line,
    Column,
    Wedge,
    Box
};

enum class CommandSource : uint8_t {
    Manual,
    AI
};

struct Command {
    CommandType         type = CommandType::Stop;
    std::vector<UnitId> units;
    Vector3             position;                 // Move/Formation centre/ability point
    UnitId              targetUnit = kInvalidUnit; // Attack/UseAbility
    FormationLayout     layout = FormationLayout::Line;
    float               spacing = 2.0f;
    CommandSource       source = CommandSource::Manual;
};

const char* ToString(CommandType type);
const char* ToString(FormationLayout layout);
std::optional<CommandType>     ParseCommandType(const std::string& name);
std::optional<FormationLayout> ParseFormationLayout(const std::string& name);

// Slot positions for count units arranged around center, facing yaw radians.
// Slot 0 is the leader position.
std::vector<Vector3> ComputeFormationSlots(FormationLayout layout, const Vector3& center,
                                           float facingYaw, size_t count, float spacing);
