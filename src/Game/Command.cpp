// src/Game/Command.cpp

#include "Game/Command.h"
#include "Utils/StringUtils.h"

#include <cmath>

const char* ToString(CommandType type) {
    switch (type) {
        case CommandType::Move:       return "move";
        case CommandType::Attack:     return "attack";
        case CommandType::Stop:       return "stop";
        case CommandType::Formation:  return "formation";
        case CommandType::UseAbility: return "ability";
    }
    return "unknown";
}

const char* ToString(FormationLayout layout) {
    switch (layout) {
        case FormationLayout::Line:   return "line";
        case FormationLayout::Column: return "column";
        case FormationLayout::Wedge:  return "wedge";
        case FormationLayout::Box:    return "box";
    }
    return "unknown";
}

std::optional<CommandType> ParseCommandType(const std::string& name) {
    auto n = StringUtils::ToLower(StringUtils::Trim(name));
    if (n == "move")                        return CommandType::Move;
    if (n == "attack")                      return CommandType::Attack;
    if (n == "stop")                        return CommandType::Stop;
    if (n == "formation")                   return CommandType::Formation;
    if (n == "ability" || n == "useability") return CommandType::UseAbility;
    return std::nullopt;
}

std::optional<FormationLayout> ParseFormationLayout(const std::string& name) {
    auto n = StringUtils::ToLower(StringUtils::Trim(name));
    if (n == "line")   return FormationLayout::Line;
    if (n == "column") return FormationLayout::Column;
    if (n == "wedge")  return FormationLayout::Wedge;
    if (n == "box")    return FormationLayout::Box;
    return std::nullopt;
}

std::vector<Vector3> ComputeFormationSlots(FormationLayout layout, const Vector3& center,
                                           float facingYaw, size_t count, float spacing) {
    // Local frame: +forward along facing, +right perpendicular
    const Vector3 forward(std::cos(facingYaw), std::sin(facingYaw), 0.0f);
    const Vector3 right(std::sin(facingYaw), -std::cos(facingYaw), 0.0f);

    std::vector<Vector3> slots;
    slots.reserve(count);
    if (count == 0) return slots;

    switch (layout) {
        case FormationLayout::Line: {
            float offset = (static_cast<float>(count) - 1.0f) * 0.5f;
            for (size_t i = 0; i < count; ++i) {
                slots.push_back(center + right * ((static_cast<float>(i) - offset) * spacing));
            }
            break;
        }
        case FormationLayout::Column: {
            float offset = (static_cast<float>(count) - 1.0f) * 0.5f;
            for (size_t i = 0; i < count; ++i) {
                slots.push_back(center + forward * ((offset - static_cast<float>(i)) * spacing));
            }
            break;
        }
        case FormationLayout::Wedge: {
            // Leader at the tip, then alternating right/left one rank back
            slots.push_back(center);
            for (size_t i = 1; i < count; ++i) {
                float rank = static_cast<float>((i + 1) / 2);
                float side = (i % 2 == 1) ? 1.0f : -1.0f;
                slots.push_back(center - forward * (rank * spacing) + right * (side * rank * spacing));
            }
            break;
        }
        case FormationLayout::Box: {
            size_t cols = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
            size_t rows = (count + cols - 1) / cols;
            float colOffset = (static_cast<float>(cols) - 1.0f) * 0.5f;
            float rowOffset = (static_cast<float>(rows) - 1.0f) * 0.5f;
            for (size_t i = 0; i < count; ++i) {
                float c = static_cast<float>(i % cols) - colOffset;
                float r = rowOffset - static_cast<float>(i / cols);
                slots.push_back(center + right * (c * spacing) + forward * (r * spacing));
            }
            break;
        }
    }
    return slots;
}
