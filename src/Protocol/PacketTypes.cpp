// src/Protocol/PacketTypes.cpp
#include "Protocol/PacketTypes.h"

// Map PacketType enum to wire tags and back.
static const char* PacketTypeTags[] = {
    "invalid",
    "hello",
    "ready",
    "command",
    "ai_command",
    "leave",
    "hello_result",
    "snapshot",
    "fog",
    "event",
    "heartbeat"
};

static_assert(sizeof(PacketTypeTags)/sizeof(*PacketTypeTags) == static_cast<size_t>(PacketType::PT_MAX),
              "PacketTypeTags size must match PacketType::PT_MAX");

const char* ToString(PacketType pt) {
    auto idx = static_cast<size_t>(pt);
    if (idx >= static_cast<size_t>(PacketType::PT_MAX)) {
        return PacketTypeTags[0];
    }
    return PacketTypeTags[idx];
}

PacketType PacketTypeFromTag(const std::string& tag) {
    for (size_t i = 1; i < static_cast<size_t>(PacketType::PT_MAX); ++i) {
        if (tag == PacketTypeTags[i]) {
            return static_cast<PacketType>(i);
        }
    }
    return PacketType::PT_INVALID;
}
