// src/Protocol/PacketTypes.h
#pragma once

#include <cstdint>
#include <string>

// Every message exchanged between host and clients. Each value maps to
// a Packet::GetTag() string.
//
// When adding a new packet type, append before PT_MAX and update PacketTypes.cpp.
enum class PacketType : uint16_t {
    PT_INVALID = 0,

    // client → host
    PT_HELLO,                 // host or join request: name, preferred team, wantsHost
    PT_READY,                 // lobby ready flag; the match starts once everyone is ready
    PT_COMMAND,               // structured unit command
    PT_AI_COMMAND,            // natural-language command + selection
    PT_LEAVE,                 // graceful disconnect

    // host → client
    PT_HELLO_RESULT,          // session result, team, token
    PT_SNAPSHOT,              // per-observer world snapshot (unreliable)
    PT_FOG,                   // team vision grid (reliable, compressed)
    PT_EVENT,                 // discrete game event (reliable)

    // both directions
    PT_HEARTBEAT,

    // Sentinel
    PT_MAX
};

const char* ToString(PacketType pt);
PacketType  PacketTypeFromTag(const std::string& tag);
