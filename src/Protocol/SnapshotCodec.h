// src/Protocol/SnapshotCodec.h
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Game/GameEvents.h"
#include "Game/GameTypes.h"
#include "Game/VisibilityEngine.h"
#include "Math/Vector3.h"
#include "Network/Packet.h"
#include "Protocol/CompressionHandler.h"

class Unit;
class ControlPoint;

enum UnitSnapshotFlag : uint8_t {
    USF_INVULNERABLE = 1 << 0,
    USF_STEALTHED    = 1 << 1
};

struct UnitSnapshot {
    UnitId       id = kInvalidUnit;
    TeamId       team = TEAM_NONE;
    ConnectionId owner = kInvalidConnection;
    std::string  archetype;
    Vector3      position;
    float        yaw = 0.0f;
    Vector3      velocity;
    float        health = 0.0f;
    float        maxHealth = 0.0f;
    UnitState    state = UnitState::Idle;
    UnitId       target = kInvalidUnit;
    float        abilityCharge = 0.0f;   // 0..1 while ChargingAbility
    uint8_t      flags = 0;              // UnitSnapshotFlag bits

    static UnitSnapshot FromUnit(const Unit& unit);
};

struct ControlPointSnapshot {
    PointId id = 0;
    Vector3 position;
    float   radius = 0.0f;
    float   captureValue = 0.0f;
    TeamId  owner = TEAM_NONE;

    static ControlPointSnapshot FromPoint(const ControlPoint& point);
};

// Everything one observer may see at one tick
struct WorldSnapshot {
    uint32_t tick = 0;
    TeamId   team = TEAM_NONE;
    std::vector<UnitSnapshot>         units;
    std::vector<ControlPointSnapshot> points;
};

struct FogUpdate {
    TeamId     team = TEAM_NONE;
    VisionGrid grid;
};

// Binary layouts for host → client messages. Decoders never throw:
// truncated or inconsistent payloads yield std::nullopt.
class SnapshotCodec {
public:
    static Packet EncodeSnapshot(const WorldSnapshot& snapshot);
    static std::optional<WorldSnapshot> DecodeSnapshot(const Packet& pkt);

    // Bit-packed grid, compressed with algo
    static Packet EncodeFog(TeamId team, const VisionGrid& grid,
                            CompressionAlgorithm algo = CompressionAlgorithm::ZLIB);
    static std::optional<FogUpdate> DecodeFog(const Packet& pkt);

    // recipient is routing information and is not encoded
    static Packet EncodeEvent(const GameEvent& event);
    static std::optional<GameEvent> DecodeEvent(const Packet& pkt);
};
