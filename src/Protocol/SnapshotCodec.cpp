// src/Protocol/SnapshotCodec.cpp
#include "Protocol/SnapshotCodec.h"
#include "Game/ControlPoint.h"
#include "Game/Unit.h"
#include "Protocol/PacketTypes.h"
#include "Utils/Logger.h"

#include <stdexcept>

namespace {
constexpr uint32_t kMaxUnitsPerSnapshot  = 4096;
constexpr uint32_t kMaxPointsPerSnapshot = 256;
constexpr uint32_t kMaxFogCells          = 1u << 22;
constexpr uint8_t  kLastUnitState        = static_cast<uint8_t>(UnitState::Respawning);
constexpr uint8_t  kLastEventType        = static_cast<uint8_t>(GameEventType::TeammateLeft);

void WriteUnit(Packet& pkt, const UnitSnapshot& u) {
    pkt.WriteUInt(u.id);
    pkt.WriteByte(static_cast<uint8_t>(u.team));
    pkt.WriteUInt(u.owner);
    pkt.WriteString(u.archetype);
    pkt.WriteVector3(u.position);
    pkt.WriteFloat(u.yaw);
    pkt.WriteVector3(u.velocity);
    pkt.WriteFloat(u.health);
    pkt.WriteFloat(u.maxHealth);
    pkt.WriteByte(static_cast<uint8_t>(u.state));
    pkt.WriteUInt(u.target);
    pkt.WriteFloat(u.abilityCharge);
    pkt.WriteByte(u.flags);
}

UnitSnapshot ReadUnit(Packet& pkt) {
    UnitSnapshot u;
    u.id        = pkt.ReadUInt();
    u.team      = pkt.ReadByte();
    u.owner     = pkt.ReadUInt();
    u.archetype = pkt.ReadString();
    u.position  = pkt.ReadVector3();
    u.yaw       = pkt.ReadFloat();
    u.velocity  = pkt.ReadVector3();
    u.health    = pkt.ReadFloat();
    u.maxHealth = pkt.ReadFloat();
    uint8_t state = pkt.ReadByte();
    if (state > kLastUnitState) {
        throw std::out_of_range("unit state out of range");
    }
    u.state         = static_cast<UnitState>(state);
    u.target        = pkt.ReadUInt();
    u.abilityCharge = pkt.ReadFloat();
    u.flags         = pkt.ReadByte();
    return u;
}

void WritePoint(Packet& pkt, const ControlPointSnapshot& p) {
    pkt.WriteUInt(p.id);
    pkt.WriteVector3(p.position);
    pkt.WriteFloat(p.radius);
    pkt.WriteFloat(p.captureValue);
    pkt.WriteByte(static_cast<uint8_t>(p.owner));
}

ControlPointSnapshot ReadPoint(Packet& pkt) {
    ControlPointSnapshot p;
    p.id           = pkt.ReadUInt();
    p.position     = pkt.ReadVector3();
    p.radius       = pkt.ReadFloat();
    p.captureValue = pkt.ReadFloat();
    p.owner        = pkt.ReadByte();
    return p;
}

bool HasTag(const Packet& pkt, PacketType type) {
    return pkt.GetTag() == ToString(type);
}

}

UnitSnapshot UnitSnapshot::FromUnit(const Unit& unit) {
    UnitSnapshot s;
    s.id            = unit.GetId();
    s.team          = unit.GetTeam();
    s.owner         = unit.GetOwner();
    s.archetype     = unit.GetArchetype().name;
    s.position      = unit.GetPosition();
    s.yaw           = unit.GetYaw();
    s.velocity      = unit.GetVelocity();
    s.health        = unit.GetHealth();
    s.maxHealth     = unit.GetMaxHealth();
    s.state         = unit.GetState();
    s.target        = unit.GetTargetId();
    s.abilityCharge = unit.GetAbilityChargeFraction();
    if (unit.IsInvulnerable()) s.flags |= USF_INVULNERABLE;
    if (unit.IsStealthed())    s.flags |= USF_STEALTHED;
    return s;
}

ControlPointSnapshot ControlPointSnapshot::FromPoint(const ControlPoint& point) {
    ControlPointSnapshot s;
    s.id           = point.GetId();
    s.position     = point.GetPosition();
    s.radius       = point.GetRadius();
    s.captureValue = point.GetCaptureValue();
    s.owner        = point.GetControllingTeam();
    return s;
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

Packet SnapshotCodec::EncodeSnapshot(const WorldSnapshot& snapshot) {
    Packet pkt(ToString(PacketType::PT_SNAPSHOT));
    pkt.WriteUInt(snapshot.tick);
    pkt.WriteByte(static_cast<uint8_t>(snapshot.team));
    pkt.WriteUInt(static_cast<uint32_t>(snapshot.units.size()));
    for (const auto& u : snapshot.units) {
        WriteUnit(pkt, u);
    }
    pkt.WriteUInt(static_cast<uint32_t>(snapshot.points.size()));
    for (const auto& p : snapshot.points) {
        WritePoint(pkt, p);
    }
    return pkt;
}

std::optional<WorldSnapshot> SnapshotCodec::DecodeSnapshot(const Packet& pkt) {
    if (!HasTag(pkt, PacketType::PT_SNAPSHOT)) return std::nullopt;
    Packet copy = pkt;
    copy.ResetRead();
    try {
        WorldSnapshot snap;
        snap.tick = copy.ReadUInt();
        snap.team = copy.ReadByte();

        uint32_t unitCount = copy.ReadUInt();
        if (unitCount > kMaxUnitsPerSnapshot) {
            Logger::Warn("SnapshotCodec: %u units exceeds limit", unitCount);
            return std::nullopt;
        }
        snap.units.reserve(unitCount);
        for (uint32_t i = 0; i < unitCount; ++i) {
            snap.units.push_back(ReadUnit(copy));
        }

        uint32_t pointCount = copy.ReadUInt();
        if (pointCount > kMaxPointsPerSnapshot) {
            Logger::Warn("SnapshotCodec: %u control points exceeds limit", pointCount);
            return std::nullopt;
        }
        snap.points.reserve(pointCount);
        for (uint32_t i = 0; i < pointCount; ++i) {
            snap.points.push_back(ReadPoint(copy));
        }
        return snap;
    } catch (const std::out_of_range& e) {
        Logger::Warn("SnapshotCodec: malformed snapshot (%s)", e.what());
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// Fog
// ---------------------------------------------------------------------------

Packet SnapshotCodec::EncodeFog(TeamId team, const VisionGrid& grid, CompressionAlgorithm algo) {
    std::vector<uint8_t> bits = grid.Pack();
    std::vector<uint8_t> body;
    if (!CompressionHandler::Compress(bits, body, algo)) {
        Logger::Warn("SnapshotCodec: %s compression failed, sending fog uncompressed",
                     CompressionHandler::ToString(algo));
        algo = CompressionAlgorithm::NONE;
        body = bits;
    }

    Packet pkt(ToString(PacketType::PT_FOG));
    pkt.WriteByte(static_cast<uint8_t>(team));
    pkt.WriteUInt(static_cast<uint32_t>(grid.GetWidth()));
    pkt.WriteUInt(static_cast<uint32_t>(grid.GetHeight()));
    pkt.WriteFloat(grid.GetCellSize());
    pkt.WriteByte(static_cast<uint8_t>(algo));
    pkt.WriteUInt(static_cast<uint32_t>(body.size()));
    pkt.WriteBytes(body);
    return pkt;
}

std::optional<FogUpdate> SnapshotCodec::DecodeFog(const Packet& pkt) {
    if (!HasTag(pkt, PacketType::PT_FOG)) return std::nullopt;
    Packet copy = pkt;
    copy.ResetRead();
    try {
        FogUpdate fog;
        fog.team = copy.ReadByte();
        uint32_t width  = copy.ReadUInt();
        uint32_t height = copy.ReadUInt();
        float cellSize  = copy.ReadFloat();
        uint8_t algo    = copy.ReadByte();
        uint32_t length = copy.ReadUInt();
        std::vector<uint8_t> body = copy.ReadBytes(length);

        if (width == 0 || height == 0 || static_cast<uint64_t>(width) * height > kMaxFogCells) {
            Logger::Warn("SnapshotCodec: fog grid %ux%u rejected", width, height);
            return std::nullopt;
        }
        if (algo > static_cast<uint8_t>(CompressionAlgorithm::LZ4)) {
            Logger::Warn("SnapshotCodec: unknown fog compression %u", algo);
            return std::nullopt;
        }

        const size_t packedSize = (static_cast<size_t>(width) * height + 7) / 8;
        std::vector<uint8_t> bits;
        if (!CompressionHandler::Decompress(body, bits, static_cast<CompressionAlgorithm>(algo), packedSize)) {
            Logger::Warn("SnapshotCodec: fog payload failed to decompress");
            return std::nullopt;
        }
        if (!VisionGrid::Unpack(static_cast<int>(width), static_cast<int>(height), cellSize, bits, fog.grid)) {
            Logger::Warn("SnapshotCodec: fog payload size mismatch");
            return std::nullopt;
        }
        return fog;
    } catch (const std::out_of_range& e) {
        Logger::Warn("SnapshotCodec: malformed fog update (%s)", e.what());
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

Packet SnapshotCodec::EncodeEvent(const GameEvent& event) {
    Packet pkt(ToString(PacketType::PT_EVENT));
    pkt.WriteByte(static_cast<uint8_t>(event.type));
    pkt.WriteUInt(event.tick);
    pkt.WriteUInt(event.unitId);
    pkt.WriteUInt(event.pointId);
    pkt.WriteByte(static_cast<uint8_t>(event.team));
    pkt.WriteByte(static_cast<uint8_t>(event.previousTeam));
    pkt.WriteByte(static_cast<uint8_t>(event.fromState));
    pkt.WriteByte(static_cast<uint8_t>(event.toState));
    pkt.WriteVector3(event.position);
    pkt.WriteString(event.detail);
    return pkt;
}

std::optional<GameEvent> SnapshotCodec::DecodeEvent(const Packet& pkt) {
    if (!HasTag(pkt, PacketType::PT_EVENT)) return std::nullopt;
    Packet copy = pkt;
    copy.ResetRead();
    try {
        GameEvent ev;
        uint8_t type = copy.ReadByte();
        if (type > kLastEventType) {
            Logger::Warn("SnapshotCodec: unknown event type %u", type);
            return std::nullopt;
        }
        ev.type         = static_cast<GameEventType>(type);
        ev.tick         = copy.ReadUInt();
        ev.unitId       = copy.ReadUInt();
        ev.pointId      = copy.ReadUInt();
        ev.team         = copy.ReadByte();
        ev.previousTeam = copy.ReadByte();
        uint8_t from    = copy.ReadByte();
        uint8_t to      = copy.ReadByte();
        if (from > kLastUnitState || to > kLastUnitState) {
            Logger::Warn("SnapshotCodec: event carries invalid unit state");
            return std::nullopt;
        }
        ev.fromState = static_cast<UnitState>(from);
        ev.toState   = static_cast<UnitState>(to);
        ev.position  = copy.ReadVector3();
        ev.detail    = copy.ReadString();
        return ev;
    } catch (const std::out_of_range& e) {
        Logger::Warn("SnapshotCodec: malformed event (%s)", e.what());
        return std::nullopt;
    }
}
