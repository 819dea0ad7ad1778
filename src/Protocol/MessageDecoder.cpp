// src/Protocol/MessageDecoder.cpp
#include "Protocol/MessageDecoder.h"
#include "Protocol/PacketTypes.h"
#include "Utils/Logger.h"

#include <cmath>
#include <stdexcept>

namespace {
constexpr size_t   kMaxNameLength   = 32;
constexpr size_t   kMaxAITextLength = 512;
constexpr uint32_t kMaxUnitIds      = 256;

std::vector<UnitId> ReadUnitIds(Packet& pkt) {
    uint32_t count = pkt.ReadUInt();
    if (count > kMaxUnitIds) {
        throw std::out_of_range("unit id list too long");
    }
    std::vector<UnitId> ids;
    ids.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ids.push_back(pkt.ReadUInt());
    }
    return ids;
}

bool IsFinite(const Vector3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
}

bool MessageDecoder::DecodeHello(const Packet& pkt, HelloMessage& out) {
    if (pkt.GetTag() != ToString(PacketType::PT_HELLO)) return false;
    Packet copy = pkt;
    try {
        HelloMessage msg;
        msg.name = copy.ReadString();
        msg.preferredTeam = copy.ReadByte();
        msg.wantsHost = copy.ReadBool();
        if (msg.name.empty() || msg.name.size() > kMaxNameLength) {
            Logger::Warn("MessageDecoder: hello with invalid name length %zu", msg.name.size());
            return false;
        }
        if (msg.preferredTeam != TEAM_NONE && !IsPlayingTeam(msg.preferredTeam)) {
            msg.preferredTeam = TEAM_NONE;
        }
        out = std::move(msg);
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed hello (%s)", e.what());
        return false;
    }
}

bool MessageDecoder::DecodeReady(const Packet& pkt, bool& outReady) {
    if (pkt.GetTag() != ToString(PacketType::PT_READY)) return false;
    Packet copy = pkt;
    try {
        outReady = copy.ReadBool();
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed ready (%s)", e.what());
        return false;
    }
}

bool MessageDecoder::DecodeCommand(const Packet& pkt, Command& out) {
    if (pkt.GetTag() != ToString(PacketType::PT_COMMAND)) return false;
    Packet copy = pkt;
    try {
        Command cmd;
        uint8_t type = copy.ReadByte();
        if (type > static_cast<uint8_t>(CommandType::UseAbility)) {
            Logger::Warn("MessageDecoder: unknown command type %u", type);
            return false;
        }
        cmd.type = static_cast<CommandType>(type);
        cmd.units = ReadUnitIds(copy);
        cmd.position = copy.ReadVector3();
        cmd.targetUnit = copy.ReadUInt();
        uint8_t layout = copy.ReadByte();
        if (layout > static_cast<uint8_t>(FormationLayout::Box)) {
            Logger::Warn("MessageDecoder: unknown formation layout %u", layout);
            return false;
        }
        cmd.layout = static_cast<FormationLayout>(layout);
        cmd.spacing = copy.ReadFloat();
        if (!IsFinite(cmd.position) || !std::isfinite(cmd.spacing)) {
            Logger::Warn("MessageDecoder: command carries non-finite coordinates");
            return false;
        }
        cmd.source = CommandSource::Manual;
        out = std::move(cmd);
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed command (%s)", e.what());
        return false;
    }
}

bool MessageDecoder::DecodeAICommand(const Packet& pkt, AICommandMessage& out) {
    if (pkt.GetTag() != ToString(PacketType::PT_AI_COMMAND)) return false;
    Packet copy = pkt;
    try {
        AICommandMessage msg;
        msg.text = copy.ReadString();
        msg.units = ReadUnitIds(copy);
        if (msg.text.empty() || msg.text.size() > kMaxAITextLength) {
            Logger::Warn("MessageDecoder: AI command text length %zu rejected", msg.text.size());
            return false;
        }
        out = std::move(msg);
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed AI command (%s)", e.what());
        return false;
    }
}

bool MessageDecoder::DecodeHelloResult(const Packet& pkt, HelloResultMessage& out) {
    if (pkt.GetTag() != ToString(PacketType::PT_HELLO_RESULT)) return false;
    Packet copy = pkt;
    try {
        HelloResultMessage msg;
        uint8_t result = copy.ReadByte();
        if (result > static_cast<uint8_t>(SessionResult::TeamsNotReady)) return false;
        msg.result = static_cast<SessionResult>(result);
        msg.connection = copy.ReadUInt();
        msg.team = copy.ReadByte();
        msg.token = copy.ReadString();
        out = std::move(msg);
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed hello result (%s)", e.what());
        return false;
    }
}

bool MessageDecoder::DecodeHeartbeat(const Packet& pkt, uint32_t& outTick) {
    if (pkt.GetTag() != ToString(PacketType::PT_HEARTBEAT)) return false;
    Packet copy = pkt;
    try {
        outTick = copy.ReadUInt();
        return true;
    } catch (const std::out_of_range& e) {
        Logger::Warn("MessageDecoder: malformed heartbeat (%s)", e.what());
        return false;
    }
}
