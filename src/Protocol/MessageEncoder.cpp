// src/Protocol/MessageEncoder.cpp
#include "Protocol/MessageEncoder.h"
#include "Protocol/PacketTypes.h"

Packet MessageEncoder::EncodeHello(const HelloMessage& msg) {
    Packet pkt(ToString(PacketType::PT_HELLO));
    pkt.WriteString(msg.name);
    pkt.WriteByte(static_cast<uint8_t>(msg.preferredTeam));
    pkt.WriteBool(msg.wantsHost);
    return pkt;
}

Packet MessageEncoder::EncodeReady(bool ready) {
    Packet pkt(ToString(PacketType::PT_READY));
    pkt.WriteBool(ready);
    return pkt;
}

Packet MessageEncoder::EncodeCommand(const Command& command) {
    Packet pkt(ToString(PacketType::PT_COMMAND));
    pkt.WriteByte(static_cast<uint8_t>(command.type));
    pkt.WriteUInt(static_cast<uint32_t>(command.units.size()));
    for (UnitId id : command.units) {
        pkt.WriteUInt(id);
    }
    pkt.WriteVector3(command.position);
    pkt.WriteUInt(command.targetUnit);
    pkt.WriteByte(static_cast<uint8_t>(command.layout));
    pkt.WriteFloat(command.spacing);
    return pkt;
}

Packet MessageEncoder::EncodeAICommand(const AICommandMessage& msg) {
    Packet pkt(ToString(PacketType::PT_AI_COMMAND));
    pkt.WriteString(msg.text);
    pkt.WriteUInt(static_cast<uint32_t>(msg.units.size()));
    for (UnitId id : msg.units) {
        pkt.WriteUInt(id);
    }
    return pkt;
}

Packet MessageEncoder::EncodeLeave() {
    return Packet(ToString(PacketType::PT_LEAVE));
}

Packet MessageEncoder::EncodeHelloResult(const HelloResultMessage& msg) {
    Packet pkt(ToString(PacketType::PT_HELLO_RESULT));
    pkt.WriteByte(static_cast<uint8_t>(msg.result));
    pkt.WriteUInt(msg.connection);
    pkt.WriteByte(static_cast<uint8_t>(msg.team));
    pkt.WriteString(msg.token);
    return pkt;
}

Packet MessageEncoder::EncodeHeartbeat(uint32_t tick) {
    Packet pkt(ToString(PacketType::PT_HEARTBEAT));
    pkt.WriteUInt(tick);
    return pkt;
}
