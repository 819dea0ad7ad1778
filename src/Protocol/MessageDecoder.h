// src/Protocol/MessageDecoder.h
#pragma once

#include <cstdint>
#include "Network/Packet.h"
#include "Protocol/MessageEncoder.h"

class MessageDecoder {
public:
    // Each returns false on a tag mismatch or malformed payload;
    // out is untouched in that case
    static bool DecodeHello(const Packet& pkt, HelloMessage& out);
    static bool DecodeReady(const Packet& pkt, bool& outReady);
    static bool DecodeCommand(const Packet& pkt, Command& out);
    static bool DecodeAICommand(const Packet& pkt, AICommandMessage& out);
    static bool DecodeHelloResult(const Packet& pkt, HelloResultMessage& out);
    static bool DecodeHeartbeat(const Packet& pkt, uint32_t& outTick);
};
