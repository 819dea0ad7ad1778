// src/Protocol/MessageEncoder.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "Game/Command.h"
#include "Game/GameTypes.h"
#include "Game/SessionManager.h"
#include "Network/Packet.h"

// Session handshake payloads
struct HelloMessage {
    std::string name;
    TeamId      preferredTeam = TEAM_NONE;
    bool        wantsHost = false;
};

struct HelloResultMessage {
    SessionResult result = SessionResult::Ok;
    ConnectionId  connection = kInvalidConnection;
    TeamId        team = TEAM_NONE;
    std::string   token;
};

struct AICommandMessage {
    std::string         text;
    std::vector<UnitId> units;
};

class MessageEncoder {
public:
    // client → host
    static Packet EncodeHello(const HelloMessage& msg);
    static Packet EncodeReady(bool ready);
    static Packet EncodeCommand(const Command& command);
    static Packet EncodeAICommand(const AICommandMessage& msg);
    static Packet EncodeLeave();

    // host → client
    static Packet EncodeHelloResult(const HelloResultMessage& msg);

    // both
    static Packet EncodeHeartbeat(uint32_t tick);
};
