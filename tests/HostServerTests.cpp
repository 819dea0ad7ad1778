// tests/HostServerTests.cpp
// Message handling of the authoritative host over an in-memory transport
//
// Covers:
// 1. Hello handshake replies with team and session token.
// 2. Malformed requests answered with command_rejected.
// 3. Match auto-start once everyone is ready, events and snapshots follow.
// 4. Heartbeat echo and leave handling.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <vector>
#include "Config/ArchetypeCatalog.h"
#include "Game/HostServer.h"
#include "Game/MapDefinition.h"
#include "Network/ObserverTransport.h"
#include "Protocol/MessageDecoder.h"
#include "Protocol/MessageEncoder.h"
#include "Protocol/PacketTypes.h"
#include "Protocol/SnapshotCodec.h"

using ::testing::Contains;
using ::testing::IsEmpty;

namespace {

struct SentPacket {
    ConnectionId conn;
    bool         reliable;
    Packet       packet;
};

class RecordingTransport : public IObserverTransport {
public:
    bool SendUnreliable(ConnectionId conn, const Packet& packet) override {
        sent.push_back({conn, false, packet});
        return true;
    }
    bool SendReliable(ConnectionId conn, const Packet& packet) override {
        sent.push_back({conn, true, packet});
        return true;
    }
    void Disconnect(ConnectionId conn) override {
        disconnected.push_back(conn);
    }

    std::vector<SentPacket> To(ConnectionId conn, PacketType type) const {
        std::vector<SentPacket> out;
        for (const auto& s : sent) {
            if (s.conn == conn && s.packet.GetTag() == ToString(type)) out.push_back(s);
        }
        return out;
    }

    std::vector<GameEventType> EventsTo(ConnectionId conn) const {
        std::vector<GameEventType> types;
        for (const auto& s : To(conn, PacketType::PT_EVENT)) {
            auto ev = SnapshotCodec::DecodeEvent(s.packet);
            if (ev) types.push_back(ev->type);
        }
        return types;
    }

    std::vector<SentPacket>   sent;
    std::vector<ConnectionId> disconnected;
};

Packet Hello(const std::string& name, bool host) {
    HelloMessage msg;
    msg.name = name;
    msg.wantsHost = host;
    return MessageEncoder::EncodeHello(msg);
}

}

class HostServerTests : public ::testing::Test {
protected:
    void SetUp() override {
        settings.broadcastInterval = 1;
        server = std::make_unique<HostServer>(settings, ArchetypeCatalog::BuiltIn(),
                                              MapDefinition::Default(), &transport);
        ASSERT_TRUE(server->Initialize());
    }

    void JoinAndReadyBoth() {
        server->HandlePacket(1, Hello("alpha", true));
        server->HandlePacket(2, Hello("bravo", false));
        server->HandlePacket(1, MessageEncoder::EncodeReady(true));
        server->HandlePacket(2, MessageEncoder::EncodeReady(true));
    }

    MatchSettings settings;
    RecordingTransport transport;
    std::unique_ptr<HostServer> server;
};

/* ---------------------------------------------------------------- */
/* Handshake                                                          */
/* ---------------------------------------------------------------- */

TEST_F(HostServerTests, Hello_RepliesWithTeamAndToken) {
    server->HandlePacket(1, Hello("alpha", true));

    auto replies = transport.To(1, PacketType::PT_HELLO_RESULT);
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_TRUE(replies[0].reliable);

    HelloResultMessage result;
    ASSERT_TRUE(MessageDecoder::DecodeHelloResult(replies[0].packet, result));
    EXPECT_EQ(result.result, SessionResult::Ok);
    EXPECT_EQ(result.connection, 1u);
    EXPECT_EQ(result.team, TEAM_A);
    EXPECT_EQ(result.token.size(), 32u);
}

TEST_F(HostServerTests, SecondHost_RefusedWithoutToken) {
    server->HandlePacket(1, Hello("alpha", true));
    server->HandlePacket(2, Hello("bravo", true));

    auto replies = transport.To(2, PacketType::PT_HELLO_RESULT);
    ASSERT_EQ(replies.size(), 1u);
    HelloResultMessage result;
    ASSERT_TRUE(MessageDecoder::DecodeHelloResult(replies[0].packet, result));
    EXPECT_NE(result.result, SessionResult::Ok);
    EXPECT_TRUE(result.token.empty());
}

TEST_F(HostServerTests, MalformedHello_Rejected) {
    server->HandlePacket(5, Packet(ToString(PacketType::PT_HELLO)));

    EXPECT_THAT(transport.To(5, PacketType::PT_HELLO_RESULT), IsEmpty());
    EXPECT_THAT(transport.EventsTo(5), Contains(GameEventType::CommandRejected));
    EXPECT_EQ(server->GetSimulation().GetSessions().PlayerCount(), 0u);
}

TEST_F(HostServerTests, UnexpectedTag_Ignored) {
    server->HandlePacket(1, Packet(ToString(PacketType::PT_SNAPSHOT)));
    EXPECT_THAT(transport.sent, IsEmpty());
}

/* ---------------------------------------------------------------- */
/* Match flow                                                         */
/* ---------------------------------------------------------------- */

TEST_F(HostServerTests, AllReady_StartsMatchAndReplicates) {
    JoinAndReadyBoth();
    ASSERT_TRUE(server->GetSimulation().IsMatchRunning());

    server->TickOnce();
    EXPECT_THAT(transport.EventsTo(1), Contains(GameEventType::MatchStarted));
    EXPECT_THAT(transport.EventsTo(2), Contains(GameEventType::MatchStarted));

    auto snapshots = transport.To(1, PacketType::PT_SNAPSHOT);
    ASSERT_FALSE(snapshots.empty());
    EXPECT_FALSE(snapshots[0].reliable);
    auto snap = SnapshotCodec::DecodeSnapshot(snapshots[0].packet);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->team, TEAM_A);
    EXPECT_EQ(snap->points.size(), 3u);
    EXPECT_TRUE(std::all_of(snap->units.begin(), snap->units.end(),
                            [](const UnitSnapshot& u) { return u.team == TEAM_A; }))
        << "enemy squad spawns outside vision";

    EXPECT_FALSE(transport.To(1, PacketType::PT_FOG).empty());
}

TEST_F(HostServerTests, CommandBeforeMatch_Rejected) {
    server->HandlePacket(1, Hello("alpha", true));
    Command cmd;
    cmd.type = CommandType::Stop;
    cmd.units = {1};
    server->HandlePacket(1, MessageEncoder::EncodeCommand(cmd));
    server->TickOnce();

    EXPECT_THAT(transport.EventsTo(1), Contains(GameEventType::CommandRejected));
}

TEST_F(HostServerTests, Heartbeat_EchoesHostTick) {
    server->TickOnce();
    server->TickOnce();
    server->HandlePacket(3, MessageEncoder::EncodeHeartbeat(99));

    auto beats = transport.To(3, PacketType::PT_HEARTBEAT);
    ASSERT_EQ(beats.size(), 1u);
    uint32_t tick = 0;
    ASSERT_TRUE(MessageDecoder::DecodeHeartbeat(beats[0].packet, tick));
    EXPECT_EQ(tick, 2u);
}

TEST_F(HostServerTests, LeaveMidMatch_OpponentWins) {
    JoinAndReadyBoth();
    server->TickOnce();

    server->HandlePacket(1, MessageEncoder::EncodeLeave());
    EXPECT_THAT(transport.disconnected, Contains(1u));
    server->TickOnce();

    EXPECT_FALSE(server->GetSimulation().IsMatchRunning());
    EXPECT_THAT(transport.EventsTo(2), Contains(GameEventType::MatchEnded));
    EXPECT_EQ(server->GetSimulation().GetSessions().Find(1), nullptr);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
