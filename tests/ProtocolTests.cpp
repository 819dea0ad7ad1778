// tests/ProtocolTests.cpp
// Unit tests for packet framing and the host/client message codecs
//
// Covers:
// 1. Packet serialize/parse framing and bounds.
// 2. Client → host messages: hello, ready, command, AI command.
// 3. Host → client messages: hello result, snapshot, fog, event.
// 4. Malformed payloads are rejected without throwing.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <limits>
#include <string>
#include "Network/Packet.h"
#include "Protocol/MessageDecoder.h"
#include "Protocol/MessageEncoder.h"
#include "Protocol/PacketTypes.h"
#include "Protocol/SnapshotCodec.h"

using ::testing::ElementsAre;

namespace {

// Same tag, payload cut to length bytes
Packet Truncate(const Packet& pkt, size_t length) {
    std::vector<uint8_t> payload(pkt.RawData().begin(),
                                 pkt.RawData().begin() + static_cast<std::ptrdiff_t>(length));
    return Packet(pkt.GetTag(), payload);
}

}

/* ---------------------------------------------------------------- */
/* Packet framing                                                     */
/* ---------------------------------------------------------------- */

TEST(PacketTests, SerializeThenParse_KeepsTagAndPayload) {
    Packet pkt("heartbeat");
    pkt.WriteUInt(1234);
    pkt.WriteString("abc");
    pkt.WriteVector3(Vector3(1.0f, 2.0f, 3.0f));

    auto parsed = Packet::FromBuffer(pkt.Serialize());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->GetTag(), "heartbeat");
    EXPECT_EQ(parsed->ReadUInt(), 1234u);
    EXPECT_EQ(parsed->ReadString(), "abc");
    EXPECT_EQ(parsed->ReadVector3(), Vector3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(parsed->Remaining(), 0u);
    EXPECT_THROW(parsed->ReadByte(), std::out_of_range);
}

TEST(PacketTests, FromBuffer_RejectsShortOrOversizedFrames) {
    auto bytes = Packet("event").Serialize();
    bytes.pop_back();
    EXPECT_FALSE(Packet::FromBuffer(bytes).has_value());
    EXPECT_FALSE(Packet::FromBuffer({1, 2}).has_value());

    std::vector<uint8_t> hugeTag = {0xFF, 0xFF, 0x00, 0x00};
    EXPECT_FALSE(Packet::FromBuffer(hugeTag).has_value());
}

TEST(PacketTests, PacketTypeNames) {
    EXPECT_STREQ(ToString(PacketType::PT_SNAPSHOT), "snapshot");
    EXPECT_EQ(PacketTypeFromTag("ai_command"), PacketType::PT_AI_COMMAND);
    EXPECT_EQ(PacketTypeFromTag("invalid"), PacketType::PT_INVALID);
    EXPECT_EQ(PacketTypeFromTag("nonsense"), PacketType::PT_INVALID);
    EXPECT_STREQ(ToString(PacketType::PT_MAX), "invalid");
}

/* ---------------------------------------------------------------- */
/* Client messages                                                    */
/* ---------------------------------------------------------------- */

TEST(MessageCodecTests, Hello_Decodes) {
    HelloMessage hello;
    hello.name = "alpha";
    hello.preferredTeam = TEAM_B;
    hello.wantsHost = true;

    HelloMessage out;
    ASSERT_TRUE(MessageDecoder::DecodeHello(MessageEncoder::EncodeHello(hello), out));
    EXPECT_EQ(out.name, "alpha");
    EXPECT_EQ(out.preferredTeam, TEAM_B);
    EXPECT_TRUE(out.wantsHost);
}

TEST(MessageCodecTests, Hello_RejectsBadNamesAndClampsTeam) {
    HelloMessage hello;
    hello.name = std::string(33, 'x');
    HelloMessage out;
    out.name = "untouched";
    EXPECT_FALSE(MessageDecoder::DecodeHello(MessageEncoder::EncodeHello(hello), out));
    EXPECT_EQ(out.name, "untouched");

    hello.name = "";
    EXPECT_FALSE(MessageDecoder::DecodeHello(MessageEncoder::EncodeHello(hello), out));

    hello.name = "ok";
    hello.preferredTeam = 9;
    ASSERT_TRUE(MessageDecoder::DecodeHello(MessageEncoder::EncodeHello(hello), out));
    EXPECT_EQ(out.preferredTeam, TEAM_NONE);
}

TEST(MessageCodecTests, Command_Decodes) {
    Command cmd;
    cmd.type = CommandType::Formation;
    cmd.units = {4, 5, 6};
    cmd.position = Vector3(10.0f, 12.0f, 0.0f);
    cmd.layout = FormationLayout::Wedge;
    cmd.spacing = 3.0f;
    cmd.source = CommandSource::AI;

    Command out;
    ASSERT_TRUE(MessageDecoder::DecodeCommand(MessageEncoder::EncodeCommand(cmd), out));
    EXPECT_EQ(out.type, CommandType::Formation);
    EXPECT_THAT(out.units, ElementsAre(4u, 5u, 6u));
    EXPECT_EQ(out.position, cmd.position);
    EXPECT_EQ(out.layout, FormationLayout::Wedge);
    EXPECT_FLOAT_EQ(out.spacing, 3.0f);
    EXPECT_EQ(out.source, CommandSource::Manual) << "wire commands are always manual";
}

TEST(MessageCodecTests, Command_RejectsNonFiniteAndUnknownType) {
    Command cmd;
    cmd.type = CommandType::Move;
    cmd.units = {1};
    cmd.position = Vector3(std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f);
    Command out;
    EXPECT_FALSE(MessageDecoder::DecodeCommand(MessageEncoder::EncodeCommand(cmd), out));

    Packet bogus(ToString(PacketType::PT_COMMAND));
    bogus.WriteByte(42);
    EXPECT_FALSE(MessageDecoder::DecodeCommand(bogus, out));
}

TEST(MessageCodecTests, Command_Truncated_Rejected) {
    Command cmd;
    cmd.type = CommandType::Attack;
    cmd.units = {1, 2};
    cmd.targetUnit = 9;
    Packet full = MessageEncoder::EncodeCommand(cmd);

    Command out;
    for (size_t len = 0; len < full.GetPayloadSize(); ++len) {
        EXPECT_FALSE(MessageDecoder::DecodeCommand(Truncate(full, len), out)) << "length " << len;
    }
}

TEST(MessageCodecTests, WrongTag_Rejected) {
    bool ready = false;
    EXPECT_FALSE(MessageDecoder::DecodeReady(MessageEncoder::EncodeLeave(), ready));
    ASSERT_TRUE(MessageDecoder::DecodeReady(MessageEncoder::EncodeReady(true), ready));
    EXPECT_TRUE(ready);

    uint32_t tick = 0;
    EXPECT_FALSE(MessageDecoder::DecodeHeartbeat(MessageEncoder::EncodeReady(true), tick));
    ASSERT_TRUE(MessageDecoder::DecodeHeartbeat(MessageEncoder::EncodeHeartbeat(900), tick));
    EXPECT_EQ(tick, 900u);
}

TEST(MessageCodecTests, AICommand_LimitsText) {
    AICommandMessage msg;
    msg.text = "hold the east point";
    msg.units = {3};
    AICommandMessage out;
    ASSERT_TRUE(MessageDecoder::DecodeAICommand(MessageEncoder::EncodeAICommand(msg), out));
    EXPECT_EQ(out.text, msg.text);
    EXPECT_THAT(out.units, ElementsAre(3u));

    msg.text.clear();
    EXPECT_FALSE(MessageDecoder::DecodeAICommand(MessageEncoder::EncodeAICommand(msg), out));
}

TEST(MessageCodecTests, HelloResult_Decodes) {
    HelloResultMessage msg;
    msg.result = SessionResult::LobbyFull;
    msg.connection = 17;
    msg.team = TEAM_NONE;

    HelloResultMessage out;
    ASSERT_TRUE(MessageDecoder::DecodeHelloResult(MessageEncoder::EncodeHelloResult(msg), out));
    EXPECT_EQ(out.result, SessionResult::LobbyFull);
    EXPECT_EQ(out.connection, 17u);
    EXPECT_TRUE(out.token.empty());
}

/* ---------------------------------------------------------------- */
/* Host messages                                                      */
/* ---------------------------------------------------------------- */

TEST(SnapshotCodecTests, Snapshot_Decodes) {
    WorldSnapshot snap;
    snap.tick = 300;
    snap.team = TEAM_B;
    UnitSnapshot u;
    u.id = 12;
    u.team = TEAM_B;
    u.owner = 2;
    u.archetype = "medic";
    u.position = Vector3(5.0f, 6.0f, 0.0f);
    u.state = UnitState::ChargingAbility;
    u.abilityCharge = 0.5f;
    u.flags = USF_INVULNERABLE | USF_STEALTHED;
    snap.units.push_back(u);
    ControlPointSnapshot p;
    p.id = 2;
    p.captureValue = -0.4f;
    p.owner = TEAM_NONE;
    snap.points.push_back(p);

    auto out = SnapshotCodec::DecodeSnapshot(SnapshotCodec::EncodeSnapshot(snap));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->tick, 300u);
    ASSERT_EQ(out->units.size(), 1u);
    EXPECT_EQ(out->units[0].archetype, "medic");
    EXPECT_EQ(out->units[0].state, UnitState::ChargingAbility);
    EXPECT_EQ(out->units[0].flags, USF_INVULNERABLE | USF_STEALTHED);
    ASSERT_EQ(out->points.size(), 1u);
    EXPECT_FLOAT_EQ(out->points[0].captureValue, -0.4f);
}

TEST(SnapshotCodecTests, Snapshot_BadStateOrCountRejected) {
    WorldSnapshot snap;
    UnitSnapshot u;
    u.id = 1;
    snap.units.push_back(u);
    Packet pkt = SnapshotCodec::EncodeSnapshot(snap);

    Packet full = pkt;
    EXPECT_FALSE(SnapshotCodec::DecodeSnapshot(Truncate(full, full.GetPayloadSize() - 2)).has_value());

    Packet huge(ToString(PacketType::PT_SNAPSHOT));
    huge.WriteUInt(1);
    huge.WriteByte(TEAM_A);
    huge.WriteUInt(1000000);
    EXPECT_FALSE(SnapshotCodec::DecodeSnapshot(huge).has_value());

    EXPECT_FALSE(SnapshotCodec::DecodeSnapshot(MessageEncoder::EncodeLeave()).has_value());
}

class FogCodecTests : public ::testing::TestWithParam<CompressionAlgorithm> {};

TEST_P(FogCodecTests, Fog_DecodesWithEachCompression) {
    VisionGrid grid(40, 30, 2.0f);
    grid.RevealDisk(Vector3(20.0f, 20.0f, 0.0f), 9.0f);

    auto out = SnapshotCodec::DecodeFog(SnapshotCodec::EncodeFog(TEAM_A, grid, GetParam()));
    ASSERT_TRUE(out.has_value()) << CompressionHandler::ToString(GetParam());
    EXPECT_EQ(out->team, TEAM_A);
    EXPECT_EQ(out->grid, grid);
}

INSTANTIATE_TEST_SUITE_P(Algorithms, FogCodecTests,
                         ::testing::Values(CompressionAlgorithm::NONE,
                                           CompressionAlgorithm::ZLIB,
                                           CompressionAlgorithm::LZ4));

TEST(SnapshotCodecTests, Fog_CorruptBodyRejected) {
    VisionGrid grid(16, 16, 1.0f);
    Packet pkt = SnapshotCodec::EncodeFog(TEAM_B, grid, CompressionAlgorithm::ZLIB);

    std::vector<uint8_t> payload = pkt.RawData();
    payload.back() ^= 0xFF;
    payload[payload.size() - 2] ^= 0xFF;
    EXPECT_FALSE(SnapshotCodec::DecodeFog(Packet(pkt.GetTag(), payload)).has_value());

    Packet zero(ToString(PacketType::PT_FOG));
    zero.WriteByte(TEAM_A);
    zero.WriteUInt(0);
    zero.WriteUInt(10);
    zero.WriteFloat(1.0f);
    zero.WriteByte(0);
    zero.WriteUInt(0);
    EXPECT_FALSE(SnapshotCodec::DecodeFog(zero).has_value());
}

TEST(SnapshotCodecTests, Event_Decodes) {
    GameEvent ev;
    ev.type = GameEventType::ControlPointNeutralized;
    ev.tick = 55;
    ev.pointId = 3;
    ev.previousTeam = TEAM_A;
    ev.position = Vector3(52.0f, 12.0f, 0.0f);

    auto out = SnapshotCodec::DecodeEvent(SnapshotCodec::EncodeEvent(ev));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->type, GameEventType::ControlPointNeutralized);
    EXPECT_EQ(out->pointId, 3u);
    EXPECT_EQ(out->previousTeam, TEAM_A);
    EXPECT_EQ(out->position, ev.position);

    Packet bad(ToString(PacketType::PT_EVENT));
    bad.WriteByte(200);
    EXPECT_FALSE(SnapshotCodec::DecodeEvent(bad).has_value());
}

TEST(SnapshotCodecTests, EventNames) {
    EXPECT_STREQ(ToString(GameEventType::UnitDied), "unit_died");
    EXPECT_STREQ(ToString(GameEventType::ControlPointCaptured), "control_point_captured");
    EXPECT_FALSE(IsNetworkEvent(GameEventType::UnitStateChanged));
    EXPECT_TRUE(IsNetworkEvent(GameEventType::AIServiceError));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
