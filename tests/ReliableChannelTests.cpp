// tests/ReliableChannelTests.cpp
// Unit tests for per-peer datagram sequencing
//
// Covers:
// 1. Reliable packets delivered once and in order despite reordering and duplicates.
// 2. Acknowledgement, resend and retry exhaustion.
// 3. Stale unreliable datagrams are dropped.
// 4. Malformed datagrams are ignored.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <string>
#include <vector>
#include "Network/ReliableChannel.h"

using namespace std::chrono_literals;

namespace {

Packet Numbered(uint32_t n) {
    Packet pkt("event");
    pkt.WriteUInt(n);
    return pkt;
}

uint32_t NumberOf(Packet pkt) {
    pkt.ResetRead();
    return pkt.ReadUInt();
}

}

class ReliableChannelTests : public ::testing::Test {
protected:
    ReliableChannel::Clock::time_point t0 = ReliableChannel::Clock::now();
    ReliableChannel sender{200ms, 25};
    ReliableChannel receiver{200ms, 25};
};

TEST_F(ReliableChannelTests, Reliable_DeliveredInOrderDespiteReordering) {
    auto d1 = sender.WrapReliable(Numbered(1), t0);
    auto d2 = sender.WrapReliable(Numbered(2), t0);
    auto d3 = sender.WrapReliable(Numbered(3), t0);

    EXPECT_TRUE(receiver.OnDatagram(d3).empty()) << "out of order packet must be held";
    EXPECT_TRUE(receiver.OnDatagram(d2).empty());

    auto ready = receiver.OnDatagram(d1);
    ASSERT_EQ(ready.size(), 3u);
    EXPECT_EQ(NumberOf(ready[0]), 1u);
    EXPECT_EQ(NumberOf(ready[1]), 2u);
    EXPECT_EQ(NumberOf(ready[2]), 3u);
    EXPECT_EQ(receiver.GetReceivedAck(), 3u);
}

TEST_F(ReliableChannelTests, Reliable_DuplicatesDeliveredOnce) {
    auto d1 = sender.WrapReliable(Numbered(1), t0);
    EXPECT_EQ(receiver.OnDatagram(d1).size(), 1u);
    EXPECT_TRUE(receiver.OnDatagram(d1).empty());

    auto d2 = sender.WrapReliable(Numbered(2), t0);
    EXPECT_TRUE(receiver.OnDatagram(sender.WrapReliable(Numbered(3), t0)).empty());
    EXPECT_TRUE(receiver.OnDatagram(sender.CollectResends(t0 + 1s).back()).empty())
        << "resent copy of a buffered packet";
    EXPECT_EQ(receiver.OnDatagram(d2).size(), 2u);
}

TEST_F(ReliableChannelTests, Ack_ClearsUnacked) {
    auto d1 = sender.WrapReliable(Numbered(1), t0);
    auto d2 = sender.WrapReliable(Numbered(2), t0);
    EXPECT_EQ(sender.UnackedCount(), 2u);

    receiver.OnDatagram(d1);
    auto ack = receiver.TakeAck();
    ASSERT_TRUE(ack.has_value());
    EXPECT_FALSE(receiver.TakeAck().has_value()) << "ack taken twice";

    sender.OnDatagram(*ack);
    EXPECT_EQ(sender.UnackedCount(), 1u);

    // Piggybacked on ordinary traffic
    receiver.OnDatagram(d2);
    sender.OnDatagram(receiver.WrapUnreliable(Numbered(99)));
    EXPECT_EQ(sender.UnackedCount(), 0u);
    EXPECT_FALSE(receiver.TakeAck().has_value()) << "outgoing traffic already carried the ack";
}

TEST_F(ReliableChannelTests, Resend_AfterInterval) {
    sender.WrapReliable(Numbered(1), t0);
    EXPECT_TRUE(sender.CollectResends(t0 + 100ms).empty());
    auto due = sender.CollectResends(t0 + 250ms);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_TRUE(sender.CollectResends(t0 + 300ms).empty()) << "interval restarts after a resend";

    auto ready = receiver.OnDatagram(due[0]);
    ASSERT_EQ(ready.size(), 1u);
    EXPECT_EQ(NumberOf(ready[0]), 1u);
}

TEST_F(ReliableChannelTests, RetriesExhausted_ChannelFails) {
    ReliableChannel lossy(100ms, 2);
    lossy.WrapReliable(Numbered(1), t0);

    EXPECT_EQ(lossy.CollectResends(t0 + 100ms).size(), 1u);
    EXPECT_EQ(lossy.CollectResends(t0 + 200ms).size(), 1u);
    EXPECT_FALSE(lossy.HasFailed());

    EXPECT_TRUE(lossy.CollectResends(t0 + 300ms).empty());
    EXPECT_TRUE(lossy.HasFailed());
    EXPECT_TRUE(lossy.CollectResends(t0 + 10s).empty());
}

TEST_F(ReliableChannelTests, Unreliable_StaleDropped) {
    auto u1 = sender.WrapUnreliable(Numbered(1));
    auto u2 = sender.WrapUnreliable(Numbered(2));

    EXPECT_EQ(receiver.OnDatagram(u2).size(), 1u);
    EXPECT_TRUE(receiver.OnDatagram(u1).empty());
    EXPECT_TRUE(receiver.OnDatagram(u2).empty());
    EXPECT_EQ(receiver.GetDroppedStale(), 2u);
    EXPECT_FALSE(receiver.TakeAck().has_value()) << "unreliable traffic needs no ack";
}

TEST_F(ReliableChannelTests, Malformed_Ignored) {
    EXPECT_TRUE(receiver.OnDatagram({}).empty());
    EXPECT_TRUE(receiver.OnDatagram({7, 0, 0, 0, 0, 0, 0, 0, 0}).empty());

    auto d1 = sender.WrapReliable(Numbered(1), t0);
    d1.resize(d1.size() - 3);
    EXPECT_TRUE(receiver.OnDatagram(d1).empty());
    EXPECT_EQ(receiver.GetReceivedAck(), 0u);
}

TEST(DatagramTests, HeaderLayout) {
    DatagramHeader header;
    header.channel = ChannelId::Reliable;
    header.sequence = 0x01020304;
    header.ack = 7;
    Packet pkt("heartbeat");
    auto bytes = EncodeDatagram(header, &pkt);
    ASSERT_GE(bytes.size(), DatagramHeader::kSize);
    EXPECT_EQ(bytes[0], 1u);

    DatagramHeader decoded;
    std::optional<Packet> body;
    ASSERT_TRUE(DecodeDatagram(bytes, decoded, body));
    EXPECT_EQ(decoded.sequence, 0x01020304u);
    EXPECT_EQ(decoded.ack, 7u);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(body->GetTag(), "heartbeat");

    header.channel = ChannelId::Ack;
    ASSERT_TRUE(DecodeDatagram(EncodeDatagram(header, nullptr), decoded, body));
    EXPECT_FALSE(body.has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
