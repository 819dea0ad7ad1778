// src/Network/ReliableChannel.h

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>
#include "Network/Packet.h"

enum class ChannelId : uint8_t {
    Unreliable = 0,
    Reliable   = 1,
    Ack        = 2
};

// Every datagram: [u8 channel][u32 sequence][u32 ack] then a serialized
// Packet (absent on Ack datagrams). ack is the highest reliable sequence
// received in order by the sender of the datagram.
struct DatagramHeader {
    ChannelId channel = ChannelId::Unreliable;
    uint32_t  sequence = 0;
    uint32_t  ack = 0;

    static constexpr size_t kSize = 9;
};

std::vector<uint8_t> EncodeDatagram(const DatagramHeader& header, const Packet* packet);
bool DecodeDatagram(const std::vector<uint8_t>& data, DatagramHeader& outHeader,
                    std::optional<Packet>& outPacket);

// Per-peer sequencing. Reliable packets are resent until acknowledged and
// delivered to the application exactly once, in order. Unreliable packets
// older than the newest one received are dropped. Not thread-safe; owned by
// the tick thread.
class ReliableChannel {
public:
    using Clock = std::chrono::steady_clock;

    ReliableChannel(std::chrono::milliseconds resendInterval, uint32_t maxRetries);

    // Outgoing
    std::vector<uint8_t> WrapUnreliable(const Packet& packet);
    std::vector<uint8_t> WrapReliable(const Packet& packet, Clock::time_point now);

    // Datagrams whose resend interval elapsed. Sets HasFailed() once a packet
    // exhausts its retries; nothing more is returned after that.
    std::vector<std::vector<uint8_t>> CollectResends(Clock::time_point now);

    // Incoming; returns packets ready for the application, in order
    std::vector<Packet> OnDatagram(const std::vector<uint8_t>& data);

    // Standalone ack when reliable data arrived since the last outgoing datagram
    std::optional<std::vector<uint8_t>> TakeAck();

    bool     HasFailed() const { return m_failed; }
    size_t   UnackedCount() const { return m_unacked.size(); }
    uint32_t GetReceivedAck() const { return m_nextExpected - 1; }
    uint64_t GetDroppedStale() const { return m_droppedStale; }

private:
    struct Outgoing {
        uint32_t             sequence;
        std::vector<uint8_t> datagram;
        Clock::time_point    lastSent;
        uint32_t             attempts;
    };

    void ProcessAck(uint32_t ack);

    std::chrono::milliseconds m_resendInterval;
    uint32_t                  m_maxRetries;

    uint32_t m_nextReliableSeq;
    uint32_t m_nextUnreliableSeq;
    std::deque<Outgoing> m_unacked;

    uint32_t m_nextExpected;          // next in-order reliable sequence
    std::map<uint32_t, Packet> m_reorder;
    uint32_t m_lastUnreliable;
    bool     m_ackDue;
    bool     m_failed;
    uint64_t m_droppedStale;
};
