// src/Network/ReliableChannel.cpp

#include "Network/ReliableChannel.h"
#include "Utils/Logger.h"

#include <cstring>

namespace {
// Reliable packets further ahead than this are discarded rather than buffered
constexpr uint32_t kReorderWindow = 256;
}

std::vector<uint8_t> EncodeDatagram(const DatagramHeader& header, const Packet* packet) {
    std::vector<uint8_t> buf(DatagramHeader::kSize);
    buf[0] = static_cast<uint8_t>(header.channel);
    std::memcpy(&buf[1], &header.sequence, 4);
    std::memcpy(&buf[5], &header.ack, 4);
    if (packet) {
        auto body = packet->Serialize();
        buf.insert(buf.end(), body.begin(), body.end());
    }
    return buf;
}

bool DecodeDatagram(const std::vector<uint8_t>& data, DatagramHeader& outHeader,
                    std::optional<Packet>& outPacket) {
    if (data.size() < DatagramHeader::kSize) return false;
    if (data[0] > static_cast<uint8_t>(ChannelId::Ack)) return false;

    DatagramHeader header;
    header.channel = static_cast<ChannelId>(data[0]);
    std::memcpy(&header.sequence, &data[1], 4);
    std::memcpy(&header.ack, &data[5], 4);

    outPacket.reset();
    if (header.channel != ChannelId::Ack) {
        outPacket = Packet::FromBuffer(data, DatagramHeader::kSize);
        if (!outPacket) return false;
    }
    outHeader = header;
    return true;
}

ReliableChannel::ReliableChannel(std::chrono::milliseconds resendInterval, uint32_t maxRetries)
    : m_resendInterval(resendInterval)
    , m_maxRetries(maxRetries)
    , m_nextReliableSeq(1)
    , m_nextUnreliableSeq(1)
    , m_nextExpected(1)
    , m_lastUnreliable(0)
    , m_ackDue(false)
    , m_failed(false)
    , m_droppedStale(0)
{
}

std::vector<uint8_t> ReliableChannel::WrapUnreliable(const Packet& packet) {
    DatagramHeader header;
    header.channel = ChannelId::Unreliable;
    header.sequence = m_nextUnreliableSeq++;
    header.ack = GetReceivedAck();
    m_ackDue = false;
    return EncodeDatagram(header, &packet);
}

std::vector<uint8_t> ReliableChannel::WrapReliable(const Packet& packet, Clock::time_point now) {
    DatagramHeader header;
    header.channel = ChannelId::Reliable;
    header.sequence = m_nextReliableSeq++;
    header.ack = GetReceivedAck();
    m_ackDue = false;

    Outgoing out{header.sequence, EncodeDatagram(header, &packet), now, 1};
    m_unacked.push_back(out);
    return out.datagram;
}

std::vector<std::vector<uint8_t>> ReliableChannel::CollectResends(Clock::time_point now) {
    std::vector<std::vector<uint8_t>> due;
    if (m_failed) return due;

    const uint32_t ack = GetReceivedAck();
    for (auto& out : m_unacked) {
        if (now - out.lastSent < m_resendInterval) continue;
        if (out.attempts > m_maxRetries) {
            Logger::Warn("ReliableChannel: sequence %u unacknowledged after %u retries",
                         out.sequence, m_maxRetries);
            m_failed = true;
            due.clear();
            return due;
        }
        // Refresh the piggybacked ack
        std::memcpy(&out.datagram[5], &ack, 4);
        out.lastSent = now;
        ++out.attempts;
        due.push_back(out.datagram);
    }
    return due;
}

std::vector<Packet> ReliableChannel::OnDatagram(const std::vector<uint8_t>& data) {
    std::vector<Packet> ready;
    DatagramHeader header;
    std::optional<Packet> packet;
    if (!DecodeDatagram(data, header, packet)) {
        Logger::Debug("ReliableChannel: dropped malformed datagram (%zu bytes)", data.size());
        return ready;
    }

    ProcessAck(header.ack);

    switch (header.channel) {
        case ChannelId::Ack:
            break;

        case ChannelId::Unreliable:
            if (header.sequence <= m_lastUnreliable) {
                ++m_droppedStale;
                break;
            }
            m_lastUnreliable = header.sequence;
            ready.push_back(std::move(*packet));
            break;

        case ChannelId::Reliable:
            m_ackDue = true;
            if (header.sequence < m_nextExpected ||
                header.sequence >= m_nextExpected + kReorderWindow) {
                break;
            }
            m_reorder.emplace(header.sequence, std::move(*packet));
            for (auto it = m_reorder.find(m_nextExpected); it != m_reorder.end();
                 it = m_reorder.find(m_nextExpected)) {
                ready.push_back(std::move(it->second));
                m_reorder.erase(it);
                ++m_nextExpected;
            }
            break;
    }
    return ready;
}

std::optional<std::vector<uint8_t>> ReliableChannel::TakeAck() {
    if (!m_ackDue) return std::nullopt;
    m_ackDue = false;
    DatagramHeader header;
    header.channel = ChannelId::Ack;
    header.ack = GetReceivedAck();
    return EncodeDatagram(header, nullptr);
}

void ReliableChannel::ProcessAck(uint32_t ack) {
    while (!m_unacked.empty() && m_unacked.front().sequence <= ack) {
        m_unacked.pop_front();
    }
}
