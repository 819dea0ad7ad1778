// src/Network/Packet.cpp

#include "Network/Packet.h"
#include <cstring>
#include <stdexcept>

namespace {
constexpr uint32_t kMaxTagLength = 64;
}

Packet::Packet(const std::string& tag)
    : m_tag(tag)
{}

Packet::Packet(const std::string& tag, const std::vector<uint8_t>& payload)
    : m_tag(tag), m_payload(payload)
{}

std::vector<uint8_t> Packet::Serialize() const {
    std::vector<uint8_t> buf;
    uint32_t tagLen = (uint32_t)m_tag.size();
    uint32_t payloadLen = (uint32_t)m_payload.size();

    buf.resize(8 + tagLen + payloadLen);
    size_t offset = 0;
    std::memcpy(&buf[offset], &tagLen, 4); offset += 4;
    if (tagLen) {
        std::memcpy(&buf[offset], m_tag.data(), tagLen);
    }
    offset += tagLen;
    std::memcpy(&buf[offset], &payloadLen, 4); offset += 4;
    if (payloadLen) {
        std::memcpy(&buf[offset], m_payload.data(), payloadLen);
    }
    return buf;
}

std::optional<Packet> Packet::FromBuffer(const std::vector<uint8_t>& buffer, size_t offset) {
    if (buffer.size() < offset + 4) return std::nullopt;
    uint32_t tagLen = 0;
    std::memcpy(&tagLen, &buffer[offset], 4); offset += 4;
    if (tagLen > kMaxTagLength || buffer.size() < offset + tagLen + 4) return std::nullopt;

    Packet pkt;
    pkt.m_tag.assign(reinterpret_cast<const char*>(buffer.data() + offset), tagLen);
    offset += tagLen;

    uint32_t payloadLen = 0;
    std::memcpy(&payloadLen, &buffer[offset], 4); offset += 4;
    if (buffer.size() - offset < payloadLen) return std::nullopt;
    pkt.m_payload.assign(buffer.begin() + offset, buffer.begin() + offset + payloadLen);
    return pkt;
}

const std::string& Packet::GetTag() const { return m_tag; }
uint32_t Packet::GetPayloadSize() const { return (uint32_t)m_payload.size(); }
const std::vector<uint8_t>& Packet::RawData() const { return m_payload; }
size_t Packet::Remaining() const { return m_payload.size() - m_readOffset; }

void Packet::Require(size_t bytes) const {
    if (m_payload.size() - m_readOffset < bytes) {
        throw std::out_of_range("Packet '" + m_tag + "': read past end of payload");
    }
}

void Packet::Append(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    m_payload.insert(m_payload.end(), p, p + len);
}

void Packet::WriteByte(uint8_t v)    { m_payload.push_back(v); }
void Packet::WriteBool(bool v)       { m_payload.push_back(v ? 1 : 0); }
void Packet::WriteUInt16(uint16_t v) { Append(&v, 2); }
void Packet::WriteUInt(uint32_t v)   { Append(&v, 4); }
void Packet::WriteUInt64(uint64_t v) { Append(&v, 8); }
void Packet::WriteInt(int32_t v)     { WriteUInt((uint32_t)v); }
void Packet::WriteFloat(float f)     { Append(&f, 4); }

void Packet::WriteString(const std::string& s) {
    WriteUInt((uint32_t)s.size());
    Append(s.data(), s.size());
}

void Packet::WriteVector3(const Vector3& v) {
    WriteFloat(v.x); WriteFloat(v.y); WriteFloat(v.z);
}

void Packet::WriteBytes(const std::vector<uint8_t>& data) {
    m_payload.insert(m_payload.end(), data.begin(), data.end());
}

uint8_t Packet::ReadByte() {
    Require(1);
    return m_payload[m_readOffset++];
}

bool Packet::ReadBool() { return ReadByte() != 0; }

uint16_t Packet::ReadUInt16() {
    Require(2);
    uint16_t v = 0;
    std::memcpy(&v, &m_payload[m_readOffset], 2);
    m_readOffset += 2; return v;
}

uint32_t Packet::ReadUInt() {
    Require(4);
    uint32_t v = 0;
    std::memcpy(&v, &m_payload[m_readOffset], 4);
    m_readOffset += 4; return v;
}

uint64_t Packet::ReadUInt64() {
    Require(8);
    uint64_t v = 0;
    std::memcpy(&v, &m_payload[m_readOffset], 8);
    m_readOffset += 8; return v;
}

int32_t Packet::ReadInt() { return (int32_t)ReadUInt(); }

float Packet::ReadFloat() {
    Require(4);
    float f = 0;
    std::memcpy(&f, &m_payload[m_readOffset], 4);
    m_readOffset += 4; return f;
}

std::string Packet::ReadString() {
    uint32_t len = ReadUInt();
    Require(len);
    std::string s(reinterpret_cast<const char*>(m_payload.data()) + m_readOffset, len);
    m_readOffset += len;
    return s;
}

Vector3 Packet::ReadVector3() {
    Vector3 v; v.x = ReadFloat(); v.y = ReadFloat(); v.z = ReadFloat(); return v;
}

std::vector<uint8_t> Packet::ReadBytes(size_t count) {
    Require(count);
    std::vector<uint8_t> out(m_payload.begin() + m_readOffset,
                             m_payload.begin() + m_readOffset + count);
    m_readOffset += count; return out;
}
