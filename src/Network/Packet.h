// src/Network/Packet.h

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Math/Vector3.h"

// Tagged binary message. Reads past the end of the payload throw
// std::out_of_range; decoders catch it at their boundary.
class Packet {
public:
    Packet() = default;
    explicit Packet(const std::string& tag);
    Packet(const std::string& tag, const std::vector<uint8_t>& payload);

    // Format: [4B tag length][tag bytes][4B payload length][payload bytes]
    std::vector<uint8_t> Serialize() const;
    static std::optional<Packet> FromBuffer(const std::vector<uint8_t>& buffer, size_t offset = 0);

    const std::string& GetTag() const;
    uint32_t           GetPayloadSize() const;

    void WriteByte(uint8_t v);
    void WriteBool(bool v);
    void WriteUInt16(uint16_t v);
    void WriteUInt(uint32_t v);
    void WriteUInt64(uint64_t v);
    void WriteInt(int32_t v);
    void WriteFloat(float v);
    void WriteString(const std::string& s);
    void WriteVector3(const Vector3& v);
    void WriteBytes(const std::vector<uint8_t>& data);

    uint8_t  ReadByte();
    bool     ReadBool();
    uint16_t ReadUInt16();
    uint32_t ReadUInt();
    uint64_t ReadUInt64();
    int32_t  ReadInt();
    float    ReadFloat();
    std::string ReadString();
    Vector3  ReadVector3();
    std::vector<uint8_t> ReadBytes(size_t count);

    size_t Remaining() const;
    void   ResetRead() { m_readOffset = 0; }

    const std::vector<uint8_t>& RawData() const;

private:
    std::string          m_tag;
    std::vector<uint8_t> m_payload;
    size_t               m_readOffset = 0;

    void Require(size_t bytes) const;
    void Append(const void* data, size_t len);
};
