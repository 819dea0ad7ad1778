// src/Network/UDPSocket.h

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using SocketHandle = int;

struct SocketAddress {
    std::string ip;
    uint16_t    port = 0;

    std::string ToString() const { return ip + ":" + std::to_string(port); }
    bool operator<(const SocketAddress& o) const {
        return ip < o.ip || (ip == o.ip && port < o.port);
    }
    bool operator==(const SocketAddress& o) const { return ip == o.ip && port == o.port; }
};

struct SocketConfig {
    std::chrono::milliseconds recvTimeout{100};
    bool   nonBlocking = false;
    size_t recvBufferSize = 1 << 18;
    size_t sendBufferSize = 1 << 18;
};

class UDPSocket {
public:
    UDPSocket();
    ~UDPSocket();

    UDPSocket(const UDPSocket&) = delete;
    UDPSocket& operator=(const UDPSocket&) = delete;

    // Bind to a local port on all interfaces; 0 picks an ephemeral port
    bool Bind(uint16_t localPort, const SocketConfig& cfg = {});
    void Close();

    bool SendTo(const SocketAddress& to, const std::vector<uint8_t>& data);

    // Bytes received, 0 on timeout, -1 on error. buffer is resized to fit.
    int ReceiveFrom(SocketAddress& from, std::vector<uint8_t>& buffer);

    bool     IsOpen() const;
    uint16_t GetLocalPort() const;

private:
    bool Configure(const SocketConfig& cfg);

    SocketHandle m_sock{-1};
    SocketConfig m_cfg;
};
