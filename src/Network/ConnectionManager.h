// src/Network/ConnectionManager.h – UDP endpoint mapping remote addresses to connections

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>
#include "Game/GameTypes.h"
#include "Network/NetworkThread.h"
#include "Network/ObserverTransport.h"
#include "Network/PacketQueue.h"
#include "Network/ReliableChannel.h"
#include "Network/UDPSocket.h"

struct InboundPacket {
    ConnectionId connection = kInvalidConnection;
    Packet       packet;
};

struct TransportSettings {
    std::chrono::milliseconds resendInterval{200};
    uint32_t                  maxRetries = 25;
    std::chrono::milliseconds idleTimeout{10000};
    size_t                    maxConnections = 16;
};

// All methods except the receive thread run on the tick thread.
class ConnectionManager : public IObserverTransport {
public:
    using Clock = std::chrono::steady_clock;

    explicit ConnectionManager(const TransportSettings& settings);
    ~ConnectionManager() override;

    bool Initialize(uint16_t listenPort);
    void Shutdown();

    // Drains received datagrams; unknown addresses become new connections
    std::vector<InboundPacket> PumpNetwork(Clock::time_point now = Clock::now());

    // Sends acks and resends; returns connections lost to retry exhaustion
    // or silence. They are already forgotten by the time this returns.
    std::vector<ConnectionId> Flush(Clock::time_point now = Clock::now());

    bool SendUnreliable(ConnectionId conn, const Packet& packet) override;
    bool SendReliable(ConnectionId conn, const Packet& packet) override;
    void Disconnect(ConnectionId conn) override;

    bool     IsConnected(ConnectionId conn) const { return m_peers.count(conn) != 0; }
    size_t   GetConnectionCount() const { return m_peers.size(); }
    uint16_t GetLocalPort() const { return m_socket.GetLocalPort(); }
    std::optional<SocketAddress> GetAddress(ConnectionId conn) const;

private:
    struct Peer {
        ConnectionId      id;
        SocketAddress     address;
        ReliableChannel   channel;
        Clock::time_point lastHeard;
    };

    Peer* FindPeer(ConnectionId conn);
    ConnectionId CreateOrGetPeer(const SocketAddress& addr, Clock::time_point now);

    TransportSettings m_settings;
    UDPSocket         m_socket;
    PacketQueue       m_inbound;
    std::unique_ptr<NetworkThread> m_thread;

    std::map<ConnectionId, Peer>           m_peers;
    std::map<SocketAddress, ConnectionId>  m_byAddress;
    ConnectionId                           m_nextConnectionId{1};
};
