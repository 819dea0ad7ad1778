// src/Network/ConnectionManager.cpp

#include "Network/ConnectionManager.h"
#include "Utils/Logger.h"

ConnectionManager::ConnectionManager(const TransportSettings& settings)
    : m_settings(settings)
{
}

ConnectionManager::~ConnectionManager() {
    Shutdown();
}

bool ConnectionManager::Initialize(uint16_t listenPort) {
    if (!m_socket.Bind(listenPort)) {
        Logger::Error("ConnectionManager: could not bind UDP port %u", listenPort);
        return false;
    }
    m_thread = std::make_unique<NetworkThread>(m_socket, m_inbound);
    m_thread->Start();
    Logger::Info("ConnectionManager listening on UDP %u", m_socket.GetLocalPort());
    return true;
}

void ConnectionManager::Shutdown() {
    if (m_thread) {
        m_thread->Stop();
        m_thread.reset();
    }
    m_inbound.Shutdown();
    m_socket.Close();
    m_peers.clear();
    m_byAddress.clear();
}

std::vector<InboundPacket> ConnectionManager::PumpNetwork(Clock::time_point now) {
    std::vector<InboundPacket> out;
    ReceivedDatagram datagram;
    while (m_inbound.TryDequeue(datagram)) {
        auto known = m_byAddress.find(datagram.from);
        if (known == m_byAddress.end()) {
            // Only a well-formed datagram opens a connection
            DatagramHeader header;
            std::optional<Packet> probe;
            if (!DecodeDatagram(datagram.data, header, probe)) {
                Logger::Debug("ConnectionManager: junk from %s ignored", datagram.from.ToString().c_str());
                continue;
            }
        }

        ConnectionId conn = CreateOrGetPeer(datagram.from, now);
        if (conn == kInvalidConnection) continue;

        Peer& peer = m_peers.at(conn);
        peer.lastHeard = now;
        for (auto& pkt : peer.channel.OnDatagram(datagram.data)) {
            out.push_back(InboundPacket{conn, std::move(pkt)});
        }
    }
    return out;
}

std::vector<ConnectionId> ConnectionManager::Flush(Clock::time_point now) {
    std::vector<ConnectionId> lost;
    for (auto& [id, peer] : m_peers) {
        if (auto ack = peer.channel.TakeAck()) {
            m_socket.SendTo(peer.address, *ack);
        }
        for (const auto& datagram : peer.channel.CollectResends(now)) {
            m_socket.SendTo(peer.address, datagram);
        }
        if (peer.channel.HasFailed()) {
            Logger::Warn("Connection %u (%s) dropped: reliable delivery failed",
                         id, peer.address.ToString().c_str());
            lost.push_back(id);
        } else if (now - peer.lastHeard > m_settings.idleTimeout) {
            Logger::Warn("Connection %u (%s) timed out", id, peer.address.ToString().c_str());
            lost.push_back(id);
        }
    }
    for (ConnectionId id : lost) {
        Disconnect(id);
    }
    return lost;
}

bool ConnectionManager::SendUnreliable(ConnectionId conn, const Packet& packet) {
    Peer* peer = FindPeer(conn);
    if (!peer) return false;
    return m_socket.SendTo(peer->address, peer->channel.WrapUnreliable(packet));
}

bool ConnectionManager::SendReliable(ConnectionId conn, const Packet& packet) {
    Peer* peer = FindPeer(conn);
    if (!peer) return false;
    // A failed first send is covered by the resend timer
    m_socket.SendTo(peer->address, peer->channel.WrapReliable(packet, Clock::now()));
    return true;
}

void ConnectionManager::Disconnect(ConnectionId conn) {
    auto it = m_peers.find(conn);
    if (it == m_peers.end()) return;
    Logger::Info("Connection %u (%s) closed", conn, it->second.address.ToString().c_str());
    m_byAddress.erase(it->second.address);
    m_peers.erase(it);
}

std::optional<SocketAddress> ConnectionManager::GetAddress(ConnectionId conn) const {
    auto it = m_peers.find(conn);
    if (it == m_peers.end()) return std::nullopt;
    return it->second.address;
}

ConnectionManager::Peer* ConnectionManager::FindPeer(ConnectionId conn) {
    auto it = m_peers.find(conn);
    return it == m_peers.end() ? nullptr : &it->second;
}

ConnectionId ConnectionManager::CreateOrGetPeer(const SocketAddress& addr, Clock::time_point now) {
    auto it = m_byAddress.find(addr);
    if (it != m_byAddress.end()) return it->second;

    if (m_peers.size() >= m_settings.maxConnections) {
        Logger::Warn("ConnectionManager: refusing %s, %zu connections open",
                     addr.ToString().c_str(), m_peers.size());
        return kInvalidConnection;
    }

    ConnectionId id = m_nextConnectionId++;
    m_peers.emplace(id, Peer{id, addr, ReliableChannel(m_settings.resendInterval, m_settings.maxRetries), now});
    m_byAddress[addr] = id;
    Logger::Info("Connection %u opened from %s", id, addr.ToString().c_str());
    return id;
}
