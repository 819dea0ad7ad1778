// src/Game/HostServer.h – Authoritative host: network ingress, simulation, replication

#pragma once

#include <atomic>
#include <memory>
#include "Config/ArchetypeCatalog.h"
#include "Config/MatchConfig.h"
#include "Game/MapDefinition.h"
#include "Game/Simulation.h"
#include "Network/ConnectionManager.h"
#include "Network/ObserverTransport.h"
#include "Network/Packet.h"
#include "Protocol/ReplicationManager.h"
#include "Time/TickManager.h"

class HostServer {
public:
    // transport == nullptr: the server owns a UDP ConnectionManager bound in Initialize()
    HostServer(const MatchSettings& settings, ArchetypeCatalog catalog, MapDefinition map,
               IObserverTransport* transport = nullptr);
    ~HostServer();

    HostServer(const HostServer&) = delete;
    HostServer& operator=(const HostServer&) = delete;

    bool Initialize();
    // Blocks until RequestShutdown()
    void Run();
    void RequestShutdown() { m_running = false; }
    void Shutdown();

    void SetAITranslator(std::shared_ptr<IAICommandTranslator> translator);

    // Inbound message from conn; never throws
    void HandlePacket(ConnectionId conn, const Packet& packet);
    void HandleConnectionLost(ConnectionId conn);

    // One simulation tick plus event routing and, on broadcast ticks, snapshots
    void TickOnce();

    Simulation&         GetSimulation() { return m_sim; }
    ReplicationManager& GetReplication() { return *m_replication; }

private:
    void Step();
    void OnHello(ConnectionId conn, const Packet& packet);
    void OnReady(ConnectionId conn, const Packet& packet);
    void OnCommand(ConnectionId conn, const Packet& packet);
    void OnAICommand(ConnectionId conn, const Packet& packet);
    void OnHeartbeat(ConnectionId conn, const Packet& packet);
    void TryStartMatch();
    void RejectRequest(ConnectionId conn, const char* what, const char* reason);

    MatchSettings                       m_settings;
    std::unique_ptr<ConnectionManager>  m_connections;
    IObserverTransport*                 m_transport;
    Simulation                          m_sim;
    std::unique_ptr<ReplicationManager> m_replication;
    TickManager                         m_tickManager;
    std::atomic<bool>                   m_running{false};
};
