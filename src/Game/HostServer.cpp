// src/Game/HostServer.cpp

#include "Game/HostServer.h"
#include "Protocol/MessageDecoder.h"
#include "Protocol/MessageEncoder.h"
#include "Protocol/PacketTypes.h"
#include "Utils/Logger.h"

#include <algorithm>
#include <thread>

HostServer::HostServer(const MatchSettings& settings, ArchetypeCatalog catalog, MapDefinition map,
                       IObserverTransport* transport)
    : m_settings(settings)
    , m_transport(transport)
    , m_sim(settings, std::move(catalog), std::move(map))
{
    if (!m_transport) {
        TransportSettings ts;
        ts.resendInterval = std::chrono::milliseconds(settings.reliableResendMs);
        ts.maxRetries = settings.reliableMaxRetries;
        ts.idleTimeout = std::chrono::milliseconds(settings.idleTimeoutMs);
        m_connections = std::make_unique<ConnectionManager>(ts);
        m_transport = m_connections.get();
    }
    m_replication = std::make_unique<ReplicationManager>(*m_transport, settings.fogCompression,
                                                         settings.fogResendThreshold);
    m_tickManager.SetTickRate(settings.tickRate);
    m_tickManager.RegisterCallback([this](uint64_t) { Step(); });
}

HostServer::~HostServer() {
    Shutdown();
}

bool HostServer::Initialize() {
    if (m_connections && !m_connections->Initialize(m_settings.port)) {
        return false;
    }
    Logger::Info("HostServer ready: %u Hz, snapshot every %u ticks",
                 m_settings.tickRate, m_settings.broadcastInterval);
    return true;
}

void HostServer::Run() {
    m_running = true;
    m_tickManager.Reset();
    while (m_running) {
        m_tickManager.Update();
        auto wait = std::min<TickManager::Duration>(m_tickManager.GetTimeUntilNextTick(),
                                                    std::chrono::milliseconds(5));
        std::this_thread::sleep_for(wait);
    }
    Logger::Info("HostServer loop exited after %llu ticks",
                 static_cast<unsigned long long>(m_tickManager.GetTickCount()));
}

void HostServer::Shutdown() {
    m_running = false;
    if (m_connections) {
        m_connections->Shutdown();
    }
}

void HostServer::SetAITranslator(std::shared_ptr<IAICommandTranslator> translator) {
    m_sim.SetAITranslator(std::move(translator));
}

void HostServer::Step() {
    if (m_connections) {
        for (auto& in : m_connections->PumpNetwork()) {
            HandlePacket(in.connection, in.packet);
        }
    }
    TickOnce();
    if (m_connections) {
        for (ConnectionId lost : m_connections->Flush()) {
            HandleConnectionLost(lost);
        }
    }
}

void HostServer::TickOnce() {
    const uint32_t tick = m_sim.GetTick();
    auto events = m_sim.Tick();
    m_replication->DispatchEvents(events, m_sim.GetSessions(), &m_sim.GetVisibility());

    const uint32_t interval = m_settings.broadcastInterval ? m_settings.broadcastInterval : 1;
    if (m_sim.IsMatchRunning() && tick % interval == 0) {
        m_replication->Broadcast(m_sim.GetStore(), m_sim.GetVisibility(), m_sim.GetSessions(), tick);
    }
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void HostServer::HandlePacket(ConnectionId conn, const Packet& packet) {
    switch (PacketTypeFromTag(packet.GetTag())) {
        case PacketType::PT_HELLO:      OnHello(conn, packet); break;
        case PacketType::PT_READY:      OnReady(conn, packet); break;
        case PacketType::PT_COMMAND:    OnCommand(conn, packet); break;
        case PacketType::PT_AI_COMMAND: OnAICommand(conn, packet); break;
        case PacketType::PT_HEARTBEAT:  OnHeartbeat(conn, packet); break;
        case PacketType::PT_LEAVE:
            HandleConnectionLost(conn);
            m_transport->Disconnect(conn);
            break;
        default:
            Logger::Warn("HostServer: unexpected '%s' from connection %u",
                         packet.GetTag().c_str(), conn);
            break;
    }
}

void HostServer::HandleConnectionLost(ConnectionId conn) {
    m_sim.Disconnect(conn);
    m_replication->ForgetObserver(conn);
}

void HostServer::OnHello(ConnectionId conn, const Packet& packet) {
    HelloMessage hello;
    if (!MessageDecoder::DecodeHello(packet, hello)) {
        RejectRequest(conn, "hello", "malformed");
        return;
    }

    SessionResult result = hello.wantsHost
        ? m_sim.Host(conn, hello.name, hello.preferredTeam)
        : m_sim.Join(conn, hello.name, hello.preferredTeam);

    HelloResultMessage reply;
    reply.result = result;
    reply.connection = conn;
    if (const PlayerSession* session = m_sim.GetSessions().Find(conn)) {
        reply.team = session->team;
        if (result == SessionResult::Ok) reply.token = session->token;
    }
    m_transport->SendReliable(conn, MessageEncoder::EncodeHelloResult(reply));
}

void HostServer::OnReady(ConnectionId conn, const Packet& packet) {
    bool ready = false;
    if (!MessageDecoder::DecodeReady(packet, ready)) {
        RejectRequest(conn, "ready", "malformed");
        return;
    }
    SessionResult result = m_sim.SetReady(conn, ready);
    if (result != SessionResult::Ok) {
        RejectRequest(conn, "ready", ToString(result));
        return;
    }
    TryStartMatch();
}

void HostServer::TryStartMatch() {
    if (m_sim.IsMatchRunning()) return;
    if (m_sim.GetSessions().CanStartMatch() != SessionResult::Ok) return;

    SessionResult result = m_sim.StartMatch();
    if (result == SessionResult::Ok) {
        m_replication->Reset();
    } else {
        Logger::Warn("HostServer: match start failed: %s", ToString(result));
    }
}

void HostServer::OnCommand(ConnectionId conn, const Packet& packet) {
    Command command;
    if (!MessageDecoder::DecodeCommand(packet, command)) {
        RejectRequest(conn, "command", "malformed");
        return;
    }
    m_sim.SubmitCommand(conn, std::move(command));
}

void HostServer::OnAICommand(ConnectionId conn, const Packet& packet) {
    AICommandMessage msg;
    if (!MessageDecoder::DecodeAICommand(packet, msg)) {
        RejectRequest(conn, "ai command", "malformed");
        return;
    }
    m_sim.RequestAICommand(conn, msg.text, msg.units);
}

void HostServer::OnHeartbeat(ConnectionId conn, const Packet& packet) {
    uint32_t clientTick = 0;
    if (!MessageDecoder::DecodeHeartbeat(packet, clientTick)) return;
    m_transport->SendUnreliable(conn, MessageEncoder::EncodeHeartbeat(m_sim.GetTick()));
}

void HostServer::RejectRequest(ConnectionId conn, const char* what, const char* reason) {
    Logger::Warn("HostServer: %s from connection %u rejected: %s", what, conn, reason);
    GameEvent ev;
    ev.type = GameEventType::CommandRejected;
    ev.tick = m_sim.GetTick();
    ev.recipient = conn;
    ev.detail = std::string(what) + ": " + reason;
    m_replication->SendEventTo(conn, ev);
}
