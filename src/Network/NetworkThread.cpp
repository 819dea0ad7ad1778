// src/Network/NetworkThread.cpp

#include "Network/NetworkThread.h"
#include "Utils/Logger.h"

NetworkThread::NetworkThread(UDPSocket& socket, PacketQueue& queue)
    : m_socket(socket)
    , m_queue(queue)
{
}

NetworkThread::~NetworkThread() {
    Stop();
}

void NetworkThread::Start() {
    if (m_running) return;
    Logger::Info("Starting NetworkThread on port %u", m_socket.GetLocalPort());
    m_running = true;
    m_thread = std::thread(&NetworkThread::RunLoop, this);
}

void NetworkThread::Stop() {
    if (!m_running && !m_thread.joinable()) return;
    Logger::Info("Stopping NetworkThread");
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void NetworkThread::RunLoop() {
    std::vector<uint8_t> buffer;
    while (m_running) {
        ReceivedDatagram datagram;
        int len = m_socket.ReceiveFrom(datagram.from, buffer);
        if (len < 0) {
            if (!m_socket.IsOpen()) break;
            continue;
        }
        if (len == 0) continue;

        datagram.data = buffer;
        if (!m_queue.Enqueue(std::move(datagram))) {
            ++m_dropped;
        }
    }
    Logger::Info("NetworkThread loop exited (%llu datagrams dropped)",
                 static_cast<unsigned long long>(m_dropped.load()));
}
