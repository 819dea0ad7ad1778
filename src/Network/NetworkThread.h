// src/Network/NetworkThread.h

#pragma once

#include <atomic>
#include <cstdint>
#include <thread>
#include "Network/PacketQueue.h"
#include "Network/UDPSocket.h"

// Blocking receive loop feeding a PacketQueue. The socket's receive
// timeout bounds how long Stop() waits.
class NetworkThread {
public:
    NetworkThread(UDPSocket& socket, PacketQueue& queue);
    ~NetworkThread();

    void Start();
    // Signal the thread to stop and wait for join
    void Stop();

    bool     IsRunning() const { return m_running; }
    uint64_t GetDroppedCount() const { return m_dropped; }

private:
    void RunLoop();

    UDPSocket&            m_socket;
    PacketQueue&          m_queue;
    std::thread           m_thread;
    std::atomic<bool>     m_running{false};
    std::atomic<uint64_t> m_dropped{0};
};
