// src/Network/PacketQueue.h

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <vector>
#include "Network/UDPSocket.h"

struct ReceivedDatagram {
    SocketAddress        from;
    std::vector<uint8_t> data;
};

// Hand-off from the receive thread to the tick thread
class PacketQueue {
public:
    PacketQueue();
    ~PacketQueue();

    // Thread-safe; dropped once Shutdown() ran or the queue is full
    bool Enqueue(ReceivedDatagram datagram);

    // Blocks until a datagram arrives or Shutdown()
    bool Dequeue(ReceivedDatagram& out);

    // Non-blocking; false if empty
    bool TryDequeue(ReceivedDatagram& out);

    void   Shutdown();
    void   Clear();
    size_t Size() const;

    void SetCapacity(size_t capacity) { m_capacity = capacity; }

private:
    std::queue<ReceivedDatagram> m_queue;
    mutable std::mutex           m_mutex;
    std::condition_variable      m_cv;
    bool                         m_shutdown{false};
    size_t                       m_capacity{8192};
};
