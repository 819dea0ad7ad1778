// src/Network/PacketQueue.cpp

#include "Network/PacketQueue.h"

PacketQueue::PacketQueue() = default;
PacketQueue::~PacketQueue() {
    Shutdown();
}

bool PacketQueue::Enqueue(ReceivedDatagram datagram) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || m_queue.size() >= m_capacity) return false;
        m_queue.push(std::move(datagram));
    }
    m_cv.notify_one();
    return true;
}

bool PacketQueue::Dequeue(ReceivedDatagram& out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [&] { return m_shutdown || !m_queue.empty(); });
    if (m_queue.empty()) return false;
    out = std::move(m_queue.front());
    m_queue.pop();
    return true;
}

bool PacketQueue::TryDequeue(ReceivedDatagram& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) return false;
    out = std::move(m_queue.front());
    m_queue.pop();
    return true;
}

void PacketQueue::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();
}

void PacketQueue::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    while (!m_queue.empty()) m_queue.pop();
}

size_t PacketQueue::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}
