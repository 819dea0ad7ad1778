// src/Time/TickManager.cpp
#include "Time/TickManager.h"
#include "Utils/Logger.h"

TickManager::TickManager()
    : m_ticksPerSecond(30),
      m_tickInterval(Duration(1000000 / 30)),
      m_lastTime(Clock::now()),
      m_accumulatedDelta(0),
      m_maxCatchUp(5),
      m_tickCount(0),
      m_droppedTicks(0)
{}

TickManager::~TickManager() = default;

void TickManager::SetTickRate(uint32_t ticksPerSecond) {
    if (ticksPerSecond == 0) return;
    m_ticksPerSecond = ticksPerSecond;
    m_tickInterval = Duration(1000000 / ticksPerSecond);
}

void TickManager::RegisterCallback(TickCallback cb) {
    m_callbacks.push_back(std::move(cb));
}

uint32_t TickManager::Update(Clock::time_point now) {
    if (now > m_lastTime) {
        m_accumulatedDelta += std::chrono::duration_cast<Duration>(now - m_lastTime);
        m_lastTime = now;
    }

    uint32_t processed = 0;
    while (m_accumulatedDelta >= m_tickInterval) {
        if (processed >= m_maxCatchUp) {
            uint64_t owed = static_cast<uint64_t>(m_accumulatedDelta / m_tickInterval);
            m_droppedTicks += owed;
            m_accumulatedDelta -= m_tickInterval * static_cast<int64_t>(owed);
            Logger::Warn("TickManager: fell behind, dropped %llu ticks",
                         static_cast<unsigned long long>(owed));
            break;
        }
        for (auto& cb : m_callbacks) {
            cb(m_tickCount);
        }
        ++m_tickCount;
        ++processed;
        m_accumulatedDelta -= m_tickInterval;
    }
    return processed;
}

TickManager::Duration TickManager::GetTimeUntilNextTick(Clock::time_point now) const {
    Duration elapsed = m_accumulatedDelta;
    if (now > m_lastTime) {
        elapsed += std::chrono::duration_cast<Duration>(now - m_lastTime);
    }
    return elapsed >= m_tickInterval ? Duration(0) : m_tickInterval - elapsed;
}

void TickManager::Reset(Clock::time_point now) {
    m_lastTime = now;
    m_accumulatedDelta = Duration(0);
}
