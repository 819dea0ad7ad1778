// src/Time/TickManager.h
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

// Fixed-step driver: converts wall time into a whole number of ticks.
class TickManager {
public:
    using Clock         = std::chrono::steady_clock;
    using Duration      = std::chrono::microseconds;
    using TickCallback  = std::function<void(uint64_t tickIndex)>;

    TickManager();
    ~TickManager();

    // Set target tick rate (ticks per second); 0 is ignored
    void SetTickRate(uint32_t ticksPerSecond);
    uint32_t GetTickRate() const { return m_ticksPerSecond; }
    Duration GetTickInterval() const { return m_tickInterval; }

    // Ticks owed beyond this after a stall are dropped
    void SetMaxCatchUp(uint32_t ticks) { m_maxCatchUp = ticks ? ticks : 1; }

    void RegisterCallback(TickCallback cb);

    // Runs every tick that fits into the time elapsed since the last call.
    // Returns the number of ticks processed.
    uint32_t Update(Clock::time_point now = Clock::now());

    // Time until the next tick is due
    Duration GetTimeUntilNextTick(Clock::time_point now = Clock::now()) const;

    uint64_t GetTickCount() const { return m_tickCount; }
    uint64_t GetDroppedTicks() const { return m_droppedTicks; }

    // Restart accumulation from now
    void Reset(Clock::time_point now = Clock::now());

private:
    uint32_t            m_ticksPerSecond;
    Duration            m_tickInterval;
    Clock::time_point   m_lastTime;
    Duration            m_accumulatedDelta;
    uint32_t            m_maxCatchUp;
    uint64_t            m_tickCount;
    uint64_t            m_droppedTicks;

    std::vector<TickCallback> m_callbacks;
};
