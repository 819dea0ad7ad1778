// tests/TimeTests.cpp
// Unit tests for the fixed-step tick driver

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <vector>
#include "Time/TickManager.h"

using ::testing::ElementsAre;
using namespace std::chrono_literals;

class TickManagerTests : public ::testing::Test {
protected:
    void SetUp() override {
        ticks.SetTickRate(10);
        ticks.Reset(t0);
        ticks.RegisterCallback([this](uint64_t index) { seen.push_back(index); });
    }

    TickManager::Clock::time_point t0 = TickManager::Clock::now();
    TickManager ticks;
    std::vector<uint64_t> seen;
};

TEST_F(TickManagerTests, Defaults) {
    TickManager fresh;
    EXPECT_EQ(fresh.GetTickRate(), 30u);
    EXPECT_EQ(fresh.GetTickInterval(), TickManager::Duration(33333));
    fresh.SetTickRate(0);
    EXPECT_EQ(fresh.GetTickRate(), 30u) << "zero rate must be ignored";
}

TEST_F(TickManagerTests, Update_RunsWholeTicksOnly) {
    EXPECT_EQ(ticks.Update(t0 + 50ms), 0u);
    EXPECT_EQ(ticks.Update(t0 + 100ms), 1u);
    EXPECT_EQ(ticks.Update(t0 + 350ms), 2u);
    EXPECT_THAT(seen, ElementsAre(0u, 1u, 2u));
    EXPECT_EQ(ticks.GetTickCount(), 3u);
    EXPECT_EQ(ticks.GetTimeUntilNextTick(t0 + 350ms), TickManager::Duration(50000));
}

TEST_F(TickManagerTests, Stall_DropsTicksBeyondCatchUp) {
    ticks.SetMaxCatchUp(3);
    EXPECT_EQ(ticks.Update(t0 + 1s), 3u);
    EXPECT_EQ(ticks.GetDroppedTicks(), 7u);
    EXPECT_EQ(ticks.GetTickCount(), 3u);
    EXPECT_EQ(ticks.Update(t0 + 1s + 100ms), 1u) << "backlog must not carry over";
}

TEST_F(TickManagerTests, ClockGoingBackwards_Ignored) {
    ticks.Update(t0 + 200ms);
    EXPECT_EQ(ticks.Update(t0 + 100ms), 0u);
    EXPECT_EQ(ticks.GetTickCount(), 2u);
}

TEST_F(TickManagerTests, Reset_DiscardsAccumulatedTime) {
    ticks.Update(t0 + 90ms);
    ticks.Reset(t0 + 90ms);
    EXPECT_EQ(ticks.Update(t0 + 150ms), 0u);
    EXPECT_EQ(ticks.GetTimeUntilNextTick(t0 + 150ms), TickManager::Duration(40000));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
