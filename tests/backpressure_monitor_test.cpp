#include <gtest/gtest.h>
#include "chunkwire/BackpressureMonitor.h"

using namespace ChunkWire;

class BackpressureMonitorTest : public ::testing::Test {
protected:
    BackpressureMonitor monitor{1000, 200};
};

TEST_F(BackpressureMonitorTest, RunsBelowHighWatermark) {
    EXPECT_FALSE(monitor.shouldPause(0));
    EXPECT_FALSE(monitor.shouldPause(1000));
    EXPECT_FALSE(monitor.isPaused());
}

TEST_F(BackpressureMonitorTest, PausesAboveHighWatermark) {
    EXPECT_TRUE(monitor.shouldPause(1001));
    EXPECT_TRUE(monitor.isPaused());
    EXPECT_EQ(monitor.pauseCount(), 1u);
}

TEST_F(BackpressureMonitorTest, StaysPausedBetweenWatermarks) {
    ASSERT_TRUE(monitor.shouldPause(5000));
    EXPECT_TRUE(monitor.shouldPause(999));
    EXPECT_TRUE(monitor.shouldPause(200));
}

TEST_F(BackpressureMonitorTest, ResumesBelowLowWatermark) {
    ASSERT_TRUE(monitor.shouldPause(5000));
    EXPECT_FALSE(monitor.shouldPause(199));
    EXPECT_FALSE(monitor.isPaused());
    // Between the marks again: still running
    EXPECT_FALSE(monitor.shouldPause(900));
}

TEST_F(BackpressureMonitorTest, CountsEachPauseTransitionOnce) {
    monitor.shouldPause(2000);
    monitor.shouldPause(3000);
    monitor.shouldPause(0);
    monitor.shouldPause(2000);

    EXPECT_EQ(monitor.pauseCount(), 2u);
}

TEST_F(BackpressureMonitorTest, ResetClearsPauseButKeepsCount) {
    monitor.shouldPause(2000);
    monitor.reset();

    EXPECT_FALSE(monitor.isPaused());
    EXPECT_EQ(monitor.pauseCount(), 1u);
}

TEST(BackpressureMonitorConstruction, LowWatermarkIsCappedAtHigh) {
    BackpressureMonitor inverted(100, 500);
    EXPECT_EQ(inverted.lowWatermark(), 100u);

    ASSERT_TRUE(inverted.shouldPause(101));
    EXPECT_FALSE(inverted.shouldPause(99));
}
