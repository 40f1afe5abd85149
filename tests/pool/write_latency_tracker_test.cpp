// StreamHub - Real-time event fan-out server
// Tests for the rolling write latency window

#include <gtest/gtest.h>

#include "streamhub/pool/write_latency_tracker.hpp"

namespace streamhub {
namespace pool {
namespace test {

TEST(WriteLatencyTrackerTest, EmptyTrackerReportsZero) {
    WriteLatencyTracker tracker;
    EXPECT_EQ(tracker.sampleCount(), 0u);
    EXPECT_DOUBLE_EQ(tracker.averageMillis(), 0.0);
    EXPECT_EQ(tracker.window(), 1000u);
}

TEST(WriteLatencyTrackerTest, AveragesInMilliseconds) {
    WriteLatencyTracker tracker;
    tracker.record(1000);
    tracker.record(3000);

    EXPECT_EQ(tracker.sampleCount(), 2u);
    EXPECT_DOUBLE_EQ(tracker.averageMillis(), 2.0);
}

TEST(WriteLatencyTrackerTest, EvictsOldestSamplesBeyondWindow) {
    WriteLatencyTracker tracker(3);
    tracker.record(100000);
    tracker.record(1000);
    tracker.record(1000);
    tracker.record(4000);

    EXPECT_EQ(tracker.sampleCount(), 3u);
    EXPECT_DOUBLE_EQ(tracker.averageMillis(), 2.0);
}

TEST(WriteLatencyTrackerTest, DefaultWindowHoldsOneThousandSamples) {
    WriteLatencyTracker tracker;
    for (int i = 0; i < 1500; ++i) {
        tracker.record(i < 500 ? 9000 : 1000);
    }
    EXPECT_EQ(tracker.sampleCount(), 1000u);
    EXPECT_DOUBLE_EQ(tracker.averageMillis(), 1.0);

    tracker.reset();
    EXPECT_EQ(tracker.sampleCount(), 0u);
}

} // namespace test
} // namespace pool
} // namespace streamhub
