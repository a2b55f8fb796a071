#include "ingest/import/network_error_tracker.hpp"

#include "ingest/core/io_error.hpp"

#include <gtest/gtest.h>

using ingest::NetworkFailureError;
using ingest::import::NetworkErrorTracker;

TEST(NetworkErrorTrackerTest, ThrowsAtThreshold) {
    NetworkErrorTracker tracker(3);
    tracker.record_network_error("reset 1");
    tracker.record_network_error("reset 2");
    EXPECT_EQ(tracker.consecutive(), 2u);

    try {
        tracker.record_network_error("reset 3");
        FAIL() << "expected NetworkFailureError";
    } catch (const NetworkFailureError& e) {
        EXPECT_EQ(e.consecutive_errors(), 3u);
        EXPECT_EQ(e.last_error(), "reset 3");
    }
    EXPECT_EQ(tracker.consecutive(), 0u);
}

TEST(NetworkErrorTrackerTest, SuccessResetsCount) {
    NetworkErrorTracker tracker(2);
    tracker.record_network_error("reset");
    tracker.record_success();
    EXPECT_NO_THROW(tracker.record_network_error("reset"));
    EXPECT_EQ(tracker.consecutive(), 1u);
}

TEST(NetworkErrorTrackerTest, NonNetworkFailureResetsCount) {
    NetworkErrorTracker tracker(2);
    tracker.record_network_error("reset");
    tracker.record_non_network();
    EXPECT_NO_THROW(tracker.record_network_error("reset"));
}

TEST(NetworkErrorTrackerTest, ZeroThresholdTreatedAsOne) {
    NetworkErrorTracker tracker(0);
    EXPECT_EQ(tracker.threshold(), 1u);
    EXPECT_THROW(tracker.record_network_error("down"), NetworkFailureError);
}
