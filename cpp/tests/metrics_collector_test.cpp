#include <gtest/gtest.h>
#include "rendercore/metrics/metrics_collector.h"

#include <limits>

using namespace rendercore;

namespace {

// Feeds frames at `fps` from `startMs` for `durationMs`; returns the last timestamp.
double run(MetricsCollector& metrics, double startMs, double durationMs, double fps, const FrameStats& frame) {
    const double step = 1000.0 / fps;
    double t = startMs;
    const int frames = static_cast<int>(durationMs / step);
    for (int i = 1; i <= frames; ++i) {
        t = startMs + i * step;
        metrics.sample(t, frame);
    }
    return t;
}

} // namespace

TEST(MetricsCollectorTest, PublishesFpsOnlyAfterInterval) {
    MetricsCollector metrics;
    const FrameStats frame{4.0, 100, 20};
    metrics.sample(0.0, frame);

    run(metrics, 0.0, 1500.0, 60.0, frame);
    EXPECT_DOUBLE_EQ(metrics.snapshot().fps, 0.0);

    run(metrics, 1500.0, 600.0, 60.0, frame);
    EXPECT_DOUBLE_EQ(metrics.snapshot().fps, 60.0);
}

TEST(MetricsCollectorTest, SmallFpsChangesAreNotPublished) {
    MetricsCollector metrics;
    const FrameStats frame{1.0, 10, 10};
    metrics.sample(0.0, frame);
    double t = run(metrics, 0.0, 2100.0, 45.0, frame);
    const double published = metrics.snapshot().fps;
    ASSERT_NEAR(published, 45.0, 1.0);

    t = run(metrics, t, 2100.0, 44.0, frame);
    EXPECT_DOUBLE_EQ(metrics.snapshot().fps, published);

    // The first window after the switch still holds a few 44 fps frames.
    run(metrics, t, 2100.0, 30.0, frame);
    EXPECT_NEAR(metrics.snapshot().fps, 30.0, 2.0);
}

TEST(MetricsCollectorTest, CountsAreCopiedEveryFrame) {
    MetricsCollector metrics;
    EXPECT_TRUE(metrics.sample(0.0, FrameStats{2.0, 500, 40}));
    EXPECT_EQ(metrics.snapshot().elementCount, 500u);
    EXPECT_EQ(metrics.snapshot().visibleCount, 40u);
    EXPECT_DOUBLE_EQ(metrics.snapshot().renderTimeMs, 2.0);

    EXPECT_FALSE(metrics.sample(16.0, FrameStats{2.0, 500, 40}));
    EXPECT_TRUE(metrics.sample(32.0, FrameStats{2.0, 500, 41}));
    EXPECT_EQ(metrics.snapshot().visibleCount, 41u);
}

TEST(MetricsCollectorTest, BackwardsClockRestartsWindow) {
    MetricsCollector metrics;
    const FrameStats frame{1.0, 1, 1};
    metrics.sample(5000.0, frame);
    run(metrics, 5000.0, 500.0, 60.0, frame);
    EXPECT_GT(metrics.framesInWindow(), 0u);

    metrics.sample(10.0, frame);
    EXPECT_EQ(metrics.framesInWindow(), 0u);
    metrics.sample(std::numeric_limits<double>::quiet_NaN(), frame);
    EXPECT_EQ(metrics.framesInWindow(), 0u);
}

TEST(MetricsCollectorTest, ResetClearsSnapshot) {
    MetricsCollector metrics;
    metrics.sample(0.0, FrameStats{3.0, 7, 7});
    run(metrics, 0.0, 2500.0, 50.0, FrameStats{3.0, 7, 7});
    metrics.reset();
    EXPECT_DOUBLE_EQ(metrics.snapshot().fps, 0.0);
    EXPECT_EQ(metrics.snapshot().elementCount, 0u);
    EXPECT_EQ(metrics.framesInWindow(), 0u);
}
