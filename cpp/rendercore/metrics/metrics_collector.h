#pragma once

#include "rendercore/core/config.h"

#include <cstdint>

namespace rendercore {

struct FrameStats {
    double renderTimeMs;
    std::uint32_t elementCount;
    std::uint32_t visibleCount;
};

struct MetricsSnapshot {
    double fps;
    double renderTimeMs;
    std::uint32_t elementCount;
    std::uint32_t visibleCount;
};

// Per-session frame statistics. One instance per editor session, handed to
// the core by reference; there is no process-wide collector.
//
// FPS is recomputed only when the window is at least minElapsedMs old and
// publishIntervalMs has passed since the last recomputation, and published
// only when it moved by more than minFpsDelta. Counts and render time are
// published on every frame.
class MetricsCollector {
public:
    explicit MetricsCollector(const MetricsConfig& config = MetricsConfig{});

    // Records one frame. Returns true when the snapshot changed.
    bool sample(double frameTimestampMs, const FrameStats& frame);

    const MetricsSnapshot& snapshot() const { return snapshot_; }
    std::uint32_t framesInWindow() const { return frameCount_; }

    void reset();

private:
    MetricsConfig config_;
    MetricsSnapshot snapshot_{0.0, 0.0, 0, 0};
    std::uint32_t frameCount_{0};
    double windowStartMs_{0.0};
    double lastFpsUpdateMs_{0.0};
    bool started_{false};
};

} // namespace rendercore
