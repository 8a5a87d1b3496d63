#include "rendercore/metrics/metrics_collector.h"

#include <cmath>

namespace rendercore {

MetricsCollector::MetricsCollector(const MetricsConfig& config)
    : config_(sanitizeConfig(config)) {}

void MetricsCollector::reset() {
    snapshot_ = MetricsSnapshot{0.0, 0.0, 0, 0};
    frameCount_ = 0;
    windowStartMs_ = 0.0;
    lastFpsUpdateMs_ = 0.0;
    started_ = false;
}

bool MetricsCollector::sample(double frameTimestampMs, const FrameStats& frame) {
    bool changed = false;
    if (snapshot_.renderTimeMs != frame.renderTimeMs
        || snapshot_.elementCount != frame.elementCount
        || snapshot_.visibleCount != frame.visibleCount) {
        snapshot_.renderTimeMs = frame.renderTimeMs;
        snapshot_.elementCount = frame.elementCount;
        snapshot_.visibleCount = frame.visibleCount;
        changed = true;
    }

    if (!std::isfinite(frameTimestampMs)) return changed;

    // First frame, or the clock went backwards: open a fresh window here.
    if (!started_ || frameTimestampMs < windowStartMs_) {
        started_ = true;
        frameCount_ = 0;
        windowStartMs_ = frameTimestampMs;
        lastFpsUpdateMs_ = frameTimestampMs;
        return changed;
    }

    ++frameCount_;
    const double elapsed = frameTimestampMs - windowStartMs_;
    if (elapsed >= config_.minElapsedMs && frameTimestampMs - lastFpsUpdateMs_ >= config_.publishIntervalMs) {
        const double fps = std::round(frameCount_ * 1000.0 / elapsed);
        if (std::fabs(fps - snapshot_.fps) > config_.minFpsDelta) {
            snapshot_.fps = fps;
            changed = true;
        }
        frameCount_ = 0;
        windowStartMs_ = frameTimestampMs;
        lastFpsUpdateMs_ = frameTimestampMs;
    }
    return changed;
}

} // namespace rendercore
