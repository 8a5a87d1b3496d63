#pragma once

#include "rendercore/core/types.h"
#include "rendercore/geometry/aabb.h"

#include <algorithm>
#include <cmath>

namespace rendercore {

// Pan/zoom of the canvas: screen = (world + pan) * zoom.
struct ViewportTransform {
    double panX;
    double panY;
    double zoom;
};

struct ScreenSize {
    double width;
    double height;
};

struct Point2 { double x; double y; };

inline Point2 worldToScreen(const ViewportTransform& t, double wx, double wy) {
    return Point2{(wx + t.panX) * t.zoom, (wy + t.panY) * t.zoom};
}

inline Point2 screenToWorld(const ViewportTransform& t, double sx, double sy) {
    return Point2{sx / t.zoom - t.panX, sy / t.zoom - t.panY};
}

inline double clampZoom(double zoom, double minZoom, double maxZoom) {
    return std::min(maxZoom, std::max(minZoom, zoom));
}

// A viewport that cannot show anything: empty screen, zero/negative/NaN zoom.
inline bool isDegenerate(const ViewportTransform& t, const ScreenSize& screen) {
    if (!std::isfinite(screen.width) || !std::isfinite(screen.height)) return true;
    if (screen.width <= 0.0 || screen.height <= 0.0) return true;
    if (!std::isfinite(t.zoom) || t.zoom <= kDegenerateZoom) return true;
    return !std::isfinite(t.panX) || !std::isfinite(t.panY);
}

// World rectangle covered by the screen. Inverse-transforms all four corners so
// the result stays correct if the transform ever gains a flip.
inline AABB screenRectToWorld(const ViewportTransform& t, const ScreenSize& screen) {
    const Point2 corners[4] = {
        screenToWorld(t, 0.0, 0.0),
        screenToWorld(t, screen.width, 0.0),
        screenToWorld(t, screen.width, screen.height),
        screenToWorld(t, 0.0, screen.height),
    };
    AABB out{corners[0].x, corners[0].y, corners[0].x, corners[0].y};
    for (int i = 1; i < 4; ++i) {
        out.minX = std::min(out.minX, corners[i].x);
        out.minY = std::min(out.minY, corners[i].y);
        out.maxX = std::max(out.maxX, corners[i].x);
        out.maxY = std::max(out.maxY, corners[i].y);
    }
    return out;
}

} // namespace rendercore
