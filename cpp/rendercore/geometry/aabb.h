#pragma once

#include <algorithm>
#include <cmath>

namespace rendercore {

// World-space axis-aligned bounding box. Edges are inclusive, so boxes that
// only touch still intersect and zero-area boxes behave like points/segments.
struct AABB {
    double minX, minY, maxX, maxY;
};

inline AABB makeAABB(double x, double y, double w, double h) {
    return AABB{x, y, x + w, y + h};
}

inline bool isFinite(const AABB& b) {
    return std::isfinite(b.minX) && std::isfinite(b.minY)
        && std::isfinite(b.maxX) && std::isfinite(b.maxY);
}

// Finite and not inverted. Anything else is refused at the index boundary.
inline bool isValid(const AABB& b) {
    return isFinite(b) && b.minX <= b.maxX && b.minY <= b.maxY;
}

inline double width(const AABB& b) { return b.maxX - b.minX; }
inline double height(const AABB& b) { return b.maxY - b.minY; }
inline double centerX(const AABB& b) { return (b.minX + b.maxX) * 0.5; }
inline double centerY(const AABB& b) { return (b.minY + b.maxY) * 0.5; }

inline bool intersects(const AABB& a, const AABB& b) {
    return !(a.maxX < b.minX || a.minX > b.maxX || a.maxY < b.minY || a.minY > b.maxY);
}

// True when `inner` lies entirely within `outer`.
inline bool contains(const AABB& outer, const AABB& inner) {
    return inner.minX >= outer.minX && inner.maxX <= outer.maxX
        && inner.minY >= outer.minY && inner.maxY <= outer.maxY;
}

inline AABB unionOf(const AABB& a, const AABB& b) {
    return AABB{
        std::min(a.minX, b.minX),
        std::min(a.minY, b.minY),
        std::max(a.maxX, b.maxX),
        std::max(a.maxY, b.maxY)
    };
}

inline AABB expand(const AABB& b, double dx, double dy) {
    return AABB{b.minX - dx, b.minY - dy, b.maxX + dx, b.maxY + dy};
}

inline bool operator==(const AABB& a, const AABB& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

inline bool operator!=(const AABB& a, const AABB& b) {
    return !(a == b);
}

} // namespace rendercore
