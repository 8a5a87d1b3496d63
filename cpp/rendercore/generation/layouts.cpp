#include "rendercore/generation/layouts.h"
#include "rendercore/generation/random.h"

#include <algorithm>
#include <cmath>

namespace rendercore {

namespace {
    constexpr double kTwoPi = 6.283185307179586;

    // Per-purpose streams so that adding a draw for one attribute never shifts
    // another.
    constexpr std::uint64_t kStreamPosition = 0x01;
    constexpr std::uint64_t kStreamCluster = 0x02;
    constexpr std::uint64_t kStreamStyle = 0x03;

    RegionSpec scatterSpec(double worldSize, double minSize, double maxSize) {
        RegionSpec spec;
        spec.layout = LayoutKind::Scatter;
        spec.bounds = AABB{0.0, 0.0, worldSize, worldSize};
        spec.minSize = minSize;
        spec.maxSize = maxSize;
        return spec;
    }

    BatchKey styleFor(const GenerationJob& job, std::uint32_t index) {
        HashRng rng(job.seed, kStreamStyle, index);
        return BatchKey{rng.nextBelow(kGeneratedStyleClasses), 0};
    }

    // Block assignment: indices [0, n) are split into `groups` contiguous runs.
    std::uint32_t groupOf(std::uint32_t index, std::uint32_t total, std::uint32_t groups) {
        if (total == 0 || groups == 0) return 0;
        const std::uint64_t g = static_cast<std::uint64_t>(index) * groups / total;
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(g, groups - 1));
    }

    AABB clampInto(double x, double y, double w, double h, const AABB& bounds) {
        const double maxX = std::max(bounds.minX, bounds.maxX - w);
        const double maxY = std::max(bounds.minY, bounds.maxY - h);
        x = std::min(std::max(x, bounds.minX), maxX);
        y = std::min(std::max(y, bounds.minY), maxY);
        return makeAABB(x, y, w, h);
    }

    AABB scatterElement(const GenerationJob& job, std::uint32_t index) {
        const RegionSpec& spec = job.region;
        HashRng rng(job.seed, kStreamPosition, index);
        const double w = rng.nextRange(spec.minSize, spec.maxSize);
        const double h = rng.nextRange(spec.minSize, spec.maxSize);
        const double x = rng.nextRange(spec.bounds.minX, std::max(spec.bounds.minX, spec.bounds.maxX - w));
        const double y = rng.nextRange(spec.bounds.minY, std::max(spec.bounds.minY, spec.bounds.maxY - h));
        return makeAABB(x, y, w, h);
    }

    AABB clusteredElement(const GenerationJob& job, std::uint32_t index) {
        const RegionSpec& spec = job.region;
        const std::uint32_t cluster = groupOf(index, job.targetCount, spec.clusterCount);

        HashRng centerRng(job.seed, kStreamCluster, cluster);
        const double cx = centerRng.nextRange(spec.bounds.minX, spec.bounds.maxX);
        const double cy = centerRng.nextRange(spec.bounds.minY, spec.bounds.maxY);

        HashRng rng(job.seed, kStreamPosition, index);
        const double angle = rng.nextUnit() * kTwoPi;
        const double dist = rng.nextUnit() * spec.clusterRadius;
        const double w = rng.nextRange(spec.minSize, spec.maxSize);
        const double h = rng.nextRange(spec.minSize, spec.maxSize);
        return clampInto(cx + std::cos(angle) * dist, cy + std::sin(angle) * dist, w, h, spec.bounds);
    }

    AABB gridElement(const GenerationJob& job, std::uint32_t index) {
        const RegionSpec& spec = job.region;
        const std::uint32_t col = index % spec.gridColumns;
        const std::uint32_t row = index / spec.gridColumns;
        const double step = spec.gridCellSize + spec.gridSpacing;
        return makeAABB(spec.bounds.minX + col * step,
                        spec.bounds.minY + row * step,
                        spec.gridCellSize,
                        spec.gridCellSize);
    }

    AABB multiRegionElement(const GenerationJob& job, std::uint32_t index) {
        const RegionSpec& spec = job.region;
        const auto regionCount = static_cast<std::uint32_t>(spec.regions.size());
        const AABB& region = spec.regions[groupOf(index, job.targetCount, regionCount)];
        const double radius = 0.5 * std::min(width(region), height(region));

        HashRng rng(job.seed, kStreamPosition, index);
        const double angle = rng.nextUnit() * kTwoPi;
        const double dist = rng.nextUnit() * radius;
        const double w = rng.nextRange(spec.minSize, spec.maxSize);
        const double h = rng.nextRange(spec.minSize, spec.maxSize);
        return makeAABB(centerX(region) + std::cos(angle) * dist,
                        centerY(region) + std::sin(angle) * dist,
                        w,
                        h);
    }
}

GenerationJob makeGenerationJob(TestType type, std::uint64_t seed) {
    GenerationJob job;
    job.testType = type;
    job.seed = seed;
    job.chunkSize = kDefaultChunkSize;

    switch (type) {
        case TestType::Light:
            job.targetCount = 1000;
            job.region = scatterSpec(50000.0, 5.0, 300.0);
            break;
        case TestType::Medium:
            job.targetCount = 5000;
            job.region = scatterSpec(100000.0, 5.0, 300.0);
            break;
        case TestType::Heavy:
            job.targetCount = 10000;
            job.region = scatterSpec(150000.0, 5.0, 300.0);
            break;
        case TestType::Extreme:
            job.targetCount = 25000;
            job.region = scatterSpec(200000.0, 5.0, 300.0);
            break;
        case TestType::Clustered:
            job.targetCount = 50 * 200;
            job.region = scatterSpec(150000.0, 20.0, 80.0);
            job.region.layout = LayoutKind::Clustered;
            job.region.clusterCount = 50;
            job.region.clusterRadius = 1000.0;
            break;
        case TestType::Grid: {
            job.targetCount = 100 * 100;
            RegionSpec spec;
            spec.layout = LayoutKind::Grid;
            spec.gridColumns = 100;
            spec.gridCellSize = 200.0;
            spec.gridSpacing = 50.0;
            const double extent = 100 * (spec.gridCellSize + spec.gridSpacing);
            spec.bounds = AABB{0.0, 0.0, extent, extent};
            spec.minSize = spec.maxSize = spec.gridCellSize;
            job.region = spec;
            break;
        }
        case TestType::Infinite: {
            static const double kCenters[9][2] = {
                {0.0, 0.0},
                {25000.0, 25000.0}, {-25000.0, -25000.0},
                {25000.0, -25000.0}, {-25000.0, 25000.0},
                {75000.0, 0.0}, {-75000.0, 0.0},
                {0.0, 75000.0}, {0.0, -75000.0},
            };
            constexpr double kRadius = 5000.0;
            RegionSpec spec;
            spec.layout = LayoutKind::MultiRegion;
            spec.minSize = 50.0;
            spec.maxSize = 200.0;
            for (const auto& c : kCenters) {
                spec.regions.push_back(AABB{c[0] - kRadius, c[1] - kRadius, c[0] + kRadius, c[1] + kRadius});
            }
            spec.bounds = spec.regions.front();
            for (const AABB& r : spec.regions) spec.bounds = unionOf(spec.bounds, r);
            job.targetCount = 9 * 450;
            job.region = spec;
            break;
        }
    }
    return job;
}

const char* testTypeName(TestType type) {
    switch (type) {
        case TestType::Light: return "light";
        case TestType::Medium: return "medium";
        case TestType::Heavy: return "heavy";
        case TestType::Extreme: return "extreme";
        case TestType::Clustered: return "clustered";
        case TestType::Grid: return "grid";
        case TestType::Infinite: return "infinite";
    }
    return "unknown";
}

std::uint64_t seedFromNumber(double value) {
    constexpr double kMaxExactSeed = 9007199254740992.0; // 2^53
    if (std::isnan(value)) return kDefaultGenerationSeed;
    if (value <= 0.0) return 0;
    if (value >= kMaxExactSeed) return static_cast<std::uint64_t>(kMaxExactSeed);
    return static_cast<std::uint64_t>(value);
}

CoreError validateJob(const GenerationJob& job) {
    if (job.chunkSize == 0) return CoreError::InvalidOperation;
    if (job.firstId == kNoElement) return CoreError::InvalidOperation;
    if (static_cast<std::uint64_t>(job.firstId) + job.targetCount > 0xFFFFFFFFull) return CoreError::InvalidOperation;

    const RegionSpec& spec = job.region;
    if (!std::isfinite(spec.minSize) || !std::isfinite(spec.maxSize)) return CoreError::InvalidGeometry;
    if (spec.minSize < 0.0 || spec.minSize > spec.maxSize) return CoreError::InvalidGeometry;

    switch (spec.layout) {
        case LayoutKind::Scatter:
            if (!isValid(spec.bounds)) return CoreError::InvalidGeometry;
            break;
        case LayoutKind::Clustered:
            if (!isValid(spec.bounds)) return CoreError::InvalidGeometry;
            if (spec.clusterCount == 0) return CoreError::InvalidOperation;
            if (!std::isfinite(spec.clusterRadius) || spec.clusterRadius < 0.0) return CoreError::InvalidGeometry;
            break;
        case LayoutKind::Grid:
            if (!isValid(spec.bounds)) return CoreError::InvalidGeometry;
            if (spec.gridColumns == 0) return CoreError::InvalidOperation;
            if (!std::isfinite(spec.gridCellSize) || spec.gridCellSize < 0.0) return CoreError::InvalidGeometry;
            if (!std::isfinite(spec.gridSpacing) || spec.gridSpacing < 0.0) return CoreError::InvalidGeometry;
            break;
        case LayoutKind::MultiRegion:
            if (spec.regions.empty()) return CoreError::InvalidOperation;
            for (const AABB& r : spec.regions) {
                if (!isValid(r)) return CoreError::InvalidGeometry;
            }
            break;
        default:
            return CoreError::InvalidOperation;
    }
    return CoreError::Ok;
}

std::uint32_t chunkCountFor(const GenerationJob& job) {
    if (job.chunkSize == 0) return 0;
    return static_cast<std::uint32_t>((static_cast<std::uint64_t>(job.targetCount) + job.chunkSize - 1) / job.chunkSize);
}

ElementDescriptor generateElement(const GenerationJob& job, std::uint32_t index) {
    AABB bounds{0.0, 0.0, 0.0, 0.0};
    switch (job.region.layout) {
        case LayoutKind::Scatter: bounds = scatterElement(job, index); break;
        case LayoutKind::Clustered: bounds = clusteredElement(job, index); break;
        case LayoutKind::Grid: bounds = gridElement(job, index); break;
        case LayoutKind::MultiRegion: bounds = multiRegionElement(job, index); break;
    }
    return ElementDescriptor{job.firstId + index, bounds, styleFor(job, index)};
}

void generateChunk(const GenerationJob& job,
                   std::uint32_t startIndex,
                   std::uint32_t count,
                   std::vector<ElementDescriptor>& out) {
    if (startIndex >= job.targetCount) return;
    const std::uint32_t end = startIndex + std::min(count, job.targetCount - startIndex);
    out.reserve(out.size() + (end - startIndex));
    for (std::uint32_t i = startIndex; i < end; ++i) {
        out.push_back(generateElement(job, i));
    }
}

} // namespace rendercore
