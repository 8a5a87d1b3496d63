#pragma once

#include "rendercore/batch/batcher.h"
#include "rendercore/core/types.h"
#include "rendercore/geometry/aabb.h"

#include <cstdint>
#include <vector>

namespace rendercore {

// Stress-test presets offered by the canvas toolbar.
enum class TestType : std::uint32_t {
    Light = 0,     // 1k scattered over 50k x 50k
    Medium = 1,    // 5k over 100k x 100k
    Heavy = 2,     // 10k over 150k x 150k
    Extreme = 3,   // 25k over 200k x 200k
    Clustered = 4, // 50 clusters x 200
    Grid = 5,      // 100 x 100 lattice
    Infinite = 6,  // nine far-apart regions
};

enum class LayoutKind : std::uint32_t {
    Scatter = 0,
    Clustered = 1,
    Grid = 2,
    MultiRegion = 3,
};

struct RegionSpec {
    LayoutKind layout{LayoutKind::Scatter};
    AABB bounds{0.0, 0.0, 0.0, 0.0};
    double minSize{0.0};
    double maxSize{0.0};

    // Clustered
    std::uint32_t clusterCount{0};
    double clusterRadius{0.0};

    // Grid: lattice starts at bounds.min; cellSize is the element size.
    std::uint32_t gridColumns{0};
    double gridCellSize{0.0};
    double gridSpacing{0.0};

    // MultiRegion: elements are scattered in a disc inscribed in each region.
    std::vector<AABB> regions;
};

struct GenerationJob {
    TestType testType{TestType::Light};
    std::uint32_t targetCount{0};
    RegionSpec region{};
    std::uint64_t seed{kDefaultGenerationSeed};
    std::uint32_t chunkSize{kDefaultChunkSize};
    ElementId firstId{1};
};

struct ElementDescriptor {
    ElementId id;
    AABB bounds;
    BatchKey key;
};

// Number of distinct style classes handed out to generated elements.
static constexpr std::uint32_t kGeneratedStyleClasses = 6;

GenerationJob makeGenerationJob(TestType type, std::uint64_t seed = kDefaultGenerationSeed);

const char* testTypeName(TestType type);

// Seed from a host number (a JS double): truncated toward zero and clamped to
// [0, 2^53]. NaN maps to the default seed.
std::uint64_t seedFromNumber(double value);

// Ok, or InvalidGeometry / InvalidOperation describing why the job cannot run.
CoreError validateJob(const GenerationJob& job);

std::uint32_t chunkCountFor(const GenerationJob& job);

// Descriptor of element `index` (0-based within the job). Pure function of
// the job and the index.
ElementDescriptor generateElement(const GenerationJob& job, std::uint32_t index);

// Appends descriptors [startIndex, startIndex + count) clipped to targetCount.
void generateChunk(const GenerationJob& job,
                   std::uint32_t startIndex,
                   std::uint32_t count,
                   std::vector<ElementDescriptor>& out);

} // namespace rendercore
