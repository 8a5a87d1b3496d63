#ifndef RENDERCORE_CORE_TYPES_H
#define RENDERCORE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by every rendercore component.

namespace rendercore {

using ElementId = std::uint32_t;
static constexpr ElementId kNoElement = 0;

// Quadtree defaults
static constexpr std::uint32_t kDefaultNodeCapacity = 12;
static constexpr std::uint32_t kDefaultMaxDepth = 20;
static constexpr double kDefaultMinNodeSize = 1.0;
static constexpr double kDefaultRootHalfExtent = 50000.0; // infinite canvas starts at 100k x 100k
static constexpr std::uint32_t kMaxRootGrowSteps = 1024;

// Viewport defaults
static constexpr double kDefaultCullMargin = 0.15;   // fraction of the screen extent, per side
static constexpr double kDefaultMinZoom = 0.01;
static constexpr double kDefaultMaxZoom = 100.0;
static constexpr double kDegenerateZoom = 1e-9;

// Generation defaults
static constexpr std::uint32_t kDefaultChunkSize = 1000;
static constexpr std::uint32_t kDefaultChannelCapacity = 4; // chunks in flight
static constexpr std::uint64_t kDefaultGenerationSeed = 0x5EEDC0DEull;

// Metrics defaults
static constexpr double kDefaultFpsWindowMs = 1000.0;
static constexpr double kDefaultFpsPublishIntervalMs = 2000.0;
static constexpr double kDefaultMinFpsDelta = 2.0;

// Command buffer format constants
static constexpr std::uint32_t commandMagicRcmd = 0x444D4352; // "RCMD"
static constexpr std::uint32_t commandVersionRcmd = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

enum class CommandOp : std::uint32_t {
    ClearAll = 1,
    UpsertElement = 2,
    RemoveElement = 3,
    SetDrawOrder = 4,
    SetBatchKey = 5,
};

enum class CoreError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownCommand = 5,
    InvalidOperation = 6,
    InvalidGeometry = 7,
    GenerationFailed = 8,
};

// Command Payloads (POD)
struct ElementPayload { double minX, minY, maxX, maxY; std::uint32_t styleClass; std::uint32_t clipRegion; };
struct BatchKeyPayload { std::uint32_t styleClass; std::uint32_t clipRegion; };
struct DrawOrderPayloadHeader {
    std::uint32_t count;
    std::uint32_t reserved;
};

static constexpr std::size_t elementPayloadBytes = sizeof(ElementPayload);

} // namespace rendercore

#endif // RENDERCORE_CORE_TYPES_H
