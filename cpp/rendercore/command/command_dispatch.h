#pragma once

#include "rendercore/core/types.h"
#include <cstdint>

namespace rendercore {

class RenderCore;

/**
 * Applies one parsed command to the core. Used as the parseCommandBuffer
 * callback by RenderCore::applyCommandBuffer.
 */
CoreError dispatchCommand(
    RenderCore* core,
    std::uint32_t op,
    std::uint32_t id,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace rendercore
