#ifndef RENDERCORE_COMMAND_COMMANDS_H
#define RENDERCORE_COMMAND_COMMANDS_H

#include "rendercore/core/types.h"
#include <cstdint>
#include <cstddef>

namespace rendercore {

using CommandCallback = CoreError(*)(void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse an "RCMD" command buffer and invoke the callback for each command.
// Stops at the first callback error and returns it; commands before it stay applied.
CoreError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

}

#endif // RENDERCORE_COMMAND_COMMANDS_H
