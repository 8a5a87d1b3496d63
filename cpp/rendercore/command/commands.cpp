#include "rendercore/command/commands.h"
#include "rendercore/core/logging.h"
#include "rendercore/core/util.h"

namespace rendercore {

CoreError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        return CoreError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != commandMagicRcmd) {
        return CoreError::InvalidMagic;
    }
    const std::uint32_t version = readU32(src, 4);
    if (version != commandVersionRcmd) {
        return CoreError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);

    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        if (o + perCommandHeaderBytes > byteCount) {
            RENDERCORE_LOG_WARN("command buffer truncated at command %u (header)", i);
            return CoreError::BufferTruncated;
        }
        const std::uint32_t op = readU32(src, o); o += 4;
        const std::uint32_t id = readU32(src, o); o += 4;
        const std::uint32_t payloadByteCount = readU32(src, o); o += 4;
        o += 4; // reserved

        if (o + payloadByteCount > byteCount) {
            RENDERCORE_LOG_WARN("command buffer truncated at command %u (payload)", i);
            return CoreError::BufferTruncated;
        }

        const std::uint8_t* payload = src + o;
        if (cb) {
            const CoreError err = cb(ctx, op, id, payload, payloadByteCount);
            if (err != CoreError::Ok) return err;
        }

        o += payloadByteCount;
    }
    return CoreError::Ok;
}

} // namespace rendercore
