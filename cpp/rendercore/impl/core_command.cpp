#include "rendercore/render_core.h"
#include "rendercore/command/command_dispatch.h"
#include "rendercore/command/commands.h"
#include "rendercore/core/util.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

CoreError RenderCore::applyCommandBuffer(const std::uint8_t* bytes, std::uint32_t byteCount) {
    clearError();
    const double t0 = nowMs();

    auto commandCallback = [](void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> CoreError {
        return dispatchCommand(static_cast<RenderCore*>(ctx), op, id, payload, payloadByteCount);
    };

    const CoreError err = parseCommandBuffer(bytes, byteCount, commandCallback, this);
    if (err != CoreError::Ok) {
        setError(err);
    }

    const double t1 = nowMs();
    state().lastApplyMs = static_cast<float>(t1 - t0);
    return err;
}

float RenderCore::getLastApplyMs() const {
    return state().lastApplyMs;
}

} // namespace rendercore
