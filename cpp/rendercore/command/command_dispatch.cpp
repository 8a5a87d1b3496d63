#include "rendercore/command/command_dispatch.h"
#include "rendercore/core/logging.h"
#include "rendercore/internal/core_state.h"
#include "rendercore/render_core.h"

#include <cstring>
#include <vector>

namespace rendercore {

CoreError dispatchCommand(
    RenderCore* self,
    std::uint32_t op,
    std::uint32_t id,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::ClearAll): {
            self->clear();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::UpsertElement): {
            if (payloadByteCount != sizeof(ElementPayload)) return CoreError::InvalidPayloadSize;
            ElementPayload p;
            std::memcpy(&p, payload, sizeof(ElementPayload));
            const CoreError err = self->upsertHostElement(id, AABB{p.minX, p.minY, p.maxX, p.maxY});
            if (err != CoreError::Ok) return err;
            const BatchKey key{p.styleClass, p.clipRegion};
            if (key == BatchKey{0, 0}) {
                self->state().batchKeys.erase(id);
            } else {
                self->state().batchKeys[id] = key;
            }
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::RemoveElement): {
            if (payloadByteCount != 0) return CoreError::InvalidPayloadSize;
            self->removeElement(id);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetDrawOrder): {
            if (payloadByteCount < sizeof(DrawOrderPayloadHeader)) return CoreError::InvalidPayloadSize;
            DrawOrderPayloadHeader hdr;
            std::memcpy(&hdr, payload, sizeof(DrawOrderPayloadHeader));
            const std::uint32_t count = hdr.count;
            const std::size_t expected = sizeof(DrawOrderPayloadHeader) + static_cast<std::size_t>(count) * 4;
            if (expected != payloadByteCount) return CoreError::InvalidPayloadSize;
            std::vector<ElementId> ids(count);
            if (count > 0) {
                std::memcpy(ids.data(), payload + sizeof(DrawOrderPayloadHeader), static_cast<std::size_t>(count) * 4);
            }
            self->setDrawOrder(ids.data(), count);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetBatchKey): {
            if (payloadByteCount != sizeof(BatchKeyPayload)) return CoreError::InvalidPayloadSize;
            BatchKeyPayload p;
            std::memcpy(&p, payload, sizeof(BatchKeyPayload));
            const CoreError err = self->setElementBatchKey(id, BatchKey{p.styleClass, p.clipRegion});
            if (err != CoreError::Ok) return err;
            break;
        }
        default:
            RENDERCORE_LOG_WARN("command: unknown op %u", op);
            return CoreError::UnknownCommand;
    }
    return CoreError::Ok;
}

} // namespace rendercore
