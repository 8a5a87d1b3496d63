#include "rendercore/render_core.h"
#include "rendercore/core/logging.h"
#include "rendercore/internal/core_state.h"

namespace rendercore {

GenerationHandle RenderCore::startGeneration(TestType type, std::uint64_t seed) {
    GenerationJob job = makeGenerationJob(type, seed);
    job.chunkSize = state().config.generation.chunkSize;
    return startGenerationJob(job);
}

GenerationHandle RenderCore::startGenerationJob(GenerationJob job) {
    CoreState& s = state();
    // kNoElement when the id space is exhausted; the generator rejects such a job.
    job.firstId = allocateElementIds(job.targetCount);

    const std::uint32_t jobId = s.generator.start(job);
    s.genTestType = job.testType;
    s.genCommitted = 0;
    s.genTotal = job.targetCount;
    s.genChunksCommitted = 0;
    s.genFirstId = job.firstId;
    s.genError.clear();

    if (s.generator.state() == GenerationState::Error) {
        s.genError = s.generator.lastError();
        setError(CoreError::GenerationFailed);
    }
    return GenerationHandle{jobId};
}

bool RenderCore::cancelGeneration(GenerationHandle handle) {
    return state().generator.cancel(handle.jobId);
}

void RenderCore::commitChunk(const ChunkMessage& msg) {
    CoreState& s = state();
    for (const ElementDescriptor& d : msg.items) {
        if (upsertElement(d.id, d.bounds) != CoreError::Ok) continue;
        if (d.key != BatchKey{0, 0}) s.batchKeys[d.id] = d.key;
    }
    s.genCommitted += static_cast<std::uint32_t>(msg.items.size());
    s.genChunksCommitted++;
}

std::uint32_t RenderCore::pumpGeneration(std::uint32_t maxChunks) {
    CoreState& s = state();
    std::uint32_t committed = 0;
    ChunkMessage msg;
    while (committed < maxChunks && s.generator.poll(msg)) {
        switch (msg.kind) {
            case MessageKind::Chunk:
                commitChunk(msg);
                committed++;
                break;
            case MessageKind::Done:
                RENDERCORE_LOG_DEBUG("generation: job %u done (%u elements)", msg.jobId, s.genCommitted);
                return committed;
            case MessageKind::Error:
                s.genError = msg.error;
                setError(CoreError::GenerationFailed);
                RENDERCORE_LOG_WARN("generation: job %u failed: %s", msg.jobId, msg.error.c_str());
                return committed;
        }
    }
    return committed;
}

GenerationProgress RenderCore::getGenerationProgress() const {
    const CoreState& s = state();
    GenerationProgress p;
    p.state = s.generator.state();
    p.jobId = s.generator.activeJobId();
    p.testType = s.genTestType;
    p.committed = s.genCommitted;
    p.total = s.genTotal;
    p.chunksCommitted = s.genChunksCommitted;
    p.firstId = s.genFirstId;
    p.error = s.genError;
    return p;
}

} // namespace rendercore
