#include <gtest/gtest.h>
#include "rendercore/core/util.h"
#include "rendercore/generation/layouts.h"
#include "rendercore/render_core.h"
#include "rendercore/spatial/spatial_index.h"
#include "tests/test_accessors.h"

#include <iostream>
#include <vector>

using namespace rendercore;

namespace {

std::vector<ElementDescriptor> generateAll(const GenerationJob& job) {
    std::vector<ElementDescriptor> out;
    generateChunk(job, 0, job.targetCount, out);
    return out;
}

} // namespace

TEST(PerfBaselineTest, ExtremeSceneQueryIsSubLinear) {
    const GenerationJob job = makeGenerationJob(TestType::Extreme, 2024);
    const std::vector<ElementDescriptor> elements = generateAll(job);

    SpatialIndex index;
    const double t0 = nowMs();
    for (const ElementDescriptor& d : elements) {
        ASSERT_TRUE(index.insert(d.id, d.bounds));
    }
    const double t1 = nowMs();

    const AABB range{99500, 99500, 100500, 100500};
    std::vector<ElementId> hits;
    index.query(range, hits);
    const double t2 = nowMs();

    std::size_t expected = 0;
    for (const ElementDescriptor& d : elements) {
        if (intersects(d.bounds, range)) ++expected;
    }
    EXPECT_EQ(hits.size(), expected);

    const QueryStats qs = index.getLastQueryStats();
    const IndexStats is = index.getStats();
    std::cout << "[perf] insert 25000: " << (t1 - t0) << " ms, query: " << (t2 - t1) << " ms, hits "
              << hits.size() << ", nodes visited " << qs.nodesVisited << ", entries tested "
              << qs.entriesTested << ", tree nodes " << is.totalNodes << ", depth " << is.maxDepth << std::endl;

    EXPECT_LT(qs.entriesTested, elements.size() / 10);
    EXPECT_LT(qs.nodesVisited, is.totalNodes / 4);
}

TEST(PerfBaselineTest, CulledFrameTouchesFractionOfScene) {
    MetricsCollector metrics;
    RenderCore core(metrics);
    const GenerationJob job = makeGenerationJob(TestType::Extreme, 7);
    for (const ElementDescriptor& d : generateAll(job)) {
        ASSERT_EQ(core.notifyElementAdded(d.id, d.bounds), CoreError::Ok);
        ASSERT_EQ(core.setElementBatchKey(d.id, d.key), CoreError::Ok);
    }

    // 1920x1080 at zoom 1 looking at the middle of the world.
    const ViewportTransform t{-99000, -99500, 1.0};
    const double t0 = nowMs();
    const auto& batches = core.getVisibleBatches(t, ScreenSize{1920, 1080});
    const double t1 = nowMs();

    const CullStats cs = core.getLastCullStats();
    std::cout << "[perf] cull 25000: " << (t1 - t0) << " ms, visible " << cs.visibleCount
              << ", candidates " << cs.candidateCount << ", batches " << batches.size() << std::endl;

    EXPECT_EQ(cs.totalCount, 25000u);
    EXPECT_LT(cs.candidateCount, 250u);
    EXPECT_LE(batches.size(), cs.visibleCount);
}
