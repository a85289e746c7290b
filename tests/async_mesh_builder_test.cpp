/**
 * @file async_mesh_builder_test.cpp
 * @brief Worker pool, frame budget and stale-result tests for AsyncChunkMeshBuilder
 *
 * Tests:
 * 1. Frame budget: min(K, M) meshes per call, the rest stay queued
 * 2. Failed builds are logged and skipped, workers keep running
 * 3. Older builds never overwrite newer ones
 * 4. Shutdown joins every worker
 */

#include "test_utils.h"
#include "async_chunk_mesh_builder.h"
#include "block_system.h"
#include "chunk_mesh_builder.h"
#include "logger.h"
#include "world.h"
#include <atomic>
#include <stdexcept>

namespace {

const auto IDLE_TIMEOUT = std::chrono::seconds(10);

// Mesh whose first brightness value tags which build produced it
ChunkMeshData taggedMesh(float tag) {
    ChunkMeshData mesh;
    mesh.brightness.push_back(tag);
    return mesh;
}

void fillColumns(World& world, int count) {
    for (int i = 0; i < count; i++) {
        world.getOrCreateChunk(i, 0);
    }
}

} // namespace

// ============================================================
// Test 1: Frame Budget
// ============================================================

TEST(FrameBudgetForwardsAtMostK) {
    World world;
    fillColumns(world, 5);

    AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) { return taggedMesh(1.0f); }, 3);
    meshing.start(2);
    for (int i = 0; i < 5; i++) {
        meshing.enqueueChunk({i, 0});
    }
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(meshing.getPendingMeshCount(), 5u);

    RecordingRenderer renderer;
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 3);
    ASSERT_EQ(renderer.uploadCount(), 3u);
    ASSERT_EQ(meshing.getPendingMeshCount(), 2u);

    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 2);
    ASSERT_EQ(meshing.getPendingMeshCount(), 0u);

    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 0);
    ASSERT_EQ(renderer.uploadCount(), 5u);
    std::cout << "✓ Budget of 3 forwards 3 then 2 then 0 of 5 meshes\n";
}

TEST(FewerMeshesThanBudget) {
    World world;
    fillColumns(world, 2);

    AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) { return taggedMesh(1.0f); });
    meshing.start(2);
    meshing.enqueueChunk({0, 0});
    meshing.enqueueChunk({1, 0});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));

    RecordingRenderer renderer;
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 2);
    ASSERT_EQ(meshing.getPendingMeshCount(), 0u);
    std::cout << "✓ Fewer finished meshes than the budget are all forwarded\n";
}

TEST(RealBuilderProducesGeometry) {
    World world;
    world.setBlock(0, 0, 0, BlockType::Stone);
    ChunkMeshBuilder builder(BlockRegistry::instance());

    AsyncChunkMeshBuilder meshing(world, builder);
    meshing.start();
    ASSERT_EQ(meshing.getWorkerCount(), AsyncChunkMeshBuilder::defaultWorkerCount());
    ASSERT_GE(meshing.getWorkerCount(), 2);

    meshing.enqueueChunk({0, 0});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));

    RecordingRenderer renderer;
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 1);
    auto uploads = renderer.uploads();
    ASSERT_EQ(uploads[0].position, (ChunkCoord{0, 0}));
    ASSERT_EQ(uploads[0].mesh.getVertexCount(), 24u);
    ASSERT_EQ(uploads[0].mesh.indices.size(), 36u);
    std::cout << "✓ Background build of an isolated block reaches the renderer\n";
}

TEST(DuplicateEnqueueBuildsOnce) {
    World world;
    fillColumns(world, 1);
    std::atomic<int> builds{0};

    AsyncChunkMeshBuilder meshing(world, [&builds](const Chunk&, const World&) {
        builds++;
        return taggedMesh(1.0f);
    });

    // Not started yet, so both requests wait in the queue
    meshing.enqueueChunk({0, 0});
    meshing.enqueueChunk({0, 0});
    ASSERT_EQ(meshing.getQueuedChunkCount(), 1u);

    meshing.start(2);
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(builds.load(), 1);
    ASSERT_EQ(meshing.getTotalBuilt(), 1u);
    std::cout << "✓ A column waiting in the queue is not queued twice\n";
}

TEST(MissingColumnIsSkipped) {
    World world;
    AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) { return taggedMesh(1.0f); });
    meshing.start(2);
    meshing.enqueueChunk({42, 42});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(meshing.getPendingMeshCount(), 0u);
    ASSERT_EQ(meshing.getFailedBuildCount(), 0u);
    std::cout << "✓ Columns absent from the world produce no mesh and no failure\n";
}

// ============================================================
// Test 2: Failure Isolation
// ============================================================

TEST(FailedBuildIsLoggedAndSkipped) {
    World world;
    fillColumns(world, 3);
    Logger::resetMessageCounts();

    AsyncChunkMeshBuilder meshing(world, [](const Chunk& chunk, const World&) {
        if (chunk.getChunkX() == 1) {
            throw std::runtime_error("corrupt column");
        }
        return taggedMesh(1.0f);
    });
    meshing.start(2);
    for (int i = 0; i < 3; i++) {
        meshing.enqueueChunk({i, 0});
    }
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));

    ASSERT_EQ(meshing.getFailedBuildCount(), 1u);
    ASSERT_EQ(meshing.getPendingMeshCount(), 2u);
    ASSERT_EQ(Logger::getMessageCount(LogLevel::ERROR), 1u);

    // Pool still accepts work after the failure
    world.getOrCreateChunk(3, 0);
    meshing.enqueueChunk({3, 0});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(meshing.getPendingMeshCount(), 3u);

    RecordingRenderer renderer;
    meshing.processCompletedMeshes(renderer);
    for (const auto& upload : renderer.uploads()) {
        ASSERT_NE(upload.position, (ChunkCoord{1, 0}));
    }
    std::cout << "✓ A throwing build is logged, counted and skipped\n";
}

// ============================================================
// Test 3: Stale Results
// ============================================================

TEST(OlderBuildDoesNotOverwriteNewer) {
    World world;
    fillColumns(world, 1);

    std::atomic<int> calls{0};
    std::atomic<bool> firstStarted{false};
    std::atomic<bool> releaseFirst{false};

    AsyncChunkMeshBuilder meshing(world, [&](const Chunk&, const World&) {
        int call = ++calls;
        if (call == 1) {
            firstStarted.store(true);
            while (!releaseFirst.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return taggedMesh(static_cast<float>(call));
    });
    meshing.start(2);

    meshing.enqueueChunk({0, 0});
    ASSERT_TRUE(waitFor([&]() { return firstStarted.load(); }));

    // Re-dirtied while the first build is still running
    meshing.enqueueChunk({0, 0});
    ASSERT_TRUE(waitFor([&]() { return meshing.getPendingMeshCount() == 1; }));

    RecordingRenderer renderer;
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 1);

    releaseFirst.store(true);
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(meshing.getPendingMeshCount(), 1u);
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 0);
    ASSERT_EQ(meshing.getDiscardedStaleCount(), 1u);

    auto uploads = renderer.uploads();
    ASSERT_EQ(uploads.size(), 1u);
    ASSERT_NEAR(uploads[0].mesh.brightness[0], 2.0f, 1e-6f);
    std::cout << "✓ A slow older build is dropped once a newer mesh was delivered\n";
}

TEST(UnloadedColumnMeshIsDropped) {
    World world;
    fillColumns(world, 2);

    AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) { return taggedMesh(1.0f); });
    meshing.start(2);
    meshing.enqueueChunk({0, 0});
    meshing.enqueueChunk({1, 0});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));

    world.removeChunk(0, 0);
    meshing.forgetChunk({0, 0});

    RecordingRenderer renderer;
    ASSERT_EQ(meshing.processCompletedMeshes(renderer), 1);
    ASSERT_EQ(renderer.uploads()[0].position, (ChunkCoord{1, 0}));
    ASSERT_EQ(meshing.getDiscardedStaleCount(), 1u);
    std::cout << "✓ Meshes of columns unloaded mid-build never reach the renderer\n";
}

TEST(RebuildAfterDeliveryIsForwarded) {
    World world;
    fillColumns(world, 1);
    std::atomic<int> calls{0};

    AsyncChunkMeshBuilder meshing(world, [&calls](const Chunk&, const World&) {
        return taggedMesh(static_cast<float>(++calls));
    });
    meshing.start(2);
    RecordingRenderer renderer;

    for (int round = 0; round < 3; round++) {
        meshing.enqueueChunk({0, 0});
        ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
        ASSERT_EQ(meshing.processCompletedMeshes(renderer), 1);
    }
    ASSERT_EQ(renderer.uploadCount(), 3u);
    ASSERT_EQ(meshing.getDiscardedStaleCount(), 0u);
    std::cout << "✓ Sequential rebuilds of one column are all delivered\n";
}

// ============================================================
// Test 4: Shutdown
// ============================================================

TEST(StopJoinsWorkers) {
    World world;
    fillColumns(world, 16);

    AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return taggedMesh(1.0f);
    });
    meshing.start(3);
    ASSERT_TRUE(meshing.isRunning());
    ASSERT_EQ(meshing.getWorkerCount(), 3);

    for (int i = 0; i < 16; i++) {
        meshing.enqueueChunk({i, 0});
    }
    meshing.stop();

    ASSERT_FALSE(meshing.isRunning());
    ASSERT_EQ(meshing.getWorkerCount(), 0);
    ASSERT_EQ(meshing.getQueuedChunkCount(), 0u);
    ASSERT_EQ(meshing.getPendingMeshCount(), 0u);

    // Second stop is a no-op
    meshing.stop();

    // Restart works after a stop
    meshing.start(2);
    meshing.enqueueChunk({0, 0});
    ASSERT_TRUE(meshing.waitUntilIdle(IDLE_TIMEOUT));
    ASSERT_EQ(meshing.getPendingMeshCount(), 1u);
    std::cout << "✓ stop() joins workers, discards queued work and allows restart\n";
}

TEST(DestructorStopsRunningPool) {
    World world;
    fillColumns(world, 4);
    {
        AsyncChunkMeshBuilder meshing(world, [](const Chunk&, const World&) { return taggedMesh(1.0f); });
        meshing.start(2);
        for (int i = 0; i < 4; i++) {
            meshing.enqueueChunk({i, 0});
        }
    }
    // Workers are gone before the world they read from
    ASSERT_EQ(world.getChunkCount(), 4u);
    std::cout << "✓ Destroying a running pool joins its workers\n";
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
