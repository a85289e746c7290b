/**
 * @file async_chunk_mesh_builder.h
 * @brief Background mesh generation with a frame-budgeted hand-off to the renderer
 *
 * ARCHITECTURE:
 * - Main thread enqueues dirty columns (never blocks on a build)
 * - Worker threads pull columns, build meshes, push results to the completed queue
 * - Main thread drains at most N completed meshes per frame into the renderer
 *
 * THREAD SAFETY:
 * - Work queue protected by mutex + condition variable
 * - Completed queue protected by its own mutex
 * - Atomic flag for shutdown signaling
 *
 * STALE RESULTS:
 * Each build is stamped with a generation taken when a worker dequeues the
 * column. A completed mesh older than the last one delivered for the same
 * column is dropped, so a slow build can never overwrite a newer edit.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "chunk.h"
#include "chunk_mesh_builder.h"
#include "world_constants.h"

class World;
class WorldRenderer;

/**
 * @brief Manages a pool of mesh worker threads
 *
 * Usage:
 * @code
 *   AsyncChunkMeshBuilder meshing(world, builder);
 *   meshing.start();                       // max(2, cores / 2) workers
 *
 *   // Whenever a column changes:
 *   meshing.enqueueChunk({chunkX, chunkZ});
 *
 *   // Each frame, on the main thread:
 *   meshing.processCompletedMeshes(renderer);
 *
 *   // On shutdown:
 *   meshing.stop();
 * @endcode
 */
class AsyncChunkMeshBuilder {
public:
    /// Builds the mesh of one column, may throw
    using MeshBuildFunction = std::function<ChunkMeshData(const Chunk&, const World&)>;

    /**
     * @param world World the columns are read from, must outlive this object
     * @param builder Mesh builder shared by all workers, must outlive this object
     * @param maxMeshesPerFrame Completed meshes forwarded per processCompletedMeshes() call
     */
    AsyncChunkMeshBuilder(const World& world, const ChunkMeshBuilder& builder,
                          int maxMeshesPerFrame = StreamingConstants::MESH_UPLOADS_PER_FRAME);

    /**
     * @param world World the columns are read from, must outlive this object
     * @param buildFunction Custom build step (used to inject failures in tests)
     * @param maxMeshesPerFrame Completed meshes forwarded per processCompletedMeshes() call
     */
    AsyncChunkMeshBuilder(const World& world, MeshBuildFunction buildFunction,
                          int maxMeshesPerFrame = StreamingConstants::MESH_UPLOADS_PER_FRAME);

    /**
     * @brief Destructor - ensures worker threads are stopped
     */
    ~AsyncChunkMeshBuilder();

    AsyncChunkMeshBuilder(const AsyncChunkMeshBuilder&) = delete;
    AsyncChunkMeshBuilder& operator=(const AsyncChunkMeshBuilder&) = delete;

    /**
     * @brief Starts background worker threads
     *
     * @param numWorkers Number of workers (0 = max(2, hardware_concurrency / 2))
     */
    void start(int numWorkers = 0);

    /**
     * @brief Stops all worker threads and discards queued work
     *
     * Builds already running finish before their thread is joined.
     * Safe to call multiple times.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    int getWorkerCount() const { return static_cast<int>(m_workers.size()); }

    /**
     * @brief Schedules a column for (re)meshing
     *
     * Never blocks on a build. A column already waiting in the queue is not
     * queued twice, the waiting entry will read the latest blocks anyway.
     */
    void enqueueChunk(const ChunkCoord& coord);

    /**
     * @brief Hands finished meshes to the renderer
     *
     * Must be called from the thread that owns the renderer. Forwards at most
     * maxMeshesPerFrame meshes, the rest stay queued for the next call. Stale
     * meshes and meshes of columns no longer in the world are dropped without
     * using up the budget.
     *
     * @return Number of meshes passed to renderer.updateChunk()
     */
    int processCompletedMeshes(WorldRenderer& renderer);

    /**
     * @brief Forgets delivery history of an unloaded column
     */
    void forgetChunk(const ChunkCoord& coord);

    /**
     * @brief Blocks until no column is queued or being built
     *
     * @param timeout Maximum time to wait
     * @return True if the workers went idle within the timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    // ========== Statistics ==========

    /// Finished meshes waiting for processCompletedMeshes()
    size_t getPendingMeshCount() const;

    /// Columns waiting for a worker
    size_t getQueuedChunkCount() const;

    size_t getTotalBuilt() const { return m_totalBuilt.load(); }
    size_t getFailedBuildCount() const { return m_failedBuilds.load(); }
    size_t getDiscardedStaleCount() const { return m_discardedStale.load(); }

    /**
     * @brief Worker count used when start() is given 0
     */
    static int defaultWorkerCount();

private:
    /**
     * @brief Worker thread main loop
     *
     * Pulls columns from the work queue until stop() is called. A failed build
     * is logged and the column skipped, the worker keeps running.
     */
    void workerThreadFunction();

    struct CompletedMesh {
        ChunkCoord coord;
        uint64_t generation;
        ChunkMeshData mesh;
    };

    // === Core References ===
    const World& m_world;                 ///< Source of block data
    MeshBuildFunction m_buildFunction;    ///< Mesh build step run on workers
    int m_maxMeshesPerFrame;              ///< Renderer hand-off budget

    // === Threading ===
    std::vector<std::thread> m_workers;   ///< Background worker threads
    std::atomic<bool> m_running;          ///< Worker thread running flag

    // === Work Queue (main thread + workers) ===
    std::deque<ChunkCoord> m_workQueue;           ///< Columns waiting for a build
    std::unordered_set<ChunkCoord> m_queuedSet;   ///< Deduplicates m_workQueue
    int m_buildsInProgress = 0;                   ///< Builds currently running
    uint64_t m_nextGeneration = 1;                ///< Stamp for the next dequeued build
    mutable std::mutex m_queueMutex;              ///< Protects the work queue state above
    std::condition_variable m_queueCV;            ///< Signals workers when work is available
    std::condition_variable m_idleCV;             ///< Signals waitUntilIdle()

    // === Completed Meshes (workers + main thread) ===
    std::deque<CompletedMesh> m_completed;        ///< Meshes ready for the renderer
    mutable std::mutex m_completedMutex;          ///< Protects m_completed

    // === Delivery History (main thread only) ===
    std::unordered_map<ChunkCoord, uint64_t> m_deliveredGeneration;

    // === Statistics ===
    std::atomic<size_t> m_totalBuilt;
    std::atomic<size_t> m_failedBuilds;
    std::atomic<size_t> m_discardedStale;
};
