/**
 * @file async_chunk_mesh_builder.cpp
 * @brief Implementation of the background mesh worker pool
 */

#include "async_chunk_mesh_builder.h"
#include "world.h"
#include "world_renderer.h"
#include "logger.h"
#include <algorithm>

AsyncChunkMeshBuilder::AsyncChunkMeshBuilder(const World& world, const ChunkMeshBuilder& builder,
                                             int maxMeshesPerFrame)
    : AsyncChunkMeshBuilder(world,
                            [&builder](const Chunk& chunk, const World& w) {
                                return builder.buildChunkMesh(chunk, w);
                            },
                            maxMeshesPerFrame)
{
}

AsyncChunkMeshBuilder::AsyncChunkMeshBuilder(const World& world, MeshBuildFunction buildFunction,
                                             int maxMeshesPerFrame)
    : m_world(world)
    , m_buildFunction(std::move(buildFunction))
    , m_maxMeshesPerFrame(std::max(1, maxMeshesPerFrame))
    , m_running(false)
    , m_totalBuilt(0)
    , m_failedBuilds(0)
    , m_discardedStale(0)
{
}

AsyncChunkMeshBuilder::~AsyncChunkMeshBuilder() {
    stop();
}

int AsyncChunkMeshBuilder::defaultWorkerCount() {
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(StreamingConstants::MIN_MESH_WORKERS, cores / 2);
}

void AsyncChunkMeshBuilder::start(int numWorkers) {
    if (m_running.load()) {
        Logger::warning() << "AsyncChunkMeshBuilder already running";
        return;
    }

    if (numWorkers <= 0) {
        numWorkers = defaultWorkerCount();
    }

    m_running.store(true);
    for (int i = 0; i < numWorkers; ++i) {
        m_workers.emplace_back(&AsyncChunkMeshBuilder::workerThreadFunction, this);
    }

    Logger::info() << "Mesh builder started with " << numWorkers << " worker threads";
}

void AsyncChunkMeshBuilder::stop() {
    if (!m_running.load()) {
        return;  // Already stopped
    }

    // Flip the flag under the queue lock so no worker misses the wakeup
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_running.store(false);
    }
    m_queueCV.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    // Clear pending state to avoid stale entries on restart
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_workQueue.clear();
        m_queuedSet.clear();
        m_buildsInProgress = 0;
    }
    m_idleCV.notify_all();

    {
        std::lock_guard<std::mutex> lock(m_completedMutex);
        m_completed.clear();
    }

    Logger::info() << "Mesh builder stopped. Built: " << m_totalBuilt.load()
                   << ", failed: " << m_failedBuilds.load()
                   << ", stale: " << m_discardedStale.load();
}

void AsyncChunkMeshBuilder::enqueueChunk(const ChunkCoord& coord) {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (!m_queuedSet.insert(coord).second) {
            return;  // Already waiting, will read current blocks when built
        }
        m_workQueue.push_back(coord);
    }
    m_queueCV.notify_one();
}

int AsyncChunkMeshBuilder::processCompletedMeshes(WorldRenderer& renderer) {
    int forwarded = 0;

    while (forwarded < m_maxMeshesPerFrame) {
        CompletedMesh entry;
        {
            std::lock_guard<std::mutex> lock(m_completedMutex);
            if (m_completed.empty()) {
                break;
            }
            entry = std::move(m_completed.front());
            m_completed.pop_front();
        }

        auto delivered = m_deliveredGeneration.find(entry.coord);
        if (delivered != m_deliveredGeneration.end() && entry.generation <= delivered->second) {
            m_discardedStale++;
            continue;
        }

        if (!m_world.hasChunk(entry.coord.x, entry.coord.z)) {
            // Unloaded while the build was in flight
            m_discardedStale++;
            continue;
        }

        m_deliveredGeneration[entry.coord] = entry.generation;
        renderer.updateChunk(entry.coord, entry.mesh);
        forwarded++;
    }

    return forwarded;
}

void AsyncChunkMeshBuilder::forgetChunk(const ChunkCoord& coord) {
    m_deliveredGeneration.erase(coord);
}

bool AsyncChunkMeshBuilder::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    return m_idleCV.wait_for(lock, timeout, [this]() {
        return m_workQueue.empty() && m_buildsInProgress == 0;
    });
}

size_t AsyncChunkMeshBuilder::getPendingMeshCount() const {
    std::lock_guard<std::mutex> lock(m_completedMutex);
    return m_completed.size();
}

size_t AsyncChunkMeshBuilder::getQueuedChunkCount() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_workQueue.size();
}

void AsyncChunkMeshBuilder::workerThreadFunction() {
    Logger::debug() << "Mesh worker thread started (ID: " << std::this_thread::get_id() << ")";

    while (true) {
        ChunkCoord coord{0, 0};
        uint64_t generation = 0;

        // Wait for work
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCV.wait(lock, [this]() {
                return !m_workQueue.empty() || !m_running.load();
            });

            if (!m_running.load()) {
                break;
            }

            coord = m_workQueue.front();
            m_workQueue.pop_front();
            m_queuedSet.erase(coord);
            generation = m_nextGeneration++;
            m_buildsInProgress++;
        }

        // Build outside the lock
        try {
            auto chunk = m_world.getChunk(coord.x, coord.z);
            if (chunk) {
                ChunkMeshData mesh = m_buildFunction(*chunk, m_world);
                {
                    std::lock_guard<std::mutex> lock(m_completedMutex);
                    m_completed.push_back(CompletedMesh{coord, generation, std::move(mesh)});
                }
                m_totalBuilt++;
            } else {
                Logger::debug() << "Skipping mesh for unloaded chunk (" << coord.x << ", " << coord.z << ")";
            }
        } catch (const std::exception& e) {
            m_failedBuilds++;
            Logger::error() << "Mesh build failed for chunk (" << coord.x << ", " << coord.z << "): " << e.what();
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_buildsInProgress--;
        }
        m_idleCV.notify_all();
    }

    Logger::debug() << "Mesh worker thread exiting (ID: " << std::this_thread::get_id() << ")";
}
