/**
 * @file game_engine.cpp
 * @brief Dirty tracking, pipeline wiring and per-frame hand-off to the renderer
 */

#include "game_engine.h"
#include "net_protocol.h"
#include "world.h"
#include "world_renderer.h"
#include "world_utils.h"
#include "logger.h"

namespace {

constexpr float STATS_INTERVAL_SECONDS = 5.0f;

MeshBuildOptions meshOptionsFrom(const RenderSettings& rendering) {
    MeshBuildOptions options;
    options.ambientOcclusion = rendering.ambientOcclusion;
    options.aoStrength = rendering.aoStrength;
    return options;
}

} // namespace

GameEngine::GameEngine(WorldRenderer& renderer, const EngineSettings& settings, const BlockRegistry& registry)
    : m_renderer(renderer)
    , m_settings(settings)
    , m_meshBuilder(registry, meshOptionsFrom(settings.rendering))
{
}

GameEngine::~GameEngine() {
    shutdown();
}

void GameEngine::setWorld(World* world) {
    shutdown();
    if (!world) {
        return;
    }

    const StreamingSettings& streaming = m_settings.streaming;
    m_chunkLoader = std::make_unique<ChunkLoader>(*world, streaming.renderDistance,
                                                  streaming.loadDistance, streaming.unloadDistance);
    m_asyncBuilder = std::make_unique<AsyncChunkMeshBuilder>(*world, m_meshBuilder,
                                                             streaming.meshUploadsPerFrame);
    m_world = world;

    m_chunkLoader->setOnChunkRequestNeeded([this](const std::vector<ChunkCoord>& positions) {
        if (m_chunkRequestHandler) {
            m_chunkRequestHandler(positions);
        } else {
            Logger::debug() << "No chunk request handler, dropping request for " << positions.size() << " chunks";
        }
    });
    m_chunkLoader->setOnChunkUnloaded([this](const ChunkCoord& position) {
        handleChunkUnloaded(position);
    });

    m_asyncBuilder->start(streaming.meshWorkers);

    std::vector<ChunkCoord> existing = world->getAllChunkCoords();
    for (const auto& coord : existing) {
        m_chunkLoader->markChunkLoaded(coord);
        markDirty(coord);
    }

    Logger::info() << "Engine attached to world with " << existing.size() << " chunks (AO "
                   << (m_meshBuilder.getOptions().ambientOcclusion ? "on" : "off") << ")";
}

void GameEngine::setChunkRequestHandler(ChunkRequestHandler handler) {
    m_chunkRequestHandler = std::move(handler);
}

void GameEngine::notifyBlockUpdate(int x, int y, int z, BlockType type) {
    if (!m_world) {
        Logger::warning() << "Block update at (" << x << "," << y << "," << z << ") with no world attached";
        return;
    }
    if (y < 0 || y >= Chunk::HEIGHT) {
        return;
    }

    m_world->setBlock(x, y, z, type);

    BlockCoordinates coords = worldToBlockCoords(x, y, z, Chunk::SIZE);
    markDirty({coords.chunkX, coords.chunkZ});

    // Edge blocks change face culling in the column across the seam
    if (coords.localX == 0) {
        markDirty({coords.chunkX - 1, coords.chunkZ});
    } else if (coords.localX == Chunk::SIZE - 1) {
        markDirty({coords.chunkX + 1, coords.chunkZ});
    }
    if (coords.localZ == 0) {
        markDirty({coords.chunkX, coords.chunkZ - 1});
    } else if (coords.localZ == Chunk::SIZE - 1) {
        markDirty({coords.chunkX, coords.chunkZ + 1});
    }
}

void GameEngine::queueBlockUpdate(int x, int y, int z, BlockType type) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pendingUpdates.push_back({x, y, z, type});
}

size_t GameEngine::getPendingBlockUpdateCount() const {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    return m_pendingUpdates.size();
}

void GameEngine::applyPendingBlockUpdates() {
    std::vector<PendingBlockUpdate> pending;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        pending.swap(m_pendingUpdates);
    }

    // Arrival order, so later edits to the same block win
    for (const auto& edit : pending) {
        notifyBlockUpdate(edit.x, edit.y, edit.z, edit.type);
    }
}

void GameEngine::notifyChunkReceived(const ChunkCoord& position) {
    if (m_chunkLoader) {
        m_chunkLoader->markChunkLoaded(position);
    }

    markDirty(position);
    markDirty({position.x + 1, position.z});
    markDirty({position.x - 1, position.z});
    markDirty({position.x, position.z + 1});
    markDirty({position.x, position.z - 1});
}

bool GameEngine::receiveChunkData(const ChunkDataMessage& message) {
    if (!m_world) {
        Logger::warning() << "Chunk data for (" << message.position.x << ", " << message.position.z
                          << ") with no world attached";
        return false;
    }
    if (!message.applyTo(*m_world)) {
        Logger::warning() << "Rejected incomplete chunk data for (" << message.position.x << ", "
                          << message.position.z << ")";
        return false;
    }

    notifyChunkReceived(message.position);
    return true;
}

void GameEngine::updatePlayerPosition(const glm::vec3& position) {
    if (m_chunkLoader) {
        m_chunkLoader->update(position);
    }
}

int GameEngine::update(float deltaTime) {
    if (!m_asyncBuilder) {
        return 0;
    }

    applyPendingBlockUpdates();

    std::unordered_set<ChunkCoord> dirty;
    {
        std::lock_guard<std::mutex> lock(m_dirtyMutex);
        dirty.swap(m_dirtyChunks);
    }

    for (const auto& coord : dirty) {
        // Neighbors that never arrived have nothing to mesh
        if (m_world->hasChunk(coord.x, coord.z)) {
            m_asyncBuilder->enqueueChunk(coord);
        }
    }

    int forwarded = m_asyncBuilder->processCompletedMeshes(m_renderer);

    m_statsTimer += deltaTime;
    if (m_statsTimer >= STATS_INTERVAL_SECONDS) {
        m_statsTimer = 0.0f;
        logPipelineStats();
    }

    return forwarded;
}

RaycastHit GameEngine::updateTargetBlock(const glm::vec3& origin, const glm::vec3& direction, float maxDistance) {
    RaycastHit hit;
    if (m_world) {
        hit = Raycast::castRay(*m_world, origin, direction, maxDistance);
    }

    if (hit.hit && m_hasTarget && hit.blockPosition == m_targetBlock) {
        return hit;
    }

    if (m_hasTarget) {
        m_renderer.highlightBlock(m_targetBlock, false);
        m_hasTarget = false;
    }
    if (hit.hit) {
        m_targetBlock = hit.blockPosition;
        m_hasTarget = true;
        m_renderer.highlightBlock(m_targetBlock, true);
    }
    return hit;
}

ChunkMeshData GameEngine::buildTargetBlockMesh() const {
    if (!m_hasTarget || !m_world) {
        return ChunkMeshData();
    }
    BlockType type = m_world->getBlock(m_targetBlock.x, m_targetBlock.y, m_targetBlock.z);
    return m_meshBuilder.buildSingleBlockMesh(m_targetBlock, type, BlockFaces::All);
}

void GameEngine::setCamera(const glm::vec3& position, const glm::vec3& rotation) {
    m_renderer.setCamera(position, rotation);
}

std::vector<ChunkCoord> GameEngine::getDirtyChunks() const {
    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    return std::vector<ChunkCoord>(m_dirtyChunks.begin(), m_dirtyChunks.end());
}

size_t GameEngine::getDirtyChunkCount() const {
    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    return m_dirtyChunks.size();
}

void GameEngine::shutdown() {
    if (m_asyncBuilder) {
        m_asyncBuilder->stop();
        logPipelineStats();
    }
    m_asyncBuilder.reset();
    m_chunkLoader.reset();
    m_world = nullptr;
    m_hasTarget = false;

    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        m_pendingUpdates.clear();
    }
    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    m_dirtyChunks.clear();
}

void GameEngine::markDirty(const ChunkCoord& position) {
    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    m_dirtyChunks.insert(position);
}

void GameEngine::handleChunkUnloaded(const ChunkCoord& position) {
    m_renderer.removeChunk(position);
    if (m_asyncBuilder) {
        m_asyncBuilder->forgetChunk(position);
    }

    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    m_dirtyChunks.erase(position);
}

void GameEngine::logPipelineStats() const {
    if (!m_asyncBuilder) {
        return;
    }
    Logger::debug() << "Mesh pipeline: queued " << m_asyncBuilder->getQueuedChunkCount()
                    << ", pending " << m_asyncBuilder->getPendingMeshCount()
                    << ", built " << m_asyncBuilder->getTotalBuilt()
                    << ", failed " << m_asyncBuilder->getFailedBuildCount()
                    << ", stale " << m_asyncBuilder->getDiscardedStaleCount();
}
