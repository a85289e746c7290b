/**
 * @file game_engine.h
 * @brief Client-side orchestration of world edits, streaming and meshing
 *
 * Data flow:
 * @code
 *   player position -> ChunkLoader -> chunk requests (network)
 *   chunk data / block edits -> World -> dirty set
 *   dirty set -> AsyncChunkMeshBuilder -> completed meshes -> WorldRenderer
 * @endcode
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>
#include <glm/glm.hpp>
#include "async_chunk_mesh_builder.h"
#include "block_system.h"
#include "chunk.h"
#include "chunk_loader.h"
#include "chunk_mesh_builder.h"
#include "engine_settings.h"
#include "raycast.h"

class World;
class WorldRenderer;
struct ChunkDataMessage;

/**
 * @brief Glue between the world, the streaming ring, the mesh workers and the renderer
 *
 * Usage:
 * @code
 *   GameEngine engine(renderer, settings);
 *   engine.setChunkRequestHandler([&](const std::vector<ChunkCoord>& p) { sendRequest(p); });
 *   engine.setWorld(&world);
 *
 *   // Each frame:
 *   engine.receiveChunkData(message);   // for every column that arrived
 *   engine.updatePlayerPosition(playerPos);
 *   engine.update(deltaTime);
 * @endcode
 *
 * Only queueBlockUpdate() may be called from other threads. Its edits are applied
 * by the next update(). Everything else, including every world write and every
 * renderer call, happens on the main thread.
 */
class GameEngine {
public:
    using ChunkRequestHandler = std::function<void(const std::vector<ChunkCoord>&)>;

    /**
     * @param renderer Receiver of meshes and highlights, must outlive the engine
     * @param settings Streaming and rendering settings
     * @param registry Block colors used for meshing, must outlive the engine
     */
    explicit GameEngine(WorldRenderer& renderer,
                        const EngineSettings& settings = EngineSettings(),
                        const BlockRegistry& registry = BlockRegistry::instance());
    ~GameEngine();

    GameEngine(const GameEngine&) = delete;
    GameEngine& operator=(const GameEngine&) = delete;

    /**
     * @brief Attaches a world and starts the mesh workers
     *
     * Columns already present are marked loaded and dirty. Passing nullptr
     * detaches the current world and stops the pipeline.
     */
    void setWorld(World* world);
    World* getWorld() const { return m_world; }

    /**
     * @brief Receives batched chunk requests produced by the loader
     */
    void setChunkRequestHandler(ChunkRequestHandler handler);

    // ========== World input ==========

    /**
     * @brief Writes a block and marks affected columns dirty
     *
     * The owning column is always marked. A block on a column edge also marks
     * the neighbor across that edge, since its culled faces may change.
     */
    void notifyBlockUpdate(int x, int y, int z, BlockType type);

    /**
     * @brief Thread-safe variant of notifyBlockUpdate()
     *
     * The edit is stored and applied at the start of the next update(), after any
     * column data received before it. Pending edits are dropped by shutdown().
     */
    void queueBlockUpdate(int x, int y, int z, BlockType type);
    size_t getPendingBlockUpdateCount() const;

    /**
     * @brief Marks a newly arrived column and its 4 horizontal neighbors dirty
     */
    void notifyChunkReceived(const ChunkCoord& position);

    /**
     * @brief Stores a received column in the world and marks it received
     * @return False if the message does not describe a complete column
     */
    bool receiveChunkData(const ChunkDataMessage& message);

    /**
     * @brief Feeds the player position to the chunk loader
     */
    void updatePlayerPosition(const glm::vec3& position);

    // ========== Per frame ==========

    /**
     * @brief Flushes the dirty set to the mesh workers and drains finished meshes
     *
     * Finished meshes are drained on every call, even when nothing was flushed.
     *
     * @return Number of meshes handed to the renderer
     */
    int update(float deltaTime);

    // ========== Targeting ==========

    /**
     * @brief Raycasts from the camera and moves the block highlight
     *
     * The previous target is un-highlighted when the target changes or is lost.
     */
    RaycastHit updateTargetBlock(const glm::vec3& origin, const glm::vec3& direction,
                                 float maxDistance = 8.0f);

    bool hasTargetBlock() const { return m_hasTarget; }
    glm::ivec3 getTargetBlock() const { return m_targetBlock; }

    /**
     * @brief Standalone mesh of the targeted block (empty without a target)
     */
    ChunkMeshData buildTargetBlockMesh() const;

    void setCamera(const glm::vec3& position, const glm::vec3& rotation);

    // ========== Inspection ==========

    /// Snapshot of columns waiting for the next update()
    std::vector<ChunkCoord> getDirtyChunks() const;
    size_t getDirtyChunkCount() const;

    const ChunkMeshBuilder& getMeshBuilder() const { return m_meshBuilder; }

    /// nullptr until a world is attached
    AsyncChunkMeshBuilder* getAsyncMeshBuilder() { return m_asyncBuilder.get(); }
    ChunkLoader* getChunkLoader() { return m_chunkLoader.get(); }

    /**
     * @brief Stops the mesh workers and detaches the world (safe to call twice)
     */
    void shutdown();

private:
    struct PendingBlockUpdate {
        int x, y, z;
        BlockType type;
    };

    void applyPendingBlockUpdates();
    void markDirty(const ChunkCoord& position);
    void handleChunkUnloaded(const ChunkCoord& position);
    void logPipelineStats() const;

    // === Collaborators ===
    WorldRenderer& m_renderer;
    EngineSettings m_settings;
    ChunkMeshBuilder m_meshBuilder;
    World* m_world = nullptr;

    // === Pipeline (exists while a world is attached) ===
    std::unique_ptr<ChunkLoader> m_chunkLoader;
    std::unique_ptr<AsyncChunkMeshBuilder> m_asyncBuilder;
    ChunkRequestHandler m_chunkRequestHandler;

    // === Edit Inbox (any thread) ===
    std::vector<PendingBlockUpdate> m_pendingUpdates;
    mutable std::mutex m_pendingMutex;

    // === Dirty Set ===
    std::unordered_set<ChunkCoord> m_dirtyChunks;
    mutable std::mutex m_dirtyMutex;

    // === Targeting ===
    bool m_hasTarget = false;
    glm::ivec3 m_targetBlock{0};

    float m_statsTimer = 0.0f;   ///< Seconds since the last stats line
};
