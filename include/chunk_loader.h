/**
 * @file chunk_loader.h
 * @brief Player-driven column residency (request, track, unload)
 */

#pragma once

#include <functional>
#include <unordered_set>
#include <vector>
#include <glm/glm.hpp>
#include "chunk.h"
#include "world_constants.h"

class World;

/**
 * @brief Decides which columns should be resident around the player
 *
 * Distances are Euclidean, measured in columns between the player's column and
 * the candidate column. Columns within the load distance are requested
 * (closest first, one batched callback per update). Columns beyond the unload
 * distance are removed from the world. The gap between the two rings keeps a
 * column from being requested again right after it was unloaded.
 *
 * Not thread-safe: call from the thread that owns the world's mutations.
 */
class ChunkLoader {
public:
    using ChunkRequestCallback = std::function<void(const std::vector<ChunkCoord>&)>;
    using ChunkUnloadedCallback = std::function<void(const ChunkCoord&)>;

    /**
     * @param world World to remove unloaded columns from
     * @param renderDistance Columns considered visible
     * @param loadDistance Columns requested around the player
     * @param unloadDistance Columns kept before unloading
     * @throws std::invalid_argument if unloadDistance < loadDistance + 2 or a distance is negative
     */
    ChunkLoader(World& world,
                int renderDistance = StreamingConstants::RENDER_DISTANCE,
                int loadDistance = StreamingConstants::LOAD_DISTANCE,
                int unloadDistance = StreamingConstants::UNLOAD_DISTANCE);

    void setOnChunkRequestNeeded(ChunkRequestCallback callback) { m_onChunkRequestNeeded = std::move(callback); }
    void setOnChunkUnloaded(ChunkUnloadedCallback callback) { m_onChunkUnloaded = std::move(callback); }

    /**
     * @brief Recomputes residency for a new player position
     *
     * Does nothing unless the player moved at least one world unit since the
     * last recomputation (the first call always runs).
     *
     * @return True if residency was recomputed
     */
    bool update(const glm::vec3& playerPosition);

    /**
     * @brief Records that a column's data has arrived (idempotent)
     */
    void markChunkLoaded(const ChunkCoord& coord);

    bool isChunkLoaded(const ChunkCoord& coord) const {
        return m_loadedChunks.count(coord) > 0;
    }

    const std::unordered_set<ChunkCoord>& getLoadedChunks() const { return m_loadedChunks; }

    /**
     * @brief True if a column lies within the render distance of the player's column
     */
    bool isWithinRenderDistance(const ChunkCoord& coord) const;

    /**
     * @brief Column the player was in at the last recomputation
     */
    ChunkCoord getPlayerChunk() const { return m_playerChunk; }

    int getRenderDistance() const { return m_renderDistance; }
    int getLoadDistance() const { return m_loadDistance; }
    int getUnloadDistance() const { return m_unloadDistance; }

private:
    void unloadDistantChunks();

    static float chunkDistance(const ChunkCoord& a, const ChunkCoord& b);

    World& m_world;
    int m_renderDistance;
    int m_loadDistance;
    int m_unloadDistance;

    std::unordered_set<ChunkCoord> m_loadedChunks;  ///< Requested or received columns
    glm::vec3 m_lastPlayerPos{0.0f};                ///< Position of the last recomputation
    bool m_hasLastPlayerPos = false;
    ChunkCoord m_playerChunk{0, 0};

    ChunkRequestCallback m_onChunkRequestNeeded;
    ChunkUnloadedCallback m_onChunkUnloaded;
};
