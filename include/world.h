/**
 * @file world.h
 * @brief Sparse column map holding all loaded terrain
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "chunk.h"

/**
 * @brief Container for all loaded columns, addressed in world block coordinates
 *
 * World coordinates:
 * - Blocks are 1.0 world units in size
 * - Columns are 16x128x16 blocks and can have negative coordinates
 * - Any position in an absent column, or with Y outside [0, 128), reads as Air
 *
 * THREAD SAFETY:
 * - The column map is protected by a shared_mutex (readers: many, writers: exclusive)
 * - Columns are handed out as shared_ptr, so a mesh worker holding one keeps it
 *   alive even if the main thread unloads it meanwhile
 * - Individual blocks are atomic bytes, see Chunk
 *
 * Visibility is never cached here: getVisibleFaces() always reflects the current
 * state, including columns that arrived after a neighbor was meshed.
 */
class World {
public:
    World() = default;
    ~World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // ========== Block Querying and Modification ==========

    /**
     * @brief Sets a block, creating its column on first write
     *
     * Writes with Y outside the world height are ignored and create nothing.
     */
    void setBlock(int worldX, int worldY, int worldZ, BlockType type);

    /**
     * @brief Gets a block (Air for absent columns or out-of-range Y)
     */
    BlockType getBlock(int worldX, int worldY, int worldZ) const;

    bool isSolid(int worldX, int worldY, int worldZ) const {
        return ::isSolid(getBlock(worldX, worldY, worldZ));
    }

    /**
     * @brief Faces of the block at a position whose neighbor is not solid
     *
     * @return Bitmask of BlockFaces flags, computed from the current world state
     */
    uint8_t getVisibleFaces(int worldX, int worldY, int worldZ) const;

    // ========== Column Management ==========

    /**
     * @brief Gets a column, inserting an all-Air one if absent
     */
    std::shared_ptr<const Chunk> getOrCreateChunk(int chunkX, int chunkZ);

    /**
     * @brief Gets a column
     * @return The column, or nullptr if it is not loaded
     */
    std::shared_ptr<const Chunk> getChunk(int chunkX, int chunkZ) const;

    bool hasChunk(int chunkX, int chunkZ) const;

    /**
     * @brief Replaces a column's contents with run-length encoded block data
     *
     * The column is fully populated before it becomes visible to readers.
     *
     * @return False if the runs are malformed, the world is unchanged then
     */
    bool setChunkData(int chunkX, int chunkZ, const std::vector<BlockRun>& runs);

    /**
     * @brief Removes a column
     * @return True if the column existed
     */
    bool removeChunk(int chunkX, int chunkZ);

    /**
     * @brief Snapshot of all loaded columns
     */
    std::vector<std::shared_ptr<const Chunk>> getAllChunks() const;

    /**
     * @brief Gets coordinates of all currently loaded columns
     */
    std::vector<ChunkCoord> getAllChunkCoords() const;

    /**
     * @brief Iterates column coordinates with a callback
     *
     * Holds the shared lock during iteration, the callback must not modify the world.
     */
    void forEachChunkCoord(const std::function<void(const ChunkCoord&)>& callback) const;

    size_t getChunkCount() const;

private:
    /**
     * @brief Column for writing, created if absent
     */
    std::shared_ptr<Chunk> getOrCreateMutableChunk(int chunkX, int chunkZ);

    std::unordered_map<ChunkCoord, std::shared_ptr<Chunk>> m_chunkMap;  ///< O(1) column lookup
    mutable std::shared_mutex m_chunkMapMutex;                          ///< Protects m_chunkMap
};
