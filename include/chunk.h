/**
 * @file chunk.h
 * @brief Full-height block column with flat storage and coordinate helpers
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include "block_types.h"
#include "world_constants.h"

/**
 * @brief Column coordinates identifying a chunk in the world
 */
struct ChunkCoord {
    int x, z;

    bool operator==(const ChunkCoord& other) const {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkCoord& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Hash function for ChunkCoord to enable use in unordered containers
 */
namespace std {
    template<>
    struct hash<ChunkCoord> {
        size_t operator()(const ChunkCoord& coord) const {
            size_t h1 = hash<int>()(coord.x);
            size_t h2 = hash<int>()(coord.z);
            return h1 ^ (h2 << 1);
        }
    };
}

/**
 * @brief One run of identical blocks in storage order
 */
struct BlockRun {
    BlockType type;
    uint32_t count;
};

/**
 * @brief A 16x128x16 column of blocks
 *
 * Storage is one contiguous array indexed ((x * HEIGHT) + y) * SIZE + z.
 * Each block is a single atomic byte so mesh workers may read while the main
 * thread writes, a reader sees either the old or the new value.
 *
 * Local coordinates outside [0,SIZE) x [0,HEIGHT) x [0,SIZE) read as Air and
 * writes to them are ignored.
 */
class Chunk {
public:
    static constexpr int SIZE = ChunkConstants::CHUNK_SIZE;        ///< Blocks along X and Z
    static constexpr int HEIGHT = ChunkConstants::WORLD_HEIGHT;    ///< Blocks along Y
    static constexpr int VOLUME = ChunkConstants::BLOCKS_PER_CHUNK;

    /**
     * @brief Creates an all-Air column
     * @param chunkX Column X coordinate
     * @param chunkZ Column Z coordinate
     */
    Chunk(int chunkX, int chunkZ);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    int getChunkX() const { return m_chunkX; }
    int getChunkZ() const { return m_chunkZ; }
    ChunkCoord getCoord() const { return ChunkCoord{m_chunkX, m_chunkZ}; }

    /**
     * @brief Gets the block at a local position
     * @return Stored type, or Air if the position is out of range
     */
    BlockType getBlock(int x, int y, int z) const;

    /**
     * @brief Sets the block at a local position (no-op when out of range)
     */
    void setBlock(int x, int y, int z, BlockType type);

    /**
     * @brief World block coordinates of a local position
     */
    glm::ivec3 getWorldPosition(int x, int y, int z) const;

    /**
     * @brief Number of non-Air blocks in the column
     */
    int countSolidBlocks() const;

    // ========== Coordinate Conversion ==========

    /**
     * @brief Column containing a world block position (floor division)
     */
    static ChunkCoord worldToChunkPosition(int worldX, int worldZ);

    /**
     * @brief Local position of a world block inside its column
     *
     * X and Z wrap into [0, SIZE) for negative coordinates too, Y is unchanged.
     */
    static glm::ivec3 worldToLocalPosition(int worldX, int worldY, int worldZ);

    static bool isInBounds(int x, int y, int z) {
        return x >= 0 && x < SIZE && y >= 0 && y < HEIGHT && z >= 0 && z < SIZE;
    }

    static int index(int x, int y, int z) {
        return ((x * HEIGHT) + y) * SIZE + z;
    }

    // ========== Serialization ==========

    /**
     * @brief Run-length encodes the column in storage order
     *
     * Terrain columns are mostly long vertical runs (air above, stone below),
     * so a column usually collapses to a few hundred runs.
     */
    std::vector<BlockRun> compressBlocks() const;

    /**
     * @brief Replaces the column contents from run-length encoded data
     *
     * @param runs Runs in storage order
     * @return False (column unchanged) if the runs do not cover exactly VOLUME blocks
     *         or contain an invalid type
     */
    bool decompressBlocks(const std::vector<BlockRun>& runs);

private:
    int m_chunkX;
    int m_chunkZ;
    std::unique_ptr<std::atomic<BlockType>[]> m_blocks;  ///< VOLUME entries, flat
};
