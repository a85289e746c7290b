/**
 * @file terrain_generator.h
 * @brief Deterministic layered terrain for server-side columns
 */

#pragma once

#include <cstdint>
#include "block_types.h"

class Chunk;
class World;

/**
 * @brief Fills columns with bedrock, stone (with ores), dirt and grass
 *
 * Column layout from the bottom up:
 * - y = 0: Bedrock
 * - Stone up to a few blocks below the surface, with ore by depth band
 *   (coal 5-64, iron 5-54, gold 5-29, diamond 5-12)
 * - 3-4 layers of Dirt
 * - Grass at the surface height
 *
 * Everything is derived from the seed and the block position, so the same seed
 * always produces the same world regardless of generation order.
 */
class TerrainGenerator {
public:
    /**
     * @param seed World seed
     * @param baseHeight Lowest surface height
     * @param heightVariation Maximum rise above baseHeight
     */
    explicit TerrainGenerator(uint32_t seed, int baseHeight = 32, int heightVariation = 16);

    /**
     * @brief Surface height of the column at a world X/Z position
     */
    int getTerrainHeight(int worldX, int worldZ) const;

    /**
     * @brief Fills a detached chunk with terrain
     */
    void fillChunk(Chunk& chunk) const;

    /**
     * @brief Generates a column and inserts it into the world, replacing any existing data
     */
    void generateChunk(World& world, int chunkX, int chunkZ) const;

    uint32_t getSeed() const { return m_seed; }

private:
    BlockType blockForDepth(int y, int surfaceHeight) const;

    uint32_t m_seed;
    int m_baseHeight;
    int m_heightVariation;

    // Seed-derived wave parameters for the height function
    float m_phaseX;
    float m_phaseZ;
    float m_phaseDiagonal;
};
