/**
 * @file terrain_generator.cpp
 * @brief Layered column generation with seeded ore placement
 */

#include "terrain_generator.h"
#include "chunk.h"
#include "world.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <random>

namespace {

constexpr float TWO_PI = 6.28318530718f;

// Mixes seed and column position into one 32-bit value for the ore RNG
uint32_t columnHash(uint32_t seed, int x, int z) {
    uint32_t h = seed * 0x9E3779B1u;
    h ^= static_cast<uint32_t>(x) * 0x85EBCA77u;
    h = (h << 13) | (h >> 19);
    h ^= static_cast<uint32_t>(z) * 0xC2B2AE3Du;
    h ^= h >> 16;
    h *= 0x7FEB352Du;
    h ^= h >> 15;
    return h;
}

} // namespace

TerrainGenerator::TerrainGenerator(uint32_t seed, int baseHeight, int heightVariation)
    : m_seed(seed)
    , m_baseHeight(std::max(1, std::min(baseHeight, Chunk::HEIGHT - 1)))
    , m_heightVariation(std::max(0, heightVariation))
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> phase(0.0f, TWO_PI);
    m_phaseX = phase(rng);
    m_phaseZ = phase(rng);
    m_phaseDiagonal = phase(rng);
}

int TerrainGenerator::getTerrainHeight(int worldX, int worldZ) const {
    // Two crossed waves plus a longer diagonal one, normalized to 0-1
    float wave = std::sin(worldX * 0.05f + m_phaseX) * std::cos(worldZ * 0.07f + m_phaseZ) * 0.5f
               + std::sin((worldX + worldZ) * 0.031f + m_phaseDiagonal) * 0.5f;
    float normalized = (wave + 1.0f) * 0.5f;

    int height = m_baseHeight + static_cast<int>(normalized * m_heightVariation);
    return std::min(height, Chunk::HEIGHT - 1);
}

BlockType TerrainGenerator::blockForDepth(int y, int surfaceHeight) const {
    int depthFromSurface = surfaceHeight - y;
    if (depthFromSurface == 0) {
        return BlockType::Grass;
    }
    if (depthFromSurface <= 3 + (y % 2)) {
        return BlockType::Dirt;
    }
    return BlockType::Stone;
}

void TerrainGenerator::fillChunk(Chunk& chunk) const {
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);

    for (int x = 0; x < Chunk::SIZE; ++x) {
        for (int z = 0; z < Chunk::SIZE; ++z) {
            glm::ivec3 world = chunk.getWorldPosition(x, 0, z);
            int surface = getTerrainHeight(world.x, world.z);

            std::mt19937 rng(columnHash(m_seed, world.x, world.z));

            chunk.setBlock(x, 0, z, BlockType::Bedrock);
            for (int y = 1; y <= surface; ++y) {
                BlockType type = blockForDepth(y, surface);

                // One draw per block keeps the sequence independent of ore outcomes
                float ore = roll(rng);
                // Rarest first, the thresholds nest inside each other
                if (type == BlockType::Stone && y >= 5) {
                    if (y <= 12 && ore > 0.995f) {
                        type = BlockType::DiamondOre;
                    } else if (y <= 29 && ore > 0.985f) {
                        type = BlockType::GoldOre;
                    } else if (y <= 54 && ore > 0.97f) {
                        type = BlockType::IronOre;
                    } else if (y <= 64 && ore > 0.95f) {
                        type = BlockType::CoalOre;
                    }
                }

                chunk.setBlock(x, y, z, type);
            }
        }
    }
}

void TerrainGenerator::generateChunk(World& world, int chunkX, int chunkZ) const {
    Chunk chunk(chunkX, chunkZ);
    fillChunk(chunk);

    if (!world.setChunkData(chunkX, chunkZ, chunk.compressBlocks())) {
        // compressBlocks always yields a full column
        Logger::error() << "Generated chunk (" << chunkX << ", " << chunkZ << ") was rejected by the world";
        return;
    }
    Logger::debug() << "Generated chunk (" << chunkX << ", " << chunkZ << ")";
}
