/**
 * @file chunk.cpp
 * @brief Column storage, coordinate conversion and run-length encoding
 */

#include "chunk.h"
#include "world_utils.h"

Chunk::Chunk(int chunkX, int chunkZ)
    : m_chunkX(chunkX)
    , m_chunkZ(chunkZ)
    , m_blocks(new std::atomic<BlockType>[VOLUME])
{
    for (int i = 0; i < VOLUME; ++i) {
        m_blocks[i].store(BlockType::Air, std::memory_order_relaxed);
    }
}

BlockType Chunk::getBlock(int x, int y, int z) const {
    if (!isInBounds(x, y, z)) {
        return BlockType::Air;
    }
    return m_blocks[index(x, y, z)].load(std::memory_order_relaxed);
}

void Chunk::setBlock(int x, int y, int z, BlockType type) {
    if (!isInBounds(x, y, z)) {
        return;
    }
    m_blocks[index(x, y, z)].store(type, std::memory_order_relaxed);
}

glm::ivec3 Chunk::getWorldPosition(int x, int y, int z) const {
    return glm::ivec3(m_chunkX * SIZE + x, y, m_chunkZ * SIZE + z);
}

int Chunk::countSolidBlocks() const {
    int count = 0;
    for (int i = 0; i < VOLUME; ++i) {
        if (isSolid(m_blocks[i].load(std::memory_order_relaxed))) {
            count++;
        }
    }
    return count;
}

ChunkCoord Chunk::worldToChunkPosition(int worldX, int worldZ) {
    return ChunkCoord{floorDiv(worldX, SIZE), floorDiv(worldZ, SIZE)};
}

glm::ivec3 Chunk::worldToLocalPosition(int worldX, int worldY, int worldZ) {
    return glm::ivec3(floorMod(worldX, SIZE), worldY, floorMod(worldZ, SIZE));
}

std::vector<BlockRun> Chunk::compressBlocks() const {
    std::vector<BlockRun> runs;

    BlockType current = m_blocks[0].load(std::memory_order_relaxed);
    uint32_t runLength = 1;

    for (int i = 1; i < VOLUME; ++i) {
        BlockType block = m_blocks[i].load(std::memory_order_relaxed);
        if (block == current) {
            runLength++;
        } else {
            runs.push_back({current, runLength});
            current = block;
            runLength = 1;
        }
    }

    runs.push_back({current, runLength});
    return runs;
}

bool Chunk::decompressBlocks(const std::vector<BlockRun>& runs) {
    // Validate before touching storage so a bad payload leaves the column intact
    uint64_t total = 0;
    for (const auto& run : runs) {
        if (!isValidBlockType(static_cast<int>(run.type))) {
            return false;
        }
        total += run.count;
    }
    if (total != static_cast<uint64_t>(VOLUME)) {
        return false;
    }

    int blockIndex = 0;
    for (const auto& run : runs) {
        for (uint32_t c = 0; c < run.count; ++c) {
            m_blocks[blockIndex++].store(run.type, std::memory_order_relaxed);
        }
    }
    return true;
}
