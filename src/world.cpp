/**
 * @file world.cpp
 * @brief Column map and block access
 */

#include "world.h"
#include "world_utils.h"
#include <mutex>

void World::setBlock(int worldX, int worldY, int worldZ, BlockType type) {
    if (worldY < 0 || worldY >= Chunk::HEIGHT) {
        return;
    }

    auto coords = worldToBlockCoords(worldX, worldY, worldZ, Chunk::SIZE);
    auto chunk = getOrCreateMutableChunk(coords.chunkX, coords.chunkZ);
    chunk->setBlock(coords.localX, coords.localY, coords.localZ, type);
}

BlockType World::getBlock(int worldX, int worldY, int worldZ) const {
    if (worldY < 0 || worldY >= Chunk::HEIGHT) {
        return BlockType::Air;
    }

    auto coords = worldToBlockCoords(worldX, worldY, worldZ, Chunk::SIZE);

    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
    auto it = m_chunkMap.find(ChunkCoord{coords.chunkX, coords.chunkZ});
    if (it == m_chunkMap.end()) {
        return BlockType::Air;
    }
    return it->second->getBlock(coords.localX, coords.localY, coords.localZ);
}

uint8_t World::getVisibleFaces(int worldX, int worldY, int worldZ) const {
    uint8_t faces = BlockFaces::None;

    if (!isSolid(worldX, worldY, worldZ + 1)) faces |= BlockFaces::Front;
    if (!isSolid(worldX, worldY, worldZ - 1)) faces |= BlockFaces::Back;
    if (!isSolid(worldX + 1, worldY, worldZ)) faces |= BlockFaces::Right;
    if (!isSolid(worldX - 1, worldY, worldZ)) faces |= BlockFaces::Left;
    if (!isSolid(worldX, worldY + 1, worldZ)) faces |= BlockFaces::Top;
    if (!isSolid(worldX, worldY - 1, worldZ)) faces |= BlockFaces::Bottom;

    return faces;
}

std::shared_ptr<const Chunk> World::getOrCreateChunk(int chunkX, int chunkZ) {
    return getOrCreateMutableChunk(chunkX, chunkZ);
}

std::shared_ptr<Chunk> World::getOrCreateMutableChunk(int chunkX, int chunkZ) {
    ChunkCoord coord{chunkX, chunkZ};

    {
        std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
        auto it = m_chunkMap.find(coord);
        if (it != m_chunkMap.end()) {
            return it->second;
        }
    }

    // Allocate outside the lock, another writer may have inserted in between
    auto created = std::make_shared<Chunk>(chunkX, chunkZ);

    std::unique_lock<std::shared_mutex> lock(m_chunkMapMutex);
    auto result = m_chunkMap.emplace(coord, std::move(created));
    return result.first->second;
}

std::shared_ptr<const Chunk> World::getChunk(int chunkX, int chunkZ) const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
    auto it = m_chunkMap.find(ChunkCoord{chunkX, chunkZ});
    if (it == m_chunkMap.end()) {
        return nullptr;
    }
    return it->second;
}

bool World::hasChunk(int chunkX, int chunkZ) const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
    return m_chunkMap.find(ChunkCoord{chunkX, chunkZ}) != m_chunkMap.end();
}

bool World::setChunkData(int chunkX, int chunkZ, const std::vector<BlockRun>& runs) {
    auto chunk = std::make_shared<Chunk>(chunkX, chunkZ);
    if (!chunk->decompressBlocks(runs)) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_chunkMapMutex);
    m_chunkMap[ChunkCoord{chunkX, chunkZ}] = std::move(chunk);
    return true;
}

bool World::removeChunk(int chunkX, int chunkZ) {
    std::unique_lock<std::shared_mutex> lock(m_chunkMapMutex);
    return m_chunkMap.erase(ChunkCoord{chunkX, chunkZ}) > 0;
}

std::vector<std::shared_ptr<const Chunk>> World::getAllChunks() const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);

    std::vector<std::shared_ptr<const Chunk>> chunks;
    chunks.reserve(m_chunkMap.size());
    for (const auto& pair : m_chunkMap) {
        chunks.push_back(pair.second);
    }
    return chunks;
}

std::vector<ChunkCoord> World::getAllChunkCoords() const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);

    std::vector<ChunkCoord> coords;
    coords.reserve(m_chunkMap.size());
    for (const auto& pair : m_chunkMap) {
        coords.push_back(pair.first);
    }
    return coords;
}

void World::forEachChunkCoord(const std::function<void(const ChunkCoord&)>& callback) const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
    for (const auto& pair : m_chunkMap) {
        callback(pair.first);
    }
}

size_t World::getChunkCount() const {
    std::shared_lock<std::shared_mutex> lock(m_chunkMapMutex);
    return m_chunkMap.size();
}
