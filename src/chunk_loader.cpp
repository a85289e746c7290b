/**
 * @file chunk_loader.cpp
 * @brief Load ring, request ordering and unload hysteresis
 */

#include "chunk_loader.h"
#include "world.h"
#include "world_utils.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

ChunkLoader::ChunkLoader(World& world, int renderDistance, int loadDistance, int unloadDistance)
    : m_world(world)
    , m_renderDistance(renderDistance)
    , m_loadDistance(loadDistance)
    , m_unloadDistance(unloadDistance)
{
    if (renderDistance < 0 || loadDistance < 0) {
        throw std::invalid_argument("ChunkLoader distances must be non-negative");
    }
    if (unloadDistance < loadDistance + StreamingConstants::MIN_UNLOAD_MARGIN) {
        throw std::invalid_argument("Unload distance " + std::to_string(unloadDistance) +
                                    " must exceed load distance " + std::to_string(loadDistance) +
                                    " by at least " + std::to_string(StreamingConstants::MIN_UNLOAD_MARGIN));
    }
}

float ChunkLoader::chunkDistance(const ChunkCoord& a, const ChunkCoord& b) {
    float dx = static_cast<float>(a.x - b.x);
    float dz = static_cast<float>(a.z - b.z);
    return std::sqrt(dx * dx + dz * dz);
}

bool ChunkLoader::update(const glm::vec3& playerPosition) {
    if (m_hasLastPlayerPos &&
        glm::length(playerPosition - m_lastPlayerPos) < StreamingConstants::MOVEMENT_THRESHOLD) {
        return false;
    }

    m_lastPlayerPos = playerPosition;
    m_hasLastPlayerPos = true;
    m_playerChunk = Chunk::worldToChunkPosition(worldToBlock(playerPosition.x), worldToBlock(playerPosition.z));

    struct Candidate {
        ChunkCoord coord;
        float distance;
    };
    std::vector<Candidate> toRequest;

    for (int dx = -m_loadDistance; dx <= m_loadDistance; ++dx) {
        for (int dz = -m_loadDistance; dz <= m_loadDistance; ++dz) {
            ChunkCoord coord{m_playerChunk.x + dx, m_playerChunk.z + dz};
            float distance = chunkDistance(coord, m_playerChunk);
            if (distance > static_cast<float>(m_loadDistance)) {
                continue;
            }
            if (isChunkLoaded(coord) || m_world.hasChunk(coord.x, coord.z)) {
                continue;
            }
            m_loadedChunks.insert(coord);
            toRequest.push_back({coord, distance});
        }
    }

    // Closest columns first
    std::stable_sort(toRequest.begin(), toRequest.end(),
                     [](const Candidate& a, const Candidate& b) { return a.distance < b.distance; });

    if (!toRequest.empty()) {
        std::vector<ChunkCoord> positions;
        positions.reserve(toRequest.size());
        for (const auto& candidate : toRequest) {
            positions.push_back(candidate.coord);
        }

        Logger::debug() << "Requesting " << positions.size() << " chunks around ("
                        << m_playerChunk.x << ", " << m_playerChunk.z << ")";
        if (m_onChunkRequestNeeded) {
            m_onChunkRequestNeeded(positions);
        }
    }

    unloadDistantChunks();
    return true;
}

void ChunkLoader::unloadDistantChunks() {
    std::vector<ChunkCoord> toUnload;
    for (const auto& coord : m_loadedChunks) {
        if (chunkDistance(coord, m_playerChunk) > static_cast<float>(m_unloadDistance)) {
            toUnload.push_back(coord);
        }
    }

    for (const auto& coord : toUnload) {
        m_loadedChunks.erase(coord);
        m_world.removeChunk(coord.x, coord.z);
        if (m_onChunkUnloaded) {
            m_onChunkUnloaded(coord);
        }
    }

    if (!toUnload.empty()) {
        Logger::debug() << "Unloaded " << toUnload.size() << " chunks";
    }
}

void ChunkLoader::markChunkLoaded(const ChunkCoord& coord) {
    m_loadedChunks.insert(coord);
}

bool ChunkLoader::isWithinRenderDistance(const ChunkCoord& coord) const {
    return chunkDistance(coord, m_playerChunk) <= static_cast<float>(m_renderDistance);
}
