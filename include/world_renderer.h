/**
 * @file world_renderer.h
 * @brief Interface the engine uses to hand geometry to a graphics backend
 */

#pragma once

#include <glm/glm.hpp>
#include "chunk.h"
#include "chunk_mesh_builder.h"

/**
 * @brief Receiver of column meshes and view state
 *
 * All calls are made from the thread driving GameEngine::update(). An empty
 * mesh passed to updateChunk() means the column currently has nothing to draw.
 */
class WorldRenderer {
public:
    virtual ~WorldRenderer() = default;

    /**
     * @brief Replaces the geometry shown for a column
     */
    virtual void updateChunk(const ChunkCoord& position, const ChunkMeshData& mesh) = 0;

    /**
     * @brief Drops the geometry of an unloaded column
     */
    virtual void removeChunk(const ChunkCoord& position) = 0;

    /**
     * @brief Shows or hides the selection outline on a block
     */
    virtual void highlightBlock(const glm::ivec3& position, bool highlighted) = 0;

    /**
     * @param position Camera position in world space
     * @param rotation Pitch, yaw, roll in degrees
     */
    virtual void setCamera(const glm::vec3& position, const glm::vec3& rotation) = 0;
};
