/**
 * @file chunk_mesh_builder.h
 * @brief Face-culled mesh generation for columns and single blocks
 */

#pragma once

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>
#include "block_types.h"
#include "world_constants.h"

class Chunk;
class World;
class BlockRegistry;

/**
 * @brief Flat vertex arrays for one mesh
 *
 * Each visible face contributes 4 vertices and 6 indices (0,1,2 / 2,3,0
 * relative to the face's first vertex). A mesh with no indices means
 * "nothing to draw".
 */
struct ChunkMeshData {
    std::vector<float> vertices;     ///< 3 floats per vertex (world space)
    std::vector<float> colors;       ///< 3 floats per vertex (RGB)
    std::vector<float> texCoords;    ///< 2 floats per vertex
    std::vector<float> brightness;   ///< 1 float per vertex (face light * ambient occlusion)
    std::vector<uint32_t> indices;   ///< 6 per face

    size_t getVertexCount() const { return vertices.size() / 3; }
    size_t getFaceCount() const { return indices.size() / 6; }
    bool isEmpty() const { return indices.empty(); }
};

/**
 * @brief Tunables for mesh generation
 */
struct MeshBuildOptions {
    bool ambientOcclusion = true;                                            ///< Per-vertex corner darkening
    float aoStrength = LightingConstants::AMBIENT_OCCLUSION_STRENGTH;         ///< Darkening of a fully occluded vertex
};

/**
 * @brief Turns block data into renderable quads
 *
 * Holds only immutable configuration, so one builder may be shared by any
 * number of threads building different columns.
 *
 * Per-face brightness is fixed: top 1.0, sides 0.75, bottom 0.5. With ambient
 * occlusion enabled, each vertex samples the three cells touching its corner in
 * the layer in front of the face (side1, side2, corner):
 * @code
 * ao = (3 - solidCount) / 3
 * brightness = faceBrightness * (1 - (1 - ao) * aoStrength)
 * @endcode
 */
class ChunkMeshBuilder {
public:
    /**
     * @param registry Source of block colors, must outlive the builder
     * @param options Ambient occlusion settings
     */
    explicit ChunkMeshBuilder(const BlockRegistry& registry, MeshBuildOptions options = MeshBuildOptions());

    /**
     * @brief Builds the mesh for one column
     *
     * Blocks are visited X outer, Y middle, Z inner. Faces are culled against the
     * current world state, so neighbors in adjacent columns hide shared faces.
     *
     * @param chunk Column to mesh
     * @param world World used for neighbor lookups
     * @return Mesh data, empty if the column has no visible faces
     */
    ChunkMeshData buildChunkMesh(const Chunk& chunk, const World& world) const;

    /**
     * @brief Builds a standalone mesh for one block (selection highlight)
     *
     * No neighbor data is available, so brightness is the plain face value.
     *
     * @param position World block position
     * @param type Block type, Air yields an empty mesh
     * @param visibleFaces BlockFaces bitmask of faces to emit
     */
    ChunkMeshData buildSingleBlockMesh(const glm::ivec3& position, BlockType type, uint8_t visibleFaces) const;

    const MeshBuildOptions& getOptions() const { return m_options; }

private:
    void addFace(ChunkMeshData& mesh, int faceIndex, const glm::ivec3& position,
                 const glm::vec3& color, const World* world) const;

    const BlockRegistry& m_registry;
    MeshBuildOptions m_options;
};
