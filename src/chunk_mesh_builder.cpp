/**
 * @file chunk_mesh_builder.cpp
 * @brief Quad emission with directional light and ambient occlusion
 */

#include "chunk_mesh_builder.h"
#include "block_system.h"
#include "chunk.h"
#include "world.h"

namespace {

/**
 * @brief Geometry of one cube face
 *
 * corners are offsets from the block center in units of half a block, in the
 * order the quad's vertices are emitted.
 */
struct FaceDef {
    uint8_t flag;
    glm::ivec3 normal;
    glm::ivec3 corners[4];
    float brightness;
};

const FaceDef FACES[6] = {
    // Front (+Z)
    { BlockFaces::Front, { 0, 0, 1 },
      { {-1, -1, 1}, { 1, -1, 1}, { 1, 1, 1}, {-1, 1, 1} },
      LightingConstants::SIDE_FACE_BRIGHTNESS },
    // Back (-Z)
    { BlockFaces::Back, { 0, 0, -1 },
      { { 1, -1, -1}, {-1, -1, -1}, {-1, 1, -1}, { 1, 1, -1} },
      LightingConstants::SIDE_FACE_BRIGHTNESS },
    // Right (+X)
    { BlockFaces::Right, { 1, 0, 0 },
      { { 1, -1, 1}, { 1, -1, -1}, { 1, 1, -1}, { 1, 1, 1} },
      LightingConstants::SIDE_FACE_BRIGHTNESS },
    // Left (-X)
    { BlockFaces::Left, { -1, 0, 0 },
      { {-1, -1, -1}, {-1, -1, 1}, {-1, 1, 1}, {-1, 1, -1} },
      LightingConstants::SIDE_FACE_BRIGHTNESS },
    // Top (+Y)
    { BlockFaces::Top, { 0, 1, 0 },
      { {-1, 1, 1}, { 1, 1, 1}, { 1, 1, -1}, {-1, 1, -1} },
      LightingConstants::TOP_FACE_BRIGHTNESS },
    // Bottom (-Y)
    { BlockFaces::Bottom, { 0, -1, 0 },
      { {-1, -1, -1}, { 1, -1, -1}, { 1, -1, 1}, {-1, -1, 1} },
      LightingConstants::BOTTOM_FACE_BRIGHTNESS },
};

const float FACE_UVS[8] = { 0.0f, 0.0f, 1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 1.0f };

const uint32_t QUAD_INDICES[6] = { 0, 1, 2, 2, 3, 0 };

} // namespace

ChunkMeshBuilder::ChunkMeshBuilder(const BlockRegistry& registry, MeshBuildOptions options)
    : m_registry(registry)
    , m_options(options)
{
}

ChunkMeshData ChunkMeshBuilder::buildChunkMesh(const Chunk& chunk, const World& world) const {
    ChunkMeshData mesh;

    for (int x = 0; x < Chunk::SIZE; ++x) {
        for (int y = 0; y < Chunk::HEIGHT; ++y) {
            for (int z = 0; z < Chunk::SIZE; ++z) {
                BlockType type = chunk.getBlock(x, y, z);
                if (type == BlockType::Air) {
                    continue;
                }

                glm::ivec3 worldPos = chunk.getWorldPosition(x, y, z);
                glm::vec3 color = m_registry.getColor(type);
                uint8_t faces = world.getVisibleFaces(worldPos.x, worldPos.y, worldPos.z);

                for (int f = 0; f < 6; ++f) {
                    if (faces & FACES[f].flag) {
                        addFace(mesh, f, worldPos, color, &world);
                    }
                }
            }
        }
    }

    return mesh;
}

ChunkMeshData ChunkMeshBuilder::buildSingleBlockMesh(const glm::ivec3& position, BlockType type,
                                                     uint8_t visibleFaces) const {
    ChunkMeshData mesh;
    if (type == BlockType::Air) {
        return mesh;
    }

    glm::vec3 color = m_registry.getColor(type);
    for (int f = 0; f < 6; ++f) {
        if (visibleFaces & FACES[f].flag) {
            addFace(mesh, f, position, color, nullptr);
        }
    }
    return mesh;
}

void ChunkMeshBuilder::addFace(ChunkMeshData& mesh, int faceIndex, const glm::ivec3& position,
                               const glm::vec3& color, const World* world) const {
    const FaceDef& face = FACES[faceIndex];
    const uint32_t baseIndex = static_cast<uint32_t>(mesh.getVertexCount());

    // Cell directly in front of the face, AO samples lie in its layer
    const glm::ivec3 front = position + face.normal;

    for (int v = 0; v < 4; ++v) {
        const glm::ivec3& corner = face.corners[v];

        mesh.vertices.push_back(position.x + corner.x * 0.5f);
        mesh.vertices.push_back(position.y + corner.y * 0.5f);
        mesh.vertices.push_back(position.z + corner.z * 0.5f);

        mesh.colors.push_back(color.r);
        mesh.colors.push_back(color.g);
        mesh.colors.push_back(color.b);

        mesh.texCoords.push_back(FACE_UVS[v * 2]);
        mesh.texCoords.push_back(FACE_UVS[v * 2 + 1]);

        float brightness = face.brightness;
        if (world != nullptr && m_options.ambientOcclusion) {
            // The two in-plane axes are the ones the normal does not use
            glm::ivec3 side1Offset(0);
            glm::ivec3 side2Offset(0);
            bool first = true;
            for (int axis = 0; axis < 3; ++axis) {
                if (face.normal[axis] != 0) {
                    continue;
                }
                glm::ivec3& target = first ? side1Offset : side2Offset;
                target[axis] = corner[axis];
                first = false;
            }

            const glm::ivec3 side1 = front + side1Offset;
            const glm::ivec3 side2 = front + side2Offset;
            const glm::ivec3 diagonal = front + side1Offset + side2Offset;

            int solidCount = (world->isSolid(side1.x, side1.y, side1.z) ? 1 : 0)
                           + (world->isSolid(side2.x, side2.y, side2.z) ? 1 : 0)
                           + (world->isSolid(diagonal.x, diagonal.y, diagonal.z) ? 1 : 0);

            float ao = (3 - solidCount) / 3.0f;
            brightness *= 1.0f - (1.0f - ao) * m_options.aoStrength;
        }
        mesh.brightness.push_back(brightness);
    }

    for (uint32_t index : QUAD_INDICES) {
        mesh.indices.push_back(baseIndex + index);
    }
}
