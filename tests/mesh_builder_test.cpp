/**
 * @file mesh_builder_test.cpp
 * @brief Face emission, lighting and ambient occlusion tests for ChunkMeshBuilder
 */

#include "test_utils.h"
#include "block_system.h"
#include "chunk.h"
#include "chunk_mesh_builder.h"
#include "world.h"

namespace {

// Face order of emitted quads: front, back, right, left, top, bottom
constexpr int TOP_FACE_FIRST_VERTEX = 16;

ChunkMeshData buildColumn(const World& world, int chunkX, int chunkZ, MeshBuildOptions options = MeshBuildOptions()) {
    ChunkMeshBuilder builder(BlockRegistry::instance(), options);
    auto chunk = world.getChunk(chunkX, chunkZ);
    if (!chunk) {
        throw std::runtime_error("column missing");
    }
    return builder.buildChunkMesh(*chunk, world);
}

} // namespace

TEST(EmptyChunkHasNoGeometry) {
    World world;
    world.getOrCreateChunk(0, 0);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    ASSERT_TRUE(mesh.isEmpty());
    ASSERT_EQ(mesh.vertices.size(), 0u);
    ASSERT_EQ(mesh.indices.size(), 0u);
    ASSERT_EQ(mesh.brightness.size(), 0u);
    std::cout << "✓ All-Air column yields an empty mesh\n";
}

TEST(SingleBlockAtOrigin) {
    World world;
    world.setBlock(0, 0, 0, BlockType::Stone);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    ASSERT_EQ(mesh.getVertexCount(), 24u);
    ASSERT_EQ(mesh.indices.size(), 36u);
    ASSERT_EQ(mesh.getFaceCount(), 6u);
    ASSERT_EQ(mesh.vertices.size(), 72u);
    ASSERT_EQ(mesh.colors.size(), 72u);
    ASSERT_EQ(mesh.texCoords.size(), 48u);
    ASSERT_EQ(mesh.brightness.size(), 24u);

    // Nothing around the block, so brightness is the plain face value
    for (int v = 0; v < 24; v++) {
        float expected = LightingConstants::SIDE_FACE_BRIGHTNESS;
        if (v >= 16 && v < 20) {
            expected = LightingConstants::TOP_FACE_BRIGHTNESS;
        } else if (v >= 20) {
            expected = LightingConstants::BOTTOM_FACE_BRIGHTNESS;
        }
        ASSERT_NEAR(mesh.brightness[v], expected, 1e-6f);
    }
    ASSERT_GT(mesh.brightness[16], mesh.brightness[0]);
    ASSERT_GT(mesh.brightness[0], mesh.brightness[20]);

    // Every corner sits half a block from the center
    for (float coord : mesh.vertices) {
        ASSERT_NEAR(std::fabs(coord), 0.5f, 1e-6f);
    }
    std::cout << "✓ Isolated block: 24 vertices, 36 indices, top > side > bottom\n";
}

TEST(QuadIndexPattern) {
    World world;
    world.setBlock(3, 3, 3, BlockType::Dirt);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    const uint32_t pattern[6] = {0, 1, 2, 2, 3, 0};
    for (size_t face = 0; face < mesh.getFaceCount(); face++) {
        for (int i = 0; i < 6; i++) {
            ASSERT_EQ(mesh.indices[face * 6 + i], static_cast<uint32_t>(face * 4) + pattern[i]);
        }
    }
    std::cout << "✓ Each quad is indexed 0,1,2 / 2,3,0 from its first vertex\n";
}

TEST(TopFaceCorners) {
    World world;
    world.setBlock(2, 5, 7, BlockType::Grass);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    for (int v = TOP_FACE_FIRST_VERTEX; v < TOP_FACE_FIRST_VERTEX + 4; v++) {
        ASSERT_NEAR(mesh.vertices[v * 3 + 1], 5.5f, 1e-6f);
        ASSERT_NEAR(std::fabs(mesh.vertices[v * 3] - 2.0f), 0.5f, 1e-6f);
        ASSERT_NEAR(std::fabs(mesh.vertices[v * 3 + 2] - 7.0f), 0.5f, 1e-6f);
    }
    std::cout << "✓ Top face lies on the upper plane of the block\n";
}

TEST(ColorsComeFromRegistry) {
    World world;
    world.setBlock(0, 0, 0, BlockType::Sand);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    glm::vec3 sand = BlockRegistry::instance().getColor(BlockType::Sand);
    for (size_t v = 0; v < mesh.getVertexCount(); v++) {
        ASSERT_NEAR(mesh.colors[v * 3], sand.r, 1e-6f);
        ASSERT_NEAR(mesh.colors[v * 3 + 1], sand.g, 1e-6f);
        ASSERT_NEAR(mesh.colors[v * 3 + 2], sand.b, 1e-6f);
    }
    std::cout << "✓ Vertex colors match the block registry\n";
}

TEST(AdjacentBlocksShareNoFaces) {
    World world;
    world.setBlock(4, 10, 4, BlockType::Stone);
    world.setBlock(5, 10, 4, BlockType::Stone);
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    ASSERT_EQ(mesh.getFaceCount(), 10u);
    std::cout << "✓ Two touching blocks emit 10 faces\n";
}

TEST(NeighborColumnCullsSeamFace) {
    World world;
    world.setBlock(15, 10, 4, BlockType::Stone);   // Column (0, 0)
    world.setBlock(16, 10, 4, BlockType::Stone);   // Column (1, 0)

    ChunkMeshData left = buildColumn(world, 0, 0);
    ChunkMeshData right = buildColumn(world, 1, 0);
    ASSERT_EQ(left.getFaceCount(), 5u);
    ASSERT_EQ(right.getFaceCount(), 5u);

    world.removeChunk(1, 0);
    left = buildColumn(world, 0, 0);
    ASSERT_EQ(left.getFaceCount(), 6u);
    std::cout << "✓ Faces on a column seam follow the neighbor column\n";
}

TEST(AmbientOcclusionDarkensCorners) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);
    world.setBlock(1, 11, 0, BlockType::Stone);   // Touches the +X edge of the top face

    ChunkMeshData mesh = buildColumn(world, 0, 0);

    // Top face of the first block: corners (-x,+z) (+x,+z) (+x,-z) (-x,-z)
    float occluded = LightingConstants::TOP_FACE_BRIGHTNESS * (1.0f - (1.0f / 3.0f) * 0.3f);
    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 0], 1.0f, 1e-5f);
    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 1], occluded, 1e-5f);
    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 2], occluded, 1e-5f);
    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 3], 1.0f, 1e-5f);
    std::cout << "✓ One solid neighbor darkens the touching corners by a third of the strength\n";
}

TEST(FullyOccludedCorner) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);
    // side1, side2 and the diagonal of the (+x, +z) top corner
    world.setBlock(1, 11, 0, BlockType::Stone);
    world.setBlock(0, 11, 1, BlockType::Stone);
    world.setBlock(1, 11, 1, BlockType::Stone);

    MeshBuildOptions full;
    full.aoStrength = 1.0f;
    ChunkMeshData mesh = buildColumn(world, 0, 0, full);

    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 1], 0.0f, 1e-5f);
    ASSERT_NEAR(mesh.brightness[TOP_FACE_FIRST_VERTEX + 3], 1.0f, 1e-5f);
    std::cout << "✓ Three solid neighbors give maximum darkening\n";
}

TEST(AmbientOcclusionCanBeDisabled) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);
    world.setBlock(1, 11, 0, BlockType::Stone);

    MeshBuildOptions flat;
    flat.ambientOcclusion = false;
    ChunkMeshData mesh = buildColumn(world, 0, 0, flat);

    for (int v = TOP_FACE_FIRST_VERTEX; v < TOP_FACE_FIRST_VERTEX + 4; v++) {
        ASSERT_NEAR(mesh.brightness[v], LightingConstants::TOP_FACE_BRIGHTNESS, 1e-6f);
    }
    std::cout << "✓ Disabled ambient occlusion leaves plain face brightness\n";
}

TEST(SingleBlockMesh) {
    ChunkMeshBuilder builder(BlockRegistry::instance());

    ChunkMeshData all = builder.buildSingleBlockMesh(glm::ivec3(-3, 40, 9), BlockType::Wood, BlockFaces::All);
    ASSERT_EQ(all.getVertexCount(), 24u);
    ASSERT_EQ(all.indices.size(), 36u);
    ASSERT_NEAR(all.vertices[0], -3.5f, 1e-6f);

    ChunkMeshData top = builder.buildSingleBlockMesh(glm::ivec3(0, 0, 0), BlockType::Wood, BlockFaces::Top);
    ASSERT_EQ(top.getFaceCount(), 1u);
    for (float b : top.brightness) {
        ASSERT_NEAR(b, LightingConstants::TOP_FACE_BRIGHTNESS, 1e-6f);
    }

    ChunkMeshData air = builder.buildSingleBlockMesh(glm::ivec3(0, 0, 0), BlockType::Air, BlockFaces::All);
    ASSERT_TRUE(air.isEmpty());

    ChunkMeshData none = builder.buildSingleBlockMesh(glm::ivec3(0, 0, 0), BlockType::Stone, BlockFaces::None);
    ASSERT_TRUE(none.isEmpty());
    std::cout << "✓ Single-block meshes honor the face mask\n";
}

TEST(FloorOfBlocks) {
    World world;
    for (int x = 0; x < Chunk::SIZE; x++) {
        for (int z = 0; z < Chunk::SIZE; z++) {
            world.setBlock(x, 0, z, BlockType::Stone);
        }
    }
    ChunkMeshData mesh = buildColumn(world, 0, 0);

    // 256 tops, 256 bottoms and 4 x 16 outer sides
    ASSERT_EQ(mesh.getFaceCount(), 256u + 256u + 64u);
    std::cout << "✓ A 16x16 floor emits only its outer faces\n";
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
