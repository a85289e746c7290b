/**
 * @file raycast_test.cpp
 * @brief Block targeting tests for the voxel ray traversal
 */

#include "test_utils.h"
#include "raycast.h"
#include "block_types.h"
#include "world.h"

TEST(StraightDownHitsTopFace) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);

    RaycastHit hit = Raycast::castRay(world, glm::vec3(0.0f, 14.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f));
    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.blockPosition, glm::ivec3(0, 10, 0));
    ASSERT_EQ(hit.normal, glm::ivec3(0, 1, 0));
    ASSERT_EQ(hit.getFace(), BlockFaces::Top);
    ASSERT_EQ(hit.getAdjacentPosition(), glm::ivec3(0, 11, 0));
    // Top face of a block centered at y = 10 is at y = 10.5
    ASSERT_NEAR(hit.distance, 3.5f, 1e-4f);
    std::cout << "✓ Downward ray enters the top face half a block above the center\n";
}

TEST(HorizontalHitEntersSideFace) {
    World world;
    world.setBlock(5, 10, 0, BlockType::Planks);

    RaycastHit hit = Raycast::castRay(world, glm::vec3(0.0f, 10.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.blockPosition, glm::ivec3(5, 10, 0));
    ASSERT_EQ(hit.normal, glm::ivec3(-1, 0, 0));
    ASSERT_EQ(hit.getFace(), BlockFaces::Left);
    ASSERT_EQ(hit.getAdjacentPosition(), glm::ivec3(4, 10, 0));
    ASSERT_NEAR(hit.distance, 4.5f, 1e-4f);

    RaycastHit back = Raycast::castRay(world, glm::vec3(9.0f, 10.0f, 0.0f), glm::vec3(-1.0f, 0.0f, 0.0f));
    ASSERT_TRUE(back.hit);
    ASSERT_EQ(back.getFace(), BlockFaces::Right);
    std::cout << "✓ Horizontal rays report the side face they entered\n";
}

TEST(BlocksAreCenteredOnIntegers) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);

    // x = 0.4 is inside the block's footprint, x = 0.6 is past its +X face
    ASSERT_TRUE(Raycast::castRay(world, glm::vec3(0.4f, 14.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)).hit);
    ASSERT_TRUE(Raycast::castRay(world, glm::vec3(-0.4f, 14.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)).hit);
    ASSERT_FALSE(Raycast::castRay(world, glm::vec3(0.6f, 14.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)).hit);
    ASSERT_FALSE(Raycast::castRay(world, glm::vec3(-0.6f, 14.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)).hit);
    std::cout << "✓ Block footprint spans half a block either side of its coordinate\n";
}

TEST(MaxDistanceLimitsReach) {
    World world;
    world.setBlock(20, 10, 0, BlockType::Stone);

    glm::vec3 origin(0.0f, 10.0f, 0.0f);
    glm::vec3 east(1.0f, 0.0f, 0.0f);
    ASSERT_FALSE(Raycast::castRay(world, origin, east).hit);
    ASSERT_FALSE(Raycast::castRay(world, origin, east, 19.0f).hit);

    RaycastHit far = Raycast::castRay(world, origin, east, 25.0f);
    ASSERT_TRUE(far.hit);
    ASSERT_NEAR(far.distance, 19.5f, 1e-3f);
    std::cout << "✓ Blocks beyond the maximum distance are not hit\n";
}

TEST(DirectionNeedNotBeNormalized) {
    World world;
    world.setBlock(2, 3, 4, BlockType::Dirt);

    RaycastHit unit = Raycast::castRay(world, glm::vec3(2.0f, 7.0f, 4.0f), glm::vec3(0.0f, -1.0f, 0.0f));
    RaycastHit scaled = Raycast::castRay(world, glm::vec3(2.0f, 7.0f, 4.0f), glm::vec3(0.0f, -5.0f, 0.0f));
    ASSERT_TRUE(unit.hit);
    ASSERT_TRUE(scaled.hit);
    ASSERT_EQ(unit.blockPosition, scaled.blockPosition);
    ASSERT_NEAR(unit.distance, scaled.distance, 1e-5f);
    std::cout << "✓ Direction length does not change the result\n";
}

TEST(ZeroDirectionMisses) {
    World world;
    world.setBlock(0, 0, 0, BlockType::Stone);
    RaycastHit hit = Raycast::castRay(world, glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(0.0f));
    ASSERT_FALSE(hit.hit);
    std::cout << "✓ Zero direction never hits\n";
}

TEST(StartingInsideBlock) {
    World world;
    world.setBlock(0, 10, 0, BlockType::Stone);
    RaycastHit hit = Raycast::castRay(world, glm::vec3(0.1f, 10.2f, -0.1f), glm::vec3(0.0f, 1.0f, 0.0f));
    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.blockPosition, glm::ivec3(0, 10, 0));
    ASSERT_EQ(hit.getFace(), BlockFaces::None);
    ASSERT_NEAR(hit.distance, 0.0f, 1e-6f);
    std::cout << "✓ Ray starting inside a block hits it at distance 0\n";
}

TEST(NegativeCoordinates) {
    World world;
    world.setBlock(-5, 10, -3, BlockType::Stone);

    RaycastHit hit = Raycast::castRay(world, glm::vec3(-5.0f, 14.0f, -3.0f), glm::vec3(0.0f, -1.0f, 0.0f));
    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.blockPosition, glm::ivec3(-5, 10, -3));

    RaycastHit diagonal = Raycast::castRay(world, glm::vec3(-2.0f, 13.0f, -3.0f), glm::vec3(-1.0f, -1.0f, 0.0f));
    ASSERT_TRUE(diagonal.hit);
    ASSERT_EQ(diagonal.blockPosition, glm::ivec3(-5, 10, -3));
    std::cout << "✓ Rays work across negative column coordinates\n";
}

TEST(MissingColumnsAreEmpty) {
    World world;
    RaycastHit hit = Raycast::castRay(world, glm::vec3(100.0f, 50.0f, 100.0f), glm::vec3(0.0f, -1.0f, 0.0f), 100.0f);
    ASSERT_FALSE(hit.hit);
    std::cout << "✓ Columns that are not loaded are treated as air\n";
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
