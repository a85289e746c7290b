/**
 * @file raycast.h
 * @brief Voxel ray traversal for block targeting
 */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

class World;

struct RaycastHit {
    bool hit = false;
    glm::ivec3 blockPosition{0};   // Block that was hit
    glm::ivec3 normal{0};          // Outward normal of the face that was entered
    float distance = 0.0f;         // Distance from ray origin to the entered face

    /// BlockFaces flag of the entered face (None if the ray started inside the block)
    uint8_t getFace() const;

    /// Cell in front of the entered face, where a placed block would go
    glm::ivec3 getAdjacentPosition() const { return blockPosition + normal; }
};

class Raycast {
public:
    // Walks the grid from origin along direction (DDA) and returns the first solid block.
    // maxDistance is in world units (1 block = 1 unit)
    static RaycastHit castRay(const World& world, const glm::vec3& origin, const glm::vec3& direction,
                              float maxDistance = 8.0f);
};
