#include "raycast.h"
#include "world.h"
#include "block_types.h"
#include <cmath>
#include <algorithm>

uint8_t RaycastHit::getFace() const {
    if (normal.z > 0) return BlockFaces::Front;
    if (normal.z < 0) return BlockFaces::Back;
    if (normal.x > 0) return BlockFaces::Right;
    if (normal.x < 0) return BlockFaces::Left;
    if (normal.y > 0) return BlockFaces::Top;
    if (normal.y < 0) return BlockFaces::Bottom;
    return BlockFaces::None;
}

RaycastHit Raycast::castRay(const World& world, const glm::vec3& origin, const glm::vec3& direction, float maxDistance) {
    RaycastHit result;

    // Zero-length direction would normalize to NaN
    float dirLength = glm::length(direction);
    if (dirLength < 0.0001f) {
        return result;
    }

    glm::vec3 dir = direction / dirLength;

    // Step direction (1 or -1 for each axis)
    glm::ivec3 step(
        dir.x > 0 ? 1 : -1,
        dir.y > 0 ? 1 : -1,
        dir.z > 0 ? 1 : -1
    );

    // How far along the ray we travel to cross one voxel on each axis.
    // Epsilon keeps axis-aligned rays from dividing by zero
    const float epsilon = 0.0001f;
    glm::vec3 deltaDist(
        1.0f / std::max(std::abs(dir.x), epsilon),
        1.0f / std::max(std::abs(dir.y), epsilon),
        1.0f / std::max(std::abs(dir.z), epsilon)
    );

    // Blocks are centered on integer coordinates (faces at +-0.5, as meshed),
    // so the grid is walked in a space shifted by half a block
    glm::vec3 start = origin + glm::vec3(0.5f);
    glm::ivec3 mapPos(
        static_cast<int>(std::floor(start.x)),
        static_cast<int>(std::floor(start.y)),
        static_cast<int>(std::floor(start.z))
    );

    // Distance to the next voxel boundary on each axis
    glm::vec3 sideDist;
    for (int i = 0; i < 3; ++i) {
        if (step[i] > 0) {
            sideDist[i] = (mapPos[i] + 1.0f - start[i]) * deltaDist[i];
        } else {
            sideDist[i] = (start[i] - mapPos[i]) * deltaDist[i];
        }
    }

    glm::ivec3 normal(0, 0, 0);
    float totalDist = 0.0f;

    while (totalDist <= maxDistance) {
        if (world.isSolid(mapPos.x, mapPos.y, mapPos.z)) {
            result.hit = true;
            result.blockPosition = mapPos;
            result.normal = normal;
            result.distance = totalDist;
            return result;
        }

        // Step to next voxel
        if (sideDist.x < sideDist.y && sideDist.x < sideDist.z) {
            totalDist = sideDist.x;
            sideDist.x += deltaDist.x;
            mapPos.x += step.x;
            normal = glm::ivec3(-step.x, 0, 0);
        } else if (sideDist.y < sideDist.z) {
            totalDist = sideDist.y;
            sideDist.y += deltaDist.y;
            mapPos.y += step.y;
            normal = glm::ivec3(0, -step.y, 0);
        } else {
            totalDist = sideDist.z;
            sideDist.z += deltaDist.z;
            mapPos.z += step.z;
            normal = glm::ivec3(0, 0, -step.z);
        }
    }

    return result;
}
