/**
 * @file world_utils.h
 * @brief Utility functions for world coordinate conversions
 */

#pragma once

#include <cmath>

/**
 * @brief Integer division rounding toward negative infinity
 *
 * floorDiv(-1, 16) == -1, where plain integer division gives 0.
 */
inline int floorDiv(int value, int divisor) {
    int q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

/**
 * @brief Remainder that is always in [0, divisor) for positive divisors
 */
inline int floorMod(int value, int divisor) {
    return ((value % divisor) + divisor) % divisor;
}

/**
 * @brief Column and local block coordinates computed from a world position
 */
struct BlockCoordinates {
    int chunkX;   ///< Column X coordinate
    int chunkZ;   ///< Column Z coordinate
    int localX;   ///< Local block X within the column (0-15)
    int localY;   ///< Block Y (columns span the full world height)
    int localZ;   ///< Local block Z within the column (0-15)
};

/**
 * @brief Converts integer world block coordinates to column and local coordinates
 *
 * Columns can have negative coordinates, world block -1 lives in column -1 at local 15.
 *
 * @code
 * auto coords = worldToBlockCoords(-1, 64, 17, 16);
 * // coords.chunkX == -1, coords.localX == 15, coords.chunkZ == 1, coords.localZ == 1
 * @endcode
 */
inline BlockCoordinates worldToBlockCoords(int worldX, int worldY, int worldZ, int chunkSize) {
    return {
        floorDiv(worldX, chunkSize),
        floorDiv(worldZ, chunkSize),
        floorMod(worldX, chunkSize),
        worldY,
        floorMod(worldZ, chunkSize)
    };
}

/**
 * @brief Block containing a floating point world position (blocks are 1.0 units)
 */
inline int worldToBlock(float worldCoord) {
    return static_cast<int>(std::floor(worldCoord));
}
