/**
 * @file block_types.h
 * @brief Closed set of block types and face visibility flags
 */

#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Block kinds stored in chunks (one byte each)
 *
 * Air is the only non-solid type. It is never meshed and reads back for any
 * position outside loaded chunks.
 */
enum class BlockType : uint8_t {
    Air = 0,
    Grass,
    Dirt,
    Stone,
    Wood,
    Sand,
    Planks,
    Gravel,
    Glass,
    Leaves,
    CoalOre,
    IronOre,
    GoldOre,
    DiamondOre,
    Bedrock
};

/// Number of BlockType values, used to validate raw bytes from the wire
constexpr int BLOCK_TYPE_COUNT = static_cast<int>(BlockType::Bedrock) + 1;

/**
 * @brief Face flags for the six axis-aligned neighbors of a block
 *
 * Combined into a bitmask by World::getVisibleFaces().
 */
namespace BlockFaces {
    constexpr uint8_t None   = 0;
    constexpr uint8_t Front  = 1 << 0;  ///< +Z
    constexpr uint8_t Back   = 1 << 1;  ///< -Z
    constexpr uint8_t Right  = 1 << 2;  ///< +X
    constexpr uint8_t Left   = 1 << 3;  ///< -X
    constexpr uint8_t Top    = 1 << 4;  ///< +Y
    constexpr uint8_t Bottom = 1 << 5;  ///< -Y
    constexpr uint8_t All    = Front | Back | Right | Left | Top | Bottom;
}

inline bool isSolid(BlockType type) {
    return type != BlockType::Air;
}

inline bool isValidBlockType(int raw) {
    return raw >= 0 && raw < BLOCK_TYPE_COUNT;
}

/**
 * @brief Canonical lowercase name of a block type ("grass", "coal_ore", ...)
 */
const char* blockTypeName(BlockType type);

/**
 * @brief Looks up a block type by canonical name
 *
 * @param name Name as returned by blockTypeName()
 * @param out Receives the type on success
 * @return False if the name is unknown
 */
bool blockTypeFromName(const std::string& name, BlockType& out);
