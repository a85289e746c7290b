/**
 * @file block_types.cpp
 * @brief Block type names
 */

#include "block_types.h"

namespace {

const char* const BLOCK_NAMES[BLOCK_TYPE_COUNT] = {
    "air",
    "grass",
    "dirt",
    "stone",
    "wood",
    "sand",
    "planks",
    "gravel",
    "glass",
    "leaves",
    "coal_ore",
    "iron_ore",
    "gold_ore",
    "diamond_ore",
    "bedrock"
};

} // namespace

const char* blockTypeName(BlockType type) {
    int index = static_cast<int>(type);
    if (!isValidBlockType(index)) {
        return "unknown";
    }
    return BLOCK_NAMES[index];
}

bool blockTypeFromName(const std::string& name, BlockType& out) {
    for (int i = 0; i < BLOCK_TYPE_COUNT; ++i) {
        if (name == BLOCK_NAMES[i]) {
            out = static_cast<BlockType>(i);
            return true;
        }
    }
    return false;
}
