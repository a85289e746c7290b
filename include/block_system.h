/**
 * @file block_system.h
 * @brief Block appearance registry with optional YAML overrides
 */

#pragma once

#include <array>
#include <string>
#include <glm/glm.hpp>
#include "block_types.h"

/**
 * @brief Display properties of one block type
 *
 * Example YAML (blocks.yaml):
 * @code
 * blocks:
 *   - name: grass
 *     color: [0.4, 0.65, 0.35]
 *   - name: stone
 *     color: "#999999"
 * @endcode
 */
struct BlockDefinition {
    BlockType type = BlockType::Air;    ///< Block this entry describes
    std::string name;                   ///< Canonical name ("grass", "coal_ore", ...)
    glm::vec3 color = glm::vec3(1.0f);  ///< Solid color (RGB, 0-1 range)
};

/**
 * @brief Registry mapping every BlockType to its display color
 *
 * Starts out with the built-in color table. loadFromFile() overrides individual
 * colors and must run before any mesh is built, the registry is read without
 * locking by mesh workers.
 *
 * Usage:
 * @code
 * auto& registry = BlockRegistry::instance();
 * registry.loadFromFile("blocks.yaml");
 * glm::vec3 grass = registry.getColor(BlockType::Grass);
 * @endcode
 */
class BlockRegistry {
public:
    /**
     * @brief Process-wide registry used when no other one is supplied
     */
    static BlockRegistry& instance();

    BlockRegistry();

    /**
     * @brief Loads color overrides from a YAML file
     *
     * Entries with an unknown name or a malformed color are skipped with a warning.
     *
     * @param filepath Path to the YAML file
     * @return False if the file could not be read or parsed, colors are unchanged then
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Restores the built-in color table
     */
    void resetToDefaults();

    const BlockDefinition& get(BlockType type) const;

    glm::vec3 getColor(BlockType type) const { return get(type).color; }

private:
    std::array<BlockDefinition, BLOCK_TYPE_COUNT> m_defs;
};
