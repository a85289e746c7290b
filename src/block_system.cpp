/**
 * @file block_system.cpp
 * @brief Block registry with built-in colors and YAML overrides
 */

#include "block_system.h"
#include "logger.h"
#include <yaml-cpp/yaml.h>

namespace {

glm::vec3 defaultColor(BlockType type) {
    switch (type) {
        case BlockType::Grass:      return glm::vec3(0.4f, 0.65f, 0.35f);
        case BlockType::Dirt:       return glm::vec3(0.55f, 0.42f, 0.30f);
        case BlockType::Stone:      return glm::vec3(0.6f, 0.6f, 0.6f);
        case BlockType::Wood:       return glm::vec3(0.6f, 0.3f, 0.1f);
        case BlockType::Sand:       return glm::vec3(0.9f, 0.9f, 0.6f);
        case BlockType::Planks:     return glm::vec3(0.72f, 0.52f, 0.32f);
        case BlockType::Gravel:     return glm::vec3(0.53f, 0.53f, 0.53f);
        case BlockType::Glass:      return glm::vec3(0.7f, 0.9f, 1.0f);
        case BlockType::Leaves:     return glm::vec3(0.2f, 0.6f, 0.2f);
        case BlockType::CoalOre:    return glm::vec3(0.2f, 0.2f, 0.2f);
        case BlockType::IronOre:    return glm::vec3(0.7f, 0.6f, 0.5f);
        case BlockType::GoldOre:    return glm::vec3(0.9f, 0.8f, 0.2f);
        case BlockType::DiamondOre: return glm::vec3(0.3f, 0.8f, 0.9f);
        case BlockType::Bedrock:    return glm::vec3(0.15f, 0.15f, 0.15f);
        default:                    return glm::vec3(1.0f);
    }
}

// Accepts "#RRGGBB" or a [r, g, b] sequence in 0-1 range
bool parseColor(const YAML::Node& node, glm::vec3& out) {
    if (node.IsSequence() && node.size() == 3) {
        out = glm::vec3(node[0].as<float>(), node[1].as<float>(), node[2].as<float>());
        return true;
    }
    if (node.IsScalar()) {
        std::string tex = node.as<std::string>();
        if (tex.size() == 7 && tex[0] == '#') {
            int rgb = std::stoi(tex.substr(1), nullptr, 16);
            out = glm::vec3(((rgb >> 16) & 0xFF) / 255.0f,
                            ((rgb >> 8) & 0xFF) / 255.0f,
                            (rgb & 0xFF) / 255.0f);
            return true;
        }
    }
    return false;
}

} // namespace

BlockRegistry& BlockRegistry::instance() {
    static BlockRegistry registry;
    return registry;
}

BlockRegistry::BlockRegistry() {
    resetToDefaults();
}

void BlockRegistry::resetToDefaults() {
    for (int i = 0; i < BLOCK_TYPE_COUNT; ++i) {
        BlockType type = static_cast<BlockType>(i);
        m_defs[i].type = type;
        m_defs[i].name = blockTypeName(type);
        m_defs[i].color = defaultColor(type);
    }
}

const BlockDefinition& BlockRegistry::get(BlockType type) const {
    int index = static_cast<int>(type);
    if (!isValidBlockType(index)) {
        return m_defs[0];
    }
    return m_defs[index];
}

bool BlockRegistry::loadFromFile(const std::string& filepath) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        Logger::error() << "Error parsing block definitions " << filepath << ": " << e.what();
        return false;
    }

    YAML::Node blocks = doc["blocks"];
    if (!blocks || !blocks.IsSequence()) {
        Logger::error() << "Block definitions " << filepath << " have no 'blocks' list";
        return false;
    }

    int applied = 0;
    for (const auto& entry : blocks) {
        if (!entry["name"]) {
            Logger::warning() << "Block entry without 'name' in " << filepath << "; skipping";
            continue;
        }
        std::string name = entry["name"].as<std::string>();

        BlockType type;
        if (!blockTypeFromName(name, type)) {
            Logger::warning() << "Unknown block name '" << name << "' in " << filepath << "; skipping";
            continue;
        }
        if (type == BlockType::Air || !entry["color"]) {
            continue;
        }

        glm::vec3 color;
        bool parsed = false;
        try {
            parsed = parseColor(entry["color"], color);
        } catch (const std::exception& e) {
            Logger::warning() << "Bad color for '" << name << "': " << e.what();
        }
        if (!parsed) {
            Logger::warning() << "Ignoring malformed color for '" << name << "' in " << filepath;
            continue;
        }

        m_defs[static_cast<int>(type)].color = color;
        applied++;
    }

    Logger::info() << "Loaded " << applied << " block color overrides from " << filepath;
    return true;
}
