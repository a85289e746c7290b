#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file: " << filepath;
        return false;
    }

    loadFromStream(file);
    Logger::info() << "Loaded config from " << filepath;
    return true;
}

void Config::loadFromStream(std::istream& input) {
    std::string currentSection;
    std::string line;
    int lineNumber = 0;

    while (std::getline(input, line)) {
        lineNumber++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [Section]
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            currentSection = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            Logger::warning() << "Config line " << lineNumber << " is not key = value: " << line;
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        // Remove inline comments
        size_t commentPos = value.find_first_of("#;");
        if (commentPos != std::string::npos) {
            value = trim(value.substr(0, commentPos));
        }

        if (currentSection.empty()) {
            Logger::warning() << "Config key '" << key << "' on line " << lineNumber << " is outside any section";
            continue;
        }
        if (!key.empty()) {
            m_data[currentSection][key] = value;
        }
    }
}

void Config::clear() {
    m_data.clear();
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool Config::hasKey(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

int Config::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            size_t used = 0;
            int parsed = std::stoi(*value, &used);
            if (used == value->size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // Reported below
        }
        Logger::warning() << "Failed to parse int for [" << section << "]:" << key;
    }
    return defaultValue;
}

float Config::getFloat(const std::string& section, const std::string& key, float defaultValue) const {
    const std::string* value = find(section, key);
    if (value) {
        try {
            size_t used = 0;
            float parsed = std::stof(*value, &used);
            if (used == value->size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // Reported below
        }
        Logger::warning() << "Failed to parse float for [" << section << "]:" << key;
    }
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(section, key);
    return value ? *value : defaultValue;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key;
    return defaultValue;
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }

    return true;
}

void Config::setInt(const std::string& section, const std::string& key, int value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setFloat(const std::string& section, const std::string& key, float value) {
    std::ostringstream out;
    out << value;
    m_data[section][key] = out.str();
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}

void Config::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "true" : "false";
}
