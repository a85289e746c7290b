#pragma once
#include <istream>
#include <map>
#include <string>

/**
 * @brief INI-style key/value store ([Section] key = value)
 *
 * Lines starting with '#' or ';' are comments, as is anything after an inline
 * '#' or ';'. Getters fall back to the supplied default when a key is missing
 * or does not parse.
 */
class Config {
public:
    static Config& instance();

    bool loadFromFile(const std::string& filepath);
    void loadFromStream(std::istream& input);
    bool saveToFile(const std::string& filepath) const;

    /// Drops all sections
    void clear();

    bool hasKey(const std::string& section, const std::string& key) const;

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    float getFloat(const std::string& section, const std::string& key, float defaultValue = 0.0f) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    /// Accepts true/false, yes/no, on/off and 1/0 (case-insensitive)
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;

    void setInt(const std::string& section, const std::string& key, int value);
    void setFloat(const std::string& section, const std::string& key, float value);
    void setString(const std::string& section, const std::string& key, const std::string& value);
    void setBool(const std::string& section, const std::string& key, bool value);

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> m_data;

    std::string trim(const std::string& str) const;
};
