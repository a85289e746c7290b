/**
 * @file logger.cpp
 * @brief Implementation of the logging system
 */

#include "logger.h"
#include <algorithm>
#include <cctype>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
std::mutex Logger::s_mutex;
std::ofstream Logger::s_file;
std::array<std::atomic<size_t>, 4> Logger::s_counts{};

namespace {

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "[DEBUG]";
        case LogLevel::INFO:    return "[INFO]";
        case LogLevel::WARNING: return "[WARNING]";
        case LogLevel::ERROR:   return "[ERROR]";
    }
    return "[?]";
}

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "\033[36m";  // Cyan
        case LogLevel::INFO:    return "\033[32m";  // Green
        case LogLevel::WARNING: return "\033[33m";  // Yellow
        case LogLevel::ERROR:   return "\033[31m";  // Red
    }
    return "";
}

} // namespace

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.close();
    }
    if (path.empty()) {
        return true;
    }
    s_file.open(path, std::ios::app);
    return s_file.is_open();
}

size_t Logger::getMessageCount(LogLevel level) {
    return s_counts[static_cast<size_t>(level)].load();
}

void Logger::resetMessageCounts() {
    for (auto& count : s_counts) {
        count.store(0);
    }
}

void Logger::write(LogLevel level, const std::string& message) {
    s_counts[static_cast<size_t>(level)].fetch_add(1);

    std::lock_guard<std::mutex> lock(s_mutex);

    std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
    if (s_useColors) {
        out << levelColor(level) << levelTag(level) << "\033[0m " << message << std::endl;
    } else {
        out << levelTag(level) << " " << message << std::endl;
    }

    if (s_file.is_open()) {
        s_file << levelTag(level) << " " << message << "\n";
        s_file.flush();
    }
}
