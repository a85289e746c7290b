/**
 * @file logger.h
 * @brief Stream-style logging with severity levels and an optional file sink
 */

#pragma once

#include <array>
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Verbose debugging information
    INFO,     ///< General informational messages
    WARNING,  ///< Warning messages (non-critical issues)
    ERROR     ///< Error messages (critical issues)
};

/**
 * @brief Parses a level name ("debug", "info", "warning", "error")
 * @param name Level name, case-insensitive
 * @param fallback Level returned for unknown names
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Thread-safe logger with severity levels
 *
 * Every emitted line goes to the console (stderr for errors, stdout otherwise)
 * and, when a log file is set, to that file without color codes.
 *
 * Usage:
 * @code
 * Logger::info() << "Loaded " << count << " chunks around " << pos.x << ", " << pos.z;
 * Logger::warning() << "Unknown block name in blocks.yaml: " << name;
 * Logger::error() << "Mesh build failed for chunk (" << x << ", " << z << "): " << e.what();
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        LogStream(LogLevel level) : m_level(level) {}

        /**
         * @brief Flushes the accumulated message
         */
        ~LogStream() {
            if (m_level >= s_minLevel) {
                Logger::write(m_level, m_stream.str());
            }
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_level >= s_minLevel) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;              ///< Severity level of this message
        std::ostringstream m_stream;   ///< Accumulated message
    };

    // ========== Static Logging Methods ==========

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum log level
     *
     * Messages below this level are suppressed and not counted.
     */
    static void setMinLevel(LogLevel level) { s_minLevel = level; }

    static LogLevel getMinLevel() { return s_minLevel; }

    /**
     * @brief Enables or disables ANSI colors on console output
     */
    static void setUseColors(bool enable) { s_useColors = enable; }

    /**
     * @brief Mirrors every emitted line into a file (append mode)
     *
     * @param path File to append to, empty string closes the current file
     * @return False if the file could not be opened
     */
    static bool setLogFile(const std::string& path);

    /**
     * @brief Number of messages emitted at a level since start or the last reset
     */
    static size_t getMessageCount(LogLevel level);

    static void resetMessageCounts();

private:
    static void write(LogLevel level, const std::string& message);

    static LogLevel s_minLevel;                           ///< Minimum level to display
    static bool s_useColors;                              ///< Whether to use ANSI colors
    static std::mutex s_mutex;                            ///< Serializes output
    static std::ofstream s_file;                          ///< Optional file sink
    static std::array<std::atomic<size_t>, 4> s_counts;  ///< Emitted messages per level
};
