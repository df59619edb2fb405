/**
 * @file Logger.hpp
 * @brief Component logger with numeric verbosity and per-facility overrides
 *
 * Every pipeline component owns a Logger named after itself; the name is
 * the facility used for level overrides. All output passes through
 * outputMessage(), which applies the level, collapses repeated lines and
 * mirrors everything into the shared log file when one is configured.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace terrain3d {

/**
 * @brief Log levels
 *
 * Level 1: Errors (generation cannot continue)
 * Level 2: Warnings (a stage degraded, e.g. synthetic fallback)
 * Level 3: Information (pipeline progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/// Environment variable holding a log configuration string ("4" or "3,MeshBuilder=6")
inline constexpr const char* LOG_LEVEL_ENV = "TERRAIN3D_LOG_LEVEL";
/// Environment variable holding a log file path
inline constexpr const char* LOG_FILE_ENV = "TERRAIN3D_LOG_FILE";

class Logger {
public:
    explicit Logger(std::string component_name);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Emit a message if it passes the facility's level
     *
     * Identical consecutive messages are held back and summarized as
     * "occurred N times" once a different message arrives.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }
    void trace(const std::string& message) const { outputMessage(LogLevel::TRACE, message); }

    /**
     * @brief Write out a pending repeat summary
     */
    void flush() const;

    const std::string& name() const { return component_name_; }

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a single component
     *
     * @example
     * Logger::setFacilityLevel("HeightmapAcquirer", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Level for facilities without an override
     */
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Override for the facility, or the default level
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Supported forms:
     * - "5" sets the default level to DEBUG
     * - "MeshBuilder=6,TerrainResampler=4" sets facility levels
     * - "3,HeightmapAcquirer=6" mixes both; "default=N" is also accepted
     *
     * Levels outside 1-6 are clamped.
     * @return Default level named in the string, if any
     */
    static std::optional<int> parseLogConfig(const std::string& config);

    /**
     * @brief Append every logger's output to a file; nullopt closes it
     * @return false if the file could not be opened
     */
    static bool setDefaultLogFile(const std::optional<std::string>& log_file);

    static void clearFacilityLevels();

private:
    std::string component_name_;

    mutable std::mutex output_mutex_;
    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> log_file_;
    static std::mutex registry_mutex_;

    void writeLine(LogLevel level, const std::string& message) const;
    void writeRepeatSummary() const;
};

} // namespace terrain3d
