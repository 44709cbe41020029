/**
 * @file Logger.hpp
 * @brief Component logging with per-facility verbosity control
 *
 * Every component owns a Logger named after itself. Verbosity is resolved
 * per facility (component name) first, then the global default. All output
 * goes through outputMessage(), which performs the single verbosity check.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <cstdlib>
#include <unordered_map>

namespace tess {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (skipped regions, recovered faults)
 * Level 3: Information (stage progress)
 * Level 4: Detailed information (per region / per group)
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

/**
 * @brief Component logger with a single point of output control
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component name
     * @param component_name Facility name used for level lookup and prefixing
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are folded into a single
     * "occurred N times" line.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summaries and output streams
     */
    void flush() const;

    const std::string& getComponentName() const { return component_name_; }

    // ========================================================================
    // Facility registry
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * - "5" sets the default level to DEBUG
     * - "3,ChopPartitioner=6" sets default INFO and ChopPartitioner TRACE
     * - "default=2,CellBuilder=4" is also accepted
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Mirror all logger output into a file (append mode)
     * @param log_file Path, or nullopt to stop file logging
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level if registered, otherwise the global default
     */
    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Repeated message folding
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> file_stream_;

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace tess
