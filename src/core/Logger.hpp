/**
 * @file Logger.hpp
 * @brief Component-scoped logging with verbosity control
 *
 * Every pipeline component owns a Logger named after itself. Output goes
 * through one outputMessage() method with one verbosity check, so the whole
 * export can be silenced or opened up per component from the command line.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace qreport {

/**
 * @brief Log levels
 *
 * Level 1: Errors (a format or the whole export failed)
 * Level 2: Warnings (a photo or side file was skipped)
 * Level 3: Information (stage progress)
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

/**
 * @brief Logger with a single point of output control
 *
 * Repeated identical messages are collapsed into one line plus a count.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component name, used as facility for level lookup
     * @param component_name Name of the component for logging identification
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with specified log level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger& other);
    Logger& operator=(const Logger& other);

    /**
     * @brief Output a message if it meets the effective verbosity level
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file of this instance
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void warn(const std::string& message) const {
        warning(message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending duplicate summaries and all output buffers
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility (component)
     *
     * @example
     * Logger::setFacilityLevel("PhotoExportManager", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Get log level for a facility, or the default level when unset
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "PhotoExportManager=6,ExportOrchestrator=3"
     * - Mixed: "4,DocumentReportGenerator=6"
     *
     * @param config Configuration string
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every Logger instance to an additional log file
     * @param log_file Path to log file (appends), or nullopt to stop
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Effective level: facility level, then instance level, then default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    // Serializes writes to console and file streams shared between instances
    static std::mutex stream_mutex_;

    void initializeFileStream();

    /**
     * @brief Perform the actual output to console and file
     */
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace qreport
