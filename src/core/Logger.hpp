/**
 * @file Logger.hpp
 * @brief Facility-aware logging shared by all extraction components
 *
 * Every component owns a Logger named after itself. Verbosity is resolved
 * per facility from a process-wide registry so a single pipeline can be
 * traced without flooding the console with the others.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rxgis {

/**
 * @brief Verbosity levels
 *
 * Level 1: Errors (run cannot continue)
 * Level 2: Warnings (a pipeline degraded to defaults)
 * Level 3: Information (run progress)
 * Level 4: Detailed information (code path taken)
 * Level 5: Debugging (objects, per-layer metadata)
 * Level 6: Tracing (per-point values)
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
 * @brief Component logger with a single output path
 *
 * All messages pass through outputMessage(), which holds the only verbosity
 * check. Identical consecutive messages are folded into one repeat summary.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Create a logger for a named facility
     * @param facility Facility name used for per-component levels
     */
    explicit Logger(const std::string& facility);

    /**
     * @brief Create a logger with an explicit level and optional log file
     * @param level Threshold for this instance
     * @param log_file Log file path (appended to if it exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    void setLogFile(const std::optional<std::string>& log_file);

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
     * @brief Emit any pending repeat summary and flush console and file
     */
    void flush() const;

    // ------------------------------------------------------------------------
    // Facility registry
    // ------------------------------------------------------------------------

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Apply a log configuration string
     *
     * Accepted forms:
     * - "5"                            default level DEBUG
     * - "ZoneResolver=6"               one facility at TRACE
     * - "3,RasterPreloader=5,default=2" mixed, "default" sets the fallback
     *
     * Levels are clamped to [1, 6]. Malformed tokens are reported on stderr
     * and skipped.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Log file shared by every logger without its own file
     *
     * Appends to the file if it exists; std::nullopt closes it.
     * @return false if the file cannot be opened
     */
    static bool setDefaultLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Level used for this instance
     *
     * Facility level if registered, else the instance level when it was set
     * explicitly, else the registry default.
     */
    LogLevel getEffectiveLevel() const;

    static const char* levelTag(LogLevel level);

private:
    LogLevel current_level_;
    bool explicit_level_;
    std::string facility_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> default_file_stream_;
    static std::mutex default_file_mutex_;

    void openFileStream();
    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace rxgis
