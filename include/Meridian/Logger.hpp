// =================================================================
// include/Meridian/Logger.hpp
// =================================================================
// Header for structured logging of session and orchestrator activity.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Meridian {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with console and rotating file output
 *
 * All public methods are safe to call from request threads, the stage
 * executor's collaborator threads and the reaper thread concurrently.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".meridian/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log creation of a session and its planned workflow
     * @param session_id New session identifier
     * @param complexity_score Score computed for the primary coordinate
     * @param plan_stages Stage names in plan order
     */
    void logSessionCreated(const std::string& session_id, double complexity_score,
                           const std::vector<std::string>& plan_stages);

    /**
     * @brief Log the end of one workflow stage
     * @param session_id Session the stage belongs to
     * @param stage_name Stage name
     * @param duration_ms Elapsed wall-clock time
     * @param success Whether the stage completed without error
     */
    void logStageCompleted(const std::string& session_id, const std::string& stage_name,
                           long duration_ms, bool success);

    /**
     * @brief Log the outcome of a simulation run
     * @param session_id Session identifier
     * @param confidence Final confidence (ignored on failure)
     * @param duration_ms Total execution time
     * @param success Whether a result was produced
     */
    void logSimulationFinished(const std::string& session_id, double confidence,
                               long duration_ms, bool success);

    /**
     * @brief Log a reaper pass
     * @param removed_ids Sessions removed in this pass
     * @param remaining Sessions still registered
     */
    void logReap(const std::vector<std::string>& removed_ids, size_t remaining);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name such as "INFO" or "warning"
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::recursive_mutex m_mutex;

    void initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Meridian::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Meridian::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Meridian::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Meridian::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Meridian::Logger::getInstance().critical(component, message)

} // namespace Meridian
