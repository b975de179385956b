// =================================================================
// src/Meridian/Logger.cpp
// =================================================================
// Implementation for the structured logging system.

#include "Meridian/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Meridian {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        initializeLocked(log_dir, max_log_size, max_log_files);
    }
    info("Logger", "Logging system initialized", m_file_enabled ? m_log_dir : "console only");
}

void Logger::initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_current_log_file.reset();
    m_initialized = true;

    if (m_file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled && m_current_log_file) {
        m_current_log_file->flush();
        m_current_log_file.reset();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logSessionCreated(const std::string& session_id, double complexity_score,
                               const std::vector<std::string>& plan_stages) {
    std::ostringstream context;
    context << "Complexity: " << std::fixed << std::setprecision(2) << complexity_score << ", ";
    context << "Stages: " << plan_stages.size();

    info("Session", "Session created: " + session_id, context.str());

    std::ostringstream plan;
    for (size_t i = 0; i < plan_stages.size(); i++) {
        if (i > 0) plan << " -> ";
        plan << plan_stages[i];
    }
    debug("Session", "Workflow plan for " + session_id + ": " + plan.str());
}

void Logger::logStageCompleted(const std::string& session_id, const std::string& stage_name,
                               long duration_ms, bool success) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (success) {
        debug("StageExecutor", "Completed stage " + stage_name, context.str());
    } else {
        error("StageExecutor", "Stage failed: " + stage_name, context.str());
    }
}

void Logger::logSimulationFinished(const std::string& session_id, double confidence,
                                   long duration_ms, bool success) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    if (success) {
        context << "Confidence: " << std::fixed << std::setprecision(2) << confidence << ", ";
    }
    context << "Duration: " << duration_ms << "ms";

    if (success) {
        info("SessionOrchestrator", "Simulation completed", context.str());
    } else {
        error("SessionOrchestrator", "Simulation failed", context.str());
    }

    if (duration_ms > 30000) {
        warning("SessionOrchestrator", "Slow simulation detected",
                "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logReap(const std::vector<std::string>& removed_ids, size_t remaining) {
    if (removed_ids.empty()) {
        debug("Reaper", "No expired sessions", "Remaining: " + std::to_string(remaining));
        return;
    }

    std::ostringstream context;
    context << "Removed: " << removed_ids.size() << ", ";
    context << "Remaining: " << remaining;
    info("Reaper", "Cleaned up expired sessions", context.str());

    for (const auto& id : removed_ids) {
        debug("Reaper", "Evicted session " + id);
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRIT" || upper == "CRITICAL") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initializeLocked(".meridian/logs", m_max_log_size, m_max_log_files);
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    // Diagnostics go to stderr so command output on stdout stays parseable
    std::cerr << formatted << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || entry.level < m_file_level) {
        return;
    }

    if (!m_current_log_file) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        m_current_log_size = 0;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream filename;
    filename << m_log_dir << "/meridian_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(3) << ms.count();
    filename << ".log";

    return filename.str();
}

} // namespace Meridian
