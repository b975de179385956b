// =================================================================
// include/Meridian/ConfigParser.hpp
// =================================================================
// Loads orchestrator and logging settings from a YAML file.

#pragma once

#include "Meridian/Logger.hpp"
#include "Meridian/SessionOrchestrator.hpp"
#include <string>

namespace YAML {
class Node;
}

namespace Meridian {

/**
 * @brief Logger settings from the `logging` section
 */
struct LoggingConfig {
    std::string directory = ".meridian/logs";
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    bool console = true;
    bool file = true;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/**
 * @brief Everything a config file can set
 */
struct AppConfig {
    OrchestratorConfig orchestrator;
    LoggingConfig logging;
};

/**
 * @brief YAML configuration reader
 *
 * Recognized sections: orchestrator, planner, executor, optimizer and
 * logging. Absent keys keep their defaults; unknown keys are ignored.
 */
class ConfigParser {
public:
    /**
     * @brief Load a configuration file
     * @param config_path Path to the YAML file
     * @return Parsed configuration, or defaults if the file does not exist
     * @throws std::runtime_error on malformed YAML or invalid values
     */
    static AppConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Parse configuration from YAML text
     * @throws std::runtime_error on malformed YAML or invalid values
     */
    static AppConfig parse(const std::string& yaml_text);

    /**
     * @brief Apply logging settings to the process-wide logger
     */
    static void applyLogging(const LoggingConfig& config);

private:
    static AppConfig fromNode(const YAML::Node& root);
};

} // namespace Meridian
