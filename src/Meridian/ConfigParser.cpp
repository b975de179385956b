// =================================================================
// src/Meridian/ConfigParser.cpp
// =================================================================
// Implementation of the YAML configuration reader.

#include "Meridian/ConfigParser.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace Meridian {

namespace {

template <typename T>
T readValue(const YAML::Node& section, const std::string& section_name,
            const std::string& key, T fallback) {
    if (!section[key]) {
        return fallback;
    }
    try {
        return section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for " + section_name + "." + key + ": " + e.what());
    }
}

double readThreshold(const YAML::Node& section, const std::string& section_name,
                     const std::string& key, double fallback) {
    double value = readValue<double>(section, section_name, key, fallback);
    if (value < 0.0 || value > 1.0) {
        throw std::runtime_error(section_name + "." + key + " must lie in [0, 1]");
    }
    return value;
}

long long readDuration(const YAML::Node& section, const std::string& section_name,
                       const std::string& key, long long fallback, bool allow_zero) {
    long long value = readValue<long long>(section, section_name, key, fallback);
    if (value < 0 || (!allow_zero && value == 0)) {
        throw std::runtime_error(section_name + "." + key +
                                 (allow_zero ? " must not be negative" : " must be positive"));
    }
    return value;
}

LogLevel readLevel(const YAML::Node& section, const std::string& key, LogLevel fallback) {
    if (!section[key]) {
        return fallback;
    }
    std::string name = readValue<std::string>(section, "logging", key, "");
    try {
        return Logger::parseLevel(name);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid value for logging." + key + ": " + e.what());
    }
}

} // anonymous namespace

AppConfig ConfigParser::loadFromFile(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        Logger::getInstance().warning("ConfigParser",
            "Configuration file not found, using defaults", "path: " + config_path);
        return AppConfig();
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + config_path + ": " + e.what());
    }

    AppConfig config = fromNode(root);
    Logger::getInstance().info("ConfigParser", "Loaded configuration", "path: " + config_path);
    return config;
}

AppConfig ConfigParser::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse configuration: " + std::string(e.what()));
    }
    return fromNode(root);
}

AppConfig ConfigParser::fromNode(const YAML::Node& root) {
    AppConfig config;

    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    if (YAML::Node node = root["orchestrator"]) {
        auto& orchestrator = config.orchestrator;
        orchestrator.session_ttl = std::chrono::hours(
            readDuration(node, "orchestrator", "session_ttl_hours", 24, false));
        orchestrator.reap_interval = std::chrono::seconds(
            readDuration(node, "orchestrator", "reap_interval_seconds", 3600, false));
        orchestrator.enable_reaper = readValue<bool>(node, "orchestrator", "enable_reaper", true);
        orchestrator.efficiency_baseline = std::chrono::seconds(
            readDuration(node, "orchestrator", "efficiency_baseline_seconds", 300, false));
    }

    if (YAML::Node node = root["planner"]) {
        auto& planner = config.orchestrator.planner;
        planner.persona_calibration_threshold = readThreshold(node, "planner",
            "persona_calibration_threshold", planner.persona_calibration_threshold);
        planner.synthesis_threshold = readThreshold(node, "planner",
            "synthesis_threshold", planner.synthesis_threshold);
    }

    if (YAML::Node node = root["executor"]) {
        config.orchestrator.executor.stage_timeout = std::chrono::milliseconds(
            readDuration(node, "executor", "stage_timeout_ms", 30000, true));
    }

    if (YAML::Node node = root["optimizer"]) {
        auto& optimizer = config.orchestrator.optimizer;
        optimizer.default_confidence = readThreshold(node, "optimizer",
            "default_confidence", optimizer.default_confidence);
        optimizer.enhancement_threshold = readThreshold(node, "optimizer",
            "enhancement_threshold", optimizer.enhancement_threshold);
        optimizer.enhancement_step = readThreshold(node, "optimizer",
            "enhancement_step", optimizer.enhancement_step);
        optimizer.staged_rollout_threshold = readThreshold(node, "optimizer",
            "staged_rollout_threshold", optimizer.staged_rollout_threshold);
        optimizer.slow_simulation_threshold = std::chrono::milliseconds(
            readDuration(node, "optimizer", "slow_simulation_threshold_ms", 5000, true));
    }

    if (YAML::Node node = root["logging"]) {
        auto& logging = config.logging;
        logging.directory = readValue<std::string>(node, "logging", "directory", logging.directory);
        logging.console_level = readLevel(node, "console_level", logging.console_level);
        logging.file_level = readLevel(node, "file_level", logging.file_level);
        logging.console = readValue<bool>(node, "logging", "console", logging.console);
        logging.file = readValue<bool>(node, "logging", "file", logging.file);
        logging.max_file_size = readValue<size_t>(node, "logging", "max_file_size", logging.max_file_size);
        logging.max_files = readValue<size_t>(node, "logging", "max_files", logging.max_files);
        if (logging.max_file_size == 0 || logging.max_files == 0) {
            throw std::runtime_error("logging.max_file_size and logging.max_files must be positive");
        }
    }

    return config;
}

void ConfigParser::applyLogging(const LoggingConfig& config) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogging(config.console);
    logger.setConsoleLogLevel(config.console_level);
    logger.setFileLogLevel(config.file_level);
    logger.setFileLogging(config.file);
    if (config.file) {
        logger.initialize(config.directory, config.max_file_size, config.max_files);
    }
}

} // namespace Meridian
