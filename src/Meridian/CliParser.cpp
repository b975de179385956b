// =================================================================
// src/Meridian/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Meridian/CliParser.hpp"

namespace Meridian {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Meridian: coordinate simulation session orchestrator.");
    m_app->require_subcommand(1);
    // Lets -c follow the subcommand; subcommands added below inherit this
    m_app->fallthrough();

    m_app->add_option("-c,--config", m_commands.config_path,
                      "Path to the YAML configuration file (default: .meridian/config.yml)");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupPlanCommand(*m_app);
    setupSimulateCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupPlanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("plan", "Scores a request's coordinate and prints the workflow plan.");
    sub->add_option("request", m_commands.request_file, "Path to the request JSON file.")
        ->required()->check(CLI::ExistingFile);
}

void CliParser::setupSimulateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("simulate", "Runs one concurrent simulation per request file.");
    sub->add_option("requests", m_commands.request_files, "Paths to request JSON files.")
        ->required()->check(CLI::ExistingFile);
    sub->add_flag("--report", m_commands.print_report, "Print the performance report to stderr.");
}

} // namespace Meridian
