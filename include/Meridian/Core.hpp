// =================================================================
// include/Meridian/Core.hpp
// =================================================================
// Defines the core application dispatcher.

#pragma once

#include "Meridian/CliParser.hpp"
#include "Meridian/ConfigParser.hpp"

namespace Meridian {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handlePlan();
    int handleSimulate();

    const Commands& m_commands;
    AppConfig m_config;
};

} // namespace Meridian
