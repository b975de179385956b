// =================================================================
// src/Meridian/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Meridian/Core.hpp"
#include "Meridian/ComplexityAnalyzer.hpp"
#include "Meridian/Logger.hpp"
#include "Meridian/Serialization.hpp"
#include "Meridian/SessionOrchestrator.hpp"
#include "Meridian/WorkflowPlanner.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace Meridian {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(ConfigParser::loadFromFile(commands.config_path))
{
    ConfigParser::applyLogging(m_config.logging);
}

int Core::run() {
    if (m_commands.active_command == "plan") {
        return handlePlan();
    } else if (m_commands.active_command == "simulate") {
        return handleSimulate();
    }

    std::cerr << "No command specified. Use --help for usage." << std::endl;
    return 1;
}

int Core::handlePlan() {
    SimulationRequest request = loadRequestFile(m_commands.request_file);

    ComplexityAnalyzer analyzer;
    ComplexityAssessment assessment = analyzer.analyze(request.coordinate);

    WorkflowPlanner planner(m_config.orchestrator.planner);
    WorkflowPlan plan = planner.plan(assessment.score, request);

    nlohmann::json output;
    to_json(output["coordinate"], request.coordinate);
    output["coordinate_key"] = request.coordinate.toKeyString();
    output["completeness"] = request.coordinate.completenessRatio();
    to_json(output["complexity"], assessment);
    output["workflow_plan"] = planToJson(plan);

    std::cout << output.dump(2) << std::endl;
    return 0;
}

int Core::handleSimulate() {
    std::vector<SimulationRequest> requests;
    for (const auto& path : m_commands.request_files) {
        requests.push_back(loadRequestFile(path));
    }

    // No analysis engines are bundled; every collaborator stage degrades to a no-op
    SessionOrchestrator orchestrator(Collaborators(), m_config.orchestrator);
    std::vector<SimulationOutcome> outcomes = orchestrator.runSimulations(requests);

    nlohmann::json results = nlohmann::json::array();
    nlohmann::json sessions = nlohmann::json::array();
    bool all_succeeded = true;

    for (size_t i = 0; i < outcomes.size(); i++) {
        const auto& outcome = outcomes[i];
        nlohmann::json item;
        item["request_file"] = m_commands.request_files[i];

        if (outcome.success()) {
            to_json(item["result"], *outcome.result);
        } else {
            item["error"] = outcome.error;
            all_succeeded = false;
        }
        results.push_back(item);

        if (auto status = orchestrator.getSessionStatus(outcome.session_id)) {
            nlohmann::json view;
            to_json(view, *status);
            sessions.push_back(view);
        }
    }

    nlohmann::json output;
    output["results"] = results;
    output["sessions"] = sessions;
    to_json(output["metrics"], orchestrator.getSystemMetrics());

    std::cout << output.dump(2) << std::endl;

    if (m_commands.print_report) {
        std::cerr << orchestrator.getPerformanceReport() << std::endl;
    }

    return all_succeeded ? 0 : 1;
}

} // namespace Meridian
