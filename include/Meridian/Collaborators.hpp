// =================================================================
// include/Meridian/Collaborators.hpp
// =================================================================
// Interfaces of the analysis engines the orchestrator calls into.

#pragma once

#include "Meridian/Coordinate.hpp"
#include "Meridian/WorkflowTypes.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Meridian {

/**
 * @brief Produces the detailed axis-by-axis analysis of a coordinate
 *
 * Implementations may block; the executor bounds each call with the
 * configured stage timeout and may abandon a call that overruns it, so
 * implementations must not hold references to caller-owned state.
 */
class CoordinateAnalyzer {
public:
    virtual ~CoordinateAnalyzer() = default;

    /**
     * @param coordinate Coordinate under analysis
     * @return Analysis artifact; a numeric "confidence_score" field is
     *         picked up as the stage confidence
     */
    virtual nlohmann::json analyze(const Coordinate& coordinate) = 0;
};

/**
 * @brief Scores how relevant each persona is for a coordinate
 */
class PersonaCalibrator {
public:
    virtual ~PersonaCalibrator() = default;

    virtual nlohmann::json calibrate(const Coordinate& coordinate,
                                     const std::vector<std::string>& target_personas) = 0;
};

/**
 * @brief Runs the main simulation for a request
 */
class SimulationRunner {
public:
    virtual ~SimulationRunner() = default;

    /**
     * @param request Full simulation request
     * @return Simulation artifact; a numeric "confidence" field is picked
     *         up as the stage confidence
     */
    virtual nlohmann::json run(const SimulationRequest& request) = 0;
};

/**
 * @brief Validates a coordinate against regulatory constraints
 */
class ComplianceValidator {
public:
    virtual ~ComplianceValidator() = default;

    virtual nlohmann::json validate(const Coordinate& coordinate,
                                    const nlohmann::json& constraints) = 0;
};

/**
 * @brief The collaborator set handed to the orchestrator at construction
 *
 * Every member is optional. A null collaborator turns its stage into a
 * timed no-op.
 *
 * With a non-zero stage timeout each call runs on a detached thread. A
 * call that overruns is abandoned, not interrupted: it keeps its thread
 * until the collaborator returns, and neither the executor nor the
 * orchestrator waits for it on shutdown. Such calls are reported in
 * SystemMetrics::abandoned_calls_running. Collaborators should therefore
 * bound their own blocking work and stay valid while shared_ptr copies
 * held by abandoned calls are alive.
 */
struct Collaborators {
    std::shared_ptr<CoordinateAnalyzer> coordinate_analyzer;
    std::shared_ptr<PersonaCalibrator> persona_calibrator;
    std::shared_ptr<SimulationRunner> simulation_runner;
    std::shared_ptr<ComplianceValidator> compliance_validator;
};

} // namespace Meridian
