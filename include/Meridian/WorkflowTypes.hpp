// =================================================================
// include/Meridian/WorkflowTypes.hpp
// =================================================================
// Stages, statuses and the request/result records of a simulation.

#pragma once

#include "Meridian/Coordinate.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Meridian {

/**
 * @brief Closed set of pipeline stages
 */
enum class WorkflowStage {
    INITIALIZATION,         ///< Session record being built
    COORDINATE_ANALYSIS,    ///< Detailed coordinate analysis
    PERSONA_CALIBRATION,    ///< Persona activation for the coordinate
    SIMULATION_EXECUTION,   ///< Main simulation run
    REGULATORY_VALIDATION,  ///< Compliance validation against constraints
    SYNTHESIS,              ///< Cross-stage synthesis marker
    OPTIMIZATION,           ///< Optimization marker
    COMPLETION              ///< Completion marker
};

/**
 * @brief Lifecycle state of a session
 */
enum class SessionStatus {
    INITIALIZING,
    ACTIVE,
    PROCESSING,
    SUSPENDED,
    COMPLETED,
    ERROR
};

/**
 * @brief Reasoning approach a caller may ask the simulation collaborator to use
 */
enum class ReasoningStrategy {
    LOGICAL,
    PROBABILISTIC,
    HEURISTIC,
    NEURAL,
    HYBRID
};

/**
 * @brief Clearance level attached to a request
 */
enum class SecurityLevel {
    PUBLIC,
    RESTRICTED,
    CONFIDENTIAL,
    SECRET,
    TOP_SECRET
};

using WorkflowPlan = std::vector<WorkflowStage>;
using StageTimings = std::map<std::string, std::chrono::milliseconds>;

std::string stageToString(WorkflowStage stage);
WorkflowStage stringToStage(const std::string& name);
std::string statusToString(SessionStatus status);
SessionStatus stringToStatus(const std::string& name);
std::string strategyToString(ReasoningStrategy strategy);
ReasoningStrategy stringToStrategy(const std::string& name);
std::string securityLevelToString(SecurityLevel level);
SecurityLevel stringToSecurityLevel(const std::string& name);

/**
 * @brief COMPLETED and ERROR are terminal; every other status is live
 */
bool isTerminal(SessionStatus status);

/**
 * @brief Simulation request as received from the boundary layer
 */
struct SimulationRequest {
    explicit SimulationRequest(const Coordinate& coord) : coordinate(coord) {}

    Coordinate coordinate;                          ///< Coordinate to analyze
    std::vector<std::string> target_personas;       ///< Personas to calibrate
    nlohmann::json regulatory_constraints;          ///< Constraint object, null when none
    std::string analysis_depth = "deep";            ///< surface, moderate, deep, comprehensive
    std::optional<ReasoningStrategy> reasoning_strategy; ///< Preferred strategy, if any
    std::vector<std::string> optimization_goals;    ///< Caller's optimization objectives
    SecurityLevel security_level = SecurityLevel::PUBLIC; ///< Required clearance
    nlohmann::json session_context;                 ///< Free-form caller context

    /**
     * @brief True when constraints are a non-empty object or array
     */
    bool hasRegulatoryConstraints() const;
};

/**
 * @brief Result compiled at the end of one successful execution
 */
struct SimulationResult {
    SimulationResult(const std::string& id, const Coordinate& coord)
        : session_id(id), coordinate(coord) {}

    std::string session_id;
    Coordinate coordinate;
    nlohmann::json reasoning = nlohmann::json::object();          ///< Coordinate analysis output
    double confidence = 0.0;                                      ///< In [0, 1]
    std::vector<std::string> recommendations;
    StageTimings performance_metrics;                             ///< Per-stage durations
    nlohmann::json persona_calibrations = nlohmann::json::object();
    nlohmann::json regulatory_status = nlohmann::json::object();
    std::chrono::milliseconds processing_time{0};                 ///< Whole execution
    bool optimization_applied = false;
};

} // namespace Meridian
