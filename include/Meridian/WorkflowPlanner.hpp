// =================================================================
// include/Meridian/WorkflowPlanner.hpp
// =================================================================
// Turns a complexity score and request options into a stage plan.

#pragma once

#include "Meridian/WorkflowTypes.hpp"

namespace Meridian {

/**
 * @brief Score thresholds that switch optional stages on
 */
struct PlannerConfig {
    double persona_calibration_threshold = 0.7;  ///< Above: persona calibration + optimization
    double synthesis_threshold = 0.8;            ///< Above: synthesis
};

/**
 * @brief Builds the ordered stage list for a new session
 *
 * Starting from [COORDINATE_ANALYSIS, SIMULATION_EXECUTION] the rules run
 * in a fixed order, each inserting relative to the list the previous rule
 * left behind:
 *   1. score > persona threshold: PERSONA_CALIBRATION at index 1,
 *      OPTIMIZATION appended
 *   2. regulatory constraints present: REGULATORY_VALIDATION before the
 *      last element
 *   3. score > synthesis threshold: SYNTHESIS appended
 */
class WorkflowPlanner {
public:
    explicit WorkflowPlanner(const PlannerConfig& config = PlannerConfig());

    /**
     * @param complexity_score Score from ComplexityAnalyzer
     * @param request Request whose options drive the conditional stages
     * @return Validated plan
     * @throws PlanningFailure if the rules produce an invalid plan
     */
    WorkflowPlan plan(double complexity_score, const SimulationRequest& request) const;

    /**
     * @brief Reject empty plans, plans missing a mandatory stage, and
     *        plans listing a stage twice
     * @throws PlanningFailure
     */
    static void validatePlan(const WorkflowPlan& plan);

    const PlannerConfig& getConfig() const { return m_config; }

private:
    PlannerConfig m_config;
};

} // namespace Meridian
