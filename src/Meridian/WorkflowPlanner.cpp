// =================================================================
// src/Meridian/WorkflowPlanner.cpp
// =================================================================
// Implementation of complexity-driven workflow planning.

#include "Meridian/WorkflowPlanner.hpp"
#include "Meridian/OrchestratorErrors.hpp"
#include <algorithm>
#include <set>

namespace Meridian {

WorkflowPlanner::WorkflowPlanner(const PlannerConfig& config)
    : m_config(config) {}

WorkflowPlan WorkflowPlanner::plan(double complexity_score, const SimulationRequest& request) const {
    WorkflowPlan workflow = {
        WorkflowStage::COORDINATE_ANALYSIS,
        WorkflowStage::SIMULATION_EXECUTION
    };

    if (complexity_score > m_config.persona_calibration_threshold) {
        workflow.insert(workflow.begin() + 1, WorkflowStage::PERSONA_CALIBRATION);
        workflow.push_back(WorkflowStage::OPTIMIZATION);
    }

    if (request.hasRegulatoryConstraints()) {
        workflow.insert(workflow.end() - 1, WorkflowStage::REGULATORY_VALIDATION);
    }

    if (complexity_score > m_config.synthesis_threshold) {
        workflow.push_back(WorkflowStage::SYNTHESIS);
    }

    validatePlan(workflow);
    return workflow;
}

void WorkflowPlanner::validatePlan(const WorkflowPlan& plan) {
    if (plan.empty()) {
        throw PlanningFailure("plan is empty");
    }

    auto contains = [&plan](WorkflowStage stage) {
        return std::find(plan.begin(), plan.end(), stage) != plan.end();
    };

    if (!contains(WorkflowStage::COORDINATE_ANALYSIS)) {
        throw PlanningFailure("plan is missing coordinate_analysis");
    }
    if (!contains(WorkflowStage::SIMULATION_EXECUTION)) {
        throw PlanningFailure("plan is missing simulation_execution");
    }

    std::set<WorkflowStage> seen;
    for (WorkflowStage stage : plan) {
        if (!seen.insert(stage).second) {
            throw PlanningFailure("stage " + stageToString(stage) + " appears more than once");
        }
    }
}

} // namespace Meridian
