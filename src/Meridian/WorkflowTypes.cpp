// =================================================================
// src/Meridian/WorkflowTypes.cpp
// =================================================================
// String mappings for workflow enums and request helpers.

#include "Meridian/WorkflowTypes.hpp"
#include <stdexcept>
#include <unordered_map>

namespace Meridian {

std::string stageToString(WorkflowStage stage) {
    switch (stage) {
        case WorkflowStage::INITIALIZATION:
            return "initialization";
        case WorkflowStage::COORDINATE_ANALYSIS:
            return "coordinate_analysis";
        case WorkflowStage::PERSONA_CALIBRATION:
            return "persona_calibration";
        case WorkflowStage::SIMULATION_EXECUTION:
            return "simulation_execution";
        case WorkflowStage::REGULATORY_VALIDATION:
            return "regulatory_validation";
        case WorkflowStage::SYNTHESIS:
            return "synthesis";
        case WorkflowStage::OPTIMIZATION:
            return "optimization";
        case WorkflowStage::COMPLETION:
            return "completion";
        default:
            throw std::invalid_argument("Unknown WorkflowStage value");
    }
}

WorkflowStage stringToStage(const std::string& name) {
    static const std::unordered_map<std::string, WorkflowStage> stage_map = {
        {"initialization", WorkflowStage::INITIALIZATION},
        {"coordinate_analysis", WorkflowStage::COORDINATE_ANALYSIS},
        {"persona_calibration", WorkflowStage::PERSONA_CALIBRATION},
        {"simulation_execution", WorkflowStage::SIMULATION_EXECUTION},
        {"regulatory_validation", WorkflowStage::REGULATORY_VALIDATION},
        {"synthesis", WorkflowStage::SYNTHESIS},
        {"optimization", WorkflowStage::OPTIMIZATION},
        {"completion", WorkflowStage::COMPLETION}
    };

    auto it = stage_map.find(name);
    if (it != stage_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown workflow stage: " + name);
}

std::string statusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::INITIALIZING: return "initializing";
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::PROCESSING: return "processing";
        case SessionStatus::SUSPENDED: return "suspended";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::ERROR: return "error";
        default:
            throw std::invalid_argument("Unknown SessionStatus value");
    }
}

SessionStatus stringToStatus(const std::string& name) {
    static const std::unordered_map<std::string, SessionStatus> status_map = {
        {"initializing", SessionStatus::INITIALIZING},
        {"active", SessionStatus::ACTIVE},
        {"processing", SessionStatus::PROCESSING},
        {"suspended", SessionStatus::SUSPENDED},
        {"completed", SessionStatus::COMPLETED},
        {"error", SessionStatus::ERROR}
    };

    auto it = status_map.find(name);
    if (it != status_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown session status: " + name);
}

std::string strategyToString(ReasoningStrategy strategy) {
    switch (strategy) {
        case ReasoningStrategy::LOGICAL: return "logical";
        case ReasoningStrategy::PROBABILISTIC: return "probabilistic";
        case ReasoningStrategy::HEURISTIC: return "heuristic";
        case ReasoningStrategy::NEURAL: return "neural";
        case ReasoningStrategy::HYBRID: return "hybrid";
        default:
            throw std::invalid_argument("Unknown ReasoningStrategy value");
    }
}

ReasoningStrategy stringToStrategy(const std::string& name) {
    static const std::unordered_map<std::string, ReasoningStrategy> strategy_map = {
        {"logical", ReasoningStrategy::LOGICAL},
        {"probabilistic", ReasoningStrategy::PROBABILISTIC},
        {"heuristic", ReasoningStrategy::HEURISTIC},
        {"neural", ReasoningStrategy::NEURAL},
        {"hybrid", ReasoningStrategy::HYBRID}
    };

    auto it = strategy_map.find(name);
    if (it != strategy_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown reasoning strategy: " + name);
}

std::string securityLevelToString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::PUBLIC: return "public";
        case SecurityLevel::RESTRICTED: return "restricted";
        case SecurityLevel::CONFIDENTIAL: return "confidential";
        case SecurityLevel::SECRET: return "secret";
        case SecurityLevel::TOP_SECRET: return "top_secret";
        default:
            throw std::invalid_argument("Unknown SecurityLevel value");
    }
}

SecurityLevel stringToSecurityLevel(const std::string& name) {
    static const std::unordered_map<std::string, SecurityLevel> level_map = {
        {"public", SecurityLevel::PUBLIC},
        {"restricted", SecurityLevel::RESTRICTED},
        {"confidential", SecurityLevel::CONFIDENTIAL},
        {"secret", SecurityLevel::SECRET},
        {"top_secret", SecurityLevel::TOP_SECRET}
    };

    auto it = level_map.find(name);
    if (it != level_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown security level: " + name);
}

bool isTerminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::ERROR;
}

bool SimulationRequest::hasRegulatoryConstraints() const {
    if (regulatory_constraints.is_object() || regulatory_constraints.is_array()) {
        return !regulatory_constraints.empty();
    }
    return false;
}

} // namespace Meridian
