// =================================================================
// src/Meridian/ResultCompiler.cpp
// =================================================================
// Implementation of result compilation, recommendations and optimization.

#include "Meridian/ResultCompiler.hpp"
#include <algorithm>
#include <stdexcept>

namespace Meridian {

namespace {

bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

} // anonymous namespace

ResultCompiler::ResultCompiler(const OptimizerConfig& config)
    : m_config(config) {

    if (!inUnitRange(m_config.default_confidence) ||
        !inUnitRange(m_config.enhancement_threshold) ||
        !inUnitRange(m_config.enhancement_step) ||
        !inUnitRange(m_config.staged_rollout_threshold)) {
        throw std::invalid_argument("Optimizer thresholds must lie in [0, 1]");
    }
    if (m_config.slow_simulation_threshold.count() < 0) {
        throw std::invalid_argument("Slow simulation threshold must not be negative");
    }
}

SimulationResult ResultCompiler::compile(const SessionContext& session,
                                         const SimulationRequest& request) const {
    SimulationResult result(session.session_id, request.coordinate);

    auto analysis = session.artifacts.find("detailed_analysis");
    if (analysis != session.artifacts.end() && analysis->second.is_object()) {
        result.reasoning = analysis->second;
    }

    auto calibrations = session.artifacts.find("persona_calibrations");
    if (calibrations != session.artifacts.end() && !calibrations->second.is_null()) {
        result.persona_calibrations = calibrations->second;
    }

    auto validation = session.artifacts.find("regulatory_validation");
    if (validation != session.artifacts.end() && !validation->second.is_null()) {
        result.regulatory_status = validation->second;
    }

    auto overall = session.confidence_scores.find("overall");
    result.confidence = overall != session.confidence_scores.end()
        ? std::clamp(overall->second, 0.0, 1.0)
        : m_config.default_confidence;

    result.recommendations = generateRecommendations(session);
    result.performance_metrics = session.processing_times;

    return result;
}

std::vector<std::string> ResultCompiler::generateRecommendations(const SessionContext& session) const {
    std::vector<std::string> recommendations;

    if (session.complexity.score > m_config.staged_rollout_threshold) {
        recommendations.push_back("Consider implementing staged rollout due to high complexity");
    }

    if (!session.errors.empty()) {
        recommendations.push_back("Review error logs for potential optimization opportunities");
    }

    auto simulation = session.processing_times.find(stageToString(WorkflowStage::SIMULATION_EXECUTION));
    if (simulation != session.processing_times.end() &&
        simulation->second > m_config.slow_simulation_threshold) {
        recommendations.push_back("Consider performance optimization for faster execution");
    }

    return recommendations;
}

OptimizationRecord ResultCompiler::optimize(SimulationResult& result, TimePoint now) const {
    OptimizationRecord record;
    record.applied_at = now;
    record.confidence_before = result.confidence;

    if (result.confidence < m_config.enhancement_threshold) {
        result.confidence = std::min(result.confidence + m_config.enhancement_step, 1.0);
        record.confidence_enhanced = true;
    }

    result.optimization_applied = true;
    record.confidence_after = result.confidence;
    return record;
}

} // namespace Meridian
