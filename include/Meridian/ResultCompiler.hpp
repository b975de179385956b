// =================================================================
// include/Meridian/ResultCompiler.hpp
// =================================================================
// Assembles the final result of a session and applies the optimization pass.

#pragma once

#include "Meridian/Session.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Meridian {

/**
 * @brief Heuristic constants of result compilation and optimization
 */
struct OptimizerConfig {
    double default_confidence = 0.75;        ///< Used when no stage reported a confidence
    double enhancement_threshold = 0.8;      ///< Below this the confidence is bumped
    double enhancement_step = 0.1;           ///< Size of the bump, capped at 1.0
    double staged_rollout_threshold = 0.8;   ///< Complexity above this recommends staged rollout
    std::chrono::milliseconds slow_simulation_threshold{5000}; ///< Slow simulation_execution
};

/**
 * @brief Builds a SimulationResult from a session's recorded state
 */
class ResultCompiler {
public:
    explicit ResultCompiler(const OptimizerConfig& config = OptimizerConfig());

    /**
     * @brief Gather artifacts, confidence, timings and recommendations
     * @param session Session after its workflow completed (caller holds its lock)
     * @param request Request that was executed
     */
    SimulationResult compile(const SessionContext& session, const SimulationRequest& request) const;

    std::vector<std::string> generateRecommendations(const SessionContext& session) const;

    /**
     * @brief Raise a low confidence by one enhancement step and mark the
     *        result optimized
     * @return Record of the pass for the session's optimization history
     */
    OptimizationRecord optimize(SimulationResult& result, TimePoint now) const;

    const OptimizerConfig& getConfig() const { return m_config; }

private:
    OptimizerConfig m_config;
};

} // namespace Meridian
