// =================================================================
// include/Meridian/Session.hpp
// =================================================================
// Typed session record and the shared handle the registry hands out.

#pragma once

#include "Meridian/ComplexityAnalyzer.hpp"
#include "Meridian/Coordinate.hpp"
#include "Meridian/WorkflowTypes.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Meridian {

using TimePoint = std::chrono::system_clock::time_point;
using TimeSource = std::function<TimePoint()>;

/**
 * @brief One application of the result optimization pass
 */
struct OptimizationRecord {
    TimePoint applied_at;
    double confidence_before = 0.0;
    double confidence_after = 0.0;
    bool confidence_enhanced = false;   ///< Whether the confidence bump fired
};

/**
 * @brief Full state of one session
 *
 * Only the orchestrator and the stage executor write to this record, and
 * only while holding the owning SessionEntry's mutex.
 */
struct SessionContext {
    explicit SessionContext(const Coordinate& coordinate)
        : primary_coordinate(coordinate) {}

    std::string session_id;
    SessionStatus status = SessionStatus::INITIALIZING;
    WorkflowStage current_stage = WorkflowStage::INITIALIZATION;
    TimePoint created_at;
    TimePoint last_activity;

    Coordinate primary_coordinate;
    ComplexityAssessment complexity;
    WorkflowPlan workflow_plan;                         ///< Fixed at creation

    std::map<std::string, nlohmann::json> artifacts;    ///< Stage outputs by artifact name
    StageTimings processing_times;                      ///< Elapsed time by stage name
    std::map<std::string, double> confidence_scores;    ///< Per-stage and "overall"
    std::vector<SimulationResult> results;
    std::vector<OptimizationRecord> optimization_history;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    std::chrono::milliseconds age(TimePoint now) const;

    /**
     * @brief Inactive for strictly longer than ttl
     */
    bool isExpired(TimePoint now, std::chrono::milliseconds ttl) const;

    /**
     * @brief (index of current stage + 1) / plan length, or 0.0 when the
     *        current stage is not part of the plan
     */
    double progress() const;
};

/**
 * @brief Cooperative cancellation flag shared between reaper and executor
 */
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

/**
 * @brief Registry slot owning one session and its locks
 *
 * `mutex` guards `context`. `run_mutex` is held for the whole of an
 * execution so that two runs of the same session never interleave.
 */
struct SessionEntry {
    explicit SessionEntry(SessionContext ctx)
        : context(std::move(ctx)), cancellation(std::make_shared<CancellationToken>()) {}

    mutable std::mutex mutex;
    std::mutex run_mutex;
    SessionContext context;
    std::shared_ptr<CancellationToken> cancellation;
};

using SessionHandle = std::shared_ptr<SessionEntry>;

/**
 * @brief Read-only snapshot returned by status queries
 */
struct SessionStatusView {
    std::string session_id;
    SessionStatus status = SessionStatus::INITIALIZING;
    WorkflowStage current_stage = WorkflowStage::INITIALIZATION;
    std::chrono::milliseconds duration{0};
    double progress = 0.0;
    double complexity_score = 0.0;
    WorkflowPlan workflow_plan;
    StageTimings performance_metrics;
    std::map<std::string, double> confidence_scores;
    size_t error_count = 0;
    size_t warning_count = 0;
    size_t results_count = 0;

    static SessionStatusView fromContext(const SessionContext& context, TimePoint now);
};

} // namespace Meridian
