// =================================================================
// include/Meridian/SessionOrchestrator.hpp
// =================================================================
// Public boundary: session creation, execution, status, metrics and reaping.

#pragma once

#include "Meridian/Collaborators.hpp"
#include "Meridian/ComplexityAnalyzer.hpp"
#include "Meridian/ResultCompiler.hpp"
#include "Meridian/Session.hpp"
#include "Meridian/SessionRegistry.hpp"
#include "Meridian/StageExecutor.hpp"
#include "Meridian/WorkflowPlanner.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Meridian {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    std::chrono::milliseconds session_ttl{std::chrono::hours(24)};        ///< Inactivity before reaping
    std::chrono::milliseconds reap_interval{std::chrono::hours(1)};       ///< Reaper period
    bool enable_reaper = true;                                            ///< Start the reaper thread on construction
    std::chrono::milliseconds efficiency_baseline{std::chrono::seconds(300)}; ///< Workflow efficiency reference

    PlannerConfig planner;
    ExecutorConfig executor;
    OptimizerConfig optimizer;
};

/**
 * @brief Running counters kept by the orchestrator
 */
struct OrchestratorStatistics {
    size_t total_sessions = 0;                    ///< Sessions ever created
    size_t successful_simulations = 0;            ///< Executions that produced a result
    size_t failed_simulations = 0;                ///< Executions aborted by a collaborator
    size_t cancelled_simulations = 0;             ///< Executions stopped by the reaper
    size_t optimization_improvements = 0;         ///< Results whose confidence was enhanced
    size_t sessions_reaped = 0;                   ///< Sessions removed by expiry scans
    double average_processing_time = 0.0;         ///< Mean successful execution time in ms
    TimePoint started_at;                         ///< Orchestrator construction time
};

/**
 * @brief Aggregate view returned by getSystemMetrics()
 */
struct SystemMetrics {
    size_t total_sessions = 0;
    size_t active_sessions = 0;                   ///< Registered and not terminal
    size_t managed_sessions = 0;                  ///< Registered in any status
    size_t in_flight_executions = 0;
    size_t successful_simulations = 0;
    size_t failed_simulations = 0;
    size_t optimization_improvements = 0;
    size_t sessions_reaped = 0;
    size_t timed_out_calls = 0;                   ///< Collaborator calls past the stage timeout
    size_t abandoned_calls_running = 0;           ///< Timed-out calls still running detached
    double average_processing_time = 0.0;         ///< ms
    double workflow_efficiency = 1.0;             ///< In [0, 1]
    std::chrono::seconds uptime{0};
};

/**
 * @brief Per-request outcome of runSimulations()
 */
struct SimulationOutcome {
    std::string session_id;                       ///< Empty if creation failed
    std::optional<SimulationResult> result;
    std::string error;

    bool success() const { return result.has_value(); }
};

/**
 * @brief Coordinates sessions from creation to reaping
 *
 * Sessions live in a SessionRegistry; executions run on the caller's
 * thread (or one std::async task per request in runSimulations), and a
 * background reaper thread removes sessions whose inactivity exceeds the
 * configured TTL. All public methods are thread-safe.
 */
class SessionOrchestrator {
public:
    /**
     * @brief Constructor
     * @param collaborators Analysis engines, any of which may be null
     * @param config Orchestrator configuration
     * @throws std::invalid_argument on non-positive durations
     */
    explicit SessionOrchestrator(const Collaborators& collaborators,
                                 const OrchestratorConfig& config = OrchestratorConfig());

    /**
     * @brief Stops and joins the reaper thread
     */
    virtual ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * @brief Analyze complexity, plan the workflow and register a session
     * @param request Simulation request carrying the primary coordinate
     * @return New session id
     * @throws PlanningFailure if no valid plan can be built
     */
    virtual std::string createSession(const SimulationRequest& request);

    /**
     * @brief Run the session's stored plan and return the optimized result
     * @throws SessionNotFoundError for unknown ids or when reaped mid-run
     * @throws CollaboratorFailure when a stage fails or times out
     * @throws PlanningFailure when the stored plan is invalid
     * @throws std::exception other failures are rethrown after the session is marked ERROR
     */
    virtual SimulationResult executeSimulation(const std::string& session_id,
                                               const SimulationRequest& request);

    /**
     * @brief Create a session and execute it in one call
     */
    virtual SimulationResult runSimulation(const SimulationRequest& request);

    /**
     * @brief Run several requests concurrently, one task per request
     * @return Outcomes in request order; failures are captured, not thrown
     */
    virtual std::vector<SimulationOutcome> runSimulations(const std::vector<SimulationRequest>& requests);

    /**
     * @return Copy of the session record, or nullopt when unknown
     */
    virtual std::optional<SessionContext> getSession(const std::string& session_id) const;

    /**
     * @return Status snapshot, or nullopt when unknown
     */
    virtual std::optional<SessionStatusView> getSessionStatus(const std::string& session_id) const;

    virtual SystemMetrics getSystemMetrics() const;

    /**
     * @brief Remove sessions inactive for longer than the TTL
     * @return Number of sessions removed
     */
    virtual size_t cleanupExpiredSessions();

    /**
     * @brief Replace the clock used for timestamps, expiry and metrics
     * @param time_source Clock function; an empty function restores the system clock
     */
    virtual void registerTimeSource(TimeSource time_source);

    virtual void startReaper();
    virtual void stopReaper();
    bool isReaperRunning() const;

    virtual OrchestratorStatistics getStatistics() const;

    /**
     * @brief Get detailed performance metrics
     * @return Formatted performance report
     */
    virtual std::string getPerformanceReport() const;

    const OrchestratorConfig& getConfig() const { return m_config; }

protected:
    TimePoint now() const;

    /**
     * @brief Fold a finished execution into the running statistics
     */
    virtual void updateStatistics(bool success, std::chrono::milliseconds duration, bool enhanced);

private:
    OrchestratorConfig m_config;

    ComplexityAnalyzer m_analyzer;
    WorkflowPlanner m_planner;
    std::unique_ptr<StageExecutor> m_executor;
    ResultCompiler m_compiler;
    SessionRegistry m_registry;

    OrchestratorStatistics m_statistics;
    mutable std::mutex m_stats_mutex;
    std::atomic<size_t> m_in_flight{0};

    TimeSource m_time_source;
    mutable std::mutex m_clock_mutex;

    std::unique_ptr<std::thread> m_reaper_thread;
    mutable std::mutex m_reaper_control_mutex;  ///< Serializes start/stop
    std::mutex m_reaper_mutex;                  ///< Guards m_stop_reaper
    std::condition_variable m_reaper_cv;
    bool m_stop_reaper = false;

    /**
     * @brief Reaper thread function
     */
    void reaperLoop();
};

} // namespace Meridian
