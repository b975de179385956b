// =================================================================
// include/Meridian/StageExecutor.hpp
// =================================================================
// Runs a session's planned stages against the injected collaborators.

#pragma once

#include "Meridian/Collaborators.hpp"
#include "Meridian/Session.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Meridian {

/**
 * @brief Stage executor configuration
 */
struct ExecutorConfig {
    std::chrono::milliseconds stage_timeout{30000};  ///< Per collaborator call, 0 disables
};

/**
 * @brief What happened when one stage ran
 */
struct StageOutcome {
    WorkflowStage stage = WorkflowStage::INITIALIZATION;
    nlohmann::json artifact;                    ///< Collaborator output, null for markers
    std::chrono::milliseconds duration{0};
    bool collaborator_available = true;         ///< False when the stage was skipped
    std::string error;                          ///< Non-empty when the collaborator failed

    bool success() const { return error.empty(); }
};

/**
 * @brief Sequential stage runner
 *
 * Collaborator calls run without any session lock held. With a non-zero
 * stage timeout every call runs on its own detached thread; a call that
 * overruns is abandoned and reported as a failure. Abandoned calls keep
 * running until the collaborator returns and are counted by
 * abandonedCallsRunning(). Nothing waits for them on destruction.
 */
class StageExecutor {
public:
    /**
     * @param collaborators Analysis engines, any of which may be null
     * @param config Executor configuration
     * @param time_source Clock used for session activity timestamps
     */
    StageExecutor(const Collaborators& collaborators,
                  const ExecutorConfig& config = ExecutorConfig(),
                  TimeSource time_source = TimeSource());

    /**
     * @brief Run one stage and record its timing, artifact and confidence
     *        on the session
     *
     * Never throws for collaborator errors; they are reported in the
     * outcome so the caller decides how to fail the session.
     */
    StageOutcome runStage(SessionEntry& entry, WorkflowStage stage, const SimulationRequest& request);

    /**
     * @brief Run every stage of the session's plan in order
     *
     * On success the mean of the recorded stage confidences is stored
     * as "overall".
     *
     * @throws SessionNotFoundError if the session is cancelled between stages
     * @throws CollaboratorFailure if a stage fails; the session is marked ERROR
     */
    void runWorkflow(SessionEntry& entry, const SimulationRequest& request);

    /**
     * @brief Session artifact key a stage writes, empty for marker stages
     */
    static std::string artifactName(WorkflowStage stage);

    /**
     * @brief Numeric "confidence" or "confidence_score" field of an artifact
     */
    static std::optional<double> extractConfidence(const nlohmann::json& artifact);

    const ExecutorConfig& getConfig() const { return m_config; }

    /**
     * @brief Number of collaborator calls that exceeded the stage timeout
     */
    size_t timedOutCalls() const;

    /**
     * @brief Timed-out calls whose collaborator has not returned yet
     */
    size_t abandonedCallsRunning() const;

private:
    /**
     * @brief Counters shared with detached call threads, which may outlive
     *        the executor
     */
    struct CallTracker {
        std::atomic<size_t> timed_out{0};
        std::atomic<size_t> abandoned_running{0};
    };

    Collaborators m_collaborators;
    ExecutorConfig m_config;
    TimeSource m_time_source;
    std::shared_ptr<CallTracker> m_tracker;

    TimePoint now() const;

    /**
     * @brief Bind the collaborator call for a stage
     * @return Empty function when the stage is a marker or its collaborator is absent
     */
    std::function<nlohmann::json()> bindCall(WorkflowStage stage, const SimulationRequest& request) const;

    bool hasCollaborator(WorkflowStage stage) const;

    nlohmann::json invokeWithTimeout(std::function<nlohmann::json()> call) const;
};

} // namespace Meridian
