// =================================================================
// include/Meridian/OrchestratorErrors.hpp
// =================================================================
// Exception types raised across the orchestrator boundary.

#pragma once

#include <stdexcept>
#include <string>

namespace Meridian {

/**
 * @brief Base class for all orchestrator failures
 */
class OrchestratorError : public std::runtime_error {
public:
    explicit OrchestratorError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The session id is unknown, or the session was reaped mid-run
 */
class SessionNotFoundError : public OrchestratorError {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : OrchestratorError("Session " + session_id + " not found"), m_session_id(session_id) {}

    const std::string& sessionId() const { return m_session_id; }

private:
    std::string m_session_id;
};

/**
 * @brief An injected collaborator threw or timed out during a stage
 */
class CollaboratorFailure : public OrchestratorError {
public:
    CollaboratorFailure(const std::string& stage_name, const std::string& message)
        : OrchestratorError("Stage " + stage_name + " failed: " + message), m_stage_name(stage_name) {}

    const std::string& stageName() const { return m_stage_name; }

private:
    std::string m_stage_name;
};

/**
 * @brief The planner produced an empty or malformed workflow
 */
class PlanningFailure : public OrchestratorError {
public:
    explicit PlanningFailure(const std::string& message)
        : OrchestratorError("Workflow planning failed: " + message) {}
};

} // namespace Meridian
