// =================================================================
// src/Meridian/StageExecutor.cpp
// =================================================================
// Implementation of sequential stage execution with timeouts.

#include "Meridian/StageExecutor.hpp"
#include "Meridian/Logger.hpp"
#include "Meridian/OrchestratorErrors.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace Meridian {

StageExecutor::StageExecutor(const Collaborators& collaborators,
                             const ExecutorConfig& config,
                             TimeSource time_source)
    : m_collaborators(collaborators), m_config(config), m_time_source(std::move(time_source)),
      m_tracker(std::make_shared<CallTracker>()) {

    if (m_config.stage_timeout.count() < 0) {
        throw std::invalid_argument("Stage timeout must not be negative");
    }
}

size_t StageExecutor::timedOutCalls() const {
    return m_tracker->timed_out.load();
}

size_t StageExecutor::abandonedCallsRunning() const {
    return m_tracker->abandoned_running.load();
}

TimePoint StageExecutor::now() const {
    return m_time_source ? m_time_source() : std::chrono::system_clock::now();
}

std::string StageExecutor::artifactName(WorkflowStage stage) {
    switch (stage) {
        case WorkflowStage::COORDINATE_ANALYSIS:   return "detailed_analysis";
        case WorkflowStage::PERSONA_CALIBRATION:   return "persona_calibrations";
        case WorkflowStage::SIMULATION_EXECUTION:  return "simulation_data";
        case WorkflowStage::REGULATORY_VALIDATION: return "regulatory_validation";
        case WorkflowStage::INITIALIZATION:
        case WorkflowStage::SYNTHESIS:
        case WorkflowStage::OPTIMIZATION:
        case WorkflowStage::COMPLETION:
            return "";
    }
    return "";
}

std::optional<double> StageExecutor::extractConfidence(const nlohmann::json& artifact) {
    if (!artifact.is_object()) {
        return std::nullopt;
    }

    for (const char* key : {"confidence", "confidence_score"}) {
        auto it = artifact.find(key);
        if (it != artifact.end() && it->is_number()) {
            return it->get<double>();
        }
    }
    return std::nullopt;
}

bool StageExecutor::hasCollaborator(WorkflowStage stage) const {
    switch (stage) {
        case WorkflowStage::COORDINATE_ANALYSIS:   return m_collaborators.coordinate_analyzer != nullptr;
        case WorkflowStage::PERSONA_CALIBRATION:   return m_collaborators.persona_calibrator != nullptr;
        case WorkflowStage::SIMULATION_EXECUTION:  return m_collaborators.simulation_runner != nullptr;
        case WorkflowStage::REGULATORY_VALIDATION: return m_collaborators.compliance_validator != nullptr;
        case WorkflowStage::INITIALIZATION:
        case WorkflowStage::SYNTHESIS:
        case WorkflowStage::OPTIMIZATION:
        case WorkflowStage::COMPLETION:
            return true;
    }
    return false;
}

std::function<nlohmann::json()> StageExecutor::bindCall(WorkflowStage stage,
                                                        const SimulationRequest& request) const {
    // Inputs are captured by value: an abandoned call may outlive the request
    switch (stage) {
        case WorkflowStage::COORDINATE_ANALYSIS: {
            auto analyzer = m_collaborators.coordinate_analyzer;
            if (!analyzer) return nullptr;
            Coordinate coordinate = request.coordinate;
            return [analyzer, coordinate]() { return analyzer->analyze(coordinate); };
        }
        case WorkflowStage::PERSONA_CALIBRATION: {
            auto calibrator = m_collaborators.persona_calibrator;
            if (!calibrator) return nullptr;
            Coordinate coordinate = request.coordinate;
            auto personas = request.target_personas;
            return [calibrator, coordinate, personas]() {
                return calibrator->calibrate(coordinate, personas);
            };
        }
        case WorkflowStage::SIMULATION_EXECUTION: {
            auto runner = m_collaborators.simulation_runner;
            if (!runner) return nullptr;
            SimulationRequest copy = request;
            return [runner, copy]() { return runner->run(copy); };
        }
        case WorkflowStage::REGULATORY_VALIDATION: {
            auto validator = m_collaborators.compliance_validator;
            if (!validator) return nullptr;
            Coordinate coordinate = request.coordinate;
            nlohmann::json constraints = request.regulatory_constraints;
            return [validator, coordinate, constraints]() {
                return validator->validate(coordinate, constraints);
            };
        }
        case WorkflowStage::INITIALIZATION:
        case WorkflowStage::SYNTHESIS:
        case WorkflowStage::OPTIMIZATION:
        case WorkflowStage::COMPLETION:
            return nullptr;
    }
    return nullptr;
}

nlohmann::json StageExecutor::invokeWithTimeout(std::function<nlohmann::json()> call) const {
    if (m_config.stage_timeout.count() == 0) {
        return call();
    }

    // finished/abandoned are settled under the mutex so a call that returns
    // right at the deadline is counted at most once
    struct CallState {
        std::mutex mutex;
        bool finished = false;
        bool abandoned = false;
    };

    auto task = std::make_shared<std::packaged_task<nlohmann::json()>>(std::move(call));
    auto state = std::make_shared<CallState>();
    std::shared_ptr<CallTracker> tracker = m_tracker;
    std::future<nlohmann::json> future = task->get_future();

    std::thread([task, state, tracker]() {
        (*task)();
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
        if (state->abandoned) {
            tracker->abandoned_running--;
        }
    }).detach();

    if (future.wait_for(m_config.stage_timeout) == std::future_status::timeout) {
        m_tracker->timed_out++;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->finished) {
                state->abandoned = true;
                m_tracker->abandoned_running++;
            }
        }
        throw std::runtime_error("Collaborator call timed out after " +
                                 std::to_string(m_config.stage_timeout.count()) + "ms");
    }

    return future.get();
}

StageOutcome StageExecutor::runStage(SessionEntry& entry, WorkflowStage stage,
                                     const SimulationRequest& request) {
    const std::string stage_name = stageToString(stage);
    std::string session_id;

    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        session_id = entry.context.session_id;
        entry.context.current_stage = stage;
        entry.context.last_activity = now();
    }

    StageOutcome outcome;
    outcome.stage = stage;

    if (!hasCollaborator(stage)) {
        outcome.collaborator_available = false;
        std::string warning = "No collaborator configured for " + stage_name + "; stage skipped";

        {
            std::lock_guard<std::mutex> lock(entry.mutex);
            entry.context.processing_times[stage_name] = std::chrono::milliseconds(0);
            entry.context.warnings.push_back(warning);
        }

        Logger::getInstance().warning("StageExecutor", warning, "session: " + session_id);
        return outcome;
    }

    auto start_time = std::chrono::steady_clock::now();

    auto call = bindCall(stage, request);
    if (call) {
        try {
            outcome.artifact = invokeWithTimeout(std::move(call));
        } catch (const std::exception& e) {
            outcome.error = e.what();
        } catch (...) {
            // Non-standard exception types still fail the stage
            outcome.error = "unknown collaborator exception";
        }
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.context.processing_times[stage_name] = outcome.duration;
        entry.context.last_activity = now();

        if (outcome.success()) {
            std::string artifact_name = artifactName(stage);
            if (!artifact_name.empty()) {
                entry.context.artifacts[artifact_name] = outcome.artifact;
            }
            if (auto confidence = extractConfidence(outcome.artifact)) {
                entry.context.confidence_scores[stage_name] = *confidence;
            }
        }
    }

    Logger::getInstance().logStageCompleted(session_id, stage_name,
                                            static_cast<long>(outcome.duration.count()),
                                            outcome.success());
    return outcome;
}

void StageExecutor::runWorkflow(SessionEntry& entry, const SimulationRequest& request) {
    WorkflowPlan plan;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        plan = entry.context.workflow_plan;
        session_id = entry.context.session_id;
    }

    for (WorkflowStage stage : plan) {
        if (entry.cancellation->isCancelled()) {
            Logger::getInstance().warning("StageExecutor",
                "Session reaped before stage " + stageToString(stage), "session: " + session_id);
            throw SessionNotFoundError(session_id);
        }

        StageOutcome outcome = runStage(entry, stage, request);
        if (!outcome.success()) {
            const std::string stage_name = stageToString(stage);
            {
                std::lock_guard<std::mutex> lock(entry.mutex);
                entry.context.status = SessionStatus::ERROR;
                entry.context.errors.push_back(stage_name + ": " + outcome.error);
            }
            Logger::getInstance().error("StageExecutor",
                "Stage " + stage_name + " failed: " + outcome.error, "session: " + session_id);
            throw CollaboratorFailure(stage_name, outcome.error);
        }
    }

    if (entry.cancellation->isCancelled()) {
        Logger::getInstance().warning("StageExecutor",
            "Session reaped during execution", "session: " + session_id);
        throw SessionNotFoundError(session_id);
    }

    std::lock_guard<std::mutex> lock(entry.mutex);
    double sum = 0.0;
    size_t count = 0;
    for (WorkflowStage stage : plan) {
        auto it = entry.context.confidence_scores.find(stageToString(stage));
        if (it != entry.context.confidence_scores.end()) {
            sum += it->second;
            count++;
        }
    }
    if (count > 0) {
        entry.context.confidence_scores["overall"] = sum / static_cast<double>(count);
    }
}

} // namespace Meridian
