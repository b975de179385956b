// =================================================================
// src/Meridian/SessionOrchestrator.cpp
// =================================================================
// Implementation of the session orchestrator and its reaper thread.

#include "Meridian/SessionOrchestrator.hpp"
#include "Meridian/Logger.hpp"
#include "Meridian/OrchestratorErrors.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Meridian {

namespace {

/**
 * @brief Counts an execution as in flight for the guard's lifetime
 */
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<size_t>& counter) : m_counter(counter) { m_counter++; }
    ~InFlightGuard() { m_counter--; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<size_t>& m_counter;
};

std::vector<std::string> stageNames(const WorkflowPlan& plan) {
    std::vector<std::string> names;
    names.reserve(plan.size());
    for (WorkflowStage stage : plan) {
        names.push_back(stageToString(stage));
    }
    return names;
}

} // anonymous namespace

SessionOrchestrator::SessionOrchestrator(const Collaborators& collaborators,
                                         const OrchestratorConfig& config)
    : m_config(config),
      m_planner(config.planner),
      m_compiler(config.optimizer) {

    if (m_config.session_ttl.count() <= 0) {
        throw std::invalid_argument("Session TTL must be positive");
    }
    if (m_config.reap_interval.count() <= 0) {
        throw std::invalid_argument("Reap interval must be positive");
    }
    if (m_config.efficiency_baseline.count() <= 0) {
        throw std::invalid_argument("Efficiency baseline must be positive");
    }

    m_executor = std::make_unique<StageExecutor>(collaborators, m_config.executor,
                                                 [this]() { return now(); });

    m_statistics.started_at = now();

    if (m_config.enable_reaper) {
        startReaper();
    }

    Logger::getInstance().info("SessionOrchestrator", "Orchestrator initialized successfully");
}

SessionOrchestrator::~SessionOrchestrator() {
    stopReaper();
}

TimePoint SessionOrchestrator::now() const {
    std::lock_guard<std::mutex> lock(m_clock_mutex);
    return m_time_source ? m_time_source() : std::chrono::system_clock::now();
}

void SessionOrchestrator::registerTimeSource(TimeSource time_source) {
    std::lock_guard<std::mutex> lock(m_clock_mutex);
    m_time_source = std::move(time_source);
}

std::string SessionOrchestrator::createSession(const SimulationRequest& request) {
    SessionContext context(request.coordinate);
    context.status = SessionStatus::INITIALIZING;
    context.created_at = now();
    context.last_activity = context.created_at;

    context.complexity = m_analyzer.analyze(request.coordinate);
    context.workflow_plan = m_planner.plan(context.complexity.score, request);
    context.status = SessionStatus::ACTIVE;

    double score = context.complexity.score;
    std::vector<std::string> plan_names = stageNames(context.workflow_plan);

    SessionHandle entry = m_registry.create(std::move(context));
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        session_id = entry->context.session_id;
    }

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_statistics.total_sessions++;
    }

    Logger::getInstance().logSessionCreated(session_id, score, plan_names);
    return session_id;
}

SimulationResult SessionOrchestrator::executeSimulation(const std::string& session_id,
                                                        const SimulationRequest& request) {
    SessionHandle entry = m_registry.find(session_id);
    if (!entry) {
        throw SessionNotFoundError(session_id);
    }

    std::lock_guard<std::mutex> run_lock(entry->run_mutex);
    InFlightGuard in_flight(m_in_flight);
    auto start_time = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        WorkflowPlanner::validatePlan(entry->context.workflow_plan);
        entry->context.status = SessionStatus::PROCESSING;
        entry->context.last_activity = now();
    }

    Logger::getInstance().debug("SessionOrchestrator", "Executing simulation", "session: " + session_id);

    try {
        m_executor->runWorkflow(*entry, request);

        std::unique_lock<std::mutex> lock(entry->mutex);
        SimulationResult result = m_compiler.compile(entry->context, request);

        auto optimization_start = std::chrono::steady_clock::now();
        OptimizationRecord record = m_compiler.optimize(result, now());
        entry->context.processing_times["result_optimization"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - optimization_start);

        // A reap that landed after the last stage still discards the result
        if (entry->cancellation->isCancelled()) {
            throw SessionNotFoundError(session_id);
        }

        result.performance_metrics = entry->context.processing_times;
        result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        entry->context.optimization_history.push_back(record);
        entry->context.results.push_back(result);
        entry->context.status = SessionStatus::COMPLETED;
        entry->context.last_activity = now();
        lock.unlock();

        updateStatistics(true, result.processing_time, record.confidence_enhanced);
        Logger::getInstance().logSimulationFinished(session_id, result.confidence,
                                                    static_cast<long>(result.processing_time.count()), true);
        return result;

    } catch (const SessionNotFoundError&) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_statistics.cancelled_simulations++;
        }
        Logger::getInstance().warning("SessionOrchestrator",
            "Simulation cancelled; session was reaped", "session: " + session_id);
        throw;

    } catch (const CollaboratorFailure&) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        updateStatistics(false, elapsed, false);
        Logger::getInstance().logSimulationFinished(session_id, 0.0,
                                                    static_cast<long>(elapsed.count()), false);
        throw;

    } catch (const std::exception& e) {
        // Failures outside the collaborators, e.g. in result compilation
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->context.status = SessionStatus::ERROR;
            entry->context.errors.push_back(std::string("execution: ") + e.what());
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        updateStatistics(false, elapsed, false);
        Logger::getInstance().error("SessionOrchestrator",
            std::string("Simulation failed: ") + e.what(), "session: " + session_id);
        throw;
    }
}

SimulationResult SessionOrchestrator::runSimulation(const SimulationRequest& request) {
    std::string session_id = createSession(request);
    return executeSimulation(session_id, request);
}

std::vector<SimulationOutcome> SessionOrchestrator::runSimulations(
    const std::vector<SimulationRequest>& requests) {

    std::vector<std::future<SimulationOutcome>> futures;

    for (const auto& request : requests) {
        futures.push_back(std::async(std::launch::async, [this, request]() {
            SimulationOutcome outcome;
            try {
                outcome.session_id = createSession(request);
                outcome.result = executeSimulation(outcome.session_id, request);
            } catch (const std::exception& e) {
                outcome.error = e.what();
            }
            return outcome;
        }));
    }

    std::vector<SimulationOutcome> outcomes;
    outcomes.reserve(futures.size());
    for (auto& future : futures) {
        outcomes.push_back(future.get());
    }

    Logger::getInstance().info("SessionOrchestrator",
        "Processed batch of " + std::to_string(requests.size()) + " simulations");

    return outcomes;
}

std::optional<SessionContext> SessionOrchestrator::getSession(const std::string& session_id) const {
    SessionHandle entry = m_registry.find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->context;
}

std::optional<SessionStatusView> SessionOrchestrator::getSessionStatus(const std::string& session_id) const {
    SessionHandle entry = m_registry.find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    TimePoint current = now();
    std::lock_guard<std::mutex> lock(entry->mutex);
    return SessionStatusView::fromContext(entry->context, current);
}

SystemMetrics SessionOrchestrator::getSystemMetrics() const {
    SystemMetrics metrics;
    TimePoint current = now();

    std::vector<SessionHandle> sessions = m_registry.all();
    metrics.managed_sessions = sessions.size();

    size_t completed = 0;
    double total_completed_age = 0.0;
    for (const auto& entry : sessions) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!isTerminal(entry->context.status)) {
            metrics.active_sessions++;
        }
        if (entry->context.status == SessionStatus::COMPLETED) {
            completed++;
            total_completed_age += static_cast<double>(entry->context.age(current).count());
        }
    }

    if (sessions.empty()) {
        metrics.workflow_efficiency = 1.0;
    } else if (completed == 0) {
        metrics.workflow_efficiency = 0.0;
    } else {
        double average_age = total_completed_age / static_cast<double>(completed);
        double baseline = static_cast<double>(m_config.efficiency_baseline.count());
        metrics.workflow_efficiency = std::clamp(1.0 - average_age / baseline, 0.0, 1.0);
    }

    metrics.in_flight_executions = m_in_flight.load();
    metrics.timed_out_calls = m_executor->timedOutCalls();
    metrics.abandoned_calls_running = m_executor->abandonedCallsRunning();

    std::lock_guard<std::mutex> lock(m_stats_mutex);
    metrics.total_sessions = m_statistics.total_sessions;
    metrics.successful_simulations = m_statistics.successful_simulations;
    metrics.failed_simulations = m_statistics.failed_simulations;
    metrics.optimization_improvements = m_statistics.optimization_improvements;
    metrics.sessions_reaped = m_statistics.sessions_reaped;
    metrics.average_processing_time = m_statistics.average_processing_time;

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(current - m_statistics.started_at);
    metrics.uptime = std::max(uptime, std::chrono::seconds(0));

    return metrics;
}

size_t SessionOrchestrator::cleanupExpiredSessions() {
    std::vector<std::string> removed = m_registry.removeExpired(now(), m_config.session_ttl);

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_statistics.sessions_reaped += removed.size();
    }

    Logger::getInstance().logReap(removed, m_registry.size());
    return removed.size();
}

OrchestratorStatistics SessionOrchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_statistics;
}

void SessionOrchestrator::updateStatistics(bool success, std::chrono::milliseconds duration, bool enhanced) {
    std::lock_guard<std::mutex> lock(m_stats_mutex);

    if (!success) {
        m_statistics.failed_simulations++;
        return;
    }

    m_statistics.successful_simulations++;
    if (enhanced) {
        m_statistics.optimization_improvements++;
    }

    // Update average processing time
    if (m_statistics.successful_simulations == 1) {
        m_statistics.average_processing_time = static_cast<double>(duration.count());
    } else {
        m_statistics.average_processing_time =
            (m_statistics.average_processing_time * (m_statistics.successful_simulations - 1) +
             static_cast<double>(duration.count())) / m_statistics.successful_simulations;
    }
}

std::string SessionOrchestrator::getPerformanceReport() const {
    SystemMetrics metrics = getSystemMetrics();
    size_t cancelled;
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        cancelled = m_statistics.cancelled_simulations;
    }

    size_t finished = metrics.successful_simulations + metrics.failed_simulations;

    std::ostringstream report;
    report << "Session Orchestrator Performance Report\n";
    report << "=======================================\n\n";

    report << "Session Statistics:\n";
    report << "  Total Sessions: " << metrics.total_sessions << "\n";
    report << "  Managed Sessions: " << metrics.managed_sessions << "\n";
    report << "  Active Sessions: " << metrics.active_sessions << "\n";
    report << "  Sessions Reaped: " << metrics.sessions_reaped << "\n\n";

    report << "Simulation Statistics:\n";
    report << "  Successful: " << metrics.successful_simulations << "\n";
    report << "  Failed: " << metrics.failed_simulations << "\n";
    report << "  Cancelled: " << cancelled << "\n";
    report << "  In Flight: " << metrics.in_flight_executions << "\n";
    report << "  Timed Out Calls: " << metrics.timed_out_calls << "\n";
    report << "  Abandoned Calls Running: " << metrics.abandoned_calls_running << "\n";
    report << "  Success Rate: " << std::fixed << std::setprecision(1)
           << (finished > 0 ? (metrics.successful_simulations * 100.0) / finished : 0.0)
           << "%\n\n";

    report << "Performance Metrics:\n";
    report << "  Average Processing Time: " << std::fixed << std::setprecision(0)
           << metrics.average_processing_time << "ms\n";
    report << "  Confidence Enhancements: " << metrics.optimization_improvements << "\n";
    report << "  Workflow Efficiency: " << std::fixed << std::setprecision(2)
           << metrics.workflow_efficiency << "\n";
    report << "  Uptime: " << metrics.uptime.count() << "s\n";

    return report.str();
}

void SessionOrchestrator::startReaper() {
    std::lock_guard<std::mutex> control(m_reaper_control_mutex);
    if (m_reaper_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_reaper_mutex);
        m_stop_reaper = false;
    }
    m_reaper_thread = std::make_unique<std::thread>(&SessionOrchestrator::reaperLoop, this);
    Logger::getInstance().info("SessionOrchestrator", "Started session reaper thread");
}

void SessionOrchestrator::stopReaper() {
    std::lock_guard<std::mutex> control(m_reaper_control_mutex);
    if (!m_reaper_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_reaper_mutex);
        m_stop_reaper = true;
    }
    m_reaper_cv.notify_all();

    if (m_reaper_thread->joinable()) {
        m_reaper_thread->join();
    }
    m_reaper_thread.reset();
    Logger::getInstance().info("SessionOrchestrator", "Stopped session reaper thread");
}

bool SessionOrchestrator::isReaperRunning() const {
    std::lock_guard<std::mutex> control(m_reaper_control_mutex);
    return m_reaper_thread != nullptr;
}

void SessionOrchestrator::reaperLoop() {
    std::unique_lock<std::mutex> lock(m_reaper_mutex);

    while (!m_stop_reaper) {
        if (m_reaper_cv.wait_for(lock, m_config.reap_interval, [this] { return m_stop_reaper; })) {
            break;
        }

        lock.unlock();
        try {
            cleanupExpiredSessions();
        } catch (const std::exception& e) {
            Logger::getInstance().error("SessionOrchestrator",
                "Session cleanup error: " + std::string(e.what()));
        }
        lock.lock();
    }
}

} // namespace Meridian
