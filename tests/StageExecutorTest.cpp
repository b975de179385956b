// =================================================================
// tests/StageExecutorTest.cpp
// =================================================================
// Unit tests for StageExecutor component.

#include "Meridian/Logger.hpp"
#include "Meridian/OrchestratorErrors.hpp"
#include "Meridian/StageExecutor.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <thread>

using Meridian::Coordinate;
using Meridian::SessionContext;
using Meridian::SessionEntry;
using Meridian::SessionStatus;
using Meridian::SimulationRequest;
using Meridian::StageExecutor;
using Meridian::WorkflowStage;

class StageExecutorTest {
private:
    class FakeAnalyzer : public Meridian::CoordinateAnalyzer {
    public:
        std::atomic<int> calls{0};
        nlohmann::json analyze(const Coordinate& coordinate) override {
            calls++;
            return {{"pillar", coordinate.pillar()}, {"confidence_score", 0.9}};
        }
    };

    class FakeCalibrator : public Meridian::PersonaCalibrator {
    public:
        nlohmann::json calibrate(const Coordinate&, const std::vector<std::string>& personas) override {
            return {{"personas", personas}};
        }
    };

    class FakeRunner : public Meridian::SimulationRunner {
    public:
        std::chrono::milliseconds delay{0};
        bool fail = false;
        bool throw_non_standard = false;
        nlohmann::json run(const SimulationRequest& request) override {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (fail) {
                throw std::runtime_error("simulation engine unavailable");
            }
            if (throw_non_standard) {
                throw 42;
            }
            return {{"depth", request.analysis_depth}, {"confidence", 0.7}};
        }
    };

    class FakeValidator : public Meridian::ComplianceValidator {
    public:
        nlohmann::json validate(const Coordinate&, const nlohmann::json& constraints) override {
            return {{"compliant", true}, {"checked", constraints.size()}};
        }
    };

    static std::shared_ptr<SessionEntry> makeEntry(const Meridian::WorkflowPlan& plan) {
        SessionContext context(Coordinate("adaptive", std::string("healthcare")));
        context.session_id = "test-session";
        context.status = SessionStatus::PROCESSING;
        context.workflow_plan = plan;
        return std::make_shared<SessionEntry>(std::move(context));
    }

    static SimulationRequest makeRequest() {
        SimulationRequest request(Coordinate("adaptive", std::string("healthcare")));
        request.target_personas = {"auditor", "clinician"};
        request.regulatory_constraints = {{"framework", "HIPAA"}};
        return request;
    }

    static Meridian::WorkflowPlan fullPlan() {
        return {
            WorkflowStage::COORDINATE_ANALYSIS,
            WorkflowStage::PERSONA_CALIBRATION,
            WorkflowStage::SIMULATION_EXECUTION,
            WorkflowStage::REGULATORY_VALIDATION,
            WorkflowStage::OPTIMIZATION,
            WorkflowStage::SYNTHESIS
        };
    }

public:
    StageExecutorTest() {
        Meridian::Logger::getInstance().setConsoleLogging(false);
        Meridian::Logger::getInstance().setFileLogging(false);
    }

    void testFullWorkflow() {
        std::cout << "Testing full workflow..." << std::endl;

        Meridian::Collaborators collaborators;
        auto analyzer = std::make_shared<FakeAnalyzer>();
        collaborators.coordinate_analyzer = analyzer;
        collaborators.persona_calibrator = std::make_shared<FakeCalibrator>();
        collaborators.simulation_runner = std::make_shared<FakeRunner>();
        collaborators.compliance_validator = std::make_shared<FakeValidator>();

        StageExecutor executor(collaborators);
        auto entry = makeEntry(fullPlan());
        executor.runWorkflow(*entry, makeRequest());

        const auto& context = entry->context;
        assert(analyzer->calls == 1 && "Analyzer should run once");
        assert(context.artifacts.at("detailed_analysis")["pillar"] == "adaptive" && "Analysis artifact stored");
        assert(context.artifacts.at("persona_calibrations")["personas"].size() == 2 && "Calibration artifact stored");
        assert(context.artifacts.at("simulation_data")["depth"] == "deep" && "Simulation artifact stored");
        assert(context.artifacts.at("regulatory_validation")["compliant"] == true && "Validation artifact stored");
        assert(context.processing_times.size() == 6 && "Every stage should be timed");
        assert(context.current_stage == WorkflowStage::SYNTHESIS && "Last planned stage should be current");
        assert(context.progress() == 1.0 && "Progress should be complete");
        assert(context.warnings.empty() && "No warnings with all collaborators present");

        assert(std::abs(context.confidence_scores.at("coordinate_analysis") - 0.9) < 1e-12 &&
               "confidence_score harvested from analysis");
        assert(std::abs(context.confidence_scores.at("simulation_execution") - 0.7) < 1e-12 &&
               "confidence harvested from simulation");
        assert(std::abs(context.confidence_scores.at("overall") - 0.8) < 1e-12 &&
               "Overall is the mean of stage confidences");

        std::cout << "✓ Full workflow test passed" << std::endl;
    }

    void testMissingCollaborators() {
        std::cout << "Testing missing collaborators..." << std::endl;

        StageExecutor executor{Meridian::Collaborators()};
        auto entry = makeEntry({WorkflowStage::COORDINATE_ANALYSIS, WorkflowStage::SIMULATION_EXECUTION});
        executor.runWorkflow(*entry, makeRequest());

        const auto& context = entry->context;
        assert(context.warnings.size() == 2 && "Each skipped stage should add a warning");
        assert(context.processing_times.at("coordinate_analysis").count() == 0 && "Skipped stage has zero duration");
        assert(context.processing_times.at("simulation_execution").count() == 0 && "Skipped stage has zero duration");
        assert(context.artifacts.empty() && "No artifacts without collaborators");
        assert(context.confidence_scores.count("overall") == 0 && "No overall confidence without stage confidences");
        assert(context.errors.empty() && "Missing collaborators are not errors");

        auto outcome = executor.runStage(*entry, WorkflowStage::PERSONA_CALIBRATION, makeRequest());
        assert(!outcome.collaborator_available && "Outcome should report the missing collaborator");
        assert(outcome.success() && "A skipped stage is not a failure");

        std::cout << "✓ Missing collaborators test passed" << std::endl;
    }

    void testCollaboratorFailure() {
        std::cout << "Testing collaborator failure..." << std::endl;

        Meridian::Collaborators collaborators;
        auto analyzer = std::make_shared<FakeAnalyzer>();
        auto runner = std::make_shared<FakeRunner>();
        runner->fail = true;
        collaborators.coordinate_analyzer = analyzer;
        collaborators.simulation_runner = runner;
        collaborators.compliance_validator = std::make_shared<FakeValidator>();

        StageExecutor executor(collaborators);
        auto entry = makeEntry({
            WorkflowStage::COORDINATE_ANALYSIS,
            WorkflowStage::SIMULATION_EXECUTION,
            WorkflowStage::REGULATORY_VALIDATION
        });

        bool threw = false;
        try {
            executor.runWorkflow(*entry, makeRequest());
        } catch (const Meridian::CollaboratorFailure& e) {
            threw = true;
            assert(e.stageName() == "simulation_execution" && "Failure should name the stage");
        }
        assert(threw && "Collaborator errors should raise CollaboratorFailure");

        const auto& context = entry->context;
        assert(context.status == SessionStatus::ERROR && "Session should be marked ERROR");
        assert(context.errors.size() == 1 && "Failure message should be recorded");
        assert(context.errors[0].find("simulation engine unavailable") != std::string::npos && "Message kept");
        assert(context.processing_times.count("simulation_execution") == 1 && "Failed stage is still timed");
        assert(context.processing_times.count("regulatory_validation") == 0 && "Remaining stages are aborted");
        assert(context.artifacts.count("simulation_data") == 0 && "Failed stage stores no artifact");

        std::cout << "✓ Collaborator failure test passed" << std::endl;
    }

    void testStageTimeout() {
        std::cout << "Testing stage timeout..." << std::endl;

        Meridian::Collaborators collaborators;
        auto runner = std::make_shared<FakeRunner>();
        runner->delay = std::chrono::milliseconds(500);
        collaborators.simulation_runner = runner;

        Meridian::ExecutorConfig config;
        config.stage_timeout = std::chrono::milliseconds(50);
        StageExecutor executor(collaborators, config);

        auto entry = makeEntry({WorkflowStage::COORDINATE_ANALYSIS, WorkflowStage::SIMULATION_EXECUTION});

        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            executor.runWorkflow(*entry, makeRequest());
        } catch (const Meridian::CollaboratorFailure& e) {
            threw = true;
            assert(std::string(e.what()).find("timed out") != std::string::npos && "Timeout should be reported");
        }
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(threw && "Overrunning collaborator should fail the stage");
        assert(elapsed < std::chrono::milliseconds(450) && "Executor should not wait for the abandoned call");
        assert(entry->context.status == SessionStatus::ERROR && "Timed out session is marked ERROR");
        assert(executor.timedOutCalls() == 1 && "Timed out call is counted");
        assert(executor.abandonedCallsRunning() == 1 && "Abandoned call is still running");

        for (int i = 0; i < 300 && executor.abandonedCallsRunning() > 0; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(executor.abandonedCallsRunning() == 0 && "Abandoned call is released once it returns");
        assert(executor.timedOutCalls() == 1 && "Timed out total is kept");

        std::cout << "✓ Stage timeout test passed" << std::endl;
    }

    void testNonStandardException() {
        std::cout << "Testing non-standard collaborator exceptions..." << std::endl;

        Meridian::Collaborators collaborators;
        auto runner = std::make_shared<FakeRunner>();
        runner->throw_non_standard = true;
        collaborators.simulation_runner = runner;

        Meridian::ExecutorConfig direct;
        direct.stage_timeout = std::chrono::milliseconds(0);

        for (const auto& config : {Meridian::ExecutorConfig(), direct}) {
            StageExecutor executor(collaborators, config);
            auto entry = makeEntry({WorkflowStage::COORDINATE_ANALYSIS, WorkflowStage::SIMULATION_EXECUTION});

            bool threw = false;
            try {
                executor.runWorkflow(*entry, makeRequest());
            } catch (const Meridian::CollaboratorFailure& e) {
                threw = true;
                assert(e.stageName() == "simulation_execution" && "Failure should name the stage");
            }
            assert(threw && "Any thrown type fails the stage");

            const auto& context = entry->context;
            assert(context.status == SessionStatus::ERROR && "Session should be marked ERROR");
            assert(context.errors.size() == 1 && "Failure should be recorded");
            assert(context.errors[0].find("unknown collaborator exception") != std::string::npos &&
                   "Non-standard failures get a generic message");
            assert(executor.timedOutCalls() == 0 && "A thrown value is not a timeout");
        }

        std::cout << "✓ Non-standard exception test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        Meridian::Collaborators collaborators;
        auto analyzer = std::make_shared<FakeAnalyzer>();
        collaborators.coordinate_analyzer = analyzer;

        StageExecutor executor(collaborators);
        auto entry = makeEntry({WorkflowStage::COORDINATE_ANALYSIS, WorkflowStage::SIMULATION_EXECUTION});
        entry->cancellation->cancel();

        bool threw = false;
        try {
            executor.runWorkflow(*entry, makeRequest());
        } catch (const Meridian::SessionNotFoundError& e) {
            threw = true;
            assert(e.sessionId() == "test-session" && "Error should carry the id");
        }
        assert(threw && "Cancelled sessions should raise SessionNotFoundError");
        assert(analyzer->calls == 0 && "No stage runs after cancellation");

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testConfidenceExtraction() {
        std::cout << "Testing confidence extraction..." << std::endl;

        assert(StageExecutor::extractConfidence({{"confidence", 0.6}}).value() == 0.6 && "confidence field");
        assert(StageExecutor::extractConfidence({{"confidence_score", 0.4}}).value() == 0.4 && "confidence_score field");
        assert(!StageExecutor::extractConfidence({{"confidence", "high"}}) && "Non-numeric values are ignored");
        assert(!StageExecutor::extractConfidence(nlohmann::json()) && "Null artifacts carry no confidence");
        assert(StageExecutor::artifactName(WorkflowStage::SYNTHESIS).empty() && "Markers have no artifact");

        std::cout << "✓ Confidence extraction test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StageExecutor unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testFullWorkflow();
        std::cout << std::endl;

        testMissingCollaborators();
        std::cout << std::endl;

        testCollaboratorFailure();
        std::cout << std::endl;

        testStageTimeout();
        std::cout << std::endl;

        testNonStandardException();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testConfidenceExtraction();
        std::cout << std::endl;

        std::cout << "All StageExecutor tests passed!" << std::endl;
    }
};

int main() {
    try {
        StageExecutorTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
