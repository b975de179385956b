// =================================================================
// tests/ResultCompilerTest.cpp
// =================================================================
// Unit tests for ResultCompiler component.

#include "Meridian/Logger.hpp"
#include "Meridian/ResultCompiler.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using Meridian::Coordinate;
using Meridian::ResultCompiler;
using Meridian::SessionContext;
using Meridian::SimulationRequest;
using Meridian::SimulationResult;

namespace {

bool hasRecommendation(const std::vector<std::string>& recommendations, const std::string& text) {
    return std::find(recommendations.begin(), recommendations.end(), text) != recommendations.end();
}

const std::string kStagedRollout = "Consider implementing staged rollout due to high complexity";
const std::string kReviewLogs = "Review error logs for potential optimization opportunities";
const std::string kPerformance = "Consider performance optimization for faster execution";

} // anonymous namespace

class ResultCompilerTest {
private:
    ResultCompiler m_compiler;

    static SessionContext makeSession() {
        SessionContext context(Coordinate("technological", std::string("finance")));
        context.session_id = "compile-session";
        return context;
    }

public:
    ResultCompilerTest() {
        Meridian::Logger::getInstance().setConsoleLogging(false);
        Meridian::Logger::getInstance().setFileLogging(false);
    }

    void testCompileDefaults() {
        std::cout << "Testing compile defaults..." << std::endl;

        SessionContext session = makeSession();
        SimulationRequest request(session.primary_coordinate);

        SimulationResult result = m_compiler.compile(session, request);
        assert(result.session_id == "compile-session" && "Result carries the session id");
        assert(result.coordinate == request.coordinate && "Result carries the coordinate");
        assert(result.reasoning.is_object() && result.reasoning.empty() && "Reasoning defaults to an empty map");
        assert(result.confidence == 0.75 && "Confidence defaults to 0.75");
        assert(result.recommendations.empty() && "No recommendations for a quiet session");
        assert(!result.optimization_applied && "Compile alone does not optimize");

        std::cout << "✓ Compile defaults test passed" << std::endl;
    }

    void testCompileFromArtifacts() {
        std::cout << "Testing compile from artifacts..." << std::endl;

        SessionContext session = makeSession();
        session.artifacts["detailed_analysis"] = {{"axes", 18}};
        session.artifacts["persona_calibrations"] = {{"auditor", 0.7}};
        session.artifacts["regulatory_validation"] = {{"compliant", false}};
        session.confidence_scores["overall"] = 0.66;
        session.processing_times["coordinate_analysis"] = std::chrono::milliseconds(12);

        SimulationResult result = m_compiler.compile(session, SimulationRequest(session.primary_coordinate));
        assert(result.reasoning["axes"] == 18 && "Reasoning comes from the analysis artifact");
        assert(result.persona_calibrations["auditor"] == 0.7 && "Calibrations are carried over");
        assert(result.regulatory_status["compliant"] == false && "Validation status is carried over");
        assert(result.confidence == 0.66 && "Overall confidence is used");
        assert(result.performance_metrics.at("coordinate_analysis").count() == 12 && "Timings are carried over");

        std::cout << "✓ Compile from artifacts test passed" << std::endl;
    }

    void testRecommendations() {
        std::cout << "Testing recommendations..." << std::endl;

        SessionContext session = makeSession();
        session.complexity.score = 0.85;
        session.errors.push_back("coordinate_analysis: transient failure");
        session.processing_times["simulation_execution"] = std::chrono::milliseconds(6000);

        auto recommendations = m_compiler.generateRecommendations(session);
        assert(recommendations.size() == 3 && "All three heuristics should fire");
        assert(hasRecommendation(recommendations, kStagedRollout) && "High complexity suggests staged rollout");
        assert(hasRecommendation(recommendations, kReviewLogs) && "Errors suggest reviewing logs");
        assert(hasRecommendation(recommendations, kPerformance) && "Slow simulation suggests optimization");

        session.complexity.score = 0.8;
        session.errors.clear();
        session.processing_times["simulation_execution"] = std::chrono::milliseconds(5000);
        assert(m_compiler.generateRecommendations(session).empty() && "Thresholds are exclusive");

        std::cout << "✓ Recommendations test passed" << std::endl;
    }

    void testOptimizationPass() {
        std::cout << "Testing optimization pass..." << std::endl;

        auto now = std::chrono::system_clock::now();
        SessionContext session = makeSession();

        SimulationResult low(session.session_id, session.primary_coordinate);
        low.confidence = 0.5;
        auto record = m_compiler.optimize(low, now);
        assert(std::abs(low.confidence - 0.6) < 1e-12 && "Low confidence is raised by one step");
        assert(low.optimization_applied && "Optimization is marked applied");
        assert(record.confidence_enhanced && "Record notes the enhancement");
        assert(record.confidence_before == 0.5 && "Record keeps the previous confidence");
        assert(record.applied_at == now && "Record carries the timestamp");

        SimulationResult near_cap(session.session_id, session.primary_coordinate);
        near_cap.confidence = 0.79;
        m_compiler.optimize(near_cap, now);
        assert(std::abs(near_cap.confidence - 0.89) < 1e-12 && "Bump applies just below the threshold");

        SimulationResult high(session.session_id, session.primary_coordinate);
        high.confidence = 0.8;
        auto unchanged = m_compiler.optimize(high, now);
        assert(high.confidence == 0.8 && "Confidence at the threshold is left alone");
        assert(high.optimization_applied && "Optimization is still marked applied");
        assert(!unchanged.confidence_enhanced && "No enhancement recorded");

        Meridian::OptimizerConfig config;
        config.enhancement_threshold = 1.0;
        config.enhancement_step = 0.5;
        ResultCompiler generous(config);
        SimulationResult capped(session.session_id, session.primary_coordinate);
        capped.confidence = 0.7;
        generous.optimize(capped, now);
        assert(capped.confidence == 1.0 && "Enhancement is capped at 1.0");

        std::cout << "✓ Optimization pass test passed" << std::endl;
    }

    void testInvalidConfiguration() {
        std::cout << "Testing invalid configuration..." << std::endl;

        Meridian::OptimizerConfig config;
        config.default_confidence = 1.5;

        bool threw = false;
        try {
            ResultCompiler compiler(config);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Out-of-range confidence should be rejected");

        std::cout << "✓ Invalid configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ResultCompiler unit tests..." << std::endl;
        std::cout << "===================================" << std::endl << std::endl;

        testCompileDefaults();
        std::cout << std::endl;

        testCompileFromArtifacts();
        std::cout << std::endl;

        testRecommendations();
        std::cout << std::endl;

        testOptimizationPass();
        std::cout << std::endl;

        testInvalidConfiguration();
        std::cout << std::endl;

        std::cout << "All ResultCompiler tests passed!" << std::endl;
    }
};

int main() {
    try {
        ResultCompilerTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
