// =================================================================
// tests/SerializationTest.cpp
// =================================================================
// Unit tests for request parsing and JSON output.

#include "Meridian/Logger.hpp"
#include "Meridian/Serialization.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using Meridian::Axis;
using Meridian::Coordinate;
using Meridian::SimulationRequest;
using nlohmann::json;

class SerializationTest {
private:
    static json fullRequestJson() {
        return json::parse(R"({
            "coordinate": {
                "pillar": "adaptive",
                "sector": "healthcare",
                "regulatory_framework": "HIPAA",
                "location": ["US", "CA"],
                "node": 42,
                "temporal": "2024-05-01T12:00:00Z",
                "branch": null
            },
            "target_personas": ["auditor", "clinician"],
            "regulatory_constraints": {"hipaa": {"phi_handling": "encrypted"}},
            "analysis_depth": "comprehensive",
            "reasoning_strategy": "hybrid",
            "optimization_goals": ["latency"],
            "security_level": "confidential",
            "session_context": {"origin": "batch"}
        })");
    }

    static bool rejects(const json& document) {
        try {
            Meridian::requestFromJson(document);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    }

public:
    SerializationTest() {
        Meridian::Logger::getInstance().setConsoleLogging(false);
        Meridian::Logger::getInstance().setFileLogging(false);
    }

    void testParseFullRequest() {
        std::cout << "Testing full request parsing..." << std::endl;

        SimulationRequest request = Meridian::requestFromJson(fullRequestJson());

        assert(request.coordinate.pillar() == "adaptive" && "Pillar parsed");
        assert(request.coordinate.text(Axis::REGULATORY_FRAMEWORK) == "HIPAA" && "String axis parsed");
        assert(request.coordinate.has(Axis::LOCATION) && "Array axis parsed");
        assert(request.coordinate.has(Axis::NODE) && "Integer axis parsed");
        assert(!request.coordinate.has(Axis::BRANCH) && "Null axis treated as absent");
        assert(request.target_personas.size() == 2 && "Personas parsed");
        assert(request.hasRegulatoryConstraints() && "Constraints parsed");
        assert(request.analysis_depth == "comprehensive" && "Depth parsed");
        assert(request.reasoning_strategy == Meridian::ReasoningStrategy::HYBRID && "Strategy parsed");
        assert(request.security_level == Meridian::SecurityLevel::CONFIDENTIAL && "Security level parsed");
        assert(request.session_context["origin"] == "batch" && "Context kept verbatim");

        std::cout << "✓ Full request parsing test passed" << std::endl;
    }

    void testParseMinimalRequest() {
        std::cout << "Testing minimal request parsing..." << std::endl;

        SimulationRequest request = Meridian::requestFromJson(
            json{{"coordinate", {{"pillar", "foundational"}, {"sector", 7}}}});

        assert(request.analysis_depth == "deep" && "Depth defaults to deep");
        assert(!request.reasoning_strategy && "No strategy by default");
        assert(request.security_level == Meridian::SecurityLevel::PUBLIC && "Public by default");
        assert(request.target_personas.empty() && "No personas by default");
        assert(!request.hasRegulatoryConstraints() && "No constraints by default");

        std::cout << "✓ Minimal request parsing test passed" << std::endl;
    }

    void testRejectsMalformedRequests() {
        std::cout << "Testing malformed requests..." << std::endl;

        json base = {{"coordinate", {{"pillar", "adaptive"}, {"sector", "finance"}}}};

        assert(rejects(json::array()) && "Non-object request");
        assert(rejects(json::object()) && "Missing coordinate");
        assert(rejects(json{{"coordinate", {{"sector", "finance"}}}}) && "Missing pillar");
        assert(rejects(json{{"coordinate", {{"pillar", "adaptive"}, {"sector", "finance"}, {"planet", "mars"}}}}) &&
               "Unknown axis");
        assert(rejects(json{{"coordinate", {{"pillar", "adaptive"}, {"sector", "finance"}, {"temporal", "soon"}}}}) &&
               "Invalid temporal value");

        json bad_depth = base;
        bad_depth["analysis_depth"] = "bottomless";
        assert(rejects(bad_depth) && "Unknown depth");

        json bad_personas = base;
        bad_personas["target_personas"] = {"auditor", 3};
        assert(rejects(bad_personas) && "Non-string persona");

        json bad_constraints = base;
        bad_constraints["regulatory_constraints"] = "HIPAA";
        assert(rejects(bad_constraints) && "Scalar constraints");

        json bad_level = base;
        bad_level["security_level"] = "cosmic";
        assert(rejects(bad_level) && "Unknown security level");

        std::cout << "✓ Malformed requests test passed" << std::endl;
    }

    void testLoadRequestFile() {
        std::cout << "Testing request file loading..." << std::endl;

        const std::string path = "serialization_test_request.json";
        {
            std::ofstream file(path);
            file << fullRequestJson().dump(2);
        }
        SimulationRequest request = Meridian::loadRequestFile(path);
        assert(request.coordinate.text(Axis::SECTOR) == std::string("healthcare") && "File contents parsed");

        {
            std::ofstream file(path);
            file << "{ not json";
        }
        bool threw = false;
        try {
            Meridian::loadRequestFile(path);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Invalid JSON is a runtime error");
        std::remove(path.c_str());

        threw = false;
        try {
            Meridian::loadRequestFile("does/not/exist.json");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Missing file is a runtime error");

        std::cout << "✓ Request file loading test passed" << std::endl;
    }

    void testOutputShapes() {
        std::cout << "Testing JSON output shapes..." << std::endl;

        SimulationRequest request = Meridian::requestFromJson(fullRequestJson());
        json coordinate = request.coordinate;
        assert(coordinate["pillar"] == "adaptive" && "Coordinate keyed by axis name");
        assert(coordinate["node"] == 42 && "Integer axis kept as a number");
        assert(coordinate["location"].is_array() && "Array axis kept as an array");
        assert(Meridian::coordinateFromJson(coordinate) == request.coordinate && "Coordinate JSON reads back");

        json request_json = request;
        assert(request_json["reasoning_strategy"] == "hybrid" && "Strategy written by name");
        assert(request_json["security_level"] == "confidential" && "Security level written by name");

        Meridian::SimulationResult result("abc", request.coordinate);
        result.confidence = 0.85;
        result.processing_time = std::chrono::milliseconds(120);
        result.performance_metrics["coordinate_analysis"] = std::chrono::milliseconds(15);
        json result_json = result;
        assert(result_json["session_id"] == "abc" && "Result id");
        assert(result_json["processing_time_ms"] == 120 && "Processing time in milliseconds");
        assert(result_json["performance_metrics"]["coordinate_analysis"] == 15 && "Stage timings in milliseconds");
        assert(result_json["optimization_applied"] == false && "Optimization flag");

        Meridian::SessionContext context(request.coordinate);
        context.session_id = "abc";
        context.workflow_plan = {Meridian::WorkflowStage::COORDINATE_ANALYSIS,
                                 Meridian::WorkflowStage::SIMULATION_EXECUTION};
        auto view = Meridian::SessionStatusView::fromContext(context, context.created_at);
        json view_json = view;
        assert(view_json["status"] == "initializing" && "Status written by name");
        assert(view_json["workflow_plan"][1] == "simulation_execution" && "Plan written by stage name");
        assert(view_json.contains("duration_ms") && "Duration key present");

        Meridian::SystemMetrics metrics;
        json metrics_json = metrics;
        assert(metrics_json.contains("workflow_efficiency") && "Efficiency key present");
        assert(metrics_json.contains("uptime_seconds") && "Uptime key present");
        assert(metrics_json.contains("abandoned_calls_running") && "Abandoned call count present");

        Meridian::ComplexityAssessment assessment;
        json assessment_json = assessment;
        assert(assessment_json["factors"].size() == 5 && "Five complexity factors");

        std::cout << "✓ JSON output shapes test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Serialization unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testParseFullRequest();
        std::cout << std::endl;

        testParseMinimalRequest();
        std::cout << std::endl;

        testRejectsMalformedRequests();
        std::cout << std::endl;

        testLoadRequestFile();
        std::cout << std::endl;

        testOutputShapes();
        std::cout << std::endl;

        std::cout << "All Serialization tests passed!" << std::endl;
    }
};

int main() {
    try {
        SerializationTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
