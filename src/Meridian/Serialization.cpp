// =================================================================
// src/Meridian/Serialization.cpp
// =================================================================
// Implementation of JSON conversion for the public data types.

#include "Meridian/Serialization.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace Meridian {

namespace {

std::vector<std::string> stringList(const nlohmann::json& value, const std::string& field) {
    if (!value.is_array()) {
        throw std::invalid_argument("Field '" + field + "' must be an array of strings");
    }

    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument("Field '" + field + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::string stringField(const nlohmann::json& value, const std::string& field) {
    if (!value.is_string()) {
        throw std::invalid_argument("Field '" + field + "' must be a string");
    }
    return value.get<std::string>();
}

} // anonymous namespace

AxisValue axisValueFromJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_array()) {
        return stringList(value, "axis value");
    }
    throw std::invalid_argument("Axis values must be strings, integers or string arrays");
}

Coordinate coordinateFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("Coordinate must be a JSON object");
    }

    AxisValues values;
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.value().is_null()) {
            continue;
        }
        values[stringToAxis(it.key())] = axisValueFromJson(it.value());
    }

    return Coordinate(values);
}

SimulationRequest requestFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("Request must be a JSON object");
    }
    if (!object.contains("coordinate")) {
        throw std::invalid_argument("Request is missing 'coordinate'");
    }

    SimulationRequest request(coordinateFromJson(object.at("coordinate")));

    if (object.contains("target_personas")) {
        request.target_personas = stringList(object.at("target_personas"), "target_personas");
    }

    if (object.contains("regulatory_constraints")) {
        const auto& constraints = object.at("regulatory_constraints");
        if (!constraints.is_null() && !constraints.is_object() && !constraints.is_array()) {
            throw std::invalid_argument("Field 'regulatory_constraints' must be an object or array");
        }
        request.regulatory_constraints = constraints;
    }

    if (object.contains("analysis_depth")) {
        static const std::unordered_set<std::string> depths = {
            "surface", "moderate", "deep", "comprehensive"
        };
        std::string depth = stringField(object.at("analysis_depth"), "analysis_depth");
        if (!depths.count(depth)) {
            throw std::invalid_argument("Unknown analysis depth: " + depth);
        }
        request.analysis_depth = depth;
    }

    if (object.contains("reasoning_strategy") && !object.at("reasoning_strategy").is_null()) {
        request.reasoning_strategy = stringToStrategy(
            stringField(object.at("reasoning_strategy"), "reasoning_strategy"));
    }

    if (object.contains("optimization_goals")) {
        request.optimization_goals = stringList(object.at("optimization_goals"), "optimization_goals");
    }

    if (object.contains("security_level")) {
        request.security_level = stringToSecurityLevel(
            stringField(object.at("security_level"), "security_level"));
    }

    if (object.contains("session_context")) {
        request.session_context = object.at("session_context");
    }

    return request;
}

SimulationRequest loadRequestFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open request file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }

    return requestFromJson(document);
}

nlohmann::json planToJson(const WorkflowPlan& plan) {
    nlohmann::json stages = nlohmann::json::array();
    for (WorkflowStage stage : plan) {
        stages.push_back(stageToString(stage));
    }
    return stages;
}

nlohmann::json timingsToJson(const StageTimings& timings) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [stage, duration] : timings) {
        object[stage] = duration.count();
    }
    return object;
}

void to_json(nlohmann::json& j, const AxisValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        j = *text;
    } else if (const auto* number = std::get_if<long long>(&value)) {
        j = *number;
    } else {
        j = std::get<std::vector<std::string>>(value);
    }
}

void to_json(nlohmann::json& j, const Coordinate& coordinate) {
    j = nlohmann::json::object();
    for (const auto& [axis, value] : coordinate.values()) {
        nlohmann::json item;
        to_json(item, value);
        j[axisToString(axis)] = item;
    }
}

void to_json(nlohmann::json& j, const ComplexityAssessment& assessment) {
    j = nlohmann::json{
        {"factors", assessment.factors()},
        {"score", assessment.score}
    };
}

void to_json(nlohmann::json& j, const SimulationRequest& request) {
    nlohmann::json coordinate;
    to_json(coordinate, request.coordinate);

    j = nlohmann::json{
        {"coordinate", coordinate},
        {"target_personas", request.target_personas},
        {"regulatory_constraints", request.regulatory_constraints},
        {"analysis_depth", request.analysis_depth},
        {"optimization_goals", request.optimization_goals},
        {"security_level", securityLevelToString(request.security_level)},
        {"session_context", request.session_context}
    };
    if (request.reasoning_strategy) {
        j["reasoning_strategy"] = strategyToString(*request.reasoning_strategy);
    }
}

void to_json(nlohmann::json& j, const SimulationResult& result) {
    nlohmann::json coordinate;
    to_json(coordinate, result.coordinate);

    j = nlohmann::json{
        {"session_id", result.session_id},
        {"coordinate", coordinate},
        {"reasoning", result.reasoning},
        {"confidence", result.confidence},
        {"recommendations", result.recommendations},
        {"performance_metrics", timingsToJson(result.performance_metrics)},
        {"persona_calibrations", result.persona_calibrations},
        {"regulatory_status", result.regulatory_status},
        {"processing_time_ms", result.processing_time.count()},
        {"optimization_applied", result.optimization_applied}
    };
}

void to_json(nlohmann::json& j, const SessionStatusView& view) {
    j = nlohmann::json{
        {"session_id", view.session_id},
        {"status", statusToString(view.status)},
        {"current_stage", stageToString(view.current_stage)},
        {"duration_ms", view.duration.count()},
        {"progress", view.progress},
        {"complexity_score", view.complexity_score},
        {"workflow_plan", planToJson(view.workflow_plan)},
        {"performance_metrics", timingsToJson(view.performance_metrics)},
        {"confidence_scores", view.confidence_scores},
        {"error_count", view.error_count},
        {"warning_count", view.warning_count},
        {"results_count", view.results_count}
    };
}

void to_json(nlohmann::json& j, const SystemMetrics& metrics) {
    j = nlohmann::json{
        {"total_sessions", metrics.total_sessions},
        {"active_sessions", metrics.active_sessions},
        {"managed_sessions", metrics.managed_sessions},
        {"in_flight_executions", metrics.in_flight_executions},
        {"successful_simulations", metrics.successful_simulations},
        {"failed_simulations", metrics.failed_simulations},
        {"optimization_improvements", metrics.optimization_improvements},
        {"sessions_reaped", metrics.sessions_reaped},
        {"timed_out_calls", metrics.timed_out_calls},
        {"abandoned_calls_running", metrics.abandoned_calls_running},
        {"average_processing_time_ms", metrics.average_processing_time},
        {"workflow_efficiency", metrics.workflow_efficiency},
        {"uptime_seconds", metrics.uptime.count()}
    };
}

} // namespace Meridian
