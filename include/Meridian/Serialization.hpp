// =================================================================
// include/Meridian/Serialization.hpp
// =================================================================
// JSON conversion of coordinates, requests, results and status views.

#pragma once

#include "Meridian/ComplexityAnalyzer.hpp"
#include "Meridian/Coordinate.hpp"
#include "Meridian/Session.hpp"
#include "Meridian/SessionOrchestrator.hpp"
#include "Meridian/WorkflowTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace Meridian {

/**
 * @brief Parse an axis value: string, integer or array of strings
 * @throws std::invalid_argument for any other JSON type
 */
AxisValue axisValueFromJson(const nlohmann::json& value);

/**
 * @brief Build a coordinate from an object keyed by axis name
 *
 * Null members are treated as absent.
 *
 * @throws std::invalid_argument on unknown axis names or invalid values
 */
Coordinate coordinateFromJson(const nlohmann::json& object);

/**
 * @brief Build a request from its JSON form
 *
 * Only "coordinate" is required; every other member falls back to the
 * SimulationRequest default.
 *
 * @throws std::invalid_argument on missing or malformed members
 */
SimulationRequest requestFromJson(const nlohmann::json& object);

/**
 * @brief Read and parse a request file
 * @throws std::runtime_error if the file cannot be read or is not JSON
 * @throws std::invalid_argument if the request is malformed
 */
SimulationRequest loadRequestFile(const std::string& path);

nlohmann::json planToJson(const WorkflowPlan& plan);
nlohmann::json timingsToJson(const StageTimings& timings);

void to_json(nlohmann::json& j, const AxisValue& value);
void to_json(nlohmann::json& j, const Coordinate& coordinate);
void to_json(nlohmann::json& j, const ComplexityAssessment& assessment);
void to_json(nlohmann::json& j, const SimulationRequest& request);
void to_json(nlohmann::json& j, const SimulationResult& result);
void to_json(nlohmann::json& j, const SessionStatusView& view);
void to_json(nlohmann::json& j, const SystemMetrics& metrics);

} // namespace Meridian
