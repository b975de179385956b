// =================================================================
// include/Meridian/Coordinate.hpp
// =================================================================
// Immutable multi-axis coordinate consumed by every analysis component.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Meridian {

/**
 * @brief Named axes of a knowledge coordinate, in canonical order
 */
enum class Axis {
    PILLAR,                 ///< Pillar level (anchor)
    SECTOR,                 ///< Sector or industry code (anchor)
    HONEYCOMB,              ///< Crosslink mappings
    BRANCH,                 ///< Branch hierarchy
    NODE,                   ///< Cross-sector node overlay
    REGULATORY,             ///< Regulatory framework code
    COMPLIANCE,             ///< Compliance standard code
    COMPLIANCE_LEVEL,       ///< strict, moderate, basic, none
    AUDIT_REQUIREMENTS,     ///< Audit requirement level
    REGULATORY_FRAMEWORK,   ///< Regulatory framework name (e.g. HIPAA)
    ROLE_KNOWLEDGE,         ///< Knowledge domain role
    ROLE_SECTOR,            ///< Sector expert role
    ROLE_REGULATORY,        ///< Regulatory expert role
    ROLE_COMPLIANCE,        ///< Compliance role
    LOCATION,               ///< Geographic location
    TEMPORAL,               ///< ISO 8601 time or version
    ROLE_DEFINITION,        ///< Role of the acting persona
    USER_AUTHORITY          ///< Authority level of the acting persona
};

/**
 * @brief Value held by one axis: text, integer code or list of strings
 */
using AxisValue = std::variant<std::string, long long, std::vector<std::string>>;

using AxisValues = std::map<Axis, AxisValue>;

std::string axisToString(Axis axis);

/**
 * @throws std::invalid_argument for unknown axis names
 */
Axis stringToAxis(const std::string& name);

/**
 * @brief All axes in canonical order
 */
const std::vector<Axis>& allAxes();

/**
 * @brief Render a value as text; lists are comma-joined
 */
std::string axisValueToString(const AxisValue& value);

/**
 * @brief True for a non-empty string, a non-zero integer or a non-empty list
 */
bool isPopulated(const AxisValue& value);

/**
 * @brief Populated and not one of the placeholder strings
 *        "none", "default" or "unspecified"
 */
bool isMeaningful(const AxisValue& value);

/**
 * @brief Immutable point in the knowledge/regulatory/persona space
 *
 * The pillar and sector anchors are always present; every other axis is
 * optional. There are no mutators: analyses receive the coordinate by
 * const reference and never alter the caller's copy.
 */
class Coordinate {
public:
    /**
     * @brief Build from the two anchors plus any optional axes
     * @param pillar Pillar category or code, must be non-empty
     * @param sector Sector name or numeric code
     * @param optional_axes Remaining axes; PILLAR/SECTOR entries are rejected
     * @throws std::invalid_argument on a missing anchor or malformed temporal axis
     */
    Coordinate(const std::string& pillar, const AxisValue& sector,
               const AxisValues& optional_axes = AxisValues());

    /**
     * @brief Build from a complete axis map that must contain both anchors
     * @throws std::invalid_argument on a missing anchor or malformed value
     */
    explicit Coordinate(const AxisValues& values);

    bool has(Axis axis) const;

    /**
     * @return Pointer to the stored value, or nullptr when absent
     */
    const AxisValue* find(Axis axis) const;

    /**
     * @return The axis value when it is present and holds a string
     */
    std::optional<std::string> text(Axis axis) const;

    const std::string& pillar() const;
    const AxisValue& sector() const;
    const AxisValues& values() const { return m_values; }

    /**
     * @brief Pipe-delimited rendering of every axis in canonical order
     *
     * Absent axes render as empty fields, so two coordinates with equal
     * key strings carry the same values.
     */
    std::string toKeyString() const;

    size_t filledAxesCount() const;
    double completenessRatio() const;

    bool operator==(const Coordinate& other) const { return m_values == other.m_values; }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }

private:
    void validate() const;

    AxisValues m_values;
};

} // namespace Meridian
