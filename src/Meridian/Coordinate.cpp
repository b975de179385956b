// =================================================================
// src/Meridian/Coordinate.cpp
// =================================================================
// Implementation of the coordinate value type and axis utilities.

#include "Meridian/Coordinate.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace Meridian {

std::string axisToString(Axis axis) {
    switch (axis) {
        case Axis::PILLAR: return "pillar";
        case Axis::SECTOR: return "sector";
        case Axis::HONEYCOMB: return "honeycomb";
        case Axis::BRANCH: return "branch";
        case Axis::NODE: return "node";
        case Axis::REGULATORY: return "regulatory";
        case Axis::COMPLIANCE: return "compliance";
        case Axis::COMPLIANCE_LEVEL: return "compliance_level";
        case Axis::AUDIT_REQUIREMENTS: return "audit_requirements";
        case Axis::REGULATORY_FRAMEWORK: return "regulatory_framework";
        case Axis::ROLE_KNOWLEDGE: return "role_knowledge";
        case Axis::ROLE_SECTOR: return "role_sector";
        case Axis::ROLE_REGULATORY: return "role_regulatory";
        case Axis::ROLE_COMPLIANCE: return "role_compliance";
        case Axis::LOCATION: return "location";
        case Axis::TEMPORAL: return "temporal";
        case Axis::ROLE_DEFINITION: return "role_definition";
        case Axis::USER_AUTHORITY: return "user_authority";
        default:
            throw std::invalid_argument("Unknown Axis value");
    }
}

Axis stringToAxis(const std::string& name) {
    static const std::unordered_map<std::string, Axis> axis_map = {
        {"pillar", Axis::PILLAR},
        {"sector", Axis::SECTOR},
        {"honeycomb", Axis::HONEYCOMB},
        {"branch", Axis::BRANCH},
        {"node", Axis::NODE},
        {"regulatory", Axis::REGULATORY},
        {"compliance", Axis::COMPLIANCE},
        {"compliance_level", Axis::COMPLIANCE_LEVEL},
        {"audit_requirements", Axis::AUDIT_REQUIREMENTS},
        {"regulatory_framework", Axis::REGULATORY_FRAMEWORK},
        {"role_knowledge", Axis::ROLE_KNOWLEDGE},
        {"role_sector", Axis::ROLE_SECTOR},
        {"role_regulatory", Axis::ROLE_REGULATORY},
        {"role_compliance", Axis::ROLE_COMPLIANCE},
        {"location", Axis::LOCATION},
        {"temporal", Axis::TEMPORAL},
        {"role_definition", Axis::ROLE_DEFINITION},
        {"user_authority", Axis::USER_AUTHORITY}
    };

    auto it = axis_map.find(name);
    if (it != axis_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown axis name: " + name);
}

const std::vector<Axis>& allAxes() {
    static const std::vector<Axis> axes = {
        Axis::PILLAR, Axis::SECTOR, Axis::HONEYCOMB, Axis::BRANCH, Axis::NODE,
        Axis::REGULATORY, Axis::COMPLIANCE, Axis::COMPLIANCE_LEVEL,
        Axis::AUDIT_REQUIREMENTS, Axis::REGULATORY_FRAMEWORK,
        Axis::ROLE_KNOWLEDGE, Axis::ROLE_SECTOR, Axis::ROLE_REGULATORY,
        Axis::ROLE_COMPLIANCE, Axis::LOCATION, Axis::TEMPORAL,
        Axis::ROLE_DEFINITION, Axis::USER_AUTHORITY
    };
    return axes;
}

std::string axisValueToString(const AxisValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* number = std::get_if<long long>(&value)) {
        return std::to_string(*number);
    }

    const auto& items = std::get<std::vector<std::string>>(value);
    std::ostringstream joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) joined << ",";
        joined << items[i];
    }
    return joined.str();
}

bool isPopulated(const AxisValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return !text->empty();
    }
    if (const auto* number = std::get_if<long long>(&value)) {
        return *number != 0;
    }
    return !std::get<std::vector<std::string>>(value).empty();
}

bool isMeaningful(const AxisValue& value) {
    if (!isPopulated(value)) {
        return false;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text != "none" && *text != "default" && *text != "unspecified";
    }
    return true;
}

Coordinate::Coordinate(const std::string& pillar, const AxisValue& sector,
                       const AxisValues& optional_axes)
    : m_values(optional_axes) {
    if (m_values.count(Axis::PILLAR) || m_values.count(Axis::SECTOR)) {
        throw std::invalid_argument("Anchor axes must be passed as pillar/sector arguments");
    }
    m_values[Axis::PILLAR] = pillar;
    m_values[Axis::SECTOR] = sector;
    validate();
}

Coordinate::Coordinate(const AxisValues& values)
    : m_values(values) {
    validate();
}

void Coordinate::validate() const {
    auto pillar_it = m_values.find(Axis::PILLAR);
    if (pillar_it == m_values.end()) {
        throw std::invalid_argument("Coordinate is missing the pillar axis");
    }
    const auto* pillar = std::get_if<std::string>(&pillar_it->second);
    if (!pillar || pillar->empty()) {
        throw std::invalid_argument("Pillar axis must be a non-empty string");
    }

    auto sector_it = m_values.find(Axis::SECTOR);
    if (sector_it == m_values.end()) {
        throw std::invalid_argument("Coordinate is missing the sector axis");
    }
    if (std::holds_alternative<std::vector<std::string>>(sector_it->second)) {
        throw std::invalid_argument("Sector axis must be a string or an integer code");
    }

    auto temporal_it = m_values.find(Axis::TEMPORAL);
    if (temporal_it != m_values.end()) {
        const auto* temporal = std::get_if<std::string>(&temporal_it->second);
        static const std::regex iso8601(
            R"(^\d{4}-\d{2}-\d{2}([T ]\d{2}:\d{2}(:\d{2}(\.\d+)?)?(Z|[+-]\d{2}:\d{2})?)?$)");
        if (!temporal || !std::regex_match(*temporal, iso8601)) {
            throw std::invalid_argument("Temporal axis must be valid ISO 8601 format");
        }
    }
}

bool Coordinate::has(Axis axis) const {
    return m_values.find(axis) != m_values.end();
}

const AxisValue* Coordinate::find(Axis axis) const {
    auto it = m_values.find(axis);
    return it == m_values.end() ? nullptr : &it->second;
}

std::optional<std::string> Coordinate::text(Axis axis) const {
    const AxisValue* value = find(axis);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return *text;
    }
    return std::nullopt;
}

const std::string& Coordinate::pillar() const {
    return std::get<std::string>(m_values.at(Axis::PILLAR));
}

const AxisValue& Coordinate::sector() const {
    return m_values.at(Axis::SECTOR);
}

std::string Coordinate::toKeyString() const {
    std::ostringstream key;
    bool first = true;
    for (Axis axis : allAxes()) {
        if (!first) key << "|";
        first = false;

        const AxisValue* value = find(axis);
        if (value) {
            key << axisValueToString(*value);
        }
    }
    return key.str();
}

size_t Coordinate::filledAxesCount() const {
    size_t count = 0;
    for (const auto& [axis, value] : m_values) {
        if (isPopulated(value)) {
            count++;
        }
    }
    return count;
}

double Coordinate::completenessRatio() const {
    return static_cast<double>(filledAxesCount()) / static_cast<double>(allAxes().size());
}

} // namespace Meridian
