// =================================================================
// src/Meridian/ComplexityAnalyzer.cpp
// =================================================================
// Implementation of coordinate complexity scoring.

#include "Meridian/ComplexityAnalyzer.hpp"
#include <algorithm>
#include <array>
#include <unordered_map>
#include <unordered_set>

namespace Meridian {

std::map<std::string, double> ComplexityAssessment::factors() const {
    return {
        {"pillar_complexity", pillar_complexity},
        {"sector_depth", sector_depth},
        {"regulatory_requirements", regulatory_requirements},
        {"persona_requirements", persona_requirements},
        {"cross_axis_dependencies", cross_axis_dependencies}
    };
}

ComplexityAssessment ComplexityAnalyzer::analyze(const Coordinate& coordinate) const {
    ComplexityAssessment assessment;
    assessment.pillar_complexity = assessPillarComplexity(coordinate.pillar());
    assessment.sector_depth = assessSectorDepth(coordinate.sector());
    assessment.regulatory_requirements = assessRegulatoryNeeds(coordinate);
    assessment.persona_requirements = assessPersonaNeeds(coordinate);
    assessment.cross_axis_dependencies = assessCrossDependencies(coordinate);

    // Fixed summation order keeps the score reproducible
    double sum = assessment.pillar_complexity;
    sum += assessment.sector_depth;
    sum += assessment.regulatory_requirements;
    sum += assessment.persona_requirements;
    sum += assessment.cross_axis_dependencies;
    assessment.score = sum / 5.0;

    return assessment;
}

double ComplexityAnalyzer::assessPillarComplexity(const std::string& pillar) {
    static const std::unordered_map<std::string, double> complexity_map = {
        {"foundational", 0.3},
        {"organizational", 0.5},
        {"technological", 0.7},
        {"adaptive", 0.9}
    };

    auto it = complexity_map.find(pillar);
    return it != complexity_map.end() ? it->second : 0.5;
}

double ComplexityAnalyzer::assessSectorDepth(const AxisValue& sector) {
    static const std::unordered_set<std::string> specialized_sectors = {
        "healthcare", "finance", "aerospace", "nuclear"
    };

    const auto* name = std::get_if<std::string>(&sector);
    if (name && specialized_sectors.count(*name)) {
        return 0.8;
    }
    return 0.4;
}

double ComplexityAnalyzer::assessRegulatoryNeeds(const Coordinate& coordinate) {
    static const std::array<Axis, 3> regulatory_axes = {
        Axis::COMPLIANCE_LEVEL, Axis::REGULATORY_FRAMEWORK, Axis::AUDIT_REQUIREMENTS
    };

    int present = 0;
    for (Axis axis : regulatory_axes) {
        const AxisValue* value = coordinate.find(axis);
        if (!value || !isPopulated(*value)) {
            continue;
        }
        const auto* text = std::get_if<std::string>(value);
        if (text && *text == "none") {
            continue;
        }
        present++;
    }

    return static_cast<double>(present) / 3.0;
}

double ComplexityAnalyzer::assessPersonaNeeds(const Coordinate& coordinate) {
    static const std::unordered_set<std::string> complex_roles = {
        "executive", "regulatory", "technical_lead"
    };

    auto role = coordinate.text(Axis::ROLE_DEFINITION);
    return (role && complex_roles.count(*role)) ? 0.8 : 0.4;
}

double ComplexityAnalyzer::assessCrossDependencies(const Coordinate& coordinate) {
    static const std::array<Axis, 7> linked_axes = {
        Axis::PILLAR, Axis::SECTOR, Axis::LOCATION, Axis::ROLE_DEFINITION,
        Axis::USER_AUTHORITY, Axis::COMPLIANCE_LEVEL, Axis::REGULATORY_FRAMEWORK
    };

    int non_default_count = 0;
    for (Axis axis : linked_axes) {
        const AxisValue* value = coordinate.find(axis);
        if (value && isMeaningful(*value)) {
            non_default_count++;
        }
    }

    return std::min(static_cast<double>(non_default_count) / 7.0, 1.0);
}

} // namespace Meridian
