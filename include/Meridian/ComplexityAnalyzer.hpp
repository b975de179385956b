// =================================================================
// include/Meridian/ComplexityAnalyzer.hpp
// =================================================================
// Five-factor complexity estimate used to size a session's workflow.

#pragma once

#include "Meridian/Coordinate.hpp"
#include <map>
#include <string>

namespace Meridian {

/**
 * @brief Per-factor scores and their unweighted mean
 */
struct ComplexityAssessment {
    double pillar_complexity = 0.0;        ///< Pillar category lookup
    double sector_depth = 0.0;             ///< Specialized sector or not
    double regulatory_requirements = 0.0;  ///< Share of populated regulatory axes
    double persona_requirements = 0.0;     ///< Complex role or not
    double cross_axis_dependencies = 0.0;  ///< Share of meaningful linked axes
    double score = 0.0;                    ///< Mean of the five factors

    /**
     * @brief Factor name -> value, keyed as in reports and JSON output
     */
    std::map<std::string, double> factors() const;
};

/**
 * @brief Pure, deterministic complexity scoring of a coordinate
 *
 * Every factor is normalized to [0, 1]. The analyzer holds no state and
 * performs no I/O, so identical coordinates always produce bit-identical
 * scores.
 */
class ComplexityAnalyzer {
public:
    ComplexityAnalyzer() = default;

    ComplexityAssessment analyze(const Coordinate& coordinate) const;

    /**
     * @brief foundational 0.3, organizational 0.5, technological 0.7,
     *        adaptive 0.9, anything else 0.5
     */
    static double assessPillarComplexity(const std::string& pillar);

    /**
     * @brief 0.8 for healthcare, finance, aerospace and nuclear, else 0.4
     */
    static double assessSectorDepth(const AxisValue& sector);

    static double assessRegulatoryNeeds(const Coordinate& coordinate);
    static double assessPersonaNeeds(const Coordinate& coordinate);
    static double assessCrossDependencies(const Coordinate& coordinate);
};

} // namespace Meridian
