/**
 * @file Chart.hpp
 * @brief Chart value object: positions, houses and angles at one instant
 * @author AstChart Team
 * @date 2026-02-14
 */

#ifndef ASTCHART_CHART_CHART_HPP
#define ASTCHART_CHART_CHART_HPP

#include "astchart/chart/HouseSystem.hpp"
#include "astchart/chart/Subject.hpp"
#include "astchart/core/Types.hpp"
#include <array>
#include <vector>

namespace astchart {

/**
 * @brief Positions + houses for a subject at an instant
 *
 * Equality is exact on every field. Two builds from identical inputs
 * compare equal.
 */
struct Chart {
    Subject subject;
    GeoLocation location;                 ///< Where houses were cast (usually the birth place)
    double jd_ut = 0.0;                   ///< As-of instant
    HouseSystemType house_system = HouseSystemType::PLACIDUS;
    ZodiacType zodiac = ZodiacType::TROPICAL;
    std::vector<BodyPosition> positions;  ///< Sun .. Ketu, canonical order
    std::array<double, 12> cusps{};
    double ascendant = 0.0;
    double midheaven = 0.0;

    /// @throws std::out_of_range if the body is not in the chart
    const BodyPosition& position(Body body) const;
    const BodyPosition* find(Body body) const;

    /// Positions followed by the ascendant and midheaven as points
    std::vector<BodyPosition> points() const;

    /// House number (1..12) of a longitude in this chart
    int houseOf(double longitude) const;

    int ascendantSign() const { return signOf(ascendant); }

    bool operator==(const Chart& o) const;
    bool operator!=(const Chart& o) const { return !(*this == o); }
};

} // namespace astchart

#endif // ASTCHART_CHART_CHART_HPP
