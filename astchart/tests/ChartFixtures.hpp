/**
 * @file ChartFixtures.hpp
 * @brief Hand-built charts for engine tests
 * @author AstChart Team
 * @date 2026-02-20
 */

#ifndef ASTCHART_TESTS_CHART_FIXTURES_HPP
#define ASTCHART_TESTS_CHART_FIXTURES_HPP

#include "astchart/chart/Chart.hpp"
#include "astchart/core/Angles.hpp"
#include <map>

namespace astchart::fixtures {

/**
 * @brief Whole-sign chart with explicit longitudes
 *
 * Bodies not listed sit at 30 * index + 15 degrees. Speeds are positive
 * except for the nodes.
 */
inline Chart makeChart(double ascendant, const std::map<Body, double>& longitudes,
                       ZodiacType zodiac = ZodiacType::SIDEREAL) {
    Chart chart;
    chart.jd_ut = 2451545.0;
    chart.house_system = HouseSystemType::WHOLE_SIGN;
    chart.zodiac = zodiac;
    chart.ascendant = normalizeDegrees(ascendant);
    chart.midheaven = normalizeDegrees(ascendant + 270.0);
    const int first = signOf(chart.ascendant);
    for (int i = 0; i < 12; ++i) {
        chart.cusps[i] = ((first + i) % 12) * 30.0;
    }
    for (Body b : ephemerisBodies()) {
        BodyPosition p;
        p.body = b;
        auto it = longitudes.find(b);
        p.longitude = it != longitudes.end() ? normalizeDegrees(it->second)
                                             : 30.0 * static_cast<int>(b) + 15.0;
        p.speed = (b == Body::RAHU || b == Body::KETU) ? -0.053 : 0.5;
        p.retrograde = p.speed < 0.0;
        p.house = chart.houseOf(p.longitude);
        chart.positions.push_back(p);
    }
    return chart;
}

inline BodyPosition point(Body body, double longitude, double speed = 0.5) {
    BodyPosition p;
    p.body = body;
    p.longitude = normalizeDegrees(longitude);
    p.speed = speed;
    p.retrograde = speed < 0.0;
    return p;
}

} // namespace astchart::fixtures

#endif // ASTCHART_TESTS_CHART_FIXTURES_HPP
