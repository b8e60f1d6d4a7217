/**
 * @file ChartBuilder.hpp
 * @brief Composes a Chart from a subject and an instant
 * @author AstChart Team
 * @date 2026-02-14
 */

#ifndef ASTCHART_CHART_CHART_BUILDER_HPP
#define ASTCHART_CHART_CHART_BUILDER_HPP

#include "astchart/chart/Chart.hpp"
#include "astchart/ephemeris/EphemerisGateway.hpp"
#include <memory>

namespace astchart {

/**
 * @brief Chart construction settings
 */
struct ChartSettings {
    HouseSystemType house_system = HouseSystemType::PLACIDUS;  ///< Default system
    ZodiacType zodiac = ZodiacType::TROPICAL;                  ///< Default zodiac
    HouseSettings houses;
};

/**
 * @brief Builds charts with one batched ephemeris query per chart
 */
class ChartBuilder {
public:
    ChartBuilder(std::shared_ptr<const ephemeris::EphemerisGateway> gateway,
                 ChartSettings settings = {});

    /**
     * @brief Chart for a subject at an instant, houses at the birth place
     * @param subject Resolved subject
     * @param as_of_jd_ut Instant [JD UT]
     * @param house_system House algorithm
     * @throws InvalidLatitude, NoConvergence, EphemerisUnavailable
     */
    Chart build(const Subject& subject, double as_of_jd_ut, HouseSystemType house_system) const;

    Chart build(const Subject& subject, double as_of_jd_ut) const {
        return build(subject, as_of_jd_ut, settings_.house_system);
    }

    /// Natal chart: the subject at its own birth instant
    Chart buildNatal(const Subject& subject) const {
        return build(subject, subject.julianDay());
    }

    /**
     * @brief Chart cast at an explicit location and zodiac
     *
     * Used for relocated returns and midpoint-instant charts.
     */
    Chart buildAt(const Subject& subject, double jd_ut, const GeoLocation& location,
                  HouseSystemType house_system, ZodiacType zodiac) const;

    const ChartSettings& settings() const { return settings_; }
    const ephemeris::EphemerisGateway& gateway() const { return *gateway_; }

private:
    std::shared_ptr<const ephemeris::EphemerisGateway> gateway_;
    ChartSettings settings_;
};

} // namespace astchart

#endif // ASTCHART_CHART_CHART_BUILDER_HPP
