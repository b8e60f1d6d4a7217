/**
 * @file Panchang.hpp
 * @brief The five limbs of the Hindu almanac for an instant
 * @author AstChart Team
 * @date 2026-02-21
 */

#ifndef ASTCHART_VEDIC_PANCHANG_HPP
#define ASTCHART_VEDIC_PANCHANG_HPP

#include "astchart/ephemeris/EphemerisGateway.hpp"
#include <memory>
#include <string>

namespace astchart::vedic {

struct Panchang {
    double jd_ut = 0.0;
    double sun_longitude = 0.0;     ///< Sidereal [deg]
    double moon_longitude = 0.0;    ///< Sidereal [deg]

    int tithi = 1;                  ///< 1..30, elongation / 12 deg
    std::string tithi_name;
    std::string paksha;             ///< "shukla" (waxing) or "krishna" (waning)

    int nakshatra = 0;              ///< 0..26
    std::string nakshatra_name;
    int pada = 1;

    int yoga = 1;                   ///< 1..27, (Sun + Moon) / 13 deg 20'
    std::string yoga_name;

    int karana = 1;                 ///< 1..60, half-tithi
    std::string karana_name;

    int vara = 0;                   ///< 0 = Sunday
    std::string vara_name;
};

class PanchangCalculator {
public:
    explicit PanchangCalculator(std::shared_ptr<const ephemeris::EphemerisGateway> gateway);

    /**
     * @brief Panchang at an instant
     * @param jd_ut Instant [JD UT]
     * @param timezone_offset Hours east of UTC; fixes the civil weekday
     */
    Panchang at(double jd_ut, double timezone_offset) const;

    /// Pure computation from sidereal longitudes and weekday
    static Panchang fromLongitudes(double sun_sidereal, double moon_sidereal, int weekday);

private:
    std::shared_ptr<const ephemeris::EphemerisGateway> gateway_;
};

} // namespace astchart::vedic

#endif // ASTCHART_VEDIC_PANCHANG_HPP
