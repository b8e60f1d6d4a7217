/**
 * @file Constants.hpp
 * @brief Astronomical and calendrical constants
 * @author AstChart Team
 * @date 2026-02-11
 */

#ifndef ASTCHART_CORE_CONSTANTS_HPP
#define ASTCHART_CORE_CONSTANTS_HPP

namespace astchart::constants {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double ARCSEC_TO_DEG = 1.0 / 3600.0;

constexpr double JD_J2000 = 2451545.0;           ///< J2000.0 epoch [JD TT]
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;
constexpr double DAYS_PER_JULIAN_YEAR = 365.25;   ///< Year used for ages and period spans
constexpr double SECONDS_PER_DAY = 86400.0;

constexpr double AU_KM = 149597870.7;
constexpr double LIGHT_TIME_DAYS_PER_AU = 0.0057755183;
constexpr double ABERRATION_CONSTANT_ARCSEC = 20.49552;

// Zodiac subdivisions
constexpr double SIGN_SPAN = 30.0;
constexpr double NAKSHATRA_SPAN = 360.0 / 27.0;
constexpr double PADA_SPAN = NAKSHATRA_SPAN / 4.0;

} // namespace astchart::constants

#endif // ASTCHART_CORE_CONSTANTS_HPP
