/**
 * @file Angles.hpp
 * @brief Angle normalization and circular arithmetic on the ecliptic
 * @author AstChart Team
 * @date 2026-02-11
 */

#ifndef ASTCHART_CORE_ANGLES_HPP
#define ASTCHART_CORE_ANGLES_HPP

#include "astchart/core/Constants.hpp"
#include <cmath>

namespace astchart {

/**
 * @brief Reduce an angle to [0, 360)
 */
inline double normalizeDegrees(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) r += 360.0;
    // fmod of a tiny negative value can round up to exactly 360
    if (r >= 360.0) r = 0.0;
    return r;
}

/**
 * @brief Signed shortest difference to - from, in (-180, 180]
 */
inline double signedDelta(double to, double from) {
    double d = normalizeDegrees(to - from);
    return d > 180.0 ? d - 360.0 : d;
}

/**
 * @brief Minimal angular separation in [0, 180]
 */
inline double angularSeparation(double a, double b) {
    // Ordered operands keep the result bitwise symmetric in (a, b)
    const double x = normalizeDegrees(a);
    const double y = normalizeDegrees(b);
    const double d = x > y ? x - y : y - x;
    return d > 180.0 ? 360.0 - d : d;
}

/**
 * @brief True when lon lies in the half-open arc [start, end) going forward
 */
inline bool inForwardArc(double lon, double start, double end) {
    double span = normalizeDegrees(end - start);
    double off = normalizeDegrees(lon - start);
    return off < span;
}

inline double sinDeg(double deg) { return std::sin(deg * constants::DEG_TO_RAD); }
inline double cosDeg(double deg) { return std::cos(deg * constants::DEG_TO_RAD); }
inline double tanDeg(double deg) { return std::tan(deg * constants::DEG_TO_RAD); }

/**
 * @brief atan2 in degrees, normalized to [0, 360)
 */
inline double atan2Deg(double y, double x) {
    return normalizeDegrees(std::atan2(y, x) * constants::RAD_TO_DEG);
}

} // namespace astchart

#endif // ASTCHART_CORE_ANGLES_HPP
