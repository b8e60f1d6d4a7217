/**
 * @file Types.hpp
 * @brief Core value types: chart points and their positions
 * @author AstChart Team
 * @date 2026-02-11
 */

#ifndef ASTCHART_CORE_TYPES_HPP
#define ASTCHART_CORE_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace astchart {

/**
 * @brief Chart points. Order is the canonical ordering used for pair keys.
 */
enum class Body {
    SUN = 0,
    MOON,
    MERCURY,
    VENUS,
    MARS,
    JUPITER,
    SATURN,
    URANUS,
    NEPTUNE,
    PLUTO,
    RAHU,       ///< Mean ascending lunar node
    KETU,       ///< Mean descending lunar node
    ASCENDANT,
    MIDHEAVEN
};

constexpr int BODY_COUNT = 14;

enum class ZodiacType {
    TROPICAL,
    SIDEREAL   ///< Lahiri ayanamsa
};

std::string bodyName(Body body);
std::optional<Body> bodyFromName(const std::string& name);

/// Bodies the ephemeris provides (Sun .. Ketu)
const std::vector<Body>& ephemerisBodies();

/// The seven classical planets, Sun .. Saturn
const std::vector<Body>& classicalPlanets();

bool isAngle(Body body);

std::string signName(int sign);
std::string nakshatraName(int index);
std::string zodiacName(ZodiacType z);
ZodiacType zodiacFromName(const std::string& name);

/**
 * @brief Position of a chart point at one instant
 *
 * Angles are geocentric apparent ecliptic of date, in degrees.
 */
struct BodyPosition {
    Body body = Body::SUN;
    double longitude = 0.0;     ///< [0, 360)
    double latitude = 0.0;
    double distance = 0.0;      ///< [AU], 0 for angles and nodes
    double speed = 0.0;         ///< Daily motion in longitude [deg/day]
    bool retrograde = false;
    int house = 0;              ///< 1..12, 0 when not assigned

    int sign() const;               ///< 0 = Aries .. 11 = Pisces
    double degreeInSign() const;    ///< [0, 30)
    int nakshatra() const;          ///< 0 = Ashwini .. 26 = Revati
    int pada() const;               ///< 1..4

    bool operator==(const BodyPosition& other) const;
    bool operator!=(const BodyPosition& other) const { return !(*this == other); }
};

/// Sign index for an ecliptic longitude
int signOf(double longitude);

} // namespace astchart

#endif // ASTCHART_CORE_TYPES_HPP
