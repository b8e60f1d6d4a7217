/**
 * @file StrengthEngine.hpp
 * @brief Six-factor planetary strength (Shadbala style)
 * @author AstChart Team
 * @date 2026-02-17
 *
 * Components, each normalized to [0, 1]:
 *  - positional   dignity table and distance from debilitation
 *  - directional  house distance from the body's strongest house
 *  - temporal     day/night, weekday lord, lunar fortnight
 *  - motional     speed against mean daily motion
 *  - natural      fixed Naisargika constants
 *  - aspectual    net benefic over malefic sign aspects (graha drishti)
 * The total is the plain sum (0..6).
 */

#ifndef ASTCHART_STRENGTH_STRENGTH_ENGINE_HPP
#define ASTCHART_STRENGTH_STRENGTH_ENGINE_HPP

#include "astchart/chart/Chart.hpp"
#include <map>
#include <string>

namespace astchart::strength {

enum class Dignity {
    EXALTED,
    MOOLATRIKONA,
    OWN_SIGN,
    FRIEND,
    NEUTRAL,
    ENEMY,
    DEBILITATED
};

std::string dignityName(Dignity d);

struct StrengthScore {
    Body body = Body::SUN;
    double positional = 0.0;
    double directional = 0.0;
    double temporal = 0.0;
    double motional = 0.0;
    double natural = 0.0;
    double aspectual = 0.0;
    double total = 0.0;
    Dignity dignity = Dignity::NEUTRAL;
    int rank = 0;             ///< 1 = strongest
};

class StrengthEngine {
public:
    StrengthEngine() = default;

    /**
     * @brief Score the seven classical planets
     * @throws std::out_of_range if the chart lacks one of them
     */
    std::map<Body, StrengthScore> score(const Chart& chart) const;

    /// Sign dignity of a classical planet at a longitude
    static Dignity dignity(Body body, double longitude);

    /// Lord of a sign (0 = Aries)
    static Body signLord(int sign);

    /// Exaltation point [deg]; debilitation is opposite
    static double exaltationPoint(Body body);

    /// Mean daily motion [deg/day]
    static double meanDailyMotion(Body body);

    /// Naisargika bala / 60
    static double naturalStrength(Body body);

    /// House (1..12) where directional strength peaks
    static int strongestHouse(Body body);

    /// True if `from` casts a Vedic sign aspect on a planet `houses_away` signs ahead (1-based)
    static bool castsAspect(Body from, int houses_away);
};

} // namespace astchart::strength

#endif // ASTCHART_STRENGTH_STRENGTH_ENGINE_HPP
