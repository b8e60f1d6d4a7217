/**
 * @file HouseSystem.hpp
 * @brief House cusp algorithms: Placidus, whole-sign, equal
 * @author AstChart Team
 * @date 2026-02-14
 *
 * Placidus cusps 11, 12, 2 and 3 trisect the diurnal and nocturnal
 * semi-arcs; each is found by fixed-point iteration on right ascension.
 * The remaining cusps are the opposites. Near the polar circles the
 * semi-arcs degenerate, so Placidus is refused beyond a latitude limit.
 */

#ifndef ASTCHART_CHART_HOUSE_SYSTEM_HPP
#define ASTCHART_CHART_HOUSE_SYSTEM_HPP

#include <array>
#include <string>

namespace astchart {

enum class HouseSystemType {
    PLACIDUS,
    WHOLE_SIGN,
    EQUAL
};

std::string houseSystemName(HouseSystemType type);

/// @throws UnsupportedParameter
HouseSystemType houseSystemFromName(const std::string& name);

struct HouseSettings {
    double placidus_max_latitude = 66.5;   ///< |lat| limit for Placidus [deg]
    int max_iterations = 100;              ///< Placidus fixed-point bound
    double tolerance_deg = 1e-9;           ///< Placidus convergence [deg]
};

struct HouseCusps {
    std::array<double, 12> cusps{};   ///< cusps[0] = house 1
    double ascendant = 0.0;
    double midheaven = 0.0;
};

/// Ecliptic longitude of the midheaven for a sidereal angle [deg]
double midheavenFromRamc(double ramc, double obliquity);

/// Ecliptic longitude of the ascendant [deg]
double ascendantFromRamc(double ramc, double obliquity, double latitude);

/**
 * @brief Compute the angles and 12 cusps
 * @param type House system
 * @param jd_ut Instant [JD UT]
 * @param latitude Geographic latitude [deg]
 * @param longitude Geographic longitude, east positive [deg]
 * @param zodiac_offset Subtracted from all tropical results (ayanamsa)
 * @throws InvalidLatitude for Placidus beyond the latitude limit
 * @throws NoConvergence if a Placidus cusp does not settle
 */
HouseCusps computeHouses(HouseSystemType type, double jd_ut, double latitude, double longitude,
                         double zodiac_offset, const HouseSettings& settings = {});

/**
 * @brief House number (1..12) containing a longitude, by cusp containment
 */
int houseContaining(const std::array<double, 12>& cusps, double longitude);

} // namespace astchart

#endif // ASTCHART_CHART_HOUSE_SYSTEM_HPP
