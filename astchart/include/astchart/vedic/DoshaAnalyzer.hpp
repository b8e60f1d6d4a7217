/**
 * @file DoshaAnalyzer.hpp
 * @brief Manglik, Kaal Sarp and Sade Sati checks on a sidereal chart
 * @author AstChart Team
 * @date 2026-02-21
 */

#ifndef ASTCHART_VEDIC_DOSHA_ANALYZER_HPP
#define ASTCHART_VEDIC_DOSHA_ANALYZER_HPP

#include "astchart/chart/Chart.hpp"
#include <string>

namespace astchart::vedic {

struct ManglikResult {
    bool present = false;
    bool from_lagna = false;
    bool from_moon = false;
    int house_from_lagna = 0;    ///< Sign-counted house of Mars, 1..12
    int house_from_moon = 0;
};

struct KaalSarpResult {
    bool present = false;
    std::string direction;       ///< "rahu-to-ketu", "ketu-to-rahu" or empty
    std::string name;            ///< Classical name by Rahu's house, empty when absent
    int rahu_house = 0;
};

struct SadeSatiResult {
    bool active = false;
    std::string phase;           ///< "rising", "peak", "setting" or "none"
    bool small_panoti = false;   ///< Saturn 4th or 8th from the Moon sign
    int moon_sign = 0;
    int saturn_sign = 0;
};

class DoshaAnalyzer {
public:
    /// Houses counted whole-sign from the ascendant and from the Moon
    static ManglikResult manglik(const Chart& chart);

    static KaalSarpResult kaalSarp(const Chart& chart);

    /**
     * @brief Sade Sati status
     * @param natal Natal chart (sidereal)
     * @param saturn_longitude Transiting Saturn, sidereal [deg]
     */
    static SadeSatiResult sadeSati(const Chart& natal, double saturn_longitude);

    /// Sign distance from `from` to `to`, 1..12
    static int signHouse(int from_sign, int to_sign);
};

} // namespace astchart::vedic

#endif // ASTCHART_VEDIC_DOSHA_ANALYZER_HPP
