/**
 * @file Ashtakavarga.hpp
 * @brief Parashari bindu tables and Sarva Ashtakavarga
 * @author AstChart Team
 * @date 2026-02-21
 *
 * Each of the seven planets receives a bindu in a sign when that sign lies
 * in one of the fixed house offsets from eight references (the seven
 * planets and the lagna). The per-planet totals do not depend on the chart
 * (Sun 48, Moon 49, Mercury 54, Venus 52, Mars 39, Jupiter 56, Saturn 39)
 * and the Sarva table always sums to 337.
 */

#ifndef ASTCHART_VEDIC_ASHTAKAVARGA_HPP
#define ASTCHART_VEDIC_ASHTAKAVARGA_HPP

#include "astchart/chart/Chart.hpp"
#include <array>
#include <vector>

namespace astchart::vedic {

/// Bindus of one planet, indexed by sign (0 = Aries)
struct BhinnaAshtakavarga {
    Body body = Body::SUN;
    std::array<int, 12> bindus{};
    int total = 0;
};

struct AshtakavargaResult {
    std::vector<BhinnaAshtakavarga> planets;   ///< Sun .. Saturn
    std::array<int, 12> sarva{};               ///< By sign
    int sarva_total = 0;
    std::array<int, 12> by_house{};            ///< Sarva bindus, index 0 = lagna sign
    std::vector<int> strong_houses;            ///< 1..12, at least STRONG_SIGN bindus
    std::vector<int> weak_houses;              ///< 1..12, below WEAK_SIGN bindus
};

class AshtakavargaCalculator {
public:
    static constexpr int STRONG_SIGN = 28;
    static constexpr int WEAK_SIGN = 25;

    /// Full tables for a sidereal chart
    static AshtakavargaResult calculate(const Chart& chart);

    /**
     * @brief Bindu table of one classical planet
     * @throws UnsupportedParameter for bodies other than Sun .. Saturn
     */
    static BhinnaAshtakavarga forPlanet(const Chart& chart, Body body);

    /// Bindus `body` holds in the sign of `longitude`, e.g. for a transit
    static int bindusAt(const AshtakavargaResult& result, Body body, double longitude);
};

} // namespace astchart::vedic

#endif // ASTCHART_VEDIC_ASHTAKAVARGA_HPP
