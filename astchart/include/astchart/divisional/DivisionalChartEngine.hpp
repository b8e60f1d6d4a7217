/**
 * @file DivisionalChartEngine.hpp
 * @brief Parashari divisional charts (vargas) D1 .. D60
 * @author AstChart Team
 * @date 2026-02-15
 *
 * Each sign is split into N equal parts (D30 uses the classical unequal
 * five-part trimsamsa). The sign a part maps to follows the Brihat
 * Parashara Hora Shastra starting-point rules: parity based for D2, D7,
 * D10, D24, D40; modality based for D9, D16, D20, D45; element based for
 * D27; continuous for D3, D4, D12, D60.
 */

#ifndef ASTCHART_DIVISIONAL_DIVISIONAL_CHART_ENGINE_HPP
#define ASTCHART_DIVISIONAL_DIVISIONAL_CHART_ENGINE_HPP

#include "astchart/chart/Chart.hpp"
#include <string>
#include <vector>

namespace astchart::divisional {

struct DivisionalChart {
    int factor = 1;
    Chart chart;

    bool operator==(const DivisionalChart& o) const {
        return factor == o.factor && chart == o.chart;
    }
};

class DivisionalChartEngine {
public:
    /// Catalog of supported factors; every entry must have a rule
    explicit DivisionalChartEngine(std::vector<int> catalog = defaultCatalog());

    static const std::vector<int>& defaultCatalog();

    /// True if a starting-point rule exists for the factor
    static bool hasRule(int factor);

    /// Classical name ("Rasi", "Navamsa", ...)
    static std::string divisionName(int factor);

    /**
     * @brief Sign (0..11) a longitude falls in under a division
     * @throws UnsupportedParameter if no rule exists
     */
    static int vargaSign(double longitude, int factor);

    /**
     * @brief Longitude in the divisional chart: varga sign plus the
     *        proportional position inside the part
     */
    static double vargaLongitude(double longitude, int factor);

    bool supports(int factor) const;
    const std::vector<int>& catalog() const { return catalog_; }

    /**
     * @brief Transform a chart
     *
     * Factor 1 returns the base chart unchanged. Otherwise every body and
     * both angles are mapped, and houses become whole-sign from the
     * divisional ascendant.
     * @throws UnsupportedParameter outside the catalog
     */
    DivisionalChart derive(const Chart& chart, int factor) const;

private:
    std::vector<int> catalog_;
};

} // namespace astchart::divisional

#endif // ASTCHART_DIVISIONAL_DIVISIONAL_CHART_ENGINE_HPP
