/**
 * @file CompatibilityEngine.hpp
 * @brief Synastry, composite and midpoint-instant charts, compatibility score
 * @author AstChart Team
 * @date 2026-02-20
 */

#ifndef ASTCHART_COMPATIBILITY_COMPATIBILITY_ENGINE_HPP
#define ASTCHART_COMPATIBILITY_COMPATIBILITY_ENGINE_HPP

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/chart/ChartBuilder.hpp"
#include <memory>
#include <optional>

namespace astchart::compatibility {

/**
 * @brief Sub-factor weights, summing to 100
 */
struct CompatibilitySettings {
    double luminary_weight = 40.0;     ///< Sun-Sun, Moon-Moon
    double affection_weight = 35.0;    ///< Venus-Venus, Mars-Mars
    double structural_weight = 25.0;   ///< Jupiter-Jupiter, Saturn-Saturn, Asc-Asc
};

struct CompatibilityReport {
    std::vector<aspects::CrossAspect> matrix;   ///< from = first chart, to = second chart
    Chart composite;
    Chart midpoint_chart;
    double luminary = 0.0;       ///< [0, 100]
    double affection = 0.0;      ///< [0, 100]
    double structural = 0.0;     ///< [0, 100]
    double overall = 0.0;        ///< [0, 100]
};

class CompatibilityEngine {
public:
    CompatibilityEngine(std::shared_ptr<const ChartBuilder> builder,
                        aspects::AspectEngine aspects = aspects::AspectEngine(),
                        CompatibilitySettings settings = {});

    /**
     * @brief Compare two charts
     *
     * Symmetric: swapping the charts transposes the matrix and leaves the
     * composite, midpoint chart and scores unchanged.
     * @param location Where to cast the midpoint-instant chart; defaults to
     *        the geographic midpoint of the two locations
     * @throws UnsupportedParameter if the charts use different zodiacs or
     *         house systems
     */
    CompatibilityReport compare(const Chart& a, const Chart& b,
                                std::optional<GeoLocation> location = std::nullopt) const;

    /**
     * @brief Composite chart: shorter-arc midpoint of every point
     *
     * Cusps share one branch: the first-cusp midpoint plus the mean
     * forward offset of each cusp, so they stay in zodiacal order.
     */
    static Chart composite(const Chart& a, const Chart& b);

    /// Chart for the temporal midpoint at a location
    Chart midpointInstantChart(const Chart& a, const Chart& b, const GeoLocation& location) const;

    /**
     * @brief Shorter-arc midpoint; exactly opposite pairs resolve to lower + 90
     */
    static double midpoint(double lon_a, double lon_b);

    /// Great-circle midpoint of two places
    static GeoLocation geographicMidpoint(const GeoLocation& a, const GeoLocation& b);

    /**
     * @brief Harmony of a same-body pair in [0, 1]; 1 only at exact conjunction
     */
    static double pairHarmony(double lon_a, double lon_b);

private:
    std::shared_ptr<const ChartBuilder> builder_;
    aspects::AspectEngine aspects_;
    CompatibilitySettings settings_;
};

} // namespace astchart::compatibility

#endif // ASTCHART_COMPATIBILITY_COMPATIBILITY_ENGINE_HPP
