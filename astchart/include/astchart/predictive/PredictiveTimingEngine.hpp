/**
 * @file PredictiveTimingEngine.hpp
 * @brief Progressions, arc directions, planetary returns and transit scans
 * @author AstChart Team
 * @date 2026-02-19
 */

#ifndef ASTCHART_PREDICTIVE_PREDICTIVE_TIMING_ENGINE_HPP
#define ASTCHART_PREDICTIVE_PREDICTIVE_TIMING_ENGINE_HPP

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/chart/ChartBuilder.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace astchart::predictive {

enum class ProgressionTechnique {
    SECONDARY,     ///< Day-for-a-year
    SOLAR_ARC,     ///< Uniform arc = progressed Sun - natal Sun
    ONE_DEGREE,    ///< 1 deg per year
    NAIBOD         ///< Mean solar motion per year
};

std::string techniqueName(ProgressionTechnique t);

/// @throws UnsupportedParameter
ProgressionTechnique techniqueFromName(const std::string& name);

struct ProgressedChart {
    Chart chart;
    ProgressionTechnique technique = ProgressionTechnique::SECONDARY;
    double target_jd = 0.0;            ///< Date the progression is read for
    double age_years = 0.0;
    double arc = 0.0;                  ///< Arc applied to the angles [deg]
    std::vector<aspects::CrossAspect> aspects_to_natal;   ///< from = progressed, to = natal
};

enum class TimingEventKind {
    SIGN_INGRESS,
    ASPECT_EXACT,
    STATION_RETROGRADE,
    STATION_DIRECT
};

std::string eventKindName(TimingEventKind kind);

struct TimingEvent {
    TimingEventKind kind = TimingEventKind::SIGN_INGRESS;
    Body body = Body::SUN;                 ///< Transiting body
    std::optional<Body> natal_point;       ///< Aspect events only
    double aspect_angle = 0.0;
    double jd = 0.0;                       ///< [JD UT]
    double longitude = 0.0;                ///< Transiting longitude at the event
    int sign = 0;                          ///< Sign entered (ingress) or occupied
};

/**
 * @brief Bounds for the iterative searches
 */
struct SearchSettings {
    int max_iterations = 200;          ///< Bisection bound
    double tolerance_days = 1e-4;      ///< Bisection stops below this interval
    double max_residual_deg = 0.01;    ///< Accept a root only this close
    double max_scan_days = 3660.0;     ///< Longest transit window
    double progression_orb = 1.0;      ///< Orb for progressed-to-natal aspects [deg]
};

struct TransitSettings {
    std::vector<Body> bodies = {
        Body::SUN, Body::MERCURY, Body::VENUS, Body::MARS, Body::JUPITER,
        Body::SATURN, Body::URANUS, Body::NEPTUNE, Body::PLUTO
    };
    std::vector<double> aspect_angles = {0.0, 60.0, 90.0, 120.0, 180.0};
    bool ingresses = true;
    bool aspects = true;
    bool stations = true;
};

class PredictiveTimingEngine {
public:
    PredictiveTimingEngine(std::shared_ptr<const ChartBuilder> builder,
                           SearchSettings settings = {});

    /**
     * @brief Symbolic chart for a target date
     *
     * SECONDARY reads the ephemeris at birth + age-in-years days. The arc
     * techniques add one uniform arc to every natal point. In all cases the
     * angles and cusps move by the technique's arc.
     */
    ProgressedChart progress(const Chart& natal, double target_jd,
                             ProgressionTechnique technique) const;

    /**
     * @brief Chart for the first return of a body to its natal longitude
     *        at or after 1 January of the target year
     * @throws NoConvergence when the bounded search fails
     */
    Chart returnChart(const Chart& natal, Body body, int target_year) const;

    /// Same search from an explicit seed date, cast at a chosen location
    Chart returnChartFrom(const Chart& natal, Body body, double seed_jd,
                          const GeoLocation& location) const;

    /**
     * @brief Instant a body reaches a longitude at or after seed_jd
     * @throws NoConvergence
     */
    double findLongitude(Body body, double longitude, double seed_jd, ZodiacType zodiac) const;

    /**
     * @brief Ingresses, exact aspects to natal points and stations in a window
     *
     * Coarse batched sampling, then bisection to tolerance_days. Events are
     * sorted by instant.
     */
    std::vector<TimingEvent> transitScan(const Chart& natal, double window_start,
                                         double window_end,
                                         const TransitSettings& transit = {}) const;

    const SearchSettings& settings() const { return settings_; }

private:
    std::shared_ptr<const ChartBuilder> builder_;
    SearchSettings settings_;
};

} // namespace astchart::predictive

#endif // ASTCHART_PREDICTIVE_PREDICTIVE_TIMING_ENGINE_HPP
