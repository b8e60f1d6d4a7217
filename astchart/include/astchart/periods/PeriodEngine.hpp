/**
 * @file PeriodEngine.hpp
 * @brief Vimshottari planetary period tree
 * @author AstChart Team
 * @date 2026-02-18
 *
 * The 120-year cycle is split among nine rulers in fixed order. The ruler
 * of the Moon's birth nakshatra opens the cycle; the elapsed fraction of
 * that nakshatra fixes how much of the first period has already run. The
 * root spans one full cycle starting at the virtual start of the birth
 * period, so it always contains the whole life.
 *
 * Each node's children start with the node's own ruler and share its span
 * in proportion to the ruler years. The last child ends exactly where the
 * parent ends.
 */

#ifndef ASTCHART_PERIODS_PERIOD_ENGINE_HPP
#define ASTCHART_PERIODS_PERIOD_ENGINE_HPP

#include "astchart/chart/Subject.hpp"
#include "astchart/core/Types.hpp"
#include "astchart/ephemeris/EphemerisGateway.hpp"
#include <memory>
#include <vector>

namespace astchart::periods {

/**
 * @brief Node of the period tree
 *
 * Level 0 is the full cycle, 1 mahadasha, 2 antardasha, 3 pratyantardasha,
 * 4 sookshma, 5 prana.
 */
struct Period {
    int level = 0;
    Body ruler = Body::KETU;
    double start_jd = 0.0;                       ///< Inclusive [JD UT]
    double end_jd = 0.0;                         ///< Exclusive [JD UT]
    const Period* parent = nullptr;
    std::vector<std::unique_ptr<Period>> children;

    double spanDays() const { return end_jd - start_jd; }
    bool contains(double jd) const { return jd >= start_jd && jd < end_jd; }
};

struct PeriodTree {
    std::shared_ptr<const Period> root;
    double birth_jd = 0.0;
    double moon_longitude = 0.0;     ///< Sidereal [deg]
    int nakshatra = 0;               ///< 0 = Ashwini
    Body birth_ruler = Body::KETU;
    double balance_years = 0.0;      ///< Remaining years of the birth period
    int depth = 3;
};

struct PeriodSettings {
    int depth = 3;      ///< Levels below the root, 1..5
};

class PeriodEngine {
public:
    static constexpr int MAX_DEPTH = 5;
    static constexpr double CYCLE_YEARS = 120.0;

    PeriodEngine(std::shared_ptr<const ephemeris::EphemerisGateway> gateway,
                 PeriodSettings settings = {});

    /**
     * @brief Build the tree from the Moon's sidereal longitude at birth
     * @throws EphemerisUnavailable
     */
    PeriodTree buildTree(const Subject& subject) const;

    /**
     * @brief Build from a known sidereal Moon longitude
     * @throws UnsupportedParameter if depth is outside 1..5
     */
    static PeriodTree buildTree(double moon_sidereal_longitude, double birth_jd, int depth);

    /**
     * @brief Path root -> deepest node containing the instant
     * @throws OutOfRangeInstant outside the root span
     */
    static std::vector<const Period*> query(const PeriodTree& tree, double jd);

    /**
     * @brief Periods at a level whose span ends after jd, in order
     */
    static std::vector<const Period*> upcoming(const PeriodTree& tree, double jd,
                                               int level, int count);

    /// Fixed ruler order, starting with Ketu
    static const std::vector<Body>& rulerSequence();
    static double rulerYears(Body ruler);

    const PeriodSettings& settings() const { return settings_; }

private:
    std::shared_ptr<const ephemeris::EphemerisGateway> gateway_;
    PeriodSettings settings_;
};

} // namespace astchart::periods

#endif // ASTCHART_PERIODS_PERIOD_ENGINE_HPP
