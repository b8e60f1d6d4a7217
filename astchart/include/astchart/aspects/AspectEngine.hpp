/**
 * @file AspectEngine.hpp
 * @brief Angular relationships between chart points and pattern detection
 * @author AstChart Team
 * @date 2026-02-16
 */

#ifndef ASTCHART_ASPECTS_ASPECT_ENGINE_HPP
#define ASTCHART_ASPECTS_ASPECT_ENGINE_HPP

#include "astchart/core/Types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace astchart::aspects {

struct AspectDefinition {
    double angle = 0.0;       ///< [deg]
    std::string name;
    double orb = 0.0;         ///< Base orb [deg]
    bool major = true;
};

/**
 * @brief Aspect catalog and orb rules
 *
 * allowed orb = base orb of the aspect x the smaller of the two body
 * factors. Factors are in (0, 1], so no allowed orb exceeds the base.
 */
struct OrbTable {
    std::vector<AspectDefinition> aspects;   ///< Enabled aspects, sorted by angle
    std::map<Body, double> body_factors;

    static OrbTable defaults();

    /// Ptolemaic aspects (0/60/90/120/180) with one orb for every body
    static OrbTable uniform(double orb);

    /// Minor aspects that can be switched on by angle (36, 40, 72, 144)
    static std::vector<AspectDefinition> minorCatalog();

    double factor(Body body) const;
    double allowedOrb(const AspectDefinition& def, Body a, Body b) const;
    double maxOrb() const;
};

struct Aspect {
    Body first = Body::SUN;       ///< Lower canonical id
    Body second = Body::SUN;
    double separation = 0.0;      ///< Minimal angular separation [0, 180]
    double angle = 0.0;           ///< Aspect angle matched
    std::string type;
    double orb = 0.0;             ///< |separation - angle|
    double allowed_orb = 0.0;
    double exactness = 0.0;       ///< 1 - orb / allowed_orb, in [0, 1]
    bool applying = false;

    bool operator==(const Aspect& o) const {
        return first == o.first && second == o.second && separation == o.separation
            && angle == o.angle && type == o.type && orb == o.orb
            && allowed_orb == o.allowed_orb && exactness == o.exactness
            && applying == o.applying;
    }
};

/**
 * @brief Aspect between a point of one set and a point of another
 *
 * Used for synastry and for progressed-to-natal contacts, where the same
 * body can appear on both sides.
 */
struct CrossAspect {
    Body from = Body::SUN;      ///< Point of the first set
    Body to = Body::SUN;        ///< Point of the second set
    Aspect aspect;

    bool operator==(const CrossAspect& o) const {
        return from == o.from && to == o.to && aspect == o.aspect;
    }
};

enum class PatternKind {
    GRAND_TRINE,
    T_SQUARE,
    GRAND_CROSS,
    STELLIUM
};

std::string patternName(PatternKind kind);

struct AspectPattern {
    PatternKind kind = PatternKind::STELLIUM;
    std::vector<Body> bodies;    ///< For a T-square the apex is last
};

struct PatternSettings {
    int stellium_min_bodies = 3;
    double stellium_max_arc = 10.0;   ///< [deg]
};

class AspectEngine {
public:
    explicit AspectEngine(OrbTable table = OrbTable::defaults(), PatternSettings patterns = {});

    /**
     * @brief All aspects among unordered pairs of points
     *
     * Each pair yields at most one aspect: the closest match within orb.
     * Result is sorted by (first, second).
     */
    std::vector<Aspect> findAspects(const std::vector<BodyPosition>& points) const {
        return findAspects(points, table_);
    }
    std::vector<Aspect> findAspects(const std::vector<BodyPosition>& points,
                                    const OrbTable& table) const;

    /**
     * @brief Aspect between two points, if any; symmetric in its arguments
     */
    std::optional<Aspect> aspectBetween(const BodyPosition& a, const BodyPosition& b) const {
        return aspectBetween(a, b, table_);
    }
    static std::optional<Aspect> aspectBetween(const BodyPosition& a, const BodyPosition& b,
                                               const OrbTable& table);

    /**
     * @brief Every aspect between a point of `first` and a point of `second`
     *
     * Ordered by the first set, then the second set.
     */
    std::vector<CrossAspect> crossAspects(const std::vector<BodyPosition>& first,
                                          const std::vector<BodyPosition>& second) const {
        return crossAspects(first, second, table_);
    }
    static std::vector<CrossAspect> crossAspects(const std::vector<BodyPosition>& first,
                                                 const std::vector<BodyPosition>& second,
                                                 const OrbTable& table);

    /**
     * @brief Grand trines, T-squares, grand crosses and stellia
     *
     * Only Sun .. Pluto take part; nodes and angles are axes, not bodies.
     */
    std::vector<AspectPattern> findPatterns(const std::vector<BodyPosition>& points,
                                            const std::vector<Aspect>& aspects) const;

    const OrbTable& orbTable() const { return table_; }
    const PatternSettings& patternSettings() const { return patterns_; }

private:
    OrbTable table_;
    PatternSettings patterns_;
};

} // namespace astchart::aspects

#endif // ASTCHART_ASPECTS_ASPECT_ENGINE_HPP
