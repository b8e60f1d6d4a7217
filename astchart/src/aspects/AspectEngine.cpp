/**
 * @file AspectEngine.cpp
 * @brief Aspect matching and pattern detection
 * @author AstChart Team
 * @date 2026-02-16
 */

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace astchart::aspects {

namespace {

constexpr double APPLYING_STEP_DAYS = 1e-3;

bool takesPartInPatterns(Body b) {
    return static_cast<int>(b) <= static_cast<int>(Body::PLUTO);
}

using PairKey = std::pair<Body, Body>;

PairKey key(Body a, Body b) {
    return a < b ? PairKey{a, b} : PairKey{b, a};
}

} // anonymous namespace

std::string patternName(PatternKind kind) {
    switch (kind) {
        case PatternKind::GRAND_TRINE: return "grand_trine";
        case PatternKind::T_SQUARE:    return "t_square";
        case PatternKind::GRAND_CROSS: return "grand_cross";
        case PatternKind::STELLIUM:    return "stellium";
    }
    return "";
}

// ============================================================================
// OrbTable
// ============================================================================

OrbTable OrbTable::defaults() {
    OrbTable t;
    t.aspects = {
        {0.0, "conjunction", 8.0, true},
        {30.0, "semisextile", 2.0, true},
        {45.0, "semisquare", 2.0, true},
        {60.0, "sextile", 5.0, true},
        {90.0, "square", 7.0, true},
        {120.0, "trine", 7.0, true},
        {135.0, "sesquiquadrate", 2.0, true},
        {150.0, "quincunx", 3.0, true},
        {180.0, "opposition", 8.0, true},
    };
    // Faster bodies get tighter orbs
    t.body_factors = {
        {Body::MOON, 0.6},    {Body::MERCURY, 0.7}, {Body::VENUS, 0.75},
        {Body::SUN, 0.8},     {Body::MARS, 0.85},   {Body::JUPITER, 0.95},
        {Body::SATURN, 1.0},  {Body::URANUS, 1.0},  {Body::NEPTUNE, 1.0},
        {Body::PLUTO, 1.0},   {Body::RAHU, 0.6},    {Body::KETU, 0.6},
        {Body::ASCENDANT, 0.8}, {Body::MIDHEAVEN, 0.8},
    };
    return t;
}

OrbTable OrbTable::uniform(double orb) {
    OrbTable t;
    t.aspects = {
        {0.0, "conjunction", orb, true},
        {60.0, "sextile", orb, true},
        {90.0, "square", orb, true},
        {120.0, "trine", orb, true},
        {180.0, "opposition", orb, true},
    };
    return t;
}

std::vector<AspectDefinition> OrbTable::minorCatalog() {
    return {
        {36.0, "decile", 1.5, false},
        {40.0, "novile", 1.5, false},
        {72.0, "quintile", 2.0, false},
        {144.0, "biquintile", 2.0, false},
    };
}

double OrbTable::factor(Body body) const {
    auto it = body_factors.find(body);
    return it == body_factors.end() ? 1.0 : it->second;
}

double OrbTable::allowedOrb(const AspectDefinition& def, Body a, Body b) const {
    return def.orb * std::min(factor(a), factor(b));
}

double OrbTable::maxOrb() const {
    double m = 0.0;
    for (const auto& d : aspects) m = std::max(m, d.orb);
    return m;
}

// ============================================================================
// AspectEngine
// ============================================================================

AspectEngine::AspectEngine(OrbTable table, PatternSettings patterns)
    : table_(std::move(table)), patterns_(patterns)
{
    std::sort(table_.aspects.begin(), table_.aspects.end(),
              [](const AspectDefinition& x, const AspectDefinition& y) { return x.angle < y.angle; });
    for (const auto& [body, f] : table_.body_factors) {
        if (!(f > 0.0 && f <= 1.0)) {
            throw UnsupportedParameter("orb factor for " + bodyName(body), std::to_string(f));
        }
    }
    if (patterns_.stellium_min_bodies < 2) {
        throw UnsupportedParameter("stellium min_bodies", std::to_string(patterns_.stellium_min_bodies));
    }
}

std::optional<Aspect> AspectEngine::aspectBetween(const BodyPosition& a, const BodyPosition& b,
                                                  const OrbTable& table) {
    const double sep = angularSeparation(a.longitude, b.longitude);

    const AspectDefinition* best = nullptr;
    double best_dev = 0.0;
    double best_allowed = 0.0;
    for (const auto& def : table.aspects) {
        double dev = std::abs(sep - def.angle);
        double allowed = table.allowedOrb(def, a.body, b.body);
        if (dev <= allowed && (!best || dev < best_dev)) {
            best = &def;
            best_dev = dev;
            best_allowed = allowed;
        }
    }
    if (!best) return std::nullopt;

    Aspect asp;
    asp.first = std::min(a.body, b.body);
    asp.second = std::max(a.body, b.body);
    asp.separation = sep;
    asp.angle = best->angle;
    asp.type = best->name;
    asp.orb = best_dev;
    asp.allowed_orb = best_allowed;
    asp.exactness = best_allowed > 0.0 ? 1.0 - best_dev / best_allowed : 1.0;

    if (a.speed != 0.0 || b.speed != 0.0) {
        double later = angularSeparation(a.longitude + a.speed * APPLYING_STEP_DAYS,
                                         b.longitude + b.speed * APPLYING_STEP_DAYS);
        asp.applying = std::abs(later - best->angle) < best_dev;
    }
    return asp;
}

std::vector<Aspect> AspectEngine::findAspects(const std::vector<BodyPosition>& points,
                                              const OrbTable& table) const {
    std::vector<Aspect> out;
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            if (auto asp = aspectBetween(points[i], points[j], table)) {
                out.push_back(*asp);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const Aspect& x, const Aspect& y) {
        return x.first != y.first ? x.first < y.first : x.second < y.second;
    });
    return out;
}

std::vector<CrossAspect> AspectEngine::crossAspects(const std::vector<BodyPosition>& first,
                                                   const std::vector<BodyPosition>& second,
                                                   const OrbTable& table) {
    std::vector<CrossAspect> out;
    for (const auto& a : first) {
        for (const auto& b : second) {
            if (auto asp = aspectBetween(a, b, table)) {
                out.push_back({a.body, b.body, *asp});
            }
        }
    }
    return out;
}

std::vector<AspectPattern> AspectEngine::findPatterns(const std::vector<BodyPosition>& points,
                                                      const std::vector<Aspect>& aspects) const {
    std::map<PairKey, double> angle_of;
    for (const auto& a : aspects) {
        if (takesPartInPatterns(a.first) && takesPartInPatterns(a.second)) {
            angle_of[key(a.first, a.second)] = a.angle;
        }
    }
    auto has = [&](Body x, Body y, double angle) {
        auto it = angle_of.find(key(x, y));
        return it != angle_of.end() && it->second == angle;
    };

    std::vector<BodyPosition> bodies;
    for (const auto& p : points) {
        if (takesPartInPatterns(p.body)) bodies.push_back(p);
    }
    std::sort(bodies.begin(), bodies.end(),
              [](const BodyPosition& x, const BodyPosition& y) { return x.body < y.body; });

    std::vector<AspectPattern> out;
    const size_t n = bodies.size();

    // Grand trines: mutual trines within one triplicity
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j)
            for (size_t k = j + 1; k < n; ++k) {
                Body a = bodies[i].body, b = bodies[j].body, c = bodies[k].body;
                if (has(a, b, 120.0) && has(b, c, 120.0) && has(a, c, 120.0)
                    && bodies[i].sign() % 4 == bodies[j].sign() % 4
                    && bodies[j].sign() % 4 == bodies[k].sign() % 4) {
                    out.push_back({PatternKind::GRAND_TRINE, {a, b, c}});
                }
            }

    // T-squares: opposition with an apex square to both ends
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j) {
            Body a = bodies[i].body, b = bodies[j].body;
            if (!has(a, b, 180.0)) continue;
            for (size_t k = 0; k < n; ++k) {
                Body c = bodies[k].body;
                if (c == a || c == b) continue;
                if (has(a, c, 90.0) && has(b, c, 90.0)) {
                    out.push_back({PatternKind::T_SQUARE, {a, b, c}});
                }
            }
        }

    // Grand crosses: two oppositions linked by four squares
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j) {
            Body a = bodies[i].body, b = bodies[j].body;
            if (!has(a, b, 180.0)) continue;
            for (size_t k = i + 1; k < n; ++k)
                for (size_t l = k + 1; l < n; ++l) {
                    Body c = bodies[k].body, d = bodies[l].body;
                    if (k == j || l == j) continue;
                    if (has(c, d, 180.0) && has(a, c, 90.0) && has(a, d, 90.0)
                        && has(b, c, 90.0) && has(b, d, 90.0)) {
                        out.push_back({PatternKind::GRAND_CROSS, {a, b, c, d}});
                    }
                }
        }

    // Stellia: maximal clusters within the arc
    if (n >= static_cast<size_t>(patterns_.stellium_min_bodies)) {
        std::vector<BodyPosition> by_lon = bodies;
        std::sort(by_lon.begin(), by_lon.end(), [](const BodyPosition& x, const BodyPosition& y) {
            return x.longitude < y.longitude;
        });
        std::vector<std::set<Body>> groups;
        for (size_t i = 0; i < n; ++i) {
            std::set<Body> g;
            for (size_t step = 0; step < n; ++step) {
                const auto& p = by_lon[(i + step) % n];
                if (normalizeDegrees(p.longitude - by_lon[i].longitude) > patterns_.stellium_max_arc) break;
                g.insert(p.body);
            }
            if (g.size() >= static_cast<size_t>(patterns_.stellium_min_bodies)) {
                groups.push_back(g);
            }
        }
        for (size_t i = 0; i < groups.size(); ++i) {
            bool redundant = false;
            for (size_t j = 0; j < groups.size() && !redundant; ++j) {
                if (i == j) continue;
                bool subset = std::includes(groups[j].begin(), groups[j].end(),
                                            groups[i].begin(), groups[i].end());
                // Strict subset, or an identical group seen earlier
                redundant = subset && (groups[j].size() > groups[i].size() || j < i);
            }
            if (!redundant) {
                out.push_back({PatternKind::STELLIUM,
                               std::vector<Body>(groups[i].begin(), groups[i].end())});
            }
        }
    }
    return out;
}

} // namespace astchart::aspects
