/**
 * @file CompatibilityEngine.cpp
 * @brief Chart comparison
 * @author AstChart Team
 * @date 2026-02-20
 */

#include "astchart/compatibility/CompatibilityEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace astchart::compatibility {

using namespace astchart::constants;

namespace {

struct HarmonyRule {
    double angle;
    double value;   ///< Harmony at exact aspect
    double orb;
};

// Conjunction of the same body scores highest
const HarmonyRule HARMONY_RULES[] = {
    {0.0, 1.0, 8.0},
    {60.0, 0.6, 6.0},
    {90.0, 0.2, 8.0},
    {120.0, 0.8, 8.0},
    {180.0, 0.3, 8.0},
};

constexpr double NEUTRAL_HARMONY = 0.4;

double pointLongitude(const Chart& c, Body body) {
    if (body == Body::ASCENDANT) return c.ascendant;
    if (body == Body::MIDHEAVEN) return c.midheaven;
    return c.position(body).longitude;
}

double meanHarmony(const Chart& a, const Chart& b, std::initializer_list<Body> bodies) {
    double sum = 0.0;
    for (Body body : bodies) {
        sum += CompatibilityEngine::pairHarmony(pointLongitude(a, body), pointLongitude(b, body));
    }
    return sum / static_cast<double>(bodies.size());
}

} // anonymous namespace

CompatibilityEngine::CompatibilityEngine(std::shared_ptr<const ChartBuilder> builder,
                                         aspects::AspectEngine aspects,
                                         CompatibilitySettings settings)
    : builder_(std::move(builder)), aspects_(std::move(aspects)), settings_(settings)
{
    if (!builder_) {
        throw std::invalid_argument("CompatibilityEngine requires a chart builder");
    }
}

double CompatibilityEngine::midpoint(double lon_a, double lon_b) {
    const double lo = std::min(normalizeDegrees(lon_a), normalizeDegrees(lon_b));
    const double hi = std::max(normalizeDegrees(lon_a), normalizeDegrees(lon_b));
    const double d = hi - lo;
    if (d < 180.0) return normalizeDegrees(lo + d / 2.0);
    if (d > 180.0) return normalizeDegrees(hi + (360.0 - d) / 2.0);
    return normalizeDegrees(lo + 90.0);
}

GeoLocation CompatibilityEngine::geographicMidpoint(const GeoLocation& a, const GeoLocation& b) {
    auto unit = [](const GeoLocation& g) {
        return Eigen::Vector3d(cosDeg(g.latitude) * cosDeg(g.longitude),
                               cosDeg(g.latitude) * sinDeg(g.longitude),
                               sinDeg(g.latitude));
    };
    const Eigen::Vector3d v = unit(a) + unit(b);

    GeoLocation m;
    m.elevation = (a.elevation + b.elevation) / 2.0;
    if (v.norm() < 1e-12) {
        // Antipodal places: no unique great-circle midpoint
        m.latitude = (a.latitude + b.latitude) / 2.0;
        m.longitude = (a.longitude + b.longitude) / 2.0;
        return m;
    }
    m.latitude = std::atan2(v.z(), std::hypot(v.x(), v.y())) * RAD_TO_DEG;
    m.longitude = std::atan2(v.y(), v.x()) * RAD_TO_DEG;
    return m;
}

double CompatibilityEngine::pairHarmony(double lon_a, double lon_b) {
    const double sep = angularSeparation(lon_a, lon_b);
    const HarmonyRule* best = nullptr;
    double best_dev = 0.0;
    for (const auto& r : HARMONY_RULES) {
        double dev = std::abs(sep - r.angle);
        if (dev <= r.orb && (!best || dev < best_dev)) {
            best = &r;
            best_dev = dev;
        }
    }
    if (!best) return NEUTRAL_HARMONY;
    const double closeness = 1.0 - best_dev / best->orb;
    return NEUTRAL_HARMONY + (best->value - NEUTRAL_HARMONY) * closeness;
}

Chart CompatibilityEngine::composite(const Chart& a, const Chart& b) {
    if (a.zodiac != b.zodiac || a.house_system != b.house_system) {
        throw UnsupportedParameter("composite", "charts must share zodiac and house system");
    }

    Chart c;
    const double jd = (a.jd_ut + b.jd_ut) / 2.0;
    c.location = geographicMidpoint(a.location, b.location);
    c.subject = Subject("composite", time::calendarFromJulianDay(jd), c.location, 0.0);
    c.jd_ut = jd;
    c.house_system = a.house_system;
    c.zodiac = a.zodiac;
    c.ascendant = midpoint(a.ascendant, b.ascendant);
    c.midheaven = midpoint(a.midheaven, b.midheaven);
    // One branch for all cusps: the first-cusp midpoint plus the mean
    // forward offset of each cusp from the first, so the order survives
    const double anchor = midpoint(a.cusps[0], b.cusps[0]);
    for (int i = 0; i < 12; ++i) {
        const double offset_a = normalizeDegrees(a.cusps[i] - a.cusps[0]);
        const double offset_b = normalizeDegrees(b.cusps[i] - b.cusps[0]);
        c.cusps[i] = normalizeDegrees(anchor + (offset_a + offset_b) / 2.0);
    }

    for (const auto& pa : a.positions) {
        const BodyPosition* pb = b.find(pa.body);
        if (!pb) continue;
        BodyPosition p;
        p.body = pa.body;
        p.longitude = midpoint(pa.longitude, pb->longitude);
        p.latitude = (pa.latitude + pb->latitude) / 2.0;
        p.distance = (pa.distance + pb->distance) / 2.0;
        p.speed = (pa.speed + pb->speed) / 2.0;
        p.retrograde = p.speed < 0.0;
        p.house = c.houseOf(p.longitude);
        c.positions.push_back(p);
    }
    return c;
}

Chart CompatibilityEngine::midpointInstantChart(const Chart& a, const Chart& b,
                                                const GeoLocation& location) const {
    const double jd = (a.jd_ut + b.jd_ut) / 2.0;
    Subject s("midpoint", time::calendarFromJulianDay(jd), location, 0.0);
    return builder_->buildAt(s, jd, location, a.house_system, a.zodiac);
}

CompatibilityReport CompatibilityEngine::compare(const Chart& a, const Chart& b,
                                                 std::optional<GeoLocation> location) const {
    CompatibilityReport r;
    r.matrix = aspects_.crossAspects(a.points(), b.points());
    r.composite = composite(a, b);
    r.midpoint_chart = midpointInstantChart(a, b, location.value_or(r.composite.location));

    r.luminary = 100.0 * meanHarmony(a, b, {Body::SUN, Body::MOON});
    r.affection = 100.0 * meanHarmony(a, b, {Body::VENUS, Body::MARS});
    r.structural = 100.0 * meanHarmony(a, b, {Body::JUPITER, Body::SATURN, Body::ASCENDANT});

    const double weights = settings_.luminary_weight + settings_.affection_weight
                         + settings_.structural_weight;
    r.overall = (settings_.luminary_weight * r.luminary + settings_.affection_weight * r.affection
                 + settings_.structural_weight * r.structural) / weights;
    return r;
}

} // namespace astchart::compatibility
