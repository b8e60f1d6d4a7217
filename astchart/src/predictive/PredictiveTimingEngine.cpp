/**
 * @file PredictiveTimingEngine.cpp
 * @brief Progressions, returns and transit scanning
 * @author AstChart Team
 * @date 2026-02-19
 */

#include "astchart/predictive/PredictiveTimingEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/time/TimeScale.hpp"
#include "astchart/utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace astchart::predictive {

using namespace astchart::constants;

namespace {

constexpr double NAIBOD_RATE = 0.98564733;   // [deg/year]

/// Coarse sampling step for a body [days]
double scanStep(Body body) {
    switch (body) {
        case Body::MOON:    return 0.25;
        case Body::SUN:
        case Body::MERCURY:
        case Body::VENUS:
        case Body::MARS:    return 1.0;
        case Body::JUPITER:
        case Body::RAHU:
        case Body::KETU:    return 2.0;
        case Body::SATURN:  return 4.0;
        default:            return 5.0;
    }
}

/// Longest interval between two returns of a body, with margin [days]
double returnWindow(Body body) {
    switch (body) {
        case Body::MOON:    return 30.0;
        case Body::SUN:
        case Body::MERCURY: return 400.0;
        case Body::VENUS:   return 600.0;
        case Body::MARS:    return 900.0;
        case Body::JUPITER: return 4500.0;
        case Body::SATURN:  return 11000.0;
        case Body::RAHU:
        case Body::KETU:    return 7000.0;
        case Body::URANUS:  return 31000.0;
        case Body::NEPTUNE: return 61000.0;
        default:            return 91000.0;
    }
}

int signum(double x) {
    return (x > 0.0) - (x < 0.0);
}

/// Sign change of a continuous function, rejecting 360-degree wrap jumps
bool isCrossing(double fa, double fb) {
    if (signum(fa) == signum(fb) || signum(fa) == 0) return false;
    return std::abs(fb - fa) < 90.0;
}

/**
 * Bisection on [a, b] for a sign change of fn. Returns the midpoint of the
 * final bracket and the number of iterations used.
 */
double bisect(const std::function<double(double)>& fn, double a, double b, double fa,
              const SearchSettings& s, const std::string& what, int& iterations) {
    for (iterations = 0; iterations < s.max_iterations; ++iterations) {
        if (b - a < s.tolerance_days) {
            return 0.5 * (a + b);
        }
        double m = 0.5 * (a + b);
        double fm = fn(m);
        if (fm == 0.0) return m;
        if (signum(fm) == signum(fa)) {
            a = m;
            fa = fm;
        } else {
            b = m;
        }
    }
    double m = 0.5 * (a + b);
    throw NoConvergence(what, iterations, m, std::abs(fn(m)));
}

} // anonymous namespace

std::string techniqueName(ProgressionTechnique t) {
    switch (t) {
        case ProgressionTechnique::SECONDARY:  return "secondary";
        case ProgressionTechnique::SOLAR_ARC:  return "solar_arc";
        case ProgressionTechnique::ONE_DEGREE: return "one_degree";
        case ProgressionTechnique::NAIBOD:     return "naibod";
    }
    return "";
}

ProgressionTechnique techniqueFromName(const std::string& name) {
    if (name == "secondary") return ProgressionTechnique::SECONDARY;
    if (name == "solar_arc" || name == "solar-arc") return ProgressionTechnique::SOLAR_ARC;
    if (name == "one_degree" || name == "one-degree") return ProgressionTechnique::ONE_DEGREE;
    if (name == "naibod") return ProgressionTechnique::NAIBOD;
    throw UnsupportedParameter("progression technique", name);
}

std::string eventKindName(TimingEventKind kind) {
    switch (kind) {
        case TimingEventKind::SIGN_INGRESS:       return "ingress";
        case TimingEventKind::ASPECT_EXACT:       return "aspect";
        case TimingEventKind::STATION_RETROGRADE: return "station_retrograde";
        case TimingEventKind::STATION_DIRECT:     return "station_direct";
    }
    return "";
}

PredictiveTimingEngine::PredictiveTimingEngine(std::shared_ptr<const ChartBuilder> builder,
                                               SearchSettings settings)
    : builder_(std::move(builder)), settings_(settings)
{
    if (!builder_) {
        throw std::invalid_argument("PredictiveTimingEngine requires a chart builder");
    }
    if (settings_.max_iterations < 1 || settings_.tolerance_days <= 0.0) {
        throw UnsupportedParameter("search settings", "non-positive bound");
    }
}

// ============================================================================
// Progressions and directions
// ============================================================================

ProgressedChart PredictiveTimingEngine::progress(const Chart& natal, double target_jd,
                                                 ProgressionTechnique technique) const {
    const auto& gateway = builder_->gateway();

    ProgressedChart out;
    out.technique = technique;
    out.target_jd = target_jd;
    out.age_years = time::julianYears(target_jd - natal.jd_ut);
    out.chart = natal;

    const double natal_sun = natal.position(Body::SUN).longitude;
    const double progressed_jd = natal.jd_ut + out.age_years;

    std::vector<BodyPosition> progressed;
    if (technique == ProgressionTechnique::SECONDARY || technique == ProgressionTechnique::SOLAR_ARC) {
        progressed = gateway.getPositions(ephemerisBodies(), progressed_jd, natal.zodiac);
        auto sun = std::find_if(progressed.begin(), progressed.end(),
                                [](const BodyPosition& p) { return p.body == Body::SUN; });
        out.arc = signedDelta(sun->longitude, natal_sun);
    } else if (technique == ProgressionTechnique::ONE_DEGREE) {
        out.arc = out.age_years;
    } else {
        out.arc = out.age_years * NAIBOD_RATE;
    }

    Chart& c = out.chart;
    if (technique == ProgressionTechnique::SECONDARY) {
        c.positions = progressed;
        c.jd_ut = progressed_jd;
    } else {
        for (auto& p : c.positions) {
            p.longitude = normalizeDegrees(p.longitude + out.arc);
        }
        c.jd_ut = target_jd;
    }
    c.ascendant = normalizeDegrees(natal.ascendant + out.arc);
    c.midheaven = normalizeDegrees(natal.midheaven + out.arc);
    for (int i = 0; i < 12; ++i) {
        c.cusps[i] = normalizeDegrees(natal.cusps[i] + out.arc);
    }
    for (auto& p : c.positions) {
        p.house = c.houseOf(p.longitude);
    }

    out.aspects_to_natal = aspects::AspectEngine::crossAspects(
        c.points(), natal.points(), aspects::OrbTable::uniform(settings_.progression_orb));
    return out;
}

// ============================================================================
// Returns
// ============================================================================

double PredictiveTimingEngine::findLongitude(Body body, double longitude, double seed_jd,
                                             ZodiacType zodiac) const {
    if (isAngle(body)) {
        throw UnsupportedParameter("return body", bodyName(body));
    }
    const auto& gateway = builder_->gateway();
    const std::string what = bodyName(body) + " return search";

    auto f = [&](double jd) {
        return signedDelta(gateway.getLongitudes({body}, jd, zodiac).front(), longitude);
    };

    const double step = scanStep(body);
    const double limit = std::min(seed_jd + returnWindow(body), gateway.maxJulianDay() - step);

    double t0 = seed_jd;
    double f0 = f(t0);
    if (f0 == 0.0) return t0;

    double best = std::abs(f0);
    int samples = 1;
    while (t0 < limit) {
        double t1 = std::min(t0 + step, limit);
        double f1 = f(t1);
        ++samples;
        best = std::min(best, std::abs(f1));
        if (f1 == 0.0) return t1;
        if (isCrossing(f0, f1)) {
            int iterations = 0;
            double root = bisect(f, t0, t1, f0, settings_, what, iterations);
            double residual = std::abs(f(root));
            if (residual > settings_.max_residual_deg) {
                throw NoConvergence(what, samples + iterations, root, residual);
            }
            if (utils::Logger::enabled(utils::LogLevel::DEBUG)) {
                utils::Logger::debug("predictive", what + " converged at " + time::formatIso(root)
                                     + " after " + std::to_string(samples) + "+"
                                     + std::to_string(iterations) + " steps");
            }
            return root;
        }
        if (t1 >= limit) break;
        t0 = t1;
        f0 = f1;
    }
    throw NoConvergence(what, samples, t0, best);
}

Chart PredictiveTimingEngine::returnChart(const Chart& natal, Body body, int target_year) const {
    const double seed = time::julianDay(target_year, 1, 1.0);
    return returnChartFrom(natal, body, seed, natal.location);
}

Chart PredictiveTimingEngine::returnChartFrom(const Chart& natal, Body body, double seed_jd,
                                              const GeoLocation& location) const {
    const double target = natal.position(body).longitude;
    const double jd = findLongitude(body, target, seed_jd, natal.zodiac);
    return builder_->buildAt(natal.subject, jd, location, natal.house_system, natal.zodiac);
}

// ============================================================================
// Transit scan
// ============================================================================

std::vector<TimingEvent> PredictiveTimingEngine::transitScan(const Chart& natal,
                                                             double window_start,
                                                             double window_end,
                                                             const TransitSettings& transit) const {
    if (!(window_end > window_start)) {
        throw InputValidationError("Transit window end must follow its start", {"window_end"});
    }
    if (window_end - window_start > settings_.max_scan_days) {
        throw UnsupportedParameter("transit window",
                                   std::to_string(window_end - window_start) + " days");
    }
    if (transit.bodies.empty()) return {};

    const auto& gateway = builder_->gateway();
    const ZodiacType zodiac = natal.zodiac;
    const auto& bodies = transit.bodies;
    for (Body b : bodies) {
        if (isAngle(b)) throw UnsupportedParameter("transit body", bodyName(b));
    }

    double step = 1.0;
    for (Body b : bodies) step = std::min(step, scanStep(b));

    // Batched coarse samples: one gateway call per instant for all bodies
    std::vector<double> times;
    for (double t = window_start; t < window_end; t += step) times.push_back(t);
    times.push_back(window_end);

    std::vector<std::vector<double>> samples;
    samples.reserve(times.size());
    for (double t : times) {
        samples.push_back(gateway.getLongitudes(bodies, t, zodiac));
    }

    const std::vector<BodyPosition> natal_points = natal.points();
    std::vector<TimingEvent> events;

    for (size_t bi = 0; bi < bodies.size(); ++bi) {
        const Body body = bodies[bi];
        auto lonAt = [&](double jd) { return gateway.getLongitudes({body}, jd, zodiac).front(); };

        for (size_t k = 1; k < times.size(); ++k) {
            const double t0 = times[k - 1], t1 = times[k];
            const double l0 = samples[k - 1][bi], l1 = samples[k][bi];

            if (transit.ingresses && signOf(l0) != signOf(l1)) {
                const double moved = signedDelta(l1, l0);
                const double boundary = (moved > 0.0 ? signOf(l1) : signOf(l0)) * SIGN_SPAN;
                auto f = [&](double jd) { return signedDelta(lonAt(jd), boundary); };
                double f0 = signedDelta(l0, boundary);
                double f1 = signedDelta(l1, boundary);
                if (isCrossing(f0, f1)) {
                    int it = 0;
                    double jd = bisect(f, t0, t1, f0, settings_, bodyName(body) + " ingress", it);
                    TimingEvent e;
                    e.kind = TimingEventKind::SIGN_INGRESS;
                    e.body = body;
                    e.jd = jd;
                    e.longitude = lonAt(jd);
                    e.sign = signOf(l1);
                    events.push_back(e);
                }
            }

            if (transit.aspects) {
                for (const auto& np : natal_points) {
                    for (double angle : transit.aspect_angles) {
                        std::vector<double> targets{normalizeDegrees(np.longitude + angle)};
                        if (angle != 0.0 && angle != 180.0) {
                            targets.push_back(normalizeDegrees(np.longitude - angle));
                        }
                        for (double target : targets) {
                            double f0 = signedDelta(l0, target);
                            double f1 = signedDelta(l1, target);
                            if (!isCrossing(f0, f1)) continue;
                            auto f = [&](double jd) { return signedDelta(lonAt(jd), target); };
                            int it = 0;
                            double jd = bisect(f, t0, t1, f0, settings_,
                                               bodyName(body) + " aspect to " + bodyName(np.body), it);
                            TimingEvent e;
                            e.kind = TimingEventKind::ASPECT_EXACT;
                            e.body = body;
                            e.natal_point = np.body;
                            e.aspect_angle = angle;
                            e.jd = jd;
                            e.longitude = lonAt(jd);
                            e.sign = signOf(e.longitude);
                            events.push_back(e);
                        }
                    }
                }
            }

            if (transit.stations && k >= 2) {
                const double d_prev = signedDelta(l0, samples[k - 2][bi]);
                const double d_cur = signedDelta(l1, l0);
                if (signum(d_prev) != 0 && signum(d_cur) != 0 && signum(d_prev) != signum(d_cur)) {
                    const double h = step / 4.0;
                    auto speed = [&](double jd) { return signedDelta(lonAt(jd + h), lonAt(jd - h)); };
                    const double a = times[k - 2];
                    int it = 0;
                    double jd = bisect(speed, a, t1, speed(a), settings_,
                                       bodyName(body) + " station", it);
                    TimingEvent e;
                    e.kind = d_cur < 0.0 ? TimingEventKind::STATION_RETROGRADE
                                         : TimingEventKind::STATION_DIRECT;
                    e.body = body;
                    e.jd = jd;
                    e.longitude = lonAt(jd);
                    e.sign = signOf(e.longitude);
                    events.push_back(e);
                }
            }
        }
    }

    events.erase(std::remove_if(events.begin(), events.end(),
                                [&](const TimingEvent& e) {
                                    return e.jd < window_start || e.jd > window_end;
                                }),
                 events.end());
    std::sort(events.begin(), events.end(), [](const TimingEvent& x, const TimingEvent& y) {
        if (x.jd != y.jd) return x.jd < y.jd;
        if (x.body != y.body) return x.body < y.body;
        return x.kind < y.kind;
    });

    if (utils::Logger::enabled(utils::LogLevel::DEBUG)) {
        utils::Logger::debug("predictive", "transit scan " + time::formatIso(window_start) + " .. "
                             + time::formatIso(window_end) + ": "
                             + std::to_string(events.size()) + " events");
    }
    return events;
}

} // namespace astchart::predictive
