/**
 * @file StrengthEngine.cpp
 * @brief Strength tables and scoring
 * @author AstChart Team
 * @date 2026-02-17
 */

#include "astchart/strength/StrengthEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/time/TimeScale.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace astchart::strength {

namespace {

enum class Relation { FRIEND, NEUTRAL, ENEMY };

struct PlanetTable {
    Body body;
    int exaltation_sign;
    double exaltation_degree;
    int moolatrikona_sign;
    double moolatrikona_from;
    double moolatrikona_to;
    double mean_speed;          ///< [deg/day]
    double naisargika;          ///< [virupa]
    int dig_bala_house;
    bool diurnal;               ///< Strong by day (Mercury: both)
};

const PlanetTable PLANETS[] = {
    {Body::SUN,     0, 10.0,  4, 0.0, 20.0,  0.9856, 60.00, 10, true},
    {Body::MOON,    1, 3.0,   1, 3.0, 30.0,  13.176, 51.43, 4,  false},
    {Body::MARS,    9, 28.0,  0, 0.0, 12.0,  0.524,  17.14, 10, false},
    {Body::MERCURY, 5, 15.0,  5, 15.0, 20.0, 1.383,  25.71, 1,  true},
    {Body::JUPITER, 3, 5.0,   8, 0.0, 10.0,  0.083,  34.29, 1,  true},
    {Body::VENUS,   11, 27.0, 6, 0.0, 15.0,  1.2,    42.86, 4,  true},
    {Body::SATURN,  6, 20.0,  10, 0.0, 20.0, 0.0335, 8.57,  7,  false},
};

const PlanetTable& table(Body body) {
    for (const auto& t : PLANETS) {
        if (t.body == body) return t;
    }
    throw std::out_of_range("No strength table for body: " + bodyName(body));
}

Relation naturalRelation(Body planet, Body lord) {
    if (planet == lord) return Relation::FRIEND;
    struct Row { Body planet; std::vector<Body> friends; std::vector<Body> enemies; };
    static const Row ROWS[] = {
        {Body::SUN,     {Body::MOON, Body::MARS, Body::JUPITER}, {Body::VENUS, Body::SATURN}},
        {Body::MOON,    {Body::SUN, Body::MERCURY}, {}},
        {Body::MARS,    {Body::SUN, Body::MOON, Body::JUPITER}, {Body::MERCURY}},
        {Body::MERCURY, {Body::SUN, Body::VENUS}, {Body::MOON}},
        {Body::JUPITER, {Body::SUN, Body::MOON, Body::MARS}, {Body::MERCURY, Body::VENUS}},
        {Body::VENUS,   {Body::MERCURY, Body::SATURN}, {Body::SUN, Body::MOON}},
        {Body::SATURN,  {Body::MERCURY, Body::VENUS}, {Body::SUN, Body::MOON, Body::MARS}},
    };
    for (const auto& r : ROWS) {
        if (r.planet != planet) continue;
        if (std::find(r.friends.begin(), r.friends.end(), lord) != r.friends.end()) return Relation::FRIEND;
        if (std::find(r.enemies.begin(), r.enemies.end(), lord) != r.enemies.end()) return Relation::ENEMY;
        return Relation::NEUTRAL;
    }
    return Relation::NEUTRAL;
}

double dignityScore(Dignity d) {
    switch (d) {
        case Dignity::EXALTED:      return 1.0;
        case Dignity::MOOLATRIKONA: return 0.85;
        case Dignity::OWN_SIGN:     return 0.75;
        case Dignity::FRIEND:       return 0.5;
        case Dignity::NEUTRAL:      return 0.375;
        case Dignity::ENEMY:        return 0.25;
        case Dignity::DEBILITATED:  return 0.0;
    }
    return 0.0;
}

bool isNaturalBenefic(Body body, bool waxing_moon) {
    switch (body) {
        case Body::JUPITER:
        case Body::VENUS:
        case Body::MERCURY:
            return true;
        case Body::MOON:
            return waxing_moon;
        default:
            return false;
    }
}

} // anonymous namespace

std::string dignityName(Dignity d) {
    switch (d) {
        case Dignity::EXALTED:      return "exalted";
        case Dignity::MOOLATRIKONA: return "moolatrikona";
        case Dignity::OWN_SIGN:     return "own_sign";
        case Dignity::FRIEND:       return "friend";
        case Dignity::NEUTRAL:      return "neutral";
        case Dignity::ENEMY:        return "enemy";
        case Dignity::DEBILITATED:  return "debilitated";
    }
    return "";
}

Body StrengthEngine::signLord(int sign) {
    static const Body LORDS[12] = {
        Body::MARS, Body::VENUS, Body::MERCURY, Body::MOON, Body::SUN, Body::MERCURY,
        Body::VENUS, Body::MARS, Body::JUPITER, Body::SATURN, Body::SATURN, Body::JUPITER
    };
    return LORDS[((sign % 12) + 12) % 12];
}

double StrengthEngine::exaltationPoint(Body body) {
    const auto& t = table(body);
    return t.exaltation_sign * constants::SIGN_SPAN + t.exaltation_degree;
}

double StrengthEngine::meanDailyMotion(Body body) {
    return table(body).mean_speed;
}

double StrengthEngine::naturalStrength(Body body) {
    return table(body).naisargika / 60.0;
}

int StrengthEngine::strongestHouse(Body body) {
    return table(body).dig_bala_house;
}

bool StrengthEngine::castsAspect(Body from, int houses_away) {
    if (houses_away == 7) return true;
    switch (from) {
        case Body::MARS:    return houses_away == 4 || houses_away == 8;
        case Body::JUPITER: return houses_away == 5 || houses_away == 9;
        case Body::SATURN:  return houses_away == 3 || houses_away == 10;
        default:            return false;
    }
}

Dignity StrengthEngine::dignity(Body body, double longitude) {
    const auto& t = table(body);
    const double lon = normalizeDegrees(longitude);
    const int sign = signOf(lon);
    const double deg = lon - sign * constants::SIGN_SPAN;

    // Moon and Mercury share exaltation and moolatrikona signs
    if (sign == t.exaltation_sign) {
        bool shared = t.moolatrikona_sign == t.exaltation_sign;
        if (!shared || deg <= t.exaltation_degree) return Dignity::EXALTED;
    }
    if (sign == t.moolatrikona_sign && deg >= t.moolatrikona_from && deg < t.moolatrikona_to) {
        return Dignity::MOOLATRIKONA;
    }
    if (signLord(sign) == body) return Dignity::OWN_SIGN;
    if (sign == (t.exaltation_sign + 6) % 12) return Dignity::DEBILITATED;

    switch (naturalRelation(body, signLord(sign))) {
        case Relation::FRIEND:  return Dignity::FRIEND;
        case Relation::ENEMY:   return Dignity::ENEMY;
        default:                return Dignity::NEUTRAL;
    }
}

std::map<Body, StrengthScore> StrengthEngine::score(const Chart& chart) const {
    const BodyPosition& sun = chart.position(Body::SUN);
    const BodyPosition& moon = chart.position(Body::MOON);

    // Sun in houses 7..12 is above the horizon
    const bool day_birth = sun.house >= 7;
    const double elongation = normalizeDegrees(moon.longitude - sun.longitude);
    const bool waxing = elongation < 180.0;
    const double bright = waxing ? elongation / 180.0 : (360.0 - elongation) / 180.0;
    const int wd = time::weekday(chart.jd_ut + chart.subject.timezoneOffset() / 24.0);
    static const Body WEEKDAY_LORDS[7] = {
        Body::SUN, Body::MOON, Body::MARS, Body::MERCURY, Body::JUPITER, Body::VENUS, Body::SATURN
    };

    std::map<Body, StrengthScore> out;
    for (Body body : classicalPlanets()) {
        const BodyPosition& p = chart.position(body);
        const PlanetTable& t = table(body);
        StrengthScore s;
        s.body = body;

        // Positional
        s.dignity = dignity(body, p.longitude);
        double debilitation = normalizeDegrees(exaltationPoint(body) + 180.0);
        double uccha = angularSeparation(p.longitude, debilitation) / 180.0;
        s.positional = 0.5 * dignityScore(s.dignity) + 0.5 * uccha;

        // Directional
        int d = std::abs(p.house - t.dig_bala_house) % 12;
        d = std::min(d, 12 - d);
        s.directional = p.house > 0 ? 1.0 - d / 6.0 : 0.0;

        // Temporal
        double day_night = (body == Body::MERCURY || t.diurnal == day_birth) ? 1.0 : 0.0;
        double weekday_lord = WEEKDAY_LORDS[wd] == body ? 1.0 : 0.0;
        double paksha = isNaturalBenefic(body, waxing) ? bright : 1.0 - bright;
        s.temporal = (day_night + weekday_lord + paksha) / 3.0;

        // Motional
        s.motional = p.retrograde ? 1.0 : std::min(1.0, std::abs(p.speed) / t.mean_speed);

        // Natural
        s.natural = t.naisargika / 60.0;

        // Aspectual
        int net = 0;
        for (Body other : classicalPlanets()) {
            if (other == body) continue;
            const BodyPosition& o = chart.position(other);
            int houses_away = (p.sign() - o.sign() + 12) % 12 + 1;
            if (castsAspect(other, houses_away)) {
                net += isNaturalBenefic(other, waxing) ? 1 : -1;
            }
        }
        s.aspectual = std::min(1.0, std::max(0.0, (net + 6) / 12.0));

        s.total = s.positional + s.directional + s.temporal + s.motional + s.natural + s.aspectual;
        out[body] = s;
    }

    std::vector<StrengthScore*> ranking;
    for (auto& [body, s] : out) ranking.push_back(&s);
    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const StrengthScore* a, const StrengthScore* b) { return a->total > b->total; });
    for (size_t i = 0; i < ranking.size(); ++i) ranking[i]->rank = static_cast<int>(i) + 1;
    return out;
}

} // namespace astchart::strength
