/**
 * @file HouseSystem.cpp
 * @brief House cusp algorithms
 * @author AstChart Team
 * @date 2026-02-14
 */

#include "astchart/chart/HouseSystem.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/core/Types.hpp"
#include "astchart/time/TimeScale.hpp"
#include <algorithm>
#include <cmath>

namespace astchart {

using namespace astchart::constants;

namespace {

// Ecliptic longitude of the ecliptic point with right ascension ra
double eclipticFromRa(double ra, double eps) {
    return atan2Deg(sinDeg(ra), cosDeg(ra) * cosDeg(eps));
}

double declinationOfEcliptic(double lon, double eps) {
    return std::asin(sinDeg(eps) * sinDeg(lon)) * RAD_TO_DEG;
}

/**
 * Placidus intermediate cusp.
 * Above the horizon: RA = RAMC + fraction * SA_d
 * Below the horizon: RA = RAMC + 180 - fraction * SA_n
 */
double placidusCusp(double ramc, double eps, double lat, double fraction, bool diurnal,
                    double initial_ra, const HouseSettings& settings) {
    double ra = initial_ra;
    double delta = 0.0;
    for (int iter = 0; iter < settings.max_iterations; ++iter) {
        double lon = eclipticFromRa(ra, eps);
        double dec = declinationOfEcliptic(lon, eps);
        double arg = -tanDeg(lat) * tanDeg(dec);
        if (arg < -1.0 || arg > 1.0) {
            throw NoConvergence("Placidus cusp (circumpolar ecliptic point)", iter + 1, 0.0, 0.0);
        }
        double sa_d = std::acos(arg) * RAD_TO_DEG;
        double next = diurnal ? ramc + fraction * sa_d
                              : ramc + 180.0 - fraction * (180.0 - sa_d);
        next = normalizeDegrees(next);
        delta = angularSeparation(next, ra);
        ra = next;
        if (delta < settings.tolerance_deg) {
            return eclipticFromRa(ra, eps);
        }
    }
    throw NoConvergence("Placidus cusp", settings.max_iterations, 0.0, delta);
}

} // anonymous namespace

std::string houseSystemName(HouseSystemType type) {
    switch (type) {
        case HouseSystemType::PLACIDUS:   return "placidus";
        case HouseSystemType::WHOLE_SIGN: return "whole-sign";
        case HouseSystemType::EQUAL:      return "equal";
    }
    return "placidus";
}

HouseSystemType houseSystemFromName(const std::string& name) {
    if (name == "placidus" || name == "P") return HouseSystemType::PLACIDUS;
    if (name == "whole-sign" || name == "whole_sign" || name == "W") return HouseSystemType::WHOLE_SIGN;
    if (name == "equal" || name == "E") return HouseSystemType::EQUAL;
    throw UnsupportedParameter("house_system", name);
}

double midheavenFromRamc(double ramc, double obliquity) {
    return atan2Deg(sinDeg(ramc), cosDeg(ramc) * cosDeg(obliquity));
}

double ascendantFromRamc(double ramc, double obliquity, double latitude) {
    return atan2Deg(cosDeg(ramc),
                    -(sinDeg(obliquity) * tanDeg(latitude) + cosDeg(obliquity) * sinDeg(ramc)));
}

HouseCusps computeHouses(HouseSystemType type, double jd_ut, double latitude, double longitude,
                         double zodiac_offset, const HouseSettings& settings) {
    if (type == HouseSystemType::PLACIDUS && std::abs(latitude) > settings.placidus_max_latitude) {
        throw InvalidLatitude(latitude, settings.placidus_max_latitude, houseSystemName(type));
    }

    const double jd_tt = time::utToTT(jd_ut);
    const double eps = time::trueObliquity(jd_tt);
    const double ramc = normalizeDegrees(time::greenwichApparentSiderealTime(jd_ut) + longitude);

    HouseCusps h;
    h.midheaven = normalizeDegrees(midheavenFromRamc(ramc, eps) - zodiac_offset);
    h.ascendant = normalizeDegrees(ascendantFromRamc(ramc, eps, latitude) - zodiac_offset);

    switch (type) {
        case HouseSystemType::WHOLE_SIGN: {
            double first = signOf(h.ascendant) * SIGN_SPAN;
            for (int i = 0; i < 12; ++i) h.cusps[i] = normalizeDegrees(first + i * SIGN_SPAN);
            break;
        }
        case HouseSystemType::EQUAL: {
            for (int i = 0; i < 12; ++i) h.cusps[i] = normalizeDegrees(h.ascendant + i * SIGN_SPAN);
            break;
        }
        case HouseSystemType::PLACIDUS: {
            double c11 = placidusCusp(ramc, eps, latitude, 1.0 / 3.0, true, ramc + 30.0, settings);
            double c12 = placidusCusp(ramc, eps, latitude, 2.0 / 3.0, true, ramc + 60.0, settings);
            double c2 = placidusCusp(ramc, eps, latitude, 2.0 / 3.0, false, ramc + 120.0, settings);
            double c3 = placidusCusp(ramc, eps, latitude, 1.0 / 3.0, false, ramc + 150.0, settings);

            std::array<double, 12> tropical{};
            tropical[0] = h.ascendant + zodiac_offset;
            tropical[1] = c2;
            tropical[2] = c3;
            tropical[3] = h.midheaven + zodiac_offset + 180.0;
            tropical[4] = c11 + 180.0;
            tropical[5] = c12 + 180.0;
            tropical[6] = h.ascendant + zodiac_offset + 180.0;
            tropical[7] = c2 + 180.0;
            tropical[8] = c3 + 180.0;
            tropical[9] = h.midheaven + zodiac_offset;
            tropical[10] = c11;
            tropical[11] = c12;
            for (int i = 0; i < 12; ++i) h.cusps[i] = normalizeDegrees(tropical[i] - zodiac_offset);
            // Angles exactly as computed above
            h.cusps[0] = h.ascendant;
            h.cusps[9] = h.midheaven;
            break;
        }
    }
    return h;
}

int houseContaining(const std::array<double, 12>& cusps, double longitude) {
    for (int i = 0; i < 12; ++i) {
        if (inForwardArc(longitude, cusps[i], cusps[(i + 1) % 12])) {
            return i + 1;
        }
    }
    // Degenerate cusps (all equal); fall back to equal division from cusp 1
    return static_cast<int>(normalizeDegrees(longitude - cusps[0]) / SIGN_SPAN) % 12 + 1;
}

} // namespace astchart
