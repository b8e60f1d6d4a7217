/**
 * @file AnalyticalEphemeris.cpp
 * @brief Analytical Sun, Moon, planet and node positions
 * @author AstChart Team
 * @date 2026-02-12
 */

#include "astchart/ephemeris/AnalyticalEphemeris.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Constants.hpp"
#include "astchart/time/TimeScale.hpp"
#include <cmath>
#include <stdexcept>

namespace astchart::ephemeris {

using namespace astchart::constants;

namespace {

// ============================================================================
// Standish (1992) mean elements, J2000 ecliptic and equinox
// a [AU], e, I, L, long. perihelion, long. node [deg]; rates per century
// ============================================================================

struct ElementSet {
    double a, da;
    double e, de;
    double I, dI;
    double L, dL;
    double varpi, dvarpi;
    double node, dnode;
};

const ElementSet ELEMENTS[] = {
    // Mercury
    {0.38709927, 0.00000037, 0.20563593, 0.00001906, 7.00497902, -0.00594749,
     252.25032350, 149472.67411175, 77.45779628, 0.16047689, 48.33076593, -0.12534081},
    // Venus
    {0.72333566, 0.00000390, 0.00677672, -0.00004107, 3.39467605, -0.00078890,
     181.97909950, 58517.81538729, 131.60246718, 0.00268329, 76.67984255, -0.27769418},
    // Earth-Moon barycenter
    {1.00000261, 0.00000562, 0.01671123, -0.00004392, -0.00001531, -0.01294668,
     100.46457166, 35999.37244981, 102.93768193, 0.32327364, 0.0, 0.0},
    // Mars
    {1.52371034, 0.00001847, 0.09339410, 0.00007882, 1.84969142, -0.00813131,
     -4.55343205, 19140.30268499, -23.94362959, 0.44441088, 49.55953891, -0.29257343},
    // Jupiter
    {5.20288700, -0.00011607, 0.04838624, -0.00013253, 1.30439695, -0.00183714,
     34.39644051, 3034.74612775, 14.72847983, 0.21252668, 100.47390909, 0.20469106},
    // Saturn
    {9.53667594, -0.00125060, 0.05386179, -0.00050991, 2.48599187, 0.00193609,
     49.95424423, 1222.49362201, 92.59887831, -0.41897216, 113.66242448, -0.28867794},
    // Uranus
    {19.18916464, -0.00196176, 0.04725744, -0.00004397, 0.77263783, -0.00242939,
     313.23810451, 428.48202785, 170.95427630, 0.40805281, 74.01692503, 0.04240589},
    // Neptune
    {30.06992276, 0.00026291, 0.00859048, 0.00005105, 1.77004347, 0.00035372,
     -55.12002969, 218.45945325, 44.96476227, -0.32241464, 131.78422574, -0.00508664},
    // Pluto
    {39.48211675, -0.00031596, 0.24882730, 0.00005170, 17.14001206, 0.00004818,
     238.92903833, 145.20780515, 224.06891629, -0.04062942, 110.30393684, -0.01183482}
};

int elementIndex(Body body) {
    switch (body) {
        case Body::MERCURY: return 0;
        case Body::VENUS:   return 1;
        case Body::SUN:     return 2;   // Earth-Moon barycenter
        case Body::MARS:    return 3;
        case Body::JUPITER: return 4;
        case Body::SATURN:  return 5;
        case Body::URANUS:  return 6;
        case Body::NEPTUNE: return 7;
        case Body::PLUTO:   return 8;
        default:
            throw std::invalid_argument("No orbital elements for body: " + bodyName(body));
    }
}

double solveKepler(double M, double e) {
    double E = M + e * std::sin(M);
    for (int i = 0; i < 30; ++i) {
        double dE = (E - e * std::sin(E) - M) / (1.0 - e * std::cos(E));
        E -= dE;
        if (std::abs(dE) < 1e-14) break;
    }
    return E;
}

// ============================================================================
// Meeus ch. 47 periodic terms
// Arguments D, M, M', F; longitude [1e-6 deg], distance [1e-3 km]
// ============================================================================

struct LonDistTerm {
    int d, m, mp, f;
    double l, r;
};

struct LatTerm {
    int d, m, mp, f;
    double b;
};

const LonDistTerm MOON_LON_DIST[] = {
    {0, 0, 1, 0, 6288774, -20905355}, {2, 0, -1, 0, 1274027, -3699111},
    {2, 0, 0, 0, 658314, -2955968},   {0, 0, 2, 0, 213618, -569925},
    {0, 1, 0, 0, -185116, 48888},     {0, 0, 0, 2, -114332, -3149},
    {2, 0, -2, 0, 58793, 246158},     {2, -1, -1, 0, 57066, -152138},
    {2, 0, 1, 0, 53322, -170733},     {2, -1, 0, 0, 45758, -204586},
    {0, 1, -1, 0, -40923, -129620},   {1, 0, 0, 0, -34720, 108743},
    {0, 1, 1, 0, -30383, 104755},     {2, 0, 0, -2, 15327, 10321},
    {0, 0, 1, 2, -12528, 0},          {0, 0, 1, -2, 10980, 79661},
    {4, 0, -1, 0, 10675, -34782},     {0, 0, 3, 0, 10034, -23210},
    {4, 0, -2, 0, 8548, -21636},      {2, 1, -1, 0, -7888, 24208},
    {2, 1, 0, 0, -6766, 30824},       {1, 0, -1, 0, -5163, -8379},
    {1, 1, 0, 0, 4987, -16675},       {2, -1, 1, 0, 4036, -12831},
    {2, 0, 2, 0, 3994, -10445},       {4, 0, 0, 0, 3861, -11650},
    {2, 0, -3, 0, 3665, 14403},       {0, 1, -2, 0, -2689, -7003},
    {2, 0, -1, 2, -2602, 0},          {2, -1, -2, 0, 2390, 10056},
    {1, 0, 1, 0, -2348, 6322},        {2, -2, 0, 0, 2236, -9884},
    {0, 1, 2, 0, -2120, 5751},        {0, 2, 0, 0, -2069, 0},
    {2, -2, -1, 0, 2048, -4950},      {2, 0, 1, -2, -1773, 4130},
    {2, 0, 0, 2, -1595, 0},           {4, -1, -1, 0, 1215, -3958},
    {0, 0, 2, 2, -1110, 0},           {3, 0, -1, 0, -892, 3258},
    {2, 1, 1, 0, -810, 2616},         {4, -1, -2, 0, 759, -1897},
    {0, 2, -1, 0, -713, -2117},       {2, 2, -1, 0, -700, 2354},
    {2, 1, -2, 0, 691, 0},            {2, -1, 0, -2, 596, 0},
    {4, 0, 1, 0, 549, -1423},         {0, 0, 4, 0, 537, -1117},
    {4, -1, 0, 0, 520, -1571},        {1, 0, -2, 0, -487, -1739},
    {2, 1, 0, -2, -399, 0},           {0, 0, 2, -2, -381, -4421},
    {1, 1, 1, 0, 351, 0},             {3, 0, -2, 0, -340, 0},
    {4, 0, -3, 0, 330, 0},            {2, -1, 2, 0, 327, 0},
    {0, 2, 1, 0, -323, 1165},         {1, 1, -1, 0, 299, 0},
    {2, 0, 3, 0, 294, 0},             {2, 0, -1, -2, 0, 8752}
};

const LatTerm MOON_LAT[] = {
    {0, 0, 0, 1, 5128122}, {0, 0, 1, 1, 280602},  {0, 0, 1, -1, 277693},
    {2, 0, 0, -1, 173237}, {2, 0, -1, 1, 55413},  {2, 0, -1, -1, 46271},
    {2, 0, 0, 1, 32573},   {0, 0, 2, 1, 17198},   {2, 0, 1, -1, 9266},
    {0, 0, 2, -1, 8822},   {2, -1, 0, -1, 8216},  {2, 0, -2, -1, 4324},
    {2, 0, 1, 1, 4200},    {2, 1, 0, -1, -3359},  {2, -1, -1, 1, 2463},
    {2, -1, 0, 1, 2211},   {2, -1, -1, -1, 2065}, {0, 1, -1, -1, -1870},
    {4, 0, -1, -1, 1828},  {0, 1, 0, 1, -1794},   {0, 0, 0, 3, -1749},
    {0, 1, -1, 1, -1565},  {1, 0, 0, 1, -1491},   {0, 1, 1, 1, -1475},
    {0, 1, 1, -1, -1410},  {0, 1, 0, -1, -1344},  {1, 0, 0, -1, -1335},
    {0, 0, 3, 1, 1107},    {4, 0, 0, -1, 1021},   {4, 0, -1, 1, 833},
    {0, 0, 1, -3, 777},    {4, 0, -2, 1, 671},    {2, 0, 0, -3, 607},
    {2, 0, 2, -1, 596},    {2, -1, 1, -1, 491},   {2, 0, -2, 1, -451},
    {0, 0, 3, -1, 439},    {2, 0, 2, 1, 422},     {2, 0, -3, -1, 421},
    {2, 1, -1, 1, -366},   {2, 1, 0, 1, -351},    {4, 0, 0, 1, 331},
    {2, -1, 1, 1, 315},    {2, -2, 0, -1, 302},   {0, 0, 1, 3, -283},
    {2, 1, 1, -1, -229},   {1, 1, 0, -1, 223},    {1, 1, 0, 1, 223},
    {0, 1, -2, -1, -220},  {2, 1, -1, -1, -220},  {1, 0, 1, 1, -185},
    {2, -1, -2, -1, 181},  {0, 1, 2, 1, -177},    {4, 0, -2, -1, 176},
    {4, -1, -1, -1, 166},  {1, 0, 1, -1, -164},   {4, 0, 1, -1, 132},
    {1, 0, -1, -1, -119},  {4, -1, 0, -1, 115},   {2, -2, 0, 1, 107}
};

double eccentricityFactor(int m, double E) {
    if (m == 0) return 1.0;
    return (m == 1 || m == -1) ? E : E * E;
}

// ============================================================================
// Shared geometry
// ============================================================================

/// True geometric Sun longitude (mean equinox of date) and radius vector
void sunTrue(double T, double& lon, double& R) {
    double L0 = 280.46646 + 36000.76983 * T + 0.0003032 * T * T;
    double M = 357.52911 + 35999.05029 * T - 0.0001537 * T * T;
    double e = 0.016708634 - 0.000042037 * T - 0.0000001267 * T * T;
    double C = (1.914602 - 0.004817 * T - 0.000014 * T * T) * sinDeg(M)
             + (0.019993 - 0.000101 * T) * sinDeg(2.0 * M)
             + 0.000289 * sinDeg(3.0 * M);
    lon = normalizeDegrees(L0 + C);
    double nu = M + C;
    R = 1.000001018 * (1.0 - e * e) / (1.0 + e * cosDeg(nu));
}

/// Ecliptic precession J2000 -> date (Meeus 21.5 with t0 = 0)
void precessFromJ2000(double T, double& lon, double& lat) {
    double eta = (47.0029 * T - 0.03302 * T * T + 0.000060 * T * T * T) * ARCSEC_TO_DEG;
    double Pi = 174.876384 - (869.8089 * T - 0.03536 * T * T) * ARCSEC_TO_DEG;
    double p = (5029.0966 * T + 1.11113 * T * T - 0.000006 * T * T * T) * ARCSEC_TO_DEG;

    double A = cosDeg(eta) * cosDeg(lat) * sinDeg(Pi - lon) - sinDeg(eta) * sinDeg(lat);
    double B = cosDeg(lat) * cosDeg(Pi - lon);
    double C = cosDeg(eta) * sinDeg(lat) + sinDeg(eta) * cosDeg(lat) * sinDeg(Pi - lon);

    lon = normalizeDegrees(p + Pi - atan2Deg(A, B));
    lat = std::asin(C) * RAD_TO_DEG;
}

EclipticCoordinates sunApparent(double T, const time::Nutation& nut) {
    double lon, R;
    sunTrue(T, lon, R);
    EclipticCoordinates c;
    c.longitude = normalizeDegrees(lon + nut.dpsi - 20.4898 * ARCSEC_TO_DEG / R);
    c.latitude = 0.0;
    c.distance = R;
    return c;
}

EclipticCoordinates moonApparent(double T, const time::Nutation& nut) {
    double Lp = 218.3164477 + T * (481267.88123421 + T * (-0.0015786
                + T * (1.0 / 538841.0 - T / 65194000.0)));
    double D = 297.8501921 + T * (445267.1114034 + T * (-0.0018819
               + T * (1.0 / 545868.0 - T / 113065000.0)));
    double M = 357.5291092 + T * (35999.0502909 + T * (-0.0001536 + T / 24490000.0));
    double Mp = 134.9633964 + T * (477198.8675055 + T * (0.0087414
                + T * (1.0 / 69699.0 - T / 14712000.0)));
    double F = 93.2720950 + T * (483202.0175233 + T * (-0.0036539
               + T * (-1.0 / 3526000.0 + T / 863310000.0)));
    double E = 1.0 - 0.002516 * T - 0.0000074 * T * T;

    double A1 = 119.75 + 131.849 * T;
    double A2 = 53.09 + 479264.290 * T;
    double A3 = 313.45 + 481266.484 * T;

    double sl = 0.0;
    double sr = 0.0;
    for (const auto& t : MOON_LON_DIST) {
        double arg = t.d * D + t.m * M + t.mp * Mp + t.f * F;
        double ef = eccentricityFactor(t.m, E);
        sl += t.l * ef * sinDeg(arg);
        sr += t.r * ef * cosDeg(arg);
    }
    double sb = 0.0;
    for (const auto& t : MOON_LAT) {
        double arg = t.d * D + t.m * M + t.mp * Mp + t.f * F;
        sb += t.b * eccentricityFactor(t.m, E) * sinDeg(arg);
    }

    sl += 3958.0 * sinDeg(A1) + 1962.0 * sinDeg(Lp - F) + 318.0 * sinDeg(A2);
    sb += -2235.0 * sinDeg(Lp) + 382.0 * sinDeg(A3) + 175.0 * sinDeg(A1 - F)
        + 175.0 * sinDeg(A1 + F) + 127.0 * sinDeg(Lp - Mp) - 115.0 * sinDeg(Lp + Mp);

    EclipticCoordinates c;
    c.longitude = normalizeDegrees(Lp + sl / 1.0e6 + nut.dpsi);
    c.latitude = sb / 1.0e6;
    c.distance = (385000.56 + sr / 1000.0) / AU_KM;
    return c;
}

EclipticCoordinates planetApparent(Body body, double jd_tt, const time::Nutation& nut,
                                   double sun_true_lon) {
    const double T = time::julianCenturies(jd_tt);
    const Eigen::Vector3d earth = AnalyticalEphemeris::heliocentricJ2000(Body::SUN, jd_tt);

    Eigen::Vector3d geo = AnalyticalEphemeris::heliocentricJ2000(body, jd_tt) - earth;
    double tau = geo.norm() * LIGHT_TIME_DAYS_PER_AU;
    geo = AnalyticalEphemeris::heliocentricJ2000(body, jd_tt - tau) - earth;

    const double dist = geo.norm();
    double lon = atan2Deg(geo.y(), geo.x());
    double lat = std::asin(geo.z() / dist) * RAD_TO_DEG;

    precessFromJ2000(T, lon, lat);

    // Annual aberration (circular-orbit approximation)
    const double kappa = ABERRATION_CONSTANT_ARCSEC * ARCSEC_TO_DEG;
    double dlon = -kappa * cosDeg(sun_true_lon - lon) / cosDeg(lat);
    double dlat = -kappa * sinDeg(sun_true_lon - lon) * sinDeg(lat);

    EclipticCoordinates c;
    c.longitude = normalizeDegrees(lon + dlon + nut.dpsi);
    c.latitude = lat + dlat;
    c.distance = dist;
    return c;
}

} // anonymous namespace

// ============================================================================
// Public interface
// ============================================================================

Eigen::Vector3d AnalyticalEphemeris::heliocentricJ2000(Body body, double jd_tt) {
    const ElementSet& el = ELEMENTS[elementIndex(body)];
    const double T = time::julianCenturies(jd_tt);

    const double a = el.a + el.da * T;
    const double e = el.e + el.de * T;
    const double I = (el.I + el.dI * T) * DEG_TO_RAD;
    const double L = el.L + el.dL * T;
    const double varpi = el.varpi + el.dvarpi * T;
    const double node = (el.node + el.dnode * T) * DEG_TO_RAD;
    const double omega = (varpi - el.node - el.dnode * T) * DEG_TO_RAD;

    double M = normalizeDegrees(L - varpi);
    if (M > 180.0) M -= 360.0;
    const double E = solveKepler(M * DEG_TO_RAD, e);

    const double xp = a * (std::cos(E) - e);
    const double yp = a * std::sqrt(1.0 - e * e) * std::sin(E);

    const double cw = std::cos(omega), sw = std::sin(omega);
    const double cO = std::cos(node), sO = std::sin(node);
    const double cI = std::cos(I), sI = std::sin(I);

    Eigen::Vector3d r;
    r.x() = (cw * cO - sw * sO * cI) * xp + (-sw * cO - cw * sO * cI) * yp;
    r.y() = (cw * sO + sw * cO * cI) * xp + (-sw * sO + cw * cO * cI) * yp;
    r.z() = (sw * sI) * xp + (cw * sI) * yp;
    return r;
}

EclipticCoordinates AnalyticalEphemeris::sun(double jd_tt) {
    return sunApparent(time::julianCenturies(jd_tt), time::nutation(jd_tt));
}

EclipticCoordinates AnalyticalEphemeris::moon(double jd_tt) {
    return moonApparent(time::julianCenturies(jd_tt), time::nutation(jd_tt));
}

EclipticCoordinates AnalyticalEphemeris::planet(Body body, double jd_tt) {
    double lon, R;
    sunTrue(time::julianCenturies(jd_tt), lon, R);
    return planetApparent(body, jd_tt, time::nutation(jd_tt), lon);
}

double AnalyticalEphemeris::meanNode(double jd_tt) {
    const double T = time::julianCenturies(jd_tt);
    double omega = 125.0445479 - 1934.1362891 * T + 0.0020754 * T * T
                 + T * T * T / 467441.0 - T * T * T * T / 60616000.0;
    return normalizeDegrees(omega + time::nutation(jd_tt).dpsi);
}

std::vector<EclipticCoordinates> AnalyticalEphemeris::compute(const std::vector<Body>& bodies,
                                                              double jd_tt) {
    const double T = time::julianCenturies(jd_tt);
    const time::Nutation nut = time::nutation(jd_tt);
    double sun_lon, sun_r;
    sunTrue(T, sun_lon, sun_r);

    std::vector<EclipticCoordinates> out;
    out.reserve(bodies.size());
    for (Body body : bodies) {
        switch (body) {
            case Body::SUN:
                out.push_back(sunApparent(T, nut));
                break;
            case Body::MOON:
                out.push_back(moonApparent(T, nut));
                break;
            case Body::RAHU:
            case Body::KETU: {
                EclipticCoordinates c;
                c.longitude = meanNode(jd_tt);
                if (body == Body::KETU) c.longitude = normalizeDegrees(c.longitude + 180.0);
                out.push_back(c);
                break;
            }
            case Body::ASCENDANT:
            case Body::MIDHEAVEN:
                throw std::invalid_argument("Chart angles are not ephemeris bodies: " + bodyName(body));
            default:
                out.push_back(planetApparent(body, jd_tt, nut, sun_lon));
                break;
        }
    }
    return out;
}

} // namespace astchart::ephemeris
