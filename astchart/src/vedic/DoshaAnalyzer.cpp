/**
 * @file DoshaAnalyzer.cpp
 * @brief Dosha rules
 * @author AstChart Team
 * @date 2026-02-21
 */

#include "astchart/vedic/DoshaAnalyzer.hpp"
#include "astchart/core/Angles.hpp"

namespace astchart::vedic {

namespace {

const char* const KAAL_SARP_NAMES[12] = {
    "Anant", "Kulik", "Vasuki", "Shankhpal", "Padma", "Mahapadma",
    "Takshak", "Karkotak", "Shankhachur", "Ghatak", "Vishdhar", "Sheshnag"
};

bool isManglikHouse(int house) {
    return house == 1 || house == 2 || house == 4 || house == 7 || house == 8 || house == 12;
}

} // anonymous namespace

int DoshaAnalyzer::signHouse(int from_sign, int to_sign) {
    return ((to_sign - from_sign) % 12 + 12) % 12 + 1;
}

ManglikResult DoshaAnalyzer::manglik(const Chart& chart) {
    const int mars = chart.position(Body::MARS).sign();
    ManglikResult r;
    r.house_from_lagna = signHouse(chart.ascendantSign(), mars);
    r.house_from_moon = signHouse(chart.position(Body::MOON).sign(), mars);
    r.from_lagna = isManglikHouse(r.house_from_lagna);
    r.from_moon = isManglikHouse(r.house_from_moon);
    r.present = r.from_lagna || r.from_moon;
    return r;
}

KaalSarpResult DoshaAnalyzer::kaalSarp(const Chart& chart) {
    const double rahu = chart.position(Body::RAHU).longitude;
    const double ketu = chart.position(Body::KETU).longitude;

    bool all_forward = true;
    bool all_backward = true;
    for (Body b : classicalPlanets()) {
        const double lon = chart.position(b).longitude;
        if (!inForwardArc(lon, rahu, ketu)) all_forward = false;
        if (!inForwardArc(lon, ketu, rahu)) all_backward = false;
    }

    KaalSarpResult r;
    r.rahu_house = signHouse(chart.ascendantSign(), signOf(rahu));
    r.present = all_forward || all_backward;
    if (r.present) {
        r.direction = all_forward ? "rahu-to-ketu" : "ketu-to-rahu";
        r.name = KAAL_SARP_NAMES[r.rahu_house - 1];
    }
    return r;
}

SadeSatiResult DoshaAnalyzer::sadeSati(const Chart& natal, double saturn_longitude) {
    SadeSatiResult r;
    r.moon_sign = natal.position(Body::MOON).sign();
    r.saturn_sign = signOf(saturn_longitude);

    switch (signHouse(r.moon_sign, r.saturn_sign)) {
        case 12: r.active = true; r.phase = "rising"; break;
        case 1:  r.active = true; r.phase = "peak"; break;
        case 2:  r.active = true; r.phase = "setting"; break;
        case 4:
        case 8:  r.small_panoti = true; r.phase = "none"; break;
        default: r.phase = "none"; break;
    }
    return r;
}

} // namespace astchart::vedic
