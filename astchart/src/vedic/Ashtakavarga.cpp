/**
 * @file Ashtakavarga.cpp
 * @brief Bindu tables
 * @author AstChart Team
 * @date 2026-02-21
 */

#include "astchart/vedic/Ashtakavarga.hpp"
#include "astchart/core/Errors.hpp"

namespace astchart::vedic {

namespace {

constexpr int REFERENCE_COUNT = 8;   // seven planets and the lagna
constexpr int LAGNA = 7;

// Houses counted from each reference (Sun, Moon, Mercury, Venus, Mars,
// Jupiter, Saturn, Lagna) that give a bindu, per planet in Body order
const std::vector<int> BINDU_HOUSES[7][REFERENCE_COUNT] = {
    // Sun
    {{1, 2, 4, 7, 8, 9, 10, 11}, {3, 6, 10, 11}, {3, 5, 6, 9, 10, 11, 12}, {6, 7, 12},
     {1, 2, 4, 7, 8, 9, 10, 11}, {5, 6, 9, 11}, {1, 2, 4, 7, 8, 9, 10, 11},
     {3, 4, 6, 10, 11, 12}},
    // Moon
    {{3, 6, 7, 8, 10, 11}, {1, 3, 6, 7, 10, 11}, {1, 3, 4, 5, 7, 8, 10, 11},
     {3, 4, 5, 7, 9, 10, 11}, {2, 3, 5, 6, 9, 10, 11}, {1, 4, 7, 8, 10, 11, 12},
     {3, 5, 6, 11}, {3, 6, 10, 11}},
    // Mercury
    {{5, 6, 9, 11, 12}, {2, 4, 6, 8, 10, 11}, {1, 3, 5, 6, 9, 10, 11, 12},
     {1, 2, 3, 4, 5, 8, 9, 11}, {1, 2, 4, 7, 8, 9, 10, 11}, {6, 8, 11, 12},
     {1, 2, 4, 7, 8, 9, 10, 11}, {1, 2, 4, 6, 8, 10, 11}},
    // Venus
    {{8, 11, 12}, {1, 2, 3, 4, 5, 8, 9, 11, 12}, {3, 5, 6, 9, 11},
     {1, 2, 3, 4, 5, 8, 9, 10, 11}, {3, 5, 6, 9, 11, 12}, {5, 8, 9, 10, 11},
     {3, 4, 5, 8, 9, 10, 11}, {1, 2, 3, 4, 5, 8, 9, 11}},
    // Mars
    {{3, 5, 6, 10, 11}, {3, 6, 11}, {3, 5, 6, 11}, {6, 8, 11, 12},
     {1, 2, 4, 7, 8, 10, 11}, {6, 10, 11, 12}, {1, 4, 7, 8, 9, 10, 11},
     {1, 3, 6, 10, 11}},
    // Jupiter
    {{1, 2, 3, 4, 7, 8, 9, 10, 11}, {2, 5, 7, 9, 11}, {1, 2, 4, 5, 6, 9, 10, 11},
     {2, 5, 6, 9, 10, 11}, {1, 2, 4, 7, 8, 10, 11}, {1, 2, 3, 4, 7, 8, 10, 11},
     {3, 5, 6, 12}, {1, 2, 4, 5, 6, 7, 9, 10, 11}},
    // Saturn
    {{1, 2, 4, 7, 8, 10, 11}, {3, 6, 11}, {6, 8, 9, 10, 11, 12}, {6, 11, 12},
     {3, 5, 6, 10, 11, 12}, {5, 6, 11, 12}, {3, 5, 6, 11}, {1, 3, 4, 6, 10, 11}},
};

int planetIndex(Body body) {
    const int i = static_cast<int>(body);
    if (i < 0 || i > static_cast<int>(Body::SATURN)) {
        throw UnsupportedParameter("ashtakavarga body", bodyName(body));
    }
    return i;
}

} // anonymous namespace

BhinnaAshtakavarga AshtakavargaCalculator::forPlanet(const Chart& chart, Body body) {
    const int row = planetIndex(body);

    int reference_signs[REFERENCE_COUNT];
    for (Body b : classicalPlanets()) {
        reference_signs[static_cast<int>(b)] = chart.position(b).sign();
    }
    reference_signs[LAGNA] = chart.ascendantSign();

    BhinnaAshtakavarga t;
    t.body = body;
    for (int ref = 0; ref < REFERENCE_COUNT; ++ref) {
        for (int house : BINDU_HOUSES[row][ref]) {
            ++t.bindus[(reference_signs[ref] + house - 1) % 12];
            ++t.total;
        }
    }
    return t;
}

AshtakavargaResult AshtakavargaCalculator::calculate(const Chart& chart) {
    AshtakavargaResult r;
    for (Body body : classicalPlanets()) {
        r.planets.push_back(forPlanet(chart, body));
        const auto& t = r.planets.back();
        for (int s = 0; s < 12; ++s) r.sarva[s] += t.bindus[s];
        r.sarva_total += t.total;
    }

    const int lagna = chart.ascendantSign();
    for (int h = 0; h < 12; ++h) {
        r.by_house[h] = r.sarva[(lagna + h) % 12];
        if (r.by_house[h] >= STRONG_SIGN) r.strong_houses.push_back(h + 1);
        if (r.by_house[h] < WEAK_SIGN) r.weak_houses.push_back(h + 1);
    }
    return r;
}

int AshtakavargaCalculator::bindusAt(const AshtakavargaResult& result, Body body,
                                     double longitude) {
    for (const auto& t : result.planets) {
        if (t.body == body) return t.bindus[signOf(longitude)];
    }
    throw UnsupportedParameter("ashtakavarga body", bodyName(body));
}

} // namespace astchart::vedic
