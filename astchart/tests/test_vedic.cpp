/**
 * @file test_vedic.cpp
 * @brief Panchang elements, dosha checks, ashtakavarga and yogas
 */

#include <gtest/gtest.h>
#include <astchart/vedic/Panchang.hpp>
#include <astchart/vedic/DoshaAnalyzer.hpp>
#include <astchart/vedic/Ashtakavarga.hpp>
#include <astchart/vedic/YogaAnalyzer.hpp>
#include <astchart/core/Errors.hpp>
#include <astchart/ephemeris/AnalyticalEphemeris.hpp>
#include <astchart/time/TimeScale.hpp>
#include "ChartFixtures.hpp"
#include <algorithm>
#include <array>
#include <map>

using namespace astchart;
using namespace astchart::vedic;

// ============================================================================
// Panchang
// ============================================================================

TEST(PanchangTest, NewMoonStartsTheMonth) {
    Panchang p = PanchangCalculator::fromLongitudes(0.0, 0.0, 0);
    EXPECT_EQ(p.tithi, 1);
    EXPECT_EQ(p.tithi_name, "Pratipada");
    EXPECT_EQ(p.paksha, "shukla");
    EXPECT_EQ(p.nakshatra, 0);
    EXPECT_EQ(p.nakshatra_name, "Ashwini");
    EXPECT_EQ(p.pada, 1);
    EXPECT_EQ(p.yoga, 1);
    EXPECT_EQ(p.yoga_name, "Vishkambha");
    EXPECT_EQ(p.karana, 1);
    EXPECT_EQ(p.karana_name, "Kimstughna");
    EXPECT_EQ(p.vara_name, "Ravivara");
}

TEST(PanchangTest, TithiAndPaksha) {
    EXPECT_EQ(PanchangCalculator::fromLongitudes(10.0, 180.0, 1).tithi_name, "Purnima");
    Panchang waning = PanchangCalculator::fromLongitudes(0.0, 180.0, 1);
    EXPECT_EQ(waning.tithi, 16);
    EXPECT_EQ(waning.paksha, "krishna");
    EXPECT_EQ(waning.tithi_name, "Pratipada");

    Panchang dark = PanchangCalculator::fromLongitudes(20.0, 10.0, 1);
    EXPECT_EQ(dark.tithi, 30);
    EXPECT_EQ(dark.tithi_name, "Amavasya");
}

TEST(PanchangTest, Karanas) {
    EXPECT_EQ(PanchangCalculator::fromLongitudes(0.0, 6.5, 0).karana_name, "Bava");
    EXPECT_EQ(PanchangCalculator::fromLongitudes(0.0, 13.0, 0).karana_name, "Balava");
    EXPECT_EQ(PanchangCalculator::fromLongitudes(0.0, 337.0, 0).karana_name, "Vishti");
    EXPECT_EQ(PanchangCalculator::fromLongitudes(0.0, 343.0, 0).karana_name, "Shakuni");
    EXPECT_EQ(PanchangCalculator::fromLongitudes(0.0, 349.0, 0).karana_name, "Chatushpada");
    Panchang last = PanchangCalculator::fromLongitudes(0.0, 355.0, 0);
    EXPECT_EQ(last.karana, 60);
    EXPECT_EQ(last.karana_name, "Naga");
}

TEST(PanchangTest, ElementsStayInRange) {
    for (double sun = 0.5; sun < 360.0; sun += 23.7) {
        for (double moon = 0.25; moon < 360.0; moon += 17.1) {
            Panchang p = PanchangCalculator::fromLongitudes(sun, moon, 3);
            EXPECT_GE(p.tithi, 1);
            EXPECT_LE(p.tithi, 30);
            EXPECT_GE(p.nakshatra, 0);
            EXPECT_LE(p.nakshatra, 26);
            EXPECT_GE(p.pada, 1);
            EXPECT_LE(p.pada, 4);
            EXPECT_GE(p.yoga, 1);
            EXPECT_LE(p.yoga, 27);
            EXPECT_GE(p.karana, 1);
            EXPECT_LE(p.karana, 60);
            EXPECT_FALSE(p.yoga_name.empty());
            EXPECT_EQ(p.vara_name, "Budhavara");
        }
    }
}

TEST(PanchangTest, EclipseDayIsAmavasya) {
    // Total solar eclipse, 2024-04-08 (Monday), conjunction at 18:21 UT
    auto gateway = std::make_shared<ephemeris::EphemerisGateway>(
        std::make_shared<ephemeris::AnalyticalEphemeris>());
    PanchangCalculator calc(gateway);
    Panchang p = calc.at(time::julianDay(2024, 4, 8.5), 0.0);
    EXPECT_EQ(p.tithi, 30);
    EXPECT_EQ(p.vara, 1);
    EXPECT_EQ(p.vara_name, "Somavara");

    // Full moon at 23:49 UT on 2024-04-23
    Panchang full = calc.at(time::julianDay(2024, 4, 23.5), 0.0);
    EXPECT_EQ(full.tithi, 15);
    EXPECT_EQ(full.tithi_name, "Purnima");
}

// ============================================================================
// Doshas
// ============================================================================

TEST(DoshaTest, SignHouse) {
    EXPECT_EQ(DoshaAnalyzer::signHouse(0, 0), 1);
    EXPECT_EQ(DoshaAnalyzer::signHouse(0, 3), 4);
    EXPECT_EQ(DoshaAnalyzer::signHouse(6, 3), 10);
    EXPECT_EQ(DoshaAnalyzer::signHouse(3, 2), 12);
}

TEST(DoshaTest, ManglikFromLagna) {
    Chart chart = fixtures::makeChart(5.0, {{Body::MARS, 100.0}, {Body::MOON, 200.0}});
    ManglikResult m = DoshaAnalyzer::manglik(chart);
    EXPECT_TRUE(m.present);
    EXPECT_TRUE(m.from_lagna);
    EXPECT_FALSE(m.from_moon);
    EXPECT_EQ(m.house_from_lagna, 4);
    EXPECT_EQ(m.house_from_moon, 10);
}

TEST(DoshaTest, NotManglik) {
    Chart chart = fixtures::makeChart(5.0, {{Body::MARS, 70.0}, {Body::MOON, 10.0}});
    ManglikResult m = DoshaAnalyzer::manglik(chart);
    EXPECT_FALSE(m.present);
    EXPECT_EQ(m.house_from_lagna, 3);
    EXPECT_EQ(m.house_from_moon, 3);
}

TEST(DoshaTest, KaalSarpRahuToKetu) {
    Chart chart = fixtures::makeChart(5.0, {
        {Body::RAHU, 100.0}, {Body::KETU, 280.0},
        {Body::SUN, 120.0}, {Body::MOON, 150.0}, {Body::MERCURY, 130.0}, {Body::VENUS, 160.0},
        {Body::MARS, 200.0}, {Body::JUPITER, 240.0}, {Body::SATURN, 270.0}});
    KaalSarpResult k = DoshaAnalyzer::kaalSarp(chart);
    EXPECT_TRUE(k.present);
    EXPECT_EQ(k.direction, "rahu-to-ketu");
    EXPECT_EQ(k.rahu_house, 4);
    EXPECT_EQ(k.name, "Shankhpal");
}

TEST(DoshaTest, KaalSarpKetuToRahu) {
    Chart chart = fixtures::makeChart(5.0, {
        {Body::RAHU, 100.0}, {Body::KETU, 280.0},
        {Body::SUN, 300.0}, {Body::MOON, 330.0}, {Body::MERCURY, 290.0}, {Body::VENUS, 10.0},
        {Body::MARS, 40.0}, {Body::JUPITER, 60.0}, {Body::SATURN, 90.0}});
    KaalSarpResult k = DoshaAnalyzer::kaalSarp(chart);
    EXPECT_TRUE(k.present);
    EXPECT_EQ(k.direction, "ketu-to-rahu");
}

TEST(DoshaTest, KaalSarpBrokenByOnePlanet) {
    Chart chart = fixtures::makeChart(5.0, {
        {Body::RAHU, 100.0}, {Body::KETU, 280.0},
        {Body::SUN, 120.0}, {Body::MOON, 150.0}, {Body::MERCURY, 130.0}, {Body::VENUS, 160.0},
        {Body::MARS, 200.0}, {Body::JUPITER, 240.0}, {Body::SATURN, 300.0}});
    KaalSarpResult k = DoshaAnalyzer::kaalSarp(chart);
    EXPECT_FALSE(k.present);
    EXPECT_TRUE(k.direction.empty());
    EXPECT_TRUE(k.name.empty());
}

TEST(DoshaTest, SadeSatiPhases) {
    Chart natal = fixtures::makeChart(5.0, {{Body::MOON, 100.0}});   // Cancer
    EXPECT_EQ(DoshaAnalyzer::sadeSati(natal, 70.0).phase, "rising");
    EXPECT_EQ(DoshaAnalyzer::sadeSati(natal, 100.0).phase, "peak");
    EXPECT_EQ(DoshaAnalyzer::sadeSati(natal, 130.0).phase, "setting");
    EXPECT_TRUE(DoshaAnalyzer::sadeSati(natal, 130.0).active);

    SadeSatiResult panoti = DoshaAnalyzer::sadeSati(natal, 190.0);
    EXPECT_FALSE(panoti.active);
    EXPECT_TRUE(panoti.small_panoti);

    SadeSatiResult clear = DoshaAnalyzer::sadeSati(natal, 250.0);
    EXPECT_FALSE(clear.active);
    EXPECT_FALSE(clear.small_panoti);
    EXPECT_EQ(clear.phase, "none");
    EXPECT_EQ(clear.moon_sign, 3);
    EXPECT_EQ(clear.saturn_sign, 8);
}

// ============================================================================
// Ashtakavarga
// ============================================================================

TEST(AshtakavargaTest, PlanetTotalsDoNotDependOnTheChart) {
    const std::map<Body, int> expected = {
        {Body::SUN, 48}, {Body::MOON, 49}, {Body::MERCURY, 54}, {Body::VENUS, 52},
        {Body::MARS, 39}, {Body::JUPITER, 56}, {Body::SATURN, 39}
    };
    const Chart charts[] = {
        fixtures::makeChart(5.0, {}),
        fixtures::makeChart(217.0, {{Body::SUN, 300.0}, {Body::MOON, 12.0}, {Body::SATURN, 299.0}}),
        fixtures::makeChart(95.0, {{Body::MARS, 95.0}, {Body::JUPITER, 96.0}, {Body::VENUS, 97.0}}),
    };
    for (const Chart& chart : charts) {
        AshtakavargaResult r = AshtakavargaCalculator::calculate(chart);
        ASSERT_EQ(r.planets.size(), 7u);
        int sum = 0;
        for (const auto& t : r.planets) {
            EXPECT_EQ(t.total, expected.at(t.body)) << bodyName(t.body);
            for (int b : t.bindus) {
                EXPECT_GE(b, 0);
                EXPECT_LE(b, 8);
            }
        }
        for (int s = 0; s < 12; ++s) sum += r.sarva[s];
        EXPECT_EQ(sum, 337);
        EXPECT_EQ(r.sarva_total, 337);
        EXPECT_EQ(r.by_house[0], r.sarva[chart.ascendantSign()]);
    }
}

TEST(AshtakavargaTest, EveryReferenceInAries) {
    Chart chart = fixtures::makeChart(5.0, {
        {Body::SUN, 5.0}, {Body::MOON, 10.0}, {Body::MERCURY, 15.0}, {Body::VENUS, 20.0},
        {Body::MARS, 25.0}, {Body::JUPITER, 1.0}, {Body::SATURN, 29.0}});

    // Sun gets a bindu in the 1st from Sun, Mars and Saturn, and in the 11th
    // from every reference except Venus
    BhinnaAshtakavarga sun = AshtakavargaCalculator::forPlanet(chart, Body::SUN);
    EXPECT_EQ(sun.bindus[0], 3);
    EXPECT_EQ(sun.bindus[10], 7);

    AshtakavargaResult r = AshtakavargaCalculator::calculate(chart);
    const std::array<int, 12> sarva = {24, 21, 29, 25, 26, 34, 19, 26, 26, 36, 54, 17};
    EXPECT_EQ(r.sarva, sarva);
    EXPECT_EQ(r.by_house, sarva);
    EXPECT_EQ(r.strong_houses, (std::vector<int>{3, 6, 10, 11}));
    EXPECT_EQ(r.weak_houses, (std::vector<int>{1, 2, 7, 12}));

    EXPECT_EQ(AshtakavargaCalculator::bindusAt(r, Body::SUN, 310.0), 7);
}

TEST(AshtakavargaTest, OnlyClassicalPlanetsHaveTables) {
    Chart chart = fixtures::makeChart(5.0, {});
    EXPECT_THROW(AshtakavargaCalculator::forPlanet(chart, Body::RAHU), UnsupportedParameter);
    AshtakavargaResult r = AshtakavargaCalculator::calculate(chart);
    EXPECT_THROW(AshtakavargaCalculator::bindusAt(r, Body::URANUS, 10.0), UnsupportedParameter);
}

// ============================================================================
// Yogas
// ============================================================================

namespace {

bool hasPair(const std::vector<YogaFinding>& found, Body a, Body b) {
    return std::any_of(found.begin(), found.end(), [a, b](const YogaFinding& y) {
        return y.bodies == std::vector<Body>{a, b};
    });
}

} // namespace

TEST(YogaTest, HouseLords) {
    Chart chart = fixtures::makeChart(5.0, {});
    EXPECT_EQ(YogaAnalyzer::houseLord(chart, 1), Body::MARS);
    EXPECT_EQ(YogaAnalyzer::houseLord(chart, 10), Body::SATURN);
    EXPECT_EQ(YogaAnalyzer::houseLord(chart, 12), Body::JUPITER);
    EXPECT_THROW(YogaAnalyzer::houseLord(chart, 13), UnsupportedParameter);
}

TEST(YogaTest, RuchakaFromExaltedMarsInTenth) {
    Chart chart = fixtures::makeChart(5.0, {{Body::MARS, 280.0}, {Body::SATURN, 100.0}});
    std::vector<YogaFinding> found = YogaAnalyzer::panchaMahapurusha(chart);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Ruchaka");
    EXPECT_EQ(found[0].group, "mahapurusha");
    EXPECT_EQ(found[0].bodies, std::vector<Body>{Body::MARS});
    EXPECT_EQ(found[0].detail, "mars exalted in house 10");

    // Capricorn is the 9th from a Taurus lagna
    Chart taurus = fixtures::makeChart(35.0, {{Body::MARS, 280.0}, {Body::SATURN, 100.0}});
    EXPECT_TRUE(YogaAnalyzer::panchaMahapurusha(taurus).empty());
}

TEST(YogaTest, ShashaFromSaturnInLibra) {
    std::vector<YogaFinding> found = YogaAnalyzer::panchaMahapurusha(fixtures::makeChart(5.0, {}));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Shasha");
}

TEST(YogaTest, GajaKesari) {
    auto present = YogaAnalyzer::gajaKesari(
        fixtures::makeChart(5.0, {{Body::MOON, 45.0}, {Body::JUPITER, 135.0}}));
    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(present->auspicious);
    EXPECT_EQ(present->detail, "jupiter in house 4 from the moon");

    EXPECT_FALSE(YogaAnalyzer::gajaKesari(
        fixtures::makeChart(5.0, {{Body::MOON, 45.0}, {Body::JUPITER, 165.0}})).has_value());
}

TEST(YogaTest, KemadrumaIgnoresTheSun) {
    // Moon in Taurus with only the Sun in Aries and nothing in Gemini
    auto lonely = YogaAnalyzer::kemadruma(fixtures::makeChart(5.0, {{Body::MERCURY, 200.0}}));
    ASSERT_TRUE(lonely.has_value());
    EXPECT_FALSE(lonely->auspicious);

    // Mercury in Gemini flanks the Moon
    EXPECT_FALSE(YogaAnalyzer::kemadruma(fixtures::makeChart(5.0, {})).has_value());
}

TEST(YogaTest, RajaYogaByConjunctionAndExchange) {
    // Aries lagna: Moon lords the 4th, Jupiter the 9th
    Chart chart = fixtures::makeChart(5.0, {{Body::MOON, 100.0}, {Body::JUPITER, 110.0}});
    std::vector<YogaFinding> raja = YogaAnalyzer::rajaYogas(chart);
    EXPECT_EQ(raja.size(), 3u);
    EXPECT_TRUE(hasPair(raja, Body::MOON, Body::JUPITER));
    EXPECT_TRUE(hasPair(raja, Body::VENUS, Body::JUPITER));
    // Sun in Aries and Mars in Leo exchange signs
    EXPECT_TRUE(hasPair(raja, Body::SUN, Body::MARS));
    for (const auto& y : raja) {
        EXPECT_EQ(y.group, "raja");
        EXPECT_TRUE(y.auspicious);
    }

    Chart apart = fixtures::makeChart(5.0, {{Body::MOON, 100.0}, {Body::JUPITER, 165.0}});
    std::vector<YogaFinding> rest = YogaAnalyzer::rajaYogas(apart);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].detail, "mars and sun exchange signs");
}

TEST(YogaTest, DhanaYoga) {
    // Venus lords the 2nd, Jupiter the 9th
    Chart chart = fixtures::makeChart(5.0, {{Body::MOON, 100.0}, {Body::JUPITER, 110.0}});
    std::vector<YogaFinding> dhana = YogaAnalyzer::dhanaYogas(chart);
    ASSERT_EQ(dhana.size(), 1u);
    EXPECT_EQ(dhana[0].bodies, (std::vector<Body>{Body::VENUS, Body::JUPITER}));
    EXPECT_EQ(dhana[0].detail, "venus and jupiter together in Cancer");

    EXPECT_TRUE(YogaAnalyzer::dhanaYogas(fixtures::makeChart(5.0, {})).empty());
}

TEST(YogaTest, AnalyzeCollectsGroupsInOrder) {
    Chart chart = fixtures::makeChart(5.0, {{Body::MOON, 100.0}, {Body::JUPITER, 110.0}});
    std::vector<YogaFinding> all = YogaAnalyzer::analyze(chart);
    // Exalted Jupiter in the 4th adds Hamsa to Shasha, then Gaja Kesari,
    // three Raja and one Dhana
    ASSERT_EQ(all.size(), 7u);
    EXPECT_EQ(all[0].name, "Hamsa");
    EXPECT_EQ(all[1].name, "Shasha");
    EXPECT_EQ(all[2].name, "Gaja Kesari");
    EXPECT_EQ(all.back().group, "dhana");
    EXPECT_THROW(YogaAnalyzer::analyzeGroup(chart, "nabhasa"), UnsupportedParameter);
}
