/**
 * @file test_divisional.cpp
 * @brief Parashari divisional charts
 */

#include <gtest/gtest.h>
#include <astchart/divisional/DivisionalChartEngine.hpp>
#include <astchart/core/Errors.hpp>
#include "ChartFixtures.hpp"

using namespace astchart;
using namespace astchart::divisional;

TEST(DivisionalChartTest, NavamsaStartingSigns) {
    // Movable signs start from themselves, fixed from the 9th, dual from the 5th
    EXPECT_EQ(DivisionalChartEngine::vargaSign(0.5, 9), 0);     // Aries -> Aries
    EXPECT_EQ(DivisionalChartEngine::vargaSign(5.0, 9), 1);     // 2nd pada of Aries -> Taurus
    EXPECT_EQ(DivisionalChartEngine::vargaSign(30.5, 9), 9);    // Taurus -> Capricorn
    EXPECT_EQ(DivisionalChartEngine::vargaSign(60.5, 9), 6);    // Gemini -> Libra
    EXPECT_EQ(DivisionalChartEngine::vargaSign(95.0, 9), 4);    // Cancer, 2nd part -> Leo
    EXPECT_EQ(DivisionalChartEngine::vargaSign(359.9, 9), 11);  // Pisces, last part -> Pisces
}

TEST(DivisionalChartTest, Hora) {
    EXPECT_EQ(DivisionalChartEngine::vargaSign(10.0, 2), 4);    // Aries, 1st half -> Leo
    EXPECT_EQ(DivisionalChartEngine::vargaSign(20.0, 2), 3);    // Aries, 2nd half -> Cancer
    EXPECT_EQ(DivisionalChartEngine::vargaSign(40.0, 2), 3);    // Taurus, 1st half -> Cancer
}

TEST(DivisionalChartTest, DrekkanaFollowsTrines) {
    EXPECT_EQ(DivisionalChartEngine::vargaSign(5.0, 3), 0);
    EXPECT_EQ(DivisionalChartEngine::vargaSign(15.0, 3), 4);
    EXPECT_EQ(DivisionalChartEngine::vargaSign(25.0, 3), 8);
}

TEST(DivisionalChartTest, TrimsamsaUnequalParts) {
    EXPECT_EQ(DivisionalChartEngine::vargaSign(3.0, 30), 0);     // Aries, Mars
    EXPECT_EQ(DivisionalChartEngine::vargaSign(7.0, 30), 10);    // Aries, Saturn
    EXPECT_EQ(DivisionalChartEngine::vargaSign(33.0, 30), 1);    // Taurus, Venus
    EXPECT_EQ(DivisionalChartEngine::vargaSign(59.0, 30), 7);    // Taurus, Mars
}

TEST(DivisionalChartTest, VargaLongitudeStaysInVargaSign) {
    for (int factor : DivisionalChartEngine::defaultCatalog()) {
        for (double lon = 0.25; lon < 360.0; lon += 7.3) {
            double v = DivisionalChartEngine::vargaLongitude(lon, factor);
            EXPECT_GE(v, 0.0);
            EXPECT_LT(v, 360.0);
            EXPECT_EQ(signOf(v), DivisionalChartEngine::vargaSign(lon, factor))
                << "factor " << factor << " lon " << lon;
        }
    }
}

TEST(DivisionalChartTest, FactorOneIsIdentity) {
    DivisionalChartEngine engine;
    Chart chart = fixtures::makeChart(100.0, {{Body::SUN, 12.0}, {Body::MOON, 250.0}});
    DivisionalChart d1 = engine.derive(chart, 1);
    EXPECT_EQ(d1.factor, 1);
    EXPECT_EQ(d1.chart, chart);
}

TEST(DivisionalChartTest, NavamsaChartUsesWholeSignsFromVargaAscendant) {
    DivisionalChartEngine engine;
    Chart chart = fixtures::makeChart(35.0, {{Body::SUN, 5.0}});
    DivisionalChart d9 = engine.derive(chart, 9);

    EXPECT_EQ(d9.chart.house_system, HouseSystemType::WHOLE_SIGN);
    EXPECT_EQ(signOf(d9.chart.ascendant), DivisionalChartEngine::vargaSign(35.0, 9));
    EXPECT_DOUBLE_EQ(d9.chart.cusps[0], signOf(d9.chart.ascendant) * 30.0);

    const BodyPosition& sun = d9.chart.position(Body::SUN);
    EXPECT_EQ(sun.sign(), 1);
    EXPECT_EQ(sun.house, d9.chart.houseOf(sun.longitude));
    // Retrograde flags and speeds are carried over
    EXPECT_EQ(d9.chart.position(Body::RAHU).retrograde, chart.position(Body::RAHU).retrograde);
}

TEST(DivisionalChartTest, UnsupportedFactorThrows) {
    DivisionalChartEngine engine;
    Chart chart = fixtures::makeChart(0.0, {});
    try {
        engine.derive(chart, 61);
        FAIL() << "Expected UnsupportedParameter";
    } catch (const UnsupportedParameter& e) {
        EXPECT_EQ(e.parameter(), "division_factor");
        EXPECT_EQ(e.value(), "61");
    }

    DivisionalChartEngine narrow({1, 9});
    EXPECT_TRUE(narrow.supports(9));
    EXPECT_FALSE(narrow.supports(10));
    EXPECT_THROW(narrow.derive(chart, 10), UnsupportedParameter);
}

TEST(DivisionalChartTest, Names) {
    EXPECT_EQ(DivisionalChartEngine::divisionName(1), "Rasi");
    EXPECT_EQ(DivisionalChartEngine::divisionName(9), "Navamsa");
    EXPECT_TRUE(DivisionalChartEngine::hasRule(60));
    EXPECT_FALSE(DivisionalChartEngine::hasRule(61));
}
