/**
 * @file test_compatibility.cpp
 * @brief Synastry, composite and midpoint-instant charts
 */

#include <gtest/gtest.h>
#include <astchart/compatibility/CompatibilityEngine.hpp>
#include <astchart/ephemeris/AnalyticalEphemeris.hpp>
#include <astchart/core/Angles.hpp>
#include <astchart/core/Errors.hpp>
#include "ChartFixtures.hpp"
#include <algorithm>

using namespace astchart;
using namespace astchart::compatibility;

class CompatibilityEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto gateway = std::make_shared<ephemeris::EphemerisGateway>(
            std::make_shared<ephemeris::AnalyticalEphemeris>());
        builder = std::make_shared<ChartBuilder>(gateway);
        engine = std::make_unique<CompatibilityEngine>(builder);

        Subject a("A", time::CivilDateTime{1988, 11, 2, 6, 15, 0.0}, GeoLocation{45.46, 9.19, 0.0}, 1.0);
        Subject b("B", time::CivilDateTime{1991, 4, 27, 22, 40, 0.0}, GeoLocation{40.42, -3.70, 0.0}, 2.0);
        chart_a = builder->buildNatal(a);
        chart_b = builder->buildNatal(b);
    }

    std::shared_ptr<ChartBuilder> builder;
    std::unique_ptr<CompatibilityEngine> engine;
    Chart chart_a;
    Chart chart_b;
};

TEST_F(CompatibilityEngineTest, SelfComparisonScoresMaximum) {
    CompatibilityReport r = engine->compare(chart_a, chart_a);
    EXPECT_DOUBLE_EQ(r.luminary, 100.0);
    EXPECT_DOUBLE_EQ(r.affection, 100.0);
    EXPECT_DOUBLE_EQ(r.structural, 100.0);
    EXPECT_DOUBLE_EQ(r.overall, 100.0);
}

TEST_F(CompatibilityEngineTest, ScoresAreBounded) {
    CompatibilityReport r = engine->compare(chart_a, chart_b);
    for (double s : {r.luminary, r.affection, r.structural, r.overall}) {
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 100.0);
    }
    EXPECT_DOUBLE_EQ(engine->compare(chart_b, chart_a).overall, r.overall);
}

TEST_F(CompatibilityEngineTest, SwappingChartsTransposesMatrix) {
    auto ab = engine->compare(chart_a, chart_b).matrix;
    auto ba = engine->compare(chart_b, chart_a).matrix;
    ASSERT_EQ(ab.size(), ba.size());
    for (const auto& x : ab) {
        auto it = std::find_if(ba.begin(), ba.end(), [&](const aspects::CrossAspect& y) {
            return y.from == x.to && y.to == x.from;
        });
        ASSERT_NE(it, ba.end());
        EXPECT_EQ(it->aspect.type, x.aspect.type);
        EXPECT_DOUBLE_EQ(it->aspect.orb, x.aspect.orb);
    }
}

TEST_F(CompatibilityEngineTest, CompositeUsesShorterArcMidpoints) {
    Chart c = CompatibilityEngine::composite(chart_a, chart_b);
    for (size_t i = 0; i < c.positions.size(); ++i) {
        double la = chart_a.positions[i].longitude;
        double lb = chart_b.positions[i].longitude;
        EXPECT_DOUBLE_EQ(c.positions[i].longitude, CompatibilityEngine::midpoint(la, lb));
        EXPECT_LE(angularSeparation(c.positions[i].longitude, la), 90.0 + 1e-9);
    }
    EXPECT_DOUBLE_EQ(c.ascendant, CompatibilityEngine::midpoint(chart_a.ascendant, chart_b.ascendant));
}

TEST_F(CompatibilityEngineTest, SwappingChartsKeepsDerivedCharts) {
    CompatibilityReport ab = engine->compare(chart_a, chart_b);
    CompatibilityReport ba = engine->compare(chart_b, chart_a);
    EXPECT_EQ(ab.composite, ba.composite);
    EXPECT_EQ(ab.midpoint_chart, ba.midpoint_chart);
}

TEST_F(CompatibilityEngineTest, CompositeCuspsStayInOrder) {
    // Half a day apart the two charts' cusps are roughly opposite
    GeoLocation greenwich{51.48, 0.0, 0.0};
    Chart morning = builder->buildNatal(
        Subject("M", time::CivilDateTime{2000, 3, 20, 6, 0, 0.0}, greenwich, 0.0));
    Chart evening = builder->buildNatal(
        Subject("E", time::CivilDateTime{2000, 3, 20, 18, 30, 0.0}, greenwich, 0.0));

    for (const Chart* other : {&evening, &chart_b}) {
        Chart c = CompatibilityEngine::composite(morning, *other);
        double total = 0.0;
        for (int i = 0; i < 12; ++i) {
            total += normalizeDegrees(c.cusps[(i + 1) % 12] - c.cusps[i]);
        }
        EXPECT_NEAR(total, 360.0, 1e-9);
        for (const auto& p : c.positions) {
            EXPECT_EQ(p.house, c.houseOf(p.longitude));
        }
    }
}

TEST_F(CompatibilityEngineTest, CompositeNeedsMatchingFrames) {
    Chart sidereal = builder->buildAt(chart_b.subject, chart_b.jd_ut, chart_b.location,
                                      chart_b.house_system, ZodiacType::SIDEREAL);
    EXPECT_THROW(CompatibilityEngine::composite(chart_a, sidereal), UnsupportedParameter);
}

TEST_F(CompatibilityEngineTest, MidpointInstantChart) {
    GeoLocation paris{48.85, 2.35, 0.0};
    Chart m = engine->midpointInstantChart(chart_a, chart_b, paris);
    EXPECT_DOUBLE_EQ(m.jd_ut, (chart_a.jd_ut + chart_b.jd_ut) / 2.0);
    EXPECT_EQ(m.location, paris);
    EXPECT_EQ(m.positions.size(), chart_a.positions.size());
}

TEST(CompatibilityMathTest, Midpoints) {
    EXPECT_DOUBLE_EQ(CompatibilityEngine::midpoint(10.0, 50.0), 30.0);
    EXPECT_DOUBLE_EQ(CompatibilityEngine::midpoint(350.0, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(CompatibilityEngine::midpoint(10.0, 350.0), 0.0);
    // Exact opposition resolves to the lower longitude plus 90
    EXPECT_DOUBLE_EQ(CompatibilityEngine::midpoint(10.0, 190.0), 100.0);
    EXPECT_DOUBLE_EQ(CompatibilityEngine::midpoint(190.0, 10.0), 100.0);
}

TEST(CompatibilityMathTest, GeographicMidpoint) {
    GeoLocation m = CompatibilityEngine::geographicMidpoint(GeoLocation{0.0, 0.0, 0.0},
                                                            GeoLocation{0.0, 90.0, 0.0});
    EXPECT_NEAR(m.latitude, 0.0, 1e-9);
    EXPECT_NEAR(m.longitude, 45.0, 1e-9);
}

TEST(CompatibilityMathTest, PairHarmony) {
    double conj = CompatibilityEngine::pairHarmony(100.0, 100.0);
    EXPECT_DOUBLE_EQ(conj, 1.0);
    double square = CompatibilityEngine::pairHarmony(100.0, 190.0);
    EXPECT_LT(square, CompatibilityEngine::pairHarmony(100.0, 220.0));   // trine
    EXPECT_GE(square, 0.0);
}
