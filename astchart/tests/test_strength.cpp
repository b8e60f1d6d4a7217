/**
 * @file test_strength.cpp
 * @brief Dignities and six-fold planetary strength
 */

#include <gtest/gtest.h>
#include <astchart/strength/StrengthEngine.hpp>
#include "ChartFixtures.hpp"
#include <set>

using namespace astchart;
using namespace astchart::strength;

TEST(DignityTest, SunDignities) {
    EXPECT_EQ(StrengthEngine::dignity(Body::SUN, 10.0), Dignity::EXALTED);
    EXPECT_EQ(StrengthEngine::dignity(Body::SUN, 130.0), Dignity::MOOLATRIKONA);
    EXPECT_EQ(StrengthEngine::dignity(Body::SUN, 140.0), Dignity::OWN_SIGN);
    EXPECT_EQ(StrengthEngine::dignity(Body::SUN, 190.0), Dignity::DEBILITATED);
}

TEST(DignityTest, MoonSharesExaltationAndMoolatrikonaSign) {
    EXPECT_EQ(StrengthEngine::dignity(Body::MOON, 32.0), Dignity::EXALTED);
    EXPECT_EQ(StrengthEngine::dignity(Body::MOON, 40.0), Dignity::MOOLATRIKONA);
    EXPECT_EQ(StrengthEngine::dignity(Body::MOON, 100.0), Dignity::OWN_SIGN);
}

TEST(DignityTest, NaturalRelationships) {
    EXPECT_EQ(StrengthEngine::dignity(Body::SATURN, 200.0), Dignity::EXALTED);
    EXPECT_EQ(StrengthEngine::dignity(Body::SATURN, 10.0), Dignity::DEBILITATED);
    EXPECT_EQ(StrengthEngine::dignity(Body::JUPITER, 70.0), Dignity::ENEMY);     // Gemini
    EXPECT_EQ(StrengthEngine::dignity(Body::JUPITER, 10.0), Dignity::FRIEND);    // Aries
}

TEST(DignityTest, SignLordsAndAspects) {
    EXPECT_EQ(StrengthEngine::signLord(0), Body::MARS);
    EXPECT_EQ(StrengthEngine::signLord(3), Body::MOON);
    EXPECT_EQ(StrengthEngine::signLord(11), Body::JUPITER);
    EXPECT_TRUE(StrengthEngine::castsAspect(Body::VENUS, 7));
    EXPECT_FALSE(StrengthEngine::castsAspect(Body::VENUS, 5));
    EXPECT_TRUE(StrengthEngine::castsAspect(Body::MARS, 8));
    EXPECT_TRUE(StrengthEngine::castsAspect(Body::JUPITER, 9));
    EXPECT_TRUE(StrengthEngine::castsAspect(Body::SATURN, 10));
    EXPECT_DOUBLE_EQ(StrengthEngine::exaltationPoint(Body::SUN), 10.0);
}

TEST(StrengthEngineTest, ComponentsAreBounded) {
    StrengthEngine engine;
    Chart chart = fixtures::makeChart(95.0, {{Body::SUN, 10.0}, {Body::MOON, 200.0},
                                            {Body::MARS, 298.0}, {Body::SATURN, 45.0}});
    auto scores = engine.score(chart);
    ASSERT_EQ(scores.size(), 7u);

    std::set<int> ranks;
    for (Body b : classicalPlanets()) {
        ASSERT_EQ(scores.count(b), 1u);
        const StrengthScore& s = scores.at(b);
        for (double c : {s.positional, s.directional, s.temporal, s.motional, s.natural,
                         s.aspectual}) {
            EXPECT_GE(c, 0.0) << bodyName(b);
            EXPECT_LE(c, 1.0) << bodyName(b);
        }
        EXPECT_NEAR(s.total, s.positional + s.directional + s.temporal + s.motional
                                 + s.natural + s.aspectual, 1e-12);
        ranks.insert(s.rank);
    }
    EXPECT_EQ(ranks, (std::set<int>{1, 2, 3, 4, 5, 6, 7}));

    for (Body a : classicalPlanets()) {
        for (Body b : classicalPlanets()) {
            if (scores.at(a).rank < scores.at(b).rank) {
                EXPECT_GE(scores.at(a).total, scores.at(b).total);
            }
        }
    }
}

TEST(StrengthEngineTest, ExaltationBeatsDebilitation) {
    StrengthEngine engine;
    Chart exalted = fixtures::makeChart(0.0, {{Body::SUN, 10.0}});
    Chart debilitated = fixtures::makeChart(0.0, {{Body::SUN, 190.0}});
    double high = engine.score(exalted).at(Body::SUN).positional;
    double low = engine.score(debilitated).at(Body::SUN).positional;
    EXPECT_DOUBLE_EQ(high, 1.0);
    EXPECT_GT(high, low);
    EXPECT_EQ(engine.score(exalted).at(Body::SUN).dignity, Dignity::EXALTED);
}

TEST(StrengthEngineTest, RetrogradeCountsAsFullMotion) {
    StrengthEngine engine;
    Chart chart = fixtures::makeChart(0.0, {});
    for (auto& p : chart.positions) {
        if (p.body == Body::SATURN) {
            p.speed = -0.02;
            p.retrograde = true;
        }
    }
    EXPECT_DOUBLE_EQ(engine.score(chart).at(Body::SATURN).motional, 1.0);
}

TEST(StrengthEngineTest, NaturalStrengthOrder) {
    EXPECT_GT(StrengthEngine::naturalStrength(Body::SUN), StrengthEngine::naturalStrength(Body::MOON));
    EXPECT_GT(StrengthEngine::naturalStrength(Body::MOON), StrengthEngine::naturalStrength(Body::VENUS));
    EXPECT_GT(StrengthEngine::naturalStrength(Body::MARS), StrengthEngine::naturalStrength(Body::SATURN));
    EXPECT_DOUBLE_EQ(StrengthEngine::naturalStrength(Body::SUN), 1.0);
}
