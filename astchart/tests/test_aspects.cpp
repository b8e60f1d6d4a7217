/**
 * @file test_aspects.cpp
 * @brief Aspect detection, orbs and configurations
 */

#include <gtest/gtest.h>
#include <astchart/aspects/AspectEngine.hpp>
#include "ChartFixtures.hpp"
#include <algorithm>

using namespace astchart;
using namespace astchart::aspects;
using astchart::fixtures::point;

TEST(AspectEngineTest, ExactTrine) {
    AspectEngine engine;
    auto asp = engine.aspectBetween(point(Body::SUN, 10.0), point(Body::MOON, 130.0));
    ASSERT_TRUE(asp.has_value());
    EXPECT_EQ(asp->type, "trine");
    EXPECT_DOUBLE_EQ(asp->angle, 120.0);
    EXPECT_NEAR(asp->orb, 0.0, 1e-9);
    EXPECT_NEAR(asp->allowed_orb, 7.0 * 0.6, 1e-12);
    EXPECT_NEAR(asp->exactness, 1.0, 1e-9);
    EXPECT_EQ(asp->first, Body::SUN);
    EXPECT_EQ(asp->second, Body::MOON);
}

TEST(AspectEngineTest, OrbScaledByFasterBody) {
    AspectEngine engine;
    // Conjunction orb 8 * 0.6 for the Moon
    EXPECT_FALSE(engine.aspectBetween(point(Body::SUN, 10.0), point(Body::MOON, 15.0)).has_value());
    EXPECT_TRUE(engine.aspectBetween(point(Body::SUN, 10.0), point(Body::MOON, 14.5)).has_value());
    // Same separation between two slow bodies is in orb
    EXPECT_TRUE(engine.aspectBetween(point(Body::SATURN, 10.0), point(Body::PLUTO, 15.0)).has_value());
}

TEST(AspectEngineTest, SeparationWrapsAroundAries) {
    AspectEngine engine;
    auto asp = engine.aspectBetween(point(Body::MARS, 358.0), point(Body::JUPITER, 2.0));
    ASSERT_TRUE(asp.has_value());
    EXPECT_EQ(asp->type, "conjunction");
    EXPECT_NEAR(asp->separation, 4.0, 1e-9);
}

TEST(AspectEngineTest, SymmetricAndWithinOrb) {
    AspectEngine engine;
    std::vector<BodyPosition> points;
    int i = 0;
    for (Body b : ephemerisBodies()) {
        points.push_back(point(b, std::fmod(37.3 * i * i + 11.0 * i, 360.0), 0.1 * (i - 4)));
        ++i;
    }
    for (const auto& a : points) {
        for (const auto& b : points) {
            if (a.body == b.body) continue;
            auto ab = engine.aspectBetween(a, b);
            auto ba = engine.aspectBetween(b, a);
            ASSERT_EQ(ab.has_value(), ba.has_value());
            if (!ab) continue;
            EXPECT_EQ(*ab, *ba);
            EXPECT_LE(ab->orb, ab->allowed_orb);
            EXPECT_GE(ab->exactness, 0.0);
            EXPECT_LE(ab->exactness, 1.0);
        }
    }

    auto all = engine.findAspects(points);
    for (size_t k = 1; k < all.size(); ++k) {
        EXPECT_TRUE(all[k - 1].first < all[k].first
                    || (all[k - 1].first == all[k].first && all[k - 1].second < all[k].second));
    }
}

TEST(AspectEngineTest, ClosestAspectWins) {
    // 44 deg: semisquare (orb 1) rather than nothing; 52 deg: none of the defaults
    AspectEngine engine;
    auto a = engine.aspectBetween(point(Body::SATURN, 0.0), point(Body::PLUTO, 44.0));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, "semisquare");
    EXPECT_FALSE(engine.aspectBetween(point(Body::SATURN, 0.0), point(Body::PLUTO, 52.0)).has_value());
}

TEST(AspectEngineTest, ApplyingAndSeparating) {
    AspectEngine engine;
    // Moon closing on the trine from 115 deg
    auto applying = engine.aspectBetween(point(Body::SUN, 10.0, 1.0), point(Body::MOON, 125.0, 13.0));
    ASSERT_TRUE(applying.has_value());
    EXPECT_TRUE(applying->applying);

    auto separating = engine.aspectBetween(point(Body::SUN, 10.0, 1.0), point(Body::MOON, 133.0, 13.0));
    ASSERT_TRUE(separating.has_value());
    EXPECT_FALSE(separating->applying);
}

TEST(AspectEngineTest, UniformAndMinorTables) {
    OrbTable uniform = OrbTable::uniform(3.0);
    EXPECT_EQ(uniform.aspects.size(), 5u);
    EXPECT_DOUBLE_EQ(uniform.allowedOrb(uniform.aspects[1], Body::MOON, Body::SUN), 3.0);
    EXPECT_FALSE(AspectEngine::aspectBetween(point(Body::SUN, 0.0), point(Body::SATURN, 72.0),
                                             uniform).has_value());

    OrbTable with_minor = OrbTable::defaults();
    for (const auto& def : OrbTable::minorCatalog()) {
        EXPECT_FALSE(def.major);
        if (def.angle == 72.0) with_minor.aspects.push_back(def);
    }
    auto q = AspectEngine::aspectBetween(point(Body::SUN, 0.0), point(Body::SATURN, 72.0), with_minor);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->type, "quintile");
}

TEST(AspectEngineTest, CrossAspectsKeepDirection) {
    AspectEngine engine;
    std::vector<BodyPosition> first{point(Body::VENUS, 100.0)};
    std::vector<BodyPosition> second{point(Body::MARS, 190.0), point(Body::SUN, 260.0)};
    auto cross = engine.crossAspects(first, second);
    ASSERT_EQ(cross.size(), 1u);
    EXPECT_EQ(cross[0].from, Body::VENUS);
    EXPECT_EQ(cross[0].to, Body::MARS);
    EXPECT_EQ(cross[0].aspect.type, "square");
}

// ============================================================================
// Configurations
// ============================================================================

namespace {

bool hasPattern(const std::vector<AspectPattern>& patterns, PatternKind kind,
                std::vector<Body> bodies) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const AspectPattern& p) {
        return p.kind == kind && p.bodies == bodies;
    });
}

} // namespace

TEST(AspectPatternTest, GrandTrineInFire) {
    AspectEngine engine;
    std::vector<BodyPosition> points{point(Body::SUN, 5.0), point(Body::JUPITER, 125.0),
                                     point(Body::SATURN, 245.0)};
    auto patterns = engine.findPatterns(points, engine.findAspects(points));
    EXPECT_TRUE(hasPattern(patterns, PatternKind::GRAND_TRINE,
                           {Body::SUN, Body::JUPITER, Body::SATURN}));
}

TEST(AspectPatternTest, TSquareApexLast) {
    AspectEngine engine;
    std::vector<BodyPosition> points{point(Body::MARS, 0.0), point(Body::SATURN, 180.0),
                                     point(Body::JUPITER, 90.0)};
    auto patterns = engine.findPatterns(points, engine.findAspects(points));
    EXPECT_TRUE(hasPattern(patterns, PatternKind::T_SQUARE,
                           {Body::MARS, Body::SATURN, Body::JUPITER}));
    EXPECT_FALSE(hasPattern(patterns, PatternKind::GRAND_CROSS,
                            {Body::MARS, Body::JUPITER, Body::SATURN}));
}

TEST(AspectPatternTest, GrandCross) {
    AspectEngine engine;
    std::vector<BodyPosition> points{point(Body::MARS, 0.0), point(Body::JUPITER, 90.0),
                                     point(Body::SATURN, 180.0), point(Body::URANUS, 270.0)};
    auto patterns = engine.findPatterns(points, engine.findAspects(points));
    EXPECT_TRUE(hasPattern(patterns, PatternKind::GRAND_CROSS,
                           {Body::MARS, Body::SATURN, Body::JUPITER, Body::URANUS}));
}

TEST(AspectPatternTest, StelliumIsMaximal) {
    AspectEngine engine;
    std::vector<BodyPosition> points{point(Body::SUN, 100.0), point(Body::MERCURY, 103.0),
                                     point(Body::VENUS, 106.0), point(Body::MARS, 250.0)};
    auto patterns = engine.findPatterns(points, engine.findAspects(points));
    EXPECT_TRUE(hasPattern(patterns, PatternKind::STELLIUM,
                           {Body::SUN, Body::MERCURY, Body::VENUS}));
    EXPECT_EQ(std::count_if(patterns.begin(), patterns.end(), [](const AspectPattern& p) {
                  return p.kind == PatternKind::STELLIUM;
              }), 1);
}

TEST(AspectPatternTest, NodesAndAnglesAreIgnored) {
    AspectEngine engine;
    std::vector<BodyPosition> points{point(Body::RAHU, 5.0), point(Body::ASCENDANT, 125.0),
                                     point(Body::SATURN, 245.0)};
    EXPECT_TRUE(engine.findPatterns(points, engine.findAspects(points)).empty());
}
