/**
 * @file test_periods.cpp
 * @brief Vimshottari period tree construction and queries
 */

#include <gtest/gtest.h>
#include <astchart/periods/PeriodEngine.hpp>
#include <astchart/ephemeris/AnalyticalEphemeris.hpp>
#include <astchart/core/Constants.hpp>
#include <astchart/core/Errors.hpp>
#include <functional>

using namespace astchart;
using namespace astchart::periods;
using astchart::constants::DAYS_PER_JULIAN_YEAR;
using astchart::constants::NAKSHATRA_SPAN;

namespace {

constexpr double BIRTH_JD = 2447000.5;

void checkChildren(const Period& node) {
    if (node.children.empty()) return;
    EXPECT_EQ(node.children.size(), 9u);
    EXPECT_EQ(node.children.front()->start_jd, node.start_jd);
    EXPECT_EQ(node.children.back()->end_jd, node.end_jd);
    EXPECT_EQ(node.children.front()->ruler, node.ruler);
    double total = 0.0;
    for (size_t i = 0; i < node.children.size(); ++i) {
        const Period& c = *node.children[i];
        EXPECT_EQ(c.parent, &node);
        EXPECT_EQ(c.level, node.level + 1);
        if (i > 0) EXPECT_EQ(c.start_jd, node.children[i - 1]->end_jd);
        total += c.spanDays();
        checkChildren(c);
    }
    EXPECT_NEAR(total, node.spanDays(), 1e-6);
}

} // namespace

TEST(PeriodEngineTest, RulerSequenceSumsToCycle) {
    double years = 0.0;
    for (Body b : PeriodEngine::rulerSequence()) years += PeriodEngine::rulerYears(b);
    EXPECT_DOUBLE_EQ(years, PeriodEngine::CYCLE_YEARS);
    EXPECT_EQ(PeriodEngine::rulerSequence().front(), Body::KETU);
    EXPECT_DOUBLE_EQ(PeriodEngine::rulerYears(Body::VENUS), 20.0);
}

TEST(PeriodEngineTest, BirthAtStartOfAshwini) {
    PeriodTree tree = PeriodEngine::buildTree(0.0, BIRTH_JD, 2);
    EXPECT_EQ(tree.nakshatra, 0);
    EXPECT_EQ(tree.birth_ruler, Body::KETU);
    EXPECT_DOUBLE_EQ(tree.balance_years, 7.0);
    EXPECT_DOUBLE_EQ(tree.root->start_jd, BIRTH_JD);
    EXPECT_NEAR(tree.root->spanDays(), 120.0 * DAYS_PER_JULIAN_YEAR, 1e-6);
}

TEST(PeriodEngineTest, BalanceOfPartlyElapsedPeriod) {
    // Middle of Bharani: half of Venus' twenty years remain
    PeriodTree tree = PeriodEngine::buildTree(1.5 * NAKSHATRA_SPAN, BIRTH_JD, 3);
    EXPECT_EQ(tree.nakshatra, 1);
    EXPECT_EQ(tree.birth_ruler, Body::VENUS);
    EXPECT_NEAR(tree.balance_years, 10.0, 1e-9);

    const Period& first = *tree.root->children.front();
    EXPECT_EQ(first.ruler, Body::VENUS);
    EXPECT_NEAR(first.end_jd, BIRTH_JD + 10.0 * DAYS_PER_JULIAN_YEAR, 1e-6);
    EXPECT_LT(first.start_jd, BIRTH_JD);
    EXPECT_EQ(tree.root->children[1]->ruler, Body::SUN);
}

TEST(PeriodEngineTest, ChildrenTileTheirParent) {
    PeriodTree tree = PeriodEngine::buildTree(217.3, BIRTH_JD, 3);
    checkChildren(*tree.root);
}

TEST(PeriodEngineTest, QueryReturnsPathFromRoot) {
    PeriodTree tree = PeriodEngine::buildTree(217.3, BIRTH_JD, 3);
    const double jd = BIRTH_JD + 12345.0;
    auto path = PeriodEngine::query(tree, jd);
    ASSERT_EQ(path.size(), 4u);
    EXPECT_EQ(path[0], tree.root.get());
    for (size_t i = 0; i < path.size(); ++i) {
        EXPECT_EQ(path[i]->level, static_cast<int>(i));
        EXPECT_TRUE(path[i]->contains(jd));
        if (i > 0) EXPECT_EQ(path[i]->parent, path[i - 1]);
    }
}

TEST(PeriodEngineTest, QueryAtBoundaryUsesHalfOpenIntervals) {
    PeriodTree tree = PeriodEngine::buildTree(100.0, BIRTH_JD, 1);
    const Period& second = *tree.root->children[1];
    auto path = PeriodEngine::query(tree, second.start_jd);
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path[1], &second);
}

TEST(PeriodEngineTest, QueryOutsideCycleThrows) {
    PeriodTree tree = PeriodEngine::buildTree(100.0, BIRTH_JD, 2);
    EXPECT_THROW(PeriodEngine::query(tree, tree.root->end_jd), OutOfRangeInstant);
    EXPECT_THROW(PeriodEngine::query(tree, tree.root->start_jd - 1.0), OutOfRangeInstant);
}

TEST(PeriodEngineTest, Upcoming) {
    PeriodTree tree = PeriodEngine::buildTree(100.0, BIRTH_JD, 2);
    const double jd = BIRTH_JD + 5000.0;
    auto next = PeriodEngine::upcoming(tree, jd, 2, 4);
    ASSERT_EQ(next.size(), 4u);
    EXPECT_TRUE(next[0]->contains(jd));
    for (size_t i = 1; i < next.size(); ++i) {
        EXPECT_EQ(next[i]->level, 2);
        EXPECT_EQ(next[i]->start_jd, next[i - 1]->end_jd);
    }
    EXPECT_TRUE(PeriodEngine::upcoming(tree, jd, 3, 4).empty());
}

TEST(PeriodEngineTest, DepthLimits) {
    EXPECT_THROW(PeriodEngine::buildTree(100.0, BIRTH_JD, 0), UnsupportedParameter);
    EXPECT_THROW(PeriodEngine::buildTree(100.0, BIRTH_JD, 6), UnsupportedParameter);

    PeriodTree deep = PeriodEngine::buildTree(100.0, BIRTH_JD, PeriodEngine::MAX_DEPTH);
    auto path = PeriodEngine::query(deep, BIRTH_JD);
    EXPECT_EQ(path.size(), static_cast<size_t>(PeriodEngine::MAX_DEPTH + 1));
}

TEST(PeriodEngineTest, TreeFromSubjectUsesSiderealMoon) {
    auto gateway = std::make_shared<ephemeris::EphemerisGateway>(
        std::make_shared<ephemeris::AnalyticalEphemeris>());
    PeriodEngine engine(gateway);

    Subject subject("", time::CivilDateTime{1990, 6, 15, 12, 0, 0.0}, GeoLocation{51.48, 0.0, 0.0}, 0.0);
    PeriodTree tree = engine.buildTree(subject);
    double moon = gateway->getPositions({Body::MOON}, subject.julianDay(), ZodiacType::SIDEREAL)[0].longitude;
    EXPECT_NEAR(tree.moon_longitude, moon, 1e-9);
    EXPECT_EQ(tree.nakshatra, static_cast<int>(moon / NAKSHATRA_SPAN));
    EXPECT_EQ(tree.depth, engine.settings().depth);
    EXPECT_NO_THROW(PeriodEngine::query(tree, subject.julianDay()));
}
