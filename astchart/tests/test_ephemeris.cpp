/**
 * @file test_ephemeris.cpp
 * @brief Analytical ephemeris accuracy and gateway behaviour
 */

#include <gtest/gtest.h>
#include <astchart/ephemeris/AnalyticalEphemeris.hpp>
#include <astchart/ephemeris/EphemerisGateway.hpp>
#include <astchart/core/Angles.hpp>
#include <astchart/core/Constants.hpp>
#include <astchart/core/Errors.hpp>
#include <astchart/time/TimeScale.hpp>
#include "FakeEphemeris.hpp"

using namespace astchart;
using namespace astchart::ephemeris;
using namespace astchart::constants;

// ============================================================================
// Analytical theory
// ============================================================================

TEST(AnalyticalEphemerisTest, SunMeeusExample25a) {
    // 1992 October 13.0 TD, apparent longitude 199.90895 deg
    auto sun = AnalyticalEphemeris::sun(2448908.5);
    EXPECT_NEAR(sun.longitude, 199.909, 0.002);
    EXPECT_NEAR(sun.distance, 0.99766, 1e-4);
}

TEST(AnalyticalEphemerisTest, MoonMeeusExample47a) {
    // 1992 April 12.0 TD, apparent longitude 133.162655 deg, distance 368409.7 km
    auto moon = AnalyticalEphemeris::moon(2448724.5);
    EXPECT_NEAR(moon.longitude, 133.1627, 0.01);
    EXPECT_NEAR(moon.latitude, -3.229126, 0.001);
    EXPECT_NEAR(moon.distance * AU_KM, 368409.7, 5.0);
}

TEST(AnalyticalEphemerisTest, SunAtMidJune1990) {
    AnalyticalEphemeris eph;
    double jd_tt = time::utToTT(2448058.0);
    auto out = eph.compute({Body::SUN}, jd_tt);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].longitude, 84.131, 0.01);
    EXPECT_EQ(signOf(out[0].longitude), 2);   // Gemini
}

TEST(AnalyticalEphemerisTest, InnerPlanetsStayNearTheSun) {
    AnalyticalEphemeris eph;
    for (double jd = 2447000.5; jd < 2462000.5; jd += 97.0) {
        auto out = eph.compute({Body::SUN, Body::MERCURY, Body::VENUS}, jd);
        EXPECT_LE(angularSeparation(out[0].longitude, out[1].longitude), 28.5) << "jd " << jd;
        EXPECT_LE(angularSeparation(out[0].longitude, out[2].longitude), 47.5) << "jd " << jd;
    }
}

TEST(AnalyticalEphemerisTest, MoonDistanceBounds) {
    AnalyticalEphemeris eph;
    for (double jd = 2451545.0; jd < 2451545.0 + 60.0; jd += 1.3) {
        auto out = eph.compute({Body::MOON}, jd);
        EXPECT_GT(out[0].distance, 0.0024);
        EXPECT_LT(out[0].distance, 0.0028);
    }
}

TEST(AnalyticalEphemerisTest, NodesAreOpposite) {
    AnalyticalEphemeris eph;
    auto out = eph.compute({Body::RAHU, Body::KETU}, 2451545.0);
    EXPECT_NEAR(angularSeparation(out[0].longitude, out[1].longitude), 180.0, 1e-9);
    // Mean node at J2000 (Meeus 47.7)
    EXPECT_NEAR(AnalyticalEphemeris::meanNode(2451545.0), 125.0445, 0.01);
}

TEST(AnalyticalEphemerisTest, AnglesAreNotEphemerisBodies) {
    AnalyticalEphemeris eph;
    EXPECT_THROW(eph.compute({Body::ASCENDANT}, 2451545.0), std::invalid_argument);
}

TEST(AnalyticalEphemerisTest, OuterPlanetsAreSlow) {
    AnalyticalEphemeris eph;
    auto a = eph.compute({Body::JUPITER, Body::SATURN, Body::PLUTO}, 2451545.0);
    auto b = eph.compute({Body::JUPITER, Body::SATURN, Body::PLUTO}, 2451546.0);
    EXPECT_LT(angularSeparation(a[0].longitude, b[0].longitude), 0.25);
    EXPECT_LT(angularSeparation(a[1].longitude, b[1].longitude), 0.14);
    EXPECT_LT(angularSeparation(a[2].longitude, b[2].longitude), 0.05);
    EXPECT_GT(a[1].distance, 8.0);
    EXPECT_LT(a[1].distance, 11.2);
}

// ============================================================================
// Gateway
// ============================================================================

class EphemerisGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake = std::make_shared<fixtures::FakeEphemeris>();
        GatewaySettings settings;
        settings.retry_backoff_ms = 0;
        gateway = std::make_shared<EphemerisGateway>(fake, settings);
    }

    std::shared_ptr<fixtures::FakeEphemeris> fake;
    std::shared_ptr<EphemerisGateway> gateway;
};

TEST_F(EphemerisGatewayTest, SingleRetrySucceeds) {
    fake->fail_next = 1;
    auto lons = gateway->getLongitudes({Body::SUN}, 2451545.0);
    EXPECT_EQ(lons.size(), 1u);
    EXPECT_EQ(fake->calls.load(), 2);
}

TEST_F(EphemerisGatewayTest, SecondFailureIsReported) {
    fake->fail_next = 2;
    EXPECT_THROW(gateway->getLongitudes({Body::SUN}, 2451545.0), EphemerisUnavailable);
    EXPECT_EQ(fake->calls.load(), 2);
}

TEST_F(EphemerisGatewayTest, UnavailableProviderIsReported) {
    fake->available = false;
    EXPECT_THROW(gateway->getPositions({Body::SUN}, 2451545.0), EphemerisUnavailable);
    EXPECT_EQ(fake->calls.load(), 0);
}

TEST_F(EphemerisGatewayTest, OutOfRangeIsNotRetried) {
    double jd_1850 = time::julianDay(1850, 1, 1.0);
    EXPECT_FALSE(gateway->inRange(jd_1850));
    EXPECT_THROW(gateway->getPositions({Body::SUN}, jd_1850), EphemerisUnavailable);
    EXPECT_EQ(fake->calls.load(), 0);

    EXPECT_TRUE(gateway->inRange(time::julianDay(2100, 12, 31.0)));
    EXPECT_FALSE(gateway->inRange(time::julianDay(2101, 1, 1.0)));
}

TEST_F(EphemerisGatewayTest, SpeedAndRetrogradeFromCentralDifference) {
    fake->motions[Body::MARS] = {100.0, -0.4};
    fake->motions[Body::JUPITER] = {200.0, 0.08};
    auto pos = gateway->getPositions({Body::MARS, Body::JUPITER}, 2451545.0);
    ASSERT_EQ(pos.size(), 2u);
    EXPECT_EQ(pos[0].body, Body::MARS);
    EXPECT_NEAR(pos[0].speed, -0.4, 1e-9);
    EXPECT_TRUE(pos[0].retrograde);
    EXPECT_NEAR(pos[1].speed, 0.08, 1e-9);
    EXPECT_FALSE(pos[1].retrograde);
    EXPECT_EQ(fake->calls.load(), 3);
}

TEST_F(EphemerisGatewayTest, SiderealSubtractsAyanamsa) {
    auto trop = gateway->getLongitudes({Body::SATURN}, 2451545.0, ZodiacType::TROPICAL);
    auto sid = gateway->getLongitudes({Body::SATURN}, 2451545.0, ZodiacType::SIDEREAL);
    double ayanamsa = time::lahiriAyanamsa(time::utToTT(2451545.0));
    EXPECT_NEAR(signedDelta(trop[0], sid[0]), ayanamsa, 1e-9);
}

TEST(EphemerisGatewayAnalyticalTest, RahuIsRetrograde) {
    EphemerisGateway gateway(std::make_shared<AnalyticalEphemeris>());
    auto pos = gateway.getPositions({Body::RAHU, Body::KETU}, 2451545.0);
    EXPECT_TRUE(pos[0].retrograde);
    EXPECT_TRUE(pos[1].retrograde);
    EXPECT_NEAR(pos[0].speed, -0.0529, 0.001);
    EXPECT_EQ(gateway.providerName(), "Analytical (Meeus/Standish)");
}
