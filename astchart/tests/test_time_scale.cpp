/**
 * @file test_time_scale.cpp
 * @brief Calendar, Julian Day and sidereal time conversions
 */

#include <gtest/gtest.h>
#include <astchart/time/TimeScale.hpp>
#include <astchart/core/Errors.hpp>
#include <astchart/core/Angles.hpp>

using namespace astchart;
using namespace astchart::time;

TEST(TimeScaleTest, J2000Epoch) {
    EXPECT_DOUBLE_EQ(julianDay(2000, 1, 1.5), 2451545.0);

    CivilDateTime dt;
    dt.year = 2000;
    dt.month = 1;
    dt.day = 1;
    dt.hour = 12;
    EXPECT_DOUBLE_EQ(julianDay(dt), 2451545.0);
}

TEST(TimeScaleTest, ElapsedYearsAndCenturies) {
    EXPECT_DOUBLE_EQ(julianYears(365.25 * 30.0), 30.0);
    EXPECT_DOUBLE_EQ(julianYears(0.0), 0.0);
    EXPECT_DOUBLE_EQ(julianCenturies(2451545.0 + 36525.0), 1.0);
}

TEST(TimeScaleTest, MeeusReferenceDates) {
    // Meeus, Astronomical Algorithms, ex. 7.a and 7.b
    EXPECT_NEAR(julianDay(1957, 10, 4.81), 2436116.31, 1e-9);
    EXPECT_DOUBLE_EQ(julianDay(333, 1, 27.5), 1842713.0);
}

TEST(TimeScaleTest, CalendarRoundTrip) {
    CivilDateTime dt = calendarFromJulianDay(2448058.0);
    EXPECT_EQ(dt.year, 1990);
    EXPECT_EQ(dt.month, 6);
    EXPECT_EQ(dt.day, 15);
    EXPECT_EQ(dt.hour, 12);
    EXPECT_EQ(dt.minute, 0);
    EXPECT_NEAR(dt.second, 0.0, 1e-3);
}

TEST(TimeScaleTest, IsoFormatting) {
    EXPECT_EQ(formatIso(2451545.0), "2000-01-01T12:00:00");
    EXPECT_EQ(formatIso(julianDay(1987, 6, 19.25)), "1987-06-19T06:00:00");
}

TEST(TimeScaleTest, IsoParsing) {
    CivilDateTime dt = parseIso("1984-03-07T18:45:30");
    EXPECT_EQ(dt.year, 1984);
    EXPECT_EQ(dt.month, 3);
    EXPECT_EQ(dt.day, 7);
    EXPECT_EQ(dt.hour, 18);
    EXPECT_EQ(dt.minute, 45);
    EXPECT_DOUBLE_EQ(dt.second, 30.0);

    CivilDateTime date_only = parseIso("2026-01-01");
    EXPECT_EQ(date_only.hour, 0);
    EXPECT_EQ(date_only.minute, 0);

    CivilDateTime spaced = parseIso("2026-01-01 06:30");
    EXPECT_EQ(spaced.hour, 6);
    EXPECT_EQ(spaced.minute, 30);
}

TEST(TimeScaleTest, MalformedIsoThrows) {
    EXPECT_THROW(parseIso("yesterday"), InputValidationError);
    EXPECT_THROW(parseIso("2026-13-01"), InputValidationError);
    EXPECT_THROW(parseIso("2026-01-01T25:00"), InputValidationError);
    EXPECT_THROW(parseIso("1990-02-30"), InputValidationError);
    EXPECT_THROW(parseIso("1990-02-31"), InputValidationError);
    EXPECT_THROW(parseIso("2026-04-31"), InputValidationError);
    EXPECT_THROW(parseIso("1900-02-29"), InputValidationError);
    EXPECT_EQ(parseIso("2000-02-29").day, 29);
    EXPECT_EQ(parseIso("2024-02-29").day, 29);
}

TEST(TimeScaleTest, DaysInMonth) {
    EXPECT_EQ(daysInMonth(2023, 2), 28);
    EXPECT_EQ(daysInMonth(2024, 2), 29);
    EXPECT_EQ(daysInMonth(1900, 2), 28);
    EXPECT_EQ(daysInMonth(2000, 2), 29);
    EXPECT_EQ(daysInMonth(2026, 4), 30);
    EXPECT_EQ(daysInMonth(2026, 12), 31);
}

TEST(TimeScaleTest, Weekday) {
    EXPECT_EQ(weekday(2451545.0), 6);   // 2000-01-01, Saturday
    EXPECT_EQ(weekday(2451545.0 + 1.0), 0);
    EXPECT_EQ(weekday(julianDay(2026, 2, 16.5)), 1);   // Monday
}

TEST(TimeScaleTest, DeltaTIsPlausible) {
    EXPECT_NEAR(deltaT(2451545.0), 63.9, 1.0);
    EXPECT_NEAR(deltaT(julianDay(2020, 1, 1.0)), 71.6, 1.0);
    EXPECT_GT(deltaT(julianDay(2020, 1, 1.0)), deltaT(2451545.0));
    EXPECT_GT(utToTT(2451545.0), 2451545.0);
}

TEST(TimeScaleTest, SiderealTime) {
    // Meeus ex. 12.a: 1987 April 10, 0h UT
    EXPECT_NEAR(greenwichMeanSiderealTime(2446895.5), 197.693195, 1e-5);
}

TEST(TimeScaleTest, LahiriAyanamsa) {
    EXPECT_NEAR(lahiriAyanamsa(2451545.0), 23.853, 1e-3);
    // Precession adds about 50.3" per year
    double per_year = lahiriAyanamsa(2451545.0 + 365.25) - lahiriAyanamsa(2451545.0);
    EXPECT_NEAR(per_year * 3600.0, 50.29, 0.05);
}

TEST(TimeScaleTest, AngleHelpers) {
    EXPECT_DOUBLE_EQ(normalizeDegrees(-30.0), 330.0);
    EXPECT_DOUBLE_EQ(normalizeDegrees(720.0), 0.0);
    EXPECT_DOUBLE_EQ(angularSeparation(350.0, 10.0), 20.0);
    EXPECT_DOUBLE_EQ(angularSeparation(10.0, 350.0), 20.0);
    EXPECT_DOUBLE_EQ(signedDelta(10.0, 350.0), 20.0);
    EXPECT_TRUE(inForwardArc(5.0, 350.0, 20.0));
    EXPECT_FALSE(inForwardArc(30.0, 350.0, 20.0));
}
