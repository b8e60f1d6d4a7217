/**
 * @file TimeScale.hpp
 * @brief Calendar, Julian Day and Earth-orientation helpers
 * @author AstChart Team
 * @date 2026-02-12
 *
 * Julian Day conversions follow Meeus, "Astronomical Algorithms" ch. 7.
 * Delta T uses the Espenak & Meeus polynomial fits (NASA, 2006).
 * Nutation keeps the four largest IAU 1980 terms, enough for 0.5" in
 * longitude.
 */

#ifndef ASTCHART_TIME_TIMESCALE_HPP
#define ASTCHART_TIME_TIMESCALE_HPP

#include <string>

namespace astchart::time {

/**
 * @brief Gregorian calendar date and time of day
 */
struct CivilDateTime {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    double second = 0.0;

    bool operator==(const CivilDateTime& o) const {
        return year == o.year && month == o.month && day == o.day
            && hour == o.hour && minute == o.minute && second == o.second;
    }
};

struct Nutation {
    double dpsi = 0.0;   ///< Nutation in longitude [deg]
    double deps = 0.0;   ///< Nutation in obliquity [deg]
};

/// Calendar date (UT) to Julian Day
double julianDay(const CivilDateTime& dt);
double julianDay(int year, int month, double day_fraction);

/// Julian Day to calendar date (UT)
CivilDateTime calendarFromJulianDay(double jd);

/// Days in a Gregorian month (1..12)
int daysInMonth(int year, int month);

/// ISO-8601 "YYYY-MM-DDTHH:MM:SS" (seconds rounded)
std::string formatIso(double jd);

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS"
 * @throws InputValidationError on malformed text or a day past the month's end
 */
CivilDateTime parseIso(const std::string& text);

/// TT - UT [seconds]
double deltaT(double jd_ut);

inline double utToTT(double jd_ut) { return jd_ut + deltaT(jd_ut) / 86400.0; }

/// Julian centuries since J2000.0
double julianCenturies(double jd);

/// Elapsed days expressed in 365.25-day years
double julianYears(double days);

/// Mean obliquity of the ecliptic (IAU 1980) [deg]
double meanObliquity(double jd_tt);

Nutation nutation(double jd_tt);

inline double trueObliquity(double jd_tt) {
    return meanObliquity(jd_tt) + nutation(jd_tt).deps;
}

/// Greenwich mean sidereal time [deg]
double greenwichMeanSiderealTime(double jd_ut);

/// Greenwich apparent sidereal time [deg]
double greenwichApparentSiderealTime(double jd_ut);

/// 0 = Sunday .. 6 = Saturday, for the civil day containing jd
int weekday(double jd);

/// Lahiri (Chitrapaksha) ayanamsa [deg]
double lahiriAyanamsa(double jd_tt);

} // namespace astchart::time

#endif // ASTCHART_TIME_TIMESCALE_HPP
