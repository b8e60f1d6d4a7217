/**
 * @file TimeScale.cpp
 * @brief Calendar, Delta T, sidereal time and nutation
 * @author AstChart Team
 * @date 2026-02-12
 */

#include "astchart/time/TimeScale.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Constants.hpp"
#include "astchart/core/Errors.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace astchart::time {

using namespace astchart::constants;

namespace {

struct DateParts {
    int year;
    int month;
    int day;
};

// Meeus 7.3, integer part only
DateParts dateFromDayNumber(long z) {
    long a = z;
    if (z >= 2299161) {
        long alpha = static_cast<long>(std::floor((z - 1867216.25) / 36524.25));
        a = z + 1 + alpha - alpha / 4;
    }
    long b = a + 1524;
    long c = static_cast<long>(std::floor((b - 122.1) / 365.25));
    long d = static_cast<long>(std::floor(365.25 * c));
    long e = static_cast<long>(std::floor((b - d) / 30.6001));

    DateParts p;
    p.day = static_cast<int>(b - d - static_cast<long>(std::floor(30.6001 * e)));
    p.month = static_cast<int>(e < 14 ? e - 1 : e - 13);
    p.year = static_cast<int>(p.month > 2 ? c - 4716 : c - 4715);
    return p;
}

} // anonymous namespace

double julianDay(int year, int month, double day_fraction) {
    int y = year;
    int m = month;
    if (m <= 2) {
        y -= 1;
        m += 12;
    }
    int a = y / 100;
    int b = 2 - a + a / 4;
    // Julian calendar before the 1582 reform
    if (year < 1582 || (year == 1582 && (month < 10 || (month == 10 && day_fraction < 15.0)))) {
        b = 0;
    }
    return std::floor(365.25 * (y + 4716)) + std::floor(30.6001 * (m + 1))
         + day_fraction + b - 1524.5;
}

double julianDay(const CivilDateTime& dt) {
    double day = dt.day + (dt.hour + (dt.minute + dt.second / 60.0) / 60.0) / 24.0;
    return julianDay(dt.year, dt.month, day);
}

CivilDateTime calendarFromJulianDay(double jd) {
    double shifted = jd + 0.5;
    long z = static_cast<long>(std::floor(shifted));
    double f = shifted - z;

    long long ms = std::llround(f * SECONDS_PER_DAY * 1000.0);
    if (ms >= static_cast<long long>(SECONDS_PER_DAY * 1000.0)) {
        ms -= static_cast<long long>(SECONDS_PER_DAY * 1000.0);
        ++z;
    }

    DateParts p = dateFromDayNumber(z);
    CivilDateTime dt;
    dt.year = p.year;
    dt.month = p.month;
    dt.day = p.day;
    dt.hour = static_cast<int>(ms / 3600000);
    dt.minute = static_cast<int>((ms / 60000) % 60);
    dt.second = (ms % 60000) / 1000.0;
    return dt;
}

std::string formatIso(double jd) {
    CivilDateTime dt = calendarFromJulianDay(jd);
    int sec = static_cast<int>(std::floor(dt.second + 0.5));
    if (sec == 60) {
        dt = calendarFromJulianDay(jd + 0.5 / SECONDS_PER_DAY);
        sec = static_cast<int>(std::floor(dt.second));
    }
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << dt.year << '-'
       << std::setw(2) << dt.month << '-' << std::setw(2) << dt.day << 'T'
       << std::setw(2) << dt.hour << ':' << std::setw(2) << dt.minute << ':'
       << std::setw(2) << sec;
    return ss.str();
}

int daysInMonth(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}

CivilDateTime parseIso(const std::string& text) {
    CivilDateTime dt;
    double sec = 0.0;
    int n = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%lf",
                        &dt.year, &dt.month, &dt.day, &dt.hour, &dt.minute, &sec);
    if (n != 3 && n != 5 && n != 6) {
        // Accept a space separator as well
        n = std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%lf",
                        &dt.year, &dt.month, &dt.day, &dt.hour, &dt.minute, &sec);
    }
    if (n != 3 && n != 5 && n != 6) {
        throw InputValidationError("Malformed date-time: '" + text + "'", {"datetime"});
    }
    if (n == 3) {
        dt.hour = 0;
        dt.minute = 0;
    }
    dt.second = sec;
    if (dt.month < 1 || dt.month > 12 || dt.day < 1 || dt.day > daysInMonth(dt.year, dt.month)
        || dt.hour < 0 || dt.hour > 23 || dt.minute < 0 || dt.minute > 59
        || sec < 0.0 || sec >= 61.0) {
        throw InputValidationError("Date-time out of range: '" + text + "'", {"datetime"});
    }
    return dt;
}

double deltaT(double jd_ut) {
    CivilDateTime dt = calendarFromJulianDay(jd_ut);
    double y = dt.year + (dt.month - 0.5) / 12.0;
    double t;

    if (y < 1860.0) {
        double u = (y - 1820.0) / 100.0;
        return -20.0 + 32.0 * u * u;
    }
    if (y < 1900.0) {
        t = y - 1860.0;
        return 7.62 + 0.5737 * t - 0.251754 * t * t + 0.01680668 * t * t * t
             - 0.0004473624 * std::pow(t, 4) + std::pow(t, 5) / 233174.0;
    }
    if (y < 1920.0) {
        t = y - 1900.0;
        return -2.79 + 1.494119 * t - 0.0598939 * t * t + 0.0061966 * t * t * t
             - 0.000197 * std::pow(t, 4);
    }
    if (y < 1941.0) {
        t = y - 1920.0;
        return 21.20 + 0.84493 * t - 0.076100 * t * t + 0.0020936 * t * t * t;
    }
    if (y < 1961.0) {
        t = y - 1950.0;
        return 29.07 + 0.407 * t - t * t / 233.0 + t * t * t / 2547.0;
    }
    if (y < 1986.0) {
        t = y - 1975.0;
        return 45.45 + 1.067 * t - t * t / 260.0 - t * t * t / 718.0;
    }
    if (y < 2005.0) {
        t = y - 2000.0;
        return 63.86 + 0.3345 * t - 0.060374 * t * t + 0.0017275 * t * t * t
             + 0.000651814 * std::pow(t, 4) + 0.00002373599 * std::pow(t, 5);
    }
    if (y < 2050.0) {
        t = y - 2000.0;
        return 62.92 + 0.32217 * t + 0.005589 * t * t;
    }
    if (y < 2150.0) {
        double u = (y - 1820.0) / 100.0;
        return -20.0 + 32.0 * u * u - 0.5628 * (2150.0 - y);
    }
    double u = (y - 1820.0) / 100.0;
    return -20.0 + 32.0 * u * u;
}

double julianCenturies(double jd) {
    return (jd - JD_J2000) / DAYS_PER_JULIAN_CENTURY;
}

double julianYears(double days) {
    return days / constants::DAYS_PER_JULIAN_YEAR;
}

double meanObliquity(double jd_tt) {
    double T = julianCenturies(jd_tt);
    double arcsec = 84381.448 - 46.8150 * T - 0.00059 * T * T + 0.001813 * T * T * T;
    return arcsec * ARCSEC_TO_DEG;
}

Nutation nutation(double jd_tt) {
    double T = julianCenturies(jd_tt);
    double omega = 125.04452 - 1934.136261 * T;
    double L = 280.4665 + 36000.7698 * T;      // Sun mean longitude
    double Lp = 218.3165 + 481267.8813 * T;    // Moon mean longitude

    Nutation n;
    n.dpsi = (-17.20 * sinDeg(omega) - 1.32 * sinDeg(2.0 * L)
              - 0.23 * sinDeg(2.0 * Lp) + 0.21 * sinDeg(2.0 * omega)) * ARCSEC_TO_DEG;
    n.deps = (9.20 * cosDeg(omega) + 0.57 * cosDeg(2.0 * L)
              + 0.10 * cosDeg(2.0 * Lp) - 0.09 * cosDeg(2.0 * omega)) * ARCSEC_TO_DEG;
    return n;
}

double greenwichMeanSiderealTime(double jd_ut) {
    double T = julianCenturies(jd_ut);
    double gmst = 280.46061837 + 360.98564736629 * (jd_ut - JD_J2000)
                + 0.000387933 * T * T - T * T * T / 38710000.0;
    return normalizeDegrees(gmst);
}

double greenwichApparentSiderealTime(double jd_ut) {
    double jd_tt = utToTT(jd_ut);
    Nutation n = nutation(jd_tt);
    double eps = meanObliquity(jd_tt) + n.deps;
    return normalizeDegrees(greenwichMeanSiderealTime(jd_ut) + n.dpsi * cosDeg(eps));
}

int weekday(double jd) {
    long d = static_cast<long>(std::floor(jd + 1.5));
    return static_cast<int>(((d % 7) + 7) % 7);
}

double lahiriAyanamsa(double jd_tt) {
    double T = julianCenturies(jd_tt);
    return 23.85305556 + (5028.796195 * T + 1.1054348 * T * T) / 3600.0;
}

} // namespace astchart::time
