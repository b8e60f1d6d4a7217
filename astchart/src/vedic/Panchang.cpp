/**
 * @file Panchang.cpp
 * @brief Tithi, nakshatra, yoga, karana and vara
 * @author AstChart Team
 * @date 2026-02-21
 */

#include "astchart/vedic/Panchang.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/time/TimeScale.hpp"
#include <algorithm>
#include <stdexcept>

namespace astchart::vedic {

using namespace astchart::constants;

namespace {

const char* const TITHI_NAMES[14] = {
    "Pratipada", "Dwitiya", "Tritiya", "Chaturthi", "Panchami", "Shashthi", "Saptami",
    "Ashtami", "Navami", "Dashami", "Ekadashi", "Dwadashi", "Trayodashi", "Chaturdashi"
};

const char* const YOGA_NAMES[27] = {
    "Vishkambha", "Priti", "Ayushman", "Saubhagya", "Shobhana", "Atiganda", "Sukarma",
    "Dhriti", "Shula", "Ganda", "Vriddhi", "Dhruva", "Vyaghata", "Harshana", "Vajra",
    "Siddhi", "Vyatipata", "Variyan", "Parigha", "Shiva", "Siddha", "Sadhya", "Shubha",
    "Shukla", "Brahma", "Indra", "Vaidhriti"
};

const char* const MOVABLE_KARANAS[7] = {
    "Bava", "Balava", "Kaulava", "Taitila", "Gara", "Vanija", "Vishti"
};

const char* const VARA_NAMES[7] = {
    "Ravivara", "Somavara", "Mangalavara", "Budhavara", "Guruvara", "Shukravara", "Shanivara"
};

std::string karanaName(int index) {
    if (index == 0) return "Kimstughna";
    if (index == 57) return "Shakuni";
    if (index == 58) return "Chatushpada";
    if (index == 59) return "Naga";
    return MOVABLE_KARANAS[(index - 1) % 7];
}

} // anonymous namespace

PanchangCalculator::PanchangCalculator(std::shared_ptr<const ephemeris::EphemerisGateway> gateway)
    : gateway_(std::move(gateway))
{
    if (!gateway_) {
        throw std::invalid_argument("PanchangCalculator requires an ephemeris gateway");
    }
}

Panchang PanchangCalculator::fromLongitudes(double sun_sidereal, double moon_sidereal, int weekday) {
    Panchang p;
    p.sun_longitude = normalizeDegrees(sun_sidereal);
    p.moon_longitude = normalizeDegrees(moon_sidereal);

    const double elongation = normalizeDegrees(p.moon_longitude - p.sun_longitude);
    const int t = std::min(29, static_cast<int>(elongation / 12.0));
    p.tithi = t + 1;
    p.paksha = t < 15 ? "shukla" : "krishna";
    if (t == 14) p.tithi_name = "Purnima";
    else if (t == 29) p.tithi_name = "Amavasya";
    else p.tithi_name = TITHI_NAMES[t % 15];

    p.nakshatra = std::min(26, static_cast<int>(p.moon_longitude / NAKSHATRA_SPAN));
    p.nakshatra_name = nakshatraName(p.nakshatra);
    p.pada = std::min(4, static_cast<int>((p.moon_longitude - p.nakshatra * NAKSHATRA_SPAN)
                                          / PADA_SPAN) + 1);

    const double yoga_lon = normalizeDegrees(p.sun_longitude + p.moon_longitude);
    const int y = std::min(26, static_cast<int>(yoga_lon / NAKSHATRA_SPAN));
    p.yoga = y + 1;
    p.yoga_name = YOGA_NAMES[y];

    const int k = std::min(59, static_cast<int>(elongation / 6.0));
    p.karana = k + 1;
    p.karana_name = karanaName(k);

    p.vara = ((weekday % 7) + 7) % 7;
    p.vara_name = VARA_NAMES[p.vara];
    return p;
}

Panchang PanchangCalculator::at(double jd_ut, double timezone_offset) const {
    auto lons = gateway_->getLongitudes({Body::SUN, Body::MOON}, jd_ut, ZodiacType::SIDEREAL);
    Panchang p = fromLongitudes(lons[0], lons[1], time::weekday(jd_ut + timezone_offset / 24.0));
    p.jd_ut = jd_ut;
    return p;
}

} // namespace astchart::vedic
