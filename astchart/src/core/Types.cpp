/**
 * @file Types.cpp
 * @brief Name tables and BodyPosition helpers
 * @author AstChart Team
 * @date 2026-02-11
 */

#include "astchart/core/Types.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace astchart {

namespace {

const std::array<const char*, BODY_COUNT> BODY_NAMES = {
    "sun", "moon", "mercury", "venus", "mars", "jupiter", "saturn",
    "uranus", "neptune", "pluto", "rahu", "ketu", "ascendant", "midheaven"
};

const std::array<const char*, 12> SIGN_NAMES = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces"
};

const std::array<const char*, 27> NAKSHATRA_NAMES = {
    "Ashwini", "Bharani", "Krittika", "Rohini", "Mrigashira", "Ardra",
    "Punarvasu", "Pushya", "Ashlesha", "Magha", "Purva Phalguni",
    "Uttara Phalguni", "Hasta", "Chitra", "Swati", "Vishakha", "Anuradha",
    "Jyeshtha", "Mula", "Purva Ashadha", "Uttara Ashadha", "Shravana",
    "Dhanishta", "Shatabhisha", "Purva Bhadrapada", "Uttara Bhadrapada",
    "Revati"
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::string bodyName(Body body) {
    return BODY_NAMES[static_cast<size_t>(body)];
}

std::optional<Body> bodyFromName(const std::string& name) {
    const std::string key = lower(name);
    for (size_t i = 0; i < BODY_NAMES.size(); ++i) {
        if (key == BODY_NAMES[i]) return static_cast<Body>(i);
    }
    if (key == "asc") return Body::ASCENDANT;
    if (key == "mc") return Body::MIDHEAVEN;
    return std::nullopt;
}

const std::vector<Body>& ephemerisBodies() {
    static const std::vector<Body> bodies = {
        Body::SUN, Body::MOON, Body::MERCURY, Body::VENUS, Body::MARS,
        Body::JUPITER, Body::SATURN, Body::URANUS, Body::NEPTUNE, Body::PLUTO,
        Body::RAHU, Body::KETU
    };
    return bodies;
}

const std::vector<Body>& classicalPlanets() {
    static const std::vector<Body> bodies = {
        Body::SUN, Body::MOON, Body::MARS, Body::MERCURY,
        Body::JUPITER, Body::VENUS, Body::SATURN
    };
    return bodies;
}

bool isAngle(Body body) {
    return body == Body::ASCENDANT || body == Body::MIDHEAVEN;
}

std::string signName(int sign) {
    return SIGN_NAMES[static_cast<size_t>(((sign % 12) + 12) % 12)];
}

std::string nakshatraName(int index) {
    return NAKSHATRA_NAMES[static_cast<size_t>(((index % 27) + 27) % 27)];
}

std::string zodiacName(ZodiacType z) {
    return z == ZodiacType::SIDEREAL ? "sidereal" : "tropical";
}

ZodiacType zodiacFromName(const std::string& name) {
    const std::string key = lower(name);
    if (key == "tropical") return ZodiacType::TROPICAL;
    if (key == "sidereal" || key == "lahiri") return ZodiacType::SIDEREAL;
    throw UnsupportedParameter("zodiac", name);
}

int signOf(double longitude) {
    return std::min(11, static_cast<int>(normalizeDegrees(longitude) / constants::SIGN_SPAN));
}

int BodyPosition::sign() const {
    return signOf(longitude);
}

double BodyPosition::degreeInSign() const {
    return normalizeDegrees(longitude) - sign() * constants::SIGN_SPAN;
}

int BodyPosition::nakshatra() const {
    return std::min(26, static_cast<int>(normalizeDegrees(longitude) / constants::NAKSHATRA_SPAN));
}

int BodyPosition::pada() const {
    double within = normalizeDegrees(longitude) - nakshatra() * constants::NAKSHATRA_SPAN;
    return std::min(4, static_cast<int>(within / constants::PADA_SPAN) + 1);
}

bool BodyPosition::operator==(const BodyPosition& other) const {
    return body == other.body
        && longitude == other.longitude
        && latitude == other.latitude
        && distance == other.distance
        && speed == other.speed
        && retrograde == other.retrograde
        && house == other.house;
}

} // namespace astchart
