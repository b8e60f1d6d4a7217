/**
 * @file DivisionalChartEngine.cpp
 * @brief Varga starting-point tables
 * @author AstChart Team
 * @date 2026-02-15
 */

#include "astchart/divisional/DivisionalChartEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>

namespace astchart::divisional {

using constants::SIGN_SPAN;

namespace {

enum { ARIES = 0, TAURUS, GEMINI, CANCER, LEO, VIRGO, LIBRA,
       SCORPIO, SAGITTARIUS, CAPRICORN, AQUARIUS, PISCES };

bool isOddSign(int s) { return s % 2 == 0; }     // Aries counts as the 1st (odd) sign
bool isMovable(int s) { return s % 3 == 0; }
bool isFixed(int s) { return s % 3 == 1; }

struct TrimsamsaPart {
    double upper;   ///< Exclusive upper bound within the sign [deg]
    int sign;
};

const TrimsamsaPart TRIMSAMSA_ODD[] = {
    {5.0, ARIES}, {10.0, AQUARIUS}, {18.0, SAGITTARIUS}, {25.0, GEMINI}, {30.0, LIBRA}
};
const TrimsamsaPart TRIMSAMSA_EVEN[] = {
    {5.0, TAURUS}, {12.0, VIRGO}, {20.0, PISCES}, {25.0, CAPRICORN}, {30.0, SCORPIO}
};

/// Starting sign of the first part for equal-part divisions
int firstPartSign(int s, int factor) {
    switch (factor) {
        case 1:  return s;
        case 3:  return s;
        case 4:  return s;
        case 7:  return isOddSign(s) ? s : s + 6;
        case 9:  return isMovable(s) ? s : (isFixed(s) ? s + 8 : s + 4);
        case 10: return isOddSign(s) ? s : s + 8;
        case 12: return s;
        case 16: return isMovable(s) ? ARIES : (isFixed(s) ? LEO : SAGITTARIUS);
        case 20: return isMovable(s) ? ARIES : (isFixed(s) ? SAGITTARIUS : LEO);
        case 24: return isOddSign(s) ? LEO : CANCER;
        case 27: {
            static const int by_element[4] = {ARIES, CANCER, LIBRA, CAPRICORN};
            return by_element[s % 4];
        }
        case 40: return isOddSign(s) ? ARIES : LIBRA;
        case 45: return isMovable(s) ? ARIES : (isFixed(s) ? LEO : SAGITTARIUS);
        case 60: return s;
        default: return -1;
    }
}

/// Signs advanced per part (D3 jumps by trine, D4 by kendra)
int partStride(int factor) {
    if (factor == 3) return 4;
    if (factor == 4) return 3;
    return 1;
}

} // anonymous namespace

DivisionalChartEngine::DivisionalChartEngine(std::vector<int> catalog)
    : catalog_(std::move(catalog))
{
    for (int f : catalog_) {
        if (!hasRule(f)) {
            throw UnsupportedParameter("division_factor", std::to_string(f));
        }
    }
    std::sort(catalog_.begin(), catalog_.end());
    catalog_.erase(std::unique(catalog_.begin(), catalog_.end()), catalog_.end());
}

const std::vector<int>& DivisionalChartEngine::defaultCatalog() {
    static const std::vector<int> catalog = {1, 2, 3, 4, 7, 9, 10, 12, 16, 20, 24, 27, 30, 40, 45, 60};
    return catalog;
}

bool DivisionalChartEngine::hasRule(int factor) {
    return factor == 2 || factor == 30 || firstPartSign(0, factor) >= 0;
}

std::string DivisionalChartEngine::divisionName(int factor) {
    switch (factor) {
        case 1:  return "Rasi";
        case 2:  return "Hora";
        case 3:  return "Drekkana";
        case 4:  return "Chaturthamsa";
        case 7:  return "Saptamsa";
        case 9:  return "Navamsa";
        case 10: return "Dashamsa";
        case 12: return "Dwadashamsa";
        case 16: return "Shodashamsa";
        case 20: return "Vimshamsa";
        case 24: return "Chaturvimshamsa";
        case 27: return "Bhamsa";
        case 30: return "Trimsamsa";
        case 40: return "Khavedamsa";
        case 45: return "Akshavedamsa";
        case 60: return "Shashtiamsa";
        default: return "D" + std::to_string(factor);
    }
}

int DivisionalChartEngine::vargaSign(double longitude, int factor) {
    const double lon = normalizeDegrees(longitude);
    const int s = signOf(lon);
    const double deg = lon - s * SIGN_SPAN;

    if (factor == 30) {
        const TrimsamsaPart* parts = isOddSign(s) ? TRIMSAMSA_ODD : TRIMSAMSA_EVEN;
        for (int i = 0; i < 5; ++i) {
            if (deg < parts[i].upper) return parts[i].sign;
        }
        return parts[4].sign;
    }

    if (!hasRule(factor)) {
        throw UnsupportedParameter("division_factor", std::to_string(factor));
    }

    const int k = std::min(factor - 1, static_cast<int>(deg * factor / SIGN_SPAN));
    if (factor == 2) {
        // Odd signs: Sun's hora (Leo) then Moon's (Cancer); even signs reversed
        bool first_half = k == 0;
        return (isOddSign(s) == first_half) ? LEO : CANCER;
    }
    return (firstPartSign(s, factor) + partStride(factor) * k) % 12;
}

double DivisionalChartEngine::vargaLongitude(double longitude, int factor) {
    const double lon = normalizeDegrees(longitude);
    if (factor == 1) return lon;

    const int s = signOf(lon);
    const double deg = lon - s * SIGN_SPAN;
    double fraction;

    if (factor == 30) {
        const TrimsamsaPart* parts = isOddSign(s) ? TRIMSAMSA_ODD : TRIMSAMSA_EVEN;
        double lower = 0.0;
        fraction = 0.0;
        for (int i = 0; i < 5; ++i) {
            if (deg < parts[i].upper || i == 4) {
                fraction = (deg - lower) / (parts[i].upper - lower);
                break;
            }
            lower = parts[i].upper;
        }
    } else {
        const double part = SIGN_SPAN / factor;
        const int k = std::min(factor - 1, static_cast<int>(deg / part));
        fraction = (deg - k * part) / part;
    }
    fraction = std::min(std::max(fraction, 0.0), 1.0 - 1e-12);
    return normalizeDegrees(vargaSign(lon, factor) * SIGN_SPAN + fraction * SIGN_SPAN);
}

bool DivisionalChartEngine::supports(int factor) const {
    return std::binary_search(catalog_.begin(), catalog_.end(), factor);
}

DivisionalChart DivisionalChartEngine::derive(const Chart& chart, int factor) const {
    if (!supports(factor)) {
        throw UnsupportedParameter("division_factor", std::to_string(factor));
    }

    DivisionalChart out;
    out.factor = factor;
    out.chart = chart;
    if (factor == 1) {
        return out;
    }

    Chart& v = out.chart;
    v.house_system = HouseSystemType::WHOLE_SIGN;
    v.ascendant = vargaLongitude(chart.ascendant, factor);
    v.midheaven = vargaLongitude(chart.midheaven, factor);
    const int first = signOf(v.ascendant);
    for (int i = 0; i < 12; ++i) {
        v.cusps[i] = ((first + i) % 12) * SIGN_SPAN;
    }
    for (auto& p : v.positions) {
        p.longitude = vargaLongitude(p.longitude, factor);
        p.house = v.houseOf(p.longitude);
    }
    return out;
}

} // namespace astchart::divisional
