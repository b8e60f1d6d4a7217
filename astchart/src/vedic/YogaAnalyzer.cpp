/**
 * @file YogaAnalyzer.cpp
 * @brief Yoga rules
 * @author AstChart Team
 * @date 2026-02-21
 */

#include "astchart/vedic/YogaAnalyzer.hpp"
#include "astchart/vedic/DoshaAnalyzer.hpp"
#include "astchart/strength/StrengthEngine.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>
#include <initializer_list>
#include <set>
#include <utility>

namespace astchart::vedic {

using strength::Dignity;
using strength::StrengthEngine;

namespace {

struct Mahapurusha {
    Body body;
    const char* name;
};

const Mahapurusha MAHAPURUSHA[] = {
    {Body::MARS, "Ruchaka"},
    {Body::MERCURY, "Bhadra"},
    {Body::JUPITER, "Hamsa"},
    {Body::VENUS, "Malavya"},
    {Body::SATURN, "Shasha"},
};

const Body TARA_GRAHAS[] = {Body::MARS, Body::MERCURY, Body::JUPITER, Body::VENUS, Body::SATURN};

bool isKendra(int house) {
    return house == 1 || house == 4 || house == 7 || house == 10;
}

std::vector<Body> lordsOf(const Chart& chart, std::initializer_list<int> houses) {
    std::vector<Body> lords;
    for (int h : houses) {
        Body lord = YogaAnalyzer::houseLord(chart, h);
        bool seen = false;
        for (Body b : lords) seen = seen || b == lord;
        if (!seen) lords.push_back(lord);
    }
    return lords;
}

/**
 * Pairs one lord from each set that share a sign or sit in each other's
 * signs. A planet never pairs with itself and each pair is reported once.
 */
std::vector<YogaFinding> associations(const Chart& chart, const std::vector<Body>& first,
                                      const std::vector<Body>& second, const char* name,
                                      const char* group) {
    std::vector<YogaFinding> out;
    std::set<std::pair<int, int>> seen;
    for (Body a : first) {
        for (Body b : second) {
            if (a == b) continue;
            const std::pair<int, int> key(std::min(static_cast<int>(a), static_cast<int>(b)),
                                          std::max(static_cast<int>(a), static_cast<int>(b)));
            if (seen.count(key)) continue;

            const int sign_a = chart.position(a).sign();
            const int sign_b = chart.position(b).sign();
            std::string detail;
            if (sign_a == sign_b) {
                detail = bodyName(a) + " and " + bodyName(b) + " together in " + signName(sign_a);
            } else if (StrengthEngine::signLord(sign_a) == b && StrengthEngine::signLord(sign_b) == a) {
                detail = bodyName(a) + " and " + bodyName(b) + " exchange signs";
            } else {
                continue;
            }
            seen.insert(key);

            YogaFinding f;
            f.name = name;
            f.group = group;
            f.bodies = {static_cast<Body>(key.first), static_cast<Body>(key.second)};
            f.detail = detail;
            out.push_back(f);
        }
    }
    return out;
}

} // anonymous namespace

Body YogaAnalyzer::houseLord(const Chart& chart, int house) {
    if (house < 1 || house > 12) {
        throw UnsupportedParameter("house", std::to_string(house));
    }
    return StrengthEngine::signLord((chart.ascendantSign() + house - 1) % 12);
}

std::vector<YogaFinding> YogaAnalyzer::panchaMahapurusha(const Chart& chart) {
    std::vector<YogaFinding> out;
    const int lagna = chart.ascendantSign();
    for (const auto& m : MAHAPURUSHA) {
        const BodyPosition& p = chart.position(m.body);
        const Dignity d = StrengthEngine::dignity(m.body, p.longitude);
        const bool dignified = d == Dignity::EXALTED || d == Dignity::MOOLATRIKONA
                            || d == Dignity::OWN_SIGN;
        const int house = DoshaAnalyzer::signHouse(lagna, p.sign());
        if (!dignified || !isKendra(house)) continue;

        YogaFinding f;
        f.name = m.name;
        f.group = "mahapurusha";
        f.bodies = {m.body};
        f.detail = bodyName(m.body) + " " + strength::dignityName(d) + " in house "
                 + std::to_string(house);
        out.push_back(f);
    }
    return out;
}

std::optional<YogaFinding> YogaAnalyzer::gajaKesari(const Chart& chart) {
    const int house = DoshaAnalyzer::signHouse(chart.position(Body::MOON).sign(),
                                               chart.position(Body::JUPITER).sign());
    if (!isKendra(house)) return std::nullopt;

    YogaFinding f;
    f.name = "Gaja Kesari";
    f.group = "lunar";
    f.bodies = {Body::MOON, Body::JUPITER};
    f.detail = "jupiter in house " + std::to_string(house) + " from the moon";
    return f;
}

std::optional<YogaFinding> YogaAnalyzer::kemadruma(const Chart& chart) {
    const int moon = chart.position(Body::MOON).sign();
    for (Body b : TARA_GRAHAS) {
        const int house = DoshaAnalyzer::signHouse(moon, chart.position(b).sign());
        if (house == 2 || house == 12) return std::nullopt;
    }

    YogaFinding f;
    f.name = "Kemadruma";
    f.group = "lunar";
    f.auspicious = false;
    f.bodies = {Body::MOON};
    f.detail = "no planet in the 2nd or 12th sign from the moon";
    return f;
}

std::vector<YogaFinding> YogaAnalyzer::rajaYogas(const Chart& chart) {
    return associations(chart, lordsOf(chart, {1, 4, 7, 10}), lordsOf(chart, {1, 5, 9}),
                        "Raja", "raja");
}

std::vector<YogaFinding> YogaAnalyzer::dhanaYogas(const Chart& chart) {
    return associations(chart, lordsOf(chart, {2, 11}), lordsOf(chart, {1, 5, 9}),
                        "Dhana", "dhana");
}

std::vector<YogaFinding> YogaAnalyzer::analyzeGroup(const Chart& chart, const std::string& group) {
    if (group == "mahapurusha") return panchaMahapurusha(chart);
    if (group == "raja") return rajaYogas(chart);
    if (group == "dhana") return dhanaYogas(chart);
    if (group == "lunar") {
        std::vector<YogaFinding> out;
        if (auto g = gajaKesari(chart)) out.push_back(*g);
        if (auto k = kemadruma(chart)) out.push_back(*k);
        return out;
    }
    throw UnsupportedParameter("yoga group", group);
}

std::vector<YogaFinding> YogaAnalyzer::analyze(const Chart& chart) {
    std::vector<YogaFinding> out;
    for (const char* group : {"mahapurusha", "lunar", "raja", "dhana"}) {
        for (auto& f : analyzeGroup(chart, group)) out.push_back(std::move(f));
    }
    return out;
}

} // namespace astchart::vedic
