/**
 * @file PeriodEngine.cpp
 * @brief Vimshottari tree construction and lookup
 * @author AstChart Team
 * @date 2026-02-18
 */

#include "astchart/periods/PeriodEngine.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace astchart::periods {

using namespace astchart::constants;

namespace {

size_t sequenceIndex(Body ruler) {
    const auto& seq = PeriodEngine::rulerSequence();
    auto it = std::find(seq.begin(), seq.end(), ruler);
    if (it == seq.end()) {
        throw std::invalid_argument("Not a period ruler: " + bodyName(ruler));
    }
    return static_cast<size_t>(it - seq.begin());
}

void subdivide(Period& node, int depth) {
    if (node.level >= depth) return;

    const auto& seq = PeriodEngine::rulerSequence();
    const size_t first = sequenceIndex(node.ruler);
    const double span = node.spanDays();

    double cursor = node.start_jd;
    node.children.reserve(seq.size());
    for (size_t i = 0; i < seq.size(); ++i) {
        auto child = std::make_unique<Period>();
        child->level = node.level + 1;
        child->ruler = seq[(first + i) % seq.size()];
        child->parent = &node;
        child->start_jd = cursor;
        child->end_jd = (i + 1 == seq.size())
                            ? node.end_jd
                            : cursor + span * PeriodEngine::rulerYears(child->ruler)
                                         / PeriodEngine::CYCLE_YEARS;
        cursor = child->end_jd;
        subdivide(*child, depth);
        node.children.push_back(std::move(child));
    }
}

} // anonymous namespace

const std::vector<Body>& PeriodEngine::rulerSequence() {
    static const std::vector<Body> seq = {
        Body::KETU, Body::VENUS, Body::SUN, Body::MOON, Body::MARS,
        Body::RAHU, Body::JUPITER, Body::SATURN, Body::MERCURY
    };
    return seq;
}

double PeriodEngine::rulerYears(Body ruler) {
    switch (ruler) {
        case Body::KETU:    return 7.0;
        case Body::VENUS:   return 20.0;
        case Body::SUN:     return 6.0;
        case Body::MOON:    return 10.0;
        case Body::MARS:    return 7.0;
        case Body::RAHU:    return 18.0;
        case Body::JUPITER: return 16.0;
        case Body::SATURN:  return 19.0;
        case Body::MERCURY: return 17.0;
        default:
            throw std::invalid_argument("Not a period ruler: " + bodyName(ruler));
    }
}

PeriodEngine::PeriodEngine(std::shared_ptr<const ephemeris::EphemerisGateway> gateway,
                           PeriodSettings settings)
    : gateway_(std::move(gateway)), settings_(settings)
{
    if (!gateway_) {
        throw std::invalid_argument("PeriodEngine requires an ephemeris gateway");
    }
    if (settings_.depth < 1 || settings_.depth > MAX_DEPTH) {
        throw UnsupportedParameter("period depth", std::to_string(settings_.depth));
    }
}

PeriodTree PeriodEngine::buildTree(const Subject& subject) const {
    const double jd = subject.julianDay();
    const double moon = gateway_->getLongitudes({Body::MOON}, jd, ZodiacType::SIDEREAL).front();
    return buildTree(moon, jd, settings_.depth);
}

PeriodTree PeriodEngine::buildTree(double moon_sidereal_longitude, double birth_jd, int depth) {
    if (depth < 1 || depth > MAX_DEPTH) {
        throw UnsupportedParameter("period depth", std::to_string(depth));
    }

    const double lon = normalizeDegrees(moon_sidereal_longitude);
    const int nak = std::min(26, static_cast<int>(lon / NAKSHATRA_SPAN));
    const double elapsed = (lon - nak * NAKSHATRA_SPAN) / NAKSHATRA_SPAN;
    const Body ruler = rulerSequence()[static_cast<size_t>(nak) % rulerSequence().size()];
    const double ruler_days = rulerYears(ruler) * DAYS_PER_JULIAN_YEAR;

    auto root = std::make_shared<Period>();
    root->level = 0;
    root->ruler = ruler;
    root->start_jd = birth_jd - elapsed * ruler_days;
    root->end_jd = root->start_jd + CYCLE_YEARS * DAYS_PER_JULIAN_YEAR;
    subdivide(*root, depth);

    PeriodTree tree;
    tree.root = root;
    tree.birth_jd = birth_jd;
    tree.moon_longitude = lon;
    tree.nakshatra = nak;
    tree.birth_ruler = ruler;
    tree.balance_years = (1.0 - elapsed) * rulerYears(ruler);
    tree.depth = depth;
    return tree;
}

std::vector<const Period*> PeriodEngine::query(const PeriodTree& tree, double jd) {
    if (!tree.root) {
        throw std::invalid_argument("Empty period tree");
    }
    const Period* node = tree.root.get();
    if (!node->contains(jd)) {
        throw OutOfRangeInstant(jd, node->start_jd, node->end_jd);
    }

    std::vector<const Period*> path{node};
    while (!node->children.empty()) {
        const Period* next = nullptr;
        for (const auto& c : node->children) {
            if (c->contains(jd)) {
                next = c.get();
                break;
            }
        }
        if (!next) break;
        path.push_back(next);
        node = next;
    }
    return path;
}

std::vector<const Period*> PeriodEngine::upcoming(const PeriodTree& tree, double jd,
                                                  int level, int count) {
    std::vector<const Period*> out;
    if (!tree.root || level < 1 || level > tree.depth || count <= 0) return out;

    std::function<void(const Period&)> walk = [&](const Period& p) {
        if (static_cast<int>(out.size()) >= count || p.end_jd <= jd) return;
        if (p.level == level) {
            out.push_back(&p);
            return;
        }
        for (const auto& c : p.children) walk(*c);
    };
    walk(*tree.root);
    return out;
}

} // namespace astchart::periods
