/**
 * @file Chart.cpp
 * @brief Chart accessors
 * @author AstChart Team
 * @date 2026-02-14
 */

#include "astchart/chart/Chart.hpp"
#include <stdexcept>

namespace astchart {

const BodyPosition* Chart::find(Body body) const {
    for (const auto& p : positions) {
        if (p.body == body) return &p;
    }
    return nullptr;
}

const BodyPosition& Chart::position(Body body) const {
    const BodyPosition* p = find(body);
    if (!p) {
        throw std::out_of_range("Body not in chart: " + bodyName(body));
    }
    return *p;
}

std::vector<BodyPosition> Chart::points() const {
    std::vector<BodyPosition> out = positions;

    BodyPosition asc;
    asc.body = Body::ASCENDANT;
    asc.longitude = ascendant;
    asc.house = houseOf(ascendant);
    out.push_back(asc);

    BodyPosition mc;
    mc.body = Body::MIDHEAVEN;
    mc.longitude = midheaven;
    mc.house = houseOf(midheaven);
    out.push_back(mc);
    return out;
}

int Chart::houseOf(double longitude) const {
    return houseContaining(cusps, longitude);
}

bool Chart::operator==(const Chart& o) const {
    return subject == o.subject && location == o.location && jd_ut == o.jd_ut
        && house_system == o.house_system && zodiac == o.zodiac
        && positions == o.positions && cusps == o.cusps
        && ascendant == o.ascendant && midheaven == o.midheaven;
}

} // namespace astchart
