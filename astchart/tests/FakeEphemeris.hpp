/**
 * @file FakeEphemeris.hpp
 * @brief Scriptable ephemeris provider for unit tests
 * @author AstChart Team
 * @date 2026-02-20
 *
 * Longitudes move linearly: base + rate * (jd_tt - J2000).
 * The provider can be told to fail its next N calls.
 */

#ifndef ASTCHART_TESTS_FAKE_EPHEMERIS_HPP
#define ASTCHART_TESTS_FAKE_EPHEMERIS_HPP

#include "astchart/core/Angles.hpp"
#include "astchart/core/Constants.hpp"
#include "astchart/ephemeris/EphemerisProvider.hpp"
#include <atomic>
#include <map>
#include <stdexcept>

namespace astchart::fixtures {

class FakeEphemeris : public ephemeris::EphemerisProvider {
public:
    struct Motion {
        double base = 0.0;    ///< Longitude at J2000 [deg]
        double rate = 0.0;    ///< [deg/day]
    };

    std::vector<ephemeris::EclipticCoordinates> compute(const std::vector<Body>& bodies,
                                                        double jd_tt) override {
        ++calls;
        if (fail_next > 0) {
            --fail_next;
            throw std::runtime_error("scripted failure");
        }
        std::vector<ephemeris::EclipticCoordinates> out;
        out.reserve(bodies.size());
        for (Body b : bodies) {
            Motion m = motion(b);
            ephemeris::EclipticCoordinates c;
            c.longitude = normalizeDegrees(m.base + m.rate * (jd_tt - constants::JD_J2000));
            c.distance = 1.0;
            out.push_back(c);
        }
        return out;
    }

    std::string getName() const override { return "fake"; }
    double getAccuracy() const override { return 0.0; }
    bool isAvailable() const override { return available; }

    Motion motion(Body b) const {
        auto it = motions.find(b);
        if (it != motions.end()) return it->second;
        return {30.0 * static_cast<int>(b), 0.0};
    }

    std::map<Body, Motion> motions;
    std::atomic<int> calls{0};
    std::atomic<int> fail_next{0};
    bool available = true;
};

} // namespace astchart::fixtures

#endif // ASTCHART_TESTS_FAKE_EPHEMERIS_HPP
