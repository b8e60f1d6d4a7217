/**
 * @file AnalyticalEphemeris.hpp
 * @brief Built-in analytical ephemeris (no data files)
 * @author AstChart Team
 * @date 2026-02-12
 *
 * Sun:      Meeus ch. 25 solar theory
 * Moon:     Meeus ch. 47 (ELP-2000/82, 60+60 periodic terms)
 * Planets:  Standish (1992) mean elements with secular rates,
 *           geocentric with light-time, precessed to date (Meeus ch. 21)
 * Nodes:    mean lunar node
 *
 * Accuracy: Sun/Moon ~10 arcsec, planets ~1 arcmin over 1800-2050.
 */

#ifndef ASTCHART_EPHEMERIS_ANALYTICAL_EPHEMERIS_HPP
#define ASTCHART_EPHEMERIS_ANALYTICAL_EPHEMERIS_HPP

#include "astchart/ephemeris/EphemerisProvider.hpp"
#include <Eigen/Dense>

namespace astchart::ephemeris {

class AnalyticalEphemeris : public EphemerisProvider {
public:
    AnalyticalEphemeris() = default;

    std::vector<EclipticCoordinates> compute(const std::vector<Body>& bodies,
                                             double jd_tt) override;

    std::string getName() const override { return "Analytical (Meeus/Standish)"; }

    double getAccuracy() const override { return 60.0; }

    bool isAvailable() const override { return true; }

    /**
     * @brief Heliocentric position, J2000 ecliptic and equinox [AU]
     * @param body Mercury .. Pluto; SUN selects the Earth-Moon barycenter
     */
    static Eigen::Vector3d heliocentricJ2000(Body body, double jd_tt);

    static EclipticCoordinates sun(double jd_tt);
    static EclipticCoordinates moon(double jd_tt);
    static EclipticCoordinates planet(Body body, double jd_tt);
    static double meanNode(double jd_tt);
};

} // namespace astchart::ephemeris

#endif // ASTCHART_EPHEMERIS_ANALYTICAL_EPHEMERIS_HPP
