/**
 * @file EphemerisProvider.hpp
 * @brief Abstract interface for ephemeris sources
 * @author AstChart Team
 * @date 2026-02-12
 */

#ifndef ASTCHART_EPHEMERIS_EPHEMERIS_PROVIDER_HPP
#define ASTCHART_EPHEMERIS_EPHEMERIS_PROVIDER_HPP

#include "astchart/core/Types.hpp"
#include <string>
#include <vector>

namespace astchart::ephemeris {

/**
 * @brief Geocentric apparent ecliptic coordinates, equinox of date
 */
struct EclipticCoordinates {
    double longitude = 0.0;   ///< [deg]
    double latitude = 0.0;    ///< [deg]
    double distance = 0.0;    ///< [AU]
};

/**
 * @brief Source of body positions
 *
 * Implementations may perform blocking I/O. A batch call returns one entry
 * per requested body, in request order, and throws std::runtime_error (or
 * a subclass) when the source cannot answer.
 */
class EphemerisProvider {
public:
    virtual ~EphemerisProvider() = default;

    /**
     * @brief Compute positions for a batch of bodies
     * @param bodies Bodies to compute (Sun .. Ketu)
     * @param jd_tt Julian Day, Terrestrial Time
     */
    virtual std::vector<EclipticCoordinates> compute(const std::vector<Body>& bodies,
                                                     double jd_tt) = 0;

    /**
     * @brief Provider name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Typical accuracy [arcsec]
     */
    virtual double getAccuracy() const = 0;

    /**
     * @brief Check if provider is ready to answer
     */
    virtual bool isAvailable() const = 0;
};

} // namespace astchart::ephemeris

#endif // ASTCHART_EPHEMERIS_EPHEMERIS_PROVIDER_HPP
