/**
 * @file EphemerisGateway.hpp
 * @brief Batched, bounds-checked access to an ephemeris provider
 * @author AstChart Team
 * @date 2026-02-13
 */

#ifndef ASTCHART_EPHEMERIS_EPHEMERIS_GATEWAY_HPP
#define ASTCHART_EPHEMERIS_EPHEMERIS_GATEWAY_HPP

#include "astchart/core/Types.hpp"
#include "astchart/ephemeris/EphemerisProvider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace astchart::ephemeris {

/**
 * @brief Gateway settings
 */
struct GatewaySettings {
    int min_year = 1900;                ///< First supported year (inclusive)
    int max_year = 2100;                ///< Last supported year (inclusive)
    int retry_backoff_ms = 50;          ///< Delay before the single retry
    double speed_step_days = 0.25;      ///< Half-width of the central difference
};

/**
 * @brief Front door to the ephemeris
 *
 * Converts UT to TT, enforces the supported date range, computes daily
 * motion by central difference and applies the sidereal offset when asked.
 * A provider failure is retried once after a backoff, then surfaced as
 * EphemerisUnavailable. Out-of-range requests fail immediately.
 *
 * The provider is shared between threads and must be safe for concurrent
 * compute() calls.
 */
class EphemerisGateway {
public:
    explicit EphemerisGateway(std::shared_ptr<EphemerisProvider> provider,
                              GatewaySettings settings = {});

    /**
     * @brief Positions with daily motion for a batch of bodies
     * @param bodies Sun .. Ketu
     * @param jd_ut Julian Day (UT)
     * @param zodiac Tropical or sidereal (Lahiri)
     * @throws EphemerisUnavailable
     */
    std::vector<BodyPosition> getPositions(const std::vector<Body>& bodies, double jd_ut,
                                           ZodiacType zodiac = ZodiacType::TROPICAL) const;

    /**
     * @brief Longitudes only, one provider call (used by searches and scans)
     */
    std::vector<double> getLongitudes(const std::vector<Body>& bodies, double jd_ut,
                                      ZodiacType zodiac = ZodiacType::TROPICAL) const;

    bool inRange(double jd_ut) const;
    double minJulianDay() const { return min_jd_; }
    double maxJulianDay() const { return max_jd_; }

    const GatewaySettings& settings() const { return settings_; }
    std::string providerName() const;

private:
    void checkRange(double jd_ut) const;
    std::vector<EclipticCoordinates> fetch(const std::vector<Body>& bodies, double jd_tt) const;
    double zodiacOffset(double jd_tt, ZodiacType zodiac) const;

    std::shared_ptr<EphemerisProvider> provider_;
    GatewaySettings settings_;
    double min_jd_;
    double max_jd_;
};

} // namespace astchart::ephemeris

#endif // ASTCHART_EPHEMERIS_EPHEMERIS_GATEWAY_HPP
