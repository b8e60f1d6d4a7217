/**
 * @file EphemerisGateway.cpp
 * @brief Ephemeris gateway implementation
 * @author AstChart Team
 * @date 2026-02-13
 */

#include "astchart/ephemeris/EphemerisGateway.hpp"
#include "astchart/core/Angles.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/time/TimeScale.hpp"
#include "astchart/utils/Logger.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace astchart::ephemeris {

EphemerisGateway::EphemerisGateway(std::shared_ptr<EphemerisProvider> provider,
                                   GatewaySettings settings)
    : provider_(std::move(provider)),
      settings_(settings),
      min_jd_(time::julianDay(settings.min_year, 1, 1.0)),
      max_jd_(time::julianDay(settings.max_year + 1, 1, 1.0))
{
    if (!provider_) {
        throw std::invalid_argument("EphemerisGateway requires a provider");
    }
    if (settings_.max_year < settings_.min_year) {
        throw std::invalid_argument("EphemerisGateway: max_year before min_year");
    }
}

std::string EphemerisGateway::providerName() const {
    return provider_->getName();
}

bool EphemerisGateway::inRange(double jd_ut) const {
    return jd_ut >= min_jd_ && jd_ut < max_jd_;
}

void EphemerisGateway::checkRange(double jd_ut) const {
    if (!inRange(jd_ut)) {
        throw EphemerisUnavailable("Date " + time::formatIso(jd_ut) + " outside ephemeris range "
                                   + std::to_string(settings_.min_year) + "-"
                                   + std::to_string(settings_.max_year));
    }
}

std::vector<EclipticCoordinates> EphemerisGateway::fetch(const std::vector<Body>& bodies,
                                                         double jd_tt) const {
    std::string last_error;
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (attempt > 0) {
            utils::Logger::warning("ephemeris", provider_->getName() + " failed (" + last_error
                                   + "), retrying in "
                                   + std::to_string(settings_.retry_backoff_ms) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.retry_backoff_ms));
        }
        try {
            if (!provider_->isAvailable()) {
                last_error = "provider not available";
                continue;
            }
            auto coords = provider_->compute(bodies, jd_tt);
            if (coords.size() != bodies.size()) {
                last_error = "provider returned " + std::to_string(coords.size())
                           + " positions for " + std::to_string(bodies.size()) + " bodies";
                continue;
            }
            return coords;
        } catch (const std::exception& e) {
            last_error = e.what();
        }
    }
    throw EphemerisUnavailable("Ephemeris source '" + provider_->getName() + "' failed: " + last_error);
}

double EphemerisGateway::zodiacOffset(double jd_tt, ZodiacType zodiac) const {
    return zodiac == ZodiacType::SIDEREAL ? time::lahiriAyanamsa(jd_tt) : 0.0;
}

std::vector<double> EphemerisGateway::getLongitudes(const std::vector<Body>& bodies, double jd_ut,
                                                    ZodiacType zodiac) const {
    checkRange(jd_ut);
    const double jd_tt = time::utToTT(jd_ut);
    const double offset = zodiacOffset(jd_tt, zodiac);

    auto coords = fetch(bodies, jd_tt);
    std::vector<double> out;
    out.reserve(coords.size());
    for (const auto& c : coords) {
        out.push_back(normalizeDegrees(c.longitude - offset));
    }
    return out;
}

std::vector<BodyPosition> EphemerisGateway::getPositions(const std::vector<Body>& bodies, double jd_ut,
                                                         ZodiacType zodiac) const {
    checkRange(jd_ut);
    const double h = settings_.speed_step_days;
    const double jd_tt = time::utToTT(jd_ut);

    // Three batched calls: t - h, t, t + h
    auto before = fetch(bodies, jd_tt - h);
    auto now = fetch(bodies, jd_tt);
    auto after = fetch(bodies, jd_tt + h);

    const double off_before = zodiacOffset(jd_tt - h, zodiac);
    const double off_now = zodiacOffset(jd_tt, zodiac);
    const double off_after = zodiacOffset(jd_tt + h, zodiac);

    std::vector<BodyPosition> out;
    out.reserve(bodies.size());
    for (size_t i = 0; i < bodies.size(); ++i) {
        BodyPosition p;
        p.body = bodies[i];
        p.longitude = normalizeDegrees(now[i].longitude - off_now);
        p.latitude = now[i].latitude;
        p.distance = now[i].distance;

        double lon_b = before[i].longitude - off_before;
        double lon_a = after[i].longitude - off_after;
        p.speed = signedDelta(lon_a, lon_b) / (2.0 * h);
        p.retrograde = p.speed < 0.0;
        out.push_back(p);
    }

    if (utils::Logger::enabled(utils::LogLevel::DEBUG)) {
        utils::Logger::debug("ephemeris", "positions for " + std::to_string(bodies.size())
                             + " bodies at JD " + std::to_string(jd_ut));
    }
    return out;
}

} // namespace astchart::ephemeris
