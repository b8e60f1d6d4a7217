/**
 * @file CalculationContext.cpp
 * @brief Engine wiring
 * @author AstChart Team
 * @date 2026-02-22
 */

#include "astchart/service/CalculationContext.hpp"
#include "astchart/core/Constants.hpp"
#include "astchart/ephemeris/AnalyticalEphemeris.hpp"
#include "astchart/utils/Logger.hpp"
#include <chrono>

namespace astchart::service {

namespace {

std::shared_ptr<ephemeris::EphemerisGateway> makeGateway(
    std::shared_ptr<ephemeris::EphemerisProvider> provider,
    const ephemeris::GatewaySettings& settings)
{
    if (!provider) provider = std::make_shared<ephemeris::AnalyticalEphemeris>();
    return std::make_shared<ephemeris::EphemerisGateway>(std::move(provider), settings);
}

double systemJulianDay() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const double seconds = std::chrono::duration<double>(since_epoch).count();
    return 2440587.5 + seconds / constants::SECONDS_PER_DAY;
}

} // anonymous namespace

CalculationContext::CalculationContext(io::AstChartConfig config,
                                       std::shared_ptr<ephemeris::EphemerisProvider> provider,
                                       NowSource now)
    : config_(std::move(config)),
      gateway_(makeGateway(std::move(provider), config_.ephemeris)),
      builder_(std::make_shared<ChartBuilder>(gateway_, config_.chart)),
      divisional_(config_.division_catalog),
      aspects_(config_.orb_table, config_.patterns),
      periods_(gateway_, config_.periods),
      predictive_(builder_, config_.search),
      compatibility_(builder_, aspects_, config_.compatibility),
      panchang_(gateway_),
      now_(now ? std::move(now) : NowSource(systemJulianDay))
{
    if (config_.verbose && !utils::Logger::enabled(utils::LogLevel::INFO)) {
        utils::Logger::setLevel(utils::LogLevel::INFO);
    }
    utils::Logger::info("context", "ephemeris " + gateway_->providerName() + ", houses "
                        + houseSystemName(config_.chart.house_system) + ", zodiac "
                        + zodiacName(config_.chart.zodiac));
}

double CalculationContext::nowJulianDay() const {
    return now_();
}

Chart CalculationContext::chartAt(const Subject& subject, double jd_ut,
                                  HouseSystemType house_system, ZodiacType zodiac) const {
    return builder_->buildAt(subject, jd_ut, subject.place(), house_system, zodiac);
}

} // namespace astchart::service
