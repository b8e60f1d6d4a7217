/**
 * @file ChartBuilder.cpp
 * @brief Chart construction
 * @author AstChart Team
 * @date 2026-02-14
 */

#include "astchart/chart/ChartBuilder.hpp"
#include "astchart/time/TimeScale.hpp"
#include "astchart/utils/Logger.hpp"
#include <stdexcept>

namespace astchart {

ChartBuilder::ChartBuilder(std::shared_ptr<const ephemeris::EphemerisGateway> gateway,
                           ChartSettings settings)
    : gateway_(std::move(gateway)), settings_(settings)
{
    if (!gateway_) {
        throw std::invalid_argument("ChartBuilder requires an ephemeris gateway");
    }
}

Chart ChartBuilder::build(const Subject& subject, double as_of_jd_ut,
                          HouseSystemType house_system) const {
    return buildAt(subject, as_of_jd_ut, subject.place(), house_system, settings_.zodiac);
}

Chart ChartBuilder::buildAt(const Subject& subject, double jd_ut, const GeoLocation& location,
                            HouseSystemType house_system, ZodiacType zodiac) const {
    Chart chart;
    chart.subject = subject;
    chart.location = location;
    chart.jd_ut = jd_ut;
    chart.house_system = house_system;
    chart.zodiac = zodiac;

    // Houses first: latitude failures are cheaper than an ephemeris call
    const double offset = zodiac == ZodiacType::SIDEREAL
                              ? time::lahiriAyanamsa(time::utToTT(jd_ut))
                              : 0.0;
    HouseCusps houses = computeHouses(house_system, jd_ut, location.latitude,
                                      location.longitude, offset, settings_.houses);
    chart.cusps = houses.cusps;
    chart.ascendant = houses.ascendant;
    chart.midheaven = houses.midheaven;

    chart.positions = gateway_->getPositions(ephemerisBodies(), jd_ut, zodiac);
    for (auto& p : chart.positions) {
        p.house = chart.houseOf(p.longitude);
    }

    if (utils::Logger::enabled(utils::LogLevel::DEBUG)) {
        utils::Logger::debug("chart", "built " + houseSystemName(house_system) + " chart at "
                             + time::formatIso(jd_ut) + " ASC " + std::to_string(chart.ascendant));
    }
    return chart;
}

} // namespace astchart
