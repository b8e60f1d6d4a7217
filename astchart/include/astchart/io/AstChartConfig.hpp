/**
 * @file AstChartConfig.hpp
 * @brief Engine configuration and its JSON loader
 * @author AstChart Team
 * @date 2026-02-22
 *
 * Every key is optional; absent keys keep the defaults below.
 */

#ifndef ASTCHART_IO_ASTCHART_CONFIG_HPP
#define ASTCHART_IO_ASTCHART_CONFIG_HPP

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/chart/ChartBuilder.hpp"
#include "astchart/compatibility/CompatibilityEngine.hpp"
#include "astchart/divisional/DivisionalChartEngine.hpp"
#include "astchart/ephemeris/EphemerisGateway.hpp"
#include "astchart/periods/PeriodEngine.hpp"
#include "astchart/predictive/PredictiveTimingEngine.hpp"
#include "astchart/service/ResultCache.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace astchart::io {

struct AstChartConfig {
    ChartSettings chart;                               ///< house_system, zodiac, placidus_max_latitude
    ephemeris::GatewaySettings ephemeris;
    aspects::OrbTable orb_table = aspects::OrbTable::defaults();
    aspects::PatternSettings patterns;                 ///< "stellium"
    std::vector<int> division_catalog = divisional::DivisionalChartEngine::defaultCatalog();
    periods::PeriodSettings periods;
    predictive::SearchSettings search;
    compatibility::CompatibilitySettings compatibility;
    service::CacheSettings cache;
    bool verbose = false;                              ///< Raises the log level to INFO
};

/**
 * @brief Build a configuration from a JSON object
 * @throws UnsupportedParameter for unknown names or out-of-range values
 * @throws nlohmann::json::exception for wrongly typed values
 */
AstChartConfig parseAstChartConfig(const nlohmann::json& j);

/**
 * @brief Load a configuration file
 * @throws std::runtime_error if the file cannot be opened
 */
AstChartConfig loadAstChartConfig(const std::string& config_file);

/// Inverse of parseAstChartConfig
nlohmann::json configToJson(const AstChartConfig& config);

} // namespace astchart::io

#endif // ASTCHART_IO_ASTCHART_CONFIG_HPP
