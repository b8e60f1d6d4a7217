/**
 * @file AstChartConfig.cpp
 * @brief JSON configuration loader
 * @author AstChart Team
 * @date 2026-02-22
 */

#include "astchart/io/AstChartConfig.hpp"
#include "astchart/core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace astchart::io {

namespace {

std::string formatAngle(double angle) {
    const double rounded = std::round(angle);
    if (rounded == angle) return std::to_string(static_cast<long long>(rounded));
    return std::to_string(angle);
}

void parseOrbTable(const nlohmann::json& ot, aspects::OrbTable& table) {
    if (ot.contains("minor_aspects")) {
        for (double angle : ot["minor_aspects"].get<std::vector<double>>()) {
            const auto minors = aspects::OrbTable::minorCatalog();
            auto it = std::find_if(minors.begin(), minors.end(),
                                   [angle](const aspects::AspectDefinition& d) {
                                       return d.angle == angle;
                                   });
            if (it == minors.end()) {
                throw UnsupportedParameter("minor_aspects", formatAngle(angle));
            }
            bool present = std::any_of(table.aspects.begin(), table.aspects.end(),
                                       [angle](const aspects::AspectDefinition& d) {
                                           return d.angle == angle;
                                       });
            if (!present) table.aspects.push_back(*it);
        }
        std::sort(table.aspects.begin(), table.aspects.end(),
                  [](const aspects::AspectDefinition& a, const aspects::AspectDefinition& b) {
                      return a.angle < b.angle;
                  });
    }

    if (ot.contains("aspects")) {
        for (auto& [key, value] : ot["aspects"].items()) {
            double angle = 0.0;
            try {
                angle = std::stod(key);
            } catch (const std::exception&) {
                throw UnsupportedParameter("orb_table.aspects", key);
            }
            auto it = std::find_if(table.aspects.begin(), table.aspects.end(),
                                   [angle](const aspects::AspectDefinition& d) {
                                       return d.angle == angle;
                                   });
            const double orb = value.get<double>();
            if (it == table.aspects.end() || orb < 0.0) {
                throw UnsupportedParameter("orb_table.aspects", key);
            }
            it->orb = orb;
        }
    }

    if (ot.contains("body_factors")) {
        for (auto& [name, value] : ot["body_factors"].items()) {
            auto body = bodyFromName(name);
            const double factor = value.get<double>();
            if (!body || factor <= 0.0 || factor > 1.0) {
                throw UnsupportedParameter("orb_table.body_factors", name);
            }
            table.body_factors[*body] = factor;
        }
    }
}

} // anonymous namespace

AstChartConfig parseAstChartConfig(const nlohmann::json& j) {
    AstChartConfig config;

    if (j.contains("house_system")) {
        config.chart.house_system = houseSystemFromName(j["house_system"].get<std::string>());
    }
    if (j.contains("zodiac")) {
        config.chart.zodiac = zodiacFromName(j["zodiac"].get<std::string>());
    }
    config.chart.houses.placidus_max_latitude = j.value("placidus_max_latitude", 66.5);
    if (config.chart.houses.placidus_max_latitude <= 0.0
        || config.chart.houses.placidus_max_latitude >= 90.0) {
        throw UnsupportedParameter("placidus_max_latitude",
                                   std::to_string(config.chart.houses.placidus_max_latitude));
    }

    if (j.contains("orb_table")) {
        parseOrbTable(j["orb_table"], config.orb_table);
    }

    if (j.contains("division_catalog")) {
        config.division_catalog = j["division_catalog"].get<std::vector<int>>();
        for (int factor : config.division_catalog) {
            if (!divisional::DivisionalChartEngine::hasRule(factor)) {
                throw UnsupportedParameter("division_catalog", std::to_string(factor));
            }
        }
    }

    if (j.contains("ephemeris")) {
        auto& ep = j["ephemeris"];
        config.ephemeris.min_year = ep.value("min_year", 1900);
        config.ephemeris.max_year = ep.value("max_year", 2100);
        config.ephemeris.retry_backoff_ms = ep.value("retry_backoff_ms", 50);
        if (config.ephemeris.max_year < config.ephemeris.min_year) {
            throw UnsupportedParameter("ephemeris.max_year",
                                       std::to_string(config.ephemeris.max_year));
        }
    }

    if (j.contains("periods")) {
        config.periods.depth = j["periods"].value("depth", 3);
        if (config.periods.depth < 1 || config.periods.depth > periods::PeriodEngine::MAX_DEPTH) {
            throw UnsupportedParameter("periods.depth", std::to_string(config.periods.depth));
        }
    }

    if (j.contains("search")) {
        auto& s = j["search"];
        config.search.max_iterations = s.value("max_iterations", 200);
        config.search.tolerance_days = s.value("tolerance_days", 1e-4);
        config.search.max_scan_days = s.value("max_scan_days", 3660.0);
    }

    if (j.contains("stellium")) {
        auto& st = j["stellium"];
        config.patterns.stellium_min_bodies = st.value("min_bodies", 3);
        config.patterns.stellium_max_arc = st.value("max_arc", 10.0);
    }

    if (j.contains("compatibility")) {
        auto& c = j["compatibility"];
        config.compatibility.luminary_weight = c.value("luminary_weight", 40.0);
        config.compatibility.affection_weight = c.value("affection_weight", 35.0);
        config.compatibility.structural_weight = c.value("structural_weight", 25.0);
    }

    if (j.contains("cache")) {
        auto& c = j["cache"];
        config.cache.enabled = c.value("enabled", true);
        config.cache.capacity = c.value("capacity", static_cast<std::size_t>(512));
        config.cache.ttl_natal_s = c.value("ttl_natal_s", 86400);
        config.cache.ttl_slow_s = c.value("ttl_slow_s", 21600);
        config.cache.ttl_fast_s = c.value("ttl_fast_s", 900);
    }

    config.verbose = j.value("verbose", false);
    return config;
}

AstChartConfig loadAstChartConfig(const std::string& config_file) {
    std::ifstream f(config_file);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + config_file);
    }

    nlohmann::json j;
    f >> j;
    return parseAstChartConfig(j);
}

nlohmann::json configToJson(const AstChartConfig& config) {
    nlohmann::json j;
    j["house_system"] = houseSystemName(config.chart.house_system);
    j["zodiac"] = zodiacName(config.chart.zodiac);
    j["placidus_max_latitude"] = config.chart.houses.placidus_max_latitude;

    nlohmann::json orbs = nlohmann::json::object();
    nlohmann::json minors = nlohmann::json::array();
    for (const auto& def : config.orb_table.aspects) {
        orbs[formatAngle(def.angle)] = def.orb;
        if (!def.major) minors.push_back(def.angle);
    }
    nlohmann::json factors = nlohmann::json::object();
    for (const auto& [body, factor] : config.orb_table.body_factors) {
        factors[bodyName(body)] = factor;
    }
    j["orb_table"] = {{"aspects", orbs}, {"body_factors", factors}, {"minor_aspects", minors}};

    j["division_catalog"] = config.division_catalog;
    j["ephemeris"] = {{"min_year", config.ephemeris.min_year},
                      {"max_year", config.ephemeris.max_year},
                      {"retry_backoff_ms", config.ephemeris.retry_backoff_ms}};
    j["periods"] = {{"depth", config.periods.depth}};
    j["search"] = {{"max_iterations", config.search.max_iterations},
                   {"tolerance_days", config.search.tolerance_days},
                   {"max_scan_days", config.search.max_scan_days}};
    j["stellium"] = {{"min_bodies", config.patterns.stellium_min_bodies},
                     {"max_arc", config.patterns.stellium_max_arc}};
    j["compatibility"] = {{"luminary_weight", config.compatibility.luminary_weight},
                          {"affection_weight", config.compatibility.affection_weight},
                          {"structural_weight", config.compatibility.structural_weight}};
    j["cache"] = {{"enabled", config.cache.enabled},
                  {"capacity", config.cache.capacity},
                  {"ttl_natal_s", config.cache.ttl_natal_s},
                  {"ttl_slow_s", config.cache.ttl_slow_s},
                  {"ttl_fast_s", config.cache.ttl_fast_s}};
    j["verbose"] = config.verbose;
    return j;
}

} // namespace astchart::io
