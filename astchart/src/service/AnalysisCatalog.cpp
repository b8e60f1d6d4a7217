/**
 * @file AnalysisCatalog.cpp
 * @brief Built-in analysis rows
 * @author AstChart Team
 * @date 2026-02-22
 */

#include "astchart/service/AnalysisCatalog.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace astchart::service {

using nlohmann::json;

std::string pipelineName(Pipeline pipeline) {
    switch (pipeline) {
        case Pipeline::NATAL_CHART:      return "natal_chart";
        case Pipeline::DIVISIONAL_CHART: return "divisional_chart";
        case Pipeline::ASPECTS:          return "aspects";
        case Pipeline::STRENGTH:         return "strength";
        case Pipeline::PERIODS:          return "periods";
        case Pipeline::NAKSHATRA:        return "nakshatra";
        case Pipeline::PROGRESSION:      return "progression";
        case Pipeline::RETURN_CHART:     return "return_chart";
        case Pipeline::TRANSITS:         return "transits";
        case Pipeline::COMPATIBILITY:    return "compatibility";
        case Pipeline::PANCHANG:         return "panchang";
        case Pipeline::DOSHAS:           return "doshas";
        case Pipeline::ASHTAKAVARGA:     return "ashtakavarga";
        case Pipeline::YOGAS:            return "yogas";
        case Pipeline::COMPREHENSIVE:    return "comprehensive";
    }
    return "unknown";
}

const std::vector<std::string>& AnalysisCatalog::birthFields() {
    static const std::vector<std::string> fields = {
        "birth_date", "birth_time", "latitude", "longitude", "timezone_offset"
    };
    return fields;
}

AnalysisCatalog::AnalysisCatalog(std::vector<AnalysisDescriptor> entries)
    : entries_(std::move(entries))
{
    std::set<std::string> seen;
    for (const auto& e : entries_) {
        if (!seen.insert(e.id).second) {
            throw std::invalid_argument("Duplicate analysis id: " + e.id);
        }
    }
}

const AnalysisDescriptor* AnalysisCatalog::find(const std::string& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const AnalysisDescriptor& d) { return d.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<std::string> AnalysisCatalog::ids() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.id);
    return out;
}

AnalysisCatalog AnalysisCatalog::standard() {
    const auto& birth = birthFields();

    auto row = [&birth](std::string id, std::string title, Pipeline pipeline, TtlTier ttl,
                        json defaults, bool uses_as_of = false, bool second = false) {
        AnalysisDescriptor d;
        d.id = std::move(id);
        d.title = std::move(title);
        d.pipeline = pipeline;
        d.ttl = ttl;
        d.required_fields = birth;
        d.needs_second_subject = second;
        d.uses_as_of = uses_as_of;
        d.defaults = std::move(defaults);
        return d;
    };

    const TtlTier N = TtlTier::NATAL;
    const TtlTier S = TtlTier::SLOW;
    const TtlTier F = TtlTier::FAST;

    return AnalysisCatalog({
        // Natal chart
        row("birth-chart", "Birth chart", Pipeline::NATAL_CHART, N, {{"focus", "full"}}),
        row("sun-sign", "Sun sign", Pipeline::NATAL_CHART, N, {{"focus", "sun"}}),
        row("moon-sign", "Moon sign", Pipeline::NATAL_CHART, N, {{"focus", "moon"}}),
        row("rising-sign", "Rising sign", Pipeline::NATAL_CHART, N, {{"focus", "rising"}}),
        row("planetary-positions", "Planetary positions", Pipeline::NATAL_CHART, N,
            {{"focus", "positions"}}),
        row("house-analysis", "Houses", Pipeline::NATAL_CHART, N, {{"focus", "houses"}}),
        row("vedic-birth-chart", "Rasi chart", Pipeline::NATAL_CHART, N,
            {{"focus", "full"}, {"zodiac", "sidereal"}, {"house_system", "whole-sign"}}),

        // Divisional charts
        row("navamsa", "Navamsa (D9)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 9}}),
        row("dashamsa", "Dashamsa (D10)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 10}}),
        row("hora-chart", "Hora (D2)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 2}}),
        row("drekkana", "Drekkana (D3)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 3}}),
        row("saptamsa", "Saptamsa (D7)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 7}}),
        row("dwadashamsa", "Dwadashamsa (D12)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 12}}),
        row("trimsamsa", "Trimsamsa (D30)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 30}}),
        row("shashtiamsa", "Shashtiamsa (D60)", Pipeline::DIVISIONAL_CHART, N, {{"factor", 60}}),
        row("divisional-chart", "Divisional chart", Pipeline::DIVISIONAL_CHART, N, {{"factor", 9}}),

        // Aspects
        row("aspect-analysis", "Aspects", Pipeline::ASPECTS, N, {{"patterns", false}}),
        row("aspect-patterns", "Aspect patterns", Pipeline::ASPECTS, N, {{"patterns", true}}),
        row("minor-aspects", "Minor aspects", Pipeline::ASPECTS, N,
            {{"patterns", false}, {"minor_aspects", {36, 40, 72, 144}}}),

        // Strength
        row("shadbala", "Shadbala", Pipeline::STRENGTH, N, json::object()),
        row("planetary-strength", "Planetary strength", Pipeline::STRENGTH, N,
            {{"top", 3}}),

        // Periods
        row("vimshottari-dasha", "Vimshottari dasha", Pipeline::PERIODS, N, {{"mode", "tree"}}),
        row("current-dasha", "Current dasha", Pipeline::PERIODS, S, {{"mode", "current"}}, true),
        row("upcoming-dashas", "Upcoming dashas", Pipeline::PERIODS, S,
            {{"mode", "upcoming"}, {"level", 2}, {"count", 5}}, true),

        // Nakshatra
        row("nakshatra-analysis", "Nakshatra", Pipeline::NAKSHATRA, N, json::object()),

        // Progressions and directions
        row("secondary-progressions", "Secondary progressions", Pipeline::PROGRESSION, S,
            {{"technique", "secondary"}}, true),
        row("solar-arc-directions", "Solar arc directions", Pipeline::PROGRESSION, S,
            {{"technique", "solar-arc"}}, true),
        row("one-degree-directions", "One degree directions", Pipeline::PROGRESSION, S,
            {{"technique", "one-degree"}}, true),
        row("naibod-directions", "Naibod directions", Pipeline::PROGRESSION, S,
            {{"technique", "naibod"}}, true),

        // Returns
        row("solar-return", "Solar return", Pipeline::RETURN_CHART, S, {{"body", "sun"}}, true),
        row("lunar-return", "Lunar return", Pipeline::RETURN_CHART, F, {{"body", "moon"}}, true),
        row("varshaphal", "Varshaphal", Pipeline::RETURN_CHART, S,
            {{"body", "sun"}, {"zodiac", "sidereal"}}, true),
        row("saturn-return", "Saturn return", Pipeline::RETURN_CHART, S,
            {{"body", "saturn"}}, true),
        row("jupiter-return", "Jupiter return", Pipeline::RETURN_CHART, S,
            {{"body", "jupiter"}}, true),

        // Transits
        row("current-transits", "Current transits", Pipeline::TRANSITS, F,
            {{"window_days", 7}}, true),
        row("monthly-forecast", "Monthly forecast", Pipeline::TRANSITS, F,
            {{"window_days", 30}}, true),
        row("significant-transits", "Significant transits", Pipeline::TRANSITS, S,
            {{"window_days", 365},
             {"bodies", {"jupiter", "saturn", "uranus", "neptune", "pluto"}},
             {"snapshot", false}}, true),

        // Compatibility
        row("synastry", "Synastry", Pipeline::COMPATIBILITY, N,
            {{"mode", "synastry"}}, false, true),
        row("composite-chart", "Composite chart", Pipeline::COMPATIBILITY, N,
            {{"mode", "composite"}}, false, true),
        row("davison-chart", "Davison chart", Pipeline::COMPATIBILITY, N,
            {{"mode", "davison"}}, false, true),
        row("compatibility-score", "Compatibility score", Pipeline::COMPATIBILITY, N,
            {{"mode", "score"}}, false, true),
        row("relationship-analysis", "Relationship analysis", Pipeline::COMPATIBILITY, N,
            {{"mode", "full"}}, false, true),

        // Panchang
        row("birth-panchang", "Birth panchang", Pipeline::PANCHANG, N, {{"at", "birth"}}),
        row("panchang", "Panchang", Pipeline::PANCHANG, F, {{"at", "as_of"}}, true),

        // Doshas
        row("manglik-dosha", "Manglik dosha", Pipeline::DOSHAS, N,
            {{"checks", json::array({"manglik"})}}),
        row("kaal-sarp-dosha", "Kaal Sarp dosha", Pipeline::DOSHAS, N,
            {{"checks", json::array({"kaal_sarp"})}}),
        row("sade-sati", "Sade Sati", Pipeline::DOSHAS, S,
            {{"checks", json::array({"sade_sati"})}}, true),
        row("dosha-analysis", "Dosha analysis", Pipeline::DOSHAS, S,
            {{"checks", {"manglik", "kaal_sarp", "sade_sati"}}}, true),

        // Ashtakavarga and yogas
        row("ashtakavarga", "Ashtakavarga", Pipeline::ASHTAKAVARGA, N, json::object()),
        row("vedic-yogas", "Vedic yogas", Pipeline::YOGAS, N,
            {{"groups", {"mahapurusha", "lunar", "raja", "dhana"}}}),
        row("pancha-mahapurusha-yoga", "Pancha Mahapurusha yogas", Pipeline::YOGAS, N,
            {{"groups", json::array({"mahapurusha"})}}),
        row("raj-yoga", "Raja yogas", Pipeline::YOGAS, N,
            {{"groups", json::array({"raja"})}}),
        row("dhan-yoga", "Dhana yogas", Pipeline::YOGAS, N,
            {{"groups", json::array({"dhana"})}}),

        // Everything
        row("comprehensive-analysis", "Comprehensive analysis", Pipeline::COMPREHENSIVE, S,
            json::object(), true),
    });
}

} // namespace astchart::service
