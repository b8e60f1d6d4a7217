/**
 * @file Pipelines.cpp
 * @brief Natal, Vedic, predictive and relationship pipelines
 * @author AstChart Team
 * @date 2026-02-23
 */

#include "astchart/service/Pipelines.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/io/JsonCodec.hpp"
#include "astchart/time/TimeScale.hpp"
#include "astchart/utils/Logger.hpp"
#include "astchart/vedic/Ashtakavarga.hpp"
#include "astchart/vedic/DoshaAnalyzer.hpp"
#include "astchart/vedic/YogaAnalyzer.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <iomanip>
#include <sstream>
#include <utility>

namespace astchart::service {

using nlohmann::json;

namespace {

// ============================================================================
// Parameter helpers
// ============================================================================

std::string fixed(double value, int precision = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

ZodiacType zodiacParam(const json& params, ZodiacType fallback) {
    if (!params.contains("zodiac")) return fallback;
    return zodiacFromName(params["zodiac"].get<std::string>());
}

HouseSystemType houseParam(const json& params, HouseSystemType fallback) {
    if (!params.contains("house_system")) return fallback;
    return houseSystemFromName(params["house_system"].get<std::string>());
}

Body bodyParam(const json& params, const char* key, Body fallback) {
    if (!params.contains(key)) return fallback;
    const std::string name = params[key].get<std::string>();
    auto body = bodyFromName(name);
    if (!body) throw UnsupportedParameter(key, name);
    return *body;
}

/// Western pipelines follow the configured zodiac and houses
Chart westernNatal(const CalculationContext& ctx, const Subject& subject, const json& params) {
    const auto& cs = ctx.config().chart;
    return ctx.chartAt(subject, subject.julianDay(), houseParam(params, cs.house_system),
                       zodiacParam(params, cs.zodiac));
}

/// Vedic pipelines default to the sidereal zodiac with whole-sign houses
Chart vedicNatal(const CalculationContext& ctx, const Subject& subject, const json& params) {
    return ctx.chartAt(subject, subject.julianDay(),
                       houseParam(params, HouseSystemType::WHOLE_SIGN),
                       zodiacParam(params, ZodiacType::SIDEREAL));
}

std::string describe(const BodyPosition& p) {
    std::string line = bodyName(p.body) + " in " + signName(p.sign()) + " "
                     + fixed(p.degreeInSign()) + " deg";
    if (p.house > 0) line += ", house " + std::to_string(p.house);
    if (p.retrograde) line += " (retrograde)";
    return line;
}

std::string describe(const periods::Period& p) {
    return "Level " + std::to_string(p.level) + " " + bodyName(p.ruler) + ": "
         + time::formatIso(p.start_jd) + " to " + time::formatIso(p.end_jd);
}

// ============================================================================
// Pipelines
// ============================================================================

PipelineOutput natalChart(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = westernNatal(ctx, in.subject, in.params);
    const std::string focus = in.params.value("focus", "full");

    PipelineOutput out;
    const auto& sun = chart.position(Body::SUN);
    const auto& moon = chart.position(Body::MOON);
    out.payload["big_three"] = {{"sun", signName(sun.sign())},
                                {"moon", signName(moon.sign())},
                                {"rising", signName(chart.ascendantSign())}};

    if (focus == "sun") {
        out.payload["sun"] = io::toJson(sun);
        out.narrative.push_back(describe(sun));
    } else if (focus == "moon") {
        out.payload["moon"] = io::toJson(moon);
        out.narrative.push_back(describe(moon));
    } else if (focus == "rising") {
        out.payload["ascendant"] = chart.ascendant;
        out.payload["rising"] = signName(chart.ascendantSign());
        out.narrative.push_back("Ascendant in " + signName(chart.ascendantSign()) + " "
                                + fixed(chart.ascendant - 30.0 * chart.ascendantSign()) + " deg");
    } else if (focus == "positions") {
        json positions = json::array();
        for (const auto& p : chart.positions) {
            positions.push_back(io::toJson(p));
            out.narrative.push_back(describe(p));
        }
        out.payload["positions"] = positions;
    } else if (focus == "houses") {
        json houses = json::array();
        for (int h = 0; h < 12; ++h) {
            json occupants = json::array();
            for (const auto& p : chart.positions) {
                if (p.house == h + 1) occupants.push_back(bodyName(p.body));
            }
            houses.push_back({{"house", h + 1},
                              {"cusp", chart.cusps[h]},
                              {"sign", signName(signOf(chart.cusps[h]))},
                              {"occupants", occupants}});
            out.narrative.push_back("House " + std::to_string(h + 1) + " cusp in "
                                    + signName(signOf(chart.cusps[h])) + ", "
                                    + std::to_string(occupants.size()) + " occupant(s)");
        }
        out.payload["houses"] = houses;
    } else if (focus == "full") {
        out.payload["chart"] = io::toJson(chart);
        out.narrative.push_back("Sun " + signName(sun.sign()) + ", Moon "
                                + signName(moon.sign()) + ", rising "
                                + signName(chart.ascendantSign()));
        for (const auto& p : chart.positions) out.narrative.push_back(describe(p));
    } else {
        throw UnsupportedParameter("focus", focus);
    }
    return out;
}

PipelineOutput divisionalChart(const CalculationContext& ctx, const PipelineInput& in) {
    const int factor = in.params.value("factor", 9);
    const Chart base = vedicNatal(ctx, in.subject, in.params);
    const auto varga = ctx.divisional().derive(base, factor);

    PipelineOutput out;
    out.payload = io::toJson(varga);
    const std::string name = divisional::DivisionalChartEngine::divisionName(factor);
    out.narrative.push_back(name + " ascendant in " + signName(varga.chart.ascendantSign()));
    for (const auto& p : varga.chart.positions) {
        out.narrative.push_back(bodyName(p.body) + " in " + signName(p.sign())
                                + ", house " + std::to_string(p.house));
    }
    return out;
}

PipelineOutput aspectAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = westernNatal(ctx, in.subject, in.params);

    aspects::OrbTable table = ctx.aspects().orbTable();
    if (in.params.contains("minor_aspects")) {
        const auto minors = aspects::OrbTable::minorCatalog();
        for (double angle : in.params["minor_aspects"].get<std::vector<double>>()) {
            auto it = std::find_if(minors.begin(), minors.end(),
                                   [angle](const aspects::AspectDefinition& d) {
                                       return d.angle == angle;
                                   });
            if (it == minors.end()) throw UnsupportedParameter("minor_aspects", fixed(angle, 0));
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

    const auto points = chart.points();
    const auto found = ctx.aspects().findAspects(points, table);

    PipelineOutput out;
    out.payload["aspects"] = io::toJson(found);
    for (const auto& a : found) {
        out.narrative.push_back(bodyName(a.first) + " " + a.type + " " + bodyName(a.second)
                                + " (orb " + fixed(a.orb) + (a.applying ? ", applying)" : ")"));
    }

    if (in.params.value("patterns", true)) {
        json patterns = json::array();
        for (const auto& p : ctx.aspects().findPatterns(points, found)) {
            patterns.push_back(io::toJson(p));
            std::string line = aspects::patternName(p.kind) + ":";
            for (Body b : p.bodies) line += " " + bodyName(b);
            out.narrative.push_back(line);
        }
        out.payload["patterns"] = patterns;
    }
    return out;
}

PipelineOutput strengthAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = vedicNatal(ctx, in.subject, in.params);
    const auto scores = ctx.strength().score(chart);

    std::vector<strength::StrengthScore> ranked;
    for (const auto& [body, s] : scores) ranked.push_back(s);
    std::sort(ranked.begin(), ranked.end(),
              [](const strength::StrengthScore& a, const strength::StrengthScore& b) {
                  return a.rank < b.rank;
              });

    PipelineOutput out;
    json arr = json::array();
    for (const auto& s : ranked) arr.push_back(io::toJson(s));
    out.payload["scores"] = arr;
    out.payload["strongest"] = bodyName(ranked.front().body);
    out.payload["weakest"] = bodyName(ranked.back().body);

    const int top = std::clamp(in.params.value("top", static_cast<int>(ranked.size())),
                               1, static_cast<int>(ranked.size()));
    for (int i = 0; i < top; ++i) {
        const auto& s = ranked[i];
        out.narrative.push_back(std::to_string(s.rank) + ". " + bodyName(s.body) + " "
                                + fixed(s.total) + "/6 (" + strength::dignityName(s.dignity)
                                + ")");
    }
    return out;
}

PipelineOutput periodAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    periods::PeriodTree tree;
    if (in.params.contains("depth")) {
        const double moon = ctx.gateway().getLongitudes({Body::MOON}, in.subject.julianDay(),
                                                        ZodiacType::SIDEREAL)[0];
        tree = periods::PeriodEngine::buildTree(moon, in.subject.julianDay(),
                                                in.params["depth"].get<int>());
    } else {
        tree = ctx.periods().buildTree(in.subject);
    }

    PipelineOutput out;
    out.payload["tree"] = io::toJson(tree);
    out.narrative.push_back("Birth nakshatra " + nakshatraName(tree.nakshatra) + ", "
                            + bodyName(tree.birth_ruler) + " period balance "
                            + fixed(tree.balance_years) + " years");

    const std::string mode = in.params.value("mode", "tree");
    if (mode == "tree") {
        for (const auto& child : tree.root->children) out.narrative.push_back(describe(*child));
    } else if (mode == "current") {
        json path = json::array();
        for (const periods::Period* p : periods::PeriodEngine::query(tree, in.as_of_jd)) {
            if (p->level == 0) continue;
            path.push_back(io::toJson(*p));
            out.narrative.push_back(describe(*p));
        }
        out.payload["current"] = path;
    } else if (mode == "upcoming") {
        const int level = in.params.value("level", 1);
        const int count = in.params.value("count", 5);
        if (level < 1 || level > tree.depth) {
            throw UnsupportedParameter("level", std::to_string(level));
        }
        json list = json::array();
        for (const periods::Period* p :
             periods::PeriodEngine::upcoming(tree, in.as_of_jd, level, count)) {
            list.push_back(io::toJson(*p));
            out.narrative.push_back(describe(*p));
        }
        out.payload["upcoming"] = list;
    } else {
        throw UnsupportedParameter("mode", mode);
    }
    return out;
}

PipelineOutput nakshatraAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = vedicNatal(ctx, in.subject, in.params);
    const auto& rulers = periods::PeriodEngine::rulerSequence();

    PipelineOutput out;
    json bodies = json::array();
    for (const auto& p : chart.points()) {
        bodies.push_back({{"body", bodyName(p.body)},
                          {"nakshatra", nakshatraName(p.nakshatra())},
                          {"pada", p.pada()},
                          {"lord", bodyName(rulers[p.nakshatra() % 9])}});
    }
    const auto& moon = chart.position(Body::MOON);
    out.payload["moon"] = {{"nakshatra", nakshatraName(moon.nakshatra())},
                           {"index", moon.nakshatra() + 1},
                           {"pada", moon.pada()},
                           {"lord", bodyName(rulers[moon.nakshatra() % 9])}};
    out.payload["bodies"] = bodies;
    out.narrative.push_back("Moon in " + nakshatraName(moon.nakshatra()) + " pada "
                            + std::to_string(moon.pada()) + ", ruled by "
                            + bodyName(rulers[moon.nakshatra() % 9]));
    return out;
}

PipelineOutput progression(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart natal = westernNatal(ctx, in.subject, in.params);
    const auto technique = predictive::techniqueFromName(in.params.value("technique", "secondary"));
    const auto pc = ctx.predictive().progress(natal, in.as_of_jd, technique);

    PipelineOutput out;
    out.payload = io::toJson(pc);
    out.narrative.push_back(predictive::techniqueName(technique) + " chart for age "
                            + fixed(pc.age_years, 1) + ", arc " + fixed(pc.arc) + " deg");
    out.narrative.push_back("Progressed " + describe(pc.chart.position(Body::SUN)));
    out.narrative.push_back("Progressed " + describe(pc.chart.position(Body::MOON)));
    for (const auto& a : pc.aspects_to_natal) {
        out.narrative.push_back("Progressed " + bodyName(a.from) + " " + a.aspect.type
                                + " natal " + bodyName(a.to));
    }
    return out;
}

PipelineOutput returnChart(const CalculationContext& ctx, const PipelineInput& in) {
    const Body body = bodyParam(in.params, "body", Body::SUN);
    const Chart natal = westernNatal(ctx, in.subject, in.params);

    GeoLocation location = in.subject.place();
    if (in.params.contains("latitude") && in.params.contains("longitude")) {
        location.latitude = in.params["latitude"].get<double>();
        location.longitude = in.params["longitude"].get<double>();
    }

    Chart ret;
    if (body == Body::MOON || in.params.value("seed", "year") == "as_of") {
        ret = ctx.predictive().returnChartFrom(natal, body, in.as_of_jd, location);
    } else {
        const double local = in.as_of_jd + in.subject.timezoneOffset() / 24.0;
        const int year = in.params.value("year", time::calendarFromJulianDay(local).year);
        const double seed = time::julianDay(year, 1, 1.0) - in.subject.timezoneOffset() / 24.0;
        ret = ctx.predictive().returnChartFrom(natal, body, seed, location);
    }

    PipelineOutput out;
    out.payload = {{"body", bodyName(body)},
                   {"natal_longitude", natal.position(body).longitude},
                   {"instant", time::formatIso(ret.jd_ut)},
                   {"jd_ut", ret.jd_ut},
                   {"chart", io::toJson(ret)}};
    out.narrative.push_back(bodyName(body) + " return at " + time::formatIso(ret.jd_ut)
                            + " UT, ascendant " + signName(ret.ascendantSign()));
    return out;
}

PipelineOutput transits(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart natal = westernNatal(ctx, in.subject, in.params);
    const double window = in.params.value("window_days", 30.0);

    predictive::TransitSettings settings;
    if (in.params.contains("bodies")) {
        settings.bodies.clear();
        for (const auto& name : in.params["bodies"].get<std::vector<std::string>>()) {
            auto body = bodyFromName(name);
            if (!body || isAngle(*body)) throw UnsupportedParameter("bodies", name);
            settings.bodies.push_back(*body);
        }
    }

    const auto events = ctx.predictive().transitScan(natal, in.as_of_jd, in.as_of_jd + window,
                                                     settings);

    PipelineOutput out;
    out.payload["window_start"] = time::formatIso(in.as_of_jd);
    out.payload["window_end"] = time::formatIso(in.as_of_jd + window);
    json list = json::array();
    for (const auto& e : events) {
        list.push_back(io::toJson(e));
        std::string line = time::formatIso(e.jd) + " " + bodyName(e.body) + " "
                         + predictive::eventKindName(e.kind);
        if (e.natal_point) {
            line += " " + fixed(e.aspect_angle, 0) + " natal " + bodyName(*e.natal_point);
        } else if (e.kind == predictive::TimingEventKind::SIGN_INGRESS) {
            line += " " + signName(e.sign);
        }
        out.narrative.push_back(line);
    }
    out.payload["events"] = list;

    if (in.params.value("snapshot", true)) {
        const Chart now = ctx.chartAt(in.subject, in.as_of_jd, natal.house_system, natal.zodiac);
        json positions = json::array();
        for (const auto& p : now.positions) positions.push_back(io::toJson(p));
        json cross = json::array();
        for (const auto& a : ctx.aspects().crossAspects(now.positions, natal.points())) {
            cross.push_back(io::toJson(a));
        }
        out.payload["positions"] = positions;
        out.payload["aspects_to_natal"] = cross;
    }
    return out;
}

PipelineOutput compatibilityAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    if (!in.second_subject) {
        throw InputValidationError(std::vector<std::string>{"second_subject"});
    }
    const Chart a = westernNatal(ctx, in.subject, in.params);
    const Chart b = westernNatal(ctx, *in.second_subject, in.params);
    const auto report = ctx.compatibility().compare(a, b);
    const json full = io::toJson(report);

    PipelineOutput out;
    const std::string mode = in.params.value("mode", "full");
    if (mode == "full") {
        out.payload = full;
    } else if (mode == "synastry") {
        out.payload["matrix"] = full["matrix"];
        out.payload["scores"] = full["scores"];
    } else if (mode == "composite") {
        out.payload["composite"] = full["composite"];
    } else if (mode == "davison") {
        out.payload["midpoint_chart"] = full["midpoint_chart"];
    } else if (mode == "score") {
        out.payload["scores"] = full["scores"];
    } else {
        throw UnsupportedParameter("mode", mode);
    }

    out.narrative.push_back("Overall compatibility " + fixed(report.overall, 1) + "/100");
    out.narrative.push_back("Luminaries " + fixed(report.luminary, 1) + ", affection "
                            + fixed(report.affection, 1) + ", structure "
                            + fixed(report.structural, 1));
    if (mode == "synastry" || mode == "full") {
        for (const auto& x : report.matrix) {
            out.narrative.push_back(bodyName(x.from) + " " + x.aspect.type + " "
                                    + bodyName(x.to));
        }
    }
    return out;
}

PipelineOutput panchangAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const std::string at = in.params.value("at", "birth");
    double jd = in.subject.julianDay();
    if (at == "as_of") {
        jd = in.as_of_jd;
    } else if (at != "birth") {
        throw UnsupportedParameter("at", at);
    }

    const auto p = ctx.panchang().at(jd, in.subject.timezoneOffset());
    PipelineOutput out;
    out.payload = io::toJson(p);
    out.narrative.push_back("Tithi " + std::to_string(p.tithi) + " " + p.tithi_name + " ("
                            + p.paksha + " paksha)");
    out.narrative.push_back("Nakshatra " + p.nakshatra_name + " pada " + std::to_string(p.pada));
    out.narrative.push_back("Yoga " + p.yoga_name + ", karana " + p.karana_name + ", "
                            + p.vara_name);
    return out;
}

PipelineOutput doshaAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = vedicNatal(ctx, in.subject, in.params);
    const auto checks = in.params.value("checks",
                                        std::vector<std::string>{"manglik", "kaal_sarp",
                                                                 "sade_sati"});
    PipelineOutput out;
    for (const auto& check : checks) {
        if (check == "manglik") {
            const auto m = vedic::DoshaAnalyzer::manglik(chart);
            out.payload["manglik"] = io::toJson(m);
            out.narrative.push_back(m.present
                ? "Manglik: Mars in house " + std::to_string(m.house_from_lagna)
                  + " from lagna, " + std::to_string(m.house_from_moon) + " from Moon"
                : "Not manglik");
        } else if (check == "kaal_sarp") {
            const auto k = vedic::DoshaAnalyzer::kaalSarp(chart);
            out.payload["kaal_sarp"] = io::toJson(k);
            out.narrative.push_back(k.present ? k.name + " Kaal Sarp (" + k.direction + ")"
                                              : "No Kaal Sarp");
        } else if (check == "sade_sati") {
            const double saturn = ctx.gateway().getLongitudes({Body::SATURN}, in.as_of_jd,
                                                              chart.zodiac)[0];
            const auto s = vedic::DoshaAnalyzer::sadeSati(chart, saturn);
            out.payload["sade_sati"] = io::toJson(s);
            out.narrative.push_back(s.active ? "Sade Sati active, " + s.phase + " phase"
                                             : "Sade Sati not active");
        } else {
            throw UnsupportedParameter("checks", check);
        }
    }
    return out;
}

PipelineOutput ashtakavargaAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = vedicNatal(ctx, in.subject, in.params);
    const auto a = vedic::AshtakavargaCalculator::calculate(chart);

    PipelineOutput out;
    out.payload = io::toJson(a);
    for (const auto& t : a.planets) {
        out.narrative.push_back(bodyName(t.body) + ": " + std::to_string(t.total) + " bindus");
    }
    auto houses = [](const std::vector<int>& list) {
        std::string s;
        for (int h : list) s += (s.empty() ? "" : ", ") + std::to_string(h);
        return s.empty() ? std::string("none") : s;
    };
    out.narrative.push_back("Sarva ashtakavarga " + std::to_string(a.sarva_total)
                            + " bindus; strong houses " + houses(a.strong_houses)
                            + "; weak houses " + houses(a.weak_houses));
    return out;
}

PipelineOutput yogaAnalysis(const CalculationContext& ctx, const PipelineInput& in) {
    const Chart chart = vedicNatal(ctx, in.subject, in.params);
    const auto groups = in.params.value("groups",
                                        std::vector<std::string>{"mahapurusha", "lunar",
                                                                 "raja", "dhana"});
    PipelineOutput out;
    out.payload["yogas"] = json::array();
    for (const auto& group : groups) {
        for (const auto& y : vedic::YogaAnalyzer::analyzeGroup(chart, group)) {
            out.payload["yogas"].push_back(io::toJson(y));
            out.narrative.push_back(y.name + " yoga: " + y.detail);
        }
    }
    out.payload["count"] = out.payload["yogas"].size();
    if (out.narrative.empty()) out.narrative.push_back("No classical yogas found");
    return out;
}

PipelineOutput comprehensive(const CalculationContext& ctx, const PipelineInput& in) {
    struct Section {
        const char* name;
        Pipeline pipeline;
        json params;
    };
    const std::vector<Section> sections = {
        {"natal", Pipeline::NATAL_CHART, {{"focus", "full"}}},
        {"aspects", Pipeline::ASPECTS, {{"patterns", true}}},
        {"strength", Pipeline::STRENGTH, json::object()},
        {"dasha", Pipeline::PERIODS, {{"mode", "current"}}},
        {"navamsa", Pipeline::DIVISIONAL_CHART, {{"factor", 9}}},
        {"nakshatra", Pipeline::NAKSHATRA, json::object()},
        {"doshas", Pipeline::DOSHAS, json::object()},
        {"yogas", Pipeline::YOGAS, json::object()},
    };

    std::vector<std::future<PipelineOutput>> futures;
    futures.reserve(sections.size());
    for (const auto& section : sections) {
        PipelineInput sub = in;
        sub.params = section.params;
        futures.push_back(std::async(std::launch::async,
                                     [&ctx, pipeline = section.pipeline, sub = std::move(sub)]() {
                                         return runPipeline(pipeline, ctx, sub);
                                     }));
    }

    // Every future is drained before the first failure is rethrown
    PipelineOutput out;
    std::exception_ptr failure;
    for (size_t i = 0; i < sections.size(); ++i) {
        try {
            PipelineOutput part = futures[i].get();
            out.payload[sections[i].name] = std::move(part.payload);
            for (auto& line : part.narrative) out.narrative.push_back(std::move(line));
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);
    return out;
}

} // anonymous namespace

PipelineOutput runPipeline(Pipeline pipeline, const CalculationContext& context,
                           const PipelineInput& input) {
    utils::Logger::debug("pipeline", "running " + pipelineName(pipeline));
    switch (pipeline) {
        case Pipeline::NATAL_CHART:      return natalChart(context, input);
        case Pipeline::DIVISIONAL_CHART: return divisionalChart(context, input);
        case Pipeline::ASPECTS:          return aspectAnalysis(context, input);
        case Pipeline::STRENGTH:         return strengthAnalysis(context, input);
        case Pipeline::PERIODS:          return periodAnalysis(context, input);
        case Pipeline::NAKSHATRA:        return nakshatraAnalysis(context, input);
        case Pipeline::PROGRESSION:      return progression(context, input);
        case Pipeline::RETURN_CHART:     return returnChart(context, input);
        case Pipeline::TRANSITS:         return transits(context, input);
        case Pipeline::COMPATIBILITY:    return compatibilityAnalysis(context, input);
        case Pipeline::PANCHANG:         return panchangAnalysis(context, input);
        case Pipeline::DOSHAS:           return doshaAnalysis(context, input);
        case Pipeline::ASHTAKAVARGA:     return ashtakavargaAnalysis(context, input);
        case Pipeline::YOGAS:            return yogaAnalysis(context, input);
        case Pipeline::COMPREHENSIVE:    return comprehensive(context, input);
    }
    throw UnsupportedParameter("pipeline", pipelineName(pipeline));
}

} // namespace astchart::service
