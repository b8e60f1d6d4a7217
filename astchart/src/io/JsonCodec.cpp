/**
 * @file JsonCodec.cpp
 * @brief JSON encoding and decoding
 * @author AstChart Team
 * @date 2026-02-22
 */

#include "astchart/io/JsonCodec.hpp"
#include "astchart/chart/HouseSystem.hpp"
#include "astchart/time/TimeScale.hpp"

namespace astchart::io {

using nlohmann::json;

namespace {

template <typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out,
                  std::vector<std::string>& bad) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const json::exception&) {
        bad.emplace_back(key);
    }
}

json cuspsToJson(const std::array<double, 12>& cusps) {
    json arr = json::array();
    for (double c : cusps) arr.push_back(c);
    return arr;
}

} // anonymous namespace

SubjectInput subjectInputFromJson(const json& j) {
    if (!j.is_object()) {
        throw InputValidationError("Subject must be a JSON object", {"subject"});
    }

    SubjectInput in;
    std::vector<std::string> bad;
    readOptional(j, "name", in.name, bad);
    readOptional(j, "birth_date", in.birth_date, bad);
    readOptional(j, "birth_time", in.birth_time, bad);
    readOptional(j, "latitude", in.latitude, bad);
    readOptional(j, "longitude", in.longitude, bad);
    readOptional(j, "elevation", in.elevation, bad);
    readOptional(j, "timezone_offset", in.timezone_offset, bad);
    readOptional(j, "place_name", in.place_name, bad);

    if (!bad.empty()) {
        std::string message = "Malformed fields:";
        for (size_t i = 0; i < bad.size(); ++i) {
            message += (i == 0 ? " " : ", ") + bad[i];
        }
        throw InputValidationError(message, bad);
    }
    return in;
}

service::AnalysisRequest requestFromJson(const json& j) {
    if (!j.is_object() || !j.contains("analysis") || !j["analysis"].is_string()) {
        throw InputValidationError(std::vector<std::string>{"analysis"});
    }

    service::AnalysisRequest req;
    req.analysis_id = j["analysis"].get<std::string>();
    if (j.contains("subject")) req.subject = subjectInputFromJson(j["subject"]);
    if (j.contains("second_subject") && !j["second_subject"].is_null()) {
        req.second_subject = subjectInputFromJson(j["second_subject"]);
    }
    if (j.contains("as_of") && j["as_of"].is_string()) {
        req.as_of = j["as_of"].get<std::string>();
    }
    if (j.contains("params") && !j["params"].is_null()) {
        req.params = j["params"];
    }
    return req;
}

json toJson(const BodyPosition& p) {
    return json{
        {"body", bodyName(p.body)},
        {"longitude", p.longitude},
        {"latitude", p.latitude},
        {"distance", p.distance},
        {"speed", p.speed},
        {"retrograde", p.retrograde},
        {"sign", signName(p.sign())},
        {"degree", p.degreeInSign()},
        {"nakshatra", nakshatraName(p.nakshatra())},
        {"pada", p.pada()},
        {"house", p.house}
    };
}

json toJson(const Chart& chart) {
    json positions = json::array();
    for (const auto& p : chart.positions) positions.push_back(toJson(p));

    return json{
        {"subject", chart.subject.name()},
        {"jd_ut", chart.jd_ut},
        {"instant", time::formatIso(chart.jd_ut)},
        {"location", {{"latitude", chart.location.latitude},
                      {"longitude", chart.location.longitude},
                      {"elevation", chart.location.elevation}}},
        {"house_system", houseSystemName(chart.house_system)},
        {"zodiac", zodiacName(chart.zodiac)},
        {"ascendant", chart.ascendant},
        {"ascendant_sign", signName(chart.ascendantSign())},
        {"midheaven", chart.midheaven},
        {"cusps", cuspsToJson(chart.cusps)},
        {"positions", positions}
    };
}

json toJson(const aspects::Aspect& a) {
    return json{
        {"first", bodyName(a.first)},
        {"second", bodyName(a.second)},
        {"type", a.type},
        {"angle", a.angle},
        {"separation", a.separation},
        {"orb", a.orb},
        {"allowed_orb", a.allowed_orb},
        {"exactness", a.exactness},
        {"applying", a.applying}
    };
}

json toJson(const aspects::CrossAspect& a) {
    json j = toJson(a.aspect);
    j["from"] = bodyName(a.from);
    j["to"] = bodyName(a.to);
    return j;
}

json toJson(const aspects::AspectPattern& p) {
    json bodies = json::array();
    for (Body b : p.bodies) bodies.push_back(bodyName(b));
    return json{{"pattern", aspects::patternName(p.kind)}, {"bodies", bodies}};
}

json toJson(const divisional::DivisionalChart& d) {
    json j = toJson(d.chart);
    j["factor"] = d.factor;
    j["division"] = divisional::DivisionalChartEngine::divisionName(d.factor);
    return j;
}

json toJson(const strength::StrengthScore& s) {
    return json{
        {"body", bodyName(s.body)},
        {"positional", s.positional},
        {"directional", s.directional},
        {"temporal", s.temporal},
        {"motional", s.motional},
        {"natural", s.natural},
        {"aspectual", s.aspectual},
        {"total", s.total},
        {"dignity", strength::dignityName(s.dignity)},
        {"rank", s.rank}
    };
}

json toJson(const periods::Period& p) {
    return json{
        {"level", p.level},
        {"ruler", bodyName(p.ruler)},
        {"start_jd", p.start_jd},
        {"end_jd", p.end_jd},
        {"start", time::formatIso(p.start_jd)},
        {"end", time::formatIso(p.end_jd)}
    };
}

json toJson(const periods::PeriodTree& tree) {
    json mahadashas = json::array();
    for (const auto& child : tree.root->children) mahadashas.push_back(toJson(*child));

    return json{
        {"moon_longitude", tree.moon_longitude},
        {"nakshatra", nakshatraName(tree.nakshatra)},
        {"birth_ruler", bodyName(tree.birth_ruler)},
        {"balance_years", tree.balance_years},
        {"depth", tree.depth},
        {"cycle_start", time::formatIso(tree.root->start_jd)},
        {"cycle_end", time::formatIso(tree.root->end_jd)},
        {"periods", mahadashas}
    };
}

json toJson(const predictive::TimingEvent& e) {
    json j{
        {"kind", predictive::eventKindName(e.kind)},
        {"body", bodyName(e.body)},
        {"jd_ut", e.jd},
        {"instant", time::formatIso(e.jd)},
        {"longitude", e.longitude},
        {"sign", signName(e.sign)}
    };
    if (e.natal_point) {
        j["natal_point"] = bodyName(*e.natal_point);
        j["aspect_angle"] = e.aspect_angle;
    }
    return j;
}

json toJson(const predictive::ProgressedChart& p) {
    json aspects = json::array();
    for (const auto& a : p.aspects_to_natal) aspects.push_back(toJson(a));
    return json{
        {"technique", predictive::techniqueName(p.technique)},
        {"target", time::formatIso(p.target_jd)},
        {"age_years", p.age_years},
        {"arc", p.arc},
        {"chart", toJson(p.chart)},
        {"aspects_to_natal", aspects}
    };
}

json toJson(const compatibility::CompatibilityReport& r) {
    json matrix = json::array();
    for (const auto& a : r.matrix) matrix.push_back(toJson(a));
    return json{
        {"matrix", matrix},
        {"composite", toJson(r.composite)},
        {"midpoint_chart", toJson(r.midpoint_chart)},
        {"scores", {{"luminary", r.luminary},
                    {"affection", r.affection},
                    {"structural", r.structural},
                    {"overall", r.overall}}}
    };
}

json toJson(const vedic::Panchang& p) {
    return json{
        {"instant", time::formatIso(p.jd_ut)},
        {"tithi", p.tithi},
        {"tithi_name", p.tithi_name},
        {"paksha", p.paksha},
        {"nakshatra", p.nakshatra_name},
        {"pada", p.pada},
        {"yoga", p.yoga},
        {"yoga_name", p.yoga_name},
        {"karana", p.karana},
        {"karana_name", p.karana_name},
        {"vara", p.vara_name},
        {"sun_longitude", p.sun_longitude},
        {"moon_longitude", p.moon_longitude}
    };
}

json toJson(const vedic::ManglikResult& m) {
    return json{
        {"present", m.present},
        {"from_lagna", m.from_lagna},
        {"from_moon", m.from_moon},
        {"house_from_lagna", m.house_from_lagna},
        {"house_from_moon", m.house_from_moon}
    };
}

json toJson(const vedic::KaalSarpResult& k) {
    return json{
        {"present", k.present},
        {"direction", k.direction},
        {"name", k.name},
        {"rahu_house", k.rahu_house}
    };
}

json toJson(const vedic::SadeSatiResult& s) {
    return json{
        {"active", s.active},
        {"phase", s.phase},
        {"small_panoti", s.small_panoti},
        {"moon_sign", signName(s.moon_sign)},
        {"saturn_sign", signName(s.saturn_sign)}
    };
}

json toJson(const vedic::AshtakavargaResult& a) {
    json planets = json::object();
    for (const auto& t : a.planets) {
        planets[bodyName(t.body)] = json{{"bindus", t.bindus}, {"total", t.total}};
    }
    return json{
        {"planets", planets},
        {"sarva", a.sarva},
        {"sarva_total", a.sarva_total},
        {"by_house", a.by_house},
        {"strong_houses", a.strong_houses},
        {"weak_houses", a.weak_houses}
    };
}

json toJson(const vedic::YogaFinding& y) {
    json bodies = json::array();
    for (Body b : y.bodies) bodies.push_back(bodyName(b));
    return json{
        {"name", y.name},
        {"group", y.group},
        {"auspicious", y.auspicious},
        {"bodies", bodies},
        {"detail", y.detail}
    };
}

json toJson(const service::AnalysisResult& r) {
    return json{
        {"analysis", r.analysis_id},
        {"pipeline", r.pipeline},
        {"payload", r.payload},
        {"narrative", r.narrative}
    };
}

json toJson(const std::vector<aspects::Aspect>& aspects) {
    json arr = json::array();
    for (const auto& a : aspects) arr.push_back(toJson(a));
    return arr;
}

json toJson(const std::map<Body, strength::StrengthScore>& scores) {
    json arr = json::array();
    for (const auto& [body, s] : scores) arr.push_back(toJson(s));
    return arr;
}

json errorToJson(const AstChartError& e) {
    json j{{"error", e.kind()}, {"message", e.what()}};
    if (auto* v = dynamic_cast<const InputValidationError*>(&e)) {
        j["fields"] = v->missingFields();
    } else if (auto* n = dynamic_cast<const NoConvergence*>(&e)) {
        j["iterations"] = n->iterations();
        j["last_jd"] = n->lastJulianDay();
        j["residual"] = n->residual();
    } else if (auto* a = dynamic_cast<const AnalysisError*>(&e)) {
        j["analysis"] = a->analysisId();
    } else if (auto* g = dynamic_cast<const GeocodingUnresolved*>(&e)) {
        j["place"] = g->place();
    }
    return j;
}

} // namespace astchart::io
