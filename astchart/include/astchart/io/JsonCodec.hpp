/**
 * @file JsonCodec.hpp
 * @brief JSON encoding of engine results and decoding of requests
 * @author AstChart Team
 * @date 2026-02-22
 */

#ifndef ASTCHART_IO_JSON_CODEC_HPP
#define ASTCHART_IO_JSON_CODEC_HPP

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/chart/Chart.hpp"
#include "astchart/compatibility/CompatibilityEngine.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/divisional/DivisionalChartEngine.hpp"
#include "astchart/periods/PeriodEngine.hpp"
#include "astchart/predictive/PredictiveTimingEngine.hpp"
#include "astchart/service/Analysis.hpp"
#include "astchart/strength/StrengthEngine.hpp"
#include "astchart/vedic/Ashtakavarga.hpp"
#include "astchart/vedic/DoshaAnalyzer.hpp"
#include "astchart/vedic/YogaAnalyzer.hpp"
#include "astchart/vedic/Panchang.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <vector>

namespace astchart::io {

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Subject fields from JSON; absent keys stay empty
 * @throws InputValidationError naming every field of the wrong JSON type
 */
SubjectInput subjectInputFromJson(const nlohmann::json& j);

/**
 * @brief Request: {"analysis", "subject", "second_subject", "as_of", "params"}
 * @throws InputValidationError if "analysis" is missing
 */
service::AnalysisRequest requestFromJson(const nlohmann::json& j);

// ============================================================================
// Encoding
// ============================================================================

nlohmann::json toJson(const BodyPosition& p);
nlohmann::json toJson(const Chart& chart);
nlohmann::json toJson(const aspects::Aspect& a);
nlohmann::json toJson(const aspects::CrossAspect& a);
nlohmann::json toJson(const aspects::AspectPattern& p);
nlohmann::json toJson(const divisional::DivisionalChart& d);
nlohmann::json toJson(const strength::StrengthScore& s);

/// Node without its children
nlohmann::json toJson(const periods::Period& p);

/// Tree summary with the first level of periods
nlohmann::json toJson(const periods::PeriodTree& tree);

nlohmann::json toJson(const predictive::TimingEvent& e);
nlohmann::json toJson(const predictive::ProgressedChart& p);
nlohmann::json toJson(const compatibility::CompatibilityReport& r);
nlohmann::json toJson(const vedic::Panchang& p);
nlohmann::json toJson(const vedic::ManglikResult& m);
nlohmann::json toJson(const vedic::KaalSarpResult& k);
nlohmann::json toJson(const vedic::SadeSatiResult& s);
nlohmann::json toJson(const vedic::AshtakavargaResult& a);
nlohmann::json toJson(const vedic::YogaFinding& y);
nlohmann::json toJson(const service::AnalysisResult& r);

nlohmann::json toJson(const std::vector<aspects::Aspect>& aspects);
nlohmann::json toJson(const std::map<Body, strength::StrengthScore>& scores);

/// {"error": kind, "message": what, ...kind-specific fields}
nlohmann::json errorToJson(const AstChartError& e);

} // namespace astchart::io

#endif // ASTCHART_IO_JSON_CODEC_HPP
