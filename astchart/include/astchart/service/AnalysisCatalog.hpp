/**
 * @file AnalysisCatalog.hpp
 * @brief Data rows mapping analysis ids onto pipelines
 * @author AstChart Team
 * @date 2026-02-22
 */

#ifndef ASTCHART_SERVICE_ANALYSIS_CATALOG_HPP
#define ASTCHART_SERVICE_ANALYSIS_CATALOG_HPP

#include "astchart/service/ResultCache.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace astchart::service {

enum class Pipeline {
    NATAL_CHART,
    DIVISIONAL_CHART,
    ASPECTS,
    STRENGTH,
    PERIODS,
    NAKSHATRA,
    PROGRESSION,
    RETURN_CHART,
    TRANSITS,
    COMPATIBILITY,
    PANCHANG,
    DOSHAS,
    ASHTAKAVARGA,
    YOGAS,
    COMPREHENSIVE
};

std::string pipelineName(Pipeline pipeline);

struct AnalysisDescriptor {
    std::string id;
    std::string title;
    Pipeline pipeline = Pipeline::NATAL_CHART;
    TtlTier ttl = TtlTier::NATAL;
    std::vector<std::string> required_fields;
    bool needs_second_subject = false;
    bool uses_as_of = false;                     ///< Result depends on the as-of date
    nlohmann::json defaults = nlohmann::json::object();
};

class AnalysisCatalog {
public:
    explicit AnalysisCatalog(std::vector<AnalysisDescriptor> entries);

    /// The built-in analyses
    static AnalysisCatalog standard();

    /// Birth fields every subject-based analysis needs
    static const std::vector<std::string>& birthFields();

    const AnalysisDescriptor* find(const std::string& id) const;
    const std::vector<AnalysisDescriptor>& entries() const { return entries_; }
    std::vector<std::string> ids() const;

private:
    std::vector<AnalysisDescriptor> entries_;
};

} // namespace astchart::service

#endif // ASTCHART_SERVICE_ANALYSIS_CATALOG_HPP
