/**
 * @file ServiceDispatcher.hpp
 * @brief Catalog-driven validation, caching and routing of analyses
 * @author AstChart Team
 * @date 2026-02-23
 */

#ifndef ASTCHART_SERVICE_SERVICE_DISPATCHER_HPP
#define ASTCHART_SERVICE_SERVICE_DISPATCHER_HPP

#include "astchart/service/Analysis.hpp"
#include "astchart/service/AnalysisCatalog.hpp"
#include "astchart/service/CalculationContext.hpp"
#include "astchart/service/ResultCache.hpp"
#include <memory>
#include <string>
#include <vector>

namespace astchart::service {

class ServiceDispatcher {
public:
    /**
     * @param context Engines and configuration
     * @param cache Shared cache; one is built from the configuration when null
     * @param catalog Analysis rows
     */
    explicit ServiceDispatcher(std::shared_ptr<const CalculationContext> context,
                               std::shared_ptr<ResultCache> cache = nullptr,
                               AnalysisCatalog catalog = AnalysisCatalog::standard());

    /**
     * @brief Run one analysis
     *
     * Either returns a complete result or throws one typed error:
     * UnsupportedParameter for an unknown id, GeocodingUnresolved,
     * InputValidationError with every missing field, the engines' own
     * typed errors unchanged, and AnalysisError wrapping anything else.
     */
    AnalysisResult invoke(const AnalysisRequest& request) const;

    AnalysisResult invoke(const std::string& analysis_id, const SubjectInput& subject,
                          const nlohmann::json& params = nlohmann::json::object()) const;

    const AnalysisCatalog& catalog() const { return catalog_; }
    const CalculationContext& context() const { return *context_; }
    std::shared_ptr<ResultCache> cache() const { return cache_; }

    /// Missing required fields, in catalog order; second subject fields are prefixed
    static std::vector<std::string> missingFields(const AnalysisDescriptor& descriptor,
                                                  const AnalysisRequest& request);

private:
    double resolveAsOf(const AnalysisRequest& request, const Subject& subject) const;

    std::shared_ptr<const CalculationContext> context_;
    std::shared_ptr<ResultCache> cache_;
    AnalysisCatalog catalog_;
};

} // namespace astchart::service

#endif // ASTCHART_SERVICE_SERVICE_DISPATCHER_HPP
