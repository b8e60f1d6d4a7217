/**
 * @file Pipelines.hpp
 * @brief Calculation pipelines behind the analysis catalog
 * @author AstChart Team
 * @date 2026-02-23
 */

#ifndef ASTCHART_SERVICE_PIPELINES_HPP
#define ASTCHART_SERVICE_PIPELINES_HPP

#include "astchart/service/AnalysisCatalog.hpp"
#include "astchart/service/CalculationContext.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace astchart::service {

struct PipelineInput {
    Subject subject;
    std::optional<Subject> second_subject;
    double as_of_jd = 0.0;                               ///< [JD UT]
    nlohmann::json params = nlohmann::json::object();    ///< Catalog defaults patched by the caller
};

struct PipelineOutput {
    nlohmann::json payload = nlohmann::json::object();
    std::vector<std::string> narrative;
};

/**
 * @brief Run one pipeline
 *
 * Pure function of the context and the input. Errors propagate unchanged.
 */
PipelineOutput runPipeline(Pipeline pipeline, const CalculationContext& context,
                           const PipelineInput& input);

} // namespace astchart::service

#endif // ASTCHART_SERVICE_PIPELINES_HPP
