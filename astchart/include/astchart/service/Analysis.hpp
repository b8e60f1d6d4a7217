/**
 * @file Analysis.hpp
 * @brief Request and result records exchanged with the dispatcher
 * @author AstChart Team
 * @date 2026-02-22
 */

#ifndef ASTCHART_SERVICE_ANALYSIS_HPP
#define ASTCHART_SERVICE_ANALYSIS_HPP

#include "astchart/chart/Subject.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace astchart::service {

struct AnalysisRequest {
    std::string analysis_id;
    SubjectInput subject;
    std::optional<SubjectInput> second_subject;
    std::optional<std::string> as_of;                       ///< ISO date-time, subject's local time
    nlohmann::json params = nlohmann::json::object();       ///< Overrides the catalog defaults
};

struct AnalysisResult {
    std::string analysis_id;
    std::string pipeline;
    nlohmann::json payload = nlohmann::json::object();
    std::vector<std::string> narrative;

    bool operator==(const AnalysisResult& o) const {
        return analysis_id == o.analysis_id && pipeline == o.pipeline
            && payload == o.payload && narrative == o.narrative;
    }
};

} // namespace astchart::service

#endif // ASTCHART_SERVICE_ANALYSIS_HPP
