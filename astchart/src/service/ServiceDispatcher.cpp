/**
 * @file ServiceDispatcher.cpp
 * @brief Analysis dispatch
 * @author AstChart Team
 * @date 2026-02-23
 */

#include "astchart/service/ServiceDispatcher.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/service/Pipelines.hpp"
#include "astchart/time/TimeScale.hpp"
#include "astchart/utils/Logger.hpp"
#include <cmath>
#include <stdexcept>

namespace astchart::service {

namespace {

bool hasField(const SubjectInput& in, const std::string& field) {
    if (field == "name") return in.name.has_value();
    if (field == "birth_date") return in.birth_date.has_value();
    if (field == "birth_time") return in.birth_time.has_value();
    if (field == "latitude") return in.latitude.has_value();
    if (field == "longitude") return in.longitude.has_value();
    if (field == "elevation") return in.elevation.has_value();
    if (field == "timezone_offset") return in.timezone_offset.has_value();
    if (field == "place_name") return in.place_name.has_value();
    return false;
}

void checkGeocoding(const SubjectInput& in) {
    if (in.place_name && !in.place_name->empty() && (!in.latitude || !in.longitude)) {
        throw GeocodingUnresolved(*in.place_name);
    }
}

} // anonymous namespace

ServiceDispatcher::ServiceDispatcher(std::shared_ptr<const CalculationContext> context,
                                     std::shared_ptr<ResultCache> cache,
                                     AnalysisCatalog catalog)
    : context_(std::move(context)), cache_(std::move(cache)), catalog_(std::move(catalog))
{
    if (!context_) {
        throw std::invalid_argument("ServiceDispatcher requires a calculation context");
    }
    if (!cache_) {
        cache_ = std::make_shared<ResultCache>(context_->config().cache);
    }
}

std::vector<std::string> ServiceDispatcher::missingFields(const AnalysisDescriptor& descriptor,
                                                          const AnalysisRequest& request) {
    std::vector<std::string> missing;
    for (const auto& field : descriptor.required_fields) {
        if (!hasField(request.subject, field)) missing.push_back(field);
    }
    if (descriptor.needs_second_subject) {
        if (!request.second_subject) {
            missing.push_back("second_subject");
        } else {
            for (const auto& field : descriptor.required_fields) {
                if (!hasField(*request.second_subject, field)) {
                    missing.push_back("second_subject." + field);
                }
            }
        }
    }
    return missing;
}

double ServiceDispatcher::resolveAsOf(const AnalysisRequest& request,
                                      const Subject& subject) const {
    const double tz_days = subject.timezoneOffset() / 24.0;
    if (request.as_of) {
        try {
            return time::julianDay(time::parseIso(*request.as_of)) - tz_days;
        } catch (const InputValidationError&) {
            throw InputValidationError("Malformed as_of: " + *request.as_of, {"as_of"});
        }
    }
    // Local midnight of the current civil day
    const double local = context_->nowJulianDay() + tz_days;
    return std::floor(local - 0.5) + 0.5 - tz_days;
}

AnalysisResult ServiceDispatcher::invoke(const std::string& analysis_id,
                                         const SubjectInput& subject,
                                         const nlohmann::json& params) const {
    AnalysisRequest request;
    request.analysis_id = analysis_id;
    request.subject = subject;
    request.params = params;
    return invoke(request);
}

AnalysisResult ServiceDispatcher::invoke(const AnalysisRequest& request) const {
    const AnalysisDescriptor* descriptor = catalog_.find(request.analysis_id);
    if (!descriptor) {
        throw UnsupportedParameter("analysis", request.analysis_id);
    }

    checkGeocoding(request.subject);
    if (descriptor->needs_second_subject && request.second_subject) {
        checkGeocoding(*request.second_subject);
    }
    auto missing = missingFields(*descriptor, request);
    if (!missing.empty()) {
        throw InputValidationError(missing);
    }
    if (!request.params.is_null() && !request.params.is_object()) {
        throw InputValidationError("Parameters must be a JSON object", {"params"});
    }

    PipelineInput input;
    input.subject = Subject::resolve(request.subject);
    if (descriptor->needs_second_subject) {
        input.second_subject = Subject::resolve(*request.second_subject);
    }
    input.as_of_jd = descriptor->uses_as_of ? resolveAsOf(request, input.subject)
                                            : input.subject.julianDay();
    input.params = descriptor->defaults;
    if (request.params.is_object()) input.params.merge_patch(request.params);

    std::string key;
    if (cache_->enabled()) {
        std::string fingerprint = input.subject.fingerprint();
        if (input.second_subject) fingerprint += "&" + input.second_subject->fingerprint();
        const std::string as_of = descriptor->uses_as_of ? time::formatIso(input.as_of_jd) : "";
        key = ResultCache::makeKey(fingerprint, descriptor->id, as_of, input.params);
        if (auto cached = cache_->get(key)) {
            utils::Logger::debug("dispatcher", "cache hit for " + descriptor->id);
            return *cached;
        }
    }

    utils::Logger::info("dispatcher", "running " + descriptor->id + " via "
                        + pipelineName(descriptor->pipeline));

    PipelineOutput output;
    try {
        output = runPipeline(descriptor->pipeline, *context_, input);
    } catch (const AstChartError& e) {
        utils::Logger::warning("dispatcher", descriptor->id + " failed: " + e.kind() + ": "
                               + e.what());
        throw;
    } catch (...) {
        utils::Logger::warning("dispatcher", descriptor->id + " failed with an untyped error");
        throw AnalysisError(descriptor->id, std::current_exception());
    }

    AnalysisResult result;
    result.analysis_id = descriptor->id;
    result.pipeline = pipelineName(descriptor->pipeline);
    result.payload = std::move(output.payload);
    result.narrative = std::move(output.narrative);

    if (cache_->enabled()) {
        cache_->put(key, result, descriptor->ttl);
    }
    return result;
}

} // namespace astchart::service
