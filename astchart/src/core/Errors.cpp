/**
 * @file Errors.cpp
 * @brief Error message formatting
 * @author AstChart Team
 * @date 2026-02-11
 */

#include "astchart/core/Errors.hpp"
#include <sstream>

namespace astchart {

namespace {

std::string joinFields(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += fields[i];
    }
    return out;
}

std::string describeCause(std::exception_ptr cause) {
    if (!cause) return "unknown cause";
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // anonymous namespace

InputValidationError::InputValidationError(std::vector<std::string> missing_fields)
    : AstChartError("Missing required fields: " + joinFields(missing_fields)),
      fields_(std::move(missing_fields)) {}

InputValidationError::InputValidationError(const std::string& message,
                                           std::vector<std::string> fields)
    : AstChartError(message), fields_(std::move(fields)) {}

GeocodingUnresolved::GeocodingUnresolved(const std::string& place)
    : AstChartError("Place '" + place + "' has no resolved coordinates"),
      place_(place) {}

UnsupportedParameter::UnsupportedParameter(const std::string& parameter,
                                           const std::string& value)
    : AstChartError("Unsupported " + parameter + ": " + value),
      parameter_(parameter), value_(value) {}

InvalidLatitude::InvalidLatitude(double latitude_deg, double limit_deg,
                                 const std::string& house_system)
    : AstChartError([&] {
          std::ostringstream ss;
          ss << "Latitude " << latitude_deg << " exceeds +/-" << limit_deg
             << " deg for house system " << house_system;
          return ss.str();
      }()),
      latitude_(latitude_deg) {}

OutOfRangeInstant::OutOfRangeInstant(double jd, double span_start, double span_end)
    : AstChartError([&] {
          std::ostringstream ss;
          ss.precision(10);
          ss << "Instant JD " << jd << " outside span [" << span_start
             << ", " << span_end << ")";
          return ss.str();
      }()),
      jd_(jd) {}

NoConvergence::NoConvergence(const std::string& search, int iterations,
                             double last_jd, double residual_deg)
    : AstChartError([&] {
          std::ostringstream ss;
          ss.precision(10);
          ss << search << " did not converge after " << iterations
             << " iterations (last JD " << last_jd << ", residual "
             << residual_deg << " deg)";
          return ss.str();
      }()),
      iterations_(iterations), last_jd_(last_jd), residual_(residual_deg) {}

AnalysisError::AnalysisError(const std::string& analysis_id, std::exception_ptr cause)
    : AstChartError("Analysis '" + analysis_id + "' failed: " + describeCause(cause)),
      analysis_id_(analysis_id), cause_(cause) {}

} // namespace astchart
