/**
 * @file Errors.hpp
 * @brief Typed failures raised by the chart engines and the dispatcher
 * @author AstChart Team
 * @date 2026-02-11
 *
 * Every error thrown by the library derives from AstChartError, itself a
 * std::runtime_error, so callers that only care about the message can catch
 * the standard type.
 */

#ifndef ASTCHART_CORE_ERRORS_HPP
#define ASTCHART_CORE_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace astchart {

class AstChartError : public std::runtime_error {
public:
    explicit AstChartError(const std::string& message)
        : std::runtime_error(message) {}

    /// Stable error category name, used in structured error payloads
    virtual std::string kind() const { return "AstChartError"; }
};

/**
 * @brief Missing or malformed subject data
 */
class InputValidationError : public AstChartError {
public:
    explicit InputValidationError(std::vector<std::string> missing_fields);
    InputValidationError(const std::string& message, std::vector<std::string> fields);

    const std::vector<std::string>& missingFields() const { return fields_; }
    std::string kind() const override { return "InputValidationError"; }

private:
    std::vector<std::string> fields_;
};

/**
 * @brief A place name arrived without resolved coordinates
 */
class GeocodingUnresolved : public AstChartError {
public:
    explicit GeocodingUnresolved(const std::string& place);

    const std::string& place() const { return place_; }
    std::string kind() const override { return "GeocodingUnresolved"; }

private:
    std::string place_;
};

class EphemerisUnavailable : public AstChartError {
public:
    explicit EphemerisUnavailable(const std::string& message)
        : AstChartError(message) {}
    std::string kind() const override { return "EphemerisUnavailable"; }
};

class UnsupportedParameter : public AstChartError {
public:
    UnsupportedParameter(const std::string& parameter, const std::string& value);

    const std::string& parameter() const { return parameter_; }
    const std::string& value() const { return value_; }
    std::string kind() const override { return "UnsupportedParameter"; }

private:
    std::string parameter_;
    std::string value_;
};

class InvalidLatitude : public AstChartError {
public:
    InvalidLatitude(double latitude_deg, double limit_deg, const std::string& house_system);

    double latitude() const { return latitude_; }
    std::string kind() const override { return "InvalidLatitude"; }

private:
    double latitude_;
};

class OutOfRangeInstant : public AstChartError {
public:
    OutOfRangeInstant(double jd, double span_start, double span_end);

    double julianDay() const { return jd_; }
    std::string kind() const override { return "OutOfRangeInstant"; }

private:
    double jd_;
};

/**
 * @brief Bounded iterative search gave up
 *
 * Carries the partial diagnostic of the last iterate.
 */
class NoConvergence : public AstChartError {
public:
    NoConvergence(const std::string& search, int iterations,
                  double last_jd, double residual_deg);

    int iterations() const { return iterations_; }
    double lastJulianDay() const { return last_jd_; }
    double residual() const { return residual_; }
    std::string kind() const override { return "NoConvergence"; }

private:
    int iterations_;
    double last_jd_;
    double residual_;
};

/**
 * @brief Wraps any non-typed failure of an analysis pipeline
 */
class AnalysisError : public AstChartError {
public:
    AnalysisError(const std::string& analysis_id, std::exception_ptr cause);

    const std::string& analysisId() const { return analysis_id_; }
    std::exception_ptr cause() const { return cause_; }
    std::string kind() const override { return "AnalysisError"; }

private:
    std::string analysis_id_;
    std::exception_ptr cause_;
};

} // namespace astchart

#endif // ASTCHART_CORE_ERRORS_HPP
