/**
 * @file Subject.hpp
 * @brief Birth data of a person, before and after resolution
 * @author AstChart Team
 * @date 2026-02-13
 */

#ifndef ASTCHART_CHART_SUBJECT_HPP
#define ASTCHART_CHART_SUBJECT_HPP

#include "astchart/time/TimeScale.hpp"
#include <optional>
#include <string>

namespace astchart {

struct GeoLocation {
    double latitude = 0.0;     ///< [deg], north positive
    double longitude = 0.0;    ///< [deg], east positive
    double elevation = 0.0;    ///< [m]

    bool operator==(const GeoLocation& o) const {
        return latitude == o.latitude && longitude == o.longitude && elevation == o.elevation;
    }
};

/**
 * @brief Unvalidated birth data as supplied by the caller
 *
 * Coordinates come from an external geocoder; a place name alone is not
 * enough to resolve a subject.
 */
struct SubjectInput {
    std::optional<std::string> name;
    std::optional<std::string> birth_date;      ///< "YYYY-MM-DD"
    std::optional<std::string> birth_time;      ///< "HH:MM" or "HH:MM:SS", local civil time
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> elevation;
    std::optional<double> timezone_offset;      ///< Hours east of UTC
    std::optional<std::string> place_name;
};

/**
 * @brief Resolved, immutable birth data
 */
class Subject {
public:
    Subject() = default;
    Subject(std::string name, const time::CivilDateTime& local_birth,
            const GeoLocation& place, double timezone_offset_hours);

    /**
     * @brief Validate and resolve caller input
     * @throws GeocodingUnresolved if a place name has no coordinates
     * @throws InputValidationError listing every missing or malformed field
     */
    static Subject resolve(const SubjectInput& input);

    const std::string& name() const { return name_; }
    const time::CivilDateTime& localBirth() const { return local_birth_; }
    const GeoLocation& place() const { return place_; }
    double timezoneOffset() const { return timezone_offset_; }

    /// Birth instant [JD UT]
    double julianDay() const { return jd_ut_; }

    /// Stable identity of the birth data and name; keys cached results
    std::string fingerprint() const;

    bool operator==(const Subject& o) const {
        return name_ == o.name_ && local_birth_ == o.local_birth_ && place_ == o.place_
            && timezone_offset_ == o.timezone_offset_ && jd_ut_ == o.jd_ut_;
    }

private:
    std::string name_;
    time::CivilDateTime local_birth_;
    GeoLocation place_;
    double timezone_offset_ = 0.0;
    double jd_ut_ = 0.0;
};

} // namespace astchart

#endif // ASTCHART_CHART_SUBJECT_HPP
