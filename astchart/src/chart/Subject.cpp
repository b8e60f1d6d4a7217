/**
 * @file Subject.cpp
 * @brief Subject resolution and fingerprinting
 * @author AstChart Team
 * @date 2026-02-13
 */

#include "astchart/chart/Subject.hpp"
#include "astchart/core/Errors.hpp"
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <vector>

namespace astchart {

Subject::Subject(std::string name, const time::CivilDateTime& local_birth,
                 const GeoLocation& place, double timezone_offset_hours)
    : name_(std::move(name)),
      local_birth_(local_birth),
      place_(place),
      timezone_offset_(timezone_offset_hours),
      jd_ut_(time::julianDay(local_birth) - timezone_offset_hours / 24.0) {}

Subject Subject::resolve(const SubjectInput& in) {
    if (in.place_name && !in.place_name->empty() && (!in.latitude || !in.longitude)) {
        throw GeocodingUnresolved(*in.place_name);
    }

    std::vector<std::string> missing;
    if (!in.birth_date) missing.push_back("birth_date");
    if (!in.birth_time) missing.push_back("birth_time");
    if (!in.latitude) missing.push_back("latitude");
    if (!in.longitude) missing.push_back("longitude");
    if (!in.timezone_offset) missing.push_back("timezone_offset");
    if (!missing.empty()) {
        throw InputValidationError(missing);
    }

    time::CivilDateTime dt;
    try {
        dt = time::parseIso(*in.birth_date);
    } catch (const InputValidationError&) {
        throw InputValidationError("Malformed birth_date: '" + *in.birth_date + "'",
                                   {"birth_date"});
    }
    {
        int h = 0, m = 0;
        double s = 0.0;
        int n = std::sscanf(in.birth_time->c_str(), "%d:%d:%lf", &h, &m, &s);
        if (n < 2 || h < 0 || h > 23 || m < 0 || m > 59 || s < 0.0 || s >= 60.0) {
            throw InputValidationError("Malformed birth_time: '" + *in.birth_time + "'",
                                       {"birth_time"});
        }
        dt.hour = h;
        dt.minute = m;
        dt.second = n == 3 ? s : 0.0;
    }

    if (*in.latitude < -90.0 || *in.latitude > 90.0) {
        throw InputValidationError("latitude out of range", {"latitude"});
    }
    if (*in.longitude < -180.0 || *in.longitude > 180.0) {
        throw InputValidationError("longitude out of range", {"longitude"});
    }
    if (*in.timezone_offset < -14.0 || *in.timezone_offset > 14.0) {
        throw InputValidationError("timezone_offset out of range", {"timezone_offset"});
    }

    GeoLocation place;
    place.latitude = *in.latitude;
    place.longitude = *in.longitude;
    place.elevation = in.elevation.value_or(0.0);

    return Subject(in.name.value_or(""), dt, place, *in.timezone_offset);
}

std::string Subject::fingerprint() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(8) << jd_ut_ << '|'
       << std::setprecision(6) << place_.latitude << '|' << place_.longitude << '|'
       << std::setprecision(1) << place_.elevation << '|'
       << std::setprecision(2) << timezone_offset_ << '|' << name_;
    return ss.str();
}

} // namespace astchart
