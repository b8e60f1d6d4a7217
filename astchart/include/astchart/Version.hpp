/**
 * @file Version.hpp
 * @brief Library version
 * @author AstChart Team
 * @date 2026-02-23
 */

#ifndef ASTCHART_VERSION_HPP
#define ASTCHART_VERSION_HPP

#define ASTCHART_VERSION_MAJOR 1
#define ASTCHART_VERSION_MINOR 0
#define ASTCHART_VERSION_PATCH 0
#define ASTCHART_VERSION_STRING "1.0.0"

namespace astchart {

inline const char* version() { return ASTCHART_VERSION_STRING; }

} // namespace astchart

#endif // ASTCHART_VERSION_HPP
