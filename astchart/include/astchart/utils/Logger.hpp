/**
 * @file Logger.hpp
 * @brief Levelled diagnostic output to stderr
 * @author AstChart Team
 * @date 2026-02-12
 */

#ifndef ASTCHART_UTILS_LOGGER_HPP
#define ASTCHART_UTILS_LOGGER_HPP

#include <ostream>
#include <string>

namespace astchart::utils {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARNING,
    ERROR,
    OFF
};

LogLevel logLevelFromName(const std::string& name);

/**
 * @brief Process-wide log sink
 *
 * Defaults to WARNING on std::cerr. The `verbose` configuration flag lowers
 * the threshold to DEBUG. Writes are serialized.
 */
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    /// Redirect output (nullptr restores std::cerr)
    static void setStream(std::ostream* stream);

    static bool enabled(LogLevel level);
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::DEBUG, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::INFO, component, message);
    }
    static void warning(const std::string& component, const std::string& message) {
        log(LogLevel::WARNING, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::ERROR, component, message);
    }
};

} // namespace astchart::utils

#endif // ASTCHART_UTILS_LOGGER_HPP
