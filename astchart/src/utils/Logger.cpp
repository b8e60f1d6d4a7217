/**
 * @file Logger.cpp
 * @brief Logger implementation
 * @author AstChart Team
 * @date 2026-02-12
 */

#include "astchart/utils/Logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace astchart::utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARNING)};
std::ostream* g_stream = nullptr;
std::mutex g_mutex;

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "";
    }
}

} // anonymous namespace

LogLevel logLevelFromName(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    return LogLevel::WARNING;
}

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load());
}

void Logger::setStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stream = stream;
}

bool Logger::enabled(LogLevel level) {
    return level != LogLevel::OFF && static_cast<int>(level) >= g_level.load();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << "[astchart][" << levelTag(level) << "] " << component << ": " << message << '\n';
}

} // namespace astchart::utils
