// common/log.cpp
#include "common/log.h"
#include <iostream>

namespace planflow {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
    }
    return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warning") return LogLevel::WARNING;
    return std::nullopt;
}

LogSink make_stderr_sink(LogLevel min_level) {
    return [min_level](LogLevel level, const std::string& msg) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;
        std::cerr << "[" << to_string(level) << "] [PlanFlow] " << msg << std::endl;
    };
}

} // namespace planflow
