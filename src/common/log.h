// common/log.h
#ifndef PLANFLOW_COMMON_LOG_H
#define PLANFLOW_COMMON_LOG_H

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <cstdint>

namespace planflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING
};

std::string_view to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Writes "[INFO] [PlanFlow] ..." lines to std::cerr, dropping anything below min_level.
LogSink make_stderr_sink(LogLevel min_level = LogLevel::INFO);

// Thin wrapper so modules don't have to null-check the sink.
class Logger {
public:
    Logger() = default;
    explicit Logger(LogSink sink) : sink_(std::move(sink)) {}

    void debug(const std::string& msg) const { write(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) const { write(LogLevel::INFO, msg); }
    void warning(const std::string& msg) const { write(LogLevel::WARNING, msg); }

    // For catch blocks: a failing sink must not replace the error being handled.
    void warning_guarded(const std::string& msg) const {
        try {
            write(LogLevel::WARNING, msg);
        } catch (const std::exception&) {
            // sink is broken, nowhere left to report
        }
    }

private:
    void write(LogLevel level, const std::string& msg) const {
        if (sink_) sink_(level, msg);
    }

    LogSink sink_;
};

} // namespace planflow

#endif // PLANFLOW_COMMON_LOG_H
