// core/config.h
#ifndef PLANFLOW_CORE_CONFIG_H
#define PLANFLOW_CORE_CONFIG_H

#include "common/log.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace planflow {

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    std::string plan_library_path = "plan_library.yaml";
    std::size_t max_events = 50;
    int max_route_depth = 15;
    int default_stale_after_turns = 15;
    int default_trigger_threshold = 2;
    // file_exists / manual pass without an external confirmation signal
    bool permissive_external_checks = true;
    LogLevel log_level = LogLevel::INFO;
};

// Missing file -> defaults. Unreadable JSON or a mistyped known key -> ConfigError.
// Relative plan_library_path is resolved against the config file's directory.
EngineConfig load_engine_config(const std::string& config_path = "planflow_config.json");

} // namespace planflow

#endif // PLANFLOW_CORE_CONFIG_H
