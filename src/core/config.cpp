// core/config.cpp
#include "core/config.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace planflow {

namespace {

int read_positive_int(const nlohmann::json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (!v.is_number_integer() || v.get<int>() <= 0) {
        throw ConfigError(std::string("'") + key + "' must be a positive integer");
    }
    return v.get<int>();
}

} // namespace

EngineConfig load_engine_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    EngineConfig config;
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse config '" + config_path + "': " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config '" + config_path + "' must be a JSON object");
    }

    if (j.contains("plan_library_path")) {
        if (!j["plan_library_path"].is_string()) {
            throw ConfigError("'plan_library_path' must be a string");
        }
        fs::path lib = j["plan_library_path"].get<std::string>();
        if (lib.is_relative()) {
            fs::path config_dir = fs::path(config_path).parent_path();
            if (config_dir.empty()) config_dir = ".";
            lib = config_dir / lib;
        }
        config.plan_library_path = lib.lexically_normal().string();
    }

    config.max_events = static_cast<std::size_t>(read_positive_int(j, "max_events", static_cast<int>(config.max_events)));
    config.max_route_depth = read_positive_int(j, "max_route_depth", config.max_route_depth);
    config.default_stale_after_turns = read_positive_int(j, "default_stale_after_turns", config.default_stale_after_turns);

    if (j.contains("default_trigger_threshold")) {
        const auto& v = j["default_trigger_threshold"];
        if (!v.is_number_integer() || v.get<int>() < 0) {
            throw ConfigError("'default_trigger_threshold' must be a non-negative integer");
        }
        config.default_trigger_threshold = v.get<int>();
    }

    if (j.contains("permissive_external_checks")) {
        if (!j["permissive_external_checks"].is_boolean()) {
            throw ConfigError("'permissive_external_checks' must be a boolean");
        }
        config.permissive_external_checks = j["permissive_external_checks"].get<bool>();
    }

    if (j.contains("log_level")) {
        auto level = j["log_level"].is_string()
            ? parse_log_level(j["log_level"].get<std::string>())
            : std::nullopt;
        if (!level) {
            throw ConfigError("'log_level' must be one of debug, info, warning");
        }
        config.log_level = *level;
    }

    return config;
}

} // namespace planflow
