// modules/session/turn_history.cpp
#include "session/turn_history.h"
#include "common/utils/string_utils.h"
#include <stdexcept>

namespace planflow {

std::string_view to_string(TurnRole role) {
    switch (role) {
        case TurnRole::USER: return "user";
        case TurnRole::AGENT: return "agent";
        case TurnRole::TOOL: return "tool";
    }
    return "user";
}

std::optional<TurnRole> parse_turn_role(std::string_view s) {
    if (s == "user") return TurnRole::USER;
    if (s == "agent" || s == "ai" || s == "assistant") return TurnRole::AGENT;
    if (s == "tool") return TurnRole::TOOL;
    return std::nullopt;
}

bool TurnRecord::is_tool_result() const {
    // agents sometimes echo tool results inline as "[tool_result ...]"
    return role == TurnRole::TOOL || tool_name.has_value() || content.rfind("[tool_result", 0) == 0;
}

std::optional<std::string> last_tool_output(const TurnHistory& history) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->is_tool_result()) return it->content;
    }
    return std::nullopt;
}

std::string last_user_message(const TurnHistory& history) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->role == TurnRole::USER) return to_lower(trim(it->content));
    }
    return "";
}

void to_json(nlohmann::json& j, const TurnRecord& record) {
    j = nlohmann::json{{"role", std::string(to_string(record.role))}, {"content", record.content}};
    if (record.tool_name) j["tool_name"] = *record.tool_name;
}

void from_json(const nlohmann::json& j, TurnRecord& record) {
    std::string role_str = j.value("role", std::string("user"));
    auto role = parse_turn_role(role_str);
    if (!role) {
        throw std::runtime_error("Unknown turn role '" + role_str + "'");
    }
    record.role = *role;
    record.content = j.value("content", std::string{});
    if (j.contains("tool_name") && j["tool_name"].is_string()) {
        record.tool_name = j["tool_name"].get<std::string>();
    } else {
        record.tool_name.reset();
    }
}

} // namespace planflow
