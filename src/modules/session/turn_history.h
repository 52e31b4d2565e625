// modules/session/turn_history.h
#ifndef PLANFLOW_MODULES_SESSION_TURN_HISTORY_H
#define PLANFLOW_MODULES_SESSION_TURN_HISTORY_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace planflow {

enum class TurnRole : uint8_t {
    USER,
    AGENT,
    TOOL
};

std::string_view to_string(TurnRole role);
std::optional<TurnRole> parse_turn_role(std::string_view s);

struct TurnRecord {
    TurnRole role = TurnRole::USER;
    std::string content;
    std::optional<std::string> tool_name; // set on tool results

    bool is_tool_result() const;
};

using TurnHistory = std::vector<TurnRecord>;

// Newest tool result in the history; nullopt means no tool has run yet.
std::optional<std::string> last_tool_output(const TurnHistory& history);

// Newest user message, trimmed and lower-cased; empty when there is none.
std::string last_user_message(const TurnHistory& history);

void to_json(nlohmann::json& j, const TurnRecord& record);
void from_json(const nlohmann::json& j, TurnRecord& record);

} // namespace planflow

#endif // PLANFLOW_MODULES_SESSION_TURN_HISTORY_H
