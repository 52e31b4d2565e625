// modules/trace/event_log.cpp
#include "trace/event_log.h"
#include <stdexcept>

namespace planflow {

std::string_view to_string(EventType type) {
    switch (type) {
        case EventType::PLAN_ACTIVATED: return "plan_activated";
        case EventType::NODE_ENTERED: return "node_entered";
        case EventType::NODE_VERIFIED: return "node_verified";
        case EventType::RETRY_TRIGGERED: return "retry_triggered";
        case EventType::EDGE_FOLLOWED: return "edge_followed";
        case EventType::PLAN_EXPIRED: return "plan_expired";
        case EventType::PLAN_COMPLETED: return "plan_completed";
        case EventType::PLAN_ESCALATED: return "plan_escalated";
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(std::string_view s) {
    if (s == "plan_activated") return EventType::PLAN_ACTIVATED;
    if (s == "node_entered") return EventType::NODE_ENTERED;
    if (s == "node_verified") return EventType::NODE_VERIFIED;
    if (s == "retry_triggered") return EventType::RETRY_TRIGGERED;
    if (s == "edge_followed") return EventType::EDGE_FOLLOWED;
    if (s == "plan_expired") return EventType::PLAN_EXPIRED;
    if (s == "plan_completed") return EventType::PLAN_COMPLETED;
    if (s == "plan_escalated") return EventType::PLAN_ESCALATED;
    return std::nullopt;
}

EventLog::EventLog(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void EventLog::emit(EventType type, int turn, NodeId node, nlohmann::json fields) {
    events_.push_back(TraversalEvent{type, turn, std::move(node), std::move(fields)});
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::optional<std::string> EventLog::last_outcome() const {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->type == EventType::NODE_VERIFIED) {
            return it->fields.value("outcome", std::string("success"));
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const TraversalEvent& event) {
    j = event.fields.is_object() ? event.fields : nlohmann::json::object();
    j["type"] = std::string(to_string(event.type));
    j["turn"] = event.turn;
    j["node"] = event.node;
}

void from_json(const nlohmann::json& j, TraversalEvent& event) {
    auto type = parse_event_type(j.at("type").get<std::string>());
    if (!type) {
        throw std::runtime_error("Unknown event type '" + j.at("type").get<std::string>() + "'");
    }
    event.type = *type;
    event.turn = j.value("turn", 0);
    event.node = j.value("node", std::string{});
    event.fields = nlohmann::json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "type" || it.key() == "turn" || it.key() == "node") continue;
        event.fields[it.key()] = it.value();
    }
}

void to_json(nlohmann::json& j, const EventLog& log) {
    j = nlohmann::json::array();
    for (const auto& e : log.events()) {
        j.push_back(e);
    }
}

void from_json(const nlohmann::json& j, EventLog& log) {
    log.clear();
    for (const auto& item : j) {
        auto event = item.get<TraversalEvent>();
        log.emit(event.type, event.turn, std::move(event.node), std::move(event.fields));
    }
}

} // namespace planflow
