// modules/scheduler/traversal_state.cpp
#include "scheduler/traversal_state.h"
#include <stdexcept>

namespace planflow {

std::string_view to_string(NodeOutcome outcome) {
    switch (outcome) {
        case NodeOutcome::PENDING: return "pending";
        case NodeOutcome::SUCCESS: return "success";
        case NodeOutcome::FAILED: return "failed";
    }
    return "pending";
}

std::string_view to_string(TraversalStatus status) {
    switch (status) {
        case TraversalStatus::IDLE: return "idle";
        case TraversalStatus::AWAITING_OUTPUT: return "awaiting_output";
        case TraversalStatus::COMPLETED: return "completed";
        case TraversalStatus::ESCALATED: return "escalated";
        case TraversalStatus::EXPIRED: return "expired";
        case TraversalStatus::ABANDONED: return "abandoned";
    }
    return "idle";
}

static NodeOutcome parse_outcome(const std::string& s) {
    if (s == "success") return NodeOutcome::SUCCESS;
    if (s == "failed") return NodeOutcome::FAILED;
    return NodeOutcome::PENDING;
}

void to_json(nlohmann::json& j, const TraversalState& state) {
    nlohmann::json visited = nlohmann::json::object();
    for (const auto& [id, rec] : state.visited) {
        visited[id] = {{"outcome", std::string(to_string(rec.outcome))}, {"attempts", rec.attempts}};
    }
    j = nlohmann::json{
        {"plan_id", state.plan_id},
        {"plan_name", state.plan_name},
        {"current_node", state.current_node},
        {"path", state.path},
        {"visited", visited},
        {"turns_active", state.turns_active},
        {"turns_since_transition", state.turns_since_transition},
        {"turns_since_progress", state.turns_since_progress},
        {"stale_after_turns", state.stale_after_turns},
        {"completed_nodes", state.completed_nodes},
        {"total_nodes", state.total_nodes},
        {"steps_completed", state.steps_completed},
        {"steps_failed", state.steps_failed},
        {"event_capacity", state.events.capacity()},
        {"events", state.events}
    };
}

void from_json(const nlohmann::json& j, TraversalState& state) {
    state.plan_id = j.at("plan_id").get<std::string>();
    state.plan_name = j.value("plan_name", state.plan_id);
    state.current_node = j.at("current_node").get<std::string>();
    state.path = j.value("path", std::vector<NodeId>{});
    state.visited.clear();
    if (j.contains("visited") && j["visited"].is_object()) {
        for (auto it = j["visited"].begin(); it != j["visited"].end(); ++it) {
            VisitRecord rec;
            rec.outcome = parse_outcome(it.value().value("outcome", std::string("pending")));
            rec.attempts = it.value().value("attempts", 0);
            state.visited[it.key()] = rec;
        }
    }
    state.turns_active = j.value("turns_active", 0);
    state.turns_since_transition = j.value("turns_since_transition", 0);
    state.turns_since_progress = j.value("turns_since_progress", 0);
    state.stale_after_turns = j.value("stale_after_turns", 15);
    state.completed_nodes = j.value("completed_nodes", 0);
    state.total_nodes = j.value("total_nodes", 0);
    state.steps_completed = j.value("steps_completed", std::vector<NodeId>{});
    state.steps_failed = j.value("steps_failed", std::vector<NodeId>{});

    state.events = EventLog(j.value("event_capacity", EventLog::DEFAULT_CAPACITY));
    if (j.contains("events")) {
        from_json(j["events"], state.events);
    }
}

} // namespace planflow
