// modules/scheduler/traversal_state.h
#ifndef PLANFLOW_MODULES_SCHEDULER_TRAVERSAL_STATE_H
#define PLANFLOW_MODULES_SCHEDULER_TRAVERSAL_STATE_H

#include "core/types/plan.h"
#include "trace/event_log.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace planflow {

enum class NodeOutcome : uint8_t {
    PENDING,
    SUCCESS,
    FAILED
};

std::string_view to_string(NodeOutcome outcome);

struct VisitRecord {
    NodeOutcome outcome = NodeOutcome::PENDING;
    int attempts = 0;
};

// Whole-traversal status reported to the host after each turn.
enum class TraversalStatus : uint8_t {
    IDLE,            // no plan active
    AWAITING_OUTPUT, // parked on a task node
    COMPLETED,
    ESCALATED,
    EXPIRED,
    ABANDONED        // plan/node reference no longer resolves
};

std::string_view to_string(TraversalStatus status);

// Mutable per-session traversal of one graph plan.
struct TraversalState {
    PlanId plan_id;
    std::string plan_name;
    NodeId current_node;
    std::vector<NodeId> path;   // may repeat under loops
    std::unordered_map<NodeId, VisitRecord> visited;

    int turns_active = 0;       // advance() calls since activation; stamped on events
    int turns_since_transition = 0;
    int turns_since_progress = 0;
    int stale_after_turns = 15;

    int completed_nodes = 0;
    int total_nodes = 0;        // task nodes only, fixed at activation
    std::vector<NodeId> steps_completed;
    std::vector<NodeId> steps_failed;

    EventLog events;

    VisitRecord& visit(const NodeId& id) { return visited[id]; }
    const VisitRecord* find_visit(const NodeId& id) const {
        auto it = visited.find(id);
        return it == visited.end() ? nullptr : &it->second;
    }
};

// Owned by the host loop and passed into the engine every turn.
struct SessionState {
    std::optional<TraversalState> traversal;
    std::optional<std::string> pace_level; // set when an escalate node is reached

    bool has_active_plan() const { return traversal.has_value(); }
};

void to_json(nlohmann::json& j, const TraversalState& state);
void from_json(const nlohmann::json& j, TraversalState& state);

} // namespace planflow

#endif // PLANFLOW_MODULES_SCHEDULER_TRAVERSAL_STATE_H
