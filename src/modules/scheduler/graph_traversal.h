// modules/scheduler/graph_traversal.h
#ifndef PLANFLOW_MODULES_SCHEDULER_GRAPH_TRAVERSAL_H
#define PLANFLOW_MODULES_SCHEDULER_GRAPH_TRAVERSAL_H

#include "core/types/plan.h"
#include "scheduler/traversal_state.h"
#include "library/plan_library.h"
#include "verify/verification.h"
#include "context/context_projector.h"
#include "common/log.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace planflow {

// Handed to the escalation sink when an escalate node is reached.
struct EscalationSignal {
    PlanId plan_id;
    std::string plan_name;
    NodeId node;
    std::string reason;
    std::string pace_level;
    std::string message; // injected in place of the status block
};

struct TurnResult {
    TraversalStatus status = TraversalStatus::IDLE;
    std::optional<std::string> status_text;
    std::optional<EscalationSignal> escalation;
    // Snapshot of the traversal at the moment it was destroyed.
    std::optional<TraversalState> finished_state;
};

// Conditions tried in order before the generic "always" edge.
using ConditionChain = std::vector<EdgeCondition>;

// Bounded-depth graph traversal state machine. Stateless between turns: all
// mutable state lives in the SessionState passed by the host each turn.
class GraphTraversalEngine {
public:
    struct Options {
        std::size_t max_events = EventLog::DEFAULT_CAPACITY;
        int max_route_depth = 15;
        VerificationEvaluator::Policy verify_policy;
    };

    GraphTraversalEngine(const PlanLibrary& library, Options options, Logger log = {});

    // Fresh traversal for a graph plan, routed past start to the first actionable node.
    // Throws PlanLibraryError for a plan without a graph.
    TraversalState activate(const Plan& plan);

    // Installs the new traversal in the session and renders its first status block.
    TurnResult activate(SessionState& session, const Plan& plan);

    // Per-turn driver. last_tool_output == nullopt means no tool ran yet: counters
    // still advance and the status is re-rendered, but no transition happens.
    // An exception inside the turn leaves the session untouched and yields a
    // passthrough result (no status text).
    TurnResult advance(SessionState& session,
                       const std::optional<std::string>& last_tool_output,
                       bool externally_confirmed = false);

    // First edge out of `from` matching the chain in order, then "always".
    static const Edge* resolve_edge(const PlanGraph& graph, const NodeId& from, const ConditionChain& chain);

    // Follows edges through start/decision/checkpoint nodes until a task, exit or
    // escalate node, a stall, or max_route_depth moves.
    void auto_route(TraversalState& state, const PlanGraph& graph);

private:
    TurnResult run_turn(SessionState& session,
                        const std::optional<std::string>& last_tool_output,
                        bool externally_confirmed);
    void advance_from_start(TraversalState& state, const PlanGraph& graph);
    void process_task(TraversalState& state, const PlanGraph& graph, const PlanNode& node,
                      const std::string& output, bool externally_confirmed);
    void move_to(TraversalState& state, const Edge& edge);

    TurnResult complete(SessionState& session);
    TurnResult escalate(SessionState& session, const PlanNode& node);
    TurnResult expire(SessionState& session);
    TurnResult abandon(SessionState& session, const std::string& why);

    const PlanLibrary& library_;
    Options options_;
    Logger log_;
    VerificationEvaluator verifier_;
    ContextProjector projector_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_SCHEDULER_GRAPH_TRAVERSAL_H
