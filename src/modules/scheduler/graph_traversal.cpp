// modules/scheduler/graph_traversal.cpp
#include "scheduler/graph_traversal.h"
#include <algorithm>
#include <stdexcept>

namespace planflow {

namespace {

// Fallback chains for each task outcome; "always" is appended by resolve_edge.
const ConditionChain kSuccessChain = {EdgeCondition::ON_SUCCESS};
const ConditionChain kRetryChain = {EdgeCondition::ON_RETRY};
const ConditionChain kExhaustChain = {EdgeCondition::ON_EXHAUST, EdgeCondition::ON_FAIL};
const ConditionChain kPassThroughChain = {};

bool contains(const std::vector<NodeId>& ids, const NodeId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

std::string progress_of(const TraversalState& state) {
    return std::to_string(state.completed_nodes) + "/" + std::to_string(state.total_nodes);
}

} // namespace

GraphTraversalEngine::GraphTraversalEngine(const PlanLibrary& library, Options options, Logger log)
    : library_(library),
      options_(options),
      log_(std::move(log)),
      verifier_(options.verify_policy),
      projector_() {}

const Edge* GraphTraversalEngine::resolve_edge(const PlanGraph& graph, const NodeId& from,
                                               const ConditionChain& chain) {
    auto candidates = graph.edges_from(from);
    auto find_condition = [&candidates](EdgeCondition cond) -> const Edge* {
        for (const Edge* e : candidates) {
            if (e->condition == cond) return e;
        }
        return nullptr;
    };

    for (EdgeCondition cond : chain) {
        if (const Edge* e = find_condition(cond)) return e;
    }
    return find_condition(EdgeCondition::ALWAYS);
}

// --- activation ---

TraversalState GraphTraversalEngine::activate(const Plan& plan) {
    if (!plan.graph) {
        throw PlanLibraryError("Plan '" + plan.id + "' has no graph");
    }
    const PlanGraph& graph = *plan.graph;

    TraversalState state;
    state.plan_id = plan.id;
    state.plan_name = plan.name;
    state.current_node = graph.start;
    state.path.push_back(graph.start);
    state.stale_after_turns = plan.stale_after_turns;
    state.total_nodes = graph.task_count();
    state.events = EventLog(options_.max_events);

    state.events.emit(EventType::PLAN_ACTIVATED, state.turns_active, graph.start, {{"plan", plan.id}});
    advance_from_start(state, graph);
    return state;
}

TurnResult GraphTraversalEngine::activate(SessionState& session, const Plan& plan) {
    TraversalState state = activate(plan);
    log_.info("Graph plan activated: " + state.plan_name + " (" + std::to_string(state.total_nodes) + " nodes)");

    TurnResult result;
    result.status = TraversalStatus::AWAITING_OUTPUT;
    result.status_text = projector_.render(state, plan);
    session.traversal = std::move(state);
    return result;
}

void GraphTraversalEngine::advance_from_start(TraversalState& state, const PlanGraph& graph) {
    state.events.emit(EventType::NODE_ENTERED, state.turns_active, graph.start);
    state.current_node = graph.start;

    const Edge* edge = resolve_edge(graph, graph.start, kPassThroughChain);
    if (!edge) {
        log_.warning("No edge out of start node '" + graph.start + "' in plan '" + state.plan_name + "'");
        return;
    }
    move_to(state, *edge);
    auto_route(state, graph);
}

// --- per-turn driver ---

TurnResult GraphTraversalEngine::advance(SessionState& session,
                                         const std::optional<std::string>& last_tool_output,
                                         bool externally_confirmed) {
    // work on a copy; the session only changes when the turn runs to the end
    SessionState working = session;
    try {
        TurnResult result = run_turn(working, last_tool_output, externally_confirmed);
        session = std::move(working);
        return result;
    } catch (const std::exception& e) {
        log_.warning_guarded(std::string("Error (passthrough): ") + e.what());
        TurnResult result;
        result.status = session.traversal ? TraversalStatus::AWAITING_OUTPUT : TraversalStatus::IDLE;
        return result;
    }
}

TurnResult GraphTraversalEngine::run_turn(SessionState& session,
                                          const std::optional<std::string>& last_tool_output,
                                          bool externally_confirmed) {
    if (!session.traversal) {
        return TurnResult{};
    }
    TraversalState& state = *session.traversal;

    ++state.turns_active;
    ++state.turns_since_transition;
    ++state.turns_since_progress;

    if (state.turns_since_transition > state.stale_after_turns) {
        return expire(session);
    }

    const Plan* plan = library_.find(state.plan_id);
    if (!plan || !plan->graph) {
        return abandon(session, "plan '" + state.plan_id + "' is no longer in the library");
    }
    const PlanGraph& graph = *plan->graph;

    const PlanNode* node = graph.find_node(state.current_node);
    if (!node) {
        return abandon(session, "node '" + state.current_node + "' is not defined");
    }

    switch (node->type()) {
        case NodeType::EXIT:
            return complete(session);
        case NodeType::ESCALATE:
            return escalate(session, *node);
        case NodeType::START:
            advance_from_start(state, graph);
            break;
        case NodeType::TASK:
            if (last_tool_output) {
                process_task(state, graph, *node, *last_tool_output, externally_confirmed);
            }
            break;
        case NodeType::DECISION:
        case NodeType::CHECKPOINT:
            auto_route(state, graph);
            break;
    }

    // landing node is handled this turn, not on the next call
    const PlanNode* landed = graph.find_node(state.current_node);
    if (!landed) {
        return abandon(session, "node '" + state.current_node + "' is not defined");
    }
    if (landed->is_terminal()) {
        return landed->type() == NodeType::EXIT ? complete(session) : escalate(session, *landed);
    }

    TurnResult result;
    result.status = TraversalStatus::AWAITING_OUTPUT;
    result.status_text = projector_.render(state, *plan);
    return result;
}

void GraphTraversalEngine::process_task(TraversalState& state, const PlanGraph& graph, const PlanNode& node,
                                        const std::string& output, bool externally_confirmed) {
    const TaskNode& task = *node.as_task();
    const NodeId id = node.id;

    VisitRecord& visit = state.visit(id);
    visit.attempts += 1;
    const int attempts = visit.attempts;
    const bool verified = verifier_.verify(task.verify, output, externally_confirmed);

    state.events.emit(EventType::NODE_VERIFIED, state.turns_active, id,
                      {{"outcome", verified ? "success" : "fail"}, {"attempt", attempts}});

    if (verified) {
        visit.outcome = NodeOutcome::SUCCESS;
        if (!contains(state.steps_completed, id)) {
            // only a first success is progress; loops back into a done node are not
            state.completed_nodes += 1;
            state.steps_completed.push_back(id);
            state.turns_since_progress = 0;
        }
        log_.info("Step verified: " + node.name + " (" + progress_of(state) + ")");

        if (const Edge* edge = resolve_edge(graph, id, kSuccessChain)) {
            move_to(state, *edge);
            auto_route(state, graph);
        } else {
            log_.warning("No edge from '" + id + "' on success, stalling");
        }
        return;
    }

    if (attempts <= task.max_retries) {
        state.events.emit(EventType::RETRY_TRIGGERED, state.turns_active, id, {{"attempt", attempts}});
        log_.info("Step failed verification: " + node.name + " (attempt " + std::to_string(attempts) +
                  "/" + std::to_string(task.max_retries + 1) + ")");
        if (const Edge* edge = resolve_edge(graph, id, kRetryChain)) {
            move_to(state, *edge);
            auto_route(state, graph);
        }
        // no edge: stay here for another attempt
        return;
    }

    visit.outcome = NodeOutcome::FAILED;
    if (!contains(state.steps_failed, id)) {
        state.steps_failed.push_back(id);
    }
    log_.info("Step retries exhausted: " + node.name + " after " + std::to_string(attempts) + " attempts");

    if (const Edge* edge = resolve_edge(graph, id, kExhaustChain)) {
        move_to(state, *edge);
        auto_route(state, graph);
    } else {
        log_.warning("No edge from '" + id + "' on exhaust, stalling");
    }
}

void GraphTraversalEngine::auto_route(TraversalState& state, const PlanGraph& graph) {
    for (int depth = 0; depth < options_.max_route_depth; ++depth) {
        const PlanNode* node = graph.find_node(state.current_node);
        if (!node || !node->is_routable()) {
            return;
        }

        ConditionChain chain;
        if (node->type() == NodeType::DECISION) {
            std::string outcome = state.events.last_outcome().value_or("success");
            if (auto cond = condition_for_outcome(outcome)) {
                chain.push_back(*cond);
            }
        }

        const Edge* edge = resolve_edge(graph, node->id, chain);
        if (!edge) {
            log_.warning("No route out of " + std::string(to_string(node->type())) + " node '" +
                         node->id + "', stalling");
            return;
        }
        log_.debug("Auto-routing " + node->id + " -> " + edge->to + " (" +
                   std::string(to_string(edge->condition)) + ")");
        move_to(state, *edge);
    }

    const PlanNode* node = graph.find_node(state.current_node);
    if (node && node->is_routable()) {
        log_.warning("Auto-routing stopped at '" + node->id + "' after " +
                     std::to_string(options_.max_route_depth) + " moves");
    }
}

void GraphTraversalEngine::move_to(TraversalState& state, const Edge& edge) {
    state.current_node = edge.to;
    state.path.push_back(edge.to);
    state.turns_since_transition = 0;
    // every entry starts a fresh retry budget (test -> fix -> test loops)
    state.visited[edge.to] = VisitRecord{};

    state.events.emit(EventType::EDGE_FOLLOWED, state.turns_active, edge.from,
                      {{"from", edge.from}, {"to", edge.to},
                       {"condition", std::string(to_string(edge.condition))}});
    state.events.emit(EventType::NODE_ENTERED, state.turns_active, edge.to);
}

// --- terminal outcomes ---

TurnResult GraphTraversalEngine::complete(SessionState& session) {
    TraversalState& state = *session.traversal;
    state.events.emit(EventType::PLAN_COMPLETED, state.turns_active, state.current_node);
    log_.info("Graph plan '" + state.plan_name + "' completed! (" + progress_of(state) + " nodes)");

    TurnResult result;
    result.status = TraversalStatus::COMPLETED;
    result.finished_state = std::move(state);
    session.traversal.reset();
    return result;
}

TurnResult GraphTraversalEngine::escalate(SessionState& session, const PlanNode& node) {
    TraversalState& state = *session.traversal;
    const EscalateNode& esc = *node.as_escalate();

    state.events.emit(EventType::PLAN_ESCALATED, state.turns_active, node.id,
                      {{"reason", esc.reason}, {"pace_level", esc.pace_level}});
    session.pace_level = esc.pace_level;
    log_.warning("Plan '" + state.plan_name + "' escalated to PACE " + esc.pace_level + ": " + esc.reason);

    EscalationSignal signal;
    signal.plan_id = state.plan_id;
    signal.plan_name = state.plan_name;
    signal.node = node.id;
    signal.reason = esc.reason;
    signal.pace_level = esc.pace_level;
    signal.message = projector_.render_escalation(state, esc);

    TurnResult result;
    result.status = TraversalStatus::ESCALATED;
    result.status_text = signal.message;
    result.escalation = std::move(signal);
    result.finished_state = std::move(state);
    session.traversal.reset();
    return result;
}

TurnResult GraphTraversalEngine::expire(SessionState& session) {
    TraversalState& state = *session.traversal;
    state.events.emit(EventType::PLAN_EXPIRED, state.turns_active, state.current_node);
    log_.info("Graph plan '" + state.plan_name + "' expired (no transition for " +
              std::to_string(state.stale_after_turns) + " turns)");

    TurnResult result;
    result.status = TraversalStatus::EXPIRED;
    result.finished_state = std::move(state);
    session.traversal.reset();
    return result;
}

TurnResult GraphTraversalEngine::abandon(SessionState& session, const std::string& why) {
    log_.warning("Abandoning plan '" + session.traversal->plan_name + "': " + why);

    TurnResult result;
    result.status = TraversalStatus::ABANDONED;
    result.finished_state = std::move(*session.traversal);
    session.traversal.reset();
    return result;
}

} // namespace planflow
