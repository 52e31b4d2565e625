// modules/context/context_projector.cpp
#include "context/context_projector.h"
#include "verify/verification.h"
#include <unordered_set>
#include <vector>

namespace planflow {

namespace {

constexpr const char* kStatusTemplate = R"([WORKFLOW: {{ plan_name }}]
{% if trace_line != "" %}
  {{ trace_line }}
{% endif %}
{% if current_type == "task" %}
    Action: {{ action }}
{% if tool != "" %}
    Tool: {{ tool }}
{% endif %}
{% if tool_hint != "" %}
    Hint: {{ tool_hint }}
{% endif %}
{% if verify != "" %}
    Verify: {{ verify }}
{% endif %}
{% for edge in edges %}
    On {{ edge.condition }} → {% if edge.escalate %}escalate: {% endif %}{{ edge.target }}
{% endfor %}
{% else if current_type == "decision" %}
    Decision: {{ description }}
{% endif %}

Execute the current step. Do not skip ahead.)";

constexpr const char* kEscalationTemplate = R"([WORKFLOW ESCALATED: {{ plan_name }}]
  Reason: {{ reason }}
  PACE level: {{ pace_level }}
  Completed: {{ completed_nodes }}/{{ total_nodes }} nodes

The current approach has failed. Change strategy or ask the user for guidance.)";

} // namespace

ContextProjector::ContextProjector()
    : renderer_(),
      status_template_(renderer_.parse(kStatusTemplate)),
      escalation_template_(renderer_.parse(kEscalationTemplate)) {}

std::string ContextProjector::build_trace_line(const TraversalState& state, const PlanGraph& graph) {
    std::vector<std::string> parts;
    std::unordered_set<NodeId> seen;

    for (const auto& id : state.path) {
        if (!seen.insert(id).second) continue;
        const PlanNode* node = graph.find_node(id);
        if (!node) continue;
        if (node->type() == NodeType::START || node->type() == NodeType::CHECKPOINT) continue;
        // decisions are routed through in the same turn; only show the one we sit on
        if (node->type() == NodeType::DECISION && id != state.current_node) continue;

        const VisitRecord* visit = state.find_visit(id);
        if (id == state.current_node) {
            std::string part = node->name + " << CURRENT";
            const TaskNode* task = node->as_task();
            if (task && task->max_retries > 0) {
                int attempts = visit ? visit->attempts : 0;
                part += " (attempt " + std::to_string(attempts + 1) + "/" +
                        std::to_string(task->max_retries + 1) + ")";
            }
            part += " >>";
            parts.push_back(std::move(part));
        } else if (visit) {
            switch (visit->outcome) {
                case NodeOutcome::SUCCESS: parts.push_back(node->name + " [DONE]"); break;
                case NodeOutcome::FAILED: parts.push_back(node->name + " [FAILED]"); break;
                case NodeOutcome::PENDING: parts.push_back(node->name + " [...]"); break;
            }
        }
    }

    std::string line;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) line += " → ";
        line += parts[i];
    }
    return line;
}

nlohmann::json ContextProjector::build_view(const TraversalState& state, const Plan& plan) {
    nlohmann::json view = {
        {"plan_name", state.plan_name},
        {"trace_line", ""},
        {"current_type", ""},
        {"action", ""},
        {"tool", ""},
        {"tool_hint", ""},
        {"verify", ""},
        {"description", ""},
        {"edges", nlohmann::json::array()}
    };
    if (!plan.graph) return view;

    const PlanGraph& graph = *plan.graph;
    view["trace_line"] = build_trace_line(state, graph);

    const PlanNode* current = graph.find_node(state.current_node);
    if (!current) return view;
    view["current_type"] = std::string(to_string(current->type()));

    if (const TaskNode* task = current->as_task()) {
        view["action"] = task->action;
        view["tool"] = task->tool;
        view["tool_hint"] = task->tool_hint;
        if (task->verify) {
            view["verify"] = VerificationEvaluator::describe(*task->verify);
        }
        for (const Edge* e : graph.edges_from(current->id)) {
            const PlanNode* target = graph.find_node(e->to);
            view["edges"].push_back({
                {"condition", std::string(to_string(e->condition))},
                {"target", target ? target->name : e->to},
                {"escalate", target && target->type() == NodeType::ESCALATE}
            });
        }
    } else if (const DecisionNode* decision = current->as_decision()) {
        view["description"] = decision->description;
    }
    return view;
}

std::string ContextProjector::render(const TraversalState& state, const Plan& plan) {
    return renderer_.render(status_template_, build_view(state, plan));
}

std::string ContextProjector::render_escalation(const TraversalState& state, const EscalateNode& node) {
    nlohmann::json data = {
        {"plan_name", state.plan_name},
        {"reason", node.reason},
        {"pace_level", node.pace_level},
        {"completed_nodes", state.completed_nodes},
        {"total_nodes", state.total_nodes}
    };
    return renderer_.render(escalation_template_, data);
}

} // namespace planflow
