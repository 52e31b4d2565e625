// core/types/plan.h
#ifndef PLANFLOW_CORE_TYPES_PLAN_H
#define PLANFLOW_CORE_TYPES_PLAN_H

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>
#include <variant>
#include <cstdint>

namespace planflow {

using NodeId = std::string;
using PlanId = std::string;

// 节点类型枚举 (order matches NodeBody alternatives)
enum class NodeType : uint8_t {
    START,
    TASK,
    DECISION,
    CHECKPOINT,
    EXIT,
    ESCALATE
};

enum class EdgeCondition : uint8_t {
    ALWAYS,
    ON_SUCCESS,
    ON_FAIL,
    ON_RETRY,
    ON_EXHAUST
};

enum class VerifyType : uint8_t {
    OUTPUT_CONTAINS,
    OUTPUT_NOT_CONTAINS,
    EXIT_CODE_ZERO,
    ANY_OUTPUT,
    FILE_EXISTS,
    MANUAL
};

struct VerifySpec {
    VerifyType type = VerifyType::ANY_OUTPUT;
    std::string value;
};

struct StartNode {};

struct TaskNode {
    std::string action;
    std::string tool;
    std::string tool_hint;
    std::optional<VerifySpec> verify; // none => always verified
    int max_retries = 0;
};

struct DecisionNode {
    std::string description;
};

// Reserved for future gating; routed through like a start node.
struct CheckpointNode {};

struct ExitNode {};

struct EscalateNode {
    std::string pace_level = "contingent";
    std::string reason = "Plan escalated";
};

using NodeBody = std::variant<StartNode, TaskNode, DecisionNode, CheckpointNode, ExitNode, EscalateNode>;

struct PlanNode {
    NodeId id;
    std::string name;
    NodeBody body;

    NodeType type() const { return static_cast<NodeType>(body.index()); }

    const TaskNode* as_task() const { return std::get_if<TaskNode>(&body); }
    const DecisionNode* as_decision() const { return std::get_if<DecisionNode>(&body); }
    const EscalateNode* as_escalate() const { return std::get_if<EscalateNode>(&body); }

    // start/decision/checkpoint need no external action and are auto-routed
    bool is_routable() const {
        auto t = type();
        return t == NodeType::START || t == NodeType::DECISION || t == NodeType::CHECKPOINT;
    }
    bool is_terminal() const {
        auto t = type();
        return t == NodeType::EXIT || t == NodeType::ESCALATE;
    }
};

struct Edge {
    NodeId from;
    NodeId to;
    EdgeCondition condition = EdgeCondition::ALWAYS;
};

struct PlanGraph {
    NodeId start;
    std::unordered_map<NodeId, PlanNode> nodes;
    std::vector<Edge> edges; // document order, first match wins

    const PlanNode* find_node(const NodeId& id) const {
        auto it = nodes.find(id);
        return it == nodes.end() ? nullptr : &it->second;
    }

    std::vector<const Edge*> edges_from(const NodeId& id) const {
        std::vector<const Edge*> out;
        for (const auto& e : edges) {
            if (e.from == id) out.push_back(&e);
        }
        return out;
    }

    // Number of task nodes; fixed as total_nodes at activation.
    int task_count() const {
        int n = 0;
        for (const auto& [id, node] : nodes) {
            if (node.type() == NodeType::TASK) ++n;
        }
        return n;
    }
};

struct Plan {
    PlanId id;
    std::string name;
    std::vector<std::string> domains;   // empty => accepts every domain
    std::vector<std::string> triggers;
    int trigger_threshold = 2;
    int stale_after_turns = 15;
    std::optional<PlanGraph> graph;     // absent for legacy linear plans
};

// --- string conversions (plan_types.cpp) ---
std::string_view to_string(NodeType type);
std::string_view to_string(EdgeCondition condition);
std::string_view to_string(VerifyType type);

std::optional<NodeType> parse_node_type(std::string_view s);
std::optional<EdgeCondition> parse_edge_condition(std::string_view s);
std::optional<VerifyType> parse_verify_type(std::string_view s);

// "success" -> ON_SUCCESS, "fail" -> ON_FAIL; decision routing key
std::optional<EdgeCondition> condition_for_outcome(std::string_view outcome);

} // namespace planflow

#endif // PLANFLOW_CORE_TYPES_PLAN_H
