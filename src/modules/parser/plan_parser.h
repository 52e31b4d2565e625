// modules/parser/plan_parser.h
#ifndef PLANFLOW_MODULES_PARSER_PLAN_PARSER_H
#define PLANFLOW_MODULES_PARSER_PLAN_PARSER_H

#include "core/types/plan.h" // 引入 Plan, PlanGraph, PlanNode
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace planflow {

struct PlanLibraryError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Turns one plan definition of the library document into a validated Plan.
// Every shape problem is a PlanLibraryError naming the plan and node.
class PlanParser {
public:
    struct Defaults {
        int trigger_threshold = 2;
        int stale_after_turns = 15;
    };

    PlanParser() = default;
    explicit PlanParser(Defaults defaults) : defaults_(defaults) {}

    Plan parse_plan(const PlanId& id, const nlohmann::ordered_json& plan_json) const;

    PlanNode create_node_from_json(const NodeId& id, const nlohmann::ordered_json& node_json) const;

private:
    PlanGraph parse_graph(const nlohmann::ordered_json& graph_json) const;
    Edge parse_edge(const nlohmann::ordered_json& edge_json) const;
    void validate_graph(const PlanGraph& graph) const;

    Defaults defaults_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_PARSER_PLAN_PARSER_H
