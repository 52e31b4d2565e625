// modules/parser/plan_parser.cpp
#include "parser/plan_parser.h"

namespace planflow {

namespace {

// Unquoted YAML numbers and booleans arrive typed; string fields take their text.
std::optional<std::string> scalar_text(const nlohmann::ordered_json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    return std::nullopt;
}

std::string read_string(const nlohmann::ordered_json& j, const char* key, const std::string& fallback = "") {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    auto text = scalar_text(j[key]);
    if (!text) {
        throw std::runtime_error(std::string("'") + key + "' must be a string");
    }
    return *text;
}

int read_int(const nlohmann::ordered_json& j, const char* key, int fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (!j[key].is_number_integer()) {
        throw std::runtime_error(std::string("'") + key + "' must be an integer");
    }
    return j[key].get<int>();
}

std::vector<std::string> read_string_list(const nlohmann::ordered_json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    const auto& v = j[key];
    if (auto text = scalar_text(v)) {
        out.push_back(*text);
        return out;
    }
    if (!v.is_array()) {
        throw std::runtime_error(std::string("'") + key + "' must be a string or a list of strings");
    }
    for (const auto& item : v) {
        auto text = scalar_text(item);
        if (!text) {
            throw std::runtime_error(std::string("'") + key + "' must only contain strings");
        }
        out.push_back(*text);
    }
    return out;
}

std::optional<VerifySpec> parse_verify(const nlohmann::ordered_json& node_json) {
    if (!node_json.contains("verify") || node_json["verify"].is_null()) {
        return std::nullopt;
    }
    const auto& vj = node_json["verify"];
    if (!vj.is_object()) {
        throw std::runtime_error("'verify' must be a mapping");
    }
    std::string type_str = read_string(vj, "type", "any_output");
    auto type = parse_verify_type(type_str);
    if (!type) {
        throw std::runtime_error("Unknown verify type '" + type_str + "'");
    }
    return VerifySpec{*type, read_string(vj, "value")};
}

} // namespace

Plan PlanParser::parse_plan(const PlanId& id, const nlohmann::ordered_json& plan_json) const {
    if (!plan_json.is_object()) {
        throw PlanLibraryError("Plan '" + id + "' must be a mapping");
    }
    try {
        Plan plan;
        plan.id = id;
        plan.name = read_string(plan_json, "name", id);
        plan.domains = read_string_list(plan_json, "domains");
        plan.triggers = read_string_list(plan_json, "triggers");
        plan.trigger_threshold = read_int(plan_json, "trigger_threshold", defaults_.trigger_threshold);
        plan.stale_after_turns = read_int(plan_json, "stale_after_turns", defaults_.stale_after_turns);

        if (plan.trigger_threshold < 0) {
            throw std::runtime_error("'trigger_threshold' must not be negative");
        }
        if (plan.stale_after_turns <= 0) {
            throw std::runtime_error("'stale_after_turns' must be positive");
        }

        if (plan_json.contains("graph") && !plan_json["graph"].is_null()) {
            plan.graph = parse_graph(plan_json["graph"]);
        }
        return plan;
    } catch (const PlanLibraryError&) {
        throw;
    } catch (const std::exception& e) {
        throw PlanLibraryError("Error parsing plan '" + id + "': " + e.what());
    }
}

PlanGraph PlanParser::parse_graph(const nlohmann::ordered_json& graph_json) const {
    if (!graph_json.is_object()) {
        throw std::runtime_error("'graph' must be a mapping");
    }
    PlanGraph graph;
    graph.start = read_string(graph_json, "start");

    if (!graph_json.contains("nodes")) {
        throw std::runtime_error("graph has no 'nodes'");
    }
    const auto& nodes = graph_json["nodes"];
    if (nodes.is_object()) {
        // keyed by node id
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            graph.nodes.emplace(it.key(), create_node_from_json(it.key(), it.value()));
        }
    } else if (nodes.is_array()) {
        for (const auto& node_json : nodes) {
            std::string id = node_json.is_object() ? read_string(node_json, "id") : "";
            if (id.empty()) {
                throw std::runtime_error("Node in graph missing 'id'");
            }
            if (graph.nodes.count(id) > 0) {
                throw std::runtime_error("Duplicate node id '" + id + "'");
            }
            graph.nodes.emplace(id, create_node_from_json(id, node_json));
        }
    } else {
        throw std::runtime_error("'nodes' must be a mapping or a list");
    }

    if (graph_json.contains("edges") && !graph_json["edges"].is_null()) {
        if (!graph_json["edges"].is_array()) {
            throw std::runtime_error("'edges' must be a list");
        }
        for (const auto& edge_json : graph_json["edges"]) {
            graph.edges.push_back(parse_edge(edge_json));
        }
    }

    validate_graph(graph);
    return graph;
}

PlanNode PlanParser::create_node_from_json(const NodeId& id, const nlohmann::ordered_json& node_json) const {
    if (!node_json.is_object()) {
        throw std::runtime_error("Node '" + id + "' must be a mapping");
    }
    std::string type_str = read_string(node_json, "type");
    auto type = parse_node_type(type_str);
    if (!type) {
        throw std::runtime_error("Node '" + id + "' has unknown type '" + type_str + "'");
    }

    PlanNode node;
    node.id = id;
    node.name = read_string(node_json, "name", id);

    try {
        switch (*type) {
            case NodeType::START:
                node.body = StartNode{};
                break;
            case NodeType::TASK: {
                TaskNode task;
                task.action = read_string(node_json, "action");
                task.tool = read_string(node_json, "tool");
                task.tool_hint = read_string(node_json, "tool_hint");
                task.verify = parse_verify(node_json);
                task.max_retries = read_int(node_json, "max_retries", 0);
                if (task.max_retries < 0) {
                    throw std::runtime_error("'max_retries' must not be negative");
                }
                node.body = std::move(task);
                break;
            }
            case NodeType::DECISION:
                node.body = DecisionNode{read_string(node_json, "description", node.name)};
                break;
            case NodeType::CHECKPOINT:
                node.body = CheckpointNode{};
                break;
            case NodeType::EXIT:
                node.body = ExitNode{};
                break;
            case NodeType::ESCALATE: {
                EscalateNode esc;
                esc.pace_level = read_string(node_json, "pace_level", esc.pace_level);
                esc.reason = read_string(node_json, "reason", esc.reason);
                node.body = std::move(esc);
                break;
            }
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Node '" + id + "': " + e.what());
    }
    return node;
}

Edge PlanParser::parse_edge(const nlohmann::ordered_json& edge_json) const {
    if (!edge_json.is_object()) {
        throw std::runtime_error("Edge must be a mapping");
    }
    Edge edge;
    edge.from = read_string(edge_json, "from");
    edge.to = read_string(edge_json, "to");
    std::string cond_str = read_string(edge_json, "condition", "always");
    auto cond = parse_edge_condition(cond_str);
    if (!cond) {
        throw std::runtime_error("Edge '" + edge.from + "' -> '" + edge.to +
                                 "' has unknown condition '" + cond_str + "'");
    }
    edge.condition = *cond;
    return edge;
}

void PlanParser::validate_graph(const PlanGraph& graph) const {
    if (graph.start.empty()) {
        throw std::runtime_error("graph has no 'start'");
    }
    const PlanNode* start = graph.find_node(graph.start);
    if (!start) {
        throw std::runtime_error("start node '" + graph.start + "' is not defined");
    }
    if (start->type() != NodeType::START) {
        throw std::runtime_error("start node '" + graph.start + "' must have type 'start'");
    }
    for (const auto& e : graph.edges) {
        if (e.from.empty() || e.to.empty()) {
            throw std::runtime_error("Edge missing 'from' or 'to'");
        }
        if (!graph.find_node(e.from)) {
            throw std::runtime_error("Edge references undefined node '" + e.from + "'");
        }
        if (!graph.find_node(e.to)) {
            throw std::runtime_error("Edge references undefined node '" + e.to + "'");
        }
    }
    if (graph.edges_from(graph.start).empty()) {
        throw std::runtime_error("start node '" + graph.start + "' has no outgoing edge");
    }
}

} // namespace planflow
