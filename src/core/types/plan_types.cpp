// core/types/plan_types.cpp
#include "core/types/plan.h"

namespace planflow {

std::string_view to_string(NodeType type) {
    switch (type) {
        case NodeType::START: return "start";
        case NodeType::TASK: return "task";
        case NodeType::DECISION: return "decision";
        case NodeType::CHECKPOINT: return "checkpoint";
        case NodeType::EXIT: return "exit";
        case NodeType::ESCALATE: return "escalate";
    }
    return "unknown";
}

std::string_view to_string(EdgeCondition condition) {
    switch (condition) {
        case EdgeCondition::ALWAYS: return "always";
        case EdgeCondition::ON_SUCCESS: return "on_success";
        case EdgeCondition::ON_FAIL: return "on_fail";
        case EdgeCondition::ON_RETRY: return "on_retry";
        case EdgeCondition::ON_EXHAUST: return "on_exhaust";
    }
    return "unknown";
}

std::string_view to_string(VerifyType type) {
    switch (type) {
        case VerifyType::OUTPUT_CONTAINS: return "output_contains";
        case VerifyType::OUTPUT_NOT_CONTAINS: return "output_not_contains";
        case VerifyType::EXIT_CODE_ZERO: return "exit_code_zero";
        case VerifyType::ANY_OUTPUT: return "any_output";
        case VerifyType::FILE_EXISTS: return "file_exists";
        case VerifyType::MANUAL: return "manual";
    }
    return "unknown";
}

std::optional<NodeType> parse_node_type(std::string_view s) {
    if (s == "start") return NodeType::START;
    if (s == "task") return NodeType::TASK;
    if (s == "decision") return NodeType::DECISION;
    if (s == "checkpoint") return NodeType::CHECKPOINT;
    if (s == "exit") return NodeType::EXIT;
    if (s == "escalate") return NodeType::ESCALATE;
    return std::nullopt;
}

std::optional<EdgeCondition> parse_edge_condition(std::string_view s) {
    if (s == "always") return EdgeCondition::ALWAYS;
    if (s == "on_success") return EdgeCondition::ON_SUCCESS;
    if (s == "on_fail") return EdgeCondition::ON_FAIL;
    if (s == "on_retry") return EdgeCondition::ON_RETRY;
    if (s == "on_exhaust") return EdgeCondition::ON_EXHAUST;
    return std::nullopt;
}

std::optional<VerifyType> parse_verify_type(std::string_view s) {
    if (s == "output_contains") return VerifyType::OUTPUT_CONTAINS;
    if (s == "output_not_contains") return VerifyType::OUTPUT_NOT_CONTAINS;
    if (s == "exit_code_zero") return VerifyType::EXIT_CODE_ZERO;
    if (s == "any_output") return VerifyType::ANY_OUTPUT;
    if (s == "file_exists") return VerifyType::FILE_EXISTS;
    if (s == "manual") return VerifyType::MANUAL;
    return std::nullopt;
}

std::optional<EdgeCondition> condition_for_outcome(std::string_view outcome) {
    if (outcome == "success") return EdgeCondition::ON_SUCCESS;
    if (outcome == "fail") return EdgeCondition::ON_FAIL;
    return std::nullopt;
}

} // namespace planflow
