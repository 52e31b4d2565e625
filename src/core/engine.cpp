// src/core/engine.cpp
#include "planflow/core/engine.h"
#include <stdexcept>

namespace planflow {

namespace {

LogSink resolve_sink(LogSink sink, const EngineConfig& config) {
    return sink ? std::move(sink) : make_stderr_sink(config.log_level);
}

GraphTraversalEngine::Options traversal_options(const EngineConfig& config) {
    GraphTraversalEngine::Options options;
    options.max_events = config.max_events;
    options.max_route_depth = config.max_route_depth;
    options.verify_policy.permissive_external_checks = config.permissive_external_checks;
    return options;
}

} // namespace

std::unique_ptr<PlanFlowEngine> PlanFlowEngine::from_config(const EngineConfig& config, LogSink sink) {
    sink = resolve_sink(std::move(sink), config);
    PlanParser::Defaults defaults;
    defaults.trigger_threshold = config.default_trigger_threshold;
    defaults.stale_after_turns = config.default_stale_after_turns;

    // loaded once; a changed library needs a new engine
    auto library = PlanLibrary::from_file(config.plan_library_path, Logger(sink), defaults);
    return std::make_unique<PlanFlowEngine>(std::move(library), config, std::move(sink));
}

std::unique_ptr<PlanFlowEngine> PlanFlowEngine::from_config_file(const std::string& config_path, LogSink sink) {
    return from_config(load_engine_config(config_path), std::move(sink));
}

PlanFlowEngine::PlanFlowEngine(PlanLibrary library, EngineConfig config, LogSink sink)
    : config_(std::move(config)),
      log_(resolve_sink(std::move(sink), config_)),
      library_(std::move(library)),
      matcher_(library_),
      traversal_(library_, traversal_options(config_), log_) {}

TurnOutput PlanFlowEngine::on_turn(SessionState& session, const TurnInput& input) {
    try {
        if (session.traversal) {
            auto result = traversal_.advance(session, last_tool_output(input.history), input.external_confirmation);
            return to_output(std::move(result));
        }
        return select_and_activate(session, input);
    } catch (const std::exception& e) {
        log_.warning_guarded(std::string("Error (passthrough): ") + e.what());
        TurnOutput out;
        out.status = session.traversal ? TraversalStatus::AWAITING_OUTPUT : TraversalStatus::IDLE;
        return out;
    }
}

TurnOutput PlanFlowEngine::select_and_activate(SessionState& session, const TurnInput& input) {
    std::string message = last_user_message(input.history);
    if (message.empty()) {
        return TurnOutput{};
    }

    auto match = matcher_.match(input.domain, message, input.allowed_plans);
    if (!match) {
        return TurnOutput{};
    }
    const Plan& plan = *match->plan;
    if (!plan.graph) {
        log_.info("Matched plan '" + plan.id + "' has no graph, not activated");
        return TurnOutput{};
    }

    log_.debug("Matched plan '" + plan.id + "' (score " + std::to_string(match->score) + ")");
    TurnOutput out = to_output(traversal_.activate(session, plan));
    out.activated_plan = plan.id;
    return out;
}

TurnOutput PlanFlowEngine::to_output(TurnResult result) {
    TurnOutput out;
    out.status = result.status;
    out.injection = std::move(result.status_text);
    out.escalation = std::move(result.escalation);
    out.finished_state = std::move(result.finished_state);
    return out;
}

} // namespace planflow
