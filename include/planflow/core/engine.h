// planflow/core/engine.h
#ifndef PLANFLOW_CORE_ENGINE_H
#define PLANFLOW_CORE_ENGINE_H

#include "core/config.h"
#include "common/log.h"
#include "modules/library/plan_library.h"
#include "modules/matcher/plan_matcher.h"
#include "modules/scheduler/graph_traversal.h"
#include "modules/scheduler/traversal_state.h"
#include "modules/session/turn_history.h"
#include <memory>
#include <optional>
#include <string>

namespace planflow {

struct TurnInput {
    std::string domain;                      // from the domain classifier
    TurnHistory history;
    std::optional<PlanAllowList> allowed_plans;
    bool external_confirmation = false;      // confirms file_exists / manual checks
};

struct TurnOutput {
    TraversalStatus status = TraversalStatus::IDLE;
    std::optional<std::string> injection;    // status block or escalation message
    std::optional<EscalationSignal> escalation;
    std::optional<PlanId> activated_plan;    // set on the turn a plan was selected
    std::optional<TraversalState> finished_state;
};

// Host-loop entry point: one call per turn. The session state is owned by the
// caller; nothing thrown inside escapes on_turn.
class PlanFlowEngine {
public:
    static std::unique_ptr<PlanFlowEngine> from_config(const EngineConfig& config, LogSink sink = {});
    static std::unique_ptr<PlanFlowEngine> from_config_file(const std::string& config_path, LogSink sink = {});

    PlanFlowEngine(PlanLibrary library, EngineConfig config, LogSink sink = {});

    PlanFlowEngine(const PlanFlowEngine&) = delete;
    PlanFlowEngine& operator=(const PlanFlowEngine&) = delete;

    TurnOutput on_turn(SessionState& session, const TurnInput& input);

    const PlanLibrary& library() const { return library_; }
    const EngineConfig& config() const { return config_; }
    GraphTraversalEngine& traversal() { return traversal_; }

private:
    TurnOutput select_and_activate(SessionState& session, const TurnInput& input);
    static TurnOutput to_output(TurnResult result);

    EngineConfig config_;
    Logger log_;
    PlanLibrary library_;
    PlanMatcher matcher_;
    GraphTraversalEngine traversal_;
};

} // namespace planflow

#endif // PLANFLOW_CORE_ENGINE_H
