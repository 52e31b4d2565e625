// modules/context/context_projector.h
#ifndef PLANFLOW_MODULES_CONTEXT_CONTEXT_PROJECTOR_H
#define PLANFLOW_MODULES_CONTEXT_CONTEXT_PROJECTOR_H

#include "core/types/plan.h"
#include "scheduler/traversal_state.h"
#include "common/utils/template_renderer.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace planflow {

// Renders traversal state into the status block injected before the next
// reasoning step. This text is the only channel carrying traversal state
// forward, so everything the agent needs to act on goes in here.
class ContextProjector {
public:
    ContextProjector();

    std::string render(const TraversalState& state, const Plan& plan);

    // Message injected in place of the status block when an escalate node is reached.
    std::string render_escalation(const TraversalState& state, const EscalateNode& node);

    // Template data behind render(); exposed for diagnostics.
    static nlohmann::json build_view(const TraversalState& state, const Plan& plan);

    // Deduplicated path with [DONE] / [FAILED] / [...] / << CURRENT >> marks.
    static std::string build_trace_line(const TraversalState& state, const PlanGraph& graph);

private:
    InjaTemplateRenderer renderer_;
    inja::Template status_template_;
    inja::Template escalation_template_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_CONTEXT_CONTEXT_PROJECTOR_H
