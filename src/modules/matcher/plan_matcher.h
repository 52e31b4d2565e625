// modules/matcher/plan_matcher.h
#ifndef PLANFLOW_MODULES_MATCHER_PLAN_MATCHER_H
#define PLANFLOW_MODULES_MATCHER_PLAN_MATCHER_H

#include "core/types/plan.h"
#include "library/plan_library.h"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace planflow {

struct PlanMatch {
    const Plan* plan = nullptr;
    int trigger_hits = 0;
    double score = 0.0;
};

using PlanAllowList = std::unordered_set<PlanId>;

// Picks the plan whose trigger keywords best match the user message.
//  - hits: trigger keywords found as substrings of the lower-cased message
//  - a plan that declares domains only accepts those domains
//  - qualifies when hits >= trigger_threshold
//  - score = hits (+1.0 when a declared domain matched); ties keep the earlier plan
//  - a score of 0 never wins, even when it meets a zero threshold
class PlanMatcher {
public:
    explicit PlanMatcher(const PlanLibrary& library) : library_(library) {}

    std::optional<PlanMatch> match(std::string_view domain,
                                   std::string_view message,
                                   const std::optional<PlanAllowList>& allowed = std::nullopt) const;

    // Score of a single plan, std::nullopt when it does not qualify.
    static std::optional<PlanMatch> score_plan(const Plan& plan, std::string_view domain,
                                               const std::string& lowered_message);

private:
    const PlanLibrary& library_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_MATCHER_PLAN_MATCHER_H
