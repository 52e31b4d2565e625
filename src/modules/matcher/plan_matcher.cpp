// modules/matcher/plan_matcher.cpp
#include "matcher/plan_matcher.h"
#include "common/utils/string_utils.h"
#include <algorithm>

namespace planflow {

std::optional<PlanMatch> PlanMatcher::score_plan(const Plan& plan, std::string_view domain,
                                                 const std::string& lowered_message) {
    bool declares_domains = !plan.domains.empty();
    bool domain_match = !declares_domains ||
        std::find(plan.domains.begin(), plan.domains.end(), domain) != plan.domains.end();
    if (!domain_match) return std::nullopt;

    int hits = 0;
    for (const auto& trigger : plan.triggers) {
        if (lowered_message.find(to_lower(trigger)) != std::string::npos) ++hits;
    }
    if (hits < plan.trigger_threshold) return std::nullopt;

    PlanMatch m;
    m.plan = &plan;
    m.trigger_hits = hits;
    m.score = hits + (declares_domains ? 1.0 : 0.0);
    return m;
}

std::optional<PlanMatch> PlanMatcher::match(std::string_view domain,
                                            std::string_view message,
                                            const std::optional<PlanAllowList>& allowed) const {
    std::string lowered = to_lower(message);
    std::optional<PlanMatch> best;

    for (const auto& plan : library_.plans()) {
        if (allowed && allowed->count(plan.id) == 0) continue;

        auto m = score_plan(plan, domain, lowered);
        if (!m) continue;
        // a zero score never selects a plan
        if (m->score > (best ? best->score : 0.0)) {
            best = m;
        }
    }
    return best;
}

} // namespace planflow
