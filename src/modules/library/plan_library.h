// modules/library/plan_library.h
#ifndef PLANFLOW_MODULES_LIBRARY_PLAN_LIBRARY_H
#define PLANFLOW_MODULES_LIBRARY_PLAN_LIBRARY_H

#include "core/types/plan.h"
#include "parser/plan_parser.h" // 引入 PlanLibraryError
#include "common/log.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace planflow {

// A plan that failed validation and was left out of the library.
struct RejectedPlan {
    PlanId id;
    std::string reason;
};

// Read-only plan id -> plan definition table, in document order.
// Loaded once; reloading means building a new library.
class PlanLibrary {
public:
    PlanLibrary() = default;

    static PlanLibrary from_json_string(const std::string& content, const Logger& log = {},
                                        PlanParser::Defaults defaults = {});
    static PlanLibrary from_yaml_string(const std::string& content, const Logger& log = {},
                                        PlanParser::Defaults defaults = {});
    // Format chosen by extension: .json, .yaml / .yml
    static PlanLibrary from_file(const std::string& file_path, const Logger& log = {},
                                 PlanParser::Defaults defaults = {});

    static PlanLibrary from_document(const nlohmann::ordered_json& doc, const Logger& log = {},
                                     PlanParser::Defaults defaults = {});

    const Plan* find(const PlanId& id) const;
    const std::vector<Plan>& plans() const { return plans_; }
    const std::vector<RejectedPlan>& rejected() const { return rejected_; }
    std::size_t size() const { return plans_.size(); }
    bool empty() const { return plans_.empty(); }

private:
    void add(Plan plan);

    std::vector<Plan> plans_;
    std::unordered_map<PlanId, std::size_t> index_;
    std::vector<RejectedPlan> rejected_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_LIBRARY_PLAN_LIBRARY_H
