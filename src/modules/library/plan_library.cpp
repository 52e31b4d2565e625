// modules/library/plan_library.cpp
#include "library/plan_library.h"
#include "common/utils/yaml_json.h"
#include "common/utils/string_utils.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace planflow {

PlanLibrary PlanLibrary::from_document(const nlohmann::ordered_json& doc, const Logger& log,
                                       PlanParser::Defaults defaults) {
    if (!doc.is_object() || !doc.contains("plans") || !doc["plans"].is_object()) {
        throw PlanLibraryError("Plan library must be a mapping with a 'plans' mapping");
    }

    PlanParser parser(defaults);
    PlanLibrary library;
    const auto& plans = doc["plans"];
    for (auto it = plans.begin(); it != plans.end(); ++it) {
        try {
            library.add(parser.parse_plan(it.key(), it.value()));
        } catch (const PlanLibraryError& e) {
            // one bad plan must not take the whole library down
            log.warning(std::string("Skipping plan: ") + e.what());
            library.rejected_.push_back({it.key(), e.what()});
        }
    }

    int graph_plans = 0;
    for (const auto& p : library.plans_) {
        if (p.graph) ++graph_plans;
    }
    log.info("Plan library loaded: " + std::to_string(library.plans_.size()) + " plans (" +
             std::to_string(graph_plans) + " graph), " + std::to_string(library.rejected_.size()) + " rejected");
    return library;
}

PlanLibrary PlanLibrary::from_json_string(const std::string& content, const Logger& log,
                                          PlanParser::Defaults defaults) {
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw PlanLibraryError(std::string("JSON parse error in plan library: ") + e.what());
    }
    return from_document(doc, log, defaults);
}

PlanLibrary PlanLibrary::from_yaml_string(const std::string& content, const Logger& log,
                                          PlanParser::Defaults defaults) {
    nlohmann::ordered_json doc;
    try {
        doc = yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw PlanLibraryError(std::string("YAML parse error in plan library: ") + e.what());
    }
    return from_document(doc, log, defaults);
}

PlanLibrary PlanLibrary::from_file(const std::string& file_path, const Logger& log,
                                   PlanParser::Defaults defaults) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw PlanLibraryError("Cannot open plan library: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string ext = to_lower(std::filesystem::path(file_path).extension().string());
    if (ext == ".yaml" || ext == ".yml") {
        return from_yaml_string(buffer.str(), log, defaults);
    }
    if (ext == ".json") {
        return from_json_string(buffer.str(), log, defaults);
    }
    throw PlanLibraryError("Unsupported plan library format '" + ext + "': " + file_path);
}

const Plan* PlanLibrary::find(const PlanId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &plans_[it->second];
}

void PlanLibrary::add(Plan plan) {
    index_[plan.id] = plans_.size();
    plans_.push_back(std::move(plan));
}

} // namespace planflow
