// common/utils/yaml_json.h
#ifndef PLANFLOW_COMMON_UTILS_YAML_JSON_H
#define PLANFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace planflow {

// 将 YAML::Node 转换为 nlohmann::ordered_json (map order preserved).
// Quoted scalars always stay strings; plain scalars are typed.
nlohmann::ordered_json yaml_to_json(const YAML::Node& node);

} // namespace planflow

#endif // PLANFLOW_COMMON_UTILS_YAML_JSON_H
