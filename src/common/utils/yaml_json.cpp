// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <string>
#include <sstream>
#include <stdexcept>
#include <cctype>

namespace planflow {

namespace {

bool is_integer(const std::string& s) {
    size_t start = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

nlohmann::ordered_json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // yaml-cpp tags quoted scalars with "!"
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True") return true;
    if (s == "false" || s == "False") return false;
    if (s == "~" || s == "null" || s.empty()) return nullptr;

    if (is_numeric(s)) {
        try {
            if (is_integer(s)) return std::stoll(s);
            return std::stod(s);
        } catch (const std::out_of_range&) {
            // too large for a number, keep the text
        }
    }
    return s;
}

} // namespace

nlohmann::ordered_json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::ordered_json obj = nlohmann::ordered_json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

} // namespace planflow
