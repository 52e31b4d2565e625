// common/utils/template_renderer.h
#ifndef PLANFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define PLANFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace planflow {

// Inja environment used for prompt-injection text. Block statements eat their
// own line (trim_blocks + lstrip_blocks) so templates can be laid out one
// statement per line; include is disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Parses once and keeps the template for repeated renders.
    inja::Template parse(std::string_view template_str);
    std::string render(const inja::Template& tmpl, const nlohmann::json& data);

private:
    inja::Environment env_;
};

} // namespace planflow

#endif // PLANFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
