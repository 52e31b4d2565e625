// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <filesystem>
#include <stdexcept>

namespace planflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for status templates.", inja::SourceLocation{});
    });
}

inja::Template InjaTemplateRenderer::parse(std::string_view template_str) {
    try {
        return env_.parse(template_str);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template parse error: " + std::string(e.message));
    }
}

std::string InjaTemplateRenderer::render(const inja::Template& tmpl, const nlohmann::json& data) {
    try {
        return env_.render(tmpl, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace planflow
