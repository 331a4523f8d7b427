// common/utils/template_renderer.h
#ifndef COMFYFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define COMFYFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h" // 引入 Context (nlohmann::json)
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace comfyflow {

// Renders user-visible status and caption text. Each message key has a
// built-in inja template; `overrides` (config messages.*) replace them.
class InjaTemplateRenderer {
public:
    explicit InjaTemplateRenderer(Context overrides = Context::object());

    // Render the template registered under `key`. Unknown keys render as the
    // key itself. Throws std::runtime_error on a broken template.
    std::string render(const std::string& key, const Context& context) const;

    // Render an ad-hoc template string
    std::string render_string(std::string_view template_str, const Context& context) const;

    // Template text currently used for `key`
    std::string template_for(const std::string& key) const;

    static const Context& default_messages();

private:
    Context messages_;
    mutable inja::Environment env_;
    mutable std::mutex mutex_;
    void configure_security(); // 禁用 include
};

// 12.3s / 42s / 3m 5s / 2h 10m
std::string format_duration(double seconds);

} // namespace comfyflow

#endif // COMFYFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
