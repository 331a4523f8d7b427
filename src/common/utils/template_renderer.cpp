// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace comfyflow {

const Context& InjaTemplateRenderer::default_messages() {
    static const Context messages = {
        {"queued", "Queued for {{ topic }}"},
        {"running", "Generating in {{ topic }}..."},
        {"generating", "Generating... (waited {{ queue }})"},
        {"canceled", "Canceled"},
        {"topic_not_found", "Topic '{{ topic }}' is not configured"},
        {"input_image_required", "This topic needs an input image"},
        {"input_images_required", "This topic needs at least one input image"},
        {"upload_failed", "Failed to upload the input image: {{ error }}"},
        {"timeout", "Generation timed out"},
        {"engine_error", "Engine error: {{ error }}"},
        {"failed", "Generation failed: {{ error }}"},
        {"no_media", "The engine finished without producing any media"},
        {"rejected_capacity", "You already have {{ pending }} pending request(s); the limit is {{ limit }}"},
        {"rejected_unavailable", "The generation queue is not accepting requests"},
        {"caption", "{{ prompt }}\nQueue: {{ queue }} | Generation: {{ generation }}"},
    };
    return messages;
}

InjaTemplateRenderer::InjaTemplateRenderer(Context overrides) : messages_(default_messages()) {
    if (overrides.is_object()) {
        for (auto it = overrides.begin(); it != overrides.end(); ++it) {
            if (it.value().is_string()) {
                messages_[it.key()] = it.value();
            }
        }
    }
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::template_for(const std::string& key) const {
    auto it = messages_.find(key);
    if (it == messages_.end() || !it->is_string()) {
        return key;
    }
    return it->get<std::string>();
}

std::string InjaTemplateRenderer::render_string(std::string_view template_str, const Context& context) const {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

std::string InjaTemplateRenderer::render(const std::string& key, const Context& context) const {
    return render_string(template_for(key), context);
}

std::string format_duration(double seconds) {
    const double s = std::max(0.0, seconds);
    char buf[64];
    if (s < 60.0) {
        if (s < 10.0) {
            std::snprintf(buf, sizeof(buf), "%.1fs", s);
        } else {
            std::snprintf(buf, sizeof(buf), "%llds", static_cast<long long>(std::llround(s)));
        }
        return buf;
    }
    const long long m = static_cast<long long>(s / 60.0);
    if (s < 3600.0) {
        const long long rem_s = std::llround(s - static_cast<double>(m) * 60.0);
        if (rem_s > 0 && rem_s < 60) {
            std::snprintf(buf, sizeof(buf), "%lldm %llds", m, rem_s);
        } else {
            std::snprintf(buf, sizeof(buf), "%lldm", m);
        }
        return buf;
    }
    const long long h = static_cast<long long>(s / 3600.0);
    const long long rem_m = static_cast<long long>((s - static_cast<double>(h) * 3600.0) / 60.0);
    if (rem_m > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm", h, rem_m);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldh", h);
    }
    return buf;
}

} // namespace comfyflow
