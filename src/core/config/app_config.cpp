// core/config/app_config.cpp
#include "core/config/app_config.h"
#include "core/types/errors.h"
#include "core/types/graph.h"
#include "common/utils/yaml_json.h"
#include "common/logging/logger.h"
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace comfyflow {

namespace {

std::optional<std::string> env_value(const EnvLookup& env, const std::string& name) {
    if (!env) return std::nullopt;
    auto v = env(name);
    if (!v || v->empty()) return std::nullopt;
    return v;
}

std::string yaml_string(const Context& doc, const std::string& path, const std::string& fallback) {
    const Context* v = json_dot_get(doc, path);
    if (!v || v->is_null()) return fallback;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return fallback;
}

int yaml_int(const Context& doc, const std::string& path, int fallback) {
    const Context* v = json_dot_get(doc, path);
    if (!v) return fallback;
    if (v->is_number_integer()) return v->get<int>();
    if (v->is_string()) {
        try {
            return std::stoi(v->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string pick_string(const EnvLookup& env, const std::string& name,
                        const Context& doc, const std::string& path, const std::string& fallback) {
    if (auto v = env_value(env, name)) return *v;
    return yaml_string(doc, path, fallback);
}

// Unparsable environment values fall back to the YAML/default value
int pick_int(const EnvLookup& env, const std::string& name,
             const Context& doc, const std::string& path, int fallback) {
    const int from_yaml = yaml_int(doc, path, fallback);
    auto v = env_value(env, name);
    if (!v) return from_yaml;
    try {
        size_t pos = 0;
        int parsed = std::stoi(*v, &pos);
        if (pos != v->size()) {
            COMFYFLOW_WARN("Ignoring non-integer {}={}", name, *v);
            return from_yaml;
        }
        return parsed;
    } catch (const std::exception&) {
        COMFYFLOW_WARN("Ignoring non-integer {}={}", name, *v);
        return from_yaml;
    }
}

} // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

AppConfig AppConfig::from_json(const Context& doc, const EnvLookup& env) {
    AppConfig cfg;
    cfg.engine_base_url = pick_string(env, "COMFY_BASE_URL", doc, "engine.base_url", "");
    cfg.engine_api_key = pick_string(env, "COMFY_API_KEY", doc, "engine.api_key", "");
    cfg.workdir = pick_string(env, "WORKDIR", doc, "paths.workdir", "data/topics");

    cfg.max_workers = pick_int(env, "LIMITS_MAX_WORKERS", doc, "limits.max_workers", 2);
    cfg.per_topic_limit = pick_int(env, "LIMITS_PER_TOPIC", doc, "limits.per_topic", 1);
    cfg.per_user_pending = pick_int(env, "LIMITS_PER_USER_PENDING", doc, "limits.per_user_pending", 3);

    cfg.event_timeout = std::chrono::seconds(pick_int(env, "TIMEOUT_WS", doc, "timeouts.ws", 120));
    cfg.run_timeout = std::chrono::seconds(pick_int(env, "TIMEOUT_RUN", doc, "timeouts.run", 300));

    cfg.log_level = to_lower_copy(pick_string(env, "LOG_LEVEL", doc, "logging.level", "info"));

    if (const Context* messages = json_dot_get(doc, "messages"); messages && messages->is_object()) {
        cfg.messages = *messages;
    }

    if (cfg.engine_base_url.empty()) {
        throw ConfigurationError("COMFY_BASE_URL (engine.base_url) is required");
    }
    if (cfg.event_timeout.count() <= 0 || cfg.run_timeout.count() <= 0) {
        throw ConfigurationError("Timeouts must be positive");
    }
    return cfg;
}

AppConfig AppConfig::load(const std::string& yaml_path, const EnvLookup& env) {
    std::string path = yaml_path;
    if (path.empty()) {
        path = trim_copy(env_value(env, "CONFIG_YAML").value_or(""));
    }

    Context doc = Context::object();
    if (!path.empty()) {
        if (!std::filesystem::exists(path)) {
            throw ConfigurationError("Config file not found: " + path);
        }
        try {
            doc = yaml_to_json(YAML::LoadFile(path));
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("Failed to read " + path + ": " + e.what());
        }
        if (!doc.is_object()) {
            doc = Context::object();
        }
        COMFYFLOW_DEBUG("Loaded config file {}", path);
    }
    return from_json(doc, env);
}

} // namespace comfyflow
