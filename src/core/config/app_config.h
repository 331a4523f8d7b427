// core/config/app_config.h
#ifndef COMFYFLOW_CORE_CONFIG_APP_CONFIG_H
#define COMFYFLOW_CORE_CONFIG_APP_CONFIG_H

#include "core/types/context.h"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace comfyflow {

// name -> value, std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Process environment through std::getenv
EnvLookup process_env();

struct AppConfig {
    std::string engine_base_url;
    std::string engine_api_key;
    std::filesystem::path workdir = "data/topics";

    int max_workers = 2;
    int per_topic_limit = 1;
    int per_user_pending = 3;  // <= 0 disables the requester limit

    std::chrono::seconds event_timeout{120};
    std::chrono::seconds run_timeout{300};

    std::string log_level = "info";

    // messages.<key> overrides for status/caption templates
    Context messages = Context::object();

    // Optional YAML file overlaid by environment variables. An empty path
    // falls back to $CONFIG_YAML; no file at all is fine. Throws
    // ConfigurationError on unreadable YAML or a missing engine base URL.
    static AppConfig load(const std::string& yaml_path = "", const EnvLookup& env = process_env());

    // Same resolution from an already parsed document
    static AppConfig from_json(const Context& doc, const EnvLookup& env);
};

} // namespace comfyflow

#endif // COMFYFLOW_CORE_CONFIG_APP_CONFIG_H
