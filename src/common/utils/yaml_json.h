// common/utils/yaml_json.h
#ifndef COMFYFLOW_COMMON_UTILS_YAML_JSON_H
#define COMFYFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace comfyflow {

// 将 YAML::Node 转换为 nlohmann::json
// Plain scalars become bool/int/double/null where they parse as such;
// quoted scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Dot-path lookup ("limits.max_workers"); nullptr when any segment is missing
const nlohmann::json* json_dot_get(const nlohmann::json& doc, const std::string& path);

} // namespace comfyflow

#endif // COMFYFLOW_COMMON_UTILS_YAML_JSON_H
