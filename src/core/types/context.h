#ifndef COMFYFLOW_TYPES_CONTEXT_H
#define COMFYFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace comfyflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json;

} // namespace comfyflow

#endif // COMFYFLOW_TYPES_CONTEXT_H
