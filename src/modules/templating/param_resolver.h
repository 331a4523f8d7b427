// modules/templating/param_resolver.h
#ifndef COMFYFLOW_MODULES_TEMPLATING_PARAM_RESOLVER_H
#define COMFYFLOW_MODULES_TEMPLATING_PARAM_RESOLVER_H

#include "core/types/graph.h"
#include "core/types/topic.h"
#include <optional>
#include <string>
#include <utility>

namespace comfyflow {

// Merge topic defaults with inline overrides:
//   rule defaults -> topic defaults -> inherit zero width/height from the input image
//   -> allow-listed inline values, clamped to inline_limits
// width/height are rescaled together so the aspect ratio survives a clamp.
class ParamResolver {
public:
    using Dimensions = std::pair<int, int>; // width, height

    static ParameterSet resolve(const TopicConfig& topic,
                                const ParameterSet& inline_params,
                                const std::optional<Dimensions>& input_dims = std::nullopt);

    // Clamp a numeric value to limits[key].{min,max}; non-numeric values pass through.
    // Integers stay integers.
    static Value clamp_value(const nlohmann::json& limits, const std::string& key, const Value& value);
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_TEMPLATING_PARAM_RESOLVER_H
