#ifndef COMFYFLOW_TYPES_TOPIC_H
#define COMFYFLOW_TYPES_TOPIC_H

#include "graph.h"
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace comfyflow {

// Everything the core needs to serve one topic alias
struct TopicConfig {
    std::string alias;
    std::string title;
    std::optional<std::string> description;

    NodeGraph workflow = NodeGraph::object();
    std::vector<NodeRule> rules;
    ParameterSet rule_defaults = ParameterSet::object(); // nodes.json "defaults"
    ParameterSet defaults = ParameterSet::object();      // meta.json "defaults", wins over rule_defaults

    // std::nullopt -> every inline parameter is allowed
    std::optional<std::set<std::string>> inline_allowed;
    // { "<param>": { "min": number, "max": number } }
    nlohmann::json inline_limits = nlohmann::json::object();

    bool has_rule(RuleKind kind) const {
        for (const auto& rule : rules) {
            if (rule.kind == kind) return true;
        }
        return false;
    }
};

} // namespace comfyflow

#endif // COMFYFLOW_TYPES_TOPIC_H
