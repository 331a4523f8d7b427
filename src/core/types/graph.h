#ifndef COMFYFLOW_TYPES_GRAPH_H
#define COMFYFLOW_TYPES_GRAPH_H

#include "context.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace comfyflow {

// Engine execution plan: { "<node id>": { "class_type": "...", "inputs": {...} } }
// An input is either a literal or an edge ["<source id>", <output index>].
using NodeGraph = nlohmann::json;

// Parameter name -> value; keys are always lower-cased
using ParameterSet = nlohmann::json;

using NodeId = std::string;

// 规则类型 - 在加载 topic 时一次性确定
enum class RuleKind : uint8_t {
    PROMPT,
    NEGATIVE_PROMPT,
    TEXT,          // "text"/"string" with param, or "text:<name>"/"string:<name>"
    INPUT_IMAGE,
    INPUT_IMAGES,
    SCALAR         // catch-all: model, width, height, steps, seed, fps, length, n ...
};

struct NodeRule {
    RuleKind kind = RuleKind::SCALAR;
    std::string raw_kind;            // as written in nodes.json
    std::vector<NodeId> node_ids;    // order matters for INPUT_IMAGES
    std::string input_key;
    std::optional<std::string> param;
    std::string param_key;           // parameter looked up for TEXT and SCALAR rules
};

struct ClassifiedKind {
    RuleKind kind;
    std::string param_key;
};

// Decide the rule kind from its raw string. `param` is only consulted for
// plain "text"/"string" rules.
ClassifiedKind classify_rule_kind(const std::string& raw_kind,
                                  const std::optional<std::string>& param = std::nullopt);

// Parse the "nodes" array of a nodes.json document
std::vector<NodeRule> parse_node_rules(const nlohmann::json& nodes_json);

// Every id referenced by a rule must exist and own an "inputs" object.
// Throws ConfigurationError otherwise.
void validate_rules_against_graph(const NodeGraph& graph, const std::vector<NodeRule>& rules);

// ["<id>", <index>] style reference
bool is_edge_reference(const Value& input_value);

std::string to_lower_copy(std::string s);
std::string trim_copy(const std::string& s);

// Copy of `params` with lower-cased keys (later duplicates win)
ParameterSet normalize_params(const ParameterSet& params);

} // namespace comfyflow

#endif // COMFYFLOW_TYPES_GRAPH_H
