// core/types/graph.cpp
#include "core/types/graph.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>

namespace comfyflow {

std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_copy(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

ClassifiedKind classify_rule_kind(const std::string& raw_kind, const std::optional<std::string>& param) {
    const std::string kind = to_lower_copy(trim_copy(raw_kind));

    if (kind == "prompt") return {RuleKind::PROMPT, "prompt"};
    if (kind == "negative_prompt") return {RuleKind::NEGATIVE_PROMPT, "negative_prompt"};
    if (kind == "input_image") return {RuleKind::INPUT_IMAGE, "input_image"};
    if (kind == "input_images") return {RuleKind::INPUT_IMAGES, "input_images"};

    if (kind.rfind("text:", 0) == 0 || kind.rfind("string:", 0) == 0) {
        return {RuleKind::TEXT, trim_copy(kind.substr(kind.find(':') + 1))};
    }
    if (kind == "text" || kind == "string") {
        return {RuleKind::TEXT, param ? to_lower_copy(trim_copy(*param)) : std::string()};
    }
    // Any other "text..."/"string..." spelling is a text rule without a usable name
    if (kind.rfind("text", 0) == 0 || kind.rfind("string", 0) == 0) {
        return {RuleKind::TEXT, std::string()};
    }
    return {RuleKind::SCALAR, kind};
}

std::vector<NodeRule> parse_node_rules(const nlohmann::json& nodes_json) {
    std::vector<NodeRule> rules;
    if (nodes_json.is_null()) {
        return rules;
    }
    if (!nodes_json.is_array()) {
        throw ConfigurationError("'nodes' must be an array");
    }

    for (const auto& item : nodes_json) {
        if (!item.is_object() || !item.contains("type") || !item.contains("node_ids") || !item.contains("key")) {
            throw ConfigurationError("Node rule requires 'type', 'node_ids' and 'key': " + item.dump());
        }
        NodeRule rule;
        rule.raw_kind = item["type"].is_string() ? item["type"].get<std::string>() : item["type"].dump();
        rule.input_key = item["key"].get<std::string>();

        const auto& ids = item["node_ids"];
        if (!ids.is_array()) {
            throw ConfigurationError("'node_ids' must be an array in rule '" + rule.raw_kind + "'");
        }
        for (const auto& id : ids) {
            rule.node_ids.push_back(id.is_string() ? id.get<std::string>() : id.dump());
        }

        if (item.contains("param")) {
            const auto& p = item["param"];
            std::string pv;
            if (p.is_string()) {
                pv = trim_copy(p.get<std::string>());
            } else if (p.is_primitive() && !p.is_null()) {
                pv = p.dump();
            }
            if (!pv.empty()) rule.param = pv;
        }

        auto classified = classify_rule_kind(rule.raw_kind, rule.param);
        rule.kind = classified.kind;
        rule.param_key = std::move(classified.param_key);
        rules.push_back(std::move(rule));
    }
    return rules;
}

void validate_rules_against_graph(const NodeGraph& graph, const std::vector<NodeRule>& rules) {
    if (!graph.is_object()) {
        throw ConfigurationError("Workflow graph must be a JSON object");
    }
    for (const auto& rule : rules) {
        for (const auto& id : rule.node_ids) {
            auto it = graph.find(id);
            if (it == graph.end()) {
                throw ConfigurationError("Rule '" + rule.raw_kind + "' references node_id " + id + " absent in workflow");
            }
            if (!it->is_object() || !it->contains("inputs") || !(*it)["inputs"].is_object()) {
                throw ConfigurationError("Workflow node " + id + " has no 'inputs'");
            }
        }
    }
}

bool is_edge_reference(const Value& input_value) {
    return input_value.is_array() && !input_value.empty() && input_value[0].is_string();
}

ParameterSet normalize_params(const ParameterSet& params) {
    ParameterSet out = ParameterSet::object();
    if (!params.is_object()) {
        return out;
    }
    for (auto it = params.begin(); it != params.end(); ++it) {
        out[to_lower_copy(it.key())] = it.value();
    }
    return out;
}

} // namespace comfyflow
