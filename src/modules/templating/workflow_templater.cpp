// modules/templating/workflow_templater.cpp
#include "templating/workflow_templater.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <random>
#include <unordered_set>

namespace comfyflow {

uint64_t generate_seed() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist(0, (uint64_t{1} << 48) - 1);
    return dist(engine);
}

namespace {

const Value* find_param(const ParameterSet& params, const std::string& key) {
    if (key.empty()) return nullptr;
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return nullptr;
    return &(*it);
}

} // namespace

void WorkflowTemplater::assign_input(NodeGraph& graph, const NodeRule& rule, const Value& value) {
    for (const auto& id : rule.node_ids) {
        auto node_it = graph.find(id);
        if (node_it == graph.end()) {
            // pruned by an input_images rule earlier in this render
            continue;
        }
        node_it->at("inputs")[rule.input_key] = value;
    }
}

void WorkflowTemplater::prune_nodes(NodeGraph& graph, const std::vector<NodeId>& ids) {
    if (ids.empty()) return;
    const std::unordered_set<NodeId> removed(ids.begin(), ids.end());

    for (const auto& id : ids) {
        graph.erase(id);
    }

    for (auto& [node_id, node] : graph.items()) {
        if (!node.is_object() || !node.contains("inputs") || !node["inputs"].is_object()) {
            continue;
        }
        auto& inputs = node["inputs"];
        std::vector<std::string> dangling;
        for (auto it = inputs.begin(); it != inputs.end(); ++it) {
            if (is_edge_reference(it.value()) && removed.count(it.value()[0].get<std::string>()) > 0) {
                dangling.push_back(it.key());
            }
        }
        for (const auto& key : dangling) {
            COMFYFLOW_DEBUG("Detaching input '{}' of node {} from pruned node", key, node_id);
            inputs.erase(key);
        }
    }
}

NodeGraph WorkflowTemplater::render(const NodeGraph& graph_template,
                                    const std::vector<NodeRule>& rules,
                                    const std::string& prompt,
                                    const ParameterSet& params) {
    NodeGraph graph = graph_template; // deep copy
    ParameterSet eff = normalize_params(params);
    if (!find_param(eff, "seed")) {
        eff["seed"] = generate_seed();
        COMFYFLOW_DEBUG("Generated random seed: {}", eff["seed"].get<uint64_t>());
    }

    // 1) prompt
    for (const auto& rule : rules) {
        if (rule.kind == RuleKind::PROMPT) {
            assign_input(graph, rule, prompt);
        }
    }

    // 2) negative prompt
    for (const auto& rule : rules) {
        if (rule.kind != RuleKind::NEGATIVE_PROMPT) continue;
        if (const Value* neg = find_param(eff, "negative_prompt")) {
            assign_input(graph, rule, *neg);
        }
    }

    // 3) generic text fields
    for (const auto& rule : rules) {
        if (rule.kind != RuleKind::TEXT) continue;
        if (const Value* val = find_param(eff, rule.param_key)) {
            assign_input(graph, rule, *val);
        }
    }

    // 4) single input image
    for (const auto& rule : rules) {
        if (rule.kind != RuleKind::INPUT_IMAGE) continue;
        if (const Value* val = find_param(eff, "input_image")) {
            assign_input(graph, rule, *val);
        }
    }

    // 5) multiple input images, unused image nodes are pruned
    for (const auto& rule : rules) {
        if (rule.kind != RuleKind::INPUT_IMAGES) continue;

        const Value* vals = find_param(eff, "input_images");
        size_t used = 0;
        if (vals && vals->is_array()) {
            used = std::min(vals->size(), rule.node_ids.size());
            for (size_t i = 0; i < used; ++i) {
                auto node_it = graph.find(rule.node_ids[i]);
                if (node_it == graph.end()) continue; // pruned by an earlier rule
                node_it->at("inputs")[rule.input_key] = (*vals)[i];
            }
        }
        if (used < rule.node_ids.size()) {
            std::vector<NodeId> surplus(rule.node_ids.begin() + static_cast<std::ptrdiff_t>(used), rule.node_ids.end());
            COMFYFLOW_DEBUG("Pruning {} unused image node(s)", surplus.size());
            prune_nodes(graph, surplus);
        }
    }

    // 6) everything else, keyed by the lower-cased kind
    for (const auto& rule : rules) {
        if (rule.kind != RuleKind::SCALAR) continue;
        if (const Value* val = find_param(eff, rule.param_key)) {
            assign_input(graph, rule, *val);
        }
    }

    if (comfyflow_logger().should_log(spdlog::level::debug)) {
        nlohmann::json classes = nlohmann::json::object();
        for (const auto& [id, node] : graph.items()) {
            classes[id] = node.value("class_type", "");
        }
        COMFYFLOW_DEBUG("Workflow prepared: nodes={}, classes={}", graph.size(), classes.dump());
    }
    return graph;
}

} // namespace comfyflow
