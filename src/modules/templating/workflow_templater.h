// modules/templating/workflow_templater.h
#ifndef COMFYFLOW_MODULES_TEMPLATING_WORKFLOW_TEMPLATER_H
#define COMFYFLOW_MODULES_TEMPLATING_WORKFLOW_TEMPLATER_H

#include "core/types/graph.h"
#include <cstdint>
#include <string>
#include <vector>

namespace comfyflow {

// Uniform in [0, 2^48 - 1]
uint64_t generate_seed();

class WorkflowTemplater {
public:
    // Build a concrete graph from a template. Never mutates its inputs.
    // Rules are applied in fixed passes:
    //   prompt -> negative_prompt -> text -> input_image -> input_images (with pruning) -> scalar
    // If params has no seed, one is generated once for the whole call.
    static NodeGraph render(const NodeGraph& graph_template,
                            const std::vector<NodeRule>& rules,
                            const std::string& prompt,
                            const ParameterSet& params);

    // Remove `ids` from the graph and delete every input of the remaining nodes
    // whose edge points at one of them.
    static void prune_nodes(NodeGraph& graph, const std::vector<NodeId>& ids);

private:
    static void assign_input(NodeGraph& graph, const NodeRule& rule, const Value& value);
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_TEMPLATING_WORKFLOW_TEMPLATER_H
