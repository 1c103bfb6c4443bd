#include "LayerAssignment.h"

#include <algorithm>
#include <queue>
#include <stdexcept>

namespace charta {
namespace algorithms {

std::vector<NodeId> LongestPathLayerAssignment::appearanceOrder(const Graph& graph) {
    std::vector<NodeId> order;
    std::vector<bool> seen(graph.nodeCount(), false);
    order.reserve(graph.nodeCount());

    auto visit = [&](NodeId node) {
        if (node != INVALID_NODE && !seen[node]) {
            seen[node] = true;
            order.push_back(node);
        }
    };

    for (EdgeId edgeId : graph.edges()) {
        const EdgeRecord& edge = graph.getEdge(edgeId);
        visit(edge.fromNode);
        visit(edge.toNode);
    }
    for (NodeId node : graph.nodes()) {
        visit(node);
    }
    return order;
}

LayerAssignmentResult LongestPathLayerAssignment::assignLayers(
    const Graph& graph,
    const std::unordered_set<EdgeId>& excludedEdges) const {

    LayerAssignmentResult result;

    size_t nodeCount = graph.nodeCount();
    if (nodeCount == 0) {
        return result;
    }

    std::vector<int> pending(nodeCount, 0);
    for (NodeId node : graph.nodes()) {
        for (EdgeId edgeId : graph.inEdges(node)) {
            if (excludedEdges.count(edgeId) == 0) {
                ++pending[node];
            }
        }
    }

    result.nodeLayer.assign(nodeCount, 0);

    std::queue<NodeId> ready;
    for (NodeId node : graph.nodes()) {
        if (pending[node] == 0) {
            ready.push(node);
        }
    }

    size_t visited = 0;
    while (!ready.empty()) {
        NodeId current = ready.front();
        ready.pop();
        ++visited;

        for (EdgeId edgeId : graph.outEdges(current)) {
            if (excludedEdges.count(edgeId) > 0) {
                continue;
            }
            NodeId successor = graph.getEdge(edgeId).toNode;
            result.nodeLayer[successor] =
                std::max(result.nodeLayer[successor], result.nodeLayer[current] + 1);
            if (--pending[successor] == 0) {
                ready.push(successor);
            }
        }
    }

    if (visited != nodeCount) {
        throw std::logic_error("Layer assignment requires an acyclic graph after exclusion");
    }

    result.layerCount = *std::max_element(result.nodeLayer.begin(), result.nodeLayer.end()) + 1;
    result.layers.resize(result.layerCount);

    for (NodeId node : appearanceOrder(graph)) {
        result.layers[result.nodeLayer[node]].push_back(node);
    }

    return result;
}

}  // namespace algorithms
}  // namespace charta
