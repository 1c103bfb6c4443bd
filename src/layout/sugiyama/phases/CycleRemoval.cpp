#include "CycleRemoval.h"

#include <algorithm>

namespace charta {
namespace algorithms {

CycleRemovalResult CycleRemoval::findExcludedEdges(const Graph& graph) const {
    Result result;
    result.isAcyclic = true;

    std::vector<NodeId> nodes = graph.nodes();
    if (nodes.empty()) {
        return result;
    }

    std::vector<NodeState> state(nodes.size(), NodeState::White);
    std::unordered_set<EdgeId> backEdges;

    // Sources first so that a cycle hanging off a chain breaks at its far end
    std::vector<NodeId> order;
    std::vector<bool> queued(nodes.size(), false);
    order.reserve(nodes.size());
    for (NodeId node : nodes) {
        bool hasIncoming = false;
        for (EdgeId edgeId : graph.inEdges(node)) {
            if (!graph.getEdge(edgeId).isSelfLoop()) {
                hasIncoming = true;
                break;
            }
        }
        if (!hasIncoming) {
            order.push_back(node);
            queued[node] = true;
        }
    }
    for (NodeId node : nodes) {
        if (!queued[node]) {
            order.push_back(node);
        }
    }

    for (NodeId node : order) {
        if (state[node] == NodeState::White) {
            dfs(node, graph, state, backEdges);
        }
    }

    result.excludedEdges.assign(backEdges.begin(), backEdges.end());
    std::sort(result.excludedEdges.begin(), result.excludedEdges.end());
    result.isAcyclic = backEdges.empty();

    return result;
}

bool CycleRemoval::hasCycles(const Graph& graph) const {
    return !findExcludedEdges(graph).isAcyclic;
}

void CycleRemoval::dfs(NodeId root, const Graph& graph,
                       std::vector<NodeState>& state,
                       std::unordered_set<EdgeId>& backEdges) const {
    // Explicit stack: chains can be far deeper than the call stack allows
    std::vector<Frame> stack;
    state[root] = NodeState::Gray;
    stack.push_back({root, 0});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        const auto& outgoing = graph.outEdges(frame.node);

        if (frame.nextEdge == outgoing.size()) {
            state[frame.node] = NodeState::Black;
            stack.pop_back();
            continue;
        }

        EdgeId edgeId = outgoing[frame.nextEdge++];
        NodeId successor = graph.getEdge(edgeId).toNode;

        if (state[successor] == NodeState::Gray) {
            // Covers self-loops too: the node itself is Gray
            backEdges.insert(edgeId);
        } else if (state[successor] == NodeState::White) {
            state[successor] = NodeState::Gray;
            stack.push_back({successor, 0});
        }
    }
}

}  // namespace algorithms
}  // namespace charta
