#pragma once

#include "charta/layout/ICycleRemoval.h"

#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// DFS-based cycle removal algorithm
///
/// Default implementation of ICycleRemoval. Nodes are visited from the
/// sources first, then in insertion order; out-edges are followed in
/// insertion order. An edge reaching a node still on the DFS stack is a
/// back edge and is excluded. Self-loops are always excluded.
class CycleRemoval : public ICycleRemoval {
public:
    using Result = CycleRemovalResult;

    CycleRemoval() = default;

    const char* algorithmName() const override { return "DFS"; }

    CycleRemovalResult findExcludedEdges(const Graph& graph) const override;

    bool hasCycles(const Graph& graph) const override;

private:
    enum class NodeState { White, Gray, Black };

    struct Frame {
        NodeId node;
        size_t nextEdge;   ///< Next out-edge to follow
    };

    void dfs(NodeId root, const Graph& graph,
             std::vector<NodeState>& state,
             std::unordered_set<EdgeId>& backEdges) const;
};

}  // namespace algorithms
}  // namespace charta
