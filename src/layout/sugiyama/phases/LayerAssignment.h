#pragma once

#include "charta/layout/ILayerAssignment.h"

#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// Longest-path layer assignment
///
/// Default implementation of ILayerAssignment. Nodes without incoming
/// (non-excluded) edges sit on layer 0; every other node sits one layer
/// below its deepest predecessor. Computed with a Kahn traversal, so each
/// disconnected component starts at its own layer 0.
///
/// The initial order inside a layer follows first appearance in the edge
/// list; nodes mentioned by no edge follow in insertion order.
class LongestPathLayerAssignment : public ILayerAssignment {
public:
    using Result = LayerAssignmentResult;

    LongestPathLayerAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    LayerAssignmentResult assignLayers(
        const Graph& graph,
        const std::unordered_set<EdgeId>& excludedEdges) const override;

    /// Node indices ordered by first appearance in the edge list
    static std::vector<NodeId> appearanceOrder(const Graph& graph);
};

using LayerAssignment = LongestPathLayerAssignment;

}  // namespace algorithms
}  // namespace charta
