#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"

#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// Result of layer assignment operation
struct LayerAssignmentResult {
    std::vector<int> nodeLayer;               ///< Indexed by NodeId
    int layerCount = 0;                       ///< Total number of layers
    std::vector<std::vector<NodeId>> layers;  ///< Layer -> nodes in initial order
};

/// Abstract interface for layer assignment algorithms
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    /// Assign every node a layer so each non-excluded edge points to a
    /// strictly greater layer
    /// @param graph The input graph
    /// @param excludedEdges Edges ignored for ranking (cycle breakers)
    virtual LayerAssignmentResult assignLayers(
        const Graph& graph,
        const std::unordered_set<EdgeId>& excludedEdges) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace charta
