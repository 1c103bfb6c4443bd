#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"
#include "config/LayoutOptions.h"

#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// Result of crossing minimization operation
struct CrossingMinimizationResult {
    std::vector<std::vector<NodeId>> layers;  ///< Reordered layers
    int crossingCount = 0;                     ///< Crossings between adjacent layers
};

/// Abstract interface for crossing minimization algorithms
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// Reorder nodes within layers to reduce crossings
    /// @param graph The input graph
    /// @param layers Initial layer order (will be reordered)
    /// @param excludedEdges Edges ignored for ordering
    /// @param strategy Strategy hint (None keeps the initial order)
    /// @param passes Maximum number of down+up sweep pairs
    virtual CrossingMinimizationResult minimize(
        const Graph& graph,
        std::vector<std::vector<NodeId>> layers,
        const std::unordered_set<EdgeId>& excludedEdges,
        charta::CrossingMinimization strategy,
        int passes) const = 0;

    /// Count edge crossings between two adjacent layers
    virtual int countCrossings(
        const Graph& graph,
        const std::vector<NodeId>& upperLayer,
        const std::vector<NodeId>& lowerLayer,
        const std::unordered_set<EdgeId>& excludedEdges) const = 0;

    /// Count total crossings over all adjacent layer pairs
    virtual int countTotalCrossings(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& layers,
        const std::unordered_set<EdgeId>& excludedEdges) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace charta
