#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"

#include <vector>

namespace charta {
namespace algorithms {

/// Result of cycle removal operation
struct CycleRemovalResult {
    std::vector<EdgeId> excludedEdges;  ///< Edges left out of layering, ascending
    bool isAcyclic = false;             ///< True when nothing had to be excluded
};

/// Abstract interface for cycle removal algorithms
///
/// Excluded edges are only ignored while ranking nodes. They are still
/// routed and drawn.
class ICycleRemoval {
public:
    virtual ~ICycleRemoval() = default;

    /// Find the edges to exclude so the remaining graph is acyclic.
    /// Does not modify the graph.
    virtual CycleRemovalResult findExcludedEdges(const Graph& graph) const = 0;

    /// Check if graph has cycles (self-loops count)
    virtual bool hasCycles(const Graph& graph) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace charta
