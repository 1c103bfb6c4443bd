#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"
#include "config/LayoutOptions.h"

#include <vector>

namespace charta {
namespace algorithms {

/// Result of coordinate assignment, in canonical orientation:
/// x is the cross axis, y is the flow axis.
struct CoordinateAssignmentResult {
    std::vector<Rect> boxes;        ///< Indexed by NodeId
    std::vector<int> layerStart;    ///< Flow coordinate of each layer
    std::vector<int> layerExtent;   ///< Flow extent of each layer
    int crossExtent = 0;            ///< Width of the widest layer
    int flowExtent = 0;             ///< End of the last layer
};

/// Abstract interface for coordinate assignment algorithms
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    /// Place nodes given their canonical sizes (width = cross, height = flow)
    /// @param graph The input graph
    /// @param layers Ordered layers from crossing minimization
    /// @param canonicalSizes Normalized size of each node, indexed by NodeId
    /// @param options Layout options (spacing)
    virtual CoordinateAssignmentResult assign(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& layers,
        const std::vector<Size>& canonicalSizes,
        const LayoutOptions& options) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace charta
