#pragma once

#include "charta/core/Graph.h"
#include "charta/layout/ICoordinateAssignment.h"
#include "charta/layout/config/LayoutResult.h"

#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// Routes edges orthogonally in canonical orientation (flow along +y).
///
/// Every path starts on the first cell past the source's exit border and
/// ends on the cell before the target's entry border (one more cell of
/// standoff for cylinders), so the last segment always runs along the flow.
///
/// - A lone outgoing edge is straight or a single L bend.
/// - Edges of a source with several outgoing edges share a junction one
///   cell below the exit cell and branch from there.
/// - Back edges, self-loops and forward edges whose column is blocked by a
///   node take a detour lane right of the drawing.
class EdgeRouting {
public:
    /// Distance between detour lanes, and from the drawing to the first lane
    static constexpr int LANE_SPACING = 2;

    struct Result {
        std::vector<PositionedEdge> edges;   ///< Indexed by EdgeId, canonical coordinates
        int detourLanes = 0;
    };

    EdgeRouting() = default;

    /// @param graph Graph being laid out
    /// @param coords Canonical node boxes
    /// @param nodeLayer Layer of each node
    Result route(const Graph& graph,
                 const CoordinateAssignmentResult& coords,
                 const std::vector<int>& nodeLayer) const;

    /// Drop consecutive duplicate points
    static std::vector<GridPoint> removeDuplicates(const std::vector<GridPoint>& points);

    /// Cell at half the path length
    static GridPoint labelPoint(const std::vector<GridPoint>& path);

private:
    bool columnBlocked(const CoordinateAssignmentResult& coords,
                       const std::vector<std::vector<NodeId>>& byLayer,
                       int firstLayer, int lastLayer, int column,
                       int fromFlow, int toFlow) const;
};

}  // namespace algorithms
}  // namespace charta
