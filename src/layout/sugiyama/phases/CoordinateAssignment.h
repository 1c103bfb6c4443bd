#pragma once

#include "charta/layout/ICoordinateAssignment.h"

#include <vector>

namespace charta {
namespace algorithms {

/// Canonical coordinate assignment
///
/// Default implementation of ICoordinateAssignment. Layers stack along the
/// flow axis separated by the effective rank spacing; nodes in a layer are
/// packed along the cross axis and each layer is centered on the widest
/// one, so a chain of single nodes shares one center column. The gap grows
/// by 2 cells where subgraph membership changes, leaving room for the
/// group border. A group's cross span is then kept clear of non-members in
/// every layer between its first and last member, so its box never covers
/// an outsider.
class CanonicalCoordinateAssignment : public ICoordinateAssignment {
public:
    using Result = CoordinateAssignmentResult;

    /// Extra gap at a subgraph membership boundary
    static constexpr int GROUP_GAP = 2;

    CanonicalCoordinateAssignment() = default;

    const char* algorithmName() const override { return "Canonical"; }

    CoordinateAssignmentResult assign(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& layers,
        const std::vector<Size>& canonicalSizes,
        const LayoutOptions& options) const override;

private:
    int gapBetween(const Graph& graph, NodeId left, NodeId right,
                   const LayoutOptions& options) const;

    /// Shift non-members out of each group's span, left or right by their
    /// side of the group's block
    void clearGroupSpans(const Graph& graph,
                         const std::vector<std::vector<NodeId>>& layers,
                         CoordinateAssignmentResult& result,
                         const LayoutOptions& options) const;
};

using CoordinateAssignment = CanonicalCoordinateAssignment;

/// Maps canonical (cross, flow) geometry to screen coordinates.
///
///   TD: (cross, flow)        BT: (cross, F-1-flow)
///   LR: (flow, cross)        RL: (F-1-flow, cross)
///
/// where F is the canonical flow extent. Boxes are reflected by their far
/// edge so they keep covering the same cells.
class DirectionTransform {
public:
    DirectionTransform(Direction direction, int flowExtent)
        : direction_(direction), flowExtent_(flowExtent) {}

    Direction direction() const { return direction_; }

    /// Screen size to canonical (cross, flow) size
    static Size toCanonical(Size size, Direction direction);

    GridPoint mapPoint(const GridPoint& canonical) const;
    Rect mapBox(const Rect& canonical) const;

private:
    Direction direction_;
    int flowExtent_;
};

}  // namespace algorithms
}  // namespace charta
