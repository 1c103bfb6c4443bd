#pragma once

#include "../../core/Types.h"
#include "LayoutEnums.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace charta {

/// Positioned node in the layout result
struct PositionedNode {
    NodeId index = INVALID_NODE;
    std::string id;
    std::vector<std::string> lines;   // Label lines, already wrapped
    NodeShape shape = NodeShape::Rectangle;
    int x = 0;                        // Top-left, cells
    int y = 0;
    int width = 1;
    int height = 1;
    int layer = 0;                    // Layer index along the flow axis
    int order = 0;                    // Order within layer

    Rect bounds() const { return {x, y, width, height}; }
    GridPoint center() const { return {x + width / 2, y + height / 2}; }
};

/// Positioned edge in the layout result
struct PositionedEdge {
    EdgeId index = INVALID_EDGE;
    std::string fromId;
    std::string toId;
    EdgeKind kind = EdgeKind::Arrow;
    std::optional<std::string> label;

    /// Path from the cell just outside the source's exit border to the cell
    /// just outside the target's entry border (or its standoff cell)
    std::vector<GridPoint> waypoints;

    NodeEdge sourceEdge = NodeEdge::Bottom;
    NodeEdge targetEdge = NodeEdge::Top;

    std::optional<GridPoint> junction;   // Shared by every edge of a fan-out group
    std::optional<int> groupIndex;
    std::optional<int> groupSize;

    std::optional<GridPoint> labelPosition;  // Path midpoint

    bool excluded = false;   // Dropped from layering to break a cycle

    /// Iterate over all segments
    /// @param callback Function called for each segment (p1, p2) in order
    template<typename Func>
    void forEachSegment(Func&& callback) const {
        for (size_t i = 1; i < waypoints.size(); ++i) {
            callback(waypoints[i - 1], waypoints[i]);
        }
    }

    size_t segmentCount() const {
        return waypoints.size() < 2 ? 0 : waypoints.size() - 1;
    }

    /// Sum of segment lengths in cells
    int pathLength() const;
};

/// Bounding box of a subgraph
struct PositionedGroup {
    std::string id;
    std::string title;
    std::vector<std::string> members;
    Rect bounds;
};

enum class LayoutWarningKind {
    CycleExcluded
};

/// Non-fatal condition reported alongside a successful layout
struct LayoutWarning {
    LayoutWarningKind kind = LayoutWarningKind::CycleExcluded;
    EdgeId edge = INVALID_EDGE;
    std::string from;
    std::string to;
    std::string message;
};

/// Cells taken by the label of a Commit node: right of the glyph when the
/// flow is vertical, centered below it otherwise. Empty without a label.
Rect commitLabelBounds(const PositionedNode& node, Direction direction);

/// Complete layout result for a graph.
/// Self-contained: the renderer needs nothing but this.
class LayoutResult {
public:
    LayoutResult() = default;

    // Node operations
    void addNode(const PositionedNode& node);
    const PositionedNode* getNode(const std::string& id) const;
    PositionedNode* getNode(const std::string& id);
    const std::vector<PositionedNode>& nodes() const { return nodes_; }
    size_t nodeCount() const { return nodes_.size(); }

    // Edge operations
    void addEdge(const PositionedEdge& edge);
    const PositionedEdge* getEdge(EdgeId index) const;
    const std::vector<PositionedEdge>& edges() const { return edges_; }
    std::vector<const PositionedEdge*> edgesFrom(const std::string& id) const;
    std::vector<const PositionedEdge*> edgesTo(const std::string& id) const;
    size_t edgeCount() const { return edges_.size(); }

    // Groups
    void addGroup(const PositionedGroup& group) { groups_.push_back(group); }
    const std::vector<PositionedGroup>& groups() const { return groups_; }

    // Warnings
    void addWarning(const LayoutWarning& warning) { warnings_.push_back(warning); }
    const std::vector<LayoutWarning>& warnings() const { return warnings_; }

    // Canvas extent
    int width() const { return width_; }
    int height() const { return height_; }
    void setSize(int width, int height) {
        width_ = width;
        height_ = height;
    }

    int layerCount() const { return layerCount_; }
    void setLayerCount(int count) { layerCount_ = count; }

    Direction direction() const { return direction_; }
    void setDirection(Direction d) { direction_ = d; }

    bool empty() const { return nodes_.empty(); }

    /// Smallest rectangle covering nodes, waypoints, junctions, groups and labels
    Rect computeBounds() const;

    /// Shift every coordinate by (dx, dy)
    void translate(int dx, int dy);

    /// Move the drawing so its bounds start at (padding, padding) and size
    /// the canvas to fit
    void fitToPadding(int padding);

    void clear();

    // JSON serialization (via LayoutSerializer)
    std::string toJson() const;
    static LayoutResult fromJson(const std::string& json);

private:
    std::vector<PositionedNode> nodes_;
    std::unordered_map<std::string, size_t> nodeIndex_;
    std::vector<PositionedEdge> edges_;
    std::vector<PositionedGroup> groups_;
    std::vector<LayoutWarning> warnings_;
    int width_ = 0;
    int height_ = 0;
    int layerCount_ = 0;
    Direction direction_ = Direction::TopDown;
};

}  // namespace charta
