#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace charta {

/// Flow direction of a layered drawing
enum class Direction {
    TopDown,     // Sources at top, sinks at bottom
    BottomUp,    // Sources at bottom, sinks at top
    LeftRight,   // Sources at left, sinks at right
    RightLeft    // Sources at right, sinks at left
};

/// Which border of a node box an edge leaves or enters through
enum class NodeEdge {
    Top,
    Bottom,
    Left,
    Right
};

/// Node outline
enum class NodeShape {
    Rectangle,
    Rounded,
    Diamond,
    Circle,
    Hexagon,
    Subroutine,
    Cylinder,
    Asymmetric,
    Parallelogram,
    Trapezoid,
    Terminal,     // Start/end marker of a state diagram
    Commit,       // Single glyph of a commit graph, label beside it
    Class         // Class box with attribute and method compartments
};

/// Edge line style and head
enum class EdgeKind {
    Arrow,
    Line,
    DottedArrow,
    DottedLine,
    ThickArrow,
    ThickLine,
    Invisible,
    OpenArrow,    // Circle head
    CrossArrow    // Cross head
};

// === Direction ===

const char* directionName(Direction d);

/// Accepts TD, TB, BT, LR, RL (case-insensitive)
std::optional<Direction> parseDirection(std::string_view text);

inline bool isVertical(Direction d) {
    return d == Direction::TopDown || d == Direction::BottomUp;
}
inline bool isHorizontal(Direction d) { return !isVertical(d); }

/// True for directions computed canonically and then reflected
inline bool isReversed(Direction d) {
    return d == Direction::BottomUp || d == Direction::RightLeft;
}

NodeEdge exitBorder(Direction d);
NodeEdge entryBorder(Direction d);

// === NodeShape ===

const char* shapeName(NodeShape shape);
std::optional<NodeShape> parseNodeShape(std::string_view text);

// === EdgeKind ===

const char* edgeKindName(EdgeKind kind);
std::optional<EdgeKind> parseEdgeKind(std::string_view text);

inline bool hasArrowHead(EdgeKind k) {
    return k == EdgeKind::Arrow || k == EdgeKind::DottedArrow ||
           k == EdgeKind::ThickArrow || k == EdgeKind::OpenArrow ||
           k == EdgeKind::CrossArrow;
}
inline bool isDotted(EdgeKind k) {
    return k == EdgeKind::DottedArrow || k == EdgeKind::DottedLine;
}
inline bool isThick(EdgeKind k) {
    return k == EdgeKind::ThickArrow || k == EdgeKind::ThickLine;
}
inline bool isInvisible(EdgeKind k) { return k == EdgeKind::Invisible; }

}  // namespace charta
