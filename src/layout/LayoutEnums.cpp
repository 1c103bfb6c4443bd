#include "charta/layout/config/LayoutEnums.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace charta {

namespace {

std::string normalized(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::pair<NodeShape, const char*>, 13> SHAPE_NAMES = {{
    {NodeShape::Rectangle, "rectangle"},
    {NodeShape::Rounded, "rounded"},
    {NodeShape::Diamond, "diamond"},
    {NodeShape::Circle, "circle"},
    {NodeShape::Hexagon, "hexagon"},
    {NodeShape::Subroutine, "subroutine"},
    {NodeShape::Cylinder, "cylinder"},
    {NodeShape::Asymmetric, "asymmetric"},
    {NodeShape::Parallelogram, "parallelogram"},
    {NodeShape::Trapezoid, "trapezoid"},
    {NodeShape::Terminal, "terminal"},
    {NodeShape::Commit, "commit"},
    {NodeShape::Class, "class"},
}};

constexpr std::array<std::pair<EdgeKind, const char*>, 9> EDGE_KIND_NAMES = {{
    {EdgeKind::Arrow, "arrow"},
    {EdgeKind::Line, "line"},
    {EdgeKind::DottedArrow, "dotted-arrow"},
    {EdgeKind::DottedLine, "dotted-line"},
    {EdgeKind::ThickArrow, "thick-arrow"},
    {EdgeKind::ThickLine, "thick-line"},
    {EdgeKind::Invisible, "invisible"},
    {EdgeKind::OpenArrow, "open-arrow"},
    {EdgeKind::CrossArrow, "cross-arrow"},
}};

}  // namespace

const char* directionName(Direction d) {
    switch (d) {
        case Direction::TopDown: return "TD";
        case Direction::BottomUp: return "BT";
        case Direction::LeftRight: return "LR";
        case Direction::RightLeft: return "RL";
    }
    return "TD";
}

std::optional<Direction> parseDirection(std::string_view text) {
    std::string key = normalized(text);
    if (key == "td" || key == "tb") return Direction::TopDown;
    if (key == "bt") return Direction::BottomUp;
    if (key == "lr") return Direction::LeftRight;
    if (key == "rl") return Direction::RightLeft;
    return std::nullopt;
}

NodeEdge exitBorder(Direction d) {
    switch (d) {
        case Direction::TopDown: return NodeEdge::Bottom;
        case Direction::BottomUp: return NodeEdge::Top;
        case Direction::LeftRight: return NodeEdge::Right;
        case Direction::RightLeft: return NodeEdge::Left;
    }
    return NodeEdge::Bottom;
}

NodeEdge entryBorder(Direction d) {
    switch (d) {
        case Direction::TopDown: return NodeEdge::Top;
        case Direction::BottomUp: return NodeEdge::Bottom;
        case Direction::LeftRight: return NodeEdge::Left;
        case Direction::RightLeft: return NodeEdge::Right;
    }
    return NodeEdge::Top;
}

const char* shapeName(NodeShape shape) {
    for (const auto& [value, name] : SHAPE_NAMES) {
        if (value == shape) return name;
    }
    return "rectangle";
}

std::optional<NodeShape> parseNodeShape(std::string_view text) {
    std::string key = normalized(text);
    for (const auto& [value, name] : SHAPE_NAMES) {
        if (key == name) return value;
    }
    return std::nullopt;
}

const char* edgeKindName(EdgeKind kind) {
    for (const auto& [value, name] : EDGE_KIND_NAMES) {
        if (value == kind) return name;
    }
    return "arrow";
}

std::optional<EdgeKind> parseEdgeKind(std::string_view text) {
    std::string key = normalized(text);
    for (const auto& [value, name] : EDGE_KIND_NAMES) {
        if (key == name) return value;
    }
    return std::nullopt;
}

}  // namespace charta
