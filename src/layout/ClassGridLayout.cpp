#include "charta/layout/ClassGridLayout.h"
#include "charta/layout/SugiyamaLayout.h"
#include "charta/common/Logger.h"
#include "charta/core/Graph.h"
#include "charta/core/TextUtils.h"
#include "sugiyama/routing/EdgeRouting.h"

#include <algorithm>
#include <cstdlib>

namespace charta {

using algorithms::EdgeRouting;

ClassGridLayout::ClassGridLayout(const LayoutOptions& options) {
    setOptions(options);
}

void ClassGridLayout::setOptions(const LayoutOptions& options) {
    SugiyamaLayout::validateOptions(options);
    options_ = options;
}

bool ClassGridLayout::isMethod(std::string_view member) {
    return member.find('(') != std::string_view::npos;
}

std::vector<std::string> ClassGridLayout::compartmentLines(const NodeRecord& node) {
    std::vector<std::string> lines = text::splitLines(node.displayLabel());
    if (lines.empty()) return {node.id};

    lines.erase(std::remove_if(lines.begin() + 1, lines.end(),
                               [](const std::string& line) {
                                   return line.find_first_not_of(' ') == std::string::npos;
                               }),
                lines.end());
    std::stable_partition(lines.begin() + 1, lines.end(),
                          [](const std::string& line) { return !isMethod(line); });
    return lines;
}

Size ClassGridLayout::boxSize(const std::vector<std::string>& lines) {
    int textWidth = 0;
    int attributes = 0;
    int methods = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        textWidth = std::max(textWidth, text::displayWidth(lines[i]));
        if (i == 0) continue;
        if (isMethod(lines[i])) {
            ++methods;
        } else {
            ++attributes;
        }
    }

    int height = 3;
    if (attributes > 0) height += 1 + attributes;
    if (methods > 0) height += 1 + methods;
    return {textWidth + 4, height};
}

LayoutResult ClassGridLayout::layout(const Graph& graph) {
    graph.validate();

    LayoutResult result;
    result.setDirection(Direction::TopDown);
    if (graph.empty()) {
        LOG_DEBUG("Empty class diagram, nothing to lay out");
        return result;
    }

    const size_t count = graph.nodeCount();
    std::vector<Rect> boxes(count);
    std::vector<int> rowOf(count, 0);
    std::vector<int> columnOf(count, 0);
    std::vector<int> rowTop;
    std::vector<int> rowBottom;

    int y = 0;
    int x = 0;
    int rowHeight = 0;
    for (NodeId node : graph.nodes()) {
        int column = static_cast<int>(node) % CLASSES_PER_ROW;
        if (column == 0) {
            if (!rowTop.empty()) {
                rowBottom.push_back(y + rowHeight);
                y += rowHeight + ROW_GAP;
            }
            rowTop.push_back(y);
            x = 0;
            rowHeight = 0;
        }

        const NodeRecord& record = graph.getNode(node);
        PositionedNode positioned;
        positioned.index = node;
        positioned.id = record.id;
        positioned.lines = compartmentLines(record);
        positioned.shape = NodeShape::Class;

        Size size = boxSize(positioned.lines);
        positioned.x = x;
        positioned.y = y;
        positioned.width = size.width;
        positioned.height = size.height;
        positioned.layer = static_cast<int>(rowTop.size()) - 1;
        positioned.order = column;
        result.addNode(positioned);

        boxes[node] = positioned.bounds();
        rowOf[node] = positioned.layer;
        columnOf[node] = column;
        x += size.width + COLUMN_GAP;
        rowHeight = std::max(rowHeight, size.height);
    }
    rowBottom.push_back(y + rowHeight);

    // Horizontal runs above a row stay one cell clear of its top border
    auto gapAbove = [&](int row) { return rowTop[row] - 2; };

    int nextLane = -LANE_SPACING;
    for (EdgeId edgeId : graph.edges()) {
        const EdgeRecord& edge = graph.getEdge(edgeId);
        const Rect& from = boxes[edge.fromNode];
        const Rect& to = boxes[edge.toNode];
        const int fromRow = rowOf[edge.fromNode];
        const int toRow = rowOf[edge.toNode];
        const int fromX = from.center().x;
        const int toX = to.center().x;

        PositionedEdge routed;
        routed.index = edgeId;
        routed.fromId = edge.from;
        routed.toId = edge.to;
        routed.kind = edge.kind;
        routed.label = edge.label;

        std::vector<GridPoint> path;
        if (edge.isSelfLoop()) {
            const int side = from.right() + 1;
            const int over = gapAbove(fromRow);
            path = {{from.right(), from.y + 1}, {side, from.y + 1}, {side, over},
                    {fromX, over}, {fromX, from.y - 1}};
            routed.sourceEdge = NodeEdge::Right;
            routed.targetEdge = NodeEdge::Top;
        } else if (fromRow == toRow &&
                   std::abs(columnOf[edge.fromNode] - columnOf[edge.toNode]) == 1) {
            const int nameRow = rowTop[fromRow] + 1;
            if (from.x < to.x) {
                path = {{from.right(), nameRow}, {to.x - 1, nameRow}};
                routed.sourceEdge = NodeEdge::Right;
                routed.targetEdge = NodeEdge::Left;
            } else {
                path = {{from.x - 1, nameRow}, {to.right(), nameRow}};
                routed.sourceEdge = NodeEdge::Left;
                routed.targetEdge = NodeEdge::Right;
            }
        } else if (fromRow == toRow) {
            const int over = gapAbove(fromRow);
            path = {{fromX, from.y - 1}, {fromX, over}, {toX, over}, {toX, to.y - 1}};
            routed.sourceEdge = NodeEdge::Top;
            routed.targetEdge = NodeEdge::Top;
        } else if (fromRow < toRow) {
            const int below = rowBottom[fromRow];
            path = {{fromX, from.bottom()}, {fromX, below}};
            if (toRow == fromRow + 1) {
                path.push_back({toX, below});
            } else {
                const int lane = nextLane;
                nextLane -= LANE_SPACING;
                path.push_back({lane, below});
                path.push_back({lane, gapAbove(toRow)});
                path.push_back({toX, gapAbove(toRow)});
            }
            path.push_back({toX, to.y - 1});
            routed.sourceEdge = NodeEdge::Bottom;
            routed.targetEdge = NodeEdge::Top;
        } else {
            const int above = gapAbove(fromRow);
            path = {{fromX, from.y - 1}, {fromX, above}};
            if (toRow == fromRow - 1) {
                path.push_back({toX, above});
            } else {
                // One row into the gap so the last run still ends vertically
                const int under = rowBottom[toRow] + 1;
                const int lane = nextLane;
                nextLane -= LANE_SPACING;
                path.push_back({lane, above});
                path.push_back({lane, under});
                path.push_back({toX, under});
            }
            path.push_back({toX, to.bottom()});
            routed.sourceEdge = NodeEdge::Top;
            routed.targetEdge = NodeEdge::Bottom;
        }

        routed.waypoints = EdgeRouting::removeDuplicates(path);
        if (routed.label && routed.waypoints.size() >= 2) {
            routed.labelPosition = EdgeRouting::labelPoint(routed.waypoints);
        }
        result.addEdge(routed);
    }

    result.setLayerCount(static_cast<int>(rowTop.size()));
    result.fitToPadding(options_.padding);

    LOG_INFO("Laid out {} classes in {} rows, {}x{} cells",
             count, rowTop.size(), result.width(), result.height());
    return result;
}

}  // namespace charta
