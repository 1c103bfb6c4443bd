#include "NodeSizing.h"
#include "charta/core/TextUtils.h"
#include "charta/layout/ClassGridLayout.h"

#include <algorithm>

namespace charta {
namespace algorithms {

Size NodeSizing::shapePadding(NodeShape shape) {
    switch (shape) {
        case NodeShape::Rectangle:
        case NodeShape::Rounded:
        case NodeShape::Circle:
            return {4, 0};
        case NodeShape::Subroutine:
            return {6, 0};
        case NodeShape::Diamond:
            return {6, 2};
        case NodeShape::Hexagon:
        case NodeShape::Asymmetric:
        case NodeShape::Parallelogram:
        case NodeShape::Trapezoid:
            return {6, 0};
        case NodeShape::Cylinder:
            return {4, 2};
        case NodeShape::Terminal:
        case NodeShape::Commit:
        case NodeShape::Class:
            return {0, 0};
    }
    return {4, 0};
}

NodeMetrics NodeSizing::measure(const NodeRecord& node) const {
    NodeMetrics metrics;

    if (node.shape == NodeShape::Terminal) {
        metrics.size = {3, 1};
        return metrics;
    }
    if (node.shape == NodeShape::Commit) {
        metrics.lines = {node.displayLabel()};
        metrics.size = {1, 1};
        return metrics;
    }
    if (node.shape == NodeShape::Class) {
        metrics.lines = ClassGridLayout::compartmentLines(node);
        metrics.size = ClassGridLayout::boxSize(metrics.lines);
        return metrics;
    }

    metrics.lines = text::wrapLabel(node.displayLabel(), options_.maxLabelWidth);

    int textWidth = 0;
    for (const auto& line : metrics.lines) {
        textWidth = std::max(textWidth, text::displayWidth(line));
    }

    Size padding = shapePadding(node.shape);
    int width = textWidth + padding.width;
    int height = 2 + static_cast<int>(metrics.lines.size()) + padding.height;

    metrics.size = {std::max(width, options_.minNodeWidth),
                    std::max(height, options_.minNodeHeight)};
    return metrics;
}

void NodeSizing::normalizeLayers(std::vector<Size>& sizes,
                                 const std::vector<std::vector<NodeId>>& layers,
                                 Direction direction) {
    bool vertical = isVertical(direction);

    for (const auto& layer : layers) {
        int extent = 0;
        for (NodeId node : layer) {
            extent = std::max(extent, vertical ? sizes[node].height : sizes[node].width);
        }
        for (NodeId node : layer) {
            if (vertical) {
                sizes[node].height = extent;
            } else {
                sizes[node].width = extent;
            }
        }
    }
}

}  // namespace algorithms
}  // namespace charta
