#include "CoordinateAssignment.h"
#include "charta/common/Logger.h"

#include <algorithm>
#include <climits>
#include <optional>

namespace charta {
namespace algorithms {

CoordinateAssignmentResult CanonicalCoordinateAssignment::assign(
    const Graph& graph,
    const std::vector<std::vector<NodeId>>& layers,
    const std::vector<Size>& canonicalSizes,
    const LayoutOptions& options) const {

    CoordinateAssignmentResult result;
    result.boxes.resize(graph.nodeCount());

    if (layers.empty()) {
        return result;
    }

    const int rankSpacing = options.effectiveRankSpacing();

    // Flow positions: layer k starts after every earlier layer plus spacing
    int flow = 0;
    for (const auto& layer : layers) {
        int extent = 0;
        for (NodeId node : layer) {
            extent = std::max(extent, canonicalSizes[node].height);
        }
        result.layerStart.push_back(flow);
        result.layerExtent.push_back(extent);
        flow += extent + rankSpacing;
    }
    result.flowExtent = result.layerStart.back() + result.layerExtent.back();

    // Cross totals per layer
    std::vector<int> totals;
    totals.reserve(layers.size());
    for (const auto& layer : layers) {
        int total = 0;
        for (size_t i = 0; i < layer.size(); ++i) {
            total += canonicalSizes[layer[i]].width;
            if (i > 0) {
                total += gapBetween(graph, layer[i - 1], layer[i], options);
            }
        }
        totals.push_back(total);
    }
    result.crossExtent = *std::max_element(totals.begin(), totals.end());
    const int centerLine = result.crossExtent / 2;

    for (size_t k = 0; k < layers.size(); ++k) {
        const auto& layer = layers[k];
        int cross = centerLine - totals[k] / 2;

        for (size_t i = 0; i < layer.size(); ++i) {
            NodeId node = layer[i];
            if (i > 0) {
                cross += gapBetween(graph, layer[i - 1], node, options);
            }
            const Size& size = canonicalSizes[node];
            result.boxes[node] = Rect{cross, result.layerStart[k], size.width, size.height};
            cross += size.width;
        }
    }

    if (!graph.subgraphs().empty()) {
        clearGroupSpans(graph, layers, result, options);
    }

    return result;
}

void CanonicalCoordinateAssignment::clearGroupSpans(
    const Graph& graph,
    const std::vector<std::vector<NodeId>>& layers,
    CoordinateAssignmentResult& result,
    const LayoutOptions& options) const {

    const size_t groupCount = graph.subgraphs().size();
    const int clearance = options.nodeSpacing + GROUP_GAP;

    std::vector<std::optional<size_t>> groupOf(graph.nodeCount());
    for (NodeId node : graph.nodes()) {
        groupOf[node] = graph.subgraphOf(graph.getNode(node).id);
    }

    auto shift = [&](const std::vector<NodeId>& layer, size_t first, size_t last, int delta) {
        for (size_t i = first; i < last; ++i) {
            result.boxes[layer[i]].x += delta;
        }
    };

    // A shift can push another group's member into a third span, so repeat
    // until a full round moves nothing
    const size_t maxRounds = 2 * groupCount + 2;
    bool moved = true;
    size_t round = 0;
    for (; moved && round < maxRounds; ++round) {
        moved = false;

        for (size_t g = 0; g < groupCount; ++g) {
            int spanLeft = INT_MAX;
            int spanRight = INT_MIN;
            size_t firstLayer = layers.size();
            size_t lastLayer = 0;

            for (size_t k = 0; k < layers.size(); ++k) {
                for (NodeId node : layers[k]) {
                    if (groupOf[node] != g) continue;
                    const Rect& box = result.boxes[node];
                    spanLeft = std::min(spanLeft, box.x);
                    spanRight = std::max(spanRight, box.right());
                    firstLayer = std::min(firstLayer, k);
                    lastLayer = std::max(lastLayer, k);
                }
            }
            if (firstLayer > lastLayer) continue;

            const int keepLeftOf = spanLeft - clearance;
            const int keepRightOf = spanRight + clearance;

            for (size_t k = firstLayer; k <= lastLayer; ++k) {
                const auto& layer = layers[k];

                // Members of one group are contiguous within a layer
                std::optional<size_t> blockStart;
                for (size_t i = 0; i < layer.size(); ++i) {
                    if (groupOf[layer[i]] == g) {
                        blockStart = i;
                        break;
                    }
                }

                std::optional<size_t> lastLeft;
                std::optional<size_t> firstRight;
                for (size_t i = 0; i < layer.size(); ++i) {
                    if (groupOf[layer[i]] == g) continue;
                    const Rect& box = result.boxes[layer[i]];
                    if (box.right() <= keepLeftOf || box.x >= keepRightOf) continue;

                    bool leftSide = blockStart
                        ? i < *blockStart
                        : 2 * box.center().x < spanLeft + spanRight;
                    if (leftSide) {
                        lastLeft = i;
                    } else if (!firstRight) {
                        firstRight = i;
                    }
                }

                if (lastLeft) {
                    int delta = keepLeftOf - result.boxes[layer[*lastLeft]].right();
                    shift(layer, 0, *lastLeft + 1, delta);
                    moved = true;
                }
                if (firstRight) {
                    int delta = keepRightOf - result.boxes[layer[*firstRight]].x;
                    shift(layer, *firstRight, layer.size(), delta);
                    moved = true;
                }
            }
        }
    }

    if (moved) {
        LOG_WARN("Group spans still overlap non-member nodes after {} rounds", round);
    }

    // Shifts may have widened the drawing on either side
    int minCross = INT_MAX;
    int maxCross = INT_MIN;
    for (const auto& layer : layers) {
        for (NodeId node : layer) {
            minCross = std::min(minCross, result.boxes[node].x);
            maxCross = std::max(maxCross, result.boxes[node].right());
        }
    }
    if (minCross != 0) {
        for (Rect& box : result.boxes) {
            box.x -= minCross;
        }
    }
    result.crossExtent = maxCross - minCross;
}

int CanonicalCoordinateAssignment::gapBetween(const Graph& graph, NodeId left, NodeId right,
                                              const LayoutOptions& options) const {
    if (graph.subgraphs().empty()) {
        return options.nodeSpacing;
    }
    auto leftGroup = graph.subgraphOf(graph.getNode(left).id);
    auto rightGroup = graph.subgraphOf(graph.getNode(right).id);
    if (leftGroup != rightGroup) {
        return options.nodeSpacing + GROUP_GAP;
    }
    return options.nodeSpacing;
}

// =============================================================================
// DirectionTransform
// =============================================================================

Size DirectionTransform::toCanonical(Size size, Direction direction) {
    if (isVertical(direction)) {
        return size;
    }
    return {size.height, size.width};
}

GridPoint DirectionTransform::mapPoint(const GridPoint& p) const {
    switch (direction_) {
        case Direction::TopDown:   return {p.x, p.y};
        case Direction::BottomUp:  return {p.x, flowExtent_ - 1 - p.y};
        case Direction::LeftRight: return {p.y, p.x};
        case Direction::RightLeft: return {flowExtent_ - 1 - p.y, p.x};
    }
    return p;
}

Rect DirectionTransform::mapBox(const Rect& r) const {
    // Far edge of the canonical box lands on the near side after reflection
    int reflected = flowExtent_ - (r.y + r.height);
    switch (direction_) {
        case Direction::TopDown:   return r;
        case Direction::BottomUp:  return {r.x, reflected, r.width, r.height};
        case Direction::LeftRight: return {r.y, r.x, r.height, r.width};
        case Direction::RightLeft: return {reflected, r.x, r.height, r.width};
    }
    return r;
}

}  // namespace algorithms
}  // namespace charta
