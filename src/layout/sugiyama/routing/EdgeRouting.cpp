#include "EdgeRouting.h"

#include <algorithm>
#include <tuple>

namespace charta {
namespace algorithms {

namespace {

int entryFlow(const NodeRecord& target, const Rect& box) {
    int standoff = target.shape == NodeShape::Cylinder ? 1 : 0;
    return box.y - 1 - standoff;
}

}  // namespace

EdgeRouting::Result EdgeRouting::route(const Graph& graph,
                                       const CoordinateAssignmentResult& coords,
                                       const std::vector<int>& nodeLayer) const {
    Result result;
    result.edges.resize(graph.edgeCount());

    int crossMax = 0;
    for (const Rect& box : coords.boxes) {
        crossMax = std::max(crossMax, box.right() - 1);
    }
    int nextLane = crossMax + LANE_SPACING;

    std::vector<std::vector<NodeId>> byLayer;
    for (NodeId node = 0; node < nodeLayer.size(); ++node) {
        size_t layer = static_cast<size_t>(nodeLayer[node]);
        if (layer >= byLayer.size()) byLayer.resize(layer + 1);
        byLayer[layer].push_back(node);
    }

    for (NodeId source : graph.nodes()) {
        const auto& outgoing = graph.outEdges(source);
        if (outgoing.empty()) continue;

        const Rect& sourceBox = coords.boxes[source];
        const int sx = sourceBox.center().x;
        const int exit = sourceBox.bottom();
        const bool fanOut = outgoing.size() > 1;
        const GridPoint start{sx, exit};
        const GridPoint junction{sx, exit + 1};
        const int departure = fanOut ? junction.y : exit;

        // Group order: target cross position, flow position, id
        std::vector<EdgeId> ordered(outgoing.begin(), outgoing.end());
        std::sort(ordered.begin(), ordered.end(), [&](EdgeId a, EdgeId b) {
            const EdgeRecord& ea = graph.getEdge(a);
            const EdgeRecord& eb = graph.getEdge(b);
            const Rect& ba = coords.boxes[ea.toNode];
            const Rect& bb = coords.boxes[eb.toNode];
            return std::make_tuple(ba.center().x, ba.y, ea.to, a) <
                   std::make_tuple(bb.center().x, bb.y, eb.to, b);
        });

        for (size_t i = 0; i < ordered.size(); ++i) {
            EdgeId edgeId = ordered[i];
            const EdgeRecord& edge = graph.getEdge(edgeId);
            const NodeRecord& target = graph.getNode(edge.toNode);
            const Rect& targetBox = coords.boxes[edge.toNode];
            const int tx = targetBox.center().x;
            const int entry = entryFlow(target, targetBox);

            PositionedEdge& routed = result.edges[edgeId];
            routed.index = edgeId;
            routed.fromId = edge.from;
            routed.toId = edge.to;
            routed.kind = edge.kind;
            routed.label = edge.label;

            bool backward = nodeLayer[edge.toNode] <= nodeLayer[source];
            bool blocked = !backward &&
                columnBlocked(coords, byLayer, nodeLayer[source], nodeLayer[edge.toNode],
                              tx, departure, entry);

            std::vector<GridPoint> path{start};
            if (fanOut) {
                path.push_back(junction);
                routed.junction = junction;
                routed.groupIndex = static_cast<int>(i);
                routed.groupSize = static_cast<int>(ordered.size());
            }

            if (backward || blocked) {
                int lane = nextLane;
                nextLane += LANE_SPACING;
                ++result.detourLanes;

                path.push_back({lane, departure});
                path.push_back({lane, entry - 1});
                path.push_back({tx, entry - 1});
                path.push_back({tx, entry});
            } else {
                path.push_back({tx, departure});
                path.push_back({tx, entry});
            }

            routed.waypoints = removeDuplicates(path);
        }
    }

    return result;
}

bool EdgeRouting::columnBlocked(const CoordinateAssignmentResult& coords,
                                const std::vector<std::vector<NodeId>>& byLayer,
                                int firstLayer, int lastLayer, int column,
                                int fromFlow, int toFlow) const {
    // Layers outside [firstLayer, lastLayer] lie wholly outside the flow span
    for (int k = firstLayer; k <= lastLayer; ++k) {
        for (NodeId node : byLayer[static_cast<size_t>(k)]) {
            const Rect& box = coords.boxes[node];
            if (column < box.x || column >= box.right()) continue;
            if (box.y <= toFlow && box.bottom() > fromFlow) {
                return true;
            }
        }
    }
    return false;
}

std::vector<GridPoint> EdgeRouting::removeDuplicates(const std::vector<GridPoint>& points) {
    std::vector<GridPoint> cleaned;
    cleaned.reserve(points.size());
    for (const GridPoint& p : points) {
        if (cleaned.empty() || cleaned.back() != p) {
            cleaned.push_back(p);
        }
    }
    return cleaned;
}

GridPoint EdgeRouting::labelPoint(const std::vector<GridPoint>& path) {
    if (path.empty()) return {};

    int total = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        total += path[i - 1].manhattan(path[i]);
    }

    int remaining = total / 2;
    for (size_t i = 1; i < path.size(); ++i) {
        const GridPoint& a = path[i - 1];
        const GridPoint& b = path[i];
        int length = a.manhattan(b);
        if (remaining <= length) {
            int dx = (b.x > a.x) - (b.x < a.x);
            int dy = (b.y > a.y) - (b.y < a.y);
            return {a.x + dx * remaining, a.y + dy * remaining};
        }
        remaining -= length;
    }
    return path.back();
}

}  // namespace algorithms
}  // namespace charta
