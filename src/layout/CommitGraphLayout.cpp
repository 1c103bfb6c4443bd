#include "charta/layout/CommitGraphLayout.h"
#include "charta/layout/SugiyamaLayout.h"
#include "charta/common/Logger.h"
#include "charta/core/Graph.h"
#include "charta/core/TextUtils.h"
#include "sugiyama/phases/CycleRemoval.h"
#include "sugiyama/phases/CoordinateAssignment.h"
#include "sugiyama/routing/EdgeRouting.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_set>

namespace charta {

using namespace algorithms;

CommitGraphLayout::CommitGraphLayout(const LayoutOptions& options) {
    setOptions(options);
}

void CommitGraphLayout::setOptions(const LayoutOptions& options) {
    SugiyamaLayout::validateOptions(options);
    options_ = options;
}

EdgeKind CommitGraphLayout::linkKind(EdgeKind kind) {
    if (isInvisible(kind)) return kind;
    if (isDotted(kind)) return EdgeKind::DottedLine;
    if (isThick(kind)) return EdgeKind::ThickLine;
    return EdgeKind::Line;
}

LayoutResult CommitGraphLayout::layout(const Graph& graph) {
    graph.validate();

    const Direction direction =
        options_.useGraphDirection ? graph.direction() : options_.direction;

    LayoutResult result;
    result.setDirection(direction);
    if (graph.empty()) {
        LOG_DEBUG("Empty commit graph, nothing to lay out");
        return result;
    }

    const size_t count = graph.nodeCount();

    // History has no cycles; closing edges stay out of the drawing
    CycleRemoval cycleRemoval;
    CycleRemovalResult cycles = cycleRemoval.findExcludedEdges(graph);
    std::unordered_set<EdgeId> excluded(cycles.excludedEdges.begin(),
                                        cycles.excludedEdges.end());
    for (EdgeId edgeId : cycles.excludedEdges) {
        const EdgeRecord& edge = graph.getEdge(edgeId);

        LayoutWarning warning;
        warning.kind = LayoutWarningKind::CycleExcluded;
        warning.edge = edgeId;
        warning.from = edge.from;
        warning.to = edge.to;
        warning.message = "Edge '" + edge.from + "' -> '" + edge.to +
                          "' closes a cycle in the commit history; not drawn";
        result.addWarning(warning);

        LOG_WARN("Edge {} ({} -> {}) closes a cycle in the commit history",
                 edgeId, edge.from, edge.to);
    }

    // Topological order, lowest index first among ready commits
    std::vector<int> pending(count, 0);
    for (EdgeId edgeId : graph.edges()) {
        if (excluded.count(edgeId) == 0) {
            ++pending[graph.getEdge(edgeId).toNode];
        }
    }
    std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
    for (NodeId node : graph.nodes()) {
        if (pending[node] == 0) ready.push(node);
    }

    std::vector<NodeId> order;
    std::vector<int> slot(count, 0);
    while (!ready.empty()) {
        NodeId commit = ready.top();
        ready.pop();
        slot[commit] = static_cast<int>(order.size());
        order.push_back(commit);
        for (EdgeId edgeId : graph.outEdges(commit)) {
            if (excluded.count(edgeId) > 0) continue;
            NodeId child = graph.getEdge(edgeId).toNode;
            if (--pending[child] == 0) ready.push(child);
        }
    }

    // Lanes
    std::vector<NodeId> firstParent(count, INVALID_NODE);
    std::vector<bool> laneContinued(count, false);
    std::vector<int> lane(count, 0);
    int laneCount = 0;
    for (NodeId commit : order) {
        for (EdgeId edgeId : graph.inEdges(commit)) {
            if (excluded.count(edgeId) == 0) {
                firstParent[commit] = graph.getEdge(edgeId).fromNode;
                break;
            }
        }
        NodeId parent = firstParent[commit];
        if (parent != INVALID_NODE && !laneContinued[parent]) {
            lane[commit] = lane[parent];
            laneContinued[parent] = true;
        } else {
            lane[commit] = laneCount++;
        }
    }

    std::vector<std::string> labels(count);
    int labelWidth = 1;
    for (NodeId node : graph.nodes()) {
        std::vector<std::string> lines = text::splitLines(graph.getNode(node).displayLabel());
        labels[node] = lines.empty() ? std::string() : lines.front();
        labelWidth = std::max(labelWidth, text::displayWidth(labels[node]));
    }

    // Labels sit beside the glyph across the flow in vertical directions and
    // below it along the flow otherwise; pitches leave room for them
    const bool vertical = isVertical(direction);
    const int turn = vertical ? 1 : labelWidth / 2 + 1;
    const int slotPitch = 2 * turn + 1;
    const int lanePitch = vertical ? labelWidth + 3 : 3;

    auto crossOf = [&](NodeId node) { return lane[node] * lanePitch; };
    auto flowOf = [&](NodeId node) { return slot[node] * slotPitch; };

    const int flowExtent = (static_cast<int>(order.size()) - 1) * slotPitch + 1;
    DirectionTransform transform(direction, flowExtent);

    for (NodeId node : graph.nodes()) {
        const NodeRecord& record = graph.getNode(node);
        Rect box = transform.mapBox({crossOf(node), flowOf(node), 1, 1});

        PositionedNode positioned;
        positioned.index = node;
        positioned.id = record.id;
        positioned.lines = {labels[node]};
        positioned.shape = NodeShape::Commit;
        positioned.x = box.x;
        positioned.y = box.y;
        positioned.width = box.width;
        positioned.height = box.height;
        positioned.layer = slot[node];
        positioned.order = lane[node];
        result.addNode(positioned);
    }

    for (EdgeId edgeId : graph.edges()) {
        const EdgeRecord& edge = graph.getEdge(edgeId);

        PositionedEdge routed;
        routed.index = edgeId;
        routed.fromId = edge.from;
        routed.toId = edge.to;
        routed.kind = linkKind(edge.kind);
        routed.label = edge.label;
        routed.sourceEdge = exitBorder(direction);
        routed.targetEdge = entryBorder(direction);

        if (excluded.count(edgeId) > 0) {
            routed.excluded = true;
            result.addEdge(routed);
            continue;
        }

        const NodeId parent = edge.fromNode;
        const NodeId child = edge.toNode;
        const int parentCross = crossOf(parent);
        const int parentFlow = flowOf(parent);
        const int childCross = crossOf(child);
        const int childFlow = flowOf(child);

        std::vector<GridPoint> path{{parentCross, parentFlow + 1}};
        if (parentCross != childCross) {
            // Branches turn next to the parent, merges next to the child
            int turnAt = firstParent[child] == parent ? parentFlow + turn : childFlow - turn;
            path.push_back({parentCross, turnAt});
            path.push_back({childCross, turnAt});
        }
        path.push_back({childCross, childFlow - 1});

        for (GridPoint& p : path) p = transform.mapPoint(p);
        routed.waypoints = EdgeRouting::removeDuplicates(path);
        if (routed.label && routed.waypoints.size() >= 2) {
            routed.labelPosition = EdgeRouting::labelPoint(routed.waypoints);
        }
        result.addEdge(routed);
    }

    result.setLayerCount(static_cast<int>(order.size()));
    result.fitToPadding(options_.padding);

    LOG_INFO("Laid out {} commits on {} lanes ({}), {}x{} cells",
             count, laneCount, directionName(direction), result.width(), result.height());
    return result;
}

}  // namespace charta
