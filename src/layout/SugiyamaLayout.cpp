#include "charta/layout/SugiyamaLayout.h"
#include "charta/common/Logger.h"
#include "charta/core/Graph.h"
#include "sugiyama/phases/CycleRemoval.h"
#include "sugiyama/phases/LayerAssignment.h"
#include "sugiyama/phases/CrossingMinimization.h"
#include "sugiyama/phases/NodeSizing.h"
#include "sugiyama/phases/CoordinateAssignment.h"
#include "sugiyama/routing/EdgeRouting.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace charta {

using namespace algorithms;

struct SugiyamaLayout::LayoutState {
    const Graph* graph = nullptr;
    Direction direction = Direction::TopDown;

    std::unordered_set<EdgeId> excludedEdges;
    std::vector<std::vector<NodeId>> layers;
    std::vector<int> nodeLayer;
    std::vector<NodeMetrics> metrics;
    std::vector<Size> canonicalSizes;
    CoordinateAssignmentResult coords;

    LayoutResult result;
};

SugiyamaLayout::SugiyamaLayout()
    : SugiyamaLayout(LayoutOptions{}) {}

SugiyamaLayout::SugiyamaLayout(const LayoutOptions& options)
    : cycleRemoval_(std::make_shared<CycleRemoval>())
    , layerAssignment_(std::make_shared<LongestPathLayerAssignment>())
    , crossingMinimization_(std::make_shared<BarycenterCrossingMinimization>())
    , coordinateAssignment_(std::make_shared<CanonicalCoordinateAssignment>())
    , state_(std::make_unique<LayoutState>()) {
    setOptions(options);
}

SugiyamaLayout::~SugiyamaLayout() = default;

SugiyamaLayout::SugiyamaLayout(SugiyamaLayout&&) noexcept = default;
SugiyamaLayout& SugiyamaLayout::operator=(SugiyamaLayout&&) noexcept = default;

void SugiyamaLayout::validateOptions(const LayoutOptions& options) {
    if (options.nodeSpacing < 0) {
        throw std::invalid_argument("nodeSpacing must not be negative");
    }
    if (options.rankSpacing < 0) {
        throw std::invalid_argument("rankSpacing must not be negative");
    }
    if (options.padding < 0) {
        throw std::invalid_argument("padding must not be negative");
    }
    if (options.minNodeWidth < 1 || options.minNodeHeight < 1) {
        throw std::invalid_argument("minimum node size must be at least 1x1");
    }
    if (options.crossingMinimizationPasses < 0) {
        throw std::invalid_argument("crossingMinimizationPasses must not be negative");
    }
}

void SugiyamaLayout::setOptions(const LayoutOptions& options) {
    validateOptions(options);
    options_ = options;
}

void SugiyamaLayout::setCycleRemoval(std::shared_ptr<ICycleRemoval> impl) {
    if (impl) cycleRemoval_ = std::move(impl);
}

void SugiyamaLayout::setLayerAssignment(std::shared_ptr<ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void SugiyamaLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void SugiyamaLayout::setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

LayoutResult SugiyamaLayout::layout(const Graph& graph) {
    graph.validate();

    state_ = std::make_unique<LayoutState>();
    state_->graph = &graph;
    state_->direction = options_.useGraphDirection ? graph.direction() : options_.direction;
    state_->result.setDirection(state_->direction);
    stats_ = LayoutStats{};

    if (graph.empty()) {
        LOG_DEBUG("Empty graph, nothing to lay out");
        return std::move(state_->result);
    }

    removeCycles();
    assignLayers();
    minimizeCrossings();
    sizeNodes();
    assignCoordinates();
    routeEdges();
    buildGroups();
    applyPadding();

    LOG_INFO("Laid out {} nodes and {} edges in {} layers ({}), {}x{} cells, {} crossings",
             graph.nodeCount(), graph.edgeCount(), stats_.layerCount,
             directionName(state_->direction), state_->result.width(),
             state_->result.height(), stats_.edgeCrossings);

    LayoutResult result = std::move(state_->result);
    state_ = std::make_unique<LayoutState>();
    return result;
}

void SugiyamaLayout::removeCycles() {
    const Graph& graph = *state_->graph;
    CycleRemovalResult cycles = cycleRemoval_->findExcludedEdges(graph);

    for (EdgeId edgeId : cycles.excludedEdges) {
        state_->excludedEdges.insert(edgeId);
        const EdgeRecord& edge = graph.getEdge(edgeId);

        LayoutWarning warning;
        warning.kind = LayoutWarningKind::CycleExcluded;
        warning.edge = edgeId;
        warning.from = edge.from;
        warning.to = edge.to;
        warning.message = edge.isSelfLoop()
            ? "Self-loop on '" + edge.from + "' excluded from layering"
            : "Edge '" + edge.from + "' -> '" + edge.to + "' closes a cycle; excluded from layering";
        state_->result.addWarning(warning);

        LOG_WARN("Edge {} ({} -> {}) excluded from layering to break a cycle",
                 edgeId, edge.from, edge.to);
    }

    stats_.excludedEdges = static_cast<int>(cycles.excludedEdges.size());
    LOG_DEBUG("{}: {} edge(s) excluded", cycleRemoval_->algorithmName(),
              cycles.excludedEdges.size());
}

void SugiyamaLayout::assignLayers() {
    LayerAssignmentResult layering =
        layerAssignment_->assignLayers(*state_->graph, state_->excludedEdges);

    state_->nodeLayer = std::move(layering.nodeLayer);
    state_->layers = std::move(layering.layers);
    stats_.layerCount = layering.layerCount;
    state_->result.setLayerCount(layering.layerCount);

    LOG_DEBUG("{}: {} layer(s)", layerAssignment_->algorithmName(), layering.layerCount);
}

void SugiyamaLayout::minimizeCrossings() {
    CrossingMinimizationResult ordering = crossingMinimization_->minimize(
        *state_->graph, std::move(state_->layers), state_->excludedEdges,
        options_.crossingMinimization, options_.crossingMinimizationPasses);

    state_->layers = std::move(ordering.layers);
    stats_.edgeCrossings = ordering.crossingCount;

    for (const auto& layer : state_->layers) {
        stats_.maxLayerWidth = std::max(stats_.maxLayerWidth, static_cast<int>(layer.size()));
    }

    LOG_DEBUG("{}: {} crossing(s)", crossingMinimization_->algorithmName(),
              ordering.crossingCount);
}

void SugiyamaLayout::sizeNodes() {
    const Graph& graph = *state_->graph;
    NodeSizing sizing(options_);

    std::vector<Size> sizes;
    sizes.reserve(graph.nodeCount());
    for (NodeId node : graph.nodes()) {
        state_->metrics.push_back(sizing.measure(graph.getNode(node)));
        sizes.push_back(state_->metrics.back().size);
    }

    NodeSizing::normalizeLayers(sizes, state_->layers, state_->direction);

    state_->canonicalSizes.reserve(sizes.size());
    for (const Size& size : sizes) {
        state_->canonicalSizes.push_back(DirectionTransform::toCanonical(size, state_->direction));
    }
}

void SugiyamaLayout::assignCoordinates() {
    const Graph& graph = *state_->graph;
    state_->coords = coordinateAssignment_->assign(
        graph, state_->layers, state_->canonicalSizes, options_);

    DirectionTransform transform(state_->direction, state_->coords.flowExtent);

    for (size_t k = 0; k < state_->layers.size(); ++k) {
        const auto& layer = state_->layers[k];
        for (size_t i = 0; i < layer.size(); ++i) {
            NodeId index = layer[i];
            const NodeRecord& record = graph.getNode(index);
            Rect box = transform.mapBox(state_->coords.boxes[index]);

            PositionedNode node;
            node.index = index;
            node.id = record.id;
            node.lines = state_->metrics[index].lines;
            node.shape = record.shape;
            node.x = box.x;
            node.y = box.y;
            node.width = box.width;
            node.height = box.height;
            node.layer = static_cast<int>(k);
            node.order = static_cast<int>(i);
            state_->result.addNode(node);
        }
    }

    LOG_DEBUG("{}: cross extent {}, flow extent {}", coordinateAssignment_->algorithmName(),
              state_->coords.crossExtent, state_->coords.flowExtent);
}

void SugiyamaLayout::routeEdges() {
    EdgeRouting routing;
    EdgeRouting::Result routed =
        routing.route(*state_->graph, state_->coords, state_->nodeLayer);

    DirectionTransform transform(state_->direction, state_->coords.flowExtent);

    for (PositionedEdge& edge : routed.edges) {
        for (GridPoint& p : edge.waypoints) {
            p = transform.mapPoint(p);
        }
        if (edge.junction) {
            edge.junction = transform.mapPoint(*edge.junction);
        }
        edge.sourceEdge = exitBorder(state_->direction);
        edge.targetEdge = entryBorder(state_->direction);
        edge.excluded = state_->excludedEdges.count(edge.index) > 0;
        if (edge.label) {
            edge.labelPosition = EdgeRouting::labelPoint(edge.waypoints);
        }
        state_->result.addEdge(edge);
    }

    LOG_DEBUG("Routed {} edge(s), {} detour lane(s)", routed.edges.size(), routed.detourLanes);
}

void SugiyamaLayout::buildGroups() {
    const Graph& graph = *state_->graph;

    for (size_t i = 0; i < graph.subgraphs().size(); ++i) {
        const Subgraph& subgraph = graph.subgraphs()[i];

        PositionedGroup group;
        group.id = subgraph.id;
        group.title = subgraph.title;

        Rect bounds;
        for (const std::string& member : subgraph.members) {
            // A node belongs to the first subgraph listing it
            if (graph.subgraphOf(member) != i) continue;
            const PositionedNode* node = state_->result.getNode(member);
            if (!node) continue;
            group.members.push_back(member);
            bounds = bounds.united(node->bounds());
        }

        if (group.members.empty()) {
            LOG_DEBUG("Subgraph {} has no placed members, skipped", subgraph.id);
            continue;
        }

        group.bounds = bounds.expanded(1);
        state_->result.addGroup(group);
    }
}

void SugiyamaLayout::applyPadding() {
    state_->result.fitToPadding(options_.padding);
}

}  // namespace charta
