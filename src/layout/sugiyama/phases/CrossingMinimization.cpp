#include "CrossingMinimization.h"

#include <algorithm>
#include <optional>
#include <tuple>

namespace charta {
namespace algorithms {

CrossingMinimizationResult BarycenterCrossingMinimization::minimize(
    const Graph& graph,
    std::vector<std::vector<NodeId>> layers,
    const std::unordered_set<EdgeId>& excludedEdges,
    charta::CrossingMinimization strategy,
    int passes) const {

    CrossingMinimizationResult result;
    result.layers = std::move(layers);

    for (auto& layer : result.layers) {
        keepGroupsContiguous(graph, layer);
    }

    if (result.layers.size() < 2 || strategy == charta::CrossingMinimization::None) {
        result.crossingCount = countTotalCrossings(graph, result.layers, excludedEdges);
        return result;
    }

    std::unordered_map<NodeId, int> initialRank;
    for (const auto& layer : result.layers) {
        for (size_t i = 0; i < layer.size(); ++i) {
            initialRank[layer[i]] = static_cast<int>(i);
        }
    }

    auto best = result.layers;
    int bestCrossings = countTotalCrossings(graph, best, excludedEdges);

    for (int pass = 0; pass < passes && bestCrossings > 0; ++pass) {
        auto before = result.layers;

        barycenterSweep(graph, result.layers, excludedEdges, initialRank, true);
        barycenterSweep(graph, result.layers, excludedEdges, initialRank, false);

        int crossings = countTotalCrossings(graph, result.layers, excludedEdges);
        if (crossings < bestCrossings) {
            bestCrossings = crossings;
            best = result.layers;
        }

        if (result.layers == before) {
            break;
        }
    }

    result.layers = std::move(best);
    result.crossingCount = bestCrossings;
    return result;
}

int BarycenterCrossingMinimization::countCrossings(
    const Graph& graph,
    const std::vector<NodeId>& upperLayer,
    const std::vector<NodeId>& lowerLayer,
    const std::unordered_set<EdgeId>& excludedEdges) const {

    std::unordered_map<NodeId, int> lowerPos;
    for (size_t i = 0; i < lowerLayer.size(); ++i) {
        lowerPos[lowerLayer[i]] = static_cast<int>(i);
    }

    std::vector<std::pair<int, int>> edges;
    for (size_t i = 0; i < upperLayer.size(); ++i) {
        for (EdgeId edgeId : graph.outEdges(upperLayer[i])) {
            if (excludedEdges.count(edgeId) > 0) {
                continue;
            }
            auto it = lowerPos.find(graph.getEdge(edgeId).toNode);
            if (it != lowerPos.end()) {
                edges.emplace_back(static_cast<int>(i), it->second);
            }
        }
    }

    // Edges sharing an endpoint do not cross
    int crossings = 0;
    for (size_t i = 0; i < edges.size(); ++i) {
        for (size_t j = i + 1; j < edges.size(); ++j) {
            int du = edges[i].first - edges[j].first;
            int dl = edges[i].second - edges[j].second;
            if ((du < 0 && dl > 0) || (du > 0 && dl < 0)) {
                ++crossings;
            }
        }
    }

    return crossings;
}

int BarycenterCrossingMinimization::countTotalCrossings(
    const Graph& graph,
    const std::vector<std::vector<NodeId>>& layers,
    const std::unordered_set<EdgeId>& excludedEdges) const {

    int total = 0;
    for (size_t i = 0; i + 1 < layers.size(); ++i) {
        total += countCrossings(graph, layers[i], layers[i + 1], excludedEdges);
    }
    return total;
}

void BarycenterCrossingMinimization::barycenterSweep(
    const Graph& graph,
    std::vector<std::vector<NodeId>>& layers,
    const std::unordered_set<EdgeId>& excludedEdges,
    const std::unordered_map<NodeId, int>& initialRank,
    bool downward) const {

    auto reorder = [&](size_t layerIndex, size_t fixedIndex, bool useSuccessors) {
        auto& layer = layers[layerIndex];
        std::vector<std::tuple<double, int, NodeId>> weights;
        weights.reserve(layer.size());

        for (size_t i = 0; i < layer.size(); ++i) {
            NodeId node = layer[i];
            double bc = computeBarycenter(node, static_cast<int>(i), graph,
                                          layers[fixedIndex], excludedEdges, useSuccessors);
            weights.emplace_back(bc, initialRank.at(node), node);
        }

        std::sort(weights.begin(), weights.end());

        layer.clear();
        for (const auto& [weight, rank, node] : weights) {
            layer.push_back(node);
        }
        keepGroupsContiguous(graph, layer);
    };

    if (downward) {
        for (size_t i = 1; i < layers.size(); ++i) {
            reorder(i, i - 1, false);
        }
    } else {
        for (size_t i = layers.size() - 1; i-- > 0;) {
            reorder(i, i + 1, true);
        }
    }
}

double BarycenterCrossingMinimization::computeBarycenter(
    NodeId node,
    int currentIndex,
    const Graph& graph,
    const std::vector<NodeId>& adjacentLayer,
    const std::unordered_set<EdgeId>& excludedEdges,
    bool useSuccessors) const {

    std::unordered_map<NodeId, int> pos;
    for (size_t i = 0; i < adjacentLayer.size(); ++i) {
        pos[adjacentLayer[i]] = static_cast<int>(i);
    }

    int sum = 0;
    int count = 0;
    const auto& incident = useSuccessors ? graph.outEdges(node) : graph.inEdges(node);
    for (EdgeId edgeId : incident) {
        if (excludedEdges.count(edgeId) > 0) continue;
        const EdgeRecord& edge = graph.getEdge(edgeId);
        auto it = pos.find(useSuccessors ? edge.toNode : edge.fromNode);
        if (it != pos.end()) {
            sum += it->second;
            ++count;
        }
    }

    if (count == 0) {
        return static_cast<double>(currentIndex);
    }
    return static_cast<double>(sum) / count;
}

void BarycenterCrossingMinimization::keepGroupsContiguous(
    const Graph& graph, std::vector<NodeId>& layer) const {

    if (graph.subgraphs().empty()) {
        return;
    }

    std::vector<std::optional<size_t>> groupOf;
    groupOf.reserve(layer.size());
    for (NodeId node : layer) {
        groupOf.push_back(graph.subgraphOf(graph.getNode(node).id));
    }

    std::vector<NodeId> ordered;
    ordered.reserve(layer.size());
    std::vector<bool> emitted(graph.subgraphs().size(), false);

    for (size_t i = 0; i < layer.size(); ++i) {
        if (!groupOf[i]) {
            ordered.push_back(layer[i]);
            continue;
        }
        size_t group = *groupOf[i];
        if (emitted[group]) {
            continue;
        }
        emitted[group] = true;
        for (size_t j = i; j < layer.size(); ++j) {
            if (groupOf[j] == group) {
                ordered.push_back(layer[j]);
            }
        }
    }

    layer = std::move(ordered);
}

}  // namespace algorithms
}  // namespace charta
