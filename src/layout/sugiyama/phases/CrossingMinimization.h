#pragma once

#include "charta/layout/ICrossingMinimization.h"

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace charta {
namespace algorithms {

/// Barycenter-based crossing minimization algorithm
///
/// Default implementation of ICrossingMinimization. Each pass is a downward
/// sweep followed by an upward sweep; a node moves to the mean index of its
/// neighbors in the fixed layer and keeps its index when it has none. Ties
/// fall back to the initial order. The best ordering seen is returned, and
/// iteration stops once a pass changes nothing.
///
/// Members of one subgraph stay contiguous within each layer.
class BarycenterCrossingMinimization : public ICrossingMinimization {
public:
    using Result = CrossingMinimizationResult;

    BarycenterCrossingMinimization() = default;

    const char* algorithmName() const override { return "Barycenter"; }

    CrossingMinimizationResult minimize(
        const Graph& graph,
        std::vector<std::vector<NodeId>> layers,
        const std::unordered_set<EdgeId>& excludedEdges,
        charta::CrossingMinimization strategy,
        int passes = 4) const override;

    int countCrossings(
        const Graph& graph,
        const std::vector<NodeId>& upperLayer,
        const std::vector<NodeId>& lowerLayer,
        const std::unordered_set<EdgeId>& excludedEdges) const override;

    int countTotalCrossings(
        const Graph& graph,
        const std::vector<std::vector<NodeId>>& layers,
        const std::unordered_set<EdgeId>& excludedEdges) const override;

private:
    void barycenterSweep(const Graph& graph,
                         std::vector<std::vector<NodeId>>& layers,
                         const std::unordered_set<EdgeId>& excludedEdges,
                         const std::unordered_map<NodeId, int>& initialRank,
                         bool downward) const;

    double computeBarycenter(NodeId node,
                             int currentIndex,
                             const Graph& graph,
                             const std::vector<NodeId>& adjacentLayer,
                             const std::unordered_set<EdgeId>& excludedEdges,
                             bool useSuccessors) const;

    /// Pull the members of each subgraph together at the first member's slot
    void keepGroupsContiguous(const Graph& graph, std::vector<NodeId>& layer) const;
};

}  // namespace algorithms
}  // namespace charta
