#pragma once

#include "charta/core/Graph.h"
#include "charta/layout/config/LayoutOptions.h"

#include <string>
#include <vector>

namespace charta {
namespace algorithms {

/// Label lines and box size of one node
struct NodeMetrics {
    std::vector<std::string> lines;
    Size size;
};

/// Computes node boxes from labels and shapes, then equalizes the flow
/// extent of every layer.
class NodeSizing {
public:
    explicit NodeSizing(const LayoutOptions& options) : options_(options) {}

    /// Extra (width, height) a shape needs around its label
    static Size shapePadding(NodeShape shape);

    /// Label lines and intrinsic box size. Terminal nodes are a fixed 3x1,
    /// commits a single cell with the label drawn beside it, and classes
    /// take their compartment box.
    NodeMetrics measure(const NodeRecord& node) const;

    /// Stretch each node to its layer's largest height (vertical directions)
    /// or largest width (horizontal directions).
    static void normalizeLayers(std::vector<Size>& sizes,
                                const std::vector<std::vector<NodeId>>& layers,
                                Direction direction);

private:
    LayoutOptions options_;
};

}  // namespace algorithms
}  // namespace charta
