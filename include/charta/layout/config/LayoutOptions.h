#pragma once

#include "LayoutEnums.h"

namespace charta {

/// Crossing minimization strategy
enum class CrossingMinimization {
    None,               // Keep first-appearance order
    BarycenterHeuristic // Alternating barycenter sweeps
};

/// Smallest inter-layer gap that leaves room for an exit stub, a junction
/// row and an arrowhead (plus one cell of cylinder standoff)
constexpr int MIN_RANK_SPACING = 4;

/// Options for controlling layout behavior.
/// All spacing/sizing values are in character cells.
struct LayoutOptions {
    // Flow direction; ignored when useGraphDirection is set
    Direction direction = Direction::TopDown;
    bool useGraphDirection = true;

    // Spacing (cells)
    int nodeSpacing = 1;     // Gap between nodes in the same layer
    int rankSpacing = 4;     // Gap between layers, raised to MIN_RANK_SPACING
    int padding = 1;         // Margin around the whole drawing

    // Node sizing (cells)
    int minNodeWidth = 5;
    int minNodeHeight = 3;
    int maxLabelWidth = 0;   // Wrap labels wider than this; 0 keeps explicit lines only

    // Algorithm settings
    CrossingMinimization crossingMinimization = CrossingMinimization::BarycenterHeuristic;
    int crossingMinimizationPasses = 4;

    int effectiveRankSpacing() const {
        return rankSpacing < MIN_RANK_SPACING ? MIN_RANK_SPACING : rankSpacing;
    }

    static LayoutOptions forDirection(Direction d) {
        LayoutOptions options;
        options.direction = d;
        options.useGraphDirection = false;
        return options;
    }

    // Builder pattern for convenient configuration
    LayoutOptions& setDirection(Direction d) {
        direction = d;
        useGraphDirection = false;
        return *this;
    }
    LayoutOptions& setUseGraphDirection(bool enabled) { useGraphDirection = enabled; return *this; }
    LayoutOptions& setNodeSpacing(int cells) { nodeSpacing = cells; return *this; }
    LayoutOptions& setRankSpacing(int cells) { rankSpacing = cells; return *this; }
    LayoutOptions& setPadding(int cells) { padding = cells; return *this; }
    LayoutOptions& setMinNodeSize(int width, int height) {
        minNodeWidth = width;
        minNodeHeight = height;
        return *this;
    }
    LayoutOptions& setMaxLabelWidth(int cells) { maxLabelWidth = cells; return *this; }
    LayoutOptions& setCrossingMinimization(CrossingMinimization c) {
        crossingMinimization = c;
        return *this;
    }
    LayoutOptions& setCrossingMinimizationPasses(int passes) {
        crossingMinimizationPasses = passes;
        return *this;
    }
};

}  // namespace charta
