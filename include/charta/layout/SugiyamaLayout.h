#pragma once

#include "ILayout.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <memory>

namespace charta {

namespace algorithms {
class ICycleRemoval;
class ILayerAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;
}  // namespace algorithms

/// Sugiyama-style layered layout on a character grid
///
/// Implements the classic layered drawing approach in one canonical
/// orientation (flow downward) and maps the result to the requested
/// direction at the end:
/// 1. Cycle Removal - Exclude back edges from ranking
/// 2. Layer Assignment - Longest path from the sources
/// 3. Crossing Minimization - Barycenter sweeps
/// 4. Node Sizing - Label-driven boxes, equalized per layer
/// 5. Coordinate Assignment - Stack layers, center each one
/// 6. Edge Routing - Orthogonal paths with fan-out junctions
///
/// Excluded edges are still routed; each one is reported as a
/// LayoutWarning and logged at warn level.
class SugiyamaLayout : public ILayout {
public:
    SugiyamaLayout();
    explicit SugiyamaLayout(const LayoutOptions& options);
    ~SugiyamaLayout() override;

    // Non-copyable, movable
    SugiyamaLayout(const SugiyamaLayout&) = delete;
    SugiyamaLayout& operator=(const SugiyamaLayout&) = delete;
    SugiyamaLayout(SugiyamaLayout&&) noexcept;
    SugiyamaLayout& operator=(SugiyamaLayout&&) noexcept;

    /// @throws std::invalid_argument for negative spacing or a minimum size below 1
    void setOptions(const LayoutOptions& options) override;
    const LayoutOptions& options() const override { return options_; }

    /// @throws DanglingReferenceError before any layout work
    LayoutResult layout(const Graph& graph) override;

    /// Get statistics from last layout
    struct LayoutStats {
        int layerCount = 0;
        int maxLayerWidth = 0;    ///< Most nodes in one layer
        int edgeCrossings = 0;
        int excludedEdges = 0;
    };
    const LayoutStats& lastStats() const { return stats_; }

    /// Algorithm injection (for swapping implementations).
    /// Passing nullptr keeps the current implementation.
    void setCycleRemoval(std::shared_ptr<algorithms::ICycleRemoval> impl);
    void setLayerAssignment(std::shared_ptr<algorithms::ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<algorithms::ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<algorithms::ICoordinateAssignment> impl);

    /// Throws std::invalid_argument when options cannot produce a layout
    static void validateOptions(const LayoutOptions& options);

private:
    LayoutOptions options_;
    LayoutStats stats_;

    std::shared_ptr<algorithms::ICycleRemoval> cycleRemoval_;
    std::shared_ptr<algorithms::ILayerAssignment> layerAssignment_;
    std::shared_ptr<algorithms::ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<algorithms::ICoordinateAssignment> coordinateAssignment_;

    // Internal layout state, alive for one layout() call
    struct LayoutState;
    std::unique_ptr<LayoutState> state_;

    void removeCycles();
    void assignLayers();
    void minimizeCrossings();
    void sizeNodes();
    void assignCoordinates();
    void routeEdges();
    void buildGroups();
    void applyPadding();
};

}  // namespace charta
