#pragma once

#include "ILayout.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <string>
#include <string_view>
#include <vector>

namespace charta {

struct NodeRecord;

/// Grid placement for class diagrams
///
/// Classes fill rows left to right in insertion order, CLASSES_PER_ROW to
/// a row. A node label holds the class name on its first line and one
/// member per following line; members containing "(" are methods and are
/// listed after the attributes.
///
/// Relationships are routed orthogonally through the gaps of the grid:
/// - neighbours in a row connect straight across on the name row;
/// - other classes of the same row connect over the top of the row;
/// - adjacent rows connect through the gap between them;
/// - rows further apart take a lane left of the grid.
///
/// The grid always reads top to bottom; the direction is ignored.
class ClassGridLayout : public ILayout {
public:
    static constexpr int CLASSES_PER_ROW = 3;
    static constexpr int COLUMN_GAP = 4;
    static constexpr int ROW_GAP = 4;
    static constexpr int LANE_SPACING = 2;

    ClassGridLayout() = default;
    explicit ClassGridLayout(const LayoutOptions& options);

    /// @throws std::invalid_argument for options SugiyamaLayout rejects
    void setOptions(const LayoutOptions& options) override;
    const LayoutOptions& options() const override { return options_; }

    /// @throws DanglingReferenceError before any layout work
    LayoutResult layout(const Graph& graph) override;

    static bool isMethod(std::string_view member);

    /// Class name, then attributes, then methods. Blank members are dropped.
    static std::vector<std::string> compartmentLines(const NodeRecord& node);

    /// Box around the name and the non-empty member compartments
    static Size boxSize(const std::vector<std::string>& lines);

private:
    LayoutOptions options_;
};

}  // namespace charta
