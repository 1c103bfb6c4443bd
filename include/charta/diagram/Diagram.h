#pragma once

#include "../core/Graph.h"
#include "../export/TextExport.h"
#include "../layout/config/LayoutOptions.h"
#include "../layout/config/LayoutResult.h"
#include "../render/CharacterSet.h"

#include <optional>
#include <string>
#include <string_view>

namespace charta {

/// Diagram families
enum class DiagramKind {
    Flowchart,
    State,       // Rectangles drawn rounded; terminals as start/end markers
    GitGraph,    // Commits on lanes, see CommitGraphLayout
    Class        // Class boxes on a grid, see ClassGridLayout
};

const char* diagramKindName(DiagramKind kind);
std::optional<DiagramKind> parseDiagramKind(std::string_view name);

/// Layout and rendering entry point for one diagram kind.
///
/// Kinds are a tag, not a class hierarchy: layout() switches on the kind
/// to apply its defaults and pick the layout engine.
class Diagram {
public:
    explicit Diagram(DiagramKind kind = DiagramKind::Flowchart) : kind_(kind) {}

    DiagramKind kind() const { return kind_; }

    /// @throws DanglingReferenceError before any layout work
    LayoutResult layout(const Graph& graph, const LayoutOptions& options = {}) const;

    std::string render(const LayoutResult& result, CharacterSet style) const;
    std::string render(const LayoutResult& result, const RenderOptions& options) const;

    /// layout() followed by render(); nothing is produced on failure
    std::string draw(const Graph& graph, CharacterSet style,
                     const LayoutOptions& options = {}) const;

private:
    DiagramKind kind_;
};

}  // namespace charta
