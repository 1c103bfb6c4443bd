#include "charta/diagram/Diagram.h"
#include "charta/layout/SugiyamaLayout.h"
#include "charta/layout/CommitGraphLayout.h"
#include "charta/layout/ClassGridLayout.h"
#include "charta/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace charta {

const char* diagramKindName(DiagramKind kind) {
    switch (kind) {
        case DiagramKind::Flowchart: return "flowchart";
        case DiagramKind::State: return "state";
        case DiagramKind::GitGraph: return "gitgraph";
        case DiagramKind::Class: return "class";
    }
    return "flowchart";
}

std::optional<DiagramKind> parseDiagramKind(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "flowchart" || key == "graph") return DiagramKind::Flowchart;
    if (key == "state" || key == "statediagram") return DiagramKind::State;
    if (key == "gitgraph" || key == "git") return DiagramKind::GitGraph;
    if (key == "class" || key == "classdiagram") return DiagramKind::Class;
    return std::nullopt;
}

LayoutResult Diagram::layout(const Graph& graph, const LayoutOptions& options) const {
    graph.validate();

    SugiyamaLayout engine(options);

    switch (kind_) {
        case DiagramKind::Flowchart:
            return engine.layout(graph);

        case DiagramKind::State: {
            Graph states = graph;
            for (NodeId index : graph.nodes()) {
                const NodeRecord& node = graph.getNode(index);
                if (node.shape == NodeShape::Rectangle) {
                    states.setNodeShape(node.id, NodeShape::Rounded);
                }
            }
            return engine.layout(states);
        }

        case DiagramKind::GitGraph: {
            CommitGraphLayout commits(options);
            return commits.layout(graph);
        }

        case DiagramKind::Class: {
            ClassGridLayout classes(options);
            return classes.layout(graph);
        }
    }

    LOG_ERROR("Unknown diagram kind {}", static_cast<int>(kind_));
    return engine.layout(graph);
}

std::string Diagram::render(const LayoutResult& result, CharacterSet style) const {
    return render(result, RenderOptions::forStyle(style));
}

std::string Diagram::render(const LayoutResult& result, const RenderOptions& options) const {
    // Kind-specific shapes were settled during layout; drawing is shared
    TextExport exporter(options);
    return exporter.exportToString(result);
}

std::string Diagram::draw(const Graph& graph, CharacterSet style,
                          const LayoutOptions& options) const {
    LayoutResult result = layout(graph, options);
    return render(result, style);
}

}  // namespace charta
