#pragma once

/// @file charta.h
/// @brief Main header for the charta text diagram library
///
/// charta lays out node/edge graphs in layers and draws them on a
/// character grid in ASCII or Unicode box-drawing styles.
///
/// Example usage:
/// @code
/// #include <charta/charta.h>
///
/// charta::Graph graph;
/// graph.addNode("A", "Start");
/// graph.addNode("B", "Stop");
/// graph.addEdge("A", "B");
///
/// charta::SugiyamaLayout layout;
/// auto result = layout.layout(graph);
///
/// charta::TextExport text;
/// std::cout << text.exportToString(result) << '\n';
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Errors.h"
#include "core/Graph.h"
#include "core/TextUtils.h"

// Logging
#include "common/Logger.h"

// Layout module - Layout algorithms and results
#include "layout/config/LayoutEnums.h"
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutResult.h"
#include "layout/ILayout.h"
#include "layout/SugiyamaLayout.h"
#include "layout/CommitGraphLayout.h"
#include "layout/ClassGridLayout.h"
#include "layout/util/LayoutSerializer.h"

// Rendering and export
#include "render/CharacterSet.h"
#include "render/Canvas.h"
#include "export/IExporter.h"
#include "export/TextExport.h"

// Diagram kinds
#include "diagram/Diagram.h"

#include <string>

namespace charta {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace charta
