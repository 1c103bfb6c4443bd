#pragma once

#include "../core/Types.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

namespace charta {

class Graph;

/// Abstract interface for graph layout algorithms
class ILayout {
public:
    virtual ~ILayout() = default;

    /// Set layout options
    virtual void setOptions(const LayoutOptions& options) = 0;

    /// Get current layout options
    virtual const LayoutOptions& options() const = 0;

    /// Perform layout on a graph
    /// @throws DanglingReferenceError if an edge names a missing node
    virtual LayoutResult layout(const Graph& graph) = 0;
};

}  // namespace charta
