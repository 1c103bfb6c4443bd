#pragma once

#include "ILayout.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

namespace charta {

/// Commit history layout.
///
/// Edges run from parent to child. Commits take one slot each along the
/// flow axis in topological order (insertion order breaks ties) and sit on
/// lanes across it: a commit continues the lane of its first parent unless
/// an earlier child already did, otherwise it opens a new lane. Roots open
/// lanes too.
///
/// A branch leaves its parent and turns onto the new lane right after it;
/// a merge runs down the parent's lane and turns just before the merge
/// commit. Links are plain lines in the edge's line style. Edges that
/// close a cycle are reported as warnings and left undrawn.
class CommitGraphLayout : public ILayout {
public:
    CommitGraphLayout() = default;
    explicit CommitGraphLayout(const LayoutOptions& options);

    /// @throws std::invalid_argument for options SugiyamaLayout rejects
    void setOptions(const LayoutOptions& options) override;
    const LayoutOptions& options() const override { return options_; }

    /// @throws DanglingReferenceError before any layout work
    LayoutResult layout(const Graph& graph) override;

    /// Line style a link of the given kind is drawn in
    static EdgeKind linkKind(EdgeKind kind);

private:
    LayoutOptions options_;
};

}  // namespace charta
