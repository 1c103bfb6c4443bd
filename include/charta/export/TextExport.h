#pragma once

#include "../layout/config/LayoutResult.h"
#include "../render/Canvas.h"
#include "../render/CharacterSet.h"
#include "IExporter.h"

#include <optional>
#include <ostream>
#include <string>

namespace charta {

/// Options for text export
struct RenderOptions {
    CharacterSet style = CharacterSet::Unicode;

    /// Draw edge labels at the path midpoint
    bool drawEdgeLabels = true;

    /// Replaces the built-in table for `style`. Roles it leaves unset raise
    /// GlyphUnmappedError when the drawing needs them.
    std::optional<GlyphTable> glyphs;

    static RenderOptions forStyle(CharacterSet s) {
        RenderOptions options;
        options.style = s;
        return options;
    }

    RenderOptions& setStyle(CharacterSet s) { style = s; return *this; }
    RenderOptions& setDrawEdgeLabels(bool enabled) { drawEdgeLabels = enabled; return *this; }
    RenderOptions& setGlyphs(const GlyphTable& table) { glyphs = table; return *this; }
};

/// Renders layout results onto a character canvas
///
/// Draw order: group boxes, nodes, edge paths, junctions, group titles,
/// edge labels. A group title takes the first stretch of its top border
/// that no edge crosses.
/// Node cells are protected from everything drawn after them. Crossing
/// and touching edge lines merge into tee and cross glyphs.
class TextExport : public IExporter {
public:
    TextExport() = default;
    explicit TextExport(const RenderOptions& options);
    ~TextExport() override = default;

    /// @throws GlyphUnmappedError if a custom table lacks a needed role
    std::string exportToString(const LayoutResult& layout) override;
    void exportToStream(const LayoutResult& layout, std::ostream& out) override;
    bool exportToFile(const LayoutResult& layout, const std::string& filename) override;

    std::string fileExtension() const override { return "txt"; }
    std::string mimeType() const override { return "text/plain; charset=utf-8"; }

    /// Draw the layout onto a fresh canvas of the layout's size
    Canvas renderCanvas(const LayoutResult& layout) const;

    void setOptions(const RenderOptions& options) { options_ = options; }
    const RenderOptions& options() const { return options_; }

private:
    RenderOptions options_;

    GlyphTable glyphTable() const;

    void drawGroups(Canvas& canvas, const LayoutResult& layout, const GlyphTable& glyphs) const;
    void drawNodes(Canvas& canvas, const LayoutResult& layout, const GlyphTable& glyphs) const;
    void drawEdges(Canvas& canvas, const LayoutResult& layout, const GlyphTable& glyphs) const;
    void drawGroupTitles(Canvas& canvas, const LayoutResult& layout, const GlyphTable& glyphs) const;
    void drawEdgeLabels(Canvas& canvas, const LayoutResult& layout) const;
};

}  // namespace charta
