#pragma once

#include "charta/layout/config/LayoutResult.h"
#include "charta/render/Canvas.h"
#include "charta/render/CharacterSet.h"

namespace charta {

/// Draws node outlines and centered labels onto a canvas
class ShapePainter {
public:
    /// @param direction Flow of the layout; places commit labels and stubs
    ShapePainter(Canvas& canvas, const GlyphTable& glyphs, Direction direction)
        : canvas_(canvas), glyphs_(glyphs), direction_(direction) {}

    /// Paint one node. Terminal nodes show the start marker when
    /// isStart is set, the end marker otherwise.
    void paint(const PositionedNode& node, bool isStart);

private:
    Canvas& canvas_;
    const GlyphTable& glyphs_;
    Direction direction_;

    void put(int x, int y, GlyphRole role);
    void hline(int x0, int x1, int y, GlyphRole role);
    void vline(int x, int y0, int y1, GlyphRole role);

    void paintBox(const Rect& r, GlyphRole tl, GlyphRole tr, GlyphRole bl, GlyphRole br);
    void paintSubroutine(const Rect& r);
    void paintCircle(const Rect& r);
    void paintDiamond(const Rect& r);
    void paintHexagon(const Rect& r);
    void paintAsymmetric(const Rect& r);
    void paintSlanted(const Rect& r, GlyphRole left, GlyphRole right);
    void paintCylinder(const Rect& r);
    void paintTerminal(const Rect& r, bool isStart);
    void paintCommit(const PositionedNode& node);
    void paintClass(const PositionedNode& node);

    /// Center label lines in rows [top, bottom)
    void paintLabel(const PositionedNode& node, int top, int bottom);
};

}  // namespace charta
