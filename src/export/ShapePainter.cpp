#include "ShapePainter.h"
#include "charta/core/TextUtils.h"
#include "charta/layout/ClassGridLayout.h"

#include <algorithm>
#include <cstdlib>

namespace charta {

void ShapePainter::put(int x, int y, GlyphRole role) {
    canvas_.set(x, y, glyphs_.lookup(role));
}

void ShapePainter::hline(int x0, int x1, int y, GlyphRole role) {
    for (int x = x0; x <= x1; ++x) put(x, y, role);
}

void ShapePainter::vline(int x, int y0, int y1, GlyphRole role) {
    for (int y = y0; y <= y1; ++y) put(x, y, role);
}

void ShapePainter::paint(const PositionedNode& node, bool isStart) {
    const Rect r = node.bounds();
    int labelTop = r.y + 1;
    int labelBottom = r.bottom() - 1;

    switch (node.shape) {
        case NodeShape::Rectangle:
            paintBox(r, GlyphRole::BoxTopLeft, GlyphRole::BoxTopRight,
                     GlyphRole::BoxBottomLeft, GlyphRole::BoxBottomRight);
            break;
        case NodeShape::Rounded:
            paintBox(r, GlyphRole::RoundTopLeft, GlyphRole::RoundTopRight,
                     GlyphRole::RoundBottomLeft, GlyphRole::RoundBottomRight);
            break;
        case NodeShape::Subroutine:
            paintSubroutine(r);
            break;
        case NodeShape::Circle:
            paintCircle(r);
            break;
        case NodeShape::Diamond:
            paintDiamond(r);
            labelTop = r.y;
            labelBottom = r.bottom();
            break;
        case NodeShape::Hexagon:
            paintHexagon(r);
            break;
        case NodeShape::Asymmetric:
            paintAsymmetric(r);
            break;
        case NodeShape::Parallelogram:
            paintSlanted(r, GlyphRole::DiagonalUp, GlyphRole::DiagonalUp);
            break;
        case NodeShape::Trapezoid:
            paintSlanted(r, GlyphRole::DiagonalUp, GlyphRole::DiagonalDown);
            break;
        case NodeShape::Cylinder:
            paintCylinder(r);
            labelTop = r.y + 2;
            break;
        case NodeShape::Terminal:
            paintTerminal(r, isStart);
            return;
        case NodeShape::Commit:
            paintCommit(node);
            return;
        case NodeShape::Class:
            paintClass(node);
            return;
    }

    paintLabel(node, labelTop, labelBottom);
}

void ShapePainter::paintBox(const Rect& r, GlyphRole tl, GlyphRole tr,
                            GlyphRole bl, GlyphRole br) {
    const int right = r.right() - 1;
    const int bottom = r.bottom() - 1;

    hline(r.x + 1, right - 1, r.y, GlyphRole::BoxHorizontal);
    hline(r.x + 1, right - 1, bottom, GlyphRole::BoxHorizontal);
    vline(r.x, r.y + 1, bottom - 1, GlyphRole::BoxVertical);
    vline(right, r.y + 1, bottom - 1, GlyphRole::BoxVertical);

    put(r.x, r.y, tl);
    put(right, r.y, tr);
    put(r.x, bottom, bl);
    put(right, bottom, br);
}

void ShapePainter::paintSubroutine(const Rect& r) {
    paintBox(r, GlyphRole::BoxTopLeft, GlyphRole::BoxTopRight,
             GlyphRole::BoxBottomLeft, GlyphRole::BoxBottomRight);
    vline(r.x + 1, r.y + 1, r.bottom() - 2, GlyphRole::BoxVertical);
    vline(r.right() - 2, r.y + 1, r.bottom() - 2, GlyphRole::BoxVertical);
}

void ShapePainter::paintCircle(const Rect& r) {
    const int right = r.right() - 1;
    const int bottom = r.bottom() - 1;

    paintBox(r, GlyphRole::RoundTopLeft, GlyphRole::RoundTopRight,
             GlyphRole::RoundBottomLeft, GlyphRole::RoundBottomRight);
    vline(r.x, r.y + 1, bottom - 1, GlyphRole::ArcLeft);
    vline(right, r.y + 1, bottom - 1, GlyphRole::ArcRight);
}

void ShapePainter::paintDiamond(const Rect& r) {
    const int right = r.right() - 1;
    const int last = r.height - 1;
    const int mid = r.height / 2;
    const int maxInset = std::max(0, (r.width - 3) / 2);

    for (int row = 0; row < r.height; ++row) {
        const int y = r.y + row;
        const int inset = std::min(std::abs(row - mid), maxInset);

        if (row == mid) {
            put(r.x, y, GlyphRole::PointLeft);
            put(right, y, GlyphRole::PointRight);
            continue;
        }

        bool upper = row < mid;
        put(r.x + inset, y, upper ? GlyphRole::DiagonalUp : GlyphRole::DiagonalDown);
        put(right - inset, y, upper ? GlyphRole::DiagonalDown : GlyphRole::DiagonalUp);

        if (row == 0 || row == last) {
            hline(r.x + inset + 1, right - inset - 1, y, GlyphRole::BoxHorizontal);
        }
    }
}

void ShapePainter::paintHexagon(const Rect& r) {
    const int right = r.right() - 1;
    const int bottom = r.bottom() - 1;
    const int mid = r.y + r.height / 2;

    hline(r.x + 2, right - 2, r.y, GlyphRole::BoxHorizontal);
    hline(r.x + 2, right - 2, bottom, GlyphRole::BoxHorizontal);
    put(r.x + 1, r.y, GlyphRole::DiagonalUp);
    put(right - 1, r.y, GlyphRole::DiagonalDown);
    put(r.x + 1, bottom, GlyphRole::DiagonalDown);
    put(right - 1, bottom, GlyphRole::DiagonalUp);

    for (int y = r.y + 1; y < bottom; ++y) {
        if (y == mid) {
            put(r.x, y, GlyphRole::PointLeft);
            put(right, y, GlyphRole::PointRight);
        } else if (y < mid) {
            put(r.x, y, GlyphRole::DiagonalUp);
            put(right, y, GlyphRole::DiagonalDown);
        } else {
            put(r.x, y, GlyphRole::DiagonalDown);
            put(right, y, GlyphRole::DiagonalUp);
        }
    }
}

void ShapePainter::paintAsymmetric(const Rect& r) {
    const int right = r.right() - 1;
    const int bottom = r.bottom() - 1;
    const int mid = r.y + r.height / 2;

    hline(r.x + 1, right - 1, r.y, GlyphRole::BoxHorizontal);
    hline(r.x + 1, right - 1, bottom, GlyphRole::BoxHorizontal);
    vline(right, r.y + 1, bottom - 1, GlyphRole::BoxVertical);
    put(right, r.y, GlyphRole::BoxTopRight);
    put(right, bottom, GlyphRole::BoxBottomRight);

    // Notch pointing into the box
    for (int y = r.y; y <= bottom; ++y) {
        if (y == mid) {
            put(r.x, y, GlyphRole::PointRight);
        } else {
            put(r.x, y, y < mid ? GlyphRole::DiagonalDown : GlyphRole::DiagonalUp);
        }
    }
}

void ShapePainter::paintSlanted(const Rect& r, GlyphRole left, GlyphRole right) {
    const int rightX = r.right() - 1;
    const int bottom = r.bottom() - 1;

    hline(r.x + 1, rightX - 1, r.y, GlyphRole::BoxHorizontal);
    hline(r.x + 1, rightX - 1, bottom, GlyphRole::BoxHorizontal);
    vline(r.x, r.y, bottom, left);
    vline(rightX, r.y, bottom, right);
}

void ShapePainter::paintCylinder(const Rect& r) {
    paintBox(r, GlyphRole::RoundTopLeft, GlyphRole::RoundTopRight,
             GlyphRole::RoundBottomLeft, GlyphRole::RoundBottomRight);
    if (r.height < 4) return;

    const int right = r.right() - 1;
    const int lid = r.y + 1;
    put(r.x, lid, GlyphRole::BoxTeeRight);
    hline(r.x + 1, right - 1, lid, GlyphRole::BoxHorizontal);
    put(right, lid, GlyphRole::BoxTeeLeft);
}

void ShapePainter::paintTerminal(const Rect& r, bool isStart) {
    const int cx = r.x + r.width / 2;
    const int cy = r.y + r.height / 2;

    put(cx - 1, cy, GlyphRole::ArcLeft);
    put(cx, cy, isStart ? GlyphRole::TerminalStart : GlyphRole::TerminalEnd);
    put(cx + 1, cy, GlyphRole::ArcRight);

    // Stubs fill a box stretched by layer normalization
    vline(cx, r.y, cy - 1, GlyphRole::LineVertical);
    vline(cx, cy + 1, r.bottom() - 1, GlyphRole::LineVertical);
    hline(r.x, cx - 2, cy, GlyphRole::LineHorizontal);
    hline(cx + 2, r.right() - 1, cy, GlyphRole::LineHorizontal);
}

void ShapePainter::paintCommit(const PositionedNode& node) {
    const Rect r = node.bounds();
    const GridPoint glyph = node.center();
    put(glyph.x, glyph.y, GlyphRole::Commit);

    // Stubs along the flow fill a box stretched by layer normalization
    if (isVertical(direction_)) {
        vline(glyph.x, r.y, glyph.y - 1, GlyphRole::LineVertical);
        vline(glyph.x, glyph.y + 1, r.bottom() - 1, GlyphRole::LineVertical);
    } else {
        hline(r.x, glyph.x - 1, glyph.y, GlyphRole::LineHorizontal);
        hline(glyph.x + 1, r.right() - 1, glyph.y, GlyphRole::LineHorizontal);
    }

    Rect label = commitLabelBounds(node, direction_);
    if (label.empty()) return;
    canvas_.writeText(label.x, label.y, node.lines.front());
    canvas_.protect(label);
}

void ShapePainter::paintClass(const PositionedNode& node) {
    const Rect r = node.bounds();
    paintBox(r, GlyphRole::BoxTopLeft, GlyphRole::BoxTopRight,
             GlyphRole::BoxBottomLeft, GlyphRole::BoxBottomRight);
    if (node.lines.empty()) return;

    const int right = r.right() - 1;
    const int bottom = r.bottom() - 1;
    const int inner = std::max(0, r.width - 2);

    std::string name = text::truncateToWidth(node.lines.front(), inner);
    canvas_.writeText(r.x + (r.width - text::displayWidth(name)) / 2, r.y + 1, name);

    // Members arrive attributes first; each compartment opens with a rule
    int y = r.y + 2;
    bool inMethods = false;
    for (size_t i = 1; i < node.lines.size() && y < bottom; ++i) {
        bool method = ClassGridLayout::isMethod(node.lines[i]);
        if (i == 1 || method != inMethods) {
            put(r.x, y, GlyphRole::BoxTeeRight);
            hline(r.x + 1, right - 1, y, GlyphRole::BoxHorizontal);
            put(right, y, GlyphRole::BoxTeeLeft);
            inMethods = method;
            if (++y >= bottom) break;
        }
        canvas_.writeText(r.x + 2, y, text::truncateToWidth(node.lines[i], r.width - 3));
        ++y;
    }
}

void ShapePainter::paintLabel(const PositionedNode& node, int top, int bottom) {
    const int rows = bottom - top;
    const int count = static_cast<int>(node.lines.size());
    if (count == 0 || rows <= 0) return;

    const int first = top + std::max(0, (rows - count) / 2);
    const int inner = std::max(0, node.width - 2);

    for (int i = 0; i < count && first + i < bottom; ++i) {
        std::string line = text::truncateToWidth(node.lines[i], inner);
        int width = text::displayWidth(line);
        int x = node.x + (node.width - width) / 2;
        canvas_.writeText(x, first + i, line);
    }
}

}  // namespace charta
