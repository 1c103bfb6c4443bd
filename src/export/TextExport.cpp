#include "charta/export/TextExport.h"
#include "charta/core/TextUtils.h"
#include "ShapePainter.h"

#include <cstdint>
#include <fstream>
#include <unordered_set>

namespace charta {

namespace {

// Arms of an edge cell: which neighbours the line continues into
enum Arm : uint8_t {
    ArmUp = 1,
    ArmDown = 2,
    ArmLeft = 4,
    ArmRight = 8
};

enum class LineStyle : uint8_t { Solid, Dotted, Thick };

struct EdgeCell {
    uint8_t arms = 0;
    LineStyle style = LineStyle::Solid;
    std::optional<GlyphRole> head;
};

LineStyle lineStyleOf(EdgeKind kind) {
    if (isDotted(kind)) return LineStyle::Dotted;
    if (isThick(kind)) return LineStyle::Thick;
    return LineStyle::Solid;
}

uint8_t armToward(const GridPoint& from, const GridPoint& to) {
    if (to.x > from.x) return ArmRight;
    if (to.x < from.x) return ArmLeft;
    if (to.y > from.y) return ArmDown;
    if (to.y < from.y) return ArmUp;
    return 0;
}

// Arm pointing from a path end into the node whose border it touches
uint8_t armInto(NodeEdge border) {
    switch (border) {
        case NodeEdge::Bottom: return ArmUp;
        case NodeEdge::Top: return ArmDown;
        case NodeEdge::Right: return ArmLeft;
        case NodeEdge::Left: return ArmRight;
    }
    return 0;
}

GlyphRole headRole(EdgeKind kind, uint8_t travel) {
    if (kind == EdgeKind::OpenArrow) return GlyphRole::OpenHead;
    if (kind == EdgeKind::CrossArrow) return GlyphRole::CrossHead;
    switch (travel) {
        case ArmUp: return GlyphRole::ArrowUp;
        case ArmLeft: return GlyphRole::ArrowLeft;
        case ArmRight: return GlyphRole::ArrowRight;
        default: return GlyphRole::ArrowDown;
    }
}

bool isStraight(uint8_t arms) {
    return (arms & (ArmLeft | ArmRight)) == 0 || (arms & (ArmUp | ArmDown)) == 0;
}

GlyphRole resolveRole(uint8_t arms, LineStyle style) {
    if ((arms & (ArmLeft | ArmRight)) == 0) {
        switch (style) {
            case LineStyle::Dotted: return GlyphRole::DottedVertical;
            case LineStyle::Thick: return GlyphRole::ThickVertical;
            case LineStyle::Solid: break;
        }
        return GlyphRole::LineVertical;
    }
    if ((arms & (ArmUp | ArmDown)) == 0) {
        switch (style) {
            case LineStyle::Dotted: return GlyphRole::DottedHorizontal;
            case LineStyle::Thick: return GlyphRole::ThickHorizontal;
            case LineStyle::Solid: break;
        }
        return GlyphRole::LineHorizontal;
    }

    switch (arms) {
        case ArmDown | ArmRight: return GlyphRole::CornerDownRight;
        case ArmDown | ArmLeft: return GlyphRole::CornerDownLeft;
        case ArmUp | ArmRight: return GlyphRole::CornerUpRight;
        case ArmUp | ArmLeft: return GlyphRole::CornerUpLeft;
        case ArmUp | ArmLeft | ArmRight: return GlyphRole::TeeUp;
        case ArmDown | ArmLeft | ArmRight: return GlyphRole::TeeDown;
        case ArmUp | ArmDown | ArmRight: return GlyphRole::TeeRight;
        case ArmUp | ArmDown | ArmLeft: return GlyphRole::TeeLeft;
        default: return GlyphRole::Cross;
    }
}

}  // namespace

TextExport::TextExport(const RenderOptions& options)
    : options_(options) {}

GlyphTable TextExport::glyphTable() const {
    return options_.glyphs ? *options_.glyphs : GlyphTable::builtin(options_.style);
}

std::string TextExport::exportToString(const LayoutResult& layout) {
    return renderCanvas(layout).toString();
}

void TextExport::exportToStream(const LayoutResult& layout, std::ostream& out) {
    out << exportToString(layout);
}

bool TextExport::exportToFile(const LayoutResult& layout, const std::string& filename) {
    // Render first so a failed render leaves no file behind
    std::string text = exportToString(layout);

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << text;
    return static_cast<bool>(file);
}

Canvas TextExport::renderCanvas(const LayoutResult& layout) const {
    if (layout.empty()) {
        return Canvas{};
    }

    const GlyphTable glyphs = glyphTable();
    Canvas canvas(layout.width(), layout.height());

    drawGroups(canvas, layout, glyphs);
    drawNodes(canvas, layout, glyphs);
    drawEdges(canvas, layout, glyphs);
    drawGroupTitles(canvas, layout, glyphs);
    if (options_.drawEdgeLabels) {
        drawEdgeLabels(canvas, layout);
    }
    return canvas;
}

void TextExport::drawGroups(Canvas& canvas, const LayoutResult& layout,
                            const GlyphTable& glyphs) const {
    for (const PositionedGroup& group : layout.groups()) {
        const Rect& r = group.bounds;
        if (r.width < 2 || r.height < 2) continue;

        const int right = r.right() - 1;
        const int bottom = r.bottom() - 1;
        const char32_t horizontal = glyphs.lookup(GlyphRole::GroupHorizontal);
        const char32_t vertical = glyphs.lookup(GlyphRole::GroupVertical);

        for (int x = r.x + 1; x < right; ++x) {
            canvas.set(x, r.y, horizontal);
            canvas.set(x, bottom, horizontal);
        }
        for (int y = r.y + 1; y < bottom; ++y) {
            canvas.set(r.x, y, vertical);
            canvas.set(right, y, vertical);
        }
        canvas.set(r.x, r.y, glyphs.lookup(GlyphRole::GroupTopLeft));
        canvas.set(right, r.y, glyphs.lookup(GlyphRole::GroupTopRight));
        canvas.set(r.x, bottom, glyphs.lookup(GlyphRole::GroupBottomLeft));
        canvas.set(right, bottom, glyphs.lookup(GlyphRole::GroupBottomRight));

    }
}

void TextExport::drawNodes(Canvas& canvas, const LayoutResult& layout,
                           const GlyphTable& glyphs) const {
    // A terminal is a start marker when nothing ranked leads into it
    std::unordered_set<std::string> hasIncoming;
    for (const PositionedEdge& edge : layout.edges()) {
        if (!edge.excluded) {
            hasIncoming.insert(edge.toId);
        }
    }

    ShapePainter painter(canvas, glyphs, layout.direction());
    for (const PositionedNode& node : layout.nodes()) {
        painter.paint(node, hasIncoming.count(node.id) == 0);
        canvas.protect(node.bounds());
    }
}

void TextExport::drawEdges(Canvas& canvas, const LayoutResult& layout,
                           const GlyphTable& glyphs) const {
    std::vector<EdgeCell> cells(static_cast<size_t>(canvas.width()) *
                                static_cast<size_t>(canvas.height()));
    auto cellAt = [&](const GridPoint& p) -> EdgeCell* {
        if (!canvas.inBounds(p.x, p.y)) return nullptr;
        return &cells[static_cast<size_t>(p.y) * static_cast<size_t>(canvas.width()) +
                      static_cast<size_t>(p.x)];
    };
    auto addArms = [&](const GridPoint& p, uint8_t arms, LineStyle style) {
        if (EdgeCell* cell = cellAt(p)) {
            cell->arms |= arms;
            cell->style = style;
        }
    };

    std::vector<GridPoint> junctions;

    for (const PositionedEdge& edge : layout.edges()) {
        if (isInvisible(edge.kind) || edge.waypoints.size() < 2) continue;

        const LineStyle style = lineStyleOf(edge.kind);

        edge.forEachSegment([&](const GridPoint& a, const GridPoint& b) {
            const uint8_t forward = armToward(a, b);
            const uint8_t backward = armToward(b, a);
            const GridPoint step{(b.x > a.x) - (b.x < a.x), (b.y > a.y) - (b.y < a.y)};
            for (GridPoint p = a;; p = p + step) {
                uint8_t arms = 0;
                if (p != a) arms |= backward;
                if (p != b) arms |= forward;
                addArms(p, arms, style);
                if (p == b) break;
            }
        });

        addArms(edge.waypoints.front(), armInto(edge.sourceEdge), style);

        const GridPoint& last = edge.waypoints.back();
        if (hasArrowHead(edge.kind)) {
            const GridPoint& before = edge.waypoints[edge.waypoints.size() - 2];
            if (EdgeCell* cell = cellAt(last)) {
                cell->head = headRole(edge.kind, armToward(before, last));
            }
        } else {
            addArms(last, armInto(edge.targetEdge), style);
        }

        if (edge.junction) {
            junctions.push_back(*edge.junction);
        }
    }

    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            const EdgeCell& cell = *cellAt({x, y});
            if (cell.head) {
                canvas.draw(x, y, glyphs.lookup(*cell.head));
            } else if (cell.arms != 0) {
                canvas.draw(x, y, glyphs.lookup(resolveRole(cell.arms, cell.style)));
            }
        }
    }

    // A junction whose branches line up still gets a visible marker
    for (const GridPoint& p : junctions) {
        const EdgeCell* cell = cellAt(p);
        if (cell && cell->arms != 0 && !cell->head && isStraight(cell->arms)) {
            canvas.draw(p.x, p.y, glyphs.lookup(GlyphRole::Junction));
        }
    }
}

void TextExport::drawGroupTitles(Canvas& canvas, const LayoutResult& layout,
                                 const GlyphTable& glyphs) const {
    const char32_t horizontal = glyphs.lookup(GlyphRole::GroupHorizontal);

    for (const PositionedGroup& group : layout.groups()) {
        const Rect& r = group.bounds;
        if (group.title.empty() || r.width < 2 || r.height < 2) continue;

        const std::string title = " " + group.title + " ";
        const int wanted = text::displayWidth(title);

        // Runs of untouched border cells between the corners
        int bestStart = 0;
        int bestLength = 0;
        int runStart = r.x + 1;
        for (int x = r.x + 1; x <= r.right() - 1; ++x) {
            bool free = x < r.right() - 1 && canvas.at(x, r.y) == horizontal;
            if (free) continue;

            int length = x - runStart;
            if (length >= wanted + 1) {
                bestStart = runStart;
                bestLength = length;
                break;
            }
            if (length > bestLength) {
                bestStart = runStart;
                bestLength = length;
            }
            runStart = x + 1;
        }

        // Keep one border cell ahead of the title
        if (bestLength < 4) continue;
        canvas.writeText(bestStart + 1, r.y, text::truncateToWidth(title, bestLength - 1));
    }
}

void TextExport::drawEdgeLabels(Canvas& canvas, const LayoutResult& layout) const {
    for (const PositionedEdge& edge : layout.edges()) {
        if (!edge.label || !edge.labelPosition || isInvisible(edge.kind)) continue;
        if (edge.label->empty()) continue;

        int width = text::displayWidth(*edge.label);
        canvas.writeText(edge.labelPosition->x - width / 2, edge.labelPosition->y,
                         *edge.label, true);
    }
}

}  // namespace charta
