#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace charta {

/// Glyph style for text output
enum class CharacterSet {
    Ascii,        // 7-bit only: + - | / \ < > ^ v
    Unicode,      // Box-drawing characters
    UnicodeMath,  // Box-drawing with mathematical diagonals
    Compact       // Light lines, every corner and junction collapsed to one dot
};

/// Display name: "ascii", "unicode", "unicode-math", "compact"
const char* characterSetName(CharacterSet style);
std::optional<CharacterSet> parseCharacterSet(std::string_view name);

/// Semantic drawing roles
enum class GlyphRole {
    // Node box
    BoxTopLeft, BoxTopRight, BoxBottomLeft, BoxBottomRight,
    BoxHorizontal, BoxVertical,
    BoxTeeRight, BoxTeeLeft,
    RoundTopLeft, RoundTopRight, RoundBottomLeft, RoundBottomRight,

    // Group boundary
    GroupTopLeft, GroupTopRight, GroupBottomLeft, GroupBottomRight,
    GroupHorizontal, GroupVertical,

    // Shape outlines
    DiagonalUp, DiagonalDown,    // '/' and '\'
    PointLeft, PointRight,       // '<' and '>'
    ArcLeft, ArcRight,           // '(' and ')'
    TerminalStart, TerminalEnd,
    Commit,

    // Edge lines
    LineHorizontal, LineVertical,
    DottedHorizontal, DottedVertical,
    ThickHorizontal, ThickVertical,

    // Edge bends, named by the arms they connect
    CornerDownRight, CornerDownLeft, CornerUpRight, CornerUpLeft,

    // Edge junctions, named by the arm opposite the stem
    TeeUp, TeeDown, TeeRight, TeeLeft,
    Cross,
    Junction,   // Fan-out point whose arms form a straight line

    // Edge heads
    ArrowUp, ArrowDown, ArrowLeft, ArrowRight,
    OpenHead, CrossHead,

    Count
};

constexpr size_t GLYPH_ROLE_COUNT = static_cast<size_t>(GlyphRole::Count);

const char* glyphRoleName(GlyphRole role);

/// Role-to-character table for one style.
///
/// Built-in tables map every role. A table assembled by hand may leave
/// roles unset; lookup() of an unset role throws GlyphUnmappedError.
class GlyphTable {
public:
    /// Empty table labelled with the given style
    explicit GlyphTable(CharacterSet style);

    /// Complete table for a built-in style
    static GlyphTable builtin(CharacterSet style);

    CharacterSet style() const { return style_; }

    GlyphTable& set(GlyphRole role, char32_t glyph);
    GlyphTable& unset(GlyphRole role);
    bool has(GlyphRole role) const;

    /// @throws GlyphUnmappedError when the role has no glyph
    char32_t lookup(GlyphRole role) const;

    /// True when every role has a glyph
    bool isComplete() const;

private:
    CharacterSet style_;
    std::array<char32_t, GLYPH_ROLE_COUNT> glyphs_{};   // 0 = unmapped
};

}  // namespace charta
