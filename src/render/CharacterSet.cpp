#include "charta/render/CharacterSet.h"
#include "charta/core/Errors.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace charta {

namespace {

using R = GlyphRole;

constexpr const char* ROLE_NAMES[GLYPH_ROLE_COUNT] = {
    "box-top-left", "box-top-right", "box-bottom-left", "box-bottom-right",
    "box-horizontal", "box-vertical",
    "box-tee-right", "box-tee-left",
    "round-top-left", "round-top-right", "round-bottom-left", "round-bottom-right",
    "group-top-left", "group-top-right", "group-bottom-left", "group-bottom-right",
    "group-horizontal", "group-vertical",
    "diagonal-up", "diagonal-down",
    "point-left", "point-right",
    "arc-left", "arc-right",
    "terminal-start", "terminal-end",
    "commit",
    "line-horizontal", "line-vertical",
    "dotted-horizontal", "dotted-vertical",
    "thick-horizontal", "thick-vertical",
    "corner-down-right", "corner-down-left", "corner-up-right", "corner-up-left",
    "tee-up", "tee-down", "tee-right", "tee-left",
    "cross",
    "junction",
    "arrow-up", "arrow-down", "arrow-left", "arrow-right",
    "open-head", "cross-head",
};

// Roles shared by every box-drawing style
void fillUnicodeBase(GlyphTable& t) {
    t.set(R::BoxTopLeft, U'┌').set(R::BoxTopRight, U'┐')
     .set(R::BoxBottomLeft, U'└').set(R::BoxBottomRight, U'┘')
     .set(R::BoxHorizontal, U'─').set(R::BoxVertical, U'│')
     .set(R::BoxTeeRight, U'├').set(R::BoxTeeLeft, U'┤')
     .set(R::RoundTopLeft, U'╭').set(R::RoundTopRight, U'╮')
     .set(R::RoundBottomLeft, U'╰').set(R::RoundBottomRight, U'╯')
     .set(R::GroupTopLeft, U'╔').set(R::GroupTopRight, U'╗')
     .set(R::GroupBottomLeft, U'╚').set(R::GroupBottomRight, U'╝')
     .set(R::GroupHorizontal, U'═').set(R::GroupVertical, U'║')
     .set(R::DiagonalUp, U'/').set(R::DiagonalDown, U'\\')
     .set(R::PointLeft, U'<').set(R::PointRight, U'>')
     .set(R::ArcLeft, U'(').set(R::ArcRight, U')')
     .set(R::TerminalStart, U'●').set(R::TerminalEnd, U'○')
     .set(R::Commit, U'○')
     .set(R::LineHorizontal, U'─').set(R::LineVertical, U'│')
     .set(R::DottedHorizontal, U'┄').set(R::DottedVertical, U'┆')
     .set(R::ThickHorizontal, U'━').set(R::ThickVertical, U'┃')
     .set(R::CornerDownRight, U'┌').set(R::CornerDownLeft, U'┐')
     .set(R::CornerUpRight, U'└').set(R::CornerUpLeft, U'┘')
     .set(R::TeeUp, U'┴').set(R::TeeDown, U'┬')
     .set(R::TeeRight, U'├').set(R::TeeLeft, U'┤')
     .set(R::Cross, U'┼').set(R::Junction, U'┼')
     .set(R::ArrowUp, U'▲').set(R::ArrowDown, U'▼')
     .set(R::ArrowLeft, U'◀').set(R::ArrowRight, U'▶')
     .set(R::OpenHead, U'○').set(R::CrossHead, U'×');
}

void fillAscii(GlyphTable& t) {
    t.set(R::BoxTopLeft, U'+').set(R::BoxTopRight, U'+')
     .set(R::BoxBottomLeft, U'+').set(R::BoxBottomRight, U'+')
     .set(R::BoxHorizontal, U'-').set(R::BoxVertical, U'|')
     .set(R::BoxTeeRight, U'+').set(R::BoxTeeLeft, U'+')
     .set(R::RoundTopLeft, U'+').set(R::RoundTopRight, U'+')
     .set(R::RoundBottomLeft, U'+').set(R::RoundBottomRight, U'+')
     .set(R::GroupTopLeft, U'#').set(R::GroupTopRight, U'#')
     .set(R::GroupBottomLeft, U'#').set(R::GroupBottomRight, U'#')
     .set(R::GroupHorizontal, U'=').set(R::GroupVertical, U'#')
     .set(R::DiagonalUp, U'/').set(R::DiagonalDown, U'\\')
     .set(R::PointLeft, U'<').set(R::PointRight, U'>')
     .set(R::ArcLeft, U'(').set(R::ArcRight, U')')
     .set(R::TerminalStart, U'*').set(R::TerminalEnd, U'o')
     .set(R::Commit, U'*')
     .set(R::LineHorizontal, U'-').set(R::LineVertical, U'|')
     .set(R::DottedHorizontal, U'.').set(R::DottedVertical, U':')
     .set(R::ThickHorizontal, U'=').set(R::ThickVertical, U'H')
     .set(R::CornerDownRight, U'+').set(R::CornerDownLeft, U'+')
     .set(R::CornerUpRight, U'+').set(R::CornerUpLeft, U'+')
     .set(R::TeeUp, U'+').set(R::TeeDown, U'+')
     .set(R::TeeRight, U'+').set(R::TeeLeft, U'+')
     .set(R::Cross, U'+').set(R::Junction, U'+')
     .set(R::ArrowUp, U'^').set(R::ArrowDown, U'v')
     .set(R::ArrowLeft, U'<').set(R::ArrowRight, U'>')
     .set(R::OpenHead, U'o').set(R::CrossHead, U'x');
}

void fillUnicodeMath(GlyphTable& t) {
    fillUnicodeBase(t);
    t.set(R::DiagonalUp, U'⟋').set(R::DiagonalDown, U'⟍')
     .set(R::OpenHead, U'∘').set(R::CrossHead, U'⨯');
}

void fillCompact(GlyphTable& t) {
    fillUnicodeBase(t);
    for (R role : {R::BoxTopLeft, R::BoxTopRight, R::BoxBottomLeft, R::BoxBottomRight,
                   R::BoxTeeRight, R::BoxTeeLeft,
                   R::RoundTopLeft, R::RoundTopRight, R::RoundBottomLeft, R::RoundBottomRight,
                   R::CornerDownRight, R::CornerDownLeft, R::CornerUpRight, R::CornerUpLeft,
                   R::TeeUp, R::TeeDown, R::TeeRight, R::TeeLeft, R::Cross}) {
        t.set(role, U'·');
    }
    t.set(R::GroupTopLeft, U'◇').set(R::GroupTopRight, U'◇')
     .set(R::GroupBottomLeft, U'◇').set(R::GroupBottomRight, U'◇')
     .set(R::GroupHorizontal, U'─').set(R::GroupVertical, U'│')
     .set(R::DiagonalUp, U'╱').set(R::DiagonalDown, U'╲')
     .set(R::Junction, U'◆')
     .set(R::ArrowUp, U'▴').set(R::ArrowDown, U'▾')
     .set(R::ArrowLeft, U'◂').set(R::ArrowRight, U'▸');
}

}  // namespace

const char* characterSetName(CharacterSet style) {
    switch (style) {
        case CharacterSet::Ascii: return "ascii";
        case CharacterSet::Unicode: return "unicode";
        case CharacterSet::UnicodeMath: return "unicode-math";
        case CharacterSet::Compact: return "compact";
    }
    return "unicode";
}

std::optional<CharacterSet> parseCharacterSet(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "ascii") return CharacterSet::Ascii;
    if (key == "unicode") return CharacterSet::Unicode;
    if (key == "unicode-math" || key == "math") return CharacterSet::UnicodeMath;
    if (key == "compact") return CharacterSet::Compact;
    return std::nullopt;
}

const char* glyphRoleName(GlyphRole role) {
    auto index = static_cast<size_t>(role);
    return index < GLYPH_ROLE_COUNT ? ROLE_NAMES[index] : "unknown";
}

GlyphTable::GlyphTable(CharacterSet style) : style_(style) {}

GlyphTable GlyphTable::builtin(CharacterSet style) {
    GlyphTable table(style);
    switch (style) {
        case CharacterSet::Ascii: fillAscii(table); break;
        case CharacterSet::Unicode: fillUnicodeBase(table); break;
        case CharacterSet::UnicodeMath: fillUnicodeMath(table); break;
        case CharacterSet::Compact: fillCompact(table); break;
    }
    return table;
}

GlyphTable& GlyphTable::set(GlyphRole role, char32_t glyph) {
    glyphs_.at(static_cast<size_t>(role)) = glyph;
    return *this;
}

GlyphTable& GlyphTable::unset(GlyphRole role) {
    glyphs_.at(static_cast<size_t>(role)) = 0;
    return *this;
}

bool GlyphTable::has(GlyphRole role) const {
    auto index = static_cast<size_t>(role);
    return index < GLYPH_ROLE_COUNT && glyphs_[index] != 0;
}

char32_t GlyphTable::lookup(GlyphRole role) const {
    if (!has(role)) {
        throw GlyphUnmappedError(glyphRoleName(role), characterSetName(style_));
    }
    return glyphs_[static_cast<size_t>(role)];
}

bool GlyphTable::isComplete() const {
    return std::none_of(glyphs_.begin(), glyphs_.end(), [](char32_t g) { return g == 0; });
}

}  // namespace charta
