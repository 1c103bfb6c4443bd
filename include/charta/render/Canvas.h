#pragma once

#include "charta/core/Types.h"

#include <string>
#include <string_view>
#include <vector>

namespace charta {

/// Fixed-size character grid.
///
/// Cells live in one row-major buffer. A wide glyph occupies its cell and
/// the next one; the second cell holds CONTINUATION and prints nothing.
/// Protected cells (node interiors and borders) refuse later draw() calls.
class Canvas {
public:
    static constexpr char32_t BLANK = U' ';
    static constexpr char32_t CONTINUATION = 0;

    Canvas() = default;
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    /// Glyph at a cell; BLANK outside the grid
    char32_t at(int x, int y) const;

    /// Unconditional write. Returns false outside the grid.
    bool set(int x, int y, char32_t glyph);

    /// Write unless the cell is protected or outside the grid
    bool draw(int x, int y, char32_t glyph);

    /// Write UTF-8 text starting at (x, y); returns the display width written.
    /// Glyphs that would land on a protected cell are skipped when
    /// respectProtection is set.
    int writeText(int x, int y, std::string_view utf8, bool respectProtection = false);

    void protect(const Rect& area);
    bool isProtected(int x, int y) const;

    /// Rows joined by '\n', trailing spaces trimmed, trailing blank rows
    /// dropped, no final newline
    std::string toString() const;

private:
    size_t indexOf(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }
    void clearWideNeighbours(int x, int y);

    int width_ = 0;
    int height_ = 0;
    std::vector<char32_t> cells_;
    std::vector<bool> protected_;
};

}  // namespace charta
