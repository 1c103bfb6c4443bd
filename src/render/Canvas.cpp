#include "charta/render/Canvas.h"
#include "charta/core/TextUtils.h"

#include <stdexcept>

namespace charta {

Canvas::Canvas(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Canvas size must not be negative");
    }
    width_ = width;
    height_ = height;
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), BLANK);
    protected_.assign(cells_.size(), false);
}

char32_t Canvas::at(int x, int y) const {
    return inBounds(x, y) ? cells_[indexOf(x, y)] : BLANK;
}

void Canvas::clearWideNeighbours(int x, int y) {
    // Overwriting either half of a wide glyph blanks the other half
    if (cells_[indexOf(x, y)] == CONTINUATION && x > 0) {
        cells_[indexOf(x - 1, y)] = BLANK;
    }
    if (x + 1 < width_ && cells_[indexOf(x + 1, y)] == CONTINUATION) {
        cells_[indexOf(x + 1, y)] = BLANK;
    }
}

bool Canvas::set(int x, int y, char32_t glyph) {
    if (!inBounds(x, y)) {
        return false;
    }
    clearWideNeighbours(x, y);
    cells_[indexOf(x, y)] = glyph;
    return true;
}

bool Canvas::draw(int x, int y, char32_t glyph) {
    if (isProtected(x, y)) {
        return false;
    }
    return set(x, y, glyph);
}

int Canvas::writeText(int x, int y, std::string_view utf8, bool respectProtection) {
    int cursor = x;
    for (char32_t cp : text::decodeUtf8(utf8)) {
        int w = text::codepointWidth(cp);
        if (w == 0) {
            continue;
        }
        if (w == 2) {
            bool fits = inBounds(cursor + 1, y) &&
                        (!respectProtection ||
                         (!isProtected(cursor, y) && !isProtected(cursor + 1, y)));
            if (fits && inBounds(cursor, y)) {
                set(cursor, y, cp);
                clearWideNeighbours(cursor + 1, y);
                cells_[indexOf(cursor + 1, y)] = CONTINUATION;
            }
        } else if (!respectProtection || !isProtected(cursor, y)) {
            set(cursor, y, cp);
        }
        cursor += w;
    }
    return cursor - x;
}

void Canvas::protect(const Rect& area) {
    for (int y = area.top(); y < area.bottom(); ++y) {
        for (int x = area.left(); x < area.right(); ++x) {
            if (inBounds(x, y)) {
                protected_[indexOf(x, y)] = true;
            }
        }
    }
}

bool Canvas::isProtected(int x, int y) const {
    return inBounds(x, y) && protected_[indexOf(x, y)];
}

std::string Canvas::toString() const {
    std::vector<std::string> rows;
    rows.reserve(static_cast<size_t>(height_));

    for (int y = 0; y < height_; ++y) {
        std::string row;
        for (int x = 0; x < width_; ++x) {
            char32_t glyph = cells_[indexOf(x, y)];
            if (glyph != CONTINUATION) {
                text::appendUtf8(row, glyph);
            }
        }
        size_t end = row.find_last_not_of(' ');
        row.erase(end == std::string::npos ? 0 : end + 1);
        rows.push_back(std::move(row));
    }

    while (!rows.empty() && rows.back().empty()) {
        rows.pop_back();
    }

    std::string out;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) out += '\n';
        out += rows[i];
    }
    return out;
}

}  // namespace charta
