#include "charta/core/TextUtils.h"

#include <algorithm>
#include <array>
#include <utility>

namespace charta {
namespace text {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

using Range = std::pair<char32_t, char32_t>;

// Zero-width: combining marks, joiners, variation selectors
constexpr std::array<Range, 12> ZERO_WIDTH = {{
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200F},
    {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F}, {0xE0100, 0xE01EF},
}};

// East Asian Wide / Fullwidth and emoji presentation blocks
constexpr std::array<Range, 19> WIDE = {{
    {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC},
    {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},
    {0xA000, 0xA4CF}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE30, 0xFE4F},
    {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F}, {0x1F900, 0x1F9FF},
    {0x1FA70, 0x1FAFF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
}};

template <size_t N>
bool inRanges(const std::array<Range, N>& ranges, char32_t cp) {
    auto it = std::upper_bound(ranges.begin(), ranges.end(), cp,
                               [](char32_t value, const Range& r) { return value < r.first; });
    if (it == ranges.begin()) return false;
    --it;
    return cp >= it->first && cp <= it->second;
}

}  // namespace

std::u32string decodeUtf8(std::string_view input) {
    std::u32string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        auto lead = static_cast<unsigned char>(input[i]);
        int length = 0;
        char32_t cp = 0;

        if (lead < 0x80) { length = 1; cp = lead; }
        else if ((lead & 0xE0) == 0xC0) { length = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { length = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { length = 4; cp = lead & 0x07; }
        else {
            out.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        if (i + length > input.size()) {
            out.push_back(REPLACEMENT);
            break;
        }

        bool valid = true;
        for (int k = 1; k < length; ++k) {
            auto cont = static_cast<unsigned char>(input[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(REPLACEMENT);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }
    return out;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        appendUtf8(out, REPLACEMENT);
    }
}

std::string encodeUtf8(char32_t codepoint) {
    std::string out;
    appendUtf8(out, codepoint);
    return out;
}

int codepointWidth(char32_t cp) {
    if (cp == 0) return 0;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
    if (cp < 0x300) return 1;
    if (inRanges(ZERO_WIDTH, cp)) return 0;
    if (inRanges(WIDE, cp)) return 2;
    return 1;
}

int displayWidth(std::string_view input) {
    int width = 0;
    for (char32_t cp : decodeUtf8(input)) {
        width += codepointWidth(cp);
    }
    return width;
}

std::vector<std::string> splitLines(std::string_view input) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = input.find('\n', start);
        std::string_view line = input.substr(start, pos == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return lines;
}

std::string truncateToWidth(std::string_view input, int maxWidth) {
    std::string out;
    int width = 0;
    for (char32_t cp : decodeUtf8(input)) {
        int w = codepointWidth(cp);
        if (width + w > maxWidth) break;
        appendUtf8(out, cp);
        width += w;
    }
    return out;
}

std::vector<std::string> wrapLabel(std::string_view input, int maxWidth) {
    std::vector<std::string> explicitLines = splitLines(input);
    if (maxWidth <= 0) {
        return explicitLines;
    }

    std::vector<std::string> wrapped;
    for (const std::string& line : explicitLines) {
        std::string current;
        int currentWidth = 0;

        auto flush = [&]() {
            wrapped.push_back(current);
            current.clear();
            currentWidth = 0;
        };

        size_t start = 0;
        bool any = false;
        while (start <= line.size()) {
            size_t space = line.find(' ', start);
            std::string word = line.substr(start, space == std::string::npos ? std::string::npos
                                                                              : space - start);
            start = space == std::string::npos ? line.size() + 1 : space + 1;
            if (word.empty()) continue;
            any = true;

            int wordWidth = displayWidth(word);
            int needed = currentWidth == 0 ? wordWidth : currentWidth + 1 + wordWidth;
            if (needed <= maxWidth) {
                if (currentWidth > 0) current += ' ';
                current += word;
                currentWidth = needed;
                continue;
            }

            if (currentWidth > 0) flush();

            // Hard-break words that cannot fit on their own line
            std::u32string codepoints = decodeUtf8(word);
            for (char32_t cp : codepoints) {
                int w = codepointWidth(cp);
                if (currentWidth + w > maxWidth && currentWidth > 0) flush();
                appendUtf8(current, cp);
                currentWidth += w;
            }
        }

        if (currentWidth > 0 || !any) {
            wrapped.push_back(current);
        }
    }
    return wrapped;
}

}  // namespace text
}  // namespace charta
