#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace charta {
namespace text {

/// Decode UTF-8; malformed sequences become U+FFFD
std::u32string decodeUtf8(std::string_view input);

void appendUtf8(std::string& out, char32_t codepoint);
std::string encodeUtf8(char32_t codepoint);

/// Terminal cell width of one codepoint: 0 (combining, control), 1 or 2 (wide)
int codepointWidth(char32_t codepoint);

/// Sum of codepointWidth over the decoded string
int displayWidth(std::string_view input);

/// Split on '\n'; a trailing '\r' on each line is dropped
std::vector<std::string> splitLines(std::string_view input);

/// Greedy word wrap by display width. Words wider than maxWidth are broken.
/// maxWidth <= 0 disables wrapping (only explicit line breaks apply).
std::vector<std::string> wrapLabel(std::string_view input, int maxWidth);

/// Longest prefix whose display width fits in maxWidth
std::string truncateToWidth(std::string_view input, int maxWidth);

}  // namespace text
}  // namespace charta
