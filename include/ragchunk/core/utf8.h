#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace ragchunk::utf8 {

// Decoded code point and the number of bytes it occupies. Invalid or truncated
// sequences decode to the lead byte with length 1 so scanning always advances.
struct CodePoint {
    char32_t value = 0;
    size_t length = 0;
};

CodePoint decodeAt(std::string_view text, size_t pos);

// Byte offset of the code point that ends right before pos.
size_t previousCodePointStart(std::string_view text, size_t pos);

// Advance pos by up to count code points, stopping at text.size().
size_t advanceCodePoints(std::string_view text, size_t pos, size_t count);

bool isWhitespace(char32_t cp);
bool isDigit(char32_t cp);
bool isPunctuation(char32_t cp);

inline bool isHangul(char32_t cp) {
    return (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0x1100 && cp <= 0x11FF) ||
           (cp >= 0x3130 && cp <= 0x318F);
}

inline bool isKana(char32_t cp) {
    return (cp >= 0x3040 && cp <= 0x30FF) || (cp >= 0x31F0 && cp <= 0x31FF);
}

inline bool isCjkIdeograph(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
           (cp >= 0xF900 && cp <= 0xFAFF);
}

size_t countCodePoints(std::string_view text);
size_t countNonWhitespace(std::string_view text);

// Whitespace trimming that understands multi-byte spaces (U+3000, U+00A0, ...).
std::string_view trim(std::string_view text);

// Narrow [begin, end) so that it starts and ends on non-whitespace. Returns an empty
// range positioned at end when the slice is blank.
std::pair<size_t, size_t> trimRange(std::string_view text, size_t begin, size_t end);

bool isBlank(std::string_view text);

// Collapse every whitespace run into a single ASCII space.
std::string normalizeWhitespace(std::string_view text);

std::string toLowerAscii(std::string_view text);

} // namespace ragchunk::utf8
