#include <ragchunk/core/utf8.h>

#include <algorithm>

namespace ragchunk::utf8 {

namespace {

inline bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

CodePoint decodeAt(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return {};
    }

    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    const size_t n = text.size();
    unsigned char c = data[pos];

    if (c < 0x80) {
        return {c, 1};
    }
    if (c >= 0xC2 && c <= 0xDF && pos + 1 < n && isContinuation(data[pos + 1])) {
        return {static_cast<char32_t>(((c & 0x1F) << 6) | (data[pos + 1] & 0x3F)), 2};
    }
    if (c >= 0xE0 && c <= 0xEF && pos + 2 < n && isContinuation(data[pos + 1]) &&
        isContinuation(data[pos + 2])) {
        return {static_cast<char32_t>(((c & 0x0F) << 12) | ((data[pos + 1] & 0x3F) << 6) |
                                      (data[pos + 2] & 0x3F)),
                3};
    }
    if (c >= 0xF0 && c <= 0xF4 && pos + 3 < n && isContinuation(data[pos + 1]) &&
        isContinuation(data[pos + 2]) && isContinuation(data[pos + 3])) {
        return {static_cast<char32_t>(((c & 0x07) << 18) | ((data[pos + 1] & 0x3F) << 12) |
                                      ((data[pos + 2] & 0x3F) << 6) | (data[pos + 3] & 0x3F)),
                4};
    }

    return {c, 1};
}

size_t previousCodePointStart(std::string_view text, size_t pos) {
    if (pos == 0 || text.empty()) {
        return 0;
    }
    pos = std::min(pos, text.size());

    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    size_t start = pos - 1;
    size_t steps = 0;
    while (start > 0 && isContinuation(data[start]) && steps < 3) {
        --start;
        ++steps;
    }

    // Only accept the lead byte if it actually spans up to pos.
    if (decodeAt(text, start).length == pos - start) {
        return start;
    }
    return pos - 1;
}

size_t advanceCodePoints(std::string_view text, size_t pos, size_t count) {
    while (count > 0 && pos < text.size()) {
        pos += decodeAt(text, pos).length;
        --count;
    }
    return std::min(pos, text.size());
}

bool isWhitespace(char32_t cp) {
    switch (cp) {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\v':
        case U'\f':
        case U'\r':
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
        case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isDigit(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || (cp >= 0x0660 && cp <= 0x0669) ||
           (cp >= 0x06F0 && cp <= 0x06F9) || (cp >= 0x0966 && cp <= 0x096F) ||
           (cp >= 0x0E50 && cp <= 0x0E59) || (cp >= 0xFF10 && cp <= 0xFF19);
}

bool isPunctuation(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 0x21 && cp <= 0x2F) || (cp >= 0x3A && cp <= 0x40) ||
               (cp >= 0x5B && cp <= 0x60) || (cp >= 0x7B && cp <= 0x7E);
    }
    return (cp >= 0x00A1 && cp <= 0x00BF && cp != 0x00AA && cp != 0x00B5 && cp != 0x00BA) ||
           (cp >= 0x2010 && cp <= 0x2027) || (cp >= 0x2030 && cp <= 0x205E) ||
           (cp >= 0x3001 && cp <= 0x3003) || (cp >= 0x3008 && cp <= 0x3011) ||
           (cp >= 0x3014 && cp <= 0x301F) || (cp >= 0xFF01 && cp <= 0xFF0F) ||
           (cp >= 0xFF1A && cp <= 0xFF20) || (cp >= 0xFF3B && cp <= 0xFF40) ||
           (cp >= 0xFF5B && cp <= 0xFF65) || cp == 0x0964 || cp == 0x0965 || cp == 0x060C ||
           cp == 0x061B || cp == 0x061F || cp == 0x06D4 || cp == 0x0E2F || cp == 0x0E5A ||
           cp == 0x0E5B || cp == 0x30FB;
}

size_t countCodePoints(std::string_view text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += decodeAt(text, pos).length) {
        ++count;
    }
    return count;
}

size_t countNonWhitespace(std::string_view text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size();) {
        auto cp = decodeAt(text, pos);
        if (!isWhitespace(cp.value)) {
            ++count;
        }
        pos += cp.length;
    }
    return count;
}

std::pair<size_t, size_t> trimRange(std::string_view text, size_t begin, size_t end) {
    end = std::min(end, text.size());
    begin = std::min(begin, end);

    while (begin < end) {
        auto cp = decodeAt(text, begin);
        if (!isWhitespace(cp.value)) {
            break;
        }
        begin += cp.length;
    }
    while (end > begin) {
        size_t prev = previousCodePointStart(text, end);
        if (prev < begin || !isWhitespace(decodeAt(text, prev).value)) {
            break;
        }
        end = prev;
    }
    if (begin >= end) {
        return {end, end};
    }
    return {begin, end};
}

std::string_view trim(std::string_view text) {
    auto [begin, end] = trimRange(text, 0, text.size());
    return text.substr(begin, end - begin);
}

bool isBlank(std::string_view text) {
    return trim(text).empty();
}

std::string normalizeWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool lastWasSpace = false;
    for (size_t pos = 0; pos < text.size();) {
        auto cp = decodeAt(text, pos);
        if (isWhitespace(cp.value)) {
            if (!lastWasSpace) {
                out.push_back(' ');
                lastWasSpace = true;
            }
        } else {
            out.append(text.substr(pos, cp.length));
            lastWasSpace = false;
        }
        pos += cp.length;
    }
    return out;
}

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return out;
}

} // namespace ragchunk::utf8
