#include <ragchunk/core/utf8.h>
#include <ragchunk/language/language_profile.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace ragchunk::language {

namespace {

constexpr size_t kAbbreviationLookback = 10;

// Polite and formal Korean endings that close a sentence without punctuation.
constexpr std::array<std::string_view, 20> kKoreanEndings = {
    "습니다", "입니다", "됩니다", "습니까", "입니까", "거든요", "잖아요",
    "던데요", "세요",   "에요",   "아요",   "어요",   "여요",   "예요",
    "었다",   "았다",   "였다",   "니다",   "니까",   "죠"};

constexpr std::array<std::string_view, 4> kJapaneseEndings = {"でした", "ました", "です", "ます"};

struct OrdinalUnit {
    std::string_view unit;
    int level;
};

constexpr std::array<OrdinalUnit, 6> kKoreanUnits = {
    {{"편", 1}, {"부", 1}, {"장", 1}, {"절", 2}, {"조", 3}, {"항", 3}}};

constexpr std::array<OrdinalUnit, 7> kChineseUnits = {
    {{"编", 1}, {"篇", 1}, {"章", 1}, {"节", 2}, {"節", 2}, {"条", 3}, {"款", 3}}};

constexpr std::array<OrdinalUnit, 6> kJapaneseUnits = {
    {{"編", 1}, {"部", 1}, {"章", 1}, {"節", 2}, {"条", 3}, {"項", 3}}};

bool isClosingMark(char32_t cp) {
    switch (cp) {
        case U'"':
        case U'\'':
        case U')':
        case U']':
        case U'}':
        case 0x00BB: // »
        case 0x2019: // ’
        case 0x201D: // ”
        case 0x300D: // 」
        case 0x300F: // 』
        case 0x3011: // 】
        case 0xFF09: // ）
            return true;
        default:
            return false;
    }
}

bool isOpeningMark(char32_t cp) {
    switch (cp) {
        case U'"':
        case U'\'':
        case U'(':
        case U'[':
        case U'{':
        case 0x00AB: // «
        case 0x2018: // ‘
        case 0x201C: // “
        case 0x300C: // 「
        case 0x300E: // 『
        case 0xFF08: // （
            return true;
        default:
            return false;
    }
}

bool isCjkNumeral(char32_t cp) {
    switch (cp) {
        case U'一':
        case U'二':
        case U'三':
        case U'四':
        case U'五':
        case U'六':
        case U'七':
        case U'八':
        case U'九':
        case U'十':
        case U'百':
        case U'千':
        case U'零':
        case U'〇':
            return true;
        default:
            return false;
    }
}

bool isRomanNumeral(char32_t cp) {
    switch (cp) {
        case U'I':
        case U'V':
        case U'X':
        case U'L':
        case U'C':
        case U'D':
        case U'M':
            return true;
        default:
            return false;
    }
}

bool isAsciiText(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool startsWithKeyword(std::string_view line, std::string_view keyword) {
    if (line.size() < keyword.size()) {
        return false;
    }
    auto head = line.substr(0, keyword.size());
    if (isAsciiText(keyword)) {
        return utf8::toLowerAscii(head) == utf8::toLowerAscii(keyword);
    }
    return head == keyword;
}

size_t skipSpaces(std::string_view s, size_t pos) {
    while (pos < s.size()) {
        auto cp = utf8::decodeAt(s, pos);
        if (!utf8::isWhitespace(cp.value)) {
            break;
        }
        pos += cp.length;
    }
    return pos;
}

// Consumes digits (any script), upper-case roman numerals or, when allowed, CJK
// numerals. Returns the position after the number, or start when none was found.
size_t consumeNumber(std::string_view s, size_t start, bool allowCjk) {
    size_t pos = start;
    while (pos < s.size()) {
        auto cp = utf8::decodeAt(s, pos);
        if (utf8::isDigit(cp.value) || isRomanNumeral(cp.value) ||
            (allowCjk && isCjkNumeral(cp.value))) {
            pos += cp.length;
        } else {
            break;
        }
    }
    return pos;
}

// A header number has to stand on its own: "Chapter 3:" yes, "Chapter 3rd" no.
bool endsToken(std::string_view s, size_t pos) {
    if (pos >= s.size()) {
        return true;
    }
    auto cp = utf8::decodeAt(s, pos).value;
    return utf8::isWhitespace(cp) || utf8::isPunctuation(cp);
}

bool isCircledNumeral(char32_t cp) {
    return (cp >= 0x2460 && cp <= 0x2473) || (cp >= 0x3220 && cp <= 0x3229);
}

std::string_view stripCarriageReturn(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

bool parseMarkdownHeader(std::string_view line, SectionHeader& header) {
    size_t pos = 0;
    while (pos < line.size() && pos < 3 && line[pos] == ' ') {
        ++pos;
    }

    size_t hashes = 0;
    while (pos + hashes < line.size() && line[pos + hashes] == '#') {
        ++hashes;
    }
    if (hashes == 0 || hashes > 6) {
        return false;
    }
    pos += hashes;
    if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
        return false;
    }

    auto title = utf8::trim(line.substr(pos));
    // Optional closing sequence: "## Title ##"
    while (!title.empty() && title.back() == '#') {
        title.remove_suffix(1);
    }
    title = utf8::trim(title);
    if (title.empty()) {
        return false;
    }

    header.title = std::string(title);
    header.level = static_cast<int>(hashes);
    return true;
}

bool isFenceLine(std::string_view line) {
    auto trimmed = utf8::trim(line);
    return trimmed.substr(0, 3) == "```" || trimmed.substr(0, 3) == "~~~";
}

template <size_t N>
bool parseCjkOrdinal(std::string_view line, std::string_view prefix, bool prefixRequired,
                     bool allowCjkNumerals, const std::array<OrdinalUnit, N>& units, int& level) {
    size_t pos = 0;
    if (line.substr(0, prefix.size()) == prefix) {
        pos = skipSpaces(line, prefix.size());
    } else if (prefixRequired) {
        return false;
    }

    size_t afterNumber = consumeNumber(line, pos, allowCjkNumerals);
    if (afterNumber == pos) {
        return false;
    }
    pos = skipSpaces(line, afterNumber);

    for (const auto& unit : units) {
        if (line.substr(pos, unit.unit.size()) == unit.unit &&
            endsToken(line, pos + unit.unit.size())) {
            level = unit.level;
            return true;
        }
    }
    return false;
}

} // namespace

const char* languageCode(Language language) {
    switch (language) {
        case Language::English: return "en";
        case Language::Korean: return "ko";
        case Language::Chinese: return "zh";
        case Language::Japanese: return "ja";
        case Language::Spanish: return "es";
        case Language::French: return "fr";
        case Language::German: return "de";
        case Language::Arabic: return "ar";
        case Language::Hindi: return "hi";
        case Language::Portuguese: return "pt";
        case Language::Vietnamese: return "vi";
        case Language::Thai: return "th";
        case Language::Russian: return "ru";
    }
    return "en";
}

LanguageProfile::LanguageProfile(Language language, std::string code, std::string name,
                                 double charsPerToken,
                                 const std::vector<std::string>& abbreviations,
                                 std::vector<SectionKeyword> sectionKeywords)
    : language_(language), code_(std::move(code)), name_(std::move(name)),
      charsPerToken_(charsPerToken > 0.0 ? charsPerToken : 4.0),
      sectionKeywords_(std::move(sectionKeywords)) {
    for (const auto& abbreviation : abbreviations) {
        abbreviations_.insert(utf8::toLowerAscii(abbreviation));
    }
}

bool LanguageProfile::isAbbreviation(std::string_view word) const {
    if (word.empty()) {
        return false;
    }
    return abbreviations_.count(utf8::toLowerAscii(word)) > 0;
}

bool LanguageProfile::isTerminator(char32_t cp) const {
    if (cp == U'.' || cp == U'!' || cp == U'?') {
        return true;
    }
    switch (language_) {
        case Language::Chinese:
            return cp == U'。' || cp == U'！' || cp == U'？' || cp == U'；';
        case Language::Japanese:
        case Language::Korean:
            return cp == U'。' || cp == U'！' || cp == U'？';
        case Language::Arabic:
            return cp == 0x061F || cp == 0x06D4;
        case Language::Hindi:
            return cp == 0x0964 || cp == 0x0965;
        default:
            return false;
    }
}

bool LanguageProfile::isSelfDelimitingTerminator(char32_t cp) const {
    return cp == U'。' || cp == U'！' || cp == U'？' || cp == U'；';
}

size_t LanguageProfile::matchLanguageEnding(std::string_view text, size_t pos) const {
    if (language_ == Language::Korean) {
        if (pos == 0) {
            return 0;
        }
        size_t prev = utf8::previousCodePointStart(text, pos);
        if (!utf8::isHangul(utf8::decodeAt(text, prev).value)) {
            return 0;
        }
        for (auto ending : kKoreanEndings) {
            if (text.substr(pos, ending.size()) == ending) {
                return ending.size();
            }
        }
    } else if (language_ == Language::Japanese) {
        for (auto ending : kJapaneseEndings) {
            if (text.substr(pos, ending.size()) == ending) {
                return ending.size();
            }
        }
    }
    return 0;
}

bool LanguageProfile::abbreviationEndsAt(std::string_view text, size_t runStart,
                                         size_t runEnd) const {
    if (abbreviations_.empty() || runStart == 0) {
        return false;
    }

    // Walk back to the previous whitespace, at most kAbbreviationLookback code points.
    size_t wordStart = runStart;
    for (size_t steps = 0; wordStart > 0 && steps < kAbbreviationLookback; ++steps) {
        size_t prev = utf8::previousCodePointStart(text, wordStart);
        if (utf8::isWhitespace(utf8::decodeAt(text, prev).value)) {
            break;
        }
        wordStart = prev;
    }
    while (wordStart < runStart && isOpeningMark(utf8::decodeAt(text, wordStart).value)) {
        wordStart += utf8::decodeAt(text, wordStart).length;
    }

    // The abbreviation includes its first period ("Dr." / "e.g.").
    auto firstStop = utf8::decodeAt(text, runStart);
    size_t wordEnd = std::min(runStart + firstStop.length, runEnd);
    return isAbbreviation(text.substr(wordStart, wordEnd - wordStart));
}

std::vector<size_t> LanguageProfile::findSentenceBoundaries(std::string_view text) const {
    std::vector<size_t> boundaries;
    if (text.empty()) {
        return boundaries;
    }

    auto push = [&boundaries](size_t pos) {
        if (pos > 0 && (boundaries.empty() || boundaries.back() < pos)) {
            boundaries.push_back(pos);
        }
    };

    // Korean sentences quoted inside another sentence are not boundaries.
    const bool trackQuotes = language_ == Language::Korean;
    int parenDepth = 0;
    int cornerDepth = 0;
    bool inSingle = false;
    bool inDouble = false;
    auto track = [&](char32_t cp) {
        switch (cp) {
            case U'(': ++parenDepth; break;
            case U')': parenDepth = std::max(0, parenDepth - 1); break;
            case U'「':
            case U'『': ++cornerDepth; break;
            case U'」':
            case U'』': cornerDepth = std::max(0, cornerDepth - 1); break;
            case U'\'': inSingle = !inSingle; break;
            case U'"': inDouble = !inDouble; break;
            default: break;
        }
    };

    size_t pos = 0;
    while (pos < text.size()) {
        auto cp = utf8::decodeAt(text, pos);
        const bool quoted =
            trackQuotes && (parenDepth > 0 || cornerDepth > 0 || inSingle || inDouble);

        if (isTerminator(cp.value)) {
            const size_t runStart = pos;
            size_t runEnd = pos;
            bool selfDelimiting = false;
            char32_t firstTerminator = cp.value;
            while (runEnd < text.size()) {
                auto next = utf8::decodeAt(text, runEnd);
                if (isTerminator(next.value)) {
                    selfDelimiting = selfDelimiting || isSelfDelimitingTerminator(next.value);
                } else if (!isClosingMark(next.value)) {
                    break;
                }
                if (trackQuotes) {
                    track(next.value);
                }
                runEnd += next.length;
            }

            bool boundary = selfDelimiting || runEnd >= text.size() ||
                            utf8::isWhitespace(utf8::decodeAt(text, runEnd).value);
            if (boundary && firstTerminator == U'.' &&
                abbreviationEndsAt(text, runStart, runEnd)) {
                boundary = false;
            }
            if (boundary && !quoted) {
                push(runEnd);
            }
            pos = runEnd;
            continue;
        }

        if (language_ == Language::Thai && utf8::isWhitespace(cp.value)) {
            size_t runEnd = pos;
            size_t count = 0;
            while (runEnd < text.size()) {
                auto next = utf8::decodeAt(text, runEnd);
                if (!utf8::isWhitespace(next.value)) {
                    break;
                }
                runEnd += next.length;
                ++count;
            }
            if (count >= 2 && runEnd < text.size()) {
                push(pos);
            }
            pos = runEnd;
            continue;
        }

        if (!quoted) {
            size_t endingLength = matchLanguageEnding(text, pos);
            if (endingLength > 0) {
                size_t after = pos + endingLength;
                if (after >= text.size() || utf8::isWhitespace(utf8::decodeAt(text, after).value)) {
                    push(after);
                }
            }
        }

        if (trackQuotes) {
            track(cp.value);
        }
        pos += cp.length;
    }

    if (boundaries.empty() || boundaries.back() != text.size()) {
        boundaries.push_back(text.size());
    }
    return boundaries;
}

std::vector<size_t> LanguageProfile::findParagraphBoundaries(std::string_view text) const {
    std::vector<size_t> boundaries;
    if (text.empty()) {
        return boundaries;
    }

    size_t pos = 0;
    while (pos < text.size()) {
        auto cp = utf8::decodeAt(text, pos);

        if (cp.value == 0x2029) {
            boundaries.push_back(pos + cp.length);
            pos += cp.length;
            continue;
        }

        if (cp.value == U'\n') {
            size_t scan = pos + 1;
            size_t lastNewline = std::string_view::npos;
            while (scan < text.size()) {
                auto next = utf8::decodeAt(text, scan);
                if (!utf8::isWhitespace(next.value)) {
                    break;
                }
                if (next.value == U'\n') {
                    lastNewline = scan;
                }
                scan += next.length;
            }
            if (lastNewline != std::string_view::npos) {
                boundaries.push_back(lastNewline + 1);
                pos = lastNewline + 1;
                continue;
            }
        }

        pos += cp.length;
    }

    if (boundaries.empty() || boundaries.back() != text.size()) {
        boundaries.push_back(text.size());
    }
    return boundaries;
}

bool LanguageProfile::parseKeywordHeader(std::string_view line, SectionHeader& header) const {
    auto trimmed = utf8::trim(line);
    if (trimmed.empty()) {
        return false;
    }

    int level = 0;

    for (const auto& entry : sectionKeywords_) {
        if (!startsWithKeyword(trimmed, entry.keyword)) {
            continue;
        }
        size_t pos = entry.keyword.size();
        // Latin keywords need a separating space, Thai ones ("บทที่1") may run on.
        size_t afterSpace = skipSpaces(trimmed, pos);
        if (afterSpace == pos && isAsciiText(entry.keyword)) {
            continue;
        }
        size_t afterNumber = consumeNumber(trimmed, afterSpace, false);
        if (afterNumber > afterSpace && endsToken(trimmed, afterNumber)) {
            level = entry.level;
            break;
        }
    }

    if (level == 0) {
        switch (language_) {
            case Language::Korean:
                parseCjkOrdinal(trimmed, "제", false, false, kKoreanUnits, level);
                break;
            case Language::Chinese:
                parseCjkOrdinal(trimmed, "第", true, true, kChineseUnits, level);
                break;
            case Language::Japanese:
                parseCjkOrdinal(trimmed, "第", true, true, kJapaneseUnits, level);
                break;
            default:
                break;
        }
    }

    if (level == 0 && (language_ == Language::Chinese || language_ == Language::Japanese ||
                       language_ == Language::Korean)) {
        auto first = utf8::decodeAt(trimmed, 0);
        if (isCircledNumeral(first.value)) {
            level = 3;
        } else if (first.value == 0xFF08 || first.value == U'(') {
            size_t afterNumber = consumeNumber(trimmed, first.length, true);
            if (afterNumber > first.length && afterNumber < trimmed.size()) {
                auto close = utf8::decodeAt(trimmed, afterNumber).value;
                if (close == 0xFF09 || close == U')') {
                    level = 3;
                }
            }
        }
    }

    if (level == 0) {
        return false;
    }

    header.title = std::string(trimmed);
    header.level = level;
    return true;
}

std::vector<SectionHeader> LanguageProfile::findSectionHeaders(std::string_view text) const {
    std::vector<SectionHeader> headers;
    if (text.empty()) {
        return headers;
    }

    bool inFence = false;
    size_t lineStart = 0;
    while (lineStart < text.size()) {
        size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = text.size();
        }
        auto line = stripCarriageReturn(text.substr(lineStart, lineEnd - lineStart));

        if (isFenceLine(line)) {
            inFence = !inFence;
        } else if (!inFence) {
            SectionHeader header;
            if (parseMarkdownHeader(line, header) || parseKeywordHeader(line, header)) {
                header.start = lineStart;
                header.end = lineStart + line.size();
                headers.push_back(std::move(header));
            }
        }

        lineStart = lineEnd + 1;
    }
    return headers;
}

size_t LanguageProfile::estimateTokenCount(std::string_view text) const {
    if (text.empty()) {
        return 0;
    }

    if (language_ == Language::Korean) {
        size_t hangul = 0;
        size_t other = 0;
        for (size_t pos = 0; pos < text.size();) {
            auto cp = utf8::decodeAt(text, pos);
            if (utf8::isHangul(cp.value)) {
                ++hangul;
            } else if (!utf8::isWhitespace(cp.value)) {
                ++other;
            }
            pos += cp.length;
        }
        if (hangul == 0 && other == 0) {
            return 0;
        }
        size_t tokens = (hangul * 2 + 2) / 3 + (other + 3) / 4;
        return std::max<size_t>(1, tokens);
    }

    size_t characters = utf8::countNonWhitespace(text);
    return static_cast<size_t>(std::ceil(static_cast<double>(characters) / charsPerToken_));
}

} // namespace ragchunk::language
