#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ragchunk::language {

/**
 * Closed set of supported languages. Behaviour that differs per language is
 * dispatched on this tag inside LanguageProfile.
 */
enum class Language {
    English,
    Korean,
    Chinese,
    Japanese,
    Spanish,
    French,
    German,
    Arabic,
    Hindi,
    Portuguese,
    Vietnamese,
    Thai,
    Russian
};

/**
 * A heading or chapter marker found at the start of a line.
 * [start, end) covers the whole header line, title has markers stripped.
 */
struct SectionHeader {
    size_t start = 0;
    size_t end = 0;
    std::string title;
    int level = 1;
};

/**
 * Keyword that introduces a numbered chapter or section ("Chapter 3", "Kapitel 2").
 */
struct SectionKeyword {
    std::string keyword;
    int level = 1;
};

/**
 * Per-language boundary rules and token estimation.
 *
 * Profiles are immutable after construction and safe to share between threads.
 * All offsets are byte offsets into the UTF-8 input. None of the functions fail:
 * unrecognised input degrades to the conservative default (end of text is always
 * a boundary, unknown characters count as one code point).
 */
class LanguageProfile {
public:
    LanguageProfile(Language language, std::string code, std::string name, double charsPerToken,
                    const std::vector<std::string>& abbreviations,
                    std::vector<SectionKeyword> sectionKeywords);

    Language language() const noexcept { return language_; }
    const std::string& code() const noexcept { return code_; }
    const std::string& name() const noexcept { return name_; }
    double charsPerToken() const noexcept { return charsPerToken_; }
    const std::unordered_set<std::string>& abbreviations() const noexcept {
        return abbreviations_;
    }

    bool isAbbreviation(std::string_view word) const;

    /**
     * Offsets immediately after each sentence terminator. The final entry is always
     * text.size() for non-empty text.
     */
    std::vector<size_t> findSentenceBoundaries(std::string_view text) const;

    /**
     * Offsets after each blank-line run (two or more line breaks), plus text.size().
     */
    std::vector<size_t> findParagraphBoundaries(std::string_view text) const;

    std::vector<SectionHeader> findSectionHeaders(std::string_view text) const;

    size_t estimateTokenCount(std::string_view text) const;

private:
    bool isTerminator(char32_t cp) const;
    bool isSelfDelimitingTerminator(char32_t cp) const;
    size_t matchLanguageEnding(std::string_view text, size_t pos) const;
    bool abbreviationEndsAt(std::string_view text, size_t runStart, size_t runEnd) const;
    bool parseKeywordHeader(std::string_view line, SectionHeader& header) const;

    Language language_;
    std::string code_;
    std::string name_;
    double charsPerToken_;
    std::unordered_set<std::string> abbreviations_;
    std::vector<SectionKeyword> sectionKeywords_;
};

const char* languageCode(Language language);

} // namespace ragchunk::language
