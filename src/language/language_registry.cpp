#include <spdlog/spdlog.h>
#include <ragchunk/core/utf8.h>
#include <ragchunk/language/language_registry.h>
#include "builtin_profiles.h"

#include <array>

namespace ragchunk::language {

namespace {

// Detection threshold: a script has to cover more than this share of counted characters.
constexpr double kScriptShareThreshold = 0.30;

enum Script : size_t {
    Hangul = 0,
    Kana,
    Han,
    ThaiScript,
    Devanagari,
    ArabicScript,
    Cyrillic,
    VietnameseLatin,
    Latin,
    ScriptCount
};

// Tie-break order, first wins.
constexpr std::array<std::pair<Script, const char*>, 8> kScriptPriority = {{
    {Hangul, "ko"},
    {Kana, "ja"},
    {Han, "zh"},
    {ThaiScript, "th"},
    {Devanagari, "hi"},
    {ArabicScript, "ar"},
    {Cyrillic, "ru"},
    {VietnameseLatin, "vi"},
}};

bool isLatinLetter(char32_t cp) {
    return (cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z') ||
           (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) ||
           (cp >= 0x1E00 && cp <= 0x1EFF);
}

// Letters that only Vietnamese uses among the supported Latin-script languages.
bool isVietnameseLetter(char32_t cp) {
    switch (cp) {
        case 0x0102: // Ă
        case 0x0103: // ă
        case 0x0110: // Đ
        case 0x0111: // đ
        case 0x01A0: // Ơ
        case 0x01A1: // ơ
        case 0x01AF: // Ư
        case 0x01B0: // ư
            return true;
        default:
            return cp >= 0x1EA0 && cp <= 0x1EF9;
    }
}

std::string normalizeCode(std::string_view code) {
    auto trimmed = utf8::trim(code);
    auto cut = trimmed.find_first_of("-_");
    if (cut != std::string_view::npos) {
        trimmed = trimmed.substr(0, cut);
    }
    return utf8::toLowerAscii(trimmed);
}

} // namespace

LanguageRegistry::LanguageRegistry() : profiles_(detail::makeBuiltinProfiles()) {
    spdlog::debug("Language registry initialized with {} profiles", profiles_.size());
}

const LanguageRegistry& LanguageRegistry::instance() {
    static const LanguageRegistry registry;
    return registry;
}

const LanguageProfile* LanguageRegistry::find(std::string_view code) const {
    auto normalized = normalizeCode(code);
    for (const auto& profile : profiles_) {
        if (profile.code() == normalized) {
            return &profile;
        }
    }
    return nullptr;
}

const LanguageProfile& LanguageRegistry::getProfile(std::string_view code) const {
    if (const auto* profile = find(code)) {
        return *profile;
    }
    spdlog::warn("Unsupported language code '{}', falling back to English", code);
    return profiles_.front();
}

const LanguageProfile& LanguageRegistry::getProfile(Language language) const {
    return profiles_.at(static_cast<size_t>(language));
}

bool LanguageRegistry::isSupported(std::string_view code) const {
    return find(code) != nullptr;
}

std::string LanguageRegistry::detectLanguage(std::string_view text) const {
    std::array<size_t, ScriptCount> counts{};
    size_t total = 0;

    for (size_t pos = 0; pos < text.size();) {
        auto cp = utf8::decodeAt(text, pos);
        pos += cp.length;

        const char32_t c = cp.value;
        if (utf8::isWhitespace(c) || utf8::isDigit(c) || utf8::isPunctuation(c)) {
            continue;
        }
        ++total;

        if (utf8::isHangul(c)) {
            ++counts[Hangul];
        } else if (utf8::isKana(c)) {
            ++counts[Kana];
        } else if (utf8::isCjkIdeograph(c)) {
            ++counts[Han];
        } else if (c >= 0x0E00 && c <= 0x0E7F) {
            ++counts[ThaiScript];
        } else if (c >= 0x0900 && c <= 0x097F) {
            ++counts[Devanagari];
        } else if ((c >= 0x0600 && c <= 0x06FF) || (c >= 0x0750 && c <= 0x077F)) {
            ++counts[ArabicScript];
        } else if (c >= 0x0400 && c <= 0x04FF) {
            ++counts[Cyrillic];
        } else if (isLatinLetter(c)) {
            ++counts[Latin];
            if (isVietnameseLetter(c)) {
                ++counts[VietnameseLatin];
            }
        }
    }

    if (total == 0) {
        return "en";
    }

    auto share = [&](size_t count) {
        return static_cast<double>(count) / static_cast<double>(total);
    };

    if (share(counts[Hangul]) > kScriptShareThreshold) {
        return "ko";
    }
    // Japanese mixes kanji with kana; any kana presence decides between ja and zh.
    if (counts[Kana] > 0 && share(counts[Kana] + counts[Han]) > kScriptShareThreshold) {
        return "ja";
    }

    for (const auto& [script, code] : kScriptPriority) {
        if (script == Hangul || script == Kana) {
            continue;
        }
        if (script == VietnameseLatin) {
            // Vietnamese text is Latin script with a high density of its own letters.
            if (share(counts[Latin]) > kScriptShareThreshold &&
                counts[VietnameseLatin] * 10 >= counts[Latin]) {
                return code;
            }
            continue;
        }
        if (share(counts[script]) > kScriptShareThreshold) {
            return code;
        }
    }
    return "en";
}

std::vector<std::string> LanguageRegistry::supportedLanguages() const {
    std::vector<std::string> codes;
    codes.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        codes.push_back(profile.code());
    }
    return codes;
}

} // namespace ragchunk::language
