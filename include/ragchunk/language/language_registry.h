#pragma once

#include <ragchunk/language/language_profile.h>

#include <string>
#include <string_view>
#include <vector>

namespace ragchunk::language {

/**
 * Process-wide table of the built-in language profiles.
 *
 * Populated once on first use and read-only afterwards, so references returned here
 * stay valid for the lifetime of the process and may be used from any thread.
 */
class LanguageRegistry {
public:
    static const LanguageRegistry& instance();

    /**
     * Lookup by ISO 639-1 code. Case-insensitive, region suffixes ("ko-KR", "pt_BR") are
     * ignored. Unknown codes fall back to English with a warning.
     */
    const LanguageProfile& getProfile(std::string_view code) const;
    const LanguageProfile& getProfile(Language language) const;

    bool isSupported(std::string_view code) const;

    /**
     * Guess the dominant script of text. Returns "en" when nothing counts.
     */
    std::string detectLanguage(std::string_view text) const;

    const LanguageProfile& detectProfile(std::string_view text) const {
        return getProfile(detectLanguage(text));
    }

    const LanguageProfile& defaultProfile() const { return getProfile(Language::English); }

    std::vector<std::string> supportedLanguages() const;

    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;

private:
    LanguageRegistry();

    const LanguageProfile* find(std::string_view code) const;

    std::vector<LanguageProfile> profiles_;
};

} // namespace ragchunk::language
