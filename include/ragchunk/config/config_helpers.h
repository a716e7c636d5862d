#pragma once

#include <ragchunk/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace ragchunk::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * All key/value pairs of one [section] of a TOML-style file. Keys written as
 * "section.key" outside any section are included too. Inline comments are stripped
 * from unquoted values.
 */
Result<std::map<std::string, std::string>>
parse_config_section(const std::filesystem::path& config_path, const std::string& section);

/**
 * Config file location: override_path when given, else $RAGCHUNK_CONFIG, else
 * $XDG_CONFIG_HOME/ragchunk/config.toml, else ~/.config/ragchunk/config.toml.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace ragchunk::config
