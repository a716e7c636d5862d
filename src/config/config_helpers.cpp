#include <fmt/format.h>
#include <ragchunk/config/config_helpers.h>

#include <fstream>

namespace ragchunk::config {

namespace {

// Drop a trailing "# comment" unless the value is quoted.
std::string strip_inline_comment(std::string value) {
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        const char quote = value.front();
        size_t close = value.find(quote, 1);
        if (close != std::string::npos) {
            return value.substr(0, close + 1);
        }
        return value;
    }
    size_t comment = value.find('#');
    if (comment != std::string::npos) {
        value = value.substr(0, comment);
        trim(value);
    }
    return value;
}

} // namespace

Result<std::map<std::string, std::string>>
parse_config_section(const std::filesystem::path& config_path, const std::string& section) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot open config file '{}'", config_path.string())};
    }

    std::map<std::string, std::string> values;
    std::string line;
    std::string currentSection;
    const std::string dottedPrefix = section + ".";
    size_t lineNumber = 0;

    while (std::getline(file, line)) {
        ++lineNumber;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ConfigurationError,
                             fmt::format("{}:{}: unterminated section header",
                                         config_path.string(), lineNumber)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ConfigurationError,
                         fmt::format("{}:{}: expected key = value", config_path.string(),
                                     lineNumber)};
        }

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        value = unquote(strip_inline_comment(value));

        if (currentSection == section) {
            values[key] = value;
        } else if (currentSection.empty() && key.rfind(dottedPrefix, 0) == 0) {
            values[key.substr(dottedPrefix.size())] = value;
        }
    }

    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("RAGCHUNK_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "ragchunk" / "config.toml";
    }

    return configHome / "ragchunk" / "config.toml";
}

} // namespace ragchunk::config
