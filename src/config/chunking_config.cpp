#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ragchunk/config/chunking_config.h>
#include <ragchunk/config/config_helpers.h>
#include <ragchunk/core/utf8.h>

#include <charconv>
#include <cstdlib>
#include <functional>
#include <unordered_map>

namespace ragchunk::config {

using chunking::ChunkOptions;

namespace {

Error badValue(const std::string& key, const std::string& value, std::string_view expected) {
    return Error{ErrorCode::ConfigurationError,
                 fmt::format("Invalid value '{}' for chunking.{}: expected {}", value, key,
                             expected)};
}

Result<size_t> parseSize(const std::string& key, const std::string& value) {
    size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
        return badValue(key, value, "a non-negative integer");
    }
    return parsed;
}

Result<double> parseDouble(const std::string& key, const std::string& value) {
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
        return badValue(key, value, "a number");
    }
    return parsed;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    auto lowered = utf8::toLowerAscii(value);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    return badValue(key, value, "true or false");
}

Result<ChunkOptions> presetOptions(const std::string& name) {
    auto lowered = utf8::toLowerAscii(name);
    if (lowered == "default" || lowered.empty()) {
        return ChunkOptions{};
    }
    if (lowered == "rag") {
        return ChunkOptions::forRag();
    }
    if (lowered == "korean") {
        return ChunkOptions::forKorean();
    }
    if (lowered == "large_document") {
        return ChunkOptions::forLargeDocument();
    }
    return badValue("preset", name, "default, rag, korean or large_document");
}

Result<void> setStrategy(ChunkOptions& options, const std::string& key, const std::string& value) {
    auto strategy = chunking::parseChunkingStrategy(value);
    if (!strategy) {
        return badValue(key, value,
                        "auto, sentence, paragraph, token, semantic or hierarchical");
    }
    options.strategy = *strategy;
    return {};
}

using Setter = std::function<Result<void>(ChunkingConfig&, const std::string&, const std::string&)>;

Setter sizeField(size_t ChunkOptions::*field) {
    return [field](ChunkingConfig& config, const std::string& key, const std::string& value) {
        auto parsed = parseSize(key, value);
        if (!parsed) {
            return Result<void>(parsed.error());
        }
        config.options.*field = parsed.value();
        return Result<void>();
    };
}

Setter boolField(bool ChunkOptions::*field) {
    return [field](ChunkingConfig& config, const std::string& key, const std::string& value) {
        auto parsed = parseBool(key, value);
        if (!parsed) {
            return Result<void>(parsed.error());
        }
        config.options.*field = parsed.value();
        return Result<void>();
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"strategy",
         [](ChunkingConfig& config, const std::string& key, const std::string& value) {
             return setStrategy(config.options, key, value);
         }},
        {"target_chunk_size", sizeField(&ChunkOptions::target_chunk_size)},
        {"min_chunk_size", sizeField(&ChunkOptions::min_chunk_size)},
        {"max_chunk_size", sizeField(&ChunkOptions::max_chunk_size)},
        {"overlap_size", sizeField(&ChunkOptions::overlap_size)},
        {"language",
         [](ChunkingConfig& config, const std::string&, const std::string& value) {
             if (value.empty() || utf8::toLowerAscii(value) == "auto") {
                 config.options.language_code.reset();
             } else {
                 config.options.language_code = value;
             }
             return Result<void>();
         }},
        {"preserve_sentences", boolField(&ChunkOptions::preserve_sentences)},
        {"preserve_paragraphs", boolField(&ChunkOptions::preserve_paragraphs)},
        {"semantic_similarity_threshold",
         [](ChunkingConfig& config, const std::string& key, const std::string& value) {
             auto parsed = parseDouble(key, value);
             if (!parsed) {
                 return Result<void>(parsed.error());
             }
             config.options.semantic_similarity_threshold = parsed.value();
             return Result<void>();
         }},
        {"enable_chunk_balancing", boolField(&ChunkOptions::enable_chunk_balancing)},
        {"trim_whitespace", boolField(&ChunkOptions::trim_whitespace)},
        {"normalize_whitespace", boolField(&ChunkOptions::normalize_whitespace)},
        {"max_concurrency",
         [](ChunkingConfig& config, const std::string& key, const std::string& value) {
             auto parsed = parseSize(key, value);
             if (!parsed) {
                 return Result<void>(parsed.error());
             }
             config.max_concurrency = parsed.value();
             return Result<void>();
         }},
    };
    return table;
}

} // namespace

Result<ChunkingConfig> parseChunkingConfig(const std::map<std::string, std::string>& values) {
    ChunkingConfig config;

    if (auto preset = values.find("preset"); preset != values.end()) {
        auto options = presetOptions(preset->second);
        if (!options) {
            return options.error();
        }
        config.options = std::move(options).value();
    }

    for (const auto& [key, value] : values) {
        if (key == "preset") {
            continue;
        }
        auto setter = setters().find(key);
        if (setter == setters().end()) {
            spdlog::warn("Ignoring unknown config key chunking.{}", key);
            continue;
        }
        auto applied = setter->second(config, key, value);
        if (!applied) {
            return applied.error();
        }
    }
    return config;
}

Result<void> applyEnvironmentOverrides(ChunkingConfig& config) {
    if (const char* env = std::getenv("RAGCHUNK_STRATEGY"); env && *env) {
        auto applied = setStrategy(config.options, "strategy", env);
        if (!applied) {
            return Error{ErrorCode::ConfigurationError,
                         fmt::format("RAGCHUNK_STRATEGY: {}", applied.error().message)};
        }
    }
    if (const char* env = std::getenv("RAGCHUNK_LANGUAGE"); env && *env) {
        config.options.language_code = std::string(env);
    }
    return {};
}

Result<ChunkingConfig> loadChunkingConfig(const std::string& explicitPath) {
    const auto path = get_config_path(explicitPath);
    const char* envPath = std::getenv("RAGCHUNK_CONFIG");
    const bool requested = !explicitPath.empty() || (envPath && *envPath);

    ChunkingConfig config;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto values = parse_config_section(path, "chunking");
        if (!values) {
            return values.error();
        }
        auto parsed = parseChunkingConfig(values.value());
        if (!parsed) {
            return parsed.error();
        }
        config = std::move(parsed).value();
        config.source = path;
        spdlog::debug("Loaded chunking config from {}", path.string());
    } else if (requested) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Config file '{}' does not exist", path.string())};
    }

    auto overridden = applyEnvironmentOverrides(config);
    if (!overridden) {
        return overridden.error();
    }
    auto valid = config.options.validate();
    if (!valid) {
        return valid.error();
    }
    return config;
}

} // namespace ragchunk::config
