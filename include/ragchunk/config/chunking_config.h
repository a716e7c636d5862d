#pragma once

#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>

#include <filesystem>
#include <map>
#include <string>

namespace ragchunk::config {

/**
 * Settings read from the [chunking] section of the config file.
 */
struct ChunkingConfig {
    chunking::ChunkOptions options;
    size_t max_concurrency = 0; // 0: hardware concurrency
    std::filesystem::path source; // Empty when defaults were used
};

/**
 * Build a config from parsed key/value pairs. "preset" (rag, korean, large_document,
 * default) is applied first, the remaining keys override it. Unknown keys are ignored
 * with a warning; malformed values fail with ConfigurationError naming the key.
 */
Result<ChunkingConfig> parseChunkingConfig(const std::map<std::string, std::string>& values);

/**
 * Apply RAGCHUNK_STRATEGY and RAGCHUNK_LANGUAGE when set.
 */
Result<void> applyEnvironmentOverrides(ChunkingConfig& config);

/**
 * Resolve the config path (see get_config_path), parse it, apply environment overrides
 * and validate. A missing file at an explicitly requested path is FileNotFound; a
 * missing default file yields the defaults.
 */
Result<ChunkingConfig> loadChunkingConfig(const std::string& explicitPath = "");

} // namespace ragchunk::config
