#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/core/types.h>

#include <optional>
#include <string>

namespace ragchunk::chunking {

/**
 * Configuration for document chunking. Sizes are estimated tokens.
 */
struct ChunkOptions {
    ChunkingStrategy strategy = ChunkingStrategy::Auto;
    size_t target_chunk_size = 512;
    size_t min_chunk_size = 100;
    size_t max_chunk_size = 1024;
    size_t overlap_size = 50;
    std::optional<std::string> language_code; // Unset: detect from the text
    bool preserve_sentences = true;
    bool preserve_paragraphs = true;
    double semantic_similarity_threshold = 0.5; // [-1, 1]
    bool enable_chunk_balancing = false;
    bool trim_whitespace = true;
    bool normalize_whitespace = false;

    // Retrieval-oriented semantic chunking with balancing.
    static ChunkOptions forRag();
    static ChunkOptions forKorean();
    static ChunkOptions forLargeDocument();
    static ChunkOptions fixedSize(size_t size, size_t overlap = 0);

    Result<void> validate() const;

    // Overlap actually applied: never more than half the target, so every chunk
    // advances through the text.
    size_t effectiveOverlap() const;
};

} // namespace ragchunk::chunking
