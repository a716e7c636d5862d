#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ragchunk::chunking {

/**
 * Chunking strategies for document segmentation
 */
enum class ChunkingStrategy {
    Auto,        // Picked per input by the engine
    Sentence,    // Sentence boundary accumulation
    Paragraph,   // Paragraph boundaries, long paragraphs split by sentence
    Token,       // Word accumulation up to the target token count
    Semantic,    // Embedding similarity grouping
    Hierarchical // Follows document headings
};

const char* toString(ChunkingStrategy strategy);

// Case-insensitive. Accepts "auto", "sentence", "paragraph", "token", "semantic" and
// "hierarchical".
std::optional<ChunkingStrategy> parseChunkingStrategy(std::string_view name);

/**
 * Where a chunk came from in the source text. Offsets are UTF-8 byte offsets.
 */
struct ChunkLocation {
    size_t start_position = 0; // Includes any overlap carried over from the previous chunk
    size_t end_position = 0;
    size_t start_line = 1; // 1-based
    size_t end_line = 1;
    std::string section_path; // "Title/Sub", empty outside hierarchical chunking
};

struct ChunkMetadata {
    size_t estimated_token_count = 0;
    ChunkingStrategy strategy = ChunkingStrategy::Sentence;
    std::string language_code;
    bool starts_at_sentence_boundary = false;
    bool ends_at_sentence_boundary = false;
    bool contains_section_header = false;
    std::string overlap_from_previous;
    double quality_score = 1.0;

    // Hierarchical chunking
    std::optional<int> hierarchy_level;
    std::optional<std::string> parent_id;
    std::optional<std::string> section_title;
};

/**
 * Represents a single chunk of a document
 */
struct Chunk {
    std::string id;
    size_t index = 0;
    size_t total_chunks = 0;
    std::string content;
    ChunkLocation location;
    ChunkMetadata metadata;

    bool isFirst() const { return index == 0; }
    bool isLast() const { return total_chunks == 0 || index + 1 == total_chunks; }
    bool hasOverlap() const { return !metadata.overlap_from_previous.empty(); }
};

} // namespace ragchunk::chunking

#include <fmt/format.h>
template <> struct fmt::formatter<ragchunk::chunking::ChunkingStrategy> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(ragchunk::chunking::ChunkingStrategy strategy, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ragchunk::chunking::toString(strategy));
    }
};
