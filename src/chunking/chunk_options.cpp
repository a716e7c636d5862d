#include <fmt/format.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/utf8.h>

#include <algorithm>
#include <array>

namespace ragchunk::chunking {

const char* toString(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::Auto: return "auto";
        case ChunkingStrategy::Sentence: return "sentence";
        case ChunkingStrategy::Paragraph: return "paragraph";
        case ChunkingStrategy::Token: return "token";
        case ChunkingStrategy::Semantic: return "semantic";
        case ChunkingStrategy::Hierarchical: return "hierarchical";
    }
    return "auto";
}

std::optional<ChunkingStrategy> parseChunkingStrategy(std::string_view name) {
    static constexpr std::array<ChunkingStrategy, 6> kAll = {
        ChunkingStrategy::Auto,     ChunkingStrategy::Sentence, ChunkingStrategy::Paragraph,
        ChunkingStrategy::Token,    ChunkingStrategy::Semantic, ChunkingStrategy::Hierarchical};

    auto normalized = utf8::toLowerAscii(utf8::trim(name));
    for (auto strategy : kAll) {
        if (normalized == toString(strategy)) {
            return strategy;
        }
    }
    return std::nullopt;
}

ChunkOptions ChunkOptions::forRag() {
    ChunkOptions options;
    options.strategy = ChunkingStrategy::Semantic;
    options.target_chunk_size = 512;
    options.min_chunk_size = 128;
    options.max_chunk_size = 1024;
    options.overlap_size = 64;
    options.enable_chunk_balancing = true;
    return options;
}

ChunkOptions ChunkOptions::forKorean() {
    ChunkOptions options;
    options.strategy = ChunkingStrategy::Sentence;
    options.target_chunk_size = 400;
    options.min_chunk_size = 80;
    options.max_chunk_size = 800;
    options.overlap_size = 40;
    options.language_code = "ko";
    options.enable_chunk_balancing = true;
    return options;
}

ChunkOptions ChunkOptions::forLargeDocument() {
    ChunkOptions options;
    options.strategy = ChunkingStrategy::Hierarchical;
    options.target_chunk_size = 768;
    options.min_chunk_size = 200;
    options.max_chunk_size = 1536;
    options.overlap_size = 128;
    options.enable_chunk_balancing = true;
    return options;
}

ChunkOptions ChunkOptions::fixedSize(size_t size, size_t overlap) {
    ChunkOptions options;
    options.strategy = ChunkingStrategy::Token;
    options.target_chunk_size = size;
    options.min_chunk_size = size / 4;
    options.max_chunk_size = size * 2;
    options.overlap_size = overlap;
    options.preserve_sentences = false;
    options.preserve_paragraphs = false;
    return options;
}

Result<void> ChunkOptions::validate() const {
    if (max_chunk_size == 0) {
        return Error{ErrorCode::ConfigurationError, "max_chunk_size must be greater than zero"};
    }
    if (min_chunk_size > target_chunk_size) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("min_chunk_size ({}) exceeds target_chunk_size ({})",
                                 min_chunk_size, target_chunk_size)};
    }
    if (target_chunk_size > max_chunk_size) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("target_chunk_size ({}) exceeds max_chunk_size ({})",
                                 target_chunk_size, max_chunk_size)};
    }
    if (semantic_similarity_threshold < -1.0 || semantic_similarity_threshold > 1.0) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("semantic_similarity_threshold {} is outside [-1, 1]",
                                 semantic_similarity_threshold)};
    }
    return {};
}

size_t ChunkOptions::effectiveOverlap() const {
    return std::min(overlap_size, target_chunk_size / 2);
}

} // namespace ragchunk::chunking
