#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>

#include <algorithm>
#include <functional>

namespace ragchunk::chunking {

std::string computeDocumentHash(std::string_view text) {
    return fmt::format("{:016x}", std::hash<std::string_view>{}(text));
}

ChunkMaterializer::ChunkMaterializer(std::string_view text, const ChunkOptions& options,
                                     const language::LanguageProfile& profile)
    : text_(text), options_(options), profile_(&profile), documentHash_(computeDocumentHash(text)),
      sentenceBoundaries_(profile.findSentenceBoundaries(text)) {
    lineStarts_.push_back(0);
    for (size_t pos = text_.find('\n'); pos != std::string_view::npos;
         pos = text_.find('\n', pos + 1)) {
        lineStarts_.push_back(pos + 1);
    }
}

std::string ChunkMaterializer::chunkId(size_t n) const {
    return fmt::format("{}_chunk_{}", documentHash_, n);
}

size_t ChunkMaterializer::lineAt(size_t offset) const {
    return static_cast<size_t>(
        std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset) - lineStarts_.begin());
}

bool ChunkMaterializer::startsAtSentenceBoundary(size_t offset) const {
    auto it = std::upper_bound(sentenceBoundaries_.begin(), sentenceBoundaries_.end(), offset);
    const size_t previous = it == sentenceBoundaries_.begin() ? 0 : *std::prev(it);
    return utf8::isBlank(text_.substr(previous, offset - previous));
}

bool ChunkMaterializer::endsAtSentenceBoundary(size_t offset) const {
    auto it = std::lower_bound(sentenceBoundaries_.begin(), sentenceBoundaries_.end(), offset);
    if (it == sentenceBoundaries_.end()) {
        return false;
    }
    return utf8::isBlank(text_.substr(offset, *it - offset));
}

Chunk ChunkMaterializer::materialize(const ChunkPlan& plan, size_t n) const {
    const auto& span = plan.spans.at(n);
    auto raw = text_.substr(span.start, span.end - span.start);

    Chunk chunk;
    chunk.id = chunkId(n);
    chunk.index = n;
    chunk.total_chunks = plan.spans.size();
    chunk.content = options_.trim_whitespace ? std::string(utf8::trim(raw)) : std::string(raw);
    if (options_.normalize_whitespace) {
        chunk.content = utf8::normalizeWhitespace(chunk.content);
    }

    chunk.location.start_position = span.start;
    chunk.location.end_position = span.end;
    chunk.location.start_line = lineAt(span.start);
    chunk.location.end_line = lineAt(span.end > span.start ? span.end - 1 : span.end);
    chunk.location.section_path = span.section_path;

    auto& meta = chunk.metadata;
    meta.estimated_token_count = profile_->estimateTokenCount(chunk.content);
    meta.strategy = plan.strategy;
    meta.language_code = profile_->code();
    meta.starts_at_sentence_boundary = startsAtSentenceBoundary(span.start);
    meta.ends_at_sentence_boundary = endsAtSentenceBoundary(span.end);
    meta.contains_section_header = span.contains_section_header;
    if (span.overlap_end > span.start) {
        meta.overlap_from_previous =
            std::string(utf8::trim(text_.substr(span.start, span.overlap_end - span.start)));
    }
    meta.quality_score = span.quality_score;
    meta.hierarchy_level = span.hierarchy_level;
    meta.section_title = span.section_title;
    if (span.parent_span) {
        meta.parent_id = chunkId(*span.parent_span);
    }
    return chunk;
}

Result<std::vector<Chunk>> IChunker::chunk(std::string_view text, const ChunkOptions& options,
                                           const language::LanguageProfile& profile,
                                           std::stop_token stop) const {
    auto planned = plan(text, options, profile, stop);
    if (!planned) {
        return planned.error();
    }

    const auto& chunkPlan = planned.value();
    ChunkMaterializer materializer(text, options, profile);

    std::vector<Chunk> chunks;
    chunks.reserve(chunkPlan.spans.size());
    for (size_t i = 0; i < chunkPlan.spans.size(); ++i) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
        }
        chunks.push_back(materializer.materialize(chunkPlan, i));
    }

    spdlog::debug("{} chunker produced {} chunks ({} bytes, language {})", name(), chunks.size(),
                  text.size(), profile.code());
    return chunks;
}

size_t IChunker::estimateChunkCount(std::string_view text, const ChunkOptions& options,
                                    const language::LanguageProfile& profile) const {
    if (utf8::isBlank(text)) {
        return 0;
    }

    const size_t totalTokens = profile.estimateTokenCount(text);
    if (totalTokens <= options.max_chunk_size) {
        return 1;
    }

    // Estimate based on target size with overlap
    size_t effectiveSize = options.target_chunk_size > options.effectiveOverlap()
                               ? options.target_chunk_size - options.effectiveOverlap()
                               : options.target_chunk_size / 2;
    effectiveSize = std::max<size_t>(1, effectiveSize);
    return (totalTokens + effectiveSize - 1) / effectiveSize;
}

Result<std::unique_ptr<IChunker>>
createChunker(ChunkingStrategy strategy, std::shared_ptr<embedding::ISimilarityOracle> oracle) {
    switch (strategy) {
        case ChunkingStrategy::Sentence:
            return std::unique_ptr<IChunker>(std::make_unique<SentenceChunker>());

        case ChunkingStrategy::Paragraph:
            return std::unique_ptr<IChunker>(std::make_unique<ParagraphChunker>());

        case ChunkingStrategy::Token:
            return std::unique_ptr<IChunker>(std::make_unique<TokenChunker>());

        case ChunkingStrategy::Semantic:
            if (!oracle) {
                return Error{ErrorCode::ConfigurationError,
                             "Semantic chunking requires a similarity oracle"};
            }
            return std::unique_ptr<IChunker>(std::make_unique<SemanticChunker>(std::move(oracle)));

        case ChunkingStrategy::Hierarchical:
            return std::unique_ptr<IChunker>(std::make_unique<HierarchicalChunker>());

        case ChunkingStrategy::Auto:
            break;
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("No chunker for strategy '{}'", toString(strategy))};
}

} // namespace ragchunk::chunking
