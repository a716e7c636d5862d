#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

namespace ragchunk::chunking {

Result<std::vector<ChunkSpan>> SentenceChunker::planRange(std::string_view text, size_t begin,
                                                          size_t end, const ChunkOptions& options,
                                                          const language::LanguageProfile& profile,
                                                          std::stop_token stop) {
    auto units = detail::sentenceUnits(text, begin, end, profile);

    detail::PackLimits limits;
    limits.max_tokens = options.max_chunk_size;
    limits.overlap_tokens = options.effectiveOverlap();

    auto packed = detail::packUnits(units, limits, nullptr, stop);
    if (!packed) {
        return packed.error();
    }
    return detail::mergeSmallSpans(std::move(packed).value(), text, options.min_chunk_size,
                                   options.max_chunk_size, profile);
}

Result<ChunkPlan> SentenceChunker::plan(std::string_view text, const ChunkOptions& options,
                                        const language::LanguageProfile& profile,
                                        std::stop_token stop) const {
    ChunkPlan result;
    result.strategy = strategy();
    if (utf8::isBlank(text)) {
        return result;
    }

    auto spans = planRange(text, 0, text.size(), options, profile, stop);
    if (!spans) {
        return spans.error();
    }
    result.spans = std::move(spans).value();
    return result;
}

} // namespace ragchunk::chunking
