#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

#include <algorithm>

namespace ragchunk::chunking {

namespace {

// Paragraph units, with paragraphs above the maximum replaced by their sentences.
std::vector<detail::TextUnit> paragraphUnits(std::string_view text, const ChunkOptions& options,
                                             const language::LanguageProfile& profile) {
    auto paragraphs = detail::unitsFromBoundaries(text, 0, text.size(),
                                                  profile.findParagraphBoundaries(text), profile);

    std::vector<detail::TextUnit> units;
    units.reserve(paragraphs.size());
    bool afterSplit = false;

    for (const auto& paragraph : paragraphs) {
        if (paragraph.tokens <= options.max_chunk_size) {
            units.push_back(paragraph);
            units.back().break_before = afterSplit && options.preserve_paragraphs;
            afterSplit = false;
            continue;
        }

        auto sentences = detail::sentenceUnits(text, paragraph.start, paragraph.end, profile);
        if (sentences.empty()) {
            continue;
        }
        sentences.front().break_before = options.preserve_paragraphs;
        units.insert(units.end(), sentences.begin(), sentences.end());
        afterSplit = true;
    }
    return units;
}

} // namespace

Result<ChunkPlan> ParagraphChunker::plan(std::string_view text, const ChunkOptions& options,
                                         const language::LanguageProfile& profile,
                                         std::stop_token stop) const {
    ChunkPlan result;
    result.strategy = strategy();
    if (utf8::isBlank(text)) {
        return result;
    }

    detail::PackLimits limits;
    limits.max_tokens = options.max_chunk_size;
    limits.overlap_tokens = options.effectiveOverlap();

    auto spans = detail::packUnits(paragraphUnits(text, options, profile), limits, nullptr, stop);
    if (!spans) {
        return spans.error();
    }
    result.spans = std::move(spans).value();
    return result;
}

size_t ParagraphChunker::estimateChunkCount(std::string_view text, const ChunkOptions& options,
                                            const language::LanguageProfile& profile) const {
    if (utf8::isBlank(text)) {
        return 0;
    }

    const size_t paragraphCount = profile.findParagraphBoundaries(text).size();
    if (paragraphCount == 0) {
        return 1;
    }

    const size_t totalTokens = profile.estimateTokenCount(text);
    const size_t averageTokens = std::max<size_t>(1, totalTokens / paragraphCount);
    const size_t perChunk = std::max<size_t>(1, options.target_chunk_size / averageTokens);
    return (paragraphCount + perChunk - 1) / perChunk;
}

} // namespace ragchunk::chunking
