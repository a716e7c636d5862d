#pragma once

#include <ragchunk/chunking/document_chunker.h>

#include <functional>

namespace ragchunk::chunking::detail {

// A trimmed, non-blank piece of text with its token estimate.
struct TextUnit {
    size_t start = 0;
    size_t end = 0;
    size_t tokens = 0;
    bool break_before = false; // Never share a chunk with the preceding unit
};

// Trimmed units between consecutive boundaries, restricted to [begin, end).
std::vector<TextUnit> unitsFromBoundaries(std::string_view text, size_t begin, size_t end,
                                          const std::vector<size_t>& boundaries,
                                          const language::LanguageProfile& profile);

std::vector<TextUnit> sentenceUnits(std::string_view text, size_t begin, size_t end,
                                    const language::LanguageProfile& profile);

struct PackLimits {
    size_t max_tokens = 0;
    size_t overlap_tokens = 0;
};

// Asked before appending unit `next` to a buffer holding units [first, next) of which
// [fresh, next) are new. Returning true closes the buffer.
using BreakHint =
    std::function<bool(size_t first, size_t fresh, size_t next, size_t bufferTokens)>;

/**
 * Greedy accumulation of units into spans. A chunk closes when the next unit would
 * exceed max_tokens, when the unit is marked break_before, or when the hint asks for
 * it. A unit larger than max_tokens ends up alone. The next chunk starts with trailing
 * whole units of the previous one worth at most overlap_tokens, never all of them.
 */
Result<std::vector<ChunkSpan>> packUnits(const std::vector<TextUnit>& units,
                                         const PackLimits& limits, const BreakHint& hint,
                                         const std::stop_token& stop);

// Merge neighbouring spans while one of them is below min_tokens and the result stays
// within max_tokens.
std::vector<ChunkSpan> mergeSmallSpans(std::vector<ChunkSpan> spans, std::string_view text,
                                       size_t minTokens, size_t maxTokens,
                                       const language::LanguageProfile& profile);

size_t spanTokens(std::string_view text, const ChunkSpan& span,
                  const language::LanguageProfile& profile);

ChunkSpan makeSpan(size_t start, size_t overlapEnd, size_t end);

} // namespace ragchunk::chunking::detail
