#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>
#include <ragchunk/language/language_profile.h>

#include <stop_token>
#include <string_view>
#include <vector>

namespace ragchunk::chunking {

/**
 * Size distribution of a chunk sequence, in estimated tokens.
 */
struct ChunkBalanceStats {
    static constexpr double kMaxBalancedVarianceRatio = 5.0;

    size_t chunk_count = 0;
    size_t min_token_count = 0;
    size_t max_token_count = 0;
    double average_token_count = 0.0;
    double standard_deviation = 0.0; // Population
    double variance_ratio = 0.0;     // max / min, 0 when min is 0
    size_t undersized_chunk_count = 0;
    size_t oversized_chunk_count = 0;

    bool isBalanced() const {
        return variance_ratio <= kMaxBalancedVarianceRatio && undersized_chunk_count == 0 &&
               oversized_chunk_count == 0;
    }
};

/**
 * Post-processing pass that evens out chunk sizes, independent of the strategy that
 * produced the chunks.
 *
 * Pass 1 merges undersized chunks into their right neighbour (a trailing one merges
 * left). Pass 2 re-splits oversized chunks along sentences, falling back to words for
 * sentences that alone exceed the maximum. Indices, totals and parent references are
 * rewritten afterwards; a parent reference that would land on a chunk outside the
 * child's section path moves up to the nearest ancestor that still encloses it, or is
 * dropped.
 *
 * text is the document the chunks were produced from. Split fragments are cut from
 * their chunk's source range, so their offsets always address text.
 */
class ChunkBalancer {
public:
    Result<std::vector<Chunk>> balance(std::vector<Chunk> chunks, std::string_view text,
                                       const ChunkOptions& options,
                                       const language::LanguageProfile& profile,
                                       std::stop_token stop = {}) const;

    static ChunkBalanceStats calculateStats(const std::vector<Chunk>& chunks,
                                            const ChunkOptions& options);
};

} // namespace ragchunk::chunking
