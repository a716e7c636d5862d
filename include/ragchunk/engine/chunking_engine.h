#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_balancer.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>
#include <ragchunk/embedding/similarity_oracle.h>
#include <ragchunk/engine/chunk_stream.h>
#include <ragchunk/language/language_profile.h>

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ragchunk::engine {

/**
 * Entry point for chunking: validates options, resolves the strategy and language,
 * runs the strategy chunker and the optional balancer.
 *
 * The engine holds no per-call state; one instance may serve many threads as long as
 * the similarity oracle tolerates concurrent calls.
 */
class ChunkingEngine {
public:
    explicit ChunkingEngine(std::shared_ptr<embedding::ISimilarityOracle> oracle = nullptr);

    void setSimilarityOracle(std::shared_ptr<embedding::ISimilarityOracle> oracle);
    bool hasSimilarityOracle() const { return oracle_ != nullptr; }

    /**
     * Chunk text. Blank text gives an empty sequence. Invalid options and Semantic
     * without an oracle fail with ConfigurationError before any work is done.
     */
    Result<std::vector<chunking::Chunk>> chunk(std::string_view text,
                                               const chunking::ChunkOptions& options,
                                               std::stop_token stop = {}) const;

    /**
     * Same chunks as chunk(), produced one at a time. The stream owns a copy of text.
     */
    Result<ChunkStream> chunkStream(std::string text, const chunking::ChunkOptions& options,
                                    std::stop_token stop = {}) const;

    Result<size_t> estimateChunkCount(std::string_view text,
                                      const chunking::ChunkOptions& options) const;

    /**
     * Strategy that chunk() would run. Auto picks Sentence for short texts, then
     * Paragraph for texts with more than three paragraphs, Sentence for more than five
     * sentences and Token otherwise.
     */
    chunking::ChunkingStrategy resolveStrategy(std::string_view text,
                                               const chunking::ChunkOptions& options) const;

    // Explicit language code when set, otherwise detected from the text.
    const language::LanguageProfile& resolveProfile(std::string_view text,
                                                    const chunking::ChunkOptions& options) const;

    static chunking::ChunkBalanceStats balanceStats(const std::vector<chunking::Chunk>& chunks,
                                                    const chunking::ChunkOptions& options);

private:
    Result<std::unique_ptr<chunking::IChunker>>
    prepare(std::string_view text, const chunking::ChunkOptions& options) const;

    std::shared_ptr<embedding::ISimilarityOracle> oracle_;
};

} // namespace ragchunk::engine
