#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/types.h>
#include <ragchunk/language/language_profile.h>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace ragchunk::engine {

/**
 * Single-consumer pull iterator over the chunks of one text.
 *
 * Boundaries are planned on the first next(); each call after that builds exactly one
 * chunk, so at most one materialized chunk is held at a time. A stream is not
 * restartable.
 *
 * With enable_chunk_balancing the whole sequence is needed up front: the first pull
 * materializes and balances every chunk and later pulls yield from that buffer. Memory
 * then grows with the full chunk sequence, as it does for ChunkingEngine::chunk().
 */
class ChunkStream {
public:
    ChunkStream(std::shared_ptr<const std::string> text, chunking::ChunkOptions options,
                const language::LanguageProfile& profile,
                std::unique_ptr<chunking::IChunker> chunker, std::stop_token stop);

    ChunkStream(ChunkStream&&) noexcept = default;
    ChunkStream& operator=(ChunkStream&&) noexcept = default;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    /**
     * Next chunk, an empty optional once exhausted, or an error. Cancellation is checked
     * on every call. After an error the stream stays exhausted.
     */
    Result<std::optional<chunking::Chunk>> next();

    // Drain the remaining chunks.
    Result<std::vector<chunking::Chunk>> collect();

    // Known after the first pull.
    std::optional<size_t> totalChunks() const;

    bool exhausted() const { return finished_; }

private:
    Result<void> start();

    std::shared_ptr<const std::string> text_;
    chunking::ChunkOptions options_;
    const language::LanguageProfile* profile_;
    std::unique_ptr<chunking::IChunker> chunker_;
    std::stop_token stop_;

    bool started_ = false;
    bool finished_ = false;
    size_t cursor_ = 0;
    chunking::ChunkPlan plan_;
    std::unique_ptr<chunking::ChunkMaterializer> materializer_;
    std::optional<std::vector<chunking::Chunk>> buffered_;
};

} // namespace ragchunk::engine
