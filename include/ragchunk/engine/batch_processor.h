#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>
#include <ragchunk/engine/chunking_engine.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace ragchunk::engine {

/**
 * Chunks many independent texts in parallel.
 *
 * Each text is a separate task on a worker pool; results come back in the order the
 * texts were added.
 */
class BatchProcessor {
public:
    static constexpr size_t kMaxConcurrency = 32;

    explicit BatchProcessor(std::shared_ptr<const ChunkingEngine> engine);

    // Blank texts are skipped.
    BatchProcessor& addText(std::string text);
    BatchProcessor& addTexts(const std::vector<std::string>& texts);

    // Clamped to [1, kMaxConcurrency].
    BatchProcessor& withMaxConcurrency(size_t maxConcurrency);

    /**
     * One chunk sequence per added text, in insertion order. If any text fails, the
     * error of the first failing text (by position) is returned.
     */
    Result<std::vector<std::vector<chunking::Chunk>>>
    process(const chunking::ChunkOptions& options, std::stop_token stop = {}) const;

    size_t totalEstimatedChunks(const chunking::ChunkOptions& options) const;

    void clear() { texts_.clear(); }
    size_t size() const { return texts_.size(); }
    size_t maxConcurrency() const { return maxConcurrency_; }

private:
    std::shared_ptr<const ChunkingEngine> engine_;
    std::vector<std::string> texts_;
    size_t maxConcurrency_;
};

} // namespace ragchunk::engine
