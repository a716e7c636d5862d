#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>
#include <ragchunk/engine/chunking_engine.h>
#include <ragchunk/engine/text_processor.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace ragchunk::engine {

/**
 * Runs registered text processors in order, then chunks the result.
 * A processor that fails is skipped with a warning and the text passes through
 * unchanged.
 */
class ChunkingPipeline {
public:
    explicit ChunkingPipeline(std::shared_ptr<const ChunkingEngine> engine);

    ChunkingPipeline& addProcessor(std::shared_ptr<ITextProcessor> processor);

    std::string preprocess(std::string text) const;

    Result<std::vector<chunking::Chunk>> run(std::string text,
                                             const chunking::ChunkOptions& options,
                                             std::stop_token stop = {}) const;

    size_t processorCount() const { return processors_.size(); }

private:
    std::shared_ptr<const ChunkingEngine> engine_;
    std::vector<std::shared_ptr<ITextProcessor>> processors_;
};

} // namespace ragchunk::engine
