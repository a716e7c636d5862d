#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include "unit_packer.h"

#include <algorithm>

namespace ragchunk::chunking {

SemanticChunker::SemanticChunker(std::shared_ptr<embedding::ISimilarityOracle> oracle)
    : oracle_(std::move(oracle)) {}

Result<ChunkPlan> SemanticChunker::plan(std::string_view text, const ChunkOptions& options,
                                        const language::LanguageProfile& profile,
                                        std::stop_token stop) const {
    if (!oracle_) {
        return Error{ErrorCode::ConfigurationError,
                     "Semantic chunking requires a similarity oracle"};
    }

    ChunkPlan result;
    result.strategy = strategy();
    if (utf8::isBlank(text)) {
        return result;
    }

    auto units = detail::sentenceUnits(text, 0, text.size(), profile);

    std::vector<std::string> sentences;
    sentences.reserve(units.size());
    for (const auto& unit : units) {
        sentences.emplace_back(text.substr(unit.start, unit.end - unit.start));
    }

    auto embedded = oracle_->embedBatch(sentences);
    if (!embedded) {
        return embedded.error();
    }
    const auto& embeddings = embedded.value();
    if (embeddings.size() != units.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Oracle '{}' returned {} embeddings for {} sentences",
                                 oracle_->name(), embeddings.size(), units.size())};
    }

    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Chunking cancelled"};
    }

    // Running mean of the embeddings of the chunk's new sentences.
    std::vector<float> mean;
    size_t meanStart = units.size();
    size_t meanCount = 0;
    size_t nextToAdd = 0;
    const auto threshold = static_cast<float>(options.semantic_similarity_threshold);

    auto hint = [&](size_t /*first*/, size_t fresh, size_t next, size_t bufferTokens) {
        if (bufferTokens < options.min_chunk_size) {
            return false;
        }
        if (meanStart != fresh) {
            mean = embeddings[fresh];
            meanCount = 1;
            nextToAdd = fresh + 1;
            meanStart = fresh;
        }
        for (; nextToAdd < next; ++nextToAdd) {
            const auto& e = embeddings[nextToAdd];
            if (e.size() != mean.size()) {
                continue;
            }
            ++meanCount;
            for (size_t k = 0; k < mean.size(); ++k) {
                mean[k] += (e[k] - mean[k]) / static_cast<float>(meanCount);
            }
        }
        return oracle_->similarity(mean, embeddings[next]) < threshold;
    };

    detail::PackLimits limits;
    limits.max_tokens = options.max_chunk_size;
    limits.overlap_tokens = options.effectiveOverlap();

    auto spans = detail::packUnits(units, limits, hint, stop);
    if (!spans) {
        return spans.error();
    }
    result.spans = std::move(spans).value();

    spdlog::debug("Semantic chunker grouped {} sentences into {} chunks (threshold {})",
                  units.size(), result.spans.size(), threshold);
    return result;
}

size_t SemanticChunker::estimateChunkCount(std::string_view text, const ChunkOptions& options,
                                           const language::LanguageProfile& profile) const {
    if (utf8::isBlank(text)) {
        return 0;
    }

    const size_t totalTokens = profile.estimateTokenCount(text);
    if (totalTokens <= options.max_chunk_size) {
        return 1;
    }

    const size_t sentenceCount = std::max<size_t>(1, profile.findSentenceBoundaries(text).size());
    const size_t averageTokens = std::max<size_t>(1, totalTokens / sentenceCount);
    const size_t perChunk = std::max<size_t>(1, options.target_chunk_size / averageTokens);
    return (sentenceCount + perChunk - 1) / perChunk;
}

} // namespace ragchunk::chunking
