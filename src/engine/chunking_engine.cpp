#include <spdlog/spdlog.h>
#include <ragchunk/core/utf8.h>
#include <ragchunk/engine/chunking_engine.h>
#include <ragchunk/language/language_registry.h>

namespace ragchunk::engine {

using chunking::Chunk;
using chunking::ChunkingStrategy;
using chunking::ChunkOptions;

namespace {

constexpr size_t kAutoParagraphThreshold = 3;
constexpr size_t kAutoSentenceThreshold = 5;

} // namespace

ChunkingEngine::ChunkingEngine(std::shared_ptr<embedding::ISimilarityOracle> oracle)
    : oracle_(std::move(oracle)) {
    spdlog::debug("ChunkingEngine created (similarity oracle: {})",
                  oracle_ ? oracle_->name() : std::string("none"));
}

void ChunkingEngine::setSimilarityOracle(std::shared_ptr<embedding::ISimilarityOracle> oracle) {
    oracle_ = std::move(oracle);
}

const language::LanguageProfile&
ChunkingEngine::resolveProfile(std::string_view text, const ChunkOptions& options) const {
    const auto& registry = language::LanguageRegistry::instance();
    if (options.language_code && !options.language_code->empty()) {
        return registry.getProfile(*options.language_code);
    }
    return registry.detectProfile(text);
}

ChunkingStrategy ChunkingEngine::resolveStrategy(std::string_view text,
                                                 const ChunkOptions& options) const {
    if (options.strategy != ChunkingStrategy::Auto) {
        return options.strategy;
    }

    const auto& profile = resolveProfile(text, options);
    if (profile.estimateTokenCount(text) <= options.target_chunk_size * 2) {
        return ChunkingStrategy::Sentence;
    }
    if (profile.findParagraphBoundaries(text).size() > kAutoParagraphThreshold) {
        return ChunkingStrategy::Paragraph;
    }
    if (profile.findSentenceBoundaries(text).size() > kAutoSentenceThreshold) {
        return ChunkingStrategy::Sentence;
    }
    return ChunkingStrategy::Token;
}

Result<std::unique_ptr<chunking::IChunker>>
ChunkingEngine::prepare(std::string_view text, const ChunkOptions& options) const {
    auto valid = options.validate();
    if (!valid) {
        return valid.error();
    }

    const auto strategy = resolveStrategy(text, options);
    if (options.strategy == ChunkingStrategy::Auto) {
        spdlog::debug("Auto strategy resolved to {}", strategy);
    }
    return chunking::createChunker(strategy, oracle_);
}

Result<std::vector<Chunk>> ChunkingEngine::chunk(std::string_view text, const ChunkOptions& options,
                                                 std::stop_token stop) const {
    auto chunker = prepare(text, options);
    if (!chunker) {
        return chunker.error();
    }
    if (utf8::isBlank(text)) {
        return std::vector<Chunk>{};
    }

    const auto& profile = resolveProfile(text, options);
    auto chunks = chunker.value()->chunk(text, options, profile, stop);
    if (!chunks || !options.enable_chunk_balancing) {
        return chunks;
    }
    return chunking::ChunkBalancer{}.balance(std::move(chunks).value(), text, options, profile,
                                           stop);
}

Result<ChunkStream> ChunkingEngine::chunkStream(std::string text, const ChunkOptions& options,
                                                std::stop_token stop) const {
    auto chunker = prepare(text, options);
    if (!chunker) {
        return chunker.error();
    }

    const auto& profile = resolveProfile(text, options);
    return ChunkStream(std::make_shared<const std::string>(std::move(text)), options, profile,
                       std::move(chunker).value(), std::move(stop));
}

Result<size_t> ChunkingEngine::estimateChunkCount(std::string_view text,
                                                  const ChunkOptions& options) const {
    auto valid = options.validate();
    if (!valid) {
        return valid.error();
    }
    if (utf8::isBlank(text)) {
        return size_t{0};
    }

    // Estimation never calls the oracle, so Semantic does not need one here.
    const auto strategy = resolveStrategy(text, options);
    const auto& profile = resolveProfile(text, options);
    if (strategy == ChunkingStrategy::Semantic) {
        return chunking::SemanticChunker(oracle_).estimateChunkCount(text, options, profile);
    }

    auto chunker = chunking::createChunker(strategy, oracle_);
    if (!chunker) {
        return chunker.error();
    }
    return chunker.value()->estimateChunkCount(text, options, profile);
}

chunking::ChunkBalanceStats ChunkingEngine::balanceStats(const std::vector<Chunk>& chunks,
                                                         const ChunkOptions& options) {
    return chunking::ChunkBalancer::calculateStats(chunks, options);
}

} // namespace ragchunk::engine
