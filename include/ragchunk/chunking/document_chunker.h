#pragma once

#include <ragchunk/chunking/chunk.h>
#include <ragchunk/chunking/chunk_options.h>
#include <ragchunk/core/types.h>
#include <ragchunk/embedding/similarity_oracle.h>
#include <ragchunk/language/language_profile.h>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ragchunk::chunking {

/**
 * One planned chunk: a contiguous byte range of the source text.
 * [start, overlap_end) is text repeated from the previous chunk, empty when
 * overlap_end == start.
 */
struct ChunkSpan {
    size_t start = 0;
    size_t overlap_end = 0;
    size_t end = 0;

    // Hierarchical chunking
    std::optional<int> hierarchy_level;
    std::optional<size_t> parent_span; // Index of the span holding the parent section
    std::optional<std::string> section_title;
    std::string section_path;
    bool contains_section_header = false;
    double quality_score = 1.0;
};

/**
 * Offset-only result of a strategy. Turning it into chunks is left to
 * ChunkMaterializer so that streaming can build one chunk at a time.
 */
struct ChunkPlan {
    ChunkingStrategy strategy = ChunkingStrategy::Sentence;
    std::vector<ChunkSpan> spans;
};

/**
 * Builds Chunk records from a plan. Holds a view of the text, which must outlive it.
 */
class ChunkMaterializer {
public:
    ChunkMaterializer(std::string_view text, const ChunkOptions& options,
                      const language::LanguageProfile& profile);

    Chunk materialize(const ChunkPlan& plan, size_t n) const;

    // Id of the n-th chunk of this text: "<16 hex digits>_chunk_<n>".
    std::string chunkId(size_t n) const;

    const std::string& documentHash() const { return documentHash_; }

private:
    size_t lineAt(size_t offset) const;
    bool startsAtSentenceBoundary(size_t offset) const;
    bool endsAtSentenceBoundary(size_t offset) const;

    std::string_view text_;
    ChunkOptions options_;
    const language::LanguageProfile* profile_;
    std::string documentHash_;
    std::vector<size_t> lineStarts_;
    std::vector<size_t> sentenceBoundaries_;
};

std::string computeDocumentHash(std::string_view text);

/**
 * Base interface for document chunking strategies
 */
class IChunker {
public:
    virtual ~IChunker() = default;

    virtual ChunkingStrategy strategy() const = 0;
    virtual std::string name() const { return toString(strategy()); }
    virtual bool requiresOracle() const { return false; }

    /**
     * Compute chunk boundaries without building any chunk content.
     * Blank text yields an empty plan. Fails only on cancellation, a missing or failing
     * similarity oracle, or invalid options.
     */
    virtual Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                                   const language::LanguageProfile& profile,
                                   std::stop_token stop = {}) const = 0;

    // plan() followed by materializing every span.
    Result<std::vector<Chunk>> chunk(std::string_view text, const ChunkOptions& options,
                                     const language::LanguageProfile& profile,
                                     std::stop_token stop = {}) const;

    /**
     * Cheap estimate of how many chunks chunk() would produce; never builds chunks.
     */
    virtual size_t estimateChunkCount(std::string_view text, const ChunkOptions& options,
                                      const language::LanguageProfile& profile) const;
};

class SentenceChunker : public IChunker {
public:
    ChunkingStrategy strategy() const override { return ChunkingStrategy::Sentence; }

    Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                           const language::LanguageProfile& profile,
                           std::stop_token stop = {}) const override;

    // Sentence packing restricted to [begin, end), used by the paragraph and
    // hierarchical chunkers and by the balancer.
    static Result<std::vector<ChunkSpan>> planRange(std::string_view text, size_t begin,
                                                    size_t end, const ChunkOptions& options,
                                                    const language::LanguageProfile& profile,
                                                    std::stop_token stop);
};

class ParagraphChunker : public IChunker {
public:
    ChunkingStrategy strategy() const override { return ChunkingStrategy::Paragraph; }

    Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                           const language::LanguageProfile& profile,
                           std::stop_token stop = {}) const override;

    size_t estimateChunkCount(std::string_view text, const ChunkOptions& options,
                              const language::LanguageProfile& profile) const override;
};

class TokenChunker : public IChunker {
public:
    ChunkingStrategy strategy() const override { return ChunkingStrategy::Token; }

    Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                           const language::LanguageProfile& profile,
                           std::stop_token stop = {}) const override;

    // Word accumulation restricted to [begin, end); the balancer falls back to it for
    // sentences longer than the maximum.
    static Result<std::vector<ChunkSpan>> planRange(std::string_view text, size_t begin,
                                                    size_t end, const ChunkOptions& options,
                                                    const language::LanguageProfile& profile,
                                                    std::stop_token stop);
};

/**
 * Semantic chunking using embeddings
 */
class SemanticChunker : public IChunker {
public:
    explicit SemanticChunker(std::shared_ptr<embedding::ISimilarityOracle> oracle);

    ChunkingStrategy strategy() const override { return ChunkingStrategy::Semantic; }
    bool requiresOracle() const override { return true; }

    Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                           const language::LanguageProfile& profile,
                           std::stop_token stop = {}) const override;

    size_t estimateChunkCount(std::string_view text, const ChunkOptions& options,
                              const language::LanguageProfile& profile) const override;

private:
    std::shared_ptr<embedding::ISimilarityOracle> oracle_;
};

/**
 * Chunks along the document's heading tree.
 */
class HierarchicalChunker : public IChunker {
public:
    ChunkingStrategy strategy() const override { return ChunkingStrategy::Hierarchical; }

    Result<ChunkPlan> plan(std::string_view text, const ChunkOptions& options,
                           const language::LanguageProfile& profile,
                           std::stop_token stop = {}) const override;

    size_t estimateChunkCount(std::string_view text, const ChunkOptions& options,
                              const language::LanguageProfile& profile) const override;
};

/**
 * Factory function for creating chunkers based on strategy. Auto is resolved by the
 * engine and is rejected here, as is Semantic without an oracle.
 */
Result<std::unique_ptr<IChunker>>
createChunker(ChunkingStrategy strategy,
              std::shared_ptr<embedding::ISimilarityOracle> oracle = nullptr);

} // namespace ragchunk::chunking
