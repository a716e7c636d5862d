#pragma once

#include <ragchunk/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace ragchunk::embedding {

/**
 * Abstract interface for the embedding backend used by semantic chunking.
 * The chunking library never loads a model itself; callers plug one in here.
 *
 * Implementations shared with BatchProcessor are called from several threads at once.
 */
class ISimilarityOracle {
public:
    virtual ~ISimilarityOracle() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, one vector per input in order
     */
    virtual Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) = 0;

    /**
     * Similarity in [-1, 1]. Defaults to cosine similarity.
     */
    virtual float similarity(const std::vector<float>& a, const std::vector<float>& b) const {
        return cosineSimilarity(a, b);
    }

    virtual std::string name() const = 0;

    // 0 when either vector is empty, the sizes differ or a norm is zero.
    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);
};

/**
 * Deterministic oracle for testing and development.
 * Generates unit-length embeddings seeded from the text hash, so equal texts always
 * map to equal vectors and unrelated texts are close to orthogonal.
 */
class MockSimilarityOracle : public ISimilarityOracle {
public:
    explicit MockSimilarityOracle(size_t dimension = 384);

    Result<std::vector<float>> embed(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) override;

    std::string name() const override { return "Mock"; }
    size_t dimension() const { return dimension_; }

private:
    size_t dimension_;
};

std::shared_ptr<ISimilarityOracle> createMockOracle(size_t dimension = 384);

} // namespace ragchunk::embedding
