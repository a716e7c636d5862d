#include <spdlog/spdlog.h>
#include <ragchunk/embedding/similarity_oracle.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace ragchunk::embedding {

float ISimilarityOracle::cosineSimilarity(const std::vector<float>& a,
                                          const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0f;
    }

    double cosine = dot / (std::sqrt(normA) * std::sqrt(normB));
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

MockSimilarityOracle::MockSimilarityOracle(size_t dimension)
    : dimension_(dimension == 0 ? 384 : dimension) {
    spdlog::debug("MockSimilarityOracle created with dimension {}", dimension_);
}

Result<std::vector<float>> MockSimilarityOracle::embed(const std::string& text) {
    // Generate deterministic embedding based on text hash
    std::hash<std::string> hasher;
    size_t seed = hasher(text);
    std::mt19937 gen(static_cast<std::mt19937::result_type>(seed));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    std::vector<float> embedding(dimension_);
    for (size_t i = 0; i < dimension_; ++i) {
        embedding[i] = dist(gen);
    }

    // Normalize to unit length
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }

    return embedding;
}

Result<std::vector<std::vector<float>>>
MockSimilarityOracle::embedBatch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    for (const auto& text : texts) {
        auto result = embed(text);
        if (!result) {
            return result.error();
        }
        embeddings.push_back(std::move(result).value());
    }

    return embeddings;
}

std::shared_ptr<ISimilarityOracle> createMockOracle(size_t dimension) {
    return std::make_shared<MockSimilarityOracle>(dimension);
}

} // namespace ragchunk::embedding
