#include <gtest/gtest.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include <ragchunk/language/language_registry.h>

#include <atomic>
#include <memory>

using namespace ragchunk;
using namespace ragchunk::chunking;

namespace {

// Two-dimensional embeddings: one axis for sentences about cats, one for the rest.
class TopicOracle : public embedding::ISimilarityOracle {
public:
    Result<std::vector<float>> embed(const std::string& text) override {
        ++embedCalls;
        return vectorFor(text);
    }

    Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) override {
        ++batchCalls;
        std::vector<std::vector<float>> out;
        for (const auto& text : texts) {
            out.push_back(vectorFor(text));
        }
        return out;
    }

    std::string name() const override { return "Topic"; }

    std::atomic<int> embedCalls{0};
    std::atomic<int> batchCalls{0};

private:
    static std::vector<float> vectorFor(const std::string& text) {
        if (utf8::toLowerAscii(text).find("cat") != std::string::npos) {
            return {1.0f, 0.0f};
        }
        return {0.0f, 1.0f};
    }
};

class FailingOracle : public embedding::ISimilarityOracle {
public:
    Result<std::vector<float>> embed(const std::string&) override {
        return Error{ErrorCode::InternalError, "model offline"};
    }
    Result<std::vector<std::vector<float>>> embedBatch(const std::vector<std::string>&) override {
        return Error{ErrorCode::InternalError, "model offline"};
    }
    std::string name() const override { return "Failing"; }
};

class ShortOracle : public embedding::ISimilarityOracle {
public:
    Result<std::vector<float>> embed(const std::string&) override {
        return std::vector<float>{1.0f};
    }
    Result<std::vector<std::vector<float>>> embedBatch(const std::vector<std::string>&) override {
        return std::vector<std::vector<float>>{};
    }
    std::string name() const override { return "Short"; }
};

} // namespace

class SemanticChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.strategy = ChunkingStrategy::Semantic;
        options.target_chunk_size = 20;
        options.min_chunk_size = 1;
        options.max_chunk_size = 100;
        options.overlap_size = 0;
        options.semantic_similarity_threshold = 0.5;
    }

    ChunkOptions options;
    const language::LanguageProfile& profile =
        language::LanguageRegistry::instance().getProfile("en");
    const std::string text = "Cats purr softly. Cats chase mice. Cats nap often. "
                             "Stocks rose today. Stocks fell later. Stocks trade daily.";
};

TEST_F(SemanticChunkerTest, SplitsWhereTheTopicChanges) {
    auto oracle = std::make_shared<TopicOracle>();
    SemanticChunker chunker(oracle);
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 2u);
    EXPECT_EQ(chunks.value()[0].content, "Cats purr softly. Cats chase mice. Cats nap often.");
    EXPECT_EQ(chunks.value()[1].content,
              "Stocks rose today. Stocks fell later. Stocks trade daily.");
    EXPECT_EQ(chunks.value()[0].metadata.strategy, ChunkingStrategy::Semantic);
}

TEST_F(SemanticChunkerTest, EmbedsAllSentencesInOneBatch) {
    auto oracle = std::make_shared<TopicOracle>();
    SemanticChunker chunker(oracle);
    ASSERT_TRUE(chunker.chunk(text, options, profile));
    EXPECT_EQ(oracle->batchCalls.load(), 1);
    EXPECT_EQ(oracle->embedCalls.load(), 0);
}

TEST_F(SemanticChunkerTest, NoTopicBreakBelowMinimum) {
    options.target_chunk_size = 100;
    options.min_chunk_size = 100;
    options.max_chunk_size = 200;
    SemanticChunker chunker(std::make_shared<TopicOracle>());
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_TRUE(chunks);
    EXPECT_EQ(chunks.value().size(), 1u);
}

TEST_F(SemanticChunkerTest, MaximumStillApplies) {
    options.target_chunk_size = 5;
    options.max_chunk_size = 9;
    SemanticChunker chunker(std::make_shared<TopicOracle>());
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_TRUE(chunks);
    EXPECT_GE(chunks.value().size(), 4u);
    for (const auto& chunk : chunks.value()) {
        EXPECT_LE(chunk.metadata.estimated_token_count, 9u);
    }
}

TEST_F(SemanticChunkerTest, WithoutOracleIsConfigurationError) {
    SemanticChunker chunker(nullptr);
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::ConfigurationError);

    auto created = createChunker(ChunkingStrategy::Semantic, nullptr);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::ConfigurationError);
}

TEST_F(SemanticChunkerTest, OracleFailurePropagates) {
    SemanticChunker chunker(std::make_shared<FailingOracle>());
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::InternalError);
    EXPECT_EQ(chunks.error().message, "model offline");
}

TEST_F(SemanticChunkerTest, EmbeddingCountMismatchIsInvalidData) {
    SemanticChunker chunker(std::make_shared<ShortOracle>());
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::InvalidData);
}

TEST_F(SemanticChunkerTest, MockOracleIsDeterministic) {
    auto oracle = embedding::createMockOracle(64);
    auto a = oracle->embed("same text");
    auto b = oracle->embed("same text");
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value().size(), 64u);
    EXPECT_NEAR(oracle->similarity(a.value(), b.value()), 1.0f, 1e-5f);

    SemanticChunker chunker(oracle);
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_TRUE(chunks);
    EXPECT_FALSE(chunks.value().empty());
}

TEST(CosineSimilarityTest, EdgeCases) {
    using embedding::ISimilarityOracle;
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({1.0f, 0.0f}, {1.0f, 0.0f}), 1.0f);
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({1.0f, 0.0f}, {-1.0f, 0.0f}), -1.0f);
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0f);
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({}, {}), 0.0f);
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({1.0f}, {1.0f, 2.0f}), 0.0f);
    EXPECT_FLOAT_EQ(ISimilarityOracle::cosineSimilarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0f);
}
