#include <gtest/gtest.h>
#include <ragchunk/embedding/similarity_oracle.h>
#include <ragchunk/engine/batch_processor.h>

#include "common/test_text.h"

using namespace ragchunk;
using namespace ragchunk::chunking;
using ragchunk::engine::BatchProcessor;
using ragchunk::engine::ChunkingEngine;

namespace {

// Fails any batch containing the word "fail", otherwise defers to the mock oracle.
class SelectiveOracle : public embedding::ISimilarityOracle {
public:
    Result<std::vector<float>> embed(const std::string& text) override {
        if (text.find("fail") != std::string::npos) {
            return Error{ErrorCode::InternalError, "refused"};
        }
        return mock_.embed(text);
    }

    Result<std::vector<std::vector<float>>>
    embedBatch(const std::vector<std::string>& texts) override {
        for (const auto& text : texts) {
            if (text.find("fail") != std::string::npos) {
                return Error{ErrorCode::InternalError, "refused"};
            }
        }
        return mock_.embedBatch(texts);
    }

    std::string name() const override { return "Selective"; }

private:
    embedding::MockSimilarityOracle mock_{16};
};

} // namespace

class BatchProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.strategy = ChunkingStrategy::Sentence;
        options.target_chunk_size = 20;
        options.min_chunk_size = 5;
        options.max_chunk_size = 30;
        options.overlap_size = 0;
    }

    std::shared_ptr<ChunkingEngine> engine = std::make_shared<ChunkingEngine>();
    ChunkOptions options;
};

TEST_F(BatchProcessorTest, PreservesInsertionOrder) {
    BatchProcessor batch(engine);
    batch.withMaxConcurrency(4);
    for (size_t i = 0; i < 10; ++i) {
        batch.addText(test::numberedSentences(i + 1, i * 100 + 1));
    }
    ASSERT_EQ(batch.size(), 10u);

    auto results = batch.process(options);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 10u);
    for (size_t i = 0; i < 10; ++i) {
        const auto& chunks = results.value()[i];
        ASSERT_FALSE(chunks.empty());
        auto expected = "Sentence number " + std::to_string(i * 100 + 1) + " is here.";
        EXPECT_EQ(chunks.front().content.rfind(expected, 0), 0u) << "item " << i;
    }
}

TEST_F(BatchProcessorTest, BlankTextsAreSkipped) {
    BatchProcessor batch(engine);
    batch.addTexts({"First text.", "   ", "", "Second text."});
    EXPECT_EQ(batch.size(), 2u);

    auto results = batch.process(options);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 2u);
    EXPECT_EQ(results.value()[1].front().content, "Second text.");

    batch.clear();
    EXPECT_EQ(batch.size(), 0u);
    auto empty = batch.process(options);
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(BatchProcessorTest, ConcurrencyIsClamped) {
    BatchProcessor batch(engine);
    EXPECT_GE(batch.maxConcurrency(), 1u);
    EXPECT_LE(batch.maxConcurrency(), BatchProcessor::kMaxConcurrency);
    batch.withMaxConcurrency(0);
    EXPECT_EQ(batch.maxConcurrency(), 1u);
    batch.withMaxConcurrency(100);
    EXPECT_EQ(batch.maxConcurrency(), BatchProcessor::kMaxConcurrency);
}

TEST_F(BatchProcessorTest, FirstFailureFailsTheBatch) {
    auto semanticEngine = std::make_shared<ChunkingEngine>(std::make_shared<SelectiveOracle>());
    options.strategy = ChunkingStrategy::Semantic;

    BatchProcessor batch(semanticEngine);
    batch.withMaxConcurrency(3);
    batch.addText(test::numberedSentences(4));
    batch.addText("This one will fail. It really does.");
    batch.addText(test::numberedSentences(6));

    auto results = batch.process(options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::InternalError);
    EXPECT_EQ(results.error().message, "refused");
}

TEST_F(BatchProcessorTest, InvalidOptionsAreRejected) {
    BatchProcessor batch(engine);
    batch.addText("Some text.");
    options.target_chunk_size = 100;
    auto results = batch.process(options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::ConfigurationError);
}

TEST_F(BatchProcessorTest, EstimateSumsItems) {
    BatchProcessor batch(engine);
    std::vector<std::string> texts = {test::numberedSentences(3), test::numberedSentences(30),
                                      test::numberedSentences(12)};
    batch.addTexts(texts);

    size_t expected = 0;
    for (const auto& text : texts) {
        auto estimate = engine->estimateChunkCount(text, options);
        ASSERT_TRUE(estimate);
        expected += estimate.value();
    }
    EXPECT_EQ(batch.totalEstimatedChunks(options), expected);
}

TEST_F(BatchProcessorTest, CancellationIsReported) {
    std::stop_source source;
    source.request_stop();
    BatchProcessor batch(engine);
    batch.addTexts({test::numberedSentences(5), test::numberedSentences(5)});
    auto results = batch.process(options, source.get_token());
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::OperationCancelled);
}

TEST_F(BatchProcessorTest, MissingEngineIsReported) {
    BatchProcessor batch(nullptr);
    batch.addText("Some text.");
    auto results = batch.process(options);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::NotInitialized);
    EXPECT_EQ(batch.totalEstimatedChunks(options), 0u);
}
