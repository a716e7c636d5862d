#include <gtest/gtest.h>
#include <ragchunk/embedding/similarity_oracle.h>
#include <ragchunk/engine/chunking_engine.h>

#include "common/test_text.h"

#include <algorithm>
#include <string>

using namespace ragchunk;
using namespace ragchunk::chunking;
using ragchunk::engine::ChunkingEngine;

class ChunkingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        small.target_chunk_size = 20;
        small.min_chunk_size = 5;
        small.max_chunk_size = 40;
        small.overlap_size = 0;
    }

    static std::string paragraphs(size_t count) {
        std::string text;
        for (size_t i = 0; i < count; ++i) {
            if (!text.empty()) {
                text += "\n\n";
            }
            text += test::numberedSentences(3, i * 3 + 1);
        }
        return text;
    }

    ChunkingEngine engine;
    ChunkOptions small;
};

TEST_F(ChunkingEngineTest, AutoPicksSentenceForShortText) {
    EXPECT_EQ(engine.resolveStrategy("Hello world. Goodbye now.", small),
              ChunkingStrategy::Sentence);
}

TEST_F(ChunkingEngineTest, AutoPicksParagraphForManyParagraphs) {
    EXPECT_EQ(engine.resolveStrategy(paragraphs(4), small), ChunkingStrategy::Paragraph);
}

TEST_F(ChunkingEngineTest, AutoPicksSentenceForManySentences) {
    EXPECT_EQ(engine.resolveStrategy(test::numberedSentences(10), small),
              ChunkingStrategy::Sentence);
}

TEST_F(ChunkingEngineTest, AutoFallsBackToToken) {
    EXPECT_EQ(engine.resolveStrategy(test::numberedWords(40), small), ChunkingStrategy::Token);
}

TEST_F(ChunkingEngineTest, ExplicitStrategyIsKept) {
    small.strategy = ChunkingStrategy::Hierarchical;
    EXPECT_EQ(engine.resolveStrategy("Hi.", small), ChunkingStrategy::Hierarchical);
}

TEST_F(ChunkingEngineTest, BlankTextGivesNoChunks) {
    auto chunks = engine.chunk("  \n\t ", ChunkOptions{});
    ASSERT_TRUE(chunks);
    EXPECT_TRUE(chunks.value().empty());

    auto estimate = engine.estimateChunkCount("   ", ChunkOptions{});
    ASSERT_TRUE(estimate);
    EXPECT_EQ(estimate.value(), 0u);
}

TEST_F(ChunkingEngineTest, ShortTextIsOneChunk) {
    auto chunks = engine.chunk("Hello world. Goodbye now.", ChunkOptions{});
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    const auto& chunk = chunks.value()[0];
    EXPECT_EQ(chunk.content, "Hello world. Goodbye now.");
    EXPECT_EQ(chunk.index, 0u);
    EXPECT_EQ(chunk.total_chunks, 1u);
    EXPECT_EQ(chunk.metadata.strategy, ChunkingStrategy::Sentence);
    EXPECT_EQ(chunk.metadata.language_code, "en");
}

TEST_F(ChunkingEngineTest, InvalidOptionsAreRejected) {
    small.min_chunk_size = 30;
    auto chunks = engine.chunk("Some text.", small);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::ConfigurationError);

    auto estimate = engine.estimateChunkCount("Some text.", small);
    ASSERT_FALSE(estimate);
    EXPECT_EQ(estimate.error().code, ErrorCode::ConfigurationError);
}

TEST_F(ChunkingEngineTest, SemanticNeedsAnOracle) {
    small.strategy = ChunkingStrategy::Semantic;
    EXPECT_FALSE(engine.hasSimilarityOracle());

    auto chunks = engine.chunk(test::numberedSentences(5), small);
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::ConfigurationError);

    auto estimate = engine.estimateChunkCount(test::numberedSentences(5), small);
    EXPECT_TRUE(estimate);
}

TEST_F(ChunkingEngineTest, SemanticWithMockOracle) {
    small.strategy = ChunkingStrategy::Semantic;
    engine.setSimilarityOracle(embedding::createMockOracle(32));
    ASSERT_TRUE(engine.hasSimilarityOracle());

    auto chunks = engine.chunk(test::numberedSentences(12), small);
    ASSERT_TRUE(chunks);
    ASSERT_FALSE(chunks.value().empty());
    for (const auto& chunk : chunks.value()) {
        EXPECT_EQ(chunk.metadata.strategy, ChunkingStrategy::Semantic);
        EXPECT_LE(chunk.metadata.estimated_token_count, small.max_chunk_size);
    }
}

TEST_F(ChunkingEngineTest, ExplicitLanguageOverridesDetection) {
    ChunkOptions options;
    options.language_code = "ko";
    auto chunks = engine.chunk("Plain English words here.", options);
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].metadata.language_code, "ko");
}

TEST_F(ChunkingEngineTest, KoreanTextIsDetected) {
    auto chunks = engine.chunk("안녕하세요. 오늘은 날씨가 좋습니다.", ChunkOptions{});
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].metadata.language_code, "ko");
}

TEST_F(ChunkingEngineTest, CancellationIsReported) {
    std::stop_source source;
    source.request_stop();
    auto chunks = engine.chunk(test::numberedSentences(20), small, source.get_token());
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::OperationCancelled);
}

TEST_F(ChunkingEngineTest, BalancingEvensOutSizes) {
    small.strategy = ChunkingStrategy::Sentence;
    small.min_chunk_size = 10;
    small.max_chunk_size = 30;
    small.enable_chunk_balancing = true;

    auto chunks = engine.chunk(test::numberedSentences(40), small);
    ASSERT_TRUE(chunks);
    ASSERT_GT(chunks.value().size(), 1u);
    auto stats = ChunkingEngine::balanceStats(chunks.value(), small);
    EXPECT_TRUE(stats.isBalanced());
    EXPECT_EQ(stats.chunk_count, chunks.value().size());
}

TEST_F(ChunkingEngineTest, BalancedSectionsKeepEnclosingParents) {
    small.strategy = ChunkingStrategy::Hierarchical;
    small.target_chunk_size = 50;
    small.min_chunk_size = 20;
    small.max_chunk_size = 100;
    small.enable_chunk_balancing = true;

    std::string lorem;
    std::string ipsum;
    for (int i = 0; i < 25; ++i) {
        lorem += "lorem ";
        ipsum += "ipsum ";
    }
    const std::string text = "# A\nShort.\n# B\n" + lorem + "\n## C\n" + ipsum;

    auto chunks = engine.chunk(text, small);
    ASSERT_TRUE(chunks);
    const auto& list = chunks.value();

    bool sawNested = false;
    for (const auto& chunk : list) {
        if (chunk.location.section_path == "B/C") {
            sawNested = true;
        }
        if (!chunk.metadata.parent_id) {
            continue;
        }
        auto parent = std::find_if(list.begin(), list.end(), [&](const Chunk& candidate) {
            return candidate.id == *chunk.metadata.parent_id;
        });
        ASSERT_NE(parent, list.end()) << chunk.id;
        const auto& parentPath = parent->location.section_path;
        EXPECT_EQ(chunk.location.section_path.substr(0, parentPath.size() + 1), parentPath + "/")
            << chunk.id;
    }
    EXPECT_TRUE(sawNested);
}

TEST_F(ChunkingEngineTest, EstimateTracksActualCount) {
    small.strategy = ChunkingStrategy::Sentence;
    const auto text = test::numberedSentences(30);
    auto estimate = engine.estimateChunkCount(text, small);
    auto chunks = engine.chunk(text, small);
    ASSERT_TRUE(estimate);
    ASSERT_TRUE(chunks);
    EXPECT_GT(estimate.value(), 1u);
    EXPECT_GT(chunks.value().size(), 1u);
}
