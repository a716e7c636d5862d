#include <fmt/format.h>
#include <gtest/gtest.h>
#include <ragchunk/chunking/chunk_options.h>

using namespace ragchunk;
using namespace ragchunk::chunking;

TEST(ChunkOptionsTest, DefaultsAreValid) {
    ChunkOptions options;
    EXPECT_EQ(options.strategy, ChunkingStrategy::Auto);
    EXPECT_EQ(options.target_chunk_size, 512u);
    EXPECT_EQ(options.min_chunk_size, 100u);
    EXPECT_EQ(options.max_chunk_size, 1024u);
    EXPECT_EQ(options.overlap_size, 50u);
    EXPECT_FALSE(options.language_code.has_value());
    EXPECT_FALSE(options.enable_chunk_balancing);
    EXPECT_TRUE(options.validate());
}

TEST(ChunkOptionsTest, PresetsAreValid) {
    EXPECT_TRUE(ChunkOptions::forRag().validate());
    EXPECT_TRUE(ChunkOptions::forKorean().validate());
    EXPECT_TRUE(ChunkOptions::forLargeDocument().validate());
    EXPECT_TRUE(ChunkOptions::fixedSize(256, 32).validate());

    EXPECT_EQ(ChunkOptions::forRag().strategy, ChunkingStrategy::Semantic);
    EXPECT_EQ(ChunkOptions::forKorean().language_code.value_or(""), "ko");
    EXPECT_EQ(ChunkOptions::forLargeDocument().strategy, ChunkingStrategy::Hierarchical);

    auto fixed = ChunkOptions::fixedSize(256, 32);
    EXPECT_EQ(fixed.strategy, ChunkingStrategy::Token);
    EXPECT_EQ(fixed.target_chunk_size, 256u);
    EXPECT_EQ(fixed.overlap_size, 32u);
    EXPECT_FALSE(fixed.preserve_sentences);
}

TEST(ChunkOptionsTest, RejectsInconsistentSizes) {
    ChunkOptions options;
    options.min_chunk_size = 600;
    auto result = options.validate();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ConfigurationError);

    options = ChunkOptions{};
    options.target_chunk_size = 2000;
    EXPECT_EQ(options.validate().error().code, ErrorCode::ConfigurationError);

    options = ChunkOptions{};
    options.max_chunk_size = 0;
    options.target_chunk_size = 0;
    options.min_chunk_size = 0;
    EXPECT_EQ(options.validate().error().code, ErrorCode::ConfigurationError);

    options = ChunkOptions{};
    options.semantic_similarity_threshold = 1.5;
    EXPECT_EQ(options.validate().error().code, ErrorCode::ConfigurationError);
}

TEST(ChunkOptionsTest, OverlapIsCappedAtHalfTheTarget) {
    ChunkOptions options;
    options.target_chunk_size = 100;
    options.min_chunk_size = 10;
    options.overlap_size = 80;
    EXPECT_EQ(options.effectiveOverlap(), 50u);

    options.overlap_size = 20;
    EXPECT_EQ(options.effectiveOverlap(), 20u);
}

TEST(ChunkOptionsTest, StrategyNames) {
    EXPECT_STREQ(toString(ChunkingStrategy::Hierarchical), "hierarchical");
    EXPECT_EQ(parseChunkingStrategy("Semantic"), ChunkingStrategy::Semantic);
    EXPECT_EQ(parseChunkingStrategy(" token "), ChunkingStrategy::Token);
    EXPECT_FALSE(parseChunkingStrategy("fixed").has_value());
    EXPECT_EQ(fmt::format("{}", ChunkingStrategy::Paragraph), "paragraph");
}
