#include <gtest/gtest.h>
#include <ragchunk/chunking/document_chunker.h>
#include <ragchunk/core/utf8.h>
#include <ragchunk/language/language_registry.h>

#include "common/test_text.h"

using namespace ragchunk;
using namespace ragchunk::chunking;

class ParagraphChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.strategy = ChunkingStrategy::Paragraph;
        options.target_chunk_size = 15;
        options.min_chunk_size = 1;
        options.max_chunk_size = 20;
        options.overlap_size = 0;

        splitText = "Intro paragraph.\n\n" + test::numberedSentences(10) +
                    "\n\nClosing paragraph.";
    }

    ParagraphChunker chunker;
    ChunkOptions options;
    std::string splitText;
    const language::LanguageProfile& profile =
        language::LanguageRegistry::instance().getProfile("en");
};

TEST_F(ParagraphChunkerTest, ShortParagraphsShareOneChunk) {
    options.target_chunk_size = 80;
    options.min_chunk_size = 10;
    options.max_chunk_size = 100;

    std::string text = "This is the first paragraph.\n\n"
                       "This is the second paragraph.\n\n"
                       "This is the third paragraph.";
    auto chunks = chunker.chunk(text, options, profile);
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].content, text);
    EXPECT_EQ(chunks.value()[0].metadata.strategy, ChunkingStrategy::Paragraph);
}

TEST_F(ParagraphChunkerTest, LongParagraphIsSplitBySentence) {
    auto chunks = chunker.chunk(splitText, options, profile);
    ASSERT_TRUE(chunks);
    const auto& list = chunks.value();
    ASSERT_EQ(list.size(), 6u);

    EXPECT_EQ(list.front().content, "Intro paragraph.");
    EXPECT_EQ(list.back().content, "Closing paragraph.");
    for (const auto& chunk : list) {
        EXPECT_LE(chunk.metadata.estimated_token_count, options.max_chunk_size);
        EXPECT_TRUE(chunk.metadata.ends_at_sentence_boundary) << chunk.content;
    }
}

TEST_F(ParagraphChunkerTest, WithoutPreserveParagraphsNeighboursMayJoin) {
    options.preserve_paragraphs = false;
    auto chunks = chunker.chunk(splitText, options, profile);
    ASSERT_TRUE(chunks);
    const auto& list = chunks.value();
    ASSERT_GE(list.size(), 2u);

    EXPECT_NE(list.front().content.find("Intro paragraph."), std::string::npos);
    EXPECT_NE(list.front().content.find("Sentence number 1 "), std::string::npos);
    EXPECT_NE(list.back().content.find("Sentence number 10"), std::string::npos);
    EXPECT_NE(list.back().content.find("Closing paragraph."), std::string::npos);
}

TEST_F(ParagraphChunkerTest, OverlapZeroReproducesText) {
    auto chunks = chunker.chunk(splitText, options, profile);
    ASSERT_TRUE(chunks);
    EXPECT_EQ(utf8::normalizeWhitespace(test::joinContents(chunks.value())),
              utf8::normalizeWhitespace(splitText));
}

TEST_F(ParagraphChunkerTest, Estimates) {
    EXPECT_EQ(chunker.estimateChunkCount("", options, profile), 0u);
    EXPECT_GE(chunker.estimateChunkCount(splitText, options, profile), 1u);
}
