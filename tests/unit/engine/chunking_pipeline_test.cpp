#include <gtest/gtest.h>
#include <ragchunk/engine/chunking_pipeline.h>

#include <regex>

using namespace ragchunk;
using namespace ragchunk::chunking;
using namespace ragchunk::engine;

namespace {

class EmailRedactor : public ITextProcessor {
public:
    Result<std::string> process(const std::string& text) override {
        static const std::regex email(R"([\w.+-]+@[\w-]+\.[\w.]+)");
        return std::regex_replace(text, email, "[email]");
    }
    std::string name() const override { return "EmailRedactor"; }
};

class BrokenProcessor : public ITextProcessor {
public:
    Result<std::string> process(const std::string&) override {
        return Error{ErrorCode::InternalError, "broken"};
    }
    std::string name() const override { return "Broken"; }
};

} // namespace

TEST(LineEndingNormalizerTest, ConvertsCarriageReturns) {
    LineEndingNormalizer normalizer;
    auto result = normalizer.process("a\r\nb\rc\n\r\nd");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), "a\nb\nc\n\nd");
}

class ChunkingPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<ChunkingEngine> engine = std::make_shared<ChunkingEngine>();
};

TEST_F(ChunkingPipelineTest, ProcessorsRunInOrder) {
    ChunkingPipeline pipeline(engine);
    pipeline.addProcessor(std::make_shared<LineEndingNormalizer>())
        .addProcessor(std::make_shared<EmailRedactor>());
    EXPECT_EQ(pipeline.processorCount(), 2u);

    auto chunks = pipeline.run("Contact alice@example.com today.\r\nThanks.", ChunkOptions{});
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].content, "Contact [email] today.\nThanks.");
}

TEST_F(ChunkingPipelineTest, FailingProcessorIsSkipped) {
    ChunkingPipeline pipeline(engine);
    pipeline.addProcessor(std::make_shared<BrokenProcessor>())
        .addProcessor(std::make_shared<EmailRedactor>());
    EXPECT_EQ(pipeline.preprocess("Mail bob@test.org now."), "Mail [email] now.");
}

TEST_F(ChunkingPipelineTest, NullProcessorIsIgnored) {
    ChunkingPipeline pipeline(engine);
    pipeline.addProcessor(nullptr);
    EXPECT_EQ(pipeline.processorCount(), 0u);
    EXPECT_EQ(pipeline.preprocess("unchanged"), "unchanged");
}

TEST_F(ChunkingPipelineTest, MissingEngineIsReported) {
    ChunkingPipeline pipeline(nullptr);
    auto chunks = pipeline.run("Some text.", ChunkOptions{});
    ASSERT_FALSE(chunks);
    EXPECT_EQ(chunks.error().code, ErrorCode::NotInitialized);
}
