#include <gtest/gtest.h>
#include <ragchunk/language/language_registry.h>

#include <string>
#include <vector>

using namespace ragchunk::language;

class LanguageProfileTest : public ::testing::Test {
protected:
    const LanguageProfile& profile(Language language) {
        return LanguageRegistry::instance().getProfile(language);
    }

    const LanguageProfile& english() { return profile(Language::English); }
    const LanguageProfile& korean() { return profile(Language::Korean); }
};

TEST_F(LanguageProfileTest, EmptyTextHasNoBoundaries) {
    EXPECT_TRUE(english().findSentenceBoundaries("").empty());
    EXPECT_TRUE(english().findParagraphBoundaries("").empty());
    EXPECT_TRUE(english().findSectionHeaders("").empty());
    EXPECT_EQ(english().estimateTokenCount(""), 0u);
}

TEST_F(LanguageProfileTest, EndOfTextIsAlwaysABoundary) {
    std::string text = "no terminator here";
    auto boundaries = english().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 1u);
    EXPECT_EQ(boundaries.back(), text.size());
}

TEST_F(LanguageProfileTest, EnglishSentences) {
    std::string text = "First one. Second one! Third one? Done";
    auto boundaries = english().findSentenceBoundaries(text);
    std::vector<size_t> expected = {10, 22, 33, text.size()};
    EXPECT_EQ(boundaries, expected);
}

TEST_F(LanguageProfileTest, AbbreviationsAreNotBoundaries) {
    std::string text = "Dr. Smith went home. He slept.";
    auto boundaries = english().findSentenceBoundaries(text);
    std::vector<size_t> expected = {20, text.size()};
    EXPECT_EQ(boundaries, expected);

    std::string latin = "Bring tools, e.g. hammers. Then start.";
    auto latinBoundaries = english().findSentenceBoundaries(latin);
    ASSERT_EQ(latinBoundaries.size(), 2u);
    EXPECT_EQ(latin.substr(0, latinBoundaries[0]), "Bring tools, e.g. hammers.");

    EXPECT_TRUE(english().isAbbreviation("DR."));
    EXPECT_FALSE(english().isAbbreviation("home."));
}

TEST_F(LanguageProfileTest, DecimalsAreNotBoundaries) {
    std::string text = "Pi is 3.14 today. Yes.";
    auto boundaries = english().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "Pi is 3.14 today.");
}

TEST_F(LanguageProfileTest, ClosingQuoteStaysWithSentence) {
    std::string text = "He said \"Stop.\" Then left.";
    auto boundaries = english().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "He said \"Stop.\"");
}

TEST_F(LanguageProfileTest, TerminatorRunsCountOnce) {
    std::string text = "Really?! Yes.";
    auto boundaries = english().findSentenceBoundaries(text);
    std::vector<size_t> expected = {8, text.size()};
    EXPECT_EQ(boundaries, expected);
}

TEST_F(LanguageProfileTest, ChineseFullWidthTerminators) {
    std::string text = "你好。今天很好！";
    auto boundaries = profile(Language::Chinese).findSentenceBoundaries(text);
    std::vector<size_t> expected = {9, text.size()};
    EXPECT_EQ(boundaries, expected);
}

TEST_F(LanguageProfileTest, KoreanEndingsAreBoundaries) {
    std::string text = "감사합니다 다음 문장입니다";
    auto boundaries = korean().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "감사합니다");
    EXPECT_EQ(boundaries[1], text.size());
}

TEST_F(LanguageProfileTest, KoreanEndingBeforePeriodUsesThePeriod) {
    std::string text = "안녕하세요. 반갑습니다.";
    auto boundaries = korean().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "안녕하세요.");
}

TEST_F(LanguageProfileTest, KoreanParenthesesSuppressBoundaries) {
    std::string text = "회의는 (오늘입니다. 확인) 끝났습니다.";
    auto boundaries = korean().findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 1u);
    EXPECT_EQ(boundaries[0], text.size());
}

TEST_F(LanguageProfileTest, JapanesePoliteEndings) {
    std::string text = "雨です 晴れでした";
    auto boundaries = profile(Language::Japanese).findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "雨です");
}

TEST_F(LanguageProfileTest, ThaiDoubleSpaceSeparatesSentences) {
    std::string text = "สวัสดีครับ  วันนี้อากาศดี";
    auto boundaries = profile(Language::Thai).findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "สวัสดีครับ");

    std::string single = "สวัสดีครับ วันนี้อากาศดี";
    EXPECT_EQ(profile(Language::Thai).findSentenceBoundaries(single).size(), 1u);
}

TEST_F(LanguageProfileTest, HindiDanda) {
    std::string text = "यह एक वाक्य है। दूसरा वाक्य।";
    auto boundaries = profile(Language::Hindi).findSentenceBoundaries(text);
    ASSERT_EQ(boundaries.size(), 2u);
    EXPECT_EQ(text.substr(0, boundaries[0]), "यह एक वाक्य है।");
}

TEST_F(LanguageProfileTest, ParagraphBoundaries) {
    std::string text = "A\n\nB\n \nC";
    std::vector<size_t> expected = {3, 7, text.size()};
    EXPECT_EQ(english().findParagraphBoundaries(text), expected);

    std::vector<size_t> single = {3};
    EXPECT_EQ(english().findParagraphBoundaries("A\nB"), single);
}

TEST_F(LanguageProfileTest, MarkdownAndKeywordHeaders) {
    std::string text = "# Title\n"
                       "Text\n"
                       "## Sub ##\n"
                       "```\n"
                       "# not a header\n"
                       "```\n"
                       "Chapter 3: Intro\n"
                       "chapter three\n"
                       "#NoSpace\n";
    auto headers = english().findSectionHeaders(text);
    ASSERT_EQ(headers.size(), 3u);

    EXPECT_EQ(headers[0].title, "Title");
    EXPECT_EQ(headers[0].level, 1);
    EXPECT_EQ(headers[0].start, 0u);
    EXPECT_EQ(headers[0].end, 7u);

    EXPECT_EQ(headers[1].title, "Sub");
    EXPECT_EQ(headers[1].level, 2);

    EXPECT_EQ(headers[2].title, "Chapter 3: Intro");
    EXPECT_EQ(headers[2].level, 1);
}

TEST_F(LanguageProfileTest, KoreanLegalHeaders) {
    std::string text = "제1장 총칙\n본문\n제2절 목적\n제3조 (정의)\n① 첫째 항목\n";
    auto headers = korean().findSectionHeaders(text);
    ASSERT_EQ(headers.size(), 4u);
    EXPECT_EQ(headers[0].level, 1);
    EXPECT_EQ(headers[1].level, 2);
    EXPECT_EQ(headers[2].level, 3);
    EXPECT_EQ(headers[3].level, 3);
    EXPECT_EQ(headers[0].title, "제1장 총칙");
}

TEST_F(LanguageProfileTest, ChineseOrdinalHeaders) {
    std::string text = "第一章 总则\n内容\n第二节 目的\n";
    auto headers = profile(Language::Chinese).findSectionHeaders(text);
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].level, 1);
    EXPECT_EQ(headers[1].level, 2);
}

TEST_F(LanguageProfileTest, TokenEstimates) {
    EXPECT_EQ(english().estimateTokenCount("hello world"), 3u);   // 10 chars / 4
    EXPECT_EQ(korean().estimateTokenCount("안녕하세요"), 4u);       // 5 syllables
    EXPECT_EQ(korean().estimateTokenCount("   "), 0u);
    EXPECT_EQ(profile(Language::Chinese).estimateTokenCount("你好世界"), 3u);
}
