#include <gtest/gtest.h>
#include <modelflux/model/thinking_parser.h>

using modelflux::model::ThinkingParser;

TEST(ThinkingParserTest, PlainResponseIsAllMessage) {
    auto p = ThinkingParser::parse("Hello there");
    EXPECT_EQ(p.message, "Hello there");
    EXPECT_TRUE(p.thinking.empty());
    EXPECT_FALSE(p.thinkingOpen);
}

TEST(ThinkingParserTest, SplitsLeadingThinkBlock) {
    auto p = ThinkingParser::parse("<think>check units</think>42 km");
    EXPECT_EQ(p.thinking, "check units");
    EXPECT_EQ(p.message, "42 km");
    EXPECT_FALSE(p.thinkingOpen);
}

TEST(ThinkingParserTest, UnclosedBlockIsStillThinking) {
    auto p = ThinkingParser::parse("<think>step one, step two");
    EXPECT_EQ(p.thinking, "step one, step two");
    EXPECT_TRUE(p.message.empty());
    EXPECT_TRUE(p.thinkingOpen);
}

TEST(ThinkingParserTest, ThinkTagLaterInTextIsMessage) {
    auto p = ThinkingParser::parse("Use <think> tags like <think>x</think>");
    EXPECT_TRUE(p.thinking.empty());
    EXPECT_EQ(p.message, "Use <think> tags like <think>x</think>");
}

TEST(ThinkingParserTest, StreamedFragmentsAcrossTagBoundaries) {
    ThinkingParser parser;
    parser.append("<th");
    EXPECT_TRUE(parser.current().message.empty());
    parser.append("ink>pla");
    EXPECT_EQ(parser.current().thinking, "pla");
    EXPECT_TRUE(parser.current().thinkingOpen);
    parser.append("n</thi");
    parser.append("nk>Answer");
    EXPECT_EQ(parser.current().thinking, "plan");
    EXPECT_EQ(parser.current().message, "Answer");
    EXPECT_EQ(parser.raw(), "<think>plan</think>Answer");

    parser.reset();
    EXPECT_TRUE(parser.raw().empty());
    EXPECT_TRUE(parser.current().message.empty());
}
