#include <gtest/gtest.h>
#include "host/text_buffer.hpp"

using namespace pulsar_mcp;

class TextBufferTest : public ::testing::Test {
protected:
    TextBuffer buffer{"hello world\nsecond line\nHello again"};
};

TEST_F(TextBufferTest, CountsLines) {
    EXPECT_EQ(buffer.LineCount(), 3);
    EXPECT_EQ(TextBuffer("").LineCount(), 1);
    EXPECT_EQ(TextBuffer("a\n").LineCount(), 2);
}

TEST_F(TextBufferTest, ClipsPositions) {
    auto p = buffer.Clip(Position{10, 99});
    EXPECT_EQ(p.row, 2);
    EXPECT_EQ(p.column, 11);
    p = buffer.Clip(Position{0, 50});
    EXPECT_EQ(p.row, 0);
    EXPECT_EQ(p.column, 11);
    p = buffer.Clip(Position{-1, -1});
    EXPECT_EQ(p.row, 0);
    EXPECT_EQ(p.column, 0);
}

TEST_F(TextBufferTest, ClipOrdersRange) {
    auto r = buffer.Clip(Range{{1, 3}, {0, 2}});
    EXPECT_EQ(r.start.row, 0);
    EXPECT_EQ(r.start.column, 2);
    EXPECT_EQ(r.end.row, 1);
    EXPECT_EQ(r.end.column, 3);
}

TEST_F(TextBufferTest, OffsetsAndPositions) {
    EXPECT_EQ(buffer.OffsetOf(Position{1, 0}), 12u);
    auto p = buffer.PositionOf(14);
    EXPECT_EQ(p.row, 1);
    EXPECT_EQ(p.column, 2);
    EXPECT_EQ(buffer.TextIn(Range{{0, 6}, {1, 6}}), "world\nsecond");
}

TEST_F(TextBufferTest, FindLiteralIsCaseSensitiveByDefault) {
    std::string err;
    auto matches = buffer.Find("hello", FindOptions{}, &err);
    ASSERT_TRUE(matches.has_value());
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ((*matches)[0].range.start.row, 0);
    EXPECT_EQ((*matches)[0].range.end.column, 5);
}

TEST_F(TextBufferTest, FindCaseInsensitive) {
    FindOptions opts;
    opts.case_sensitive = false;
    std::string err;
    auto matches = buffer.Find("hello", opts, &err);
    ASSERT_TRUE(matches.has_value());
    ASSERT_EQ(matches->size(), 2u);
    EXPECT_EQ((*matches)[1].text, "Hello");
    EXPECT_EQ((*matches)[1].range.start.row, 2);
}

TEST_F(TextBufferTest, FindLiteralEscapesMetacharacters) {
    TextBuffer b("a.b axb (x)");
    std::string err;
    auto matches = b.Find("a.b", FindOptions{}, &err);
    ASSERT_TRUE(matches.has_value());
    EXPECT_EQ(matches->size(), 1u);
    matches = b.Find("(x)", FindOptions{}, &err);
    ASSERT_TRUE(matches.has_value());
    EXPECT_EQ(matches->size(), 1u);
}

TEST_F(TextBufferTest, FindRegex) {
    FindOptions opts;
    opts.is_regex = true;
    std::string err;
    auto matches = buffer.Find("[a-z]+ line", opts, &err);
    ASSERT_TRUE(matches.has_value());
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ((*matches)[0].text, "second line");
}

TEST_F(TextBufferTest, FindReportsBadPatterns) {
    FindOptions opts;
    opts.is_regex = true;
    std::string err;
    EXPECT_FALSE(buffer.Find("(unclosed", opts, &err).has_value());
    EXPECT_EQ(err.rfind("Invalid regex", 0), 0u);

    err.clear();
    EXPECT_FALSE(buffer.Find("", FindOptions{}, &err).has_value());
    EXPECT_EQ(err, "pattern must not be empty");
}

TEST_F(TextBufferTest, RegexAnchorsAtLineBoundaries) {
    FindOptions opts;
    opts.is_regex = true;
    std::string err;
    auto matches = buffer.Find("^second", opts, &err);
    ASSERT_TRUE(matches.has_value()) << err;
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ((*matches)[0].range.start.row, 1);
    EXPECT_EQ((*matches)[0].range.start.column, 0);
}

TEST_F(TextBufferTest, LiteralSearchHandlesLongLines) {
    TextBuffer big(std::string(30000, 'a') + "needle");
    std::string err;
    auto matches = big.Find("needle", FindOptions{}, &err);
    ASSERT_TRUE(matches.has_value());
    ASSERT_EQ(matches->size(), 1u);
    EXPECT_EQ((*matches)[0].range.start.column, 30000);
}

TEST_F(TextBufferTest, RegexRefusesOverlongLines) {
    TextBuffer big(std::string(30000, 'a'));
    FindOptions opts;
    opts.is_regex = true;
    std::string err;
    EXPECT_FALSE(big.Find("(a|b)*", opts, &err).has_value());
    EXPECT_NE(err.find("at most"), std::string::npos);
}

TEST_F(TextBufferTest, LineWithoutTerminator) {
    EXPECT_EQ(buffer.Line(0), "hello world");
    EXPECT_EQ(buffer.Line(2), "Hello again");
}
