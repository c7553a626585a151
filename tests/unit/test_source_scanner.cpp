/**
 * Codeveil - Source Scanner Tests
 */

#include <gtest/gtest.h>
#include "codecs/lexer/source_scanner.hpp"

using namespace codeveil::lexer;

// ============================================================================
// Comments
// ============================================================================

TEST(StripCommentsTest, BlockAndLine) {
    EXPECT_EQ(stripComments("a /* b */ c // d\ne"), "a  c \ne");
}

TEST(StripCommentsTest, MultiLineBlock) {
    EXPECT_EQ(stripComments("x/*\n * doc\n */y"), "xy");
}

TEST(StripCommentsTest, UnclosedBlockIsKept) {
    EXPECT_EQ(stripComments("a /* b"), "a /* b");
}

TEST(StripCommentsTest, IgnoresStrings) {
    // the pattern knows nothing about quotes
    EXPECT_EQ(stripComments("u = 'http://host';"), "u = 'http:");
}

TEST(StripCommentsTest, LineCommentStopsAtCarriageReturn) {
    EXPECT_EQ(stripComments("a // x\r\nb"), "a \r\nb");
}

// ============================================================================
// Quoted literals
// ============================================================================

TEST(StripQuotedLiteralsTest, AllQuoteKinds) {
    EXPECT_EQ(stripQuotedLiterals("a \"b\" 'c' `d` e"), "a    e");
}

TEST(StripQuotedLiteralsTest, EscapedQuote) {
    EXPECT_EQ(stripQuotedLiterals("\"a\\\"b\" x"), " x");
}

TEST(StripQuotedLiteralsTest, UnterminatedOnLineIsKept) {
    EXPECT_EQ(stripQuotedLiterals("\"abc\nfoo"), "\"abc\nfoo");
}

TEST(StripQuotedLiteralsTest, EmptyLiteral) {
    EXPECT_EQ(stripQuotedLiterals("f('')"), "f()");
}

// ============================================================================
// String literals for extraction
// ============================================================================

TEST(FindStringLiteralsTest, SpansAndBodies) {
    std::string src = "let x = \"hi\"; y = 'a\\'b'; z = \"\";";
    auto spans = findStringLiterals(src);

    ASSERT_EQ(spans.size(), 3u);

    EXPECT_EQ(spans[0].body, "hi");
    EXPECT_EQ(spans[0].quote, '"');
    EXPECT_EQ(src.substr(spans[0].begin, spans[0].end - spans[0].begin), "\"hi\"");

    EXPECT_EQ(spans[1].body, "a\\'b");
    EXPECT_EQ(spans[1].quote, '\'');

    EXPECT_EQ(spans[2].body, "");
}

TEST(FindStringLiteralsTest, TemplateLiteralsAreNotStrings) {
    EXPECT_TRUE(findStringLiterals("let t = `x`;").empty());
}

TEST(FindStringLiteralsTest, RawNewlineAllowed) {
    auto spans = findStringLiterals("\"a\nb\"");

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].body, "a\nb");
}

TEST(FindStringLiteralsTest, DoubleInsideSingle) {
    auto spans = findStringLiterals("'say \"hi\"'");

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].body, "say \"hi\"");
}

TEST(FindStringLiteralsTest, UnterminatedSkipped) {
    auto spans = findStringLiterals("x = \"open; y = 'ok';");

    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].body, "ok");
}

// ============================================================================
// Whitespace
// ============================================================================

TEST(CollapseWhitespaceTest, RunsBecomeOneSpace) {
    EXPECT_EQ(collapseWhitespace("a \t\n b"), "a b");
    EXPECT_EQ(collapseWhitespace("  a  "), " a ");
    EXPECT_EQ(collapseWhitespace("ab"), "ab");
    EXPECT_EQ(collapseWhitespace(""), "");
}

// ============================================================================
// Identifiers and words
// ============================================================================

TEST(ScanIdentifiersTest, DistinctInFirstOccurrenceOrder) {
    auto ids = scanIdentifiers("foo.bar = foo + $x1 + 2abc");

    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids[0], "foo");
    EXPECT_EQ(ids[1], "bar");
    EXPECT_EQ(ids[2], "$x1");
    EXPECT_EQ(ids[3], "abc");
}

TEST(ScanIdentifiersTest, Empty) {
    EXPECT_TRUE(scanIdentifiers("1 + 2 == 3;").empty());
}

TEST(WordsOfTest, MaximalRuns) {
    auto words = wordsOf("a1 + $b_c(2)");

    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "a1");
    EXPECT_EQ(words[1], "$b_c");
    EXPECT_EQ(words[2], "2");
}

TEST(ReplaceWholeWordsTest, OnlyWholeWords) {
    std::unordered_map<std::string, std::string> mapping = {{"foo", "a"}};
    size_t replaced = 0;

    EXPECT_EQ(replaceWholeWords("foo foobar foo.x _foo", mapping, &replaced), "a foobar a.x _foo");
    EXPECT_EQ(replaced, 2u);
}

TEST(ReplaceWholeWordsTest, SimultaneousSwap) {
    std::unordered_map<std::string, std::string> mapping = {{"a", "b"}, {"b", "a"}};

    EXPECT_EQ(replaceWholeWords("a+b*a", mapping), "b+a*b");
}

TEST(ReplaceWholeWordsTest, DollarIsAWordCharacter) {
    std::unordered_map<std::string, std::string> mapping = {{"$el", "a"}};

    EXPECT_EQ(replaceWholeWords("$el.x = $el$;", mapping), "a.x = $el$;");
}

TEST(ReplaceWholeWordsTest, DigitPrefixBlocksMatch) {
    std::unordered_map<std::string, std::string> mapping = {{"abc", "x"}};

    EXPECT_EQ(replaceWholeWords("2abc abc", mapping), "2abc x");
}
