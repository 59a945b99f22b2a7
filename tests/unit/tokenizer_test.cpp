#include "Tokenizer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using keyward::ui::cli::TokenizeError;
using keyward::ui::cli::Tokenizer;
using ::testing::ElementsAre;

TEST(TokenizerTest, SplitsCommandWords)
{
    EXPECT_THAT(Tokenizer::tokenize("show 12 --reveal"), ElementsAre("show", "12", "--reveal"));
    EXPECT_THAT(Tokenizer::tokenize("  ls \t -c   work  "), ElementsAre("ls", "-c", "work"));
}

TEST(TokenizerTest, BlankLinesYieldNothing)
{
    EXPECT_TRUE(Tokenizer::tokenize("").empty());
    EXPECT_TRUE(Tokenizer::tokenize("   ").empty());
}

TEST(TokenizerTest, PipesAreOrdinaryCharacters)
{
    EXPECT_THAT(Tokenizer::tokenize("ls|grep"), ElementsAre("ls|grep"));
    EXPECT_THAT(Tokenizer::tokenize("add a --notes x|y"), ElementsAre("add", "a", "--notes", "x|y"));
}

TEST(TokenizerTest, HashStartsCommentOnlyAtWordStart)
{
    EXPECT_TRUE(Tokenizer::tokenize("# just a comment").empty());
    EXPECT_THAT(Tokenizer::tokenize("ls --tag dev # filter"), ElementsAre("ls", "--tag", "dev"));
    EXPECT_THAT(Tokenizer::tokenize("add C#"), ElementsAre("add", "C#"));
    EXPECT_THAT(Tokenizer::tokenize("add '#1' \\#2"), ElementsAre("add", "#1", "#2"));
}

TEST(TokenizerTest, QuotedNamesKeepSpaces)
{
    EXPECT_THAT(Tokenizer::tokenize("add 'Online Banking' -c banking"),
                ElementsAre("add", "Online Banking", "-c", "banking"));
    EXPECT_THAT(Tokenizer::tokenize("edit 3 --notes \"PIN is in the drawer\""),
                ElementsAre("edit", "3", "--notes", "PIN is in the drawer"));
}

TEST(TokenizerTest, SingleQuotesAreLiteral)
{
    EXPECT_THAT(Tokenizer::tokenize("'a\\b $x'"), ElementsAre("a\\b $x"));
    EXPECT_THAT(Tokenizer::tokenize("'it''s'"), ElementsAre("its"));
}

TEST(TokenizerTest, EmptyQuotesProduceEmptyWord)
{
    EXPECT_THAT(Tokenizer::tokenize("edit 1 --notes ''"), ElementsAre("edit", "1", "--notes", ""));
    EXPECT_THAT(Tokenizer::tokenize("\"\""), ElementsAre(""));
}

TEST(TokenizerTest, AdjacentPiecesJoin)
{
    EXPECT_THAT(Tokenizer::tokenize("abc\"def\""), ElementsAre("abcdef"));
    EXPECT_THAT(Tokenizer::tokenize("'abc'\"def\"ghi"), ElementsAre("abcdefghi"));
    EXPECT_THAT(Tokenizer::tokenize("--url=\"https://x.test/a b\""), ElementsAre("--url=https://x.test/a b"));
}

TEST(TokenizerTest, BackslashOutsideQuotes)
{
    EXPECT_THAT(Tokenizer::tokenize("a\\ b"), ElementsAre("a b"));
    EXPECT_THAT(Tokenizer::tokenize("\\\\"), ElementsAre("\\"));
    EXPECT_THAT(Tokenizer::tokenize("abc\\"), ElementsAre("abc\\"));
}

TEST(TokenizerTest, BackslashInsideDoubleQuotes)
{
    EXPECT_THAT(Tokenizer::tokenize("\"quote\\\"here\""), ElementsAre("quote\"here"));
    EXPECT_THAT(Tokenizer::tokenize("\"back\\\\slash\""), ElementsAre("back\\slash"));
    EXPECT_THAT(Tokenizer::tokenize("\"cost\\$5\""), ElementsAre("cost$5"));
    EXPECT_THAT(Tokenizer::tokenize("\"cmd\\`\""), ElementsAre("cmd`"));
    EXPECT_THAT(Tokenizer::tokenize("\"path\\to\\file\""), ElementsAre("path\\to\\file"));
}

TEST(TokenizerTest, UnterminatedQuoteThrows)
{
    EXPECT_THROW((void)Tokenizer::tokenize("add \"GitHub"), TokenizeError);
    EXPECT_THROW((void)Tokenizer::tokenize("add 'GitHub"), TokenizeError);
    EXPECT_THROW((void)Tokenizer::tokenize("\"escaped end\\\""), TokenizeError);
    EXPECT_NO_THROW((void)Tokenizer::tokenize("# 'not a quote"));
}
