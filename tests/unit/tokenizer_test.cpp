#include "Tokenizer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using lockwarden::ui::cli::tokenize;
using ::testing::ElementsAre;

TEST(TokenizerTest, SplitsOnAnyWhitespace)
{
    const auto words{ tokenize("  add \t mail   pw ") };
    ASSERT_TRUE(words.has_value());
    EXPECT_THAT(*words, ElementsAre("add", "mail", "pw"));
}

TEST(TokenizerTest, BlankLineHasNoWords)
{
    ASSERT_TRUE(tokenize("").has_value());
    EXPECT_TRUE(tokenize("")->empty());
    EXPECT_TRUE(tokenize("    ")->empty());
}

TEST(TokenizerTest, SingleQuotesAreLiteral)
{
    const auto words{ tokenize(R"(add 'my bank' 'a\b"c')") };
    ASSERT_TRUE(words.has_value());
    EXPECT_THAT(*words, ElementsAre("add", "my bank", R"(a\b"c)"));
}

TEST(TokenizerTest, DoubleQuotesHonourEscapes)
{
    const auto words{ tokenize(R"(add "say \"hi\"" "back\\slash" "keep\n")") };
    ASSERT_TRUE(words.has_value());
    EXPECT_THAT(*words, ElementsAre("add", R"(say "hi")", R"(back\slash)", R"(keep\n)"));
}

TEST(TokenizerTest, BackslashEscapesOutsideQuotes)
{
    const auto words{ tokenize(R"(show my\ bank)") };
    ASSERT_TRUE(words.has_value());
    EXPECT_THAT(*words, ElementsAre("show", "my bank"));
}

TEST(TokenizerTest, QuotesJoinAdjacentText)
{
    const auto words{ tokenize(R"(pre"fix suf"fix '')") };
    ASSERT_TRUE(words.has_value());
    EXPECT_THAT(*words, ElementsAre("prefix suffix", ""));
}

TEST(TokenizerTest, UnterminatedQuoteIsRejected)
{
    EXPECT_FALSE(tokenize("add 'mail").has_value());
    EXPECT_FALSE(tokenize(R"(add "mail)").has_value());
    EXPECT_FALSE(tokenize(R"(add "mail\")").has_value());
}
