#include <gtest/gtest.h>

#include "mk/edit/paste.hpp"

TEST(PasteDetection, RecognizesBlockSyntaxPerLine)
{
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("# Title"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("intro\n```\ncode\n```"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("first line\r\n> quoted"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("- item"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("12. twelfth"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("- [x] done"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("above\n---\nbelow"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("  $$"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("| a | b |"));
}

TEST(PasteDetection, RecognizesInlineSyntax)
{
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("some **bold** words"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("an *emphasised* word"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("~~struck~~"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("call `run()` now"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("see [the docs](https://example.com)"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("![](pic.png)"));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("==marked=="));
    EXPECT_TRUE(mk::edit::containsMarkdownSyntax("where $x$ holds"));
}

TEST(PasteDetection, IgnoresPlainText)
{
    EXPECT_FALSE(mk::edit::containsMarkdownSyntax(""));
    EXPECT_FALSE(mk::edit::containsMarkdownSyntax("Just a sentence."));
    EXPECT_FALSE(mk::edit::containsMarkdownSyntax("2*3 = 6 and snake_case"));
    EXPECT_FALSE(mk::edit::containsMarkdownSyntax("a | b\n#hashtag\n-dash"));
    EXPECT_FALSE(mk::edit::containsMarkdownSyntax("costs 5 $"));
}
