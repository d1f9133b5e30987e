#include <gtest/gtest.h>

#include "mk/edit/inline_parser.hpp"

#include <string>
#include <vector>

using mk::edit::InlineParser;
using mk::edit::Mark;
using mk::edit::MarkType;
using mk::edit::SyntaxType;
using mk::edit::TextRun;

namespace
{

std::string joined(const std::vector<TextRun> &runs)
{
    std::string text;
    for (const auto &run : runs)
        text += run.text;
    return text;
}

} // namespace

TEST(InlineParser, KeepsDelimitersAsMarkedRuns)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("a **b** c");

    ASSERT_EQ(runs.size(), 5u);
    EXPECT_EQ(runs[0].text, "a ");
    EXPECT_TRUE(runs[0].marks.empty());

    EXPECT_EQ(runs[1].text, "**");
    EXPECT_EQ(mk::edit::syntaxTypeOf(runs[1].marks), SyntaxType::Strong);
    EXPECT_TRUE(mk::edit::hasMark(runs[1].marks, MarkType::Strong));

    EXPECT_EQ(runs[2].text, "b");
    EXPECT_EQ(runs[2].marks, (mk::edit::MarkSet{Mark::semantic(MarkType::Strong)}));

    EXPECT_EQ(runs[3].text, "**");
    EXPECT_EQ(runs[4].text, " c");
}

TEST(InlineParser, NestsEmphasisInsideStrong)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("**a *b* c**");

    EXPECT_EQ(joined(runs), "**a *b* c**");
    bool foundNested = false;
    for (const auto &run : runs)
    {
        if (run.text == "b")
        {
            foundNested = true;
            EXPECT_TRUE(mk::edit::hasMark(run.marks, MarkType::Strong));
            EXPECT_TRUE(mk::edit::hasMark(run.marks, MarkType::Emphasis));
            EXPECT_FALSE(mk::edit::hasMark(run.marks, MarkType::SyntaxMarker));
        }
    }
    EXPECT_TRUE(foundNested);
}

TEST(InlineParser, MarksStrongEmphasisDelimiters)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("***x***");

    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(mk::edit::syntaxTypeOf(runs[0].marks), SyntaxType::StrongEmphasis);
    EXPECT_TRUE(mk::edit::hasMark(runs[1].marks, MarkType::Strong));
    EXPECT_TRUE(mk::edit::hasMark(runs[1].marks, MarkType::Emphasis));
}

TEST(InlineParser, SplitsBackslashEscapes)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("a\\*b*");

    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].text, "a");
    EXPECT_EQ(runs[1].text, "\\");
    EXPECT_EQ(mk::edit::syntaxTypeOf(runs[1].marks), SyntaxType::Escape);
    EXPECT_EQ(runs[2].text, "*b*");
    EXPECT_TRUE(runs[2].marks.empty());
}

TEST(InlineParser, ParsesLinksWithTitles)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("see [docs](http://example.com/a\\(1\\) \"Docs\")");

    const mk::edit::Mark *link = nullptr;
    for (const auto &run : runs)
    {
        if (run.text == "docs")
            link = mk::edit::findMark(run.marks, MarkType::Link);
    }
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->href, "http://example.com/a(1)");
    EXPECT_EQ(link->title, "Docs");
    EXPECT_EQ(joined(runs), "see [docs](http://example.com/a\\(1\\) \"Docs\")");
}

TEST(InlineParser, IgnoresImagesAndEscapesInsideLinks)
{
    EXPECT_TRUE(InlineParser::collectMatches("![alt](pic.png)", SyntaxType::Link).empty());
    EXPECT_TRUE(InlineParser::findEscapes("[a](b\\)c)").empty());
    EXPECT_EQ(InlineParser::findEscapes("x \\_ y"), (std::vector<std::size_t>{2}));
}

TEST(InlineParser, CarriesMathContentOnTheMark)
{
    InlineParser parser;
    std::vector<TextRun> runs = parser.parse("so $x^2$ holds");

    ASSERT_EQ(runs.size(), 5u);
    const mk::edit::Mark *math = mk::edit::findMark(runs[2].marks, MarkType::MathInline);
    ASSERT_NE(math, nullptr);
    EXPECT_EQ(math->content, "x^2");
    EXPECT_EQ(mk::edit::syntaxTypeOf(runs[1].marks), SyntaxType::MathInline);
}

TEST(InlineParser, LeavesUnterminatedDelimitersAsText)
{
    InlineParser parser;
    for (const char *text : {"**open", "`tick", "~~gone", "$$5", "a * b"})
    {
        std::vector<TextRun> runs = parser.parse(text);
        ASSERT_EQ(runs.size(), 1u) << text;
        EXPECT_EQ(runs[0].text, text);
        EXPECT_TRUE(runs[0].marks.empty()) << text;
    }
}

TEST(InlineParser, PrefersEarlierAndLongerMatches)
{
    std::vector<mk::edit::InlineMatch> kept =
        InlineParser::selectMatches(InlineParser::collectMatches("`a **b**` **c**"));

    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].syntax, SyntaxType::CodeInline);
    EXPECT_EQ(kept[0].content, "a **b**");
    EXPECT_EQ(kept[1].syntax, SyntaxType::Strong);
    EXPECT_EQ(kept[1].content, "c");
}
