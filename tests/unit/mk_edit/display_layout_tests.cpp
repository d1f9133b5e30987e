#include <gtest/gtest.h>

#include "mk/edit/decorations.hpp"
#include "mk/edit/display_layout.hpp"
#include "mk/edit/markdown_parser.hpp"

#include <string>
#include <vector>

using mk::edit::DecorationEngine;
using mk::edit::DisplayLine;
using mk::edit::Node;

namespace
{

class BracketRenderer : public mk::edit::MathRenderer
{
public:
    std::string render(std::string_view formula) override
    {
        return "[" + std::string(formula) + "]";
    }
};

std::vector<DisplayLine> layoutAt(const std::string &markdown, std::size_t cursor,
                                  mk::edit::MathRenderer *renderer = nullptr)
{
    mk::edit::MarkdownParser parser;
    Node doc = parser.parse(markdown).doc;
    DecorationEngine engine(renderer);
    return mk::edit::layoutDocument(doc, engine.computeDecorations(doc, cursor, false).decorations);
}

std::vector<std::string> lineTexts(const std::vector<DisplayLine> &lines)
{
    std::vector<std::string> texts;
    for (const auto &line : lines)
        texts.push_back(line.text());
    return texts;
}

} // namespace

TEST(DisplayLayout, DropsHiddenMarkers)
{
    EXPECT_EQ(lineTexts(layoutAt("a **b** c", 1)), (std::vector<std::string>{"a b c"}));
    EXPECT_EQ(lineTexts(layoutAt("a **b** c", 5)), (std::vector<std::string>{"a **b** c"}));
}

TEST(DisplayLayout, PlacesRenderedMathAfterHiddenSource)
{
    BracketRenderer renderer;
    EXPECT_EQ(lineTexts(layoutAt("x $a$ y", 1, &renderer)), (std::vector<std::string>{"x [a] y"}));
    EXPECT_EQ(lineTexts(layoutAt("x $a$ y", 4, &renderer)), (std::vector<std::string>{"x $a$ y"}));
}

TEST(DisplayLayout, PrefixesListsAndQuotes)
{
    EXPECT_EQ(lineTexts(layoutAt("- a\n- b", 1)),
              (std::vector<std::string>{"\xE2\x80\xA2 a", "\xE2\x80\xA2 b"}));
    EXPECT_EQ(lineTexts(layoutAt("3. x\n4. y", 1)), (std::vector<std::string>{"3. x", "4. y"}));
    EXPECT_EQ(lineTexts(layoutAt("- [x] done\n- [ ] todo", 1)), (std::vector<std::string>{"[x] done", "[ ] todo"}));

    // The quote marker is hidden while the cursor is in the last paragraph.
    EXPECT_EQ(lineTexts(layoutAt("> q\n\nz", 8)), (std::vector<std::string>{"\xE2\x94\x82 q", "z"}));
}

TEST(DisplayLayout, DrawsTablesWithHeaderRule)
{
    std::vector<DisplayLine> lines = layoutAt("| a | b |\n|---|---|\n| 1 | 2 |", 3);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text(), "a \xE2\x94\x82 b");
    EXPECT_FALSE(lines[1].hasText);
    EXPECT_EQ(lines[1].width(), 5u);
    EXPECT_EQ(lines[2].text(), "1 \xE2\x94\x82 2");
}

TEST(DisplayLayout, RendersLeafBlocksAsDecorations)
{
    std::vector<DisplayLine> lines = layoutAt("![logo](logo.png)\n\n---\n\nend", 0);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text(), "[image: logo]");
    EXPECT_FALSE(lines[0].hasText);
    EXPECT_EQ(lines[1].width(), 40u);
    EXPECT_EQ(lines[2].text(), "end");
}

TEST(DisplayLayout, SplitsCodeBlocksIntoLines)
{
    std::vector<DisplayLine> lines = layoutAt("```\nl1\nl2\n```", 1);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text(), "l1");
    EXPECT_EQ(lines[1].text(), "l2");
    EXPECT_EQ(lines[1].from, 4u);
    EXPECT_EQ(mk::edit::lineIndexOf(lines, 5), 1u);
    EXPECT_EQ(mk::edit::lineIndexOf(lines, 2), 0u);
}

TEST(DisplayLayout, MapsColumnsAroundHiddenText)
{
    std::vector<DisplayLine> lines = layoutAt("a **b** c", 1);
    ASSERT_EQ(lines.size(), 1u);
    const DisplayLine &line = lines[0];

    EXPECT_EQ(line.columnOf(1), 0u);
    EXPECT_EQ(line.columnOf(5), 2u);
    EXPECT_EQ(line.columnOf(8), 3u);
    EXPECT_EQ(line.positionAt(2), 5u);
    EXPECT_EQ(line.positionAt(4), 9u);
    EXPECT_EQ(line.positionAt(100), 10u);
}

TEST(DisplayLayout, ListsEveryCursorPosition)
{
    mk::edit::MarkdownParser parser;
    Node doc = parser.parse("ab\n\nc").doc;
    EXPECT_EQ(mk::edit::cursorPositions(doc), (std::vector<std::size_t>{1, 2, 3, 5, 6}));
}

TEST(DisplayLayout, CountsCodePointsForWidth)
{
    EXPECT_EQ(mk::edit::displayWidth("\xE2\x80\xA2 ab"), 4u);
    EXPECT_EQ(mk::edit::displayWidth(""), 0u);
}
