#include <gtest/gtest.h>

#include "mk/edit/markdown_parser.hpp"

#include <string>
#include <vector>

using mk::edit::MarkdownParser;
using mk::edit::MarkType;
using mk::edit::Node;
using mk::edit::NodeType;
using mk::edit::SyntaxType;
using mk::edit::TableAlignment;

namespace
{

std::vector<NodeType> childTypes(const Node &node)
{
    std::vector<NodeType> types;
    for (const auto &child : node.children())
        types.push_back(child.type());
    return types;
}

} // namespace

TEST(MarkdownParser, DetectsHeadingsAndTasks)
{
    MarkdownParser parser;
    Node doc = parser.parse("## Heading\n\n- [x] finish docs\n- [ ] review").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::Heading, NodeType::TaskList}));

    const Node &heading = doc.child(0);
    EXPECT_EQ(heading.attrs().level, 2);
    ASSERT_EQ(heading.runs().size(), 3u);
    EXPECT_EQ(heading.runs()[0].text, "##");
    EXPECT_EQ(mk::edit::syntaxTypeOf(heading.runs()[0].marks), SyntaxType::Heading);
    EXPECT_EQ(heading.textContent(), "## Heading");

    const Node &tasks = doc.child(1);
    ASSERT_EQ(tasks.childCount(), 2u);
    EXPECT_TRUE(tasks.child(0).attrs().checked);
    EXPECT_FALSE(tasks.child(1).attrs().checked);
    EXPECT_EQ(tasks.child(0).child(0).textContent(), "finish docs");
}

TEST(MarkdownParser, TracksCodeFences)
{
    MarkdownParser parser;
    Node doc = parser.parse("```cpp\nint main() {}\n\n```").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    const Node &code = doc.child(0);
    EXPECT_EQ(code.type(), NodeType::CodeBlock);
    EXPECT_EQ(code.attrs().language, "cpp");
    EXPECT_EQ(code.textContent(), "int main() {}\n");
}

TEST(MarkdownParser, InnerFenceWithLanguageNestsInsideOuterFence)
{
    MarkdownParser parser;
    Node doc = parser.parse("```markdown\n```js\nlet a;\n```\n```\nafter").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::CodeBlock, NodeType::Paragraph}));
    EXPECT_EQ(doc.child(0).attrs().language, "markdown");
    EXPECT_EQ(doc.child(0).textContent(), "```js\nlet a;\n```");
    EXPECT_EQ(doc.child(1).textContent(), "after");
}

TEST(MarkdownParser, ListMarkerInsideFenceStaysInTheItem)
{
    MarkdownParser parser;
    Node doc = parser.parse("- item\n  ```\n- inside\n  ```\n- next").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    const Node &list = doc.child(0);
    ASSERT_EQ(list.type(), NodeType::BulletList);
    ASSERT_EQ(list.childCount(), 2u);

    const Node &first = list.child(0);
    ASSERT_EQ(childTypes(first), (std::vector<NodeType>{NodeType::Paragraph, NodeType::CodeBlock}));
    EXPECT_EQ(first.child(0).textContent(), "item");
    EXPECT_EQ(first.child(1).textContent(), "- inside");
    EXPECT_EQ(list.child(1).child(0).textContent(), "next");
}

TEST(MarkdownParser, LeavesUnterminatedFenceAsParagraphs)
{
    MarkdownParser parser;
    Node doc = parser.parse("```cpp\ncode").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::Paragraph, NodeType::Paragraph}));
    EXPECT_EQ(doc.child(0).textContent(), "```cpp");
    EXPECT_EQ(doc.child(1).textContent(), "code");
}

TEST(MarkdownParser, ParsesTablesWithAlignment)
{
    MarkdownParser parser;
    Node doc = parser.parse("| Name | Size |\n|:-----|-----:|\n| a | 1 |\n| b | 2 |").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    const Node &table = doc.child(0);
    ASSERT_EQ(table.type(), NodeType::Table);
    ASSERT_EQ(table.childCount(), 3u);

    const Node &header = table.child(0);
    ASSERT_EQ(header.childCount(), 2u);
    EXPECT_EQ(header.child(0).type(), NodeType::TableHeader);
    EXPECT_EQ(header.child(0).textContent(), "Name");
    EXPECT_EQ(header.child(0).attrs().align, TableAlignment::Left);
    EXPECT_EQ(header.child(1).attrs().align, TableAlignment::Right);

    const Node &last = table.child(2);
    EXPECT_EQ(last.child(0).type(), NodeType::TableCell);
    EXPECT_EQ(last.child(1).textContent(), "2");
    EXPECT_EQ(last.child(1).attrs().align, TableAlignment::Right);
}

TEST(MarkdownParser, EscapedPipeStaysInsideTableCell)
{
    MarkdownParser parser;
    Node doc = parser.parse("| a \\| b | c |\n|---|---|\n| 1 | 2 |").doc;

    ASSERT_EQ(doc.child(0).type(), NodeType::Table);
    const Node &header = doc.child(0).child(0);
    ASSERT_EQ(header.childCount(), 2u);
    EXPECT_EQ(header.child(0).textContent(), "a \\| b");
    EXPECT_EQ(header.child(1).textContent(), "c");

    const Node &cell = header.child(0);
    ASSERT_EQ(cell.runs().size(), 3u);
    EXPECT_EQ(cell.runs()[1].text, "\\");
    EXPECT_EQ(mk::edit::syntaxTypeOf(cell.runs()[1].marks), SyntaxType::Escape);
}

TEST(MarkdownParser, TableRowWithoutSeparatorIsAParagraph)
{
    MarkdownParser parser;
    Node doc = parser.parse("| just | pipes |").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    EXPECT_EQ(doc.child(0).type(), NodeType::Paragraph);
}

TEST(MarkdownParser, NestsIndentedLists)
{
    MarkdownParser parser;
    Node doc = parser.parse("- a\n  - b\n- c").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    const Node &list = doc.child(0);
    ASSERT_EQ(list.type(), NodeType::BulletList);
    ASSERT_EQ(list.childCount(), 2u);

    const Node &first = list.child(0);
    ASSERT_EQ(childTypes(first), (std::vector<NodeType>{NodeType::Paragraph, NodeType::BulletList}));
    EXPECT_EQ(first.child(1).child(0).child(0).textContent(), "b");
    EXPECT_EQ(list.child(1).child(0).textContent(), "c");
}

TEST(MarkdownParser, KeepsOrderedListStart)
{
    MarkdownParser parser;
    Node doc = parser.parse("3. three\n4. four").doc;

    ASSERT_EQ(doc.child(0).type(), NodeType::OrderedList);
    EXPECT_EQ(doc.child(0).attrs().start, 3u);
    EXPECT_EQ(doc.child(0).childCount(), 2u);
}

TEST(MarkdownParser, PrefixesQuotedParagraphsWithMarker)
{
    MarkdownParser parser;
    Node doc = parser.parse("> quoted *text*").doc;

    const Node &quote = doc.child(0);
    ASSERT_EQ(quote.type(), NodeType::Blockquote);
    const Node &paragraph = quote.child(0);
    ASSERT_FALSE(paragraph.runs().empty());
    EXPECT_EQ(paragraph.runs()[0].text, "> ");
    EXPECT_EQ(mk::edit::syntaxTypeOf(paragraph.runs()[0].marks), SyntaxType::Blockquote);
    EXPECT_EQ(paragraph.textContent(), "> quoted *text*");
}

TEST(MarkdownParser, ParsesLeafAndRawBlocks)
{
    MarkdownParser parser;
    Node doc = parser.parse("![logo](img/logo.png \"Logo\")\n---\n$$e=mc^2$$\n<div>\nhi\n</div>").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::Image, NodeType::HorizontalRule,
                                                      NodeType::MathBlock, NodeType::HtmlBlock}));
    EXPECT_EQ(doc.child(0).attrs().src, "img/logo.png");
    EXPECT_EQ(doc.child(0).attrs().alt, "logo");
    EXPECT_EQ(doc.child(0).attrs().title, "Logo");
    EXPECT_EQ(doc.child(2).textContent(), "e=mc^2");
    EXPECT_EQ(doc.child(3).textContent(), "<div>\nhi\n</div>");
}

TEST(MarkdownParser, HtmlBlockBalancesNestedSameTag)
{
    MarkdownParser parser;
    Node doc = parser.parse("<div>\n<div>inner</div>\n</div>\nafter").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::HtmlBlock, NodeType::Paragraph}));
    EXPECT_EQ(doc.child(0).textContent(), "<div>\n<div>inner</div>\n</div>");
    EXPECT_EQ(doc.child(1).textContent(), "after");
}

TEST(MarkdownParser, VoidHtmlElementIsASingleLine)
{
    MarkdownParser parser;
    Node doc = parser.parse("<br>\ntext").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::HtmlBlock, NodeType::Paragraph}));
    EXPECT_EQ(doc.child(0).textContent(), "<br>");
    EXPECT_EQ(doc.child(1).textContent(), "text");
}

TEST(MarkdownParser, UnterminatedRawBlocksRunToTheEnd)
{
    MarkdownParser parser;

    Node html = parser.parse("<div>\nopen\nstill open").doc;
    ASSERT_EQ(childTypes(html), (std::vector<NodeType>{NodeType::HtmlBlock}));
    EXPECT_EQ(html.child(0).textContent(), "<div>\nopen\nstill open");

    Node math = parser.parse("$$\na+b\nc").doc;
    ASSERT_EQ(childTypes(math), (std::vector<NodeType>{NodeType::MathBlock}));
    EXPECT_EQ(math.child(0).textContent(), "a+b\nc");

    Node container = parser.parse(":::tip\nfirst\n\nsecond").doc;
    ASSERT_EQ(childTypes(container), (std::vector<NodeType>{NodeType::Container}));
    EXPECT_EQ(container.child(0).attrs().containerType, "tip");
    ASSERT_EQ(childTypes(container.child(0)), (std::vector<NodeType>{NodeType::Paragraph, NodeType::Paragraph}));
    EXPECT_EQ(container.child(0).child(1).textContent(), "second");
}

TEST(MarkdownParser, ParsesMultiLineMathAndContainers)
{
    MarkdownParser parser;
    Node doc = parser.parse("$$\na+b\n$$\n:::note Heads up\nInside **here**\n:::").doc;

    ASSERT_EQ(childTypes(doc), (std::vector<NodeType>{NodeType::MathBlock, NodeType::Container}));
    EXPECT_EQ(doc.child(0).textContent(), "a+b");

    const Node &container = doc.child(1);
    EXPECT_EQ(container.attrs().containerType, "note");
    EXPECT_EQ(container.attrs().containerTitle, "Heads up");
    ASSERT_EQ(container.childCount(), 1u);
    EXPECT_EQ(container.child(0).textContent(), "Inside **here**");
}

TEST(MarkdownParser, KeepsExtraBlankLinesAsEmptyParagraphs)
{
    MarkdownParser parser;

    EXPECT_EQ(parser.parse("a\n\nb").doc.childCount(), 2u);

    Node spaced = parser.parse("a\n\n\nb").doc;
    ASSERT_EQ(spaced.childCount(), 3u);
    EXPECT_EQ(spaced.child(1).type(), NodeType::Paragraph);
    EXPECT_EQ(spaced.child(1).contentSize(), 0u);

    EXPECT_EQ(parser.parse("a\n").doc.childCount(), 1u);
    EXPECT_EQ(parser.parse("a\r\nb").doc.childCount(), 2u);
}

TEST(MarkdownParser, EmptyInputYieldsOneEmptyParagraph)
{
    MarkdownParser parser;
    Node doc = parser.parse("").doc;

    ASSERT_EQ(doc.childCount(), 1u);
    EXPECT_EQ(doc.child(0).type(), NodeType::Paragraph);
    EXPECT_EQ(doc.contentSize(), 2u);
}

TEST(MarkdownParser, ReportsSyntaxMarkerRegions)
{
    MarkdownParser parser;
    mk::edit::ParseResult result = parser.parse("a **b**");

    ASSERT_EQ(result.markers.size(), 2u);
    EXPECT_EQ(result.markers[0], (mk::edit::SyntaxMarkerRegion{3, 5, SyntaxType::Strong}));
    EXPECT_EQ(result.markers[1], (mk::edit::SyntaxMarkerRegion{6, 8, SyntaxType::Strong}));
}

TEST(MarkdownParser, DelimitersCarrySemanticMarks)
{
    MarkdownParser parser;
    Node doc = parser.parse("~~gone~~ and ==lit==").doc;

    for (const auto &run : doc.child(0).runs())
    {
        if (run.text == "~~")
            EXPECT_TRUE(mk::edit::hasMark(run.marks, MarkType::Strikethrough));
        if (run.text == "==")
            EXPECT_TRUE(mk::edit::hasMark(run.marks, MarkType::Highlight));
    }
}
