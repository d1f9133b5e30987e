#include <gtest/gtest.h>

#include "mk/edit/document.hpp"
#include "mk/edit/markdown_parser.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using mk::edit::Mark;
using mk::edit::MarkType;
using mk::edit::Node;
using mk::edit::NodeType;
using mk::edit::SyntaxType;

namespace
{

Node twoParagraphs()
{
    return Node::branch(NodeType::Doc, {Node::paragraph("ab"), Node::paragraph("cd")});
}

} // namespace

TEST(Document, CountsBoundariesLeavesAndText)
{
    Node doc = Node::branch(NodeType::Doc,
                            {Node::paragraph("abc"), Node(NodeType::HorizontalRule), Node::paragraph()});

    EXPECT_EQ(doc.child(0).nodeSize(), 5u);
    EXPECT_EQ(doc.child(1).nodeSize(), 1u);
    EXPECT_EQ(doc.child(2).nodeSize(), 2u);
    EXPECT_EQ(doc.contentSize(), 8u);
    EXPECT_EQ(doc.textContent(), "abc");
}

TEST(Document, InsertsAndDeletesTextInDocumentCoordinates)
{
    Node doc = twoParagraphs();

    doc.insertText(1, "X");
    EXPECT_EQ(doc.child(0).textContent(), "Xab");

    // Second paragraph content now starts at 6.
    doc.insertText(8, "!");
    EXPECT_EQ(doc.child(1).textContent(), "cd!");

    doc.deleteText(1, 2);
    EXPECT_EQ(doc.child(0).textContent(), "ab");
}

TEST(Document, RejectsPositionsOutsideTextblocks)
{
    Node doc = twoParagraphs();

    EXPECT_THROW(doc.insertText(100, "x"), std::out_of_range);
    EXPECT_THROW(doc.deleteText(2, 6), std::out_of_range);
    EXPECT_THROW(doc.child(5), std::out_of_range);
    EXPECT_THROW(doc.removeChild(2), std::out_of_range);
}

TEST(Document, TypedTextNeverJoinsADelimiter)
{
    mk::edit::MarkdownParser parser;
    Node doc = parser.parse("**b**").doc;

    // Between the two asterisks of the opening delimiter.
    doc.insertText(2, "X");

    const Node &paragraph = doc.child(0);
    EXPECT_EQ(paragraph.textContent(), "*X*b**");
    for (const auto &run : paragraph.runs())
    {
        if (run.text.find('X') != std::string::npos)
        {
            EXPECT_FALSE(mk::edit::hasMark(run.marks, MarkType::SyntaxMarker));
            EXPECT_TRUE(mk::edit::hasMark(run.marks, MarkType::Strong));
        }
    }
}

TEST(Document, MergesAdjacentRunsWithEqualMarks)
{
    Node paragraph(NodeType::Paragraph);
    paragraph.appendRun("a");
    paragraph.appendRun("b");
    paragraph.appendRun("c", {Mark::semantic(MarkType::Strong)});
    paragraph.appendRun("");

    ASSERT_EQ(paragraph.runs().size(), 2u);
    EXPECT_EQ(paragraph.runs()[0].text, "ab");
    EXPECT_EQ(paragraph.runs()[1].text, "c");
}

TEST(Document, KeepsMarkSetsCanonicallyOrdered)
{
    mk::edit::MarkSet marks;
    marks = mk::edit::withMark(marks, Mark::semantic(MarkType::Emphasis));
    marks = mk::edit::withMark(marks, Mark::syntaxMarker(SyntaxType::Strong));
    marks = mk::edit::withMark(marks, Mark::semantic(MarkType::Strong));
    marks = mk::edit::withMark(marks, Mark::semantic(MarkType::Strong));

    ASSERT_EQ(marks.size(), 3u);
    EXPECT_EQ(marks[0].type, MarkType::SyntaxMarker);
    EXPECT_EQ(marks[1].type, MarkType::Strong);
    EXPECT_EQ(marks[2].type, MarkType::Emphasis);
    EXPECT_EQ(mk::edit::syntaxTypeOf(marks), SyntaxType::Strong);

    marks = mk::edit::withoutMark(marks, MarkType::SyntaxMarker);
    EXPECT_FALSE(mk::edit::syntaxTypeOf(marks).has_value());
}

TEST(Document, ExtractsTextAcrossBlocks)
{
    Node doc = twoParagraphs();
    EXPECT_EQ(doc.textBetween(1, 7), "abcd");
    EXPECT_EQ(doc.textBetween(2, 6), "bc");
    EXPECT_EQ(doc.textBetween(3, 3), "");
}

TEST(Document, ResolvesTextblocksByPosition)
{
    Node doc = twoParagraphs();

    auto second = mk::edit::resolveTextblock(doc, 5);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->node, &doc.child(1));
    EXPECT_EQ(second->contentStart, 5u);
    EXPECT_EQ(second->contentEnd, 7u);

    EXPECT_FALSE(mk::edit::resolveTextblock(doc, 4).has_value());
    EXPECT_FALSE(mk::edit::resolveTextblock(doc, 42).has_value());
}

TEST(Document, VisitsNestedTextblocksWithContentStarts)
{
    mk::edit::MarkdownParser parser;
    Node doc = parser.parse("- a\n- b").doc;

    std::vector<std::size_t> starts;
    std::vector<std::string> texts;
    mk::edit::forEachTextblock(doc, [&](const Node &textblock, std::size_t contentStart) {
        starts.push_back(contentStart);
        texts.push_back(textblock.textContent());
    });

    EXPECT_EQ(starts, (std::vector<std::size_t>{3, 8}));
    EXPECT_EQ(texts, (std::vector<std::string>{"a", "b"}));
}

TEST(Document, SameStructureIgnoresSourceViewAttributes)
{
    mk::edit::NodeAttrs grouped;
    grouped.group = mk::edit::BlockGroup{mk::edit::BlockGroupKind::CodeBlock, "cb_1", 0, 1};
    grouped.hrSource = true;

    Node plain = Node::branch(NodeType::Doc, {Node::paragraph("x")});
    Node tagged = Node::branch(NodeType::Doc, {Node::paragraph("x", grouped)});

    EXPECT_NE(plain, tagged);
    EXPECT_TRUE(plain.sameStructure(tagged));
    EXPECT_FALSE(plain.sameStructure(Node::branch(NodeType::Doc, {Node::paragraph("y")})));
}

TEST(Document, NamesRoundTripThroughLookups)
{
    EXPECT_EQ(mk::edit::nodeTypeName(NodeType::TaskItem), "task_item");
    EXPECT_EQ(mk::edit::nodeTypeFromName("code_block"), NodeType::CodeBlock);
    EXPECT_EQ(mk::edit::syntaxTypeFromName("strong_emphasis"), SyntaxType::StrongEmphasis);
    EXPECT_FALSE(mk::edit::nodeTypeFromName("nonsense").has_value());
}
