#include <gtest/gtest.h>

#include "mk/edit/editor_session.hpp"

#include <string>
#include <vector>

using mk::edit::EditorSession;
using mk::edit::EditorSettings;
using mk::edit::Node;
using mk::edit::NodeType;

namespace
{

class EchoRenderer : public mk::edit::MathRenderer
{
public:
    std::string render(std::string_view formula) override
    {
        return "<" + std::string(formula) + ">";
    }
};

std::vector<NodeType> childTypes(const Node &node)
{
    std::vector<NodeType> types;
    for (const auto &child : node.children())
        types.push_back(child.type());
    return types;
}

} // namespace

TEST(EditorSession, StartsWithAnEmptyParagraph)
{
    EditorSession session;

    ASSERT_EQ(session.doc().childCount(), 1u);
    EXPECT_EQ(session.doc().child(0).type(), NodeType::Paragraph);
    EXPECT_EQ(session.selection(), 1u);
    EXPECT_FALSE(session.isSourceView());
    EXPECT_EQ(session.regionScanCount(), 1u);
}

TEST(EditorSession, CursorMovesReuseCachedRegions)
{
    EditorSession session;
    session.setMarkdown("a **b** c");
    EXPECT_EQ(session.regionScanCount(), 2u);
    EXPECT_EQ(session.selection(), 1u);
    EXPECT_TRUE(session.decorations().isHidden(3));

    session.setSelection(5);
    EXPECT_EQ(session.regionScanCount(), 2u);
    EXPECT_FALSE(session.decorations().isHidden(3));

    session.setSelection(3);
    EXPECT_EQ(session.regionScanCount(), 2u);
    ASSERT_EQ(session.activeRegions().size(), 1u);
    EXPECT_EQ(session.activeRegions()[0].from, 3u);

    session.insertText(10, "!");
    EXPECT_EQ(session.regionScanCount(), 3u);
    EXPECT_EQ(session.selection(), 11u);
    EXPECT_EQ(session.doc().child(0).textContent(), "a **b** c!");
}

TEST(EditorSession, DeletesARangeAndMovesTheCursorToItsStart)
{
    EditorSession session;
    session.setMarkdown("a **b** c");
    std::size_t scansBefore = session.regionScanCount();

    session.deleteRange(1, 3);
    EXPECT_EQ(session.doc().child(0).textContent(), "**b** c");
    EXPECT_EQ(session.selection(), 1u);
    EXPECT_EQ(session.regionScanCount(), scansBefore + 1);
}

TEST(EditorSession, ClampsSelectionToDocument)
{
    EditorSession session;
    session.setMarkdown("abc");
    session.setSelection(1000);
    EXPECT_EQ(session.selection(), session.doc().contentSize());
}

TEST(EditorSession, NotifiesListenersOncePerToggle)
{
    EditorSession session;
    session.setMarkdown("```\nx\n```");

    std::vector<bool> seen;
    std::size_t id = session.subscribe([&seen](bool sourceView) { seen.push_back(sourceView); });
    EXPECT_EQ(seen, (std::vector<bool>{false}));

    session.toggleSourceView();
    EXPECT_EQ(seen, (std::vector<bool>{false, true}));
    EXPECT_TRUE(session.isSourceView());

    session.setSourceView(true);
    session.setSelection(2);
    EXPECT_EQ(seen.size(), 2u);

    session.toggleSourceView();
    EXPECT_EQ(seen, (std::vector<bool>{false, true, false}));

    session.unsubscribe(id);
    session.toggleSourceView();
    EXPECT_EQ(seen.size(), 3u);
}

TEST(EditorSession, ToggleRewritesTheWholeDocument)
{
    EditorSession session;
    session.setMarkdown("intro\n\n```cpp\nint x;\n```\n\n---");
    std::size_t scansBefore = session.regionScanCount();

    session.toggleSourceView();
    EXPECT_EQ(session.regionScanCount(), scansBefore + 1);
    EXPECT_EQ(childTypes(session.doc()), std::vector<NodeType>(5, NodeType::Paragraph));

    session.toggleSourceView();
    EXPECT_EQ(childTypes(session.doc()),
              (std::vector<NodeType>{NodeType::Paragraph, NodeType::CodeBlock, NodeType::HorizontalRule}));
}

TEST(EditorSession, EditsInSourceViewReachTheStructuredBlock)
{
    EditorSession session;
    session.setMarkdown("```cpp\nint x;\n```");
    session.toggleSourceView();

    // End of the second source line.
    session.insertText(15, " // y");
    session.toggleSourceView();

    ASSERT_EQ(session.doc().childCount(), 1u);
    EXPECT_EQ(session.doc().child(0).type(), NodeType::CodeBlock);
    EXPECT_EQ(session.doc().child(0).textContent(), "int x; // y");
}

TEST(EditorSession, DeletingATableRowInSourceView)
{
    EditorSession session;
    session.setMarkdown("| h |\n|---|\n| 1 |\n| 2 |");
    session.toggleSourceView();
    ASSERT_EQ(session.doc().childCount(), 4u);

    Node edited = session.doc();
    edited.removeChild(2);
    mk::edit::Transaction transaction;
    transaction.doc = std::move(edited);
    session.dispatch(std::move(transaction));

    EXPECT_EQ(session.markdown(), "| h |\n| --- |\n| 2 |");

    session.toggleSourceView();
    ASSERT_EQ(session.doc().child(0).type(), NodeType::Table);
    EXPECT_EQ(session.doc().child(0).childCount(), 2u);
}

TEST(EditorSession, LoadingInSourceViewFlattensStructuredBlocks)
{
    EditorSettings settings;
    settings.startInSourceView = true;
    EditorSession session(settings);
    EXPECT_TRUE(session.isSourceView());

    session.setMarkdown("$$\nx\n$$");
    EXPECT_EQ(childTypes(session.doc()), std::vector<NodeType>(3, NodeType::Paragraph));
    EXPECT_EQ(session.markdown(), "$$\nx\n$$");
}

TEST(EditorSession, PastesPlainTextLiterally)
{
    EditorSession session;
    session.setMarkdown("ab");
    session.setSelection(2);

    session.paste("XY");
    EXPECT_EQ(session.doc().child(0).textContent(), "aXYb");
    EXPECT_EQ(session.selection(), 4u);
}

TEST(EditorSession, PastesMarkdownAsBlocks)
{
    EditorSession session;
    session.paste("# Head\r\n\r\n- a");

    EXPECT_EQ(childTypes(session.doc()), (std::vector<NodeType>{NodeType::Heading, NodeType::BulletList}));
    // End of the list item paragraph.
    EXPECT_EQ(session.selection(), 12u);
}

TEST(EditorSession, PastedBlocksFollowTheCurrentBlock)
{
    EditorSession session;
    session.setMarkdown("intro\n\nend");

    session.paste("**bold** text\n\n> q");
    EXPECT_EQ(childTypes(session.doc()), (std::vector<NodeType>{NodeType::Paragraph, NodeType::Paragraph,
                                                                NodeType::Blockquote, NodeType::Paragraph}));
    EXPECT_EQ(session.doc().child(1).textContent(), "**bold** text");
    EXPECT_EQ(session.doc().child(3).textContent(), "end");
}

TEST(EditorSession, PastesLiterallyWhenParsingIsOffOrInSourceView)
{
    EditorSettings settings;
    settings.parsePastedMarkdown = false;
    EditorSession literal(settings);
    literal.paste("**x**");
    ASSERT_EQ(literal.doc().childCount(), 1u);
    EXPECT_EQ(literal.doc().child(0).textContent(), "**x**");

    EditorSession source;
    source.toggleSourceView();
    source.paste("# not a heading");
    ASSERT_EQ(source.doc().childCount(), 1u);
    EXPECT_EQ(source.doc().child(0).type(), NodeType::Paragraph);
    EXPECT_EQ(source.doc().child(0).textContent(), "# not a heading");
}

TEST(EditorSession, RendersInlineMathOnlyWhenEnabled)
{
    EchoRenderer renderer;
    EditorSession rendered(EditorSettings{}, &renderer);
    rendered.setMarkdown("x $a$ y");
    ASSERT_EQ(rendered.decorations().widgetsAt(6).size(), 1u);
    EXPECT_EQ(rendered.decorations().widgetsAt(6)[0].widgetContent, "<a>");

    EditorSettings settings;
    settings.renderInlineMath = false;
    EditorSession plain(settings, &renderer);
    plain.setMarkdown("x $a$ y");
    EXPECT_TRUE(plain.decorations().widgetsAt(6).empty());
}

TEST(EditorSession, SerializesTheCurrentDocument)
{
    EditorSession session;
    const std::string text = "# Notes\n\n- [x] parse\n- [ ] render\n\n```sh\nmake\n```";
    session.setMarkdown(text);
    EXPECT_EQ(session.markdown(), text);

    session.toggleSourceView();
    EXPECT_EQ(session.markdown(), text);
}
