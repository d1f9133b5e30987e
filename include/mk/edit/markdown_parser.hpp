#pragma once

#include "mk/edit/document.hpp"
#include "mk/edit/inline_parser.hpp"
#include "mk/edit/markdown_syntax.hpp"
#include "mk/edit/regions.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

struct ParseResult
{
    Node doc{NodeType::Doc};
    std::vector<SyntaxMarkerRegion> markers;
};

// Turns Markdown text into a document tree whose textblocks still contain
// every delimiter as marked text. Never fails: constructs that do not match
// their full grammar fall through to later rules and finally to paragraphs.
//
// Block rules, in priority order: closed code fence, single-line $$math$$,
// multi-line $$ block, ::: container, ATX heading, image line, horizontal
// rule, blockquote, task list, bullet list, ordered list, table, raw HTML,
// paragraph.
class MarkdownParser
{
public:
    ParseResult parse(std::string_view markdown) const;

    std::vector<Node> parseBlocks(const std::vector<std::string> &lines) const;
    std::vector<TextRun> parseInline(std::string_view text, const MarkSet &inherited = {}) const;

private:
    struct BlockResult
    {
        Node node;
        std::size_t endIndex = 0; // last consumed line
    };

    enum class ListKind
    {
        Bullet,
        Ordered
    };

    Node parseParagraph(std::string_view line) const;
    Node parseHeading(const HeadingLine &heading) const;
    std::optional<BlockResult> parseCodeBlock(const std::vector<std::string> &lines, std::size_t start) const;
    BlockResult parseMathBlock(const std::vector<std::string> &lines, std::size_t start) const;
    BlockResult parseContainer(const std::vector<std::string> &lines, std::size_t start,
                               const ContainerOpen &open) const;
    BlockResult parseHtmlBlock(const std::vector<std::string> &lines, std::size_t start,
                               const std::string &tag) const;
    BlockResult parseBlockquote(const std::vector<std::string> &lines, std::size_t start) const;
    BlockResult parseTaskList(const std::vector<std::string> &lines, std::size_t start) const;
    BlockResult parseList(const std::vector<std::string> &lines, std::size_t start, ListKind kind) const;
    std::optional<BlockResult> parseTable(const std::vector<std::string> &lines, std::size_t start) const;
    std::vector<Node> parseTableRow(std::string_view line, bool header,
                                    const std::vector<TableAlignment> &alignments) const;

    InlineParser inlineParser;
};

} // namespace mk::edit
