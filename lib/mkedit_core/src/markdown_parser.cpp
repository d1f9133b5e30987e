#include "mk/edit/markdown_parser.hpp"

#include <algorithm>
#include <charconv>
#include <plog/Log.h>
#include <regex>

namespace mk::edit
{
namespace
{
std::size_t parseListStart(const std::string &number)
{
    std::size_t value = 1;
    auto rc = std::from_chars(number.data(), number.data() + number.size(), value);
    if (rc.ec != std::errc())
        return 1;
    return value;
}

Node textblockWithText(NodeType type, const std::string &text, NodeAttrs attrs = {})
{
    Node node(type, std::move(attrs));
    node.appendRun(text);
    return node;
}

} // namespace

ParseResult MarkdownParser::parse(std::string_view markdown) const
{
    std::vector<std::string> lines = splitLines(normalizeLineEndings(markdown));
    std::vector<Node> blocks = parseBlocks(lines);
    if (blocks.empty())
        blocks.push_back(Node::paragraph());

    ParseResult result;
    result.doc = Node::branch(NodeType::Doc, std::move(blocks));
    result.markers = findSyntaxMarkerRegions(result.doc);
    PLOG_DEBUG << "Parsed " << lines.size() << " lines into " << result.doc.childCount() << " blocks, "
               << result.markers.size() << " syntax markers";
    return result;
}

std::vector<TextRun> MarkdownParser::parseInline(std::string_view text, const MarkSet &inherited) const
{
    return inlineParser.parse(text, inherited);
}

std::vector<Node> MarkdownParser::parseBlocks(const std::vector<std::string> &lines) const
{
    std::vector<Node> blocks;
    std::size_t i = 0;

    while (i < lines.size())
    {
        const std::string &line = lines[i];

        if (isBlank(line))
        {
            std::size_t blankCount = 0;
            while (i < lines.size() && isBlank(lines[i]))
            {
                ++blankCount;
                ++i;
            }
            // The first blank line separates blocks; further ones are kept as
            // empty paragraphs. The empty string after a final newline is not
            // a blank line of its own.
            std::size_t extra = blocks.empty() ? blankCount : blankCount - 1;
            for (std::size_t j = 0; j < extra; ++j)
            {
                if (i >= lines.size() && j == extra - 1)
                    break;
                blocks.push_back(Node::paragraph());
            }
            continue;
        }

        if (matchCodeFenceOpen(line))
        {
            if (auto result = parseCodeBlock(lines, i))
            {
                blocks.push_back(std::move(result->node));
                i = result->endIndex + 1;
                continue;
            }
            PLOG_DEBUG << "Unterminated code fence at line " << i + 1 << " left as paragraph text";
        }

        if (auto math = matchSingleLineMath(line))
        {
            blocks.push_back(textblockWithText(NodeType::MathBlock, *math));
            ++i;
            continue;
        }

        if (isMathFence(line))
        {
            BlockResult result = parseMathBlock(lines, i);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (auto container = matchContainerOpen(line))
        {
            BlockResult result = parseContainer(lines, i, *container);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (auto heading = matchHeading(line))
        {
            blocks.push_back(parseHeading(*heading));
            ++i;
            continue;
        }

        if (auto image = matchImageLine(line))
        {
            NodeAttrs attrs;
            attrs.src = image->src;
            attrs.alt = image->alt;
            attrs.title = image->title;
            blocks.emplace_back(NodeType::Image, std::move(attrs));
            ++i;
            continue;
        }

        if (isHorizontalRule(line))
        {
            blocks.emplace_back(NodeType::HorizontalRule);
            ++i;
            continue;
        }

        if (matchBlockquote(line))
        {
            BlockResult result = parseBlockquote(lines, i);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (matchTaskItem(line))
        {
            BlockResult result = parseTaskList(lines, i);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (matchBulletItem(line))
        {
            BlockResult result = parseList(lines, i, ListKind::Bullet);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (matchOrderedItem(line))
        {
            BlockResult result = parseList(lines, i, ListKind::Ordered);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        if (isTableRow(line))
        {
            if (auto result = parseTable(lines, i))
            {
                blocks.push_back(std::move(result->node));
                i = result->endIndex + 1;
                continue;
            }
        }

        if (auto tag = matchHtmlBlockStart(line))
        {
            BlockResult result = parseHtmlBlock(lines, i, *tag);
            blocks.push_back(std::move(result.node));
            i = result.endIndex + 1;
            continue;
        }

        blocks.push_back(parseParagraph(line));
        ++i;
    }

    return blocks;
}

Node MarkdownParser::parseParagraph(std::string_view line) const
{
    return Node::textblock(NodeType::Paragraph, parseInline(line));
}

Node MarkdownParser::parseHeading(const HeadingLine &heading) const
{
    NodeAttrs attrs;
    attrs.level = heading.level;
    Node node(NodeType::Heading, std::move(attrs));
    node.appendRun(heading.hashes, {Mark::syntaxMarker(SyntaxType::Heading)});
    node.appendRun(heading.spacing);
    node.appendRuns(parseInline(heading.content));
    return node;
}

std::optional<MarkdownParser::BlockResult> MarkdownParser::parseCodeBlock(const std::vector<std::string> &lines,
                                                                          std::size_t start) const
{
    std::optional<CodeFenceOpen> fence = matchCodeFenceOpen(lines[start]);
    if (!fence)
        return std::nullopt;

    std::vector<std::string> contentLines;
    std::size_t end = start + 1;
    int nestedLevel = 0;
    while (end < lines.size())
    {
        const std::string &line = lines[end];
        bool isClose = isCodeFenceClose(line);
        bool isOpen = !isClose && matchCodeFenceOpen(line).has_value();
        if (isOpen)
        {
            ++nestedLevel;
        }
        else if (isClose)
        {
            if (nestedLevel == 0)
                break;
            --nestedLevel;
        }

        if (fence->indent > 0 && line.size() >= fence->indent)
            contentLines.push_back(line.substr(fence->indent));
        else
            contentLines.push_back(line);
        ++end;
    }
    if (end >= lines.size())
        return std::nullopt;

    NodeAttrs attrs;
    attrs.language = fence->language;
    return BlockResult{textblockWithText(NodeType::CodeBlock, joinLines(contentLines), std::move(attrs)), end};
}

MarkdownParser::BlockResult MarkdownParser::parseMathBlock(const std::vector<std::string> &lines,
                                                           std::size_t start) const
{
    std::vector<std::string> contentLines;
    std::size_t end = start + 1;
    while (end < lines.size() && !isMathFence(lines[end]))
        contentLines.push_back(lines[end++]);
    if (end >= lines.size())
    {
        PLOG_DEBUG << "Math block at line " << start + 1 << " runs to the end of the document";
    }

    return BlockResult{textblockWithText(NodeType::MathBlock, joinLines(contentLines)),
                       std::min(end, lines.size() - 1)};
}

MarkdownParser::BlockResult MarkdownParser::parseContainer(const std::vector<std::string> &lines, std::size_t start,
                                                           const ContainerOpen &open) const
{
    std::vector<std::string> contentLines;
    std::size_t end = start + 1;
    while (end < lines.size() && !isContainerClose(lines[end]))
        contentLines.push_back(lines[end++]);

    NodeAttrs attrs;
    attrs.containerType = open.type;
    attrs.containerTitle = open.title;
    return BlockResult{Node::branch(NodeType::Container, parseBlocks(contentLines), std::move(attrs)),
                       std::min(end, lines.size() - 1)};
}

// Same-tag open and close occurrences are counted per line; this is a
// balance heuristic, not an HTML parser.
MarkdownParser::BlockResult MarkdownParser::parseHtmlBlock(const std::vector<std::string> &lines,
                                                           std::size_t start, const std::string &tag) const
{
    const std::string &startLine = lines[start];
    if (isVoidHtmlElement(tag) || endsWith(trimEndView(startLine), "/>"))
        return BlockResult{textblockWithText(NodeType::HtmlBlock, startLine), start};

    const std::regex closePattern("</" + tag + "\\s*>", std::regex::ECMAScript | std::regex::icase);
    if (std::regex_search(startLine, closePattern))
        return BlockResult{textblockWithText(NodeType::HtmlBlock, startLine), start};

    const std::regex openPattern("<" + tag + "[\\s>/]", std::regex::ECMAScript | std::regex::icase);
    std::vector<std::string> contentLines{startLine};
    std::size_t end = start + 1;
    int nestLevel = 1;
    while (end < lines.size())
    {
        const std::string &line = lines[end];
        contentLines.push_back(line);
        if (std::regex_search(line, openPattern))
            ++nestLevel;
        if (std::regex_search(line, closePattern))
        {
            --nestLevel;
            if (nestLevel <= 0)
                break;
        }
        ++end;
    }

    return BlockResult{textblockWithText(NodeType::HtmlBlock, joinLines(contentLines)),
                       std::min(end, lines.size() - 1)};
}

MarkdownParser::BlockResult MarkdownParser::parseBlockquote(const std::vector<std::string> &lines,
                                                            std::size_t start) const
{
    std::vector<std::string> contentLines;
    std::size_t end = start;
    while (end < lines.size())
    {
        const std::string &line = lines[end];
        if (isBlank(line))
        {
            if (end + 1 < lines.size() && matchBlockquote(lines[end + 1]))
            {
                contentLines.emplace_back();
                ++end;
                continue;
            }
            break;
        }
        std::optional<std::string> content = matchBlockquote(line);
        if (!content)
            break;
        contentLines.push_back(*content);
        ++end;
    }

    std::vector<Node> blocks;
    for (auto &block : parseBlocks(contentLines))
    {
        if (block.type() != NodeType::Paragraph)
        {
            blocks.push_back(std::move(block));
            continue;
        }
        Node quoted(NodeType::Paragraph);
        quoted.appendRun("> ", {Mark::syntaxMarker(SyntaxType::Blockquote)});
        quoted.appendRuns(block.runs());
        blocks.push_back(std::move(quoted));
    }
    if (blocks.empty())
        blocks.push_back(Node::paragraph());

    return BlockResult{Node::branch(NodeType::Blockquote, std::move(blocks)), end - 1};
}

MarkdownParser::BlockResult MarkdownParser::parseTaskList(const std::vector<std::string> &lines,
                                                          std::size_t start) const
{
    std::vector<Node> items;
    std::size_t end = start;
    while (end < lines.size())
    {
        const std::string &line = lines[end];
        if (isBlank(line))
            break;
        std::optional<ListItemLine> item = matchTaskItem(line);
        if (!item)
            break;
        NodeAttrs attrs;
        attrs.checked = item->checked;
        items.push_back(Node::branch(NodeType::TaskItem, {parseParagraph(item->content)}, std::move(attrs)));
        ++end;
    }

    return BlockResult{Node::branch(NodeType::TaskList, std::move(items)), end - 1};
}

// A continuation line belongs to the current item when indented at least
// the item's content column, or while a fence opened in the item is still
// open. A list line indented that far is item content, i.e. a nested list.
MarkdownParser::BlockResult MarkdownParser::parseList(const std::vector<std::string> &lines, std::size_t start,
                                                      ListKind kind) const
{
    auto matchItem = [kind](std::string_view line) {
        return kind == ListKind::Bullet ? matchBulletItem(line) : matchOrderedItem(line);
    };

    std::vector<Node> items;
    std::size_t end = start;
    std::optional<std::size_t> baseIndent;
    std::size_t startNumber = 1;

    while (end < lines.size())
    {
        const std::string &line = lines[end];
        if (isBlank(line))
        {
            if (end + 1 < lines.size())
            {
                std::optional<ListItemLine> next = matchItem(lines[end + 1]);
                if (next && (!baseIndent || next->indent == *baseIndent))
                {
                    ++end;
                    continue;
                }
            }
            break;
        }

        std::optional<ListItemLine> item = matchItem(line);
        if (!item)
            break;
        if (!baseIndent)
        {
            baseIndent = item->indent;
            if (kind == ListKind::Ordered)
                startNumber = parseListStart(item->number);
        }
        if (item->indent != *baseIndent)
            break;

        std::size_t itemIndent = item->indent + (kind == ListKind::Ordered ? item->number.size() + 2 : 2);
        std::vector<std::string> itemLines{item->content};
        bool inFence = startsCodeFence(item->content);
        std::size_t next = end + 1;
        while (next < lines.size())
        {
            const std::string &nextLine = lines[next];
            if (startsCodeFence(nextLine))
                inFence = !inFence;

            if (isBlank(nextLine))
            {
                if (!inFence && next + 1 < lines.size())
                {
                    const std::string &after = lines[next + 1];
                    std::size_t afterIndent = leadingWhitespace(after);
                    bool siblingItem = matchItem(after).has_value() && afterIndent < itemIndent;
                    if (siblingItem || afterIndent < 2)
                        break;
                }
                itemLines.emplace_back();
                ++next;
                continue;
            }

            std::size_t lineIndent = leadingWhitespace(nextLine);
            if (!inFence && matchItem(nextLine) && lineIndent < itemIndent)
                break;
            if (lineIndent >= itemIndent || inFence || startsCodeFence(nextLine))
            {
                itemLines.push_back(nextLine.substr(std::min(lineIndent, itemIndent)));
                ++next;
                continue;
            }
            break;
        }

        std::vector<Node> content = parseBlocks(itemLines);
        if (content.empty())
            content.push_back(Node::paragraph());
        items.push_back(Node::branch(NodeType::ListItem, std::move(content)));
        end = next;
    }

    if (items.empty())
        items.push_back(Node::branch(NodeType::ListItem, {Node::paragraph()}));

    NodeAttrs attrs;
    if (kind == ListKind::Ordered)
        attrs.start = startNumber;
    NodeType type = kind == ListKind::Bullet ? NodeType::BulletList : NodeType::OrderedList;
    return BlockResult{Node::branch(type, std::move(items), std::move(attrs)), end - 1};
}

// Header row, then the alignment separator (one blank line may sit between
// them), then data rows; blank lines between data rows are skipped.
std::optional<MarkdownParser::BlockResult> MarkdownParser::parseTable(const std::vector<std::string> &lines,
                                                                      std::size_t start) const
{
    std::size_t separator = start + 1;
    if (separator < lines.size() && isBlank(lines[separator]))
        ++separator;
    if (separator >= lines.size() || !isTableSeparator(lines[separator]))
    {
        PLOG_DEBUG << "Table row at line " << start + 1 << " has no alignment row";
        return std::nullopt;
    }

    std::vector<TableAlignment> alignments = parseTableAlignments(lines[separator]);
    std::vector<Node> rows;
    rows.push_back(Node::branch(NodeType::TableRow, parseTableRow(lines[start], true, alignments)));

    std::size_t end = separator + 1;
    while (end < lines.size())
    {
        if (isBlank(lines[end]))
        {
            ++end;
            continue;
        }
        if (!isTableRow(lines[end]))
            break;
        rows.push_back(Node::branch(NodeType::TableRow, parseTableRow(lines[end], false, alignments)));
        ++end;
    }

    return BlockResult{Node::branch(NodeType::Table, std::move(rows)), end - 1};
}

std::vector<Node> MarkdownParser::parseTableRow(std::string_view line, bool header,
                                                const std::vector<TableAlignment> &alignments) const
{
    std::vector<Node> cells;
    std::vector<std::string> texts = splitTableCells(line);
    for (std::size_t i = 0; i < texts.size(); ++i)
    {
        NodeAttrs attrs;
        if (i < alignments.size())
            attrs.align = alignments[i];
        cells.push_back(
            Node::textblock(header ? NodeType::TableHeader : NodeType::TableCell, parseInline(texts[i]), std::move(attrs)));
    }
    return cells;
}

} // namespace mk::edit
