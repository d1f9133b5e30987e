#include "mk/edit/source_view_transform.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <cctype>
#include <chrono>
#include <plog/Log.h>

namespace mk::edit
{
namespace
{
std::string_view groupKindName(BlockGroupKind kind) noexcept
{
    switch (kind)
    {
    case BlockGroupKind::CodeBlock:
        return "code block";
    case BlockGroupKind::Table:
        return "table";
    case BlockGroupKind::HtmlBlock:
        return "HTML block";
    case BlockGroupKind::MathBlock:
        return "math block";
    }
    return "block";
}

bool sameGroup(const std::optional<BlockGroup> &a, const std::optional<BlockGroup> &b) noexcept
{
    return a && b && a->kind == b->kind && a->id == b->id;
}

std::string joinedText(const std::vector<Node> &paragraphs)
{
    std::string text;
    for (std::size_t i = 0; i < paragraphs.size(); ++i)
    {
        if (i > 0)
            text.push_back('\n');
        text += paragraphs[i].textContent();
    }
    return text;
}

Node textblockWithText(NodeType type, const std::string &text, NodeAttrs attrs = {})
{
    Node node(type, std::move(attrs));
    node.appendRun(text);
    return node;
}

// ```info\n<content>\n```
std::optional<Node> codeBlockFromText(const std::string &text)
{
    if (!startsWith(text, "```"))
        return std::nullopt;
    std::size_t firstBreak = text.find('\n');
    if (firstBreak == std::string::npos || text.size() < firstBreak + 5 || !endsWith(text, "\n```"))
        return std::nullopt;

    std::optional<CodeFenceOpen> fence = matchCodeFenceOpen(std::string_view(text).substr(0, firstBreak));
    NodeAttrs attrs;
    attrs.language = fence ? fence->language : std::string();
    std::string content = text.substr(firstBreak + 1, text.size() - 4 - (firstBreak + 1));
    return textblockWithText(NodeType::CodeBlock, content, std::move(attrs));
}

// $$\n<content>\n$$
std::optional<Node> mathBlockFromText(const std::string &text)
{
    if (text.size() < 6 || !startsWith(text, "$$\n") || !endsWith(text, "\n$$"))
        return std::nullopt;
    return textblockWithText(NodeType::MathBlock, text.substr(3, text.size() - 6));
}

std::optional<Node> htmlBlockFromText(const std::string &text)
{
    if (text.size() < 2 || text[0] != '<' || !std::isalpha(static_cast<unsigned char>(text[1])))
        return std::nullopt;
    return textblockWithText(NodeType::HtmlBlock, text);
}

} // namespace

std::string_view blockGroupPrefix(BlockGroupKind kind) noexcept
{
    switch (kind)
    {
    case BlockGroupKind::CodeBlock:
        return "cb";
    case BlockGroupKind::Table:
        return "tb";
    case BlockGroupKind::HtmlBlock:
        return "hb";
    case BlockGroupKind::MathBlock:
        return "mb";
    }
    return "bg";
}

RandomBlockIdGenerator::RandomBlockIdGenerator()
    : engine(std::random_device{}())
{
}

std::string RandomBlockIdGenerator::next(BlockGroupKind kind)
{
    static constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::uniform_int_distribution<std::size_t> digit(0, kDigits.size() - 1);
    std::string suffix;
    for (int i = 0; i < 9; ++i)
        suffix.push_back(kDigits[digit(engine)]);
    return std::string(blockGroupPrefix(kind)) + "_" + std::to_string(millis) + "_" + suffix;
}

SourceViewTransform::SourceViewTransform()
    : idGenerator(std::make_shared<RandomBlockIdGenerator>())
{
}

SourceViewTransform::SourceViewTransform(std::shared_ptr<BlockIdGenerator> ids)
    : idGenerator(ids ? std::move(ids) : std::make_shared<RandomBlockIdGenerator>())
{
}

bool SourceViewTransform::containsStructuredBlocks(const Node &doc)
{
    switch (doc.type())
    {
    case NodeType::CodeBlock:
    case NodeType::Image:
    case NodeType::HorizontalRule:
    case NodeType::Table:
    case NodeType::HtmlBlock:
    case NodeType::MathBlock:
        return true;
    default:
        break;
    }
    for (const auto &child : doc.children())
    {
        if (containsStructuredBlocks(child))
            return true;
    }
    return false;
}

std::vector<std::string> SourceViewTransform::codeBlockLines(const Node &codeBlock)
{
    return splitLines("```" + codeBlock.attrs().language + "\n" + codeBlock.textContent() + "\n```");
}

std::vector<std::string> SourceViewTransform::mathBlockLines(const Node &mathBlock)
{
    return splitLines("$$\n" + mathBlock.textContent() + "\n$$");
}

// The separator spans the widest row; each column takes its alignment from
// the first row that has a cell there.
std::vector<std::string> SourceViewTransform::tableLines(const Node &table)
{
    std::vector<const NodeAttrs *> columnAttrs;
    for (const auto &row : table.children())
    {
        for (std::size_t column = columnAttrs.size(); column < row.childCount(); ++column)
            columnAttrs.push_back(&row.child(column).attrs());
    }

    std::string separator = "|";
    for (const NodeAttrs *attrs : columnAttrs)
        separator += " " + std::string(alignmentMarker(attrs->align)) + " |";

    std::vector<std::string> lines;
    for (std::size_t rowIndex = 0; rowIndex < table.childCount(); ++rowIndex)
    {
        std::string line = "|";
        for (const auto &cell : table.child(rowIndex).children())
            line += " " + cell.textContent() + " |";
        lines.push_back(line);
        if (rowIndex == 0)
            lines.push_back(separator);
    }
    return lines;
}

std::vector<Node> SourceViewTransform::groupParagraphs(BlockGroupKind kind, const std::vector<std::string> &lines) const
{
    std::string id = idGenerator->next(kind);
    std::vector<Node> paragraphs;
    paragraphs.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        NodeAttrs attrs;
        attrs.group = BlockGroup{kind, id, i, lines.size()};
        paragraphs.push_back(Node::paragraph(lines[i], std::move(attrs)));
    }
    return paragraphs;
}

std::vector<Node> SourceViewTransform::flattenNode(const Node &node) const
{
    switch (node.type())
    {
    case NodeType::CodeBlock:
        return groupParagraphs(BlockGroupKind::CodeBlock, codeBlockLines(node));
    case NodeType::Table:
        return groupParagraphs(BlockGroupKind::Table, tableLines(node));
    case NodeType::HtmlBlock:
        return groupParagraphs(BlockGroupKind::HtmlBlock, splitLines(node.textContent()));
    case NodeType::MathBlock:
        return groupParagraphs(BlockGroupKind::MathBlock, mathBlockLines(node));
    case NodeType::Image:
    {
        NodeAttrs attrs;
        attrs.imageSource = ImageSource{node.attrs().src, node.attrs().alt, node.attrs().title};
        return {Node::paragraph(imageMarkdown(*attrs.imageSource), std::move(attrs))};
    }
    case NodeType::HorizontalRule:
    {
        NodeAttrs attrs;
        attrs.hrSource = true;
        return {Node::paragraph("---", std::move(attrs))};
    }
    default:
        break;
    }

    if (node.isTextblock() || node.isLeaf())
        return {node};

    Node copy(node.type(), node.attrs());
    std::vector<Node> children;
    for (const auto &child : node.children())
    {
        for (auto &replacement : flattenNode(child))
            children.push_back(std::move(replacement));
    }
    copy.replaceChildren(std::move(children));
    return {copy};
}

Node SourceViewTransform::toFlattened(const Node &doc) const
{
    std::vector<Node> flattened = flattenNode(doc);
    PLOG_DEBUG << "Flattened document into " << flattened.front().childCount() << " top-level blocks";
    return std::move(flattened.front());
}

std::optional<Node> SourceViewTransform::rebuildGroup(BlockGroupKind kind, const std::vector<Node> &paragraphs) const
{
    std::string text = joinedText(paragraphs);
    switch (kind)
    {
    case BlockGroupKind::CodeBlock:
        return codeBlockFromText(text);
    case BlockGroupKind::MathBlock:
        return mathBlockFromText(text);
    case BlockGroupKind::HtmlBlock:
        return htmlBlockFromText(text);
    case BlockGroupKind::Table:
    {
        if (paragraphs.size() < 2)
            return std::nullopt;
        // Any line that does not belong to the table keeps the whole group
        // as paragraphs.
        ParseResult parsed = parser.parse(text);
        if (parsed.doc.childCount() != 1 || parsed.doc.child(0).type() != NodeType::Table)
            return std::nullopt;
        return parsed.doc.child(0);
    }
    }
    return std::nullopt;
}

std::optional<Node> SourceViewTransform::rebuildSingle(const Node &paragraph) const
{
    std::string text = paragraph.textContent();
    if (paragraph.attrs().imageSource)
    {
        std::optional<ImageSource> image = matchImageLine(text, false);
        if (!image)
            return std::nullopt;
        NodeAttrs attrs;
        attrs.src = image->src;
        attrs.alt = image->alt;
        attrs.title = image->title;
        return Node(NodeType::Image, std::move(attrs));
    }
    if (paragraph.attrs().hrSource)
    {
        if (!isHorizontalRule(trimView(text)))
            return std::nullopt;
        return Node(NodeType::HorizontalRule);
    }
    return std::nullopt;
}

Node SourceViewTransform::structureNode(const Node &node) const
{
    if (node.isTextblock() || node.isLeaf())
        return node;

    std::vector<Node> children;
    std::vector<Node> group;

    auto flush = [&]() {
        if (group.empty())
            return;
        BlockGroupKind kind = group.front().attrs().group->kind;
        if (std::optional<Node> rebuilt = rebuildGroup(kind, group))
        {
            children.push_back(std::move(*rebuilt));
        }
        else
        {
            PLOG_WARNING << "Source of " << groupKindName(kind) << " " << group.front().attrs().group->id
                         << " is no longer valid; keeping " << group.size() << " paragraphs";
            for (auto &paragraph : group)
                children.push_back(std::move(paragraph));
        }
        group.clear();
    };

    for (const auto &child : node.children())
    {
        const std::optional<BlockGroup> &membership = child.attrs().group;
        if (child.type() == NodeType::Paragraph && membership)
        {
            if (!group.empty() && !sameGroup(group.front().attrs().group, membership))
                flush();
            group.push_back(child);
            continue;
        }
        flush();

        if (child.type() == NodeType::Paragraph && (child.attrs().imageSource || child.attrs().hrSource))
        {
            std::optional<Node> rebuilt = rebuildSingle(child);
            if (!rebuilt)
            {
                PLOG_WARNING << "Paragraph \"" << child.textContent() << "\" no longer matches its "
                             << (child.attrs().imageSource ? "image" : "rule") << " syntax";
            }
            children.push_back(rebuilt ? std::move(*rebuilt) : child);
            continue;
        }
        children.push_back(structureNode(child));
    }
    flush();

    Node copy(node.type(), node.attrs());
    copy.replaceChildren(std::move(children));
    return copy;
}

Node SourceViewTransform::toStructured(const Node &doc) const
{
    Node structured = structureNode(doc);
    PLOG_DEBUG << "Structured document into " << structured.childCount() << " top-level blocks";
    return structured;
}

} // namespace mk::edit
