#include "mk/edit/markdown_serializer.hpp"

#include "mk/edit/markdown_syntax.hpp"
#include "mk/edit/source_view_transform.hpp"

namespace mk::edit
{
namespace
{
using Lines = std::vector<std::string>;

Lines blockLines(const Node &node);

// An empty paragraph stands for one extra blank line; inside a blockquote
// that paragraph still carries its "> " marker.
bool isVisuallyEmpty(const Node &node)
{
    if (node.type() != NodeType::Paragraph)
        return false;
    std::string text = node.textContent();
    return text.empty() || text == "> ";
}

void appendLines(Lines &out, Lines lines)
{
    for (auto &line : lines)
        out.push_back(std::move(line));
}

// Blocks are separated by one separator line, except after an empty
// paragraph, which already produced its own line. A trailing empty paragraph
// needs one more line since the parser ignores the final line break.
Lines joinBlocks(const std::vector<Node> &blocks, const std::string &separator)
{
    Lines lines;
    for (std::size_t i = 0; i < blocks.size(); ++i)
    {
        if (i > 0 && !isVisuallyEmpty(blocks[i - 1]))
            lines.push_back(separator);
        appendLines(lines, blockLines(blocks[i]));
    }
    if (!blocks.empty() && isVisuallyEmpty(blocks.back()))
        lines.push_back(separator);
    return lines;
}

Lines indentedItem(const std::string &marker, Lines content)
{
    Lines lines;
    std::string indent(marker.size(), ' ');
    for (std::size_t i = 0; i < content.size(); ++i)
    {
        if (i == 0)
            lines.push_back(marker + content[i]);
        else if (content[i].empty())
            lines.emplace_back();
        else
            lines.push_back(indent + content[i]);
    }
    if (content.empty())
        lines.push_back(marker);
    return lines;
}

Lines listLines(const Node &list)
{
    Lines lines;
    std::size_t number = list.attrs().start;
    for (const auto &item : list.children())
    {
        std::string marker = list.type() == NodeType::OrderedList ? std::to_string(number++) + ". " : "- ";
        appendLines(lines, indentedItem(marker, joinBlocks(item.children(), "")));
    }
    return lines;
}

Lines taskListLines(const Node &list)
{
    Lines lines;
    for (const auto &item : list.children())
    {
        std::string marker = item.attrs().checked ? "- [x] " : "- [ ] ";
        appendLines(lines, indentedItem(marker, joinBlocks(item.children(), "")));
    }
    return lines;
}

// Quoted paragraphs carry their own marker run; other blocks are prefixed
// line by line.
Lines blockquoteLines(const Node &quote)
{
    Lines lines;
    const std::vector<Node> &children = quote.children();
    for (std::size_t i = 0; i < children.size(); ++i)
    {
        if (i > 0 && !isVisuallyEmpty(children[i - 1]))
            lines.push_back(">");
        const Node &child = children[i];
        if (child.type() == NodeType::Paragraph && matchBlockquote(child.textContent()))
        {
            lines.push_back(child.textContent());
            continue;
        }
        for (auto &line : blockLines(child))
            lines.push_back(line.empty() ? ">" : "> " + line);
    }
    if (!children.empty() && isVisuallyEmpty(children.back()))
        lines.push_back(">");
    return lines;
}

Lines containerLines(const Node &container)
{
    const NodeAttrs &attrs = container.attrs();
    Lines lines;
    lines.push_back(":::" + attrs.containerType + (attrs.containerTitle.empty() ? "" : " " + attrs.containerTitle));
    appendLines(lines, joinBlocks(container.children(), ""));
    lines.push_back(":::");
    return lines;
}

Lines blockLines(const Node &node)
{
    switch (node.type())
    {
    case NodeType::Paragraph:
    case NodeType::Heading:
        return {node.textContent()};
    case NodeType::CodeBlock:
        return SourceViewTransform::codeBlockLines(node);
    case NodeType::MathBlock:
        return SourceViewTransform::mathBlockLines(node);
    case NodeType::Table:
        return SourceViewTransform::tableLines(node);
    case NodeType::HtmlBlock:
        return splitLines(node.textContent());
    case NodeType::Image:
        return {imageMarkdown(ImageSource{node.attrs().src, node.attrs().alt, node.attrs().title})};
    case NodeType::HorizontalRule:
        return {"---"};
    case NodeType::Blockquote:
        return blockquoteLines(node);
    case NodeType::BulletList:
    case NodeType::OrderedList:
        return listLines(node);
    case NodeType::TaskList:
        return taskListLines(node);
    case NodeType::Container:
        return containerLines(node);
    default:
        return joinBlocks(node.children(), "");
    }
}

} // namespace

std::string serializeMarkdown(const Node &doc)
{
    // The parser turns empty input into a single empty paragraph.
    if (doc.childCount() == 1 && doc.child(0).type() == NodeType::Paragraph && doc.child(0).contentSize() == 0)
        return std::string();
    return joinLines(joinBlocks(doc.children(), ""));
}

} // namespace mk::edit
