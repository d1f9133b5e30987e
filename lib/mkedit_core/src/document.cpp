#include "mk/edit/document.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

namespace mk::edit
{
namespace
{
constexpr std::array<std::pair<NodeType, std::string_view>, 19> kNodeTypeNames = {{
    {NodeType::Doc, "doc"},
    {NodeType::Paragraph, "paragraph"},
    {NodeType::Heading, "heading"},
    {NodeType::CodeBlock, "code_block"},
    {NodeType::Blockquote, "blockquote"},
    {NodeType::BulletList, "bullet_list"},
    {NodeType::OrderedList, "ordered_list"},
    {NodeType::ListItem, "list_item"},
    {NodeType::TaskList, "task_list"},
    {NodeType::TaskItem, "task_item"},
    {NodeType::Table, "table"},
    {NodeType::TableRow, "table_row"},
    {NodeType::TableHeader, "table_header"},
    {NodeType::TableCell, "table_cell"},
    {NodeType::Image, "image"},
    {NodeType::HorizontalRule, "horizontal_rule"},
    {NodeType::HtmlBlock, "html_block"},
    {NodeType::MathBlock, "math_block"},
    {NodeType::Container, "container"},
}};

constexpr std::array<std::pair<SyntaxType, std::string_view>, 11> kSyntaxTypeNames = {{
    {SyntaxType::StrongEmphasis, "strong_emphasis"},
    {SyntaxType::Strong, "strong"},
    {SyntaxType::Emphasis, "emphasis"},
    {SyntaxType::CodeInline, "code_inline"},
    {SyntaxType::Strikethrough, "strikethrough"},
    {SyntaxType::Highlight, "highlight"},
    {SyntaxType::Link, "link"},
    {SyntaxType::MathInline, "math_inline"},
    {SyntaxType::Escape, "escape"},
    {SyntaxType::Heading, "heading"},
    {SyntaxType::Blockquote, "blockquote"},
}};

void normalizeRuns(std::vector<TextRun> &runs)
{
    std::vector<TextRun> merged;
    merged.reserve(runs.size());
    for (auto &run : runs)
    {
        if (run.text.empty())
            continue;
        if (!merged.empty() && merged.back().marks == run.marks)
            merged.back().text += run.text;
        else
            merged.push_back(std::move(run));
    }
    runs = std::move(merged);
}

} // namespace

std::string_view nodeTypeName(NodeType type) noexcept
{
    for (const auto &[value, name] : kNodeTypeNames)
    {
        if (value == type)
            return name;
    }
    return "unknown";
}

std::string_view markTypeName(MarkType type) noexcept
{
    switch (type)
    {
    case MarkType::SyntaxMarker:
        return "syntax_marker";
    case MarkType::Strong:
        return "strong";
    case MarkType::Emphasis:
        return "emphasis";
    case MarkType::CodeInline:
        return "code_inline";
    case MarkType::Strikethrough:
        return "strikethrough";
    case MarkType::Highlight:
        return "highlight";
    case MarkType::Link:
        return "link";
    case MarkType::MathInline:
        return "math_inline";
    }
    return "unknown";
}

std::string_view syntaxTypeName(SyntaxType type) noexcept
{
    for (const auto &[value, name] : kSyntaxTypeNames)
    {
        if (value == type)
            return name;
    }
    return "unknown";
}

std::string_view alignmentName(TableAlignment align) noexcept
{
    switch (align)
    {
    case TableAlignment::Left:
        return "left";
    case TableAlignment::Center:
        return "center";
    case TableAlignment::Right:
        return "right";
    case TableAlignment::None:
        break;
    }
    return "none";
}

std::optional<NodeType> nodeTypeFromName(std::string_view name) noexcept
{
    for (const auto &[value, entry] : kNodeTypeNames)
    {
        if (entry == name)
            return value;
    }
    return std::nullopt;
}

std::optional<SyntaxType> syntaxTypeFromName(std::string_view name) noexcept
{
    for (const auto &[value, entry] : kSyntaxTypeNames)
    {
        if (entry == name)
            return value;
    }
    return std::nullopt;
}

Mark Mark::syntaxMarker(SyntaxType syntax)
{
    Mark mark;
    mark.type = MarkType::SyntaxMarker;
    mark.syntax = syntax;
    return mark;
}

Mark Mark::semantic(MarkType type)
{
    Mark mark;
    mark.type = type;
    return mark;
}

Mark Mark::link(std::string href, std::string title)
{
    Mark mark;
    mark.type = MarkType::Link;
    mark.href = std::move(href);
    mark.title = std::move(title);
    return mark;
}

Mark Mark::math(std::string content)
{
    Mark mark;
    mark.type = MarkType::MathInline;
    mark.content = std::move(content);
    return mark;
}

bool Mark::operator==(const Mark &other) const noexcept
{
    return type == other.type && syntax == other.syntax && href == other.href && title == other.title &&
           content == other.content;
}

MarkSet withMark(MarkSet marks, const Mark &mark)
{
    auto it = std::lower_bound(marks.begin(), marks.end(), mark.type,
                               [](const Mark &existing, MarkType type) { return existing.type < type; });
    if (it != marks.end() && it->type == mark.type)
        *it = mark;
    else
        marks.insert(it, mark);
    return marks;
}

MarkSet withMarks(MarkSet marks, const MarkSet &added)
{
    for (const auto &mark : added)
        marks = withMark(std::move(marks), mark);
    return marks;
}

MarkSet withoutMark(MarkSet marks, MarkType type)
{
    marks.erase(std::remove_if(marks.begin(), marks.end(), [type](const Mark &mark) { return mark.type == type; }),
                marks.end());
    return marks;
}

bool hasMark(const MarkSet &marks, MarkType type) noexcept
{
    return findMark(marks, type) != nullptr;
}

const Mark *findMark(const MarkSet &marks, MarkType type) noexcept
{
    for (const auto &mark : marks)
    {
        if (mark.type == type)
            return &mark;
    }
    return nullptr;
}

std::optional<SyntaxType> syntaxTypeOf(const MarkSet &marks) noexcept
{
    if (const Mark *mark = findMark(marks, MarkType::SyntaxMarker))
        return mark->syntax;
    return std::nullopt;
}

bool TextRun::operator==(const TextRun &other) const noexcept
{
    return text == other.text && marks == other.marks;
}

bool BlockGroup::operator==(const BlockGroup &other) const noexcept
{
    return kind == other.kind && id == other.id && lineIndex == other.lineIndex && totalLines == other.totalLines;
}

bool ImageSource::operator==(const ImageSource &other) const noexcept
{
    return src == other.src && alt == other.alt && title == other.title;
}

bool NodeAttrs::operator==(const NodeAttrs &other) const noexcept
{
    return sameIgnoringTransient(other) && imageSource == other.imageSource && hrSource == other.hrSource &&
           group == other.group;
}

bool NodeAttrs::sameIgnoringTransient(const NodeAttrs &other) const noexcept
{
    return level == other.level && language == other.language && start == other.start &&
           checked == other.checked && align == other.align && src == other.src && alt == other.alt &&
           title == other.title && containerType == other.containerType &&
           containerTitle == other.containerTitle;
}

bool isTextblockType(NodeType type) noexcept
{
    switch (type)
    {
    case NodeType::Paragraph:
    case NodeType::Heading:
    case NodeType::CodeBlock:
    case NodeType::TableHeader:
    case NodeType::TableCell:
    case NodeType::HtmlBlock:
    case NodeType::MathBlock:
        return true;
    default:
        return false;
    }
}

bool isLeafType(NodeType type) noexcept
{
    return type == NodeType::Image || type == NodeType::HorizontalRule;
}

Node::Node(NodeType type, NodeAttrs attrs)
    : nodeType(type), attributes(std::move(attrs))
{
}

Node Node::textblock(NodeType type, std::vector<TextRun> runs, NodeAttrs attrs)
{
    Node node(type, std::move(attrs));
    for (auto &run : runs)
        node.appendRun(std::move(run));
    return node;
}

Node Node::branch(NodeType type, std::vector<Node> children, NodeAttrs attrs)
{
    Node node(type, std::move(attrs));
    node.childNodes = std::move(children);
    return node;
}

Node Node::paragraph(std::string_view text, NodeAttrs attrs)
{
    Node node(NodeType::Paragraph, std::move(attrs));
    if (!text.empty())
        node.appendRun(std::string(text));
    return node;
}

const Node &Node::child(std::size_t index) const
{
    return childNodes.at(index);
}

Node &Node::child(std::size_t index)
{
    return childNodes.at(index);
}

void Node::appendChild(Node node)
{
    childNodes.push_back(std::move(node));
}

void Node::insertChild(std::size_t index, Node node)
{
    if (index > childNodes.size())
        throw std::out_of_range("Child index " + std::to_string(index) + " past end of " +
                                std::string(nodeTypeName(nodeType)));
    childNodes.insert(childNodes.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
}

void Node::removeChild(std::size_t index)
{
    if (index >= childNodes.size())
        throw std::out_of_range("No child " + std::to_string(index) + " in " + std::string(nodeTypeName(nodeType)));
    childNodes.erase(childNodes.begin() + static_cast<std::ptrdiff_t>(index));
}

void Node::replaceChildren(std::vector<Node> nodes)
{
    childNodes = std::move(nodes);
}

void Node::appendRun(TextRun run)
{
    if (run.text.empty())
        return;
    if (!textRuns.empty() && textRuns.back().marks == run.marks)
    {
        textRuns.back().text += run.text;
        return;
    }
    textRuns.push_back(std::move(run));
}

void Node::appendRun(std::string text, MarkSet marks)
{
    appendRun(TextRun{std::move(text), std::move(marks)});
}

void Node::appendRuns(const std::vector<TextRun> &runs)
{
    for (const auto &run : runs)
        appendRun(run);
}

std::size_t Node::nodeSize() const noexcept
{
    if (isLeaf())
        return 1;
    return contentSize() + 2;
}

std::size_t Node::contentSize() const noexcept
{
    std::size_t size = 0;
    if (isTextblock())
    {
        for (const auto &run : textRuns)
            size += run.text.size();
        return size;
    }
    for (const auto &node : childNodes)
        size += node.nodeSize();
    return size;
}

std::string Node::textContent() const
{
    std::string out;
    if (isTextblock())
    {
        for (const auto &run : textRuns)
            out += run.text;
        return out;
    }
    for (const auto &node : childNodes)
        out += node.textContent();
    return out;
}

std::string Node::textBetween(std::size_t from, std::size_t to) const
{
    std::string out;
    if (from < to)
        appendTextBetween(from, to, out);
    return out;
}

void Node::appendTextBetween(std::size_t from, std::size_t to, std::string &out) const
{
    if (isTextblock())
    {
        std::string text = textContent();
        from = std::min(from, text.size());
        to = std::min(to, text.size());
        if (from < to)
            out.append(text, from, to - from);
        return;
    }

    std::size_t offset = 0;
    for (const auto &node : childNodes)
    {
        std::size_t size = node.nodeSize();
        std::size_t end = offset + size;
        if (end > from && offset < to && !node.isLeaf())
        {
            std::size_t innerFrom = from > offset + 1 ? from - offset - 1 : 0;
            std::size_t innerTo = std::min(to - offset, size) - 1;
            node.appendTextBetween(innerFrom, innerTo, out);
        }
        offset = end;
        if (offset >= to)
            break;
    }
}

Node &Node::textblockAt(std::size_t pos, std::size_t &localPos)
{
    if (isTextblock())
    {
        if (pos > contentSize())
            throw std::out_of_range("Position " + std::to_string(pos) + " past end of " +
                                    std::string(nodeTypeName(nodeType)));
        localPos = pos;
        return *this;
    }

    std::size_t offset = 0;
    for (auto &node : childNodes)
    {
        std::size_t size = node.nodeSize();
        if (!node.isLeaf() && pos >= offset + 1 && pos <= offset + size - 1)
            return node.textblockAt(pos - offset - 1, localPos);
        offset += size;
    }
    throw std::out_of_range("Position " + std::to_string(pos) + " is not inside a textblock");
}

void Node::insertText(std::size_t pos, std::string_view text)
{
    std::size_t local = 0;
    Node &target = textblockAt(pos, local);
    if (text.empty())
        return;

    auto &runs = target.textRuns;
    if (runs.empty())
    {
        runs.push_back(TextRun{std::string(text), {}});
        return;
    }

    std::size_t runStart = 0;
    std::size_t index = 0;
    for (; index < runs.size(); ++index)
    {
        std::size_t runEnd = runStart + runs[index].text.size();
        if (local <= runEnd && (local > runStart || index == 0))
            break;
        runStart = runEnd;
    }
    if (index == runs.size())
        index = runs.size() - 1;

    TextRun &run = runs[index];
    std::size_t inner = local - runStart;
    if (!hasMark(run.marks, MarkType::SyntaxMarker))
    {
        run.text.insert(inner, text);
        return;
    }

    // Typed text never becomes part of a delimiter.
    TextRun left{run.text.substr(0, inner), run.marks};
    TextRun middle{std::string(text), withoutMark(run.marks, MarkType::SyntaxMarker)};
    TextRun right{run.text.substr(inner), run.marks};
    runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(index));
    runs.insert(runs.begin() + static_cast<std::ptrdiff_t>(index), {left, middle, right});
    normalizeRuns(runs);
}

void Node::deleteText(std::size_t from, std::size_t to)
{
    if (from >= to)
        return;
    std::size_t local = 0;
    Node &target = textblockAt(from, local);
    std::size_t localTo = local + (to - from);
    if (localTo > target.contentSize())
        throw std::out_of_range("Deletion " + std::to_string(from) + ".." + std::to_string(to) +
                                " spans more than one textblock");

    std::size_t runStart = 0;
    for (auto &run : target.textRuns)
    {
        std::size_t runEnd = runStart + run.text.size();
        std::size_t cutFrom = std::max(local, runStart);
        std::size_t cutTo = std::min(localTo, runEnd);
        if (cutFrom < cutTo)
            run.text.erase(cutFrom - runStart, cutTo - cutFrom);
        runStart = runEnd;
    }
    normalizeRuns(target.textRuns);
}

bool Node::operator==(const Node &other) const noexcept
{
    return nodeType == other.nodeType && attributes == other.attributes && textRuns == other.textRuns &&
           childNodes == other.childNodes;
}

bool Node::sameStructure(const Node &other) const noexcept
{
    if (nodeType != other.nodeType || !attributes.sameIgnoringTransient(other.attributes) ||
        textRuns != other.textRuns || childNodes.size() != other.childNodes.size())
        return false;
    for (std::size_t i = 0; i < childNodes.size(); ++i)
    {
        if (!childNodes[i].sameStructure(other.childNodes[i]))
            return false;
    }
    return true;
}

namespace
{
std::optional<ResolvedTextblock> resolveIn(const Node &node, std::size_t pos, std::size_t base)
{
    if (node.isTextblock())
    {
        if (pos > node.contentSize())
            return std::nullopt;
        return ResolvedTextblock{&node, base, base + node.contentSize()};
    }

    std::size_t offset = 0;
    for (const auto &child : node.children())
    {
        std::size_t size = child.nodeSize();
        if (!child.isLeaf() && pos >= offset + 1 && pos <= offset + size - 1)
            return resolveIn(child, pos - offset - 1, base + offset + 1);
        offset += size;
    }
    return std::nullopt;
}

void visitTextblocks(const Node &node, std::size_t base, const TextblockVisitor &visitor)
{
    if (node.isTextblock())
    {
        visitor(node, base);
        return;
    }
    std::size_t offset = 0;
    for (const auto &child : node.children())
    {
        if (!child.isLeaf())
            visitTextblocks(child, base + offset + 1, visitor);
        offset += child.nodeSize();
    }
}

} // namespace

std::optional<ResolvedTextblock> resolveTextblock(const Node &root, std::size_t pos)
{
    return resolveIn(root, pos, 0);
}

void forEachTextblock(const Node &root, const TextblockVisitor &visitor)
{
    visitTextblocks(root, 0, visitor);
}

} // namespace mk::edit
