#include "mk/edit/display_layout.hpp"

namespace mk::edit
{
namespace
{
constexpr std::string_view kQuotePrefix = "\xE2\x94\x82 ";  // "│ "
constexpr std::string_view kCellSeparator = " \xE2\x94\x82 "; // " │ "
constexpr std::string_view kRuleChar = "\xE2\x94\x80";      // "─"
constexpr std::string_view kBullet = "\xE2\x80\xA2 ";       // "• "
constexpr std::size_t kRuleWidth = 40;

struct LayoutContext
{
    const DecorationSet &decorations;
    std::vector<DisplayLine> &lines;
};

bool isTextSpan(const DisplaySpan &span) noexcept
{
    return !span.widget && !span.decoration;
}

std::size_t byteOffsetOfColumn(std::string_view text, std::size_t column) noexcept
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80)
            continue;
        if (seen == column)
            return i;
        ++seen;
    }
    return text.size();
}

void appendDecoration(DisplayLine &line, std::string_view text)
{
    if (text.empty())
        return;
    DisplaySpan span;
    span.text = std::string(text);
    span.from = span.to = line.from;
    span.decoration = true;
    line.spans.push_back(std::move(span));
}

void appendChar(DisplayLine &line, char ch, std::size_t pos, const MarkSet &marks)
{
    if (!line.spans.empty())
    {
        DisplaySpan &last = line.spans.back();
        if (isTextSpan(last) && last.to == pos && last.marks == marks)
        {
            last.text.push_back(ch);
            last.to = pos + 1;
            return;
        }
    }
    DisplaySpan span;
    span.text = std::string(1, ch);
    span.from = pos;
    span.to = pos + 1;
    span.marks = marks;
    line.spans.push_back(std::move(span));
}

DisplayLine startLine(NodeType type, std::size_t from, bool hasText, std::string_view prefix)
{
    DisplayLine line;
    line.blockType = type;
    line.from = from;
    line.to = from;
    line.hasText = hasText;
    appendDecoration(line, prefix);
    return line;
}

// Appends the text of a textblock. Hidden positions are skipped, widgets are
// placed before the character at their position and a line break in the
// text starts a new display line with the continuation prefix.
void appendText(const Node &block, std::size_t contentStart, LayoutContext &context, DisplayLine &line,
                std::string_view continuation)
{
    std::size_t pos = contentStart;
    auto emitWidgets = [&](std::size_t at) {
        for (const auto &decoration : context.decorations.widgetsAt(at))
        {
            DisplaySpan span;
            span.text = decoration.widgetContent;
            span.from = span.to = at;
            span.widget = true;
            line.spans.push_back(std::move(span));
        }
    };

    for (const auto &run : block.runs())
    {
        for (char ch : run.text)
        {
            emitWidgets(pos);
            if (ch == '\n')
            {
                line.to = pos;
                context.lines.push_back(std::move(line));
                line = startLine(block.type(), pos + 1, true, continuation);
            }
            else if (!context.decorations.isHidden(pos))
            {
                appendChar(line, ch, pos, run.marks);
            }
            ++pos;
        }
    }
    emitWidgets(pos);
    line.to = pos;
}

void layoutBlock(const Node &node, std::size_t start, LayoutContext &context, const std::string &firstPrefix,
                 const std::string &restPrefix);

void layoutChildren(const Node &node, std::size_t contentStart, LayoutContext &context,
                    const std::string &firstPrefix, const std::string &restPrefix)
{
    std::size_t pos = contentStart;
    for (std::size_t i = 0; i < node.childCount(); ++i)
    {
        const Node &child = node.child(i);
        layoutBlock(child, pos, context, i == 0 ? firstPrefix : restPrefix, restPrefix);
        pos += child.nodeSize();
    }
}

void layoutTable(const Node &table, std::size_t start, LayoutContext &context, const std::string &firstPrefix,
                 const std::string &restPrefix)
{
    std::size_t rowStart = start + 1;
    for (std::size_t rowIndex = 0; rowIndex < table.childCount(); ++rowIndex)
    {
        const Node &row = table.child(rowIndex);
        DisplayLine line = startLine(NodeType::Table, rowStart + 2, true, rowIndex == 0 ? firstPrefix : restPrefix);
        std::size_t cellStart = rowStart + 1;
        for (std::size_t cellIndex = 0; cellIndex < row.childCount(); ++cellIndex)
        {
            const Node &cell = row.child(cellIndex);
            if (cellIndex > 0)
                appendDecoration(line, kCellSeparator);
            appendText(cell, cellStart + 1, context, line, {});
            cellStart += cell.nodeSize();
        }
        std::size_t width = line.width();
        context.lines.push_back(std::move(line));

        if (rowIndex == 0)
        {
            DisplayLine rule = startLine(NodeType::Table, rowStart + row.nodeSize(), false, restPrefix);
            std::string dashes;
            for (std::size_t i = displayWidth(restPrefix); i < width; ++i)
                dashes += kRuleChar;
            appendDecoration(rule, dashes);
            context.lines.push_back(std::move(rule));
        }
        rowStart += row.nodeSize();
    }
}

void layoutList(const Node &list, std::size_t start, LayoutContext &context, const std::string &firstPrefix,
                const std::string &restPrefix)
{
    std::size_t pos = start + 1;
    std::size_t number = list.attrs().start;
    for (std::size_t i = 0; i < list.childCount(); ++i)
    {
        const Node &item = list.child(i);
        std::string marker;
        if (list.type() == NodeType::OrderedList)
            marker = std::to_string(number++) + ". ";
        else if (list.type() == NodeType::TaskList)
            marker = item.attrs().checked ? "[x] " : "[ ] ";
        else
            marker = std::string(kBullet);

        std::string indent(displayWidth(marker), ' ');
        layoutChildren(item, pos + 1, context, (i == 0 ? firstPrefix : restPrefix) + marker, restPrefix + indent);
        pos += item.nodeSize();
    }
}

void layoutBlock(const Node &node, std::size_t start, LayoutContext &context, const std::string &firstPrefix,
                 const std::string &restPrefix)
{
    switch (node.type())
    {
    case NodeType::Image:
    {
        DisplayLine line = startLine(NodeType::Image, start, false, firstPrefix);
        const NodeAttrs &attrs = node.attrs();
        appendDecoration(line, "[image: " + (attrs.alt.empty() ? attrs.src : attrs.alt) + "]");
        context.lines.push_back(std::move(line));
        return;
    }
    case NodeType::HorizontalRule:
    {
        DisplayLine line = startLine(NodeType::HorizontalRule, start, false, firstPrefix);
        std::string rule;
        for (std::size_t i = 0; i < kRuleWidth; ++i)
            rule += kRuleChar;
        appendDecoration(line, rule);
        context.lines.push_back(std::move(line));
        return;
    }
    case NodeType::Table:
        layoutTable(node, start, context, firstPrefix, restPrefix);
        return;
    case NodeType::BulletList:
    case NodeType::OrderedList:
    case NodeType::TaskList:
        layoutList(node, start, context, firstPrefix, restPrefix);
        return;
    case NodeType::Blockquote:
        layoutChildren(node, start + 1, context, firstPrefix + std::string(kQuotePrefix),
                       restPrefix + std::string(kQuotePrefix));
        return;
    case NodeType::Container:
    {
        const NodeAttrs &attrs = node.attrs();
        DisplayLine header = startLine(NodeType::Container, start, false, firstPrefix);
        appendDecoration(header, "[" + attrs.containerType + "]" +
                                     (attrs.containerTitle.empty() ? "" : " " + attrs.containerTitle));
        context.lines.push_back(std::move(header));
        std::string nested = restPrefix + std::string(kQuotePrefix);
        layoutChildren(node, start + 1, context, nested, nested);
        return;
    }
    default:
        break;
    }

    if (node.isTextblock())
    {
        DisplayLine line = startLine(node.type(), start + 1, true, firstPrefix);
        appendText(node, start + 1, context, line, restPrefix);
        context.lines.push_back(std::move(line));
        return;
    }
    layoutChildren(node, start + 1, context, firstPrefix, restPrefix);
}

} // namespace

std::size_t displayWidth(std::string_view text) noexcept
{
    std::size_t width = 0;
    for (char ch : text)
    {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++width;
    }
    return width;
}

std::string DisplayLine::text() const
{
    std::string result;
    for (const auto &span : spans)
        result += span.text;
    return result;
}

std::size_t DisplayLine::width() const
{
    return displayWidth(text());
}

std::size_t DisplayLine::columnOf(std::size_t pos) const
{
    std::size_t column = 0;
    for (const auto &span : spans)
    {
        if (isTextSpan(span))
        {
            if (pos < span.from)
                return column;
            if (pos <= span.to)
                return column + displayWidth(std::string_view(span.text).substr(0, pos - span.from));
        }
        column += displayWidth(span.text);
    }
    return column;
}

std::size_t DisplayLine::positionAt(std::size_t column) const
{
    std::size_t current = 0;
    for (const auto &span : spans)
    {
        std::size_t width = displayWidth(span.text);
        if (isTextSpan(span))
        {
            if (column < current + width)
                return span.from + byteOffsetOfColumn(span.text, column - current);
        }
        else if (column < current + width)
        {
            column = current + width;
        }
        current += width;
    }
    return hasText ? to : from;
}

std::vector<DisplayLine> layoutDocument(const Node &doc, const DecorationSet &decorations)
{
    std::vector<DisplayLine> lines;
    LayoutContext context{decorations, lines};
    layoutChildren(doc, 0, context, {}, {});
    return lines;
}

std::size_t lineIndexOf(const std::vector<DisplayLine> &lines, std::size_t pos) noexcept
{
    std::size_t fallback = 0;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (!lines[i].hasText)
            continue;
        if (lines[i].from <= pos && pos <= lines[i].to)
            return i;
        if (lines[i].from <= pos)
            fallback = i;
    }
    return fallback;
}

std::vector<std::size_t> cursorPositions(const Node &doc)
{
    std::vector<std::size_t> positions;
    forEachTextblock(doc, [&positions](const Node &textblock, std::size_t contentStart) {
        for (std::size_t pos = contentStart; pos <= contentStart + textblock.contentSize(); ++pos)
            positions.push_back(pos);
    });
    return positions;
}

} // namespace mk::edit
