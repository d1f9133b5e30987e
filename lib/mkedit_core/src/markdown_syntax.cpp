#include "mk/edit/markdown_syntax.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mk::edit
{
namespace
{
std::string lower(std::string_view view)
{
    std::string result(view.begin(), view.end());
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

bool isDigit(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

bool isAsciiAlpha(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

std::size_t skipSpaces(std::string_view text, std::size_t pos) noexcept
{
    while (pos < text.size() && isSpaceChar(text[pos]))
        ++pos;
    return pos;
}

std::optional<ListItemLine> matchTaskAfterBullet(std::string_view line, std::size_t indent, std::size_t pos)
{
    std::size_t afterSpace = skipSpaces(line, pos);
    if (afterSpace == pos || afterSpace >= line.size() || line[afterSpace] != '[')
        return std::nullopt;
    pos = afterSpace + 1;
    bool checked = false;
    if (pos < line.size() && line[pos] != ']')
    {
        if (line[pos] != ' ' && line[pos] != 'x' && line[pos] != 'X')
            return std::nullopt;
        checked = line[pos] != ' ';
        ++pos;
    }
    if (pos >= line.size() || line[pos] != ']')
        return std::nullopt;
    ++pos;
    std::size_t contentStart = skipSpaces(line, pos);
    if (contentStart == pos)
        return std::nullopt;

    ListItemLine item;
    item.indent = indent;
    item.bullet = line[indent];
    item.checked = checked;
    item.content = std::string(line.substr(contentStart));
    return item;
}

} // namespace

bool isSpaceChar(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool isWordChar(char ch) noexcept
{
    return isAsciiAlpha(ch) || isDigit(ch) || ch == '_';
}

bool isBlank(std::string_view line) noexcept
{
    return std::all_of(line.begin(), line.end(), isSpaceChar);
}

bool startsWith(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool endsWith(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::string_view trimView(std::string_view text) noexcept
{
    std::size_t start = 0;
    std::size_t end = text.size();
    while (start < end && isSpaceChar(text[start]))
        ++start;
    while (end > start && isSpaceChar(text[end - 1]))
        --end;
    return text.substr(start, end - start);
}

std::string trim(std::string_view text)
{
    return std::string(trimView(text));
}

std::string_view trimEndView(std::string_view text) noexcept
{
    std::size_t end = text.size();
    while (end > 0 && isSpaceChar(text[end - 1]))
        --end;
    return text.substr(0, end);
}

std::size_t leadingWhitespace(std::string_view line) noexcept
{
    return skipSpaces(line, 0);
}

std::string normalizeLineEndings(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r')
        {
            result.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            continue;
        }
        result.push_back(text[i]);
    }
    return result;
}

std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t offset = 0;
    while (true)
    {
        std::size_t end = text.find('\n', offset);
        if (end == std::string_view::npos)
        {
            lines.emplace_back(text.substr(offset));
            break;
        }
        lines.emplace_back(text.substr(offset, end - offset));
        offset = end + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string> &lines)
{
    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            result.push_back('\n');
        result += lines[i];
    }
    return result;
}

std::optional<CodeFenceOpen> matchCodeFenceOpen(std::string_view line)
{
    std::size_t indent = leadingWhitespace(line);
    if (line.substr(indent, 3) != "```")
        return std::nullopt;
    std::size_t pos = indent + 3;
    std::size_t end = pos;
    while (end < line.size() && !isSpaceChar(line[end]) && line[end] != '`')
        ++end;
    CodeFenceOpen fence;
    fence.indent = indent;
    fence.language = std::string(line.substr(pos, end - pos));
    return fence;
}

bool isCodeFenceClose(std::string_view line) noexcept
{
    return trimView(line) == "```";
}

bool startsCodeFence(std::string_view line) noexcept
{
    return startsWith(trimView(line), "```");
}

std::optional<std::string> matchSingleLineMath(std::string_view line)
{
    std::string_view body = trimView(line);
    if (body.size() < 5 || !startsWith(body, "$$") || !endsWith(body, "$$"))
        return std::nullopt;
    return std::string(body.substr(2, body.size() - 4));
}

bool isMathFence(std::string_view line) noexcept
{
    return trimView(line) == "$$";
}

std::optional<ContainerOpen> matchContainerOpen(std::string_view line)
{
    if (!startsWith(line, ":::"))
        return std::nullopt;
    std::size_t pos = 3;
    while (pos < line.size() && isWordChar(line[pos]))
        ++pos;
    if (pos == 3)
        return std::nullopt;

    ContainerOpen open;
    open.type = std::string(line.substr(3, pos - 3));
    if (pos == line.size())
        return open;
    if (!isSpaceChar(line[pos]))
        return std::nullopt;
    open.title = std::string(line.substr(skipSpaces(line, pos)));
    return open;
}

bool isContainerClose(std::string_view line) noexcept
{
    return startsWith(line, ":::") && isBlank(line.substr(3));
}

std::optional<HeadingLine> matchHeading(std::string_view line)
{
    std::size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#')
        ++hashes;
    if (hashes == 0 || hashes > 6 || hashes >= line.size() || !isSpaceChar(line[hashes]))
        return std::nullopt;
    std::size_t contentStart = skipSpaces(line, hashes);

    HeadingLine heading;
    heading.level = static_cast<int>(hashes);
    heading.hashes = std::string(line.substr(0, hashes));
    heading.spacing = std::string(line.substr(hashes, contentStart - hashes));
    heading.content = std::string(line.substr(contentStart));
    return heading;
}

std::optional<ImageSource> matchImageLine(std::string_view line, bool allowTrailingSpace)
{
    if (!startsWith(line, "!["))
        return std::nullopt;
    std::size_t altEnd = line.find(']', 2);
    if (altEnd == std::string_view::npos || altEnd + 1 >= line.size() || line[altEnd + 1] != '(')
        return std::nullopt;

    std::string_view rest = line.substr(altEnd + 2);
    if (allowTrailingSpace)
        rest = trimEndView(rest);
    if (rest.empty() || rest.back() != ')')
        return std::nullopt;
    std::string_view inner = rest.substr(0, rest.size() - 1);

    ImageSource image;
    image.alt = std::string(line.substr(2, altEnd - 2));

    // The shortest source wins, so a trailing quoted title is split off
    // whenever whitespace precedes it.
    if (inner.size() >= 2 && inner.back() == '"')
    {
        std::size_t open = inner.rfind('"', inner.size() - 2);
        if (open != std::string_view::npos && open > 0 && isSpaceChar(inner[open - 1]))
        {
            std::size_t srcEnd = open;
            while (srcEnd > 0 && isSpaceChar(inner[srcEnd - 1]))
                --srcEnd;
            if (srcEnd > 0)
            {
                image.src = std::string(inner.substr(0, srcEnd));
                image.title = std::string(inner.substr(open + 1, inner.size() - open - 2));
                return image;
            }
        }
    }
    if (inner.empty())
        return std::nullopt;
    image.src = std::string(inner);
    return image;
}

std::string imageMarkdown(const ImageSource &image)
{
    std::string text = "![" + image.alt + "](" + image.src;
    if (!image.title.empty())
        text += " \"" + image.title + "\"";
    text += ")";
    return text;
}

bool isHorizontalRule(std::string_view line) noexcept
{
    std::size_t count = 0;
    while (count < line.size() && (line[count] == '-' || line[count] == '*' || line[count] == '_'))
        ++count;
    return count >= 3 && isBlank(line.substr(count));
}

std::optional<std::string> matchBlockquote(std::string_view line)
{
    if (line.empty() || line.front() != '>')
        return std::nullopt;
    std::size_t pos = 1;
    if (pos < line.size() && isSpaceChar(line[pos]))
        ++pos;
    return std::string(line.substr(pos));
}

std::optional<ListItemLine> matchTaskItem(std::string_view line)
{
    std::size_t indent = leadingWhitespace(line);
    if (indent >= line.size() || (line[indent] != '-' && line[indent] != '*' && line[indent] != '+'))
        return std::nullopt;
    return matchTaskAfterBullet(line, indent, indent + 1);
}

std::optional<ListItemLine> matchBulletItem(std::string_view line)
{
    std::size_t indent = leadingWhitespace(line);
    if (indent >= line.size() || (line[indent] != '-' && line[indent] != '*' && line[indent] != '+'))
        return std::nullopt;
    std::size_t contentStart = skipSpaces(line, indent + 1);
    if (contentStart == indent + 1)
        return std::nullopt;

    ListItemLine item;
    item.indent = indent;
    item.bullet = line[indent];
    item.content = std::string(line.substr(contentStart));
    return item;
}

std::optional<ListItemLine> matchOrderedItem(std::string_view line)
{
    std::size_t indent = leadingWhitespace(line);
    std::size_t pos = indent;
    while (pos < line.size() && isDigit(line[pos]))
        ++pos;
    if (pos == indent || pos >= line.size() || line[pos] != '.')
        return std::nullopt;
    std::size_t contentStart = skipSpaces(line, pos + 1);
    if (contentStart == pos + 1)
        return std::nullopt;

    ListItemLine item;
    item.indent = indent;
    item.number = std::string(line.substr(indent, pos - indent));
    item.content = std::string(line.substr(contentStart));
    return item;
}

bool isTableRow(std::string_view line) noexcept
{
    std::string_view body = trimEndView(line);
    return body.size() >= 3 && body.front() == '|' && body.back() == '|';
}

bool isTableSeparator(std::string_view line) noexcept
{
    if (!isTableRow(line))
        return false;
    std::string_view body = trimEndView(line);
    std::string_view inner = body.substr(1, body.size() - 2);
    return std::all_of(inner.begin(), inner.end(),
                       [](char ch) { return ch == '-' || ch == ':' || ch == '|' || isSpaceChar(ch); });
}

std::vector<std::string> splitTableCells(std::string_view line)
{
    std::string_view body = trimEndView(line);
    if (body.size() < 2)
        return {};
    std::string_view inner = body.substr(1, body.size() - 2);

    std::vector<std::string> cells;
    std::size_t cellStart = 0;
    for (std::size_t i = 0; i < inner.size(); ++i)
    {
        if (inner[i] == '\\' && i + 1 < inner.size())
        {
            ++i;
            continue;
        }
        if (inner[i] == '|')
        {
            cells.push_back(trim(inner.substr(cellStart, i - cellStart)));
            cellStart = i + 1;
        }
    }
    cells.push_back(trim(inner.substr(cellStart)));
    return cells;
}

std::vector<TableAlignment> parseTableAlignments(std::string_view separator)
{
    std::vector<TableAlignment> alignments;
    for (const auto &column : splitTableCells(separator))
    {
        bool left = startsWith(column, ":");
        bool right = endsWith(column, ":");
        if (left && right)
            alignments.push_back(TableAlignment::Center);
        else if (right)
            alignments.push_back(TableAlignment::Right);
        else if (left)
            alignments.push_back(TableAlignment::Left);
        else
            alignments.push_back(TableAlignment::None);
    }
    return alignments;
}

std::string_view alignmentMarker(TableAlignment align) noexcept
{
    switch (align)
    {
    case TableAlignment::Center:
        return ":---:";
    case TableAlignment::Right:
        return "---:";
    case TableAlignment::Left:
        return ":---";
    case TableAlignment::None:
        break;
    }
    return "---";
}

std::optional<std::string> matchHtmlBlockStart(std::string_view line)
{
    if (line.size() < 2 || line[0] != '<' || !isAsciiAlpha(line[1]))
        return std::nullopt;
    std::size_t end = 2;
    while (end < line.size() && (isAsciiAlpha(line[end]) || isDigit(line[end])))
        ++end;
    return std::string(line.substr(1, end - 1));
}

bool isVoidHtmlElement(std::string_view tag)
{
    static constexpr std::array<std::string_view, 14> kVoidElements = {
        "area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "param", "source", "track", "wbr"};
    std::string name = lower(tag);
    return std::find(kVoidElements.begin(), kVoidElements.end(), name) != kVoidElements.end();
}

} // namespace mk::edit
