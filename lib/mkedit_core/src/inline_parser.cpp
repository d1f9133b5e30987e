#include "mk/edit/inline_parser.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <algorithm>
#include <optional>

namespace mk::edit
{
namespace
{
using Scanner = std::optional<InlineMatch> (*)(std::string_view text, std::size_t pos);

char charAt(std::string_view text, std::size_t pos) noexcept
{
    return pos < text.size() ? text[pos] : '\0';
}

InlineMatch makeMatch(SyntaxType syntax, std::string_view text, std::size_t start, std::size_t prefixLength,
                      std::size_t contentEnd, std::size_t suffixLength)
{
    InlineMatch match;
    match.syntax = syntax;
    match.start = start;
    match.end = contentEnd + suffixLength;
    match.prefix = std::string(text.substr(start, prefixLength));
    match.content = std::string(text.substr(start + prefixLength, contentEnd - start - prefixLength));
    match.suffix = std::string(text.substr(contentEnd, suffixLength));
    return match;
}

// ***x*** or ___x___
std::optional<InlineMatch> scanStrongEmphasis(std::string_view text, std::size_t pos)
{
    std::string_view delimiter = text.substr(pos, 3);
    if (delimiter != "***" && delimiter != "___")
        return std::nullopt;
    std::size_t close = text.find(delimiter, pos + 4);
    if (close == std::string_view::npos)
        return std::nullopt;
    return makeMatch(SyntaxType::StrongEmphasis, text, pos, 3, close, 3);
}

// **x** or __x__, where neither delimiter touches a third delimiter character.
std::optional<InlineMatch> scanStrong(std::string_view text, std::size_t pos)
{
    char delimiter = charAt(text, pos);
    if (delimiter != '*' && delimiter != '_')
        return std::nullopt;
    if (charAt(text, pos + 1) != delimiter || charAt(text, pos + 2) == delimiter)
        return std::nullopt;
    if (pos > 0 && text[pos - 1] == delimiter)
        return std::nullopt;
    for (std::size_t close = pos + 3; close + 1 < text.size(); ++close)
    {
        if (text[close] == delimiter && text[close + 1] == delimiter && text[close - 1] != delimiter &&
            charAt(text, close + 2) != delimiter)
            return makeMatch(SyntaxType::Strong, text, pos, 2, close, 2);
    }
    return std::nullopt;
}

std::optional<InlineMatch> scanEmphasis(std::string_view text, std::size_t pos)
{
    char delimiter = charAt(text, pos);
    if (delimiter == '*')
    {
        if (pos > 0 && (text[pos - 1] == '*' || text[pos - 1] == '_' || isWordChar(text[pos - 1])))
            return std::nullopt;
        if (pos + 1 >= text.size() || text[pos + 1] == '*' || isSpaceChar(text[pos + 1]))
            return std::nullopt;
        for (std::size_t close = pos + 2; close < text.size(); ++close)
        {
            if (text[close] == '*' && text[close - 1] != '*' && !isSpaceChar(text[close - 1]) &&
                charAt(text, close + 1) != '*')
                return makeMatch(SyntaxType::Emphasis, text, pos, 1, close, 1);
        }
        return std::nullopt;
    }
    if (delimiter == '_')
    {
        if (pos > 0 && (text[pos - 1] == '*' || text[pos - 1] == '_'))
            return std::nullopt;
        if (pos + 1 >= text.size() || text[pos + 1] == '_' || isSpaceChar(text[pos + 1]))
            return std::nullopt;
        for (std::size_t close = pos + 2; close < text.size(); ++close)
        {
            if (text[close] != '_' || text[close - 1] == '_' || isSpaceChar(text[close - 1]))
                continue;
            char next = charAt(text, close + 1);
            if (next != '_' && !isWordChar(next))
                return makeMatch(SyntaxType::Emphasis, text, pos, 1, close, 1);
        }
    }
    return std::nullopt;
}

std::optional<InlineMatch> scanCode(std::string_view text, std::size_t pos)
{
    if (charAt(text, pos) != '`')
        return std::nullopt;
    std::size_t close = text.find('`', pos + 1);
    if (close == std::string_view::npos || close == pos + 1)
        return std::nullopt;
    return makeMatch(SyntaxType::CodeInline, text, pos, 1, close, 1);
}

std::optional<InlineMatch> scanPaired(std::string_view text, std::size_t pos, std::string_view delimiter,
                                      SyntaxType syntax)
{
    if (text.substr(pos, delimiter.size()) != delimiter)
        return std::nullopt;
    std::size_t close = text.find(delimiter, pos + delimiter.size() + 1);
    if (close == std::string_view::npos)
        return std::nullopt;
    return makeMatch(syntax, text, pos, delimiter.size(), close, delimiter.size());
}

std::optional<InlineMatch> scanStrikethrough(std::string_view text, std::size_t pos)
{
    return scanPaired(text, pos, "~~", SyntaxType::Strikethrough);
}

std::optional<InlineMatch> scanHighlight(std::string_view text, std::size_t pos)
{
    return scanPaired(text, pos, "==", SyntaxType::Highlight);
}

std::string unescapeParentheses(std::string_view href)
{
    std::string result;
    result.reserve(href.size());
    for (std::size_t i = 0; i < href.size(); ++i)
    {
        if (href[i] == '\\' && i + 1 < href.size() && (href[i + 1] == '(' || href[i + 1] == ')'))
            ++i;
        result.push_back(href[i]);
    }
    return result;
}

// [label](href "title"), not preceded by '!'. The href may contain
// backslash escapes but no whitespace or unescaped ')'.
std::optional<InlineMatch> scanLink(std::string_view text, std::size_t pos)
{
    if (charAt(text, pos) != '[' || (pos > 0 && text[pos - 1] == '!'))
        return std::nullopt;
    std::size_t labelEnd = text.find(']', pos + 1);
    if (labelEnd == std::string_view::npos || labelEnd == pos + 1 || charAt(text, labelEnd + 1) != '(')
        return std::nullopt;

    std::size_t hrefStart = labelEnd + 2;
    std::size_t i = hrefStart;
    while (i < text.size())
    {
        char ch = text[i];
        if (ch == '\\')
        {
            if (i + 1 >= text.size())
                break;
            i += 2;
            continue;
        }
        if (ch == ')' || isSpaceChar(ch))
            break;
        ++i;
    }
    if (i == hrefStart)
        return std::nullopt;
    std::size_t hrefEnd = i;

    std::size_t closeParen = std::string_view::npos;
    std::string title;
    if (i < text.size() && isSpaceChar(text[i]))
    {
        std::size_t quote = i;
        while (quote < text.size() && isSpaceChar(text[quote]))
            ++quote;
        if (charAt(text, quote) != '"')
            return std::nullopt;
        std::size_t endQuote = text.find('"', quote + 1);
        if (endQuote == std::string_view::npos || charAt(text, endQuote + 1) != ')')
            return std::nullopt;
        title = std::string(text.substr(quote + 1, endQuote - quote - 1));
        closeParen = endQuote + 1;
    }
    else if (charAt(text, i) == ')')
    {
        closeParen = i;
    }
    else
    {
        return std::nullopt;
    }

    InlineMatch match = makeMatch(SyntaxType::Link, text, pos, 1, labelEnd, closeParen + 1 - labelEnd);
    match.href = unescapeParentheses(text.substr(hrefStart, hrefEnd - hrefStart));
    match.title = std::move(title);
    return match;
}

// $x$ where neither dollar sign is doubled.
std::optional<InlineMatch> scanMath(std::string_view text, std::size_t pos)
{
    if (charAt(text, pos) != '$' || (pos > 0 && text[pos - 1] == '$'))
        return std::nullopt;
    if (pos + 1 >= text.size() || text[pos + 1] == '$')
        return std::nullopt;
    std::size_t close = text.find('$', pos + 1);
    if (close == std::string_view::npos || charAt(text, close + 1) == '$')
        return std::nullopt;
    return makeMatch(SyntaxType::MathInline, text, pos, 1, close, 1);
}

struct SyntaxScanner
{
    SyntaxType syntax;
    Scanner scan;
};

// Priority order.
constexpr SyntaxScanner kScanners[] = {
    {SyntaxType::StrongEmphasis, scanStrongEmphasis},
    {SyntaxType::Strong, scanStrong},
    {SyntaxType::Emphasis, scanEmphasis},
    {SyntaxType::CodeInline, scanCode},
    {SyntaxType::Strikethrough, scanStrikethrough},
    {SyntaxType::Highlight, scanHighlight},
    {SyntaxType::Link, scanLink},
    {SyntaxType::MathInline, scanMath},
};

void scanAll(std::string_view text, Scanner scan, std::vector<InlineMatch> &out)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::optional<InlineMatch> match = scan(text, pos);
        if (!match)
        {
            ++pos;
            continue;
        }
        pos = match->end > pos ? match->end : pos + 1;
        if (match->prefix.empty() || match->content.empty())
            continue;
        out.push_back(std::move(*match));
    }
}

void appendMerged(std::vector<TextRun> &out, std::string_view text, const MarkSet &marks)
{
    if (text.empty())
        return;
    if (!out.empty() && out.back().marks == marks)
    {
        out.back().text.append(text);
        return;
    }
    out.push_back(TextRun{std::string(text), marks});
}

} // namespace

std::vector<InlineMatch> InlineParser::collectMatches(std::string_view text)
{
    std::vector<InlineMatch> matches;
    for (const auto &scanner : kScanners)
        scanAll(text, scanner.scan, matches);
    return matches;
}

std::vector<InlineMatch> InlineParser::collectMatches(std::string_view text, SyntaxType syntax)
{
    std::vector<InlineMatch> matches;
    for (const auto &scanner : kScanners)
    {
        if (scanner.syntax == syntax)
            scanAll(text, scanner.scan, matches);
    }
    return matches;
}

std::vector<InlineMatch> InlineParser::selectMatches(std::vector<InlineMatch> matches)
{
    std::stable_sort(matches.begin(), matches.end(), [](const InlineMatch &a, const InlineMatch &b) {
        if (a.start != b.start)
            return a.start < b.start;
        return a.end > b.end;
    });

    std::vector<InlineMatch> kept;
    std::size_t lastEnd = 0;
    for (auto &match : matches)
    {
        if (match.start >= lastEnd)
        {
            lastEnd = match.end;
            kept.push_back(std::move(match));
        }
    }
    return kept;
}

bool InlineParser::isEscapable(char ch) noexcept
{
    static constexpr std::string_view kEscapable = "\\`*_{}[]()#+-.!|~=$>";
    return kEscapable.find(ch) != std::string_view::npos;
}

std::vector<std::size_t> InlineParser::findEscapes(std::string_view text)
{
    std::vector<InlineMatch> protectedSpans = collectMatches(text, SyntaxType::Link);
    scanAll(text, scanMath, protectedSpans);

    std::vector<std::size_t> escapes;
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '\\' || i + 1 >= text.size() || !isEscapable(text[i + 1]))
        {
            ++i;
            continue;
        }
        bool inProtected = std::any_of(protectedSpans.begin(), protectedSpans.end(), [i](const InlineMatch &span) {
            return i >= span.start && i + 2 <= span.end;
        });
        if (!inProtected)
            escapes.push_back(i);
        i += 2;
    }
    return escapes;
}

MarkSet InlineParser::contentMarks(const InlineMatch &match)
{
    switch (match.syntax)
    {
    case SyntaxType::StrongEmphasis:
        return {Mark::semantic(MarkType::Strong), Mark::semantic(MarkType::Emphasis)};
    case SyntaxType::Strong:
        return {Mark::semantic(MarkType::Strong)};
    case SyntaxType::Emphasis:
        return {Mark::semantic(MarkType::Emphasis)};
    case SyntaxType::CodeInline:
        return {Mark::semantic(MarkType::CodeInline)};
    case SyntaxType::Strikethrough:
        return {Mark::semantic(MarkType::Strikethrough)};
    case SyntaxType::Highlight:
        return {Mark::semantic(MarkType::Highlight)};
    case SyntaxType::Link:
        return {Mark::link(match.href, match.title)};
    case SyntaxType::MathInline:
        return {Mark::math(match.content)};
    default:
        return {};
    }
}

std::vector<TextRun> InlineParser::parse(std::string_view text, const MarkSet &inherited) const
{
    std::vector<TextRun> runs;
    parseInto(text, inherited, runs);
    return runs;
}

void InlineParser::parseInto(std::string_view text, const MarkSet &inherited, std::vector<TextRun> &out) const
{
    if (text.empty())
        return;

    std::vector<std::size_t> escapes = findEscapes(text);
    if (!escapes.empty())
    {
        parseWithEscapes(text, inherited, escapes, out);
        return;
    }

    std::size_t pos = 0;
    for (const auto &match : selectMatches(collectMatches(text)))
    {
        if (match.start > pos)
            appendMerged(out, text.substr(pos, match.start - pos), inherited);

        MarkSet contentSet = withMarks(inherited, contentMarks(match));
        MarkSet delimiterSet = withMark(contentSet, Mark::syntaxMarker(match.syntax));
        appendMerged(out, match.prefix, delimiterSet);
        parseInto(match.content, contentSet, out);
        appendMerged(out, match.suffix, delimiterSet);
        pos = match.end;
    }
    if (pos < text.size())
        appendMerged(out, text.substr(pos), inherited);
}

void InlineParser::parseWithEscapes(std::string_view text, const MarkSet &inherited,
                                    const std::vector<std::size_t> &escapes, std::vector<TextRun> &out) const
{
    MarkSet backslashMarks = withMark(inherited, Mark::syntaxMarker(SyntaxType::Escape));
    std::size_t pos = 0;
    for (std::size_t escape : escapes)
    {
        if (escape > pos)
            parseInto(text.substr(pos, escape - pos), inherited, out);
        appendMerged(out, text.substr(escape, 1), backslashMarks);
        appendMerged(out, text.substr(escape + 1, 1), inherited);
        pos = escape + 2;
    }
    if (pos < text.size())
        parseInto(text.substr(pos), inherited, out);
}

} // namespace mk::edit
