#include "mk/edit/paste.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <regex>
#include <string>
#include <vector>

namespace mk::edit
{
namespace
{
const std::vector<std::regex> &linePatterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^#{1,6}\s)"),
        std::regex(R"(^```)"),
        std::regex(R"(^>\s?)"),
        std::regex(R"(^[-*+]\s)"),
        std::regex(R"(^\d+\.\s)"),
        std::regex(R"(^[-*_]{3,}\s*$)"),
        std::regex(R"(^\s*\$\$)"),
        std::regex(R"(^- \[[ xX]\])"),
        std::regex(R"(^\|.+\|$)"),
    };
    return patterns;
}

const std::vector<std::regex> &inlinePatterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\*\*[^*]+\*\*)"),
        std::regex(R"(\*[^*]+\*)"),
        std::regex(R"(~~[^~]+~~)"),
        std::regex(R"(`[^`]+`)"),
        std::regex(R"(\[[^\]]+\]\([^)]*\))"),
        std::regex(R"(!\[[^\]]*\]\([^)]+\))"),
        std::regex(R"(==[^=]+==)"),
        std::regex(R"(\$[^$]+\$)"),
    };
    return patterns;
}

} // namespace

bool containsMarkdownSyntax(std::string_view text)
{
    std::string normalized = normalizeLineEndings(text);

    // Line anchored patterns are matched line by line; inline ones may span
    // line breaks.
    for (const auto &line : splitLines(normalized))
    {
        for (const auto &pattern : linePatterns())
        {
            if (std::regex_search(line, pattern))
                return true;
        }
    }
    for (const auto &pattern : inlinePatterns())
    {
        if (std::regex_search(normalized, pattern))
            return true;
    }
    return false;
}

} // namespace mk::edit
