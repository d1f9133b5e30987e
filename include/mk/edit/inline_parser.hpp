#pragma once

#include "mk/edit/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

// One candidate inline construct found in a piece of text. Offsets are byte
// offsets into the scanned text; [start, end) covers prefix, content and suffix.
struct InlineMatch
{
    SyntaxType syntax = SyntaxType::Strong;
    std::size_t start = 0;
    std::size_t end = 0;
    std::string prefix;
    std::string content;
    std::string suffix;
    std::string href;  // Link
    std::string title; // Link
};

// Splits inline text into marked runs without dropping any delimiter. Every
// delimiter run carries a syntax_marker mark plus the semantic marks of the
// construct it opens or closes; content runs carry the semantic marks of all
// enclosing constructs.
class InlineParser
{
public:
    std::vector<TextRun> parse(std::string_view text, const MarkSet &inherited = {}) const;

    // Candidates of every construct, in construct priority order, each
    // construct scanned left to right without overlapping itself.
    static std::vector<InlineMatch> collectMatches(std::string_view text);
    static std::vector<InlineMatch> collectMatches(std::string_view text, SyntaxType syntax);
    // Orders candidates by start (longer first on ties) and keeps a candidate
    // only if it starts at or after the end of the previously kept one.
    static std::vector<InlineMatch> selectMatches(std::vector<InlineMatch> matches);
    // Offsets of backslash escapes outside link and inline math spans.
    static std::vector<std::size_t> findEscapes(std::string_view text);

    static bool isEscapable(char ch) noexcept;
    static MarkSet contentMarks(const InlineMatch &match);

private:
    void parseInto(std::string_view text, const MarkSet &inherited, std::vector<TextRun> &out) const;
    void parseWithEscapes(std::string_view text, const MarkSet &inherited, const std::vector<std::size_t> &escapes,
                          std::vector<TextRun> &out) const;
};

} // namespace mk::edit
