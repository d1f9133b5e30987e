#pragma once

#include "mk/edit/document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

bool isSpaceChar(char ch) noexcept;
bool isWordChar(char ch) noexcept;
bool isBlank(std::string_view line) noexcept;
bool startsWith(std::string_view text, std::string_view prefix) noexcept;
bool endsWith(std::string_view text, std::string_view suffix) noexcept;
std::string trim(std::string_view text);
std::string_view trimView(std::string_view text) noexcept;
std::string_view trimEndView(std::string_view text) noexcept;
std::size_t leadingWhitespace(std::string_view line) noexcept;

// Converts CRLF and lone CR to LF.
std::string normalizeLineEndings(std::string_view text);
// Splits on LF; a trailing LF yields a trailing empty line.
std::vector<std::string> splitLines(std::string_view text);
std::string joinLines(const std::vector<std::string> &lines);

struct CodeFenceOpen
{
    std::size_t indent = 0;
    std::string language;
};

struct HeadingLine
{
    int level = 0;
    std::string hashes;
    std::string spacing;
    std::string content;
};

struct ContainerOpen
{
    std::string type;
    std::string title;
};

struct ListItemLine
{
    std::size_t indent = 0;
    char bullet = '-';
    std::string number;
    std::string content;
    bool checked = false;
};

std::optional<CodeFenceOpen> matchCodeFenceOpen(std::string_view line);
bool isCodeFenceClose(std::string_view line) noexcept;
bool startsCodeFence(std::string_view line) noexcept;

std::optional<std::string> matchSingleLineMath(std::string_view line);
bool isMathFence(std::string_view line) noexcept;

std::optional<ContainerOpen> matchContainerOpen(std::string_view line);
bool isContainerClose(std::string_view line) noexcept;

std::optional<HeadingLine> matchHeading(std::string_view line);

// ![alt](src "title") occupying the whole line. With allowTrailingSpace the
// line may end in whitespace after the closing parenthesis.
std::optional<ImageSource> matchImageLine(std::string_view line, bool allowTrailingSpace = true);
std::string imageMarkdown(const ImageSource &image);

bool isHorizontalRule(std::string_view line) noexcept;

std::optional<std::string> matchBlockquote(std::string_view line);

std::optional<ListItemLine> matchTaskItem(std::string_view line);
std::optional<ListItemLine> matchBulletItem(std::string_view line);
std::optional<ListItemLine> matchOrderedItem(std::string_view line);

bool isTableRow(std::string_view line) noexcept;
bool isTableSeparator(std::string_view line) noexcept;
// Cell texts between the outer pipes, split on unescaped '|' and trimmed.
std::vector<std::string> splitTableCells(std::string_view line);
std::vector<TableAlignment> parseTableAlignments(std::string_view separator);
std::string_view alignmentMarker(TableAlignment align) noexcept;

std::optional<std::string> matchHtmlBlockStart(std::string_view line);
bool isVoidHtmlElement(std::string_view tag);

} // namespace mk::edit
