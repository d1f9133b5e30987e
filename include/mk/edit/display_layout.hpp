#pragma once

#include "mk/edit/decorations.hpp"
#include "mk/edit/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

struct DisplaySpan
{
    std::string text;
    std::size_t from = 0; // document position of the first byte
    std::size_t to = 0;
    MarkSet marks;
    bool widget = false;     // rendered content, not document text
    bool decoration = false; // block prefix or cell separator
};

// One terminal line. Text lines cover the document positions [from, to];
// lines for images and rules cover none and have hasText unset.
struct DisplayLine
{
    std::vector<DisplaySpan> spans;
    std::size_t from = 0;
    std::size_t to = 0;
    bool hasText = false;
    NodeType blockType = NodeType::Paragraph;

    std::string text() const;
    std::size_t width() const;
    // Column of a document position on this line, or of the first visible
    // position after it when pos itself is hidden.
    std::size_t columnOf(std::size_t pos) const;
    std::size_t positionAt(std::size_t column) const;
};

// Number of terminal columns, counting one per UTF-8 code point.
std::size_t displayWidth(std::string_view text) noexcept;

std::vector<DisplayLine> layoutDocument(const Node &doc, const DecorationSet &decorations);

// Index of the first line whose text range contains pos.
std::size_t lineIndexOf(const std::vector<DisplayLine> &lines, std::size_t pos) noexcept;

// Every position a cursor can take, in ascending order.
std::vector<std::size_t> cursorPositions(const Node &doc);

} // namespace mk::edit
