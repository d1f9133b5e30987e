#pragma once

#include <string_view>

namespace mk::edit
{

// True when the text contains anything the parser would turn into a block
// or an inline mark: headings, emphasis, code, links, images, quotes, lists,
// rules, highlights, math, task items or table rows.
bool containsMarkdownSyntax(std::string_view text);

} // namespace mk::edit
