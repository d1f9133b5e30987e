#pragma once

#include "mk/edit/document.hpp"

#include <string>

namespace mk::edit
{

// Writes a structured tree back to Markdown. Inline delimiters are part of
// the text runs and are emitted unchanged; block syntax is regenerated.
// MarkdownParser::parse(serializeMarkdown(doc)).doc has the same structure
// as doc for any tree the parser produced.
std::string serializeMarkdown(const Node &doc);

} // namespace mk::edit
