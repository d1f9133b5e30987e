#pragma once

#include "mk/edit/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

// Maximal contiguous span of one syntax_marker type, in document positions.
struct SyntaxMarkerRegion
{
    std::size_t from = 0;
    std::size_t to = 0;
    SyntaxType syntaxType = SyntaxType::Strong;

    bool operator==(const SyntaxMarkerRegion &other) const noexcept;
    bool operator!=(const SyntaxMarkerRegion &other) const noexcept { return !(*this == other); }
};

struct MathInlineRegion
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string content;
    std::size_t contentFrom = 0;
    std::size_t contentTo = 0;

    bool operator==(const MathInlineRegion &other) const noexcept;
    bool operator!=(const MathInlineRegion &other) const noexcept { return !(*this == other); }
};

enum class SemanticType
{
    Strong,
    Emphasis,
    CodeInline,
    Strikethrough,
    Highlight,
    Link,
    MathInline,
    Heading
};

struct SemanticRegion
{
    SemanticType type = SemanticType::Strong;
    std::size_t from = 0;
    std::size_t to = 0;
};

std::string_view semanticTypeName(SemanticType type) noexcept;

std::vector<SyntaxMarkerRegion> findSyntaxMarkerRegions(const Node &doc);
std::vector<MathInlineRegion> findMathInlineRegions(const Node &doc);

// Semantic mark regions touching pos, one per mark type, each extended to
// the maximal run of that mark type inside the textblock.
std::vector<SemanticRegion> findSemanticRegionsAt(const Node &doc, std::size_t pos);
// findSemanticRegionsAt plus the whole heading content when pos is inside one.
std::vector<SemanticRegion> activeSemanticRegions(const Node &doc, std::size_t pos);

// Whether a marker of the given syntax belongs to a semantic region of the
// given type (strong and emphasis markers also belong to combined regions).
bool isSyntaxTypeRelated(SyntaxType syntax, SemanticType semantic) noexcept;

} // namespace mk::edit
