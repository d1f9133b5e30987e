#include "mk/edit/regions.hpp"

#include <algorithm>
#include <optional>

namespace mk::edit
{
namespace
{
std::optional<SemanticType> semanticTypeOf(MarkType type) noexcept
{
    switch (type)
    {
    case MarkType::Strong:
        return SemanticType::Strong;
    case MarkType::Emphasis:
        return SemanticType::Emphasis;
    case MarkType::CodeInline:
        return SemanticType::CodeInline;
    case MarkType::Strikethrough:
        return SemanticType::Strikethrough;
    case MarkType::Highlight:
        return SemanticType::Highlight;
    case MarkType::Link:
        return SemanticType::Link;
    case MarkType::MathInline:
        return SemanticType::MathInline;
    case MarkType::SyntaxMarker:
        break;
    }
    return std::nullopt;
}

bool isMathDelimiter(const TextRun &run) noexcept
{
    std::optional<SyntaxType> syntax = syntaxTypeOf(run.marks);
    return syntax && *syntax == SyntaxType::MathInline;
}

// Maximal run of markType around hint, in document positions.
std::optional<SemanticRegion> fullMarkRegion(const Node &textblock, MarkType markType, SemanticType semantic,
                                             std::size_t hint, std::size_t contentStart)
{
    std::vector<SemanticRegion> regions;
    std::optional<SemanticRegion> current;
    std::size_t offset = contentStart;
    for (const auto &run : textblock.runs())
    {
        std::size_t runEnd = offset + run.text.size();
        if (hasMark(run.marks, markType))
        {
            if (!current)
                current = SemanticRegion{semantic, offset, runEnd};
            else
                current->to = runEnd;
        }
        else if (current)
        {
            regions.push_back(*current);
            current.reset();
        }
        offset = runEnd;
    }
    if (current)
        regions.push_back(*current);

    for (const auto &region : regions)
    {
        if (hint >= region.from && hint <= region.to)
            return region;
    }
    if (!regions.empty())
        return regions.front();
    return std::nullopt;
}

} // namespace

bool SyntaxMarkerRegion::operator==(const SyntaxMarkerRegion &other) const noexcept
{
    return from == other.from && to == other.to && syntaxType == other.syntaxType;
}

bool MathInlineRegion::operator==(const MathInlineRegion &other) const noexcept
{
    return from == other.from && to == other.to && content == other.content && contentFrom == other.contentFrom &&
           contentTo == other.contentTo;
}

std::string_view semanticTypeName(SemanticType type) noexcept
{
    switch (type)
    {
    case SemanticType::Strong:
        return "strong";
    case SemanticType::Emphasis:
        return "emphasis";
    case SemanticType::CodeInline:
        return "code_inline";
    case SemanticType::Strikethrough:
        return "strikethrough";
    case SemanticType::Highlight:
        return "highlight";
    case SemanticType::Link:
        return "link";
    case SemanticType::MathInline:
        return "math_inline";
    case SemanticType::Heading:
        return "heading";
    }
    return "unknown";
}

std::vector<SyntaxMarkerRegion> findSyntaxMarkerRegions(const Node &doc)
{
    std::vector<SyntaxMarkerRegion> regions;
    forEachTextblock(doc, [&regions](const Node &textblock, std::size_t contentStart) {
        std::size_t offset = contentStart;
        bool previousWasMarker = false;
        for (const auto &run : textblock.runs())
        {
            std::size_t runEnd = offset + run.text.size();
            std::optional<SyntaxType> syntax = syntaxTypeOf(run.marks);
            if (syntax)
            {
                if (previousWasMarker && regions.back().syntaxType == *syntax && regions.back().to == offset)
                    regions.back().to = runEnd;
                else
                    regions.push_back(SyntaxMarkerRegion{offset, runEnd, *syntax});
            }
            previousWasMarker = syntax.has_value();
            offset = runEnd;
        }
    });
    return regions;
}

std::vector<MathInlineRegion> findMathInlineRegions(const Node &doc)
{
    std::vector<MathInlineRegion> regions;
    forEachTextblock(doc, [&regions](const Node &textblock, std::size_t contentStart) {
        std::optional<MathInlineRegion> current;
        std::size_t offset = contentStart;
        for (const auto &run : textblock.runs())
        {
            std::size_t runEnd = offset + run.text.size();
            if (hasMark(run.marks, MarkType::MathInline))
            {
                if (!current)
                    current = MathInlineRegion{offset, runEnd, std::string(), offset, runEnd};
                else
                    current->to = runEnd;

                if (!isMathDelimiter(run))
                {
                    if (current->content.empty())
                        current->contentFrom = offset;
                    current->content += run.text;
                    current->contentTo = runEnd;
                }
            }
            else if (current)
            {
                regions.push_back(std::move(*current));
                current.reset();
            }
            offset = runEnd;
        }
        if (current)
            regions.push_back(std::move(*current));
    });
    return regions;
}

std::vector<SemanticRegion> findSemanticRegionsAt(const Node &doc, std::size_t pos)
{
    std::vector<SemanticRegion> regions;
    std::optional<ResolvedTextblock> resolved = resolveTextblock(doc, pos);
    if (!resolved)
        return regions;

    const Node &textblock = *resolved->node;
    std::size_t offset = resolved->contentStart;
    for (const auto &run : textblock.runs())
    {
        std::size_t runEnd = offset + run.text.size();
        if (pos >= offset && pos <= runEnd)
        {
            for (const auto &mark : run.marks)
            {
                std::optional<SemanticType> semantic = semanticTypeOf(mark.type);
                if (!semantic)
                    continue;
                bool seen = std::any_of(regions.begin(), regions.end(),
                                        [&semantic](const SemanticRegion &region) { return region.type == *semantic; });
                if (seen)
                    continue;
                if (auto region = fullMarkRegion(textblock, mark.type, *semantic, offset, resolved->contentStart))
                    regions.push_back(*region);
            }
        }
        offset = runEnd;
    }
    return regions;
}

std::vector<SemanticRegion> activeSemanticRegions(const Node &doc, std::size_t pos)
{
    std::vector<SemanticRegion> regions = findSemanticRegionsAt(doc, pos);
    std::optional<ResolvedTextblock> resolved = resolveTextblock(doc, pos);
    if (resolved && resolved->node->type() == NodeType::Heading)
        regions.push_back(SemanticRegion{SemanticType::Heading, resolved->contentStart, resolved->contentEnd});
    return regions;
}

bool isSyntaxTypeRelated(SyntaxType syntax, SemanticType semantic) noexcept
{
    switch (syntax)
    {
    case SyntaxType::StrongEmphasis:
        return semantic == SemanticType::Strong || semantic == SemanticType::Emphasis;
    case SyntaxType::Strong:
        return semantic == SemanticType::Strong;
    case SyntaxType::Emphasis:
        return semantic == SemanticType::Emphasis;
    case SyntaxType::CodeInline:
        return semantic == SemanticType::CodeInline;
    case SyntaxType::Strikethrough:
        return semantic == SemanticType::Strikethrough;
    case SyntaxType::Highlight:
        return semantic == SemanticType::Highlight;
    case SyntaxType::Link:
        return semantic == SemanticType::Link;
    case SyntaxType::MathInline:
        return semantic == SemanticType::MathInline;
    case SyntaxType::Heading:
        return semantic == SemanticType::Heading;
    case SyntaxType::Escape:
    case SyntaxType::Blockquote:
        break;
    }
    return false;
}

} // namespace mk::edit
