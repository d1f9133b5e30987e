#include "mk/edit/decorations.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <algorithm>

namespace mk::edit
{
namespace
{
Decoration inlineDecoration(std::size_t from, std::size_t to, DecorationStyle style)
{
    Decoration decoration;
    decoration.kind = DecorationKind::Inline;
    decoration.from = from;
    decoration.to = to;
    decoration.style = style;
    return decoration;
}

std::size_t leadingHashes(const Node &doc, const SyntaxMarkerRegion &region)
{
    std::string text = doc.textBetween(region.from, region.to);
    std::size_t count = 0;
    while (count < text.size() && text[count] == '#')
        ++count;
    return count;
}

} // namespace

std::string_view decorationClassName(DecorationStyle style) noexcept
{
    switch (style)
    {
    case DecorationStyle::SyntaxVisible:
        return "mk-syntax-visible";
    case DecorationStyle::SyntaxHidden:
        return "mk-syntax-hidden";
    case DecorationStyle::MathSourceHidden:
        return "mk-math-source-hidden";
    case DecorationStyle::MathRendered:
        return "mk-math-rendered";
    }
    return "";
}

bool Decoration::operator==(const Decoration &other) const noexcept
{
    return kind == other.kind && from == other.from && to == other.to && style == other.style &&
           widgetContent == other.widgetContent && side == other.side;
}

DecorationSet::DecorationSet(std::vector<Decoration> decorations)
    : entries(std::move(decorations))
{
    std::stable_sort(entries.begin(), entries.end(), [](const Decoration &a, const Decoration &b) {
        if (a.from != b.from)
            return a.from < b.from;
        return a.to < b.to;
    });
}

std::vector<Decoration> DecorationSet::find(std::size_t from, std::size_t to) const
{
    std::vector<Decoration> result;
    for (const auto &decoration : entries)
    {
        if (decoration.kind == DecorationKind::Inline && decoration.from < to && decoration.to > from)
            result.push_back(decoration);
    }
    return result;
}

std::vector<Decoration> DecorationSet::widgetsAt(std::size_t pos) const
{
    std::vector<Decoration> result;
    for (const auto &decoration : entries)
    {
        if (decoration.kind == DecorationKind::Widget && decoration.from == pos)
            result.push_back(decoration);
    }
    return result;
}

bool DecorationSet::isHidden(std::size_t pos) const noexcept
{
    return std::any_of(entries.begin(), entries.end(), [pos](const Decoration &decoration) {
        return decoration.kind == DecorationKind::Inline && decoration.from <= pos && pos < decoration.to &&
               (decoration.style == DecorationStyle::SyntaxHidden ||
                decoration.style == DecorationStyle::MathSourceHidden);
    });
}

bool DecorationSet::isVisibleMarker(std::size_t from, std::size_t to) const noexcept
{
    return std::any_of(entries.begin(), entries.end(), [from, to](const Decoration &decoration) {
        return decoration.kind == DecorationKind::Inline && decoration.style == DecorationStyle::SyntaxVisible &&
               decoration.from == from && decoration.to == to;
    });
}

DecorationEngine::DecorationEngine(MathRenderer *mathRenderer)
    : mathRenderer(mathRenderer)
{
}

bool DecorationEngine::isMarkerShown(const SyntaxMarkerRegion &region, std::size_t cursorPos,
                                     const std::vector<SemanticRegion> &activeSemantic) noexcept
{
    if (region.syntaxType == SyntaxType::Escape)
    {
        // The backslash and the escaped character after it.
        if (cursorPos >= region.from && cursorPos <= region.to + 1)
            return true;
    }
    else
    {
        for (const auto &active : activeSemantic)
        {
            if (isSyntaxTypeRelated(region.syntaxType, active.type) && region.from >= active.from &&
                region.to <= active.to)
                return true;
        }
    }
    return cursorPos >= region.from && cursorPos <= region.to;
}

DecorationResult DecorationEngine::computeDecorations(const Node &doc, std::size_t cursorPos, bool sourceView,
                                                      const std::vector<SyntaxMarkerRegion> *cachedSyntaxRegions,
                                                      const std::vector<MathInlineRegion> *cachedMathRegions) const
{
    DecorationResult result;
    result.syntaxRegions = cachedSyntaxRegions ? *cachedSyntaxRegions : findSyntaxMarkerRegions(doc);
    result.mathInlineRegions = cachedMathRegions ? *cachedMathRegions : findMathInlineRegions(doc);

    for (const auto &region : result.syntaxRegions)
    {
        if (cursorPos >= region.from && cursorPos <= region.to)
            result.activeRegions.push_back(region);
    }

    std::vector<Decoration> decorations;
    decorations.reserve(result.syntaxRegions.size() + result.mathInlineRegions.size() * 2);

    if (sourceView)
    {
        for (const auto &region : result.syntaxRegions)
            decorations.push_back(inlineDecoration(region.from, region.to, DecorationStyle::SyntaxVisible));
        result.decorations = DecorationSet(std::move(decorations));
        return result;
    }

    std::vector<SemanticRegion> activeSemantic = activeSemanticRegions(doc, cursorPos);
    for (const auto &region : result.syntaxRegions)
    {
        if (isMarkerShown(region, cursorPos, activeSemantic))
        {
            decorations.push_back(inlineDecoration(region.from, region.to, DecorationStyle::SyntaxVisible));
            continue;
        }
        std::size_t hideTo = region.to;
        if (region.syntaxType == SyntaxType::Heading)
        {
            std::size_t hashes = leadingHashes(doc, region);
            if (hashes > 0)
                hideTo = region.from + hashes;
        }
        decorations.push_back(inlineDecoration(region.from, hideTo, DecorationStyle::SyntaxHidden));
    }

    if (mathRenderer)
    {
        for (const auto &math : result.mathInlineRegions)
        {
            bool cursorInMath = cursorPos >= math.from && cursorPos <= math.to;
            if (cursorInMath || isBlank(math.content))
                continue;
            decorations.push_back(inlineDecoration(math.from, math.to, DecorationStyle::MathSourceHidden));

            std::string rendered = mathRenderer->render(math.content);
            if (rendered.empty())
                continue;
            Decoration widget;
            widget.kind = DecorationKind::Widget;
            widget.from = math.to;
            widget.to = math.to;
            widget.style = DecorationStyle::MathRendered;
            widget.widgetContent = std::move(rendered);
            widget.side = -1;
            decorations.push_back(std::move(widget));
        }
    }

    result.decorations = DecorationSet(std::move(decorations));
    return result;
}

} // namespace mk::edit
