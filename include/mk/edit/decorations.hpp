#pragma once

#include "mk/edit/document.hpp"
#include "mk/edit/regions.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

// Renders the literal text of an inline formula for display. Implementations
// should return quickly (cache if rendering is expensive); an empty result
// means nothing is shown in place of the hidden source.
class MathRenderer
{
public:
    virtual ~MathRenderer() = default;
    virtual std::string render(std::string_view formula) = 0;
};

enum class DecorationKind
{
    Inline,
    Widget
};

enum class DecorationStyle
{
    SyntaxVisible,
    SyntaxHidden,
    MathSourceHidden,
    MathRendered
};

std::string_view decorationClassName(DecorationStyle style) noexcept;

struct Decoration
{
    DecorationKind kind = DecorationKind::Inline;
    std::size_t from = 0;
    std::size_t to = 0;
    DecorationStyle style = DecorationStyle::SyntaxVisible;
    std::string widgetContent; // Widget only
    int side = 0;              // Widget only; negative binds to the text before

    bool operator==(const Decoration &other) const noexcept;
};

class DecorationSet
{
public:
    DecorationSet() = default;
    explicit DecorationSet(std::vector<Decoration> decorations);

    const std::vector<Decoration> &items() const noexcept { return entries; }
    bool empty() const noexcept { return entries.empty(); }
    std::size_t size() const noexcept { return entries.size(); }

    // Inline decorations overlapping [from, to).
    std::vector<Decoration> find(std::size_t from, std::size_t to) const;
    std::vector<Decoration> widgetsAt(std::size_t pos) const;
    // Whether the character starting at pos is hidden.
    bool isHidden(std::size_t pos) const noexcept;
    bool isVisibleMarker(std::size_t from, std::size_t to) const noexcept;

    bool operator==(const DecorationSet &other) const noexcept { return entries == other.entries; }

private:
    std::vector<Decoration> entries;
};

struct DecorationResult
{
    DecorationSet decorations;
    std::vector<SyntaxMarkerRegion> activeRegions;
    std::vector<SyntaxMarkerRegion> syntaxRegions;
    std::vector<MathInlineRegion> mathInlineRegions;
};

// Decides per cursor position which syntax markers are shown and replaces
// inline math outside the cursor by rendered fragments. Passing previously
// scanned regions skips the tree scans; the result is the same as scanning.
class DecorationEngine
{
public:
    explicit DecorationEngine(MathRenderer *mathRenderer = nullptr);

    void setMathRenderer(MathRenderer *renderer) noexcept { mathRenderer = renderer; }
    MathRenderer *renderer() const noexcept { return mathRenderer; }

    DecorationResult computeDecorations(const Node &doc, std::size_t cursorPos, bool sourceView,
                                        const std::vector<SyntaxMarkerRegion> *cachedSyntaxRegions = nullptr,
                                        const std::vector<MathInlineRegion> *cachedMathRegions = nullptr) const;

    static bool isMarkerShown(const SyntaxMarkerRegion &region, std::size_t cursorPos,
                              const std::vector<SemanticRegion> &activeSemantic) noexcept;

private:
    MathRenderer *mathRenderer;
};

} // namespace mk::edit
