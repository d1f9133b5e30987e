#pragma once

#include "mk/edit/decorations.hpp"
#include "mk/edit/document.hpp"
#include "mk/edit/editor_settings.hpp"
#include "mk/edit/markdown_parser.hpp"
#include "mk/edit/regions.hpp"
#include "mk/edit/source_view_transform.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::edit
{

// One state change. A missing document or selection keeps the current one;
// sourceView requests a view mode.
struct Transaction
{
    std::optional<Node> doc;
    std::optional<std::size_t> selection;
    std::optional<bool> sourceView;
};

using SourceViewListener = std::function<void(bool sourceView)>;

// The state of one editing session: document, cursor, view mode and the
// decorations derived from them.
//
// Regions are scanned again only when a transaction changes the document or
// toggles the view mode; cursor moves reuse the cached regions. Toggling the
// mode rewrites the whole document inside the same dispatch and notifies the
// subscribed listeners once.
class EditorSession
{
public:
    explicit EditorSession(EditorSettings settings = {}, MathRenderer *mathRenderer = nullptr,
                           std::shared_ptr<BlockIdGenerator> ids = nullptr);

    const Node &doc() const noexcept { return document; }
    std::size_t selection() const noexcept { return selectionHead; }
    bool isSourceView() const noexcept { return sourceView; }
    const EditorSettings &settings() const noexcept { return editorSettings; }

    const DecorationResult &decorationState() const noexcept { return current; }
    const DecorationSet &decorations() const noexcept { return current.decorations; }
    const std::vector<SyntaxMarkerRegion> &activeRegions() const noexcept { return current.activeRegions; }
    // Number of full region scans so far.
    std::size_t regionScanCount() const noexcept { return scans; }

    void dispatch(Transaction transaction);

    // Replaces the document with parsed Markdown and puts the cursor at the
    // start of the first textblock.
    void setMarkdown(std::string_view markdown);
    void setSelection(std::size_t pos);
    void insertText(std::size_t pos, std::string_view text);
    void deleteRange(std::size_t from, std::size_t to);
    void toggleSourceView();
    void setSourceView(bool enabled);
    void paste(std::string_view text);

    std::string markdown() const;

    std::size_t subscribe(SourceViewListener listener);
    void unsubscribe(std::size_t id);

private:
    void rescan();
    void notifyListeners();
    void insertParsedBlocks(std::vector<Node> blocks);

    EditorSettings editorSettings;
    MarkdownParser parser;
    SourceViewTransform transform;
    DecorationEngine engine;

    Node document{NodeType::Doc};
    std::size_t selectionHead = 0;
    bool sourceView = false;

    std::vector<SyntaxMarkerRegion> cachedSyntaxRegions;
    std::vector<MathInlineRegion> cachedMathRegions;
    DecorationResult current;
    std::size_t scans = 0;

    std::map<std::size_t, SourceViewListener> listeners;
    std::size_t nextListenerId = 1;
};

} // namespace mk::edit
