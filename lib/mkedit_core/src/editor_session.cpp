#include "mk/edit/editor_session.hpp"

#include "mk/edit/markdown_serializer.hpp"
#include "mk/edit/markdown_syntax.hpp"
#include "mk/edit/paste.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace mk::edit
{
namespace
{
std::optional<std::size_t> firstTextPosition(const Node &doc)
{
    std::optional<std::size_t> first;
    forEachTextblock(doc, [&first](const Node &, std::size_t contentStart) {
        if (!first)
            first = contentStart;
    });
    return first;
}

// End of the last textblock that ends at or before limit.
std::optional<std::size_t> lastTextPositionBefore(const Node &doc, std::size_t limit)
{
    std::optional<std::size_t> last;
    forEachTextblock(doc, [&last, limit](const Node &textblock, std::size_t contentStart) {
        std::size_t contentEnd = contentStart + textblock.contentSize();
        if (contentEnd <= limit)
            last = contentEnd;
    });
    return last;
}

} // namespace

EditorSession::EditorSession(EditorSettings settings, MathRenderer *mathRenderer,
                             std::shared_ptr<BlockIdGenerator> ids)
    : editorSettings(std::move(settings)),
      transform(std::move(ids)),
      engine(editorSettings.renderInlineMath ? mathRenderer : nullptr),
      document(parser.parse("").doc),
      sourceView(editorSettings.startInSourceView)
{
    selectionHead = firstTextPosition(document).value_or(0);
    rescan();
    current = engine.computeDecorations(document, selectionHead, sourceView, &cachedSyntaxRegions,
                                        &cachedMathRegions);
}

void EditorSession::dispatch(Transaction transaction)
{
    bool docChanged = transaction.doc.has_value();
    bool toggled = transaction.sourceView && *transaction.sourceView != sourceView;

    if (toggled)
    {
        const Node &base = docChanged ? *transaction.doc : document;
        Node replaced = *transaction.sourceView ? transform.toFlattened(base) : transform.toStructured(base);
        document = std::move(replaced);
        sourceView = *transaction.sourceView;
        PLOG_INFO << (sourceView ? "Switched to source view" : "Switched to formatted view");
    }
    else if (docChanged)
    {
        if (sourceView && SourceViewTransform::containsStructuredBlocks(*transaction.doc))
        {
            PLOG_INFO << "Reloaded document contains structured blocks; flattening for source view";
            document = transform.toFlattened(*transaction.doc);
        }
        else
        {
            document = std::move(*transaction.doc);
        }
    }

    if (transaction.selection)
        selectionHead = *transaction.selection;
    selectionHead = std::min(selectionHead, document.contentSize());

    if (docChanged || toggled)
        rescan();
    current = engine.computeDecorations(document, selectionHead, sourceView, &cachedSyntaxRegions,
                                        &cachedMathRegions);

    if (toggled)
        notifyListeners();
}

void EditorSession::rescan()
{
    cachedSyntaxRegions = findSyntaxMarkerRegions(document);
    cachedMathRegions = findMathInlineRegions(document);
    ++scans;
    PLOG_DEBUG << "Region scan " << scans << ": " << cachedSyntaxRegions.size() << " syntax, "
               << cachedMathRegions.size() << " math";
}

void EditorSession::notifyListeners()
{
    // A listener may unsubscribe while being notified.
    auto snapshot = listeners;
    for (const auto &[id, listener] : snapshot)
        listener(sourceView);
}

void EditorSession::setMarkdown(std::string_view markdown)
{
    Transaction transaction;
    transaction.doc = parser.parse(markdown).doc;
    PLOG_INFO << "Loaded " << markdown.size() << " bytes of Markdown";
    dispatch(std::move(transaction));
    setSelection(firstTextPosition(document).value_or(0));
}

void EditorSession::setSelection(std::size_t pos)
{
    Transaction transaction;
    transaction.selection = pos;
    dispatch(std::move(transaction));
}

void EditorSession::insertText(std::size_t pos, std::string_view text)
{
    Node next = document;
    next.insertText(pos, text);
    Transaction transaction;
    transaction.doc = std::move(next);
    transaction.selection = pos + text.size();
    dispatch(std::move(transaction));
}

void EditorSession::deleteRange(std::size_t from, std::size_t to)
{
    Node next = document;
    next.deleteText(from, to);
    Transaction transaction;
    transaction.doc = std::move(next);
    transaction.selection = from;
    dispatch(std::move(transaction));
}

void EditorSession::toggleSourceView()
{
    setSourceView(!sourceView);
}

void EditorSession::setSourceView(bool enabled)
{
    Transaction transaction;
    transaction.sourceView = enabled;
    dispatch(std::move(transaction));
}

void EditorSession::paste(std::string_view text)
{
    if (text.empty())
        return;
    std::string normalized = normalizeLineEndings(text);

    if (sourceView || !editorSettings.parsePastedMarkdown || !containsMarkdownSyntax(normalized))
    {
        if (!resolveTextblock(document, selectionHead))
        {
            PLOG_WARNING << "Paste ignored: cursor " << selectionHead << " is not inside a textblock";
            return;
        }
        insertText(selectionHead, normalized);
        return;
    }

    ParseResult parsed = parser.parse(normalized);
    std::vector<Node> blocks = parsed.doc.children();
    PLOG_DEBUG << "Pasting " << blocks.size() << " parsed blocks";
    insertParsedBlocks(std::move(blocks));
}

// The blocks go after the top-level block holding the cursor, or replace it
// when it is an empty paragraph.
void EditorSession::insertParsedBlocks(std::vector<Node> blocks)
{
    std::size_t index = document.childCount();
    std::size_t offset = 0;
    for (std::size_t i = 0; i < document.childCount(); ++i)
    {
        std::size_t size = document.child(i).nodeSize();
        if (selectionHead >= offset && selectionHead <= offset + size)
        {
            index = i;
            break;
        }
        offset += size;
    }

    Node next = document;
    std::size_t insertAt = index;
    if (index < document.childCount())
    {
        const Node &target = document.child(index);
        if (target.type() == NodeType::Paragraph && target.contentSize() == 0)
        {
            next.removeChild(index);
        }
        else
        {
            insertAt = index + 1;
            offset += target.nodeSize();
        }
    }

    std::size_t insertedEnd = offset;
    for (auto &block : blocks)
    {
        insertedEnd += block.nodeSize();
        next.insertChild(insertAt++, std::move(block));
    }

    Transaction transaction;
    transaction.selection = lastTextPositionBefore(next, insertedEnd).value_or(insertedEnd);
    transaction.doc = std::move(next);
    dispatch(std::move(transaction));
}

std::string EditorSession::markdown() const
{
    if (sourceView)
        return serializeMarkdown(transform.toStructured(document));
    return serializeMarkdown(document);
}

std::size_t EditorSession::subscribe(SourceViewListener listener)
{
    std::size_t id = nextListenerId++;
    listeners.emplace(id, std::move(listener)).first->second(sourceView);
    return id;
}

void EditorSession::unsubscribe(std::size_t id)
{
    listeners.erase(id);
}

} // namespace mk::edit
