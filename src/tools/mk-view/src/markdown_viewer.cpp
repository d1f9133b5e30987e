#include "mk/view/markdown_viewer.hpp"

#include "mk/edit/markdown_syntax.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <plog/Log.h>
#include <set>
#include <sstream>

#define cpDocumentView "\x06\x07"

namespace mk::view
{

std::optional<std::string> readMarkdownFile(const std::filesystem::path &path, std::string &error)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        error = "Cannot open " + path.string();
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
        error = "Cannot read " + path.string();
        return std::nullopt;
    }
    return edit::normalizeLineEndings(buffer.str());
}

class ViewerStatusLine : public TStatusLine
{
public:
    explicit ViewerStatusLine(TRect r)
        : TStatusLine(r, *new TStatusDef(0, 0xFFFF,
                                         new TStatusItem("~F2~ Source view", kbF2, cmToggleSourceView,
                                                         new TStatusItem("~F10~ Exit", kbF10, cmQuit,
                                                                         new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit)))))
    {
    }

    void setMessage(std::string text)
    {
        if (text == message)
            return;
        message = std::move(text);
        drawView();
    }

    const char *hint(ushort) override
    {
        return message.c_str();
    }

private:
    std::string message;
};

DocumentView::DocumentView(const TRect &bounds, edit::EditorSession &session) noexcept
    : TView(bounds), session(session)
{
    growMode = gfGrowHiX | gfGrowHiY;
    options |= ofSelectable;
    rebuildLayout();
    showCursor();
}

TPalette &DocumentView::getPalette() const
{
    static TPalette palette(cpDocumentView, sizeof(cpDocumentView) - 1);
    return palette;
}

void DocumentView::rebuildLayout()
{
    lines = edit::layoutDocument(session.doc(), session.decorations());
    positions = edit::cursorPositions(session.doc());
}

void DocumentView::refresh()
{
    rebuildLayout();
    scrollToCursor();
    drawView();
    if (statusLine)
        statusLine->setMessage(statusText());
}

std::string DocumentView::statusText() const
{
    std::string text = session.isSourceView() ? "Source" : "Formatted";
    text += "  Pos " + std::to_string(session.selection());

    std::set<edit::SyntaxType> active;
    for (const auto &region : session.activeRegions())
        active.insert(region.syntaxType);
    if (!active.empty())
    {
        text += "  [";
        bool first = true;
        for (edit::SyntaxType type : active)
        {
            if (!first)
                text += ", ";
            text += edit::syntaxTypeName(type);
            first = false;
        }
        text += "]";
    }
    return text;
}

TColorAttr DocumentView::spanAttr(const edit::DisplaySpan &span, TColorAttr normal, TColorAttr marker,
                                  TColorAttr rendered) const
{
    if (span.widget)
        return rendered;
    if (span.decoration)
        return marker;

    TColorAttr attr = edit::hasMark(span.marks, edit::MarkType::SyntaxMarker) ? marker : normal;
    ushort style = getStyle(attr);
    if (edit::hasMark(span.marks, edit::MarkType::Strong))
        style |= slBold;
    if (edit::hasMark(span.marks, edit::MarkType::Emphasis))
        style |= slItalic;
    if (edit::hasMark(span.marks, edit::MarkType::Strikethrough))
        style |= slStrike;
    if (edit::hasMark(span.marks, edit::MarkType::Link))
        style |= slUnderline;
    if (edit::hasMark(span.marks, edit::MarkType::Highlight) || edit::hasMark(span.marks, edit::MarkType::CodeInline))
        style |= slReverse;
    setStyle(attr, style);
    return attr;
}

void DocumentView::draw()
{
    const auto colors = getColor(0x0201);
    const TColorAttr normalAttr = colors[0];
    const TColorAttr markerAttr = colors[1];
    TColorAttr renderedAttr = normalAttr;
    setStyle(renderedAttr, getStyle(renderedAttr) | slItalic);

    for (int row = 0; row < size.y; ++row)
    {
        TDrawBuffer buffer;
        buffer.moveChar(0, ' ', normalAttr, size.x);
        std::size_t index = static_cast<std::size_t>(topLine + row);
        if (index < lines.size())
        {
            ushort x = 0;
            for (const auto &span : lines[index].spans)
            {
                if (x >= size.x)
                    break;
                TColorAttr attr = spanAttr(span, normalAttr, markerAttr, renderedAttr);
                x += buffer.moveStr(x, TStringView(span.text.data(), span.text.size()), attr);
            }
        }
        writeLine(0, row, size.x, 1, buffer);
    }

    std::size_t lineIndex = edit::lineIndexOf(lines, session.selection());
    if (lineIndex < lines.size())
    {
        int column = static_cast<int>(lines[lineIndex].columnOf(session.selection()));
        setCursor(std::min(column, size.x - 1), static_cast<int>(lineIndex) - topLine);
    }
}

void DocumentView::scrollToCursor()
{
    int lineIndex = static_cast<int>(edit::lineIndexOf(lines, session.selection()));
    if (lineIndex < topLine)
        topLine = lineIndex;
    else if (lineIndex >= topLine + size.y)
        topLine = lineIndex - size.y + 1;
    topLine = std::max(topLine, 0);
}

void DocumentView::moveHorizontally(int direction)
{
    if (positions.empty())
        return;
    auto it = std::lower_bound(positions.begin(), positions.end(), session.selection());
    if (direction > 0)
    {
        if (it != positions.end() && *it == session.selection())
            ++it;
        if (it == positions.end())
            return;
    }
    else
    {
        if (it == positions.begin())
            return;
        --it;
    }
    goalColumn.reset();
    session.setSelection(*it);
    refresh();
}

void DocumentView::moveVertically(int delta)
{
    if (lines.empty())
        return;
    std::size_t current = edit::lineIndexOf(lines, session.selection());
    std::size_t column = goalColumn.value_or(lines[current].columnOf(session.selection()));

    int target = static_cast<int>(current);
    int step = delta > 0 ? 1 : -1;
    int remaining = std::abs(delta);
    int candidate = target;
    while (remaining > 0)
    {
        candidate += step;
        if (candidate < 0 || candidate >= static_cast<int>(lines.size()))
            break;
        if (!lines[static_cast<std::size_t>(candidate)].hasText)
            continue;
        target = candidate;
        --remaining;
    }
    if (target == static_cast<int>(current))
        return;

    session.setSelection(lines[static_cast<std::size_t>(target)].positionAt(column));
    goalColumn = column;
    refresh();
}

void DocumentView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);
    if (event.what != evKeyDown)
        return;

    switch (event.keyDown.keyCode)
    {
    case kbLeft:
        moveHorizontally(-1);
        break;
    case kbRight:
        moveHorizontally(1);
        break;
    case kbUp:
        moveVertically(-1);
        break;
    case kbDown:
        moveVertically(1);
        break;
    case kbPgUp:
        moveVertically(-std::max(1, size.y - 1));
        break;
    case kbPgDn:
        moveVertically(std::max(1, size.y - 1));
        break;
    case kbHome:
        if (!lines.empty())
        {
            goalColumn.reset();
            session.setSelection(lines[edit::lineIndexOf(lines, session.selection())].from);
            refresh();
        }
        break;
    case kbEnd:
        if (!lines.empty())
        {
            goalColumn.reset();
            session.setSelection(lines[edit::lineIndexOf(lines, session.selection())].to);
            refresh();
        }
        break;
    default:
        return;
    }
    clearEvent(event);
}

ViewerWindow::ViewerWindow(const TRect &bounds, const std::string &title, edit::EditorSession &session) noexcept
    : TWindowInit(&TWindow::initFrame), TWindow(bounds, title.c_str(), wnNoNumber)
{
    options |= ofTileable;
    TRect inner = getExtent();
    inner.grow(-1, -1);
    view = new DocumentView(inner, session);
    insert(view);
}

MarkdownViewerApp::MarkdownViewerApp(std::unique_ptr<edit::EditorSession> session, std::string title,
                                     std::optional<std::string> startupMessage)
    : TProgInit(&MarkdownViewerApp::initStatusLine, &MarkdownViewerApp::initMenuBar, &TApplication::initDeskTop),
      TApplication(),
      session(std::move(session))
{
    window = new ViewerWindow(deskTop->getExtent(), title, *this->session);
    deskTop->insert(window);
    if (auto *line = dynamic_cast<ViewerStatusLine *>(statusLine))
        window->documentView()->setStatusLine(line);

    listenerId = this->session->subscribe([this](bool sourceView) {
        PLOG_DEBUG << "View mode changed, source view " << (sourceView ? "on" : "off");
        if (window)
            window->documentView()->refresh();
    });

    if (startupMessage)
    {
        if (auto *line = dynamic_cast<ViewerStatusLine *>(statusLine))
            line->setMessage(*startupMessage);
    }
}

MarkdownViewerApp::~MarkdownViewerApp()
{
    session->unsubscribe(listenerId);
    window = nullptr;
}

void MarkdownViewerApp::refreshStatus()
{
    if (!window)
        return;
    if (auto *line = dynamic_cast<ViewerStatusLine *>(statusLine))
        line->setMessage(window->documentView()->statusText());
}

void MarkdownViewerApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case cmToggleSourceView:
        session->toggleSourceView();
        refreshStatus();
        clearEvent(event);
        break;
    default:
        break;
    }
}

TMenuBar *MarkdownViewerApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    return new TMenuBar(r,
                        *new TSubMenu("~F~ile", kbAltF) + *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X") +
                            *new TSubMenu("~V~iew", kbAltV) +
                            *new TMenuItem("~S~ource view", cmToggleSourceView, kbF2, hcNoContext, "F2"));
}

TStatusLine *MarkdownViewerApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new ViewerStatusLine(r);
}

} // namespace mk::view
