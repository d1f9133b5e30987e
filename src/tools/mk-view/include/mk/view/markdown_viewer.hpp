#pragma once

#include "mk/edit/display_layout.hpp"
#include "mk/edit/editor_session.hpp"

#define Uses_TWindow
#define Uses_TFrame
#define Uses_TView
#define Uses_TRect
#define Uses_TEvent
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TMenuBar
#define Uses_TMenu
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TDeskTop
#define Uses_TApplication
#define Uses_TProgram
#define Uses_TKeys
#define Uses_TPalette
#include <tvision/tv.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::view
{

inline constexpr std::string_view kAppId = "mk-view";
inline constexpr std::string_view kAppName = "mk-view";
inline constexpr std::string_view kAppShortDescription = "Markdown viewer with live syntax hiding";

inline constexpr ushort cmToggleSourceView = 3100;

// Reads a file as text with CRLF and CR line endings turned into LF.
std::optional<std::string> readMarkdownFile(const std::filesystem::path &path, std::string &error);

class ViewerStatusLine;

// Draws the decorated document of an EditorSession and moves its cursor.
class DocumentView : public TView
{
public:
    DocumentView(const TRect &bounds, edit::EditorSession &session) noexcept;

    void draw() override;
    void handleEvent(TEvent &event) override;
    TPalette &getPalette() const override;

    void setStatusLine(ViewerStatusLine *line) noexcept { statusLine = line; }
    void refresh();
    std::string statusText() const;

private:
    void rebuildLayout();
    void moveHorizontally(int direction);
    void moveVertically(int lines);
    void scrollToCursor();
    TColorAttr spanAttr(const edit::DisplaySpan &span, TColorAttr normal, TColorAttr marker,
                        TColorAttr rendered) const;

    edit::EditorSession &session;
    ViewerStatusLine *statusLine = nullptr;
    std::vector<edit::DisplayLine> lines;
    std::vector<std::size_t> positions;
    int topLine = 0;
    std::optional<std::size_t> goalColumn;
};

class ViewerWindow : public TWindow
{
public:
    ViewerWindow(const TRect &bounds, const std::string &title, edit::EditorSession &session) noexcept;

    DocumentView *documentView() const noexcept { return view; }

private:
    DocumentView *view = nullptr;
};

class MarkdownViewerApp : public TApplication
{
public:
    MarkdownViewerApp(std::unique_ptr<edit::EditorSession> session, std::string title,
                      std::optional<std::string> startupMessage);
    ~MarkdownViewerApp() override;

    void handleEvent(TEvent &event) override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

private:
    void refreshStatus();

    std::unique_ptr<edit::EditorSession> session;
    ViewerWindow *window = nullptr;
    std::size_t listenerId = 0;
};

} // namespace mk::view
