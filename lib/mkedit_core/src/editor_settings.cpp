#include "mk/edit/editor_settings.hpp"

namespace mk::edit
{

const char *const kOptionStartInSourceView = "startInSourceView";
const char *const kOptionRenderInlineMath = "renderInlineMath";
const char *const kOptionParsePastedMarkdown = "parsePastedMarkdown";
const char *const kOptionLogLevel = "logLevel";

void registerEditorOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionStartInSourceView, config::OptionKind::Boolean, false,
                             "Open documents showing raw Markdown for code blocks, tables, HTML and math."});
    registry.registerOption({kOptionRenderInlineMath, config::OptionKind::Boolean, true,
                             "Replace $...$ formulas outside the cursor with their rendered form."});
    registry.registerOption({kOptionParsePastedMarkdown, config::OptionKind::Boolean, true,
                             "Turn pasted text containing Markdown syntax into formatted blocks."});
    registry.registerOption({kOptionLogLevel, config::OptionKind::String, "warning",
                             "Minimum severity written to the log file (none, fatal, error, warning, info, debug, "
                             "verbose)."});
}

EditorSettings loadEditorSettings(const config::OptionRegistry &registry)
{
    EditorSettings defaults;
    EditorSettings settings;
    settings.startInSourceView = registry.getBool(kOptionStartInSourceView, defaults.startInSourceView);
    settings.renderInlineMath = registry.getBool(kOptionRenderInlineMath, defaults.renderInlineMath);
    settings.parsePastedMarkdown = registry.getBool(kOptionParsePastedMarkdown, defaults.parsePastedMarkdown);
    settings.logLevel = registry.getString(kOptionLogLevel, defaults.logLevel);
    return settings;
}

} // namespace mk::edit
