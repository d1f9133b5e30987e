#pragma once

#include "mk/config/option_registry.hpp"

#include <string>

namespace mk::edit
{

extern const char *const kOptionStartInSourceView;
extern const char *const kOptionRenderInlineMath;
extern const char *const kOptionParsePastedMarkdown;
extern const char *const kOptionLogLevel;

struct EditorSettings
{
    bool startInSourceView = false;
    bool renderInlineMath = true;
    bool parsePastedMarkdown = true;
    std::string logLevel = "warning";
};

void registerEditorOptions(config::OptionRegistry &registry);
EditorSettings loadEditorSettings(const config::OptionRegistry &registry);

} // namespace mk::edit
