#include "mk/view/markdown_viewer.hpp"

#include "mk/edit/editor_settings.hpp"
#include "mk/edit/unicode_math_renderer.hpp"
#include "mk/config/option_registry.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Log.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef MK_VIEW_VERSION
#define MK_VIEW_VERSION "0.0.0"
#endif

namespace
{

constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr int kMaxLogFiles = 3;

void printHelp()
{
    std::cout << mk::view::kAppName << " " << MK_VIEW_VERSION << " - " << mk::view::kAppShortDescription << "\n\n"
              << "Usage: " << mk::view::kAppName << " [options] [FILE]\n"
              << "  --source                 Start in source view\n"
              << "  --set KEY=VALUE          Override an option for this run\n"
              << "  --load-options FILE      Load options from FILE\n"
              << "  --no-default-options     Do not load saved defaults\n\n"
              << "Keys: arrows move the cursor, F2 toggles source view, F10 or Alt-X quits." << std::endl;
}

bool isHelpFlag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

void initLogging(const mk::config::OptionRegistry &registry, const std::string &level)
{
    plog::Severity severity = plog::severityFromString(level.c_str());
    if (severity == plog::none)
        return;

    std::filesystem::path directory = registry.appDirectory();
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        std::cerr << mk::view::kAppName << ": cannot create " << directory.string() << ": " << ec.message()
                  << std::endl;
        return;
    }
    std::string logFile = (directory / "mk-view.log").string();
    plog::init(severity, logFile.c_str(), kMaxLogFileSize, kMaxLogFiles);
}

} // namespace

int main(int argc, char **argv)
{
    mk::config::OptionRegistry registry{std::string(mk::view::kAppId)};
    mk::edit::registerEditorOptions(registry);

    bool loadDefaults = true;
    bool sourceViewFlag = false;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::string> assignments;
    std::optional<std::filesystem::path> file;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (isHelpFlag(arg))
        {
            printHelp();
            return 0;
        }
        else if (arg == "--source")
        {
            sourceViewFlag = true;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "--set" || arg == "--load-options")
        {
            if (i + 1 >= argc)
            {
                std::cerr << mk::view::kAppName << ": " << arg << " requires a value" << std::endl;
                return 1;
            }
            if (arg == "--set")
                assignments.emplace_back(argv[++i]);
            else
                optionFiles.emplace_back(argv[++i]);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << mk::view::kAppName << ": unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else if (file)
        {
            std::cerr << mk::view::kAppName << ": only one file can be viewed at a time" << std::endl;
            return 1;
        }
        else
        {
            file = arg;
        }
    }

    std::vector<std::string> warnings;
    std::error_code ec;
    if (loadDefaults && std::filesystem::exists(registry.defaultOptionsPath(), ec) && !registry.loadDefaults())
        warnings.push_back("Saved defaults could not be read");
    for (const auto &path : optionFiles)
    {
        if (!registry.loadFromFile(path))
        {
            std::cerr << mk::view::kAppName << ": failed to load options from '" << path.string() << "'"
                      << std::endl;
            return 1;
        }
    }
    std::vector<std::string> rejected = registry.applyAssignments(assignments);
    if (!rejected.empty())
    {
        std::cerr << mk::view::kAppName << ": invalid option assignment '" << rejected.front() << "'" << std::endl;
        return 1;
    }

    mk::edit::EditorSettings settings = mk::edit::loadEditorSettings(registry);
    if (sourceViewFlag)
        settings.startInSourceView = true;

    initLogging(registry, settings.logLevel);
    PLOG_INFO << mk::view::kAppName << " starting";
    for (const auto &warning : warnings)
        PLOG_WARNING << warning;

    mk::edit::UnicodeMathRenderer mathRenderer;
    auto session = std::make_unique<mk::edit::EditorSession>(settings, &mathRenderer);

    std::string title = "untitled";
    std::optional<std::string> startupMessage;
    if (file)
    {
        title = file->filename().string();
        std::string error;
        if (std::optional<std::string> text = mk::view::readMarkdownFile(*file, error))
        {
            session->setMarkdown(*text);
        }
        else
        {
            PLOG_ERROR << error;
            startupMessage = error;
        }
    }

    mk::view::MarkdownViewerApp app(std::move(session), title, startupMessage);
    app.run();
    app.shutDown();
    return 0;
}
