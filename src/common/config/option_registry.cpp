#include "mk/config/option_registry.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <plog/Log.h>
#include <stdexcept>
#include <system_error>

namespace mk::config
{
namespace
{

std::string trim(std::string_view text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::optional<bool> parseBool(std::string_view text)
{
    std::string lower;
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "on" || lower == "yes" || lower == "1")
        return true;
    if (lower == "false" || lower == "off" || lower == "no" || lower == "0")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(std::string_view text)
{
    std::int64_t parsed = 0;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if (ec != std::errc() || ptr != end || text.empty())
        return std::nullopt;
    return parsed;
}

nlohmann::json emptyValue(OptionKind kind)
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return false;
    case OptionKind::Integer:
        return std::int64_t{0};
    case OptionKind::String:
        return std::string();
    case OptionKind::StringList:
        break;
    }
    return nlohmann::json::array();
}

nlohmann::json splitList(std::string_view text)
{
    nlohmann::json items = nlohmann::json::array();
    std::size_t start = 0;
    while (start <= text.size())
    {
        std::size_t comma = text.find(',', start);
        if (comma == std::string_view::npos)
            comma = text.size();
        std::string item = trim(text.substr(start, comma - start));
        if (!item.empty())
            items.push_back(item);
        start = comma + 1;
    }
    return items;
}

} // namespace

std::string_view optionKindName(OptionKind kind) noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return "boolean";
    case OptionKind::Integer:
        return "integer";
    case OptionKind::String:
        return "string";
    case OptionKind::StringList:
        return "string list";
    }
    return "unknown";
}

std::optional<nlohmann::json> coerceOptionValue(OptionKind kind, const nlohmann::json &raw)
{
    switch (kind)
    {
    case OptionKind::Boolean:
        if (raw.is_boolean())
            return raw;
        if (raw.is_number_integer())
            return raw.get<std::int64_t>() != 0;
        if (raw.is_string())
        {
            if (auto parsed = parseBool(raw.get<std::string>()))
                return *parsed;
        }
        break;
    case OptionKind::Integer:
        if (raw.is_number_integer())
            return raw.get<std::int64_t>();
        if (raw.is_boolean())
            return raw.get<bool>() ? std::int64_t{1} : std::int64_t{0};
        if (raw.is_string())
        {
            if (auto parsed = parseInteger(raw.get<std::string>()))
                return *parsed;
        }
        break;
    case OptionKind::String:
        if (raw.is_string())
            return raw;
        if (raw.is_boolean())
            return std::string(raw.get<bool>() ? "true" : "false");
        if (raw.is_number_integer())
            return std::to_string(raw.get<std::int64_t>());
        break;
    case OptionKind::StringList:
        if (raw.is_string())
            return nlohmann::json::array({raw});
        if (raw.is_array())
        {
            for (const auto &item : raw)
            {
                if (!item.is_string())
                    return std::nullopt;
            }
            return raw;
        }
        break;
    }
    return std::nullopt;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(OptionDefinition definition)
{
    if (auto coerced = coerceOptionValue(definition.kind, definition.defaultValue))
    {
        definition.defaultValue = std::move(*coerced);
    }
    else
    {
        PLOG_WARNING << "Default of option " << definition.key << " is not a " << optionKindName(definition.kind);
        definition.defaultValue = emptyValue(definition.kind);
    }

    Entry &entry = entries[definition.key];
    if (entry.override)
        entry.override = coerceOptionValue(definition.kind, *entry.override);
    entry.definition = std::move(definition);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return findEntry(key) != nullptr;
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const noexcept
{
    const Entry *entry = findEntry(key);
    return entry ? &entry->definition : nullptr;
}

bool OptionRegistry::set(const std::string &key, const nlohmann::json &value)
{
    auto it = entries.find(key);
    if (it == entries.end())
        return false;
    std::optional<nlohmann::json> coerced = coerceOptionValue(it->second.definition.kind, value);
    if (!coerced)
        return false;
    it->second.override = std::move(coerced);
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    auto it = entries.find(key);
    if (it != entries.end())
        it->second.override.reset();
}

bool OptionRegistry::isOverridden(const std::string &key) const noexcept
{
    const Entry *entry = findEntry(key);
    return entry && entry->override.has_value();
}

const nlohmann::json &OptionRegistry::value(const std::string &key) const
{
    const Entry *entry = findEntry(key);
    if (!entry)
        throw std::out_of_range("unknown option: " + key);
    return entry->override ? *entry->override : entry->definition.defaultValue;
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    if (!hasOption(key))
        return fallback;
    std::optional<nlohmann::json> coerced = coerceOptionValue(OptionKind::Boolean, value(key));
    return coerced ? coerced->get<bool>() : fallback;
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    if (!hasOption(key))
        return fallback;
    std::optional<nlohmann::json> coerced = coerceOptionValue(OptionKind::Integer, value(key));
    return coerced ? coerced->get<std::int64_t>() : fallback;
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    if (!hasOption(key))
        return fallback;
    std::optional<nlohmann::json> coerced = coerceOptionValue(OptionKind::String, value(key));
    return coerced ? coerced->get<std::string>() : fallback;
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    if (!hasOption(key))
        return {};
    std::optional<nlohmann::json> coerced = coerceOptionValue(OptionKind::StringList, value(key));
    return coerced ? coerced->get<std::vector<std::string>>() : std::vector<std::string>();
}

std::vector<std::string> OptionRegistry::applyAssignments(const std::vector<std::string> &assignments)
{
    std::vector<std::string> rejected;
    for (const auto &assignment : assignments)
    {
        std::string_view text(assignment);
        std::size_t equal = text.find('=');
        if (equal == std::string_view::npos)
        {
            rejected.push_back(assignment);
            continue;
        }
        std::string key = trim(text.substr(0, equal));
        std::string raw = trim(text.substr(equal + 1));
        const OptionDefinition *target = definition(key);
        bool applied = false;
        if (target)
            applied = set(key, target->kind == OptionKind::StringList ? splitList(raw) : nlohmann::json(raw));
        if (!applied)
            rejected.push_back(assignment);
    }
    return rejected;
}

nlohmann::json OptionRegistry::toJson() const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, entry] : entries)
        data[key] = entry.override ? *entry.override : entry.definition.defaultValue;
    return data;
}

bool OptionRegistry::loadFromString(std::string_view text)
{
    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(text.begin(), text.end());
    }
    catch (const nlohmann::json::parse_error &error)
    {
        PLOG_WARNING << "Options for " << id << " are not valid JSON: " << error.what();
        return false;
    }
    if (!data.is_object())
    {
        PLOG_WARNING << "Options for " << id << " must be a JSON object";
        return false;
    }

    for (const auto &[key, raw] : data.items())
    {
        if (!hasOption(key))
        {
            PLOG_DEBUG << "Ignoring unknown option " << key;
            continue;
        }
        if (!set(key, raw))
            PLOG_WARNING << "Ignoring invalid value for option " << key << ": " << raw.dump();
    }
    return true;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
    {
        PLOG_WARNING << "Cannot open options file " << filePath.string();
        return false;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return loadFromString(contents);
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
    {
        PLOG_ERROR << "Cannot write options to " << filePath.string();
        return false;
    }
    out << toJson().dump(4) << '\n';
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::error_code ec;
    std::filesystem::path path = defaultOptionsPath();
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

std::filesystem::path OptionRegistry::appDirectory() const
{
    return configRoot() / id;
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return appDirectory() / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return std::filesystem::path(xdg) / "mk-edit";
    const char *home = std::getenv("HOME");
    if (home && *home)
        return std::filesystem::path(home) / ".config" / "mk-edit";
    return std::filesystem::path(".config") / "mk-edit";
}

const OptionRegistry::Entry *OptionRegistry::findEntry(const std::string &key) const noexcept
{
    auto it = entries.find(key);
    return it == entries.end() ? nullptr : &it->second;
}

} // namespace mk::config
