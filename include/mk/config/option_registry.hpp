#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mk::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

std::string_view optionKindName(OptionKind kind) noexcept;

// Converts raw to the JSON shape of kind. Strings are parsed for booleans
// ("on", "yes", "1", ...) and integers; a lone string becomes a one-item
// list. Returns std::nullopt when raw has no representation in kind.
std::optional<nlohmann::json> coerceOptionValue(OptionKind kind, const nlohmann::json &raw);

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    nlohmann::json defaultValue;
    std::string description;
};

// Typed options of one application, persisted as a flat JSON object under
// <config-root>/<app-id>/.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    // The default is coerced to the declared kind; re-registering a key keeps
    // a stored override when it still fits the new kind.
    void registerOption(OptionDefinition definition);
    bool hasOption(const std::string &key) const noexcept;
    const OptionDefinition *definition(const std::string &key) const noexcept;

    // False when the key is unknown or the value does not fit its kind; the
    // previous value is kept in both cases.
    bool set(const std::string &key, const nlohmann::json &value);
    void reset(const std::string &key);
    bool isOverridden(const std::string &key) const noexcept;

    // Throws std::out_of_range for an unregistered key.
    const nlohmann::json &value(const std::string &key) const;

    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    // Applies "key=value" assignments as given with --set. List options take
    // a comma separated value. Returns the assignments that were not applied.
    std::vector<std::string> applyAssignments(const std::vector<std::string> &assignments);

    nlohmann::json toJson() const;
    bool loadFromString(std::string_view text);
    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    std::filesystem::path appDirectory() const;
    std::filesystem::path defaultOptionsPath() const;

    // $XDG_CONFIG_HOME/mk-edit, else $HOME/.config/mk-edit.
    static std::filesystem::path configRoot();

private:
    struct Entry
    {
        OptionDefinition definition;
        std::optional<nlohmann::json> override;
    };

    const Entry *findEntry(const std::string &key) const noexcept;

    std::string id;
    std::map<std::string, Entry> entries;
};

} // namespace mk::config
