#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Owns config.toml and hands each registered section to its handler.
 *
 * Handlers run on every successful load with the table at their dotted path,
 * or an empty table when the path is absent, so a handler always rebuilds its
 * settings from defaults plus whatever the file sets. Top-level keys no
 * root handler owns are logged once per load (typos like [matchng]).
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // Fails when a key in ownedKeys is already owned by a handler at the same path
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error; handlers see empty tables
    bool load();

    bool loadFromString(std::string_view text, std::string_view source = "<string>");

    // Reloads when the file's write time moved; a broken revision is skipped until it changes again
    bool reloadIfChanged();

    const toml::table& root() const;

    // Top-level keys from the last load that no root handler claimed
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    bool apply(toml::table parsed);
    void dispatch();
    void collectUnknownKeys();
    void reportParseError(const toml::parse_error& pe, std::string_view source);
    const toml::table* sectionAt(const std::string& path) const;
    std::optional<std::filesystem::file_time_type> writeTime() const;

    std::string config_path_;
    std::string last_error_;
    std::optional<std::filesystem::file_time_type> seen_write_time_;
    std::vector<HandlerEntry> handlers_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};
