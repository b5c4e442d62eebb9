#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <fstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , seen_write_time_(writeTime())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        auto clash = std::find_first_of(ownedKeys.begin(), ownedKeys.end(), handler.ownedKeys.begin(),
                                        handler.ownedKeys.end());
        if (clash != ownedKeys.end())
        {
            last_error_ = "config key '" + *clash + "' at '" + path + "' is already owned by another handler";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream in(config_path_, std::ios::binary);
    if (!in)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return apply(toml::table{});
    }

    try
    {
        toml::table parsed = toml::parse(in, config_path_);
        seen_write_time_ = writeTime();
        return apply(std::move(parsed));
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(std::string_view text, std::string_view source)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(text, source));
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, source);
        return false;
    }
}

bool ConfigManager::reloadIfChanged()
{
    auto current = writeTime();
    if (!current || current == seen_write_time_)
        return false;

    if (load())
    {
        PLOG_INFO << "Config reloaded from " << config_path_;
        return true;
    }

    seen_write_time_ = current;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Config reload rejected, previous settings stay active", last_error_);
    return false;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

bool ConfigManager::apply(toml::table parsed)
{
    root_ = std::make_unique<toml::table>(std::move(parsed));
    collectUnknownKeys();
    dispatch();
    return true;
}

void ConfigManager::dispatch()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        if (!handler.callbacks.load)
            continue;
        const toml::table* section = sectionAt(handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

void ConfigManager::collectUnknownKeys()
{
    unknown_keys_.clear();
    bool has_root_handler = false;
    for (const auto& handler : handlers_)
        has_root_handler = has_root_handler || handler.path.empty();
    if (!has_root_handler)
        return;

    for (const auto& [key, node] : *root_)
    {
        (void)node;
        const std::string name(key.str());
        bool owned = std::any_of(handlers_.begin(), handlers_.end(), [&name](const HandlerEntry& h) {
            return h.path.empty() && std::find(h.ownedKeys.begin(), h.ownedKeys.end(), name) != h.ownedKeys.end();
        });
        if (!owned)
        {
            PLOG_WARNING << "Ignoring unknown config key '" << name << "' in " << config_path_;
            unknown_keys_.push_back(name);
        }
    }
}

void ConfigManager::reportParseError(const toml::parse_error& pe, std::string_view source)
{
    const auto& where = pe.source().begin;
    last_error_ = "config parse error in " + std::string(source);
    if (where.line > 0)
        last_error_ += " at " + std::to_string(where.line) + ":" + std::to_string(where.column);
    last_error_ += ": " + std::string(pe.description());

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Config file has errors, keeping previous settings", last_error_);
}

const toml::table* ConfigManager::sectionAt(const std::string& path) const
{
    if (path.empty())
        return root_.get();

    auto node = root_->at_path(path);
    if (node && !node.is_table())
    {
        PLOG_WARNING << "Config entry '" << path << "' is not a table, using defaults";
        return nullptr;
    }
    return node.as_table();
}

std::optional<fs::file_time_type> ConfigManager::writeTime() const
{
    std::error_code ec;
    auto t = fs::last_write_time(config_path_, ec);
    if (ec)
        return std::nullopt;
    return t;
}
