#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool ConfigManager::Section::owns(const std::string& key) const
{
    return std::find(ownedKeys.begin(), ownedKeys.end(), key) != ownedKeys.end();
}

ConfigManager::ConfigManager(const fs::path& configPath)
    : config_path_(configPath.string())
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    if (SplitPath(path).empty() && !path.empty())
    {
        last_error_ = "Invalid section path '" + path + "'";
        PLOG_ERROR << last_error_;
        return false;
    }

    for (const auto& section : sections_)
    {
        if (section.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (section.owns(key))
            {
                last_error_ = "Key '" + key + "' in [" + path + "] is already owned";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    sections_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No configuration at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        loadSections(*root_);
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream where;
        where << pe.description();
        if (pe.source().begin.line > 0)
            where << " (line " << pe.source().begin.line << ")";
        last_error_ = "config parse error: " + where.str();
        PLOG_WARNING << last_error_;

        // Defaults stay in effect; the broken file is left for the user to fix
        root_ = std::make_unique<toml::table>();
        loadSections(*root_);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            where.str() + "\nFile: " + config_path_);
        return false;
    }

    loadSections(*root_);
    return true;
}

void ConfigManager::loadSections(const toml::table& doc)
{
    static const toml::table empty;
    for (const auto& section : sections_)
    {
        const toml::table* found = FindSection(doc, section.path);
        section.callbacks.load(found ? *found : empty);
    }
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table output = *root_;
    for (const auto& section : sections_)
    {
        toml::table* target = EnsureSection(output, section.path);
        if (!target)
        {
            last_error_ = "[" + section.path + "] collides with a non-table value";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }

        toml::table produced = section.callbacks.save();
        for (const auto& entry : produced)
        {
            const auto& key = entry.first;
            if (!section.owns(std::string(key.str())))
                PLOG_WARNING << "[" << section.path << "] produced unowned key '" << key.str() << "', dropped";
        }

        for (const auto& key : section.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    if (!writeAtomically(output))
        return false;

    *root_ = std::move(output);
    PLOG_DEBUG << "Saved config to " << config_path_;
    return true;
}

bool ConfigManager::writeAtomically(const toml::table& doc)
{
    fs::path target(config_path_);
    std::error_code ec;
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (ofs)
            ofs << doc << '\n';
        if (!ofs)
        {
            last_error_ = "Could not write " + tmp.string();
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            if (fs::is_regular_file(tmp, ec))
                fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        last_error_ = "Could not replace " + config_path_ + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

const toml::table& ConfigManager::root() const { return *root_; }

std::vector<std::string> ConfigManager::SplitPath(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
            return {};
        segments.push_back(segment);
    }
    return segments;
}

const toml::table* ConfigManager::FindSection(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& segment : SplitPath(path))
    {
        current = current->get_as<toml::table>(segment);
        if (!current)
            return nullptr;
    }
    return current;
}

toml::table* ConfigManager::EnsureSection(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : SplitPath(path))
    {
        // insert keeps an existing value
        auto [it, inserted] = current->insert(segment, toml::table{});
        current = it->second.as_table();
        if (!current)
            return nullptr;
    }
    return current;
}
