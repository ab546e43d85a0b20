#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.h>

// Read/write hooks for one dotted section of config.toml ("app", "app.update_stats")
struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns the TOML document on disk. Each registered section owns a fixed set of keys;
// keys nobody owns are carried through a save untouched.
class ConfigManager
{
public:
    explicit ConfigManager(const std::filesystem::path& configPath);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every section loads from an empty table
    bool load();
    bool save();

    const toml::table& root() const;
    const char* lastError() const { return last_error_.c_str(); }
    const std::string& configPath() const { return config_path_; }

private:
    struct Section
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;

        bool owns(const std::string& key) const;
    };

    static std::vector<std::string> SplitPath(const std::string& path);
    static const toml::table* FindSection(const toml::table& root, const std::string& path);
    static toml::table* EnsureSection(toml::table& root, const std::string& path);

    void loadSections(const toml::table& doc);
    bool writeAtomically(const toml::table& doc);

    std::string config_path_;
    std::string last_error_;
    std::vector<Section> sections_;
    std::unique_ptr<toml::table> root_;
};
