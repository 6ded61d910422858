#pragma once

#include <functional>
#include <string>
#include <vector>

#include <toml++/toml.h>

// Reads and writes one top-level table of config.toml
struct ConfigSection
{
    std::string name;
    std::function<void(const toml::table& table)> load;
    std::function<toml::table()> save;
};

// Owns config.toml. Each registered section receives its own table on load
// (empty when absent) and replaces that table on save. Tables nobody
// registered are written back as they were read.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "config.toml");

    bool addSection(ConfigSection section);

    // False when the file exists but cannot be parsed; sections still get defaults
    bool load();

    // Writes through "<path>.tmp" and renames over the file
    bool save();

    const toml::table& root() const { return root_; }
    const std::string& path() const { return config_path_; }
    const std::string& lastError() const { return last_error_; }

private:
    void loadSections();

    std::string config_path_;
    std::string last_error_;
    std::vector<ConfigSection> sections_;
    toml::table root_;
};
