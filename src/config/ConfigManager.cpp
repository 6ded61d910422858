#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

bool ConfigManager::addSection(ConfigSection section)
{
    if (section.name.empty() || !section.load || !section.save)
    {
        last_error_ = "Config section needs a name, a loader and a saver";
        PLOG_ERROR << last_error_;
        return false;
    }

    for (const auto& existing : sections_)
    {
        if (existing.name == section.name)
        {
            last_error_ = "Config section [" + section.name + "] is already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    sections_.push_back(std::move(section));
    return true;
}

void ConfigManager::loadSections()
{
    static const toml::table empty;
    for (const auto& section : sections_)
    {
        const toml::node* node = root_.get(section.name);
        const toml::table* table = node ? node->as_table() : nullptr;
        if (node && !table)
        {
            PLOG_WARNING << "[" << section.name << "] in " << config_path_ << " is not a table, using defaults";
        }
        section.load(table ? *table : empty);
    }
}

bool ConfigManager::load()
{
    last_error_.clear();
    root_ = toml::table{};

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        loadSections();
        return true;
    }

    try
    {
        root_ = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error at line " + std::to_string(pe.source().begin.line) + ": " +
                      std::string(pe.description());
        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, using defaults",
                                            last_error_ + " (" + config_path_ + ")");
        root_ = toml::table{};
        loadSections();
        return false;
    }

    loadSections();
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table output = root_;
    for (const auto& section : sections_)
    {
        output.insert_or_assign(section.name, section.save());
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Could not open " + tmp + " for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        ofs << output << '\n';
        if (!ofs.flush())
        {
            last_error_ = "Could not write " + tmp;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "Could not replace " + config_path_ + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }

    root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}
