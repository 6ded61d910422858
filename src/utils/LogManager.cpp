#include "LogManager.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

namespace
{

// Indexed by plog::Severity
constexpr const char* kLevelNames[] = { "none", "fatal", "error", "warning", "info", "debug", "verbose" };
constexpr std::size_t kLevelCount = sizeof(kLevelNames) / sizeof(kLevelNames[0]);

constexpr std::size_t kMegabyte = 1024 * 1024;

} // namespace

bool LogManager::s_initialized = false;
std::string LogManager::s_log_file;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::ParseLevel(const std::string& name, plog::Severity& outLevel)
{
    for (std::size_t i = 0; i < kLevelCount; ++i)
    {
        if (name == kLevelNames[i])
        {
            outLevel = static_cast<plog::Severity>(i);
            return true;
        }
    }
    return false;
}

const char* LogManager::LevelName(plog::Severity level)
{
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelCount ? kLevelNames[index] : "info";
}

void LogManager::ReadTable(const toml::table& table, LogSettings& settings)
{
    if (auto level = table["level"].value<std::string>())
    {
        if (!ParseLevel(*level, settings.level))
        {
            std::cerr << "dropsync: unknown log level '" << *level << "', using "
                      << LevelName(settings.level) << "\n";
        }
    }
    if (auto file = table["file"].value<std::string>(); file && !file->empty())
        settings.file = *file;
    if (auto append = table["append"].value<bool>())
        settings.append = *append;
    if (auto console = table["console"].value<bool>())
        settings.console = *console;
    if (auto size = table["max_size_mb"].value<std::int64_t>(); size && *size > 0)
        settings.max_file_size = static_cast<std::size_t>(*size) * kMegabyte;
    if (auto backups = table["backups"].value<std::int64_t>(); backups && *backups >= 0)
        settings.backup_count = static_cast<std::size_t>(*backups);
}

toml::table LogManager::ToTable(const LogSettings& settings)
{
    toml::table table;
    table.insert("level", std::string(LevelName(settings.level)));
    table.insert("file", settings.file);
    table.insert("append", settings.append);
    table.insert("console", settings.console);
    table.insert("max_size_mb", static_cast<std::int64_t>(settings.max_file_size / kMegabyte));
    table.insert("backups", static_cast<std::int64_t>(settings.backup_count));
    return table;
}

LogSettings LogManager::ReadSettings(const std::string& configPath)
{
    LogSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec))
        return settings;

    try
    {
        auto cfg = toml::parse_file(configPath);
        if (auto logging = cfg["logging"].as_table())
        {
            ReadTable(*logging, settings);
        }
    }
    catch (const toml::parse_error&)
    {
        // ConfigManager reports the same parse error once logging is up
    }
    return settings;
}

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    try
    {
        std::filesystem::path dir = std::filesystem::path(settings.file).parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                std::cerr << "dropsync: cannot create " << dir.string() << ": " << ec.message() << "\n";
                return false;
            }
        }

        if (!settings.append)
        {
            std::ofstream(settings.file, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));
        plog::init(settings.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "dropsync: failed to open log " << settings.file << ": " << ex.what() << "\n";
        return false;
    }

    s_log_file = settings.file;
    s_initialized = true;
    PLOG_DEBUG << "Logging at level " << LevelName(settings.level) << " to " << s_log_file;
    return true;
}

const std::string& LogManager::LogFile() { return s_log_file; }

} // namespace utils
