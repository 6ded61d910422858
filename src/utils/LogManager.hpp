#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>
#include <toml++/toml.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// The [logging] table of config.toml
struct LogSettings
{
    plog::Severity level = plog::info;
    std::string file = "logs/dropsync.log";
    bool append = true;
    bool console = true;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

// Sets up the single plog logger: a rolling file plus the console.
class LogManager
{
public:
    // Logging starts before ConfigManager, so the [logging] table is read
    // straight from the file. A missing or broken file yields the defaults.
    static LogSettings ReadSettings(const std::string& configPath);

    static void ReadTable(const toml::table& table, LogSettings& settings);
    static toml::table ToTable(const LogSettings& settings);

    // Once per process; later calls keep the first configuration
    static bool Initialize(const LogSettings& settings);

    // Empty until Initialize() succeeded
    static const std::string& LogFile();

    // "none", "fatal", "error", "warning", "info", "debug", "verbose"
    static bool ParseLevel(const std::string& name, plog::Severity& outLevel);
    static const char* LevelName(plog::Severity level);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::string s_log_file;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
