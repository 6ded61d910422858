#include "AppSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace
{

fs::path homeDir()
{
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home);
    return fs::current_path();
}

template <typename T>
void readInt(const toml::table& tbl, const char* key, T& out, T minimum)
{
    if (auto v = tbl[key].value<std::int64_t>())
    {
        if (*v < static_cast<std::int64_t>(minimum))
        {
            PLOG_WARNING << "Ignoring " << key << " = " << *v << " (minimum " << minimum << ")";
            return;
        }
        out = static_cast<T>(*v);
    }
}

} // namespace

AppSettings::AppSettings()
{
    sync.sync_root = defaultDocumentsDir();
    sync.downloads_dir = defaultDownloadsDir();
    sync.export_dir = defaultExportDir();
}

std::string AppSettings::defaultDocumentsDir() { return (homeDir() / "Documents").string(); }

std::string AppSettings::defaultDownloadsDir() { return (homeDir() / "Downloads").string(); }

std::string AppSettings::defaultExportDir()
{
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
        tmp = "/tmp";
    return (tmp / "dropsync-export").string();
}

namespace
{

toml::table serverTable(const ServerSettings& server)
{
    toml::table table;
    table.insert("base_url", server.base_url);
    return table;
}

void readServer(const toml::table& table, ServerSettings& server)
{
    if (auto v = table["base_url"].value<std::string>())
        server.base_url = *v;
}

toml::table watcherTable(const watcher::WatcherSettings& watcher)
{
    toml::table table;
    table.insert("poll_interval_ms", watcher.poll_interval_ms);
    table.insert("timeout_ms", watcher.timeout_ms);
    table.insert("discard_stale_responses", watcher.discard_stale_responses);
    table.insert("auto_fetch_on_notify", watcher.auto_fetch_on_notify);
    return table;
}

void readWatcher(const toml::table& table, watcher::WatcherSettings& watcher)
{
    readInt(table, "poll_interval_ms", watcher.poll_interval_ms, 100);
    readInt(table, "timeout_ms", watcher.timeout_ms, 0);
    if (auto v = table["discard_stale_responses"].value<bool>())
        watcher.discard_stale_responses = *v;
    if (auto v = table["auto_fetch_on_notify"].value<bool>())
        watcher.auto_fetch_on_notify = *v;
}

toml::table syncTable(const filesync::SyncSettings& sync)
{
    toml::table table;
    table.insert("sync_root", sync.sync_root);
    table.insert("downloads_dir", sync.downloads_dir);
    table.insert("export_dir", sync.export_dir);
    table.insert("remote_path", sync.remote_path);
    table.insert("follow_server_cwd", sync.follow_server_cwd);
    table.insert("skew_tolerance_seconds", static_cast<std::int64_t>(sync.skew_tolerance_seconds));
    table.insert("refresh_delay_ms", sync.refresh_delay_ms);
    table.insert("transfer_timeout_ms", sync.transfer_timeout_ms);
    table.insert("upload_workers", sync.upload_workers);
    return table;
}

void readSync(const toml::table& table, filesync::SyncSettings& sync)
{
    if (auto v = table["sync_root"].value<std::string>(); v && !v->empty())
        sync.sync_root = *v;
    if (auto v = table["downloads_dir"].value<std::string>(); v && !v->empty())
        sync.downloads_dir = *v;
    if (auto v = table["export_dir"].value<std::string>(); v && !v->empty())
        sync.export_dir = *v;
    if (auto v = table["remote_path"].value<std::string>())
        sync.remote_path = *v;
    if (auto v = table["follow_server_cwd"].value<bool>())
        sync.follow_server_cwd = *v;
    readInt(table, "skew_tolerance_seconds", sync.skew_tolerance_seconds, std::uint64_t{ 0 });
    readInt(table, "refresh_delay_ms", sync.refresh_delay_ms, 0);
    readInt(table, "transfer_timeout_ms", sync.transfer_timeout_ms, 0);
    readInt(table, "upload_workers", sync.upload_workers, 1);
}

const toml::table* subTable(const toml::table& root, const char* name)
{
    return root[name].as_table();
}

} // namespace

toml::table AppSettings::serialize(const AppSettings& settings)
{
    toml::table root;
    root.insert("server", serverTable(settings.server));
    root.insert("watcher", watcherTable(settings.watcher));
    root.insert("sync", syncTable(settings.sync));
    root.insert("logging", utils::LogManager::ToTable(settings.logging));
    return root;
}

void AppSettings::deserialize(const toml::table& root, AppSettings& settings)
{
    if (auto* table = subTable(root, "server"))
        readServer(*table, settings.server);
    if (auto* table = subTable(root, "watcher"))
        readWatcher(*table, settings.watcher);
    if (auto* table = subTable(root, "sync"))
        readSync(*table, settings.sync);
    if (auto* table = subTable(root, "logging"))
        utils::LogManager::ReadTable(*table, settings.logging);
}

bool AppSettings::registerConfigHandler(ConfigManager& config)
{
    return config.addSection({ "server",
                              [this](const toml::table& table) { readServer(table, server); },
                              [this]() { return serverTable(server); } }) &&
           config.addSection({ "watcher",
                              [this](const toml::table& table) { readWatcher(table, watcher); },
                              [this]() { return watcherTable(watcher); } }) &&
           config.addSection({ "sync",
                              [this](const toml::table& table) { readSync(table, sync); },
                              [this]() { return syncTable(sync); } }) &&
           config.addSection({ "logging",
                              [this](const toml::table& table) { utils::LogManager::ReadTable(table, logging); },
                              [this]() { return utils::LogManager::ToTable(logging); } });
}
