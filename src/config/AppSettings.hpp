#pragma once

#include "../filesync/SyncTypes.hpp"
#include "../utils/LogManager.hpp"
#include "../watcher/StatusTypes.hpp"

#include <toml++/toml.h>
#include <string>

class ConfigManager;

struct ServerSettings
{
    std::string base_url;
};

// Everything dropsync reads from config.toml:
//   [server]  base_url
//   [watcher] poll_interval_ms, timeout_ms, discard_stale_responses, auto_fetch_on_notify
//   [sync]    sync_root, downloads_dir, export_dir, remote_path, follow_server_cwd,
//             skew_tolerance_seconds, refresh_delay_ms, transfer_timeout_ms, upload_workers
//   [logging] level, file, append, console, max_size_mb, backups
class AppSettings
{
public:
    AppSettings();

    ServerSettings server;
    watcher::WatcherSettings watcher;
    filesync::SyncSettings sync;
    utils::LogSettings logging;

    static toml::table serialize(const AppSettings& settings);

    // Missing or mistyped keys keep their current value
    static void deserialize(const toml::table& root, AppSettings& settings);

    // One config section per table above
    bool registerConfigHandler(ConfigManager& config);

    static std::string defaultDocumentsDir();
    static std::string defaultDownloadsDir();
    static std::string defaultExportDir();
};
