#pragma once

#include "FolderAccess.hpp"
#include "SyncTypes.hpp"
#include "TransferEngine.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace net
{
class HttpClient;
}

namespace utils
{
class Dispatcher;
}

namespace filesync
{

using SyncStateCallback = std::function<void(const SyncState&)>;
using TransferCallback = std::function<void(const TransferResult&)>;

// Owns the observable sync state and drives check/pull/push.
//
// Must be used from the dispatcher's owner thread: network and disk work runs
// on workers, their completions come back through Dispatcher::post(), and only
// those completions touch outdatedFiles/isSyncing. There is no lock.
class SyncCoordinator
{
public:
    SyncCoordinator(utils::Dispatcher& dispatcher, net::HttpClient& http, FolderAccess& folderAccess,
                    std::string baseUrl, SyncSettings settings);
    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    // Fetch /browse, diff against sync_root, replace outdatedFiles wholesale.
    // On failure outdatedFiles keeps its previous value.
    void checkForUpdates();

    // Download one file into sync_root; on success its entry leaves outdatedFiles
    void pull(const RemoteFile& file, TransferCallback callback = nullptr);

    void pullAll();

    // Upload every visible file under folder on up to upload_workers workers,
    // then re-check after refresh_delay_ms. Returns false when the folder could
    // not be read or no worker could start; uploads themselves are
    // fire-and-forget and report failures through ErrorReporter.
    bool uploadProject(const std::filesystem::path& folder);

    void subscribe(SyncStateCallback callback);

    // Folder reported by the server. Browsed when follow_server_cwd is set
    // and no remote_path is configured.
    void setServerDirectory(const std::string& path);

    // Server directory the next check lists; empty for the server default
    std::string browsePath() const;

    const SyncState& state() const { return state_; }
    const SyncSettings& settings() const { return settings_; }
    const TransferEngine& transfers() const { return engine_; }

private:
    void applyManifest(bool success, std::vector<RemoteFile> outdated, const std::string& scope,
                       const std::string& error);
    void removeOutdated(const std::string& name);
    void publish();

    utils::Dispatcher& dispatcher_;
    net::HttpClient& http_;
    FolderAccess& folder_access_;
    std::string base_url_;
    SyncSettings settings_;
    TransferEngine engine_;

    SyncState state_;
    std::string server_directory_;
    std::string manifest_scope_; // browse path the current outdatedFiles came from
    int checks_in_flight_ = 0;
    std::vector<SyncStateCallback> callbacks_;
};

} // namespace filesync
