#include "SyncCoordinator.hpp"
#include "ManifestDiffer.hpp"
#include "ManifestParser.hpp"
#include "../net/HttpClient.hpp"
#include "../net/Url.hpp"
#include "../utils/Dispatcher.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace fs = std::filesystem;

namespace filesync
{

namespace
{

// Server path of a manifest entry listed under scope
std::string remoteEntryPath(const std::string& scope, const std::string& name)
{
    std::string dir = scope;
    while (!dir.empty() && dir.back() == '/')
        dir.pop_back();
    return dir + "/" + name;
}

// Shared by the upload workers of one uploadProject() call. The folder
// grant is released with the last reference.
class UploadQueue
{
public:
    explicit UploadQueue(UploadBatch batch)
        : batch_(std::move(batch))
    {
    }

    bool next(UploadItem& out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (next_ >= batch_.items.size())
            return false;
        out = batch_.items[next_++];
        return true;
    }

    std::size_t size() const { return batch_.items.size(); }

private:
    std::mutex mutex_;
    UploadBatch batch_;
    std::size_t next_ = 0;
};

} // namespace

SyncCoordinator::SyncCoordinator(utils::Dispatcher& dispatcher, net::HttpClient& http, FolderAccess& folderAccess,
                                 std::string baseUrl, SyncSettings settings)
    : dispatcher_(dispatcher)
    , http_(http)
    , folder_access_(folderAccess)
    , base_url_(net::normalize_base_url(baseUrl))
    , settings_(std::move(settings))
    , engine_(http, base_url_, settings_.transfer_timeout_ms)
{
}

// Workers capture this; the owner shuts the dispatcher down first
SyncCoordinator::~SyncCoordinator() = default;

void SyncCoordinator::checkForUpdates()
{
    ++checks_in_flight_;
    if (!state_.isSyncing)
    {
        state_.isSyncing = true;
        publish();
    }

    const std::string scope = browsePath();
    std::string url = net::join_url(base_url_, "browse");
    if (!scope.empty())
    {
        url += "?path=" + net::url_escape(scope);
    }

    ManifestDiffer differ(settings_.sync_root, settings_.skew_tolerance_seconds);
    net::SessionConfig cfg;
    cfg.timeout_ms = settings_.transfer_timeout_ms;

    PLOG_DEBUG << "Checking " << url;

    const bool started = dispatcher_.spawn([this, url, scope, differ, cfg]() {
        net::HttpResponse response = http_.get(url, cfg);
        if (!response.ok())
        {
            std::string error = response.describeFailure();
            dispatcher_.post([this, scope, error]() { applyManifest(false, {}, scope, error); });
            return;
        }

        std::vector<RemoteFile> manifest;
        std::string error;
        ManifestParser parser;
        if (!parser.parse(response.text, manifest, error))
        {
            dispatcher_.post([this, scope, error]() { applyManifest(false, {}, scope, "Invalid manifest: " + error); });
            return;
        }

        OutdatedSet outdated = differ.diff(manifest);
        dispatcher_.post([this, scope, outdated = std::move(outdated)]() mutable {
            applyManifest(true, std::move(outdated), scope, {});
        });
    });

    if (!started)
    {
        applyManifest(false, {}, scope, "Could not start update check");
    }
}

void SyncCoordinator::applyManifest(bool success, std::vector<RemoteFile> outdated, const std::string& scope,
                                    const std::string& error)
{
    if (checks_in_flight_ > 0)
        --checks_in_flight_;

    if (success)
    {
        state_.outdatedFiles = std::move(outdated);
        manifest_scope_ = scope;
        state_.statusMessage = state_.outdatedFiles.empty()
                                   ? "Up to date"
                                   : std::to_string(state_.outdatedFiles.size()) + " file(s) out of date";
        PLOG_INFO << state_.statusMessage;
    }
    else
    {
        state_.statusMessage = error;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Network, "Update check failed", error);
    }

    state_.isSyncing = checks_in_flight_ > 0;
    publish();
}

void SyncCoordinator::pull(const RemoteFile& file, TransferCallback callback)
{
    if (file.isDir)
    {
        PLOG_WARNING << "Ignoring pull of directory " << file.name;
        return;
    }

    const std::string name = file.name;
    const fs::path root = settings_.sync_root;
    const std::string remotePath = manifest_scope_.empty() ? std::string() : remoteEntryPath(manifest_scope_, name);

    auto finish = [this, name, callback](const TransferResult& result) {
        if (result.success)
        {
            removeOutdated(name);
        }
        else
        {
            utils::ErrorReporter::ReportTransferFailure("pull", name, result.error);
        }

        if (callback)
            callback(result);
    };

    const bool started = dispatcher_.spawn([this, name, root, remotePath, finish]() {
        TransferResult result = remotePath.empty() ? engine_.pull(name, root) : engine_.pullPath(remotePath, name, root);
        dispatcher_.post([result, finish]() { finish(result); });
    });

    if (!started)
    {
        TransferResult result;
        result.error = "Could not start transfer";
        finish(result);
    }
}

void SyncCoordinator::pullAll()
{
    // Snapshot: entries are removed as their pulls complete
    const OutdatedSet pending = state_.outdatedFiles;
    PLOG_INFO << "Pulling " << pending.size() << " file(s)";
    for (const auto& file : pending)
    {
        pull(file);
    }
}

bool SyncCoordinator::uploadProject(const fs::path& folder)
{
    UploadBatch batch;
    std::string error;
    if (!TransferEngine::collectUploads(folder_access_, folder, batch, error))
    {
        state_.statusMessage = error;
        publish();
        return false;
    }

    auto queue = std::make_shared<UploadQueue>(std::move(batch));
    const std::size_t wanted =
        std::min(queue->size(), static_cast<std::size_t>(std::max(1, settings_.upload_workers)));

    PLOG_INFO << "Uploading " << queue->size() << " file(s) from " << folder.string() << " on " << wanted
              << " worker(s)";

    std::size_t started = 0;
    for (std::size_t i = 0; i < wanted; ++i)
    {
        const bool ok = dispatcher_.spawn([this, queue]() {
            UploadItem item;
            while (queue->next(item))
            {
                TransferResult result = engine_.upload(item);
                if (!result.success)
                {
                    utils::ErrorReporter::ReportTransferFailure("upload", item.relativePath, result.error);
                }
            }
        });
        if (ok)
            ++started;
    }

    if (wanted > 0 && started == 0)
    {
        state_.statusMessage = "Could not start uploads";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Transfer, state_.statusMessage,
                                          std::to_string(queue->size()) + " file(s) from " + folder.string() +
                                              " were not sent");
        publish();
        return false;
    }
    if (started < wanted)
    {
        PLOG_WARNING << "Only " << started << " of " << wanted << " upload workers started";
    }

    dispatcher_.postDelayed(std::chrono::milliseconds(settings_.refresh_delay_ms), [this]() { checkForUpdates(); });
    return true;
}

void SyncCoordinator::subscribe(SyncStateCallback callback)
{
    if (callback)
        callbacks_.push_back(std::move(callback));
}

void SyncCoordinator::setServerDirectory(const std::string& path)
{
    if (path == server_directory_)
        return;

    server_directory_ = path;
    PLOG_DEBUG << "Server directory: " << path;
}

std::string SyncCoordinator::browsePath() const
{
    if (!settings_.remote_path.empty())
        return settings_.remote_path;
    return settings_.follow_server_cwd ? server_directory_ : std::string();
}

void SyncCoordinator::removeOutdated(const std::string& name)
{
    auto& files = state_.outdatedFiles;
    auto it = std::remove_if(files.begin(), files.end(), [&](const RemoteFile& f) { return f.name == name; });
    if (it == files.end())
        return;

    files.erase(it, files.end());
    publish();
}

void SyncCoordinator::publish()
{
    for (const auto& cb : callbacks_)
    {
        cb(state_);
    }
}

} // namespace filesync
