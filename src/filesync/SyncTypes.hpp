#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace filesync
{

// One entry of the remote /browse manifest
struct RemoteFile
{
    std::string name; // relative path, unique within one manifest
    bool isDir = false;
    std::int64_t size = 0;
    std::uint64_t modifiedEpochSeconds = 0;

    bool operator==(const RemoteFile& other) const = default;
};

// Remote files missing locally or newer than the local copy, in manifest order
using OutdatedSet = std::vector<RemoteFile>;

struct SyncState
{
    OutdatedSet outdatedFiles;
    bool isSyncing = false; // a manifest check is in flight
    std::string statusMessage;
};

struct SyncSettings
{
    std::string sync_root;     // manifest pulls land here
    std::string downloads_dir; // watcher-triggered downloads
    std::string export_dir;    // share/export staging
    std::string remote_path;   // optional ?path= for /browse; pulls then go through /pull
    bool follow_server_cwd = false; // without remote_path, browse the server's reported folder
    std::uint64_t skew_tolerance_seconds = 2;
    int refresh_delay_ms = 2000;
    int transfer_timeout_ms = 0; // 0 keeps the transport default
    int upload_workers = 4;      // concurrent uploads per project
};

// A file below a user-granted folder, read when its upload starts
struct UploadItem
{
    std::string relativePath; // anchored at the folder's basename, '/'-separated
    std::filesystem::path sourcePath;
    std::uint64_t size = 0;
};

struct TransferResult
{
    bool success = false;
    std::string path;  // local file written (downloads)
    std::string error;
};

} // namespace filesync
