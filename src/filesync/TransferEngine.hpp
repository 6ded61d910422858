#pragma once

#include "FolderAccess.hpp"
#include "SyncTypes.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace net
{
class HttpClient;
}

namespace filesync
{

// Files found below a granted folder. The grant is held until the batch is
// destroyed, so file contents can still be read while uploads run.
struct UploadBatch
{
    std::unique_ptr<ScopedFolderAccess> grant;
    std::vector<UploadItem> items;
};

// Blocking download/upload primitives. Every call is independent and safe to
// run on a worker thread; callers own scheduling and state updates.
//
// Downloads stream into a hidden temp file beside the destination, then the
// old file is deleted and the temp file moved into place. Readers can see the
// destination missing for a moment, never half written.
class TransferEngine
{
public:
    TransferEngine(net::HttpClient& http, std::string baseUrl, int timeoutMs = 0);

    // GET {base}/download/{name} into syncRoot/name
    TransferResult pull(const std::string& name, const std::filesystem::path& syncRoot) const;

    // GET {base}/pull?path={remotePath} into syncRoot/name, for manifests
    // browsed below a server directory
    TransferResult pullPath(const std::string& remotePath, const std::string& name,
                            const std::filesystem::path& syncRoot) const;

    // GET {base}/download into downloadsDir, never overwriting: "name (n).ext"
    TransferResult fetchLatest(const std::filesystem::path& downloadsDir, const std::string& fallbackName) const;

    // GET {base}/download/{name} into downloadsDir with the same collision policy
    TransferResult fetchWaiting(const std::string& name, const std::filesystem::path& downloadsDir) const;

    // GET {base}/download into exportDir/resolvedName, replacing a stale copy
    TransferResult downloadForExport(const std::string& resolvedName, const std::filesystem::path& exportDir) const;

    // Lists every visible regular file below folder under a scoped grant,
    // which moves into outBatch. Paths are anchored at the folder's own name
    // ("Proj/sub/b.txt"). Fails when access is denied or the walk throws;
    // the grant is then already released.
    static bool collectUploads(FolderAccess& access, const std::filesystem::path& folder, UploadBatch& outBatch,
                               std::string& outError);

    // Reads item.sourcePath and sends one multipart POST to {base}/upload;
    // success means HTTP 200. Only this file is held in memory.
    TransferResult upload(const UploadItem& item) const;

    const std::string& baseUrl() const { return base_url_; }

private:
    TransferResult downloadTo(const std::string& url, const std::filesystem::path& dest) const;
    TransferResult downloadUnique(const std::string& url, const std::filesystem::path& downloadsDir,
                                  const std::string& fallbackName) const;

    net::HttpClient& http_;
    std::string base_url_;
    int timeout_ms_;
};

} // namespace filesync
