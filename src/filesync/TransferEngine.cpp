#include "TransferEngine.hpp"
#include "../net/HttpClient.hpp"
#include "../net/Multipart.hpp"
#include "../net/Url.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/FileUtils.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace filesync
{

namespace
{

// Server-supplied names may carry directories; only the last component is used
std::string leafName(const std::string& name)
{
    std::string leaf = fs::path(name).filename().string();
    if (leaf.empty() || leaf == "." || leaf == "..")
        return {};
    return leaf;
}

// "Proj/" and "Proj" both walk Proj and anchor at "Proj"
fs::path normalizedFolder(const fs::path& folder)
{
    fs::path clean = folder.lexically_normal();
    if (clean.filename().empty())
    {
        clean = clean.parent_path();
    }
    return clean;
}

} // namespace

TransferEngine::TransferEngine(net::HttpClient& http, std::string baseUrl, int timeoutMs)
    : http_(http)
    , base_url_(net::normalize_base_url(baseUrl))
    , timeout_ms_(timeoutMs)
{
}

TransferResult TransferEngine::pull(const std::string& name, const fs::path& syncRoot) const
{
    const std::string url = net::join_url(base_url_, "download/" + net::escape_path(name));
    PLOG_INFO << "Pulling " << name;
    return downloadTo(url, syncRoot / fs::path(name));
}

TransferResult TransferEngine::pullPath(const std::string& remotePath, const std::string& name,
                                        const fs::path& syncRoot) const
{
    const std::string url = net::join_url(base_url_, "pull") + "?path=" + net::url_escape(remotePath);
    PLOG_INFO << "Pulling " << remotePath;
    return downloadTo(url, syncRoot / fs::path(name));
}

TransferResult TransferEngine::fetchLatest(const fs::path& downloadsDir, const std::string& fallbackName) const
{
    return downloadUnique(net::join_url(base_url_, "download"), downloadsDir, fallbackName);
}

TransferResult TransferEngine::fetchWaiting(const std::string& name, const fs::path& downloadsDir) const
{
    return downloadUnique(net::join_url(base_url_, "download/" + net::escape_path(name)), downloadsDir, name);
}

TransferResult TransferEngine::downloadForExport(const std::string& resolvedName, const fs::path& exportDir) const
{
    TransferResult result;
    std::string leaf = leafName(resolvedName);
    if (leaf.empty())
    {
        result.error = "No file name to export";
        return result;
    }

    return downloadTo(net::join_url(base_url_, "download"), exportDir / leaf);
}

TransferResult TransferEngine::downloadTo(const std::string& url, const fs::path& dest) const
{
    TransferResult result;

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
    {
        result.error = "Failed to create " + dest.parent_path().string() + ": " + ec.message();
        PLOG_ERROR << result.error;
        return result;
    }

    const fs::path temp = utils::make_temp_sibling(dest);

    net::SessionConfig cfg;
    cfg.timeout_ms = timeout_ms_;
    net::HttpResponse response = http_.download(url, temp.string(), cfg);

    if (response.status_code != 200 || !response.error.empty())
    {
        result.error = response.describeFailure();
        PLOG_ERROR << "Download of " << url << " failed: " << result.error;
        fs::remove(temp, ec);
        return result;
    }

    if (!utils::replace_file(temp, dest, result.error))
    {
        PLOG_ERROR << result.error;
        fs::remove(temp, ec);
        return result;
    }

    auto size = fs::file_size(dest, ec);
    PLOG_INFO << "Saved " << dest.string() << " (" << utils::format_size(ec ? 0 : size) << ")";
    result.success = true;
    result.path = dest.string();
    return result;
}

TransferResult TransferEngine::downloadUnique(const std::string& url, const fs::path& downloadsDir,
                                              const std::string& fallbackName) const
{
    TransferResult result;

    std::error_code ec;
    fs::create_directories(downloadsDir, ec);
    if (ec)
    {
        result.error = "Failed to create " + downloadsDir.string() + ": " + ec.message();
        PLOG_ERROR << result.error;
        return result;
    }

    const fs::path temp = utils::make_temp_sibling(downloadsDir / "download");

    net::SessionConfig cfg;
    cfg.timeout_ms = timeout_ms_;
    net::HttpResponse response = http_.download(url, temp.string(), cfg);

    if (response.status_code != 200 || !response.error.empty())
    {
        result.error = response.describeFailure();
        PLOG_ERROR << "Download of " << url << " failed: " << result.error;
        fs::remove(temp, ec);
        return result;
    }

    std::string name = leafName(net::content_disposition_filename(response.header("Content-Disposition")));
    if (name.empty())
        name = leafName(fallbackName);
    if (name.empty())
        name = "downloaded_file";

    fs::path dest;
    if (!utils::allocate_unique_path(downloadsDir, name, dest, result.error))
    {
        PLOG_ERROR << result.error << " for " << name;
        fs::remove(temp, ec);
        return result;
    }

    if (!utils::replace_file(temp, dest, result.error))
    {
        PLOG_ERROR << result.error;
        fs::remove(temp, ec);
        return result;
    }

    PLOG_INFO << "Saved " << dest.string();
    result.success = true;
    result.path = dest.string();
    return result;
}

bool TransferEngine::collectUploads(FolderAccess& access, const fs::path& folder, UploadBatch& outBatch,
                                    std::string& outError)
{
    auto grant = std::make_unique<ScopedFolderAccess>(access, folder);
    if (!grant->granted())
    {
        outError = grant->error();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Permission, "Folder access denied", outError);
        return false;
    }

    const fs::path base = normalizedFolder(folder);
    const fs::path anchor = base.filename();
    std::vector<UploadItem> items;

    try
    {
        for (auto it = fs::recursive_directory_iterator(base); it != fs::recursive_directory_iterator(); ++it)
        {
            const fs::directory_entry& entry = *it;
            if (utils::is_hidden_name(entry.path().filename().string()))
            {
                if (entry.is_directory())
                {
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (!entry.is_regular_file())
                continue;

            UploadItem item;
            item.relativePath = (anchor / entry.path().lexically_relative(base)).generic_string();
            item.sourcePath = entry.path();
            std::error_code sizeError;
            item.size = entry.file_size(sizeError);
            if (sizeError)
                item.size = 0;
            items.push_back(std::move(item));
        }
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Failed to enumerate folder: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }

    std::sort(items.begin(), items.end(),
              [](const UploadItem& a, const UploadItem& b) { return a.relativePath < b.relativePath; });

    PLOG_INFO << "Collected " << items.size() << " files from " << folder.string();
    outBatch.grant = std::move(grant);
    outBatch.items = std::move(items);
    return true;
}

TransferResult TransferEngine::upload(const UploadItem& item) const
{
    TransferResult result;

    std::string content;
    if (!utils::read_file(item.sourcePath, content, result.error))
    {
        return result;
    }

    net::MultipartBody mp = net::encode_file_part(item.relativePath, item.relativePath, content);
    std::string().swap(content);

    net::SessionConfig cfg;
    cfg.timeout_ms = timeout_ms_;
    net::HttpResponse response = http_.post(net::join_url(base_url_, "upload"), mp.body, mp.contentType, cfg);

    if (response.status_code != 200 || !response.error.empty())
    {
        result.error = response.describeFailure();
        return result;
    }

    PLOG_INFO << "Uploaded " << item.relativePath << " (" << utils::format_size(item.size) << ")";
    result.success = true;
    result.path = item.relativePath;
    return result;
}

} // namespace filesync
