#include "ManifestDiffer.hpp"
#include "../utils/FileUtils.hpp"

#include <plog/Log.h>

namespace filesync
{

ManifestDiffer::ManifestDiffer(std::filesystem::path localRoot, std::uint64_t skewToleranceSeconds)
    : local_root_(std::move(localRoot))
    , skew_tolerance_(skewToleranceSeconds)
{
}

OutdatedSet ManifestDiffer::diff(const std::vector<RemoteFile>& manifest) const
{
    OutdatedSet outdated;
    for (const auto& remote : manifest)
    {
        if (remote.isDir)
            continue;

        auto localModified = utils::file_mtime_seconds(local_root_ / std::filesystem::path(remote.name));
        if (isOutdated(remote, localModified, skew_tolerance_))
        {
            outdated.push_back(remote);
        }
    }

    PLOG_DEBUG << "Diff against " << local_root_ << ": " << outdated.size() << " of " << manifest.size()
               << " entries outdated";
    return outdated;
}

bool ManifestDiffer::isOutdated(const RemoteFile& remote, std::optional<std::uint64_t> localModified,
                                std::uint64_t skewToleranceSeconds)
{
    if (remote.isDir)
        return false;
    if (!localModified)
        return true;
    return remote.modifiedEpochSeconds > *localModified + skewToleranceSeconds;
}

} // namespace filesync
