#pragma once

#include "SyncTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace filesync
{

// Compares a remote manifest against files under a fixed local root.
// No caching: every diff() re-reads the local modification times.
class ManifestDiffer
{
public:
    static constexpr std::uint64_t kDefaultSkewToleranceSeconds = 2;

    explicit ManifestDiffer(std::filesystem::path localRoot,
                            std::uint64_t skewToleranceSeconds = kDefaultSkewToleranceSeconds);

    // Directories are skipped; everything else missing locally or strictly
    // newer than local + tolerance is returned in manifest order.
    OutdatedSet diff(const std::vector<RemoteFile>& manifest) const;

    static bool isOutdated(const RemoteFile& remote, std::optional<std::uint64_t> localModified,
                           std::uint64_t skewToleranceSeconds);

    const std::filesystem::path& localRoot() const { return local_root_; }

private:
    std::filesystem::path local_root_;
    std::uint64_t skew_tolerance_;
};

} // namespace filesync
