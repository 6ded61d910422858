#pragma once

#include "SyncTypes.hpp"

#include <string>

namespace filesync
{

// Parser for the server's /browse listing:
// [{"name": ..., "is_dir": ..., "size": ..., "modified": ...}, ...]
class ManifestParser
{
public:
    ManifestParser() = default;
    ~ManifestParser() = default;

    bool parse(const std::string& jsonContent, std::vector<RemoteFile>& outFiles, std::string& outError);

    // Rejects duplicate names and absolute or parent-escaping paths
    static bool validate(const std::vector<RemoteFile>& files, std::string& outError);
};

} // namespace filesync
