#include "ManifestParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace filesync
{

namespace
{

bool isSafeRelativePath(const std::string& name)
{
    if (name.empty() || name.front() == '/' || name.front() == '\\')
        return false;

    std::istringstream ss(name);
    std::string segment;
    while (std::getline(ss, segment, '/'))
    {
        if (segment == "..")
            return false;
    }
    return true;
}

} // namespace

bool ManifestParser::parse(const std::string& jsonContent, std::vector<RemoteFile>& outFiles, std::string& outError)
{
    try
    {
        json manifestJson = json::parse(jsonContent);

        if (!manifestJson.is_array())
        {
            outError = "Manifest is not a JSON array";
            return false;
        }

        std::vector<RemoteFile> files;
        files.reserve(manifestJson.size());

        for (const auto& entryJson : manifestJson)
        {
            if (!entryJson.is_object())
            {
                PLOG_WARNING << "Skipping non-object manifest entry";
                continue;
            }

            auto nameIt = entryJson.find("name");
            if (nameIt == entryJson.end() || !nameIt->is_string())
            {
                PLOG_WARNING << "Skipping manifest entry without a string name";
                continue;
            }

            RemoteFile file;
            file.name = nameIt->get<std::string>();
            file.isDir = entryJson.value("is_dir", false);
            file.size = entryJson.value("size", std::int64_t{ 0 });
            file.modifiedEpochSeconds = entryJson.value("modified", std::uint64_t{ 0 });

            if (file.name.empty())
            {
                PLOG_WARNING << "Skipping manifest entry with empty name";
                continue;
            }

            files.push_back(std::move(file));
        }

        if (!validate(files, outError))
        {
            PLOG_ERROR << outError;
            return false;
        }

        PLOG_DEBUG << "Manifest parsed: " << files.size() << " entries";
        outFiles = std::move(files);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ManifestParser::validate(const std::vector<RemoteFile>& files, std::string& outError)
{
    std::unordered_set<std::string> seen;
    for (const auto& file : files)
    {
        if (!isSafeRelativePath(file.name))
        {
            outError = "Manifest entry '" + file.name + "' is not a relative path inside the shared folder";
            return false;
        }

        if (!seen.insert(file.name).second)
        {
            outError = "Manifest lists '" + file.name + "' more than once";
            return false;
        }
    }
    return true;
}

} // namespace filesync
