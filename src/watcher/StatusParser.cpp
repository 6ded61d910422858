#include "StatusParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstdint>

using json = nlohmann::json;

namespace watcher
{

namespace
{

// Missing or mistyped fields keep their defaults
std::string stringField(const json& node, const char* key)
{
    auto it = node.find(key);
    return it != node.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::uint64_t countField(const json& node, const char* key)
{
    auto it = node.find(key);
    return it != node.end() && it->is_number_unsigned() ? it->get<std::uint64_t>() : 0;
}

bool flagField(const json& node, const char* key)
{
    auto it = node.find(key);
    return it != node.end() && it->is_boolean() && it->get<bool>();
}

std::optional<SentFileInfo> readSentFile(const json& node)
{
    if (!node.is_object())
        return std::nullopt;

    SentFileInfo info;
    info.name = stringField(node, "name");
    if (info.name.empty())
        return std::nullopt;

    info.peerId = stringField(node, "peer_id");
    info.size = countField(node, "size");
    info.timestamp = countField(node, "timestamp");
    info.succeeded = flagField(node, "succeeded");
    info.sending = flagField(node, "sending");
    return info;
}

} // namespace

bool StatusParser::parseStatus(const std::string& jsonContent, StatusSnapshot& outSnapshot, std::string& outError)
{
    try
    {
        json statusJson = json::parse(jsonContent);
        if (!statusJson.is_object())
        {
            outError = "Status response is not a JSON object";
            return false;
        }

        StatusSnapshot snapshot;

        if (auto it = statusJson.find("last_sent_file"); it != statusJson.end())
        {
            snapshot.lastSent = readSentFile(*it);
        }

        if (auto it = statusJson.find("server_cwd"); it != statusJson.end() && it->is_string())
        {
            snapshot.serverCwd = it->get<std::string>();
        }

        // A sent file only counts once the transfer succeeded
        if (snapshot.lastSent && snapshot.lastSent->succeeded)
        {
            snapshot.fileName = snapshot.lastSent->name;
            snapshot.source = FileSource::Sent;
        }
        else if (snapshot.lastSent && snapshot.lastSent->sending)
        {
            snapshot.source = FileSource::SendInProgress;
        }
        else
        {
            std::string received = stringField(statusJson, "last_received_file");
            if (!received.empty())
            {
                snapshot.fileName = std::move(received);
                snapshot.source = FileSource::Received;
            }
        }

        outSnapshot = std::move(snapshot);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_DEBUG << outError;
        return false;
    }
}

bool StatusParser::parseWaitingFiles(const std::string& jsonContent, std::vector<WaitingFile>& outFiles,
                                     std::string& outError)
{
    try
    {
        json filesJson = json::parse(jsonContent);

        outFiles.clear();
        if (!filesJson.is_object() || !filesJson.contains("files") || !filesJson["files"].is_array())
        {
            return true;
        }

        for (const auto& entry : filesJson["files"])
        {
            if (!entry.is_object())
                continue;

            WaitingFile file;
            file.name = stringField(entry, "name");
            file.size = countField(entry, "size");
            if (file.name.empty())
            {
                PLOG_WARNING << "Skipping waiting file entry with empty name";
                continue;
            }
            outFiles.push_back(std::move(file));
        }
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

} // namespace watcher
