#pragma once

#include "StatusTypes.hpp"

#include <string>
#include <vector>

namespace watcher
{

// Decoder for the server's /status and /files payloads
class StatusParser
{
public:
    // Resolves the current file name: nested last_sent_file.name wins over
    // the flat last_received_file string; neither yields the sentinel.
    static bool parseStatus(const std::string& jsonContent, StatusSnapshot& outSnapshot, std::string& outError);

    static bool parseWaitingFiles(const std::string& jsonContent, std::vector<WaitingFile>& outFiles,
                                  std::string& outError);
};

} // namespace watcher
