#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace watcher
{

inline constexpr const char* kWaitingSentinel = "Waiting...";

// Nested "last_sent_file" record reported by the desktop side
struct SentFileInfo
{
    std::string name;
    std::string peerId;
    std::uint64_t size = 0;
    std::uint64_t timestamp = 0;
    bool succeeded = false;
    bool sending = false;
};

enum class FileSource
{
    None,          // neither field present, sentinel
    Sent,          // nested last_sent_file.name, transfer succeeded
    Received,      // flat last_received_file
    SendInProgress // last_sent_file still sending; the current name stands
};

// One decoded /status response
struct StatusSnapshot
{
    std::string fileName = kWaitingSentinel;
    FileSource source = FileSource::None;
    std::optional<SentFileInfo> lastSent;
    std::optional<std::string> serverCwd;
};

struct WaitingFile
{
    std::string name;
    std::uint64_t size = 0;
};

struct WatcherState
{
    std::string lastFileName = kWaitingSentinel;
    bool isConnected = false;
    std::string statusMessage = "Connecting...";
    bool autoDownloadRequested = false;

    std::optional<SentFileInfo> lastSent;
    std::optional<std::string> serverCwd;
};

struct Notification
{
    std::string title;
    std::string body;
    std::string fileName;
};

struct WatcherSettings
{
    int poll_interval_ms = 3000;
    int timeout_ms = 5000;

    // Drop poll completions that arrive after a newer one was applied
    bool discard_stale_responses = true;

    // Headless front ends have nobody to tap the notification
    bool auto_fetch_on_notify = false;
};

} // namespace watcher
