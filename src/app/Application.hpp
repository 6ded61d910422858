#pragma once

#include <memory>
#include <string>
#include <vector>

class AppSettings;
class ConfigManager;

namespace utils
{
class Dispatcher;
}

namespace net
{
class HttpClient;
}

namespace watcher
{
class StatusWatcher;
class NotificationSink;
} // namespace watcher

namespace filesync
{
class SyncCoordinator;
class FolderAccess;
class ExportPresenter;
class TransferEngine;
} // namespace filesync

// Headless front end. Owns the owner thread: every command wires the engines
// together, then pumps the dispatcher until its work is done.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    enum class Command
    {
        Watch,
        Check,
        Pull,
        Push,
        Fetch,
        Share,
        Waiting,
        Help,
        Version
    };

    bool parseCommandLineArgs(std::string& outError);
    bool initializeLogging();
    void initializeConfig();
    void setupServices();

    int runWatch();
    int runCheck();
    int runPull();
    int runPush();
    int runFetch();
    int runShare();
    int runWaiting();

    // Pumps until the dispatcher is idle. False when Ctrl-C interrupted the wait.
    bool waitUntilIdle();

    // Polls /status once so commands can use the resolved file name.
    // outName stays empty when the server has none. False when interrupted.
    bool resolveCurrentFileName(std::string& outName);

    // With sync.follow_server_cwd, learn the server's folder before browsing
    bool refreshServerDirectory();

    void printOutdated() const;
    int drainErrors();
    void printUsage() const;
    void cleanup();

    std::vector<std::string> args_;
    Command command_ = Command::Help;
    std::vector<std::string> operands_;
    std::string config_path_ = "config.toml";
    std::string server_override_;
    bool save_config_ = false;

    std::unique_ptr<AppSettings> settings_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<utils::Dispatcher> dispatcher_;
    std::unique_ptr<net::HttpClient> http_;
    std::unique_ptr<watcher::NotificationSink> notification_sink_;
    std::unique_ptr<filesync::FolderAccess> folder_access_;
    std::unique_ptr<filesync::ExportPresenter> export_presenter_;
    std::unique_ptr<watcher::StatusWatcher> watcher_;
    std::unique_ptr<filesync::SyncCoordinator> coordinator_;

    bool cleaned_up_ = false;

    static constexpr int kInterruptedExit = 130;
};
