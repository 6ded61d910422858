#include "Application.hpp"
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "filesync/ExportPresenter.hpp"
#include "filesync/FolderAccess.hpp"
#include "filesync/SyncCoordinator.hpp"
#include "filesync/TransferEngine.hpp"
#include "net/CprHttpClient.hpp"
#include "utils/Dispatcher.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/FileUtils.hpp"
#include "utils/LogManager.hpp"
#include "watcher/NotificationSink.hpp"
#include "watcher/StatusWatcher.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>

#ifndef DROPSYNC_VERSION_STRING
#define DROPSYNC_VERSION_STRING "0.0.0-dev"
#endif

namespace
{

std::atomic<bool> g_exit_requested{ false };

// First signal asks every command to wind down; a second one while
// workers are still being joined terminates the process.
extern "C" void onTerminateSignal(int sig)
{
    if (g_exit_requested.exchange(true))
    {
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

} // namespace

Application::Application(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        args_.emplace_back(argv[i]);
    }
}

Application::~Application() { cleanup(); }

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(error))
    {
        std::cerr << "dropsync: " << error << "\n\n";
        printUsage();
        return 2;
    }

    if (command_ == Command::Help)
    {
        printUsage();
        return 0;
    }
    if (command_ == Command::Version)
    {
        std::cout << "dropsync " << DROPSYNC_VERSION_STRING << std::endl;
        return 0;
    }

    if (!initializeLogging())
        return 1;

    PLOG_INFO << "dropsync " << DROPSYNC_VERSION_STRING;

    initializeConfig();
    if (settings_->server.base_url.empty())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "No server configured",
                                          "Set [server] base_url in " + config_path_ + " or pass --server");
        return 2;
    }

    setupServices();

    std::signal(SIGINT, onTerminateSignal);
    std::signal(SIGTERM, onTerminateSignal);

    int rc = 0;
    switch (command_)
    {
    case Command::Watch:
        rc = runWatch();
        break;
    case Command::Check:
        rc = runCheck();
        break;
    case Command::Pull:
        rc = runPull();
        break;
    case Command::Push:
        rc = runPush();
        break;
    case Command::Fetch:
        rc = runFetch();
        break;
    case Command::Share:
        rc = runShare();
        break;
    case Command::Waiting:
        rc = runWaiting();
        break;
    case Command::Help:
    case Command::Version:
        break;
    }

    cleanup();
    return rc;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    g_exit_requested.store(true);
}

bool Application::parseCommandLineArgs(std::string& outError)
{
    bool haveCommand = false;

    for (size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];

        if (arg == "-h" || arg == "--help")
        {
            command_ = Command::Help;
            return true;
        }
        if (arg == "--version")
        {
            command_ = Command::Version;
            return true;
        }
        if (arg == "--config" || arg == "--server")
        {
            if (i + 1 >= args_.size())
            {
                outError = arg + " needs a value";
                return false;
            }
            (arg == "--config" ? config_path_ : server_override_) = args_[++i];
            continue;
        }
        if (arg == "--save-config")
        {
            save_config_ = true;
            continue;
        }
        if (!haveCommand && !arg.empty() && arg[0] == '-')
        {
            outError = "unknown option " + arg;
            return false;
        }

        if (!haveCommand)
        {
            if (arg == "watch")
                command_ = Command::Watch;
            else if (arg == "check")
                command_ = Command::Check;
            else if (arg == "pull")
                command_ = Command::Pull;
            else if (arg == "push")
                command_ = Command::Push;
            else if (arg == "fetch")
                command_ = Command::Fetch;
            else if (arg == "share")
                command_ = Command::Share;
            else if (arg == "waiting")
                command_ = Command::Waiting;
            else
            {
                outError = "unknown command " + arg;
                return false;
            }
            haveCommand = true;
            continue;
        }

        operands_.push_back(arg);
    }

    if (!haveCommand)
    {
        if (save_config_)
        {
            outError = "--save-config needs a command";
            return false;
        }
        command_ = Command::Help;
        return true;
    }

    switch (command_)
    {
    case Command::Push:
        if (operands_.size() != 1)
        {
            outError = "push takes exactly one folder";
            return false;
        }
        break;
    case Command::Watch:
    case Command::Check:
    case Command::Fetch:
    case Command::Share:
        if (!operands_.empty())
        {
            outError = "unexpected argument " + operands_.front();
            return false;
        }
        break;
    default:
        break;
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(utils::LogManager::ReadSettings(config_path_)))
    {
        std::cerr << "dropsync: failed to initialize logging\n";
        return false;
    }
    return true;
}

void Application::initializeConfig()
{
    settings_ = std::make_unique<AppSettings>();
    config_ = std::make_unique<ConfigManager>(config_path_);
    if (!settings_->registerConfigHandler(*config_))
    {
        PLOG_ERROR << "Config sections not registered: " << config_->lastError();
    }

    if (!config_->load())
    {
        PLOG_WARNING << "Continuing with default settings: " << config_->lastError();
    }

    if (!server_override_.empty())
    {
        settings_->server.base_url = server_override_;
    }

    if (save_config_)
    {
        if (!config_->save())
        {
            PLOG_WARNING << "Could not save " << config_path_ << ": " << config_->lastError();
        }
    }
}

void Application::setupServices()
{
    const std::string& baseUrl = settings_->server.base_url;

    dispatcher_ = std::make_unique<utils::Dispatcher>();
    http_ = std::make_unique<net::CprHttpClient>();
    notification_sink_ = std::make_unique<watcher::LogNotificationSink>();
    folder_access_ = std::make_unique<filesync::PosixFolderAccess>();
    export_presenter_ = std::make_unique<filesync::LogExportPresenter>();

    watcher_ = std::make_unique<watcher::StatusWatcher>(*dispatcher_, *http_, *notification_sink_, settings_->watcher);
    watcher_->setServer(baseUrl);

    coordinator_ = std::make_unique<filesync::SyncCoordinator>(*dispatcher_, *http_, *folder_access_, baseUrl,
                                                               settings_->sync);

    watcher_->subscribe(
        [this](const watcher::WatcherState& state)
        {
            if (state.serverCwd)
                coordinator_->setServerDirectory(*state.serverCwd);
        });

    PLOG_INFO << "Server: " << baseUrl << ", sync root: " << settings_->sync.sync_root;
}

int Application::runWatch()
{
    watcher_->subscribe(
        [last = std::string()](const watcher::WatcherState& state) mutable
        {
            if (state.statusMessage == last)
                return;
            last = state.statusMessage;
            std::cout << (state.isConnected ? "[online] " : "[offline] ") << state.statusMessage << std::endl;
        });

    watcher_->onNotification([](const watcher::Notification& n)
                             { std::cout << n.title << ": " << n.body << std::endl; });

    coordinator_->subscribe(
        [this](const filesync::SyncState& state)
        {
            if (!state.isSyncing)
                printOutdated();
        });

    watcher_->start(settings_->server.base_url);
    coordinator_->checkForUpdates();

    while (!g_exit_requested.load())
    {
        dispatcher_->waitForPending(std::chrono::milliseconds(100));
        dispatcher_->pump();

        if (watcher_->consumeAutoDownloadRequest())
        {
            std::string fallback = watcher_->state().lastFileName;
            if (fallback == watcher::kWaitingSentinel)
                fallback.clear();

            const filesync::TransferEngine& engine = coordinator_->transfers();
            const std::string downloads = settings_->sync.downloads_dir;
            const std::string subject = fallback.empty() ? "latest file" : fallback;
            const bool started = dispatcher_->spawn(
                [this, &engine, fallback, downloads, subject]()
                {
                    filesync::TransferResult result = engine.fetchLatest(downloads, fallback);
                    dispatcher_->post(
                        [result, subject]()
                        {
                            if (result.success)
                                std::cout << "Downloaded " << result.path << std::endl;
                            else
                                utils::ErrorReporter::ReportTransferFailure("download", subject, result.error);
                        });
                });
            if (!started)
                utils::ErrorReporter::ReportTransferFailure("download", subject, "No worker available");
        }

        // Watch keeps running through failures; the log already has them
        utils::ErrorReporter::GetPendingErrors();
    }

    PLOG_INFO << "Stopping watch";
    watcher_->stop();
    return 0;
}

int Application::runCheck()
{
    if (!refreshServerDirectory())
        return kInterruptedExit;

    coordinator_->checkForUpdates();
    if (!waitUntilIdle())
        return kInterruptedExit;

    int rc = drainErrors();
    if (rc == 0)
        printOutdated();
    return rc;
}

int Application::runPull()
{
    if (!refreshServerDirectory())
        return kInterruptedExit;

    coordinator_->checkForUpdates();
    if (!waitUntilIdle())
        return kInterruptedExit;
    if (int rc = drainErrors(); rc != 0)
        return rc;

    if (operands_.empty())
    {
        coordinator_->pullAll();
    }
    else
    {
        for (const auto& name : operands_)
        {
            filesync::RemoteFile file;
            file.name = name;
            for (const auto& outdated : coordinator_->state().outdatedFiles)
            {
                if (outdated.name == name)
                {
                    file = outdated;
                    break;
                }
            }
            coordinator_->pull(file,
                               [](const filesync::TransferResult& result)
                               {
                                   if (result.success)
                                       std::cout << "Pulled " << result.path << std::endl;
                               });
        }
    }

    if (!waitUntilIdle())
        return kInterruptedExit;
    printOutdated();
    return drainErrors();
}

int Application::runPush()
{
    if (!refreshServerDirectory())
        return kInterruptedExit;

    if (!coordinator_->uploadProject(operands_.front()))
    {
        drainErrors();
        return 1;
    }

    // Uploads plus the delayed re-check
    if (!waitUntilIdle())
        return kInterruptedExit;
    printOutdated();
    return drainErrors();
}

int Application::runFetch()
{
    std::string fallback;
    if (!resolveCurrentFileName(fallback))
        return kInterruptedExit;

    const filesync::TransferEngine& engine = coordinator_->transfers();
    const std::string downloads = settings_->sync.downloads_dir;

    filesync::TransferResult result;
    result.error = "No worker available";
    const bool started = dispatcher_->spawn(
        [this, &engine, &result, fallback, downloads]()
        {
            filesync::TransferResult r = engine.fetchLatest(downloads, fallback);
            dispatcher_->post([&result, r]() { result = r; });
        });
    if (started && !waitUntilIdle())
        return kInterruptedExit;

    if (!result.success)
    {
        utils::ErrorReporter::ReportTransferFailure("download", fallback.empty() ? "latest file" : fallback,
                                                    result.error);
        return drainErrors();
    }

    std::cout << "Downloaded " << result.path << std::endl;
    return drainErrors();
}

int Application::runShare()
{
    std::string name;
    if (!resolveCurrentFileName(name))
        return kInterruptedExit;
    if (name.empty())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Transfer, "Nothing to share",
                                          "The server has not reported a file yet");
        return drainErrors();
    }

    const filesync::TransferEngine& engine = coordinator_->transfers();
    const std::string exportDir = settings_->sync.export_dir;

    filesync::TransferResult result;
    result.error = "No worker available";
    const bool started = dispatcher_->spawn(
        [this, &engine, &result, name, exportDir]()
        {
            filesync::TransferResult r = engine.downloadForExport(name, exportDir);
            dispatcher_->post([&result, r]() { result = r; });
        });
    if (started && !waitUntilIdle())
        return kInterruptedExit;

    if (!result.success)
    {
        utils::ErrorReporter::ReportTransferFailure("share", name, result.error);
        return drainErrors();
    }

    std::string error;
    if (!export_presenter_->present(result.path, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Permission, "Could not present file", error);
        return drainErrors();
    }

    std::cout << result.path << std::endl;
    return drainErrors();
}

int Application::runWaiting()
{
    if (operands_.empty())
    {
        watcher_->fetchWaitingFiles(
            [](bool success, const std::vector<watcher::WaitingFile>& files, const std::string& error)
            {
                if (!success)
                {
                    utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, "Could not list waiting files",
                                                      error);
                    return;
                }
                if (files.empty())
                    std::cout << "No files waiting" << std::endl;
                for (const auto& f : files)
                {
                    std::cout << f.name << "\t" << utils::format_size(f.size) << std::endl;
                }
            });
        if (!waitUntilIdle())
            return kInterruptedExit;
        return drainErrors();
    }

    const filesync::TransferEngine& engine = coordinator_->transfers();
    const std::string downloads = settings_->sync.downloads_dir;
    for (const auto& name : operands_)
    {
        const bool started = dispatcher_->spawn(
            [this, &engine, name, downloads]()
            {
                filesync::TransferResult r = engine.fetchWaiting(name, downloads);
                dispatcher_->post(
                    [name, r]()
                    {
                        if (r.success)
                            std::cout << "Downloaded " << r.path << std::endl;
                        else
                            utils::ErrorReporter::ReportTransferFailure("download", name, r.error);
                    });
            });
        if (!started)
            utils::ErrorReporter::ReportTransferFailure("download", name, "No worker available");
    }
    if (!waitUntilIdle())
        return kInterruptedExit;
    return drainErrors();
}

bool Application::waitUntilIdle()
{
    if (dispatcher_->drainUntilIdle(g_exit_requested))
        return true;

    PLOG_WARNING << "Interrupted with " << dispatcher_->activeWorkers() << " transfer(s) running";
    return false;
}

bool Application::resolveCurrentFileName(std::string& outName)
{
    outName.clear();
    watcher_->refreshNow();
    if (!waitUntilIdle())
        return false;

    const watcher::WatcherState& state = watcher_->state();
    if (!state.isConnected)
    {
        PLOG_WARNING << "Status unavailable: " << state.statusMessage;
        return true;
    }
    if (state.lastFileName != watcher::kWaitingSentinel)
        outName = state.lastFileName;
    return true;
}

bool Application::refreshServerDirectory()
{
    if (!settings_->sync.follow_server_cwd || !settings_->sync.remote_path.empty())
        return true;

    watcher_->refreshNow();
    if (!waitUntilIdle())
        return false;

    if (!watcher_->state().serverCwd)
        PLOG_WARNING << "Server did not report its folder; browsing the default path";
    return true;
}

void Application::printOutdated() const
{
    const auto& files = coordinator_->state().outdatedFiles;
    if (files.empty())
    {
        std::cout << "Everything is up to date" << std::endl;
        return;
    }

    const auto now = utils::now_epoch_seconds();
    std::cout << files.size() << " file(s) out of date:" << std::endl;
    for (const auto& f : files)
    {
        std::cout << "  " << f.name << "\t" << utils::format_size(static_cast<std::uint64_t>(f.size)) << "\t"
                  << utils::format_timestamp(f.modifiedEpochSeconds, now) << std::endl;
    }
}

int Application::drainErrors()
{
    int failures = 0;
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (!report.countsAsFailure())
            continue;
        ++failures;
        std::cerr << "dropsync: " << report.describe() << std::endl;
    }

    if (failures > 0)
    {
        std::cerr << failures << " operation(s) failed; see " << utils::LogManager::LogFile() << std::endl;
        return 1;
    }
    return 0;
}

void Application::printUsage() const
{
    std::cout << "Usage: dropsync [--config FILE] [--server URL] [--save-config] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  watch            poll the server and report new files until interrupted\n"
                 "  check            list remote files newer than the sync root\n"
                 "  pull [NAME...]   download outdated files (all when no name is given)\n"
                 "  push FOLDER      upload every visible file under FOLDER\n"
                 "  fetch            download the latest file into the downloads folder\n"
                 "  share            download the latest file for sharing\n"
                 "  waiting [NAME...] list files waiting on the server, or download them\n"
                 "\n"
                 "Options:\n"
                 "  --config FILE    configuration file (default config.toml)\n"
                 "  --server URL     server base URL, overrides [server] base_url\n"
                 "  --save-config    write the effective settings back to the config file\n"
                 "  --version        print the version\n"
                 "  -h, --help       show this help\n";
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    if (watcher_)
        watcher_->stop();

    // Workers reference the services below; join them first
    if (dispatcher_)
    {
        if (const std::size_t running = dispatcher_->activeWorkers(); running > 0 && g_exit_requested.load())
        {
            std::cerr << "Waiting for " << running << " transfer(s) to stop; press Ctrl-C again to abort"
                      << std::endl;
        }
        dispatcher_->shutdown();
    }
}
