#include "StatusWatcher.hpp"
#include "StatusParser.hpp"
#include "../net/HttpClient.hpp"
#include "../net/Url.hpp"
#include "../utils/Dispatcher.hpp"

#include <plog/Log.h>

#include <chrono>

namespace watcher
{

StatusWatcher::StatusWatcher(utils::Dispatcher& dispatcher, net::HttpClient& http, NotificationSink& sink,
                             WatcherSettings settings)
    : dispatcher_(dispatcher)
    , http_(http)
    , sink_(sink)
    , settings_(settings)
{
}

StatusWatcher::~StatusWatcher() { stop(); }

void StatusWatcher::start(const std::string& baseUrl)
{
    stop();

    setServer(baseUrl);
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stop_requested_ = false;
    }
    running_ = true;

    PLOG_INFO << "Status watcher polling " << base_url_ << "/status every " << settings_.poll_interval_ms << " ms";

    issuePoll();
    timer_ = std::thread([this]() { timerLoop(); });
}

void StatusWatcher::setServer(const std::string& baseUrl) { base_url_ = net::normalize_base_url(baseUrl); }

void StatusWatcher::stop()
{
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stop_requested_ = true;
    }
    timer_cv_.notify_all();

    if (timer_.joinable())
    {
        timer_.join();
        PLOG_INFO << "Status watcher stopped";
    }
    running_ = false;
}

void StatusWatcher::refreshNow()
{
    if (base_url_.empty())
    {
        PLOG_WARNING << "Status watcher has no server URL; call start() first";
        return;
    }
    issuePoll();
}

void StatusWatcher::timerLoop()
{
    const auto interval = std::chrono::milliseconds(settings_.poll_interval_ms);
    std::unique_lock<std::mutex> lock(timer_mutex_);
    for (;;)
    {
        if (timer_cv_.wait_for(lock, interval, [this]() { return stop_requested_; }))
            break;

        lock.unlock();
        issuePoll();
        lock.lock();
    }
}

void StatusWatcher::issuePoll()
{
    const std::uint64_t sequence = ++issued_;
    const std::string url = net::join_url(base_url_, "status");

    net::SessionConfig cfg;
    cfg.connect_timeout_ms = settings_.timeout_ms;
    cfg.timeout_ms = settings_.timeout_ms;
    cfg.bypass_cache = true;

    const bool started = dispatcher_.spawn(
        [this, sequence, url, cfg]()
        {
            net::HttpResponse response = http_.get(url, cfg);
            dispatcher_.post([this, sequence, response = std::move(response)]()
                             { applyPollResult(sequence, response); });
        });

    if (!started)
    {
        net::HttpResponse failed;
        failed.error = "No worker available for the status poll";
        dispatcher_.post([this, sequence, failed]() { applyPollResult(sequence, failed); });
    }
}

void StatusWatcher::applyPollResult(std::uint64_t sequence, const net::HttpResponse& response)
{
    if (settings_.discard_stale_responses)
    {
        if (sequence <= last_applied_)
        {
            PLOG_DEBUG << "Discarding stale status response #" << sequence << " (applied #" << last_applied_ << ")";
            return;
        }
        last_applied_ = sequence;
    }

    StatusSnapshot snapshot;
    std::string error;
    bool success = response.ok();
    if (!success)
    {
        error = response.describeFailure();
    }
    else
    {
        success = StatusParser::parseStatus(response.text, snapshot, error);
    }

    if (!success)
    {
        if (state_.isConnected)
        {
            PLOG_WARNING << "Lost connection to " << base_url_ << ": " << error;
        }
        state_.isConnected = false;
        state_.statusMessage = error;
        publish();
        return;
    }

    if (snapshot.source == FileSource::SendInProgress)
    {
        snapshot.fileName = state_.lastFileName;
    }

    const bool changed = snapshot.fileName != state_.lastFileName;
    if (changed && contacted_ && snapshot.fileName != kWaitingSentinel)
    {
        Notification notification;
        if (snapshot.source == FileSource::Sent)
        {
            notification.title = "File Sent";
            notification.body = "Desktop sent: " + snapshot.fileName;
        }
        else
        {
            notification.title = "File Ready";
            notification.body = "Tap to download: " + snapshot.fileName;
        }
        notification.fileName = snapshot.fileName;
        emitNotification(notification);
    }

    if (!state_.isConnected)
    {
        PLOG_INFO << "Connected to " << base_url_;
    }

    contacted_ = true;
    state_.lastFileName = snapshot.fileName;
    state_.isConnected = true;
    state_.statusMessage = "Connected to server";
    state_.lastSent = snapshot.lastSent;
    if (snapshot.serverCwd)
    {
        state_.serverCwd = snapshot.serverCwd;
    }
    publish();
}

void StatusWatcher::emitNotification(const Notification& notification)
{
    PLOG_INFO << "New file observed: " << notification.fileName;

    try
    {
        if (!sink_.deliver(notification))
        {
            PLOG_WARNING << "Notification for '" << notification.fileName << "' was not delivered";
        }
    }
    catch (const std::exception& e)
    {
        PLOG_WARNING << "Notification delivery failed: " << e.what();
    }

    for (const auto& callback : notification_callbacks_)
    {
        callback(notification);
    }

    if (settings_.auto_fetch_on_notify)
    {
        handleNotificationResponse();
    }
}

void StatusWatcher::handleNotificationResponse()
{
    state_.autoDownloadRequested = true;
    publish();
}

bool StatusWatcher::consumeAutoDownloadRequest()
{
    if (!state_.autoDownloadRequested)
        return false;

    state_.autoDownloadRequested = false;
    return true;
}

void StatusWatcher::fetchWaitingFiles(WaitingFilesCallback callback)
{
    const std::string url = net::join_url(base_url_, "files");

    net::SessionConfig cfg;
    cfg.connect_timeout_ms = settings_.timeout_ms;
    cfg.timeout_ms = settings_.timeout_ms;
    cfg.bypass_cache = true;

    const bool started = dispatcher_.spawn(
        [this, url, cfg, callback]()
        {
            net::HttpResponse response = http_.get(url, cfg);

            std::vector<WaitingFile> files;
            std::string error;
            bool success = response.ok();
            if (!success)
            {
                error = response.describeFailure();
            }
            else
            {
                success = StatusParser::parseWaitingFiles(response.text, files, error);
            }

            dispatcher_.post([callback, success, files = std::move(files), error]()
                             {
                                 if (callback)
                                 {
                                     callback(success, files, error);
                                 }
                             });
        });

    if (!started && callback)
    {
        dispatcher_.post([callback]() { callback(false, {}, "No worker available for the file listing"); });
    }
}

void StatusWatcher::subscribe(StateCallback callback) { state_callbacks_.push_back(std::move(callback)); }

void StatusWatcher::onNotification(NotificationCallback callback)
{
    notification_callbacks_.push_back(std::move(callback));
}

void StatusWatcher::publish()
{
    for (const auto& callback : state_callbacks_)
    {
        callback(state_);
    }
}

} // namespace watcher
