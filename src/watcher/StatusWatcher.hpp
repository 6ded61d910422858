#pragma once

#include "NotificationSink.hpp"
#include "StatusTypes.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace net
{
class HttpClient;
struct HttpResponse;
} // namespace net

namespace utils
{
class Dispatcher;
}

namespace watcher
{

using StateCallback = std::function<void(const WatcherState&)>;
using NotificationCallback = std::function<void(const Notification&)>;
using WaitingFilesCallback =
    std::function<void(bool success, const std::vector<WaitingFile>& files, const std::string& error)>;

// Polls {base}/status on a fixed interval and turns file-name changes into
// notifications. All state lives on the dispatcher's owner thread; the timer
// thread only spawns requests, so ticks can overlap when the server is slow.
class StatusWatcher
{
public:
    StatusWatcher(utils::Dispatcher& dispatcher, net::HttpClient& http, NotificationSink& sink,
                  WatcherSettings settings = {});
    ~StatusWatcher();

    StatusWatcher(const StatusWatcher&) = delete;
    StatusWatcher& operator=(const StatusWatcher&) = delete;

    // Polls once immediately, then every poll_interval_ms until stop()
    void start(const std::string& baseUrl);

    // Target a server without starting the timer; refreshNow() polls on demand
    void setServer(const std::string& baseUrl);
    void stop();
    bool isRunning() const { return running_.load(); }

    // Extra poll outside the timer cadence
    void refreshNow();

    // The user acted on a delivered notification
    void handleNotificationResponse();

    // Returns true once per request and clears the flag
    bool consumeAutoDownloadRequest();

    void fetchWaitingFiles(WaitingFilesCallback callback);

    void subscribe(StateCallback callback);
    void onNotification(NotificationCallback callback);

    const WatcherState& state() const { return state_; }
    const std::string& baseUrl() const { return base_url_; }
    const WatcherSettings& settings() const { return settings_; }

private:
    void issuePoll();
    void timerLoop();
    void applyPollResult(std::uint64_t sequence, const net::HttpResponse& response);
    void emitNotification(const Notification& notification);
    void publish();

    utils::Dispatcher& dispatcher_;
    net::HttpClient& http_;
    NotificationSink& sink_;
    WatcherSettings settings_;
    std::string base_url_;

    // Owner-thread state
    WatcherState state_;
    bool contacted_ = false;
    std::uint64_t last_applied_ = 0;
    std::vector<StateCallback> state_callbacks_;
    std::vector<NotificationCallback> notification_callbacks_;

    // Timer thread
    std::thread timer_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{ false };
    std::atomic<std::uint64_t> issued_{ 0 };
};

} // namespace watcher
