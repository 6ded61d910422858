#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace utils
{

// Owner-thread task queue plus fire-and-forget workers.
//
// Workers run blocking I/O and post their completions back with post();
// the owner thread runs them in pump(). State touched from posted tasks
// therefore never needs a lock. Worker handles are kept and joined in
// shutdown(); nothing is cancelled, a running request finishes first.
//
// At most maxWorkers threads run at once. spawn() refuses work beyond that,
// and when the system cannot create a thread, instead of throwing.
class Dispatcher
{
public:
    using Task = std::function<void()>;

    static constexpr std::size_t kDefaultMaxWorkers = 32;

    explicit Dispatcher(std::size_t maxWorkers = kDefaultMaxWorkers);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Queue a task for the owner thread. Dropped after shutdown().
    void post(Task task);

    // Run work on a new background thread. Returns false, with nothing
    // started, after shutdown(), at the worker limit or when thread creation fails.
    bool spawn(Task work);

    // Post task to the owner thread once delay has elapsed. Without a free
    // worker for the timer the task is posted right away.
    void postDelayed(std::chrono::milliseconds delay, Task task);

    // Owner thread: run everything queued so far. Returns the number of tasks run.
    std::size_t pump();

    // Block until a task is queued or timeout expires
    bool waitForPending(std::chrono::milliseconds timeout);

    // Pump until no worker is running and the queue is empty
    void drainUntilIdle();

    // Same, but gives up once cancel is set. Returns false when cancelled.
    bool drainUntilIdle(const std::atomic<bool>& cancel,
                        std::chrono::milliseconds checkInterval = std::chrono::milliseconds(100));

    std::size_t activeWorkers() const;
    std::size_t maxWorkers() const { return max_workers_; }

    // Joins every worker and discards queued tasks
    void shutdown();

private:
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked(std::vector<std::thread>& finished);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Task> queue_;
    std::list<Worker> workers_;
    std::size_t active_ = 0;
    std::size_t max_workers_;
    bool stopping_ = false;
};

} // namespace utils
