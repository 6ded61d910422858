#include "Dispatcher.hpp"

#include <plog/Log.h>

#include <system_error>

namespace utils
{

Dispatcher::Dispatcher(std::size_t maxWorkers)
    : max_workers_(maxWorkers == 0 ? 1 : maxWorkers)
{
}

Dispatcher::~Dispatcher() { shutdown(); }

void Dispatcher::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
            return;
        queue_.push_back(std::move(task));
    }
    cv_.notify_all();
}

bool Dispatcher::spawn(Task work)
{
    std::vector<std::thread> finished;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            PLOG_DEBUG << "Dispatcher stopping, worker not started";
            return false;
        }

        reapFinishedLocked(finished);

        if (active_ >= max_workers_)
        {
            PLOG_WARNING << "Worker limit reached (" << max_workers_ << "), task not started";
        }
        else
        {
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread thread;
            try
            {
                // The worker decrements active_ under mutex_, which is held
                // until the increment below
                thread = std::thread(
                    [this, work = std::move(work), done]() mutable
                    {
                        try
                        {
                            work();
                        }
                        catch (const std::exception& e)
                        {
                            PLOG_ERROR << "Worker task failed: " << e.what();
                        }

                        // Captures go before the worker counts as finished
                        work = nullptr;

                        {
                            std::lock_guard<std::mutex> lock(mutex_);
                            --active_;
                            done->store(true);
                        }
                        cv_.notify_all();
                    });
            }
            catch (const std::system_error& e)
            {
                PLOG_ERROR << "Could not start worker thread: " << e.what();
            }

            if (thread.joinable())
            {
                ++active_;
                workers_.push_back(Worker{ std::move(thread), done });
                started = true;
            }
        }
    }

    for (auto& t : finished)
    {
        t.join();
    }
    return started;
}

void Dispatcher::postDelayed(std::chrono::milliseconds delay, Task task)
{
    auto shared = std::make_shared<Task>(std::move(task));
    const bool started = spawn(
        [this, delay, shared]()
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, delay, [this]() { return stopping_; }))
                    return;
            }
            post(std::move(*shared));
        });

    if (!started)
    {
        PLOG_DEBUG << "No timer worker, posting delayed task now";
        post(std::move(*shared));
    }
}

std::size_t Dispatcher::pump()
{
    std::vector<Task> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(queue_);
    }

    for (auto& task : local)
    {
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "Owner-thread task failed: " << e.what();
        }
    }
    return local.size();
}

bool Dispatcher::waitForPending(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || stopping_; });
    return !queue_.empty();
}

void Dispatcher::drainUntilIdle()
{
    for (;;)
    {
        pump();

        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty() && active_ == 0)
            break;
        cv_.wait(lock, [this]() { return !queue_.empty() || active_ == 0; });
    }
}

bool Dispatcher::drainUntilIdle(const std::atomic<bool>& cancel, std::chrono::milliseconds checkInterval)
{
    while (!cancel.load())
    {
        pump();

        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty() && active_ == 0)
            return true;
        cv_.wait_for(lock, checkInterval, [this]() { return !queue_.empty() || active_ == 0; });
    }
    return false;
}

std::size_t Dispatcher::activeWorkers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void Dispatcher::shutdown()
{
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
        workers.swap(workers_);
    }
    cv_.notify_all();

    for (auto& worker : workers)
    {
        if (worker.thread.joinable())
        {
            worker.thread.join();
        }
    }
}

void Dispatcher::reapFinishedLocked(std::vector<std::thread>& finished)
{
    for (auto it = workers_.begin(); it != workers_.end();)
    {
        if (it->done->load())
        {
            finished.push_back(std::move(it->thread));
            it = workers_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

} // namespace utils
