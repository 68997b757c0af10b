#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace typerace::server
{
    // Runs a callback on its own thread once per interval until cancelled or
    // until the callback returns false. The first call happens one interval
    // after start().
    class PeriodicTask
    {
    public:
        using Tick = std::function<bool()>;

        PeriodicTask() = default;
        ~PeriodicTask();

        PeriodicTask(const PeriodicTask&) = delete;
        PeriodicTask& operator=(const PeriodicTask&) = delete;

        bool start(std::string name, std::chrono::milliseconds interval, Tick tick);

        // Does not wait; safe to call from inside the callback.
        void cancel();

        // Cancels and joins the worker thread.
        void stop();

        bool isRunning() const noexcept { return running_.load(); }

    private:
        void run();

        std::string name_;
        std::chrono::milliseconds interval_{0};
        Tick tick_;
        std::thread thread_;
        std::atomic_bool running_{false};

        std::mutex mutex_;
        std::condition_variable cv_;
        bool cancelled_{false};
    };
}
