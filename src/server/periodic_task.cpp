#include "periodic_task.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace typerace::server
{
    PeriodicTask::~PeriodicTask()
    {
        stop();
    }

    bool PeriodicTask::start(std::string name, std::chrono::milliseconds interval, Tick tick)
    {
        if (running_.exchange(true))
        {
            return false;
        }

        if (thread_.joinable())
        {
            thread_.join();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = false;
        }

        name_ = std::move(name);
        interval_ = interval;
        tick_ = std::move(tick);

        thread_ = std::thread([this]() {
            run();
        });
        return true;
    }

    void PeriodicTask::cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void PeriodicTask::stop()
    {
        cancel();

        if (!thread_.joinable())
        {
            return;
        }

        if (thread_.get_id() == std::this_thread::get_id())
        {
            thread_.detach();
            return;
        }

        thread_.join();
    }

    void PeriodicTask::run()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, interval_, [this]() { return cancelled_; }))
                {
                    break;
                }
            }

            bool keepGoing = true;
            try
            {
                keepGoing = tick_();
            }
            catch (const std::exception& ex)
            {
                spdlog::error("[task {}] tick failed: {}", name_, ex.what());
            }

            if (!keepGoing)
            {
                break;
            }
        }

        running_.store(false);
    }
}
