#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace typerace::testing
{
    template <typename Fn>
    void run_case(const char* name, Fn&& fn, int& failures)
    {
        try
        {
            fn();
            std::cout << "[PASS] " << name << "\n";
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[FAIL] " << name << ": " << ex.what() << "\n";
            ++failures;
        }
        catch (...)
        {
            std::cerr << "[FAIL] " << name << ": unknown exception\n";
            ++failures;
        }
    }

    inline void expect(bool condition, const std::string& message)
    {
        if (!condition)
        {
            throw std::runtime_error(message);
        }
    }

    // Polls until predicate holds or the timeout elapses.
    inline bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }
}
