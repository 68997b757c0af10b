#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "race_room.hpp"

namespace typerace::server
{
    nlohmann::json serialize_room_summary(const RoomSummary& summary);

    // Read-only HTTP API: GET /health and GET /rooms.
    class StatusServer
    {
    public:
        struct Sources
        {
            std::function<std::vector<RoomSummary>()> rooms;
            std::function<std::size_t()> connectionCount;
            int websocketPort{0};
        };

        // Port 0 binds any free port; see port() after start().
        StatusServer(std::string host, int port, Sources sources);
        ~StatusServer();

        StatusServer(const StatusServer&) = delete;
        StatusServer& operator=(const StatusServer&) = delete;

        bool start();
        void stop();

        bool isRunning() const noexcept { return running_.load(); }
        int port() const noexcept { return port_; }

    private:
        void configureRoutes();
        long long uptimeMilliseconds() const;

        std::string host_;
        int port_;
        Sources sources_;
        httplib::Server server_;
        std::thread serverThread_;
        std::atomic_bool running_{false};
        std::chrono::steady_clock::time_point startedAt_{};
    };
}
