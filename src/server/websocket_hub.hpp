#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "connection.hpp"

namespace typerace::server
{
    // Thread-per-connection WebSocket listener. Performs the upgrade, answers
    // pings and reports everything else to the listener.
    class WebSocketHub
    {
    public:
        struct Config
        {
            std::string host{"127.0.0.1"};
            int port{0};
            std::string path{"/race"};
        };

        WebSocketHub(Config config, ConnectionListener& listener);
        ~WebSocketHub();

        WebSocketHub(const WebSocketHub&) = delete;
        WebSocketHub& operator=(const WebSocketHub&) = delete;

        bool start();
        void stop();

        int port() const noexcept { return config_.port; }
        std::size_t connectionCount() const;

    private:
        class WebSocketConnection;

        void acceptLoop();
        bool performHandshake(WebSocketConnection& connection, JoinRequest& request);
        void connectionLoop(std::shared_ptr<WebSocketConnection> connection);
        void forget(const WebSocketConnection& connection);

        Config config_;
        ConnectionListener& listener_;
        asio::io_context io_;
        asio::ip::tcp::acceptor acceptor_;
        std::thread acceptThread_;
        std::atomic_bool running_{false};
        std::atomic<std::uint64_t> nextConnectionId_{1};

        mutable std::mutex connectionsMutex_;
        std::vector<std::shared_ptr<WebSocketConnection>> connections_;
    };
}
