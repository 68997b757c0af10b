#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "broadcast_engine.hpp"
#include "connection.hpp"
#include "connection_registry.hpp"
#include "periodic_task.hpp"
#include "room_directory.hpp"
#include "server_config.hpp"
#include "status_server.hpp"
#include "text_provider.hpp"
#include "websocket_hub.hpp"

namespace typerace::server
{
    // The authoritative side: owns the registry, the rooms, the transport and
    // the background sweeps. Connection callbacks may also be driven directly,
    // without start(), which is how the race logic is exercised in tests.
    class RaceServer : public ConnectionListener
    {
    public:
        explicit RaceServer(ServerConfig config);
        RaceServer(ServerConfig config, std::unique_ptr<ReferenceTextProvider> texts);
        ~RaceServer() override;

        RaceServer(const RaceServer&) = delete;
        RaceServer& operator=(const RaceServer&) = delete;

        bool start();
        void stop();
        bool isRunning() const noexcept { return running_.load(); }

        int port() const noexcept { return hub_.port(); }
        int statusPort() const noexcept;

        void onOpen(const std::shared_ptr<Connection>& connection, const JoinRequest& request) override;
        void onMessage(Connection& connection, const std::string& text) override;
        void onPong(Connection& connection) override;
        void onClose(Connection& connection) override;

        // One liveness pass: probes every binding and evicts the silent ones.
        void sweepLiveness(SteadyClock::time_point now);
        std::vector<std::string> reapRooms(SteadyClock::time_point now);

        RoomDirectory& rooms() noexcept { return rooms_; }
        const ConnectionRegistry& registry() const noexcept { return registry_; }
        const ServerConfig& config() const noexcept { return config_; }

    private:
        void reject(Connection& connection, const std::string& message, ErrorCode code, std::uint16_t closeCode);
        void sendError(Connection& connection, const std::string& message, ErrorCode code);
        void disconnect(std::uint64_t connectionId, const char* reason);

        ServerConfig config_;
        std::unique_ptr<ReferenceTextProvider> texts_;
        ConnectionRegistry registry_;
        BroadcastEngine broadcaster_;
        RoomDirectory rooms_;
        WebSocketHub hub_;
        std::unique_ptr<StatusServer> status_;
        PeriodicTask liveness_;
        PeriodicTask reaper_;
        std::atomic_bool running_{false};
    };
}
